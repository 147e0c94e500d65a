// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

/**
 * Node integration tests
 *
 * A regtest node plots its piece set, farms blocks on its own and picks up
 * where it left off after a restart. Two nodes on the loopback transport
 * end up on the same chain.
 */

#include <boost/test/unit_test.hpp>

#include <core/node_context.h>
#include <net/gossip.h>
#include <node/ledger.h>
#include <test/test_helpers.h>

#include <chrono>
#include <functional>
#include <thread>

namespace {

CNodeOptions RegtestOptions(const std::string& datadir) {
    CNodeOptions options;
    options.network = "regtest";
    options.datadir = datadir;
    options.nPlotThreads = 2;
    options.nScanThreads = 1;
    options.nScanTimeoutMs = 10000;
    return options;
}

bool WaitUntil(const std::function<bool()>& condition, std::chrono::seconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return condition();
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(node_context_tests)

BOOST_AUTO_TEST_CASE(regtest_node_farms_and_restarts) {
    TestDirectory dir("node");
    std::string error;

    uint32_t nHeight = 0;
    uint256 farmer;
    {
        NodeContext node;
        BOOST_REQUIRE_MESSAGE(node.Init(RegtestOptions(dir.Path()), error), error);
        farmer = node.farmer_key.GetFarmerId();

        BOOST_CHECK(WaitUntil([&node] { return node.ledger->GetHeight() >= 3; }, std::chrono::seconds(60)));

        CNodeSnapshot snapshot = node.GetSnapshot();
        BOOST_CHECK(snapshot.nHeight >= 3);
        BOOST_CHECK(snapshot.nBlocksFarmed >= 3);
        BOOST_CHECK(snapshot.nProofsEmitted >= 3);
        BOOST_CHECK(!snapshot.ToString().empty());

        node.Shutdown();
        node.Shutdown();
        nHeight = snapshot.nHeight;
    }

    NodeContext node;
    CNodeOptions options = RegtestOptions(dir.Path());
    options.fFarm = false;
    BOOST_REQUIRE_MESSAGE(node.Init(options, error), error);
    BOOST_CHECK(node.farmer_key.GetFarmerId() == farmer);
    BOOST_CHECK(node.ledger->GetHeight() >= nHeight);
    BOOST_CHECK(!node.evaluation_loop);

    // Second Init on a running node is refused
    BOOST_CHECK(!node.Init(options, error));
    node.Shutdown();
}

BOOST_AUTO_TEST_CASE(two_nodes_share_one_chain) {
    TestDirectory dirA("node_a");
    TestDirectory dirB("node_b");
    CLoopbackTransport transport;
    std::string error;

    NodeContext farmerNode;
    NodeContext watcherNode;
    transport.Attach(0, [&farmerNode](SourceId from, const std::vector<uint8_t>& payload) {
        farmerNode.HandleMessage(from, payload);
    });
    transport.Attach(1, [&watcherNode](SourceId from, const std::vector<uint8_t>& payload) {
        watcherNode.HandleMessage(from, payload);
    });

    CNodeOptions watcherOptions = RegtestOptions(dirB.Path());
    watcherOptions.fFarm = false;
    BOOST_REQUIRE_MESSAGE(watcherNode.Init(watcherOptions, error, &transport, 1), error);
    BOOST_REQUIRE_MESSAGE(farmerNode.Init(RegtestOptions(dirA.Path()), error, &transport, 0), error);

    BOOST_CHECK(WaitUntil([&] {
        transport.ProcessPending();
        return watcherNode.ledger->GetHeight() >= 2;
    }, std::chrono::seconds(60)));

    // Stop farming, let the last proofs drain, then deliver what is in flight
    farmerNode.evaluation_loop->Stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    transport.ProcessPending();

    BOOST_CHECK(watcherNode.ledger->GetTipHash() == farmerNode.ledger->GetTipHash());
    BOOST_CHECK_EQUAL(watcherNode.GetSnapshot().nBlocksFarmed, 0u);

    farmerNode.Shutdown();
    watcherNode.Shutdown();
    transport.Detach(0);
    transport.Detach(1);
}

BOOST_AUTO_TEST_CASE(late_node_catches_up) {
    TestDirectory dirA("node_a");
    TestDirectory dirB("node_b");
    CLoopbackTransport transport;
    std::string error;

    NodeContext farmerNode;
    transport.Attach(0, [&farmerNode](SourceId from, const std::vector<uint8_t>& payload) {
        farmerNode.HandleMessage(from, payload);
    });
    BOOST_REQUIRE_MESSAGE(farmerNode.Init(RegtestOptions(dirA.Path()), error, &transport, 0), error);
    BOOST_REQUIRE(WaitUntil([&] { return farmerNode.ledger->GetHeight() >= 3; }, std::chrono::seconds(60)));

    // The watcher was not around for the first blocks
    NodeContext watcherNode;
    transport.Attach(1, [&watcherNode](SourceId from, const std::vector<uint8_t>& payload) {
        watcherNode.HandleMessage(from, payload);
    });
    CNodeOptions watcherOptions = RegtestOptions(dirB.Path());
    watcherOptions.fFarm = false;
    BOOST_REQUIRE_MESSAGE(watcherNode.Init(watcherOptions, error, &transport, 1), error);
    BOOST_CHECK_EQUAL(watcherNode.ledger->GetHeight(), 0u);

    BOOST_CHECK(WaitUntil([&] {
        transport.ProcessPending();
        return watcherNode.ledger->GetHeight() >= 3;
    }, std::chrono::seconds(60)));

    farmerNode.evaluation_loop->Stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    BOOST_CHECK(WaitUntil([&] {
        transport.ProcessPending();
        return watcherNode.ledger->GetTipHash() == farmerNode.ledger->GetTipHash();
    }, std::chrono::seconds(10)));
    BOOST_CHECK_EQUAL(watcherNode.ledger->GetOrphanCount(), 0u);

    farmerNode.Shutdown();
    watcherNode.Shutdown();
    transport.Detach(0);
    transport.Detach(1);
}

BOOST_AUTO_TEST_CASE(init_rejects_unknown_network) {
    TestDirectory dir("node");
    CNodeOptions options = RegtestOptions(dir.Path());
    options.network = "moon";

    NodeContext node;
    std::string error;
    BOOST_CHECK(!node.Init(options, error));
    BOOST_CHECK(error.find("unknown network") == 0);
}

BOOST_AUTO_TEST_SUITE_END()
