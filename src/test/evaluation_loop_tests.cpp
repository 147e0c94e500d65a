// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

/**
 * Evaluation loop tests
 *
 * The scan must find the closest plotted encoding, emitted proofs must
 * turn into valid blocks, and a newer challenge must cancel the round in
 * progress without a stale proof ever reaching the callback.
 */

#include <boost/test/unit_test.hpp>

#include <miner/evaluation_loop.h>
#include <node/ledger.h>
#include <plot/plot_store.h>
#include <plot/plotter.h>
#include <test/test_helpers.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace {

/** Plot store whose reads are slow enough to interrupt a scan */
class SlowPlotStore : public CPlotStore {
public:
    PlotStoreResult Get(uint64_t index, std::vector<uint8_t>& encoded) const override {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return CPlotStore::Get(index, encoded);
    }
};

/** Collects emitted proofs for the test thread */
class ProofCollector {
public:
    CEvaluationLoop::ProofCallback Callback() {
        return [this](const CProofEvent& event) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_events.push_back(event);
            m_cv.notify_all();
        };
    }

    bool WaitFor(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this, count] { return m_events.size() >= count; });
    }

    std::vector<CProofEvent> Events() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<CProofEvent> m_events;
};

CChallenge TestChallenge(uint32_t height, uint8_t tag) {
    uint8_t seed[2] = {'c', tag};
    CChallenge challenge;
    challenge.nHeight = height;
    challenge.value = Hash256(seed, sizeof(seed));
    return challenge;
}

bool WaitForState(const CEvaluationLoop& loop, EvaluationState state, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (loop.GetState() == state) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return false;
}

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(evaluation_loop_tests)

BOOST_AUTO_TEST_CASE(scan_finds_closest_encoding) {
    TestDirectory dir("evaluation");
    Plotchain::ChainParams params = TestParams(10);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);
    CKey key = MakeTestKey();

    CPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), key.GetFarmerId(), params.encodingLayers, error));
    CPlotter plotter(2);
    BOOST_REQUIRE(plotter.Plot(pieces, key.GetFarmerId(), store).result == PlotResult::OK);

    CEvaluationLoop loop(store, pieces, key, params.encodingLayers, 3);
    for (uint8_t tag = 0; tag < 4; tag++) {
        CChallenge challenge = TestChallenge(1, tag);

        bool fHaveBest = false;
        uint64_t bestIndex = 0;
        uint256 bestDistance;
        for (uint64_t i = 0; i < 10; i++) {
            std::vector<uint8_t> encoding;
            BOOST_REQUIRE(store.Get(i, encoding) == PlotStoreResult::OK);
            uint256 distance = ComputeDistance(challenge.value, encoding);
            if (!fHaveBest || distance < bestDistance) {
                fHaveBest = true;
                bestIndex = i;
                bestDistance = distance;
            }
        }

        CScanResult result = loop.Scan(challenge);
        BOOST_CHECK(result.outcome == ScanOutcome::FOUND);
        BOOST_CHECK_EQUAL(result.nIndex, bestIndex);
        BOOST_CHECK(result.distance == bestDistance);
        BOOST_CHECK_EQUAL(result.nQuality, GetQuality(bestDistance));
        BOOST_CHECK_EQUAL(result.nExamined, 10u);
    }
}

BOOST_AUTO_TEST_CASE(empty_plot_yields_nothing) {
    TestDirectory dir("evaluation");
    Plotchain::ChainParams params = TestParams(4);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);
    CKey key = MakeTestKey();

    CPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), key.GetFarmerId(), params.encodingLayers, error));

    CEvaluationLoop loop(store, pieces, key, params.encodingLayers);
    CScanResult result = loop.Scan(TestChallenge(1, 0));
    BOOST_CHECK(result.outcome == ScanOutcome::EMPTY_PLOT);
    BOOST_CHECK_EQUAL(result.nExamined, 0u);
}

BOOST_AUTO_TEST_CASE(emitted_proof_becomes_valid_block) {
    TestDirectory dir("evaluation");
    Plotchain::ChainParams params = TestParams(10);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);
    CKey key = MakeTestKey();

    CLedger ledger(params, pieces);
    std::string error;
    BOOST_REQUIRE(ledger.Init(error));

    CPlotStore store;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), key.GetFarmerId(), params.encodingLayers, error));
    CPlotter plotter(2);
    BOOST_REQUIRE(plotter.Plot(pieces, key.GetFarmerId(), store).result == PlotResult::OK);

    ProofCollector collector;
    CEvaluationLoop loop(store, pieces, key, params.encodingLayers, 2);
    loop.SetProofCallback(collector.Callback());
    loop.Start();

    CChallenge challenge;
    uint32_t nDifficulty = 0;
    ledger.GetNextChallenge(challenge, nDifficulty);
    BOOST_CHECK_EQUAL(challenge.nHeight, 1u);
    BOOST_CHECK(loop.SetChallenge(challenge, nDifficulty));

    BOOST_REQUIRE(collector.WaitFor(1, std::chrono::seconds(30)));
    loop.Stop();

    CProofEvent event = collector.Events()[0];
    BOOST_CHECK(event.challenge == challenge);
    BOOST_CHECK(event.proof.challenge == challenge.value);
    BOOST_CHECK(event.proof.vchFarmerPubKey == key.GetPubKey().GetBytes());
    BOOST_CHECK_EQUAL(event.proof.nPieceIndex, loop.Scan(challenge).nIndex);
    BOOST_CHECK_EQUAL(loop.GetProofsEmitted(), 1u);

    CBlock block;
    BOOST_REQUIRE_MESSAGE(ledger.CreateLocalBlock(event.proof, key, block, error), error);
    std::string reason;
    BOOST_CHECK_MESSAGE(ledger.Validate(block, reason) == BlockValidity::VALID, reason);
    BOOST_CHECK(ledger.ProcessBlock(block, LOCAL_SOURCE, reason) == BlockProcessResult::ACCEPTED);
    BOOST_CHECK_EQUAL(ledger.GetHeight(), 1u);
    BOOST_CHECK(ledger.GetTipHash() == block.GetHash());
}

BOOST_AUTO_TEST_CASE(newer_challenge_cancels_round) {
    TestDirectory dir("evaluation");
    Plotchain::ChainParams params = TestParams(10);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);
    CKey key = MakeTestKey();

    SlowPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), key.GetFarmerId(), params.encodingLayers, error));
    CPlotter plotter(2);
    BOOST_REQUIRE(plotter.Plot(pieces, key.GetFarmerId(), store).result == PlotResult::OK);

    ProofCollector collector;
    CEvaluationLoop loop(store, pieces, key, params.encodingLayers, 1);
    loop.SetProofCallback(collector.Callback());
    loop.Start();

    CChallenge first = TestChallenge(1, 1);
    CChallenge second = TestChallenge(1, 2);

    BOOST_CHECK(loop.SetChallenge(first, 0));
    BOOST_REQUIRE(WaitForState(loop, EvaluationState::SCANNING, std::chrono::seconds(10)));
    BOOST_CHECK(loop.SetChallenge(second, 0));

    BOOST_REQUIRE(collector.WaitFor(1, std::chrono::seconds(30)));
    // Give a stale round time to surface if it were going to
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    loop.Stop();

    std::vector<CProofEvent> events = collector.Events();
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK(events[0].challenge == second);
    BOOST_CHECK(events[0].proof.challenge == second.value);
    BOOST_CHECK_GE(loop.GetRoundsAbandoned(), 1u);
    BOOST_CHECK(loop.GetState() == EvaluationState::IDLE);
}

BOOST_AUTO_TEST_CASE(rescan_after_plotting) {
    TestDirectory dir("evaluation");
    Plotchain::ChainParams params = TestParams(6);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);
    CKey key = MakeTestKey();

    CPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), key.GetFarmerId(), params.encodingLayers, error));

    ProofCollector collector;
    CEvaluationLoop loop(store, pieces, key, params.encodingLayers);
    loop.SetProofCallback(collector.Callback());
    loop.Start();
    BOOST_CHECK(!loop.Rescan());

    // Nothing plotted: the round ends without a proof
    BOOST_CHECK(loop.SetChallenge(TestChallenge(1, 9), 0));
    BOOST_CHECK(!collector.WaitFor(1, std::chrono::milliseconds(200)));

    CPlotter plotter(2);
    BOOST_REQUIRE(plotter.Plot(pieces, key.GetFarmerId(), store).result == PlotResult::OK);
    BOOST_CHECK(loop.Rescan());
    BOOST_CHECK(collector.WaitFor(1, std::chrono::seconds(30)));
    loop.Stop();

    BOOST_CHECK(collector.Events()[0].challenge == TestChallenge(1, 9));
}

BOOST_AUTO_TEST_CASE(gossiped_challenges_filtered) {
    TestDirectory dir("evaluation");
    Plotchain::ChainParams params = TestParams(2);
    CChainPieceSet pieces;
    pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);
    CKey key = MakeTestKey();

    CPlotStore store;
    std::string error;
    BOOST_REQUIRE(store.Open(dir.Sub("plot"), key.GetFarmerId(), params.encodingLayers, error));

    CEvaluationLoop loop(store, pieces, key, params.encodingLayers);

    CChallenge five = TestChallenge(5, 1);
    BOOST_CHECK(loop.OnNewChallenge(five, 0));
    BOOST_CHECK(!loop.OnNewChallenge(five, 0));
    BOOST_CHECK(!loop.OnNewChallenge(TestChallenge(4, 2), 0));
    BOOST_CHECK(loop.GetCurrentChallenge() == five);

    // A competing challenge at the same height replaces the current one
    CChallenge rival = TestChallenge(5, 3);
    BOOST_CHECK(loop.OnNewChallenge(rival, 0));
    BOOST_CHECK(loop.GetCurrentChallenge() == rival);

    // The local ledger may move back after a reorg
    CChallenge lower = TestChallenge(3, 4);
    BOOST_CHECK(loop.SetChallenge(lower, 0));
    BOOST_CHECK(!loop.SetChallenge(lower, 0));
    BOOST_CHECK(loop.GetCurrentChallenge() == lower);
}

BOOST_AUTO_TEST_SUITE_END()
