// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

/**
 * Gossip tests
 *
 * Several ledgers wired through the loopback transport must converge on
 * the same tip under duplicated, out-of-order delivery, and malformed
 * payloads must be dropped without side effects.
 */

#include <boost/test/unit_test.hpp>

#include <miner/evaluation_loop.h>
#include <net/gossip.h>
#include <node/ledger.h>
#include <plot/plot_store.h>
#include <test/test_helpers.h>

#include <memory>
#include <string>
#include <vector>

namespace {

struct TestNode {
    CChainPieceSet pieces;
    std::unique_ptr<CLedger> ledger;
    std::unique_ptr<CGossipRelay> relay;

    TestNode(const Plotchain::ChainParams& params, CLoopbackTransport& transport, SourceId id) {
        pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);
        ledger = std::make_unique<CLedger>(params, pieces);
        std::string error;
        if (!ledger->Init(error)) {
            throw std::runtime_error(error);
        }
        relay = std::make_unique<CGossipRelay>(*ledger, nullptr, &transport, id);
        CGossipRelay* pRelay = relay.get();
        transport.Attach(id, [pRelay](SourceId from, const std::vector<uint8_t>& payload) {
            pRelay->OnMessage(from, payload);
        });
    }
};

struct GossipSetup {
    Plotchain::ChainParams params;
    CChainPieceSet pieces;
    CKey key;
    CBlock genesis;
    CLoopbackTransport transport;
    std::vector<std::unique_ptr<TestNode>> nodes;

    GossipSetup() : params(TestParams(8)), key(MakeTestKey()) {
        pieces.InitGenesis(params.genesisSeed, params.genesisPieceCount);
        genesis = params.GenesisBlock();
        for (SourceId id = 0; id < 3; id++) {
            nodes.push_back(std::make_unique<TestNode>(params, transport, id));
        }
    }
};

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(gossip_tests)

BOOST_AUTO_TEST_CASE(challenge_message_layout) {
    CChallenge challenge;
    challenge.nHeight = 0x01020304;
    challenge.value.data[0] = 0xab;

    std::vector<uint8_t> payload = CGossipMessage::NewChallenge(challenge, 9).Serialize();
    BOOST_REQUIRE_EQUAL(payload.size(), 1u + 4 + 32 + 4);
    BOOST_CHECK_EQUAL(payload[0], static_cast<uint8_t>(GossipMessageType::NEW_CHALLENGE));

    CGossipMessage msg;
    std::string error;
    BOOST_REQUIRE(CGossipMessage::Deserialize(payload, msg, error));
    BOOST_CHECK(msg.type == GossipMessageType::NEW_CHALLENGE);
    BOOST_CHECK(msg.challenge == challenge);
    BOOST_CHECK_EQUAL(msg.nDifficulty, 9u);
}

BOOST_FIXTURE_TEST_CASE(block_message_carries_whole_block, GossipSetup) {
    CBlock block = BuildTestChild(genesis, key, 0, pieces, params);
    std::vector<uint8_t> payload = CGossipMessage::CandidateBlock(block).Serialize();

    CGossipMessage msg;
    std::string error;
    BOOST_REQUIRE_MESSAGE(CGossipMessage::Deserialize(payload, msg, error), error);
    BOOST_CHECK(msg.type == GossipMessageType::CANDIDATE_BLOCK);
    BOOST_CHECK(msg.block.GetHash() == block.GetHash());
    BOOST_CHECK(msg.block.vchBlockSig == block.vchBlockSig);
    BOOST_CHECK(msg.block.proof.vchEncoding == block.proof.vchEncoding);
}

BOOST_AUTO_TEST_CASE(malformed_payloads_rejected) {
    CGossipMessage msg;
    std::string error;

    BOOST_CHECK(!CGossipMessage::Deserialize(std::vector<uint8_t>(), msg, error));

    std::vector<uint8_t> unknown = {0x07, 0x00};
    BOOST_CHECK(!CGossipMessage::Deserialize(unknown, msg, error));
    BOOST_CHECK(error.find("unknown message type") == 0);

    CChallenge challenge;
    std::vector<uint8_t> trailing = CGossipMessage::NewChallenge(challenge, 1).Serialize();
    trailing.push_back(0x00);
    BOOST_CHECK(!CGossipMessage::Deserialize(trailing, msg, error));

    std::vector<uint8_t> truncated = CGossipMessage::CandidateBlock(CBlock()).Serialize();
    truncated.resize(truncated.size() / 2);
    BOOST_CHECK(!CGossipMessage::Deserialize(truncated, msg, error));
}

BOOST_FIXTURE_TEST_CASE(nodes_converge_under_duplicate_delivery, GossipSetup) {
    transport.SetDuplicateDelivery(true);

    std::vector<CBlock> chain;
    const CBlock* tip = &genesis;
    for (uint64_t i = 0; i < 4; i++) {
        chain.push_back(BuildTestChild(*tip, key, i, pieces, params));
        tip = &chain.back();
    }

    // Node 0 farmed the chain; announce it newest first
    for (const CBlock& block : chain) {
        BOOST_REQUIRE(nodes[0]->ledger->ProcessBlock(block) == BlockProcessResult::ACCEPTED);
    }
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        nodes[0]->relay->RelayBlock(*it);
    }

    BOOST_CHECK(transport.ProcessPending() > 0);
    BOOST_CHECK_EQUAL(transport.GetPendingCount(), 0u);

    for (const auto& node : nodes) {
        BOOST_CHECK(node->ledger->GetTipHash() == chain.back().GetHash());
        BOOST_CHECK_EQUAL(node->ledger->GetHeight(), 4u);
        BOOST_CHECK_EQUAL(node->ledger->GetOrphanCount(), 0u);
    }
    BOOST_CHECK(nodes[1]->relay->GetDuplicatesDropped() > 0);
    BOOST_CHECK(nodes[2]->relay->GetDuplicatesDropped() > 0);
    BOOST_CHECK_EQUAL(nodes[1]->relay->GetMalformedDropped(), 0u);

    // Announcing again is a no-op everywhere
    uint64_t received = nodes[1]->relay->GetMessagesReceived();
    nodes[0]->relay->RelayBlock(chain.back());
    transport.ProcessPending();
    BOOST_CHECK(nodes[1]->relay->GetMessagesReceived() > received);
    BOOST_CHECK(nodes[1]->ledger->GetTipHash() == chain.back().GetHash());
}

BOOST_FIXTURE_TEST_CASE(invalid_block_not_forwarded, GossipSetup) {
    CBlock bad = BuildTestChild(genesis, key, 0, pieces, params);
    bad.nHeight = 3;
    FinishTestBlock(bad, genesis.nCumulativeWeight, key);

    nodes[0]->relay->RelayBlock(bad);
    BOOST_CHECK_EQUAL(transport.ProcessPending(), 2u);

    for (size_t i = 1; i < nodes.size(); i++) {
        BOOST_CHECK(nodes[i]->ledger->IsInvalid(bad.GetHash()));
        BOOST_CHECK_EQUAL(nodes[i]->ledger->GetHeight(), 0u);
    }
}

BOOST_FIXTURE_TEST_CASE(malformed_payload_dropped, GossipSetup) {
    std::vector<uint8_t> garbage = {0x02, 0x01, 0x02, 0x03};
    BOOST_CHECK(!nodes[1]->relay->OnMessage(0, garbage));
    BOOST_CHECK_EQUAL(nodes[1]->relay->GetMalformedDropped(), 1u);
    BOOST_CHECK_EQUAL(transport.GetPendingCount(), 0u);
    BOOST_CHECK_EQUAL(nodes[1]->ledger->GetBlockCount(), 1u);

    // Seen already: ignored before parsing
    BOOST_CHECK(nodes[1]->relay->OnMessage(0, garbage));
    BOOST_CHECK_EQUAL(nodes[1]->relay->GetMalformedDropped(), 1u);
    BOOST_CHECK_EQUAL(nodes[1]->relay->GetDuplicatesDropped(), 1u);
}

BOOST_FIXTURE_TEST_CASE(challenges_reach_evaluation_loop, GossipSetup) {
    CPlotStore store;
    CEvaluationLoop loop(store, pieces, key, params.encodingLayers);
    CGossipRelay relay(*nodes[1]->ledger, &loop, nullptr, 5);

    CChallenge challenge;
    uint32_t nDifficulty = 0;
    nodes[1]->ledger->GetNextChallenge(challenge, nDifficulty);

    std::vector<uint8_t> payload = CGossipMessage::NewChallenge(challenge, nDifficulty).Serialize();
    BOOST_CHECK(relay.OnMessage(0, payload));
    BOOST_CHECK(loop.GetCurrentChallenge() == challenge);

    CChallenge older = challenge;
    older.nHeight = 0;
    older.value.data[0] ^= 0xff;
    BOOST_CHECK(relay.OnMessage(0, CGossipMessage::NewChallenge(older, nDifficulty).Serialize()));
    BOOST_CHECK(loop.GetCurrentChallenge() == challenge);
    BOOST_CHECK_EQUAL(relay.GetChallengesIgnored(), 1u);
}

BOOST_FIXTURE_TEST_CASE(unknown_high_challenge_ignored, GossipSetup) {
    CPlotStore store;
    CEvaluationLoop loop(store, pieces, key, params.encodingLayers);
    CGossipRelay relay(*nodes[1]->ledger, &loop, nullptr, 5);

    CChallenge challenge;
    uint32_t nDifficulty = 0;
    nodes[1]->ledger->GetNextChallenge(challenge, nDifficulty);
    loop.SetChallenge(challenge, nDifficulty);

    // A challenge no block in our tree produces cannot take over the round
    CChallenge bogus;
    bogus.nHeight = 0xffffffff;
    bogus.value = Hash256(std::vector<uint8_t>(32, 0x5a));
    BOOST_CHECK(relay.OnMessage(0, CGossipMessage::NewChallenge(bogus, 0).Serialize()));
    BOOST_CHECK(loop.GetCurrentChallenge() == challenge);
    BOOST_CHECK_EQUAL(relay.GetChallengesIgnored(), 1u);

    // Once the ledger moves on, the genuine next challenge still gets through
    CBlock block = BuildTestChild(genesis, key, 0, pieces, params);
    BOOST_REQUIRE(nodes[1]->ledger->ProcessBlock(block) == BlockProcessResult::ACCEPTED);
    CChallenge next = GetChallengeForChild(block);
    BOOST_CHECK(relay.OnMessage(0, CGossipMessage::NewChallenge(next, 0).Serialize()));
    BOOST_CHECK(loop.GetCurrentChallenge() == next);
}

BOOST_AUTO_TEST_CASE(sync_message_layout) {
    uint256 hashStop;
    hashStop.data[31] = 0x42;

    std::vector<uint8_t> request = CGossipMessage::GetBlocks(hashStop, 7).Serialize();
    BOOST_REQUIRE_EQUAL(request.size(), 1u + 32 + 4);
    BOOST_CHECK_EQUAL(request[0], static_cast<uint8_t>(GossipMessageType::GET_BLOCKS));

    CGossipMessage msg;
    std::string error;
    BOOST_REQUIRE(CGossipMessage::Deserialize(request, msg, error));
    BOOST_CHECK(msg.type == GossipMessageType::GET_BLOCKS);
    BOOST_CHECK(msg.hashStop == hashStop);
    BOOST_CHECK_EQUAL(msg.nFromHeight, 7u);

    std::vector<uint8_t> empty = CGossipMessage::Blocks(hashStop, std::vector<CBlock>()).Serialize();
    BOOST_REQUIRE(CGossipMessage::Deserialize(empty, msg, error));
    BOOST_CHECK(msg.type == GossipMessageType::BLOCKS);
    BOOST_CHECK(msg.vBlocks.empty());

    // A count above the per-message limit is refused before any block is read
    std::vector<uint8_t> oversized(empty.begin(), empty.end() - 1);
    oversized.push_back(static_cast<uint8_t>(MAX_BLOCKS_PER_MESSAGE + 1));
    BOOST_CHECK(!CGossipMessage::Deserialize(oversized, msg, error));
    BOOST_CHECK(error.find("too many blocks") == 0);
}

BOOST_FIXTURE_TEST_CASE(missing_parents_fetched_from_sender, GossipSetup) {
    std::vector<CBlock> chain;
    const CBlock* tip = &genesis;
    for (uint64_t i = 0; i < 5; i++) {
        chain.push_back(BuildTestChild(*tip, key, i, pieces, params));
        tip = &chain.back();
        BOOST_REQUIRE(nodes[0]->ledger->ProcessBlock(chain.back()) == BlockProcessResult::ACCEPTED);
    }

    // Only the newest block is announced; everyone else must ask for the rest
    nodes[0]->relay->RelayBlock(chain.back());
    transport.ProcessPending();

    for (const auto& node : nodes) {
        BOOST_CHECK(node->ledger->GetTipHash() == chain.back().GetHash());
        BOOST_CHECK_EQUAL(node->ledger->GetOrphanCount(), 0u);
    }

    // One outstanding request per missing block until it is answered
    BOOST_CHECK(nodes[1]->relay->RequestBlocks(0, chain[0].GetHash(), 1));
    BOOST_CHECK(!nodes[1]->relay->RequestBlocks(0, chain[0].GetHash(), 1));
    transport.ProcessPending();
    BOOST_CHECK(nodes[1]->relay->RequestBlocks(0, chain[0].GetHash(), 1));
    transport.ProcessPending();
}

BOOST_FIXTURE_TEST_CASE(sync_request_answered_from_tree, GossipSetup) {
    std::vector<CBlock> chain;
    const CBlock* tip = &genesis;
    for (uint64_t i = 0; i < 4; i++) {
        chain.push_back(BuildTestChild(*tip, key, i, pieces, params));
        tip = &chain.back();
        BOOST_REQUIRE(nodes[0]->ledger->ProcessBlock(chain.back()) == BlockProcessResult::ACCEPTED);
    }

    std::vector<CBlock> blocks;
    BOOST_REQUIRE(nodes[0]->ledger->GetBlockRange(uint256(), 2, MAX_BLOCKS_PER_MESSAGE, blocks));
    BOOST_REQUIRE_EQUAL(blocks.size(), 3u);
    BOOST_CHECK(blocks.front().GetHash() == chain[1].GetHash());
    BOOST_CHECK(blocks.back().GetHash() == chain[3].GetHash());

    BOOST_REQUIRE(nodes[0]->ledger->GetBlockRange(chain[2].GetHash(), 1, 2, blocks));
    BOOST_REQUIRE_EQUAL(blocks.size(), 2u);
    BOOST_CHECK(blocks[0].GetHash() == chain[0].GetHash());
    BOOST_CHECK(blocks[1].GetHash() == chain[1].GetHash());

    BOOST_CHECK(!nodes[0]->ledger->GetBlockRange(Hash256(std::vector<uint8_t>(1, 0x01)), 1, 8, blocks));
    BOOST_CHECK(blocks.empty());

    // Nodes 1 and 2 join late and catch up with one sync request each
    nodes[1]->relay->RequestSync();
    nodes[2]->relay->RequestSync();
    transport.ProcessPending();
    for (const auto& node : nodes) {
        BOOST_CHECK(node->ledger->GetTipHash() == chain.back().GetHash());
    }
}

BOOST_AUTO_TEST_SUITE_END()
