// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_NET_GOSSIP_H
#define PLOTCHAIN_NET_GOSSIP_H

#include <consensus/quality.h>
#include <net/orphan_manager.h>
#include <primitives/block.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

class CEvaluationLoop;
class CLedger;

enum class GossipMessageType : uint8_t {
    NEW_CHALLENGE   = 1,
    CANDIDATE_BLOCK = 2,
    GET_BLOCKS      = 3,
    BLOCKS          = 4
};

const char* GossipMessageTypeToString(GossipMessageType type);

/** Most blocks a BLOCKS message may carry */
static const size_t MAX_BLOCKS_PER_MESSAGE = 64;

/**
 * CGossipMessage - the messages nodes exchange
 *
 * NEW_CHALLENGE and CANDIDATE_BLOCK are flooded. GET_BLOCKS and BLOCKS are
 * sent to one node and carry the block sync: a node missing a parent, or
 * just started, asks a peer for the branch ending at hashStop (the peer's
 * tip if null) from height nFromHeight up.
 *
 * Wire layout: [uint8 type][payload]
 *   NEW_CHALLENGE:   [uint32 height][uint256 value][uint32 difficulty]
 *   CANDIDATE_BLOCK: serialized CBlock
 *   GET_BLOCKS:      [uint256 hashStop][uint32 fromHeight]
 *   BLOCKS:          [uint256 hashStop][CompactSize count][serialized CBlock]*
 */
struct CGossipMessage {
    GossipMessageType type{GossipMessageType::NEW_CHALLENGE};
    CChallenge challenge;
    uint32_t nDifficulty{0};
    CBlock block;
    uint256 hashStop;
    uint32_t nFromHeight{0};
    std::vector<CBlock> vBlocks;

    static CGossipMessage NewChallenge(const CChallenge& challenge, uint32_t nDifficulty);
    static CGossipMessage CandidateBlock(const CBlock& block);
    static CGossipMessage GetBlocks(const uint256& hashStop, uint32_t nFromHeight);
    static CGossipMessage Blocks(const uint256& hashStop, const std::vector<CBlock>& blocks);

    std::vector<uint8_t> Serialize() const;
    static bool Deserialize(const std::vector<uint8_t>& payload, CGossipMessage& msg, std::string& error);
};

/** Identity of a serialized message, used for duplicate suppression */
uint256 GetGossipMessageHash(const std::vector<uint8_t>& payload);

/**
 * CGossipTransport - delivery of opaque payloads to other nodes
 *
 * Delivery is at-least-once with no ordering guarantee. Framing and peer
 * management belong to the implementation.
 */
class CGossipTransport {
public:
    virtual ~CGossipTransport() = default;

    /** Send payload to every node except from */
    virtual void Broadcast(SourceId from, const std::vector<uint8_t>& payload) = 0;

    /** Send payload to node to only */
    virtual void SendTo(SourceId from, SourceId to, const std::vector<uint8_t>& payload) = 0;
};

/**
 * CGossipRelay - glue between a transport, the ledger and the evaluation loop
 *
 * Inbound blocks go to CLedger::ProcessBlock and are re-broadcast when
 * accepted. An orphan makes the relay ask its sender for the missing
 * branch. Inbound challenges reach CEvaluationLoop::OnNewChallenge only if
 * they are the challenge of the ledger's own tip; anything else is either
 * stale or unverifiable, and the local tip change sets the loop's challenge
 * anyway. Every flooded payload is remembered by hash so redelivery is a
 * no-op.
 *
 * Thread Safety: OnMessage and the Relay* methods may be called from any
 * thread, but never while holding the ledger's lock.
 */
class CGossipRelay {
public:
    static const size_t MAX_SEEN_MESSAGES = 50000;

    /** A missing branch is requested again only after this long */
    static constexpr std::chrono::seconds BLOCK_REQUEST_INTERVAL{30};

    /**
     * @param ledger    Receives candidate blocks
     * @param loop      Receives challenges (nullptr on a non-farming node)
     * @param transport Outbound transport (nullptr disables sending)
     * @param selfId    This node's id on the transport
     */
    CGossipRelay(CLedger& ledger, CEvaluationLoop* loop, CGossipTransport* transport, SourceId selfId);

    CGossipRelay(const CGossipRelay&) = delete;
    CGossipRelay& operator=(const CGossipRelay&) = delete;

    /**
     * Handle a payload delivered by the transport.
     *
     * @return false if the payload is malformed; duplicates return true
     */
    bool OnMessage(SourceId from, const std::vector<uint8_t>& payload);

    /** Announce a locally produced block */
    void RelayBlock(const CBlock& block);

    /** Announce the challenge for the local tip */
    void RelayChallenge(const CChallenge& challenge, uint32_t nDifficulty);

    /** Ask every peer for the blocks above our last confirmed height */
    void RequestSync();

    /**
     * Ask peer for the branch ending at hashStop, above nFromHeight.
     * Repeated requests for the same hashStop within
     * BLOCK_REQUEST_INTERVAL are suppressed.
     *
     * @return true if a request was sent
     */
    bool RequestBlocks(SourceId peer, const uint256& hashStop, uint32_t nFromHeight);

    uint64_t GetMessagesReceived() const;
    uint64_t GetDuplicatesDropped() const;
    uint64_t GetMalformedDropped() const;
    uint64_t GetChallengesIgnored() const;

private:
    /** @return true if hash was not seen before */
    bool MarkSeen(const uint256& hash);
    void Send(const std::vector<uint8_t>& payload);

    void HandleChallenge(SourceId from, const CGossipMessage& msg);
    void HandleBlock(SourceId from, const CGossipMessage& msg, const std::vector<uint8_t>& payload);
    void HandleGetBlocks(SourceId from, const CGossipMessage& msg);
    void HandleBlocks(SourceId from, const CGossipMessage& msg);

    CLedger& m_ledger;
    CEvaluationLoop* m_loop;
    CGossipTransport* m_transport;
    SourceId m_selfId;

    mutable std::mutex cs_seen;
    std::set<uint256> m_seen;
    std::deque<uint256> m_seenOrder;
    uint64_t m_nReceived{0};
    uint64_t m_nDuplicates{0};
    uint64_t m_nMalformed{0};
    uint64_t m_nChallengesIgnored{0};

    // Outstanding block requests by hashStop
    std::mutex cs_requests;
    std::map<uint256, std::chrono::steady_clock::time_point> m_requested;
};

/**
 * CLoopbackTransport - in-process bus between several nodes
 *
 * Broadcast only queues; ProcessPending delivers. Handlers may broadcast
 * while being delivered to without recursing into each other.
 */
class CLoopbackTransport : public CGossipTransport {
public:
    typedef std::function<void(SourceId from, const std::vector<uint8_t>& payload)> Handler;

    void Attach(SourceId id, Handler handler);
    void Detach(SourceId id);

    void Broadcast(SourceId from, const std::vector<uint8_t>& payload) override;
    void SendTo(SourceId from, SourceId to, const std::vector<uint8_t>& payload) override;

    /** Deliver every message delivered twice, to exercise at-least-once delivery */
    void SetDuplicateDelivery(bool fDuplicate);

    /**
     * Deliver queued messages until the queue drains.
     *
     * @return number of deliveries made
     */
    size_t ProcessPending();

    size_t GetPendingCount() const;

private:
    struct Delivery {
        SourceId from;
        SourceId to;
        std::vector<uint8_t> payload;
    };

    mutable std::mutex cs_bus;
    std::map<SourceId, Handler> m_handlers;
    std::deque<Delivery> m_queue;
    bool m_fDuplicate{false};
};

#endif // PLOTCHAIN_NET_GOSSIP_H
