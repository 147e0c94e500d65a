// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <net/gossip.h>

#include <miner/evaluation_loop.h>
#include <net/serialize.h>
#include <node/ledger.h>
#include <util/logging.h>

#include <stdexcept>

const char* GossipMessageTypeToString(GossipMessageType type) {
    switch (type) {
        case GossipMessageType::NEW_CHALLENGE: return "newchallenge";
        case GossipMessageType::CANDIDATE_BLOCK: return "candidateblock";
        case GossipMessageType::GET_BLOCKS: return "getblocks";
        case GossipMessageType::BLOCKS: return "blocks";
    }
    return "unknown";
}

CGossipMessage CGossipMessage::NewChallenge(const CChallenge& challenge, uint32_t nDifficulty) {
    CGossipMessage msg;
    msg.type = GossipMessageType::NEW_CHALLENGE;
    msg.challenge = challenge;
    msg.nDifficulty = nDifficulty;
    return msg;
}

CGossipMessage CGossipMessage::CandidateBlock(const CBlock& block) {
    CGossipMessage msg;
    msg.type = GossipMessageType::CANDIDATE_BLOCK;
    msg.block = block;
    return msg;
}

CGossipMessage CGossipMessage::GetBlocks(const uint256& hashStop, uint32_t nFromHeight) {
    CGossipMessage msg;
    msg.type = GossipMessageType::GET_BLOCKS;
    msg.hashStop = hashStop;
    msg.nFromHeight = nFromHeight;
    return msg;
}

CGossipMessage CGossipMessage::Blocks(const uint256& hashStop, const std::vector<CBlock>& blocks) {
    CGossipMessage msg;
    msg.type = GossipMessageType::BLOCKS;
    msg.hashStop = hashStop;
    msg.vBlocks = blocks;
    return msg;
}

std::vector<uint8_t> CGossipMessage::Serialize() const {
    CDataStream s;
    s.WriteUint8(static_cast<uint8_t>(type));
    switch (type) {
        case GossipMessageType::NEW_CHALLENGE:
            s.WriteUint32(challenge.nHeight);
            s.WriteUint256(challenge.value);
            s.WriteUint32(nDifficulty);
            break;
        case GossipMessageType::CANDIDATE_BLOCK:
            block.Serialize(s);
            break;
        case GossipMessageType::GET_BLOCKS:
            s.WriteUint256(hashStop);
            s.WriteUint32(nFromHeight);
            break;
        case GossipMessageType::BLOCKS:
            s.WriteUint256(hashStop);
            s.WriteCompactSize(vBlocks.size());
            for (const CBlock& b : vBlocks) {
                b.Serialize(s);
            }
            break;
    }
    return s.GetData();
}

bool CGossipMessage::Deserialize(const std::vector<uint8_t>& payload, CGossipMessage& msg, std::string& error) {
    try {
        CDataStream s(payload);
        uint8_t nType = s.ReadUint8();
        switch (nType) {
            case static_cast<uint8_t>(GossipMessageType::NEW_CHALLENGE):
                msg = CGossipMessage();
                msg.type = GossipMessageType::NEW_CHALLENGE;
                msg.challenge.nHeight = s.ReadUint32();
                msg.challenge.value = s.ReadUint256();
                msg.nDifficulty = s.ReadUint32();
                break;
            case static_cast<uint8_t>(GossipMessageType::CANDIDATE_BLOCK):
                msg = CGossipMessage();
                msg.type = GossipMessageType::CANDIDATE_BLOCK;
                msg.block.Unserialize(s);
                break;
            case static_cast<uint8_t>(GossipMessageType::GET_BLOCKS):
                msg = CGossipMessage();
                msg.type = GossipMessageType::GET_BLOCKS;
                msg.hashStop = s.ReadUint256();
                msg.nFromHeight = s.ReadUint32();
                break;
            case static_cast<uint8_t>(GossipMessageType::BLOCKS): {
                msg = CGossipMessage();
                msg.type = GossipMessageType::BLOCKS;
                msg.hashStop = s.ReadUint256();
                uint64_t nCount = s.ReadCompactSize();
                if (nCount > MAX_BLOCKS_PER_MESSAGE) {
                    error = "too many blocks: " + std::to_string(nCount);
                    return false;
                }
                msg.vBlocks.resize(static_cast<size_t>(nCount));
                for (CBlock& b : msg.vBlocks) {
                    b.Unserialize(s);
                }
                break;
            }
            default:
                error = "unknown message type " + std::to_string(nType);
                return false;
        }
        if (!s.eof()) {
            error = "trailing bytes after message";
            return false;
        }
    } catch (const std::exception& e) {
        error = std::string("truncated message: ") + e.what();
        return false;
    }
    return true;
}

uint256 GetGossipMessageHash(const std::vector<uint8_t>& payload) {
    return Hash256(payload);
}

CGossipRelay::CGossipRelay(CLedger& ledger, CEvaluationLoop* loop, CGossipTransport* transport, SourceId selfId)
    : m_ledger(ledger), m_loop(loop), m_transport(transport), m_selfId(selfId)
{
}

bool CGossipRelay::MarkSeen(const uint256& hash) {
    std::lock_guard<std::mutex> lock(cs_seen);
    if (!m_seen.insert(hash).second) {
        return false;
    }
    m_seenOrder.push_back(hash);
    while (m_seenOrder.size() > MAX_SEEN_MESSAGES) {
        m_seen.erase(m_seenOrder.front());
        m_seenOrder.pop_front();
    }
    return true;
}

void CGossipRelay::Send(const std::vector<uint8_t>& payload) {
    if (m_transport != nullptr) {
        m_transport->Broadcast(m_selfId, payload);
    }
}

bool CGossipRelay::OnMessage(SourceId from, const std::vector<uint8_t>& payload) {
    // Directed sync messages may legitimately repeat byte for byte
    bool fFlooded = payload.empty() || (payload[0] != static_cast<uint8_t>(GossipMessageType::GET_BLOCKS) &&
                                        payload[0] != static_cast<uint8_t>(GossipMessageType::BLOCKS));
    bool fNew = !fFlooded || MarkSeen(GetGossipMessageHash(payload));
    {
        std::lock_guard<std::mutex> lock(cs_seen);
        m_nReceived++;
        if (!fNew) {
            m_nDuplicates++;
        }
    }
    if (!fNew) {
        return true;
    }

    CGossipMessage msg;
    std::string error;
    if (!CGossipMessage::Deserialize(payload, msg, error)) {
        {
            std::lock_guard<std::mutex> lock(cs_seen);
            m_nMalformed++;
        }
        LogPrintNet(WARN, "Malformed message from node %d: %s", from, error.c_str());
        return false;
    }

    LogPrintNet(DEBUG, "%s (%zu bytes) from node %d", GossipMessageTypeToString(msg.type), payload.size(), from);

    switch (msg.type) {
        case GossipMessageType::NEW_CHALLENGE:
            HandleChallenge(from, msg);
            break;
        case GossipMessageType::CANDIDATE_BLOCK:
            HandleBlock(from, msg, payload);
            break;
        case GossipMessageType::GET_BLOCKS:
            HandleGetBlocks(from, msg);
            break;
        case GossipMessageType::BLOCKS:
            HandleBlocks(from, msg);
            break;
    }
    return true;
}

void CGossipRelay::HandleChallenge(SourceId from, const CGossipMessage& msg) {
    if (m_loop == nullptr) {
        return;
    }

    // Only the challenge of our own tip can be answered with a block we
    // would accept, and only our ledger can vouch for its difficulty
    CChallenge expected;
    uint32_t nDifficulty = 0;
    m_ledger.GetNextChallenge(expected, nDifficulty);
    if (msg.challenge != expected) {
        {
            std::lock_guard<std::mutex> lock(cs_seen);
            m_nChallengesIgnored++;
        }
        LogPrintNet(DEBUG, "Ignoring challenge for height %u from node %d: not the challenge of our tip (height %u)",
                    msg.challenge.nHeight, from, expected.nHeight);
        return;
    }
    m_loop->OnNewChallenge(expected, nDifficulty);
}

void CGossipRelay::HandleBlock(SourceId from, const CGossipMessage& msg, const std::vector<uint8_t>& payload) {
    std::string reason;
    BlockProcessResult result = m_ledger.ProcessBlock(msg.block, from, reason);
    LogPrintNet(DEBUG, "Block %s at height %u from node %d: %s %s",
                msg.block.GetHash().GetHex().c_str(), msg.block.nHeight, from,
                BlockProcessResultToString(result), reason.c_str());

    if (result == BlockProcessResult::ORPHAN) {
        RequestBlocks(from, msg.block.hashPrevBlock, m_ledger.GetLastConfirmedHeight() + 1);
    }

    // Flood accepted blocks onward; orphans are passed on too so peers
    // that hold the parent can connect them
    if (result == BlockProcessResult::ACCEPTED || result == BlockProcessResult::ORPHAN) {
        Send(payload);
    }
}

void CGossipRelay::HandleGetBlocks(SourceId from, const CGossipMessage& msg) {
    std::vector<CBlock> blocks;
    if (!m_ledger.GetBlockRange(msg.hashStop, msg.nFromHeight, MAX_BLOCKS_PER_MESSAGE, blocks)) {
        LogPrintNet(DEBUG, "Node %d asked for unknown block %s", from, msg.hashStop.GetHex().c_str());
    }

    // Always answer, so the requester can ask someone else
    if (m_transport != nullptr) {
        m_transport->SendTo(m_selfId, from, CGossipMessage::Blocks(msg.hashStop, blocks).Serialize());
    }
    LogPrintNet(DEBUG, "Sent %zu block(s) from height %u to node %d", blocks.size(), msg.nFromHeight, from);
}

void CGossipRelay::HandleBlocks(SourceId from, const CGossipMessage& msg) {
    {
        std::lock_guard<std::mutex> lock(cs_requests);
        m_requested.erase(msg.hashStop);
    }

    size_t nAccepted = 0;
    for (const CBlock& block : msg.vBlocks) {
        std::string reason;
        BlockProcessResult result = m_ledger.ProcessBlock(block, from, reason);
        if (result == BlockProcessResult::ACCEPTED) {
            nAccepted++;
        } else if (result != BlockProcessResult::ALREADY_HAVE) {
            LogPrintNet(DEBUG, "Synced block %s at height %u from node %d: %s %s",
                        block.GetHash().GetHex().c_str(), block.nHeight, from,
                        BlockProcessResultToString(result), reason.c_str());
        }
    }
    if (!msg.vBlocks.empty()) {
        LogPrintNet(INFO, "Synced %zu of %zu block(s) from node %d, height now %u",
                    nAccepted, msg.vBlocks.size(), from, m_ledger.GetHeight());
    }

    // A full batch means the branch goes on above it
    bool fReached = !msg.hashStop.IsNull() && m_ledger.HaveBlock(msg.hashStop);
    if (msg.vBlocks.size() == MAX_BLOCKS_PER_MESSAGE && !fReached) {
        RequestBlocks(from, msg.hashStop, msg.vBlocks.back().nHeight + 1);
    }
}

bool CGossipRelay::RequestBlocks(SourceId peer, const uint256& hashStop, uint32_t nFromHeight) {
    if (m_transport == nullptr) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(cs_requests);
        auto now = std::chrono::steady_clock::now();
        auto it = m_requested.find(hashStop);
        if (it != m_requested.end() && now - it->second < BLOCK_REQUEST_INTERVAL) {
            return false;
        }
        // Unanswered requests expire
        for (auto entry = m_requested.begin(); entry != m_requested.end();) {
            if (now - entry->second >= BLOCK_REQUEST_INTERVAL) {
                entry = m_requested.erase(entry);
            } else {
                ++entry;
            }
        }
        m_requested[hashStop] = now;
    }
    m_transport->SendTo(m_selfId, peer, CGossipMessage::GetBlocks(hashStop, nFromHeight).Serialize());
    LogPrintNet(DEBUG, "Requested blocks up to %s from height %u from node %d",
                hashStop.IsNull() ? "tip" : hashStop.GetHex().c_str(), nFromHeight, peer);
    return true;
}

void CGossipRelay::RequestSync() {
    Send(CGossipMessage::GetBlocks(uint256(), m_ledger.GetLastConfirmedHeight() + 1).Serialize());
}

void CGossipRelay::RelayBlock(const CBlock& block) {
    std::vector<uint8_t> payload = CGossipMessage::CandidateBlock(block).Serialize();
    MarkSeen(GetGossipMessageHash(payload));
    Send(payload);
    LogPrintNet(DEBUG, "Relayed block %s at height %u", block.GetHash().GetHex().c_str(), block.nHeight);
}

void CGossipRelay::RelayChallenge(const CChallenge& challenge, uint32_t nDifficulty) {
    std::vector<uint8_t> payload = CGossipMessage::NewChallenge(challenge, nDifficulty).Serialize();
    if (!MarkSeen(GetGossipMessageHash(payload))) {
        return;
    }
    Send(payload);
}

uint64_t CGossipRelay::GetMessagesReceived() const {
    std::lock_guard<std::mutex> lock(cs_seen);
    return m_nReceived;
}

uint64_t CGossipRelay::GetDuplicatesDropped() const {
    std::lock_guard<std::mutex> lock(cs_seen);
    return m_nDuplicates;
}

uint64_t CGossipRelay::GetMalformedDropped() const {
    std::lock_guard<std::mutex> lock(cs_seen);
    return m_nMalformed;
}

uint64_t CGossipRelay::GetChallengesIgnored() const {
    std::lock_guard<std::mutex> lock(cs_seen);
    return m_nChallengesIgnored;
}

void CLoopbackTransport::Attach(SourceId id, Handler handler) {
    std::lock_guard<std::mutex> lock(cs_bus);
    m_handlers[id] = std::move(handler);
}

void CLoopbackTransport::Detach(SourceId id) {
    std::lock_guard<std::mutex> lock(cs_bus);
    m_handlers.erase(id);
}

void CLoopbackTransport::Broadcast(SourceId from, const std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(cs_bus);
    for (const auto& entry : m_handlers) {
        if (entry.first == from) {
            continue;
        }
        m_queue.push_back(Delivery{from, entry.first, payload});
        if (m_fDuplicate) {
            m_queue.push_back(Delivery{from, entry.first, payload});
        }
    }
}

void CLoopbackTransport::SendTo(SourceId from, SourceId to, const std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(cs_bus);
    if (m_handlers.count(to) == 0) {
        return;
    }
    m_queue.push_back(Delivery{from, to, payload});
    if (m_fDuplicate) {
        m_queue.push_back(Delivery{from, to, payload});
    }
}

void CLoopbackTransport::SetDuplicateDelivery(bool fDuplicate) {
    std::lock_guard<std::mutex> lock(cs_bus);
    m_fDuplicate = fDuplicate;
}

size_t CLoopbackTransport::ProcessPending() {
    size_t nDelivered = 0;
    while (true) {
        Delivery delivery;
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(cs_bus);
            if (m_queue.empty()) {
                break;
            }
            delivery = std::move(m_queue.front());
            m_queue.pop_front();
            auto it = m_handlers.find(delivery.to);
            if (it == m_handlers.end()) {
                continue;
            }
            handler = it->second;
        }
        handler(delivery.from, delivery.payload);
        nDelivered++;
    }
    return nDelivered;
}

size_t CLoopbackTransport::GetPendingCount() const {
    std::lock_guard<std::mutex> lock(cs_bus);
    return m_queue.size();
}
