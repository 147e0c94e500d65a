// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <node/ledger.h>

#include <consensus/difficulty.h>
#include <key.h>
#include <node/blockchain_storage.h>
#include <plot/piece_set.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

#include <algorithm>
#include <iostream>

namespace {

/**
 * Rejections that say nothing about the header hash: the block signature is
 * outside the hash, a timestamp too far ahead may become acceptable, and the
 * fork depth limit depends on this node's confirmations, not on the block.
 */
bool IsCacheableRejection(const std::string& reason) {
    return reason.compare(0, 13, "bad-block-sig") != 0 && reason.compare(0, 12, "time-too-new") != 0 &&
           reason.compare(0, 14, "bad-fork-depth") != 0;
}

} // anonymous namespace

const char* BlockProcessResultToString(BlockProcessResult result) {
    switch (result) {
        case BlockProcessResult::ACCEPTED: return "ACCEPTED";
        case BlockProcessResult::ALREADY_HAVE: return "ALREADY_HAVE";
        case BlockProcessResult::ORPHAN: return "ORPHAN";
        case BlockProcessResult::INVALID: return "INVALID";
        case BlockProcessResult::DB_ERROR: return "DB_ERROR";
    }
    return "UNKNOWN";
}

CLedger::CLedger(const Plotchain::ChainParams& params, CChainPieceSet& pieceSet, CBlockchainDB* db)
    : m_params(params), m_pieceSet(pieceSet), m_db(db), m_validator(params)
{
}

bool CLedger::Init(std::string& error) {
    std::lock_guard<std::recursive_mutex> lock(cs_main);

    if (m_chainstate.GetTip() != nullptr) {
        return true;
    }
    if (m_pieceSet.Size() != m_params.genesisPieceCount) {
        error = strprintf("piece set holds %llu pieces, expected %llu genesis pieces",
                          static_cast<unsigned long long>(m_pieceSet.Size()),
                          static_cast<unsigned long long>(m_params.genesisPieceCount));
        return false;
    }

    CBlock genesis = m_params.GenesisBlock();
    CBlockIndex* pindexGenesis = m_chainstate.AddBlockIndex(genesis, 0);
    if (pindexGenesis == nullptr) {
        error = "cannot index genesis block";
        return false;
    }
    pindexGenesis->nStatus |= CBlockIndex::BLOCK_CONFIRMED;

    CReorgEvent event;
    bool fTipChanged = false;
    m_chainstate.ActivateBestChain(pindexGenesis, event, fTipChanged);

    std::cout << "[Ledger] Genesis " << genesis.GetHash().GetHex().substr(0, 16)
              << " (" << m_params.GetNetworkName() << ")" << std::endl;

    if (m_db == nullptr) {
        return true;
    }

    if (!m_db->BlockExists(genesis.GetHash()) && !m_db->WriteBlock(genesis)) {
        error = "cannot store genesis block";
        return false;
    }

    std::vector<CBlock> blocks;
    size_t nCorrupt = 0;
    if (!m_db->LoadAllBlocks(blocks, nCorrupt, error)) {
        return false;
    }

    // Parents before children
    std::stable_sort(blocks.begin(), blocks.end(), [](const CBlock& a, const CBlock& b) {
        return a.nHeight < b.nHeight;
    });

    m_fReplaying = true;
    size_t nReplayed = 0;
    size_t nRejected = 0;
    for (const CBlock& block : blocks) {
        if (block.IsGenesis()) {
            continue;
        }
        std::string reason;
        BlockProcessResult result = AcceptBlock(block, LOCAL_SOURCE, false, reason);
        if (result == BlockProcessResult::ACCEPTED) {
            nReplayed++;
            ConnectOrphans(block.GetHash());
        } else if (result != BlockProcessResult::ALREADY_HAVE) {
            nRejected++;
            LogPrintf(DB, WARN, "Stored block %s not replayed: %s %s", block.GetHash().GetHex().c_str(),
                      BlockProcessResultToString(result), reason.c_str());
        }
    }
    m_fReplaying = false;

    uint256 hashStoredTip;
    uint256 hashTip = m_chainstate.GetTip()->GetBlockHash();
    if (m_db->ReadBestBlock(hashStoredTip) && hashStoredTip != hashTip) {
        LogPrintConsensus(WARN, "Stored tip %s differs from replayed tip %s",
                          hashStoredTip.GetHex().c_str(), hashTip.GetHex().c_str());
    }
    m_db->WriteBestBlock(hashTip);

    std::cout << "[Ledger] Replayed " << nReplayed << " stored block(s), tip height "
              << m_chainstate.GetHeight() << " (" << nRejected << " rejected, " << nCorrupt
              << " corrupt)" << std::endl;
    return true;
}

BlockProcessResult CLedger::ProcessBlock(const CBlock& block, SourceId source) {
    std::string reason;
    return ProcessBlock(block, source, reason);
}

BlockProcessResult CLedger::ProcessBlock(const CBlock& block, SourceId source, std::string& reason) {
    std::lock_guard<std::recursive_mutex> lock(cs_main);

    m_orphans.EraseExpiredOrphans();

    BlockProcessResult result = AcceptBlock(block, source, true, reason);
    if (result == BlockProcessResult::ACCEPTED) {
        ConnectOrphans(block.GetHash());
    }
    return result;
}

BlockProcessResult CLedger::AcceptBlock(const CBlock& block, SourceId source, bool fPersist,
                                        std::string& reason) {
    uint256 hash = block.GetHash();

    if (m_chainstate.HasBlockIndex(hash)) {
        reason = "duplicate";
        return BlockProcessResult::ALREADY_HAVE;
    }
    if (m_invalid.count(hash) > 0) {
        reason = "known-invalid";
        return BlockProcessResult::INVALID;
    }
    if (m_orphans.HaveOrphanBlock(hash)) {
        reason = "duplicate-orphan";
        return BlockProcessResult::ALREADY_HAVE;
    }
    if (m_invalid.count(block.hashPrevBlock) > 0) {
        reason = "bad-prevblk: parent is invalid";
        MarkInvalid(hash);
        LogPrintValidation(WARN, "Block %s from source %d rejected: %s",
                           hash.GetHex().c_str(), source, reason.c_str());
        return BlockProcessResult::INVALID;
    }

    unsigned int nQuality = 0;
    if (!m_validator.CheckBlock(block, nQuality, reason)) {
        if (IsCacheableRejection(reason)) {
            MarkInvalid(hash);
        }
        LogPrintValidation(WARN, "Block %s from source %d rejected: %s",
                           hash.GetHex().c_str(), source, reason.c_str());
        return BlockProcessResult::INVALID;
    }

    CBlockIndex* pindexPrev = m_chainstate.LookupBlockIndex(block.hashPrevBlock);
    if (pindexPrev == nullptr) {
        if (!m_orphans.AddOrphanBlock(source, block)) {
            reason = "orphan buffer full for source, dropped";
        } else {
            reason = "missing parent " + block.hashPrevBlock.GetHex().substr(0, 16);
        }
        LogPrintValidation(DEBUG, "Block %s at height %u is an orphan: %s",
                           hash.GetHex().c_str(), block.nHeight, reason.c_str());
        return BlockProcessResult::ORPHAN;
    }

    if (!m_validator.ContextualCheckBlock(block, nQuality, pindexPrev, m_pieceSet, GetTime(), reason)) {
        if (IsCacheableRejection(reason)) {
            MarkInvalid(hash);
        }
        LogPrintValidation(WARN, "Block %s from source %d rejected: %s",
                           hash.GetHex().c_str(), source, reason.c_str());
        return BlockProcessResult::INVALID;
    }

    if (!CheckForkDepth(pindexPrev, reason)) {
        LogPrintValidation(WARN, "Block %s from source %d rejected: %s",
                           hash.GetHex().c_str(), source, reason.c_str());
        return BlockProcessResult::INVALID;
    }

    if (fPersist && m_db != nullptr && !m_db->WriteBlock(block)) {
        reason = "db-write-failed";
        return BlockProcessResult::DB_ERROR;
    }

    CBlockIndex* pindex = m_chainstate.AddBlockIndex(block, nQuality);
    if (pindex == nullptr) {
        reason = "cannot index block";
        return BlockProcessResult::DB_ERROR;
    }

    LogPrintValidation(DEBUG, "Accepted %s", pindex->ToString().c_str());

    CReorgEvent event;
    bool fTipChanged = false;
    m_chainstate.ActivateBestChain(pindex, event, fTipChanged);
    if (!fTipChanged) {
        reason = "accepted on a side branch";
        return BlockProcessResult::ACCEPTED;
    }

    if (m_db != nullptr && !m_fReplaying) {
        m_db->WriteBestBlock(event.hashNewTip);
    }

    ApplyConfirmations();

    if (event.IsReorg()) {
        m_lastReorg = event;
        m_fHaveReorg = true;
        LogPrintConsensus(INFO, "Reorg: %s (height %u) -> %s (height %u), fork at %u, %zu disconnected, %zu connected",
                          event.hashOldTip.GetHex().c_str(), event.nOldHeight,
                          event.hashNewTip.GetHex().c_str(), event.nNewHeight, event.nForkHeight,
                          event.vDisconnected.size(), event.vConnected.size());
    } else {
        LogPrintConsensus(DEBUG, "New tip %s at height %u", event.hashNewTip.GetHex().c_str(), event.nNewHeight);
    }

    reason.clear();
    Notify(event);
    return BlockProcessResult::ACCEPTED;
}

bool CLedger::CheckForkDepth(const CBlockIndex* pindexPrev, std::string& reason) const {
    const CBlockIndex* pindexTip = m_chainstate.GetTip();
    const CBlockIndex* pindexFork = LastCommonAncestor(pindexPrev, pindexTip);
    uint32_t nConfirmed = m_chainstate.GetLastConfirmedHeight();
    if (pindexFork == nullptr || pindexFork->nHeight < nConfirmed) {
        reason = strprintf("bad-fork-depth: branch leaves the chain below confirmed height %u", nConfirmed);
        return false;
    }
    return true;
}

void CLedger::MarkInvalid(const uint256& hash) {
    if (!m_invalid.insert(hash).second) {
        return;
    }
    m_invalidOrder.push_back(hash);
    while (m_invalidOrder.size() > MAX_INVALID_CACHE) {
        m_invalid.erase(m_invalidOrder.front());
        m_invalidOrder.pop_front();
    }
}

void CLedger::ConnectOrphans(const uint256& parentHash) {
    std::vector<uint256> parents(1, parentHash);
    while (!parents.empty()) {
        uint256 parent = parents.back();
        parents.pop_back();

        for (const uint256& childHash : m_orphans.GetOrphanChildren(parent)) {
            CBlock child;
            if (!m_orphans.GetOrphanBlock(childHash, child)) {
                continue;
            }
            m_orphans.EraseOrphanBlock(childHash);

            std::string reason;
            BlockProcessResult result = AcceptBlock(child, LOCAL_SOURCE, !m_fReplaying, reason);
            LogPrintValidation(DEBUG, "Orphan %s processed: %s %s", childHash.GetHex().c_str(),
                               BlockProcessResultToString(result), reason.c_str());
            if (result == BlockProcessResult::ACCEPTED) {
                parents.push_back(childHash);
            }
        }
    }
}

void CLedger::ApplyConfirmations() {
    std::vector<const CBlockIndex*> confirmed = m_chainstate.UpdateConfirmations(m_params.confirmationDepth);
    for (const CBlockIndex* pindex : confirmed) {
        uint64_t expected = m_params.genesisPieceCount + pindex->nHeight - 1;
        if (m_pieceSet.Size() != expected) {
            LogPrintConsensus(ERROR, "Piece set size %llu out of step with confirmed height %u",
                              static_cast<unsigned long long>(m_pieceSet.Size()), pindex->nHeight);
        }
        m_pieceSet.AppendFromBlock(pindex->GetBlockHash());
        LogPrintConsensus(DEBUG, "Confirmed block %s at height %u", pindex->GetBlockHash().GetHex().c_str(),
                          pindex->nHeight);
    }
}

void CLedger::Notify(const CReorgEvent& event) {
    for (const ReorgCallback& callback : m_callbacks) {
        callback(event);
    }
}

BlockValidity CLedger::Validate(const CBlock& block, std::string& reason) const {
    std::lock_guard<std::recursive_mutex> lock(cs_main);

    uint256 hash = block.GetHash();
    if (m_invalid.count(hash) > 0 || m_invalid.count(block.hashPrevBlock) > 0) {
        reason = "known-invalid";
        return BlockValidity::INVALID;
    }

    unsigned int nQuality = 0;
    if (!m_validator.CheckBlock(block, nQuality, reason)) {
        return BlockValidity::INVALID;
    }

    const CBlockIndex* pindexPrev = m_chainstate.LookupBlockIndex(block.hashPrevBlock);
    if (pindexPrev == nullptr) {
        reason = "missing parent";
        return BlockValidity::MISSING_PARENT;
    }

    if (!m_validator.ContextualCheckBlock(block, nQuality, pindexPrev, m_pieceSet, GetTime(), reason) ||
        !CheckForkDepth(pindexPrev, reason)) {
        return BlockValidity::INVALID;
    }
    return BlockValidity::VALID;
}

bool CLedger::CreateLocalBlock(const CProof& proof, const CKey& key, CBlock& block, std::string& error) const {
    std::lock_guard<std::recursive_mutex> lock(cs_main);

    const CBlockIndex* pindexTip = m_chainstate.GetTip();
    if (pindexTip == nullptr) {
        error = "ledger not initialised";
        return false;
    }
    if (!key.IsValid() || key.GetPubKey().GetBytes() != proof.vchFarmerPubKey) {
        error = "key does not match the proof's farmer";
        return false;
    }

    uint256 expectedChallenge = ComputeChallenge(pindexTip->GetBlockHash(), pindexTip->block.proof.vchSignature);
    if (proof.challenge != expectedChallenge) {
        error = "stale-challenge: proof does not answer the current tip";
        return false;
    }

    uint32_t nDifficulty = GetNextDifficulty(pindexTip, m_params);
    unsigned int nQuality = GetQuality(ComputeDistance(proof.challenge, proof.vchEncoding));
    uint256 blockWeight;
    uint256 chainWeight;
    if (!GetBlockWeight(nQuality, nDifficulty, blockWeight)) {
        error = strprintf("quality %u below difficulty %u", nQuality, nDifficulty);
        return false;
    }
    if (!WeightAdd(pindexTip->nChainWeight, blockWeight, chainWeight)) {
        error = "cumulative weight overflow";
        return false;
    }

    block.SetNull();
    block.nVersion = CBlockHeader::CURRENT_VERSION;
    block.hashPrevBlock = pindexTip->GetBlockHash();
    block.nHeight = pindexTip->nHeight + 1;
    block.nTime = static_cast<uint32_t>(std::max<int64_t>(GetTime(), pindexTip->nTime));
    block.nDifficulty = nDifficulty;
    block.nCumulativeWeight = chainWeight;
    block.proof = proof;

    if (!key.Sign(block.GetHash(), block.vchBlockSig)) {
        error = "failed to sign block";
        return false;
    }
    return true;
}

void CLedger::GetNextChallenge(CChallenge& challenge, uint32_t& nDifficulty) const {
    std::lock_guard<std::recursive_mutex> lock(cs_main);
    const CBlockIndex* pindexTip = m_chainstate.GetTip();
    if (pindexTip == nullptr) {
        challenge = CChallenge();
        nDifficulty = m_params.genesisDifficulty;
        return;
    }
    challenge = GetChallengeForChild(pindexTip->block);
    nDifficulty = GetNextDifficulty(pindexTip, m_params);
}

void CLedger::RegisterReorgCallback(ReorgCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(cs_main);
    m_callbacks.push_back(std::move(callback));
}

uint256 CLedger::GetTipHash() const {
    std::lock_guard<std::recursive_mutex> lock(cs_main);
    const CBlockIndex* pindexTip = m_chainstate.GetTip();
    return pindexTip ? pindexTip->GetBlockHash() : uint256();
}

uint32_t CLedger::GetHeight() const {
    return m_chainstate.GetHeight();
}

uint256 CLedger::GetChainWeight() const {
    return m_chainstate.GetChainWeight();
}

uint32_t CLedger::GetLastConfirmedHeight() const {
    return m_chainstate.GetLastConfirmedHeight();
}

size_t CLedger::GetBlockCount() const {
    return m_chainstate.GetBlockCount();
}

bool CLedger::HaveBlock(const uint256& hash) const {
    return m_chainstate.HasBlockIndex(hash);
}

bool CLedger::IsInvalid(const uint256& hash) const {
    std::lock_guard<std::recursive_mutex> lock(cs_main);
    return m_invalid.count(hash) > 0;
}

bool CLedger::GetActiveBlock(uint32_t height, CBlock& block) const {
    std::lock_guard<std::recursive_mutex> lock(cs_main);
    const CBlockIndex* pindex = m_chainstate.GetActiveBlock(height);
    if (pindex == nullptr) {
        return false;
    }
    block = pindex->block;
    return true;
}

bool CLedger::GetBlockRange(const uint256& hashStop, uint32_t nFromHeight, size_t nMax,
                            std::vector<CBlock>& blocks) const {
    std::lock_guard<std::recursive_mutex> lock(cs_main);
    blocks.clear();

    const CBlockIndex* pindex = hashStop.IsNull() ? m_chainstate.GetTip() : m_chainstate.LookupBlockIndex(hashStop);
    if (pindex == nullptr) {
        return false;
    }

    std::vector<const CBlockIndex*> branch;
    for (; pindex != nullptr && pindex->nHeight >= nFromHeight && pindex->nHeight > 0; pindex = pindex->pprev) {
        branch.push_back(pindex);
    }

    // Oldest first, so the requester can connect them in order
    for (auto it = branch.rbegin(); it != branch.rend() && blocks.size() < nMax; ++it) {
        blocks.push_back((*it)->block);
    }
    return true;
}

bool CLedger::GetLastReorg(CReorgEvent& event) const {
    std::lock_guard<std::recursive_mutex> lock(cs_main);
    if (!m_fHaveReorg) {
        return false;
    }
    event = m_lastReorg;
    return true;
}

size_t CLedger::ExpireOrphans() {
    std::lock_guard<std::recursive_mutex> lock(cs_main);
    return m_orphans.EraseExpiredOrphans();
}

size_t CLedger::ExpireOrphans(std::chrono::seconds maxAge, COrphanManager::Clock::time_point now) {
    std::lock_guard<std::recursive_mutex> lock(cs_main);
    return m_orphans.EraseExpiredOrphans(maxAge, now);
}
