// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <consensus/chain.h>

#include <consensus/quality.h>
#include <util/logging.h>

#include <algorithm>
#include <iostream>

CBlockIndex* CChainState::AddBlockIndex(const CBlock& block, unsigned int nQuality) {
    std::lock_guard<std::mutex> lock(cs_chain);

    uint256 hash = block.GetHash();
    auto it = mapBlockIndex.find(hash);
    if (it != mapBlockIndex.end()) {
        return it->second.get();
    }

    CBlockIndex* pprev = nullptr;
    if (!mapBlockIndex.empty()) {
        auto itPrev = mapBlockIndex.find(block.hashPrevBlock);
        if (itPrev == mapBlockIndex.end()) {
            return nullptr;
        }
        pprev = itPrev->second.get();
    } else if (!block.IsGenesis()) {
        return nullptr;
    }

    std::unique_ptr<CBlockIndex> pindex(new CBlockIndex(block));
    pindex->pprev = pprev;
    pindex->nQuality = nQuality;
    pindex->nStatus = CBlockIndex::BLOCK_VALID_TREE | CBlockIndex::BLOCK_HAVE_DATA;
    pindex->nSequenceId = ++nSequence;
    pindex->BuildSkip();

    CBlockIndex* raw = pindex.get();
    mapBlockIndex.emplace(hash, std::move(pindex));
    return raw;
}

CBlockIndex* CChainState::LookupBlockIndex(const uint256& hash) const {
    std::lock_guard<std::mutex> lock(cs_chain);
    auto it = mapBlockIndex.find(hash);
    return it == mapBlockIndex.end() ? nullptr : it->second.get();
}

bool CChainState::HasBlockIndex(const uint256& hash) const {
    std::lock_guard<std::mutex> lock(cs_chain);
    return mapBlockIndex.count(hash) > 0;
}

const CBlockIndex* CChainState::GetTip() const {
    std::lock_guard<std::mutex> lock(cs_chain);
    return pindexTip;
}

uint32_t CChainState::GetHeight() const {
    std::lock_guard<std::mutex> lock(cs_chain);
    return pindexTip ? pindexTip->nHeight : 0;
}

uint256 CChainState::GetChainWeight() const {
    std::lock_guard<std::mutex> lock(cs_chain);
    return pindexTip ? pindexTip->nChainWeight : uint256();
}

size_t CChainState::GetBlockCount() const {
    std::lock_guard<std::mutex> lock(cs_chain);
    return mapBlockIndex.size();
}

bool CChainState::IsBetterTip(const CBlockIndex* candidate, const CBlockIndex* tip) {
    if (tip == nullptr) {
        return candidate != nullptr;
    }
    if (candidate == nullptr || candidate == tip) {
        return false;
    }
    if (WeightGreaterThan(candidate->nChainWeight, tip->nChainWeight)) {
        return true;
    }
    if (WeightGreaterThan(tip->nChainWeight, candidate->nChainWeight)) {
        return false;
    }
    // Equal weight: smaller hash wins
    return candidate->GetBlockHash() < tip->GetBlockHash();
}

void CChainState::ActivateBestChain(CBlockIndex* pindexNew, CReorgEvent& event, bool& fTipChanged) {
    std::lock_guard<std::mutex> lock(cs_chain);
    fTipChanged = false;

    if (pindexNew == nullptr || !IsBetterTip(pindexNew, pindexTip)) {
        return;
    }

    // Genesis
    if (pindexTip == nullptr) {
        vChain.assign(1, pindexNew);
        pindexTip = pindexNew;
        event = CReorgEvent();
        event.hashNewTip = pindexNew->GetBlockHash();
        event.nNewHeight = pindexNew->nHeight;
        event.hashFork = pindexNew->GetBlockHash();
        event.vConnected.push_back(pindexNew->GetBlockHash());
        fTipChanged = true;
        return;
    }

    const CBlockIndex* pindexFork = LastCommonAncestor(pindexTip, pindexNew);
    if (pindexFork == nullptr) {
        // Every indexed block descends from the same genesis
        LogPrintConsensus(ERROR, "No common ancestor between tip %s and %s",
                          pindexTip->GetBlockHash().GetHex().c_str(),
                          pindexNew->GetBlockHash().GetHex().c_str());
        return;
    }

    event = CReorgEvent();
    event.hashOldTip = pindexTip->GetBlockHash();
    event.nOldHeight = pindexTip->nHeight;
    event.hashNewTip = pindexNew->GetBlockHash();
    event.nNewHeight = pindexNew->nHeight;
    event.hashFork = pindexFork->GetBlockHash();
    event.nForkHeight = pindexFork->nHeight;

    for (const CBlockIndex* pindex = pindexTip; pindex != pindexFork; pindex = pindex->pprev) {
        event.vDisconnected.push_back(pindex->GetBlockHash());
    }

    std::vector<CBlockIndex*> connectBlocks;
    for (CBlockIndex* pindex = pindexNew; pindex != pindexFork; pindex = pindex->pprev) {
        connectBlocks.push_back(pindex);
    }
    std::reverse(connectBlocks.begin(), connectBlocks.end());

    vChain.resize(pindexFork->nHeight + 1);
    for (CBlockIndex* pindex : connectBlocks) {
        vChain.push_back(pindex);
        event.vConnected.push_back(pindex->GetBlockHash());
    }

    pindexTip = pindexNew;
    fTipChanged = true;

    if (event.IsReorg()) {
        std::cout << "[Chain] Reorganized: disconnected " << event.vDisconnected.size()
                  << ", connected " << event.vConnected.size()
                  << ", fork at height " << event.nForkHeight << std::endl;
    }
}

const CBlockIndex* CChainState::GetActiveBlock(uint32_t height) const {
    std::lock_guard<std::mutex> lock(cs_chain);
    return height < vChain.size() ? vChain[height] : nullptr;
}

uint32_t CChainState::GetLastConfirmedHeight() const {
    std::lock_guard<std::mutex> lock(cs_chain);
    return nLastConfirmedHeight;
}

std::vector<const CBlockIndex*> CChainState::UpdateConfirmations(uint32_t depth) {
    std::lock_guard<std::mutex> lock(cs_chain);
    std::vector<const CBlockIndex*> confirmed;
    if (pindexTip == nullptr || pindexTip->nHeight <= depth) {
        return confirmed;
    }

    uint32_t nBuried = pindexTip->nHeight - depth;
    while (nLastConfirmedHeight < nBuried) {
        CBlockIndex* pindex = vChain[nLastConfirmedHeight + 1];
        pindex->nStatus |= CBlockIndex::BLOCK_CONFIRMED;
        confirmed.push_back(pindex);
        nLastConfirmedHeight++;
    }
    return confirmed;
}
