// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <node/block_index.h>

#include <consensus/quality.h>

#include <sstream>

CBlockIndex::CBlockIndex(const CBlock& blockIn)
    : block(blockIn),
      nHeight(blockIn.nHeight),
      nTime(blockIn.nTime),
      nDifficulty(blockIn.nDifficulty),
      nChainWeight(blockIn.nCumulativeWeight),
      hashBlock(blockIn.GetHash())
{
}

std::string CBlockIndex::ToString() const {
    std::stringstream ss;
    ss << "CBlockIndex(hash=" << hashBlock.GetHex().substr(0, 16) << "..."
       << ", height=" << nHeight << ", quality=" << nQuality
       << ", difficulty=" << nDifficulty
       << ", weight=" << WeightToDouble(nChainWeight) << ")";
    return ss.str();
}

// Helper functions for skip pointer calculation
static inline uint32_t InvertLowestOne(uint32_t n) {
    return n & (n - 1);
}

static inline uint32_t GetSkipHeight(uint32_t height) {
    if (height < 2)
        return 0;

    // Skip back exponentially so ancestor lookup is O(log n)
    return (height & 1) ? InvertLowestOne(InvertLowestOne(height - 1)) + 1 : InvertLowestOne(height);
}

void CBlockIndex::BuildSkip() {
    if (pprev != nullptr) {
        pskip = pprev->GetAncestor(GetSkipHeight(nHeight));
    }
}

CBlockIndex* CBlockIndex::GetAncestor(uint32_t height) {
    if (height > nHeight) {
        return nullptr;
    }

    CBlockIndex* pindexWalk = this;
    uint32_t heightWalk = nHeight;
    while (heightWalk > height) {
        uint32_t heightSkip = GetSkipHeight(heightWalk);
        uint32_t heightSkipPrev = GetSkipHeight(heightWalk - 1);
        if (pindexWalk->pskip != nullptr &&
            (heightSkip == height ||
             (heightSkip > height && !(heightSkipPrev + 2 < heightSkip && heightSkipPrev >= height)))) {
            pindexWalk = pindexWalk->pskip;
            heightWalk = heightSkip;
        } else {
            if (pindexWalk->pprev == nullptr) {
                return nullptr;
            }
            pindexWalk = pindexWalk->pprev;
            heightWalk--;
        }
    }
    return pindexWalk;
}

const CBlockIndex* CBlockIndex::GetAncestor(uint32_t height) const {
    return const_cast<CBlockIndex*>(this)->GetAncestor(height);
}

const CBlockIndex* LastCommonAncestor(const CBlockIndex* pa, const CBlockIndex* pb) {
    if (pa == nullptr || pb == nullptr) {
        return nullptr;
    }
    if (pa->nHeight > pb->nHeight) {
        pa = pa->GetAncestor(pb->nHeight);
    } else if (pb->nHeight > pa->nHeight) {
        pb = pb->GetAncestor(pa->nHeight);
    }
    while (pa != pb && pa != nullptr && pb != nullptr) {
        pa = pa->pprev;
        pb = pb->pprev;
    }
    return pa;
}
