// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_NODE_BLOCK_INDEX_H
#define PLOTCHAIN_NODE_BLOCK_INDEX_H

#include <primitives/block.h>

#include <cstdint>
#include <string>

/**
 * Node of the block tree.
 *
 * Index entries are owned by the ledger's arena (keyed by block hash) and
 * never move or die while the ledger lives, so pprev/pskip are plain
 * non-owning pointers into that arena.
 */
class CBlockIndex
{
public:
    CBlock block;                    // full block, kept for challenge derivation and persistence
    CBlockIndex* pprev{nullptr};
    CBlockIndex* pskip{nullptr};
    uint32_t nHeight{0};
    uint32_t nTime{0};
    uint32_t nDifficulty{0};
    unsigned int nQuality{0};
    uint256 nChainWeight;            // little-endian cumulative weight
    uint32_t nStatus{0};
    uint64_t nSequenceId{0};         // arrival order, for logging only

    CBlockIndex() = default;
    explicit CBlockIndex(const CBlock& blockIn);

    CBlockIndex(const CBlockIndex&) = delete;
    CBlockIndex& operator=(const CBlockIndex&) = delete;

    const uint256& GetBlockHash() const { return hashBlock; }
    bool IsValid() const { return (nStatus & BLOCK_FAILED_MASK) == 0; }
    std::string ToString() const;

    /** Set pskip once pprev is linked */
    void BuildSkip();

    /** Ancestor at the given height, or nullptr */
    CBlockIndex* GetAncestor(uint32_t height);
    const CBlockIndex* GetAncestor(uint32_t height) const;

    enum BlockStatus : uint32_t {
        BLOCK_VALID_TREE    = 1,     // parent known, contextual checks passed
        BLOCK_HAVE_DATA     = 8,
        BLOCK_CONFIRMED     = 16,    // buried under confirmation depth on the canonical chain
        BLOCK_FAILED_VALID  = 32,
        BLOCK_FAILED_MASK   = BLOCK_FAILED_VALID,
    };

private:
    uint256 hashBlock;
};

/** Last common block of two branches */
const CBlockIndex* LastCommonAncestor(const CBlockIndex* pa, const CBlockIndex* pb);

#endif // PLOTCHAIN_NODE_BLOCK_INDEX_H
