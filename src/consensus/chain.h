// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_CONSENSUS_CHAIN_H
#define PLOTCHAIN_CONSENSUS_CHAIN_H

#include <node/block_index.h>
#include <primitives/block.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * Tip change notification.
 *
 * A plain extension has an empty vDisconnected list. vDisconnected runs from
 * the old tip down to (not including) the fork point; vConnected runs from
 * just above the fork point up to the new tip.
 */
struct CReorgEvent {
    uint256 hashOldTip;
    uint256 hashNewTip;
    uint256 hashFork;
    uint32_t nOldHeight{0};
    uint32_t nNewHeight{0};
    uint32_t nForkHeight{0};
    std::vector<uint256> vDisconnected;
    std::vector<uint256> vConnected;

    bool IsReorg() const { return !vDisconnected.empty(); }
};

/**
 * Chain State Manager
 *
 * Owns the block tree arena and the active chain. The canonical tip is the
 * block with the greatest cumulative weight; equal weights go to the
 * smaller block hash, so every node holding the same blocks picks the same
 * tip regardless of arrival order.
 *
 * Thread Safety: all members are guarded by cs_chain. Returned index
 * pointers stay valid for the lifetime of the chain state (entries are
 * never erased).
 */
class CChainState
{
private:
    std::map<uint256, std::unique_ptr<CBlockIndex>> mapBlockIndex;

    // Active chain tip (greatest cumulative weight)
    CBlockIndex* pindexTip{nullptr};

    // Active chain by height, vChain[0] is genesis
    std::vector<CBlockIndex*> vChain;

    // Highest height buried under the confirmation depth (genesis is final)
    uint32_t nLastConfirmedHeight{0};

    uint64_t nSequence{0};

    mutable std::mutex cs_chain;

public:
    CChainState() = default;
    ~CChainState() = default;

    CChainState(const CChainState&) = delete;
    CChainState& operator=(const CChainState&) = delete;

    /**
     * Add a block to the tree.
     *
     * The parent must already be indexed, except for the first block added,
     * which becomes the genesis. Re-adding a known block returns the
     * existing entry.
     *
     * @return The index entry, or nullptr if the parent is unknown
     */
    CBlockIndex* AddBlockIndex(const CBlock& block, unsigned int nQuality);

    CBlockIndex* LookupBlockIndex(const uint256& hash) const;
    bool HasBlockIndex(const uint256& hash) const;

    const CBlockIndex* GetTip() const;
    uint32_t GetHeight() const;
    uint256 GetChainWeight() const;
    size_t GetBlockCount() const;

    /** Fork-choice order: does candidate beat tip? */
    static bool IsBetterTip(const CBlockIndex* candidate, const CBlockIndex* tip);

    /**
     * Make pindexNew the tip if it beats the current one.
     *
     * @param pindexNew    Newly indexed block
     * @param event        Filled in when the tip changes
     * @param fTipChanged  Set to whether it did
     */
    void ActivateBestChain(CBlockIndex* pindexNew, CReorgEvent& event, bool& fTipChanged);

    /** Block on the active chain at height, or nullptr */
    const CBlockIndex* GetActiveBlock(uint32_t height) const;

    uint32_t GetLastConfirmedHeight() const;

    /**
     * Mark active blocks buried under depth blocks as confirmed.
     *
     * @return Newly confirmed blocks in height order
     */
    std::vector<const CBlockIndex*> UpdateConfirmations(uint32_t depth);
};

#endif // PLOTCHAIN_CONSENSUS_CHAIN_H
