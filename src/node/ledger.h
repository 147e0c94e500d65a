// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_NODE_LEDGER_H
#define PLOTCHAIN_NODE_LEDGER_H

#include <consensus/chain.h>
#include <consensus/quality.h>
#include <consensus/validation.h>
#include <core/chainparams.h>
#include <net/orphan_manager.h>
#include <primitives/block.h>

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

class CBlockchainDB;
class CChainPieceSet;
class CKey;

/**
 * @brief Result codes for CLedger::ProcessBlock()
 */
enum class BlockProcessResult {
    ACCEPTED,           // Block added to the tree (canonical or not)
    ALREADY_HAVE,       // Known block, known orphan, or redelivery
    ORPHAN,             // Parent unknown, buffered
    INVALID,            // Failed validation; remembered and never reconsidered
    DB_ERROR            // Database write failed
};

const char* BlockProcessResultToString(BlockProcessResult result);

/** Outcome of CLedger::Validate() */
enum class BlockValidity {
    VALID,
    INVALID,
    MISSING_PARENT      // context-free checks passed, parent not in the tree
};

/**
 * Ledger - block tree, fork choice and confirmation
 *
 * All mutation goes through ProcessBlock(), serialised under cs_main, so
 * weight comparisons and tip changes are linearizable. Tip-change
 * notifications are delivered under cs_main too, in the order the changes
 * happened; callbacks may read the ledger but must not call ProcessBlock().
 *
 * Every block whose active-chain depth reaches the confirmation depth
 * appends one piece to the piece set, so the piece set always matches the
 * canonical history.
 */
class CLedger
{
public:
    typedef std::function<void(const CReorgEvent&)> ReorgCallback;

    static const size_t MAX_INVALID_CACHE = 10000;

    /**
     * @param params   Chain parameters (must outlive the ledger)
     * @param pieceSet Piece set holding the genesis pieces; grows on confirmation
     * @param db       Optional block database; nullptr keeps the tree in memory only
     */
    CLedger(const Plotchain::ChainParams& params, CChainPieceSet& pieceSet, CBlockchainDB* db = nullptr);
    ~CLedger() = default;

    CLedger(const CLedger&) = delete;
    CLedger& operator=(const CLedger&) = delete;

    /**
     * Index the genesis block and replay any stored blocks.
     * The piece set must already hold the genesis pieces.
     */
    bool Init(std::string& error);

    /**
     * Validate and insert a block delivered by source.
     *
     * Blocks with an unknown parent are buffered; once the parent connects
     * they are processed in turn. Rejections are logged, never thrown.
     */
    BlockProcessResult ProcessBlock(const CBlock& block, SourceId source, std::string& reason);
    BlockProcessResult ProcessBlock(const CBlock& block, SourceId source = LOCAL_SOURCE);

    /** Run every check without changing any state */
    BlockValidity Validate(const CBlock& block, std::string& reason) const;

    /**
     * Build and sign a block on the current tip around a local proof.
     *
     * Fails if the proof answers a stale challenge, falls short of the
     * difficulty, or key does not match the proof's farmer.
     */
    bool CreateLocalBlock(const CProof& proof, const CKey& key, CBlock& block, std::string& error) const;

    /** Challenge and difficulty for the next block on the current tip */
    void GetNextChallenge(CChallenge& challenge, uint32_t& nDifficulty) const;

    void RegisterReorgCallback(ReorgCallback callback);

    uint256 GetTipHash() const;
    uint32_t GetHeight() const;
    uint256 GetChainWeight() const;
    uint32_t GetLastConfirmedHeight() const;
    size_t GetBlockCount() const;
    bool HaveBlock(const uint256& hash) const;
    bool IsInvalid(const uint256& hash) const;

    /** Canonical block at height */
    bool GetActiveBlock(uint32_t height, CBlock& block) const;

    /**
     * Ancestors of hashStop (the tip if null) from height nFromHeight up,
     * oldest first, at most nMax of them. Genesis is never included.
     *
     * @return false if hashStop is not in the tree
     */
    bool GetBlockRange(const uint256& hashStop, uint32_t nFromHeight, size_t nMax,
                       std::vector<CBlock>& blocks) const;

    /** Last event that disconnected blocks; false if none happened */
    bool GetLastReorg(CReorgEvent& event) const;

    size_t GetOrphanCount() const { return m_orphans.GetOrphanCount(); }

    /** Drop orphans whose parent did not arrive in time */
    size_t ExpireOrphans();
    size_t ExpireOrphans(std::chrono::seconds maxAge, COrphanManager::Clock::time_point now);


private:
    BlockProcessResult AcceptBlock(const CBlock& block, SourceId source, bool fPersist, std::string& reason);
    bool CheckForkDepth(const CBlockIndex* pindexPrev, std::string& reason) const;
    void MarkInvalid(const uint256& hash);
    void ConnectOrphans(const uint256& parentHash);
    void ApplyConfirmations();
    void Notify(const CReorgEvent& event);

    const Plotchain::ChainParams& m_params;
    CChainPieceSet& m_pieceSet;
    CBlockchainDB* m_db;
    CBlockValidator m_validator;

    CChainState m_chainstate;
    COrphanManager m_orphans;

    // Rejected hashes, oldest first
    std::set<uint256> m_invalid;
    std::deque<uint256> m_invalidOrder;

    std::vector<ReorgCallback> m_callbacks;
    CReorgEvent m_lastReorg;
    bool m_fHaveReorg{false};

    bool m_fReplaying{false};

    mutable std::recursive_mutex cs_main;
};

#endif // PLOTCHAIN_NODE_LEDGER_H
