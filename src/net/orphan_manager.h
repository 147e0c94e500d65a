// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_NET_ORPHAN_MANAGER_H
#define PLOTCHAIN_NET_ORPHAN_MANAGER_H

#include <primitives/block.h>

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <vector>

/** Identifies who delivered a block (a gossip source, or LOCAL_SOURCE) */
typedef int SourceId;

static const SourceId LOCAL_SOURCE = -1;

/**
 * Buffer for blocks whose parent is not yet known.
 *
 * Bounded by count, bytes and per-source share; the oldest orphan is
 * evicted first. When a block connects, the ledger asks for its buffered
 * children and processes them.
 */
class COrphanManager {
public:
    typedef std::chrono::steady_clock Clock;

    static constexpr size_t MAX_ORPHAN_BLOCKS = 100;
    static constexpr size_t MAX_ORPHAN_BYTES = 100 * 1024 * 1024;
    static constexpr size_t MAX_ORPHANS_PER_SOURCE = 100;
    static constexpr int DEFAULT_ORPHAN_EXPIRATION_SECS = 1200;   // 20 minutes

    COrphanManager();
    ~COrphanManager() = default;

    COrphanManager(const COrphanManager&) = delete;
    COrphanManager& operator=(const COrphanManager&) = delete;

    /**
     * Buffer a block.
     *
     * @return false if the source is over its share or the block does not fit
     */
    bool AddOrphanBlock(SourceId source, const CBlock& block);

    bool HaveOrphanBlock(const uint256& hash) const;
    bool GetOrphanBlock(const uint256& hash, CBlock& block) const;
    bool EraseOrphanBlock(const uint256& hash);

    /** Buffered blocks whose hashPrevBlock is parentHash */
    std::vector<uint256> GetOrphanChildren(const uint256& parentHash) const;

    size_t EraseOrphansForSource(SourceId source);
    size_t GetOrphanCountForSource(SourceId source) const;

    /** Drop orphans older than maxAge; returns how many were dropped */
    size_t EraseExpiredOrphans(std::chrono::seconds maxAge = std::chrono::seconds(DEFAULT_ORPHAN_EXPIRATION_SECS));
    size_t EraseExpiredOrphans(std::chrono::seconds maxAge, Clock::time_point now);

    size_t GetOrphanCount() const;
    size_t GetOrphanBytes() const;

    void Clear();

private:
    struct COrphanBlock {
        CBlock block;
        SourceId source;
        Clock::time_point timeReceived;
        size_t nBlockSize;
        uint64_t nSequence;     // arrival order, oldest is evicted first

        COrphanBlock(const CBlock& blk, SourceId src, size_t size, uint64_t seq)
            : block(blk), source(src), timeReceived(Clock::now()), nBlockSize(size), nSequence(seq) {}
    };

    std::map<uint256, COrphanBlock> mapOrphanBlocks;

    // parent hash -> orphan hash
    std::multimap<uint256, uint256> mapOrphanBlocksByPrev;

    std::map<SourceId, std::set<uint256>> mapOrphanBlocksBySource;

    size_t nOrphanBytes;
    uint64_t nNextSequence;

    mutable std::mutex cs_orphans;

    // The helpers below expect cs_orphans to be held
    void LimitOrphans();
    std::map<uint256, COrphanBlock>::iterator SelectOrphanForEviction();
    void EraseOrphanInternal(std::map<uint256, COrphanBlock>::iterator it);
};

#endif // PLOTCHAIN_NET_ORPHAN_MANAGER_H
