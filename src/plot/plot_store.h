// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_PLOT_PLOT_STORE_H
#define PLOTCHAIN_PLOT_PLOT_STORE_H

#include <primitives/block.h>

#include <leveldb/db.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

enum class PlotStoreResult {
    OK,
    NOT_FOUND,
    CORRUPT_ENTRY,    // record failed its checksum or layout checks
    IO_FAILURE        // storage layer error
};

const char* PlotStoreResultToString(PlotStoreResult result);

/** Half-open index range [begin, end) */
struct CPlotRange {
    uint64_t begin{0};
    uint64_t end{0};

    uint64_t size() const { return end > begin ? end - begin : 0; }
    bool empty() const { return size() == 0; }
};

/**
 * On-disk plot for one farmer identity.
 *
 * Entries live in LevelDB under 'p' || farmerId || index (big-endian), so
 * iteration walks a farmer's plot in index order. Each value is
 *
 *   [VERSION u32][COMPLETE u8][LENGTH u32][DATA][SHA3-256(index || COMPLETE || DATA)]
 *
 * and the checksum is verified on every Get. A metadata record
 * 'm' || farmerId pins the encoding layer count the plot was built with.
 *
 * Thread safety: Get never takes a lock (LevelDB reads are thread-safe);
 * Put serialises only the in-memory completion bitmap update, so readers of
 * already completed indices never wait on a writer. Open and Close must not
 * race with other calls.
 */
class CPlotStore {
public:
    CPlotStore();
    virtual ~CPlotStore();

    CPlotStore(const CPlotStore&) = delete;
    CPlotStore& operator=(const CPlotStore&) = delete;

    /**
     * Open (or create) the plot database and rebuild the completion state.
     *
     * @param path     LevelDB directory
     * @param farmerId Identity whose entries this store manages
     * @param layers   Encoding layers; must match an existing plot
     * @param error    Set on failure
     */
    bool Open(const std::string& path, const uint256& farmerId, uint32_t layers, std::string& error);
    void Close();
    bool IsOpen() const { return db != nullptr; }

    /** Store an encoded piece and mark the index complete. Anything but PIECE_SIZE bytes is CORRUPT_ENTRY. */
    virtual PlotStoreResult Put(uint64_t index, const std::vector<uint8_t>& encoded);

    /** Fetch and integrity-check an encoded piece */
    virtual PlotStoreResult Get(uint64_t index, std::vector<uint8_t>& encoded) const;

    bool Has(uint64_t index) const;

    /** Contiguous completed prefix [0, end) */
    CPlotRange CompletedRange() const;
    uint64_t CompletedCount() const;

    /** Percentage of [0, pieceCount) that is plotted */
    double CompletionPercent(uint64_t pieceCount) const;

    /** Delete every entry of this farmer (rebuilds a corrupt plot from scratch) */
    PlotStoreResult Clear();

    const uint256& GetFarmerId() const { return m_farmerId; }
    uint32_t GetLayers() const { return m_layers; }

    /** Disable fsync per write (bulk plotting on throwaway data) */
    void SetSyncWrites(bool sync) { m_syncWrites = sync; }

    static std::string MakeKey(const uint256& farmerId, uint64_t index);
    static std::string MakeMetaKey(const uint256& farmerId);

private:
    void MarkComplete(uint64_t index);
    bool LoadCompletion(std::string& error);
    bool CheckMetadata(std::string& error);

    std::unique_ptr<leveldb::DB> db;
    uint256 m_farmerId;
    uint32_t m_layers{0};
    bool m_syncWrites{true};

    mutable std::shared_mutex cs_completion;
    std::vector<bool> m_completed;
    uint64_t m_completedCount{0};
    uint64_t m_contiguousEnd{0};
};

#endif // PLOTCHAIN_PLOT_PLOT_STORE_H
