// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_PLOT_PLOTTER_H
#define PLOTCHAIN_PLOT_PLOTTER_H

#include <plot/piece_set.h>
#include <plot/plot_store.h>
#include <primitives/block.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

enum class PlotResult {
    OK,                     // every index in range is plotted
    PARTIAL,                // some indices failed or the run was stopped
    MALFORMED_PIECE_SET,    // provider broke the size/order contract
    STORE_UNAVAILABLE       // store closed or opened for another farmer
};

const char* PlotResultToString(PlotResult result);

struct CPlotReport {
    PlotResult result{PlotResult::OK};
    uint64_t nEncoded{0};           // pieces encoded and stored by this run
    uint64_t nSkipped{0};           // already complete before the run
    std::vector<uint64_t> failed;   // sorted, retried indices that still failed
    bool fStopped{false};
    std::string error;
};

/**
 * Plotter - encodes a piece set into a farmer's plot store
 *
 * Pieces are independent, so the pool encodes one piece per worker; each
 * encode is internally sequential. Runs are idempotent by index: anything
 * the store already reports complete is skipped, which is also how an
 * interrupted run resumes.
 *
 * Usage:
 *   CPlotter plotter(4, 3);
 *   plotter.SetProgressCallback([](uint64_t done, uint64_t total) { ... });
 *   CPlotReport report = plotter.Plot(pieceSet, farmerId, store);
 *   // later, after the piece set grew from n pieces:
 *   report = plotter.Extend(pieceSet, farmerId, store, n);
 */
class CPlotter {
public:
    typedef std::function<void(uint64_t done, uint64_t total)> ProgressCallback;

    /**
     * @param nThreads Worker count (0 = hardware concurrency)
     * @param nRetries Put attempts per piece before it is recorded as failed
     */
    explicit CPlotter(uint32_t nThreads = 0, uint32_t nRetries = 3);
    ~CPlotter();

    CPlotter(const CPlotter&) = delete;
    CPlotter& operator=(const CPlotter&) = delete;

    /** Plot every index in [0, pieceSet.Size()) not yet in the store. Blocks until done. */
    CPlotReport Plot(const CPieceSet& pieceSet, const uint256& farmerId, CPlotStore& store);

    /** Plot only [previousSize, pieceSet.Size()) after the piece set grew */
    CPlotReport Extend(const CPieceSet& pieceSet, const uint256& farmerId, CPlotStore& store,
                       uint64_t previousSize);

    /** Ask a running Plot/Extend to finish the pieces in flight and return */
    void Stop() { m_stop = true; }
    bool IsRunning() const { return m_running; }

    /**
     * Called from worker threads with the callback mutex held.
     * Must not call Plot() or Stop() on this plotter from inside.
     */
    void SetProgressCallback(ProgressCallback callback);

    uint32_t GetThreadCount() const { return m_nThreads; }
    uint32_t GetRetryCount() const { return m_nRetries; }

    /** Total pieces encoded by this plotter across all runs */
    uint64_t GetTotalEncoded() const { return m_totalEncoded.load(std::memory_order_relaxed); }

private:
    struct RunState;

    CPlotReport PlotRange(const CPieceSet& pieceSet, const uint256& farmerId, CPlotStore& store,
                          uint64_t begin, uint64_t end);
    void PlotWorker(RunState& run);
    bool StorePiece(RunState& run, uint64_t index, const std::vector<uint8_t>& encoded);
    void ReportProgress(RunState& run);

    uint32_t m_nThreads;
    uint32_t m_nRetries;
    std::atomic<bool> m_stop{false};
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_totalEncoded{0};

    ProgressCallback m_progressCallback;
    std::mutex m_callbackMutex;
};

#endif // PLOTCHAIN_PLOT_PLOTTER_H
