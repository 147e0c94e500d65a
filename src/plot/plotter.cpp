// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <plot/plotter.h>

#include <sloth/sloth.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

const uint32_t MAX_PLOT_THREADS = 64;
const int64_t RETRY_BACKOFF_MS = 20;

} // anonymous namespace

const char* PlotResultToString(PlotResult result) {
    switch (result) {
        case PlotResult::OK: return "OK";
        case PlotResult::PARTIAL: return "Partial";
        case PlotResult::MALFORMED_PIECE_SET: return "MalformedPieceSet";
        case PlotResult::STORE_UNAVAILABLE: return "StoreUnavailable";
    }
    return "Unknown";
}

struct CPlotter::RunState {
    const CPieceSet& pieceSet;
    const uint256& farmerId;
    CPlotStore& store;
    uint64_t begin;
    uint64_t end;

    std::atomic<uint64_t> next;
    std::atomic<uint64_t> done{0};
    std::atomic<uint64_t> encoded{0};
    std::atomic<uint64_t> skipped{0};
    std::atomic<bool> malformed{false};
    uint64_t lastReportedDecile{0};

    std::mutex cs_failed;
    std::vector<uint64_t> failed;
    std::string error;

    RunState(const CPieceSet& set, const uint256& id, CPlotStore& target, uint64_t b, uint64_t e)
        : pieceSet(set), farmerId(id), store(target), begin(b), end(e), next(b) {}
};

CPlotter::CPlotter(uint32_t nThreads, uint32_t nRetries)
    : m_nThreads(nThreads), m_nRetries(nRetries)
{
    if (m_nThreads == 0) {
        m_nThreads = std::thread::hardware_concurrency();
        if (m_nThreads == 0) {
            m_nThreads = 1;
        }
    }
    m_nThreads = std::min(m_nThreads, MAX_PLOT_THREADS);
    if (m_nRetries == 0) {
        m_nRetries = 1;
    }
}

CPlotter::~CPlotter() {
    Stop();
}

void CPlotter::SetProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_progressCallback = std::move(callback);
}

CPlotReport CPlotter::Plot(const CPieceSet& pieceSet, const uint256& farmerId, CPlotStore& store) {
    return PlotRange(pieceSet, farmerId, store, 0, pieceSet.Size());
}

CPlotReport CPlotter::Extend(const CPieceSet& pieceSet, const uint256& farmerId, CPlotStore& store,
                             uint64_t previousSize) {
    uint64_t size = pieceSet.Size();
    return PlotRange(pieceSet, farmerId, store, std::min(previousSize, size), size);
}

CPlotReport CPlotter::PlotRange(const CPieceSet& pieceSet, const uint256& farmerId, CPlotStore& store,
                                uint64_t begin, uint64_t end) {
    CPlotReport report;

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        report.result = PlotResult::STORE_UNAVAILABLE;
        report.error = "plotter already running";
        return report;
    }

    if (!store.IsOpen() || store.GetFarmerId() != farmerId) {
        m_running = false;
        report.result = PlotResult::STORE_UNAVAILABLE;
        report.error = store.IsOpen() ? "plot store belongs to another farmer" : "plot store is not open";
        LogPrintPlot(ERROR, "Cannot plot: %s", report.error.c_str());
        return report;
    }

    m_stop = false;
    RunState run(pieceSet, farmerId, store, begin, end);

    int64_t nStart = GetTimeMillis();
    std::cout << "[Plotter] Plotting pieces " << begin << ".." << end << " with "
              << m_nThreads << " thread(s), " << store.GetLayers() << " layer(s)" << std::endl;

    uint32_t nWorkers = static_cast<uint32_t>(std::min<uint64_t>(m_nThreads, std::max<uint64_t>(end - begin, 1)));
    std::vector<std::thread> workers;
    workers.reserve(nWorkers);
    for (uint32_t i = 0; i < nWorkers; ++i) {
        workers.emplace_back(&CPlotter::PlotWorker, this, std::ref(run));
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    report.nEncoded = run.encoded.load();
    report.nSkipped = run.skipped.load();
    report.failed = std::move(run.failed);
    std::sort(report.failed.begin(), report.failed.end());
    report.fStopped = m_stop.load() && !run.malformed.load();
    report.error = run.error;

    if (run.malformed) {
        report.result = PlotResult::MALFORMED_PIECE_SET;
    } else if (!report.failed.empty() || report.fStopped) {
        report.result = PlotResult::PARTIAL;
    } else {
        report.result = PlotResult::OK;
    }

    int64_t nElapsed = GetTimeMillis() - nStart;
    std::cout << "[Plotter] " << PlotResultToString(report.result) << ": encoded " << report.nEncoded
              << ", skipped " << report.nSkipped << ", failed " << report.failed.size()
              << " (" << nElapsed << " ms)" << std::endl;
    if (!report.failed.empty()) {
        LogPrintPlot(WARN, "%zu piece(s) could not be stored, first failed index %llu",
                     report.failed.size(), static_cast<unsigned long long>(report.failed.front()));
    }

    m_running = false;
    return report;
}

void CPlotter::PlotWorker(RunState& run) {
    while (!m_stop.load(std::memory_order_relaxed)) {
        uint64_t index = run.next.fetch_add(1);
        if (index >= run.end) {
            break;
        }

        if (run.store.Has(index)) {
            run.skipped++;
            run.done++;
            ReportProgress(run);
            continue;
        }

        Piece piece;
        PieceSetResult pieceResult = run.pieceSet.GetPiece(index, piece);
        if (pieceResult != PieceSetResult::OK || piece.size() != PIECE_SIZE) {
            std::lock_guard<std::mutex> lock(run.cs_failed);
            if (!run.malformed) {
                run.error = strprintf("piece %llu: %s", static_cast<unsigned long long>(index),
                                      PieceSetResultToString(pieceResult == PieceSetResult::OK
                                                             ? PieceSetResult::MALFORMED_PIECE_SET
                                                             : pieceResult));
                LogPrintPlot(ERROR, "Aborting plot, %s", run.error.c_str());
            }
            run.malformed = true;
            m_stop = true;
            break;
        }

        std::vector<uint8_t> encoded;
        try {
            encoded = sloth::encode(piece, run.farmerId, index, run.store.GetLayers());
        } catch (const sloth::SlothError& e) {
            // The piece set handed us a block outside the field
            std::lock_guard<std::mutex> lock(run.cs_failed);
            if (!run.malformed) {
                run.error = strprintf("piece %llu: %s", static_cast<unsigned long long>(index), e.what());
                LogPrintPlot(ERROR, "Aborting plot, %s", run.error.c_str());
            }
            run.malformed = true;
            m_stop = true;
            break;
        }

        if (StorePiece(run, index, encoded)) {
            run.encoded++;
            m_totalEncoded.fetch_add(1, std::memory_order_relaxed);
        } else {
            std::lock_guard<std::mutex> lock(run.cs_failed);
            run.failed.push_back(index);
        }
        run.done++;
        ReportProgress(run);
    }
}

bool CPlotter::StorePiece(RunState& run, uint64_t index, const std::vector<uint8_t>& encoded) {
    for (uint32_t attempt = 1; attempt <= m_nRetries; ++attempt) {
        PlotStoreResult result = run.store.Put(index, encoded);
        if (result == PlotStoreResult::OK) {
            return true;
        }
        LogPrintPlot(WARN, "Storing piece %llu failed (%s), attempt %u/%u",
                     static_cast<unsigned long long>(index), PlotStoreResultToString(result),
                     attempt, m_nRetries);
        if (attempt < m_nRetries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(RETRY_BACKOFF_MS * attempt));
        }
    }
    return false;
}

void CPlotter::ReportProgress(RunState& run) {
    uint64_t total = run.end - run.begin;
    uint64_t done = run.done.load();

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    if (m_progressCallback) {
        m_progressCallback(done, total);
    }

    uint64_t decile = total == 0 ? 10 : (done * 10) / total;
    if (decile > run.lastReportedDecile) {
        run.lastReportedDecile = decile;
        LogPrintPlot(INFO, "Plotting %llu%% (%llu/%llu)", static_cast<unsigned long long>(decile * 10),
                     static_cast<unsigned long long>(done), static_cast<unsigned long long>(total));
    }
}
