// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_MINER_EVALUATION_LOOP_H
#define PLOTCHAIN_MINER_EVALUATION_LOOP_H

#include <consensus/quality.h>
#include <primitives/block.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

class CKey;
class CPieceSet;
class CPlotStore;

enum class EvaluationState {
    IDLE,                   // not started, or shut down
    AWAITING_CHALLENGE,
    SCANNING,
    PROOF_EMITTED
};

const char* EvaluationStateToString(EvaluationState state);

enum class ScanOutcome {
    FOUND,                  // best candidate over everything examined
    EMPTY_PLOT,             // nothing plotted yet
    CANCELLED,              // a newer challenge arrived mid-scan
    TIMEOUT                 // scan window expired
};

const char* ScanOutcomeToString(ScanOutcome outcome);

struct CScanResult {
    ScanOutcome outcome{ScanOutcome::EMPTY_PLOT};
    uint64_t nIndex{0};
    uint256 distance;
    unsigned int nQuality{0};
    std::vector<uint8_t> vchEncoding;
    uint64_t nExamined{0};
    uint64_t nUnreadable{0};    // entries skipped because Get failed
};

/** A proof ready for the ledger and the gossip layer */
struct CProofEvent {
    CProof proof;
    CChallenge challenge;
    uint32_t nDifficulty{0};
    unsigned int nQuality{0};
};

/**
 * Evaluation loop - the farming side of the node
 *
 * One worker thread waits for challenges and scans the plot store for the
 * encoding closest to each. The scan is exhaustive over the completed
 * prefix of the plot (bounded by the piece set size), so the best proof
 * the farmer holds is always found unless the scan is cut short.
 *
 * Each accepted challenge bumps a generation counter. Scan threads compare
 * it between candidates and stop as soon as it moves; a finished scan is
 * only emitted if its generation is still current, checked under the emit
 * mutex that challenge updates also take. Once SetChallenge/OnNewChallenge
 * returns, no proof for an older challenge can be emitted.
 *
 * Usage:
 *   CEvaluationLoop loop(store, pieceSet, key, layers, 4);
 *   loop.SetProofCallback([](const CProofEvent& ev) { queue.push(ev); });
 *   loop.Start();
 *   loop.SetChallenge(ledger.GetChallenge(), difficulty);
 */
class CEvaluationLoop {
public:
    /**
     * Invoked on the loop thread with the emit mutex held. Must return
     * quickly and must not call into the ledger (hand the proof to a queue
     * instead), or challenge updates from the ledger would deadlock.
     */
    typedef std::function<void(const CProofEvent&)> ProofCallback;

    static constexpr int64_t DEFAULT_SCAN_TIMEOUT_MS = 60 * 1000;

    CEvaluationLoop(const CPlotStore& store, const CPieceSet& pieceSet, const CKey& key,
                    uint32_t nLayers, uint32_t nScanThreads = 1,
                    std::chrono::milliseconds scanTimeout = std::chrono::milliseconds(DEFAULT_SCAN_TIMEOUT_MS));
    ~CEvaluationLoop();

    CEvaluationLoop(const CEvaluationLoop&) = delete;
    CEvaluationLoop& operator=(const CEvaluationLoop&) = delete;

    void Start();

    /** Cancel any scan and join the worker */
    void Stop();

    bool IsRunning() const { return m_running.load(); }

    /**
     * Challenge from the local ledger's tip. Replaces the current one unless
     * it is identical (a reorg may lower the height).
     *
     * @return true if a new round was started
     */
    bool SetChallenge(const CChallenge& challenge, uint32_t nDifficulty);

    /**
     * Challenge delivered by gossip. Duplicates and challenges for a lower
     * height than the current one are ignored.
     *
     * @return true if a new round was started
     */
    bool OnNewChallenge(const CChallenge& challenge, uint32_t nDifficulty);

    /**
     * Start another round on the current challenge, e.g. after more of the
     * plot was written. A round in progress is cancelled.
     *
     * @return false if no challenge has been set yet
     */
    bool Rescan();

    /**
     * Scan synchronously, without cancellation or timeout. Does not emit.
     */
    CScanResult Scan(const CChallenge& challenge) const;

    void SetProofCallback(ProofCallback callback);

    EvaluationState GetState() const { return m_state.load(); }
    CChallenge GetCurrentChallenge() const;
    uint64_t GetProofsEmitted() const { return m_proofsEmitted.load(); }
    uint64_t GetRoundsAbandoned() const { return m_roundsAbandoned.load(); }

private:
    struct ScanSlice;

    bool QueueChallenge(const CChallenge& challenge, uint32_t nDifficulty, bool fRequireHigher);
    void EvaluationThread();

    CScanResult ScanInternal(const CChallenge& challenge, const uint64_t* pGeneration,
                             std::chrono::steady_clock::time_point deadline) const;
    void ScanRange(const CChallenge& challenge, const uint64_t* pGeneration,
                   std::chrono::steady_clock::time_point deadline, ScanSlice& slice) const;

    /** Decode the winning encoding against the piece set, then sign */
    bool BuildProof(const CScanResult& result, const CChallenge& challenge, CProof& proof) const;

    const CPlotStore& m_store;
    const CPieceSet& m_pieceSet;
    const CKey& m_key;
    uint32_t m_nLayers;
    uint32_t m_nScanThreads;
    std::chrono::milliseconds m_scanTimeout;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<EvaluationState> m_state{EvaluationState::IDLE};

    // Latest challenge; guarded by m_mutex
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    CChallenge m_challenge;
    uint32_t m_nDifficulty{0};
    bool m_fHaveChallenge{false};
    uint64_t m_processedGeneration{0};

    // Bumped under m_emitMutex and m_mutex; read lock-free by scan threads
    std::atomic<uint64_t> m_generation{0};

    // Serialises emission against challenge updates; guards m_proofCallback
    std::mutex m_emitMutex;
    ProofCallback m_proofCallback;

    std::atomic<uint64_t> m_proofsEmitted{0};
    std::atomic<uint64_t> m_roundsAbandoned{0};
};

#endif // PLOTCHAIN_MINER_EVALUATION_LOOP_H
