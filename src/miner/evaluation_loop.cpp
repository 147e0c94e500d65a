// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <miner/evaluation_loop.h>

#include <key.h>
#include <plot/piece_set.h>
#include <plot/plot_store.h>
#include <sloth/sloth.h>
#include <util/logging.h>

#include <algorithm>
#include <iostream>

namespace {

const uint32_t MAX_SCAN_THREADS = 64;

bool IsBetterCandidate(const uint256& distance, uint64_t index,
                       const uint256& bestDistance, uint64_t bestIndex) {
    if (distance < bestDistance) return true;
    if (bestDistance < distance) return false;
    return index < bestIndex;
}

} // anonymous namespace

const char* EvaluationStateToString(EvaluationState state) {
    switch (state) {
        case EvaluationState::IDLE: return "Idle";
        case EvaluationState::AWAITING_CHALLENGE: return "AwaitingChallenge";
        case EvaluationState::SCANNING: return "Scanning";
        case EvaluationState::PROOF_EMITTED: return "ProofEmitted";
    }
    return "Unknown";
}

const char* ScanOutcomeToString(ScanOutcome outcome) {
    switch (outcome) {
        case ScanOutcome::FOUND: return "Found";
        case ScanOutcome::EMPTY_PLOT: return "EmptyPlot";
        case ScanOutcome::CANCELLED: return "Cancelled";
        case ScanOutcome::TIMEOUT: return "Timeout";
    }
    return "Unknown";
}

struct CEvaluationLoop::ScanSlice {
    uint64_t begin{0};
    uint64_t end{0};
    bool fFound{false};
    bool fCancelled{false};
    bool fTimedOut{false};
    uint64_t nBestIndex{0};
    uint256 bestDistance;
    std::vector<uint8_t> vchBestEncoding;
    uint64_t nExamined{0};
    uint64_t nUnreadable{0};
};

CEvaluationLoop::CEvaluationLoop(const CPlotStore& store, const CPieceSet& pieceSet, const CKey& key,
                                 uint32_t nLayers, uint32_t nScanThreads,
                                 std::chrono::milliseconds scanTimeout)
    : m_store(store), m_pieceSet(pieceSet), m_key(key), m_nLayers(nLayers),
      m_nScanThreads(nScanThreads), m_scanTimeout(scanTimeout)
{
    if (m_nScanThreads == 0) {
        m_nScanThreads = std::max(1u, std::thread::hardware_concurrency());
    }
    m_nScanThreads = std::min(m_nScanThreads, MAX_SCAN_THREADS);
}

CEvaluationLoop::~CEvaluationLoop() {
    Stop();
}

void CEvaluationLoop::Start() {
    if (m_running.exchange(true)) {
        return;
    }
    m_state = EvaluationState::AWAITING_CHALLENGE;
    m_thread = std::thread(&CEvaluationLoop::EvaluationThread, this);
}

void CEvaluationLoop::Stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Moving the generation cancels a scan in progress
        m_generation++;
    }
    m_cv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_state = EvaluationState::IDLE;
}

void CEvaluationLoop::SetProofCallback(ProofCallback callback) {
    std::lock_guard<std::mutex> lock(m_emitMutex);
    m_proofCallback = std::move(callback);
}

CChallenge CEvaluationLoop::GetCurrentChallenge() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_challenge;
}

bool CEvaluationLoop::SetChallenge(const CChallenge& challenge, uint32_t nDifficulty) {
    return QueueChallenge(challenge, nDifficulty, false);
}

bool CEvaluationLoop::OnNewChallenge(const CChallenge& challenge, uint32_t nDifficulty) {
    return QueueChallenge(challenge, nDifficulty, true);
}

bool CEvaluationLoop::Rescan() {
    std::lock_guard<std::mutex> emitLock(m_emitMutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_fHaveChallenge) {
            return false;
        }
        m_generation++;
    }
    m_cv.notify_all();
    return true;
}

bool CEvaluationLoop::QueueChallenge(const CChallenge& challenge, uint32_t nDifficulty, bool fRequireHigher) {
    std::lock_guard<std::mutex> emitLock(m_emitMutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_fHaveChallenge) {
            if (challenge == m_challenge) {
                return false;
            }
            if (fRequireHigher && challenge.nHeight < m_challenge.nHeight) {
                LogPrintFarming(DEBUG, "Ignoring challenge for height %u, already at %u",
                                challenge.nHeight, m_challenge.nHeight);
                return false;
            }
        }

        m_challenge = challenge;
        m_nDifficulty = nDifficulty;
        m_fHaveChallenge = true;
        m_generation++;
    }
    m_cv.notify_all();

    LogPrintFarming(DEBUG, "New challenge for height %u: %s (difficulty %u)",
                    challenge.nHeight, challenge.value.GetHex().substr(0, 16).c_str(), nDifficulty);
    return true;
}

void CEvaluationLoop::EvaluationThread() {
    std::cout << "[Farmer] Evaluation loop started (" << m_nScanThreads << " scan thread(s), farmer "
              << m_key.GetFarmerId().GetHex().substr(0, 16) << ")" << std::endl;

    while (m_running.load()) {
        CChallenge challenge;
        uint32_t nDifficulty = 0;
        uint64_t generation = 0;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_state = EvaluationState::AWAITING_CHALLENGE;
            m_cv.wait(lock, [this] {
                return !m_running.load() || (m_fHaveChallenge && m_generation.load() != m_processedGeneration);
            });
            if (!m_running.load()) {
                break;
            }
            challenge = m_challenge;
            nDifficulty = m_nDifficulty;
            generation = m_generation.load();
            m_processedGeneration = generation;
        }

        m_state = EvaluationState::SCANNING;
        auto deadline = std::chrono::steady_clock::now() + m_scanTimeout;
        CScanResult result = ScanInternal(challenge, &generation, deadline);

        if (result.outcome == ScanOutcome::CANCELLED || result.outcome == ScanOutcome::TIMEOUT) {
            m_roundsAbandoned++;
            LogPrintFarming(DEBUG, "Round for height %u abandoned: %s after %llu candidate(s)",
                            challenge.nHeight, ScanOutcomeToString(result.outcome),
                            static_cast<unsigned long long>(result.nExamined));
            continue;
        }
        if (result.outcome == ScanOutcome::EMPTY_PLOT) {
            LogPrintFarming(DEBUG, "Nothing plotted yet, skipping height %u", challenge.nHeight);
            continue;
        }

        if (result.nQuality < nDifficulty) {
            LogPrintFarming(DEBUG, "No proof for height %u: best quality %u < difficulty %u",
                            challenge.nHeight, result.nQuality, nDifficulty);
            continue;
        }

        CProof proof;
        if (!BuildProof(result, challenge, proof)) {
            continue;
        }

        CProofEvent event;
        event.proof = std::move(proof);
        event.challenge = challenge;
        event.nDifficulty = nDifficulty;
        event.nQuality = result.nQuality;

        std::lock_guard<std::mutex> emitLock(m_emitMutex);
        if (m_generation.load() != generation) {
            // Superseded while decoding or signing
            m_roundsAbandoned++;
            continue;
        }

        m_state = EvaluationState::PROOF_EMITTED;
        m_proofsEmitted++;
        std::cout << "[Farmer] Proof for height " << challenge.nHeight << ": piece "
                  << event.proof.nPieceIndex << ", quality " << event.nQuality
                  << " (difficulty " << nDifficulty << ")" << std::endl;
        if (m_proofCallback) {
            m_proofCallback(event);
        }
    }

    m_state = EvaluationState::IDLE;
    std::cout << "[Farmer] Evaluation loop stopped" << std::endl;
}

CScanResult CEvaluationLoop::Scan(const CChallenge& challenge) const {
    return ScanInternal(challenge, nullptr, std::chrono::steady_clock::time_point::max());
}

CScanResult CEvaluationLoop::ScanInternal(const CChallenge& challenge, const uint64_t* pGeneration,
                                          std::chrono::steady_clock::time_point deadline) const {
    CScanResult result;

    // Snapshot the boundary once; the plotter may extend the store meanwhile
    CPlotRange range = m_store.CompletedRange();
    uint64_t end = std::min(range.end, m_pieceSet.Size());
    if (end <= range.begin) {
        result.outcome = ScanOutcome::EMPTY_PLOT;
        return result;
    }

    uint64_t total = end - range.begin;
    uint32_t nSlices = static_cast<uint32_t>(std::min<uint64_t>(m_nScanThreads, total));
    std::vector<ScanSlice> slices(nSlices);
    uint64_t per = total / nSlices;
    uint64_t extra = total % nSlices;
    uint64_t next = range.begin;
    for (uint32_t i = 0; i < nSlices; i++) {
        slices[i].begin = next;
        next += per + (i < extra ? 1 : 0);
        slices[i].end = next;
    }

    if (nSlices == 1) {
        ScanRange(challenge, pGeneration, deadline, slices[0]);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(nSlices);
        for (uint32_t i = 0; i < nSlices; i++) {
            workers.emplace_back(&CEvaluationLoop::ScanRange, this, std::cref(challenge), pGeneration,
                                 deadline, std::ref(slices[i]));
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    bool fCancelled = false;
    bool fTimedOut = false;
    bool fFound = false;
    for (ScanSlice& slice : slices) {
        result.nExamined += slice.nExamined;
        result.nUnreadable += slice.nUnreadable;
        fCancelled |= slice.fCancelled;
        fTimedOut |= slice.fTimedOut;
        if (!slice.fFound) {
            continue;
        }
        if (!fFound || IsBetterCandidate(slice.bestDistance, slice.nBestIndex, result.distance, result.nIndex)) {
            fFound = true;
            result.nIndex = slice.nBestIndex;
            result.distance = slice.bestDistance;
            result.vchEncoding = std::move(slice.vchBestEncoding);
        }
    }

    if (fCancelled) {
        result.outcome = ScanOutcome::CANCELLED;
    } else if (fTimedOut) {
        result.outcome = ScanOutcome::TIMEOUT;
    } else if (!fFound) {
        // Every entry in range was unreadable
        result.outcome = ScanOutcome::EMPTY_PLOT;
    } else {
        result.outcome = ScanOutcome::FOUND;
        result.nQuality = GetQuality(result.distance);
    }
    return result;
}

void CEvaluationLoop::ScanRange(const CChallenge& challenge, const uint64_t* pGeneration,
                                std::chrono::steady_clock::time_point deadline, ScanSlice& slice) const {
    std::vector<uint8_t> encoding;
    for (uint64_t index = slice.begin; index < slice.end; index++) {
        if (pGeneration != nullptr && m_generation.load(std::memory_order_relaxed) != *pGeneration) {
            slice.fCancelled = true;
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            slice.fTimedOut = true;
            return;
        }

        PlotStoreResult status = m_store.Get(index, encoding);
        if (status != PlotStoreResult::OK) {
            slice.nUnreadable++;
            LogPrintFarming(WARN, "Skipping plotted piece %llu: %s",
                            static_cast<unsigned long long>(index), PlotStoreResultToString(status));
            continue;
        }

        slice.nExamined++;
        uint256 distance = ComputeDistance(challenge.value, encoding);
        if (!slice.fFound || IsBetterCandidate(distance, index, slice.bestDistance, slice.nBestIndex)) {
            slice.fFound = true;
            slice.nBestIndex = index;
            slice.bestDistance = distance;
            slice.vchBestEncoding = encoding;
        }
    }
}

bool CEvaluationLoop::BuildProof(const CScanResult& result, const CChallenge& challenge, CProof& proof) const {
    Piece piece;
    PieceSetResult pieceStatus = m_pieceSet.GetPiece(result.nIndex, piece);
    if (pieceStatus != PieceSetResult::OK) {
        LogPrintFarming(ERROR, "Piece %llu for proof self-check unavailable: %s",
                        static_cast<unsigned long long>(result.nIndex), PieceSetResultToString(pieceStatus));
        return false;
    }

    try {
        sloth::verify(piece, result.vchEncoding, m_key.GetFarmerId(), result.nIndex, m_nLayers);
    } catch (const sloth::SlothError& e) {
        // The plot holds a bad replica; emitting it would only get the block rejected
        LogPrintFarming(ERROR, "Self-check of piece %llu failed (%s): %s",
                        static_cast<unsigned long long>(result.nIndex),
                        sloth::ErrorCodeToString(e.code()), e.what());
        return false;
    }

    proof.SetNull();
    proof.vchFarmerPubKey = m_key.GetPubKey().GetBytes();
    proof.nPieceIndex = result.nIndex;
    proof.challenge = challenge.value;
    proof.vchEncoding = result.vchEncoding;
    if (!m_key.Sign(proof.GetSigningHash(), proof.vchSignature)) {
        LogPrintFarming(ERROR, "Failed to sign proof for piece %llu",
                        static_cast<unsigned long long>(result.nIndex));
        return false;
    }
    return true;
}
