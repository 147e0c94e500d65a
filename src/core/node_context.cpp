// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <core/node_context.h>

#include <net/gossip.h>
#include <node/blockchain_storage.h>
#include <node/ledger.h>
#include <plot/piece_set.h>
#include <plot/plot_store.h>
#include <plot/plotter.h>
#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <chrono>
#include <filesystem>
#include <iostream>

bool CNodeOptions::FromConfig(const CConfigParser& config, CNodeOptions& options, std::string& error) {
    options.network = config.GetString("network", options.network);
    Plotchain::ChainParams probe;
    if (!Plotchain::ChainParams::FromName(options.network, probe)) {
        error = "unknown network '" + options.network + "'";
        return false;
    }

    options.datadir = config.GetString("datadir", options.datadir);

    int64_t nLayers = config.GetInt64("layers", options.nLayers);
    if (nLayers < 0 || nLayers > 65536) {
        error = strprintf("layers must be between 0 and 65536, got %lld", static_cast<long long>(nLayers));
        return false;
    }
    options.nLayers = static_cast<uint32_t>(nLayers);

    int64_t nPlotThreads = config.GetInt64("plotthreads", options.nPlotThreads);
    if (nPlotThreads < 0 || nPlotThreads > 1024) {
        error = strprintf("plotthreads out of range: %lld", static_cast<long long>(nPlotThreads));
        return false;
    }
    options.nPlotThreads = static_cast<uint32_t>(nPlotThreads);

    int64_t nPlotRetries = config.GetInt64("plotretries", options.nPlotRetries);
    if (nPlotRetries < 1 || nPlotRetries > 100) {
        error = strprintf("plotretries must be between 1 and 100, got %lld", static_cast<long long>(nPlotRetries));
        return false;
    }
    options.nPlotRetries = static_cast<uint32_t>(nPlotRetries);

    int64_t nScanThreads = config.GetInt64("scanthreads", options.nScanThreads);
    if (nScanThreads < 1 || nScanThreads > 1024) {
        error = strprintf("scanthreads must be between 1 and 1024, got %lld", static_cast<long long>(nScanThreads));
        return false;
    }
    options.nScanThreads = static_cast<uint32_t>(nScanThreads);

    options.nScanTimeoutMs = config.GetInt64("scantimeout", options.nScanTimeoutMs);
    if (options.nScanTimeoutMs <= 0) {
        error = "scantimeout must be positive";
        return false;
    }

    options.logLevel = config.GetString("loglevel", options.logLevel);
    LogLevel level;
    if (!ParseLogLevel(options.logLevel, level)) {
        error = "unknown loglevel '" + options.logLevel + "'";
        return false;
    }

    options.logCategories = config.GetString("debug", options.logCategories);
    uint32_t nCategories = 0;
    if (!ParseLogCategories(options.logCategories, nCategories)) {
        error = "unknown log category in '" + options.logCategories + "'";
        return false;
    }

    options.logFile = config.GetString("logfile", options.logFile);
    options.fFarm = config.GetBool("farm", options.fFarm);
    return true;
}

std::string CNodeSnapshot::ToString() const {
    std::string str = strprintf("tip=%s height=%u weight=%.0f confirmed=%u plot=%.1f%% pieces=%llu proofs=%llu farmed=%llu farming=%s",
                                hashTip.GetHex().substr(0, 16).c_str(), nHeight, WeightToDouble(nChainWeight),
                                nLastConfirmedHeight, dPlotCompletion,
                                static_cast<unsigned long long>(nPieceCount),
                                static_cast<unsigned long long>(nProofsEmitted),
                                static_cast<unsigned long long>(nBlocksFarmed),
                                EvaluationStateToString(farmingState));
    if (fHaveReorg) {
        str += strprintf(" lastreorg=%u->%u(fork %u)", lastReorg.nOldHeight, lastReorg.nNewHeight,
                         lastReorg.nForkHeight);
    }
    return str;
}

NodeContext::NodeContext() = default;

NodeContext::~NodeContext() {
    Shutdown();
}

bool NodeContext::Init(const CNodeOptions& opts, std::string& error, CGossipTransport* transport, SourceId nodeId) {
    if (ledger) {
        error = "node already initialised";
        return false;
    }
    options = opts;

    if (!Plotchain::ChainParams::FromName(options.network, params)) {
        error = "unknown network '" + options.network + "'";
        return false;
    }
    if (options.nLayers != 0 && options.nLayers != params.encodingLayers) {
        LogPrintf(ALL, WARN, "Overriding %s encoding layers %u with %u; every node must agree",
                  params.GetNetworkName(), params.encodingLayers, options.nLayers);
        params.encodingLayers = options.nLayers;
    }

    datadir = options.datadir.empty() ? GetDefaultDataDir(options.network) : options.datadir;
    std::error_code ec;
    std::filesystem::create_directories(datadir, ec);
    if (ec) {
        error = "cannot create data directory " + datadir + ": " + ec.message();
        return false;
    }

    std::cout << "[Node] Starting " << params.GetNetworkName() << " node in " << datadir << std::endl;

    // Chain
    piece_set = std::make_unique<CChainPieceSet>();
    if (!piece_set->InitGenesis(params.genesisSeed, params.genesisPieceCount)) {
        error = "cannot expand genesis pieces";
        return false;
    }

    block_db = std::make_unique<CBlockchainDB>();
    if (!block_db->Open(datadir + "/blocks", error)) {
        return false;
    }

    ledger = std::make_unique<CLedger>(params, *piece_set, block_db.get());
    if (!ledger->Init(error)) {
        return false;
    }

    // Farmer identity
    std::string keyPath = datadir + "/farmer.key";
    std::string keyError;
    if (!farmer_key.ReadKeyFile(keyPath, keyError)) {
        if (std::filesystem::exists(keyPath)) {
            error = keyError;
            return false;
        }
        if (!farmer_key.MakeNewKey() || !farmer_key.WriteKeyFile(keyPath, error)) {
            if (error.empty()) {
                error = "cannot generate farmer key";
            }
            return false;
        }
        std::cout << "[Node] Generated farmer key " << keyPath << std::endl;
    }
    std::cout << "[Node] Farmer id " << farmer_key.GetFarmerId().GetHex().substr(0, 16) << std::endl;

    // Plot
    plot_store = std::make_unique<CPlotStore>();
    if (!plot_store->Open(datadir + "/plot", farmer_key.GetFarmerId(), params.encodingLayers, error)) {
        return false;
    }
    plotter = std::make_unique<CPlotter>(options.nPlotThreads, options.nPlotRetries);

    if (options.fFarm) {
        evaluation_loop = std::make_unique<CEvaluationLoop>(
            *plot_store, *piece_set, farmer_key, params.encodingLayers, options.nScanThreads,
            std::chrono::milliseconds(options.nScanTimeoutMs));
        evaluation_loop->SetProofCallback([this](const CProofEvent& event) {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_proofQueue.push_back(event);
            m_queueCv.notify_one();
        });
    }

    relay = std::make_unique<CGossipRelay>(*ledger, evaluation_loop.get(), transport, nodeId);
    ledger->RegisterReorgCallback([this](const CReorgEvent& event) { OnTipChanged(event); });

    if (evaluation_loop) {
        evaluation_loop->Start();
        CChallenge challenge;
        uint32_t nDifficulty = 0;
        ledger->GetNextChallenge(challenge, nDifficulty);
        evaluation_loop->SetChallenge(challenge, nDifficulty);
    }

    running = true;
    m_blockThread = std::thread(&NodeContext::BlockThread, this);
    m_plotThread = std::thread(&NodeContext::PlotThread, this);

    // Catch up on blocks farmed while this node was away
    if (transport != nullptr) {
        relay->RequestSync();
    }

    std::cout << "[Node] Ready at height " << ledger->GetHeight() << " ("
              << (options.fFarm ? "farming" : "not farming") << ")" << std::endl;
    return true;
}

void NodeContext::Shutdown() {
    bool fWasRunning = running.exchange(false);

    if (plotter) {
        plotter->Stop();
    }
    if (evaluation_loop) {
        evaluation_loop->Stop();
    }
    m_queueCv.notify_all();
    m_plotCv.notify_all();
    if (m_blockThread.joinable()) {
        m_blockThread.join();
    }
    if (m_plotThread.joinable()) {
        m_plotThread.join();
    }

    relay.reset();
    evaluation_loop.reset();
    plotter.reset();
    if (plot_store) {
        plot_store->Close();
        plot_store.reset();
    }
    ledger.reset();
    if (block_db) {
        block_db->Close();
        block_db.reset();
    }
    piece_set.reset();

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_proofQueue.clear();
        m_fTipChanged = false;
    }

    if (fWasRunning) {
        std::cout << "[Node] Shutdown complete" << std::endl;
    }
}

bool NodeContext::HandleMessage(SourceId from, const std::vector<uint8_t>& payload) {
    if (!running || !relay) {
        return false;
    }
    return relay->OnMessage(from, payload);
}

void NodeContext::OnTipChanged(const CReorgEvent& event) {
    // Runs under the ledger lock; only hand work to the loop and the block thread
    if (evaluation_loop) {
        CChallenge challenge;
        uint32_t nDifficulty = 0;
        ledger->GetNextChallenge(challenge, nDifficulty);
        evaluation_loop->SetChallenge(challenge, nDifficulty);
    }
    if (event.IsReorg()) {
        std::cout << "[Node] Reorg to height " << event.nNewHeight << ", fork at " << event.nForkHeight
                  << ", " << event.vDisconnected.size() << " block(s) disconnected" << std::endl;
    }

    std::lock_guard<std::mutex> lock(m_queueMutex);
    m_fTipChanged = true;
    m_queueCv.notify_one();
}

void NodeContext::BlockThread() {
    while (true) {
        std::deque<CProofEvent> proofs;
        bool fTipChanged = false;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCv.wait(lock, [this] { return !running || !m_proofQueue.empty() || m_fTipChanged; });
            if (!running) {
                break;
            }
            proofs.swap(m_proofQueue);
            fTipChanged = m_fTipChanged;
            m_fTipChanged = false;
        }

        for (const CProofEvent& event : proofs) {
            CBlock block;
            std::string error;
            if (!ledger->CreateLocalBlock(event.proof, farmer_key, block, error)) {
                LogPrintFarming(DEBUG, "Dropping proof for height %u: %s", event.challenge.nHeight, error.c_str());
                continue;
            }

            std::string reason;
            BlockProcessResult result = ledger->ProcessBlock(block, LOCAL_SOURCE, reason);
            if (result != BlockProcessResult::ACCEPTED) {
                LogPrintFarming(WARN, "Local block at height %u not accepted: %s %s", block.nHeight,
                                BlockProcessResultToString(result), reason.c_str());
                continue;
            }

            m_blocksFarmed++;
            std::cout << "[Farmer] Farmed block " << block.GetHash().GetHex().substr(0, 16)
                      << " at height " << block.nHeight << " (quality " << event.nQuality
                      << ", difficulty " << event.nDifficulty << ")" << std::endl;
            relay->RelayBlock(block);
        }

        if (fTipChanged) {
            CChallenge challenge;
            uint32_t nDifficulty = 0;
            ledger->GetNextChallenge(challenge, nDifficulty);
            relay->RelayChallenge(challenge, nDifficulty);
            m_plotCv.notify_one();
        }
    }
}

void NodeContext::PlotThread() {
    const uint256 farmerId = farmer_key.GetFarmerId();
    uint64_t nPlotted = 0;
    bool fComplete = false;

    plotter->SetProgressCallback([](uint64_t done, uint64_t total) {
        if (total >= 100 && done % (total / 10) == 0) {
            std::cout << "[Plotter] " << done << "/" << total << " pieces" << std::endl;
        }
    });

    while (running) {
        uint64_t nSize = piece_set->Size();
        if (!fComplete || nSize > nPlotted) {
            CPlotReport report = fComplete ? plotter->Extend(*piece_set, farmerId, *plot_store, nPlotted)
                                           : plotter->Plot(*piece_set, farmerId, *plot_store);
            if (report.fStopped) {
                break;
            }
            if (report.result == PlotResult::MALFORMED_PIECE_SET ||
                report.result == PlotResult::STORE_UNAVAILABLE) {
                LogPrintPlot(ERROR, "Plotting halted: %s %s", PlotResultToString(report.result),
                             report.error.c_str());
                std::cerr << "[Plotter] Plotting halted: " << report.error << std::endl;
                break;
            }

            fComplete = (report.result == PlotResult::OK);
            nPlotted = nSize;
            if (report.nEncoded > 0 && evaluation_loop) {
                // The current challenge may have been scanned against a smaller plot
                evaluation_loop->Rescan();
            }
            if (report.nEncoded > 0 || !fComplete) {
                std::cout << "[Plotter] Encoded " << report.nEncoded << " piece(s), " << report.failed.size()
                          << " failed, plot " << strprintf("%.1f", plot_store->CompletionPercent(piece_set->Size()))
                          << "% complete" << std::endl;
            }
        }

        std::unique_lock<std::mutex> lock(m_plotMutex);
        m_plotCv.wait_for(lock, std::chrono::seconds(fComplete ? 5 : 30), [&] {
            return !running || piece_set->Size() > nPlotted;
        });
    }
}

CNodeSnapshot NodeContext::GetSnapshot() const {
    CNodeSnapshot snapshot;
    if (!ledger) {
        return snapshot;
    }
    snapshot.hashTip = ledger->GetTipHash();
    snapshot.nHeight = ledger->GetHeight();
    snapshot.nChainWeight = ledger->GetChainWeight();
    snapshot.nLastConfirmedHeight = ledger->GetLastConfirmedHeight();
    snapshot.nPieceCount = piece_set->Size();
    if (plot_store && plot_store->IsOpen()) {
        snapshot.dPlotCompletion = plot_store->CompletionPercent(snapshot.nPieceCount);
    }
    if (evaluation_loop) {
        snapshot.nProofsEmitted = evaluation_loop->GetProofsEmitted();
        snapshot.farmingState = evaluation_loop->GetState();
    }
    snapshot.nBlocksFarmed = m_blocksFarmed.load();
    snapshot.fHaveReorg = ledger->GetLastReorg(snapshot.lastReorg);
    return snapshot;
}
