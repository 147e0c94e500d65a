// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_CORE_NODE_CONTEXT_H
#define PLOTCHAIN_CORE_NODE_CONTEXT_H

#include <consensus/chain.h>
#include <core/chainparams.h>
#include <key.h>
#include <miner/evaluation_loop.h>
#include <net/orphan_manager.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class CBlockchainDB;
class CChainPieceSet;
class CConfigParser;
class CGossipRelay;
class CGossipTransport;
class CLedger;
class CPlotStore;
class CPlotter;

/**
 * Node options, read from plotchain.conf and PLOTCHAIN_* environment overrides
 */
struct CNodeOptions {
    std::string network{"main"};
    std::string datadir;                    // empty: GetDefaultDataDir(network)
    uint32_t nLayers{0};                    // 0: network default
    uint32_t nPlotThreads{0};               // 0: hardware concurrency
    uint32_t nPlotRetries{3};
    uint32_t nScanThreads{1};
    int64_t nScanTimeoutMs{CEvaluationLoop::DEFAULT_SCAN_TIMEOUT_MS};
    std::string logLevel{"info"};
    std::string logCategories{"all"};       // comma-separated, see ParseLogCategories
    std::string logFile;                    // relative paths live in the datadir
    bool fFarm{true};

    static bool FromConfig(const CConfigParser& config, CNodeOptions& options, std::string& error);
};

/** Read-only view of a running node */
struct CNodeSnapshot {
    uint256 hashTip;
    uint32_t nHeight{0};
    uint256 nChainWeight;
    uint32_t nLastConfirmedHeight{0};
    double dPlotCompletion{0.0};            // percent of the piece set plotted
    uint64_t nPieceCount{0};
    uint64_t nProofsEmitted{0};
    uint64_t nBlocksFarmed{0};
    EvaluationState farmingState{EvaluationState::IDLE};
    bool fHaveReorg{false};
    CReorgEvent lastReorg;

    std::string ToString() const;
};

/**
 * NodeContext - owns every component of a node
 *
 * Wiring:
 *   piece set -> plotter -> plot store -> evaluation loop -> proof queue
 *   proof queue -> CreateLocalBlock -> ProcessBlock -> gossip relay
 *   ledger tip change -> evaluation loop challenge + piece set growth
 *   Init -> block sync request to every peer
 *
 * The evaluation loop never touches the ledger: its proofs are queued and
 * turned into blocks on the block thread. Piece set growth is plotted on
 * the plot thread.
 */
struct NodeContext {
    CNodeOptions options;
    Plotchain::ChainParams params;
    std::string datadir;

    std::unique_ptr<CChainPieceSet> piece_set;
    std::unique_ptr<CBlockchainDB> block_db;
    std::unique_ptr<CLedger> ledger;
    CKey farmer_key;
    std::unique_ptr<CPlotStore> plot_store;
    std::unique_ptr<CPlotter> plotter;
    std::unique_ptr<CEvaluationLoop> evaluation_loop;
    std::unique_ptr<CGossipRelay> relay;

    std::atomic<bool> running{false};

    NodeContext();
    ~NodeContext();

    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;

    /**
     * Open storage, replay the chain, load or create the farmer key and
     * start plotting and farming.
     *
     * @param transport Outbound gossip (nullptr runs the node standalone)
     * @param nodeId    This node's id on the transport
     */
    bool Init(const CNodeOptions& opts, std::string& error,
              CGossipTransport* transport = nullptr, SourceId nodeId = 0);

    /** Stop all threads and close storage. Safe to call multiple times. */
    void Shutdown();

    /** Entry point for payloads the transport delivers to this node */
    bool HandleMessage(SourceId from, const std::vector<uint8_t>& payload);

    CNodeSnapshot GetSnapshot() const;

private:
    void OnTipChanged(const CReorgEvent& event);
    void BlockThread();
    void PlotThread();

    std::thread m_blockThread;
    std::thread m_plotThread;

    std::mutex m_queueMutex;
    std::condition_variable m_queueCv;
    std::deque<CProofEvent> m_proofQueue;
    bool m_fTipChanged{false};

    std::mutex m_plotMutex;
    std::condition_variable m_plotCv;

    std::atomic<uint64_t> m_blocksFarmed{0};
};

#endif // PLOTCHAIN_CORE_NODE_CONTEXT_H
