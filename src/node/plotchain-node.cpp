// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

/**
 * Plotchain node
 *
 * Plots the piece set, farms challenges and maintains the ledger.
 * Settings come from <datadir>/plotchain.conf, PLOTCHAIN_* environment
 * variables and -key=value arguments, in increasing priority.
 */

#include <core/chainparams.h>
#include <core/node_context.h>
#include <sloth/sloth.h>
#include <util/config.h>
#include <util/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void SignalHandler(int) {
    g_shutdown_requested = true;
}

void PrintUsage() {
    std::cout << "Usage: plotchain-node [-key=value ...]\n"
              << "\n"
              << "Keys (also read from plotchain.conf and PLOTCHAIN_<KEY>):\n"
              << "  network=<main|testnet|regtest>\n"
              << "  datadir=<path>\n"
              << "  conf=<path>            config file (default <datadir>/plotchain.conf)\n"
              << "  layers=<n>             sloth layers, 0 for the network default\n"
              << "  plotthreads=<n>        plotting workers, 0 for all cores\n"
              << "  plotretries=<n>\n"
              << "  scanthreads=<n>\n"
              << "  scantimeout=<ms>\n"
              << "  loglevel=<error|warn|info|debug>\n"
              << "  debug=<net,plot,farming,consensus,validation,db|all|none>\n"
              << "  logfile=<path>\n"
              << "  farm=<0|1>\n"
              << "  benchmark            time the encoder on this machine and exit\n";
}

int RunBenchmark(const CNodeOptions& options) {
    Plotchain::ChainParams params;
    Plotchain::ChainParams::FromName(options.network, params);
    uint32_t nLayers = options.nLayers != 0 ? options.nLayers : params.encodingLayers;

    std::cout << "[Benchmark] Timing square roots over the " << sloth::PRIME_BITS << "-bit field..." << std::endl;
    uint64_t nRootsPerSecond = sloth::benchmark();
    if (nRootsPerSecond == 0) {
        std::cerr << "Error: benchmark produced no measurement" << std::endl;
        return 1;
    }

    double dPieceSeconds = static_cast<double>(nLayers) * sloth::BLOCKS_PER_PIECE /
                           static_cast<double>(nRootsPerSecond);
    std::cout << "[Benchmark] " << nRootsPerSecond << " roots/s" << std::endl;
    std::cout << "[Benchmark] " << params.GetNetworkName() << " uses " << nLayers << " layers: "
              << dPieceSeconds << " s per piece per thread" << std::endl;
    std::cout << "[Benchmark] Layers for a one second piece on this machine: "
              << sloth::calculate_layers(1.0, nRootsPerSecond) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "-help" || arg == "--help") {
            PrintUsage();
            return 0;
        }
        while (!arg.empty() && arg[0] == '-') {
            arg.erase(0, 1);
        }
        if (arg.find('=') == std::string::npos) {
            arg += "=1";
        }
        args.push_back(arg);
    }

    // Command line first, to find the network, datadir and config file
    CConfigParser cmdline;
    for (const std::string& arg : args) {
        cmdline.LoadConfigString(arg);
    }
    std::string network = cmdline.GetString("network", "main");
    std::string datadir = cmdline.GetString("datadir", GetDefaultDataDir(network));
    std::string confPath = cmdline.GetString("conf", GetConfigFilePath(datadir));

    CConfigParser config;
    if (!config.LoadConfigFile(confPath)) {
        std::cerr << "Error: cannot read config file " << confPath << std::endl;
        return 1;
    }
    for (const std::string& arg : args) {
        config.LoadConfigString(arg);
    }
    network = config.GetString("network", network);
    config.SetActiveSection(network == "main" || network == "mainnet" ? "" : network);

    CNodeOptions options;
    options.datadir = datadir;
    std::string error;
    if (!CNodeOptions::FromConfig(config, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    if (config.GetBool("benchmark", false)) {
        return RunBenchmark(options);
    }

    LogLevel level = LogLevel::LVL_INFO;
    uint32_t nCategories = static_cast<uint32_t>(LogCategory::ALL);
    ParseLogLevel(options.logLevel, level);
    ParseLogCategories(options.logCategories, nCategories);
    CLoggingConfig::GetInstance().SetLogLevel(level);
    CLoggingConfig::GetInstance().SetCategories(nCategories);
    CLoggingConfig::GetInstance().SetLogFile(options.logFile);

    if (std::signal(SIGINT, SignalHandler) == SIG_ERR) {
        std::cerr << "WARNING: Failed to install SIGINT handler" << std::endl;
    }
    if (std::signal(SIGTERM, SignalHandler) == SIG_ERR) {
        std::cerr << "WARNING: Failed to install SIGTERM handler" << std::endl;
    }

    NodeContext node;
    if (!node.Init(options, error)) {
        std::cerr << "Error: " << error << std::endl;
        node.Shutdown();
        return 1;
    }

    if (!CLogger::GetInstance().Initialize(node.datadir)) {
        std::cerr << "WARNING: file logging disabled" << std::endl;
    }
    LogPrintf(ALL, INFO, "Node started on %s", node.params.GetNetworkName());

    auto lastStatus = std::chrono::steady_clock::now();
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        auto now = std::chrono::steady_clock::now();
        if (now - lastStatus >= std::chrono::seconds(30)) {
            lastStatus = now;
            std::cout << "[Node] " << node.GetSnapshot().ToString() << std::endl;
        }
    }

    std::cout << "\nShutting down..." << std::endl;
    LogPrintf(ALL, INFO, "Shutting down");
    node.Shutdown();
    CLogger::GetInstance().Shutdown();
    return 0;
}
