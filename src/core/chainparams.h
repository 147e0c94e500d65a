// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_CORE_CHAINPARAMS_H
#define PLOTCHAIN_CORE_CHAINPARAMS_H

#include <primitives/block.h>

#include <cstdint>
#include <string>

namespace Plotchain {

enum Network {
    MAINNET,
    TESTNET,
    REGTEST
};

class ChainParams {
public:
    Network network;

    // Genesis block parameters
    uint32_t genesisTime;            // Genesis block timestamp
    uint32_t genesisDifficulty;      // Minimum quality bits of the first blocks
    std::string genesisMessage;      // Hashed into the genesis seed
    uint256 genesisSeed;             // Expands into the genesis pieces
    uint64_t genesisPieceCount;      // Pieces in the set before any block confirms

    // Replica parameters
    uint32_t encodingLayers;         // Default sloth layers (the plotting delay)

    // Consensus parameters
    uint32_t blockTime;              // Target seconds per block
    uint32_t difficultyAdjustment;   // Blocks between difficulty adjustments
    uint32_t maxDifficulty;          // Upper bound on the quality requirement
    bool fNoRetargeting;             // Keep genesisDifficulty forever
    uint32_t confirmationDepth;      // Blocks on top before a block is final
    int64_t maxFutureBlockTime;      // Allowed clock drift for new blocks

    static ChainParams Mainnet();
    static ChainParams Testnet();
    static ChainParams Regtest();

    /** Look up parameters by network name ("main", "mainnet", "testnet", "regtest") */
    static bool FromName(const std::string& name, ChainParams& params);

    const char* GetNetworkName() const {
        switch (network) {
            case MAINNET: return "mainnet";
            case TESTNET: return "testnet";
            case REGTEST: return "regtest";
        }
        return "unknown";
    }

    bool IsRegtest() const { return network == REGTEST; }

    /** Deterministic genesis block: null proof, no signature, zero weight */
    CBlock GenesisBlock() const;
};

} // namespace Plotchain

#endif // PLOTCHAIN_CORE_CHAINPARAMS_H
