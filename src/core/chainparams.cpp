// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <core/chainparams.h>

namespace Plotchain {

namespace {

uint256 SeedFromMessage(const std::string& message) {
    return Hash256(reinterpret_cast<const uint8_t*>(message.data()), message.size());
}

} // anonymous namespace

ChainParams ChainParams::Mainnet() {
    ChainParams params;
    params.network = MAINNET;

    params.genesisTime = 1767225600;   // January 1, 2026 00:00:00 UTC
    params.genesisDifficulty = 4;
    params.genesisMessage = "plotchain mainnet genesis: space, time and replication";
    params.genesisSeed = SeedFromMessage(params.genesisMessage);
    params.genesisPieceCount = 256;    // 1 MB of genesis history

    params.encodingLayers = 128;

    params.blockTime = 300;            // 5 minutes
    params.difficultyAdjustment = 64;
    params.maxDifficulty = 240;
    params.fNoRetargeting = false;
    params.confirmationDepth = 6;
    params.maxFutureBlockTime = 2 * 60 * 60;

    return params;
}

ChainParams ChainParams::Testnet() {
    ChainParams params = Mainnet();
    params.network = TESTNET;

    params.genesisTime = 1760000000;
    params.genesisDifficulty = 2;
    params.genesisMessage = "plotchain testnet genesis";
    params.genesisSeed = SeedFromMessage(params.genesisMessage);
    params.genesisPieceCount = 64;

    // Cheap plotting for test deployments
    params.encodingLayers = 16;

    return params;
}

ChainParams ChainParams::Regtest() {
    ChainParams params = Mainnet();
    params.network = REGTEST;

    params.genesisTime = 1700000000;
    params.genesisDifficulty = 0;      // Every proof qualifies
    params.genesisMessage = "plotchain regtest genesis";
    params.genesisSeed = SeedFromMessage(params.genesisMessage);
    params.genesisPieceCount = 16;

    params.encodingLayers = 1;
    params.fNoRetargeting = true;

    return params;
}

bool ChainParams::FromName(const std::string& name, ChainParams& params) {
    if (name.empty() || name == "main" || name == "mainnet") {
        params = Mainnet();
    } else if (name == "testnet") {
        params = Testnet();
    } else if (name == "regtest") {
        params = Regtest();
    } else {
        return false;
    }
    return true;
}

CBlock ChainParams::GenesisBlock() const {
    CBlock genesis;
    genesis.nVersion = CBlockHeader::CURRENT_VERSION;
    genesis.hashPrevBlock.SetNull();
    genesis.nHeight = 0;
    genesis.nTime = genesisTime;
    genesis.nDifficulty = genesisDifficulty;
    genesis.nCumulativeWeight.SetNull();
    // The seed in the challenge slot makes each network's genesis hash distinct
    genesis.proof.challenge = genesisSeed;
    return genesis;
}

} // namespace Plotchain
