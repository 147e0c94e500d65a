// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_TEST_TEST_HELPERS_H
#define PLOTCHAIN_TEST_TEST_HELPERS_H

#include <consensus/quality.h>
#include <core/chainparams.h>
#include <key.h>
#include <plot/piece_set.h>
#include <primitives/block.h>
#include <sloth/sloth.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>

/** Scratch directory under the system temp dir, removed on destruction */
class TestDirectory {
public:
    explicit TestDirectory(const std::string& tag) {
        static std::atomic<uint64_t> counter{0};
        uint64_t stamp = static_cast<uint64_t>(
            std::chrono::steady_clock::now().time_since_epoch().count());
        m_path = (std::filesystem::temp_directory_path() /
                  ("plotchain_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++))).string();
        std::filesystem::create_directories(m_path);
    }

    ~TestDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TestDirectory(const TestDirectory&) = delete;
    TestDirectory& operator=(const TestDirectory&) = delete;

    const std::string& Path() const { return m_path; }
    std::string Sub(const std::string& name) const { return m_path + "/" + name; }

private:
    std::string m_path;
};

/** Regtest parameters with a small genesis piece set */
inline Plotchain::ChainParams TestParams(uint64_t nGenesisPieces = 8, uint32_t nConfirmationDepth = 6) {
    Plotchain::ChainParams params = Plotchain::ChainParams::Regtest();
    params.genesisPieceCount = nGenesisPieces;
    params.confirmationDepth = nConfirmationDepth;
    return params;
}

inline CKey MakeTestKey() {
    CKey key;
    if (!key.MakeNewKey()) {
        throw std::runtime_error("cannot generate test key");
    }
    return key;
}

/** Proof by key over piece index of pieceSet, answering the challenge of parent */
inline CProof MakeTestProof(const CBlock& parent, const CKey& key, uint64_t index,
                            const CPieceSet& pieceSet, uint32_t nLayers) {
    Piece piece;
    if (pieceSet.GetPiece(index, piece) != PieceSetResult::OK) {
        throw std::runtime_error("test piece unavailable");
    }
    CProof proof;
    proof.vchFarmerPubKey = key.GetPubKey().GetBytes();
    proof.nPieceIndex = index;
    proof.challenge = ComputeChallenge(parent.GetHash(), parent.proof.vchSignature);
    proof.vchEncoding = sloth::encode(piece, key.GetFarmerId(), index, nLayers);
    key.Sign(proof.GetSigningHash(), proof.vchSignature);
    return proof;
}

/**
 * Re-sign the proof, recompute the cumulative weight on top of
 * parentWeight and sign the block. Used after a test tampers with a field.
 */
inline void FinishTestBlock(CBlock& block, const uint256& parentWeight, const CKey& key) {
    block.proof.vchSignature.clear();
    key.Sign(block.proof.GetSigningHash(), block.proof.vchSignature);

    unsigned int nQuality = GetQuality(ComputeDistance(block.proof.challenge, block.proof.vchEncoding));
    uint256 weight;
    if (GetBlockWeight(nQuality, block.nDifficulty, weight)) {
        WeightAdd(parentWeight, weight, block.nCumulativeWeight);
    }

    block.vchBlockSig.clear();
    key.Sign(block.GetHash(), block.vchBlockSig);
}

/**
 * Valid child of parent, farmed by key over genesis piece index.
 * Genesis pieces are available on every branch, so any parent works.
 */
inline CBlock BuildTestChild(const CBlock& parent, const CKey& key, uint64_t index,
                             const CPieceSet& pieceSet, const Plotchain::ChainParams& params,
                             uint32_t nTimeStep = 1) {
    CBlock block;
    block.hashPrevBlock = parent.GetHash();
    block.nHeight = parent.nHeight + 1;
    block.nTime = parent.nTime + nTimeStep;
    block.nDifficulty = parent.IsGenesis() ? params.genesisDifficulty : parent.nDifficulty;
    block.proof = MakeTestProof(parent, key, index, pieceSet, params.encodingLayers);
    FinishTestBlock(block, parent.nCumulativeWeight, key);
    return block;
}

/** Fork-choice order: greater weight, then smaller hash */
inline bool IsPreferredTip(const CBlock& a, const CBlock& b) {
    if (WeightGreaterThan(a.nCumulativeWeight, b.nCumulativeWeight)) return true;
    if (WeightGreaterThan(b.nCumulativeWeight, a.nCumulativeWeight)) return false;
    return a.GetHash() < b.GetHash();
}

#endif // PLOTCHAIN_TEST_TEST_HELPERS_H
