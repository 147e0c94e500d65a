// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <consensus/validation.h>

#include <consensus/difficulty.h>
#include <consensus/quality.h>
#include <node/block_index.h>
#include <plot/piece_set.h>
#include <pubkey.h>
#include <sloth/sloth.h>
#include <util/strencodings.h>

uint64_t GetPieceCountForChild(const CBlockIndex* pindexParent, const Plotchain::ChainParams& params) {
    uint64_t count = params.genesisPieceCount;
    if (pindexParent != nullptr && pindexParent->nHeight > params.confirmationDepth) {
        count += pindexParent->nHeight - params.confirmationDepth;
    }
    return count;
}

bool GetBranchPiece(const CBlockIndex* pindexParent, uint64_t index, const CPieceSet& pieceSet,
                    const Plotchain::ChainParams& params, Piece& piece, std::string& error) {
    if (index >= GetPieceCountForChild(pindexParent, params)) {
        error = strprintf("bad-piece-index: %llu not yet available", static_cast<unsigned long long>(index));
        return false;
    }

    if (index < params.genesisPieceCount) {
        PieceSetResult result = pieceSet.GetPiece(index, piece);
        if (result != PieceSetResult::OK) {
            error = strprintf("bad-piece-set: genesis piece %llu %s",
                              static_cast<unsigned long long>(index), PieceSetResultToString(result));
            return false;
        }
        return true;
    }

    uint64_t height = index - params.genesisPieceCount + 1;
    const CBlockIndex* pindexSource = pindexParent->GetAncestor(static_cast<uint32_t>(height));
    if (pindexSource == nullptr) {
        error = strprintf("bad-piece-index: no ancestor at height %llu", static_cast<unsigned long long>(height));
        return false;
    }
    piece = CChainPieceSet::ExpandPiece(pindexSource->GetBlockHash(), index);
    return true;
}

CBlockValidator::CBlockValidator(const Plotchain::ChainParams& params)
    : m_params(params)
{
}

bool CBlockValidator::CheckProof(const CProof& proof, unsigned int& nQuality, std::string& error) const {
    if (proof.vchFarmerPubKey.size() != CPubKey::size()) {
        error = strprintf("bad-proof-pubkey: size %zu", proof.vchFarmerPubKey.size());
        return false;
    }
    if (proof.vchEncoding.size() != PIECE_SIZE) {
        error = strprintf("bad-proof-encoding: size %zu", proof.vchEncoding.size());
        return false;
    }
    if (proof.vchSignature.size() != DILITHIUM_BYTES) {
        error = strprintf("bad-proof-sig: size %zu", proof.vchSignature.size());
        return false;
    }

    CPubKey pubkey(proof.vchFarmerPubKey);
    if (!pubkey.IsValid()) {
        error = "bad-proof-pubkey: unparseable";
        return false;
    }
    if (!pubkey.Verify(proof.GetSigningHash(), proof.vchSignature)) {
        error = "bad-proof-sig: verification failed";
        return false;
    }

    nQuality = GetQuality(ComputeDistance(proof.challenge, proof.vchEncoding));
    return true;
}

bool CBlockValidator::CheckBlock(const CBlock& block, unsigned int& nQuality, std::string& error) const {
    if (block.nVersion != CBlockHeader::CURRENT_VERSION) {
        error = strprintf("bad-version: %d", block.nVersion);
        return false;
    }
    if (block.IsGenesis() || block.proof.IsNull()) {
        error = "bad-proof-missing";
        return false;
    }
    if (block.nDifficulty > m_params.maxDifficulty) {
        error = strprintf("bad-difficulty: %u above maximum %u", block.nDifficulty, m_params.maxDifficulty);
        return false;
    }

    if (!CheckProof(block.proof, nQuality, error)) {
        return false;
    }

    if (block.vchBlockSig.size() != DILITHIUM_BYTES) {
        error = strprintf("bad-block-sig: size %zu", block.vchBlockSig.size());
        return false;
    }
    CPubKey pubkey(block.proof.vchFarmerPubKey);
    if (!pubkey.Verify(block.GetHash(), block.vchBlockSig)) {
        error = "bad-block-sig: verification failed";
        return false;
    }

    if (nQuality < block.nDifficulty) {
        error = strprintf("bad-quality: %u < difficulty %u", nQuality, block.nDifficulty);
        return false;
    }

    return true;
}

bool CBlockValidator::ContextualCheckBlock(const CBlock& block, unsigned int nQuality,
                                           const CBlockIndex* pindexPrev, const CPieceSet& pieceSet,
                                           int64_t nNow, std::string& error) const {
    if (pindexPrev == nullptr) {
        error = "bad-prevblk: parent unknown";
        return false;
    }

    if (block.nHeight != pindexPrev->nHeight + 1) {
        error = strprintf("bad-height: %u, parent at %u", block.nHeight, pindexPrev->nHeight);
        return false;
    }

    uint256 expectedChallenge = ComputeChallenge(pindexPrev->GetBlockHash(), pindexPrev->block.proof.vchSignature);
    if (block.proof.challenge != expectedChallenge) {
        error = "bad-challenge: proof answers a different challenge";
        return false;
    }

    uint32_t nExpectedDifficulty = GetNextDifficulty(pindexPrev, m_params);
    if (block.nDifficulty != nExpectedDifficulty) {
        error = strprintf("bad-difficulty: %u, expected %u", block.nDifficulty, nExpectedDifficulty);
        return false;
    }

    uint256 blockWeight;
    uint256 expectedWeight;
    if (!GetBlockWeight(nQuality, block.nDifficulty, blockWeight) ||
        !WeightAdd(pindexPrev->nChainWeight, blockWeight, expectedWeight)) {
        error = "bad-weight: cannot compute block weight";
        return false;
    }
    if (block.nCumulativeWeight != expectedWeight) {
        error = "bad-weight: declared cumulative weight does not match";
        return false;
    }

    if (!CheckBlockTimestamp(block, pindexPrev, m_params, nNow, error)) {
        return false;
    }

    Piece piece;
    if (!GetBranchPiece(pindexPrev, block.proof.nPieceIndex, pieceSet, m_params, piece, error)) {
        return false;
    }

    try {
        sloth::verify(piece, block.proof.vchEncoding, block.proof.GetFarmerId(),
                      block.proof.nPieceIndex, m_params.encodingLayers);
    } catch (const sloth::SlothError& e) {
        error = strprintf("bad-witness: %s", e.what());
        return false;
    }

    return true;
}
