// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_CONSENSUS_VALIDATION_H
#define PLOTCHAIN_CONSENSUS_VALIDATION_H

#include <core/chainparams.h>
#include <primitives/block.h>
#include <primitives/piece.h>

#include <cstdint>
#include <string>

class CBlockIndex;
class CPieceSet;

/**
 * Number of pieces a child of pindexParent may prove: the genesis pieces
 * plus one per block that was confirmed while pindexParent was the tip.
 */
uint64_t GetPieceCountForChild(const CBlockIndex* pindexParent, const Plotchain::ChainParams& params);

/**
 * Piece at index as seen from the branch ending at pindexParent.
 *
 * Genesis pieces come from the piece set; piece genesisPieceCount + h - 1
 * is expanded from the branch's block at height h. Deriving from the branch
 * keeps validation independent of which blocks this node has confirmed.
 */
bool GetBranchPiece(const CBlockIndex* pindexParent, uint64_t index, const CPieceSet& pieceSet,
                    const Plotchain::ChainParams& params, Piece& piece, std::string& error);

/**
 * CBlockValidator
 *
 * Proof and block validation. Rejections are reported through the error
 * string as a short reason code followed by detail, e.g.
 * "bad-quality: 3 < difficulty 5".
 *
 * Thread Safety: stateless apart from the parameters; callers serialise
 * access to the block tree and piece set.
 */
class CBlockValidator
{
public:
    explicit CBlockValidator(const Plotchain::ChainParams& params);

    /**
     * CheckProof - context-free proof checks
     *
     * Checks:
     * - Field sizes (public key, encoding, signature)
     * - Farmer signature over the proof digest
     * - Quality recomputed from the witness and the claimed challenge
     *
     * @param proof    Proof to check
     * @param nQuality Receives the recomputed quality
     * @param error    Reason on failure
     */
    bool CheckProof(const CProof& proof, unsigned int& nQuality, std::string& error) const;

    /**
     * CheckBlock - everything that does not need the parent
     *
     * CheckProof plus version, block signature and quality >= declared
     * difficulty.
     */
    bool CheckBlock(const CBlock& block, unsigned int& nQuality, std::string& error) const;

    /**
     * ContextualCheckBlock - checks against the parent
     *
     * Checks height, challenge, difficulty, cumulative weight, timestamp,
     * piece index range and that the witness decodes to the claimed piece.
     *
     * @param block       Block that passed CheckBlock
     * @param nQuality    Quality computed by CheckBlock
     * @param pindexPrev  Parent (must not be null)
     * @param pieceSet    Piece set holding at least the genesis pieces
     * @param nNow        Current adjusted time
     */
    bool ContextualCheckBlock(const CBlock& block, unsigned int nQuality,
                              const CBlockIndex* pindexPrev, const CPieceSet& pieceSet,
                              int64_t nNow, std::string& error) const;

private:
    const Plotchain::ChainParams& m_params;
};

#endif // PLOTCHAIN_CONSENSUS_VALIDATION_H
