// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_PLOT_PIECE_SET_H
#define PLOTCHAIN_PLOT_PIECE_SET_H

#include <primitives/block.h>
#include <primitives/piece.h>

#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <vector>

enum class PieceSetResult {
    OK,
    NOT_FOUND,              // index at or beyond Size()
    MALFORMED_PIECE_SET     // provider returned a piece of the wrong size
};

const char* PieceSetResultToString(PieceSetResult result);

/**
 * Read-only view of the globally agreed piece sequence.
 *
 * Size() is the explicit current-length boundary: callers snapshot it once
 * and never read past it, even if the set grows concurrently. Version()
 * changes whenever pieces are appended.
 */
class CPieceSet {
public:
    virtual ~CPieceSet() = default;

    virtual uint64_t Size() const = 0;
    virtual uint64_t Version() const = 0;
    virtual PieceSetResult GetPiece(uint64_t index, Piece& piece) const = 0;
};

/**
 * Append-only in-memory piece set derived from chain history.
 *
 * Starts with the genesis pieces expanded from the chain's genesis seed and
 * grows by one piece per block that reaches confirmation depth.
 * Thread-safe: many readers, one appender.
 */
class CChainPieceSet : public CPieceSet {
public:
    CChainPieceSet() = default;

    CChainPieceSet(const CChainPieceSet&) = delete;
    CChainPieceSet& operator=(const CChainPieceSet&) = delete;

    /**
     * Deterministically expand a 32-byte seed into one piece:
     * block j = SHA3-256(seed || index LE64 || j LE32)
     */
    static Piece ExpandPiece(const uint256& seed, uint64_t index);

    /** Replace the contents with count genesis pieces. Only valid on an empty set. */
    bool InitGenesis(const uint256& seed, uint64_t count);

    /** Append a piece; fails with MALFORMED_PIECE_SET on a wrong size */
    PieceSetResult Append(const Piece& piece);

    /** Append the piece derived from a confirmed block */
    PieceSetResult AppendFromBlock(const uint256& blockHash);

    uint64_t Size() const override;
    uint64_t Version() const override { return m_version.load(); }
    PieceSetResult GetPiece(uint64_t index, Piece& piece) const override;

private:
    mutable std::shared_mutex cs_pieces;
    std::vector<Piece> m_pieces;
    std::atomic<uint64_t> m_version{0};
};

#endif // PLOTCHAIN_PLOT_PIECE_SET_H
