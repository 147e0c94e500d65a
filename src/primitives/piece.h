// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_PRIMITIVES_PIECE_H
#define PLOTCHAIN_PRIMITIVES_PIECE_H

#include <cstddef>
#include <cstdint>
#include <vector>

/** Size of one piece of chain history, and of its encoding */
static const size_t PIECE_SIZE = 4096;

/** A piece is an immutable PIECE_SIZE byte block */
typedef std::vector<uint8_t> Piece;

#endif // PLOTCHAIN_PRIMITIVES_PIECE_H
