// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

/**
 * Sloth sequential encoding
 *
 * Turns a piece into a farmer-specific replica with a chain of modular
 * square roots over a 256-bit prime field. Each square root is an
 * exponentiation by (p+1)/4 and depends on the previous output, so encoding
 * cannot be parallelised inside a piece. Decoding needs one squaring per
 * block and is several hundred times faster, which is what lets any node
 * check a proof that took a farmer real time to plot.
 *
 * Piece layout: PIECE_SIZE bytes = BLOCKS_PER_PIECE blocks of 32 bytes, each
 * read as a little-endian 256-bit integer.
 */

#ifndef PLOTCHAIN_SLOTH_SLOTH_H
#define PLOTCHAIN_SLOTH_SLOTH_H

#include <primitives/block.h>
#include <primitives/piece.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sloth {

static const size_t BLOCK_SIZE = 32;
static const size_t BLOCKS_PER_PIECE = PIECE_SIZE / BLOCK_SIZE;
static const unsigned int PRIME_BITS = 256;

enum class ErrorCode {
    INVALID_INPUT_SIZE,   // wrong piece length, or a block outside the field
    DECODE_MISMATCH       // encoded data could not have been produced by encode()
};

const char* ErrorCodeToString(ErrorCode code);

class SlothError : public std::runtime_error {
public:
    SlothError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), m_code(code) {}

    ErrorCode code() const { return m_code; }

private:
    ErrorCode m_code;
};

/**
 * Per-piece initial feedback value.
 *
 * iv = SHA3-256(farmerId || index as little-endian u64)
 */
uint256 expand_iv(const uint256& farmerId, uint64_t index);

/**
 * Encode a piece for one farmer.
 *
 * @param piece    PIECE_SIZE bytes
 * @param farmerId SHA3-256 of the farmer public key
 * @param index    Piece index
 * @param layers   Number of full passes over the piece (the delay knob)
 * @throws SlothError(INVALID_INPUT_SIZE)
 */
std::vector<uint8_t> encode(const Piece& piece, const uint256& farmerId,
                            uint64_t index, uint32_t layers);

/**
 * Exact inverse of encode().
 *
 * Every intermediate value that encode() would have produced as a square
 * root must lie below the prime; any other value means re-encoding the
 * result could not reproduce the input, and DECODE_MISMATCH is thrown.
 *
 * @throws SlothError(INVALID_INPUT_SIZE) or SlothError(DECODE_MISMATCH)
 */
Piece decode(const std::vector<uint8_t>& encoded, const uint256& farmerId,
             uint64_t index, uint32_t layers);

/**
 * Check that encoded is the replica of piece for (farmerId, index).
 *
 * @throws SlothError(DECODE_MISMATCH) if it is not
 */
void verify(const Piece& piece, const std::vector<uint8_t>& encoded,
            const uint256& farmerId, uint64_t index, uint32_t layers);

/** The field prime, as lowercase big-endian hex */
std::string prime_hex();

/**
 * Benchmark square-root throughput on this hardware.
 *
 * @param sample_roots Number of square roots to time
 * @return Estimated square roots per second
 */
uint64_t benchmark(uint64_t sample_roots = 4096);

/**
 * Layers needed so that encoding one piece takes at least target_seconds.
 *
 * @param target_seconds Desired per-piece encoding delay
 * @param measured_rps   Square roots per second from benchmark()
 * @return Layer count, at least 1
 */
uint32_t calculate_layers(double target_seconds, uint64_t measured_rps);


} // namespace sloth

#endif // PLOTCHAIN_SLOTH_SLOTH_H
