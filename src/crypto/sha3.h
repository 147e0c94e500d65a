// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_CRYPTO_SHA3_H
#define PLOTCHAIN_CRYPTO_SHA3_H

#include <stdint.h>
#include <stdlib.h>
#include <vector>

/**
 * SHA3-256 (NIST FIPS 202) from the Dilithium reference library.
 *
 * Every consensus hash in plotchain is SHA3-256: block ids, challenges,
 * encoding IVs, quality tags, piece expansion and storage checksums.
 */

/**
 * Compute SHA3-256 hash of data (one-shot function)
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 * @throws std::invalid_argument on null buffers
 */
void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]);

inline void SHA3_256(const std::vector<uint8_t>& data, uint8_t hash[32]) {
    SHA3_256(data.data(), data.size(), hash);
}

#endif // PLOTCHAIN_CRYPTO_SHA3_H
