// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <crypto/sha3.h>
#include <stdexcept>

// SHA-3 from the Dilithium FIPS 202 module (libpqcrystals_fips202_ref)
extern "C" {
    void pqcrystals_dilithium_fips202_ref_sha3_256(uint8_t h[32], const uint8_t *in, size_t inlen);
}

void SHA3_256(const uint8_t* data, size_t len, uint8_t hash[32]) {
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("SHA3_256: data is NULL but len > 0");
    }
    if (hash == nullptr) {
        throw std::invalid_argument("SHA3_256: hash output buffer is NULL");
    }

    pqcrystals_dilithium_fips202_ref_sha3_256(hash, data, len);
}
