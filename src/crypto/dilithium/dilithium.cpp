// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <crypto/dilithium/dilithium.h>
#include <support/cleanse.h>

#include <openssl/rand.h>

#include <cstring>
#include <cstdint>

namespace dilithium {

/**
 * Sanity check the system RNG before key generation. The reference
 * implementation reads its own entropy; a broken OS RNG usually shows up
 * here first as an all-zero or all-0xFF buffer.
 */
static bool validate_entropy_quality()
{
    unsigned char test_bytes[32];
    if (RAND_bytes(test_bytes, sizeof(test_bytes)) != 1) {
        return false;
    }

    bool all_zero = true;
    bool all_ones = true;
    for (size_t i = 0; i < sizeof(test_bytes); i++) {
        if (test_bytes[i] != 0x00) all_zero = false;
        if (test_bytes[i] != 0xFF) all_ones = false;
    }

    memory_cleanse(test_bytes, sizeof(test_bytes));
    return !all_zero && !all_ones;
}

static bool buffer_is_nonzero(const unsigned char* buf, size_t len)
{
    for (size_t i = 0; i < len; i++) {
        if (buf[i] != 0) {
            return true;
        }
    }
    return false;
}

int keypair(unsigned char* pk, unsigned char* sk)
{
    if (pk == nullptr || sk == nullptr || pk == sk) {
        return -1;
    }

    if (!validate_entropy_quality()) {
        return -2;
    }

    int ret = pqcrystals_dilithium3_ref_keypair(pk, sk);
    if (ret != 0) {
        return -3;
    }

    if (!buffer_is_nonzero(pk, DILITHIUM_PUBLICKEYBYTES) ||
        !buffer_is_nonzero(sk, DILITHIUM_SECRETKEYBYTES)) {
        memory_cleanse(pk, DILITHIUM_PUBLICKEYBYTES);
        memory_cleanse(sk, DILITHIUM_SECRETKEYBYTES);
        return -3;
    }

    return 0;
}

int sign(unsigned char* sig, size_t* siglen,
         const unsigned char* msg, size_t msglen,
         const unsigned char* sk)
{
    if (sig == nullptr || siglen == nullptr || sk == nullptr ||
        (msg == nullptr && msglen > 0)) {
        return -1;
    }

    int ret = pqcrystals_dilithium3_ref_signature(sig, siglen,
                                                  msg, msglen,
                                                  nullptr, 0,  // No context
                                                  sk);
    if (ret != 0 || *siglen != DILITHIUM_BYTES) {
        memory_cleanse(sig, DILITHIUM_BYTES);
        return -2;
    }

    return 0;
}

int verify(const unsigned char* sig, size_t siglen,
           const unsigned char* msg, size_t msglen,
           const unsigned char* pk)
{
    if (sig == nullptr || pk == nullptr || (msg == nullptr && msglen > 0)) {
        return -1;
    }
    if (siglen != DILITHIUM_BYTES) {
        return -1;
    }

    // 0 = valid signature
    return pqcrystals_dilithium3_ref_verify(sig, siglen,
                                            msg, msglen,
                                            nullptr, 0,  // No context
                                            pk);
}

} // namespace dilithium
