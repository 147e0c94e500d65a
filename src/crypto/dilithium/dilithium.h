// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PLOTCHAIN_CRYPTO_DILITHIUM_DILITHIUM_H
#define PLOTCHAIN_CRYPTO_DILITHIUM_DILITHIUM_H

#include <cstddef>
#include <cstdint>

extern "C" {
#include <dilithium/ref/api.h>
}

/**
 * CRYSTALS-Dilithium wrapper for farmer identities.
 *
 * Dilithium3 (NIST level 3) reference implementation. Farmers sign every
 * proof and every block they produce; the public key is carried inside the
 * proof and its SHA3-256 digest is the farmer id that seeds the encoding.
 *
 * Signatures are made with an empty context string.
 */

#define DILITHIUM_PUBLICKEYBYTES pqcrystals_dilithium3_ref_PUBLICKEYBYTES
#define DILITHIUM_SECRETKEYBYTES pqcrystals_dilithium3_ref_SECRETKEYBYTES
#define DILITHIUM_BYTES pqcrystals_dilithium3_ref_BYTES

namespace dilithium {

/**
 * Generate a Dilithium keypair.
 *
 * @return 0 on success
 *         -1 on invalid parameters (null pointers, buffer overlap)
 *         -2 on RNG failure (entropy self-test failed)
 *         -3 on key generation failure
 */
int keypair(unsigned char* pk, unsigned char* sk)
    __attribute__((warn_unused_result))
    __attribute__((nonnull(1, 2)));

/**
 * Sign a message.
 *
 * @param sig Output buffer, at least DILITHIUM_BYTES
 * @param siglen Receives the signature length
 * @return 0 on success, -1 on invalid parameters, -2 on signing failure
 */
int sign(unsigned char* sig, size_t* siglen,
         const unsigned char* msg, size_t msglen,
         const unsigned char* sk)
    __attribute__((warn_unused_result));

/**
 * Verify a signature.
 *
 * @return 0 if the signature is valid, non-zero otherwise
 */
int verify(const unsigned char* sig, size_t siglen,
           const unsigned char* msg, size_t msglen,
           const unsigned char* pk)
    __attribute__((warn_unused_result));

} // namespace dilithium

#endif // PLOTCHAIN_CRYPTO_DILITHIUM_DILITHIUM_H
