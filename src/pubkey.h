// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license.

#ifndef PLOTCHAIN_PUBKEY_H
#define PLOTCHAIN_PUBKEY_H

#include <crypto/dilithium/dilithium.h>
#include <primitives/block.h>

#include <cstring>
#include <vector>

/**
 * CPubKey: A farmer's Dilithium public key.
 *
 * The farmer id used by the encoder and the plot store is
 * SHA3-256(public key), see GetFarmerId().
 */
class CPubKey
{
private:
    unsigned char vch[DILITHIUM_PUBLICKEYBYTES];
    bool fValid;

public:
    CPubKey() : fValid(false) {
        memset(vch, 0, sizeof(vch));
    }

    CPubKey(const unsigned char* pbegin, const unsigned char* pend);
    explicit CPubKey(const std::vector<unsigned char>& bytes);

    friend bool operator==(const CPubKey& a, const CPubKey& b) {
        return a.fValid == b.fValid &&
               memcmp(a.vch, b.vch, DILITHIUM_PUBLICKEYBYTES) == 0;
    }

    friend bool operator!=(const CPubKey& a, const CPubKey& b) {
        return !(a == b);
    }

    static constexpr unsigned int size() { return DILITHIUM_PUBLICKEYBYTES; }

    const unsigned char* data() const { return vch; }
    const unsigned char* begin() const { return vch; }
    const unsigned char* end() const { return vch + size(); }

    std::vector<unsigned char> GetBytes() const {
        return std::vector<unsigned char>(begin(), end());
    }

    bool IsValid() const { return fValid; }

    void Set(const unsigned char* pbegin, const unsigned char* pend);

    //! SHA3-256 of the key bytes
    uint256 GetFarmerId() const;

    //! Verify a signature over a 32-byte digest
    bool Verify(const uint256& hash, const std::vector<unsigned char>& vchSig) const;
};

#endif // PLOTCHAIN_PUBKEY_H
