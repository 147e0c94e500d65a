// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license.

#include <pubkey.h>
#include <crypto/sha3.h>

CPubKey::CPubKey(const unsigned char* pbegin, const unsigned char* pend)
    : fValid(false)
{
    Set(pbegin, pend);
}

CPubKey::CPubKey(const std::vector<unsigned char>& bytes)
    : fValid(false)
{
    Set(bytes.data(), bytes.data() + bytes.size());
}

void CPubKey::Set(const unsigned char* pbegin, const unsigned char* pend)
{
    if (pend - pbegin == DILITHIUM_PUBLICKEYBYTES) {
        memcpy(vch, pbegin, DILITHIUM_PUBLICKEYBYTES);
        fValid = true;
    } else {
        memset(vch, 0, sizeof(vch));
        fValid = false;
    }
}

uint256 CPubKey::GetFarmerId() const
{
    uint256 id;
    SHA3_256(vch, DILITHIUM_PUBLICKEYBYTES, id.data);
    return id;
}

bool CPubKey::Verify(const uint256& hash, const std::vector<unsigned char>& vchSig) const
{
    if (!fValid) {
        return false;
    }

    if (vchSig.size() != DILITHIUM_BYTES) {
        return false;
    }

    int ret = dilithium::verify(
        vchSig.data(), vchSig.size(),
        hash.begin(), 32,
        vch
    );

    return (ret == 0);
}
