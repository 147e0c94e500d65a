// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license.

#ifndef PLOTCHAIN_KEY_H
#define PLOTCHAIN_KEY_H

#include <crypto/dilithium/dilithium.h>
#include <pubkey.h>

#include <string>
#include <vector>

class uint256;

/**
 * CKey: A farmer's Dilithium keypair.
 *
 * The secret half is wiped on destruction. Dilithium public keys cannot be
 * recomputed cheaply from the packed secret key, so the pair is kept
 * together and persisted together (see ReadKeyFile / WriteKeyFile).
 */
class CKey
{
private:
    bool fValid;
    std::vector<unsigned char> keydata;   // DILITHIUM_SECRETKEYBYTES
    CPubKey pubkey;

public:
    CKey() : fValid(false) {}
    ~CKey();

    //! Initialize from an existing keypair
    bool Set(const std::vector<unsigned char>& secret, const std::vector<unsigned char>& pub);

    //! Generate a new random keypair
    bool MakeNewKey();

    bool IsValid() const { return fValid; }

    const CPubKey& GetPubKey() const { return pubkey; }

    uint256 GetFarmerId() const;

    //! Sign a 32-byte digest
    bool Sign(const uint256& hash, std::vector<unsigned char>& vchSig) const;

    //! Load "<pub><secret>" from disk
    bool ReadKeyFile(const std::string& path, std::string& error);

    //! Persist "<pub><secret>" with owner-only permissions
    bool WriteKeyFile(const std::string& path, std::string& error) const;

    CKey(const CKey&) = delete;
    CKey& operator=(const CKey&) = delete;

    CKey(CKey&& other) noexcept;
    CKey& operator=(CKey&& other) noexcept;
};

#endif // PLOTCHAIN_KEY_H
