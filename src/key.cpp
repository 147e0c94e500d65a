// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license.

#include <key.h>
#include <support/cleanse.h>

#include <cstring>
#include <fstream>
#include <iterator>

#ifndef _WIN32
#include <sys/stat.h>
#endif

CKey::~CKey()
{
    if (!keydata.empty()) {
        memory_cleanse(keydata.data(), keydata.size());
    }
}

CKey::CKey(CKey&& other) noexcept
    : fValid(other.fValid), keydata(std::move(other.keydata)), pubkey(other.pubkey)
{
    other.fValid = false;
    other.keydata.clear();
}

CKey& CKey::operator=(CKey&& other) noexcept
{
    if (this != &other) {
        if (!keydata.empty()) {
            memory_cleanse(keydata.data(), keydata.size());
        }
        fValid = other.fValid;
        keydata = std::move(other.keydata);
        pubkey = other.pubkey;
        other.fValid = false;
        other.keydata.clear();
    }
    return *this;
}

bool CKey::Set(const std::vector<unsigned char>& secret, const std::vector<unsigned char>& pub)
{
    if (secret.size() != DILITHIUM_SECRETKEYBYTES || pub.size() != DILITHIUM_PUBLICKEYBYTES) {
        fValid = false;
        return false;
    }

    keydata = secret;
    pubkey = CPubKey(pub);
    fValid = pubkey.IsValid();
    return fValid;
}

bool CKey::MakeNewKey()
{
    unsigned char pk[DILITHIUM_PUBLICKEYBYTES];
    keydata.assign(DILITHIUM_SECRETKEYBYTES, 0);

    if (dilithium::keypair(pk, keydata.data()) != 0) {
        memory_cleanse(keydata.data(), keydata.size());
        keydata.clear();
        fValid = false;
        return false;
    }

    pubkey = CPubKey(pk, pk + DILITHIUM_PUBLICKEYBYTES);
    fValid = true;
    return true;
}

uint256 CKey::GetFarmerId() const
{
    return pubkey.GetFarmerId();
}

bool CKey::Sign(const uint256& hash, std::vector<unsigned char>& vchSig) const
{
    if (!fValid) {
        return false;
    }

    vchSig.resize(DILITHIUM_BYTES);
    size_t siglen = 0;

    int ret = dilithium::sign(vchSig.data(), &siglen, hash.begin(), 32, keydata.data());
    if (ret != 0) {
        vchSig.clear();
        return false;
    }

    vchSig.resize(siglen);
    return true;
}

bool CKey::ReadKeyFile(const std::string& path, std::string& error)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "cannot open key file " + path;
        return false;
    }

    std::vector<unsigned char> contents((std::istreambuf_iterator<char>(file)),
                                        std::istreambuf_iterator<char>());
    if (contents.size() != DILITHIUM_PUBLICKEYBYTES + DILITHIUM_SECRETKEYBYTES) {
        memory_cleanse(contents.data(), contents.size());
        error = "key file " + path + " has unexpected size";
        return false;
    }

    std::vector<unsigned char> pub(contents.begin(), contents.begin() + DILITHIUM_PUBLICKEYBYTES);
    std::vector<unsigned char> secret(contents.begin() + DILITHIUM_PUBLICKEYBYTES, contents.end());
    memory_cleanse(contents.data(), contents.size());

    bool ok = Set(secret, pub);
    memory_cleanse(secret.data(), secret.size());
    if (!ok) {
        error = "key file " + path + " holds an invalid key";
    }
    return ok;
}

bool CKey::WriteKeyFile(const std::string& path, std::string& error) const
{
    if (!fValid) {
        error = "cannot write an invalid key";
        return false;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        error = "cannot create key file " + path;
        return false;
    }

    file.write(reinterpret_cast<const char*>(pubkey.data()), pubkey.size());
    file.write(reinterpret_cast<const char*>(keydata.data()), keydata.size());
    file.close();
    if (!file) {
        error = "failed writing key file " + path;
        return false;
    }

#ifndef _WIN32
    if (chmod(path.c_str(), S_IRUSR | S_IWUSR) != 0) {
        error = "cannot restrict permissions of key file " + path;
        return false;
    }
#endif
    return true;
}
