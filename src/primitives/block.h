// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_PRIMITIVES_BLOCK_H
#define PLOTCHAIN_PRIMITIVES_BLOCK_H

#include <cstring>
#include <cstdint>
#include <vector>
#include <string>
#include <iosfwd>

class CDataStream;

/** 256-bit hash */
class uint256 {
public:
    uint8_t data[32];

    uint256() { memset(data, 0, 32); }

    void SetNull() { memset(data, 0, 32); }

    bool IsNull() const {
        for (int i = 0; i < 32; i++)
            if (data[i] != 0) return false;
        return true;
    }

    // Byte-order comparison (data[0] first). Used for STL containers, for
    // the fork-choice tie-break, and for ranking quality distances.
    // Numeric values such as cumulative weight are little-endian and must be
    // compared with WeightGreaterThan() instead.
    bool operator<(const uint256& other) const {
        return memcmp(data, other.data, 32) < 0;
    }

    bool operator==(const uint256& other) const {
        return memcmp(data, other.data, 32) == 0;
    }

    bool operator!=(const uint256& other) const {
        return memcmp(data, other.data, 32) != 0;
    }

    uint8_t* begin() { return data; }
    const uint8_t* begin() const { return data; }
    uint8_t* end() { return data + 32; }
    const uint8_t* end() const { return data + 32; }

    std::string GetHex() const;
};

// Stream output operator for Boost.Test (defined in block.cpp)
std::ostream& operator<<(std::ostream& os, const uint256& h);

/** SHA3-256 of an arbitrary buffer, as a uint256 */
uint256 Hash256(const uint8_t* data, size_t len);
inline uint256 Hash256(const std::vector<uint8_t>& v) { return Hash256(v.data(), v.size()); }

/**
 * Proof of replication.
 *
 * Claims that the farmer holding vchFarmerPubKey stores the encoding of
 * piece nPieceIndex, and that this encoding reaches some quality against
 * challenge. vchEncoding is the full encoded piece, which lets any node
 * holding the piece set check the claim with one decode.
 */
class CProof {
public:
    std::vector<uint8_t> vchFarmerPubKey;
    uint64_t nPieceIndex;
    uint256 challenge;
    std::vector<uint8_t> vchEncoding;
    std::vector<uint8_t> vchSignature;

    CProof() { SetNull(); }

    void SetNull() {
        vchFarmerPubKey.clear();
        nPieceIndex = 0;
        challenge.SetNull();
        vchEncoding.clear();
        vchSignature.clear();
    }

    bool IsNull() const { return vchFarmerPubKey.empty(); }

    /** SHA3-256(farmer public key) */
    uint256 GetFarmerId() const;

    /** Digest the farmer signs: SHA3(farmerId || index || challenge || SHA3(encoding)) */
    uint256 GetSigningHash() const;

    void Serialize(CDataStream& s) const;
    void Unserialize(CDataStream& s);
};

class CBlockHeader {
public:
    int32_t nVersion;
    uint256 hashPrevBlock;
    uint32_t nHeight;
    uint32_t nTime;
    uint32_t nDifficulty;          // minimum quality, in leading zero bits
    uint256 nCumulativeWeight;     // little-endian 256-bit integer
    CProof proof;

    static const int32_t CURRENT_VERSION = 1;

    CBlockHeader() { SetNull(); }

    void SetNull() {
        nVersion = CURRENT_VERSION;
        hashPrevBlock.SetNull();
        nHeight = 0;
        nTime = 0;
        nDifficulty = 0;
        nCumulativeWeight.SetNull();
        proof.SetNull();
    }

    bool IsGenesis() const { return hashPrevBlock.IsNull() && nHeight == 0; }

    /** SHA3-256 of the serialized header */
    uint256 GetHash() const;

    void Serialize(CDataStream& s) const;
    void Unserialize(CDataStream& s);
};

class CBlock : public CBlockHeader {
public:
    // Farmer's signature over GetHash(); not part of the hashed header
    std::vector<uint8_t> vchBlockSig;

    CBlock() { SetNull(); }
    explicit CBlock(const CBlockHeader& header) {
        SetNull();
        *(static_cast<CBlockHeader*>(this)) = header;
    }

    void SetNull() {
        CBlockHeader::SetNull();
        vchBlockSig.clear();
    }


    void Serialize(CDataStream& s) const;
    void Unserialize(CDataStream& s);

    std::vector<uint8_t> ToBytes() const;
    static bool FromBytes(const std::vector<uint8_t>& bytes, CBlock& block, std::string& error);

    /** Rough in-memory footprint, used by the orphan buffer limits */
    size_t GetSerializedSize() const;
};

#endif // PLOTCHAIN_PRIMITIVES_BLOCK_H
