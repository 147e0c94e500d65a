// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <primitives/block.h>
#include <primitives/piece.h>
#include <crypto/sha3.h>
#include <net/serialize.h>
#include <util/strencodings.h>

#include <sstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>

// Field limits applied when reading untrusted bytes
static const size_t MAX_PUBKEY_SIZE = 8 * 1024;
static const size_t MAX_SIGNATURE_SIZE = 8 * 1024;

std::string uint256::GetHex() const {
    std::stringstream ss;
    for (int i = 31; i >= 0; i--) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const uint256& h) {
    return os << h.GetHex();
}

uint256 Hash256(const uint8_t* data, size_t len) {
    uint256 result;
    SHA3_256(data, len, result.data);
    return result;
}

// ---------------------------------------------------------------------------
// CProof
// ---------------------------------------------------------------------------

uint256 CProof::GetFarmerId() const {
    return Hash256(vchFarmerPubKey);
}

uint256 CProof::GetSigningHash() const {
    uint8_t buf[32 + 8 + 32 + 32];
    uint256 farmerId = GetFarmerId();
    uint256 encodingHash = Hash256(vchEncoding);

    memcpy(buf, farmerId.data, 32);
    WriteLE64(buf + 32, nPieceIndex);
    memcpy(buf + 40, challenge.data, 32);
    memcpy(buf + 72, encodingHash.data, 32);
    return Hash256(buf, sizeof(buf));
}

void CProof::Serialize(CDataStream& s) const {
    s.WriteBytes(vchFarmerPubKey);
    s.WriteUint64(nPieceIndex);
    s.WriteUint256(challenge);
    s.WriteBytes(vchEncoding);
    s.WriteBytes(vchSignature);
}

void CProof::Unserialize(CDataStream& s) {
    vchFarmerPubKey = s.ReadBytes(MAX_PUBKEY_SIZE);
    nPieceIndex = s.ReadUint64();
    challenge = s.ReadUint256();
    vchEncoding = s.ReadBytes(PIECE_SIZE);
    vchSignature = s.ReadBytes(MAX_SIGNATURE_SIZE);
}

// ---------------------------------------------------------------------------
// CBlockHeader / CBlock
// ---------------------------------------------------------------------------

void CBlockHeader::Serialize(CDataStream& s) const {
    s.WriteInt32(nVersion);
    s.WriteUint256(hashPrevBlock);
    s.WriteUint32(nHeight);
    s.WriteUint32(nTime);
    s.WriteUint32(nDifficulty);
    s.WriteUint256(nCumulativeWeight);
    proof.Serialize(s);
}

void CBlockHeader::Unserialize(CDataStream& s) {
    nVersion = s.ReadInt32();
    hashPrevBlock = s.ReadUint256();
    nHeight = s.ReadUint32();
    nTime = s.ReadUint32();
    nDifficulty = s.ReadUint32();
    nCumulativeWeight = s.ReadUint256();
    proof.Unserialize(s);
}

uint256 CBlockHeader::GetHash() const {
    CDataStream s;
    Serialize(s);
    return Hash256(s.GetData());
}

void CBlock::Serialize(CDataStream& s) const {
    CBlockHeader::Serialize(s);
    s.WriteBytes(vchBlockSig);
}

void CBlock::Unserialize(CDataStream& s) {
    CBlockHeader::Unserialize(s);
    vchBlockSig = s.ReadBytes(MAX_SIGNATURE_SIZE);
}

std::vector<uint8_t> CBlock::ToBytes() const {
    CDataStream s;
    Serialize(s);
    return s.GetData();
}

bool CBlock::FromBytes(const std::vector<uint8_t>& bytes, CBlock& block, std::string& error) {
    try {
        CDataStream s(bytes);
        block.Unserialize(s);
        if (!s.eof()) {
            error = "trailing bytes after block";
            return false;
        }
    } catch (const std::runtime_error& e) {
        error = e.what();
        return false;
    }
    return true;
}

size_t CBlock::GetSerializedSize() const {
    // Fixed header fields plus the variable-length proof and signature
    return 4 + 32 + 4 + 4 + 4 + 32 + 8 + 32 +
           proof.vchFarmerPubKey.size() + proof.vchEncoding.size() +
           proof.vchSignature.size() + vchBlockSig.size();
}
