// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <consensus/quality.h>

uint256 ComputeChallenge(const uint256& blockHash, const std::vector<uint8_t>& vchProofSig) {
    uint256 sigHash = Hash256(vchProofSig);
    uint8_t preimage[64];
    memcpy(preimage, blockHash.begin(), 32);
    memcpy(preimage + 32, sigHash.begin(), 32);
    return Hash256(preimage, sizeof(preimage));
}

CChallenge GetChallengeForChild(const CBlockHeader& block) {
    CChallenge challenge;
    challenge.nHeight = block.nHeight + 1;
    challenge.value = ComputeChallenge(block.GetHash(), block.proof.vchSignature);
    return challenge;
}

uint256 ComputeDistance(const uint256& challenge, const uint8_t* encoding, size_t len) {
    std::vector<uint8_t> preimage(32 + len);
    memcpy(preimage.data(), challenge.begin(), 32);
    if (len > 0) {
        memcpy(preimage.data() + 32, encoding, len);
    }
    uint256 distance = Hash256(preimage);
    for (int i = 0; i < 32; i++) {
        distance.data[i] ^= challenge.data[i];
    }
    return distance;
}

unsigned int GetQuality(const uint256& distance) {
    unsigned int bits = 0;
    for (int i = 0; i < 32; i++) {
        uint8_t b = distance.data[i];
        if (b == 0) {
            bits += 8;
            continue;
        }
        for (int bit = 7; bit >= 0; bit--) {
            if (b & (1 << bit)) {
                return bits;
            }
            bits++;
        }
    }
    return bits;
}

bool GetBlockWeight(unsigned int quality, unsigned int difficulty, uint256& weight) {
    weight.SetNull();
    if (quality < difficulty || difficulty > 248) {
        return false;
    }

    unsigned int bonus = quality - difficulty;
    if (bonus > MAX_QUALITY_BONUS) {
        bonus = MAX_QUALITY_BONUS;
    }
    uint32_t multiplier = 1 + bonus;

    // multiplier < 2^5, so the shifted value stays below 2^(difficulty+5)
    unsigned int byte = difficulty / 8;
    unsigned int shift = difficulty % 8;
    uint64_t shifted = static_cast<uint64_t>(multiplier) << shift;
    for (unsigned int i = 0; shifted != 0 && byte + i < 32; i++) {
        weight.data[byte + i] = static_cast<uint8_t>(shifted & 0xff);
        shifted >>= 8;
    }
    return true;
}

bool WeightAdd(const uint256& a, const uint256& b, uint256& result) {
    unsigned int carry = 0;
    for (int i = 0; i < 32; i++) {
        unsigned int sum = static_cast<unsigned int>(a.data[i]) + b.data[i] + carry;
        result.data[i] = static_cast<uint8_t>(sum & 0xff);
        carry = sum >> 8;
    }
    return carry == 0;
}

bool WeightGreaterThan(const uint256& a, const uint256& b) {
    for (int i = 31; i >= 0; i--) {
        if (a.data[i] != b.data[i]) {
            return a.data[i] > b.data[i];
        }
    }
    return false;
}

double WeightToDouble(const uint256& weight) {
    double value = 0.0;
    for (int i = 31; i >= 0; i--) {
        value = value * 256.0 + weight.data[i];
    }
    return value;
}
