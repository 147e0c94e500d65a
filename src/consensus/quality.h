// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_CONSENSUS_QUALITY_H
#define PLOTCHAIN_CONSENSUS_QUALITY_H

#include <primitives/block.h>

#include <cstdint>
#include <vector>

/**
 * Proof ranking rules
 *
 * These functions are consensus-critical: every node must compute exactly
 * the same bytes.
 *
 *   challenge(child of B) = SHA3-256(hash(B) || SHA3-256(B.proof.vchSignature))
 *   tag                   = SHA3-256(challenge || encoded piece)
 *   distance              = tag XOR challenge
 *   quality               = leading zero bits of distance (byte 0, bit 7 first)
 *
 * A lower distance is a better proof. Distances compare in byte order, so
 * uint256::operator< ranks them directly.
 */

/** Upper bound on the quality bonus a block can earn above its difficulty */
static const unsigned int MAX_QUALITY_BONUS = 16;

/** A challenge, identified by the height of the block that answers it */
struct CChallenge {
    uint32_t nHeight{0};
    uint256 value;

    bool operator==(const CChallenge& other) const {
        return nHeight == other.nHeight && value == other.value;
    }
    bool operator!=(const CChallenge& other) const { return !(*this == other); }
};

/**
 * Both inputs are covered by the block hash, so every copy of a block
 * yields the same challenge whatever its block signature.
 */
uint256 ComputeChallenge(const uint256& blockHash, const std::vector<uint8_t>& vchProofSig);

/** Challenge a child of block must answer */
CChallenge GetChallengeForChild(const CBlockHeader& block);

uint256 ComputeDistance(const uint256& challenge, const uint8_t* encoding, size_t len);
inline uint256 ComputeDistance(const uint256& challenge, const std::vector<uint8_t>& encoding) {
    return ComputeDistance(challenge, encoding.data(), encoding.size());
}

/** Leading zero bits, 0..256 */
unsigned int GetQuality(const uint256& distance);

/**
 * Weight contributed by a block: 2^difficulty * (1 + min(quality - difficulty, 16)).
 *
 * @return false if quality < difficulty or difficulty is out of range
 */
bool GetBlockWeight(unsigned int quality, unsigned int difficulty, uint256& weight);

/**
 * Little-endian 256-bit addition.
 *
 * @return false on overflow (result is then unspecified)
 */
bool WeightAdd(const uint256& a, const uint256& b, uint256& result);

/** Numeric comparison of little-endian weights */
bool WeightGreaterThan(const uint256& a, const uint256& b);

/** Approximate value for display only */
double WeightToDouble(const uint256& weight);

#endif // PLOTCHAIN_CONSENSUS_QUALITY_H
