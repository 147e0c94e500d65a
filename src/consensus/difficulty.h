// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#ifndef PLOTCHAIN_CONSENSUS_DIFFICULTY_H
#define PLOTCHAIN_CONSENSUS_DIFFICULTY_H

#include <core/chainparams.h>
#include <primitives/block.h>

#include <cstdint>
#include <string>

class CBlockIndex;

/**
 * Difficulty is the minimum proof quality, in leading zero bits of the
 * distance. Each extra bit halves the share of plotted pieces that can win,
 * so adjustment moves in single bits.
 */

/**
 * One retarget step.
 *
 * Blocks arriving more than twice as fast as intended raise the requirement
 * by one bit; more than twice as slow lowers it by one bit.
 *
 * @param nOld            Current difficulty
 * @param nActualTimespan Seconds the last interval took
 * @param nTargetTimespan Seconds it should have taken
 * @param nMaxDifficulty  Upper bound
 */
uint32_t CalculateNextDifficulty(uint32_t nOld, int64_t nActualTimespan,
                                 int64_t nTargetTimespan, uint32_t nMaxDifficulty);

/**
 * Difficulty required of the child of pindexLast.
 * Only changes on heights that are a multiple of the adjustment interval.
 */
uint32_t GetNextDifficulty(const CBlockIndex* pindexLast, const Plotchain::ChainParams& params);

/**
 * Validate block timestamp
 *
 * Rules:
 * 1. Not before the parent's timestamp
 * 2. Not more than maxFutureBlockTime ahead of nNow
 */
bool CheckBlockTimestamp(const CBlockHeader& block, const CBlockIndex* pindexPrev,
                         const Plotchain::ChainParams& params, int64_t nNow, std::string& error);

#endif // PLOTCHAIN_CONSENSUS_DIFFICULTY_H
