// Copyright (c) 2025 The Dilithion Core developers
// Distributed under the MIT software license

#include <consensus/difficulty.h>

#include <node/block_index.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <iostream>

uint32_t CalculateNextDifficulty(uint32_t nOld, int64_t nActualTimespan,
                                 int64_t nTargetTimespan, uint32_t nMaxDifficulty) {
    uint32_t nNew = nOld;
    if (nActualTimespan * 2 < nTargetTimespan) {
        nNew = nOld + 1;
    } else if (nActualTimespan > nTargetTimespan * 2 && nOld > 0) {
        nNew = nOld - 1;
    }

    if (nNew > nMaxDifficulty)
        nNew = nMaxDifficulty;
    return nNew;
}

uint32_t GetNextDifficulty(const CBlockIndex* pindexLast, const Plotchain::ChainParams& params) {
    if (pindexLast == nullptr) {
        return params.genesisDifficulty;
    }
    if (params.fNoRetargeting) {
        return pindexLast->nDifficulty;
    }

    int64_t nInterval = params.difficultyAdjustment;
    if (nInterval <= 0 || (pindexLast->nHeight + 1) % nInterval != 0) {
        return pindexLast->nDifficulty;
    }

    // Block at the start of this interval
    if (pindexLast->nHeight + 1 < nInterval) {
        return pindexLast->nDifficulty;
    }
    const CBlockIndex* pindexFirst = pindexLast->GetAncestor(pindexLast->nHeight + 1 - nInterval);
    if (pindexFirst == nullptr) {
        return pindexLast->nDifficulty;
    }

    int64_t nTargetTimespan = nInterval * static_cast<int64_t>(params.blockTime);
    int64_t nActualTimespan = static_cast<int64_t>(pindexLast->nTime) - static_cast<int64_t>(pindexFirst->nTime);
    if (nActualTimespan <= 0) {
        // Timestamps only have to be non-decreasing; a flat interval is as fast as it gets
        LogPrintConsensus(DEBUG, "Flat timespan over interval ending at height %u", pindexLast->nHeight);
        nActualTimespan = 1;
    }

    uint32_t nNew = CalculateNextDifficulty(pindexLast->nDifficulty, nActualTimespan,
                                            nTargetTimespan, params.maxDifficulty);

    if (nNew != pindexLast->nDifficulty) {
        std::cout << "[Difficulty] Adjustment at height " << (pindexLast->nHeight + 1)
                  << ": " << pindexLast->nDifficulty << " -> " << nNew << " bits"
                  << " (actual " << nActualTimespan << "s, expected " << nTargetTimespan << "s)" << std::endl;
    }
    return nNew;
}

bool CheckBlockTimestamp(const CBlockHeader& block, const CBlockIndex* pindexPrev,
                         const Plotchain::ChainParams& params, int64_t nNow, std::string& error) {
    int64_t nMaxFutureBlockTime = nNow + params.maxFutureBlockTime;
    if (static_cast<int64_t>(block.nTime) > nMaxFutureBlockTime) {
        error = strprintf("time-too-new: block time %u, max allowed %lld",
                          block.nTime, static_cast<long long>(nMaxFutureBlockTime));
        return false;
    }

    if (pindexPrev != nullptr && block.nTime < pindexPrev->nTime) {
        error = strprintf("time-too-old: block time %u before parent time %u",
                          block.nTime, pindexPrev->nTime);
        return false;
    }

    return true;
}
