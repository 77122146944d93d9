// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_multiplier.h"

#include "points/points_params.h"

#include <algorithm>
#include <limits>

namespace points_multiplier {

uint32_t CalculateNftMultiplier(uint32_t nActiveCount, uint32_t nFirstBonusBps, uint32_t nDecayRatioBps)
{
    uint64_t nMultiplier = BASE_MULTIPLIER_BPS;
    uint64_t nCurrentBonus = nFirstBonusBps;

    for (uint32_t i = 0; i < nActiveCount; ++i) {
        if (nCurrentBonus == 0) {
            break;
        }
        nMultiplier += nCurrentBonus;
        if (nMultiplier >= std::numeric_limits<uint32_t>::max()) {
            return std::numeric_limits<uint32_t>::max();
        }
        nCurrentBonus = nCurrentBonus * nDecayRatioBps / BPS_DENOMINATOR;
    }

    return (uint32_t)nMultiplier;
}

uint32_t CalculateVotingPowerMultiplier(const CBigInt& votingPower, const std::vector<CVotingPowerTier>& tiers, int* pTierIndex)
{
    std::vector<CVotingPowerTier> sorted;
    for (const CVotingPowerTier& tier : tiers) {
        if (tier.fActive) {
            sorted.push_back(tier);
        }
    }
    std::sort(sorted.begin(), sorted.end(), [](const CVotingPowerTier& a, const CVotingPowerTier& b) {
        if (a.minVotingPower != b.minVotingPower) return a.minVotingPower < b.minVotingPower;
        return a.nIndex < b.nIndex;
    });

    uint32_t nMultiplier = BASE_MULTIPLIER_BPS;
    int nTierIndex = -1;
    for (const CVotingPowerTier& tier : sorted) {
        if (votingPower < tier.minVotingPower) {
            break;
        }
        nMultiplier = tier.nMultiplierBps;
        nTierIndex = tier.nIndex;
    }

    if (pTierIndex) {
        *pTierIndex = nTierIndex;
    }
    return nMultiplier;
}

uint32_t CalculateCombinedMultiplier(uint32_t nNftMultiplierBps, uint32_t nVpMultiplierBps)
{
    int64_t nCombined = (int64_t)nNftMultiplierBps + (int64_t)nVpMultiplierBps - BASE_MULTIPLIER_BPS;
    if (nCombined < BASE_MULTIPLIER_BPS) {
        return BASE_MULTIPLIER_BPS;
    }
    if (nCombined > MAX_MULTIPLIER_BPS) {
        return MAX_MULTIPLIER_BPS;
    }
    return (uint32_t)nCombined;
}

CBigInt CalculateVotingPower(const CBigInt& lockedAmount, int64_t nLockEnd, bool fPermanent, int64_t nTime)
{
    if (lockedAmount <= 0) {
        return 0;
    }
    if (fPermanent) {
        return lockedAmount;
    }
    if (nLockEnd <= nTime) {
        return 0;
    }
    int64_t nRemaining = std::min(nLockEnd - nTime, MAX_LOCK_TIME);
    return lockedAmount * nRemaining / MAX_LOCK_TIME;
}

CBigInt CalculateAverageVotingPower(const CBigInt& lockedAmount, int64_t nLockEnd, bool fPermanent,
                                    int64_t nStart, int64_t nEnd)
{
    if (fPermanent) {
        return lockedAmount > 0 ? lockedAmount : CBigInt(0);
    }
    if (nEnd <= nStart) {
        return CalculateVotingPower(lockedAmount, nLockEnd, false, nStart);
    }
    if (nLockEnd <= nStart) {
        return 0;
    }

    int64_t nActiveEnd = std::min(nEnd, nLockEnd);
    CBigInt vpStart = CalculateVotingPower(lockedAmount, nLockEnd, false, nStart);
    CBigInt vpEnd = CalculateVotingPower(lockedAmount, nLockEnd, false, nActiveEnd);
    CBigInt activeAverage = (vpStart + vpEnd) / 2;

    return activeAverage * (nActiveEnd - nStart) / (nEnd - nStart);
}

CPoints ApplyMultiplier(const CPoints& raw, uint32_t nMultiplierBps)
{
    uint32_t nCapped = std::min(nMultiplierBps, MAX_MULTIPLIER_BPS);
    return raw * nCapped / BPS_DENOMINATOR;
}

} // namespace points_multiplier
