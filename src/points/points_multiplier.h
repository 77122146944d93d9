// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_MULTIPLIER_H
#define POINTSD_POINTS_MULTIPLIER_H

#include "points/points_amount.h"
#include "points/points_state.h"

#include <stdint.h>
#include <vector>

/**
 * Multiplier resolution
 *
 * All multipliers are basis points where 10000 = 1.0x. NFT ownership and
 * voting power each contribute a bonus above 1.0x; the bonuses add up and
 * the result is capped at MAX_MULTIPLIER_BPS.
 */
namespace points_multiplier {

/**
 * CalculateNftMultiplier - Diminishing bonus over held partner collections
 *
 * multiplier = 10000 + sum(i = 0..count-1) firstBonus * decay^i / 10000^i
 * Each term is derived from the previous one with integer division.
 *
 * @param nActiveCount Number of active partner collections held
 * @param nFirstBonusBps Bonus of the first collection
 * @param nDecayRatioBps Ratio between successive bonuses (10000 = no decay)
 * @return Multiplier in bps, 10000 when nActiveCount is 0
 */
uint32_t CalculateNftMultiplier(uint32_t nActiveCount, uint32_t nFirstBonusBps, uint32_t nDecayRatioBps);

/**
 * CalculateVotingPowerMultiplier - Tier lookup
 *
 * Active tiers are scanned in ascending minVotingPower order; the highest
 * tier whose threshold is met wins.
 *
 * @param votingPower Voting power (token base units)
 * @param tiers Configured tiers, any order
 * @param pTierIndex Optional output: index of the matched tier, -1 if none
 * @return Multiplier in bps, 10000 if no tier matches
 */
uint32_t CalculateVotingPowerMultiplier(const CBigInt& votingPower, const std::vector<CVotingPowerTier>& tiers, int* pTierIndex = nullptr);

/** min(MAX_MULTIPLIER_BPS, nft + vp - 10000), never below 10000 */
uint32_t CalculateCombinedMultiplier(uint32_t nNftMultiplierBps, uint32_t nVpMultiplierBps);

/**
 * CalculateVotingPower - Linearly decaying veNFT voting power
 *
 * @return lockedAmount for permanent locks, 0 for expired locks,
 *         otherwise lockedAmount * remaining / MAX_LOCK_TIME
 */
CBigInt CalculateVotingPower(const CBigInt& lockedAmount, int64_t nLockEnd, bool fPermanent, int64_t nTime);

/**
 * CalculateAverageVotingPower - Mean voting power over [nStart, nEnd]
 *
 * Power decays linearly until the lock ends, so the mean over the active
 * part is the average of its endpoints. Time after the lock end counts as
 * zero power.
 */
CBigInt CalculateAverageVotingPower(const CBigInt& lockedAmount, int64_t nLockEnd, bool fPermanent,
                                    int64_t nStart, int64_t nEnd);

/** raw * min(multiplier, MAX_MULTIPLIER_BPS) / 10000 */
CPoints ApplyMultiplier(const CPoints& raw, uint32_t nMultiplierBps);

} // namespace points_multiplier

#endif // POINTSD_POINTS_MULTIPLIER_H
