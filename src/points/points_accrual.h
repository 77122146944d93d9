// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_ACCRUAL_H
#define POINTSD_POINTS_ACCRUAL_H

#include "points/points_amount.h"
#include "points/points_state.h"
#include "points/points_store.h"

#include <optional>
#include <stdint.h>
#include <string>

/**
 * Points accrual engine
 *
 * Converts time-weighted positions into points:
 *
 *   points = valueUsd * rateBps / 10000 * seconds / 86400
 *
 * for deposits and borrows (per reserve), voting power and LP positions,
 * then applies the user's combined multiplier. Each settlement measures the
 * interval from the stored baseline, credits every epoch the interval
 * overlaps and moves the baseline forward, so settling twice at the same
 * time credits nothing the second time.
 */
namespace points_accrual {

struct CAccrualResult
{
    CPoints depositPoints;
    CPoints borrowPoints;
    int64_t nSeconds;

    CAccrualResult() : depositPoints(0), borrowPoints(0), nSeconds(0) {}
};

/**
 * CalculateValuePoints - Points earned by a token amount over an interval
 *
 * amount * price * rate * seconds * 1e18 / (10^decimals * 1e8 * 10000 * 86400)
 *
 * @param amount Token amount in base units
 * @param nDecimals Token decimals
 * @param priceUsdE8 USD price with 8 decimals
 * @param nRateBps Daily rate (10000 = 100% of the value per day)
 * @param nSeconds Interval length
 * @return Scaled points, truncated
 */
CPoints CalculateValuePoints(const CBigInt& amount, int nDecimals, const CBigInt& priceUsdE8,
                             uint32_t nRateBps, int64_t nSeconds);

/** CalculateValuePoints for a USD value */
CPoints CalculateUsdPoints(double valueUsd, uint32_t nRateBps, int64_t nSeconds);

/** USD value of a token amount */
double AmountToUsd(const CBigInt& amount, int nDecimals, const CBigInt& priceUsdE8);

/** True while fewer than nCooldownSeconds passed since the baseline was settled */
bool IsInCooldown(const CUserReservePoints& baseline, int64_t nCooldownSeconds, int64_t nTime);

/**
 * AccruePointsForUserReserve - Settle one (user, reserve) up to nTime
 *
 * ALGORITHM:
 * 1. Load the baseline; a user without one is treated as holding the
 *    current balances since the start of the current epoch
 * 2. If the baseline predates the current epoch and the previous epoch has
 *    ended, credit [baseline, previousEnd] to the previous epoch and rebase
 *    at previousEnd with the frozen indices
 * 3. Credit the part of the interval inside the current epoch (the whole
 *    interval while it runs, up to its end once it has ended)
 * 4. Move the baseline to nTime, or to the epoch end while between epochs,
 *    valuing the balances with the index of that moment
 *
 * Unknown reserves are skipped. The baseline is written whether or not
 * points accrued.
 *
 * @param pResult Optional output: points credited by this call
 * @return false on store failure only
 */
bool AccruePointsForUserReserve(CPointsStore& store, const std::string& user, const std::string& reserve,
                                int64_t nTime, int64_t nBlock, CAccrualResult* pResult = nullptr);

/** Move the baseline to the current balances without crediting points */
bool SyncUserReserveBaseline(CPointsStore& store, const std::string& user, const std::string& reserve,
                             int64_t nTime, int64_t nBlock);

/**
 * SettlePointsForUser - Settle every position of a user
 *
 * Refreshes multipliers, then accrues each reserve the user holds.
 * While an epoch is active, reserves inside their settlement cooldown are
 * skipped unless they are the reserve named by the triggering event or
 * fIgnoreCooldown is set.
 * Voting power and LP points are settled last.
 *
 * @param eventReserve Reserve whose balance is about to change, if any
 */
bool SettlePointsForUser(CPointsStore& store, const std::string& user, const std::optional<std::string>& eventReserve,
                         int64_t nTime, int64_t nBlock, bool fIgnoreCooldown = false);

/** Credit voting power points since the last VP settlement */
bool SettleVotingPowerPoints(CPointsStore& store, const std::string& user, int64_t nTime);

/** Credit LP points since the last LP settlement */
bool SettleLpPoints(CPointsStore& store, const std::string& user, int64_t nTime);

/** Add valueUsd to the user's USD volume for an action on the current UTC day */
bool UpdateDailyHighwater(CPointsStore& store, const std::string& user, DailyAction action,
                          double valueUsd, int64_t nTime);

/**
 * AwardDailyBonus - Award an action's fixed daily bonus
 *
 * Awarded at most once per UTC day and only once the day's high-water mark
 * reaches the configured minimum. Requires an active epoch.
 */
bool AwardDailyBonus(CPointsStore& store, const std::string& user, DailyAction action, int64_t nTime);

/**
 * AdjustManualPoints - Add (or with a negative delta remove) manual points
 *
 * @param nEpoch Target epoch, the current one when 0
 */
bool AdjustManualPoints(CPointsStore& store, const std::string& user, int nEpoch, const CPoints& delta, int64_t nTime);

/**
 * CommitEpochStats - Persist epoch stats and propagate them
 *
 * Recomputes the totals, records participation, refreshes lifetime points
 * and updates the epoch and all-time leaderboards.
 */
bool CommitEpochStats(CPointsStore& store, CUserEpochStats& stats, int64_t nTime);

/** Recompute lifetime points as the sum of totalPoints over participated epochs */
bool UpdateLifetimePoints(CPointsStore& store, const std::string& user, int64_t nTime);

} // namespace points_accrual

#endif // POINTSD_POINTS_ACCRUAL_H
