// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_accrual.h"

#include "logging.h"
#include "points/points_epoch.h"
#include "points/points_leaderboard.h"
#include "points/points_math.h"
#include "points/points_multiplier.h"
#include "points/points_params.h"
#include "points/points_voting.h"
#include "util/system.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace points_accrual {

// ============================================================================
// Point formulas
// ============================================================================

CPoints CalculateValuePoints(const CBigInt& amount, int nDecimals, const CBigInt& priceUsdE8,
                             uint32_t nRateBps, int64_t nSeconds)
{
    if (amount <= 0 || priceUsdE8 <= 0 || nRateBps == 0 || nSeconds <= 0) {
        return 0;
    }

    // Worst case numerator stays below 2^255 for amounts up to 1e30 base units
    CBigInt numerator = amount * priceUsdE8 * nRateBps * nSeconds * points_math::WAD;
    CBigInt denominator = points_math::Pow10(nDecimals) * CBigInt(DEFAULT_PRICE_USD_E8) *
                          BPS_DENOMINATOR * SECONDS_PER_DAY;

    return static_cast<CPoints>(numerator / denominator);
}

CPoints CalculateUsdPoints(double valueUsd, uint32_t nRateBps, int64_t nSeconds)
{
    if (!std::isfinite(valueUsd) || valueUsd <= 0) {
        return 0;
    }
    CBigInt valueE8 = 0;
    if (!ParseBigInt(strprintf("%.0f", std::round(std::min(valueUsd, MAX_USD_VALUE) * 1e8)), valueE8)) {
        return 0;
    }
    return CalculateValuePoints(valueE8, 8, CBigInt(DEFAULT_PRICE_USD_E8), nRateBps, nSeconds);
}

double AmountToUsd(const CBigInt& amount, int nDecimals, const CBigInt& priceUsdE8)
{
    return points_math::ToDecimal(amount * priceUsdE8, nDecimals + 8);
}

bool IsInCooldown(const CUserReservePoints& baseline, int64_t nCooldownSeconds, int64_t nTime)
{
    if (nCooldownSeconds <= 0 || !baseline.HasBaseline()) {
        return false;
    }
    return nTime - baseline.nLastSettledAt < nCooldownSeconds;
}

// ============================================================================
// Epoch stats propagation
// ============================================================================

bool UpdateLifetimePoints(CPointsStore& store, const std::string& user, int64_t nTime)
{
    CUserLeaderboardState state = store.LoadUserLeaderboardState_OrNew(user);

    CPoints lifetime = 0;
    for (int nEpoch : state.vEpochsParticipated) {
        CUserEpochStats stats;
        if (store.ReadUserEpochStats(user, nEpoch, stats)) {
            lifetime += stats.totalPoints;
        }
    }

    state.lifetimePoints = lifetime;
    state.nLastUpdatedAt = nTime;
    if (!store.WriteUserLeaderboardState(state)) {
        return error("%s: failed to write leaderboard state of %s", __func__, user);
    }

    return points_leaderboard::UpdateAllTimeLeaderboard(store, user, PointsToDouble(lifetime), nTime);
}

bool CommitEpochStats(CPointsStore& store, CUserEpochStats& stats, int64_t nTime)
{
    stats.RecomputeTotals();
    stats.nLastUpdatedAt = nTime;
    if (!store.WriteUserEpochStats(stats)) {
        return error("%s: failed to write stats %s", __func__, MakeUserEpochKey(stats.user, stats.nEpochNumber));
    }

    CUserLeaderboardState state = store.LoadUserLeaderboardState_OrNew(stats.user);
    if (state.AddEpoch(stats.nEpochNumber)) {
        if (!store.WriteUserLeaderboardState(state)) {
            return error("%s: failed to write leaderboard state of %s", __func__, stats.user);
        }
    }

    LogPrint(BCLog::POINTS, "CommitEpochStats: user=%s epoch=%d total=%s withMultiplier=%s\n",
             stats.user, stats.nEpochNumber, FormatPoints(stats.totalPoints), FormatPoints(stats.totalPointsWithMultiplier));

    if (!UpdateLifetimePoints(store, stats.user, nTime)) {
        return false;
    }
    return points_leaderboard::UpdateLeaderboardForEpoch(store, stats.user, stats.nEpochNumber,
                                                         PointsToDouble(stats.totalPointsWithMultiplier), nTime);
}

/** Epochs an interval starting at nLastSettled can overlap: every ended one since then, oldest first, and the current */
static std::vector<CLeaderboardEpoch> GetSettlementEpochs(CPointsStore& store, const CLeaderboardEpoch& current,
                                                          int64_t nLastSettled)
{
    std::vector<CLeaderboardEpoch> vEpochs;
    if (current.IsNull()) {
        return vEpochs;
    }
    int64_t nBoundary = current.nStartTime;
    for (int nEpoch = current.nEpochNumber - 1; nEpoch >= 1 && nLastSettled < nBoundary; --nEpoch) {
        CLeaderboardEpoch previous;
        if (!store.ReadEpoch(nEpoch, previous) || !previous.HasEnded()) {
            break;
        }
        vEpochs.push_back(previous);
        nBoundary = previous.nStartTime;
    }
    std::reverse(vEpochs.begin(), vEpochs.end());
    vEpochs.push_back(current);
    return vEpochs;
}

// ============================================================================
// Reserve accrual
// ============================================================================

/** Value a user's scaled balances at nTime */
static void GetBalancesAt(CPointsStore& store, const CReserve& reserve, const CUserReserve& userReserve,
                          const CLeaderboardEpoch& epoch, int64_t nTime, CBigInt& deposit, CBigInt& borrow)
{
    CBigInt liquidityIndex, borrowIndex;
    points_epoch::GetReserveIndicesAt(store, reserve, epoch, nTime, liquidityIndex, borrowIndex);
    deposit = points_math::RayMul(userReserve.scaledATokenBalance, liquidityIndex);
    borrow = points_math::RayMul(userReserve.scaledVariableDebt, borrowIndex);
}

/**
 * AccrueEpochSegment - Credit the part of the baseline interval scored by one epoch
 *
 * For an ended epoch the baseline is moved to the epoch end and revalued
 * with the frozen indices.
 */
static bool AccrueEpochSegment(CPointsStore& store, const std::string& user, const CReserve& reserve,
                               const CUserReserve& userReserve, const CLeaderboardEpoch& epoch,
                               CUserReservePoints& baseline, int64_t nTime, int64_t nBlock, CAccrualResult& result)
{
    if (nBlock < epoch.nStartBlock) {
        LogPrint(BCLog::POINTS, "AccrueEpochSegment: block %lld before epoch %d start block %lld\n",
                 (long long)nBlock, epoch.nEpochNumber, (long long)epoch.nStartBlock);
        return true;
    }

    int64_t nStart = 0;
    int64_t nEnd = 0;
    if (points_epoch::GetAccrualWindow(epoch, baseline.nLastSettledAt, nTime, nStart, nEnd)) {
        const CLeaderboardConfig config = store.LoadConfig_OrDefault();
        const int64_t nSeconds = nEnd - nStart;
        const CBigInt price = reserve.GetPriceUsdE8();

        CPoints depositPoints = CalculateValuePoints(baseline.lastDepositAmount, reserve.nDecimals, price,
                                                     config.nDepositRateBps, nSeconds);
        CPoints borrowPoints = CalculateValuePoints(baseline.lastBorrowAmount, reserve.nDecimals, price,
                                                    config.nBorrowRateBps, nSeconds);

        LogPrint(BCLog::POINTS, "AccrueEpochSegment: user=%s reserve=%s epoch=%d [%lld, %lld] deposit=%s borrow=%s\n",
                 user, reserve.id, epoch.nEpochNumber, (long long)nStart, (long long)nEnd,
                 FormatPoints(depositPoints), FormatPoints(borrowPoints));

        if (depositPoints > 0 || borrowPoints > 0) {
            baseline.depositPoints += depositPoints;
            baseline.borrowPoints += borrowPoints;

            const CUserLeaderboardState state = store.LoadUserLeaderboardState_OrNew(user);
            const uint32_t nMultiplier = state.nCombinedMultiplierBps;

            CUserEpochStats stats = store.LoadUserEpochStats_OrNew(user, epoch.nEpochNumber, nTime);
            stats.depositPoints += depositPoints;
            stats.depositPointsWithMultiplier += points_multiplier::ApplyMultiplier(depositPoints, nMultiplier);
            stats.borrowPoints += borrowPoints;
            stats.borrowPointsWithMultiplier += points_multiplier::ApplyMultiplier(borrowPoints, nMultiplier);
            stats.nLastAppliedMultiplierBps = nMultiplier;
            if (!CommitEpochStats(store, stats, nTime)) {
                return false;
            }

            result.depositPoints += depositPoints;
            result.borrowPoints += borrowPoints;
        }
        result.nSeconds += nSeconds;
    }

    if (epoch.HasEnded() && baseline.nLastSettledAt < *epoch.nEndTime && nTime >= *epoch.nEndTime) {
        baseline.nLastSettledAt = *epoch.nEndTime;
        GetBalancesAt(store, reserve, userReserve, epoch, *epoch.nEndTime,
                      baseline.lastDepositAmount, baseline.lastBorrowAmount);
    }
    return true;
}

static bool AccrueOrSync(CPointsStore& store, const std::string& user, const std::string& reserveId,
                         int64_t nTime, int64_t nBlock, bool fSkipPointAccrual, CAccrualResult* pResult)
{
    CReserve reserve;
    if (!store.ReadReserve(reserveId, reserve)) {
        LogPrint(BCLog::POINTS, "AccruePointsForUserReserve: unknown reserve %s, skipping\n", reserveId);
        return true;
    }

    CUserReserve userReserve;
    if (!store.ReadUserReserve(user, reserveId, userReserve)) {
        userReserve.SetNull();
        userReserve.user = user;
        userReserve.reserve = reserveId;
    }

    CLeaderboardEpoch epoch;
    if (!points_epoch::GetCurrentEpoch(store, epoch)) {
        epoch.SetNull();
    }

    CUserReservePoints baseline = store.LoadUserReservePoints_OrNew(user, reserveId);
    if (!baseline.HasBaseline()) {
        // Balances present at the first settlement count as held since the epoch start
        GetBalancesAt(store, reserve, userReserve, epoch, nTime, baseline.lastDepositAmount, baseline.lastBorrowAmount);
        const bool fFromEpochStart = !fSkipPointAccrual && epoch.fActive && nTime > epoch.nStartTime;
        baseline.nLastSettledAt = fFromEpochStart ? epoch.nStartTime : nTime;
    }

    CAccrualResult result;
    if (!fSkipPointAccrual) {
        for (const CLeaderboardEpoch& segment : GetSettlementEpochs(store, epoch, baseline.nLastSettledAt)) {
            if (!AccrueEpochSegment(store, user, reserve, userReserve, segment, baseline, nTime, nBlock, result)) {
                return false;
            }
        }
    }

    const int64_t nNext = points_epoch::GetNextBaselineTime(epoch, baseline.nLastSettledAt, nTime);
    GetBalancesAt(store, reserve, userReserve, epoch, nNext, baseline.lastDepositAmount, baseline.lastBorrowAmount);
    baseline.nLastSettledAt = nNext;
    baseline.nLastSettledBlock = nBlock;

    if (!store.WriteUserReservePoints(baseline)) {
        return error("%s: failed to write baseline %s", __func__, MakeUserReserveKey(user, reserveId));
    }

    if (pResult) *pResult = result;
    return true;
}

bool AccruePointsForUserReserve(CPointsStore& store, const std::string& user, const std::string& reserve,
                                int64_t nTime, int64_t nBlock, CAccrualResult* pResult)
{
    return AccrueOrSync(store, user, reserve, nTime, nBlock, false, pResult);
}

bool SyncUserReserveBaseline(CPointsStore& store, const std::string& user, const std::string& reserve,
                             int64_t nTime, int64_t nBlock)
{
    return AccrueOrSync(store, user, reserve, nTime, nBlock, true, nullptr);
}

// ============================================================================
// Voting power and LP
// ============================================================================

bool SettleVotingPowerPoints(CPointsStore& store, const std::string& user, int64_t nTime)
{
    CLeaderboardEpoch epoch;
    if (!points_epoch::GetCurrentEpoch(store, epoch)) {
        epoch.SetNull();
    }

    const CLeaderboardConfig config = store.LoadConfig_OrDefault();
    CUserLeaderboardState state = store.LoadUserLeaderboardState_OrNew(user);
    const int64_t nLastSettled = state.nLastVpSettledAt;

    if (config.nVpRateBps > 0) {
        for (const CLeaderboardEpoch& segment : GetSettlementEpochs(store, epoch, nLastSettled)) {
            int64_t nStart = 0;
            int64_t nEnd = 0;
            if (!points_epoch::GetAccrualWindow(segment, nLastSettled, nTime, nStart, nEnd)) {
                continue;
            }

            CBigInt averageVp = points_voting::GetUserAverageVotingPower(store, user, nStart, nEnd);
            CPoints points = CalculateValuePoints(averageVp, 18, CBigInt(DEFAULT_PRICE_USD_E8),
                                                  config.nVpRateBps, nEnd - nStart);
            if (points <= 0) {
                continue;
            }

            CUserEpochStats stats = store.LoadUserEpochStats_OrNew(user, segment.nEpochNumber, nTime);
            stats.vpPoints += points;
            stats.vpPointsWithMultiplier += points_multiplier::ApplyMultiplier(points, state.nCombinedMultiplierBps);
            stats.nLastAppliedMultiplierBps = state.nCombinedMultiplierBps;
            if (!CommitEpochStats(store, stats, nTime)) {
                return false;
            }

            LogPrint(BCLog::POINTS, "SettleVotingPowerPoints: user=%s epoch=%d averageVp=%s points=%s\n",
                     user, segment.nEpochNumber, averageVp.str(), FormatPoints(points));
        }
    }

    // CommitEpochStats rewrites the leaderboard state
    state = store.LoadUserLeaderboardState_OrNew(user);
    state.nLastVpSettledAt = points_epoch::GetNextBaselineTime(epoch, nLastSettled, nTime);
    if (!store.WriteUserLeaderboardState(state)) {
        return error("%s: failed to write leaderboard state of %s", __func__, user);
    }
    return true;
}

bool SettleLpPoints(CPointsStore& store, const std::string& user, int64_t nTime)
{
    CUserLpPosition position;
    if (!store.ReadUserLpPosition(user, position)) {
        return true;
    }

    CLeaderboardEpoch epoch;
    if (!points_epoch::GetCurrentEpoch(store, epoch)) {
        epoch.SetNull();
    }

    const CLeaderboardConfig config = store.LoadConfig_OrDefault();
    if (config.nLpRateBps > 0 && position.valueUsd > 0) {
        const CUserLeaderboardState state = store.LoadUserLeaderboardState_OrNew(user);
        for (const CLeaderboardEpoch& segment : GetSettlementEpochs(store, epoch, position.nLastSettledAt)) {
            int64_t nStart = 0;
            int64_t nEnd = 0;
            if (!points_epoch::GetAccrualWindow(segment, position.nLastSettledAt, nTime, nStart, nEnd)) {
                continue;
            }

            CPoints points = CalculateUsdPoints(position.valueUsd, config.nLpRateBps, nEnd - nStart);
            if (points <= 0) {
                continue;
            }
            position.lpPoints += points;

            CUserEpochStats stats = store.LoadUserEpochStats_OrNew(user, segment.nEpochNumber, nTime);
            stats.lpPoints += points;
            stats.lpPointsWithMultiplier += points_multiplier::ApplyMultiplier(points, state.nCombinedMultiplierBps);
            stats.nLastAppliedMultiplierBps = state.nCombinedMultiplierBps;
            if (!CommitEpochStats(store, stats, nTime)) {
                return false;
            }
        }
    }

    position.nLastSettledAt = points_epoch::GetNextBaselineTime(epoch, position.nLastSettledAt, nTime);
    if (!store.WriteUserLpPosition(position)) {
        return error("%s: failed to write LP position of %s", __func__, user);
    }
    return true;
}

// ============================================================================
// Settlement
// ============================================================================

bool SettlePointsForUser(CPointsStore& store, const std::string& user, const std::optional<std::string>& eventReserve,
                         int64_t nTime, int64_t nBlock, bool fIgnoreCooldown)
{
    if (!points_voting::RefreshUserMultipliers(store, user, nTime)) {
        return false;
    }

    const CLeaderboardConfig config = store.LoadConfig_OrDefault();
    // Cooldowns only throttle settlement inside an active epoch
    const bool fCooldown = !fIgnoreCooldown && store.LoadLeaderboardState_OrNew().fActive;

    std::vector<std::string> reserves;
    if (!store.ReadUserReserveIds(user, reserves)) {
        reserves.clear();
    }
    if (eventReserve && std::find(reserves.begin(), reserves.end(), *eventReserve) == reserves.end()) {
        reserves.push_back(*eventReserve);
    }

    for (const std::string& reserve : reserves) {
        const bool fEventReserve = eventReserve && *eventReserve == reserve;
        if (!fEventReserve && fCooldown) {
            CUserReservePoints baseline;
            if (store.ReadUserReservePoints(user, reserve, baseline) &&
                IsInCooldown(baseline, config.nCooldownSeconds, nTime)) {
                LogPrint(BCLog::POINTS, "SettlePointsForUser: user=%s reserve=%s in cooldown (last=%lld now=%lld)\n",
                         user, reserve, (long long)baseline.nLastSettledAt, (long long)nTime);
                continue;
            }
        }
        if (!AccruePointsForUserReserve(store, user, reserve, nTime, nBlock)) {
            return false;
        }
    }

    if (!SettleVotingPowerPoints(store, user, nTime)) {
        return false;
    }
    return SettleLpPoints(store, user, nTime);
}

// ============================================================================
// Daily bonuses and manual points
// ============================================================================

bool UpdateDailyHighwater(CPointsStore& store, const std::string& user, DailyAction action,
                          double valueUsd, int64_t nTime)
{
    CLeaderboardEpoch epoch;
    if (!points_epoch::GetActiveEpoch(store, epoch)) {
        return true;
    }

    const int64_t nDay = points_epoch::GetDayIndex(nTime);
    CUserDailyActivity activity = store.LoadUserDailyActivity_OrNew(user, epoch.nEpochNumber, nDay);
    if (std::isfinite(valueUsd) && valueUsd > 0) {
        activity.usdHighwater[action] += valueUsd;
    }
    activity.nUpdatedAt = nTime;

    if (!store.WriteUserDailyActivity(activity)) {
        return error("%s: failed to write activity %s", __func__, MakeUserDayKey(user, epoch.nEpochNumber, nDay));
    }
    return true;
}

bool AwardDailyBonus(CPointsStore& store, const std::string& user, DailyAction action, int64_t nTime)
{
    CLeaderboardEpoch epoch;
    if (!points_epoch::GetActiveEpoch(store, epoch)) {
        return true;
    }

    const CLeaderboardConfig config = store.LoadConfig_OrDefault();
    if (config.dailyBonus[action] <= 0) {
        return true;
    }

    const int64_t nDay = points_epoch::GetDayIndex(nTime);
    CUserEpochStats stats = store.LoadUserEpochStats_OrNew(user, epoch.nEpochNumber, nTime);
    if (stats.nLastBonusDay[action] && *stats.nLastBonusDay[action] == nDay) {
        return true;
    }

    CUserDailyActivity activity;
    if (!store.ReadUserDailyActivity(user, epoch.nEpochNumber, nDay, activity) ||
        activity.usdHighwater[action] < config.nMinDailyBonusUsd) {
        return true;
    }

    stats.dailyBonusPoints[action] += config.dailyBonus[action];
    stats.nLastBonusDay[action] = nDay;

    LogPrint(BCLog::POINTS, "AwardDailyBonus: user=%s action=%s day=%lld bonus=%s\n",
             user, DailyActionName(action), (long long)nDay, FormatPoints(config.dailyBonus[action]));

    return CommitEpochStats(store, stats, nTime);
}

bool AdjustManualPoints(CPointsStore& store, const std::string& user, int nEpoch, const CPoints& delta, int64_t nTime)
{
    if (nEpoch <= 0) {
        nEpoch = store.LoadLeaderboardState_OrNew().nCurrentEpoch;
    }
    CLeaderboardEpoch epoch;
    if (nEpoch <= 0 || !store.ReadEpoch(nEpoch, epoch)) {
        LogPrint(BCLog::POINTS, "AdjustManualPoints: no epoch for user=%s, skipping\n", user);
        return true;
    }

    CUserEpochStats stats = store.LoadUserEpochStats_OrNew(user, nEpoch, nTime);
    stats.manualAwardPoints += delta;

    LogPrint(BCLog::POINTS, "AdjustManualPoints: user=%s epoch=%d delta=%s manual=%s\n",
             user, nEpoch, FormatPoints(delta), FormatPoints(stats.manualAwardPoints));

    return CommitEpochStats(store, stats, nTime);
}

} // namespace points_accrual
