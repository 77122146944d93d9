// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_STATE_H
#define POINTSD_POINTS_STATE_H

#include "points/points_amount.h"
#include "points/points_params.h"

#include <optional>
#include <stdint.h>
#include <string>
#include <vector>

/**
 * Derived state entities
 *
 * Every entity is addressed by a deterministic string key (see
 * points_store.h) so that replaying an event upserts the same records.
 * Optional fields are std::optional; each has exactly one accessor that
 * resolves the fallback.
 */

// ============================================================================
// Reserves and balances
// ============================================================================

/** Lending reserve: interest indices (ray), rates (ray) and oracle price */
struct CReserve
{
    std::string id;
    std::string symbol;
    int nDecimals;

    CBigInt liquidityIndex;
    CBigInt liquidityRate;
    CBigInt variableBorrowIndex;
    CBigInt variableBorrowRate;
    int64_t nLastUpdateTimestamp;

    std::optional<CBigInt> priceUsdE8;

    CReserve() { SetNull(); }

    void SetNull()
    {
        id.clear();
        symbol.clear();
        nDecimals = DEFAULT_RESERVE_DECIMALS;
        liquidityIndex = 0;
        liquidityRate = 0;
        variableBorrowIndex = 0;
        variableBorrowRate = 0;
        nLastUpdateTimestamp = 0;
        priceUsdE8.reset();
    }

    bool IsNull() const { return id.empty(); }

    /** Oracle price, 1.0 USD when the reserve has never been priced */
    CBigInt GetPriceUsdE8() const { return priceUsdE8 ? *priceUsdE8 : CBigInt(DEFAULT_PRICE_USD_E8); }
};

/** Scaled (index-independent) balances of one user in one reserve */
struct CUserReserve
{
    std::string user;
    std::string reserve;
    CBigInt scaledATokenBalance;
    CBigInt scaledVariableDebt;
    int64_t nLastUpdateTimestamp;

    CUserReserve() { SetNull(); }

    void SetNull()
    {
        user.clear();
        reserve.clear();
        scaledATokenBalance = 0;
        scaledVariableDebt = 0;
        nLastUpdateTimestamp = 0;
    }

    bool IsNull() const { return user.empty(); }
};

/**
 * CUserReservePoints - Accrual baseline of one (user, reserve)
 *
 * INVARIANTS:
 * - nLastSettledAt never moves backwards
 * - deposit/borrow amounts are the token amounts (raw units) held since nLastSettledAt
 */
struct CUserReservePoints
{
    std::string user;
    std::string reserve;

    CBigInt lastDepositAmount;
    CBigInt lastBorrowAmount;
    int64_t nLastSettledAt;
    int64_t nLastSettledBlock;

    CPoints depositPoints;
    CPoints borrowPoints;

    CUserReservePoints() { SetNull(); }

    void SetNull()
    {
        user.clear();
        reserve.clear();
        lastDepositAmount = 0;
        lastBorrowAmount = 0;
        nLastSettledAt = 0;
        nLastSettledBlock = 0;
        depositPoints = 0;
        borrowPoints = 0;
    }

    bool IsNull() const { return user.empty(); }

    bool HasBaseline() const { return nLastSettledAt > 0; }
};

// ============================================================================
// Epochs and configuration
// ============================================================================

struct CLeaderboardEpoch
{
    int nEpochNumber;
    int64_t nStartBlock;
    int64_t nStartTime;
    std::optional<int64_t> nEndBlock;
    std::optional<int64_t> nEndTime;
    bool fActive;
    std::optional<int64_t> nScheduledStartTime;
    std::optional<int64_t> nScheduledEndTime;

    CLeaderboardEpoch() { SetNull(); }

    void SetNull()
    {
        nEpochNumber = 0;
        nStartBlock = 0;
        nStartTime = 0;
        nEndBlock.reset();
        nEndTime.reset();
        fActive = false;
        nScheduledStartTime.reset();
        nScheduledEndTime.reset();
    }

    bool IsNull() const { return nEpochNumber == 0; }

    /** Started epochs have a start time; scheduled-only epochs do not */
    bool HasStarted() const { return nStartTime > 0; }

    bool HasEnded() const { return !fActive && nEndTime.has_value(); }

    /** End of the scoring window: the recorded end, or nTime while still running */
    int64_t GetEndTimeOr(int64_t nTime) const { return nEndTime ? *nEndTime : nTime; }
};

/** Singleton "current" pointer to the epoch being scored */
struct CLeaderboardState
{
    int nCurrentEpoch;
    bool fActive;
    int nGlobalMirrorEpoch;
    int64_t nUpdatedAt;

    CLeaderboardState() { SetNull(); }

    void SetNull()
    {
        nCurrentEpoch = 0;
        fActive = false;
        nGlobalMirrorEpoch = 0;
        nUpdatedAt = 0;
    }

    bool IsNull() const { return nCurrentEpoch == 0 && nUpdatedAt == 0; }
};

/** Daily bonus actions, also the index into the per-action arrays */
enum DailyAction : int {
    DAILY_SUPPLY = 0,
    DAILY_BORROW = 1,
    DAILY_REPAY = 2,
    DAILY_WITHDRAW = 3,
    DAILY_ACTION_COUNT = 4,
};

const char* DailyActionName(DailyAction action);

/** Global scoring parameters, replaced wholesale by admin snapshots */
struct CLeaderboardConfig
{
    uint32_t nDepositRateBps;
    uint32_t nBorrowRateBps;
    uint32_t nVpRateBps;
    uint32_t nLpRateBps;

    CPoints dailyBonus[DAILY_ACTION_COUNT];
    double nMinDailyBonusUsd;

    int64_t nCooldownSeconds;

    uint32_t nNftFirstBonusBps;
    uint32_t nNftDecayRatioBps;

    int64_t nUpdatedAt;

    CLeaderboardConfig() { SetNull(); }

    void SetNull()
    {
        nDepositRateBps = DEFAULT_DEPOSIT_RATE_BPS;
        nBorrowRateBps = DEFAULT_BORROW_RATE_BPS;
        nVpRateBps = DEFAULT_VP_RATE_BPS;
        nLpRateBps = DEFAULT_LP_RATE_BPS;
        for (int i = 0; i < DAILY_ACTION_COUNT; ++i) {
            dailyBonus[i] = 0;
        }
        nMinDailyBonusUsd = 0;
        nCooldownSeconds = DEFAULT_COOLDOWN_SECONDS;
        nNftFirstBonusBps = DEFAULT_NFT_FIRST_BONUS_BPS;
        nNftDecayRatioBps = DEFAULT_NFT_DECAY_RATIO_BPS;
        nUpdatedAt = 0;
    }
};

/** Reserve indices frozen at an epoch's end time */
struct CEpochEndSnapshot
{
    int nEpochNumber;
    std::string reserve;
    CBigInt liquidityIndex;
    CBigInt variableBorrowIndex;
    int64_t nTime;

    CEpochEndSnapshot() { SetNull(); }

    void SetNull()
    {
        nEpochNumber = 0;
        reserve.clear();
        liquidityIndex = 0;
        variableBorrowIndex = 0;
        nTime = 0;
    }

    bool IsNull() const { return reserve.empty(); }
};

// ============================================================================
// Per-user points
// ============================================================================

/**
 * CUserEpochStats - Running totals of one user in one epoch
 *
 * totalPoints sums every raw component; totalPointsWithMultiplier sums the
 * multiplier-applied components. Daily bonuses and manual points are never
 * multiplied and count the same in both totals.
 */
struct CUserEpochStats
{
    std::string user;
    int nEpochNumber;

    CPoints depositPoints;
    CPoints depositPointsWithMultiplier;
    CPoints borrowPoints;
    CPoints borrowPointsWithMultiplier;
    CPoints lpPoints;
    CPoints lpPointsWithMultiplier;
    CPoints vpPoints;
    CPoints vpPointsWithMultiplier;

    CPoints dailyBonusPoints[DAILY_ACTION_COUNT];
    std::optional<int64_t> nLastBonusDay[DAILY_ACTION_COUNT];

    CPoints manualAwardPoints;

    CPoints totalPoints;
    CPoints totalPointsWithMultiplier;

    uint32_t nLastAppliedMultiplierBps;
    int64_t nFirstSeenAt;
    int64_t nLastUpdatedAt;

    CUserEpochStats() { SetNull(); }

    void SetNull()
    {
        user.clear();
        nEpochNumber = 0;
        depositPoints = 0;
        depositPointsWithMultiplier = 0;
        borrowPoints = 0;
        borrowPointsWithMultiplier = 0;
        lpPoints = 0;
        lpPointsWithMultiplier = 0;
        vpPoints = 0;
        vpPointsWithMultiplier = 0;
        for (int i = 0; i < DAILY_ACTION_COUNT; ++i) {
            dailyBonusPoints[i] = 0;
            nLastBonusDay[i].reset();
        }
        manualAwardPoints = 0;
        totalPoints = 0;
        totalPointsWithMultiplier = 0;
        nLastAppliedMultiplierBps = BASE_MULTIPLIER_BPS;
        nFirstSeenAt = 0;
        nLastUpdatedAt = 0;
    }

    bool IsNull() const { return user.empty(); }

    /** Recompute both totals from the components */
    void RecomputeTotals();
};

/** USD volume per action of one user on one UTC day */
struct CUserDailyActivity
{
    std::string user;
    int nEpochNumber;
    int64_t nDay;
    double usdHighwater[DAILY_ACTION_COUNT];
    int64_t nUpdatedAt;

    CUserDailyActivity() { SetNull(); }

    void SetNull()
    {
        user.clear();
        nEpochNumber = 0;
        nDay = 0;
        for (int i = 0; i < DAILY_ACTION_COUNT; ++i) {
            usdHighwater[i] = 0;
        }
        nUpdatedAt = 0;
    }

    bool IsNull() const { return user.empty(); }
};

/** Denormalized multiplier inputs and lifetime totals, one row per user */
struct CUserLeaderboardState
{
    std::string user;

    uint32_t nNftCount;
    uint32_t nNftMultiplierBps;
    CBigInt votingPower;
    int nVpTierIndex;
    uint32_t nVpMultiplierBps;
    uint32_t nCombinedMultiplierBps;

    CPoints lifetimePoints;
    std::vector<int> vEpochsParticipated;

    bool fBlacklisted;
    int64_t nLastVpSettledAt;
    int64_t nLastUpdatedAt;

    CUserLeaderboardState() { SetNull(); }

    void SetNull()
    {
        user.clear();
        nNftCount = 0;
        nNftMultiplierBps = BASE_MULTIPLIER_BPS;
        votingPower = 0;
        nVpTierIndex = -1;
        nVpMultiplierBps = BASE_MULTIPLIER_BPS;
        nCombinedMultiplierBps = BASE_MULTIPLIER_BPS;
        lifetimePoints = 0;
        vEpochsParticipated.clear();
        fBlacklisted = false;
        nLastVpSettledAt = 0;
        nLastUpdatedAt = 0;
    }

    bool IsNull() const { return user.empty(); }

    /** Record participation in an epoch, return true if it was new */
    bool AddEpoch(int nEpoch);
};

// ============================================================================
// Voting power and ownership
// ============================================================================

struct CVotingPowerTier
{
    int nIndex;
    CBigInt minVotingPower;
    uint32_t nMultiplierBps;
    bool fActive;

    CVotingPowerTier() : nIndex(0), minVotingPower(0), nMultiplierBps(BASE_MULTIPLIER_BPS), fActive(false) {}
};

struct CNftPartnership
{
    std::string collection;
    std::string name;
    bool fActive;

    CNftPartnership() : fActive(false) {}

    bool IsNull() const { return collection.empty(); }
};

struct CUserNftOwnership
{
    std::string user;
    std::string collection;
    int64_t nBalance;
    int64_t nUpdatedAt;

    CUserNftOwnership() : nBalance(0), nUpdatedAt(0) {}

    bool IsNull() const { return user.empty(); }
};

/** veNFT lock */
struct CVeLock
{
    std::string tokenId;
    std::string owner;
    CBigInt lockedAmount;
    int64_t nLockEnd;
    bool fPermanent;
    int64_t nUpdatedAt;

    CVeLock() : lockedAmount(0), nLockEnd(0), fPermanent(false), nUpdatedAt(0) {}

    bool IsNull() const { return tokenId.empty(); }
};

struct CUserLpPosition
{
    std::string user;
    double valueUsd;
    int64_t nLastSettledAt;
    CPoints lpPoints;

    CUserLpPosition() : valueUsd(0), nLastSettledAt(0), lpPoints(0) {}

    bool IsNull() const { return user.empty(); }
};

// ============================================================================
// Ranking
// ============================================================================

/** Score and bucket of a user in one scope, nBucketIndex is -1 for a zero score */
struct CUserIndex
{
    std::string id;
    std::string user;
    int nEpochNumber;
    double points;
    int nBucketIndex;
    int64_t nUpdatedAt;

    CUserIndex() : nEpochNumber(0), points(0), nBucketIndex(-1), nUpdatedAt(0) {}

    bool IsNull() const { return id.empty(); }
};

struct CScoreBucket
{
    std::string id;
    int nEpochNumber;
    int nIndex;
    double lower;
    double upper;
    int32_t nCount;
    int64_t nUpdatedAt;

    CScoreBucket() : nEpochNumber(0), nIndex(0), lower(0), upper(0), nCount(0), nUpdatedAt(0) {}

    bool IsNull() const { return id.empty(); }
};

struct CTopKEntry
{
    std::string user;
    double points;
    int nRank;

    CTopKEntry() : points(0), nRank(0) {}
    CTopKEntry(const std::string& userIn, double pointsIn) : user(userIn), points(pointsIn), nRank(0) {}
};

/** Ordered top list of a scope, sorted by points desc then user asc */
struct CTopK
{
    std::string id;
    int nEpochNumber;
    std::vector<CTopKEntry> vEntries;
    int64_t nUpdatedAt;

    CTopK() : nEpochNumber(0), nUpdatedAt(0) {}

    bool IsNull() const { return id.empty(); }
};

struct CLeaderboardTotals
{
    std::string id;
    int nEpochNumber;
    int32_t nUsersWithPoints;
    int64_t nUpdatedAt;

    CLeaderboardTotals() : nEpochNumber(0), nUsersWithPoints(0), nUpdatedAt(0) {}

    bool IsNull() const { return id.empty(); }
};

// ============================================================================
// Audit
// ============================================================================

enum AuditKind : int {
    AUDIT_MANUAL_AWARD = 0,
    AUDIT_MANUAL_REMOVAL = 1,
    AUDIT_CONFIG = 2,
    AUDIT_BLACKLIST = 3,
    AUDIT_EPOCH = 4,
};

struct CPointsAuditRecord
{
    std::string id;
    AuditKind kind;
    std::string user;
    int nEpochNumber;
    CPoints amount;
    std::string reason;
    int64_t nTime;
    int64_t nBlock;

    CPointsAuditRecord() : kind(AUDIT_MANUAL_AWARD), nEpochNumber(0), amount(0), nTime(0), nBlock(0) {}

    bool IsNull() const { return id.empty(); }
};

#endif // POINTSD_POINTS_STATE_H
