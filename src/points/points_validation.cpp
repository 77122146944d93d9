// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_validation.h"

#include "logging.h"
#include "points/points_accrual.h"
#include "points/points_epoch.h"
#include "points/points_leaderboard.h"
#include "points/points_math.h"
#include "points/points_params.h"
#include "points/points_voting.h"
#include "util/format.h"
#include "util/system.h"

#include <algorithm>
#include <cmath>
#include <vector>

using points_voting::CChainReader;

namespace {

/** Everything a payload handler needs besides its payload */
struct CEventContext
{
    CPointsStore& store;
    const CEventHeader& header;
    CPointsEventState& state;
    CChainReader* pReader;
};

} // namespace

static bool WriteAudit(CEventContext& ctx, AuditKind kind, const std::string& user, const CPoints& amount,
                       const std::string& reason, int64_t nTime)
{
    CPointsAuditRecord record;
    record.id = ctx.header.GetId();
    record.kind = kind;
    record.user = user;
    record.nEpochNumber = ctx.store.LoadLeaderboardState_OrNew().nCurrentEpoch;
    record.amount = amount;
    record.reason = reason;
    record.nTime = nTime;
    record.nBlock = ctx.header.nBlock;

    if (!ctx.store.WriteAuditRecord(record)) {
        return ctx.state.Error(strprintf("audit-write-failed %s", record.id));
    }
    return true;
}

// ============================================================================
// Reserves and interest-bearing tokens
// ============================================================================

static bool ApplyEvent(CEventContext& ctx, const CReserveDataUpdatedEvent& event)
{
    if (event.reserve.empty()) {
        return ctx.state.Invalid("bad-reserve-id");
    }
    if (event.nDecimals && (*event.nDecimals < 0 || *event.nDecimals > 36)) {
        return ctx.state.Invalid("bad-reserve-decimals", strprintf("decimals=%d", *event.nDecimals));
    }

    CReserve reserve;
    if (!ctx.store.ReadReserve(event.reserve, reserve)) {
        reserve.SetNull();
        reserve.id = event.reserve;
    }
    if (event.symbol) reserve.symbol = *event.symbol;
    if (event.nDecimals) reserve.nDecimals = *event.nDecimals;
    if (event.priceUsdE8) reserve.priceUsdE8 = *event.priceUsdE8;
    reserve.liquidityRate = event.liquidityRate;
    reserve.variableBorrowRate = event.variableBorrowRate;
    reserve.liquidityIndex = event.liquidityIndex;
    reserve.variableBorrowIndex = event.variableBorrowIndex;
    reserve.nLastUpdateTimestamp = ctx.header.nTime;

    if (!ctx.store.WriteReserve(reserve)) {
        return ctx.state.Error(strprintf("reserve-write-failed %s", event.reserve));
    }

    LogPrint(BCLog::EVENTS, "ReserveDataUpdated: reserve=%s liquidityIndex=%s borrowIndex=%s\n",
             reserve.id, reserve.liquidityIndex.str(), reserve.variableBorrowIndex.str());
    return true;
}

static bool AddUserReserve(CPointsStore& store, const std::string& user, const std::string& reserve)
{
    std::vector<std::string> reserves;
    if (!store.ReadUserReserveIds(user, reserves)) {
        reserves.clear();
    }
    if (std::find(reserves.begin(), reserves.end(), reserve) != reserves.end()) {
        return true;
    }
    reserves.push_back(reserve);
    return store.WriteUserReserveIds(user, reserves);
}

enum BalanceSide {
    SIDE_DEPOSIT,
    SIDE_BORROW,
};

/**
 * ApplyBalanceDelta - Settle a user, then move one scaled balance
 *
 * The delta is scaled with the live index of the side being changed and
 * the balance clamps at zero. The reserve is re-baselined without accrual.
 */
static bool ApplyBalanceDelta(CEventContext& ctx, const std::string& user, const CReserve& reserve,
                              BalanceSide side, const CBigInt& amount, bool fIncrease)
{
    CPointsStore& store = ctx.store;
    const int64_t nTime = ctx.header.nTime;
    const int64_t nBlock = ctx.header.nBlock;

    if (!AddUserReserve(store, user, reserve.id)) {
        return ctx.state.Error(strprintf("user-reserves-write-failed %s", user));
    }
    if (!points_accrual::SettlePointsForUser(store, user, reserve.id, nTime, nBlock)) {
        return ctx.state.Error(strprintf("settle-failed %s", user));
    }

    CUserReserve userReserve;
    if (!store.ReadUserReserve(user, reserve.id, userReserve)) {
        userReserve.SetNull();
        userReserve.user = user;
        userReserve.reserve = reserve.id;
    }

    CBigInt index;
    if (side == SIDE_DEPOSIT) {
        index = points_math::GetNormalizedIncome(reserve.liquidityIndex, reserve.liquidityRate,
                                                 reserve.nLastUpdateTimestamp, nTime);
    } else {
        index = points_math::GetNormalizedVariableDebt(reserve.variableBorrowIndex, reserve.variableBorrowRate,
                                                       reserve.nLastUpdateTimestamp, nTime);
    }
    const CBigInt scaled = points_math::RayDiv(amount, index);

    CBigInt& balance = side == SIDE_DEPOSIT ? userReserve.scaledATokenBalance : userReserve.scaledVariableDebt;
    if (fIncrease) {
        balance += scaled;
    } else {
        balance = std::max<CBigInt>(balance - scaled, 0);
    }
    userReserve.nLastUpdateTimestamp = nTime;

    if (!store.WriteUserReserve(userReserve)) {
        return ctx.state.Error(strprintf("user-reserve-write-failed %s", MakeUserReserveKey(user, reserve.id)));
    }
    if (!points_accrual::SyncUserReserveBaseline(store, user, reserve.id, nTime, nBlock)) {
        return ctx.state.Error(strprintf("baseline-sync-failed %s", MakeUserReserveKey(user, reserve.id)));
    }
    return true;
}

static bool ApplyReserveBalanceEvent(CEventContext& ctx, const CReserveBalanceEvent& event,
                                     BalanceSide side, bool fIncrease, DailyAction action)
{
    if (event.reserve.empty()) {
        return ctx.state.Invalid("bad-reserve-id");
    }
    if (event.amount < 0) {
        return ctx.state.Invalid("bad-amount", event.amount.str());
    }
    if (IsNullAddress(event.user)) {
        LogPrint(BCLog::EVENTS, "%s: null user, skipping\n", DailyActionName(action));
        return true;
    }

    CReserve reserve;
    if (!ctx.store.ReadReserve(event.reserve, reserve)) {
        LogPrint(BCLog::EVENTS, "%s: unknown reserve %s, skipping\n", DailyActionName(action), event.reserve);
        return true;
    }

    if (!ApplyBalanceDelta(ctx, event.user, reserve, side, event.amount, fIncrease)) {
        return false;
    }

    const double valueUsd = points_accrual::AmountToUsd(event.amount, reserve.nDecimals, reserve.GetPriceUsdE8());
    if (!points_accrual::UpdateDailyHighwater(ctx.store, event.user, action, valueUsd, ctx.header.nTime) ||
        !points_accrual::AwardDailyBonus(ctx.store, event.user, action, ctx.header.nTime)) {
        return ctx.state.Error(strprintf("daily-bonus-failed %s", event.user));
    }

    LogPrint(BCLog::EVENTS, "%s: user=%s reserve=%s amount=%s usd=%.2f\n",
             DailyActionName(action), event.user, event.reserve, event.amount.str(), valueUsd);
    return true;
}

static bool ApplyEvent(CEventContext& ctx, const CSupplyEvent& event)
{
    return ApplyReserveBalanceEvent(ctx, event, SIDE_DEPOSIT, true, DAILY_SUPPLY);
}

static bool ApplyEvent(CEventContext& ctx, const CWithdrawEvent& event)
{
    return ApplyReserveBalanceEvent(ctx, event, SIDE_DEPOSIT, false, DAILY_WITHDRAW);
}

static bool ApplyEvent(CEventContext& ctx, const CBorrowEvent& event)
{
    return ApplyReserveBalanceEvent(ctx, event, SIDE_BORROW, true, DAILY_BORROW);
}

static bool ApplyEvent(CEventContext& ctx, const CRepayEvent& event)
{
    return ApplyReserveBalanceEvent(ctx, event, SIDE_BORROW, false, DAILY_REPAY);
}

static bool ApplyEvent(CEventContext& ctx, const CBalanceTransferEvent& event)
{
    if (event.reserve.empty()) {
        return ctx.state.Invalid("bad-reserve-id");
    }
    if (event.amount < 0) {
        return ctx.state.Invalid("bad-amount", event.amount.str());
    }
    if (event.from == event.to) {
        return true;
    }

    CReserve reserve;
    if (!ctx.store.ReadReserve(event.reserve, reserve)) {
        LogPrint(BCLog::EVENTS, "BalanceTransfer: unknown reserve %s, skipping\n", event.reserve);
        return true;
    }

    if (!IsNullAddress(event.from) && !ApplyBalanceDelta(ctx, event.from, reserve, SIDE_DEPOSIT, event.amount, false)) {
        return false;
    }
    if (!IsNullAddress(event.to) && !ApplyBalanceDelta(ctx, event.to, reserve, SIDE_DEPOSIT, event.amount, true)) {
        return false;
    }

    LogPrint(BCLog::EVENTS, "BalanceTransfer: reserve=%s from=%s to=%s amount=%s\n",
             event.reserve, event.from, event.to, event.amount.str());
    return true;
}

// ============================================================================
// LP, veNFT and partner NFTs
// ============================================================================

static bool ApplyEvent(CEventContext& ctx, const CLpPositionUpdatedEvent& event)
{
    if (IsNullAddress(event.user)) {
        return ctx.state.Invalid("bad-user");
    }
    if (!std::isfinite(event.valueUsd) || event.valueUsd < 0) {
        return ctx.state.Invalid("bad-lp-value", strprintf("%f", event.valueUsd));
    }

    const int64_t nTime = ctx.header.nTime;
    if (!points_accrual::SettlePointsForUser(ctx.store, event.user, std::nullopt, nTime, ctx.header.nBlock)) {
        return ctx.state.Error(strprintf("settle-failed %s", event.user));
    }

    CUserLpPosition position;
    if (!ctx.store.ReadUserLpPosition(event.user, position)) {
        position.user = event.user;
        position.nLastSettledAt = nTime;
    }
    position.valueUsd = event.valueUsd;

    if (!ctx.store.WriteUserLpPosition(position)) {
        return ctx.state.Error(strprintf("lp-write-failed %s", event.user));
    }
    return true;
}

/** Settle every listed user, then apply a change, then refresh their multipliers */
template <typename Fn>
static bool WithSettledUsers(CEventContext& ctx, const std::vector<std::string>& users, Fn apply)
{
    const int64_t nTime = ctx.header.nTime;

    for (const std::string& user : users) {
        if (IsNullAddress(user)) continue;
        if (!points_accrual::SettlePointsForUser(ctx.store, user, std::nullopt, nTime, ctx.header.nBlock)) {
            return ctx.state.Error(strprintf("settle-failed %s", user));
        }
    }

    if (!apply()) {
        return ctx.state.Error("apply-failed");
    }

    for (const std::string& user : users) {
        if (IsNullAddress(user)) continue;
        if (!points_voting::RefreshUserMultipliers(ctx.store, user, nTime)) {
            return ctx.state.Error(strprintf("multiplier-refresh-failed %s", user));
        }
    }
    return true;
}

static bool ApplyEvent(CEventContext& ctx, const CLockDepositEvent& event)
{
    if (event.tokenId.empty()) {
        return ctx.state.Invalid("bad-token-id");
    }
    if (event.amount < 0) {
        return ctx.state.Invalid("bad-amount", event.amount.str());
    }

    std::string owner = event.owner;
    if (IsNullAddress(owner)) {
        owner = points_voting::GetLockOwner(ctx.store, event.tokenId);
    }
    if (IsNullAddress(owner)) {
        LogPrint(BCLog::EVENTS, "LockDeposit: no owner for lock %s, skipping\n", event.tokenId);
        return true;
    }

    const std::string previousOwner = points_voting::GetLockOwner(ctx.store, event.tokenId);
    return WithSettledUsers(ctx, {owner, previousOwner}, [&]() {
        return points_voting::ApplyLockDeposit(ctx.store, event.tokenId, owner, event.amount, event.nLockEnd,
                                               ctx.header.nTime);
    });
}

static bool ApplyEvent(CEventContext& ctx, const CLockWithdrawEvent& event)
{
    const std::string owner = points_voting::GetLockOwner(ctx.store, event.tokenId);
    if (owner.empty()) {
        LogPrint(BCLog::EVENTS, "LockWithdraw: unknown lock %s, skipping\n", event.tokenId);
        return true;
    }
    return WithSettledUsers(ctx, {owner}, [&]() {
        return points_voting::ApplyLockWithdraw(ctx.store, event.tokenId, ctx.header.nTime);
    });
}

static bool ApplyEvent(CEventContext& ctx, const CLockPermanentEvent& event)
{
    const std::string owner = points_voting::GetLockOwner(ctx.store, event.tokenId);
    if (owner.empty()) {
        LogPrint(BCLog::EVENTS, "LockPermanent: unknown lock %s, skipping\n", event.tokenId);
        return true;
    }
    return WithSettledUsers(ctx, {owner}, [&]() {
        return points_voting::ApplyLockPermanent(ctx.store, event.tokenId, event.fPermanent, ctx.header.nTime);
    });
}

static bool ApplyEvent(CEventContext& ctx, const CLockTransferEvent& event)
{
    const std::string owner = points_voting::GetLockOwner(ctx.store, event.tokenId);
    if (owner.empty()) {
        LogPrint(BCLog::EVENTS, "LockTransfer: unknown lock %s, skipping\n", event.tokenId);
        return true;
    }
    return WithSettledUsers(ctx, {owner, event.to}, [&]() {
        return points_voting::ApplyLockTransfer(ctx.store, event.tokenId, event.to, ctx.header.nTime);
    });
}

static bool ApplyEvent(CEventContext& ctx, const CNftTransferEvent& event)
{
    if (event.collection.empty()) {
        return ctx.state.Invalid("bad-collection");
    }
    if (event.nCount <= 0) {
        return ctx.state.Invalid("bad-nft-count", strprintf("count=%lld", (long long)event.nCount));
    }
    return WithSettledUsers(ctx, {event.from, event.to}, [&]() {
        return points_voting::ApplyNftTransfer(ctx.store, event.collection, event.from, event.to, event.nCount,
                                               ctx.pReader, ctx.header.nTime);
    });
}

// ============================================================================
// Admin
// ============================================================================

static bool ApplyEvent(CEventContext& ctx, const CConfigSnapshotEvent& event)
{
    CLeaderboardConfig config = event.config;
    config.nUpdatedAt = ctx.header.nTime;
    if (!ctx.store.WriteConfig(config)) {
        return ctx.state.Error("config-write-failed");
    }

    LogPrint(BCLog::EVENTS, "ConfigSnapshot: deposit=%u borrow=%u vp=%u lp=%u cooldown=%lld minDailyUsd=%.2f\n",
             config.nDepositRateBps, config.nBorrowRateBps, config.nVpRateBps, config.nLpRateBps,
             (long long)config.nCooldownSeconds, config.nMinDailyBonusUsd);
    return WriteAudit(ctx, AUDIT_CONFIG, std::string(), 0, "config snapshot", ctx.header.nTime);
}

static bool ApplyEvent(CEventContext& ctx, const CVotingPowerTierSetEvent& event)
{
    if (event.tier.nIndex < 0 || event.tier.nIndex >= (int)MAX_VP_TIERS) {
        return ctx.state.Invalid("bad-tier-index", strprintf("index=%d", event.tier.nIndex));
    }
    if (event.tier.minVotingPower < 0 || event.tier.nMultiplierBps < BASE_MULTIPLIER_BPS) {
        return ctx.state.Invalid("bad-tier");
    }
    if (!ctx.store.WriteVotingPowerTier(event.tier)) {
        return ctx.state.Error("tier-write-failed");
    }

    LogPrint(BCLog::EVENTS, "VotingPowerTierSet: index=%d min=%s multiplier=%u active=%d\n",
             event.tier.nIndex, event.tier.minVotingPower.str(), event.tier.nMultiplierBps, event.tier.fActive);
    return WriteAudit(ctx, AUDIT_CONFIG, std::string(), 0, strprintf("tier %d", event.tier.nIndex), ctx.header.nTime);
}

static bool ApplyEvent(CEventContext& ctx, const CNftPartnershipSetEvent& event)
{
    if (event.partnership.collection.empty()) {
        return ctx.state.Invalid("bad-collection");
    }
    if (!ctx.store.WriteNftPartnership(event.partnership)) {
        return ctx.state.Error("partnership-write-failed");
    }

    LogPrint(BCLog::EVENTS, "NftPartnershipSet: collection=%s active=%d\n",
             event.partnership.collection, event.partnership.fActive);
    return WriteAudit(ctx, AUDIT_CONFIG, std::string(), 0,
                      strprintf("partnership %s", event.partnership.collection), ctx.header.nTime);
}

static bool ApplyEvent(CEventContext& ctx, const CEpochStartEvent& event)
{
    if (event.nEpoch <= 0) {
        return ctx.state.Invalid("bad-epoch-number", strprintf("epoch=%d", event.nEpoch));
    }
    if (!points_epoch::ScheduleEpochStart(ctx.store, event.nEpoch, event.nStartTime, ctx.header.nTime,
                                          ctx.header.nBlock)) {
        return ctx.state.Error(strprintf("epoch-start-failed %d", event.nEpoch));
    }
    return WriteAudit(ctx, AUDIT_EPOCH, std::string(), 0, strprintf("epoch %d start", event.nEpoch), ctx.header.nTime);
}

static bool ApplyEvent(CEventContext& ctx, const CEpochEndEvent& event)
{
    if (event.nEpoch <= 0) {
        return ctx.state.Invalid("bad-epoch-number", strprintf("epoch=%d", event.nEpoch));
    }
    if (!points_epoch::ScheduleEpochEnd(ctx.store, event.nEpoch, event.nEndTime, ctx.header.nTime,
                                        ctx.header.nBlock)) {
        return ctx.state.Error(strprintf("epoch-end-failed %d", event.nEpoch));
    }
    return WriteAudit(ctx, AUDIT_EPOCH, std::string(), 0, strprintf("epoch %d end", event.nEpoch), ctx.header.nTime);
}

static bool ApplyManualPoints(CEventContext& ctx, const CManualPointsEvent& event, bool fAward)
{
    if (IsNullAddress(event.user)) {
        return ctx.state.Invalid("bad-user");
    }
    if (event.points < 0) {
        return ctx.state.Invalid("bad-points", FormatPoints(event.points));
    }

    CPointsAuditRecord existing;
    if (ctx.store.ReadAuditRecord(ctx.header.GetId(), existing)) {
        LogPrint(BCLog::EVENTS, "ManualPoints: %s already recorded\n", ctx.header.GetId());
        return true;
    }

    const int64_t nTime = event.nTimestamp.value_or(ctx.header.nTime);
    const CPoints delta = fAward ? event.points : CPoints(-event.points);

    if (!points_accrual::AdjustManualPoints(ctx.store, event.user, 0, delta, nTime)) {
        return ctx.state.Error(strprintf("manual-points-failed %s", event.user));
    }

    LogPrint(BCLog::EVENTS, "ManualPoints: user=%s delta=%s reason=%s\n", event.user, FormatPoints(delta), event.reason);
    return WriteAudit(ctx, fAward ? AUDIT_MANUAL_AWARD : AUDIT_MANUAL_REMOVAL, event.user, delta, event.reason, nTime);
}

static bool ApplyEvent(CEventContext& ctx, const CManualPointsAwardEvent& event)
{
    return ApplyManualPoints(ctx, event, true);
}

static bool ApplyEvent(CEventContext& ctx, const CManualPointsRemovalEvent& event)
{
    return ApplyManualPoints(ctx, event, false);
}

static bool ApplyEvent(CEventContext& ctx, const CUserBlacklistEvent& event)
{
    if (IsNullAddress(event.user)) {
        return ctx.state.Invalid("bad-user");
    }

    CPointsStore& store = ctx.store;
    const int64_t nTime = ctx.header.nTime;

    CUserLeaderboardState userState = store.LoadUserLeaderboardState_OrNew(event.user);
    userState.fBlacklisted = event.fBlacklisted;
    userState.nLastUpdatedAt = nTime;
    if (!store.WriteUserLeaderboardState(userState)) {
        return ctx.state.Error(strprintf("leaderboard-state-write-failed %s", event.user));
    }

    if (event.fBlacklisted) {
        if (!points_leaderboard::RemoveUserFromLeaderboards(store, event.user, nTime)) {
            return ctx.state.Error(strprintf("leaderboard-remove-failed %s", event.user));
        }
    } else {
        // Re-rank from the stored totals
        const CLeaderboardState lbState = store.LoadLeaderboardState_OrNew();
        CUserEpochStats stats;
        if (lbState.nCurrentEpoch > 0 && store.ReadUserEpochStats(event.user, lbState.nCurrentEpoch, stats)) {
            if (!points_leaderboard::UpdateLeaderboard(store, event.user,
                                                       PointsToDouble(stats.totalPointsWithMultiplier), nTime)) {
                return ctx.state.Error(strprintf("leaderboard-update-failed %s", event.user));
            }
        }
        if (!points_accrual::UpdateLifetimePoints(store, event.user, nTime)) {
            return ctx.state.Error(strprintf("lifetime-update-failed %s", event.user));
        }
    }

    LogPrint(BCLog::EVENTS, "UserBlacklist: user=%s blacklisted=%d\n", event.user, event.fBlacklisted);
    return WriteAudit(ctx, AUDIT_BLACKLIST, event.user, 0, event.fBlacklisted ? "blacklisted" : "unblacklisted", nTime);
}

static bool ApplyEvent(CEventContext& ctx, const CSettlePointsEvent& event)
{
    if (IsNullAddress(event.user)) {
        return ctx.state.Invalid("bad-user");
    }
    if (!points_accrual::SettlePointsForUser(ctx.store, event.user, std::nullopt, ctx.header.nTime,
                                             ctx.header.nBlock, event.fIgnoreCooldown)) {
        return ctx.state.Error(strprintf("settle-failed %s", event.user));
    }
    return true;
}

// ============================================================================
// Dispatcher
// ============================================================================

bool ProcessPointsEvent(CPointsStore& store, const CPointsEvent& event, CPointsEventState& state,
                        CChainReader* pReader)
{
    const CEventHeader& header = event.header;
    const std::string strId = header.GetId();
    const std::string strName = event.GetName();

    if (header.txHash.empty()) {
        return state.Invalid("bad-event-id", strName);
    }
    if (header.nTime <= 0 || header.nBlock < 0) {
        return state.Invalid("bad-event-position", strprintf("%s block=%lld time=%lld", strId,
                                                             (long long)header.nBlock, (long long)header.nTime));
    }

    if (store.ExistsProcessedEvent(strId)) {
        LogPrint(BCLog::EVENTS, "ProcessPointsEvent: %s %s already processed, skipping\n", strName, strId);
        return true;
    }

    LogPrint(BCLog::EVENTS, "ProcessPointsEvent: %s id=%s block=%lld time=%lld\n",
             strName, strId, (long long)header.nBlock, (long long)header.nTime);

    int nTransitions = 0;
    if (!points_epoch::ApplyScheduledEpochTransitions(store, header.nTime, header.nBlock, &nTransitions)) {
        return state.Error("epoch-transition-failed");
    }

    CEventContext ctx{store, header, state, pReader};
    const bool fApplied = std::visit([&ctx](const auto& payload) { return ApplyEvent(ctx, payload); }, event.payload);
    if (!fApplied) {
        if (state.IsValid()) {
            return state.Error(strprintf("%s-failed", strName));
        }
        LogPrint(BCLog::EVENTS, "ProcessPointsEvent: %s %s rejected: %s\n", strName, strId, state.ToString());
        return false;
    }

    if (!store.WriteProcessedEvent(strId)) {
        return state.Error(strprintf("processed-marker-write-failed %s", strId));
    }
    return true;
}
