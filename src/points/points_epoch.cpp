// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_epoch.h"

#include "logging.h"
#include "points/points_math.h"
#include "points/points_params.h"
#include "points/points_ranking.h"
#include "util/system.h"

#include <algorithm>
#include <vector>

namespace points_epoch {

int64_t GetDayIndex(int64_t nTime)
{
    int64_t nDay = nTime / SECONDS_PER_DAY;
    if (nTime < 0 && nTime % SECONDS_PER_DAY != 0) {
        nDay--;
    }
    return nDay;
}

bool GetCurrentEpoch(CPointsStore& store, CLeaderboardEpoch& epoch)
{
    CLeaderboardState state = store.LoadLeaderboardState_OrNew();
    if (state.nCurrentEpoch == 0) {
        return false;
    }
    return store.ReadEpoch(state.nCurrentEpoch, epoch);
}

bool GetActiveEpoch(CPointsStore& store, CLeaderboardEpoch& epoch)
{
    CLeaderboardState state = store.LoadLeaderboardState_OrNew();
    if (state.nCurrentEpoch == 0 || !state.fActive) {
        return false;
    }
    if (!store.ReadEpoch(state.nCurrentEpoch, epoch)) {
        return false;
    }
    return epoch.fActive;
}

// ═══════════════════════════════════════════════════════════════════════════
// Transitions
// ═══════════════════════════════════════════════════════════════════════════

bool FreezeReserveIndices(CPointsStore& store, int nEpoch, int64_t nEndTime)
{
    std::vector<std::string> reserves;
    if (!store.ListReserves(reserves)) {
        return error("%s: failed to list reserves", __func__);
    }

    for (const std::string& reserveId : reserves) {
        CReserve reserve;
        if (!store.ReadReserve(reserveId, reserve)) {
            continue;
        }

        CEpochEndSnapshot snapshot;
        snapshot.nEpochNumber = nEpoch;
        snapshot.reserve = reserveId;
        snapshot.liquidityIndex = points_math::GetNormalizedIncome(
            reserve.liquidityIndex, reserve.liquidityRate, reserve.nLastUpdateTimestamp, nEndTime);
        snapshot.variableBorrowIndex = points_math::GetNormalizedVariableDebt(
            reserve.variableBorrowIndex, reserve.variableBorrowRate, reserve.nLastUpdateTimestamp, nEndTime);
        snapshot.nTime = nEndTime;

        if (!store.WriteEpochEndSnapshot(snapshot)) {
            return error("%s: failed to write snapshot %s", __func__, MakeEpochEndKey(nEpoch, reserveId));
        }

        LogPrint(BCLog::EPOCH, "FreezeReserveIndices: epoch=%d reserve=%s liquidityIndex=%s borrowIndex=%s\n",
                 nEpoch, reserveId, snapshot.liquidityIndex.str(), snapshot.variableBorrowIndex.str());
    }

    return true;
}

bool EndEpoch(CPointsStore& store, int nEpoch, int64_t nEndTime, int64_t nEndBlock)
{
    CLeaderboardEpoch epoch;
    if (!store.ReadEpoch(nEpoch, epoch)) {
        LogPrint(BCLog::EPOCH, "EndEpoch: epoch %d unknown, skipping\n", nEpoch);
        return true;
    }
    if (!epoch.fActive) {
        LogPrint(BCLog::EPOCH, "EndEpoch: epoch %d not active, skipping\n", nEpoch);
        return true;
    }

    nEndTime = std::max(nEndTime, epoch.nStartTime);
    nEndBlock = std::max(nEndBlock, epoch.nStartBlock);

    epoch.fActive = false;
    epoch.nEndTime = nEndTime;
    epoch.nEndBlock = nEndBlock;
    epoch.nScheduledEndTime.reset();
    if (!store.WriteEpoch(epoch)) {
        return error("%s: failed to write epoch %d", __func__, nEpoch);
    }

    if (!FreezeReserveIndices(store, nEpoch, nEndTime)) {
        return false;
    }

    CLeaderboardState state = store.LoadLeaderboardState_OrNew();
    if (state.nCurrentEpoch == nEpoch) {
        state.fActive = false;
        state.nUpdatedAt = nEndTime;
        if (!store.WriteLeaderboardState(state)) {
            return error("%s: failed to write leaderboard state", __func__);
        }
    }

    LogPrint(BCLog::EPOCH, "EndEpoch: epoch=%d endTime=%lld endBlock=%lld\n",
             nEpoch, (long long)nEndTime, (long long)nEndBlock);
    return true;
}

bool StartEpoch(CPointsStore& store, int nEpoch, int64_t nStartTime, int64_t nStartBlock)
{
    if (nEpoch <= 0) {
        return error("%s: invalid epoch number %d", __func__, nEpoch);
    }

    CLeaderboardEpoch epoch;
    if (store.ReadEpoch(nEpoch, epoch)) {
        if (epoch.fActive) {
            LogPrint(BCLog::EPOCH, "StartEpoch: epoch %d already active\n", nEpoch);
            return true;
        }
        if (epoch.HasEnded()) {
            LogPrintf("StartEpoch: epoch %d already ended, ignoring restart\n", nEpoch);
            return true;
        }
    } else {
        epoch.SetNull();
    }

    CLeaderboardState state = store.LoadLeaderboardState_OrNew();
    if (state.nCurrentEpoch > 0 && state.nCurrentEpoch != nEpoch && state.fActive) {
        if (!EndEpoch(store, state.nCurrentEpoch, nStartTime, nStartBlock)) {
            return false;
        }
        state = store.LoadLeaderboardState_OrNew();
    }

    epoch.nEpochNumber = nEpoch;
    epoch.nStartTime = nStartTime;
    epoch.nStartBlock = nStartBlock;
    epoch.fActive = true;
    epoch.nEndTime.reset();
    epoch.nEndBlock.reset();
    epoch.nScheduledStartTime.reset();
    if (!store.WriteEpoch(epoch)) {
        return error("%s: failed to write epoch %d", __func__, nEpoch);
    }

    state.nCurrentEpoch = nEpoch;
    state.fActive = true;
    state.nGlobalMirrorEpoch = nEpoch;
    state.nUpdatedAt = nStartTime;
    if (!store.WriteLeaderboardState(state)) {
        return error("%s: failed to write leaderboard state", __func__);
    }

    if (!points_ranking::ResetGlobalMirror(store, nEpoch, nStartTime)) {
        return false;
    }

    LogPrint(BCLog::EPOCH, "StartEpoch: epoch=%d startTime=%lld startBlock=%lld\n",
             nEpoch, (long long)nStartTime, (long long)nStartBlock);
    return true;
}

bool ScheduleEpochStart(CPointsStore& store, int nEpoch, const std::optional<int64_t>& nStartTime,
                        int64_t nTime, int64_t nBlock)
{
    const int64_t nStart = nStartTime.value_or(nTime);
    if (nStart <= nTime) {
        return StartEpoch(store, nEpoch, nStart, nBlock);
    }

    CLeaderboardEpoch epoch;
    if (!store.ReadEpoch(nEpoch, epoch)) {
        epoch.SetNull();
        epoch.nEpochNumber = nEpoch;
    }
    if (epoch.HasStarted()) {
        LogPrint(BCLog::EPOCH, "ScheduleEpochStart: epoch %d already started\n", nEpoch);
        return true;
    }
    epoch.nScheduledStartTime = nStart;
    if (!store.WriteEpoch(epoch)) {
        return error("%s: failed to write epoch %d", __func__, nEpoch);
    }

    LogPrint(BCLog::EPOCH, "ScheduleEpochStart: epoch=%d scheduled at %lld\n", nEpoch, (long long)nStart);
    return true;
}

bool ScheduleEpochEnd(CPointsStore& store, int nEpoch, const std::optional<int64_t>& nEndTime,
                      int64_t nTime, int64_t nBlock)
{
    const int64_t nEnd = nEndTime.value_or(nTime);

    CLeaderboardEpoch epoch;
    if (!store.ReadEpoch(nEpoch, epoch)) {
        LogPrint(BCLog::EPOCH, "ScheduleEpochEnd: epoch %d unknown, skipping\n", nEpoch);
        return true;
    }
    if (nEnd <= nTime && epoch.fActive) {
        return EndEpoch(store, nEpoch, nEnd, nBlock);
    }
    if (epoch.HasEnded()) {
        LogPrint(BCLog::EPOCH, "ScheduleEpochEnd: epoch %d already ended\n", nEpoch);
        return true;
    }

    epoch.nScheduledEndTime = nEnd;
    if (!store.WriteEpoch(epoch)) {
        return error("%s: failed to write epoch %d", __func__, nEpoch);
    }

    LogPrint(BCLog::EPOCH, "ScheduleEpochEnd: epoch=%d scheduled at %lld\n", nEpoch, (long long)nEnd);
    return true;
}

bool ApplyScheduledEpochTransitions(CPointsStore& store, int64_t nTime, int64_t nBlock, int* pnApplied)
{
    int nApplied = 0;

    for (int i = 0; i < MAX_EPOCH_TRANSITIONS_PER_EVENT; ++i) {
        CLeaderboardState state = store.LoadLeaderboardState_OrNew();

        CLeaderboardEpoch current;
        if (state.nCurrentEpoch > 0 && store.ReadEpoch(state.nCurrentEpoch, current) &&
            current.fActive && current.nScheduledEndTime && nTime >= *current.nScheduledEndTime) {
            if (!EndEpoch(store, current.nEpochNumber, *current.nScheduledEndTime, nBlock)) {
                return false;
            }
            nApplied++;
            continue;
        }

        CLeaderboardEpoch next;
        if (store.ReadEpoch(state.nCurrentEpoch + 1, next) && !next.HasStarted() &&
            next.nScheduledStartTime && nTime >= *next.nScheduledStartTime) {
            // StartEpoch closes a still active current epoch at this start time
            if (!StartEpoch(store, next.nEpochNumber, *next.nScheduledStartTime, nBlock)) {
                return false;
            }
            nApplied++;
            continue;
        }

        break;
    }

    if (nApplied > 0) {
        LogPrint(BCLog::EPOCH, "ApplyScheduledEpochTransitions: applied %d at time=%lld\n", nApplied, (long long)nTime);
    }
    if (pnApplied) *pnApplied = nApplied;
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Settlement windows
// ═══════════════════════════════════════════════════════════════════════════

bool GetAccrualWindow(const CLeaderboardEpoch& epoch, int64_t nLastSettled, int64_t nTime,
                      int64_t& nStart, int64_t& nEnd)
{
    nStart = 0;
    nEnd = 0;
    if (epoch.IsNull() || !epoch.HasStarted()) {
        return false;
    }

    nStart = std::max(nLastSettled, epoch.nStartTime);
    nEnd = epoch.fActive ? nTime : std::min(nTime, epoch.GetEndTimeOr(nTime));
    return nEnd > nStart;
}

int64_t GetNextBaselineTime(const CLeaderboardEpoch& epoch, int64_t nLastSettled, int64_t nTime)
{
    if (!epoch.IsNull() && epoch.HasEnded() && nTime > *epoch.nEndTime) {
        return std::max(nLastSettled, *epoch.nEndTime);
    }
    return std::max(nLastSettled, nTime);
}

void GetReserveIndicesAt(CPointsStore& store, const CReserve& reserve, const CLeaderboardEpoch& epoch,
                         int64_t nTime, CBigInt& liquidityIndex, CBigInt& variableBorrowIndex)
{
    if (!epoch.IsNull() && epoch.HasEnded() && nTime == *epoch.nEndTime) {
        CEpochEndSnapshot snapshot;
        if (store.ReadEpochEndSnapshot(epoch.nEpochNumber, reserve.id, snapshot)) {
            liquidityIndex = snapshot.liquidityIndex;
            variableBorrowIndex = snapshot.variableBorrowIndex;
            return;
        }
    }

    liquidityIndex = points_math::GetNormalizedIncome(
        reserve.liquidityIndex, reserve.liquidityRate, reserve.nLastUpdateTimestamp, nTime);
    variableBorrowIndex = points_math::GetNormalizedVariableDebt(
        reserve.variableBorrowIndex, reserve.variableBorrowRate, reserve.nLastUpdateTimestamp, nTime);
}

} // namespace points_epoch
