// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_EPOCH_H
#define POINTSD_POINTS_EPOCH_H

#include "points/points_amount.h"
#include "points/points_state.h"
#include "points/points_store.h"

#include <optional>
#include <stdint.h>

/**
 * Epoch settlement coordinator
 *
 * Tracks the epoch being scored, applies scheduled start/end transitions,
 * freezes reserve indices when an epoch ends and decides which part of a
 * settlement interval belongs to which epoch.
 *
 * LIFECYCLE:
 * - scheduled: record exists with nScheduledStartTime, not started
 * - active:    fActive, nStartTime set, LeaderboardState points at it
 * - ended:     !fActive, nEndTime set, still current until the next start
 */
namespace points_epoch {

/** UTC day number: floor(nTime / 86400) */
int64_t GetDayIndex(int64_t nTime);

/**
 * GetCurrentEpoch - Epoch referenced by LeaderboardState (active or ended)
 *
 * @return false if no epoch was ever started or the record is missing
 */
bool GetCurrentEpoch(CPointsStore& store, CLeaderboardEpoch& epoch);

/** Current epoch, only if it is still active */
bool GetActiveEpoch(CPointsStore& store, CLeaderboardEpoch& epoch);

/**
 * StartEpoch - Activate an epoch
 *
 * Closes the previous epoch at nStartTime if it is still active, points
 * LeaderboardState at the new epoch and resets the global mirror.
 * Starting an already active epoch is a no-op; an ended epoch cannot restart.
 */
bool StartEpoch(CPointsStore& store, int nEpoch, int64_t nStartTime, int64_t nStartBlock);

/**
 * EndEpoch - Close an active epoch and freeze every reserve's indices at nEndTime
 *
 * Ending an epoch that is not active is a no-op.
 */
bool EndEpoch(CPointsStore& store, int nEpoch, int64_t nEndTime, int64_t nEndBlock);

/**
 * ScheduleEpochStart - Handle an epoch start signal
 *
 * @param nStartTime Requested start, the block timestamp when unset
 * @return false on store failure
 */
bool ScheduleEpochStart(CPointsStore& store, int nEpoch, const std::optional<int64_t>& nStartTime,
                        int64_t nTime, int64_t nBlock);

/** Handle an epoch end signal, see ScheduleEpochStart */
bool ScheduleEpochEnd(CPointsStore& store, int nEpoch, const std::optional<int64_t>& nEndTime,
                      int64_t nTime, int64_t nBlock);

/**
 * ApplyScheduledEpochTransitions - Apply due scheduled ends and starts
 *
 * Runs before every event. At most MAX_EPOCH_TRANSITIONS_PER_EVENT
 * transitions are applied per call.
 *
 * @param pnApplied Optional output: number of transitions applied
 */
bool ApplyScheduledEpochTransitions(CPointsStore& store, int64_t nTime, int64_t nBlock, int* pnApplied = nullptr);

/** Write an EpochEndSnapshot for every known reserve */
bool FreezeReserveIndices(CPointsStore& store, int nEpoch, int64_t nEndTime);

/**
 * GetAccrualWindow - Part of [nLastSettled, nTime] scored by an epoch
 *
 * The window starts no earlier than the epoch start and, for an ended
 * epoch, stops at the epoch end.
 *
 * @return true if the window is non-empty
 */
bool GetAccrualWindow(const CLeaderboardEpoch& epoch, int64_t nLastSettled, int64_t nTime,
                      int64_t& nStart, int64_t& nEnd);

/**
 * GetNextBaselineTime - Timestamp a baseline advances to
 *
 * While the current epoch has ended and no new one started, baselines stop
 * at the epoch end so that repeated settlements in the gap accrue nothing.
 */
int64_t GetNextBaselineTime(const CLeaderboardEpoch& epoch, int64_t nLastSettled, int64_t nTime);

/**
 * GetReserveIndicesAt - Liquidity and variable borrow index of a reserve at nTime
 *
 * At the end time of an ended epoch the frozen snapshot is used; otherwise
 * the live index is projected forward from the reserve's last update.
 */
void GetReserveIndicesAt(CPointsStore& store, const CReserve& reserve, const CLeaderboardEpoch& epoch,
                         int64_t nTime, CBigInt& liquidityIndex, CBigInt& variableBorrowIndex);

} // namespace points_epoch

#endif // POINTSD_POINTS_EPOCH_H
