// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_leaderboard.h"

#include "logging.h"
#include "points/points_ranking.h"
#include "util/system.h"

using points_ranking::CRankingScope;

namespace points_leaderboard {

bool IsUserBlacklisted(CPointsStore& store, const std::string& user)
{
    CUserLeaderboardState state;
    if (!store.ReadUserLeaderboardState(user, state)) {
        return false;
    }
    return state.fBlacklisted;
}

/** Mirror the epoch scope into the global scope when it is the one being mirrored */
static bool MaybeSyncGlobal(CPointsStore& store, int nEpoch, const std::string& user,
                            int nOldBucket, int nNewBucket, int64_t nTime)
{
    CLeaderboardState state = store.LoadLeaderboardState_OrNew();
    if (state.nCurrentEpoch != nEpoch || state.nGlobalMirrorEpoch != nEpoch) {
        return true;
    }
    return points_ranking::SyncGlobalMirror(store, nEpoch, user, {nOldBucket, nNewBucket}, nTime);
}

bool UpdateLeaderboard(CPointsStore& store, const std::string& user, double points, int64_t nTime)
{
    CLeaderboardState state = store.LoadLeaderboardState_OrNew();
    if (state.nCurrentEpoch == 0) {
        LogPrint(BCLog::RANKING, "UpdateLeaderboard: no epoch, skipping user=%s\n", user);
        return true;
    }
    CLeaderboardEpoch epoch;
    if (!store.ReadEpoch(state.nCurrentEpoch, epoch)) {
        LogPrint(BCLog::RANKING, "UpdateLeaderboard: epoch %d missing, skipping user=%s\n", state.nCurrentEpoch, user);
        return true;
    }
    return UpdateLeaderboardForEpoch(store, user, state.nCurrentEpoch, points, nTime);
}

bool UpdateLeaderboardForEpoch(CPointsStore& store, const std::string& user, int nEpoch, double points, int64_t nTime)
{
    if (nEpoch <= 0) {
        return true;
    }
    if (IsUserBlacklisted(store, user)) {
        LogPrint(BCLog::RANKING, "UpdateLeaderboardForEpoch: user=%s is blacklisted\n", user);
        return true;
    }

    int nOldBucket = -1;
    int nNewBucket = -1;
    if (!points_ranking::UpdateUserScore(store, CRankingScope::Epoch(nEpoch), user, points, nTime,
                                         &nOldBucket, &nNewBucket)) {
        return error("%s: ranking update failed for user=%s epoch=%d", __func__, user, nEpoch);
    }
    return MaybeSyncGlobal(store, nEpoch, user, nOldBucket, nNewBucket, nTime);
}

bool UpdateAllTimeLeaderboard(CPointsStore& store, const std::string& user, double lifetimePoints, int64_t nTime)
{
    if (IsUserBlacklisted(store, user)) {
        LogPrint(BCLog::RANKING, "UpdateAllTimeLeaderboard: user=%s is blacklisted\n", user);
        return true;
    }
    if (!points_ranking::UpdateUserScore(store, CRankingScope::AllTime(), user, lifetimePoints, nTime)) {
        return error("%s: ranking update failed for user=%s", __func__, user);
    }
    return true;
}

bool RemoveUserFromLeaderboards(CPointsStore& store, const std::string& user, int64_t nTime)
{
    CLeaderboardState state = store.LoadLeaderboardState_OrNew();
    if (state.nCurrentEpoch > 0) {
        int nOldBucket = -1;
        if (!points_ranking::RemoveUser(store, CRankingScope::Epoch(state.nCurrentEpoch), user, nTime, &nOldBucket)) {
            return error("%s: failed to remove user=%s from epoch %d", __func__, user, state.nCurrentEpoch);
        }
        if (!MaybeSyncGlobal(store, state.nCurrentEpoch, user, nOldBucket, -1, nTime)) {
            return false;
        }
    }

    if (!points_ranking::RemoveUser(store, CRankingScope::AllTime(), user, nTime)) {
        return error("%s: failed to remove user=%s from all-time", __func__, user);
    }

    LogPrint(BCLog::RANKING, "RemoveUserFromLeaderboards: user=%s removed\n", user);
    return true;
}

} // namespace points_leaderboard
