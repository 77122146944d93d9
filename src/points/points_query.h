// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_QUERY_H
#define POINTSD_POINTS_QUERY_H

#include "points/points_ranking.h"
#include "points/points_state.h"
#include "points/points_store.h"

#include <stdint.h>
#include <string>
#include <vector>

/**
 * Read-only leaderboard queries
 *
 * Ranks are exact inside the TopK. Below it only the histogram is known,
 * so a rank is reported as the range of positions the user's bucket covers.
 */
namespace points_query {

struct CUserRank
{
    std::string user;
    double points;
    int nBucketIndex;
    bool fExact;
    int nRank;      //!< exact rank, 0 when not exact
    int nRankLow;   //!< best possible rank
    int nRankHigh;  //!< worst possible rank

    CUserRank() : points(0), nBucketIndex(-1), fExact(false), nRank(0), nRankLow(0), nRankHigh(0) {}
};

/** Per-user view combining the current epoch, lifetime totals and ranks */
struct CUserPointsSummary
{
    std::string user;
    CUserLeaderboardState state;
    int nCurrentEpoch;
    CUserEpochStats currentStats;
    bool fHasEpochRank;
    CUserRank epochRank;
    bool fHasAllTimeRank;
    CUserRank allTimeRank;

    CUserPointsSummary() : nCurrentEpoch(0), fHasEpochRank(false), fHasAllTimeRank(false) {}
};

/** Scope the "global" name resolves to (the mirror of the current epoch) */
points_ranking::CRankingScope GetGlobalScope(CPointsStore& store);

/**
 * GetTopEntries - First nCount TopK entries of a scope, ranks filled in
 *
 * @param nCount Entries wanted, clamped to [0, MAX_TOP_K]
 */
std::vector<CTopKEntry> GetTopEntries(CPointsStore& store, const points_ranking::CRankingScope& scope, int nCount);

/**
 * GetUserRank - Rank of a user in a scope
 *
 * @return false if the user has no positive score in the scope
 */
bool GetUserRank(CPointsStore& store, const points_ranking::CRankingScope& scope, const std::string& user,
                 CUserRank& rank);

/**
 * CountUsersInRange - Users whose score lies in [minPoints, maxPoints]
 *
 * Answered at bucket granularity: every bucket overlapping the range is
 * counted in full.
 */
int64_t CountUsersInRange(CPointsStore& store, const points_ranking::CRankingScope& scope,
                          double minPoints, double maxPoints);

/** Non-empty buckets of a scope, ascending */
std::vector<CScoreBucket> GetHistogram(CPointsStore& store, const points_ranking::CRankingScope& scope);

/** Users with a positive score in a scope */
int32_t GetUsersWithPoints(CPointsStore& store, const points_ranking::CRankingScope& scope);

CUserPointsSummary GetUserSummary(CPointsStore& store, const std::string& user);

} // namespace points_query

#endif // POINTSD_POINTS_QUERY_H
