// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_RANKING_H
#define POINTSD_POINTS_RANKING_H

#include "points/points_state.h"
#include "points/points_store.h"

#include <stdint.h>
#include <string>
#include <vector>

/**
 * Ranking structure: exact TopK plus a bucketed histogram
 *
 * Each scope (one epoch, the all-time scope, or the global mirror of the
 * current epoch) owns:
 * - a CUserIndex per user: score and occupied bucket (-1 for a zero score)
 * - MAX_BUCKETS score buckets counting every user with a positive score
 * - a CTopK list of at most MAX_TOP_K entries, points desc then user asc
 * - a CLeaderboardTotals counter of users with a positive score
 *
 * Bucket and totals counters saturate at MAX_BUCKET_COUNT and never go
 * below zero.
 */
namespace points_ranking {

/**
 * CRankingScope - Key namespace of one leaderboard
 */
class CRankingScope
{
private:
    int m_nEpoch;
    bool m_fGlobal;

    CRankingScope(int nEpoch, bool fGlobal) : m_nEpoch(nEpoch), m_fGlobal(fGlobal) {}

public:
    static CRankingScope Epoch(int nEpoch) { return CRankingScope(nEpoch, false); }
    static CRankingScope AllTime() { return CRankingScope(ALL_TIME_EPOCH, false); }
    /** Mirror of the current epoch, nEpoch is the epoch being mirrored */
    static CRankingScope Global(int nEpoch) { return CRankingScope(nEpoch, true); }

    int GetEpoch() const { return m_nEpoch; }
    bool IsGlobal() const { return m_fGlobal; }
    bool IsAllTime() const { return !m_fGlobal && m_nEpoch == ALL_TIME_EPOCH; }

    /** "epoch:N" or "global" (TopK, Totals) */
    std::string GetPrefix() const;
    /** "user:N" or "global:user" */
    std::string GetUserIndexKey(const std::string& user) const;
    /** "epoch:N:user" or "global:user" */
    std::string GetTopKEntryKey(const std::string& user) const;
    /** "epoch:N:b:i" or "global:b:i" */
    std::string GetBucketKey(int nIndex) const;

    std::string ToString() const;
};

/** Non-finite and negative scores count as zero */
double NormalizePoints(double points);

/**
 * GetBucketIndex - Histogram bucket of a score
 *
 * [0, 0.1) -> 0, [0.1, 0.5) -> 1, [0.5, 1) -> 2, then doubling ranges
 * [1, 2) -> 3, [2, 4) -> 4, ... up to MAX_BUCKETS - 1 which is open ended.
 * Monotone and history independent.
 */
int GetBucketIndex(double points);

/** Bounds [lower, upper) of a bucket; the last bucket's upper bound is +inf */
void GetBucketBounds(int nIndex, double& lower, double& upper);

/** Strict weak order of the TopK: points desc, then user asc */
bool TopKEntryBefore(const CTopKEntry& a, const CTopKEntry& b);

/**
 * UpdateUserScore - Insert, update or zero a user's score in a scope
 *
 * A zero score releases the user's bucket, drops the user from the TopK and
 * un-counts the user from the totals, keeping the CUserIndex with bucket -1.
 *
 * @param pOldBucket Optional output: bucket occupied before the update
 * @param pNewBucket Optional output: bucket occupied after the update
 * @return false on store failure
 */
bool UpdateUserScore(CPointsStore& store, const CRankingScope& scope, const std::string& user,
                     double points, int64_t nTime, int* pOldBucket = nullptr, int* pNewBucket = nullptr);

/**
 * RemoveUser - Full teardown of a user in a scope
 *
 * Releases the bucket, drops the TopK entry, un-counts the totals and erases
 * the CUserIndex. A user that is not present is a no-op.
 *
 * @param pOldBucket Optional output: bucket occupied before removal (-1 if none)
 */
bool RemoveUser(CPointsStore& store, const CRankingScope& scope, const std::string& user, int64_t nTime,
                int* pOldBucket = nullptr);

/**
 * SyncGlobalMirror - Copy a user's epoch-scope ranking records into the global scope
 *
 * Copies the user index (or erases it when the epoch scope has none), the
 * listed buckets, the TopK and the totals.
 */
bool SyncGlobalMirror(CPointsStore& store, int nEpoch, const std::string& user,
                      const std::vector<int>& vTouchedBuckets, int64_t nTime);

/** Reset the global scope to an empty leaderboard for nEpoch */
bool ResetGlobalMirror(CPointsStore& store, int nEpoch, int64_t nTime);

/** Load a scope's TopK, empty when the scope has never been written */
CTopK LoadTopK(CPointsStore& store, const CRankingScope& scope);

/** Load a bucket, initialized with its bounds and a zero count when missing */
CScoreBucket LoadScoreBucket(CPointsStore& store, const CRankingScope& scope, int nIndex);

/** Load a scope's totals, zero when missing */
CLeaderboardTotals LoadTotals(CPointsStore& store, const CRankingScope& scope);

} // namespace points_ranking

#endif // POINTSD_POINTS_RANKING_H
