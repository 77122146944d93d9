// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_ranking.h"

#include "logging.h"
#include "util/system.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace points_ranking {

static const char* const GLOBAL_PREFIX = "global";

// ============================================================================
// Scope keys
// ============================================================================

std::string CRankingScope::GetPrefix() const
{
    if (m_fGlobal) {
        return GLOBAL_PREFIX;
    }
    return "epoch:" + std::to_string(m_nEpoch);
}

std::string CRankingScope::GetUserIndexKey(const std::string& user) const
{
    if (m_fGlobal) {
        return std::string(GLOBAL_PREFIX) + ":" + user;
    }
    return user + ":" + std::to_string(m_nEpoch);
}

std::string CRankingScope::GetTopKEntryKey(const std::string& user) const
{
    return GetPrefix() + ":" + user;
}

std::string CRankingScope::GetBucketKey(int nIndex) const
{
    return GetPrefix() + ":b:" + std::to_string(nIndex);
}

std::string CRankingScope::ToString() const
{
    if (m_fGlobal) {
        return strprintf("global(epoch %d)", m_nEpoch);
    }
    if (m_nEpoch == ALL_TIME_EPOCH) {
        return "all-time";
    }
    return strprintf("epoch %d", m_nEpoch);
}

// ============================================================================
// Buckets
// ============================================================================

double NormalizePoints(double points)
{
    if (!std::isfinite(points) || points < 0) {
        return 0;
    }
    return points;
}

int GetBucketIndex(double points)
{
    double p = NormalizePoints(points);
    if (p < 0.1) return 0;
    if (p < 0.5) return 1;
    if (p < 1.0) return 2;

    int nIndex = 3;
    double bound = 1.0;
    while (nIndex < MAX_BUCKETS - 1 && p >= bound * 2) {
        bound *= 2;
        nIndex++;
    }
    return nIndex;
}

void GetBucketBounds(int nIndex, double& lower, double& upper)
{
    switch (nIndex) {
    case 0:
        lower = 0;
        upper = 0.1;
        return;
    case 1:
        lower = 0.1;
        upper = 0.5;
        return;
    case 2:
        lower = 0.5;
        upper = 1.0;
        return;
    default:
        break;
    }
    lower = std::ldexp(1.0, nIndex - 3);
    upper = (nIndex >= MAX_BUCKETS - 1) ? std::numeric_limits<double>::infinity() : std::ldexp(1.0, nIndex - 2);
}

CScoreBucket LoadScoreBucket(CPointsStore& store, const CRankingScope& scope, int nIndex)
{
    CScoreBucket bucket;
    if (store.ReadScoreBucket(scope.GetBucketKey(nIndex), bucket)) {
        return bucket;
    }
    bucket.id = scope.GetBucketKey(nIndex);
    bucket.nEpochNumber = scope.GetEpoch();
    bucket.nIndex = nIndex;
    GetBucketBounds(nIndex, bucket.lower, bucket.upper);
    bucket.nCount = 0;
    return bucket;
}

static bool AdjustBucket(CPointsStore& store, const CRankingScope& scope, int nIndex, int nDelta, int64_t nTime)
{
    if (nIndex < 0 || nIndex >= MAX_BUCKETS) {
        return error("%s: bucket index %d out of range", __func__, nIndex);
    }

    CScoreBucket bucket = LoadScoreBucket(store, scope, nIndex);
    if (nDelta > 0) {
        if (bucket.nCount < MAX_BUCKET_COUNT) {
            bucket.nCount++;
        } else {
            LogPrint(BCLog::RANKING, "AdjustBucket: %s bucket %d saturated at %d\n",
                     scope.ToString(), nIndex, bucket.nCount);
        }
    } else if (bucket.nCount > 0) {
        bucket.nCount--;
    }
    bucket.nUpdatedAt = nTime;

    if (!store.WriteScoreBucket(bucket)) {
        return error("%s: failed to write bucket %s", __func__, bucket.id);
    }
    return true;
}

// ============================================================================
// Totals
// ============================================================================

CLeaderboardTotals LoadTotals(CPointsStore& store, const CRankingScope& scope)
{
    CLeaderboardTotals totals;
    if (store.ReadTotals(scope.GetPrefix(), totals)) {
        return totals;
    }
    totals.id = scope.GetPrefix();
    totals.nEpochNumber = scope.GetEpoch();
    return totals;
}

static bool AdjustTotals(CPointsStore& store, const CRankingScope& scope, int nDelta, int64_t nTime)
{
    CLeaderboardTotals totals = LoadTotals(store, scope);
    if (nDelta > 0) {
        if (totals.nUsersWithPoints < MAX_BUCKET_COUNT) {
            totals.nUsersWithPoints++;
        }
    } else if (totals.nUsersWithPoints > 0) {
        totals.nUsersWithPoints--;
    }
    totals.nUpdatedAt = nTime;

    if (!store.WriteTotals(totals)) {
        return error("%s: failed to write totals %s", __func__, totals.id);
    }
    return true;
}

// ============================================================================
// TopK
// ============================================================================

bool TopKEntryBefore(const CTopKEntry& a, const CTopKEntry& b)
{
    if (a.points != b.points) {
        return a.points > b.points;
    }
    return a.user < b.user;
}

CTopK LoadTopK(CPointsStore& store, const CRankingScope& scope)
{
    CTopK topK;
    if (store.ReadTopK(scope.GetPrefix(), topK)) {
        return topK;
    }
    topK.id = scope.GetPrefix();
    topK.nEpochNumber = scope.GetEpoch();
    return topK;
}

/** Write next as the scope's TopK, erasing entry rows of users no longer listed */
static bool WriteTopKRows(CPointsStore& store, const CRankingScope& scope, const CTopK& previous, const CTopK& next)
{
    std::set<std::string> setNext;
    for (const CTopKEntry& entry : next.vEntries) {
        setNext.insert(entry.user);
    }

    for (const CTopKEntry& entry : previous.vEntries) {
        if (!setNext.count(entry.user)) {
            if (!store.EraseTopKEntry(scope.GetTopKEntryKey(entry.user))) {
                return error("%s: failed to erase entry %s", __func__, scope.GetTopKEntryKey(entry.user));
            }
        }
    }

    for (const CTopKEntry& entry : next.vEntries) {
        if (!store.WriteTopKEntry(scope.GetTopKEntryKey(entry.user), entry)) {
            return error("%s: failed to write entry %s", __func__, scope.GetTopKEntryKey(entry.user));
        }
    }

    if (!store.WriteTopK(next)) {
        return error("%s: failed to write %s", __func__, next.id);
    }
    return true;
}

/**
 * UpdateTopK - Merge one user's score into the sorted TopK
 *
 * A score of 0 removes the user. A user outside a full TopK who does not
 * beat the last entry leaves the list untouched.
 */
static bool UpdateTopK(CPointsStore& store, const CRankingScope& scope, const std::string& user,
                       double points, int64_t nTime)
{
    const CTopK previous = LoadTopK(store, scope);
    CTopK next = previous;

    auto it = std::find_if(next.vEntries.begin(), next.vEntries.end(),
                           [&user](const CTopKEntry& entry) { return entry.user == user; });
    bool fPresent = it != next.vEntries.end();

    if (!fPresent) {
        if (points <= 0) {
            return true;
        }
        if ((int)next.vEntries.size() >= MAX_TOP_K &&
            !TopKEntryBefore(CTopKEntry(user, points), next.vEntries.back())) {
            return true;
        }
    } else {
        next.vEntries.erase(it);
    }

    if (points > 0) {
        next.vEntries.emplace_back(user, points);
    }

    std::sort(next.vEntries.begin(), next.vEntries.end(), TopKEntryBefore);
    if ((int)next.vEntries.size() > MAX_TOP_K) {
        next.vEntries.resize(MAX_TOP_K);
    }
    for (size_t i = 0; i < next.vEntries.size(); ++i) {
        next.vEntries[i].nRank = (int)i + 1;
    }
    next.nUpdatedAt = nTime;

    return WriteTopKRows(store, scope, previous, next);
}

// ============================================================================
// Score updates
// ============================================================================

bool UpdateUserScore(CPointsStore& store, const CRankingScope& scope, const std::string& user,
                     double points, int64_t nTime, int* pOldBucket, int* pNewBucket)
{
    const double normalized = NormalizePoints(points);
    const std::string key = scope.GetUserIndexKey(user);

    CUserIndex index;
    bool fExists = store.ReadUserIndex(key, index);
    const int nOldBucket = fExists ? index.nBucketIndex : -1;
    const bool fWasCounted = fExists && index.points > 0;
    if (!fExists) {
        index.id = key;
        index.user = user;
        index.nEpochNumber = scope.GetEpoch();
    }
    if (pOldBucket) *pOldBucket = nOldBucket;

    int nNewBucket = -1;
    if (normalized == 0) {
        if (nOldBucket >= 0 && !AdjustBucket(store, scope, nOldBucket, -1, nTime)) {
            return false;
        }
        if (fWasCounted && !AdjustTotals(store, scope, -1, nTime)) {
            return false;
        }
    } else {
        nNewBucket = GetBucketIndex(normalized);
        if (nNewBucket != nOldBucket) {
            if (nOldBucket >= 0 && !AdjustBucket(store, scope, nOldBucket, -1, nTime)) {
                return false;
            }
            if (!AdjustBucket(store, scope, nNewBucket, 1, nTime)) {
                return false;
            }
        }
        if (!fWasCounted && !AdjustTotals(store, scope, 1, nTime)) {
            return false;
        }
    }
    if (pNewBucket) *pNewBucket = nNewBucket;

    index.points = normalized;
    index.nBucketIndex = nNewBucket;
    index.nUpdatedAt = nTime;
    if (!store.WriteUserIndex(index)) {
        return error("%s: failed to write user index %s", __func__, key);
    }

    LogPrint(BCLog::RANKING, "UpdateUserScore: %s user=%s points=%f bucket %d -> %d\n",
             scope.ToString(), user, normalized, nOldBucket, nNewBucket);

    return UpdateTopK(store, scope, user, normalized, nTime);
}

bool RemoveUser(CPointsStore& store, const CRankingScope& scope, const std::string& user, int64_t nTime,
                int* pOldBucket)
{
    const std::string key = scope.GetUserIndexKey(user);

    CUserIndex index;
    int nOldBucket = -1;
    if (store.ReadUserIndex(key, index)) {
        nOldBucket = index.nBucketIndex;
        if (nOldBucket >= 0 && !AdjustBucket(store, scope, nOldBucket, -1, nTime)) {
            return false;
        }
        if (index.points > 0 && !AdjustTotals(store, scope, -1, nTime)) {
            return false;
        }
        if (!store.EraseUserIndex(key)) {
            return error("%s: failed to erase user index %s", __func__, key);
        }
    }
    if (pOldBucket) *pOldBucket = nOldBucket;

    LogPrint(BCLog::RANKING, "RemoveUser: %s user=%s bucket=%d\n", scope.ToString(), user, nOldBucket);

    return UpdateTopK(store, scope, user, 0, nTime);
}

// ============================================================================
// Global mirror
// ============================================================================

bool SyncGlobalMirror(CPointsStore& store, int nEpoch, const std::string& user,
                      const std::vector<int>& vTouchedBuckets, int64_t nTime)
{
    const CRankingScope epochScope = CRankingScope::Epoch(nEpoch);
    const CRankingScope globalScope = CRankingScope::Global(nEpoch);

    CUserIndex index;
    if (store.ReadUserIndex(epochScope.GetUserIndexKey(user), index)) {
        index.id = globalScope.GetUserIndexKey(user);
        if (!store.WriteUserIndex(index)) {
            return error("%s: failed to write %s", __func__, index.id);
        }
    } else if (!store.EraseUserIndex(globalScope.GetUserIndexKey(user))) {
        return error("%s: failed to erase %s", __func__, globalScope.GetUserIndexKey(user));
    }

    for (int nIndex : vTouchedBuckets) {
        if (nIndex < 0) continue;
        CScoreBucket bucket = LoadScoreBucket(store, epochScope, nIndex);
        bucket.id = globalScope.GetBucketKey(nIndex);
        if (!store.WriteScoreBucket(bucket)) {
            return error("%s: failed to write %s", __func__, bucket.id);
        }
    }

    const CTopK previous = LoadTopK(store, globalScope);
    CTopK next = LoadTopK(store, epochScope);
    next.id = globalScope.GetPrefix();
    if (!WriteTopKRows(store, globalScope, previous, next)) {
        return false;
    }

    CLeaderboardTotals totals = LoadTotals(store, epochScope);
    totals.id = globalScope.GetPrefix();
    if (!store.WriteTotals(totals)) {
        return error("%s: failed to write %s", __func__, totals.id);
    }

    LogPrint(BCLog::RANKING, "SyncGlobalMirror: epoch=%d user=%s topk=%u\n",
             nEpoch, user, (unsigned)next.vEntries.size());
    return true;
}

bool ResetGlobalMirror(CPointsStore& store, int nEpoch, int64_t nTime)
{
    const CRankingScope globalScope = CRankingScope::Global(nEpoch);

    const CTopK previous = LoadTopK(store, globalScope);
    CTopK empty;
    empty.id = globalScope.GetPrefix();
    empty.nEpochNumber = nEpoch;
    empty.nUpdatedAt = nTime;
    if (!WriteTopKRows(store, globalScope, previous, empty)) {
        return false;
    }

    for (int i = 0; i < MAX_BUCKETS; ++i) {
        CScoreBucket bucket;
        if (!store.ReadScoreBucket(globalScope.GetBucketKey(i), bucket)) {
            continue;
        }
        bucket.nEpochNumber = nEpoch;
        bucket.nCount = 0;
        bucket.nUpdatedAt = nTime;
        if (!store.WriteScoreBucket(bucket)) {
            return error("%s: failed to write %s", __func__, bucket.id);
        }
    }

    CLeaderboardTotals totals;
    totals.id = globalScope.GetPrefix();
    totals.nEpochNumber = nEpoch;
    totals.nUpdatedAt = nTime;
    if (!store.WriteTotals(totals)) {
        return error("%s: failed to write %s", __func__, totals.id);
    }

    LogPrint(BCLog::RANKING, "ResetGlobalMirror: now mirroring epoch %d\n", nEpoch);
    return true;
}

} // namespace points_ranking
