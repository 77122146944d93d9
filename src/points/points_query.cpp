// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_query.h"

#include "points/points_params.h"

#include <algorithm>
#include <cmath>

using points_ranking::CRankingScope;

namespace points_query {

CRankingScope GetGlobalScope(CPointsStore& store)
{
    return CRankingScope::Global(store.LoadLeaderboardState_OrNew().nGlobalMirrorEpoch);
}

std::vector<CTopKEntry> GetTopEntries(CPointsStore& store, const CRankingScope& scope, int nCount)
{
    nCount = std::max(0, std::min(nCount, MAX_TOP_K));

    const CTopK topK = points_ranking::LoadTopK(store, scope);
    std::vector<CTopKEntry> vEntries;
    for (size_t i = 0; i < topK.vEntries.size() && (int)vEntries.size() < nCount; ++i) {
        CTopKEntry entry = topK.vEntries[i];
        entry.nRank = (int)i + 1;
        vEntries.push_back(entry);
    }
    return vEntries;
}

bool GetUserRank(CPointsStore& store, const CRankingScope& scope, const std::string& user, CUserRank& rank)
{
    rank = CUserRank();
    rank.user = user;

    CUserIndex index;
    if (!store.ReadUserIndex(scope.GetUserIndexKey(user), index)) {
        return false;
    }
    // Global rows left over from an earlier mirrored epoch
    if (scope.IsGlobal() && index.nEpochNumber != scope.GetEpoch()) {
        return false;
    }
    if (index.nBucketIndex < 0 || index.points <= 0) {
        return false;
    }
    rank.points = index.points;
    rank.nBucketIndex = index.nBucketIndex;

    const CTopK topK = points_ranking::LoadTopK(store, scope);
    for (size_t i = 0; i < topK.vEntries.size(); ++i) {
        if (topK.vEntries[i].user == user) {
            rank.fExact = true;
            rank.nRank = (int)i + 1;
            rank.nRankLow = rank.nRank;
            rank.nRankHigh = rank.nRank;
            return true;
        }
    }

    int64_t nAbove = 0;
    for (int i = index.nBucketIndex + 1; i < MAX_BUCKETS; ++i) {
        CScoreBucket bucket;
        if (store.ReadScoreBucket(scope.GetBucketKey(i), bucket)) {
            nAbove += bucket.nCount;
        }
    }
    const CScoreBucket own = points_ranking::LoadScoreBucket(store, scope, index.nBucketIndex);

    // Everyone in the TopK ranks ahead of a user outside it
    const int64_t nLow = std::max<int64_t>(nAbove + 1, (int64_t)topK.vEntries.size() + 1);
    const int64_t nHigh = std::max<int64_t>(nLow, nAbove + own.nCount);
    rank.nRankLow = (int)std::min<int64_t>(nLow, MAX_BUCKET_COUNT);
    rank.nRankHigh = (int)std::min<int64_t>(nHigh, MAX_BUCKET_COUNT);
    return true;
}

int64_t CountUsersInRange(CPointsStore& store, const CRankingScope& scope, double minPoints, double maxPoints)
{
    if (std::isnan(minPoints) || std::isnan(maxPoints) || maxPoints < minPoints) {
        return 0;
    }
    const int nFirst = points_ranking::GetBucketIndex(std::max(minPoints, 0.0));
    const int nLast = std::isinf(maxPoints) ? MAX_BUCKETS - 1 : points_ranking::GetBucketIndex(std::max(maxPoints, 0.0));

    int64_t nUsers = 0;
    for (int i = nFirst; i <= nLast; ++i) {
        CScoreBucket bucket;
        if (store.ReadScoreBucket(scope.GetBucketKey(i), bucket)) {
            nUsers += bucket.nCount;
        }
    }
    return nUsers;
}

std::vector<CScoreBucket> GetHistogram(CPointsStore& store, const CRankingScope& scope)
{
    std::vector<CScoreBucket> vBuckets;
    for (int i = 0; i < MAX_BUCKETS; ++i) {
        CScoreBucket bucket;
        if (store.ReadScoreBucket(scope.GetBucketKey(i), bucket) && bucket.nCount > 0) {
            vBuckets.push_back(bucket);
        }
    }
    return vBuckets;
}

int32_t GetUsersWithPoints(CPointsStore& store, const CRankingScope& scope)
{
    return points_ranking::LoadTotals(store, scope).nUsersWithPoints;
}

CUserPointsSummary GetUserSummary(CPointsStore& store, const std::string& user)
{
    CUserPointsSummary summary;
    summary.user = user;
    summary.state = store.LoadUserLeaderboardState_OrNew(user);
    summary.nCurrentEpoch = store.LoadLeaderboardState_OrNew().nCurrentEpoch;

    if (summary.nCurrentEpoch > 0) {
        summary.currentStats = store.LoadUserEpochStats_OrNew(user, summary.nCurrentEpoch, 0);
        summary.fHasEpochRank = GetUserRank(store, CRankingScope::Epoch(summary.nCurrentEpoch), user, summary.epochRank);
    }
    summary.fHasAllTimeRank = GetUserRank(store, CRankingScope::AllTime(), user, summary.allTimeRank);
    return summary;
}

} // namespace points_query
