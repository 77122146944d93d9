// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Leaderboard query tests
 *
 * Tests:
 * 1. Exact ranks inside the TopK
 * 2. Rank ranges below the TopK
 * 3. Users in a score range
 * 4. Histogram
 * 5. Top entries clamping
 * 6. Global scope resolution
 * 7. User summary
 */

#include "test/test_pointsd.h"

#include "points/points_epoch.h"
#include "points/points_leaderboard.h"
#include "points/points_params.h"
#include "points/points_query.h"
#include "points/points_ranking.h"
#include "util/format.h"

#include <cmath>
#include <limits>

#include <boost/test/unit_test.hpp>

using namespace points_query;
using points_ranking::CRankingScope;

/** Users 0xuser001..0xuser105 scoring 1..105 in epoch 1 */
struct QueryTestingSetup : public BasicTestingSetup {
    const CRankingScope scope = CRankingScope::Epoch(1);

    QueryTestingSetup()
    {
        for (int i = 1; i <= 105; ++i) {
            BOOST_REQUIRE(points_ranking::UpdateUserScore(store, scope, strprintf("0xuser%03d", i), i, 100));
        }
    }
};

BOOST_FIXTURE_TEST_SUITE(points_query_tests, QueryTestingSetup)

// ═══════════════════════════════════════════════════════════════════════════
// TEST 1: Exact ranks
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(exact_rank_in_topk)
{
    CUserRank rank;
    BOOST_REQUIRE(GetUserRank(store, scope, "0xuser105", rank));
    BOOST_CHECK(rank.fExact);
    BOOST_CHECK_EQUAL(rank.nRank, 1);
    BOOST_CHECK_EQUAL(rank.nRankLow, 1);
    BOOST_CHECK_EQUAL(rank.nRankHigh, 1);
    BOOST_CHECK_EQUAL(rank.points, 105.0);

    BOOST_REQUIRE(GetUserRank(store, scope, "0xuser006", rank));
    BOOST_CHECK(rank.fExact);
    BOOST_CHECK_EQUAL(rank.nRank, 100);

    // Unknown users have no rank
    BOOST_CHECK(!GetUserRank(store, scope, "0xnobody", rank));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 2: Rank ranges
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(rank_range_below_topk)
{
    CUserRank rank;

    // Alone in [1, 2), below everyone else
    BOOST_REQUIRE(GetUserRank(store, scope, "0xuser001", rank));
    BOOST_CHECK(!rank.fExact);
    BOOST_CHECK_EQUAL(rank.nRank, 0);
    BOOST_CHECK_EQUAL(rank.nBucketIndex, 3);
    BOOST_CHECK_EQUAL(rank.nRankLow, 105);
    BOOST_CHECK_EQUAL(rank.nRankHigh, 105);

    // [4, 8) holds 4..7, 98 users score 8 or more, the TopK fills ranks 1..100
    BOOST_REQUIRE(GetUserRank(store, scope, "0xuser005", rank));
    BOOST_CHECK(!rank.fExact);
    BOOST_CHECK_EQUAL(rank.nBucketIndex, 5);
    BOOST_CHECK_EQUAL(rank.nRankLow, 101);
    BOOST_CHECK_EQUAL(rank.nRankHigh, 102);

    // A zeroed user keeps its index but has no rank
    BOOST_REQUIRE(points_ranking::UpdateUserScore(store, scope, "0xuser002", 0, 200));
    BOOST_CHECK(!GetUserRank(store, scope, "0xuser002", rank));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 3: Users in range
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(count_users_in_range)
{
    BOOST_CHECK_EQUAL(CountUsersInRange(store, scope, 4, 7.9), 4);
    BOOST_CHECK_EQUAL(CountUsersInRange(store, scope, 0, std::numeric_limits<double>::infinity()), 105);
    BOOST_CHECK_EQUAL(CountUsersInRange(store, scope, 64, 1000), 42);

    // Bucket granularity: 5..6 still counts the whole [4, 8) bucket
    BOOST_CHECK_EQUAL(CountUsersInRange(store, scope, 5, 6), 4);

    BOOST_CHECK_EQUAL(CountUsersInRange(store, scope, 10, 5), 0);
    BOOST_CHECK_EQUAL(CountUsersInRange(store, scope, std::nan(""), 5), 0);
    BOOST_CHECK_EQUAL(CountUsersInRange(store, CRankingScope::Epoch(9), 0, 1000), 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 4: Histogram
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(histogram)
{
    std::vector<CScoreBucket> vBuckets = GetHistogram(store, scope);
    BOOST_REQUIRE_EQUAL(vBuckets.size(), 7U);

    int64_t nTotal = 0;
    for (const CScoreBucket& bucket : vBuckets) {
        BOOST_CHECK(bucket.nCount > 0);
        nTotal += bucket.nCount;
    }
    BOOST_CHECK_EQUAL(nTotal, 105);
    BOOST_CHECK_EQUAL(vBuckets.front().nIndex, 3);
    BOOST_CHECK_EQUAL(vBuckets.back().nIndex, 9);
    BOOST_CHECK_EQUAL(vBuckets.back().nCount, 42);
    BOOST_CHECK_EQUAL(GetUsersWithPoints(store, scope), 105);
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 5: Top entries
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(top_entries_clamped)
{
    std::vector<CTopKEntry> vEntries = GetTopEntries(store, scope, 5);
    BOOST_REQUIRE_EQUAL(vEntries.size(), 5U);
    BOOST_CHECK_EQUAL(vEntries[0].user, "0xuser105");
    BOOST_CHECK_EQUAL(vEntries[4].user, "0xuser101");
    BOOST_CHECK_EQUAL(vEntries[4].nRank, 5);

    BOOST_CHECK_EQUAL((int)GetTopEntries(store, scope, 500).size(), MAX_TOP_K);
    BOOST_CHECK(GetTopEntries(store, scope, -1).empty());
    BOOST_CHECK(GetTopEntries(store, CRankingScope::Epoch(2), 10).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 6: Global scope
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(global_scope_resolution)
{
    BOOST_REQUIRE(points_epoch::StartEpoch(store, 1, 100, 1));
    BOOST_REQUIRE(points_leaderboard::UpdateLeaderboard(store, "0xa", 200, 200));

    CRankingScope global = GetGlobalScope(store);
    BOOST_CHECK(global.IsGlobal());
    BOOST_CHECK_EQUAL(global.GetEpoch(), 1);

    CUserRank rank;
    BOOST_REQUIRE(GetUserRank(store, global, "0xa", rank));
    BOOST_CHECK(rank.fExact);
    BOOST_CHECK_EQUAL(rank.nRank, 1);

    // The next epoch starts with an empty mirror
    BOOST_REQUIRE(points_epoch::StartEpoch(store, 2, 300, 2));
    global = GetGlobalScope(store);
    BOOST_CHECK_EQUAL(global.GetEpoch(), 2);
    BOOST_CHECK(GetTopEntries(store, global, 10).empty());
    BOOST_CHECK(!GetUserRank(store, global, "0xa", rank));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 7: User summary
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(user_summary)
{
    CUserPointsSummary summary = GetUserSummary(store, "0xa");
    BOOST_CHECK_EQUAL(summary.nCurrentEpoch, 0);
    BOOST_CHECK(!summary.fHasEpochRank);
    BOOST_CHECK(!summary.fHasAllTimeRank);

    BOOST_REQUIRE(points_epoch::StartEpoch(store, 3, 100, 1));
    BOOST_REQUIRE(points_leaderboard::UpdateLeaderboardForEpoch(store, "0xa", 3, 12, 200));
    BOOST_REQUIRE(points_leaderboard::UpdateAllTimeLeaderboard(store, "0xa", 30, 200));

    summary = GetUserSummary(store, "0xa");
    BOOST_CHECK_EQUAL(summary.user, "0xa");
    BOOST_CHECK_EQUAL(summary.nCurrentEpoch, 3);
    BOOST_CHECK(summary.fHasEpochRank);
    BOOST_CHECK(summary.epochRank.fExact);
    BOOST_CHECK_EQUAL(summary.epochRank.nRank, 1);
    BOOST_CHECK(summary.fHasAllTimeRank);
    BOOST_CHECK_EQUAL(summary.allTimeRank.points, 30.0);
    BOOST_CHECK_EQUAL(summary.currentStats.nEpochNumber, 3);
}

BOOST_AUTO_TEST_SUITE_END()
