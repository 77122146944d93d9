// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Event processing tests
 *
 * Tests:
 * 1. Event names and ids
 * 2. Replayed events are ignored
 * 3. Manual points with audit records
 * 4. Blacklisting removes ranks, unblacklisting restores them
 * 5. Malformed events are rejected and not marked processed
 * 6. Balance transfers clamp the sender
 * 7. Missing prerequisites are skipped
 * 8. Admin snapshots
 * 9. NFT ownership backfill
 * 10. veNFT lock events
 */

#include "test/test_pointsd.h"

#include "points/points_params.h"
#include "points/points_query.h"
#include "points/points_voting.h"

#include <stdexcept>

#include <boost/test/unit_test.hpp>

using points_query::CUserRank;
using points_ranking::CRankingScope;

/** Chain reader knowing a single balance, throwing for everyone else */
class CFixedChainReader : public points_voting::CChainReader
{
public:
    bool ReadBalance(const std::string& collection, const std::string& owner, int64_t& nBalance) override
    {
        if (owner == "0xb") {
            nBalance = 3;
            return true;
        }
        throw std::runtime_error("rpc unavailable");
    }
};

struct EventsTestingSetup : public BasicTestingSetup {
    EventsTestingSetup()
    {
        CEpochStartEvent start;
        start.nEpoch = 1;
        BOOST_REQUIRE(Process(MakeHeader(1, 1000), start));
    }

    CManualPointsAwardEvent Award(const std::string& user, const CPoints& points)
    {
        CManualPointsAwardEvent event;
        event.user = user;
        event.points = points;
        event.reason = "campaign";
        return event;
    }
};

BOOST_FIXTURE_TEST_SUITE(points_events_tests, EventsTestingSetup)

// ═══════════════════════════════════════════════════════════════════════════
// TEST 1: Names and ids
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(event_names_and_ids)
{
    const CEventHeader header = MakeHeader(7, 1000, 3);
    BOOST_CHECK_EQUAL(header.GetId(), "0x0000000000000000000000000000000000000000000000000000000000000007-3");

    BOOST_CHECK_EQUAL(CPointsEvent(header, CSupplyEvent()).GetName(), "Supply");
    BOOST_CHECK_EQUAL(CPointsEvent(header, CBalanceTransferEvent()).GetName(), "BalanceTransfer");
    BOOST_CHECK_EQUAL(CPointsEvent(header, CEpochStartEvent()).GetName(), "EpochStart");
    BOOST_CHECK_EQUAL(CPointsEvent(header, CManualPointsRemovalEvent()).GetName(), "ManualPointsRemoval");
    BOOST_CHECK_EQUAL(CPointsEvent(header, CSettlePointsEvent()).GetName(), "SettlePoints");
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 2: Replay protection
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(replayed_supply_is_ignored)
{
    AddReserve("0xr", 18, CBigInt(100000000), 1000);

    CSupplyEvent supply;
    supply.user = "0xu";
    supply.reserve = "0xr";
    supply.amount = TOKEN * 1000;

    const CEventHeader header = MakeHeader(2, 1100);
    BOOST_REQUIRE(Process(header, supply));
    BOOST_CHECK(store.ExistsProcessedEvent(header.GetId()));
    BOOST_REQUIRE(Process(header, supply));

    CUserReserve userReserve;
    BOOST_REQUIRE(store.ReadUserReserve("0xu", "0xr", userReserve));
    BOOST_CHECK(userReserve.scaledATokenBalance == TOKEN * 1000);

    // Same transaction, next log
    BOOST_REQUIRE(Process(MakeHeader(2, 1100, 1), supply));
    BOOST_REQUIRE(store.ReadUserReserve("0xu", "0xr", userReserve));
    BOOST_CHECK(userReserve.scaledATokenBalance == TOKEN * 2000);

    std::vector<std::string> reserves;
    BOOST_REQUIRE(store.ReadUserReserveIds("0xu", reserves));
    BOOST_CHECK_EQUAL(reserves.size(), 1U);
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 3: Manual points
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(manual_points_award_and_removal)
{
    const size_t nAuditBefore = store.CountAuditRecords();

    const CEventHeader awardHeader = MakeHeader(2, 1100);
    BOOST_REQUIRE(Process(awardHeader, Award("0xu", POINTS_SCALE * 5)));
    BOOST_REQUIRE(Process(awardHeader, Award("0xu", POINTS_SCALE * 5)));

    CUserEpochStats stats;
    BOOST_REQUIRE(store.ReadUserEpochStats("0xu", 1, stats));
    BOOST_CHECK(stats.manualAwardPoints == POINTS_SCALE * 5);

    CManualPointsRemovalEvent removal;
    removal.user = "0xu";
    removal.points = POINTS_SCALE * 2;
    removal.reason = "correction";
    BOOST_REQUIRE(Process(MakeHeader(3, 1200), removal));

    BOOST_REQUIRE(store.ReadUserEpochStats("0xu", 1, stats));
    BOOST_CHECK(stats.manualAwardPoints == POINTS_SCALE * 3);
    BOOST_CHECK(stats.totalPoints == POINTS_SCALE * 3);

    BOOST_CHECK_EQUAL(store.CountAuditRecords(), nAuditBefore + 2);
    CPointsAuditRecord record;
    BOOST_REQUIRE(store.ReadAuditRecord(awardHeader.GetId(), record));
    BOOST_CHECK_EQUAL(record.kind, AUDIT_MANUAL_AWARD);
    BOOST_CHECK_EQUAL(record.user, "0xu");
    BOOST_CHECK_EQUAL(record.nEpochNumber, 1);
    BOOST_CHECK(record.amount == POINTS_SCALE * 5);
    BOOST_CHECK_EQUAL(record.reason, "campaign");

    // Negative amounts are malformed
    BOOST_CHECK(!Process(MakeHeader(4, 1300), Award("0xu", POINTS_SCALE * -1)));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 4: Blacklist
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(blacklist_and_restore)
{
    BOOST_REQUIRE(Process(MakeHeader(2, 1100), Award("0xu", POINTS_SCALE * 3)));
    BOOST_REQUIRE(Process(MakeHeader(3, 1100), Award("0xv", POINTS_SCALE * 1)));

    CUserRank rank;
    BOOST_REQUIRE(points_query::GetUserRank(store, CRankingScope::Epoch(1), "0xu", rank));
    BOOST_CHECK_EQUAL(rank.nRank, 1);

    CUserBlacklistEvent blacklist;
    blacklist.user = "0xu";
    BOOST_REQUIRE(Process(MakeHeader(4, 1200), blacklist));

    BOOST_CHECK(store.LoadUserLeaderboardState_OrNew("0xu").fBlacklisted);
    BOOST_CHECK(!points_query::GetUserRank(store, CRankingScope::Epoch(1), "0xu", rank));
    BOOST_CHECK(!points_query::GetUserRank(store, CRankingScope::AllTime(), "0xu", rank));
    BOOST_CHECK(!points_query::GetUserRank(store, points_query::GetGlobalScope(store), "0xu", rank));
    BOOST_REQUIRE(points_query::GetUserRank(store, CRankingScope::Epoch(1), "0xv", rank));
    BOOST_CHECK_EQUAL(rank.nRank, 1);

    // Points still accrue but are not ranked
    BOOST_REQUIRE(Process(MakeHeader(5, 1300), Award("0xu", POINTS_SCALE * 1)));
    BOOST_CHECK(!points_query::GetUserRank(store, CRankingScope::Epoch(1), "0xu", rank));
    CUserEpochStats stats;
    BOOST_REQUIRE(store.ReadUserEpochStats("0xu", 1, stats));
    BOOST_CHECK(stats.totalPoints == POINTS_SCALE * 4);

    blacklist.fBlacklisted = false;
    BOOST_REQUIRE(Process(MakeHeader(6, 1400), blacklist));

    BOOST_REQUIRE(points_query::GetUserRank(store, CRankingScope::Epoch(1), "0xu", rank));
    BOOST_CHECK(rank.fExact);
    BOOST_CHECK_EQUAL(rank.nRank, 1);
    BOOST_CHECK_EQUAL(rank.points, 4.0);
    BOOST_REQUIRE(points_query::GetUserRank(store, points_query::GetGlobalScope(store), "0xu", rank));
    BOOST_CHECK_EQUAL(rank.nRank, 1);
    BOOST_REQUIRE(points_query::GetUserRank(store, CRankingScope::AllTime(), "0xu", rank));
    BOOST_CHECK_EQUAL(rank.points, 4.0);

    CPointsAuditRecord record;
    BOOST_REQUIRE(store.ReadAuditRecord(MakeHeader(6, 1400).GetId(), record));
    BOOST_CHECK_EQUAL(record.kind, AUDIT_BLACKLIST);
    BOOST_CHECK_EQUAL(record.reason, "unblacklisted");
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 5: Malformed events
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(malformed_events_rejected)
{
    AddReserve("0xr", 18, CBigInt(100000000), 1000);

    CSupplyEvent supply;
    supply.user = "0xu";
    supply.reserve = "0xr";
    supply.amount = TOKEN;

    CEventHeader header = MakeHeader(2, 1100);
    header.txHash.clear();
    CPointsEventState state;
    BOOST_CHECK(!ProcessPointsEvent(store, CPointsEvent(header, supply), state));
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-event-id");

    header = MakeHeader(2, 0);
    state = CPointsEventState();
    BOOST_CHECK(!ProcessPointsEvent(store, CPointsEvent(header, supply), state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-event-position");

    supply.amount = TOKEN * -1;
    header = MakeHeader(3, 1200);
    state = CPointsEventState();
    BOOST_CHECK(!ProcessPointsEvent(store, CPointsEvent(header, supply), state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "bad-amount");
    BOOST_CHECK(!store.ExistsProcessedEvent(header.GetId()));

    CUserReserve userReserve;
    BOOST_CHECK(!store.ReadUserReserve("0xu", "0xr", userReserve));

    CEpochStartEvent start;
    start.nEpoch = 0;
    BOOST_CHECK(!Process(MakeHeader(4, 1300), start));

    CVotingPowerTierSetEvent tier;
    tier.tier.nIndex = MAX_VP_TIERS;
    tier.tier.nMultiplierBps = 12000;
    BOOST_CHECK(!Process(MakeHeader(5, 1300), tier));

    CLpPositionUpdatedEvent lp;
    lp.user = "0xu";
    lp.valueUsd = -5;
    BOOST_CHECK(!Process(MakeHeader(6, 1300), lp));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 6: Balance transfers
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(transfer_clamps_sender)
{
    AddReserve("0xr", 18, CBigInt(100000000), 1000);

    CSupplyEvent supply;
    supply.user = "0xa";
    supply.reserve = "0xr";
    supply.amount = TOKEN * 100;
    BOOST_REQUIRE(Process(MakeHeader(2, 1100), supply));

    CBalanceTransferEvent transfer;
    transfer.reserve = "0xr";
    transfer.from = "0xa";
    transfer.to = "0xb";
    transfer.amount = TOKEN * 150;
    BOOST_REQUIRE(Process(MakeHeader(3, 1200), transfer));

    CUserReserve userReserve;
    BOOST_REQUIRE(store.ReadUserReserve("0xa", "0xr", userReserve));
    BOOST_CHECK(userReserve.scaledATokenBalance == 0);
    BOOST_REQUIRE(store.ReadUserReserve("0xb", "0xr", userReserve));
    BOOST_CHECK(userReserve.scaledATokenBalance == TOKEN * 150);

    // Withdrawing more than held clamps at zero as well
    CWithdrawEvent withdraw;
    withdraw.user = "0xb";
    withdraw.reserve = "0xr";
    withdraw.amount = TOKEN * 1000;
    BOOST_REQUIRE(Process(MakeHeader(4, 1300), withdraw));
    BOOST_REQUIRE(store.ReadUserReserve("0xb", "0xr", userReserve));
    BOOST_CHECK(userReserve.scaledATokenBalance == 0);

    // Borrow and repay move the debt side only
    CBorrowEvent borrow;
    borrow.user = "0xb";
    borrow.reserve = "0xr";
    borrow.amount = TOKEN * 10;
    BOOST_REQUIRE(Process(MakeHeader(5, 1400), borrow));
    CRepayEvent repay;
    repay.user = "0xb";
    repay.reserve = "0xr";
    repay.amount = TOKEN * 4;
    BOOST_REQUIRE(Process(MakeHeader(6, 1500), repay));
    BOOST_REQUIRE(store.ReadUserReserve("0xb", "0xr", userReserve));
    BOOST_CHECK(userReserve.scaledVariableDebt == TOKEN * 6);
    BOOST_CHECK(userReserve.scaledATokenBalance == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 7: Missing prerequisites
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(missing_prerequisites_skipped)
{
    CSupplyEvent supply;
    supply.user = "0xu";
    supply.reserve = "0xunknown";
    supply.amount = TOKEN;

    const CEventHeader header = MakeHeader(2, 1100);
    BOOST_REQUIRE(Process(header, supply));
    BOOST_CHECK(store.ExistsProcessedEvent(header.GetId()));
    CUserReserve userReserve;
    BOOST_CHECK(!store.ReadUserReserve("0xu", "0xunknown", userReserve));

    // Mints to the null address are ignored
    AddReserve("0xr", 18, CBigInt(100000000), 1000);
    supply.user = NULL_ADDRESS;
    supply.reserve = "0xr";
    BOOST_REQUIRE(Process(MakeHeader(3, 1200), supply));
    BOOST_CHECK(!store.ReadUserReserve(NULL_ADDRESS, "0xr", userReserve));

    CLockWithdrawEvent withdraw;
    withdraw.tokenId = "42";
    BOOST_REQUIRE(Process(MakeHeader(4, 1300), withdraw));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 8: Admin snapshots
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(admin_snapshots)
{
    CConfigSnapshotEvent snapshot;
    snapshot.config.nDepositRateBps = 250;
    snapshot.config.nCooldownSeconds = 60;
    snapshot.config.dailyBonus[DAILY_BORROW] = POINTS_SCALE * 2;
    const CEventHeader header = MakeHeader(2, 1100);
    BOOST_REQUIRE(Process(header, snapshot));

    CLeaderboardConfig config = store.LoadConfig_OrDefault();
    BOOST_CHECK_EQUAL(config.nDepositRateBps, 250U);
    BOOST_CHECK_EQUAL(config.nCooldownSeconds, 60);
    BOOST_CHECK(config.dailyBonus[DAILY_BORROW] == POINTS_SCALE * 2);
    BOOST_CHECK_EQUAL(config.nUpdatedAt, 1100);

    CPointsAuditRecord record;
    BOOST_REQUIRE(store.ReadAuditRecord(header.GetId(), record));
    BOOST_CHECK_EQUAL(record.kind, AUDIT_CONFIG);

    CVotingPowerTierSetEvent tier;
    tier.tier.nIndex = 0;
    tier.tier.minVotingPower = TOKEN * 100;
    tier.tier.nMultiplierBps = 15000;
    tier.tier.fActive = true;
    BOOST_REQUIRE(Process(MakeHeader(3, 1200), tier));

    std::vector<CVotingPowerTier> tiers;
    BOOST_REQUIRE(store.ReadVotingPowerTiers(tiers));
    BOOST_REQUIRE_EQUAL(tiers.size(), 1U);
    BOOST_CHECK_EQUAL(tiers[0].nMultiplierBps, 15000U);

    CNftPartnershipSetEvent partnership;
    partnership.partnership.collection = "0xnft";
    partnership.partnership.name = "Partner";
    partnership.partnership.fActive = true;
    BOOST_REQUIRE(Process(MakeHeader(4, 1300), partnership));

    CNftPartnership stored;
    BOOST_REQUIRE(store.ReadNftPartnership("0xnft", stored));
    BOOST_CHECK(stored.fActive);
    BOOST_CHECK_EQUAL(stored.name, "Partner");
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 9: NFT ownership backfill
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(nft_ownership_backfill)
{
    CNftPartnershipSetEvent partnership;
    partnership.partnership.collection = "0xnft";
    partnership.partnership.fActive = true;
    BOOST_REQUIRE(Process(MakeHeader(2, 1100), partnership));

    CFixedChainReader reader;
    CNftTransferEvent transfer;
    transfer.collection = "0xnft";
    transfer.from = "0xa";
    transfer.to = "0xb";

    CPointsEventState state;
    BOOST_REQUIRE(ProcessPointsEvent(store, CPointsEvent(MakeHeader(3, 1200), transfer), state, &reader));
    BOOST_CHECK(state.IsValid());

    // 0xb read from the chain after the transfer, 0xa fell back to zero
    CUserNftOwnership ownership;
    BOOST_REQUIRE(store.ReadUserNftOwnership("0xb", "0xnft", ownership));
    BOOST_CHECK_EQUAL(ownership.nBalance, 3);
    BOOST_REQUIRE(store.ReadUserNftOwnership("0xa", "0xnft", ownership));
    BOOST_CHECK_EQUAL(ownership.nBalance, 0);

    CUserLeaderboardState userState = store.LoadUserLeaderboardState_OrNew("0xb");
    BOOST_CHECK_EQUAL(userState.nNftCount, 1U);
    BOOST_CHECK(userState.nCombinedMultiplierBps >= BASE_MULTIPLIER_BPS);

    // Known balances move without the reader
    transfer.from = "0xb";
    transfer.to = "0xa";
    transfer.nCount = 2;
    BOOST_REQUIRE(Process(MakeHeader(4, 1300), transfer));
    BOOST_REQUIRE(store.ReadUserNftOwnership("0xb", "0xnft", ownership));
    BOOST_CHECK_EQUAL(ownership.nBalance, 1);
    BOOST_REQUIRE(store.ReadUserNftOwnership("0xa", "0xnft", ownership));
    BOOST_CHECK_EQUAL(ownership.nBalance, 2);

    transfer.nCount = 0;
    BOOST_CHECK(!Process(MakeHeader(5, 1400), transfer));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 10: veNFT locks
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(lock_events)
{
    CLockDepositEvent deposit;
    deposit.tokenId = "7";
    deposit.owner = "0xa";
    deposit.amount = TOKEN * 1000;
    deposit.nLockEnd = 1100 + MAX_LOCK_TIME;
    BOOST_REQUIRE(Process(MakeHeader(2, 1100), deposit));

    BOOST_CHECK_EQUAL(points_voting::GetLockOwner(store, "7"), "0xa");
    BOOST_CHECK(store.LoadUserLeaderboardState_OrNew("0xa").votingPower == TOKEN * 1000);

    CLockTransferEvent transfer;
    transfer.tokenId = "7";
    transfer.from = "0xa";
    transfer.to = "0xb";
    BOOST_REQUIRE(Process(MakeHeader(3, 1100), transfer));
    BOOST_CHECK_EQUAL(points_voting::GetLockOwner(store, "7"), "0xb");
    BOOST_CHECK(store.LoadUserLeaderboardState_OrNew("0xa").votingPower == 0);
    BOOST_CHECK(store.LoadUserLeaderboardState_OrNew("0xb").votingPower == TOKEN * 1000);

    CLockWithdrawEvent withdraw;
    withdraw.tokenId = "7";
    BOOST_REQUIRE(Process(MakeHeader(4, 1200), withdraw));
    BOOST_CHECK(points_voting::GetLockOwner(store, "7").empty());
    BOOST_CHECK(store.LoadUserLeaderboardState_OrNew("0xb").votingPower == 0);
}

BOOST_AUTO_TEST_SUITE_END()
