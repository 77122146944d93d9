// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_EVENTS_H
#define POINTSD_POINTS_EVENTS_H

#include "points/points_amount.h"
#include "points/points_state.h"

#include <optional>
#include <stdint.h>
#include <string>
#include <variant>

/**
 * Inbound events
 *
 * Every event is a header (chain position and origin) plus one payload of
 * the closed CPointsEventPayload union. Addresses are expected lower case.
 */

/** Chain position of an event; (nBlock, nLogIndex) orders the stream */
struct CEventHeader
{
    int64_t nBlock;
    int64_t nTime;
    int nLogIndex;
    std::string txHash;
    std::string source;

    CEventHeader() : nBlock(0), nTime(0), nLogIndex(0) {}

    /** "txHash-logIndex", unique per event */
    std::string GetId() const;
};

// ============================================================================
// Reserves and interest-bearing tokens
// ============================================================================

struct CReserveDataUpdatedEvent
{
    std::string reserve;
    std::optional<std::string> symbol;
    std::optional<int> nDecimals;
    CBigInt liquidityRate;
    CBigInt variableBorrowRate;
    CBigInt liquidityIndex;
    CBigInt variableBorrowIndex;
    std::optional<CBigInt> priceUsdE8;
};

/** Balance change of one user in one reserve (amount in token base units) */
struct CReserveBalanceEvent
{
    std::string user;
    std::string reserve;
    CBigInt amount;

    CReserveBalanceEvent() : amount(0) {}
};

/** aToken mint */
struct CSupplyEvent : public CReserveBalanceEvent {};
/** aToken burn */
struct CWithdrawEvent : public CReserveBalanceEvent {};
/** Variable debt mint */
struct CBorrowEvent : public CReserveBalanceEvent {};
/** Variable debt burn */
struct CRepayEvent : public CReserveBalanceEvent {};

/** aToken transfer between two users */
struct CBalanceTransferEvent
{
    std::string reserve;
    std::string from;
    std::string to;
    CBigInt amount;

    CBalanceTransferEvent() : amount(0) {}
};

// ============================================================================
// LP, veNFT and partner NFTs
// ============================================================================

struct CLpPositionUpdatedEvent
{
    std::string user;
    double valueUsd;

    CLpPositionUpdatedEvent() : valueUsd(0) {}
};

struct CLockDepositEvent
{
    std::string tokenId;
    std::string owner;
    CBigInt amount;
    std::optional<int64_t> nLockEnd;

    CLockDepositEvent() : amount(0) {}
};

struct CLockWithdrawEvent
{
    std::string tokenId;
};

struct CLockPermanentEvent
{
    std::string tokenId;
    bool fPermanent;

    CLockPermanentEvent() : fPermanent(true) {}
};

struct CLockTransferEvent
{
    std::string tokenId;
    std::string from;
    std::string to;
};

struct CNftTransferEvent
{
    std::string collection;
    std::string from;
    std::string to;
    int64_t nCount;

    CNftTransferEvent() : nCount(1) {}
};

// ============================================================================
// Admin
// ============================================================================

struct CConfigSnapshotEvent
{
    CLeaderboardConfig config;
};

/** Add, update or (with fActive = false) disable a voting power tier */
struct CVotingPowerTierSetEvent
{
    CVotingPowerTier tier;
};

struct CNftPartnershipSetEvent
{
    CNftPartnership partnership;
};

struct CEpochStartEvent
{
    int nEpoch;
    std::optional<int64_t> nStartTime;

    CEpochStartEvent() : nEpoch(0) {}
};

struct CEpochEndEvent
{
    int nEpoch;
    std::optional<int64_t> nEndTime;

    CEpochEndEvent() : nEpoch(0) {}
};

struct CManualPointsEvent
{
    std::string user;
    CPoints points;
    std::string reason;
    std::optional<int64_t> nTimestamp;

    CManualPointsEvent() : points(0) {}
};

struct CManualPointsAwardEvent : public CManualPointsEvent {};
struct CManualPointsRemovalEvent : public CManualPointsEvent {};

struct CUserBlacklistEvent
{
    std::string user;
    bool fBlacklisted;

    CUserBlacklistEvent() : fBlacklisted(true) {}
};

/** Explicit settlement of one user */
struct CSettlePointsEvent
{
    std::string user;
    bool fIgnoreCooldown;

    CSettlePointsEvent() : fIgnoreCooldown(false) {}
};

typedef std::variant<
    CReserveDataUpdatedEvent,
    CSupplyEvent,
    CWithdrawEvent,
    CBorrowEvent,
    CRepayEvent,
    CBalanceTransferEvent,
    CLpPositionUpdatedEvent,
    CLockDepositEvent,
    CLockWithdrawEvent,
    CLockPermanentEvent,
    CLockTransferEvent,
    CNftTransferEvent,
    CConfigSnapshotEvent,
    CVotingPowerTierSetEvent,
    CNftPartnershipSetEvent,
    CEpochStartEvent,
    CEpochEndEvent,
    CManualPointsAwardEvent,
    CManualPointsRemovalEvent,
    CUserBlacklistEvent,
    CSettlePointsEvent>
    CPointsEventPayload;

struct CPointsEvent
{
    CEventHeader header;
    CPointsEventPayload payload;

    CPointsEvent() {}
    CPointsEvent(const CEventHeader& headerIn, const CPointsEventPayload& payloadIn) : header(headerIn), payload(payloadIn) {}

    /** Event name as it appears in the JSON stream ("Supply", "EpochStart", ...) */
    std::string GetName() const;
};

#endif // POINTSD_POINTS_EVENTS_H
