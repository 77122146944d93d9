// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_events.h"

#include "util/format.h"

std::string CEventHeader::GetId() const
{
    return strprintf("%s-%d", txHash, nLogIndex);
}

static const char* EventName(const CReserveDataUpdatedEvent&) { return "ReserveDataUpdated"; }
static const char* EventName(const CSupplyEvent&) { return "Supply"; }
static const char* EventName(const CWithdrawEvent&) { return "Withdraw"; }
static const char* EventName(const CBorrowEvent&) { return "Borrow"; }
static const char* EventName(const CRepayEvent&) { return "Repay"; }
static const char* EventName(const CBalanceTransferEvent&) { return "BalanceTransfer"; }
static const char* EventName(const CLpPositionUpdatedEvent&) { return "LpPositionUpdated"; }
static const char* EventName(const CLockDepositEvent&) { return "LockDeposit"; }
static const char* EventName(const CLockWithdrawEvent&) { return "LockWithdraw"; }
static const char* EventName(const CLockPermanentEvent&) { return "LockPermanent"; }
static const char* EventName(const CLockTransferEvent&) { return "LockTransfer"; }
static const char* EventName(const CNftTransferEvent&) { return "NftTransfer"; }
static const char* EventName(const CConfigSnapshotEvent&) { return "ConfigSnapshot"; }
static const char* EventName(const CVotingPowerTierSetEvent&) { return "VotingPowerTierSet"; }
static const char* EventName(const CNftPartnershipSetEvent&) { return "NftPartnershipSet"; }
static const char* EventName(const CEpochStartEvent&) { return "EpochStart"; }
static const char* EventName(const CEpochEndEvent&) { return "EpochEnd"; }
static const char* EventName(const CManualPointsAwardEvent&) { return "ManualPointsAward"; }
static const char* EventName(const CManualPointsRemovalEvent&) { return "ManualPointsRemoval"; }
static const char* EventName(const CUserBlacklistEvent&) { return "UserBlacklist"; }
static const char* EventName(const CSettlePointsEvent&) { return "SettlePoints"; }

std::string CPointsEvent::GetName() const
{
    return std::visit([](const auto& payload) { return std::string(EventName(payload)); }, payload);
}
