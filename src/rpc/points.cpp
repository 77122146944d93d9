// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpc/points.h"

#include "points/points_amount.h"
#include "points/points_epoch.h"
#include "points/points_params.h"
#include "util/format.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>

using points_ranking::CRankingScope;

UniValue JSONRPCError(int code, const std::string& message)
{
    UniValue error(UniValue::VOBJ);
    error.pushKV("code", code);
    error.pushKV("message", message);
    return error;
}

// ============================================================================
// Parameter readers
// ============================================================================

static bool ReadString(const UniValue& obj, const char* key, std::string& out, std::string& strError,
                       bool fRequired = true)
{
    const UniValue& value = find_value(obj, key);
    if (value.isNull()) {
        if (fRequired) strError = strprintf("missing %s", key);
        return !fRequired;
    }
    if (!value.isStr()) {
        strError = strprintf("%s must be a string", key);
        return false;
    }
    out = value.get_str();
    return true;
}

static bool ReadAddress(const UniValue& obj, const char* key, std::string& out, std::string& strError)
{
    if (!ReadString(obj, key, out, strError)) {
        return false;
    }
    boost::algorithm::to_lower(out);
    return true;
}

static bool ReadBigInt(const UniValue& obj, const char* key, CBigInt& out, std::string& strError,
                       bool fRequired = true)
{
    const UniValue& value = find_value(obj, key);
    if (value.isNull()) {
        if (fRequired) strError = strprintf("missing %s", key);
        return !fRequired;
    }
    if ((!value.isNum() && !value.isStr()) || !ParseBigInt(value.getValStr(), out)) {
        strError = strprintf("%s is not an integer", key);
        return false;
    }
    return true;
}

static bool ReadOptionalBigInt(const UniValue& obj, const char* key, std::optional<CBigInt>& out, std::string& strError)
{
    if (find_value(obj, key).isNull()) {
        out.reset();
        return true;
    }
    CBigInt value = 0;
    if (!ReadBigInt(obj, key, value, strError)) {
        return false;
    }
    out = value;
    return true;
}

static bool ReadInt64(const UniValue& obj, const char* key, int64_t& out, std::string& strError,
                      bool fRequired = true)
{
    const UniValue& value = find_value(obj, key);
    if (value.isNull()) {
        if (fRequired) strError = strprintf("missing %s", key);
        return !fRequired;
    }
    if (!value.isNum()) {
        strError = strprintf("%s must be a number", key);
        return false;
    }
    try {
        out = value.get_int64();
    } catch (const std::runtime_error& e) {
        strError = strprintf("%s: %s", key, e.what());
        return false;
    }
    return true;
}

static bool ReadOptionalInt64(const UniValue& obj, const char* key, std::optional<int64_t>& out, std::string& strError)
{
    if (find_value(obj, key).isNull()) {
        out.reset();
        return true;
    }
    int64_t nValue = 0;
    if (!ReadInt64(obj, key, nValue, strError)) {
        return false;
    }
    // 0 means "unset" on chain
    if (nValue > 0) {
        out = nValue;
    } else {
        out.reset();
    }
    return true;
}

static bool ReadUInt32(const UniValue& obj, const char* key, uint32_t& out, std::string& strError,
                       bool fRequired = true)
{
    int64_t nValue = out;
    if (!ReadInt64(obj, key, nValue, strError, fRequired)) {
        return false;
    }
    if (nValue < 0 || nValue > std::numeric_limits<uint32_t>::max()) {
        strError = strprintf("%s out of range", key);
        return false;
    }
    out = (uint32_t)nValue;
    return true;
}

static bool ReadDouble(const UniValue& obj, const char* key, double& out, std::string& strError,
                       bool fRequired = true)
{
    const UniValue& value = find_value(obj, key);
    if (value.isNull()) {
        if (fRequired) strError = strprintf("missing %s", key);
        return !fRequired;
    }
    if (!value.isNum()) {
        strError = strprintf("%s must be a number", key);
        return false;
    }
    out = value.get_real();
    return true;
}

static bool ReadBool(const UniValue& obj, const char* key, bool& out, std::string& strError)
{
    const UniValue& value = find_value(obj, key);
    if (value.isNull()) {
        return true;
    }
    if (!value.isBool()) {
        strError = strprintf("%s must be a boolean", key);
        return false;
    }
    out = value.get_bool();
    return true;
}

/** Scaled points (1e18 = 1 point) as an integer */
static bool ReadPoints(const UniValue& obj, const char* key, CPoints& out, std::string& strError,
                       bool fRequired = true)
{
    CBigInt value = out;
    if (!ReadBigInt(obj, key, value, strError, fRequired)) {
        return false;
    }
    if (value > CBigInt(std::numeric_limits<CPoints>::max()) || value < CBigInt(std::numeric_limits<CPoints>::min())) {
        strError = strprintf("%s out of range", key);
        return false;
    }
    out = static_cast<CPoints>(value);
    return true;
}

// ============================================================================
// Event decoders
// ============================================================================

typedef bool (*EventDecoder)(const UniValue& params, CPointsEventPayload& payload, std::string& strError);

static bool DecodeReserveDataUpdated(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CReserveDataUpdatedEvent event;
    std::string symbol;
    int64_t nDecimals = -1;
    if (!ReadAddress(params, "reserve", event.reserve, strError) ||
        !ReadString(params, "symbol", symbol, strError, false) ||
        !ReadInt64(params, "decimals", nDecimals, strError, false) ||
        !ReadBigInt(params, "liquidityRate", event.liquidityRate, strError) ||
        !ReadBigInt(params, "variableBorrowRate", event.variableBorrowRate, strError) ||
        !ReadBigInt(params, "liquidityIndex", event.liquidityIndex, strError) ||
        !ReadBigInt(params, "variableBorrowIndex", event.variableBorrowIndex, strError) ||
        !ReadOptionalBigInt(params, "priceUsdE8", event.priceUsdE8, strError)) {
        return false;
    }
    if (!symbol.empty()) event.symbol = symbol;
    if (nDecimals >= 0) event.nDecimals = (int)nDecimals;
    payload = event;
    return true;
}

template <typename T>
static bool DecodeReserveBalance(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    T event;
    if (!ReadAddress(params, "user", event.user, strError) ||
        !ReadAddress(params, "reserve", event.reserve, strError) ||
        !ReadBigInt(params, "amount", event.amount, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeBalanceTransfer(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CBalanceTransferEvent event;
    if (!ReadAddress(params, "reserve", event.reserve, strError) ||
        !ReadAddress(params, "from", event.from, strError) ||
        !ReadAddress(params, "to", event.to, strError) ||
        !ReadBigInt(params, "amount", event.amount, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeLpPositionUpdated(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CLpPositionUpdatedEvent event;
    if (!ReadAddress(params, "user", event.user, strError) ||
        !ReadDouble(params, "valueUsd", event.valueUsd, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeLockDeposit(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CLockDepositEvent event;
    if (!ReadString(params, "tokenId", event.tokenId, strError) ||
        !ReadAddress(params, "owner", event.owner, strError) ||
        !ReadBigInt(params, "amount", event.amount, strError) ||
        !ReadOptionalInt64(params, "lockEnd", event.nLockEnd, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeLockWithdraw(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CLockWithdrawEvent event;
    if (!ReadString(params, "tokenId", event.tokenId, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeLockPermanent(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CLockPermanentEvent event;
    if (!ReadString(params, "tokenId", event.tokenId, strError) ||
        !ReadBool(params, "permanent", event.fPermanent, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeLockTransfer(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CLockTransferEvent event;
    if (!ReadString(params, "tokenId", event.tokenId, strError) ||
        !ReadAddress(params, "from", event.from, strError) ||
        !ReadAddress(params, "to", event.to, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeNftTransfer(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CNftTransferEvent event;
    if (!ReadAddress(params, "collection", event.collection, strError) ||
        !ReadAddress(params, "from", event.from, strError) ||
        !ReadAddress(params, "to", event.to, strError) ||
        !ReadInt64(params, "count", event.nCount, strError, false)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeConfigSnapshot(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CConfigSnapshotEvent event;
    CLeaderboardConfig& config = event.config;
    if (!ReadUInt32(params, "depositRateBps", config.nDepositRateBps, strError, false) ||
        !ReadUInt32(params, "borrowRateBps", config.nBorrowRateBps, strError, false) ||
        !ReadUInt32(params, "vpRateBps", config.nVpRateBps, strError, false) ||
        !ReadUInt32(params, "lpRateBps", config.nLpRateBps, strError, false) ||
        !ReadPoints(params, "dailySupplyBonus", config.dailyBonus[DAILY_SUPPLY], strError, false) ||
        !ReadPoints(params, "dailyBorrowBonus", config.dailyBonus[DAILY_BORROW], strError, false) ||
        !ReadPoints(params, "dailyRepayBonus", config.dailyBonus[DAILY_REPAY], strError, false) ||
        !ReadPoints(params, "dailyWithdrawBonus", config.dailyBonus[DAILY_WITHDRAW], strError, false) ||
        !ReadDouble(params, "minDailyBonusUsd", config.nMinDailyBonusUsd, strError, false) ||
        !ReadInt64(params, "cooldownSeconds", config.nCooldownSeconds, strError, false) ||
        !ReadUInt32(params, "nftFirstBonusBps", config.nNftFirstBonusBps, strError, false) ||
        !ReadUInt32(params, "nftDecayRatioBps", config.nNftDecayRatioBps, strError, false)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeVotingPowerTierSet(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CVotingPowerTierSetEvent event;
    int64_t nIndex = 0;
    event.tier.fActive = true;
    if (!ReadInt64(params, "index", nIndex, strError) ||
        !ReadBigInt(params, "minVotingPower", event.tier.minVotingPower, strError) ||
        !ReadUInt32(params, "multiplierBps", event.tier.nMultiplierBps, strError) ||
        !ReadBool(params, "active", event.tier.fActive, strError)) {
        return false;
    }
    if (nIndex < 0 || nIndex > std::numeric_limits<int>::max()) {
        strError = "index out of range";
        return false;
    }
    event.tier.nIndex = (int)nIndex;
    payload = event;
    return true;
}

static bool DecodeNftPartnershipSet(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CNftPartnershipSetEvent event;
    event.partnership.fActive = true;
    if (!ReadAddress(params, "collection", event.partnership.collection, strError) ||
        !ReadString(params, "name", event.partnership.name, strError, false) ||
        !ReadBool(params, "active", event.partnership.fActive, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool ReadEpochNumber(const UniValue& params, int& nEpoch, std::string& strError)
{
    int64_t nValue = 0;
    if (!ReadInt64(params, "epoch", nValue, strError)) {
        return false;
    }
    if (nValue <= 0 || nValue > std::numeric_limits<int>::max()) {
        strError = "epoch out of range";
        return false;
    }
    nEpoch = (int)nValue;
    return true;
}

static bool DecodeEpochStart(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CEpochStartEvent event;
    if (!ReadEpochNumber(params, event.nEpoch, strError) ||
        !ReadOptionalInt64(params, "startTime", event.nStartTime, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeEpochEnd(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CEpochEndEvent event;
    if (!ReadEpochNumber(params, event.nEpoch, strError) ||
        !ReadOptionalInt64(params, "endTime", event.nEndTime, strError)) {
        return false;
    }
    payload = event;
    return true;
}

template <typename T>
static bool DecodeManualPoints(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    T event;
    if (!ReadAddress(params, "user", event.user, strError) ||
        !ReadPoints(params, "points", event.points, strError) ||
        !ReadString(params, "reason", event.reason, strError, false) ||
        !ReadOptionalInt64(params, "timestamp", event.nTimestamp, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeUserBlacklist(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CUserBlacklistEvent event;
    if (!ReadAddress(params, "user", event.user, strError) ||
        !ReadBool(params, "blacklisted", event.fBlacklisted, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static bool DecodeSettlePoints(const UniValue& params, CPointsEventPayload& payload, std::string& strError)
{
    CSettlePointsEvent event;
    if (!ReadAddress(params, "user", event.user, strError) ||
        !ReadBool(params, "ignoreCooldown", event.fIgnoreCooldown, strError)) {
        return false;
    }
    payload = event;
    return true;
}

static const std::map<std::string, EventDecoder>& GetEventDecoders()
{
    static const std::map<std::string, EventDecoder> decoders = {
        {"ReserveDataUpdated", DecodeReserveDataUpdated},
        {"Supply", DecodeReserveBalance<CSupplyEvent>},
        {"Withdraw", DecodeReserveBalance<CWithdrawEvent>},
        {"Borrow", DecodeReserveBalance<CBorrowEvent>},
        {"Repay", DecodeReserveBalance<CRepayEvent>},
        {"BalanceTransfer", DecodeBalanceTransfer},
        {"LpPositionUpdated", DecodeLpPositionUpdated},
        {"LockDeposit", DecodeLockDeposit},
        {"LockWithdraw", DecodeLockWithdraw},
        {"LockPermanent", DecodeLockPermanent},
        {"LockTransfer", DecodeLockTransfer},
        {"NftTransfer", DecodeNftTransfer},
        {"ConfigSnapshot", DecodeConfigSnapshot},
        {"VotingPowerTierSet", DecodeVotingPowerTierSet},
        {"NftPartnershipSet", DecodeNftPartnershipSet},
        {"EpochStart", DecodeEpochStart},
        {"EpochEnd", DecodeEpochEnd},
        {"ManualPointsAward", DecodeManualPoints<CManualPointsAwardEvent>},
        {"ManualPointsRemoval", DecodeManualPoints<CManualPointsRemovalEvent>},
        {"UserBlacklist", DecodeUserBlacklist},
        {"SettlePoints", DecodeSettlePoints},
    };
    return decoders;
}

bool DecodePointsEvent(const UniValue& obj, CPointsEvent& event, std::string& strError)
{
    if (!obj.isObject()) {
        strError = "event is not an object";
        return false;
    }

    CEventHeader header;
    int64_t nLogIndex = 0;
    if (!ReadInt64(obj, "block", header.nBlock, strError) ||
        !ReadInt64(obj, "time", header.nTime, strError) ||
        !ReadInt64(obj, "logIndex", nLogIndex, strError, false) ||
        !ReadString(obj, "txHash", header.txHash, strError) ||
        !ReadString(obj, "source", header.source, strError, false)) {
        return false;
    }
    if (nLogIndex < 0 || nLogIndex > std::numeric_limits<int>::max()) {
        strError = "logIndex out of range";
        return false;
    }
    header.nLogIndex = (int)nLogIndex;
    boost::algorithm::to_lower(header.txHash);
    boost::algorithm::to_lower(header.source);

    std::string strName;
    if (!ReadString(obj, "event", strName, strError)) {
        return false;
    }
    const auto& decoders = GetEventDecoders();
    auto it = decoders.find(strName);
    if (it == decoders.end()) {
        strError = strprintf("unknown event %s", strName);
        return false;
    }

    const UniValue& params = find_value(obj, "params");
    if (!params.isObject()) {
        strError = strprintf("%s: params is not an object", strName);
        return false;
    }

    CPointsEventPayload payload;
    if (!it->second(params, payload, strError)) {
        strError = strprintf("%s: %s", strName, strError);
        return false;
    }

    event = CPointsEvent(header, payload);
    return true;
}

bool DecodePointsEventLine(const std::string& strLine, CPointsEvent& event, std::string& strError)
{
    UniValue obj;
    if (!obj.read(strLine)) {
        strError = "invalid JSON";
        return false;
    }
    return DecodePointsEvent(obj, event, strError);
}

// ============================================================================
// Rendering
// ============================================================================

CRankingScope ParseRankingScope(CPointsStore& store, const UniValue& value)
{
    if (value.isNull()) {
        return points_query::GetGlobalScope(store);
    }
    if (value.isNum()) {
        const int nEpoch = value.get_int();
        if (nEpoch < 0) {
            throw JSONRPCError(RPC_INVALID_PARAMETER, "epoch must be >= 0");
        }
        return nEpoch == ALL_TIME_EPOCH ? CRankingScope::AllTime() : CRankingScope::Epoch(nEpoch);
    }
    if (!value.isStr()) {
        throw JSONRPCError(RPC_TYPE_ERROR, "scope must be a string or an epoch number");
    }

    const std::string strScope = value.get_str();
    if (strScope == "global") {
        return points_query::GetGlobalScope(store);
    }
    if (strScope == "alltime") {
        return CRankingScope::AllTime();
    }
    if (strScope == "current") {
        return CRankingScope::Epoch(store.LoadLeaderboardState_OrNew().nCurrentEpoch);
    }
    // "epoch:N" or a bare "N", where 0 is the all-time scope
    const std::string strEpoch = boost::algorithm::starts_with(strScope, "epoch:") ? strScope.substr(6) : strScope;
    CBigInt nEpoch = 0;
    if (ParseBigInt(strEpoch, nEpoch) && nEpoch >= 0 && nEpoch <= std::numeric_limits<int>::max()) {
        const int n = nEpoch.convert_to<int>();
        return n == ALL_TIME_EPOCH ? CRankingScope::AllTime() : CRankingScope::Epoch(n);
    }
    throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Invalid scope: %s", strScope));
}

UniValue TopEntriesToJSON(CPointsStore& store, const CRankingScope& scope, int nCount)
{
    UniValue entries(UniValue::VARR);
    for (const CTopKEntry& entry : points_query::GetTopEntries(store, scope, nCount)) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("rank", entry.nRank);
        obj.pushKV("user", entry.user);
        obj.pushKV("points", entry.points);
        entries.push_back(obj);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("scope", scope.ToString());
    result.pushKV("epoch", scope.GetEpoch());
    result.pushKV("usersWithPoints", points_query::GetUsersWithPoints(store, scope));
    result.pushKV("entries", entries);
    return result;
}

UniValue UserRankToJSON(const points_query::CUserRank& rank)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("user", rank.user);
    result.pushKV("points", rank.points);
    result.pushKV("bucket", rank.nBucketIndex);
    result.pushKV("exact", rank.fExact);
    if (rank.fExact) {
        result.pushKV("rank", rank.nRank);
    } else {
        result.pushKV("rankLow", rank.nRankLow);
        result.pushKV("rankHigh", rank.nRankHigh);
    }
    return result;
}

static UniValue EpochStatsToJSON(const CUserEpochStats& stats)
{
    UniValue daily(UniValue::VOBJ);
    for (int i = 0; i < DAILY_ACTION_COUNT; ++i) {
        daily.pushKV(DailyActionName((DailyAction)i), FormatPoints(stats.dailyBonusPoints[i]));
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("epoch", stats.nEpochNumber);
    result.pushKV("depositPoints", FormatPoints(stats.depositPoints));
    result.pushKV("depositPointsWithMultiplier", FormatPoints(stats.depositPointsWithMultiplier));
    result.pushKV("borrowPoints", FormatPoints(stats.borrowPoints));
    result.pushKV("borrowPointsWithMultiplier", FormatPoints(stats.borrowPointsWithMultiplier));
    result.pushKV("lpPoints", FormatPoints(stats.lpPoints));
    result.pushKV("vpPoints", FormatPoints(stats.vpPoints));
    result.pushKV("dailyBonusPoints", daily);
    result.pushKV("manualPoints", FormatPoints(stats.manualAwardPoints));
    result.pushKV("totalPoints", FormatPoints(stats.totalPoints));
    result.pushKV("totalPointsWithMultiplier", FormatPoints(stats.totalPointsWithMultiplier));
    result.pushKV("lastAppliedMultiplierBps", (int64_t)stats.nLastAppliedMultiplierBps);
    return result;
}

UniValue UserSummaryToJSON(const points_query::CUserPointsSummary& summary)
{
    const CUserLeaderboardState& state = summary.state;

    UniValue multipliers(UniValue::VOBJ);
    multipliers.pushKV("nftCount", (int64_t)state.nNftCount);
    multipliers.pushKV("nftMultiplierBps", (int64_t)state.nNftMultiplierBps);
    multipliers.pushKV("votingPower", state.votingPower.str());
    multipliers.pushKV("vpTierIndex", state.nVpTierIndex);
    multipliers.pushKV("vpMultiplierBps", (int64_t)state.nVpMultiplierBps);
    multipliers.pushKV("combinedMultiplierBps", (int64_t)state.nCombinedMultiplierBps);

    UniValue epochs(UniValue::VARR);
    for (int nEpoch : state.vEpochsParticipated) {
        epochs.push_back(nEpoch);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("user", summary.user);
    result.pushKV("blacklisted", state.fBlacklisted);
    result.pushKV("multipliers", multipliers);
    result.pushKV("lifetimePoints", FormatPoints(state.lifetimePoints));
    result.pushKV("epochsParticipated", epochs);
    result.pushKV("currentEpoch", summary.nCurrentEpoch);
    if (summary.nCurrentEpoch > 0) {
        result.pushKV("currentEpochStats", EpochStatsToJSON(summary.currentStats));
    }
    result.pushKV("epochRank", summary.fHasEpochRank ? UserRankToJSON(summary.epochRank) : NullUniValue);
    result.pushKV("allTimeRank", summary.fHasAllTimeRank ? UserRankToJSON(summary.allTimeRank) : NullUniValue);
    return result;
}

UniValue HistogramToJSON(CPointsStore& store, const CRankingScope& scope)
{
    UniValue buckets(UniValue::VARR);
    for (const CScoreBucket& bucket : points_query::GetHistogram(store, scope)) {
        UniValue obj(UniValue::VOBJ);
        obj.pushKV("index", bucket.nIndex);
        obj.pushKV("lower", bucket.lower);
        if (std::isinf(bucket.upper)) {
            obj.pushKV("upper", NullUniValue);
        } else {
            obj.pushKV("upper", bucket.upper);
        }
        obj.pushKV("count", (int64_t)bucket.nCount);
        buckets.push_back(obj);
    }

    UniValue result(UniValue::VOBJ);
    result.pushKV("scope", scope.ToString());
    result.pushKV("usersWithPoints", points_query::GetUsersWithPoints(store, scope));
    result.pushKV("buckets", buckets);
    return result;
}

UniValue EpochToJSON(const CLeaderboardEpoch& epoch)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("epoch", epoch.nEpochNumber);
    result.pushKV("active", epoch.fActive);
    result.pushKV("startTime", epoch.nStartTime);
    result.pushKV("startBlock", epoch.nStartBlock);
    result.pushKV("endTime", epoch.nEndTime ? UniValue(*epoch.nEndTime) : NullUniValue);
    result.pushKV("endBlock", epoch.nEndBlock ? UniValue(*epoch.nEndBlock) : NullUniValue);
    result.pushKV("scheduledStartTime", epoch.nScheduledStartTime ? UniValue(*epoch.nScheduledStartTime) : NullUniValue);
    result.pushKV("scheduledEndTime", epoch.nScheduledEndTime ? UniValue(*epoch.nScheduledEndTime) : NullUniValue);
    return result;
}

// ============================================================================
// Commands
// ============================================================================

static const UniValue& Param(const UniValue& params, size_t n)
{
    if (!params.isArray() || n >= params.size()) {
        return NullUniValue;
    }
    return params[n];
}

/**
 * getleaderboard ( scope count )
 *
 * Arguments:
 * 1. scope    (string or numeric, optional, default="global") "global", "alltime", "current", "epoch:N" or N
 * 2. count    (numeric, optional, default=100) Entries to return
 */
static UniValue getleaderboard(CPointsStore& store, const UniValue& params)
{
    const CRankingScope scope = ParseRankingScope(store, Param(params, 0));
    int nCount = MAX_TOP_K;
    if (!Param(params, 1).isNull()) {
        nCount = Param(params, 1).get_int();
    }
    return TopEntriesToJSON(store, scope, nCount);
}

/**
 * getuserrank user ( scope )
 *
 * Result is null when the user has no points in the scope.
 */
static UniValue getuserrank(CPointsStore& store, const UniValue& params)
{
    if (!Param(params, 0).isStr()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "user address required");
    }
    const std::string user = boost::algorithm::to_lower_copy(Param(params, 0).get_str());
    const CRankingScope scope = ParseRankingScope(store, Param(params, 1));

    points_query::CUserRank rank;
    if (!points_query::GetUserRank(store, scope, user, rank)) {
        return NullUniValue;
    }
    return UserRankToJSON(rank);
}

/** getusersinrange min ( max scope ) */
static UniValue getusersinrange(CPointsStore& store, const UniValue& params)
{
    if (!Param(params, 0).isNum()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "min points required");
    }
    const double minPoints = Param(params, 0).get_real();
    const double maxPoints = Param(params, 1).isNull() ? std::numeric_limits<double>::infinity()
                                                       : Param(params, 1).get_real();
    const CRankingScope scope = ParseRankingScope(store, Param(params, 2));

    UniValue result(UniValue::VOBJ);
    result.pushKV("scope", scope.ToString());
    result.pushKV("min", minPoints);
    if (std::isinf(maxPoints)) {
        result.pushKV("max", NullUniValue);
    } else {
        result.pushKV("max", maxPoints);
    }
    result.pushKV("users", points_query::CountUsersInRange(store, scope, minPoints, maxPoints));
    return result;
}

/** getpointssummary user */
static UniValue getpointssummary(CPointsStore& store, const UniValue& params)
{
    if (!Param(params, 0).isStr()) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, "user address required");
    }
    const std::string user = boost::algorithm::to_lower_copy(Param(params, 0).get_str());
    return UserSummaryToJSON(points_query::GetUserSummary(store, user));
}

/** getscorehistogram ( scope ) */
static UniValue getscorehistogram(CPointsStore& store, const UniValue& params)
{
    return HistogramToJSON(store, ParseRankingScope(store, Param(params, 0)));
}

/** getepochinfo ( epoch ), the current epoch by default */
static UniValue getepochinfo(CPointsStore& store, const UniValue& params)
{
    int nEpoch = store.LoadLeaderboardState_OrNew().nCurrentEpoch;
    if (!Param(params, 0).isNull()) {
        nEpoch = Param(params, 0).get_int();
    }

    CLeaderboardEpoch epoch;
    if (nEpoch <= 0 || !store.ReadEpoch(nEpoch, epoch)) {
        throw JSONRPCError(RPC_INVALID_PARAMETER, strprintf("Unknown epoch %d", nEpoch));
    }
    return EpochToJSON(epoch);
}

typedef UniValue (*PointsCommandFn)(CPointsStore& store, const UniValue& params);

struct CPointsCommand
{
    const char* name;
    PointsCommandFn actor;
};

static const CPointsCommand vPointsCommands[] = {
    {"getleaderboard", &getleaderboard},
    {"getuserrank", &getuserrank},
    {"getusersinrange", &getusersinrange},
    {"getpointssummary", &getpointssummary},
    {"getscorehistogram", &getscorehistogram},
    {"getepochinfo", &getepochinfo},
};

UniValue ExecutePointsCommand(CPointsStore& store, const std::string& strMethod, const UniValue& params)
{
    for (const CPointsCommand& command : vPointsCommands) {
        if (strMethod != command.name) continue;
        try {
            return command.actor(store, params);
        } catch (const std::runtime_error& e) {
            // UniValue type errors
            throw JSONRPCError(RPC_TYPE_ERROR, e.what());
        }
    }
    throw JSONRPCError(RPC_METHOD_NOT_FOUND, strprintf("Method not found: %s", strMethod));
}
