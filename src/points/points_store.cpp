// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_store.h"

static const char* const KEY_LEADERBOARD_STATE = "current";
static const char* const KEY_LEADERBOARD_CONFIG = "global";

std::string MakeUserReserveKey(const std::string& user, const std::string& reserve)
{
    return user + ":" + reserve;
}

std::string MakeUserEpochKey(const std::string& user, int nEpoch)
{
    return user + ":" + std::to_string(nEpoch);
}

std::string MakeUserDayKey(const std::string& user, int nEpoch, int64_t nDay)
{
    return user + ":" + std::to_string(nEpoch) + ":" + std::to_string(nDay);
}

std::string MakeEpochEndKey(int nEpoch, const std::string& reserve)
{
    return "epochEnd:" + std::to_string(nEpoch) + ":" + reserve;
}

std::string MakeUserCollectionKey(const std::string& user, const std::string& collection)
{
    return user + ":" + collection;
}

// ═══════════════════════════════════════════════════════════════════════════
// Load-or-create helpers
// ═══════════════════════════════════════════════════════════════════════════

CLeaderboardConfig CPointsStore::LoadConfig_OrDefault()
{
    CLeaderboardConfig config;
    if (!ReadConfig(config)) {
        config.SetNull();
    }
    return config;
}

CLeaderboardState CPointsStore::LoadLeaderboardState_OrNew()
{
    CLeaderboardState state;
    if (!ReadLeaderboardState(state)) {
        state.SetNull();
    }
    return state;
}

CUserReservePoints CPointsStore::LoadUserReservePoints_OrNew(const std::string& user, const std::string& reserve)
{
    CUserReservePoints points;
    if (ReadUserReservePoints(user, reserve, points)) {
        return points;
    }
    points.SetNull();
    points.user = user;
    points.reserve = reserve;
    return points;
}

CUserEpochStats CPointsStore::LoadUserEpochStats_OrNew(const std::string& user, int nEpoch, int64_t nTime)
{
    CUserEpochStats stats;
    if (ReadUserEpochStats(user, nEpoch, stats)) {
        return stats;
    }
    stats.SetNull();
    stats.user = user;
    stats.nEpochNumber = nEpoch;
    stats.nFirstSeenAt = nTime;
    stats.nLastUpdatedAt = nTime;
    return stats;
}

CUserLeaderboardState CPointsStore::LoadUserLeaderboardState_OrNew(const std::string& user)
{
    CUserLeaderboardState state;
    if (ReadUserLeaderboardState(user, state)) {
        return state;
    }
    state.SetNull();
    state.user = user;
    return state;
}

CUserDailyActivity CPointsStore::LoadUserDailyActivity_OrNew(const std::string& user, int nEpoch, int64_t nDay)
{
    CUserDailyActivity activity;
    if (ReadUserDailyActivity(user, nEpoch, nDay, activity)) {
        return activity;
    }
    activity.SetNull();
    activity.user = user;
    activity.nEpochNumber = nEpoch;
    activity.nDay = nDay;
    return activity;
}

// ═══════════════════════════════════════════════════════════════════════════
// CPointsMemoryStore
// ═══════════════════════════════════════════════════════════════════════════

bool CPointsMemoryStore::ReadReserve(const std::string& reserve, CReserve& out)
{
    return m_reserves.Read(reserve, out);
}

bool CPointsMemoryStore::WriteReserve(const CReserve& reserve)
{
    return m_reserves.Write(reserve.id, reserve);
}

bool CPointsMemoryStore::ListReserves(std::vector<std::string>& reserves)
{
    reserves.clear();
    for (const auto& row : m_reserves.Rows()) {
        reserves.push_back(row.first);
    }
    return true;
}

bool CPointsMemoryStore::ReadUserReserve(const std::string& user, const std::string& reserve, CUserReserve& out)
{
    return m_userReserves.Read(MakeUserReserveKey(user, reserve), out);
}

bool CPointsMemoryStore::WriteUserReserve(const CUserReserve& userReserve)
{
    return m_userReserves.Write(MakeUserReserveKey(userReserve.user, userReserve.reserve), userReserve);
}

bool CPointsMemoryStore::ReadUserReserveIds(const std::string& user, std::vector<std::string>& reserves)
{
    return m_userReserveIds.Read(user, reserves);
}

bool CPointsMemoryStore::WriteUserReserveIds(const std::string& user, const std::vector<std::string>& reserves)
{
    return m_userReserveIds.Write(user, reserves);
}

bool CPointsMemoryStore::ReadUserReservePoints(const std::string& user, const std::string& reserve, CUserReservePoints& out)
{
    return m_userReservePoints.Read(MakeUserReserveKey(user, reserve), out);
}

bool CPointsMemoryStore::WriteUserReservePoints(const CUserReservePoints& points)
{
    return m_userReservePoints.Write(MakeUserReserveKey(points.user, points.reserve), points);
}

bool CPointsMemoryStore::ReadEpoch(int nEpoch, CLeaderboardEpoch& out)
{
    return m_epochs.Read(std::to_string(nEpoch), out);
}

bool CPointsMemoryStore::WriteEpoch(const CLeaderboardEpoch& epoch)
{
    return m_epochs.Write(std::to_string(epoch.nEpochNumber), epoch);
}

bool CPointsMemoryStore::ReadLeaderboardState(CLeaderboardState& out)
{
    return m_leaderboardState.Read(KEY_LEADERBOARD_STATE, out);
}

bool CPointsMemoryStore::WriteLeaderboardState(const CLeaderboardState& state)
{
    return m_leaderboardState.Write(KEY_LEADERBOARD_STATE, state);
}

bool CPointsMemoryStore::ReadConfig(CLeaderboardConfig& out)
{
    return m_config.Read(KEY_LEADERBOARD_CONFIG, out);
}

bool CPointsMemoryStore::WriteConfig(const CLeaderboardConfig& config)
{
    return m_config.Write(KEY_LEADERBOARD_CONFIG, config);
}

bool CPointsMemoryStore::ReadEpochEndSnapshot(int nEpoch, const std::string& reserve, CEpochEndSnapshot& out)
{
    return m_epochEndSnapshots.Read(MakeEpochEndKey(nEpoch, reserve), out);
}

bool CPointsMemoryStore::WriteEpochEndSnapshot(const CEpochEndSnapshot& snapshot)
{
    return m_epochEndSnapshots.Write(MakeEpochEndKey(snapshot.nEpochNumber, snapshot.reserve), snapshot);
}

bool CPointsMemoryStore::ReadUserEpochStats(const std::string& user, int nEpoch, CUserEpochStats& out)
{
    return m_userEpochStats.Read(MakeUserEpochKey(user, nEpoch), out);
}

bool CPointsMemoryStore::WriteUserEpochStats(const CUserEpochStats& stats)
{
    return m_userEpochStats.Write(MakeUserEpochKey(stats.user, stats.nEpochNumber), stats);
}

bool CPointsMemoryStore::ReadUserDailyActivity(const std::string& user, int nEpoch, int64_t nDay, CUserDailyActivity& out)
{
    return m_userDailyActivity.Read(MakeUserDayKey(user, nEpoch, nDay), out);
}

bool CPointsMemoryStore::WriteUserDailyActivity(const CUserDailyActivity& activity)
{
    return m_userDailyActivity.Write(MakeUserDayKey(activity.user, activity.nEpochNumber, activity.nDay), activity);
}

bool CPointsMemoryStore::ReadUserLeaderboardState(const std::string& user, CUserLeaderboardState& out)
{
    return m_userLeaderboardState.Read(user, out);
}

bool CPointsMemoryStore::WriteUserLeaderboardState(const CUserLeaderboardState& state)
{
    return m_userLeaderboardState.Write(state.user, state);
}

bool CPointsMemoryStore::ReadVotingPowerTiers(std::vector<CVotingPowerTier>& tiers)
{
    tiers.clear();
    for (const auto& row : m_vpTiers) {
        tiers.push_back(row.second);
    }
    return true;
}

bool CPointsMemoryStore::WriteVotingPowerTier(const CVotingPowerTier& tier)
{
    m_vpTiers[tier.nIndex] = tier;
    return true;
}

bool CPointsMemoryStore::ReadNftPartnership(const std::string& collection, CNftPartnership& out)
{
    return m_nftPartnerships.Read(collection, out);
}

bool CPointsMemoryStore::WriteNftPartnership(const CNftPartnership& partnership)
{
    return m_nftPartnerships.Write(partnership.collection, partnership);
}

bool CPointsMemoryStore::ListNftPartnerships(std::vector<CNftPartnership>& partnerships)
{
    partnerships.clear();
    for (const auto& row : m_nftPartnerships.Rows()) {
        partnerships.push_back(row.second);
    }
    return true;
}

bool CPointsMemoryStore::ReadUserNftOwnership(const std::string& user, const std::string& collection, CUserNftOwnership& out)
{
    return m_userNftOwnership.Read(MakeUserCollectionKey(user, collection), out);
}

bool CPointsMemoryStore::WriteUserNftOwnership(const CUserNftOwnership& ownership)
{
    return m_userNftOwnership.Write(MakeUserCollectionKey(ownership.user, ownership.collection), ownership);
}

bool CPointsMemoryStore::ReadVeLock(const std::string& tokenId, CVeLock& out)
{
    return m_veLocks.Read(tokenId, out);
}

bool CPointsMemoryStore::WriteVeLock(const CVeLock& lock)
{
    return m_veLocks.Write(lock.tokenId, lock);
}

bool CPointsMemoryStore::EraseVeLock(const std::string& tokenId)
{
    return m_veLocks.Erase(tokenId);
}

bool CPointsMemoryStore::ReadUserLockIds(const std::string& user, std::vector<std::string>& tokenIds)
{
    return m_userLockIds.Read(user, tokenIds);
}

bool CPointsMemoryStore::WriteUserLockIds(const std::string& user, const std::vector<std::string>& tokenIds)
{
    return m_userLockIds.Write(user, tokenIds);
}

bool CPointsMemoryStore::ReadUserLpPosition(const std::string& user, CUserLpPosition& out)
{
    return m_userLpPositions.Read(user, out);
}

bool CPointsMemoryStore::WriteUserLpPosition(const CUserLpPosition& position)
{
    return m_userLpPositions.Write(position.user, position);
}

bool CPointsMemoryStore::ReadUserIndex(const std::string& id, CUserIndex& out)
{
    return m_userIndexes.Read(id, out);
}

bool CPointsMemoryStore::WriteUserIndex(const CUserIndex& index)
{
    return m_userIndexes.Write(index.id, index);
}

bool CPointsMemoryStore::EraseUserIndex(const std::string& id)
{
    return m_userIndexes.Erase(id);
}

bool CPointsMemoryStore::ReadScoreBucket(const std::string& id, CScoreBucket& out)
{
    return m_scoreBuckets.Read(id, out);
}

bool CPointsMemoryStore::WriteScoreBucket(const CScoreBucket& bucket)
{
    return m_scoreBuckets.Write(bucket.id, bucket);
}

bool CPointsMemoryStore::ReadTopK(const std::string& id, CTopK& out)
{
    return m_topK.Read(id, out);
}

bool CPointsMemoryStore::WriteTopK(const CTopK& topK)
{
    return m_topK.Write(topK.id, topK);
}

bool CPointsMemoryStore::ReadTopKEntry(const std::string& id, CTopKEntry& out)
{
    return m_topKEntries.Read(id, out);
}

bool CPointsMemoryStore::WriteTopKEntry(const std::string& id, const CTopKEntry& entry)
{
    return m_topKEntries.Write(id, entry);
}

bool CPointsMemoryStore::EraseTopKEntry(const std::string& id)
{
    return m_topKEntries.Erase(id);
}

bool CPointsMemoryStore::ReadTotals(const std::string& id, CLeaderboardTotals& out)
{
    return m_totals.Read(id, out);
}

bool CPointsMemoryStore::WriteTotals(const CLeaderboardTotals& totals)
{
    return m_totals.Write(totals.id, totals);
}

bool CPointsMemoryStore::ReadAuditRecord(const std::string& id, CPointsAuditRecord& out)
{
    return m_auditRecords.Read(id, out);
}

bool CPointsMemoryStore::WriteAuditRecord(const CPointsAuditRecord& record)
{
    return m_auditRecords.Write(record.id, record);
}

bool CPointsMemoryStore::ExistsProcessedEvent(const std::string& id)
{
    return m_processedEvents.count(id) > 0;
}

bool CPointsMemoryStore::WriteProcessedEvent(const std::string& id)
{
    m_processedEvents.insert(id);
    return true;
}
