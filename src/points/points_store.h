// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_STORE_H
#define POINTSD_POINTS_STORE_H

#include "points/points_state.h"

#include <map>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

// ============================================================================
// Entity keys
// ============================================================================

/** "user:reserve" (UserReserve, UserReservePoints) */
std::string MakeUserReserveKey(const std::string& user, const std::string& reserve);

/** "user:epoch" (UserEpochStats) */
std::string MakeUserEpochKey(const std::string& user, int nEpoch);

/** "user:epoch:day" (UserDailyActivity) */
std::string MakeUserDayKey(const std::string& user, int nEpoch, int64_t nDay);

/** "epochEnd:epoch:reserve" (EpochEndSnapshot) */
std::string MakeEpochEndKey(int nEpoch, const std::string& reserve);

/** "user:collection" (UserNftOwnership) */
std::string MakeUserCollectionKey(const std::string& user, const std::string& collection);

/**
 * CPointsStore - Entity store consumed by the points engine
 *
 * One typed Read/Write (and Erase where records can disappear) per entity.
 * Read returns false when the record does not exist. Write and Erase return
 * false on storage failure. Reads observe every prior write (read your
 * writes); the engine never caches records across calls.
 */
class CPointsStore
{
public:
    virtual ~CPointsStore() {}

    // Reserves
    virtual bool ReadReserve(const std::string& reserve, CReserve& out) = 0;
    virtual bool WriteReserve(const CReserve& reserve) = 0;
    virtual bool ListReserves(std::vector<std::string>& reserves) = 0;

    virtual bool ReadUserReserve(const std::string& user, const std::string& reserve, CUserReserve& out) = 0;
    virtual bool WriteUserReserve(const CUserReserve& userReserve) = 0;
    virtual bool ReadUserReserveIds(const std::string& user, std::vector<std::string>& reserves) = 0;
    virtual bool WriteUserReserveIds(const std::string& user, const std::vector<std::string>& reserves) = 0;

    virtual bool ReadUserReservePoints(const std::string& user, const std::string& reserve, CUserReservePoints& out) = 0;
    virtual bool WriteUserReservePoints(const CUserReservePoints& points) = 0;

    // Epochs and configuration
    virtual bool ReadEpoch(int nEpoch, CLeaderboardEpoch& out) = 0;
    virtual bool WriteEpoch(const CLeaderboardEpoch& epoch) = 0;
    virtual bool ReadLeaderboardState(CLeaderboardState& out) = 0;
    virtual bool WriteLeaderboardState(const CLeaderboardState& state) = 0;
    virtual bool ReadConfig(CLeaderboardConfig& out) = 0;
    virtual bool WriteConfig(const CLeaderboardConfig& config) = 0;
    virtual bool ReadEpochEndSnapshot(int nEpoch, const std::string& reserve, CEpochEndSnapshot& out) = 0;
    virtual bool WriteEpochEndSnapshot(const CEpochEndSnapshot& snapshot) = 0;

    // Per-user points
    virtual bool ReadUserEpochStats(const std::string& user, int nEpoch, CUserEpochStats& out) = 0;
    virtual bool WriteUserEpochStats(const CUserEpochStats& stats) = 0;
    virtual bool ReadUserDailyActivity(const std::string& user, int nEpoch, int64_t nDay, CUserDailyActivity& out) = 0;
    virtual bool WriteUserDailyActivity(const CUserDailyActivity& activity) = 0;
    virtual bool ReadUserLeaderboardState(const std::string& user, CUserLeaderboardState& out) = 0;
    virtual bool WriteUserLeaderboardState(const CUserLeaderboardState& state) = 0;

    // Voting power and ownership
    virtual bool ReadVotingPowerTiers(std::vector<CVotingPowerTier>& tiers) = 0;
    virtual bool WriteVotingPowerTier(const CVotingPowerTier& tier) = 0;
    virtual bool ReadNftPartnership(const std::string& collection, CNftPartnership& out) = 0;
    virtual bool WriteNftPartnership(const CNftPartnership& partnership) = 0;
    virtual bool ListNftPartnerships(std::vector<CNftPartnership>& partnerships) = 0;
    virtual bool ReadUserNftOwnership(const std::string& user, const std::string& collection, CUserNftOwnership& out) = 0;
    virtual bool WriteUserNftOwnership(const CUserNftOwnership& ownership) = 0;
    virtual bool ReadVeLock(const std::string& tokenId, CVeLock& out) = 0;
    virtual bool WriteVeLock(const CVeLock& lock) = 0;
    virtual bool EraseVeLock(const std::string& tokenId) = 0;
    virtual bool ReadUserLockIds(const std::string& user, std::vector<std::string>& tokenIds) = 0;
    virtual bool WriteUserLockIds(const std::string& user, const std::vector<std::string>& tokenIds) = 0;
    virtual bool ReadUserLpPosition(const std::string& user, CUserLpPosition& out) = 0;
    virtual bool WriteUserLpPosition(const CUserLpPosition& position) = 0;

    // Ranking (keys are built by points_ranking)
    virtual bool ReadUserIndex(const std::string& id, CUserIndex& out) = 0;
    virtual bool WriteUserIndex(const CUserIndex& index) = 0;
    virtual bool EraseUserIndex(const std::string& id) = 0;
    virtual bool ReadScoreBucket(const std::string& id, CScoreBucket& out) = 0;
    virtual bool WriteScoreBucket(const CScoreBucket& bucket) = 0;
    virtual bool ReadTopK(const std::string& id, CTopK& out) = 0;
    virtual bool WriteTopK(const CTopK& topK) = 0;
    virtual bool ReadTopKEntry(const std::string& id, CTopKEntry& out) = 0;
    virtual bool WriteTopKEntry(const std::string& id, const CTopKEntry& entry) = 0;
    virtual bool EraseTopKEntry(const std::string& id) = 0;
    virtual bool ReadTotals(const std::string& id, CLeaderboardTotals& out) = 0;
    virtual bool WriteTotals(const CLeaderboardTotals& totals) = 0;

    // Audit and replay protection
    virtual bool ReadAuditRecord(const std::string& id, CPointsAuditRecord& out) = 0;
    virtual bool WriteAuditRecord(const CPointsAuditRecord& record) = 0;
    virtual bool ExistsProcessedEvent(const std::string& id) = 0;
    virtual bool WriteProcessedEvent(const std::string& id) = 0;

    // ========================================================================
    // Load-or-create helpers
    // ========================================================================

    /** Stored config, or the defaults from points_params.h */
    CLeaderboardConfig LoadConfig_OrDefault();

    CLeaderboardState LoadLeaderboardState_OrNew();

    CUserReservePoints LoadUserReservePoints_OrNew(const std::string& user, const std::string& reserve);

    CUserEpochStats LoadUserEpochStats_OrNew(const std::string& user, int nEpoch, int64_t nTime);

    CUserLeaderboardState LoadUserLeaderboardState_OrNew(const std::string& user);

    CUserDailyActivity LoadUserDailyActivity_OrNew(const std::string& user, int nEpoch, int64_t nDay);
};

/**
 * CEntityTable - Keyed rows of one entity type
 */
template <typename T>
class CEntityTable
{
private:
    std::map<std::string, T> m_rows;

public:
    bool Read(const std::string& key, T& out) const
    {
        auto it = m_rows.find(key);
        if (it == m_rows.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    bool Write(const std::string& key, const T& value)
    {
        m_rows[key] = value;
        return true;
    }

    bool Erase(const std::string& key)
    {
        m_rows.erase(key);
        return true;
    }

    bool Exists(const std::string& key) const { return m_rows.count(key) > 0; }

    size_t Size() const { return m_rows.size(); }

    const std::map<std::string, T>& Rows() const { return m_rows; }

    void Clear() { m_rows.clear(); }
};

/**
 * CPointsMemoryStore - In-memory entity store
 *
 * Used by the replay tool and the unit tests. Nothing is persisted.
 */
class CPointsMemoryStore : public CPointsStore
{
private:
    CEntityTable<CReserve> m_reserves;
    CEntityTable<CUserReserve> m_userReserves;
    CEntityTable<std::vector<std::string>> m_userReserveIds;
    CEntityTable<CUserReservePoints> m_userReservePoints;
    CEntityTable<CLeaderboardEpoch> m_epochs;
    CEntityTable<CLeaderboardState> m_leaderboardState;
    CEntityTable<CLeaderboardConfig> m_config;
    CEntityTable<CEpochEndSnapshot> m_epochEndSnapshots;
    CEntityTable<CUserEpochStats> m_userEpochStats;
    CEntityTable<CUserDailyActivity> m_userDailyActivity;
    CEntityTable<CUserLeaderboardState> m_userLeaderboardState;
    std::map<int, CVotingPowerTier> m_vpTiers;
    CEntityTable<CNftPartnership> m_nftPartnerships;
    CEntityTable<CUserNftOwnership> m_userNftOwnership;
    CEntityTable<CVeLock> m_veLocks;
    CEntityTable<std::vector<std::string>> m_userLockIds;
    CEntityTable<CUserLpPosition> m_userLpPositions;
    CEntityTable<CUserIndex> m_userIndexes;
    CEntityTable<CScoreBucket> m_scoreBuckets;
    CEntityTable<CTopK> m_topK;
    CEntityTable<CTopKEntry> m_topKEntries;
    CEntityTable<CLeaderboardTotals> m_totals;
    CEntityTable<CPointsAuditRecord> m_auditRecords;
    std::set<std::string> m_processedEvents;

public:
    bool ReadReserve(const std::string& reserve, CReserve& out) override;
    bool WriteReserve(const CReserve& reserve) override;
    bool ListReserves(std::vector<std::string>& reserves) override;

    bool ReadUserReserve(const std::string& user, const std::string& reserve, CUserReserve& out) override;
    bool WriteUserReserve(const CUserReserve& userReserve) override;
    bool ReadUserReserveIds(const std::string& user, std::vector<std::string>& reserves) override;
    bool WriteUserReserveIds(const std::string& user, const std::vector<std::string>& reserves) override;

    bool ReadUserReservePoints(const std::string& user, const std::string& reserve, CUserReservePoints& out) override;
    bool WriteUserReservePoints(const CUserReservePoints& points) override;

    bool ReadEpoch(int nEpoch, CLeaderboardEpoch& out) override;
    bool WriteEpoch(const CLeaderboardEpoch& epoch) override;
    bool ReadLeaderboardState(CLeaderboardState& out) override;
    bool WriteLeaderboardState(const CLeaderboardState& state) override;
    bool ReadConfig(CLeaderboardConfig& out) override;
    bool WriteConfig(const CLeaderboardConfig& config) override;
    bool ReadEpochEndSnapshot(int nEpoch, const std::string& reserve, CEpochEndSnapshot& out) override;
    bool WriteEpochEndSnapshot(const CEpochEndSnapshot& snapshot) override;

    bool ReadUserEpochStats(const std::string& user, int nEpoch, CUserEpochStats& out) override;
    bool WriteUserEpochStats(const CUserEpochStats& stats) override;
    bool ReadUserDailyActivity(const std::string& user, int nEpoch, int64_t nDay, CUserDailyActivity& out) override;
    bool WriteUserDailyActivity(const CUserDailyActivity& activity) override;
    bool ReadUserLeaderboardState(const std::string& user, CUserLeaderboardState& out) override;
    bool WriteUserLeaderboardState(const CUserLeaderboardState& state) override;

    bool ReadVotingPowerTiers(std::vector<CVotingPowerTier>& tiers) override;
    bool WriteVotingPowerTier(const CVotingPowerTier& tier) override;
    bool ReadNftPartnership(const std::string& collection, CNftPartnership& out) override;
    bool WriteNftPartnership(const CNftPartnership& partnership) override;
    bool ListNftPartnerships(std::vector<CNftPartnership>& partnerships) override;
    bool ReadUserNftOwnership(const std::string& user, const std::string& collection, CUserNftOwnership& out) override;
    bool WriteUserNftOwnership(const CUserNftOwnership& ownership) override;
    bool ReadVeLock(const std::string& tokenId, CVeLock& out) override;
    bool WriteVeLock(const CVeLock& lock) override;
    bool EraseVeLock(const std::string& tokenId) override;
    bool ReadUserLockIds(const std::string& user, std::vector<std::string>& tokenIds) override;
    bool WriteUserLockIds(const std::string& user, const std::vector<std::string>& tokenIds) override;
    bool ReadUserLpPosition(const std::string& user, CUserLpPosition& out) override;
    bool WriteUserLpPosition(const CUserLpPosition& position) override;

    bool ReadUserIndex(const std::string& id, CUserIndex& out) override;
    bool WriteUserIndex(const CUserIndex& index) override;
    bool EraseUserIndex(const std::string& id) override;
    bool ReadScoreBucket(const std::string& id, CScoreBucket& out) override;
    bool WriteScoreBucket(const CScoreBucket& bucket) override;
    bool ReadTopK(const std::string& id, CTopK& out) override;
    bool WriteTopK(const CTopK& topK) override;
    bool ReadTopKEntry(const std::string& id, CTopKEntry& out) override;
    bool WriteTopKEntry(const std::string& id, const CTopKEntry& entry) override;
    bool EraseTopKEntry(const std::string& id) override;
    bool ReadTotals(const std::string& id, CLeaderboardTotals& out) override;
    bool WriteTotals(const CLeaderboardTotals& totals) override;

    bool ReadAuditRecord(const std::string& id, CPointsAuditRecord& out) override;
    bool WriteAuditRecord(const CPointsAuditRecord& record) override;
    bool ExistsProcessedEvent(const std::string& id) override;
    bool WriteProcessedEvent(const std::string& id) override;

    /** Number of live TopKEntry rows (all scopes) */
    size_t CountTopKEntries() const { return m_topKEntries.Size(); }

    /** Number of audit records */
    size_t CountAuditRecords() const { return m_auditRecords.Size(); }
};

#endif // POINTSD_POINTS_STORE_H
