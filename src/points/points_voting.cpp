// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_voting.h"

#include "logging.h"
#include "points/points_multiplier.h"
#include "points/points_params.h"
#include "util/system.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

bool IsNullAddress(const std::string& address)
{
    return address.empty() || address == NULL_ADDRESS;
}

namespace points_voting {

// ============================================================================
// Lock lists
// ============================================================================

static bool AddUserLock(CPointsStore& store, const std::string& user, const std::string& tokenId)
{
    std::vector<std::string> tokenIds;
    if (!store.ReadUserLockIds(user, tokenIds)) {
        tokenIds.clear();
    }
    if (std::find(tokenIds.begin(), tokenIds.end(), tokenId) != tokenIds.end()) {
        return true;
    }
    tokenIds.push_back(tokenId);
    if (!store.WriteUserLockIds(user, tokenIds)) {
        return error("%s: failed to write locks of %s", __func__, user);
    }
    return true;
}

static bool RemoveUserLock(CPointsStore& store, const std::string& user, const std::string& tokenId)
{
    std::vector<std::string> tokenIds;
    if (!store.ReadUserLockIds(user, tokenIds)) {
        return true;
    }
    tokenIds.erase(std::remove(tokenIds.begin(), tokenIds.end(), tokenId), tokenIds.end());
    if (!store.WriteUserLockIds(user, tokenIds)) {
        return error("%s: failed to write locks of %s", __func__, user);
    }
    return true;
}

std::string GetLockOwner(CPointsStore& store, const std::string& tokenId)
{
    CVeLock lock;
    if (!store.ReadVeLock(tokenId, lock)) {
        return std::string();
    }
    return lock.owner;
}

// ============================================================================
// Voting power
// ============================================================================

CBigInt GetUserVotingPower(CPointsStore& store, const std::string& user, int64_t nTime)
{
    std::vector<std::string> tokenIds;
    if (!store.ReadUserLockIds(user, tokenIds)) {
        return 0;
    }

    CBigInt total = 0;
    for (const std::string& tokenId : tokenIds) {
        CVeLock lock;
        if (!store.ReadVeLock(tokenId, lock)) {
            continue;
        }
        total += points_multiplier::CalculateVotingPower(lock.lockedAmount, lock.nLockEnd, lock.fPermanent, nTime);
    }
    return total;
}

CBigInt GetUserAverageVotingPower(CPointsStore& store, const std::string& user, int64_t nStart, int64_t nEnd)
{
    std::vector<std::string> tokenIds;
    if (!store.ReadUserLockIds(user, tokenIds)) {
        return 0;
    }

    CBigInt total = 0;
    for (const std::string& tokenId : tokenIds) {
        CVeLock lock;
        if (!store.ReadVeLock(tokenId, lock)) {
            continue;
        }
        total += points_multiplier::CalculateAverageVotingPower(lock.lockedAmount, lock.nLockEnd, lock.fPermanent, nStart, nEnd);
    }
    return total;
}

uint32_t CountActiveNftCollections(CPointsStore& store, const std::string& user)
{
    std::vector<CNftPartnership> partnerships;
    if (!store.ListNftPartnerships(partnerships)) {
        return 0;
    }

    uint32_t nCount = 0;
    for (const CNftPartnership& partnership : partnerships) {
        if (!partnership.fActive) continue;
        CUserNftOwnership ownership;
        if (store.ReadUserNftOwnership(user, partnership.collection, ownership) && ownership.nBalance > 0) {
            nCount++;
        }
    }
    return nCount;
}

bool RefreshUserMultipliers(CPointsStore& store, const std::string& user, int64_t nTime,
                            CUserLeaderboardState* pStateOut)
{
    CUserLeaderboardState state = store.LoadUserLeaderboardState_OrNew(user);
    CLeaderboardConfig config = store.LoadConfig_OrDefault();

    std::vector<CVotingPowerTier> tiers;
    if (!store.ReadVotingPowerTiers(tiers)) {
        tiers.clear();
    }

    state.nNftCount = CountActiveNftCollections(store, user);
    state.nNftMultiplierBps = points_multiplier::CalculateNftMultiplier(
        state.nNftCount, config.nNftFirstBonusBps, config.nNftDecayRatioBps);

    state.votingPower = GetUserVotingPower(store, user, nTime);
    int nTierIndex = -1;
    state.nVpMultiplierBps = points_multiplier::CalculateVotingPowerMultiplier(state.votingPower, tiers, &nTierIndex);
    state.nVpTierIndex = nTierIndex;

    state.nCombinedMultiplierBps = points_multiplier::CalculateCombinedMultiplier(
        state.nNftMultiplierBps, state.nVpMultiplierBps);
    state.nLastUpdatedAt = nTime;

    if (!store.WriteUserLeaderboardState(state)) {
        return error("%s: failed to write leaderboard state of %s", __func__, user);
    }

    LogPrint(BCLog::POINTS, "RefreshUserMultipliers: user=%s nft=%u/%u vp=%s tier=%d/%u combined=%u\n",
             user, state.nNftCount, state.nNftMultiplierBps, state.votingPower.str(),
             state.nVpTierIndex, state.nVpMultiplierBps, state.nCombinedMultiplierBps);

    if (pStateOut) *pStateOut = state;
    return true;
}

// ============================================================================
// Locks
// ============================================================================

bool ApplyLockDeposit(CPointsStore& store, const std::string& tokenId, const std::string& owner,
                      const CBigInt& amount, const std::optional<int64_t>& nLockEnd, int64_t nTime)
{
    CVeLock lock;
    if (!store.ReadVeLock(tokenId, lock)) {
        lock.tokenId = tokenId;
        lock.owner = owner;
    } else if (lock.owner != owner && !owner.empty()) {
        // Deposit for a lock that changed hands without a transfer event
        if (!RemoveUserLock(store, lock.owner, tokenId)) return false;
        lock.owner = owner;
    }

    if (amount > 0) {
        lock.lockedAmount += amount;
    }
    if (nLockEnd) {
        lock.nLockEnd = std::max(lock.nLockEnd, *nLockEnd);
    }
    lock.nUpdatedAt = nTime;

    if (!store.WriteVeLock(lock)) {
        return error("%s: failed to write lock %s", __func__, tokenId);
    }

    LogPrint(BCLog::POINTS, "ApplyLockDeposit: token=%s owner=%s amount=%s end=%lld permanent=%d\n",
             tokenId, lock.owner, lock.lockedAmount.str(), (long long)lock.nLockEnd, lock.fPermanent);

    return AddUserLock(store, lock.owner, tokenId);
}

bool ApplyLockWithdraw(CPointsStore& store, const std::string& tokenId, int64_t nTime)
{
    CVeLock lock;
    if (!store.ReadVeLock(tokenId, lock)) {
        LogPrint(BCLog::POINTS, "ApplyLockWithdraw: unknown lock %s\n", tokenId);
        return true;
    }
    if (!RemoveUserLock(store, lock.owner, tokenId)) {
        return false;
    }
    if (!store.EraseVeLock(tokenId)) {
        return error("%s: failed to erase lock %s", __func__, tokenId);
    }

    LogPrint(BCLog::POINTS, "ApplyLockWithdraw: token=%s owner=%s at %lld\n", tokenId, lock.owner, (long long)nTime);
    return true;
}

bool ApplyLockPermanent(CPointsStore& store, const std::string& tokenId, bool fPermanent, int64_t nTime)
{
    CVeLock lock;
    if (!store.ReadVeLock(tokenId, lock)) {
        LogPrint(BCLog::POINTS, "ApplyLockPermanent: unknown lock %s\n", tokenId);
        return true;
    }
    if (lock.fPermanent == fPermanent) {
        return true;
    }

    lock.fPermanent = fPermanent;
    if (!fPermanent) {
        lock.nLockEnd = nTime + MAX_LOCK_TIME;
    }
    lock.nUpdatedAt = nTime;

    if (!store.WriteVeLock(lock)) {
        return error("%s: failed to write lock %s", __func__, tokenId);
    }
    return true;
}

bool ApplyLockTransfer(CPointsStore& store, const std::string& tokenId, const std::string& to, int64_t nTime)
{
    CVeLock lock;
    if (!store.ReadVeLock(tokenId, lock)) {
        LogPrint(BCLog::POINTS, "ApplyLockTransfer: unknown lock %s\n", tokenId);
        return true;
    }
    if (IsNullAddress(to)) {
        return ApplyLockWithdraw(store, tokenId, nTime);
    }
    if (lock.owner == to) {
        return true;
    }

    if (!RemoveUserLock(store, lock.owner, tokenId)) {
        return false;
    }
    lock.owner = to;
    lock.nUpdatedAt = nTime;
    if (!store.WriteVeLock(lock)) {
        return error("%s: failed to write lock %s", __func__, tokenId);
    }
    return AddUserLock(store, to, tokenId);
}

// ============================================================================
// Partner NFTs
// ============================================================================

/**
 * LoadOwnership - Stored ownership, or a chain backfill for a first sighting
 *
 * @param fFromChain Output: balance came from the chain and already reflects
 *                   the transfer being applied
 */
static CUserNftOwnership LoadOwnership(CPointsStore& store, const std::string& user, const std::string& collection,
                                       CChainReader* pReader, bool& fFromChain)
{
    fFromChain = false;

    CUserNftOwnership ownership;
    if (store.ReadUserNftOwnership(user, collection, ownership)) {
        return ownership;
    }
    ownership.user = user;
    ownership.collection = collection;
    ownership.nBalance = 0;

    if (!pReader) {
        return ownership;
    }

    try {
        int64_t nBalance = 0;
        if (pReader->ReadBalance(collection, user, nBalance)) {
            ownership.nBalance = std::max<int64_t>(nBalance, 0);
            fFromChain = true;
        } else {
            LogPrint(BCLog::POINTS, "LoadOwnership: balance read failed for %s in %s\n", user, collection);
        }
    } catch (const std::runtime_error& e) {
        LogPrintf("LoadOwnership: balance read for %s in %s threw: %s\n", user, collection, e.what());
    }
    return ownership;
}

bool ApplyNftTransfer(CPointsStore& store, const std::string& collection, const std::string& from,
                      const std::string& to, int64_t nCount, CChainReader* pReader, int64_t nTime)
{
    if (nCount <= 0) {
        return true;
    }

    if (!IsNullAddress(from)) {
        bool fFromChain = false;
        CUserNftOwnership ownership = LoadOwnership(store, from, collection, pReader, fFromChain);
        if (!fFromChain) {
            ownership.nBalance = std::max<int64_t>(ownership.nBalance - nCount, 0);
        }
        ownership.nUpdatedAt = nTime;
        if (!store.WriteUserNftOwnership(ownership)) {
            return error("%s: failed to write ownership %s", __func__, MakeUserCollectionKey(from, collection));
        }
    }

    if (!IsNullAddress(to)) {
        bool fFromChain = false;
        CUserNftOwnership ownership = LoadOwnership(store, to, collection, pReader, fFromChain);
        if (!fFromChain) {
            ownership.nBalance += nCount;
        }
        ownership.nUpdatedAt = nTime;
        if (!store.WriteUserNftOwnership(ownership)) {
            return error("%s: failed to write ownership %s", __func__, MakeUserCollectionKey(to, collection));
        }
    }

    LogPrint(BCLog::POINTS, "ApplyNftTransfer: collection=%s from=%s to=%s count=%lld\n",
             collection, from, to, (long long)nCount);
    return true;
}

} // namespace points_voting
