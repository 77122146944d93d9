// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_VOTING_H
#define POINTSD_POINTS_VOTING_H

#include "points/points_amount.h"
#include "points/points_state.h"
#include "points/points_store.h"

#include <optional>
#include <stdint.h>
#include <string>

/** Mint/burn counterparty */
static const char* const NULL_ADDRESS = "0x0000000000000000000000000000000000000000";

bool IsNullAddress(const std::string& address);

/**
 * Voting power and partner NFT ownership
 *
 * Keeps veNFT locks and partner collection balances per user and turns them
 * into the multiplier inputs stored in CUserLeaderboardState.
 */
namespace points_voting {

/**
 * CChainReader - Best-effort chain reads used to backfill ownership
 *
 * Implementations return false (or throw std::runtime_error) when the read
 * fails; callers then keep the state they already have.
 */
class CChainReader
{
public:
    virtual ~CChainReader() {}

    /** Balance of owner in an ERC-721 collection at the current block */
    virtual bool ReadBalance(const std::string& collection, const std::string& owner, int64_t& nBalance) = 0;
};

/** Sum of the voting power of every lock owned by user at nTime */
CBigInt GetUserVotingPower(CPointsStore& store, const std::string& user, int64_t nTime);

/** Sum of the average voting power of every lock owned by user over [nStart, nEnd] */
CBigInt GetUserAverageVotingPower(CPointsStore& store, const std::string& user, int64_t nStart, int64_t nEnd);

/** Number of active partner collections in which user holds at least one token */
uint32_t CountActiveNftCollections(CPointsStore& store, const std::string& user);

/**
 * RefreshUserMultipliers - Recompute NFT, voting power and combined multipliers
 *
 * @param pStateOut Optional output: the refreshed state
 */
bool RefreshUserMultipliers(CPointsStore& store, const std::string& user, int64_t nTime,
                            CUserLeaderboardState* pStateOut = nullptr);

/**
 * ApplyLockDeposit - Create a lock or add to an existing one
 *
 * @param amount Amount added to the lock
 * @param nLockEnd New unlock time, unchanged when unset
 */
bool ApplyLockDeposit(CPointsStore& store, const std::string& tokenId, const std::string& owner,
                      const CBigInt& amount, const std::optional<int64_t>& nLockEnd, int64_t nTime);

/** Remove a withdrawn lock; an unknown lock is a no-op */
bool ApplyLockWithdraw(CPointsStore& store, const std::string& tokenId, int64_t nTime);

/** Lock permanently, or unlock into a fresh MAX_LOCK_TIME decay */
bool ApplyLockPermanent(CPointsStore& store, const std::string& tokenId, bool fPermanent, int64_t nTime);

/** Move a lock to a new owner */
bool ApplyLockTransfer(CPointsStore& store, const std::string& tokenId, const std::string& to, int64_t nTime);

/**
 * ApplyNftTransfer - Move nCount partner tokens between users
 *
 * Mints and burns use the null address. A side whose balance has never
 * been seen is read from the chain when a reader is available; a failed
 * read falls back to a zero starting balance. Balances never go negative.
 */
bool ApplyNftTransfer(CPointsStore& store, const std::string& collection, const std::string& from,
                      const std::string& to, int64_t nCount, CChainReader* pReader, int64_t nTime);

/** Owner of a lock, empty if unknown */
std::string GetLockOwner(CPointsStore& store, const std::string& tokenId);

} // namespace points_voting

#endif // POINTSD_POINTS_VOTING_H
