// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_LEADERBOARD_H
#define POINTSD_POINTS_LEADERBOARD_H

#include "points/points_store.h"

#include <stdint.h>
#include <string>

/**
 * Leaderboard facade
 *
 * Single entry point after every points mutation. Blacklisted users are
 * never ranked. Updates of the current epoch are mirrored into the global
 * scope consumed by front ends.
 */
namespace points_leaderboard {

bool IsUserBlacklisted(CPointsStore& store, const std::string& user);

/**
 * UpdateLeaderboard - Rank a user's score in the current epoch
 *
 * Skipped when the user is blacklisted or no epoch has been started.
 */
bool UpdateLeaderboard(CPointsStore& store, const std::string& user, double points, int64_t nTime);

/**
 * UpdateLeaderboardForEpoch - Rank a user's score in a given epoch
 *
 * @param nEpoch Epoch number (> 0)
 * @param points Epoch total with multipliers applied
 * @return false on store failure only
 */
bool UpdateLeaderboardForEpoch(CPointsStore& store, const std::string& user, int nEpoch, double points, int64_t nTime);

/** Rank a user's lifetime points in the all-time scope (epoch 0) */
bool UpdateAllTimeLeaderboard(CPointsStore& store, const std::string& user, double lifetimePoints, int64_t nTime);

/** Remove a user from the current epoch (and its mirror) and from the all-time scope */
bool RemoveUserFromLeaderboards(CPointsStore& store, const std::string& user, int64_t nTime);

} // namespace points_leaderboard

#endif // POINTSD_POINTS_LEADERBOARD_H
