// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_state.h"

#include <algorithm>

const char* DailyActionName(DailyAction action)
{
    switch (action) {
    case DAILY_SUPPLY: return "supply";
    case DAILY_BORROW: return "borrow";
    case DAILY_REPAY: return "repay";
    case DAILY_WITHDRAW: return "withdraw";
    case DAILY_ACTION_COUNT: break;
    }
    return "unknown";
}

void CUserEpochStats::RecomputeTotals()
{
    CPoints bonuses = 0;
    for (int i = 0; i < DAILY_ACTION_COUNT; ++i) {
        bonuses += dailyBonusPoints[i];
    }

    totalPoints = depositPoints + borrowPoints + lpPoints + vpPoints + bonuses + manualAwardPoints;
    totalPointsWithMultiplier = depositPointsWithMultiplier + borrowPointsWithMultiplier +
                                lpPointsWithMultiplier + vpPointsWithMultiplier +
                                bonuses + manualAwardPoints;
}

bool CUserLeaderboardState::AddEpoch(int nEpoch)
{
    if (std::find(vEpochsParticipated.begin(), vEpochsParticipated.end(), nEpoch) != vEpochsParticipated.end()) {
        return false;
    }
    vEpochsParticipated.push_back(nEpoch);
    std::sort(vEpochsParticipated.begin(), vEpochsParticipated.end());
    return true;
}
