// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_TEST_TEST_POINTSD_H
#define POINTSD_TEST_TEST_POINTSD_H

#include "points/points_events.h"
#include "points/points_math.h"
#include "points/points_store.h"
#include "points/points_validation.h"

#include <stdint.h>
#include <string>

/** One whole token with 18 decimals */
static const CBigInt TOKEN("1000000000000000000");

/**
 * Basic testing setup.
 * Resets logging and the argument manager, and hands every test a fresh
 * in-memory store.
 */
struct BasicTestingSetup {
    CPointsMemoryStore store;

    BasicTestingSetup();
    ~BasicTestingSetup();

    /** Header at (nBlock, nLogIndex) with a transaction hash derived from both */
    CEventHeader MakeHeader(int64_t nBlock, int64_t nTime, int nLogIndex = 0) const;

    /** ProcessPointsEvent wrapper, returns the state's result */
    bool Process(const CEventHeader& header, const CPointsEventPayload& payload);

    /** Reserve with unit indices, zero rates and the given price */
    void AddReserve(const std::string& reserve, int nDecimals, const CBigInt& priceUsdE8, int64_t nTime);

    /** ConfigSnapshot with the given rates and no cooldown */
    void SetConfig(uint32_t nDepositRateBps, uint32_t nBorrowRateBps, int64_t nCooldownSeconds, int64_t nTime);
};

#endif // POINTSD_TEST_TEST_POINTSD_H
