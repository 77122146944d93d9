// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_PARAMS_H
#define POINTSD_POINTS_PARAMS_H

#include <stdint.h>

/**
 * Engine parameters
 *
 * Time values are in seconds, rates and multipliers in basis points
 * (10000 = 1.0x, or 100% per day for accrual rates).
 */

// ============================================================================
// Time
// ============================================================================

static const int64_t SECONDS_PER_DAY = 86400;
static const int64_t SECONDS_PER_YEAR = 31556952;     // 365.2425 days, interest math only
static const int64_t MAX_LOCK_TIME = 31536000;        // 365 days, veNFT maximum lock

// ============================================================================
// Multipliers
// ============================================================================

static const uint32_t BPS_DENOMINATOR = 10000;
static const uint32_t BASE_MULTIPLIER_BPS = 10000;    // 1.0x
static const uint32_t MAX_MULTIPLIER_BPS = 100000;    // 10.0x
static const uint32_t MAX_VP_TIERS = 20;

// ============================================================================
// Ranking
// ============================================================================

static const int MAX_TOP_K = 100;
static const int MAX_BUCKETS = 120;
static const int ALL_TIME_EPOCH = 0;
static const int32_t MAX_BUCKET_COUNT = 2147483647;   // saturating counter ceiling

// ============================================================================
// Epochs and settlement
// ============================================================================

static const int MAX_EPOCH_TRANSITIONS_PER_EVENT = 5;

static const uint32_t DEFAULT_DEPOSIT_RATE_BPS = 100;
static const uint32_t DEFAULT_BORROW_RATE_BPS = 500;
static const uint32_t DEFAULT_VP_RATE_BPS = 0;
static const uint32_t DEFAULT_LP_RATE_BPS = 0;
static const int64_t DEFAULT_COOLDOWN_SECONDS = 3600;
static const uint32_t DEFAULT_NFT_FIRST_BONUS_BPS = 0;
static const uint32_t DEFAULT_NFT_DECAY_RATIO_BPS = 10000;

/** Price used when a reserve has no oracle price (1.0 USD, 8 decimals) */
static const int64_t DEFAULT_PRICE_USD_E8 = 100000000;
static const int DEFAULT_RESERVE_DECIMALS = 18;
/** USD values above this are clamped before points are computed */
static const double MAX_USD_VALUE = 1e15;

#endif // POINTSD_POINTS_PARAMS_H
