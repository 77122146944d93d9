// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_AMOUNT_H
#define POINTSD_POINTS_AMOUNT_H

#include <boost/multiprecision/cpp_int.hpp>

#include <string>

/**
 * Amount types
 *
 * CBigInt carries ray (1e27) and wad (1e18) quantities, interest indices and
 * raw on-chain token amounts. CPoints carries points scaled by POINTS_SCALE
 * (1e18), so 1.5 points is stored as 1500000000000000000.
 */
typedef boost::multiprecision::int256_t CBigInt;
typedef boost::multiprecision::int128_t CPoints;

static const int64_t POINTS_SCALE_DECIMALS = 18;
static const CPoints POINTS_SCALE = CPoints(1000000000000000000LL);

/** Convert scaled points to a floating value (ranking and display only) */
double PointsToDouble(const CPoints& points);

/** Format scaled points as a decimal string ("41.666666666666666666") */
std::string FormatPoints(const CPoints& points);

/** Parse a decimal integer string ("-123") into a CBigInt, false on bad input */
bool ParseBigInt(const std::string& str, CBigInt& out);

#endif // POINTSD_POINTS_AMOUNT_H
