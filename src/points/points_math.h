// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_MATH_H
#define POINTSD_POINTS_MATH_H

#include "points/points_amount.h"

#include <stdint.h>
#include <string>

/**
 * Ray (1e27) and wad (1e18) fixed point arithmetic
 *
 * Interest indices and rates are ray values. All divisions round half up
 * on positive operands, matching the lending pool contracts the indices
 * come from. No state.
 */
namespace points_math {

extern const CBigInt RAY;
extern const CBigInt HALF_RAY;
extern const CBigInt WAD;
extern const CBigInt WAD_RAY_RATIO;

/** (a * b + HALF_RAY) / RAY, 0 if either operand is 0 */
CBigInt RayMul(const CBigInt& a, const CBigInt& b);

/** (a * RAY + b / 2) / b, 0 if b is 0 */
CBigInt RayDiv(const CBigInt& a, const CBigInt& b);

CBigInt RayToWad(const CBigInt& a);
CBigInt WadToRay(const CBigInt& a);

/** 10^n */
CBigInt Pow10(int n);

/**
 * CalculateLinearInterest - rate * (nTime - nLastUpdate) / SECONDS_PER_YEAR
 *
 * @param rate Annual rate (ray)
 * @param nLastUpdate Start of the interval
 * @param nTime End of the interval
 * @return Accumulated interest factor over the interval (ray, without the 1.0 base)
 */
CBigInt CalculateLinearInterest(const CBigInt& rate, int64_t nLastUpdate, int64_t nTime);

/**
 * CalculateCompoundedInterest - Three term Taylor expansion of e^(rate*t)
 *
 * @return RAY (1.0) when nTime <= nLastUpdate
 */
CBigInt CalculateCompoundedInterest(const CBigInt& rate, int64_t nLastUpdate, int64_t nTime);

/**
 * CalculateGrowth - Interest earned by a wad principal over an interval
 *
 * @return 0 when nTime <= nLastUpdate
 */
CBigInt CalculateGrowth(const CBigInt& principal, const CBigInt& rate, int64_t nLastUpdate, int64_t nTime);

/** Liquidity index projected to nTime (linear), 0 for an uninitialized index */
CBigInt GetNormalizedIncome(const CBigInt& liquidityIndex, const CBigInt& liquidityRate,
                            int64_t nLastUpdate, int64_t nTime);

/** Variable borrow index projected to nTime (compounded), 0 for an uninitialized index */
CBigInt GetNormalizedVariableDebt(const CBigInt& variableBorrowIndex, const CBigInt& variableBorrowRate,
                                  int64_t nLastUpdate, int64_t nTime);

/**
 * FormatDecimal - Render an integer with nDecimals implied decimals
 *
 * The sign is kept and trailing zero fraction digits are dropped:
 * FormatDecimal(-1500, 3) == "-1.5", FormatDecimal(2000, 3) == "2".
 */
std::string FormatDecimal(const CBigInt& value, int nDecimals);

/** FormatDecimal parsed back to a double (display and ranking) */
double ToDecimal(const CBigInt& value, int nDecimals);

} // namespace points_math

#endif // POINTSD_POINTS_MATH_H
