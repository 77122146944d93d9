// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_math.h"

#include "points/points_params.h"

#include <cstdlib>

namespace points_math {

const CBigInt RAY("1000000000000000000000000000");
const CBigInt HALF_RAY("500000000000000000000000000");
const CBigInt WAD("1000000000000000000");
const CBigInt WAD_RAY_RATIO("1000000000");

CBigInt RayMul(const CBigInt& a, const CBigInt& b)
{
    if (a == 0 || b == 0) {
        return 0;
    }
    return (a * b + HALF_RAY) / RAY;
}

CBigInt RayDiv(const CBigInt& a, const CBigInt& b)
{
    if (b == 0) {
        return 0;
    }
    CBigInt halfB = b / 2;
    return (a * RAY + halfB) / b;
}

CBigInt RayToWad(const CBigInt& a)
{
    CBigInt halfRatio = WAD_RAY_RATIO / 2;
    return (a + halfRatio) / WAD_RAY_RATIO;
}

CBigInt WadToRay(const CBigInt& a)
{
    return a * WAD_RAY_RATIO;
}

CBigInt Pow10(int n)
{
    CBigInt result = 1;
    for (int i = 0; i < n; ++i) {
        result *= 10;
    }
    return result;
}

CBigInt CalculateLinearInterest(const CBigInt& rate, int64_t nLastUpdate, int64_t nTime)
{
    CBigInt timeDelta = RayDiv(WadToRay(CBigInt(nTime - nLastUpdate)), WadToRay(CBigInt(SECONDS_PER_YEAR)));
    return RayMul(rate, timeDelta);
}

CBigInt CalculateCompoundedInterest(const CBigInt& rate, int64_t nLastUpdate, int64_t nTime)
{
    if (nTime <= nLastUpdate) {
        return RAY;
    }

    CBigInt timeDiff = nTime - nLastUpdate;
    CBigInt expMinusOne = timeDiff - 1;
    CBigInt expMinusTwo = timeDiff > 2 ? CBigInt(timeDiff - 2) : CBigInt(0);
    CBigInt ratePerSecond = rate / SECONDS_PER_YEAR;

    CBigInt basePowerTwo = RayMul(ratePerSecond, ratePerSecond);
    CBigInt basePowerThree = RayMul(basePowerTwo, ratePerSecond);

    CBigInt secondTerm = (timeDiff * expMinusOne * basePowerTwo) / 2;
    CBigInt thirdTerm = (timeDiff * expMinusOne * expMinusTwo * basePowerThree) / 6;

    return RAY + ratePerSecond * timeDiff + secondTerm + thirdTerm;
}

CBigInt CalculateGrowth(const CBigInt& principal, const CBigInt& rate, int64_t nLastUpdate, int64_t nTime)
{
    if (nTime <= nLastUpdate) {
        return 0;
    }
    CBigInt growthRate = CalculateLinearInterest(rate, nLastUpdate, nTime);
    return RayToWad(RayMul(WadToRay(principal), growthRate));
}

CBigInt GetNormalizedIncome(const CBigInt& liquidityIndex, const CBigInt& liquidityRate,
                            int64_t nLastUpdate, int64_t nTime)
{
    if (liquidityIndex == 0) {
        return 0;
    }
    if (nTime <= nLastUpdate) {
        return liquidityIndex;
    }
    return RayMul(RAY + CalculateLinearInterest(liquidityRate, nLastUpdate, nTime), liquidityIndex);
}

CBigInt GetNormalizedVariableDebt(const CBigInt& variableBorrowIndex, const CBigInt& variableBorrowRate,
                                  int64_t nLastUpdate, int64_t nTime)
{
    if (variableBorrowIndex == 0) {
        return 0;
    }
    if (nTime <= nLastUpdate) {
        return variableBorrowIndex;
    }
    return RayMul(CalculateCompoundedInterest(variableBorrowRate, nLastUpdate, nTime), variableBorrowIndex);
}

std::string FormatDecimal(const CBigInt& value, int nDecimals)
{
    if (value == 0) {
        return "0";
    }
    bool fNegative = value < 0;
    std::string digits = (fNegative ? CBigInt(-value) : value).str();

    std::string result;
    if (nDecimals <= 0) {
        result = digits;
    } else {
        if ((int)digits.size() < nDecimals + 1) {
            digits.insert(0, nDecimals + 1 - digits.size(), '0');
        }
        std::string whole = digits.substr(0, digits.size() - nDecimals);
        std::string fraction = digits.substr(digits.size() - nDecimals);
        size_t last = fraction.find_last_not_of('0');
        fraction = (last == std::string::npos) ? std::string() : fraction.substr(0, last + 1);
        result = fraction.empty() ? whole : whole + "." + fraction;
    }
    return fNegative ? "-" + result : result;
}

double ToDecimal(const CBigInt& value, int nDecimals)
{
    return std::strtod(FormatDecimal(value, nDecimals).c_str(), nullptr);
}

} // namespace points_math
