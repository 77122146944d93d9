// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "points/points_amount.h"

#include "points/points_math.h"

double PointsToDouble(const CPoints& points)
{
    return points_math::ToDecimal(CBigInt(points), POINTS_SCALE_DECIMALS);
}

std::string FormatPoints(const CPoints& points)
{
    return points_math::FormatDecimal(CBigInt(points), POINTS_SCALE_DECIMALS);
}

bool ParseBigInt(const std::string& str, CBigInt& out)
{
    if (str.empty()) {
        return false;
    }
    size_t start = (str[0] == '-' || str[0] == '+') ? 1 : 0;
    if (start == str.size()) {
        return false;
    }
    for (size_t i = start; i < str.size(); ++i) {
        if (str[i] < '0' || str[i] > '9') {
            return false;
        }
    }
    // int256 holds up to 76 decimal digits
    if (str.size() - start > 76) {
        return false;
    }
    out = CBigInt(str.substr(start).c_str());
    if (str[0] == '-') {
        out = -out;
    }
    return true;
}
