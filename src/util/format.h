// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_UTIL_FORMAT_H
#define POINTSD_UTIL_FORMAT_H

#include <boost/format.hpp>

#include <string>

/**
 * strprintf - printf-style formatting on top of boost::format
 *
 * Length modifiers (%lld, %zu, ...) are accepted and ignored, so format
 * strings read the same as elsewhere in the codebase. Argument count
 * mismatches are not treated as errors. A call without arguments still
 * goes through boost::format, so "%%" always renders as "%".
 */
template <typename... Args>
std::string strprintf(const char* fmt, const Args&... args)
{
    boost::format f(fmt);
    f.exceptions(boost::io::all_error_bits ^ (boost::io::too_many_args_bit | boost::io::too_few_args_bit));
    using expander = int[];
    (void)expander{0, ((void)(f % args), 0)...};
    return f.str();
}

#endif // POINTSD_UTIL_FORMAT_H
