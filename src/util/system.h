// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_UTIL_SYSTEM_H
#define POINTSD_UTIL_SYSTEM_H

#include "logging.h"

#include <cstdint>
#include <istream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

static const char* const POINTSD_CONF_FILENAME = "pointsd.conf";

template <typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintf("ERROR: %s\n", strprintf(fmt, args...));
    return false;
}

/**
 * ArgsManager - Command line and config file options
 *
 * Options are stored with their leading dash ("-debug"). Values given on the
 * command line take precedence over values read from the config file.
 * Multi-valued options (-debug=points -debug=ranking) keep every value.
 */
class ArgsManager
{
protected:
    mutable std::mutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

    /** Return the last value set for strArg, command line first */
    bool GetLastValue(const std::string& strArg, std::string& strValue) const;

public:
    /**
     * ParseParameters - Read -name[=value] options from the command line
     *
     * @param argc Argument count
     * @param argv Argument vector (argv[0] is skipped)
     * @param error Output: description of the first malformed argument
     * @return false if a positional (non-dash) argument was found
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * ReadConfigStream - Read name=value lines
     *
     * Blank lines and lines starting with '#' are ignored.
     *
     * @param stream Input stream
     * @param error Output: description of the first malformed line
     * @return false on a line without '='
     */
    bool ReadConfigStream(std::istream& stream, std::string& error);

    /** Read a config file from disk, see ReadConfigStream */
    bool ReadConfigFile(const std::string& path, std::string& error);

    /** Return all values for an option (command line values first) */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    bool IsArgSet(const std::string& strArg) const;

    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /** Set an option unless it was already set, return true on success */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    /** Overwrite an option on the command line layer (tests) */
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    void ClearArgs();
};

extern ArgsManager gArgs;

#endif // POINTSD_UTIL_SYSTEM_H
