// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <fstream>

ArgsManager gArgs;

/** Interpret an option value as a bool ("", "1", "true" are true) */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    if (strValue == "true")
        return true;
    if (strValue == "false")
        return false;
    try {
        return boost::lexical_cast<int64_t>(strValue) != 0;
    } catch (const boost::bad_lexical_cast&) {
        return false;
    }
}

/** Turn -nofoo into -foo=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Unexpected argument: %s", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);

    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos = str.find('#');
        if (pos != std::string::npos) {
            str = str.substr(0, pos);
        }
        boost::algorithm::trim(str);
        if (!str.empty()) {
            pos = str.find('=');
            if (pos == std::string::npos) {
                error = strprintf("parse error on line %i: %s", linenr, str);
                return false;
            }
            std::string key = "-" + boost::algorithm::trim_copy(str.substr(0, pos));
            std::string value = boost::algorithm::trim_copy(str.substr(pos + 1));
            InterpretNegatedOption(key, value);
            m_config_args[key].push_back(value);
        }
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& path, std::string& error)
{
    std::ifstream stream(path);
    if (!stream.good()) {
        error = strprintf("cannot open config file %s", path);
        return false;
    }
    return ReadConfigStream(stream, error);
}

bool ArgsManager::GetLastValue(const std::string& strArg, std::string& strValue) const
{
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    return false;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::vector<std::string> result;
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string value;
    return GetLastValue(strArg, value);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string value;
    if (GetLastValue(strArg, value)) return value;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string value;
    if (!GetLastValue(strArg, value)) return nDefault;
    try {
        return boost::lexical_cast<int64_t>(value);
    } catch (const boost::bad_lexical_cast&) {
        LogPrintf("Invalid integer value %s=%s, using default %lld\n", strArg, value, (long long)nDefault);
        return nDefault;
    }
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string value;
    if (GetLastValue(strArg, value)) return InterpretBool(value);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string value;
    if (GetLastValue(strArg, value)) return false;
    m_override_args[strArg] = {strValue};
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();
    m_config_args.clear();
}
