// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"

#include <chrono>
#include <ctime>

const char* const DEFAULT_DEBUGLOGFILE = "debug.log";

BCLog::Logger& LogInstance()
{
    // Leaked on purpose so that logging from static destructors stays valid.
    static BCLog::Logger* g_logger{new BCLog::Logger()};
    return *g_logger;
}

struct CLogCategoryDesc
{
    BCLog::LogFlags flag;
    std::string category;
};

static const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::NONE, "none"},
    {BCLog::POINTS, "points"},
    {BCLog::RANKING, "ranking"},
    {BCLog::EPOCH, "epoch"},
    {BCLog::EVENTS, "events"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str)
{
    if (str == "") {
        flag = BCLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != BCLog::NONE && category_desc.flag != BCLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

BCLog::Logger::~Logger()
{
    CloseDebugLog();
}

bool BCLog::Logger::OpenDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);

    if (m_fileout) {
        return true;
    }
    m_fileout = fopen(m_file_path.c_str(), "a");
    if (!m_fileout) {
        return false;
    }
    setbuf(m_fileout, nullptr); // unbuffered
    return true;
}

void BCLog::Logger::CloseDebugLog()
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
    if (m_fileout) {
        fclose(m_fileout);
        m_fileout = nullptr;
    }
}

void BCLog::Logger::EnableCategory(BCLog::LogFlags flag)
{
    m_categories |= flag;
}

bool BCLog::Logger::EnableCategory(const std::string& str)
{
    BCLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void BCLog::Logger::DisableCategory(BCLog::LogFlags flag)
{
    m_categories &= ~flag;
}

bool BCLog::Logger::DisableCategory(const std::string& str)
{
    BCLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool BCLog::Logger::WillLogCategory(BCLog::LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

std::string BCLog::Logger::LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!m_log_timestamps)
        return str;

    if (m_started_new_line) {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        char buf[32];
        struct tm tm_utc;
        gmtime_r(&now, &tm_utc);
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        strStamped = std::string(buf) + ' ' + str;
    } else
        strStamped = str;

    m_started_new_line = !str.empty() && str[str.size() - 1] == '\n';

    return strStamped;
}

void BCLog::Logger::LogPrintStr(const std::string& str)
{
    std::lock_guard<std::mutex> scoped_lock(m_file_mutex);
    std::string strTimestamped = LogTimestampStr(str);

    if (m_print_to_console) {
        // print to console
        fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (m_print_to_file && m_fileout) {
        fwrite(strTimestamped.data(), 1, strTimestamped.size(), m_fileout);
    }
}
