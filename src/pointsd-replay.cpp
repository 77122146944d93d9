// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"
#include "points/points_params.h"
#include "points/points_store.h"
#include "points/points_validation.h"
#include "rpc/points.h"
#include "util/system.h"

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

static const int64_t DEFAULT_REPLAY_TOPK = 10;

static void PrintUsage()
{
    std::string strUsage = "Usage: pointsd-replay -events=<file> [options]\n\n";
    strUsage += "Replay a JSON lines event stream and print the resulting leaderboard.\n\n";
    strUsage += "Options:\n";
    strUsage += "  -events=<file>            Event stream, one JSON event per line\n";
    strUsage += "  -conf=<file>              Read options from a name=value file\n";
    strUsage += strprintf("  -topk=<n>                 Entries printed at the end (default: %d)\n", DEFAULT_REPLAY_TOPK);
    strUsage += "  -scope=<scope>            global, alltime, current or epoch:N (default: global)\n";
    strUsage += "  -printtoconsole           Send log output to stdout\n";
    strUsage += strprintf("  -debuglogfile=<file>      Log file (default: %s)\n", DEFAULT_DEBUGLOGFILE);
    strUsage += strprintf("  -debug=<category>         Enable debug logging: %s, all\n", ListLogCategories());
    strUsage += "\nBootstrap configuration (used until the first ConfigSnapshot event):\n";
    strUsage += strprintf("  -depositratebps=<n>       (default: %u)\n", DEFAULT_DEPOSIT_RATE_BPS);
    strUsage += strprintf("  -borrowratebps=<n>        (default: %u)\n", DEFAULT_BORROW_RATE_BPS);
    strUsage += strprintf("  -vpratebps=<n>            (default: %u)\n", DEFAULT_VP_RATE_BPS);
    strUsage += strprintf("  -lpratebps=<n>            (default: %u)\n", DEFAULT_LP_RATE_BPS);
    strUsage += strprintf("  -cooldown=<seconds>       (default: %d)\n", DEFAULT_COOLDOWN_SECONDS);
    strUsage += "  -mindailybonususd=<usd>   (default: 0)\n";
    strUsage += strprintf("  -nftfirstbonusbps=<n>     (default: %u)\n", DEFAULT_NFT_FIRST_BONUS_BPS);
    strUsage += strprintf("  -nftdecaybps=<n>          (default: %u)\n", DEFAULT_NFT_DECAY_RATIO_BPS);
    fprintf(stdout, "%s", strUsage.c_str());
}

static bool InitLogging()
{
    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debuglogfile")) {
        logger.m_file_path = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
        logger.m_print_to_file = true;
        if (!logger.OpenDebugLog()) {
            fprintf(stderr, "Error: Could not open debug log file %s\n", logger.m_file_path.c_str());
            return false;
        }
    }

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (!logger.EnableCategory(cat)) {
            fprintf(stderr, "Warning: Unsupported logging category -debug=%s\n", cat.c_str());
        }
    }
    return true;
}

static uint32_t GetBpsArg(const std::string& strArg, uint32_t nDefault)
{
    const int64_t nValue = gArgs.GetArg(strArg, (int64_t)nDefault);
    if (nValue < 0 || nValue > (int64_t)MAX_MULTIPLIER_BPS * 10) {
        LogPrintf("%s: %s=%d out of range, using %u\n", __func__, strArg, nValue, nDefault);
        return nDefault;
    }
    return (uint32_t)nValue;
}

/** Seed the store with the bootstrap configuration */
static bool WriteBootstrapConfig(CPointsStore& store)
{
    CLeaderboardConfig config;
    config.nDepositRateBps = GetBpsArg("-depositratebps", DEFAULT_DEPOSIT_RATE_BPS);
    config.nBorrowRateBps = GetBpsArg("-borrowratebps", DEFAULT_BORROW_RATE_BPS);
    config.nVpRateBps = GetBpsArg("-vpratebps", DEFAULT_VP_RATE_BPS);
    config.nLpRateBps = GetBpsArg("-lpratebps", DEFAULT_LP_RATE_BPS);
    config.nCooldownSeconds = std::max<int64_t>(0, gArgs.GetArg("-cooldown", DEFAULT_COOLDOWN_SECONDS));
    config.nNftFirstBonusBps = GetBpsArg("-nftfirstbonusbps", DEFAULT_NFT_FIRST_BONUS_BPS);
    config.nNftDecayRatioBps = GetBpsArg("-nftdecaybps", DEFAULT_NFT_DECAY_RATIO_BPS);

    const std::string strMinUsd = gArgs.GetArg("-mindailybonususd", "0");
    try {
        config.nMinDailyBonusUsd = std::stod(strMinUsd);
    } catch (const std::exception&) {
        return error("%s: invalid -mindailybonususd=%s", __func__, strMinUsd);
    }

    if (!store.WriteConfig(config)) {
        return error("%s: failed to write config", __func__);
    }
    LogPrintf("Bootstrap config: deposit=%u borrow=%u vp=%u lp=%u bps, cooldown=%ds\n",
              config.nDepositRateBps, config.nBorrowRateBps, config.nVpRateBps, config.nLpRateBps,
              config.nCooldownSeconds);
    return true;
}

/** Replay every event of the file, return false if it cannot be opened */
static bool ReplayEvents(CPointsStore& store, const std::string& strPath, int& nApplied, int& nRejected)
{
    std::ifstream file(strPath);
    if (!file.is_open()) {
        return error("%s: cannot open %s", __func__, strPath);
    }

    std::string strLine;
    int nLine = 0;
    while (std::getline(file, strLine)) {
        ++nLine;
        boost::algorithm::trim(strLine);
        if (strLine.empty() || strLine[0] == '#') {
            continue;
        }

        CPointsEvent event;
        std::string strError;
        if (!DecodePointsEventLine(strLine, event, strError)) {
            LogPrintf("%s:%d: %s\n", strPath, nLine, strError);
            ++nRejected;
            continue;
        }

        CPointsEventState state;
        if (!ProcessPointsEvent(store, event, state)) {
            LogPrintf("%s:%d: %s %s rejected: %s\n", strPath, nLine, event.GetName(), event.header.GetId(),
                      state.ToString());
            ++nRejected;
            continue;
        }
        ++nApplied;
    }
    return true;
}

int main(int argc, char* argv[])
{
    std::string strError;
    if (!gArgs.ParseParameters(argc, argv, strError)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", strError.c_str());
        return EXIT_FAILURE;
    }

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help") || !gArgs.IsArgSet("-events")) {
        PrintUsage();
        return gArgs.IsArgSet("-events") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (gArgs.IsArgSet("-conf")) {
        const std::string strConf = gArgs.GetArg("-conf", POINTSD_CONF_FILENAME);
        if (!gArgs.ReadConfigFile(strConf, strError)) {
            fprintf(stderr, "Error reading configuration file: %s\n", strError.c_str());
            return EXIT_FAILURE;
        }
    }

    if (!InitLogging()) {
        return EXIT_FAILURE;
    }

    CPointsMemoryStore store;
    if (!WriteBootstrapConfig(store)) {
        return EXIT_FAILURE;
    }

    const std::string strEvents = gArgs.GetArg("-events", "");
    int nApplied = 0;
    int nRejected = 0;
    if (!ReplayEvents(store, strEvents, nApplied, nRejected)) {
        fprintf(stderr, "Error: cannot open event file %s\n", strEvents.c_str());
        return EXIT_FAILURE;
    }
    LogPrintf("Replayed %s: %d events applied, %d rejected\n", strEvents, nApplied, nRejected);

    try {
        UniValue scopeParam(gArgs.GetArg("-scope", "global"));
        const points_ranking::CRankingScope scope = ParseRankingScope(store, scopeParam);
        const int64_t nTopK = gArgs.GetArg("-topk", DEFAULT_REPLAY_TOPK);
        UniValue result = TopEntriesToJSON(store, scope, (int)std::max<int64_t>(0, std::min<int64_t>(nTopK, MAX_TOP_K)));
        result.pushKV("applied", nApplied);
        result.pushKV("rejected", nRejected);
        std::cout << result.write(2) << std::endl;
    } catch (const UniValue& objError) {
        fprintf(stderr, "Error: %s\n", find_value(objError, "message").getValStr().c_str());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
