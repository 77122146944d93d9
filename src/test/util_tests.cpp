// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Argument and logging utility tests
 *
 * Tests:
 * 1. Command line parsing
 * 2. Negated options
 * 3. Config stream and precedence
 * 4. Log categories
 * 5. Format strings
 */

#include "test/test_pointsd.h"

#include "logging.h"
#include "util/format.h"
#include "util/system.h"

#include <sstream>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(util_tests, BasicTestingSetup)

// ═══════════════════════════════════════════════════════════════════════════
// TEST 1: Command line
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(parse_parameters)
{
    ArgsManager args;
    std::string strError;

    const char* argv[] = {"pointsd-replay", "-events=stream.jsonl", "--topk=5", "-printtoconsole", "-debug=points", "-debug=ranking"};
    BOOST_REQUIRE(args.ParseParameters(6, argv, strError));

    BOOST_CHECK_EQUAL(args.GetArg("-events", ""), "stream.jsonl");
    BOOST_CHECK_EQUAL(args.GetArg("-topk", (int64_t)10), 5);
    BOOST_CHECK(args.GetBoolArg("-printtoconsole", false));
    BOOST_CHECK(!args.IsArgSet("-scope"));
    BOOST_CHECK_EQUAL(args.GetArg("-scope", "global"), "global");

    std::vector<std::string> debug = args.GetArgs("-debug");
    BOOST_REQUIRE_EQUAL(debug.size(), 2U);
    BOOST_CHECK_EQUAL(debug[0], "points");
    BOOST_CHECK_EQUAL(debug[1], "ranking");

    // Bad integers fall back to the default
    const char* argvBad[] = {"pointsd-replay", "-topk=abc"};
    BOOST_REQUIRE(args.ParseParameters(2, argvBad, strError));
    BOOST_CHECK_EQUAL(args.GetArg("-topk", (int64_t)10), 10);

    // Positional arguments are rejected
    const char* argvPositional[] = {"pointsd-replay", "stream.jsonl"};
    BOOST_CHECK(!args.ParseParameters(2, argvPositional, strError));
    BOOST_CHECK(!strError.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 2: Negated options
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(negated_options)
{
    ArgsManager args;
    std::string strError;

    const char* argv[] = {"pointsd-replay", "-nologtimestamps", "-noprinttoconsole=0"};
    BOOST_REQUIRE(args.ParseParameters(3, argv, strError));
    BOOST_CHECK(args.IsArgSet("-logtimestamps"));
    BOOST_CHECK(!args.GetBoolArg("-logtimestamps", true));
    BOOST_CHECK(args.GetBoolArg("-printtoconsole", false));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 3: Config stream
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(config_stream)
{
    ArgsManager args;
    std::string strError;

    std::istringstream stream(
        "# bootstrap rates\n"
        "depositratebps = 250\n"
        "\n"
        "cooldown=60  # one minute\n"
        "debug=epoch\n");
    BOOST_REQUIRE(args.ReadConfigStream(stream, strError));
    BOOST_CHECK_EQUAL(args.GetArg("-depositratebps", (int64_t)0), 250);
    BOOST_CHECK_EQUAL(args.GetArg("-cooldown", (int64_t)0), 60);

    // The command line wins
    const char* argv[] = {"pointsd-replay", "-cooldown=5", "-debug=events"};
    BOOST_REQUIRE(args.ParseParameters(3, argv, strError));
    BOOST_CHECK_EQUAL(args.GetArg("-cooldown", (int64_t)0), 5);
    std::vector<std::string> debug = args.GetArgs("-debug");
    BOOST_REQUIRE_EQUAL(debug.size(), 2U);
    BOOST_CHECK_EQUAL(debug[0], "events");
    BOOST_CHECK_EQUAL(debug[1], "epoch");

    BOOST_CHECK(!args.SoftSetArg("-cooldown", "7"));
    BOOST_CHECK(args.SoftSetArg("-scope", "alltime"));
    BOOST_CHECK_EQUAL(args.GetArg("-scope", ""), "alltime");

    std::istringstream bad("cooldown\n");
    BOOST_CHECK(!args.ReadConfigStream(bad, strError));
    BOOST_CHECK(!strError.empty());

    args.ClearArgs();
    BOOST_CHECK(!args.IsArgSet("-cooldown"));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 4: Log categories
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(log_categories)
{
    BCLog::LogFlags flag = BCLog::NONE;
    BOOST_CHECK(GetLogCategory(flag, "ranking"));
    BOOST_CHECK_EQUAL(flag, BCLog::RANKING);
    BOOST_CHECK(GetLogCategory(flag, "all"));
    BOOST_CHECK_EQUAL(flag, BCLog::ALL);
    BOOST_CHECK(!GetLogCategory(flag, "wallet"));

    BOOST_CHECK_EQUAL(ListLogCategories(), "points, ranking, epoch, events");

    BCLog::Logger& logger = LogInstance();
    BOOST_CHECK(!logger.WillLogCategory(BCLog::EPOCH));
    BOOST_CHECK(logger.EnableCategory("epoch"));
    BOOST_CHECK(logger.WillLogCategory(BCLog::EPOCH));
    BOOST_CHECK(!logger.WillLogCategory(BCLog::POINTS));
    BOOST_CHECK(!logger.EnableCategory("wallet"));
    logger.DisableCategory(BCLog::ALL);
    BOOST_CHECK(!logger.WillLogCategory(BCLog::EPOCH));
}

// ═══════════════════════════════════════════════════════════════════════════
// TEST 5: Format strings
// ═══════════════════════════════════════════════════════════════════════════

BOOST_AUTO_TEST_CASE(format_strings)
{
    BOOST_CHECK_EQUAL(strprintf("100%% settled"), "100% settled");
    BOOST_CHECK_EQUAL(strprintf("%d%% of %s", 40, "0xr"), "40% of 0xr");
    BOOST_CHECK_EQUAL(strprintf("epoch=%d block=%lld", 3, (long long)12), "epoch=3 block=12");
    BOOST_CHECK_EQUAL(strprintf("%.0f", 1e20), "100000000000000000000");
}

BOOST_AUTO_TEST_SUITE_END()
