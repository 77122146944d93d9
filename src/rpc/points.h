// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_RPC_POINTS_H
#define POINTSD_RPC_POINTS_H

#include "points/points_events.h"
#include "points/points_query.h"
#include "points/points_ranking.h"
#include "points/points_store.h"

#include <string>

#include <univalue.h>

//! Error codes, same values as the JSON-RPC server uses
enum RPCErrorCode {
    RPC_MISC_ERROR = -1,
    RPC_TYPE_ERROR = -3,
    RPC_INVALID_PARAMETER = -8,
    RPC_DESERIALIZATION_ERROR = -22,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INTERNAL_ERROR = -32603,
};

/** {"code": code, "message": message}, thrown by the command handlers */
UniValue JSONRPCError(int code, const std::string& message);

// ============================================================================
// Event decoding
// ============================================================================

/**
 * DecodePointsEvent - Build an event from its JSON form
 *
 * {
 *   "block": n, "time": n, "logIndex": n, "txHash": "0x..", "source": "0x..",
 *   "event": "Supply",
 *   "params": { "user": "0x..", "reserve": "0x..", "amount": "1000000" }
 * }
 *
 * Integer amounts may be JSON numbers or decimal strings. Addresses are
 * lower cased.
 *
 * @param strError Output: reason on failure
 * @return false if the object is malformed or the event name unknown
 */
bool DecodePointsEvent(const UniValue& obj, CPointsEvent& event, std::string& strError);

/** DecodePointsEvent for one line of a JSON lines stream */
bool DecodePointsEventLine(const std::string& strLine, CPointsEvent& event, std::string& strError);

// ============================================================================
// Rendering
// ============================================================================

/** "global" (default), "alltime", "current", "epoch:N" or an epoch number */
points_ranking::CRankingScope ParseRankingScope(CPointsStore& store, const UniValue& value);

UniValue TopEntriesToJSON(CPointsStore& store, const points_ranking::CRankingScope& scope, int nCount);
UniValue UserRankToJSON(const points_query::CUserRank& rank);
UniValue UserSummaryToJSON(const points_query::CUserPointsSummary& summary);
UniValue HistogramToJSON(CPointsStore& store, const points_ranking::CRankingScope& scope);
UniValue EpochToJSON(const CLeaderboardEpoch& epoch);

// ============================================================================
// Commands
// ============================================================================

/**
 * ExecutePointsCommand - Run a read-only query command
 *
 * Commands: getleaderboard, getuserrank, getusersinrange, getpointssummary,
 * getscorehistogram, getepochinfo. Throws a JSONRPCError object on bad
 * parameters or an unknown command.
 *
 * @param params JSON array of positional parameters
 */
UniValue ExecutePointsCommand(CPointsStore& store, const std::string& strMethod, const UniValue& params);

#endif // POINTSD_RPC_POINTS_H
