// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef POINTSD_POINTS_VALIDATION_H
#define POINTSD_POINTS_VALIDATION_H

#include "points/points_events.h"
#include "points/points_store.h"

#include <string>

namespace points_voting {
class CChainReader;
}

/** Outcome of applying one event */
class CPointsEventState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< malformed event, nothing applied
        MODE_ERROR,   //!< store failure
    } mode;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CPointsEventState() : mode(MODE_VALID) {}

    bool Invalid(const std::string& strRejectReasonIn, const std::string& strDebugMessageIn = "")
    {
        mode = MODE_INVALID;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        return false;
    }

    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID) {
            strRejectReason = strRejectReasonIn;
        }
        mode = MODE_ERROR;
        return false;
    }

    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }
    bool IsError() const { return mode == MODE_ERROR; }

    const std::string& GetRejectReason() const { return strRejectReason; }
    const std::string& GetDebugMessage() const { return strDebugMessage; }

    std::string ToString() const
    {
        if (IsValid()) return "valid";
        if (strDebugMessage.empty()) return strRejectReason;
        return strRejectReason + ", " + strDebugMessage;
    }
};

/**
 * ProcessPointsEvent - Apply one event to the derived state
 *
 * ORDER:
 * 1. Drop events already processed (same txHash-logIndex)
 * 2. Apply due scheduled epoch transitions
 * 3. Dispatch on the payload
 * 4. Mark the event processed
 *
 * Missing prerequisites (no epoch, unknown reserve or lock) skip the
 * points-affecting work and still succeed. Malformed events are rejected
 * with state.Invalid() before their payload touches the store and are not
 * marked processed; store failures return state.Error().
 *
 * @param event Event to apply, events must arrive in (block, logIndex) order
 * @param state Validation state (for errors)
 * @param pReader Optional chain reader used to backfill NFT ownership
 * @return true if the event was applied or skipped
 */
bool ProcessPointsEvent(CPointsStore& store, const CPointsEvent& event, CPointsEventState& state,
                        points_voting::CChainReader* pReader = nullptr);

#endif // POINTSD_POINTS_VALIDATION_H
