// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "consensus/validation.h"

#include <tinyformat.h>

std::string GetRejectCodeName(unsigned int chRejectCode)
{
    switch (chRejectCode) {
    case 0: return "none";
    case REJECT_INVALID: return "invalid";
    case REJECT_DUPLICATE: return "duplicate";
    case REJECT_INSUFFICIENT_FUNDS: return "insufficient-funds";
    case REJECT_UNAUTHORIZED: return "unauthorized-signer";
    case REJECT_PROVISIONING_CONFLICT: return "provisioning-conflict";
    case REJECT_OVERFLOW: return "arithmetic-overflow";
    case REJECT_LEDGER_FAILURE: return "ledger-failure";
    }
    return "unknown";
}

std::string FormatStateMessage(const CValidationState& state)
{
    return tfm::format("%s%s (code %i, %s)",
        state.GetRejectReason(),
        state.GetDebugMessage().empty() ? "" : ", " + state.GetDebugMessage(),
        state.GetRejectCode(),
        GetRejectCodeName(state.GetRejectCode()));
}
