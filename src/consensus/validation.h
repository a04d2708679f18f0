// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_CONSENSUS_VALIDATION_H
#define DONATION_CONSENSUS_VALIDATION_H

#include <string>

/** "reject" codes, one per failure category of a ledger request */
static const unsigned char REJECT_INVALID = 0x10;
static const unsigned char REJECT_DUPLICATE = 0x12;
static const unsigned char REJECT_INSUFFICIENT_FUNDS = 0x20;
static const unsigned char REJECT_UNAUTHORIZED = 0x21;
static const unsigned char REJECT_PROVISIONING_CONFLICT = 0x22;
static const unsigned char REJECT_OVERFLOW = 0x23;
static const unsigned char REJECT_LEDGER_FAILURE = 0x24;

/** Capture information about request validation and execution */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< request is rejected
        MODE_ERROR,   //!< run-time error
    } mode;
    unsigned int chRejectCode;
    std::string strRejectReason;
    std::string strDebugMessage;

public:
    CValidationState() : mode(MODE_VALID), chRejectCode(0) {}

    bool DoS(bool ret = false,
             unsigned int chRejectCodeIn = 0,
             const std::string& strRejectReasonIn = "",
             const std::string& strDebugMessageIn = "")
    {
        chRejectCode = chRejectCodeIn;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        if (mode == MODE_ERROR)
            return ret;
        mode = MODE_INVALID;
        return ret;
    }

    bool Invalid(bool ret = false,
                 unsigned int _chRejectCode = 0,
                 const std::string& _strRejectReason = "",
                 const std::string& _strDebugMessage = "")
    {
        return DoS(ret, _chRejectCode, _strRejectReason, _strDebugMessage);
    }

    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        mode = MODE_ERROR;
        chRejectCode = REJECT_LEDGER_FAILURE;
        return false;
    }

    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }
    bool IsError() const { return mode == MODE_ERROR; }

    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

/** Human readable name of a reject code ("insufficient-funds", ...) */
std::string GetRejectCodeName(unsigned int chRejectCode);

/** Convert CValidationState to a human-readable message for logging */
std::string FormatStateMessage(const CValidationState& state);

#endif // DONATION_CONSENSUS_VALIDATION_H
