// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_DONATION_EVENTS_H
#define DONATION_DONATION_EVENTS_H

#include "amount.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>

#include <string>

/**
 * CDonationRecord - what one successful donation did
 *
 * Observational only. Emitted once per committed request; ledger state never
 * depends on it.
 */
class CDonationRecord
{
public:
    uint256 donor;
    CAmount nAmount;
    int64_t nTime;
    CAmount nTokens;
    uint256 hashRequest;
    //! Commit sequence of the request (0-based)
    uint64_t nSequence;

    CDonationRecord()
    {
        SetNull();
    }

    void SetNull()
    {
        donor.SetNull();
        nAmount = 0;
        nTime = 0;
        nTokens = 0;
        hashRequest.SetNull();
        nSequence = 0;
    }

    SERIALIZE_METHODS(CDonationRecord, obj)
    {
        READWRITE(obj.donor, obj.nAmount, obj.nTime, obj.nTokens, obj.hashRequest, obj.nSequence);
    }

    /** DONATION_EVENT: donor=<base58>, amount=<n>, timestamp=<t>, tokens=<n> */
    std::string ToLogLine() const;
};

/** Parse a line produced by ToLogLine (anywhere in the string). hashRequest and nSequence stay null. */
bool ParseDonationEventLine(const std::string& strLine, CDonationRecord& recordRet);

/**
 * Implement this to subscribe to committed donations.
 */
class CDonationInterface
{
public:
    virtual ~CDonationInterface() {}

    /** Called once per committed donation, after the ledger write */
    virtual void DonationRecorded(const CDonationRecord& record) {}
};

/** Register a listener */
void RegisterDonationInterface(CDonationInterface* pListener);
/** Unregister a listener */
void UnregisterDonationInterface(CDonationInterface* pListener);
/** Unregister all listeners */
void UnregisterAllDonationInterfaces();

/**
 * EventEmitter: log the record line and notify every listener.
 * A throwing listener is logged and skipped.
 */
void EmitDonationEvent(const CDonationRecord& record);

#endif // DONATION_DONATION_EVENTS_H
