// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_DONATION_INDEXDB_H
#define DONATION_DONATION_INDEXDB_H

#include "amount.h"
#include "dbwrapper.h"
#include "donation/donation_events.h"
#include "fs.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>

#include <vector>

/** Running totals of one donor */
struct CDonorTotal {
    CAmount nAmount;
    CAmount nTokens;
    uint64_t nCount;

    CDonorTotal() : nAmount(0), nTokens(0), nCount(0) {}

    SERIALIZE_METHODS(CDonorTotal, obj)
    {
        READWRITE(obj.nAmount, obj.nTokens, obj.nCount);
    }
};

/** Campaign-wide totals */
struct CCampaignTotals {
    CAmount nRaised;
    CAmount nTokens;
    uint64_t nDonations;
    uint64_t nDonors;

    CCampaignTotals() : nRaised(0), nTokens(0), nDonations(0), nDonors(0) {}

    SERIALIZE_METHODS(CCampaignTotals, obj)
    {
        READWRITE(obj.nRaised, obj.nTokens, obj.nDonations, obj.nDonors);
    }
};

/**
 * CDonationIndexDB - LevelDB index of emitted donation records
 *
 * Database keys:
 * - 'D' + index  -> CDonationRecord (index counts from 0 in emission order)
 * - 'N'          -> uint64_t (number of records)
 * - 'T' + donor  -> CDonorTotal
 * - 'C'          -> CCampaignTotals
 *
 * Observational: it is fed from the event stream and never consulted by
 * request execution.
 */
class CDonationIndexDB : public CDBWrapper
{
public:
    explicit CDonationIndexDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);

private:
    CDonationIndexDB(const CDonationIndexDB&);
    void operator=(const CDonationIndexDB&);

public:
    /**
     * WriteDonation - Append a record and update donor and campaign totals
     * in one batch.
     */
    bool WriteDonation(const CDonationRecord& record);

    bool ReadDonation(uint64_t nIndex, CDonationRecord& record) const;

    uint64_t ReadDonationCount() const;

    /**
     * ReadRecentDonations - Up to nCount records, newest first
     */
    bool ReadRecentDonations(size_t nCount, std::vector<CDonationRecord>& records) const;

    bool ReadDonorTotal(const uint256& donor, CDonorTotal& total) const;

    CCampaignTotals ReadCampaignTotals() const;

    /**
     * RebuildFromLog - Re-index DONATION_EVENT lines of a debug log.
     * Lines already present are not de-duplicated; call on an empty index.
     *
     * @return number of records indexed, -1 if the file cannot be read
     */
    int RebuildFromLog(const fs::path& logFile);
};

/** Listener that appends every emitted record to a CDonationIndexDB */
class CDonationIndexer : public CDonationInterface
{
private:
    CDonationIndexDB& db;

public:
    explicit CDonationIndexer(CDonationIndexDB& dbIn) : db(dbIn) {}

    void DonationRecorded(const CDonationRecord& record) override;
};

#endif // DONATION_DONATION_INDEXDB_H
