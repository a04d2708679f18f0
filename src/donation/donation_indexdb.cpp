// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "donation/donation_indexdb.h"

#include "base58.h"
#include "logging.h"
#include "util/system.h"

#include <string>

static const char DB_DONATION = 'D';
static const char DB_DONATION_COUNT = 'N';
static const char DB_DONOR_TOTAL = 'T';
static const char DB_CAMPAIGN = 'C';

CDonationIndexDB::CDonationIndexDB(size_t nCacheSize, bool fMemory, bool fWipe) :
    CDBWrapper(GetDataDir() / "donations", nCacheSize, fMemory, fWipe)
{
}

bool CDonationIndexDB::WriteDonation(const CDonationRecord& record)
{
    const uint64_t nIndex = ReadDonationCount();

    CDonorTotal donorTotal;
    const bool fNewDonor = !ReadDonorTotal(record.donor, donorTotal);
    CCampaignTotals campaign = ReadCampaignTotals();

    // Totals saturate instead of wrapping
    if (!CheckedAdd(donorTotal.nAmount, record.nAmount, donorTotal.nAmount)) donorTotal.nAmount = MAX_AMOUNT;
    if (!CheckedAdd(donorTotal.nTokens, record.nTokens, donorTotal.nTokens)) donorTotal.nTokens = MAX_AMOUNT;
    donorTotal.nCount++;
    if (!CheckedAdd(campaign.nRaised, record.nAmount, campaign.nRaised)) campaign.nRaised = MAX_AMOUNT;
    if (!CheckedAdd(campaign.nTokens, record.nTokens, campaign.nTokens)) campaign.nTokens = MAX_AMOUNT;
    campaign.nDonations++;
    if (fNewDonor)
        campaign.nDonors++;

    CDBBatch batch;
    batch.Write(std::make_pair(DB_DONATION, nIndex), record);
    batch.Write(DB_DONATION_COUNT, nIndex + 1);
    batch.Write(std::make_pair(DB_DONOR_TOTAL, record.donor), donorTotal);
    batch.Write(DB_CAMPAIGN, campaign);
    return WriteBatch(batch);
}

bool CDonationIndexDB::ReadDonation(uint64_t nIndex, CDonationRecord& record) const
{
    return Read(std::make_pair(DB_DONATION, nIndex), record);
}

uint64_t CDonationIndexDB::ReadDonationCount() const
{
    uint64_t nCount = 0;
    if (!Read(DB_DONATION_COUNT, nCount))
        return 0;
    return nCount;
}

bool CDonationIndexDB::ReadRecentDonations(size_t nCount, std::vector<CDonationRecord>& records) const
{
    records.clear();
    uint64_t nIndex = ReadDonationCount();
    while (nIndex > 0 && records.size() < nCount) {
        nIndex--;
        CDonationRecord record;
        if (!ReadDonation(nIndex, record)) {
            return error("%s: missing donation record %u", __func__, nIndex);
        }
        records.push_back(record);
    }
    return true;
}

bool CDonationIndexDB::ReadDonorTotal(const uint256& donor, CDonorTotal& total) const
{
    return Read(std::make_pair(DB_DONOR_TOTAL, donor), total);
}

CCampaignTotals CDonationIndexDB::ReadCampaignTotals() const
{
    CCampaignTotals totals;
    if (!Read(DB_CAMPAIGN, totals))
        return CCampaignTotals();
    return totals;
}

int CDonationIndexDB::RebuildFromLog(const fs::path& logFile)
{
    fsbridge::ifstream file(logFile);
    if (!file.good()) {
        LogPrintf("ERROR: %s: cannot open %s\n", __func__, logFile.string());
        return -1;
    }

    int nIndexed = 0;
    std::string strLine;
    while (std::getline(file, strLine)) {
        CDonationRecord record;
        if (!ParseDonationEventLine(strLine, record))
            continue;
        record.nSequence = ReadDonationCount();
        if (!WriteDonation(record)) {
            LogPrintf("ERROR: %s: failed to write record %d\n", __func__, nIndexed);
            return -1;
        }
        nIndexed++;
    }
    LogPrint(BCLog::DB, "%s: indexed %d donation records from %s\n", __func__, nIndexed, logFile.string());
    return nIndexed;
}

void CDonationIndexer::DonationRecorded(const CDonationRecord& record)
{
    try {
        if (!db.WriteDonation(record))
            LogPrintf("ERROR: %s: failed to index donation from %s\n", __func__, EncodeAddress(record.donor));
    } catch (const dbwrapper_error& e) {
        LogPrintf("ERROR: %s: failed to index donation from %s: %s\n", __func__, EncodeAddress(record.donor), e.what());
    }
}
