// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for donation events and the donation index
//

#include "test/test_donation.h"

#include "base58.h"
#include "consensus/validation.h"
#include "donation/donation_events.h"
#include "donation/donation_indexdb.h"
#include "donation/donation_tx.h"
#include "donation/donation_validation.h"
#include "logging.h"
#include "utiltime.h"

#include <stdexcept>
#include <vector>

#include <boost/test/unit_test.hpp>

namespace {

class RecordingListener : public CDonationInterface
{
public:
    std::vector<CDonationRecord> vRecords;

    void DonationRecorded(const CDonationRecord& record) override
    {
        vRecords.push_back(record);
    }
};

class ThrowingListener : public CDonationInterface
{
public:
    void DonationRecorded(const CDonationRecord& record) override
    {
        throw std::runtime_error("listener down");
    }
};

CDonationRecord MakeRecord(unsigned char nSeed, CAmount nAmount, int64_t nTime)
{
    CDonationRecord record;
    record.donor = MakeTestKey(nSeed).GetPubKey().GetAddress();
    record.nAmount = nAmount;
    record.nTime = nTime;
    record.nTokens = nAmount / 1000000;
    return record;
}

bool DonateFrom(const CKey& key, CAmount nAmount, uint64_t nNonce)
{
    CDonationRequest request;
    if (!CreateDonationRequest(key, nAmount, nNonce, request))
        return false;
    CValidationState state;
    return ProcessDonationRequest(request, state);
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(donation_events_tests, LedgerTestingSetup)

BOOST_AUTO_TEST_CASE(log_line_format)
{
    CDonationRecord record = MakeRecord(1, 2500000, 1735689600);
    const std::string strLine = record.ToLogLine();
    BOOST_CHECK_EQUAL(strLine, "DONATION_EVENT: donor=" + EncodeAddress(record.donor) +
                                   ", amount=2500000, timestamp=1735689600, tokens=2");

    CDonationRecord parsed;
    BOOST_REQUIRE(ParseDonationEventLine(strLine, parsed));
    BOOST_CHECK(parsed.donor == record.donor);
    BOOST_CHECK_EQUAL(parsed.nAmount, record.nAmount);
    BOOST_CHECK_EQUAL(parsed.nTime, record.nTime);
    BOOST_CHECK_EQUAL(parsed.nTokens, record.nTokens);
    BOOST_CHECK(parsed.hashRequest.IsNull());

    // As written to debug.log
    BOOST_CHECK(ParseDonationEventLine("2025-01-01T00:00:00Z " + strLine + "\n", parsed));
    BOOST_CHECK(parsed.donor == record.donor);
}

BOOST_AUTO_TEST_CASE(log_line_rejects_garbage)
{
    CDonationRecord record = MakeRecord(2, 1000000, 100);
    const std::string strLine = record.ToLogLine();
    CDonationRecord parsed;

    BOOST_CHECK(!ParseDonationEventLine("", parsed));
    BOOST_CHECK(!ParseDonationEventLine("ProcessDonationRequest: rejected", parsed));
    BOOST_CHECK(!ParseDonationEventLine("DONATION_EVENT: donor=, amount=1, timestamp=1, tokens=0", parsed));
    BOOST_CHECK(!ParseDonationEventLine("DONATION_EVENT: donor=" + EncodeAddress(record.donor) +
                                            ", amount=-5, timestamp=1, tokens=0", parsed));
    BOOST_CHECK(!ParseDonationEventLine("DONATION_EVENT: donor=" + EncodeAddress(record.donor) +
                                            ", amount=5, timestamp=1", parsed));
    BOOST_CHECK(!ParseDonationEventLine("DONATION_EVENT: donor=notbase58!, amount=5, timestamp=1, tokens=0", parsed));
}

BOOST_AUTO_TEST_CASE(listeners_notified)
{
    RecordingListener listener;
    ThrowingListener broken;
    RegisterDonationInterface(&broken);
    RegisterDonationInterface(&listener);
    RegisterDonationInterface(&listener);

    CDonationRecord record = MakeRecord(3, 7000000, 200);
    EmitDonationEvent(record);

    // Once despite the double registration, and despite the failing listener
    BOOST_REQUIRE_EQUAL(listener.vRecords.size(), 1U);
    BOOST_CHECK(listener.vRecords[0].donor == record.donor);

    UnregisterDonationInterface(&listener);
    EmitDonationEvent(record);
    BOOST_CHECK_EQUAL(listener.vRecords.size(), 1U);
    UnregisterDonationInterface(&broken);
}

BOOST_AUTO_TEST_CASE(failed_request_emits_nothing)
{
    RecordingListener listener;
    RegisterDonationInterface(&listener);

    CKey donor = MakeFundedKey(COIN);
    BOOST_CHECK(!DonateFrom(donor, 2 * COIN, 1));
    BOOST_CHECK(listener.vRecords.empty());

    BOOST_CHECK(DonateFrom(donor, 1000000, 2));
    BOOST_REQUIRE_EQUAL(listener.vRecords.size(), 1U);
    BOOST_CHECK_EQUAL(listener.vRecords[0].nTokens, 1U);

    UnregisterDonationInterface(&listener);
}

BOOST_AUTO_TEST_CASE(index_totals)
{
    CDonationIndexDB* index = GetDonationIndexDB();
    BOOST_REQUIRE(index);

    CKey donorA = MakeFundedKey(10 * COIN);
    CKey donorB = MakeFundedKey(10 * COIN);
    BOOST_REQUIRE(DonateFrom(donorA, 2000000, 1));
    BOOST_REQUIRE(DonateFrom(donorB, 3500000, 1));
    BOOST_REQUIRE(DonateFrom(donorA, 1000000, 2));

    CCampaignTotals campaign = index->ReadCampaignTotals();
    BOOST_CHECK_EQUAL(campaign.nRaised, 6500000U);
    BOOST_CHECK_EQUAL(campaign.nTokens, 6U);
    BOOST_CHECK_EQUAL(campaign.nDonations, 3U);
    BOOST_CHECK_EQUAL(campaign.nDonors, 2U);

    CDonorTotal totalA;
    BOOST_REQUIRE(index->ReadDonorTotal(donorA.GetPubKey().GetAddress(), totalA));
    BOOST_CHECK_EQUAL(totalA.nAmount, 3000000U);
    BOOST_CHECK_EQUAL(totalA.nTokens, 3U);
    BOOST_CHECK_EQUAL(totalA.nCount, 2U);

    CDonorTotal totalNone;
    BOOST_CHECK(!index->ReadDonorTotal(MakeTestKey(99).GetPubKey().GetAddress(), totalNone));

    // Newest first, capped at the requested count
    std::vector<CDonationRecord> records;
    BOOST_REQUIRE(index->ReadRecentDonations(2, records));
    BOOST_REQUIRE_EQUAL(records.size(), 2U);
    BOOST_CHECK(records[0].donor == donorA.GetPubKey().GetAddress());
    BOOST_CHECK_EQUAL(records[0].nAmount, 1000000U);
    BOOST_CHECK_EQUAL(records[0].nSequence, 2U);
    BOOST_CHECK(records[1].donor == donorB.GetPubKey().GetAddress());

    BOOST_REQUIRE(index->ReadRecentDonations(10, records));
    BOOST_CHECK_EQUAL(records.size(), 3U);
}

BOOST_AUTO_TEST_CASE(index_totals_saturate)
{
    CDonationIndexDB* index = GetDonationIndexDB();
    BOOST_REQUIRE(index);

    BOOST_REQUIRE(index->WriteDonation(MakeRecord(4, MAX_AMOUNT - 1, 1)));
    BOOST_REQUIRE(index->WriteDonation(MakeRecord(4, 10, 2)));

    CDonorTotal total;
    BOOST_REQUIRE(index->ReadDonorTotal(MakeTestKey(4).GetPubKey().GetAddress(), total));
    BOOST_CHECK_EQUAL(total.nAmount, MAX_AMOUNT);
    BOOST_CHECK_EQUAL(total.nCount, 2U);
    BOOST_CHECK_EQUAL(index->ReadCampaignTotals().nRaised, MAX_AMOUNT);
}

BOOST_AUTO_TEST_CASE(rebuild_from_log)
{
    BCLog::Logger& logger = LogInstance();
    logger.m_file_path = pathTemp / "debug.log";
    logger.m_log_timestamps = true;
    BOOST_REQUIRE(logger.OpenDebugLog());
    logger.m_print_to_file = true;

    SetMockTime(1735689600);
    CKey donorA = MakeFundedKey(10 * COIN);
    CKey donorB = MakeFundedKey(10 * COIN);
    BOOST_REQUIRE(DonateFrom(donorA, 4000000, 1));
    BOOST_REQUIRE(DonateFrom(donorB, 500000, 1));
    BOOST_REQUIRE(DonateFrom(donorA, 6000000, 2));

    logger.m_print_to_file = false;
    logger.CloseDebugLog();

    const CCampaignTotals before = GetDonationIndexDB()->ReadCampaignTotals();
    BOOST_CHECK_EQUAL(before.nDonations, 3U);

    // Start over from an empty index
    BOOST_REQUIRE(InitDonationIndexDB(1 << 20, true, true));
    CDonationIndexDB* index = GetDonationIndexDB();
    BOOST_CHECK(index->IsEmpty());

    BOOST_CHECK_EQUAL(index->RebuildFromLog(logger.m_file_path), 3);

    const CCampaignTotals after = index->ReadCampaignTotals();
    BOOST_CHECK_EQUAL(after.nRaised, before.nRaised);
    BOOST_CHECK_EQUAL(after.nTokens, before.nTokens);
    BOOST_CHECK_EQUAL(after.nDonations, 3U);
    BOOST_CHECK_EQUAL(after.nDonors, 2U);

    CDonationRecord last;
    BOOST_REQUIRE(index->ReadDonation(2, last));
    BOOST_CHECK(last.donor == donorA.GetPubKey().GetAddress());
    BOOST_CHECK_EQUAL(last.nAmount, 6000000U);
    BOOST_CHECK_EQUAL(last.nTime, 1735689600);
    BOOST_CHECK_EQUAL(last.nSequence, 2U);
}

BOOST_AUTO_TEST_CASE(rebuild_from_missing_log)
{
    CDonationIndexDB* index = GetDonationIndexDB();
    BOOST_REQUIRE(index);
    BOOST_CHECK_EQUAL(index->RebuildFromLog(pathTemp / "no-such.log"), -1);
    BOOST_CHECK_EQUAL(index->ReadDonationCount(), 0U);
}

BOOST_AUTO_TEST_SUITE_END()
