// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for the ledger unit of work (CLedgerViewCache over CLedgerDB)
//
// Tests verify:
// - Writes stay in the view until Flush()
// - A dropped view leaves the database untouched
// - First writer wins for newly created accounts
// - Updates of an account changed since it was read are rejected
// - Committed request hashes are rejected as duplicates
//

#include "test/test_donation.h"

#include "chainparams.h"
#include "consensus/validation.h"
#include "donation/donation_validation.h"
#include "ledger/account.h"
#include "ledger/ledgerdb.h"
#include "ledger/ledgerview.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(ledger_view_tests, LedgerTestingSetup)

static uint256 TestAddress(unsigned char n)
{
    uint256 address;
    *address.begin() = n;
    *(address.begin() + 31) = 0xee;
    return address;
}

static CAccount PlainAccount(CAmount nLamports)
{
    return CAccount(Params().GetLedger().systemProgramId, nLamports);
}

BOOST_AUTO_TEST_CASE(view_isolated_until_flush)
{
    CLedgerDB& db = *GetLedgerDB();
    const uint256 addr = TestAddress(1);

    {
        CLedgerViewDB viewDB(db);
        CLedgerViewCache view(&viewDB);
        view.SetAccount(addr, PlainAccount(1000));

        CAccount account;
        BOOST_CHECK(view.GetAccount(addr, account));
        BOOST_CHECK_EQUAL(account.nLamports, 1000U);
        BOOST_CHECK(view.HasPendingChanges());
        BOOST_CHECK(!db.ExistsAccount(addr));

        CValidationState state;
        BOOST_CHECK(view.Flush(state));
        BOOST_CHECK(state.IsValid());
        BOOST_CHECK(!view.HasPendingChanges());
        BOOST_CHECK_EQUAL(view.GetCacheSize(), 0U);
    }

    CAccount stored;
    BOOST_REQUIRE(db.ReadAccount(addr, stored));
    BOOST_CHECK(stored == PlainAccount(1000));
}

BOOST_AUTO_TEST_CASE(dropped_view_discards_everything)
{
    CLedgerDB& db = *GetLedgerDB();
    const uint256 addr = TestAddress(2);
    const uint256 hashRequest = TestAddress(0x42);

    {
        CLedgerViewDB viewDB(db);
        CLedgerViewCache view(&viewDB);
        view.SetAccount(addr, PlainAccount(5));
        view.AddRequest(hashRequest);
        BOOST_CHECK(view.HaveRequest(hashRequest));
        BOOST_CHECK_EQUAL(view.GetRequestCount(), 1U);
    }

    BOOST_CHECK(!db.ExistsAccount(addr));
    BOOST_CHECK(!db.ExistsRequest(hashRequest));
    BOOST_CHECK_EQUAL(db.ReadRequestCount(), 0U);

    // Reset behaves like dropping the view
    CLedgerViewDB viewDB(db);
    CLedgerViewCache view(&viewDB);
    view.SetAccount(addr, PlainAccount(5));
    view.Reset();
    CValidationState state;
    BOOST_CHECK(view.Flush(state));
    BOOST_CHECK(!db.ExistsAccount(addr));
}

BOOST_AUTO_TEST_CASE(flush_commits_requests)
{
    CLedgerDB& db = *GetLedgerDB();
    const uint256 hashA = TestAddress(0xa0);
    const uint256 hashB = TestAddress(0xb0);

    CLedgerViewDB viewDB(db);
    {
        CLedgerViewCache view(&viewDB);
        view.SetAccount(TestAddress(3), PlainAccount(1));
        view.AddRequest(hashA);
        CValidationState state;
        BOOST_REQUIRE(view.Flush(state));
    }
    BOOST_CHECK(db.ExistsRequest(hashA));
    BOOST_CHECK_EQUAL(db.ReadRequestCount(), 1U);

    {
        CLedgerViewCache view(&viewDB);
        view.AddRequest(hashB);
        BOOST_CHECK_EQUAL(view.GetRequestCount(), 2U);
        CValidationState state;
        BOOST_REQUIRE(view.Flush(state));
    }
    BOOST_CHECK(db.ExistsRequest(hashB));
    BOOST_CHECK_EQUAL(db.ReadRequestCount(), 2U);
}

BOOST_AUTO_TEST_CASE(duplicate_request_rejected_at_commit)
{
    CLedgerDB& db = *GetLedgerDB();
    const uint256 hashRequest = TestAddress(0xc0);
    const uint256 addr = TestAddress(4);

    CLedgerViewDB viewDB(db);
    CLedgerViewCache viewA(&viewDB);
    CLedgerViewCache viewB(&viewDB);

    viewA.AddRequest(hashRequest);
    viewB.SetAccount(addr, PlainAccount(9));
    viewB.AddRequest(hashRequest);

    CValidationState stateA;
    BOOST_REQUIRE(viewA.Flush(stateA));

    CValidationState stateB;
    BOOST_CHECK(!viewB.Flush(stateB));
    BOOST_CHECK_EQUAL(stateB.GetRejectCode(), REJECT_DUPLICATE);
    BOOST_CHECK_EQUAL(stateB.GetRejectReason(), "ledger-duplicate-request");

    // Nothing of the rejected batch was written
    BOOST_CHECK(!db.ExistsAccount(addr));
    BOOST_CHECK_EQUAL(db.ReadRequestCount(), 1U);
}

BOOST_AUTO_TEST_CASE(first_writer_wins)
{
    CLedgerDB& db = *GetLedgerDB();
    const uint256 addr = TestAddress(5);
    const uint256 other = TestAddress(6);

    CLedgerViewDB viewDB(db);
    CLedgerViewCache viewA(&viewDB);
    CLedgerViewCache viewB(&viewDB);

    BOOST_CHECK(!viewA.HaveAccount(addr));
    BOOST_CHECK(!viewB.HaveAccount(addr));

    viewA.SetAccount(addr, PlainAccount(100));
    viewB.SetAccount(addr, PlainAccount(200));
    viewB.SetAccount(other, PlainAccount(300));

    CValidationState stateA;
    BOOST_REQUIRE(viewA.Flush(stateA));

    CValidationState stateB;
    BOOST_CHECK(!viewB.Flush(stateB));
    BOOST_CHECK_EQUAL(stateB.GetRejectCode(), REJECT_PROVISIONING_CONFLICT);
    BOOST_CHECK_EQUAL(stateB.GetRejectReason(), "ledger-address-in-use");

    CAccount stored;
    BOOST_REQUIRE(db.ReadAccount(addr, stored));
    BOOST_CHECK_EQUAL(stored.nLamports, 100U);
    BOOST_CHECK(!db.ExistsAccount(other));
}

BOOST_AUTO_TEST_CASE(absent_accounts_not_cached)
{
    CLedgerDB& db = *GetLedgerDB();
    const uint256 addr = TestAddress(7);

    CLedgerViewDB viewDB(db);
    CLedgerViewCache viewB(&viewDB);
    BOOST_CHECK(!viewB.HaveAccount(addr));

    {
        CLedgerViewCache viewA(&viewDB);
        viewA.SetAccount(addr, PlainAccount(42));
        CValidationState state;
        BOOST_REQUIRE(viewA.Flush(state));
    }

    // A creation committed by another unit of work is visible afterwards
    CAccount account;
    BOOST_CHECK(viewB.GetAccount(addr, account));
    BOOST_CHECK_EQUAL(account.nLamports, 42U);
}

BOOST_AUTO_TEST_CASE(concurrent_credits_do_not_lose_writes)
{
    CLedgerDB& db = *GetLedgerDB();
    const uint256 vault = TestAddress(8);

    CLedgerViewDB viewDB(db);
    {
        CLedgerViewCache view(&viewDB);
        view.SetAccount(vault, PlainAccount(100));
        CValidationState state;
        BOOST_REQUIRE(view.Flush(state));
    }

    // Two units of work credit the same committed account
    CLedgerViewCache viewA(&viewDB);
    CLedgerViewCache viewB(&viewDB);
    CAccount account;
    BOOST_REQUIRE(viewA.GetAccount(vault, account));
    account.nLamports += 10;
    viewA.SetAccount(vault, account);
    BOOST_REQUIRE(viewB.GetAccount(vault, account));
    account.nLamports += 20;
    viewB.SetAccount(vault, account);
    viewB.SetAccount(TestAddress(12), PlainAccount(1));

    CValidationState stateA, stateB;
    BOOST_REQUIRE(viewA.Flush(stateA));
    BOOST_CHECK(!viewB.Flush(stateB));
    BOOST_CHECK_EQUAL(stateB.GetRejectCode(), REJECT_LEDGER_FAILURE);
    BOOST_CHECK_EQUAL(stateB.GetRejectReason(), "ledger-account-modified");

    // Nothing of the stale batch was written
    CAccount stored;
    BOOST_REQUIRE(db.ReadAccount(vault, stored));
    BOOST_CHECK_EQUAL(stored.nLamports, 110U);
    BOOST_CHECK(!db.ExistsAccount(TestAddress(12)));

    // Redone over the committed state, both credits stand
    CLedgerViewCache viewRetry(&viewDB);
    BOOST_REQUIRE(viewRetry.GetAccount(vault, account));
    account.nLamports += 20;
    viewRetry.SetAccount(vault, account);
    CValidationState stateRetry;
    BOOST_REQUIRE(viewRetry.Flush(stateRetry));
    BOOST_REQUIRE(db.ReadAccount(vault, stored));
    BOOST_CHECK_EQUAL(stored.nLamports, 130U);
}

BOOST_AUTO_TEST_CASE(nested_view_rejects_stale_child)
{
    const uint256 addr = TestAddress(13);

    CLedgerViewDB viewDB(*GetLedgerDB());
    CLedgerViewCache parent(&viewDB);
    parent.SetAccount(addr, PlainAccount(50));

    CLedgerViewCache childA(&parent);
    CLedgerViewCache childB(&parent);
    CAccount account;
    BOOST_REQUIRE(childA.GetAccount(addr, account));
    account.nLamports = 60;
    childA.SetAccount(addr, account);
    BOOST_REQUIRE(childB.GetAccount(addr, account));
    account.nLamports = 70;
    childB.SetAccount(addr, account);

    CValidationState stateA, stateB;
    BOOST_REQUIRE(childA.Flush(stateA));
    BOOST_CHECK(!childB.Flush(stateB));
    BOOST_CHECK_EQUAL(stateB.GetRejectReason(), "ledger-account-modified");
    BOOST_REQUIRE(parent.GetAccount(addr, account));
    BOOST_CHECK_EQUAL(account.nLamports, 60U);
}

BOOST_AUTO_TEST_CASE(nested_views)
{
    CLedgerDB& db = *GetLedgerDB();
    const uint256 addr = TestAddress(9);

    CLedgerViewDB viewDB(db);
    CLedgerViewCache parent(&viewDB);
    {
        CLedgerViewCache child(&parent);
        child.SetAccount(addr, PlainAccount(77));
        child.AddRequest(TestAddress(0xd0));
        CValidationState state;
        BOOST_REQUIRE(child.Flush(state));
    }
    BOOST_CHECK(parent.HaveAccount(addr));
    BOOST_CHECK(parent.HaveRequest(TestAddress(0xd0)));
    BOOST_CHECK(!db.ExistsAccount(addr));

    // Pending writes of the parent are invisible to views over the database
    {
        CLedgerViewCache child(&parent);
        CLedgerViewCache sibling(&viewDB);
        BOOST_CHECK(child.HaveAccount(addr));
        BOOST_CHECK(!sibling.HaveAccount(addr));
        child.SetAccount(TestAddress(10), PlainAccount(1));
        CValidationState state;
        BOOST_CHECK(child.Flush(state));
    }

    CValidationState state;
    BOOST_REQUIRE(parent.Flush(state));
    BOOST_CHECK(db.ExistsAccount(addr));
    BOOST_CHECK(db.ExistsAccount(TestAddress(10)));
    BOOST_CHECK(db.ExistsRequest(TestAddress(0xd0)));
}

BOOST_AUTO_TEST_CASE(read_only_base_rejects_commit)
{
    CLedgerView empty;
    CLedgerViewCache view(&empty);
    view.SetAccount(TestAddress(11), PlainAccount(1));
    CValidationState state;
    BOOST_CHECK(!view.Flush(state));
    BOOST_CHECK(state.IsError());
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_LEDGER_FAILURE);
}

BOOST_AUTO_TEST_CASE(load_all_accounts)
{
    CLedgerDB& db = *GetLedgerDB();
    CLedgerViewDB viewDB(db);
    CLedgerViewCache view(&viewDB);
    for (unsigned char n = 20; n < 25; n++)
        view.SetAccount(TestAddress(n), PlainAccount(n));
    CValidationState state;
    BOOST_REQUIRE(view.Flush(state));

    std::vector<std::pair<uint256, CAccount>> accounts;
    BOOST_REQUIRE(db.LoadAllAccounts(accounts));
    BOOST_CHECK_EQUAL(accounts.size(), 5U);
    for (const auto& entry : accounts) {
        BOOST_CHECK_EQUAL(entry.second.nLamports, (CAmount)*entry.first.begin());
    }
}

BOOST_AUTO_TEST_SUITE_END()
