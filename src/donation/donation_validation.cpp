// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "donation/donation_validation.h"

#include "base58.h"
#include "consensus/validation.h"
#include "donation/donation_address.h"
#include "donation/donation_events.h"
#include "donation/donation_indexdb.h"
#include "donation/donation_provision.h"
#include "donation/donation_reward.h"
#include "donation/donation_tx.h"
#include "ledger/ledgerdb.h"
#include "ledger/ledgerview.h"
#include "ledger/signers.h"
#include "ledger/system_ledger.h"
#include "logging.h"
#include "utilmoneystr.h"
#include "utiltime.h"

#include <memory>

// Global ledger database
static std::unique_ptr<CLedgerDB> pledgerdb;

// Global donation index (observational)
static std::unique_ptr<CDonationIndexDB> pdonationindexdb;
static std::unique_ptr<CDonationIndexer> pdonationindexer;

RecursiveMutex cs_donation;

bool InitLedgerDB(size_t nCacheSize, bool fMemory, bool fWipe)
{
    LOCK(cs_donation);

    try {
        pledgerdb.reset();
        pledgerdb = std::make_unique<CLedgerDB>(nCacheSize, fMemory, fWipe);
        LogPrint(BCLog::LEDGER, "Ledger: initialized account database (memory=%d)\n", fMemory);
        return true;
    } catch (const std::exception& e) {
        LogPrintf("ERROR: Failed to initialize ledger database: %s\n", e.what());
        return false;
    }
}

CLedgerDB* GetLedgerDB()
{
    return pledgerdb.get();
}

bool InitDonationIndexDB(size_t nCacheSize, bool fMemory, bool fWipe)
{
    LOCK(cs_donation);

    try {
        if (pdonationindexer) {
            UnregisterDonationInterface(pdonationindexer.get());
            pdonationindexer.reset();
        }
        pdonationindexdb.reset();
        pdonationindexdb = std::make_unique<CDonationIndexDB>(nCacheSize, fMemory, fWipe);
        pdonationindexer = std::make_unique<CDonationIndexer>(*pdonationindexdb);
        RegisterDonationInterface(pdonationindexer.get());
        LogPrint(BCLog::DONATION, "Donation: initialized donation index\n");
        return true;
    } catch (const std::exception& e) {
        LogPrintf("ERROR: Failed to initialize donation index: %s\n", e.what());
        return false;
    }
}

CDonationIndexDB* GetDonationIndexDB()
{
    return pdonationindexdb.get();
}

void ShutdownDonationDBs()
{
    LOCK(cs_donation);

    if (pdonationindexer) {
        UnregisterDonationInterface(pdonationindexer.get());
        pdonationindexer.reset();
    }
    pdonationindexdb.reset();
    pledgerdb.reset();
}

bool ConnectDonation(const CDonationRequest& request,
                     const CDonationAccounts& accounts,
                     CLedgerViewCache& view,
                     CDonationRecord& record,
                     CValidationState& state)
{
    AssertLockHeld(cs_donation);

    const uint256 donor = request.donor.GetAddress();
    const uint256 hashRequest = request.GetHash();

    // 1. Replay
    if (view.HaveRequest(hashRequest)) {
        return state.Invalid(false, REJECT_DUPLICATE, "donation-duplicate-request", hashRequest.ToString());
    }

    // 2. Donor authorizes this exact request
    CInvocationSigners signers;
    if (!signers.AddKeySigner(request.donor, hashRequest, request.vchSig)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "donation-bad-signature",
                             strprintf("donor %s", EncodeAddress(donor)));
    }

    // 3. ValueTransfer
    if (!SystemTransfer(view, signers, donor, accounts.vault.address, request.nAmount, state)) {
        return false;
    }

    // 4. MintProvisioner
    if (!ProvisionDonationAccounts(view, signers, donor, accounts, state)) {
        return false;
    }

    // 5. RewardMinter
    CAmount nMinted = 0;
    if (!MintDonationReward(view, signers, accounts, request.nAmount, nMinted, state)) {
        return false;
    }

    // 6. Commit marker
    view.AddRequest(hashRequest);

    record.donor = donor;
    record.nAmount = request.nAmount;
    record.nTime = GetTime();
    record.nTokens = nMinted;
    record.hashRequest = hashRequest;
    record.nSequence = view.GetRequestCount() - 1;
    return true;
}

static bool IsCommitConflict(const CValidationState& state)
{
    return state.GetRejectReason() == "ledger-address-in-use" ||
           state.GetRejectReason() == "ledger-account-modified";
}

bool CommitDonation(const CDonationRequest& request,
                    const CDonationAccounts& accounts,
                    CLedgerView& base,
                    CDonationRecord& record,
                    CValidationState& state)
{
    AssertLockHeld(cs_donation);

    for (int nAttempt = 0; nAttempt < 2; nAttempt++) {
        CValidationState stateAttempt;
        CLedgerViewCache view(&base);
        if (!ConnectDonation(request, accounts, view, record, stateAttempt)) {
            // view goes out of scope unflushed: every step is discarded
            state = stateAttempt;
            return false;
        }
        if (view.Flush(stateAttempt))
            return true;
        state = stateAttempt;
        if (!IsCommitConflict(stateAttempt))
            break;
        LogPrint(BCLog::DONATION, "CommitDonation: %s, executing %s over the committed ledger\n",
                 stateAttempt.GetRejectReason(), request.GetHash().ToString());
    }
    LogPrintf("CommitDonation: commit failed: %s\n", FormatStateMessage(state));
    return false;
}

bool ProcessDonationRequest(const CDonationRequest& request, CValidationState& state, CDonationRecord* pRecordRet)
{
    LOCK(cs_donation);

    LogPrint(BCLog::DONATION, "ProcessDonationRequest: %s\n", request.ToString());

    CDonationAccounts accounts;
    if (!CheckDonationRequest(request, accounts, state)) {
        LogPrint(BCLog::DONATION, "ProcessDonationRequest: rejected: %s\n", FormatStateMessage(state));
        return false;
    }

    CLedgerDB* db = GetLedgerDB();
    if (!db) {
        return state.Error("donation-db-not-initialized");
    }

    CDonationRecord record;
    try {
        CLedgerViewDB viewDB(*db);
        if (!CommitDonation(request, accounts, viewDB, record, state)) {
            LogPrint(BCLog::DONATION, "ProcessDonationRequest: rejected: %s\n", FormatStateMessage(state));
            return false;
        }
    } catch (const dbwrapper_error& e) {
        return state.Error(strprintf("donation-ledger-db-error: %s", e.what()));
    }

    EmitDonationEvent(record);

    if (pRecordRet)
        *pRecordRet = record;
    return true;
}

bool ProcessAirdrop(const uint256& to, CAmount amount, CValidationState& state)
{
    LOCK(cs_donation);

    CLedgerDB* db = GetLedgerDB();
    if (!db) {
        return state.Error("donation-db-not-initialized");
    }

    try {
        CLedgerViewDB viewDB(*db);
        CLedgerViewCache view(&viewDB);
        if (!SystemAirdrop(view, to, amount, state)) {
            return false;
        }
        if (!view.Flush(state)) {
            return false;
        }
    } catch (const dbwrapper_error& e) {
        return state.Error(strprintf("donation-ledger-db-error: %s", e.what()));
    }

    LogPrint(BCLog::LEDGER, "Airdrop: %s to %s\n", FormatMoney(amount), EncodeAddress(to));
    return true;
}

bool ReadLedgerAccount(const uint256& address, CAccount& account)
{
    LOCK(cs_donation);

    CLedgerDB* db = GetLedgerDB();
    if (!db)
        return false;
    return db->ReadAccount(address, account);
}
