// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_DONATION_VALIDATION_H
#define DONATION_DONATION_VALIDATION_H

#include "amount.h"
#include "sync.h"
#include "uint256.h"

#include <stddef.h>

class CAccount;
class CDonationIndexDB;
class CDonationRecord;
class CDonationRequest;
class CLedgerDB;
class CLedgerView;
class CLedgerViewCache;
class CValidationState;
struct CDonationAccounts;

/** Serializes request execution against the ledger database */
extern RecursiveMutex cs_donation;

/**
 * InitLedgerDB - Initialize the ledger account database
 *
 * @param nCacheSize DB cache size
 * @param fMemory Keep the database in memory (tests)
 * @param fWipe If true, wipe and recreate DB
 * @return true on success
 */
bool InitLedgerDB(size_t nCacheSize, bool fMemory, bool fWipe);

/**
 * GetLedgerDB - Get global ledger database instance
 *
 * @return Pointer to the ledger DB (may be nullptr if not initialized)
 */
CLedgerDB* GetLedgerDB();

/**
 * InitDonationIndexDB - Initialize the donation index and subscribe it to
 * donation events
 */
bool InitDonationIndexDB(size_t nCacheSize, bool fMemory, bool fWipe);

CDonationIndexDB* GetDonationIndexDB();

/** Unsubscribe the indexer and close both databases */
void ShutdownDonationDBs();

/**
 * ConnectDonation - Apply one donation to a unit of work
 *
 * Order: replay check, donor signature, ValueTransfer (donor -> vault),
 * MintProvisioner, RewardMinter, request marker. Any failure leaves view
 * partially modified; the caller must discard it.
 *
 * @param request Donation request (CheckDonationRequest already passed)
 * @param accounts Derived accounts the program acts on
 * @param view Unit of work
 * @param record Output: the record to emit once view is committed
 * @param state Validation state (for errors)
 * @return true if every step succeeded
 */
bool ConnectDonation(const CDonationRequest& request,
                     const CDonationAccounts& accounts,
                     CLedgerViewCache& view,
                     CDonationRecord& record,
                     CValidationState& state);

/**
 * CommitDonation - Run ConnectDonation on a unit of work over base and commit it
 *
 * When the commit loses to a unit of work committed since this one read the
 * ledger ("ledger-address-in-use" or "ledger-account-modified"), the request
 * is executed once more over the committed state, so a mint created by the
 * winner is adopted as already provisioned.
 */
bool CommitDonation(const CDonationRequest& request,
                    const CDonationAccounts& accounts,
                    CLedgerView& base,
                    CDonationRecord& record,
                    CValidationState& state);

/**
 * ProcessDonationRequest - record_donation(amount) end to end
 *
 * Checks the request, runs CommitDonation over the ledger DB and only then
 * emits the event. On
 * failure nothing is written.
 */
bool ProcessDonationRequest(const CDonationRequest& request, CValidationState& state, CDonationRecord* pRecordRet = nullptr);

/** Credit test funds and commit (regtest/testnet) */
bool ProcessAirdrop(const uint256& to, CAmount amount, CValidationState& state);

/** Read one committed account */
bool ReadLedgerAccount(const uint256& address, CAccount& account);

#endif // DONATION_DONATION_VALIDATION_H
