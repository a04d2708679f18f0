// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_LEDGER_LEDGERDB_H
#define DONATION_LEDGER_LEDGERDB_H

#include "dbwrapper.h"
#include "ledger/account.h"
#include "ledger/ledgerview.h"
#include "sync.h"

#include <stdint.h>

#include <utility>
#include <vector>

/**
 * CLedgerDB - LevelDB persistence layer for ledger accounts
 *
 * Database keys:
 * - 'A' + address      -> CAccount
 * - 'R' + request hash -> commit sequence number (replay protection)
 * - 'S'                -> number of committed requests
 */
class CLedgerDB : public CDBWrapper
{
public:
    explicit CLedgerDB(size_t nCacheSize, bool fMemory = false, bool fWipe = false);

private:
    CLedgerDB(const CLedgerDB&);
    void operator=(const CLedgerDB&);

public:
    bool ReadAccount(const uint256& address, CAccount& account) const;
    bool ExistsAccount(const uint256& address) const;

    bool ExistsRequest(const uint256& hashRequest) const;
    uint64_t ReadRequestCount() const;

    /**
     * Write a batch of accounts plus committed request hashes atomically.
     *
     * @param mapAccounts Cache entries; only DIRTY ones are written
     * @param setRequests Request hashes committed by this batch
     * @param state Reason on failure
     * @return false if a FRESH account already exists, a request was already committed,
     *         or LevelDB failed; nothing is written in that case
     */
    bool BatchWriteLedger(const CLedgerMap& mapAccounts, const std::set<uint256>& setRequests, CValidationState& state);

    /** Load every account (diagnostics and tests) */
    bool LoadAllAccounts(std::vector<std::pair<uint256, CAccount>>& accounts);

private:
    //! Serializes check-then-write of concurrent batches
    mutable RecursiveMutex cs_ledgerdb;
};

/** CLedgerView backed by the ledger database */
class CLedgerViewDB : public CLedgerView
{
protected:
    CLedgerDB& db;

public:
    explicit CLedgerViewDB(CLedgerDB& dbIn) : db(dbIn) {}

    bool GetAccount(const uint256& address, CAccount& account) const override;
    bool HaveAccount(const uint256& address) const override;
    bool HaveRequest(const uint256& hashRequest) const override;
    uint64_t GetRequestCount() const override;
    bool BatchWrite(CLedgerMap& mapAccounts, const std::set<uint256>& setRequests, CValidationState& state) override;
};

#endif // DONATION_LEDGER_LEDGERDB_H
