// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledgerdb.h"

#include "base58.h"
#include "consensus/validation.h"
#include "logging.h"
#include "util/system.h"

static const char DB_ACCOUNT = 'A';
static const char DB_REQUEST = 'R';
static const char DB_SEQUENCE = 'S';

CLedgerDB::CLedgerDB(size_t nCacheSize, bool fMemory, bool fWipe) :
    CDBWrapper(GetDataDir() / "ledger", nCacheSize, fMemory, fWipe)
{
}

bool CLedgerDB::ReadAccount(const uint256& address, CAccount& account) const
{
    return Read(std::make_pair(DB_ACCOUNT, address), account);
}

bool CLedgerDB::ExistsAccount(const uint256& address) const
{
    return Exists(std::make_pair(DB_ACCOUNT, address));
}

bool CLedgerDB::ExistsRequest(const uint256& hashRequest) const
{
    return Exists(std::make_pair(DB_REQUEST, hashRequest));
}

uint64_t CLedgerDB::ReadRequestCount() const
{
    uint64_t nCount = 0;
    if (!Read(DB_SEQUENCE, nCount))
        return 0;
    return nCount;
}

bool CLedgerDB::BatchWriteLedger(const CLedgerMap& mapAccounts, const std::set<uint256>& setRequests, CValidationState& state)
{
    LOCK(cs_ledgerdb);

    // First writer wins: a FRESH account must still be absent at commit time,
    // any other written account must still hold the version that was read
    for (const auto& entry : mapAccounts) {
        if (!(entry.second.flags & CLedgerCacheEntry::DIRTY))
            continue;
        CAccount current;
        const bool fExists = ReadAccount(entry.first, current);
        if (entry.second.flags & CLedgerCacheEntry::FRESH) {
            if (fExists) {
                return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "ledger-address-in-use",
                                     strprintf("account %s already exists", EncodeAddress(entry.first)));
            }
        } else if (!fExists || current != entry.second.original) {
            return state.Invalid(false, REJECT_LEDGER_FAILURE, "ledger-account-modified",
                                 strprintf("account %s changed since it was read", EncodeAddress(entry.first)));
        }
    }
    for (const uint256& hash : setRequests) {
        if (ExistsRequest(hash)) {
            return state.Invalid(false, REJECT_DUPLICATE, "ledger-duplicate-request", hash.ToString());
        }
    }

    CDBBatch batch;
    size_t nWritten = 0;
    for (const auto& entry : mapAccounts) {
        if (entry.second.flags & CLedgerCacheEntry::DIRTY) {
            batch.Write(std::make_pair(DB_ACCOUNT, entry.first), entry.second.account);
            nWritten++;
        }
    }
    uint64_t nCount = ReadRequestCount();
    for (const uint256& hash : setRequests) {
        batch.Write(std::make_pair(DB_REQUEST, hash), nCount);
        nCount++;
    }
    batch.Write(DB_SEQUENCE, nCount);

    try {
        if (!WriteBatch(batch, true))
            return state.Error("ledger-db-write-failed");
    } catch (const dbwrapper_error& e) {
        return state.Error(strprintf("ledger-db-write-failed: %s", e.what()));
    }

    LogPrint(BCLog::LEDGER, "CLedgerDB: committed %u accounts, %u requests (sequence=%u)\n",
             nWritten, setRequests.size(), nCount);
    return true;
}

bool CLedgerDB::LoadAllAccounts(std::vector<std::pair<uint256, CAccount>>& accounts)
{
    std::unique_ptr<CDBIterator> pcursor(NewIterator());

    pcursor->Seek(std::make_pair(DB_ACCOUNT, uint256()));

    while (pcursor->Valid()) {
        std::pair<char, uint256> key;
        if (pcursor->GetKey(key) && key.first == DB_ACCOUNT) {
            CAccount account;
            if (!pcursor->GetValue(account)) {
                return error("%s: unable to read account %s", __func__, EncodeAddress(key.second));
            }
            accounts.emplace_back(key.second, account);
            pcursor->Next();
        } else {
            break;
        }
    }

    return true;
}

bool CLedgerViewDB::GetAccount(const uint256& address, CAccount& account) const
{
    return db.ReadAccount(address, account);
}

bool CLedgerViewDB::HaveAccount(const uint256& address) const
{
    return db.ExistsAccount(address);
}

bool CLedgerViewDB::HaveRequest(const uint256& hashRequest) const
{
    return db.ExistsRequest(hashRequest);
}

uint64_t CLedgerViewDB::GetRequestCount() const
{
    return db.ReadRequestCount();
}

bool CLedgerViewDB::BatchWrite(CLedgerMap& mapAccounts, const std::set<uint256>& setRequests, CValidationState& state)
{
    bool fOk = db.BatchWriteLedger(mapAccounts, setRequests, state);
    if (fOk)
        mapAccounts.clear();
    return fOk;
}
