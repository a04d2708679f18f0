// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledgerview.h"

#include "base58.h"
#include "consensus/validation.h"
#include "logging.h"

bool CLedgerView::GetAccount(const uint256& address, CAccount& account) const { return false; }
bool CLedgerView::HaveAccount(const uint256& address) const
{
    CAccount account;
    return GetAccount(address, account);
}
bool CLedgerView::HaveRequest(const uint256& hashRequest) const { return false; }
uint64_t CLedgerView::GetRequestCount() const { return 0; }
bool CLedgerView::BatchWrite(CLedgerMap& mapAccounts, const std::set<uint256>& setRequests, CValidationState& state)
{
    return state.Error("ledger-view-read-only");
}


CLedgerViewBacked::CLedgerViewBacked(CLedgerView* viewIn) : base(viewIn) {}
bool CLedgerViewBacked::GetAccount(const uint256& address, CAccount& account) const { return base->GetAccount(address, account); }
bool CLedgerViewBacked::HaveAccount(const uint256& address) const { return base->HaveAccount(address); }
bool CLedgerViewBacked::HaveRequest(const uint256& hashRequest) const { return base->HaveRequest(hashRequest); }
uint64_t CLedgerViewBacked::GetRequestCount() const { return base->GetRequestCount(); }
bool CLedgerViewBacked::BatchWrite(CLedgerMap& mapAccounts, const std::set<uint256>& setRequests, CValidationState& state)
{
    return base->BatchWrite(mapAccounts, setRequests, state);
}

CLedgerViewCache::CLedgerViewCache(CLedgerView* baseIn) : CLedgerViewBacked(baseIn) {}

CLedgerMap::iterator CLedgerViewCache::FetchAccount(const uint256& address) const
{
    CLedgerMap::iterator it = cacheAccounts.find(address);
    if (it != cacheAccounts.end())
        return it;
    CAccount tmp;
    if (!base->GetAccount(address, tmp))
        return cacheAccounts.end();
    // Absent accounts are not cached, so a later creation by another view stays visible.
    return cacheAccounts.emplace(address, CLedgerCacheEntry(tmp)).first;
}

bool CLedgerViewCache::GetAccount(const uint256& address, CAccount& account) const
{
    CLedgerMap::const_iterator it = FetchAccount(address);
    if (it == cacheAccounts.end())
        return false;
    account = it->second.account;
    return true;
}

bool CLedgerViewCache::HaveAccount(const uint256& address) const
{
    CLedgerMap::const_iterator it = FetchAccount(address);
    return it != cacheAccounts.end();
}

bool CLedgerViewCache::HaveRequest(const uint256& hashRequest) const
{
    if (setRequests.count(hashRequest))
        return true;
    return base->HaveRequest(hashRequest);
}

uint64_t CLedgerViewCache::GetRequestCount() const
{
    return base->GetRequestCount() + setRequests.size();
}

void CLedgerViewCache::SetAccount(const uint256& address, const CAccount& account)
{
    CLedgerMap::iterator it = FetchAccount(address);
    if (it == cacheAccounts.end()) {
        it = cacheAccounts.emplace(address, CLedgerCacheEntry()).first;
        it->second.flags = CLedgerCacheEntry::FRESH;
    }
    it->second.account = account;
    it->second.flags |= CLedgerCacheEntry::DIRTY;
}

void CLedgerViewCache::AddRequest(const uint256& hashRequest)
{
    setRequests.insert(hashRequest);
}

bool CLedgerViewCache::BatchWrite(CLedgerMap& mapAccounts, const std::set<uint256>& setRequestsIn, CValidationState& state)
{
    // Validate everything first so that a rejected batch leaves this cache untouched
    for (const auto& entry : mapAccounts) {
        if (!(entry.second.flags & CLedgerCacheEntry::DIRTY))
            continue;
        CAccount current;
        const bool fExists = GetAccount(entry.first, current);
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
    for (const uint256& hash : setRequestsIn) {
        if (HaveRequest(hash)) {
            return state.Invalid(false, REJECT_DUPLICATE, "ledger-duplicate-request", hash.ToString());
        }
    }

    for (auto& entry : mapAccounts) {
        if (!(entry.second.flags & CLedgerCacheEntry::DIRTY))
            continue;
        CLedgerMap::iterator itUs = cacheAccounts.find(entry.first);
        if (itUs == cacheAccounts.end()) {
            CLedgerCacheEntry& ours = cacheAccounts[entry.first];
            ours.account = entry.second.account;
            ours.original = entry.second.original;
            // The parent of this cache may still lack the account, so keep it FRESH.
            ours.flags = entry.second.flags;
        } else {
            itUs->second.account = entry.second.account;
            itUs->second.flags |= CLedgerCacheEntry::DIRTY;
        }
    }
    setRequests.insert(setRequestsIn.begin(), setRequestsIn.end());
    mapAccounts.clear();
    return true;
}

bool CLedgerViewCache::Flush(CValidationState& state)
{
    bool fOk = base->BatchWrite(cacheAccounts, setRequests, state);
    cacheAccounts.clear();
    setRequests.clear();
    return fOk;
}

void CLedgerViewCache::Reset()
{
    cacheAccounts.clear();
    setRequests.clear();
}

bool CLedgerViewCache::HasPendingChanges() const
{
    for (const auto& entry : cacheAccounts) {
        if (entry.second.flags & CLedgerCacheEntry::DIRTY)
            return true;
    }
    return !setRequests.empty();
}

unsigned int CLedgerViewCache::GetCacheSize() const
{
    return cacheAccounts.size();
}
