// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_LEDGER_LEDGERVIEW_H
#define DONATION_LEDGER_LEDGERVIEW_H

#include "ledger/account.h"
#include "uint256.h"

#include <map>
#include <set>

class CValidationState;

struct CLedgerCacheEntry {
    CAccount account;
    CAccount original; //!< Version read from the parent view; unused for FRESH entries
    unsigned char flags;

    enum Flags {
        DIRTY = (1 << 0), // This cache entry is potentially different from the version in the parent view.
        FRESH = (1 << 1), // The parent view does not have this entry.
        /* Note that FRESH is a performance optimization with which we can
         * skip writing an unchanged entry, but here it also carries meaning:
         * a FRESH account must not exist in the parent when it is written,
         * otherwise the commit fails with "address already in use".
         * A DIRTY entry that is not FRESH must still match `original` in the
         * parent, otherwise the commit fails with "account modified". */
    };

    CLedgerCacheEntry() : flags(0) {}
    explicit CLedgerCacheEntry(const CAccount& accountIn) : account(accountIn), original(accountIn), flags(0) {}
};

typedef std::map<uint256, CLedgerCacheEntry> CLedgerMap;

/** Abstract view on the ledger account set. */
class CLedgerView
{
public:
    //! Retrieve the account at a given address. Returns false if it does not exist.
    virtual bool GetAccount(const uint256& address, CAccount& account) const;

    //! Just check whether an account exists at a given address.
    virtual bool HaveAccount(const uint256& address) const;

    //! Whether a request with this hash has already been committed.
    virtual bool HaveRequest(const uint256& hashRequest) const;

    //! Number of committed requests.
    virtual uint64_t GetRequestCount() const;

    //! Do a bulk modification (multiple account changes + committed requests).
    //! Fails without modifying anything when a FRESH account already exists, another DIRTY account
    //! changed since it was read, or a request is already known.
    virtual bool BatchWrite(CLedgerMap& mapAccounts, const std::set<uint256>& setRequests, CValidationState& state);

    //! As we use CLedgerViews polymorphically, have a virtual destructor
    virtual ~CLedgerView() {}
};


/** CLedgerView backed by another CLedgerView */
class CLedgerViewBacked : public CLedgerView
{
protected:
    CLedgerView* base;

public:
    explicit CLedgerViewBacked(CLedgerView* viewIn);
    bool GetAccount(const uint256& address, CAccount& account) const override;
    bool HaveAccount(const uint256& address) const override;
    bool HaveRequest(const uint256& hashRequest) const override;
    uint64_t GetRequestCount() const override;
    bool BatchWrite(CLedgerMap& mapAccounts, const std::set<uint256>& setRequests, CValidationState& state) override;
};


/**
 * CLedgerViewCache - the unit of work of one request
 *
 * Every mutation of a request lands here. Flush() hands all of them to the
 * backing view in one BatchWrite; destroying the cache without flushing
 * discards them.
 */
class CLedgerViewCache : public CLedgerViewBacked
{
protected:
    /**
     * Make mutable so that we can "fill the cache" even from Get-methods
     * declared as "const".
     */
    mutable CLedgerMap cacheAccounts;
    std::set<uint256> setRequests;

    CLedgerMap::iterator FetchAccount(const uint256& address) const;

public:
    explicit CLedgerViewCache(CLedgerView* baseIn);

    CLedgerViewCache(const CLedgerViewCache&) = delete;
    CLedgerViewCache& operator=(const CLedgerViewCache&) = delete;

    // Standard CLedgerView methods
    bool GetAccount(const uint256& address, CAccount& account) const override;
    bool HaveAccount(const uint256& address) const override;
    bool HaveRequest(const uint256& hashRequest) const override;
    uint64_t GetRequestCount() const override;
    bool BatchWrite(CLedgerMap& mapAccounts, const std::set<uint256>& setRequests, CValidationState& state) override;

    /**
     * Store an account. Accounts not known to exist in the backing view are
     * marked FRESH.
     */
    void SetAccount(const uint256& address, const CAccount& account);

    /** Record a request hash to be committed with the account changes */
    void AddRequest(const uint256& hashRequest);

    /**
     * Push the modifications applied to this cache to its base.
     * Failure to call this method before destruction will cause the changes to be forgotten.
     * The cache is emptied in both cases.
     */
    bool Flush(CValidationState& state);

    //! Discard all pending modifications
    void Reset();

    //! Whether any account has been modified in this view
    bool HasPendingChanges() const;

    //! Calculate the size of the cache (in number of accounts)
    unsigned int GetCacheSize() const;
};

#endif // DONATION_LEDGER_LEDGERVIEW_H
