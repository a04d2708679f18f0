// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_LEDGER_ACCOUNT_H
#define DONATION_LEDGER_ACCOUNT_H

#include "amount.h"
#include "serialize.h"
#include "uint256.h"

#include <string>
#include <vector>

/**
 * CAccount - one keyed record of the ledger
 *
 * An account exists iff it is present in the store. The owner is the id of
 * the program allowed to mutate its data and debit its balance. Plain native
 * currency holders are owned by the system program and carry no data.
 */
class CAccount
{
public:
    uint256 owner;
    CAmount nLamports;
    std::vector<unsigned char> vchData;

    CAccount()
    {
        SetNull();
    }

    CAccount(const uint256& ownerIn, CAmount nLamportsIn) : owner(ownerIn), nLamports(nLamportsIn) {}

    void SetNull()
    {
        owner.SetNull();
        nLamports = 0;
        vchData.clear();
    }

    bool IsOwnedBy(const uint256& programId) const { return owner == programId; }

    /** System-owned and data-less: a plain balance holder */
    bool IsPlainBalance(const uint256& systemProgramId) const
    {
        return owner == systemProgramId && vchData.empty();
    }

    friend bool operator==(const CAccount& a, const CAccount& b)
    {
        return a.owner == b.owner &&
               a.nLamports == b.nLamports &&
               a.vchData == b.vchData;
    }

    friend bool operator!=(const CAccount& a, const CAccount& b)
    {
        return !(a == b);
    }

    SERIALIZE_METHODS(CAccount, obj)
    {
        READWRITE(obj.owner, obj.nLamports, obj.vchData);
    }

    std::string ToString() const;
};

#endif // DONATION_LEDGER_ACCOUNT_H
