// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/account.h"

#include "base58.h"
#include "logging.h"
#include "utilmoneystr.h"

std::string CAccount::ToString() const
{
    return strprintf("CAccount(owner=%s, lamports=%s, data=%u bytes)",
                     EncodeAddress(owner),
                     FormatMoney(nLamports),
                     vchData.size());
}
