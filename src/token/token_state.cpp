// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token_state.h"

#include "base58.h"
#include "logging.h"

std::string CMint::ToString() const
{
    return strprintf("CMint(initialized=%d, decimals=%d, supply=%u, mintAuthority=%s, freezeAuthority=%s)",
                     fInitialized, nDecimals, nSupply,
                     mintAuthority ? EncodeAddress(*mintAuthority) : "none",
                     freezeAuthority ? EncodeAddress(*freezeAuthority) : "none");
}

std::string CTokenAccount::ToString() const
{
    return strprintf("CTokenAccount(initialized=%d, mint=%s, owner=%s, amount=%u)",
                     fInitialized, EncodeAddress(mint), EncodeAddress(owner), nAmount);
}
