// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "donation/donation_address.h"

#include "base58.h"
#include "chainparams.h"
#include "logging.h"
#include "token/token_ledger.h"

std::string CDerivedAddress::ToString() const
{
    return strprintf("CDerivedAddress(address=%s, bump=%d, seeds=%u)", EncodeAddress(address), nBump, vSeeds.size());
}

bool DeriveDonationAddress(const std::string& strTag, const std::vector<CSeed>& vContext, CDerivedAddress& derivedRet)
{
    if (strTag.empty())
        return error("%s: empty tag", __func__);
    for (const CSeed& seed : vContext) {
        if (seed.empty())
            return error("%s: empty context seed for tag %s", __func__, strTag);
    }

    std::vector<CSeed> vSeeds;
    vSeeds.push_back(SeedFromString(strTag));
    vSeeds.insert(vSeeds.end(), vContext.begin(), vContext.end());

    CDerivedAddress derived;
    if (!FindProgramAddress(vSeeds, Params().GetDonation().programId, derived.address, derived.nBump)) {
        return error("%s: no program address for tag %s", __func__, strTag);
    }
    derived.vSeeds = vSeeds;
    derivedRet = derived;
    return true;
}

bool GetVaultAddress(CDerivedAddress& derivedRet)
{
    return DeriveDonationAddress(Params().GetDonation().strVaultTag, {}, derivedRet);
}

bool GetRewardMintAddress(CDerivedAddress& derivedRet)
{
    return DeriveDonationAddress(Params().GetDonation().strMintTag, {}, derivedRet);
}

bool GetMintAuthorityAddress(CDerivedAddress& derivedRet)
{
    return DeriveDonationAddress(Params().GetDonation().strMintAuthorityTag, {}, derivedRet);
}

bool DeriveDonationAccounts(const uint256& donor, CDonationAccounts& accountsRet)
{
    CDonationAccounts accounts;
    if (!GetVaultAddress(accounts.vault) ||
        !GetRewardMintAddress(accounts.mint) ||
        !GetMintAuthorityAddress(accounts.mintAuthority)) {
        return false;
    }
    if (!GetAssociatedTokenAddress(donor, accounts.mint.address, accounts.donorTokenAccount, accounts.nDonorTokenBump)) {
        return error("%s: no associated token address for %s", __func__, EncodeAddress(donor));
    }
    accountsRet = accounts;
    return true;
}
