// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "donation/donation_reward.h"

#include "base58.h"
#include "chainparams.h"
#include "consensus/validation.h"
#include "donation/donation_address.h"
#include "ledger/signers.h"
#include "logging.h"
#include "token/token_ledger.h"
#include "utilmoneystr.h"

bool CalculateReward(CAmount amount, CAmount nConversionRate, CAmount& nRewardRet, CValidationState& state)
{
    if (nConversionRate == 0) {
        return state.Invalid(false, REJECT_OVERFLOW, "donation-reward-zero-rate");
    }
    nRewardRet = amount / nConversionRate;
    return true;
}

bool MintDonationReward(CLedgerViewCache& view, const CInvocationSigners& signers,
                        const CDonationAccounts& accounts, CAmount amount,
                        CAmount& nMintedRet, CValidationState& state)
{
    const Consensus::DonationParams& params = Params().GetDonation();

    CAmount nReward = 0;
    if (!CalculateReward(amount, params.nConversionRate, nReward, state))
        return false;

    CInvocationSigners signersMint(signers);
    uint256 authority;
    if (!signersMint.AddDerivedSigner(accounts.mintAuthority.vSeeds, accounts.mintAuthority.nBump,
                                      params.programId, &authority)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "donation-mint-authority-signer-failed",
                             strprintf("bump %d", accounts.mintAuthority.nBump));
    }

    // Present the proven address; TokenMintTo matches it against the mint
    if (!TokenMintTo(view, signersMint, accounts.mint.address, accounts.donorTokenAccount,
                     authority, nReward, state)) {
        return false;
    }

    LogPrint(BCLog::DONATION, "%s: %s -> %s reward tokens to %s\n", __func__,
             FormatMoney(amount), FormatTokenAmount(nReward, params.nRewardDecimals),
             EncodeAddress(accounts.donorTokenAccount));
    nMintedRet = nReward;
    return true;
}
