// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "donation/donation_provision.h"

#include "base58.h"
#include "chainparams.h"
#include "consensus/validation.h"
#include "donation/donation_address.h"
#include "ledger/ledgerview.h"
#include "ledger/signers.h"
#include "logging.h"
#include "token/token_ledger.h"

bool IsRewardMintProvisioned(const CLedgerView& view, const CDonationAccounts& accounts)
{
    CMint mint;
    if (!GetMint(view, accounts.mint.address, mint))
        return false;
    return mint.fInitialized && mint.mintAuthority;
}

bool IsContributorBalanceProvisioned(const CLedgerView& view, const CDonationAccounts& accounts, const uint256& donor)
{
    CTokenAccount tokenAccount;
    if (!GetTokenAccount(view, accounts.donorTokenAccount, tokenAccount))
        return false;
    return tokenAccount.fInitialized && tokenAccount.owner == donor;
}

/** Existing mint must carry the configured decimals and authority */
static bool CheckRewardMintMetadata(const CLedgerView& view, const CDonationAccounts& accounts, CValidationState& state)
{
    const Consensus::DonationParams& params = Params().GetDonation();

    CMint mint;
    if (!GetMint(view, accounts.mint.address, mint) || !mint.fInitialized) {
        return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "donation-mint-metadata-mismatch",
                             strprintf("%s is not an initialized mint", EncodeAddress(accounts.mint.address)));
    }
    if (mint.nDecimals != params.nRewardDecimals) {
        return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "donation-mint-metadata-mismatch",
                             strprintf("decimals %d, expected %d", mint.nDecimals, params.nRewardDecimals));
    }
    if (!mint.mintAuthority || *mint.mintAuthority != accounts.mintAuthority.address) {
        return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "donation-mint-metadata-mismatch",
                             strprintf("mint authority %s, expected %s",
                                       mint.mintAuthority ? EncodeAddress(*mint.mintAuthority) : "none",
                                       EncodeAddress(accounts.mintAuthority.address)));
    }
    if (!mint.freezeAuthority || *mint.freezeAuthority != accounts.mintAuthority.address) {
        return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "donation-mint-metadata-mismatch",
                             strprintf("freeze authority %s, expected %s",
                                       mint.freezeAuthority ? EncodeAddress(*mint.freezeAuthority) : "none",
                                       EncodeAddress(accounts.mintAuthority.address)));
    }
    return true;
}

/** Existing balance account must belong to donor and hold the reward mint */
static bool CheckContributorBalanceMetadata(const CLedgerView& view, const CDonationAccounts& accounts,
                                            const uint256& donor, CValidationState& state)
{
    CTokenAccount tokenAccount;
    if (!GetTokenAccount(view, accounts.donorTokenAccount, tokenAccount) || !tokenAccount.fInitialized) {
        return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "donation-token-account-metadata-mismatch",
                             strprintf("%s is not an initialized token account", EncodeAddress(accounts.donorTokenAccount)));
    }
    if (tokenAccount.owner != donor || tokenAccount.mint != accounts.mint.address) {
        return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "donation-token-account-metadata-mismatch",
                             strprintf("owner %s mint %s, expected owner %s mint %s",
                                       EncodeAddress(tokenAccount.owner), EncodeAddress(tokenAccount.mint),
                                       EncodeAddress(donor), EncodeAddress(accounts.mint.address)));
    }
    return true;
}

bool CreateRewardMintOrAdopt(CLedgerViewCache& view, const CInvocationSigners& signers,
                             const uint256& payer, const CDonationAccounts& accounts,
                             CValidationState& state)
{
    const Consensus::DonationParams& params = Params().GetDonation();

    // The donation program signs for the mint address it derives
    CInvocationSigners signersMint(signers);
    if (!signersMint.AddDerivedSigner(accounts.mint.vSeeds, accounts.mint.nBump, params.programId)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "donation-mint-signer-failed");
    }

    CValidationState stateCreate;
    if (TokenCreateMint(view, signersMint, payer, accounts.mint.address,
                        params.nRewardDecimals, accounts.mintAuthority.address,
                        accounts.mintAuthority.address, stateCreate)) {
        LogPrint(BCLog::DONATION, "%s: created reward mint %s\n", __func__, EncodeAddress(accounts.mint.address));
        return true;
    }

    if (stateCreate.GetRejectCode() != REJECT_PROVISIONING_CONFLICT) {
        state = stateCreate;
        return false;
    }

    // Another request created it first: adopt it when it is the mint we would have made
    LogPrint(BCLog::DONATION, "%s: mint %s already in use (%s), checking metadata\n",
             __func__, EncodeAddress(accounts.mint.address), stateCreate.GetRejectReason());
    return CheckRewardMintMetadata(view, accounts, state);
}

bool CreateContributorBalanceOrAdopt(CLedgerViewCache& view, const CInvocationSigners& signers,
                                     const uint256& donor, const CDonationAccounts& accounts,
                                     CValidationState& state)
{
    CValidationState stateCreate;
    if (CreateAssociatedTokenAccount(view, signers, donor, donor, accounts.mint.address, stateCreate)) {
        LogPrint(BCLog::DONATION, "%s: created reward balance %s for %s\n",
                 __func__, EncodeAddress(accounts.donorTokenAccount), EncodeAddress(donor));
        return true;
    }

    if (stateCreate.GetRejectCode() != REJECT_PROVISIONING_CONFLICT) {
        state = stateCreate;
        return false;
    }

    LogPrint(BCLog::DONATION, "%s: balance %s already in use (%s), checking metadata\n",
             __func__, EncodeAddress(accounts.donorTokenAccount), stateCreate.GetRejectReason());
    return CheckContributorBalanceMetadata(view, accounts, donor, state);
}

bool ProvisionDonationAccounts(CLedgerViewCache& view, const CInvocationSigners& signers,
                               const uint256& donor, const CDonationAccounts& accounts,
                               CValidationState& state)
{
    // 1. Reward mint (singleton)
    if (IsRewardMintProvisioned(view, accounts)) {
        if (!CheckRewardMintMetadata(view, accounts, state))
            return false;
    } else if (!CreateRewardMintOrAdopt(view, signers, donor, accounts, state)) {
        return false;
    }

    // 2. Donor's reward balance
    if (IsContributorBalanceProvisioned(view, accounts, donor)) {
        if (!CheckContributorBalanceMetadata(view, accounts, donor, state))
            return false;
    } else if (!CreateContributorBalanceOrAdopt(view, signers, donor, accounts, state)) {
        return false;
    }

    return true;
}
