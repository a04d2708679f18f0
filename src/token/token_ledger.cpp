// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "token/token_ledger.h"

#include "base58.h"
#include "chainparams.h"
#include "consensus/validation.h"
#include "ledger/ledgerview.h"
#include "ledger/program_address.h"
#include "ledger/signers.h"
#include "ledger/system_ledger.h"
#include "logging.h"

static bool ReadTokenProgramAccount(const CLedgerView& view, const uint256& address, CAccount& account)
{
    if (!view.GetAccount(address, account))
        return false;
    return account.IsOwnedBy(Params().GetLedger().tokenProgramId);
}

bool GetMint(const CLedgerView& view, const uint256& address, CMint& mint)
{
    CAccount account;
    if (!ReadTokenProgramAccount(view, address, account))
        return false;
    if (account.vchData.size() != CMint::MINT_SIZE)
        return false;
    return UnpackTokenState(account.vchData, mint);
}

bool GetTokenAccount(const CLedgerView& view, const uint256& address, CTokenAccount& tokenAccount)
{
    CAccount account;
    if (!ReadTokenProgramAccount(view, address, account))
        return false;
    if (account.vchData.size() != CTokenAccount::ACCOUNT_SIZE)
        return false;
    return UnpackTokenState(account.vchData, tokenAccount);
}

bool TokenInitializeMint(CLedgerViewCache& view, const uint256& mintAddress,
                         uint8_t nDecimals, const uint256& mintAuthority,
                         const Optional<uint256>& freezeAuthority,
                         CValidationState& state)
{
    CAccount account;
    if (!ReadTokenProgramAccount(view, mintAddress, account) || account.vchData.size() != CMint::MINT_SIZE) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "token-init-mint-bad-account",
                             strprintf("%s is not a token program account of %u bytes", EncodeAddress(mintAddress), CMint::MINT_SIZE));
    }

    CMint mint;
    if (!UnpackTokenState(account.vchData, mint)) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "token-init-mint-bad-data");
    }
    if (mint.fInitialized) {
        return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "token-mint-already-initialized",
                             EncodeAddress(mintAddress));
    }

    mint.fInitialized = true;
    mint.nDecimals = nDecimals;
    mint.nSupply = 0;
    mint.mintAuthority = mintAuthority;
    mint.freezeAuthority = freezeAuthority;
    if (!PackTokenState(mint, account.vchData)) {
        return state.Error("token-init-mint-pack-failed");
    }
    view.SetAccount(mintAddress, account);

    LogPrint(BCLog::TOKEN, "TokenInitializeMint: %s %s\n", EncodeAddress(mintAddress), mint.ToString());
    return true;
}

bool TokenInitializeAccount(CLedgerViewCache& view, const uint256& accountAddress,
                            const uint256& mintAddress, const uint256& owner,
                            CValidationState& state)
{
    CAccount account;
    if (!ReadTokenProgramAccount(view, accountAddress, account) || account.vchData.size() != CTokenAccount::ACCOUNT_SIZE) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "token-init-account-bad-account",
                             strprintf("%s is not a token program account of %u bytes", EncodeAddress(accountAddress), CTokenAccount::ACCOUNT_SIZE));
    }

    CMint mint;
    if (!GetMint(view, mintAddress, mint) || !mint.fInitialized) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "token-init-account-invalid-mint",
                             strprintf("mint %s is not initialized", EncodeAddress(mintAddress)));
    }

    CTokenAccount tokenAccount;
    if (!UnpackTokenState(account.vchData, tokenAccount)) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "token-init-account-bad-data");
    }
    if (tokenAccount.fInitialized) {
        return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "token-account-already-initialized",
                             EncodeAddress(accountAddress));
    }

    tokenAccount.fInitialized = true;
    tokenAccount.mint = mintAddress;
    tokenAccount.owner = owner;
    tokenAccount.nAmount = 0;
    if (!PackTokenState(tokenAccount, account.vchData)) {
        return state.Error("token-init-account-pack-failed");
    }
    view.SetAccount(accountAddress, account);

    LogPrint(BCLog::TOKEN, "TokenInitializeAccount: %s %s\n", EncodeAddress(accountAddress), tokenAccount.ToString());
    return true;
}

bool TokenCreateMint(CLedgerViewCache& view, const CInvocationSigners& signers,
                     const uint256& payer, const uint256& mintAddress,
                     uint8_t nDecimals, const uint256& mintAuthority,
                     const Optional<uint256>& freezeAuthority,
                     CValidationState& state)
{
    if (!SystemCreateAccount(view, signers, payer, mintAddress, CMint::MINT_SIZE,
                             Params().GetLedger().tokenProgramId, state)) {
        return false;
    }
    return TokenInitializeMint(view, mintAddress, nDecimals, mintAuthority, freezeAuthority, state);
}

bool TokenMintTo(CLedgerViewCache& view, const CInvocationSigners& signers,
                 const uint256& mintAddress, const uint256& destination,
                 const uint256& authority, CAmount amount,
                 CValidationState& state)
{
    CAccount accMint;
    CMint mint;
    if (!ReadTokenProgramAccount(view, mintAddress, accMint) || !GetMint(view, mintAddress, mint) || !mint.fInitialized) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "token-mint-to-invalid-mint",
                             strprintf("mint %s is not initialized", EncodeAddress(mintAddress)));
    }
    if (!mint.mintAuthority) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "token-mint-to-fixed-supply",
                             strprintf("mint %s has no mint authority", EncodeAddress(mintAddress)));
    }
    if (*mint.mintAuthority != authority) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "token-mint-to-authority-mismatch",
                             strprintf("expected %s, got %s", EncodeAddress(*mint.mintAuthority), EncodeAddress(authority)));
    }
    if (!signers.IsSigner(authority)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "token-mint-to-missing-authority-signature",
                             strprintf("mint authority %s did not sign", EncodeAddress(authority)));
    }

    CAccount accDest;
    CTokenAccount tokenAccount;
    if (!ReadTokenProgramAccount(view, destination, accDest) || !GetTokenAccount(view, destination, tokenAccount) ||
        !tokenAccount.fInitialized) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "token-mint-to-invalid-destination",
                             strprintf("%s is not an initialized token account", EncodeAddress(destination)));
    }
    if (tokenAccount.mint != mintAddress) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "token-mint-to-mint-mismatch",
                             strprintf("%s holds mint %s", EncodeAddress(destination), EncodeAddress(tokenAccount.mint)));
    }

    // Overflow checks before any mutation
    CAmount nNewSupply, nNewAmount;
    if (!CheckedAdd(mint.nSupply, amount, nNewSupply) || !CheckedAdd(tokenAccount.nAmount, amount, nNewAmount)) {
        return state.Invalid(false, REJECT_OVERFLOW, "token-mint-to-overflow",
                             strprintf("supply=%u balance=%u amount=%u", mint.nSupply, tokenAccount.nAmount, amount));
    }

    if (amount == 0) {
        LogPrint(BCLog::TOKEN, "TokenMintTo: zero amount to %s\n", EncodeAddress(destination));
        return true;
    }

    mint.nSupply = nNewSupply;
    tokenAccount.nAmount = nNewAmount;
    if (!PackTokenState(mint, accMint.vchData) || !PackTokenState(tokenAccount, accDest.vchData)) {
        return state.Error("token-mint-to-pack-failed");
    }
    view.SetAccount(mintAddress, accMint);
    view.SetAccount(destination, accDest);

    LogPrint(BCLog::TOKEN, "TokenMintTo: %u to %s (supply=%u)\n", amount, EncodeAddress(destination), nNewSupply);
    return true;
}

static std::vector<CSeed> AssociatedTokenSeeds(const uint256& owner, const uint256& mint)
{
    return {SeedFromAddress(owner), SeedFromAddress(Params().GetLedger().tokenProgramId), SeedFromAddress(mint)};
}

bool GetAssociatedTokenAddress(const uint256& owner, const uint256& mint, uint256& addressRet, uint8_t& nBumpRet)
{
    return FindProgramAddress(AssociatedTokenSeeds(owner, mint), Params().GetLedger().associatedTokenProgramId,
                              addressRet, nBumpRet);
}

bool CreateAssociatedTokenAccount(CLedgerViewCache& view, const CInvocationSigners& signers,
                                  const uint256& payer, const uint256& owner, const uint256& mint,
                                  CValidationState& state)
{
    uint256 address;
    uint8_t nBump;
    if (!GetAssociatedTokenAddress(owner, mint, address, nBump)) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "token-associated-address-not-found");
    }

    // The associated-account program signs for its own derived address
    CInvocationSigners signersInner(signers);
    if (!signersInner.AddDerivedSigner(AssociatedTokenSeeds(owner, mint), nBump,
                                       Params().GetLedger().associatedTokenProgramId)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "token-associated-signer-failed");
    }

    if (!SystemCreateAccount(view, signersInner, payer, address, CTokenAccount::ACCOUNT_SIZE,
                             Params().GetLedger().tokenProgramId, state)) {
        return false;
    }
    return TokenInitializeAccount(view, address, mint, owner, state);
}
