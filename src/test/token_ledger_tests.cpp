// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for the token sub-ledger
//
// Tests verify:
// - Mint and balance account creation and initialization
// - Associated balance account derivation
// - mint_to authority, destination and overflow checks
//

#include "test/test_donation.h"

#include "chainparams.h"
#include "consensus/validation.h"
#include "donation/donation_validation.h"
#include "ledger/account.h"
#include "ledger/ledgerdb.h"
#include "ledger/ledgerview.h"
#include "ledger/signers.h"
#include "ledger/system_ledger.h"
#include "token/token_ledger.h"
#include "token/token_state.h"

#include <boost/test/unit_test.hpp>

namespace {

/** A funded payer, a mint keyed by mintKey and a key-held mint authority */
struct TokenTestingSetup : public LedgerTestingSetup {
    CKey payerKey;
    CKey mintKey;
    CKey authorityKey;
    uint256 payer;
    uint256 mintAddress;
    uint256 authority;

    TokenTestingSetup()
    {
        payerKey = MakeFundedKey(10 * COIN);
        mintKey = MakeTestKey(50);
        authorityKey = MakeTestKey(51);
        payer = payerKey.GetPubKey().GetAddress();
        mintAddress = mintKey.GetPubKey().GetAddress();
        authority = authorityKey.GetPubKey().GetAddress();
    }

    CInvocationSigners Signers(const CKey& key)
    {
        CInvocationSigners signers;
        BOOST_REQUIRE(AddTestKeySigner(key, signers));
        return signers;
    }

    /** Create the mint and commit it */
    void CreateMint()
    {
        CLedgerViewDB viewDB(*GetLedgerDB());
        CLedgerViewCache view(&viewDB);
        CInvocationSigners signers = Signers(payerKey);
        BOOST_REQUIRE(AddTestKeySigner(mintKey, signers));
        CValidationState state;
        BOOST_REQUIRE(TokenCreateMint(view, signers, payer, mintAddress, 6, authority, nullopt, state));
        BOOST_REQUIRE(view.Flush(state));
    }

    /** Create owner's associated balance of the mint and commit it */
    uint256 CreateBalance(const uint256& owner)
    {
        CLedgerViewDB viewDB(*GetLedgerDB());
        CLedgerViewCache view(&viewDB);
        CValidationState state;
        BOOST_REQUIRE(CreateAssociatedTokenAccount(view, Signers(payerKey), payer, owner, mintAddress, state));
        BOOST_REQUIRE(view.Flush(state));
        uint256 address;
        uint8_t nBump;
        BOOST_REQUIRE(GetAssociatedTokenAddress(owner, mintAddress, address, nBump));
        return address;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(token_ledger_tests, TokenTestingSetup)

BOOST_AUTO_TEST_CASE(create_mint)
{
    CreateMint();

    CLedgerViewDB viewDB(*GetLedgerDB());
    CMint mint;
    BOOST_REQUIRE(GetMint(viewDB, mintAddress, mint));
    BOOST_CHECK(mint.fInitialized);
    BOOST_CHECK_EQUAL(mint.nDecimals, 6);
    BOOST_CHECK_EQUAL(mint.nSupply, 0U);
    BOOST_REQUIRE(mint.mintAuthority);
    BOOST_CHECK(*mint.mintAuthority == authority);
    BOOST_CHECK(!mint.freezeAuthority);

    CAccount account;
    BOOST_REQUIRE(viewDB.GetAccount(mintAddress, account));
    BOOST_CHECK(account.owner == Params().GetLedger().tokenProgramId);
    BOOST_CHECK_EQUAL(account.vchData.size(), CMint::MINT_SIZE);
    BOOST_CHECK_EQUAL(account.nLamports, RentExemptMinimum(CMint::MINT_SIZE));
    BOOST_CHECK_EQUAL(CommittedBalance(payer), 10 * COIN - account.nLamports);

    // A mint account is not a balance account
    CTokenAccount tokenAccount;
    BOOST_CHECK(!GetTokenAccount(viewDB, mintAddress, tokenAccount));
}

BOOST_AUTO_TEST_CASE(initialize_mint_twice)
{
    CreateMint();

    CLedgerViewDB viewDB(*GetLedgerDB());
    CLedgerViewCache view(&viewDB);
    CValidationState state;
    BOOST_CHECK(!TokenInitializeMint(view, mintAddress, 9, payer, nullopt, state));
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_PROVISIONING_CONFLICT);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "token-mint-already-initialized");

    // Creating the account again fails before initialization
    CInvocationSigners signers = Signers(payerKey);
    BOOST_REQUIRE(AddTestKeySigner(mintKey, signers));
    CValidationState stateCreate;
    BOOST_CHECK(!TokenCreateMint(view, signers, payer, mintAddress, 6, authority, nullopt, stateCreate));
    BOOST_CHECK_EQUAL(stateCreate.GetRejectReason(), "ledger-create-account-in-use");
}

BOOST_AUTO_TEST_CASE(initialize_mint_needs_token_account)
{
    CLedgerViewDB viewDB(*GetLedgerDB());
    CLedgerViewCache view(&viewDB);
    CValidationState state;
    BOOST_CHECK(!TokenInitializeMint(view, mintAddress, 6, authority, nullopt, state));
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_LEDGER_FAILURE);
}

BOOST_AUTO_TEST_CASE(associated_balance_account)
{
    CreateMint();
    const uint256 owner = MakeTestKey(60).GetPubKey().GetAddress();
    const CAmount nPayerBefore = CommittedBalance(payer);

    const uint256 address = CreateBalance(owner);

    CLedgerViewDB viewDB(*GetLedgerDB());
    CTokenAccount tokenAccount;
    BOOST_REQUIRE(GetTokenAccount(viewDB, address, tokenAccount));
    BOOST_CHECK(tokenAccount.fInitialized);
    BOOST_CHECK(tokenAccount.owner == owner);
    BOOST_CHECK(tokenAccount.mint == mintAddress);
    BOOST_CHECK_EQUAL(tokenAccount.nAmount, 0U);

    const CAmount nRent = RentExemptMinimum(CTokenAccount::ACCOUNT_SIZE);
    BOOST_CHECK_EQUAL(CommittedBalance(address), nRent);
    BOOST_CHECK_EQUAL(CommittedBalance(payer), nPayerBefore - nRent);

    // Second creation is in use
    CLedgerViewCache view(&viewDB);
    CValidationState state;
    BOOST_CHECK(!CreateAssociatedTokenAccount(view, Signers(payerKey), payer, owner, mintAddress, state));
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_PROVISIONING_CONFLICT);
}

BOOST_AUTO_TEST_CASE(associated_balance_needs_mint)
{
    const uint256 owner = MakeTestKey(61).GetPubKey().GetAddress();

    CLedgerViewDB viewDB(*GetLedgerDB());
    CLedgerViewCache view(&viewDB);
    CValidationState state;
    BOOST_CHECK(!CreateAssociatedTokenAccount(view, Signers(payerKey), payer, owner, mintAddress, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "token-init-account-invalid-mint");
}

BOOST_AUTO_TEST_CASE(mint_to)
{
    CreateMint();
    const uint256 owner = MakeTestKey(62).GetPubKey().GetAddress();
    const uint256 destination = CreateBalance(owner);

    CLedgerViewDB viewDB(*GetLedgerDB());
    CLedgerViewCache view(&viewDB);
    CValidationState state;
    BOOST_REQUIRE(TokenMintTo(view, Signers(authorityKey), mintAddress, destination, authority, 5000, state));
    BOOST_REQUIRE(TokenMintTo(view, Signers(authorityKey), mintAddress, destination, authority, 250, state));
    BOOST_REQUIRE(view.Flush(state));

    CMint mint;
    CTokenAccount tokenAccount;
    BOOST_REQUIRE(GetMint(viewDB, mintAddress, mint));
    BOOST_REQUIRE(GetTokenAccount(viewDB, destination, tokenAccount));
    BOOST_CHECK_EQUAL(mint.nSupply, 5250U);
    BOOST_CHECK_EQUAL(tokenAccount.nAmount, 5250U);
}

BOOST_AUTO_TEST_CASE(mint_to_zero_amount)
{
    CreateMint();
    const uint256 destination = CreateBalance(MakeTestKey(63).GetPubKey().GetAddress());

    CLedgerViewDB viewDB(*GetLedgerDB());
    CLedgerViewCache view(&viewDB);
    CValidationState state;
    BOOST_CHECK(TokenMintTo(view, Signers(authorityKey), mintAddress, destination, authority, 0, state));
    BOOST_CHECK(!view.HasPendingChanges());

    // Zero still needs the authority
    CValidationState stateNoSig;
    BOOST_CHECK(!TokenMintTo(view, Signers(payerKey), mintAddress, destination, authority, 0, stateNoSig));
    BOOST_CHECK_EQUAL(stateNoSig.GetRejectCode(), REJECT_UNAUTHORIZED);
}

BOOST_AUTO_TEST_CASE(mint_to_authority_checks)
{
    CreateMint();
    const uint256 destination = CreateBalance(MakeTestKey(64).GetPubKey().GetAddress());

    CLedgerViewDB viewDB(*GetLedgerDB());
    CLedgerViewCache view(&viewDB);

    // Wrong authority, even though it signed
    CValidationState state;
    BOOST_CHECK(!TokenMintTo(view, Signers(payerKey), mintAddress, destination, payer, 1, state));
    BOOST_CHECK_EQUAL(state.GetRejectCode(), REJECT_UNAUTHORIZED);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "token-mint-to-authority-mismatch");

    // Right authority, missing signature
    CValidationState state2;
    BOOST_CHECK(!TokenMintTo(view, Signers(payerKey), mintAddress, destination, authority, 1, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectCode(), REJECT_UNAUTHORIZED);
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "token-mint-to-missing-authority-signature");

    BOOST_CHECK(!view.HasPendingChanges());
}

BOOST_AUTO_TEST_CASE(mint_to_fixed_supply)
{
    CreateMint();
    const uint256 destination = CreateBalance(MakeTestKey(65).GetPubKey().GetAddress());

    // Drop the mint authority
    CLedgerViewDB viewDB(*GetLedgerDB());
    CLedgerViewCache view(&viewDB);
    CAccount account;
    BOOST_REQUIRE(view.GetAccount(mintAddress, account));
    CMint mint;
    BOOST_REQUIRE(UnpackTokenState(account.vchData, mint));
    mint.mintAuthority = nullopt;
    BOOST_REQUIRE(PackTokenState(mint, account.vchData));
    view.SetAccount(mintAddress, account);

    CValidationState state;
    BOOST_CHECK(!TokenMintTo(view, Signers(authorityKey), mintAddress, destination, authority, 1, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "token-mint-to-fixed-supply");
}

BOOST_AUTO_TEST_CASE(mint_to_wrong_destination)
{
    CreateMint();

    // A balance of another mint
    CKey otherMintKey = MakeTestKey(70);
    const uint256 otherMint = otherMintKey.GetPubKey().GetAddress();
    const uint256 owner = MakeTestKey(66).GetPubKey().GetAddress();
    uint256 otherBalance;
    {
        CLedgerViewDB viewDB(*GetLedgerDB());
        CLedgerViewCache view(&viewDB);
        CInvocationSigners signers = Signers(payerKey);
        BOOST_REQUIRE(AddTestKeySigner(otherMintKey, signers));
        CValidationState state;
        BOOST_REQUIRE(TokenCreateMint(view, signers, payer, otherMint, 6, authority, authority, state));
        BOOST_REQUIRE(CreateAssociatedTokenAccount(view, signers, payer, owner, otherMint, state));
        BOOST_REQUIRE(view.Flush(state));
        uint8_t nBump;
        BOOST_REQUIRE(GetAssociatedTokenAddress(owner, otherMint, otherBalance, nBump));
    }

    CLedgerViewDB viewDB(*GetLedgerDB());
    CMint other;
    BOOST_REQUIRE(GetMint(viewDB, otherMint, other));
    BOOST_REQUIRE(other.freezeAuthority);
    BOOST_CHECK(*other.freezeAuthority == authority);

    CLedgerViewCache view(&viewDB);
    CValidationState state;
    BOOST_CHECK(!TokenMintTo(view, Signers(authorityKey), mintAddress, otherBalance, authority, 1, state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "token-mint-to-mint-mismatch");

    // Not a token account at all
    CValidationState state2;
    BOOST_CHECK(!TokenMintTo(view, Signers(authorityKey), mintAddress, payer, authority, 1, state2));
    BOOST_CHECK_EQUAL(state2.GetRejectReason(), "token-mint-to-invalid-destination");
}

BOOST_AUTO_TEST_CASE(mint_to_overflow)
{
    CreateMint();
    const uint256 destination = CreateBalance(MakeTestKey(67).GetPubKey().GetAddress());

    CLedgerViewDB viewDB(*GetLedgerDB());
    CLedgerViewCache view(&viewDB);
    CValidationState state;
    BOOST_REQUIRE(TokenMintTo(view, Signers(authorityKey), mintAddress, destination, authority, MAX_AMOUNT, state));

    CValidationState stateOverflow;
    BOOST_CHECK(!TokenMintTo(view, Signers(authorityKey), mintAddress, destination, authority, 1, stateOverflow));
    BOOST_CHECK_EQUAL(stateOverflow.GetRejectCode(), REJECT_OVERFLOW);

    CMint mint;
    CTokenAccount tokenAccount;
    BOOST_REQUIRE(GetMint(view, mintAddress, mint));
    BOOST_REQUIRE(GetTokenAccount(view, destination, tokenAccount));
    BOOST_CHECK_EQUAL(mint.nSupply, MAX_AMOUNT);
    BOOST_CHECK_EQUAL(tokenAccount.nAmount, MAX_AMOUNT);
}

BOOST_AUTO_TEST_SUITE_END()
