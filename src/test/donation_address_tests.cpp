// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for program address derivation and signer sets
//
// Tests verify:
// - Derived addresses are deterministic and network specific
// - The returned bump is the highest one that yields an off-curve address
// - Seed limits are enforced
// - Seed boundaries are part of the derivation
// - Key and derived signers are only admitted with a valid proof
//

#include "test/test_donation.h"

#include "base58.h"
#include "chainparams.h"
#include "donation/donation_address.h"
#include "hash.h"
#include "key.h"
#include "ledger/program_address.h"
#include "ledger/signers.h"
#include "pubkey.h"
#include "token/token_ledger.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(donation_address_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(program_address_deterministic)
{
    const uint256 programId = Params().GetDonation().programId;
    std::vector<CSeed> vSeeds = {SeedFromString("donation_vault")};

    uint256 addr1, addr2;
    uint8_t nBump1 = 0, nBump2 = 0;
    BOOST_REQUIRE(FindProgramAddress(vSeeds, programId, addr1, nBump1));
    BOOST_REQUIRE(FindProgramAddress(vSeeds, programId, addr2, nBump2));
    BOOST_CHECK(addr1 == addr2);
    BOOST_CHECK_EQUAL(nBump1, nBump2);

    // A program address has no private key
    BOOST_CHECK(!CPubKey::IsOnCurve(addr1));

    // Re-deriving with the bump gives the same address
    std::vector<CSeed> vWithBump(vSeeds);
    vWithBump.emplace_back(1, nBump1);
    uint256 addrCheck;
    BOOST_REQUIRE(CreateProgramAddress(vWithBump, programId, addrCheck));
    BOOST_CHECK(addrCheck == addr1);
}

BOOST_AUTO_TEST_CASE(program_address_canonical_bump)
{
    const uint256 programId = Params().GetDonation().programId;
    std::vector<CSeed> vSeeds = {SeedFromString("spacex_token_mint")};

    uint256 address;
    uint8_t nBump = 0;
    BOOST_REQUIRE(FindProgramAddress(vSeeds, programId, address, nBump));

    // Every higher bump lands on the curve
    for (int b = 255; b > nBump; b--) {
        std::vector<CSeed> vWithBump(vSeeds);
        vWithBump.emplace_back(1, (unsigned char)b);
        uint256 tmp;
        BOOST_CHECK(!CreateProgramAddress(vWithBump, programId, tmp));
    }
}

BOOST_AUTO_TEST_CASE(program_address_depends_on_inputs)
{
    const uint256 programId = Params().GetDonation().programId;
    uint256 addrA, addrB, addrC;
    uint8_t nBump;
    BOOST_REQUIRE(FindProgramAddress({SeedFromString("a")}, programId, addrA, nBump));
    BOOST_REQUIRE(FindProgramAddress({SeedFromString("b")}, programId, addrB, nBump));
    BOOST_REQUIRE(FindProgramAddress({SeedFromString("a")}, Params().GetLedger().tokenProgramId, addrC, nBump));
    BOOST_CHECK(addrA != addrB);
    BOOST_CHECK(addrA != addrC);
}

BOOST_AUTO_TEST_CASE(program_address_seed_boundaries)
{
    const uint256 programId = Params().GetDonation().programId;
    uint256 addrWhole, addrSplit, addrTrailing;
    uint8_t nBump;
    BOOST_REQUIRE(FindProgramAddress({SeedFromString("donation_vault")}, programId, addrWhole, nBump));
    BOOST_REQUIRE(FindProgramAddress({SeedFromString("donation_"), SeedFromString("vault")}, programId, addrSplit, nBump));
    BOOST_REQUIRE(FindProgramAddress({SeedFromString("donation_vault"), CSeed()}, programId, addrTrailing, nBump));
    BOOST_CHECK(addrWhole != addrSplit);
    BOOST_CHECK(addrWhole != addrTrailing);
    BOOST_CHECK(addrSplit != addrTrailing);

    // Same through the donation program: distinct (tag, context) pairs
    CDerivedAddress vault, split, empty;
    BOOST_REQUIRE(DeriveDonationAddress("donation_vault", {}, vault));
    BOOST_REQUIRE(DeriveDonationAddress("donation_", {SeedFromString("vault")}, split));
    BOOST_CHECK(vault.address != split.address);
    BOOST_CHECK(!DeriveDonationAddress("donation_vault", {CSeed()}, empty));
    BOOST_CHECK(!DeriveDonationAddress("", {SeedFromString("vault")}, empty));
}

BOOST_AUTO_TEST_CASE(program_address_seed_limits)
{
    const uint256 programId = Params().GetDonation().programId;
    uint256 address;
    uint8_t nBump;

    // Seed longer than 32 bytes
    std::vector<CSeed> vLong = {CSeed(MAX_SEED_LEN + 1, 0xab)};
    BOOST_CHECK(!FindProgramAddress(vLong, programId, address, nBump));
    BOOST_CHECK(!CreateProgramAddress(vLong, programId, address));

    // 32 bytes is fine
    std::vector<CSeed> vMax = {CSeed(MAX_SEED_LEN, 0xab)};
    BOOST_CHECK(FindProgramAddress(vMax, programId, address, nBump));

    // No room left for the bump
    std::vector<CSeed> vMany(MAX_SEEDS, CSeed(1, 0x01));
    BOOST_CHECK(!FindProgramAddress(vMany, programId, address, nBump));
    std::vector<CSeed> vTooMany(MAX_SEEDS + 1, CSeed(1, 0x01));
    BOOST_CHECK(!CreateProgramAddress(vTooMany, programId, address));
}

BOOST_AUTO_TEST_CASE(donation_singletons)
{
    CDerivedAddress vault, mint, authority;
    BOOST_REQUIRE(GetVaultAddress(vault));
    BOOST_REQUIRE(GetRewardMintAddress(mint));
    BOOST_REQUIRE(GetMintAuthorityAddress(authority));

    BOOST_CHECK(vault.address != mint.address);
    BOOST_CHECK(vault.address != authority.address);
    BOOST_CHECK(mint.address != authority.address);

    // Seeds are the tag alone; the bump is kept apart
    BOOST_REQUIRE_EQUAL(vault.vSeeds.size(), 1U);
    BOOST_CHECK(vault.vSeeds[0] == SeedFromString(Params().GetDonation().strVaultTag));

    CDerivedAddress vault2;
    BOOST_REQUIRE(GetVaultAddress(vault2));
    BOOST_CHECK(vault2.address == vault.address);
    BOOST_CHECK_EQUAL(vault2.nBump, vault.nBump);
}

BOOST_AUTO_TEST_CASE(donation_addresses_network_specific)
{
    CDerivedAddress vaultRegtest;
    BOOST_REQUIRE(GetVaultAddress(vaultRegtest));

    SelectParams(CBaseChainParams::MAIN);
    CDerivedAddress vaultMain;
    BOOST_REQUIRE(GetVaultAddress(vaultMain));

    SelectParams(CBaseChainParams::TESTNET);
    CDerivedAddress vaultTest;
    BOOST_REQUIRE(GetVaultAddress(vaultTest));

    SelectParams(CBaseChainParams::REGTEST);

    BOOST_CHECK(vaultRegtest.address != vaultMain.address);
    BOOST_CHECK(vaultRegtest.address != vaultTest.address);
    BOOST_CHECK(vaultMain.address != vaultTest.address);
}

BOOST_AUTO_TEST_CASE(donor_token_account_per_donor)
{
    const uint256 donorA = MakeTestKey(1).GetPubKey().GetAddress();
    const uint256 donorB = MakeTestKey(2).GetPubKey().GetAddress();

    CDonationAccounts accA, accB, accA2;
    BOOST_REQUIRE(DeriveDonationAccounts(donorA, accA));
    BOOST_REQUIRE(DeriveDonationAccounts(donorB, accB));
    BOOST_REQUIRE(DeriveDonationAccounts(donorA, accA2));

    BOOST_CHECK(accA.donorTokenAccount != accB.donorTokenAccount);
    BOOST_CHECK(accA.donorTokenAccount == accA2.donorTokenAccount);
    BOOST_CHECK(accA.vault.address == accB.vault.address);
    BOOST_CHECK(accA.mint.address == accB.mint.address);

    uint256 expected;
    uint8_t nBump;
    BOOST_REQUIRE(GetAssociatedTokenAddress(donorA, accA.mint.address, expected, nBump));
    BOOST_CHECK(expected == accA.donorTokenAccount);
    BOOST_CHECK_EQUAL(nBump, accA.nDonorTokenBump);
}

BOOST_AUTO_TEST_CASE(address_encoding)
{
    CDerivedAddress vault;
    BOOST_REQUIRE(GetVaultAddress(vault));

    const std::string strB58 = EncodeAddress(vault.address);
    uint256 decoded;
    BOOST_CHECK(DecodeAddress(strB58, decoded));
    BOOST_CHECK(decoded == vault.address);

    uint256 decodedHex;
    BOOST_CHECK(DecodeAddress(vault.address.GetHex(), decodedHex));
    BOOST_CHECK(decodedHex == vault.address);

    uint256 bad;
    BOOST_CHECK(!DecodeAddress("", bad));
    BOOST_CHECK(!DecodeAddress("0OIl", bad));
    BOOST_CHECK(!DecodeAddress("3mJr7AoUXx2Wqd", bad));
}

BOOST_AUTO_TEST_CASE(key_signer)
{
    CKey key = MakeTestKey(7);
    CPubKey pubkey = key.GetPubKey();
    BOOST_REQUIRE(pubkey.IsFullyValid());

    const uint256 hash = Hash(pubkey.begin(), pubkey.end());
    std::vector<unsigned char> vchSig;
    BOOST_REQUIRE(key.Sign(hash, vchSig));

    CInvocationSigners signers;
    BOOST_CHECK(signers.AddKeySigner(pubkey, hash, vchSig));
    BOOST_CHECK(signers.IsSigner(pubkey.GetAddress()));
    BOOST_CHECK_EQUAL(signers.size(), 1U);

    // Signature over another message
    CInvocationSigners signers2;
    uint256 other = hash;
    *other.begin() ^= 0x01;
    BOOST_CHECK(!signers2.AddKeySigner(pubkey, other, vchSig));
    BOOST_CHECK(!signers2.IsSigner(pubkey.GetAddress()));

    // Signature by another key
    CInvocationSigners signers3;
    std::vector<unsigned char> vchSigOther;
    BOOST_REQUIRE(MakeTestKey(8).Sign(hash, vchSigOther));
    BOOST_CHECK(!signers3.AddKeySigner(pubkey, hash, vchSigOther));
    BOOST_CHECK_EQUAL(signers3.size(), 0U);
}

BOOST_AUTO_TEST_CASE(derived_signer)
{
    CDerivedAddress authority;
    BOOST_REQUIRE(GetMintAuthorityAddress(authority));
    const uint256 programId = Params().GetDonation().programId;

    CInvocationSigners signers;
    uint256 proven;
    BOOST_CHECK(signers.AddDerivedSigner(authority.vSeeds, authority.nBump, programId, &proven));
    BOOST_CHECK(proven == authority.address);
    BOOST_CHECK(signers.IsSigner(authority.address));

    // The same recipe under another program proves a different address
    CInvocationSigners signersOther;
    uint256 provenOther;
    if (signersOther.AddDerivedSigner(authority.vSeeds, authority.nBump, Params().GetLedger().tokenProgramId, &provenOther)) {
        BOOST_CHECK(provenOther != authority.address);
    }
    BOOST_CHECK(!signersOther.IsSigner(authority.address));
}

BOOST_AUTO_TEST_SUITE_END()
