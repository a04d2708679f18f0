// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "donation/donation_validation.h"

#include "base58.h"
#include "chainparams.h"
#include "consensus/validation.h"
#include "donation/donation_address.h"
#include "donation/donation_events.h"
#include "donation/donation_indexdb.h"
#include "donation/donation_provision.h"
#include "donation/donation_tx.h"
#include "key.h"
#include "ledger/account.h"
#include "ledger/ledgerdb.h"
#include "ledger/ledgerview.h"
#include "ledger/system_ledger.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "sync.h"
#include "token/token_ledger.h"
#include "token/token_state.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "utiltime.h"

#include <univalue.h>

static void EnsureLedgerDB()
{
    if (!GetLedgerDB())
        throw JSONRPCError(RPC_IN_WARMUP, "Ledger database not initialized");
}

static UniValue DerivedToJSON(const CDerivedAddress& derived)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", EncodeAddress(derived.address));
    obj.pushKV("bump", (int)derived.nBump);
    return obj;
}

static UniValue RecordToJSON(const CDonationRecord& record)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("donor", EncodeAddress(record.donor));
    obj.pushKV("amount", ValueFromAmount(record.nAmount));
    obj.pushKV("tokens", ValueFromAmount(record.nTokens));
    obj.pushKV("timestamp", record.nTime);
    obj.pushKV("time", FormatISO8601DateTime(record.nTime));
    if (!record.hashRequest.IsNull())
        obj.pushKV("request", record.hashRequest.GetHex());
    obj.pushKV("sequence", record.nSequence);
    return obj;
}

static UniValue StateToJSONError(const CValidationState& state)
{
    int code = RPC_VERIFY_REJECTED;
    if (state.GetRejectCode() == REJECT_DUPLICATE)
        code = RPC_VERIFY_ALREADY_IN_CHAIN;
    else if (state.IsError())
        code = RPC_DATABASE_ERROR;
    return JSONRPCError(code, strprintf("%s (%s)", FormatStateMessage(state), GetRejectCodeName(state.GetRejectCode())));
}

/**
 * getdonationinfo - Program ids, derived singletons and protocol constants
 * of the selected network
 */
static UniValue getdonationinfo(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getdonationinfo\n"
            "\nReturns the donation program parameters of the selected network.\n"
            "\nResult:\n"
            "{\n"
            "  \"network\": \"xxx\",           (string) Network name\n"
            "  \"program_id\": \"xxx\",        (string) Donation program id\n"
            "  \"token_program_id\": \"xxx\",  (string) Token program id\n"
            "  \"vault\": {...},             (object) Collecting account address and bump\n"
            "  \"mint\": {...},              (object) Reward mint address and bump\n"
            "  \"mint_authority\": {...},    (object) Mint authority address and bump\n"
            "  \"reward_decimals\": n,       (numeric) Reward token decimals\n"
            "  \"conversion_rate\": n,       (numeric) Native lamports per whole reward token\n"
            "  \"campaign_goal\": n,         (numeric) Campaign goal in lamports\n"
            "  \"mint_provisioned\": true|false, (boolean) Whether the reward mint exists\n"
            "  \"requests\": n               (numeric) Committed requests\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getdonationinfo", "") + HelpExampleRpc("getdonationinfo", ""));
    }

    EnsureLedgerDB();

    const CChainParams& params = Params();
    const Consensus::DonationParams& donation = params.GetDonation();
    const Consensus::LedgerParams& ledger = params.GetLedger();

    CDerivedAddress vault, mint, authority;
    if (!GetVaultAddress(vault) || !GetRewardMintAddress(mint) || !GetMintAuthorityAddress(authority))
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Unable to derive program addresses");

    LOCK(cs_donation);
    CLedgerViewDB viewDB(*GetLedgerDB());
    CMint mintState;
    bool fMint = GetMint(viewDB, mint.address, mintState);

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("network", params.NetworkIDString());
    obj.pushKV("program_id", EncodeAddress(donation.programId));
    obj.pushKV("token_program_id", EncodeAddress(ledger.tokenProgramId));
    obj.pushKV("associated_token_program_id", EncodeAddress(ledger.associatedTokenProgramId));
    obj.pushKV("vault", DerivedToJSON(vault));
    obj.pushKV("mint", DerivedToJSON(mint));
    obj.pushKV("mint_authority", DerivedToJSON(authority));
    obj.pushKV("reward_decimals", (int)donation.nRewardDecimals);
    obj.pushKV("conversion_rate", ValueFromAmount(donation.nConversionRate));
    obj.pushKV("campaign_goal", ValueFromAmount(donation.nCampaignGoal));
    CAmount nMintRent, nBalanceRent;
    if (!GetMinimumBalanceForRentExemption(CMint::MINT_SIZE, ledger, nMintRent) ||
        !GetMinimumBalanceForRentExemption(CTokenAccount::ACCOUNT_SIZE, ledger, nBalanceRent))
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Rent-exempt minimum out of range");
    obj.pushKV("mint_rent_exempt", ValueFromAmount(nMintRent));
    obj.pushKV("token_account_rent_exempt", ValueFromAmount(nBalanceRent));
    obj.pushKV("mint_provisioned", fMint);
    if (fMint)
        obj.pushKV("reward_supply", ValueFromAmount(mintState.nSupply));
    CAccount vaultAccount;
    obj.pushKV("vault_balance", ValueFromAmount(viewDB.GetAccount(vault.address, vaultAccount) ? vaultAccount.nLamports : 0));
    obj.pushKV("requests", GetLedgerDB()->ReadRequestCount());
    obj.pushKV("airdrop_allowed", params.AllowAirdrop());
    return obj;
}

/**
 * derivedonationaddresses - AddressDeriver output, optionally with the
 * donor's reward balance address
 */
static UniValue derivedonationaddresses(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 1) {
        throw std::runtime_error(
            "derivedonationaddresses ( \"donor\" )\n"
            "\nDerive the addresses a donation acts on.\n"
            "\nArguments:\n"
            "1. \"donor\"    (string, optional) Donor address (base58 or hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"vault\": {\"address\": \"xxx\", \"bump\": n},\n"
            "  \"mint\": {\"address\": \"xxx\", \"bump\": n},\n"
            "  \"mint_authority\": {\"address\": \"xxx\", \"bump\": n},\n"
            "  \"donor_token_account\": {\"address\": \"xxx\", \"bump\": n}   (only with donor)\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("derivedonationaddresses", "\"9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin\""));
    }

    UniValue obj(UniValue::VOBJ);
    if (request.params.size() > 0) {
        uint256 donor = ParseAddressV(request.params[0], "donor");
        CDonationAccounts accounts;
        if (!DeriveDonationAccounts(donor, accounts))
            throw JSONRPCError(RPC_INTERNAL_ERROR, "Unable to derive program addresses");
        obj.pushKV("vault", DerivedToJSON(accounts.vault));
        obj.pushKV("mint", DerivedToJSON(accounts.mint));
        obj.pushKV("mint_authority", DerivedToJSON(accounts.mintAuthority));
        UniValue tokenAccount(UniValue::VOBJ);
        tokenAccount.pushKV("address", EncodeAddress(accounts.donorTokenAccount));
        tokenAccount.pushKV("bump", (int)accounts.nDonorTokenBump);
        obj.pushKV("donor_token_account", tokenAccount);
        return obj;
    }

    CDerivedAddress vault, mint, authority;
    if (!GetVaultAddress(vault) || !GetRewardMintAddress(mint) || !GetMintAuthorityAddress(authority))
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Unable to derive program addresses");
    obj.pushKV("vault", DerivedToJSON(vault));
    obj.pushKV("mint", DerivedToJSON(mint));
    obj.pushKV("mint_authority", DerivedToJSON(authority));
    return obj;
}

/**
 * getaccountinfo - Raw and decoded view of one committed ledger account
 */
static UniValue getaccountinfo(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getaccountinfo \"address\"\n"
            "\nReturns a committed ledger account.\n"
            "\nArguments:\n"
            "1. \"address\"    (string, required) Account address (base58 or hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"address\": \"xxx\",   (string) Account address\n"
            "  \"owner\": \"xxx\",     (string) Owning program id\n"
            "  \"lamports\": n,      (numeric) Native balance\n"
            "  \"balance\": \"x.xx\",  (string) Native balance in coins\n"
            "  \"data\": \"hex\",      (string) Raw account data\n"
            "  \"type\": \"xxx\",      (string) system | mint | token_account | program\n"
            "  ...                  decoded mint or token account fields\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getaccountinfo", "\"9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin\""));
    }

    EnsureLedgerDB();
    uint256 address = ParseAddressV(request.params[0], "address");

    LOCK(cs_donation);
    CLedgerViewDB viewDB(*GetLedgerDB());
    CAccount account;
    if (!viewDB.GetAccount(address, account))
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "Account not found");

    const Consensus::LedgerParams& ledger = Params().GetLedger();

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", EncodeAddress(address));
    obj.pushKV("owner", EncodeAddress(account.owner));
    obj.pushKV("lamports", ValueFromAmount(account.nLamports));
    obj.pushKV("balance", FormatMoney(account.nLamports));
    obj.pushKV("data", HexStr(account.vchData));
    obj.pushKV("data_len", (uint64_t)account.vchData.size());

    CMint mint;
    CTokenAccount tokenAccount;
    if (account.IsPlainBalance(ledger.systemProgramId)) {
        obj.pushKV("type", "system");
    } else if (GetMint(viewDB, address, mint)) {
        obj.pushKV("type", "mint");
        obj.pushKV("initialized", mint.fInitialized);
        obj.pushKV("decimals", (int)mint.nDecimals);
        obj.pushKV("supply", ValueFromAmount(mint.nSupply));
        obj.pushKV("mint_authority", mint.mintAuthority ? EncodeAddress(*mint.mintAuthority) : "");
        obj.pushKV("freeze_authority", mint.freezeAuthority ? EncodeAddress(*mint.freezeAuthority) : "");
    } else if (GetTokenAccount(viewDB, address, tokenAccount)) {
        obj.pushKV("type", "token_account");
        obj.pushKV("initialized", tokenAccount.fInitialized);
        obj.pushKV("mint", EncodeAddress(tokenAccount.mint));
        obj.pushKV("token_owner", EncodeAddress(tokenAccount.owner));
        obj.pushKV("amount", ValueFromAmount(tokenAccount.nAmount));
    } else {
        obj.pushKV("type", "program");
    }
    return obj;
}

/**
 * getrewardbalance - A donor's reward token balance, read from the ledger
 */
static UniValue getrewardbalance(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "getrewardbalance \"donor\"\n"
            "\nReturns the reward token balance of a donor.\n"
            "\nArguments:\n"
            "1. \"donor\"    (string, required) Donor address (base58 or hex)\n"
            "\nResult:\n"
            "{\n"
            "  \"donor\": \"xxx\",          (string) Donor address\n"
            "  \"token_account\": \"xxx\",  (string) Associated reward balance address\n"
            "  \"provisioned\": true|false, (boolean) Whether the balance account exists\n"
            "  \"amount\": n,             (numeric) Balance in smallest token units\n"
            "  \"ui_amount\": \"x.xx\"      (string) Balance in whole tokens\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getrewardbalance", "\"9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin\""));
    }

    EnsureLedgerDB();
    uint256 donor = ParseAddressV(request.params[0], "donor");

    CDonationAccounts accounts;
    if (!DeriveDonationAccounts(donor, accounts))
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Unable to derive program addresses");

    LOCK(cs_donation);
    CLedgerViewDB viewDB(*GetLedgerDB());
    CTokenAccount tokenAccount;
    bool fProvisioned = IsContributorBalanceProvisioned(viewDB, accounts, donor) &&
                        GetTokenAccount(viewDB, accounts.donorTokenAccount, tokenAccount);

    const uint8_t nDecimals = Params().GetDonation().nRewardDecimals;
    const CAmount nAmount = fProvisioned ? tokenAccount.nAmount : 0;

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("donor", EncodeAddress(donor));
    obj.pushKV("token_account", EncodeAddress(accounts.donorTokenAccount));
    obj.pushKV("provisioned", fProvisioned);
    obj.pushKV("amount", ValueFromAmount(nAmount));
    obj.pushKV("decimals", (int)nDecimals);
    obj.pushKV("ui_amount", FormatTokenAmount(nAmount, nDecimals));
    return obj;
}

/**
 * recorddonation - Execute a signed donation request against the ledger
 */
static UniValue recorddonation(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 1) {
        throw std::runtime_error(
            "recorddonation \"hexrequest\"\n"
            "\nExecute a signed donation request: transfer the amount to the vault,\n"
            "provision the reward mint and donor balance if needed, mint the reward\n"
            "and emit the donation event. Either every step is committed or none.\n"
            "\nArguments:\n"
            "1. \"hexrequest\"    (string, required) Serialized signed request (see createdonationrequest)\n"
            "\nResult:\n"
            "{\n"
            "  \"donor\": \"xxx\",       (string) Donor address\n"
            "  \"amount\": n,          (numeric) Donated lamports\n"
            "  \"tokens\": n,          (numeric) Reward token units minted\n"
            "  \"timestamp\": n,       (numeric) Unix time of the donation\n"
            "  \"request\": \"hash\",    (string) Request id\n"
            "  \"sequence\": n         (numeric) Commit sequence\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("recorddonation", "\"0100...\""));
    }

    RPCTypeCheck(request.params, {UniValue::VSTR});
    EnsureLedgerDB();

    CDonationRequest donationRequest;
    if (!DecodeHexDonationRequest(request.params[0].get_str(), donationRequest))
        throw JSONRPCError(RPC_DESERIALIZATION_ERROR, "Request decode failed");

    CValidationState state;
    CDonationRecord record;
    if (!ProcessDonationRequest(donationRequest, state, &record))
        throw StateToJSONError(state);

    return RecordToJSON(record);
}

/**
 * createdonationrequest - Build and sign a request for a donor key
 */
static UniValue createdonationrequest(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() < 2 || request.params.size() > 3) {
        throw std::runtime_error(
            "createdonationrequest \"privkey\" amount ( nonce )\n"
            "\nCreate a signed donation request. Nothing is executed.\n"
            "\nArguments:\n"
            "1. \"privkey\"    (string, required) Donor secret key (hex)\n"
            "2. amount       (numeric, required) Lamports to donate\n"
            "3. nonce        (numeric, optional) Request nonce (default: current time in microseconds)\n"
            "\nResult:\n"
            "{\n"
            "  \"hex\": \"xxx\",            (string) Serialized request for recorddonation\n"
            "  \"request\": \"hash\",       (string) Request id\n"
            "  \"donor\": \"xxx\",          (string) Donor address\n"
            "  \"token_account\": \"xxx\"   (string) Donor reward balance address\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("createdonationrequest", "\"<privkey>\" 500000"));
    }

    RPCTypeCheck(request.params, {UniValue::VSTR});
    std::vector<unsigned char> vchSecret = ParseHexV(request.params[0], "privkey");
    CKey key;
    key.Set(vchSecret.begin(), vchSecret.end());
    if (!key.IsValid())
        throw JSONRPCError(RPC_INVALID_ADDRESS_OR_KEY, "Invalid private key");

    CAmount nAmount = AmountFromValue(request.params[1]);
    uint64_t nNonce = (uint64_t)GetTimeMicros();
    if (request.params.size() > 2) {
        if (!ParseUInt64(request.params[2].getValStr(), &nNonce))
            throw JSONRPCError(RPC_INVALID_PARAMETER, "Invalid nonce");
    }

    CDonationRequest donationRequest;
    if (!CreateDonationRequest(key, nAmount, nNonce, donationRequest))
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Unable to create donation request");

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("hex", EncodeHexDonationRequest(donationRequest));
    obj.pushKV("request", donationRequest.GetHash().GetHex());
    obj.pushKV("donor", EncodeAddress(donationRequest.donor.GetAddress()));
    obj.pushKV("amount", ValueFromAmount(donationRequest.nAmount));
    obj.pushKV("nonce", donationRequest.nNonce);
    obj.pushKV("vault", EncodeAddress(donationRequest.vault));
    obj.pushKV("mint", EncodeAddress(donationRequest.mint));
    obj.pushKV("token_account", EncodeAddress(donationRequest.donorTokenAccount));
    obj.pushKV("mint_authority", EncodeAddress(donationRequest.mintAuthority));
    return obj;
}

/**
 * listdonations - Recent donations from the index, newest first
 */
static UniValue listdonations(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() > 1) {
        throw std::runtime_error(
            "listdonations ( count )\n"
            "\nReturns the most recent donations, newest first.\n"
            "\nArguments:\n"
            "1. count    (numeric, optional, default=10) Maximum number of donations\n"
            "\nResult:\n"
            "[\n"
            "  {\n"
            "    \"donor\": \"xxx\",    (string) Donor address\n"
            "    \"amount\": n,       (numeric) Donated lamports\n"
            "    \"tokens\": n,       (numeric) Reward token units minted\n"
            "    \"timestamp\": n,    (numeric) Unix time\n"
            "    \"time\": \"xxx\",     (string) ISO 8601 time\n"
            "    \"sequence\": n      (numeric) Commit sequence\n"
            "  }, ...\n"
            "]\n"
            "\nExamples:\n" +
            HelpExampleCli("listdonations", "10"));
    }

    int64_t nCount = 10;
    if (request.params.size() > 0) {
        RPCTypeCheck(request.params, {UniValue::VNUM});
        nCount = request.params[0].get_int64();
        if (nCount < 0)
            throw JSONRPCError(RPC_INVALID_PARAMETER, "Negative count");
    }

    CDonationIndexDB* pindex = GetDonationIndexDB();
    if (!pindex)
        throw JSONRPCError(RPC_IN_WARMUP, "Donation index not initialized");

    std::vector<CDonationRecord> records;
    if (!pindex->ReadRecentDonations((size_t)nCount, records))
        throw JSONRPCError(RPC_DATABASE_ERROR, "Unable to read donation index");

    UniValue ret(UniValue::VARR);
    for (const CDonationRecord& record : records)
        ret.push_back(RecordToJSON(record));
    return ret;
}

/**
 * getcampaignprogress - Raised amount against the configured goal
 */
static UniValue getcampaignprogress(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getcampaignprogress\n"
            "\nReturns the campaign progress from the donation index.\n"
            "\nResult:\n"
            "{\n"
            "  \"raised\": n,          (numeric) Lamports donated\n"
            "  \"goal\": n,            (numeric) Campaign goal in lamports\n"
            "  \"percentage\": x.xx,   (numeric) Raised / goal, capped at 100\n"
            "  \"donors\": n,          (numeric) Distinct donors\n"
            "  \"donations\": n,       (numeric) Donation count\n"
            "  \"tokens\": n           (numeric) Reward token units minted\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getcampaignprogress", "") + HelpExampleRpc("getcampaignprogress", ""));
    }

    CDonationIndexDB* pindex = GetDonationIndexDB();
    if (!pindex)
        throw JSONRPCError(RPC_IN_WARMUP, "Donation index not initialized");

    const CCampaignTotals totals = pindex->ReadCampaignTotals();
    const CAmount nGoal = Params().GetDonation().nCampaignGoal;

    double dPercentage = 0.0;
    if (nGoal > 0) {
        dPercentage = (double)totals.nRaised * 100.0 / (double)nGoal;
        if (dPercentage > 100.0)
            dPercentage = 100.0;
    }

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("raised", ValueFromAmount(totals.nRaised));
    obj.pushKV("raised_coins", FormatMoney(totals.nRaised));
    obj.pushKV("goal", ValueFromAmount(nGoal));
    obj.pushKV("goal_coins", FormatMoney(nGoal));
    obj.pushKV("percentage", dPercentage);
    obj.pushKV("donors", totals.nDonors);
    obj.pushKV("donations", totals.nDonations);
    obj.pushKV("tokens", ValueFromAmount(totals.nTokens));
    return obj;
}

/**
 * airdrop - Credit test funds to an address (test networks only)
 */
static UniValue airdrop(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 2) {
        throw std::runtime_error(
            "airdrop \"address\" amount\n"
            "\nCredit native test funds to an address. Only on networks that allow it.\n"
            "\nArguments:\n"
            "1. \"address\"    (string, required) Recipient address (base58 or hex)\n"
            "2. amount       (numeric, required) Lamports to credit\n"
            "\nResult:\n"
            "{\n"
            "  \"address\": \"xxx\",   (string) Recipient address\n"
            "  \"lamports\": n       (numeric) New balance\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("airdrop", "\"9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin\" 2000000000"));
    }

    EnsureLedgerDB();
    uint256 address = ParseAddressV(request.params[0], "address");
    CAmount nAmount = AmountFromValue(request.params[1]);

    CValidationState state;
    if (!ProcessAirdrop(address, nAmount, state))
        throw StateToJSONError(state);

    CAccount account;
    if (!ReadLedgerAccount(address, account))
        throw JSONRPCError(RPC_DATABASE_ERROR, "Unable to read account");

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", EncodeAddress(address));
    obj.pushKV("lamports", ValueFromAmount(account.nLamports));
    return obj;
}

/**
 * getnewdonorkey - Generate a fresh donor key pair
 */
static UniValue getnewdonorkey(const JSONRPCRequest& request)
{
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getnewdonorkey\n"
            "\nGenerate a new donor key. The key is not stored.\n"
            "\nResult:\n"
            "{\n"
            "  \"privkey\": \"hex\",   (string) Secret key\n"
            "  \"pubkey\": \"hex\",    (string) Compressed public key\n"
            "  \"address\": \"xxx\"    (string) Ledger address\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getnewdonorkey", ""));
    }

    CKey key;
    key.MakeNewKey();
    CPubKey pubkey = key.GetPubKey();
    if (!pubkey.IsFullyValid() || !key.VerifyPubKey(pubkey))
        throw JSONRPCError(RPC_INTERNAL_ERROR, "Key generation failed");

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("privkey", HexStr(key.begin(), key.end()));
    obj.pushKV("pubkey", HexStr(pubkey.begin(), pubkey.end()));
    obj.pushKV("address", EncodeAddress(pubkey.GetAddress()));
    return obj;
}

// clang-format off
static const CRPCCommand commands[] = {
    //  category      name                         actor (function)            okSafe  argNames
    //  ------------  ---------------------------  --------------------------  ------  ----------
    { "donation",     "getdonationinfo",           &getdonationinfo,           true,   {} },
    { "donation",     "derivedonationaddresses",   &derivedonationaddresses,   true,   {"donor"} },
    { "donation",     "getaccountinfo",            &getaccountinfo,            true,   {"address"} },
    { "donation",     "getrewardbalance",          &getrewardbalance,          true,   {"donor"} },
    { "donation",     "recorddonation",            &recorddonation,            false,  {"hexrequest"} },
    { "donation",     "createdonationrequest",     &createdonationrequest,     true,   {"privkey", "amount", "nonce"} },
    { "donation",     "listdonations",             &listdonations,             true,   {"count"} },
    { "donation",     "getcampaignprogress",       &getcampaignprogress,       true,   {} },
    { "donation",     "airdrop",                   &airdrop,                   false,  {"address", "amount"} },
    { "donation",     "getnewdonorkey",            &getnewdonorkey,            true,   {} },
};
// clang-format on

void RegisterDonationRPCCommands(CRPCTable& t)
{
    for (unsigned int vcidx = 0; vcidx < ARRAYLEN(commands); vcidx++)
        t.appendCommand(commands[vcidx].name, &commands[vcidx]);
}
