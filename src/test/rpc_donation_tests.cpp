// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/test_donation.h"

#include "base58.h"
#include "donation/donation_address.h"
#include "donation/donation_validation.h"
#include "rpc/client.h"
#include "rpc/protocol.h"
#include "rpc/register.h"
#include "rpc/server.h"

#include <boost/algorithm/string.hpp>
#include <boost/test/unit_test.hpp>

#include <univalue.h>

namespace {

struct RPCTestingSetup : public LedgerTestingSetup {
    RPCTestingSetup()
    {
        RegisterAllCoreRPCCommands(tableRPC);
    }
};

JSONRPCRequest MakeRequest(const std::string& args)
{
    std::vector<std::string> vArgs;
    boost::split(vArgs, args, boost::is_any_of(" \t"));
    JSONRPCRequest request;
    request.strMethod = vArgs[0];
    vArgs.erase(vArgs.begin());
    request.params = RPCConvertValues(request.strMethod, vArgs);
    return request;
}

UniValue CallRPC(const std::string& args)
{
    JSONRPCRequest request = MakeRequest(args);
    try {
        return tableRPC.execute(request);
    } catch (const UniValue& objError) {
        throw std::runtime_error(find_value(objError, "message").get_str());
    }
}

/** Error code of a failing call, 0 if it succeeds */
int CallRPCErrorCode(const std::string& args)
{
    JSONRPCRequest request = MakeRequest(args);
    try {
        tableRPC.execute(request);
    } catch (const UniValue& objError) {
        return find_value(objError, "code").get_int();
    }
    return 0;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(rpc_donation_tests, RPCTestingSetup)

BOOST_AUTO_TEST_CASE(rpc_convert_values)
{
    UniValue params = RPCConvertValues("createdonationrequest", {"00ff", "2500000", "7"});
    BOOST_REQUIRE_EQUAL(params.size(), 3U);
    BOOST_CHECK(params[0].isStr());
    BOOST_CHECK(params[1].isNum());
    BOOST_CHECK_EQUAL(params[1].get_int64(), 2500000);
    BOOST_CHECK(params[2].isNum());

    params = RPCConvertValues("recorddonation", {"0100"});
    BOOST_CHECK(params[0].isStr());

    BOOST_CHECK_THROW(RPCConvertValues("listdonations", {"ten"}), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(rpc_donation_flow)
{
    UniValue key = CallRPC("getnewdonorkey");
    const std::string strPrivKey = find_value(key, "privkey").get_str();
    const std::string strAddress = find_value(key, "address").get_str();

    UniValue info = CallRPC("getdonationinfo");
    BOOST_CHECK_EQUAL(find_value(info, "network").get_str(), "regtest");
    BOOST_CHECK_EQUAL(find_value(info, "reward_decimals").get_int(), 6);
    BOOST_CHECK_EQUAL(find_value(info, "conversion_rate").get_int64(), 1000000);
    BOOST_CHECK(!find_value(info, "mint_provisioned").get_bool());

    CDerivedAddress vault;
    BOOST_REQUIRE(GetVaultAddress(vault));
    BOOST_CHECK_EQUAL(find_value(find_value(info, "vault"), "address").get_str(), EncodeAddress(vault.address));

    UniValue funded = CallRPC("airdrop " + strAddress + " 10000000000");
    BOOST_CHECK_EQUAL(find_value(funded, "lamports").get_int64(), 10000000000LL);

    UniValue created = CallRPC("createdonationrequest " + strPrivKey + " 2500000 1");
    BOOST_CHECK_EQUAL(find_value(created, "donor").get_str(), strAddress);
    BOOST_CHECK_EQUAL(find_value(created, "vault").get_str(), EncodeAddress(vault.address));
    const std::string strHex = find_value(created, "hex").get_str();

    UniValue recorded = CallRPC("recorddonation " + strHex);
    BOOST_CHECK_EQUAL(find_value(recorded, "donor").get_str(), strAddress);
    BOOST_CHECK_EQUAL(find_value(recorded, "amount").get_int64(), 2500000);
    BOOST_CHECK_EQUAL(find_value(recorded, "tokens").get_int64(), 2);
    BOOST_CHECK_EQUAL(find_value(recorded, "request").get_str(), find_value(created, "request").get_str());

    // Same request again
    BOOST_CHECK_EQUAL(CallRPCErrorCode("recorddonation " + strHex), RPC_VERIFY_ALREADY_IN_CHAIN);

    UniValue reward = CallRPC("getrewardbalance " + strAddress);
    BOOST_CHECK(find_value(reward, "provisioned").get_bool());
    BOOST_CHECK_EQUAL(find_value(reward, "amount").get_int64(), 2);
    BOOST_CHECK_EQUAL(find_value(reward, "ui_amount").get_str(), "0.000002");

    UniValue list = CallRPC("listdonations 5");
    BOOST_REQUIRE_EQUAL(list.size(), 1U);
    BOOST_CHECK_EQUAL(find_value(list[0], "donor").get_str(), strAddress);

    UniValue progress = CallRPC("getcampaignprogress");
    BOOST_CHECK_EQUAL(find_value(progress, "raised").get_int64(), 2500000);
    BOOST_CHECK_EQUAL(find_value(progress, "donors").get_int64(), 1);
    BOOST_CHECK_EQUAL(find_value(progress, "donations").get_int64(), 1);

    info = CallRPC("getdonationinfo");
    BOOST_CHECK(find_value(info, "mint_provisioned").get_bool());
    BOOST_CHECK_EQUAL(find_value(info, "reward_supply").get_int64(), 2);
    BOOST_CHECK_EQUAL(find_value(info, "vault_balance").get_int64(), 2500000);

    UniValue vaultInfo = CallRPC("getaccountinfo " + EncodeAddress(vault.address));
    BOOST_CHECK_EQUAL(find_value(vaultInfo, "type").get_str(), "system");
    BOOST_CHECK_EQUAL(find_value(vaultInfo, "lamports").get_int64(), 2500000);

    UniValue mintInfo = CallRPC("getaccountinfo " + find_value(created, "mint").get_str());
    BOOST_CHECK_EQUAL(find_value(mintInfo, "type").get_str(), "mint");
    BOOST_CHECK_EQUAL(find_value(mintInfo, "decimals").get_int(), 6);
    BOOST_CHECK_EQUAL(find_value(mintInfo, "mint_authority").get_str(), find_value(created, "mint_authority").get_str());
    BOOST_CHECK_EQUAL(find_value(mintInfo, "freeze_authority").get_str(), find_value(created, "mint_authority").get_str());

    UniValue balanceInfo = CallRPC("getaccountinfo " + find_value(created, "token_account").get_str());
    BOOST_CHECK_EQUAL(find_value(balanceInfo, "type").get_str(), "token_account");
    BOOST_CHECK_EQUAL(find_value(balanceInfo, "token_owner").get_str(), strAddress);
}

BOOST_AUTO_TEST_CASE(rpc_rejections)
{
    UniValue key = CallRPC("getnewdonorkey");
    const std::string strPrivKey = find_value(key, "privkey").get_str();

    // Unfunded donor
    UniValue created = CallRPC("createdonationrequest " + strPrivKey + " 1000000");
    BOOST_CHECK_EQUAL(CallRPCErrorCode("recorddonation " + find_value(created, "hex").get_str()), RPC_VERIFY_REJECTED);

    BOOST_CHECK_EQUAL(CallRPCErrorCode("recorddonation 0011"), RPC_DESERIALIZATION_ERROR);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("createdonationrequest 00 1000000"), RPC_INVALID_ADDRESS_OR_KEY);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("createdonationrequest " + strPrivKey + " -5"), RPC_INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("listdonations -1"), RPC_INVALID_PARAMETER);

    // Unknown and malformed addresses
    const std::string strUnknown = EncodeAddress(MakeTestKey(77).GetPubKey().GetAddress());
    BOOST_CHECK_EQUAL(CallRPCErrorCode("getaccountinfo " + strUnknown), RPC_INVALID_ADDRESS_OR_KEY);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("getaccountinfo nothing"), RPC_INVALID_ADDRESS_OR_KEY);

    UniValue reward = CallRPC("getrewardbalance " + strUnknown);
    BOOST_CHECK(!find_value(reward, "provisioned").get_bool());
    BOOST_CHECK_EQUAL(find_value(reward, "amount").get_int64(), 0);

    BOOST_CHECK_EQUAL(CallRPCErrorCode("nosuchcommand"), RPC_METHOD_NOT_FOUND);

    ShutdownDonationDBs();
    BOOST_CHECK_EQUAL(CallRPCErrorCode("getdonationinfo"), RPC_IN_WARMUP);
    BOOST_CHECK_EQUAL(CallRPCErrorCode("getcampaignprogress"), RPC_IN_WARMUP);
}

BOOST_AUTO_TEST_CASE(rpc_help)
{
    const std::string strHelp = tableRPC.help("recorddonation");
    BOOST_CHECK(boost::starts_with(strHelp, "recorddonation \"hexrequest\""));

    const std::string strAll = tableRPC.help("");
    BOOST_CHECK(strAll.find("== Donation ==") != std::string::npos);
    BOOST_CHECK(strAll.find("getcampaignprogress") != std::string::npos);

    BOOST_CHECK(boost::starts_with(tableRPC.help("nosuchcommand"), "help: unknown command"));

    // Wrong parameter count reports the usage
    BOOST_CHECK_EQUAL(CallRPCErrorCode("recorddonation"), RPC_MISC_ERROR);
    BOOST_CHECK_THROW(CallRPC("getrewardbalance"), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
