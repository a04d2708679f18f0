// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Donation Test Suite

#include "test/test_donation.h"

#include "chainparams.h"
#include "consensus/validation.h"
#include "donation/donation_events.h"
#include "donation/donation_validation.h"
#include "hash.h"
#include "ledger/signers.h"
#include "ledger/account.h"
#include "ledger/system_ledger.h"
#include "logging.h"
#include "util/system.h"
#include "utiltime.h"

#include <stdexcept>
#include <vector>

#include <boost/test/unit_test.hpp>

BasicTestingSetup::BasicTestingSetup(const std::string& chainName)
{
    pathTemp = fs::temp_directory_path() / fs::unique_path("test_donation_%%%%-%%%%-%%%%");
    fs::create_directories(pathTemp);

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-datadir", pathTemp.string());
    if (chainName == CBaseChainParams::REGTEST)
        gArgs.ForceSetArg("-regtest", "1");
    else if (chainName == CBaseChainParams::TESTNET)
        gArgs.ForceSetArg("-testnet", "1");
    ClearDatadirCache();
    SelectParams(chainName);

    BCLog::Logger& logger = LogInstance();
    logger.m_print_to_console = false;
    logger.m_print_to_file = false;
    logger.EnableCategory(BCLog::ALL);
}

BasicTestingSetup::~BasicTestingSetup()
{
    UnregisterAllDonationInterfaces();
    LogInstance().CloseDebugLog();
    LogInstance().m_print_to_file = false;
    SetMockTime(0);
    ClearDatadirCache();
    gArgs.ClearArgs();
    boost::system::error_code ec;
    fs::remove_all(pathTemp, ec);
}

LedgerTestingSetup::LedgerTestingSetup(const std::string& chainName) : BasicTestingSetup(chainName)
{
    if (!InitLedgerDB(1 << 20, true, true))
        throw std::runtime_error("LedgerTestingSetup: InitLedgerDB failed");
    if (!InitDonationIndexDB(1 << 20, true, true))
        throw std::runtime_error("LedgerTestingSetup: InitDonationIndexDB failed");
}

LedgerTestingSetup::~LedgerTestingSetup()
{
    ShutdownDonationDBs();
}

void LedgerTestingSetup::Fund(const CKey& key, CAmount amount)
{
    CValidationState state;
    if (!ProcessAirdrop(key.GetPubKey().GetAddress(), amount, state))
        throw std::runtime_error("LedgerTestingSetup: airdrop failed: " + FormatStateMessage(state));
}

CKey LedgerTestingSetup::MakeFundedKey(CAmount amount)
{
    CKey key;
    key.MakeNewKey();
    Fund(key, amount);
    return key;
}

CAmount LedgerTestingSetup::CommittedBalance(const uint256& address)
{
    CAccount account;
    if (!ReadLedgerAccount(address, account))
        return 0;
    return account.nLamports;
}

CAmount LedgerTestingSetup::RentExemptMinimum(uint64_t nSpace)
{
    CAmount nRent = 0;
    BOOST_REQUIRE(GetMinimumBalanceForRentExemption(nSpace, Params().GetLedger(), nRent));
    return nRent;
}

CKey MakeTestKey(unsigned char nSeed)
{
    std::vector<unsigned char> vch(CKey::KEY_SIZE, 0);
    vch[CKey::KEY_SIZE - 1] = nSeed;
    vch[0] = 0x01;
    CKey key;
    key.Set(vch.begin(), vch.end());
    return key;
}

bool AddTestKeySigner(const CKey& key, CInvocationSigners& signers)
{
    static const std::string strMessage = "test invocation";
    const uint256 hash = Hash(strMessage.begin(), strMessage.end());
    std::vector<unsigned char> vchSig;
    if (!key.Sign(hash, vchSig))
        return false;
    return signers.AddKeySigner(key.GetPubKey(), hash, vchSig);
}
