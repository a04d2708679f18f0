// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"

#include "logging.h"
#include "util/system.h"

#include <assert.h>

static Consensus::LedgerParams DefaultLedgerParams()
{
    Consensus::LedgerParams ledger;
    ledger.systemProgramId.SetNull();
    ledger.tokenProgramId = uint256S("a1da193d3ce38473a4162a67e92021fb02f5a4130c9489c75d4c49c463795526");
    ledger.associatedTokenProgramId = uint256S("a3ca29d7d9557516b64d1dacdce5d053fb59dac13d0e66195ddcd67dc0ea1654");
    ledger.nAccountStorageOverhead = 128;
    ledger.nLamportsPerByteYear = 3480;
    ledger.nExemptionThresholdYears = 2;
    return ledger;
}

static Consensus::DonationParams DefaultDonationParams(const uint256& programId)
{
    Consensus::DonationParams donation;
    donation.programId = programId;
    donation.strVaultTag = "donation_vault";
    donation.strMintTag = "spacex_token_mint";
    donation.strMintAuthorityTag = "mint_authority";
    donation.nRewardDecimals = 6;
    donation.nConversionRate = 1000000;
    donation.nCampaignGoal = 1000 * COIN;
    return donation;
}

/**
 * Main network
 */
class CMainParams : public CChainParams
{
public:
    CMainParams()
    {
        strNetworkID = "main";
        ledger = DefaultLedgerParams();
        donation = DefaultDonationParams(uint256S("3f04fcc8688e308a4506c5a78ef4196f6bee579430339a032afc2875e2087725"));
        fAllowAirdrop = false;
        nDefaultDbCache = 64 << 20;
    }
};

/**
 * Testnet
 */
class CTestNetParams : public CChainParams
{
public:
    CTestNetParams()
    {
        strNetworkID = "test";
        ledger = DefaultLedgerParams();
        donation = DefaultDonationParams(uint256S("ad9f4eaf583782bc2056a0f274fa0ca614f58e183824f173143713f645a5345b"));
        fAllowAirdrop = true;
        nDefaultDbCache = 16 << 20;
    }
};

/**
 * Regression test
 */
class CRegTestParams : public CChainParams
{
public:
    CRegTestParams()
    {
        strNetworkID = "regtest";
        ledger = DefaultLedgerParams();
        donation = DefaultDonationParams(uint256S("d8d05213569a8a17548e99738cd9871aef123f72e8211770e7b0d7f7c2e6156e"));
        fAllowAirdrop = true;
        nDefaultDbCache = 4 << 20;
    }
};

static std::unique_ptr<CChainParams> globalChainParams;

const CChainParams& Params()
{
    assert(globalChainParams);
    return *globalChainParams;
}

std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain)
{
    if (chain == CBaseChainParams::MAIN)
        return std::unique_ptr<CChainParams>(new CMainParams());
    else if (chain == CBaseChainParams::TESTNET)
        return std::unique_ptr<CChainParams>(new CTestNetParams());
    else if (chain == CBaseChainParams::REGTEST)
        return std::unique_ptr<CChainParams>(new CRegTestParams());
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}

void SelectParams(const std::string& network)
{
    globalChainParams = CreateChainParams(network);
}

void UpdateCampaignGoal(CAmount nGoal)
{
    assert(globalChainParams);
    globalChainParams->UpdateCampaignGoal(nGoal);
}
