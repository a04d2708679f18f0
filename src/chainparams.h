// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_CHAINPARAMS_H
#define DONATION_CHAINPARAMS_H

#include "amount.h"
#include "uint256.h"

#include <memory>
#include <string>

namespace Consensus {

/** Ledger-wide constants shared by every program on a network */
struct LedgerParams {
    //! Owner of plain native-currency accounts
    uint256 systemProgramId;
    uint256 tokenProgramId;
    uint256 associatedTokenProgramId;
    //! Bytes charged on top of an account's data for rent purposes
    uint64_t nAccountStorageOverhead;
    CAmount nLamportsPerByteYear;
    uint64_t nExemptionThresholdYears;
};

/** Parameters of the deployed donation program */
struct DonationParams {
    uint256 programId;
    std::string strVaultTag;
    std::string strMintTag;
    std::string strMintAuthorityTag;
    uint8_t nRewardDecimals;
    //! Smallest native units per smallest reward-token unit
    CAmount nConversionRate;
    CAmount nCampaignGoal;
};

} // namespace Consensus

/**
 * CChainParams defines the program ids and protocol constants of a given
 * network (main, test, regtest).
 */
class CChainParams
{
public:
    const Consensus::LedgerParams& GetLedger() const { return ledger; }
    const Consensus::DonationParams& GetDonation() const { return donation; }

    /** Return the network string */
    std::string NetworkIDString() const { return strNetworkID; }
    /** Whether test funds may be credited with the airdrop command */
    bool AllowAirdrop() const { return fAllowAirdrop; }
    /** Default cache size of the ledger database (bytes) */
    size_t DefaultDbCache() const { return nDefaultDbCache; }

    void UpdateCampaignGoal(CAmount nGoal) { donation.nCampaignGoal = nGoal; }

protected:
    CChainParams() {}

    std::string strNetworkID;
    Consensus::LedgerParams ledger;
    Consensus::DonationParams donation;
    bool fAllowAirdrop;
    size_t nDefaultDbCache;
};

/**
 * Creates and returns a std::unique_ptr<CChainParams> of the chosen chain.
 * @returns a CChainParams* of the chosen chain.
 * @throws a std::runtime_error if the chain is not supported.
 */
std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CChainParams& Params();

/**
 * Sets the params returned by Params() to those for the given network.
 */
void SelectParams(const std::string& chain);

/**
 * Allows modifying the campaign goal (-campaigngoal).
 */
void UpdateCampaignGoal(CAmount nGoal);

#endif // DONATION_CHAINPARAMS_H
