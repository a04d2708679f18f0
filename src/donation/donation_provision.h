// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_DONATION_PROVISION_H
#define DONATION_DONATION_PROVISION_H

#include "uint256.h"

class CInvocationSigners;
class CLedgerView;
class CLedgerViewCache;
class CValidationState;
struct CDonationAccounts;

/**
 * Whether the reward mint exists: an initialized mint whose mint authority
 * field is populated. Says nothing about whether its metadata is right.
 */
bool IsRewardMintProvisioned(const CLedgerView& view, const CDonationAccounts& accounts);

/** Whether the donor's balance account exists with owner == donor */
bool IsContributorBalanceProvisioned(const CLedgerView& view, const CDonationAccounts& accounts, const uint256& donor);

/**
 * Create the reward mint (decimals, authority = mint authority address) at
 * its derived address, paid by payer. If the ledger reports the address as
 * already in use, the existing mint is re-read: matching metadata counts as
 * success, anything else fails with REJECT_PROVISIONING_CONFLICT
 * "donation-mint-metadata-mismatch".
 */
bool CreateRewardMintOrAdopt(CLedgerViewCache& view, const CInvocationSigners& signers,
                             const uint256& payer, const CDonationAccounts& accounts,
                             CValidationState& state);

/** Same for the donor's balance account; metadata is (owner, mint) */
bool CreateContributorBalanceOrAdopt(CLedgerViewCache& view, const CInvocationSigners& signers,
                                     const uint256& donor, const CDonationAccounts& accounts,
                                     CValidationState& state);

/**
 * MintProvisioner: make sure the reward mint and the donor's balance exist,
 * creating each only when absent. Existing ones have their metadata checked.
 */
bool ProvisionDonationAccounts(CLedgerViewCache& view, const CInvocationSigners& signers,
                               const uint256& donor, const CDonationAccounts& accounts,
                               CValidationState& state);

#endif // DONATION_DONATION_PROVISION_H
