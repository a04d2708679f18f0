// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_DONATION_REWARD_H
#define DONATION_DONATION_REWARD_H

#include "amount.h"
#include "uint256.h"

class CInvocationSigners;
class CLedgerViewCache;
class CValidationState;
struct CDonationAccounts;

/**
 * reward = amount / nConversionRate, floor division.
 * Fails with REJECT_OVERFLOW on a zero rate.
 */
bool CalculateReward(CAmount amount, CAmount nConversionRate, CAmount& nRewardRet, CValidationState& state);

/**
 * RewardMinter: mint CalculateReward(amount) to the donor's balance.
 *
 * The mint authority proves itself by re-deriving from the seeds and bump in
 * accounts, so a wrong bump fails the mint as unauthorized. A zero reward
 * still runs the mint instruction.
 */
bool MintDonationReward(CLedgerViewCache& view, const CInvocationSigners& signers,
                        const CDonationAccounts& accounts, CAmount amount,
                        CAmount& nMintedRet, CValidationState& state);

#endif // DONATION_DONATION_REWARD_H
