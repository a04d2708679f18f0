// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_LEDGER_SYSTEM_LEDGER_H
#define DONATION_LEDGER_SYSTEM_LEDGER_H

#include "amount.h"
#include "uint256.h"

#include <stdint.h>

class CInvocationSigners;
class CLedgerViewCache;
class CValidationState;

namespace Consensus {
struct LedgerParams;
}

/**
 * Balance needed for an account holding nSpace data bytes to be exempt from rent
 *
 * @return false if the minimum does not fit in a CAmount
 */
bool GetMinimumBalanceForRentExemption(uint64_t nSpace, const Consensus::LedgerParams& params, CAmount& nRentRet);

/**
 * Move native currency between system-owned accounts.
 *
 * from must be a signer, system-owned and hold at least amount. to is
 * created as a plain balance when absent and must be system-owned when
 * present. amount == 0 succeeds without touching either account.
 */
bool SystemTransfer(CLedgerViewCache& view, const CInvocationSigners& signers,
                    const uint256& from, const uint256& to, CAmount amount,
                    CValidationState& state);

/**
 * Create an account of nSpace zeroed data bytes owned by owner, funded by
 * payer to the rent-exempt minimum.
 *
 * Both payer and address must be signers. A pre-funded plain balance at
 * address is topped up and adopted; any other existing account is rejected
 * with REJECT_PROVISIONING_CONFLICT "ledger-create-account-in-use" before the
 * payer is debited.
 */
bool SystemCreateAccount(CLedgerViewCache& view, const CInvocationSigners& signers,
                         const uint256& payer, const uint256& address,
                         uint64_t nSpace, const uint256& owner,
                         CValidationState& state);

/** Credit test funds (networks that allow airdrops only) */
bool SystemAirdrop(CLedgerViewCache& view, const uint256& to, CAmount amount, CValidationState& state);

/** Native balance of address, 0 when the account does not exist */
CAmount GetBalance(const CLedgerViewCache& view, const uint256& address);

#endif // DONATION_LEDGER_SYSTEM_LEDGER_H
