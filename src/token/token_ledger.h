// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_TOKEN_TOKEN_LEDGER_H
#define DONATION_TOKEN_TOKEN_LEDGER_H

#include "amount.h"
#include "optional.h"
#include "token/token_state.h"
#include "uint256.h"

#include <stdint.h>

class CInvocationSigners;
class CLedgerView;
class CLedgerViewCache;
class CValidationState;

/** Read an account owned by the token program as a mint (may be uninitialized) */
bool GetMint(const CLedgerView& view, const uint256& address, CMint& mint);

/** Read an account owned by the token program as a token balance (may be uninitialized) */
bool GetTokenAccount(const CLedgerView& view, const uint256& address, CTokenAccount& tokenAccount);

/** Initialize a MINT_SIZE account owned by the token program. Fails on an initialized mint. */
bool TokenInitializeMint(CLedgerViewCache& view, const uint256& mintAddress,
                         uint8_t nDecimals, const uint256& mintAuthority,
                         const Optional<uint256>& freezeAuthority,
                         CValidationState& state);

/** Initialize an ACCOUNT_SIZE account owned by the token program as owner's balance of mint */
bool TokenInitializeAccount(CLedgerViewCache& view, const uint256& accountAddress,
                            const uint256& mint, const uint256& owner,
                            CValidationState& state);

/**
 * create_mint(decimals, authority, freeze_authority): allocate the mint
 * account (payer funds rent, mintAddress must be a signer) and initialize it.
 */
bool TokenCreateMint(CLedgerViewCache& view, const CInvocationSigners& signers,
                     const uint256& payer, const uint256& mintAddress,
                     uint8_t nDecimals, const uint256& mintAuthority,
                     const Optional<uint256>& freezeAuthority,
                     CValidationState& state);

/**
 * mint_to(mint, destination, amount, authority_proof)
 *
 * authority must be the mint's configured mint authority and a member of
 * signers. destination must be an initialized balance of the same mint.
 * Supply and balance are overflow-checked; amount == 0 is accepted.
 */
bool TokenMintTo(CLedgerViewCache& view, const CInvocationSigners& signers,
                 const uint256& mintAddress, const uint256& destination,
                 const uint256& authority, CAmount amount,
                 CValidationState& state);

/**
 * Address of owner's associated balance of mint: the program address of
 * seeds (owner, token program id, mint) under the associated-account program.
 */
bool GetAssociatedTokenAddress(const uint256& owner, const uint256& mint, uint256& addressRet, uint8_t& nBumpRet);

/**
 * create_balance_account(owner, mint): create and initialize owner's
 * associated balance of mint with amount 0, rent paid by payer. The
 * associated-account program signs for the new address by derivation.
 */
bool CreateAssociatedTokenAccount(CLedgerViewCache& view, const CInvocationSigners& signers,
                                  const uint256& payer, const uint256& owner, const uint256& mint,
                                  CValidationState& state);

#endif // DONATION_TOKEN_TOKEN_LEDGER_H
