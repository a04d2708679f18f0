// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_TEST_TEST_DONATION_H
#define DONATION_TEST_TEST_DONATION_H

#include "amount.h"
#include "chainparams.h"
#include "fs.h"
#include "key.h"
#include "uint256.h"
#include "util/system.h"

#include <string>

/** Basic testing setup.
 * This just configures logging, chain parameters and a temporary data directory.
 */
struct BasicTestingSetup {
    fs::path pathTemp;

    explicit BasicTestingSetup(const std::string& chainName = CBaseChainParams::REGTEST);
    ~BasicTestingSetup();
};

/** Testing setup with in-memory ledger and donation index databases,
 * and helpers to create funded donor keys.
 */
struct LedgerTestingSetup : public BasicTestingSetup {
    explicit LedgerTestingSetup(const std::string& chainName = CBaseChainParams::REGTEST);
    ~LedgerTestingSetup();

    /** Credit amount to key's address through a committed airdrop */
    void Fund(const CKey& key, CAmount amount);

    /** A new key holding amount lamports */
    CKey MakeFundedKey(CAmount amount);

    /** Committed balance of an address (0 if absent) */
    CAmount CommittedBalance(const uint256& address);

    /** Rent-exempt minimum for nSpace data bytes on the selected network */
    CAmount RentExemptMinimum(uint64_t nSpace);
};

class CInvocationSigners;

/** Admit key as a signer by signing a fixed test message */
bool AddTestKeySigner(const CKey& key, CInvocationSigners& signers);

/** Deterministic key from a small integer seed (for reproducible addresses) */
CKey MakeTestKey(unsigned char nSeed);

#endif // DONATION_TEST_TEST_DONATION_H
