// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_DONATION_ADDRESS_H
#define DONATION_DONATION_ADDRESS_H

#include "ledger/program_address.h"
#include "uint256.h"

#include <stdint.h>

#include <string>
#include <vector>

/**
 * A program address together with the recipe that proves it:
 * the seeds (without bump) and the bump found for them.
 */
struct CDerivedAddress {
    uint256 address;
    uint8_t nBump;
    std::vector<CSeed> vSeeds;

    CDerivedAddress() : nBump(0) {}

    std::string ToString() const;
};

/** Every address a donation touches besides the donor's own */
struct CDonationAccounts {
    CDerivedAddress vault;
    CDerivedAddress mint;
    CDerivedAddress mintAuthority;
    //! Associated balance of (donor, mint) under the associated-account program
    uint256 donorTokenAccount;
    uint8_t nDonorTokenBump;

    CDonationAccounts() : nDonorTokenBump(0) {}
};

/**
 * Derive the address of a fixed tag plus optional context under the donation
 * program of the selected network. Identical inputs always give the same
 * address and bump.
 *
 * @return false if the tag or a context seed is empty, or no bump yields a
 *         valid program address
 */
bool DeriveDonationAddress(const std::string& strTag, const std::vector<CSeed>& vContext, CDerivedAddress& derivedRet);

bool GetVaultAddress(CDerivedAddress& derivedRet);
bool GetRewardMintAddress(CDerivedAddress& derivedRet);
bool GetMintAuthorityAddress(CDerivedAddress& derivedRet);

/** Derive the singleton addresses and donor's reward balance address */
bool DeriveDonationAccounts(const uint256& donor, CDonationAccounts& accountsRet);

#endif // DONATION_DONATION_ADDRESS_H
