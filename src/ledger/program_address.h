// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_LEDGER_PROGRAM_ADDRESS_H
#define DONATION_LEDGER_PROGRAM_ADDRESS_H

#include "uint256.h"

#include <stdint.h>

#include <string>
#include <vector>

typedef std::vector<unsigned char> CSeed;

static const size_t MAX_SEEDS = 16;
static const size_t MAX_SEED_LEN = 32;

/** Seed holding the bytes of a fixed tag */
CSeed SeedFromString(const std::string& str);

/** Seed holding the 32 raw bytes of an address */
CSeed SeedFromAddress(const uint256& address);

/**
 * Program-derived address
 *
 * address = SHA256(n || len_0 || seed_0 || ... || len_n || seed_n || programId || "ProgramDerivedAddress")
 *
 * with the seed count and each seed length as one byte.
 *
 * The result is only valid when it is NOT the x-coordinate of a secp256k1
 * point, so no private key can sign for it. Only the program can, by
 * presenting the seeds back to the ledger.
 *
 * @return false if the seeds are malformed or the hash lands on the curve
 */
bool CreateProgramAddress(const std::vector<CSeed>& vSeeds, const uint256& programId, uint256& addressRet);

/**
 * Search bump seeds 255 down to 0 for the first valid program address of
 * (vSeeds || [bump], programId). Deterministic for identical inputs.
 *
 * @return false if the seeds are malformed or no bump yields a valid address
 */
bool FindProgramAddress(const std::vector<CSeed>& vSeeds, const uint256& programId, uint256& addressRet, uint8_t& nBumpRet);

#endif // DONATION_LEDGER_PROGRAM_ADDRESS_H
