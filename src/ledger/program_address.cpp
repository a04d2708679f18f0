// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/program_address.h"

#include "hash.h"
#include "pubkey.h"

static const char PDA_MARKER[] = "ProgramDerivedAddress";

CSeed SeedFromString(const std::string& str)
{
    return CSeed(str.begin(), str.end());
}

CSeed SeedFromAddress(const uint256& address)
{
    return CSeed(address.begin(), address.end());
}

bool CreateProgramAddress(const std::vector<CSeed>& vSeeds, const uint256& programId, uint256& addressRet)
{
    if (vSeeds.size() > MAX_SEEDS)
        return false;

    // Seed count and each seed length are hashed ahead of the seed bytes
    CSHA256 hasher;
    const unsigned char nSeeds = (unsigned char)vSeeds.size();
    hasher.Write(&nSeeds, 1);
    for (const CSeed& seed : vSeeds) {
        if (seed.size() > MAX_SEED_LEN)
            return false;
        const unsigned char nLen = (unsigned char)seed.size();
        hasher.Write(&nLen, 1);
        if (!seed.empty())
            hasher.Write(seed.data(), seed.size());
    }
    hasher.Write(programId.begin(), programId.size());
    hasher.Write((const unsigned char*)PDA_MARKER, sizeof(PDA_MARKER) - 1);

    uint256 hash;
    hasher.Finalize(hash.begin());

    if (CPubKey::IsOnCurve(hash))
        return false;

    addressRet = hash;
    return true;
}

bool FindProgramAddress(const std::vector<CSeed>& vSeeds, const uint256& programId, uint256& addressRet, uint8_t& nBumpRet)
{
    // One slot is reserved for the bump seed
    if (vSeeds.size() >= MAX_SEEDS)
        return false;
    for (const CSeed& seed : vSeeds) {
        if (seed.size() > MAX_SEED_LEN)
            return false;
    }

    std::vector<CSeed> vSeedsWithBump(vSeeds);
    vSeedsWithBump.emplace_back(1, 0);
    for (int nBump = 255; nBump >= 0; nBump--) {
        vSeedsWithBump.back()[0] = (unsigned char)nBump;
        if (CreateProgramAddress(vSeedsWithBump, programId, addressRet)) {
            nBumpRet = (uint8_t)nBump;
            return true;
        }
    }
    return false;
}
