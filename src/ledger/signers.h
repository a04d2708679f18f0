// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_LEDGER_SIGNERS_H
#define DONATION_LEDGER_SIGNERS_H

#include "ledger/program_address.h"
#include "pubkey.h"
#include "uint256.h"

#include <set>
#include <vector>

/**
 * CInvocationSigners - the authorities proven for one invocation
 *
 * Addresses enter the set only through proof: a key holder by an ECDSA
 * signature over the request hash, a program-derived address by re-deriving
 * it from (seeds, bump) against the id of the program that invokes.
 */
class CInvocationSigners
{
private:
    std::set<uint256> setSigners;

public:
    CInvocationSigners() {}

    /** Verify vchSig over hash with pubkey and, on success, add the key's address */
    bool AddKeySigner(const CPubKey& pubkey, const uint256& hash, const std::vector<unsigned char>& vchSig);

    /**
     * Re-derive CreateProgramAddress(vSeeds || [nBump], programId) and add it.
     * @return false if the recipe does not yield a valid program address
     */
    bool AddDerivedSigner(const std::vector<CSeed>& vSeeds, uint8_t nBump, const uint256& programId, uint256* pAddressRet = nullptr);

    bool IsSigner(const uint256& address) const { return setSigners.count(address) != 0; }
    size_t size() const { return setSigners.size(); }
};

#endif // DONATION_LEDGER_SIGNERS_H
