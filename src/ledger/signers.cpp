// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/signers.h"

#include "base58.h"
#include "logging.h"

bool CInvocationSigners::AddKeySigner(const CPubKey& pubkey, const uint256& hash, const std::vector<unsigned char>& vchSig)
{
    if (!pubkey.IsFullyValid())
        return false;
    if (!pubkey.Verify(hash, vchSig)) {
        LogPrint(BCLog::LEDGER, "%s: bad signature for %s\n", __func__, EncodeAddress(pubkey.GetAddress()));
        return false;
    }
    setSigners.insert(pubkey.GetAddress());
    return true;
}

bool CInvocationSigners::AddDerivedSigner(const std::vector<CSeed>& vSeeds, uint8_t nBump, const uint256& programId, uint256* pAddressRet)
{
    std::vector<CSeed> vSeedsWithBump(vSeeds);
    vSeedsWithBump.emplace_back(1, nBump);

    uint256 address;
    if (!CreateProgramAddress(vSeedsWithBump, programId, address)) {
        LogPrint(BCLog::LEDGER, "%s: seeds with bump %d do not derive a program address\n", __func__, nBump);
        return false;
    }
    setSigners.insert(address);
    if (pAddressRet)
        *pAddressRet = address;
    return true;
}
