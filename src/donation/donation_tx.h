// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_DONATION_TX_H
#define DONATION_DONATION_TX_H

#include "amount.h"
#include "pubkey.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>

#include <string>
#include <vector>

struct CDonationAccounts;
class CKey;
class CValidationState;

/**
 * CDonationRequest - a contributor's signed record_donation(amount)
 *
 * Carries the addresses the caller computed for the request. They are not
 * trusted: CheckDonationRequest re-derives each one and rejects a mismatch.
 *
 * Wire format (SER_NETWORK):
 * - nVersion (uint16), donor (compact size + 33 bytes), nAmount (uint64),
 *   nNonce (uint64), vault, mint, donorTokenAccount, mintAuthority (32 bytes each),
 *   vchSig (compact size + DER)
 */
class CDonationRequest
{
public:
    static constexpr uint16_t CURRENT_VERSION = 1;

    uint16_t nVersion;
    CPubKey donor;
    CAmount nAmount;
    //! Distinguishes otherwise identical requests of one donor
    uint64_t nNonce;
    uint256 vault;
    uint256 mint;
    uint256 donorTokenAccount;
    uint256 mintAuthority;
    std::vector<unsigned char> vchSig;

    CDonationRequest()
    {
        SetNull();
    }

    void SetNull()
    {
        nVersion = CURRENT_VERSION;
        donor = CPubKey();
        nAmount = 0;
        nNonce = 0;
        vault.SetNull();
        mint.SetNull();
        donorTokenAccount.SetNull();
        mintAuthority.SetNull();
        vchSig.clear();
    }

    SERIALIZE_METHODS(CDonationRequest, obj)
    {
        READWRITE(obj.nVersion, obj.donor, obj.nAmount, obj.nNonce);
        READWRITE(obj.vault, obj.mint, obj.donorTokenAccount, obj.mintAuthority);
        if (!(s.GetType() & SER_GETHASH)) {
            READWRITE(obj.vchSig);
        }
    }

    /**
     * Hash of everything but the signature. It is both the signed message
     * and the request id, so a re-encoded signature cannot replay a request.
     */
    uint256 GetHash() const;

    std::string ToString() const;
};

/**
 * Stateless checks: version, donor key, signature presence and every
 * supplied address against its derivation.
 *
 * @param[out] accountsRet The derived accounts, valid when true is returned
 */
bool CheckDonationRequest(const CDonationRequest& request, CDonationAccounts& accountsRet, CValidationState& state);

/** Sign request.GetHash() with key; key must match request.donor */
bool SignDonationRequest(const CKey& key, CDonationRequest& request);

/** Build and sign a request for key with freshly derived addresses */
bool CreateDonationRequest(const CKey& key, CAmount nAmount, uint64_t nNonce, CDonationRequest& requestRet);

std::string EncodeHexDonationRequest(const CDonationRequest& request);
bool DecodeHexDonationRequest(const std::string& strHex, CDonationRequest& requestRet);

#endif // DONATION_DONATION_TX_H
