// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "donation/donation_tx.h"

#include "base58.h"
#include "consensus/validation.h"
#include "donation/donation_address.h"
#include "hash.h"
#include "key.h"
#include "logging.h"
#include "streams.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"
#include "version.h"

uint256 CDonationRequest::GetHash() const
{
    return SerializeHash(*this);
}

std::string CDonationRequest::ToString() const
{
    return strprintf("CDonationRequest(ver=%d, donor=%s, amount=%s, nonce=%u, vault=%s, mint=%s, tokenAccount=%s, authority=%s, sig=%u bytes)",
                     nVersion,
                     donor.IsValid() ? EncodeAddress(donor.GetAddress()) : "invalid",
                     FormatMoney(nAmount),
                     nNonce,
                     EncodeAddress(vault),
                     EncodeAddress(mint),
                     EncodeAddress(donorTokenAccount),
                     EncodeAddress(mintAuthority),
                     vchSig.size());
}

bool CheckDonationRequest(const CDonationRequest& request, CDonationAccounts& accountsRet, CValidationState& state)
{
    // 1. Version
    if (request.nVersion != CDonationRequest::CURRENT_VERSION) {
        return state.Invalid(false, REJECT_INVALID, "donation-bad-version",
                             strprintf("version %d", request.nVersion));
    }

    // 2. Donor key
    if (!request.donor.IsFullyValid()) {
        return state.Invalid(false, REJECT_INVALID, "donation-bad-donor-key");
    }

    // 3. Signature present (verified when the signer set is built)
    if (request.vchSig.empty()) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "donation-missing-signature");
    }

    // 4. Supplied addresses against their derivation
    const uint256 donorAddress = request.donor.GetAddress();
    CDonationAccounts accounts;
    if (!DeriveDonationAccounts(donorAddress, accounts)) {
        return state.Error("donation-derivation-failed");
    }
    if (request.vault != accounts.vault.address) {
        return state.Invalid(false, REJECT_INVALID, "donation-bad-vault-address",
                             strprintf("expected %s", EncodeAddress(accounts.vault.address)));
    }
    if (request.mint != accounts.mint.address) {
        return state.Invalid(false, REJECT_INVALID, "donation-bad-mint-address",
                             strprintf("expected %s", EncodeAddress(accounts.mint.address)));
    }
    if (request.donorTokenAccount != accounts.donorTokenAccount) {
        return state.Invalid(false, REJECT_INVALID, "donation-bad-token-account-address",
                             strprintf("expected %s", EncodeAddress(accounts.donorTokenAccount)));
    }
    if (request.mintAuthority != accounts.mintAuthority.address) {
        return state.Invalid(false, REJECT_INVALID, "donation-bad-mint-authority-address",
                             strprintf("expected %s", EncodeAddress(accounts.mintAuthority.address)));
    }

    accountsRet = accounts;
    return true;
}

bool SignDonationRequest(const CKey& key, CDonationRequest& request)
{
    if (key.GetPubKey() != request.donor) {
        return error("%s: key does not match donor %s", __func__, request.ToString());
    }
    return key.Sign(request.GetHash(), request.vchSig);
}

bool CreateDonationRequest(const CKey& key, CAmount nAmount, uint64_t nNonce, CDonationRequest& requestRet)
{
    if (!key.IsValid())
        return error("%s: invalid key", __func__);

    CDonationRequest request;
    request.donor = key.GetPubKey();
    request.nAmount = nAmount;
    request.nNonce = nNonce;

    CDonationAccounts accounts;
    if (!DeriveDonationAccounts(request.donor.GetAddress(), accounts))
        return false;
    request.vault = accounts.vault.address;
    request.mint = accounts.mint.address;
    request.donorTokenAccount = accounts.donorTokenAccount;
    request.mintAuthority = accounts.mintAuthority.address;

    if (!SignDonationRequest(key, request))
        return false;
    requestRet = request;
    return true;
}

std::string EncodeHexDonationRequest(const CDonationRequest& request)
{
    CDataStream ss(SER_NETWORK, PROTOCOL_VERSION);
    ss << request;
    return HexStr(ss.begin(), ss.end());
}

bool DecodeHexDonationRequest(const std::string& strHex, CDonationRequest& requestRet)
{
    if (!IsHex(strHex))
        return false;

    CDataStream ss(ParseHex(strHex), SER_NETWORK, PROTOCOL_VERSION);
    try {
        ss >> requestRet;
        if (!ss.empty())
            return false;
    } catch (const std::exception& e) {
        LogPrint(BCLog::DONATION, "ERROR: DecodeHexDonationRequest: %s\n", e.what());
        return false;
    }
    return true;
}
