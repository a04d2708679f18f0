// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "pubkey.h"

#include "key.h"

#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>

uint256 CPubKey::GetAddress() const
{
    if (!IsValid()) {
        return uint256();
    }
    return uint256(std::vector<unsigned char>(vch + 1, vch + COMPRESSED_SIZE));
}

bool CPubKey::IsFullyValid() const
{
    if (!IsValid())
        return false;
    const EC_GROUP* group = ECC_Secp256k1Group();
    EC_POINT* point = EC_POINT_new(group);
    if (!point)
        return false;
    bool fValid = EC_POINT_oct2point(group, point, vch, COMPRESSED_SIZE, nullptr) == 1;
    EC_POINT_free(point);
    if (!fValid)
        ERR_clear_error();
    return fValid;
}

bool CPubKey::Verify(const uint256& hash, const std::vector<unsigned char>& vchSig) const
{
    if (!IsValid() || vchSig.empty())
        return false;

    const EC_GROUP* group = ECC_Secp256k1Group();
    EC_KEY* pkey = EC_KEY_new_by_curve_name(NID_secp256k1);
    EC_POINT* point = EC_POINT_new(group);
    bool fOk = false;
    if (pkey && point &&
        EC_POINT_oct2point(group, point, vch, COMPRESSED_SIZE, nullptr) == 1 &&
        EC_KEY_set_public_key(pkey, point) == 1) {
        fOk = ECDSA_verify(0, hash.begin(), hash.size(), vchSig.data(), (int)vchSig.size(), pkey) == 1;
    }
    EC_POINT_free(point);
    EC_KEY_free(pkey);
    if (!fOk)
        ERR_clear_error();
    return fOk;
}

bool CPubKey::IsOnCurve(const uint256& x)
{
    unsigned char buf[COMPRESSED_SIZE];
    buf[0] = 0x02;
    memcpy(buf + 1, x.begin(), x.size());

    const EC_GROUP* group = ECC_Secp256k1Group();
    EC_POINT* point = EC_POINT_new(group);
    if (!point)
        throw std::runtime_error("CPubKey::IsOnCurve: EC_POINT_new failed");
    bool fOnCurve = EC_POINT_oct2point(group, point, buf, COMPRESSED_SIZE, nullptr) == 1;
    EC_POINT_free(point);
    if (!fOnCurve)
        ERR_clear_error();
    return fOnCurve;
}
