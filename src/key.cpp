// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "key.h"

#include "hash.h"

#include <memory>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>

namespace {

struct ECGroupDeleter {
    void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};

struct BNDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};

struct ECPointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_free(point); }
};

struct ECKeyDeleter {
    void operator()(EC_KEY* key) const { EC_KEY_free(key); }
};

} // namespace

const EC_GROUP* ECC_Secp256k1Group()
{
    static std::unique_ptr<EC_GROUP, ECGroupDeleter> group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!group) {
        throw std::runtime_error("ECC_Secp256k1Group: secp256k1 not available in libcrypto");
    }
    return group.get();
}

bool CKey::Check(const unsigned char* vch)
{
    // 0 < secret < curve order
    std::unique_ptr<BIGNUM, BNDeleter> bnSecret(BN_bin2bn(vch, KEY_SIZE, nullptr));
    if (!bnSecret || BN_is_zero(bnSecret.get()))
        return false;
    const BIGNUM* order = EC_GROUP_get0_order(ECC_Secp256k1Group());
    return BN_cmp(bnSecret.get(), order) < 0;
}

void CKey::MakeNewKey()
{
    do {
        if (RAND_bytes(keydata.data(), keydata.size()) != 1) {
            throw std::runtime_error("CKey::MakeNewKey: RAND_bytes failed");
        }
    } while (!Check(keydata.data()));
    fValid = true;
}

CPubKey CKey::GetPubKey() const
{
    CPubKey result;
    if (!fValid)
        return result;

    const EC_GROUP* group = ECC_Secp256k1Group();
    std::unique_ptr<BIGNUM, BNDeleter> bnSecret(BN_bin2bn(keydata.data(), keydata.size(), nullptr));
    std::unique_ptr<EC_POINT, ECPointDeleter> point(EC_POINT_new(group));
    if (!bnSecret || !point ||
        EC_POINT_mul(group, point.get(), bnSecret.get(), nullptr, nullptr, nullptr) != 1) {
        ERR_clear_error();
        return result;
    }

    unsigned char buf[CPubKey::COMPRESSED_SIZE];
    size_t nLen = EC_POINT_point2oct(group, point.get(), POINT_CONVERSION_COMPRESSED, buf, sizeof(buf), nullptr);
    if (nLen != CPubKey::COMPRESSED_SIZE) {
        ERR_clear_error();
        return result;
    }
    result.Set(buf, buf + nLen);
    return result;
}

bool CKey::Sign(const uint256& hash, std::vector<unsigned char>& vchSig) const
{
    if (!fValid)
        return false;

    const EC_GROUP* group = ECC_Secp256k1Group();
    std::unique_ptr<EC_KEY, ECKeyDeleter> pkey(EC_KEY_new_by_curve_name(NID_secp256k1));
    std::unique_ptr<BIGNUM, BNDeleter> bnSecret(BN_bin2bn(keydata.data(), keydata.size(), nullptr));
    std::unique_ptr<EC_POINT, ECPointDeleter> point(EC_POINT_new(group));
    if (!pkey || !bnSecret || !point ||
        EC_KEY_set_private_key(pkey.get(), bnSecret.get()) != 1 ||
        EC_POINT_mul(group, point.get(), bnSecret.get(), nullptr, nullptr, nullptr) != 1 ||
        EC_KEY_set_public_key(pkey.get(), point.get()) != 1) {
        ERR_clear_error();
        return false;
    }

    unsigned int nSize = ECDSA_size(pkey.get());
    vchSig.resize(nSize);
    if (ECDSA_sign(0, hash.begin(), hash.size(), vchSig.data(), &nSize, pkey.get()) != 1) {
        ERR_clear_error();
        vchSig.clear();
        return false;
    }
    vchSig.resize(nSize);
    return true;
}

bool CKey::VerifyPubKey(const CPubKey& pubkey) const
{
    unsigned char rnd[8];
    std::string str = "Donation key verification\n";
    if (RAND_bytes(rnd, sizeof(rnd)) != 1)
        return false;
    uint256 hash;
    CHashWriter ss(SER_GETHASH, 0);
    ss << str;
    ss.write((const char*)rnd, sizeof(rnd));
    hash = ss.GetHash();
    std::vector<unsigned char> vchSig;
    if (!Sign(hash, vchSig))
        return false;
    return pubkey.Verify(hash, vchSig);
}
