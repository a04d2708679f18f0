// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_KEY_H
#define DONATION_KEY_H

#include "pubkey.h"
#include "uint256.h"

#include <stdexcept>
#include <string>
#include <vector>

struct ec_group_st;

/** Shared secp256k1 group parameters (process lifetime) */
const ec_group_st* ECC_Secp256k1Group();

/** An encapsulated secp256k1 private key. */
class CKey
{
public:
    static const unsigned int KEY_SIZE = 32;

private:
    //! Whether this private key is valid. We check for correctness when modifying the key
    //! data, so fValid should always correspond to the actual state.
    bool fValid;

    //! The actual byte data
    std::vector<unsigned char> keydata;

    //! Check whether the 32-byte array pointed to by vch is valid keydata.
    static bool Check(const unsigned char* vch);

public:
    CKey() : fValid(false)
    {
        keydata.resize(KEY_SIZE);
    }

    friend bool operator==(const CKey& a, const CKey& b)
    {
        return a.size() == b.size() &&
               memcmp(a.keydata.data(), b.keydata.data(), a.size()) == 0;
    }

    //! Initialize using begin and end iterators to byte data.
    template <typename T>
    void Set(const T pbegin, const T pend)
    {
        if (size_t(pend - pbegin) != keydata.size()) {
            fValid = false;
        } else if (Check(&pbegin[0])) {
            memcpy(keydata.data(), (unsigned char*)&pbegin[0], keydata.size());
            fValid = true;
        } else {
            fValid = false;
        }
    }

    unsigned int size() const { return (fValid ? keydata.size() : 0); }
    const unsigned char* begin() const { return keydata.data(); }
    const unsigned char* end() const { return keydata.data() + size(); }

    bool IsValid() const { return fValid; }

    //! Generate a new private key using a cryptographic PRNG.
    void MakeNewKey();

    /**
     * Compute the public key from a private key.
     * This is expensive.
     */
    CPubKey GetPubKey() const;

    /**
     * Create a DER-serialized signature.
     */
    bool Sign(const uint256& hash, std::vector<unsigned char>& vchSig) const;

    //! Verify that the public key derived from this key matches and can check a signature
    bool VerifyPubKey(const CPubKey& pubkey) const;
};

#endif // DONATION_KEY_H
