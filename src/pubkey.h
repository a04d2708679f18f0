// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_PUBKEY_H
#define DONATION_PUBKEY_H

#include "serialize.h"
#include "uint256.h"

#include <string.h>

#include <stdexcept>
#include <vector>

/**
 * An encapsulated compressed secp256k1 public key.
 *
 * The ledger address of a key holder is the 32-byte x-coordinate of its
 * public key. Addresses that are not a valid x-coordinate on the curve
 * (see IsOnCurve) therefore have no private key at all.
 */
class CPubKey
{
public:
    static const unsigned int COMPRESSED_SIZE = 33;

private:
    unsigned char vch[COMPRESSED_SIZE];

    void Invalidate()
    {
        vch[0] = 0xFF;
    }

public:
    CPubKey()
    {
        Invalidate();
    }

    template <typename T>
    void Set(const T pbegin, const T pend)
    {
        if (pend - pbegin == COMPRESSED_SIZE && (pbegin[0] == 0x02 || pbegin[0] == 0x03))
            memcpy(vch, (unsigned char*)&pbegin[0], COMPRESSED_SIZE);
        else
            Invalidate();
    }

    explicit CPubKey(const std::vector<unsigned char>& _vch)
    {
        Set(_vch.begin(), _vch.end());
    }

    unsigned int size() const { return IsValid() ? COMPRESSED_SIZE : 0; }
    const unsigned char* begin() const { return vch; }
    const unsigned char* end() const { return vch + size(); }

    friend bool operator==(const CPubKey& a, const CPubKey& b)
    {
        return a.vch[0] == b.vch[0] &&
               memcmp(a.vch, b.vch, a.size()) == 0;
    }
    friend bool operator!=(const CPubKey& a, const CPubKey& b)
    {
        return !(a == b);
    }

    template <typename Stream>
    void Serialize(Stream& s) const
    {
        unsigned int len = size();
        ::WriteCompactSize(s, len);
        s.write((char*)vch, len);
    }
    template <typename Stream>
    void Unserialize(Stream& s)
    {
        unsigned int len = ::ReadCompactSize(s);
        if (len == COMPRESSED_SIZE) {
            s.read((char*)vch, len);
            if (vch[0] != 0x02 && vch[0] != 0x03) {
                Invalidate();
            }
        } else {
            // invalid pubkey, skip available data
            char dummy;
            while (len--)
                s.read(&dummy, 1);
            Invalidate();
        }
    }

    //! Ledger address owned by this key (x-coordinate)
    uint256 GetAddress() const;

    //! Syntactic validity: right length and prefix
    bool IsValid() const
    {
        return vch[0] == 0x02 || vch[0] == 0x03;
    }

    //! fully validate whether this is a valid public key (more expensive than IsValid())
    bool IsFullyValid() const;

    /**
     * Verify a DER-serialized ECDSA signature against this key.
     */
    bool Verify(const uint256& hash, const std::vector<unsigned char>& vchSig) const;

    std::vector<unsigned char> Raw() const
    {
        return std::vector<unsigned char>(begin(), end());
    }

    /**
     * Whether a 32-byte value is the x-coordinate of some secp256k1 point,
     * i.e. whether a private key could exist for it as an address.
     */
    static bool IsOnCurve(const uint256& x);
};

#endif // DONATION_PUBKEY_H
