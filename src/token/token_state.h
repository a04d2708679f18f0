// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_TOKEN_TOKEN_STATE_H
#define DONATION_TOKEN_TOKEN_STATE_H

#include "amount.h"
#include "optional.h"
#include "serialize.h"
#include "streams.h"
#include "uint256.h"
#include "version.h"

#include <algorithm>
#include <string>
#include <vector>

/**
 * CMint - descriptor of one fungible token
 *
 * Stored in the data of an account owned by the token program. The data area
 * is MINT_SIZE bytes; the serialized record occupies its front and the rest
 * stays zero. An all-zero area reads back as an uninitialized mint.
 */
class CMint
{
public:
    static constexpr uint64_t MINT_SIZE = 82;

    bool fInitialized;
    uint8_t nDecimals;
    CAmount nSupply;
    Optional<uint256> mintAuthority;
    Optional<uint256> freezeAuthority;

    CMint()
    {
        SetNull();
    }

    void SetNull()
    {
        fInitialized = false;
        nDecimals = 0;
        nSupply = 0;
        mintAuthority = nullopt;
        freezeAuthority = nullopt;
    }

    SERIALIZE_METHODS(CMint, obj)
    {
        READWRITE(obj.fInitialized, obj.nDecimals, obj.nSupply, obj.mintAuthority, obj.freezeAuthority);
    }

    std::string ToString() const;
};

/**
 * CTokenAccount - one owner's balance of one mint
 */
class CTokenAccount
{
public:
    static constexpr uint64_t ACCOUNT_SIZE = 165;

    bool fInitialized;
    uint256 mint;
    uint256 owner;
    CAmount nAmount;

    CTokenAccount()
    {
        SetNull();
    }

    void SetNull()
    {
        fInitialized = false;
        mint.SetNull();
        owner.SetNull();
        nAmount = 0;
    }

    SERIALIZE_METHODS(CTokenAccount, obj)
    {
        READWRITE(obj.fInitialized, obj.mint, obj.owner, obj.nAmount);
    }

    std::string ToString() const;
};

/** Write obj at the front of an account data area of unchanged size */
template <typename T>
bool PackTokenState(const T& obj, std::vector<unsigned char>& vchData)
{
    CDataStream ss(SER_DISK, CLIENT_VERSION);
    ss << obj;
    if (ss.size() > vchData.size())
        return false;
    std::fill(vchData.begin(), vchData.end(), 0);
    std::copy(ss.begin(), ss.end(), vchData.begin());
    return true;
}

/** Read obj from the front of an account data area */
template <typename T>
bool UnpackTokenState(const std::vector<unsigned char>& vchData, T& obj)
{
    try {
        CDataStream ss(vchData, SER_DISK, CLIENT_VERSION);
        ss >> obj;
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

#endif // DONATION_TOKEN_TOKEN_STATE_H
