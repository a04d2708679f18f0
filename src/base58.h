// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Why base-58 instead of standard base-64 encoding?
 * - Don't want 0OIl characters that look the same in some fonts and
 *      could be used to create visually identical looking data.
 * - A string with non-alphanumeric characters is not as easily accepted as input.
 * - E-mail usually won't line-break if there's no punctuation to break at.
 * - Double-clicking selects the whole string as one word if it's all alphanumeric.
 *
 * Ledger addresses are displayed as the plain base58 encoding of their 32 bytes.
 */
#ifndef DONATION_BASE58_H
#define DONATION_BASE58_H

#include "uint256.h"

#include <string>
#include <vector>

/**
 * Encode a byte sequence as a base58-encoded string.
 * pbegin and pend cannot be nullptr, unless both are.
 */
std::string EncodeBase58(const unsigned char* pbegin, const unsigned char* pend);

/**
 * Encode a byte vector as a base58-encoded string
 */
std::string EncodeBase58(const std::vector<unsigned char>& vch);

/**
 * Decode a base58-encoded string (psz) into a byte vector (vchRet).
 * return true if decoding is successful.
 * psz cannot be nullptr.
 */
bool DecodeBase58(const char* psz, std::vector<unsigned char>& vchRet);

bool DecodeBase58(const std::string& str, std::vector<unsigned char>& vchRet);

/** Display form of a ledger address */
std::string EncodeAddress(const uint256& address);

/** Parse a ledger address; accepts base58 (32 bytes) or the 64-character GetHex() form */
bool DecodeAddress(const std::string& str, uint256& addressRet);

#endif // DONATION_BASE58_H
