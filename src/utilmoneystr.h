// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Money parsing/formatting utilities.
 */
#ifndef DONATION_UTILMONEYSTR_H
#define DONATION_UTILMONEYSTR_H

#include "amount.h"

#include <stdint.h>
#include <string>

/** Native amount as whole coins with nine decimals, trailing zeros trimmed to two */
std::string FormatMoney(const CAmount& n, bool fPlus = false);

/** Token amount as a decimal string with the mint's decimal count */
std::string FormatTokenAmount(const CAmount& n, uint8_t nDecimals);

/** Parse "12.5" style coin amounts into smallest native units */
bool ParseMoney(const std::string& str, CAmount& nRet);
bool ParseMoney(const char* pszIn, CAmount& nRet);

#endif // DONATION_UTILMONEYSTR_H
