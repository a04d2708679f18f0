// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "utilmoneystr.h"

#include "utilstrencodings.h"

#include <tinyformat.h>

static std::string FormatFixed(const CAmount& n, uint8_t nDecimals, int nMinDecimals)
{
    CAmount nUnit = 1;
    for (uint8_t i = 0; i < nDecimals; i++)
        nUnit *= 10;

    const CAmount quotient = n / nUnit;
    const CAmount remainder = n % nUnit;
    if (nDecimals == 0)
        return tfm::format("%d", quotient);

    std::string str = tfm::format("%d.%0*d", quotient, (int)nDecimals, remainder);

    // Right-trim excess zeros before the decimal point:
    int nTrim = 0;
    for (int i = str.size() - 1; (str[i] == '0' && IsDigit(str[i - 2])); --i)
        ++nTrim;
    if (nTrim > nDecimals - nMinDecimals)
        nTrim = nDecimals - nMinDecimals;
    if (nTrim > 0)
        str.erase(str.size() - nTrim, nTrim);
    return str;
}

std::string FormatMoney(const CAmount& n, bool fPlus)
{
    std::string str = FormatFixed(n, 9, 2);
    if (fPlus && n > 0)
        str.insert((unsigned int)0, 1, '+');
    return str;
}

std::string FormatTokenAmount(const CAmount& n, uint8_t nDecimals)
{
    return FormatFixed(n, nDecimals, nDecimals > 0 ? 1 : 0);
}

bool ParseMoney(const std::string& str, CAmount& nRet)
{
    return ParseMoney(str.c_str(), nRet);
}

bool ParseMoney(const char* pszIn, CAmount& nRet)
{
    std::string strWhole;
    CAmount nUnits = 0;
    const char* p = pszIn;
    while (IsSpace(*p))
        p++;
    for (; *p; p++) {
        if (*p == '.') {
            p++;
            CAmount nMult = COIN / 10;
            while (IsDigit(*p) && (nMult > 0)) {
                nUnits += nMult * (*p++ - '0');
                nMult /= 10;
            }
            break;
        }
        if (IsSpace(*p))
            break;
        if (!IsDigit(*p))
            return false;
        strWhole.insert(strWhole.end(), *p);
    }
    for (; *p; p++)
        if (!IsSpace(*p))
            return false;
    if (strWhole.size() > 10) // guard against 63 bit overflow
        return false;
    if (strWhole.empty() && nUnits == 0 && (p == pszIn || *(p - 1) != '0'))
        return false;

    CAmount nWhole = strWhole.empty() ? 0 : (CAmount)atoi64(strWhole);
    nRet = nWhole * COIN + nUnits;
    return true;
}
