// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_AMOUNT_H
#define DONATION_AMOUNT_H

#include <stdint.h>
#include <limits>

/** Amount in the smallest native unit (or smallest reward-token unit) */
typedef uint64_t CAmount;

/** Smallest native units per whole native coin */
static const CAmount COIN = 1000000000;

static const CAmount MAX_AMOUNT = std::numeric_limits<CAmount>::max();

/** a + b without wrapping; returns false when the sum does not fit */
inline bool CheckedAdd(CAmount a, CAmount b, CAmount& nRet)
{
    if (a > MAX_AMOUNT - b) {
        return false;
    }
    nRet = a + b;
    return true;
}

/** a * b without wrapping; returns false when the product does not fit */
inline bool CheckedMul(CAmount a, CAmount b, CAmount& nRet)
{
    if (a != 0 && b > MAX_AMOUNT / a) {
        return false;
    }
    nRet = a * b;
    return true;
}

#endif // DONATION_AMOUNT_H
