// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_VERSION_H
#define DONATION_VERSION_H

//! wire format version of donation requests and RPC payloads
static const int PROTOCOL_VERSION = 70100;

//! on-disk format version of ledger and index databases
static const int CLIENT_VERSION = 1000000;

static const char* const CLIENT_NAME = "DonationLedger";

#endif // DONATION_VERSION_H
