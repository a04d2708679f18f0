// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_RPC_PROTOCOL_H
#define DONATION_RPC_PROTOCOL_H

#include <string>

#include <univalue.h>

//! Error codes
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST  = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS   = -32602,
    RPC_INTERNAL_ERROR   = -32603,
    RPC_PARSE_ERROR      = -32700,

    //! General application defined errors
    RPC_MISC_ERROR                  = -1,  //!< std::exception thrown in command handling
    RPC_TYPE_ERROR                  = -3,  //!< Unexpected type was passed as parameter
    RPC_INVALID_ADDRESS_OR_KEY      = -5,  //!< Invalid address or key
    RPC_INVALID_PARAMETER           = -8,  //!< Invalid, missing or duplicate parameter
    RPC_DATABASE_ERROR              = -20, //!< Database error
    RPC_DESERIALIZATION_ERROR       = -22, //!< Error parsing or validating structure in raw format
    RPC_VERIFY_ERROR                = -25, //!< General error during request execution
    RPC_VERIFY_REJECTED             = -26, //!< Request was rejected by ledger rules
    RPC_VERIFY_ALREADY_IN_CHAIN     = -27, //!< Request already committed
    RPC_IN_WARMUP                   = -28, //!< Databases not initialized yet
};

UniValue JSONRPCError(int code, const std::string& message);

#endif // DONATION_RPC_PROTOCOL_H
