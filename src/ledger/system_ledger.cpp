// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/system_ledger.h"

#include "base58.h"
#include "chainparams.h"
#include "consensus/validation.h"
#include "ledger/ledgerview.h"
#include "ledger/signers.h"
#include "logging.h"
#include "utilmoneystr.h"

bool GetMinimumBalanceForRentExemption(uint64_t nSpace, const Consensus::LedgerParams& params, CAmount& nRentRet)
{
    CAmount nBytes, nPerYear;
    return CheckedAdd(params.nAccountStorageOverhead, nSpace, nBytes) &&
           CheckedMul(nBytes, params.nLamportsPerByteYear, nPerYear) &&
           CheckedMul(nPerYear, params.nExemptionThresholdYears, nRentRet);
}

CAmount GetBalance(const CLedgerViewCache& view, const uint256& address)
{
    CAccount account;
    if (!view.GetAccount(address, account))
        return 0;
    return account.nLamports;
}

bool SystemTransfer(CLedgerViewCache& view, const CInvocationSigners& signers,
                    const uint256& from, const uint256& to, CAmount amount,
                    CValidationState& state)
{
    const uint256& systemProgramId = Params().GetLedger().systemProgramId;

    if (!signers.IsSigner(from)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "ledger-transfer-missing-signature",
                             strprintf("%s did not sign", EncodeAddress(from)));
    }

    if (amount == 0) {
        LogPrint(BCLog::LEDGER, "SystemTransfer: zero amount from %s, nothing to do\n", EncodeAddress(from));
        return true;
    }

    CAccount accFrom;
    if (!view.GetAccount(from, accFrom)) {
        return state.Invalid(false, REJECT_INSUFFICIENT_FUNDS, "ledger-transfer-insufficient-funds",
                             strprintf("%s has no account (need %s)", EncodeAddress(from), FormatMoney(amount)));
    }
    if (!accFrom.IsPlainBalance(systemProgramId)) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "ledger-transfer-from-not-system",
                             strprintf("%s is not a plain balance account", EncodeAddress(from)));
    }

    if (accFrom.nLamports < amount) {
        return state.Invalid(false, REJECT_INSUFFICIENT_FUNDS, "ledger-transfer-insufficient-funds",
                             strprintf("have %s, need %s", FormatMoney(accFrom.nLamports), FormatMoney(amount)));
    }

    if (from == to) {
        return true;
    }

    CAccount accTo(systemProgramId, 0);
    if (view.GetAccount(to, accTo) && !accTo.IsOwnedBy(systemProgramId)) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "ledger-transfer-to-not-system",
                             strprintf("%s is owned by %s", EncodeAddress(to), EncodeAddress(accTo.owner)));
    }

    CAmount nNewTo;
    if (!CheckedAdd(accTo.nLamports, amount, nNewTo)) {
        return state.Invalid(false, REJECT_OVERFLOW, "ledger-transfer-overflow",
                             strprintf("%s + %s overflows", FormatMoney(accTo.nLamports), FormatMoney(amount)));
    }

    accFrom.nLamports -= amount;
    accTo.nLamports = nNewTo;
    view.SetAccount(from, accFrom);
    view.SetAccount(to, accTo);

    LogPrint(BCLog::LEDGER, "SystemTransfer: %s -> %s amount=%s\n",
             EncodeAddress(from), EncodeAddress(to), FormatMoney(amount));
    return true;
}

bool SystemCreateAccount(CLedgerViewCache& view, const CInvocationSigners& signers,
                         const uint256& payer, const uint256& address,
                         uint64_t nSpace, const uint256& owner,
                         CValidationState& state)
{
    const Consensus::LedgerParams& params = Params().GetLedger();

    if (!signers.IsSigner(payer)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "ledger-create-account-missing-payer-signature",
                             strprintf("payer %s did not sign", EncodeAddress(payer)));
    }
    if (!signers.IsSigner(address)) {
        return state.Invalid(false, REJECT_UNAUTHORIZED, "ledger-create-account-missing-address-signature",
                             strprintf("new account %s did not sign", EncodeAddress(address)));
    }

    if (payer == address) {
        return state.Invalid(false, REJECT_INVALID, "ledger-create-account-self-funded",
                             strprintf("%s cannot fund its own creation", EncodeAddress(address)));
    }

    CAmount nRequired;
    if (!GetMinimumBalanceForRentExemption(nSpace, params, nRequired)) {
        return state.Invalid(false, REJECT_OVERFLOW, "ledger-create-account-rent-overflow",
                             strprintf("no rent-exempt minimum for %u data bytes", nSpace));
    }

    // Existing plain balances are adopted, anything else is in use
    CAccount accNew(owner, 0);
    CAccount accExisting;
    if (view.GetAccount(address, accExisting)) {
        if (!accExisting.IsPlainBalance(params.systemProgramId)) {
            return state.Invalid(false, REJECT_PROVISIONING_CONFLICT, "ledger-create-account-in-use",
                                 strprintf("account %s already in use (owner=%s, %u data bytes)",
                                           EncodeAddress(address), EncodeAddress(accExisting.owner),
                                           accExisting.vchData.size()));
        }
        accNew.nLamports = accExisting.nLamports;
    }

    const CAmount nShortfall = accNew.nLamports >= nRequired ? 0 : nRequired - accNew.nLamports;
    if (nShortfall > 0) {
        CAccount accPayer;
        if (!view.GetAccount(payer, accPayer) || !accPayer.IsPlainBalance(params.systemProgramId)) {
            return state.Invalid(false, REJECT_INSUFFICIENT_FUNDS, "ledger-create-account-insufficient-funds",
                                 strprintf("payer %s holds no balance", EncodeAddress(payer)));
        }
        if (accPayer.nLamports < nShortfall) {
            return state.Invalid(false, REJECT_INSUFFICIENT_FUNDS, "ledger-create-account-insufficient-funds",
                                 strprintf("payer has %s, rent requires %s",
                                           FormatMoney(accPayer.nLamports), FormatMoney(nShortfall)));
        }
        accPayer.nLamports -= nShortfall;
        accNew.nLamports += nShortfall;
        view.SetAccount(payer, accPayer);
    }

    accNew.vchData.assign(nSpace, 0);
    view.SetAccount(address, accNew);

    LogPrint(BCLog::LEDGER, "SystemCreateAccount: %s space=%u owner=%s funded=%s (payer %s paid %s)\n",
             EncodeAddress(address), nSpace, EncodeAddress(owner), FormatMoney(accNew.nLamports),
             EncodeAddress(payer), FormatMoney(nShortfall));
    return true;
}

bool SystemAirdrop(CLedgerViewCache& view, const uint256& to, CAmount amount, CValidationState& state)
{
    const CChainParams& chainparams = Params();
    if (!chainparams.AllowAirdrop()) {
        return state.Invalid(false, REJECT_INVALID, "ledger-airdrop-not-allowed",
                             strprintf("airdrops are disabled on %s", chainparams.NetworkIDString()));
    }

    const uint256& systemProgramId = chainparams.GetLedger().systemProgramId;
    CAccount accTo(systemProgramId, 0);
    if (view.GetAccount(to, accTo) && !accTo.IsOwnedBy(systemProgramId)) {
        return state.Invalid(false, REJECT_LEDGER_FAILURE, "ledger-airdrop-not-system",
                             strprintf("%s is not system-owned", EncodeAddress(to)));
    }
    CAmount nNew;
    if (!CheckedAdd(accTo.nLamports, amount, nNew)) {
        return state.Invalid(false, REJECT_OVERFLOW, "ledger-airdrop-overflow");
    }
    accTo.nLamports = nNew;
    view.SetAccount(to, accTo);

    LogPrint(BCLog::LEDGER, "SystemAirdrop: %s += %s\n", EncodeAddress(to), FormatMoney(amount));
    return true;
}
