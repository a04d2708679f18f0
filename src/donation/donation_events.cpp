// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "donation/donation_events.h"

#include "base58.h"
#include "logging.h"
#include "sync.h"
#include "utilstrencodings.h"

#include <algorithm>
#include <vector>

static const std::string EVENT_PREFIX = "DONATION_EVENT: ";

static RecursiveMutex cs_listeners;
static std::vector<CDonationInterface*> g_listeners;

std::string CDonationRecord::ToLogLine() const
{
    return strprintf("%sdonor=%s, amount=%u, timestamp=%d, tokens=%u",
                     EVENT_PREFIX, EncodeAddress(donor), nAmount, nTime, nTokens);
}

/** Value of "key=" up to the next ',' or end */
static bool FindField(const std::string& str, const std::string& key, std::string& valueRet)
{
    const std::string needle = key + "=";
    size_t pos = str.find(needle);
    if (pos == std::string::npos)
        return false;
    pos += needle.size();
    size_t end = str.find_first_of(",\r\n", pos);
    valueRet = str.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    return !valueRet.empty();
}

bool ParseDonationEventLine(const std::string& strLine, CDonationRecord& recordRet)
{
    size_t pos = strLine.find(EVENT_PREFIX);
    if (pos == std::string::npos)
        return false;
    const std::string strBody = strLine.substr(pos + EVENT_PREFIX.size());

    std::string strDonor, strAmount, strTime, strTokens;
    if (!FindField(strBody, "donor", strDonor) ||
        !FindField(strBody, "amount", strAmount) ||
        !FindField(strBody, "timestamp", strTime) ||
        !FindField(strBody, "tokens", strTokens)) {
        return false;
    }

    CDonationRecord record;
    uint64_t nTime;
    if (!DecodeAddress(strDonor, record.donor) ||
        !ParseUInt64(strAmount, &record.nAmount) ||
        !ParseUInt64(strTime, &nTime) ||
        !ParseUInt64(strTokens, &record.nTokens)) {
        return false;
    }
    record.nTime = (int64_t)nTime;
    recordRet = record;
    return true;
}

void RegisterDonationInterface(CDonationInterface* pListener)
{
    LOCK(cs_listeners);
    if (std::find(g_listeners.begin(), g_listeners.end(), pListener) == g_listeners.end())
        g_listeners.push_back(pListener);
}

void UnregisterDonationInterface(CDonationInterface* pListener)
{
    LOCK(cs_listeners);
    g_listeners.erase(std::remove(g_listeners.begin(), g_listeners.end(), pListener), g_listeners.end());
}

void UnregisterAllDonationInterfaces()
{
    LOCK(cs_listeners);
    g_listeners.clear();
}

void EmitDonationEvent(const CDonationRecord& record)
{
    LogPrintf("%s\n", record.ToLogLine());

    LOCK(cs_listeners);
    for (CDonationInterface* pListener : g_listeners) {
        try {
            pListener->DonationRecorded(record);
        } catch (const std::exception& e) {
            LogPrintf("ERROR: %s: listener failed: %s\n", __func__, e.what());
        }
    }
}
