// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "donation/donation_indexdb.h"
#include "donation/donation_validation.h"
#include "fs.h"
#include "logging.h"
#include "rpc/client.h"
#include "rpc/protocol.h"
#include "rpc/register.h"
#include "rpc/server.h"
#include "util/system.h"
#include "utilmoneystr.h"

#include <stdio.h>
#include <stdlib.h>

#include <univalue.h>

static const int CONTINUE_EXECUTION = -1;

static const int64_t DEFAULT_DB_CACHE_MB = 8;

static std::string HelpMessageCli()
{
    std::string strUsage;
    strUsage += "Usage:\n"
                "  donation-cli [options] <command> [params]  Run a donation command\n"
                "  donation-cli [options] help                List commands\n"
                "  donation-cli [options] help <command>      Get help for a command\n"
                "\nOptions:\n";
    strUsage += "  -?                     This help message\n";
    strUsage += "  -conf=<file>           Specify configuration file (default: donation.conf)\n";
    strUsage += "  -datadir=<dir>         Specify data directory\n";
    strUsage += "  -testnet               Use the test network\n";
    strUsage += "  -regtest               Use the regression test network\n";
    strUsage += strprintf("  -dbcache=<n>           Database cache size in megabytes (default: %d)\n", DEFAULT_DB_CACHE_MB);
    strUsage += "  -campaigngoal=<amt>    Campaign goal in coins (default: 1000)\n";
    strUsage += "  -reindexdonations      Rebuild the donation index from DONATION_EVENT lines of debug.log\n";
    strUsage += "  -nodonationindex       Do not maintain the donation index\n";
    strUsage += strprintf("  -debug=<category>      Output debugging information (%s)\n", ListLogCategories());
    strUsage += "  -printtoconsole        Send trace/debug info to console\n";
    strUsage += "  -logtimestamps         Prepend debug output with timestamp\n";
    strUsage += strprintf("  -debuglogfile=<file>   Debug log file (default: %s)\n", DEFAULT_DEBUGLOGFILE);
    return strUsage;
}

static int AppInitCli(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessageCli().c_str());
        return argc < 2 ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    if (!fs::is_directory(GetDataDir(false))) {
        fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", gArgs.GetArg("-datadir", "").c_str());
        return EXIT_FAILURE;
    }
    if (!gArgs.ReadConfigFiles(error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    // Check for -testnet or -regtest parameter (Params() calls are only valid after this clause)
    try {
        SelectParams(gArgs.GetChainName());
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    if (gArgs.IsArgSet("-campaigngoal")) {
        CAmount nGoal = 0;
        if (!ParseMoney(gArgs.GetArg("-campaigngoal", ""), nGoal)) {
            fprintf(stderr, "Error: Invalid amount for -campaigngoal=<amount>: '%s'\n", gArgs.GetArg("-campaigngoal", "").c_str());
            return EXIT_FAILURE;
        }
        UpdateCampaignGoal(nGoal);
    }

    if (!InitLogging(error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    return CONTINUE_EXECUTION;
}

static bool AppInitDatabases()
{
    int64_t nCacheMB = gArgs.GetArg("-dbcache", DEFAULT_DB_CACHE_MB);
    if (nCacheMB < 1)
        nCacheMB = 1;
    const size_t nCacheSize = (size_t)nCacheMB << 20;

    LogPrintf("Using data directory %s\n", GetDataDir().string());
    LogPrintf("Network: %s\n", Params().NetworkIDString());

    if (!InitLedgerDB(nCacheSize / 2, false, false)) {
        fprintf(stderr, "Error: unable to open the ledger database\n");
        return false;
    }

    if (!gArgs.GetBoolArg("-donationindex", true))
        return true;

    const bool fReindex = gArgs.GetBoolArg("-reindexdonations", false);
    if (!InitDonationIndexDB(nCacheSize / 2, false, fReindex)) {
        fprintf(stderr, "Error: unable to open the donation index\n");
        return false;
    }

    if (fReindex) {
        const fs::path logFile = LogInstance().m_file_path;
        // The log being read is also the log being appended to
        LogInstance().m_print_to_file = false;
        int nIndexed = GetDonationIndexDB()->RebuildFromLog(logFile);
        LogInstance().m_print_to_file = true;
        if (nIndexed < 0) {
            fprintf(stderr, "Error: unable to read %s\n", logFile.string().c_str());
            return false;
        }
        LogPrintf("Reindexed %d donations from %s\n", nIndexed, logFile.string());
    }
    return true;
}

static int CommandLineRPC()
{
    std::string strPrint;
    int nRet = 0;
    try {
        std::vector<std::string> args = gArgs.GetCommandArgs();
        if (args.size() < 1)
            throw std::runtime_error("too few parameters (need at least command)");

        const std::string strMethod = args[0];
        args.erase(args.begin()); // Remove trailing method name from arguments vector

        JSONRPCRequest request;
        request.id = 1;
        request.strMethod = strMethod;
        request.params = RPCConvertValues(strMethod, args);

        try {
            const UniValue result = tableRPC.execute(request);
            if (result.isNull())
                strPrint = "";
            else if (result.isStr())
                strPrint = result.get_str();
            else
                strPrint = result.write(2);
        } catch (const UniValue& objError) {
            // Error
            int code = find_value(objError, "code").get_int();
            strPrint = "error code: " + std::to_string(code) + "\n";
            const UniValue& errMsg = find_value(objError, "message");
            if (errMsg.isStr())
                strPrint += "error message:\n" + errMsg.get_str();
            nRet = abs(code);
        }
    } catch (const std::exception& e) {
        strPrint = std::string("error: ") + e.what();
        nRet = EXIT_FAILURE;
    }

    if (strPrint != "") {
        fprintf((nRet == 0 ? stdout : stderr), "%s\n", strPrint.c_str());
    }
    return nRet;
}

int main(int argc, char* argv[])
{
    try {
        int ret = AppInitCli(argc, argv);
        if (ret != CONTINUE_EXECUTION)
            return ret;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    int ret = EXIT_FAILURE;
    try {
        if (!AppInitDatabases()) {
            ShutdownDonationDBs();
            return EXIT_FAILURE;
        }
        RegisterAllCoreRPCCommands(tableRPC);
        ret = CommandLineRPC();
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        ret = EXIT_FAILURE;
    }

    ShutdownDonationDBs();
    return ret;
}
