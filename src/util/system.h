// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory resolution.
 */
#ifndef DONATION_UTIL_SYSTEM_H
#define DONATION_UTIL_SYSTEM_H

#include "fs.h"
#include "logging.h"
#include "sync.h"

#include <stdint.h>

#include <map>
#include <set>
#include <string>
#include <vector>

extern const char* const DONATION_CONF_FILENAME;

const fs::path& GetDataDir(bool fNetSpecific = true);
fs::path GetDefaultDataDir();
void ClearDatadirCache();
fs::path GetConfigFile(const std::string& confPath);
bool TryCreateDirectories(const fs::path& p);

/** Network names */
namespace CBaseChainParams {
    extern const std::string MAIN;
    extern const std::string TESTNET;
    extern const std::string REGTEST;
}

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

    /** Last value wins; command line overrides the config file */
    bool GetArgValue(const std::string& strArg, std::string& strValue) const;

public:
    /** Parse -name[=value] arguments. Non-dash tokens stop option parsing. */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /** Parse name=value lines of a config file; a missing file is not an error. */
    bool ReadConfigFiles(std::string& error);
    bool ReadConfigStream(std::istream& stream, std::string& error);

    /** Tokens remaining after the last -option (command and its params) */
    std::vector<std::string> GetCommandArgs() const { return m_command; }

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return true if the argument was originally passed as a negated option,
     * i.e. -nofoo.
     */
    bool IsArgNegated(const std::string& strArg) const;

    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /** Set an argument if it doesn't already have a value */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    void ClearArgs();

    /**
     * Looks for -regtest, -testnet and returns the appropriate network name.
     * @return CBaseChainParams::MAIN by default; raises runtime error if an invalid combination is given.
     */
    std::string GetChainName() const;

private:
    std::vector<std::string> m_command;
};

extern ArgsManager gArgs;

/** Apply -debug, -printtoconsole and the debug log file from gArgs to the global logger */
bool InitLogging(std::string& error);

#endif // DONATION_UTIL_SYSTEM_H
