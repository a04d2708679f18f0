// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "sync.h"

#include "logging.h"

#include <algorithm>
#include <cstdlib>
#include <vector>

namespace {

struct CLockLocation {
    void* cs;
    const char* pszName;
    const char* pszFile;
    int nLine;
};

// Locks held by the current thread, innermost last
thread_local std::vector<CLockLocation> g_lockstack;

bool LockHeldByThisThread(void* cs)
{
    return std::any_of(g_lockstack.begin(), g_lockstack.end(),
                       [cs](const CLockLocation& loc) { return loc.cs == cs; });
}

} // namespace

void EnterCritical(const char* pszName, const char* pszFile, int nLine, void* cs)
{
    g_lockstack.push_back(CLockLocation{cs, pszName, pszFile, nLine});
}

void LeaveCritical(void* cs)
{
    for (auto it = g_lockstack.rbegin(); it != g_lockstack.rend(); ++it) {
        if (it->cs == cs) {
            g_lockstack.erase(std::next(it).base());
            return;
        }
    }
}

void AssertLockHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs)
{
    if (LockHeldByThisThread(cs))
        return;
    LogPrintf("Assertion failed: lock %s not held in %s:%i\n", pszName, pszFile, nLine);
    abort();
}

void AssertLockNotHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs)
{
    if (!LockHeldByThisThread(cs))
        return;
    LogPrintf("Assertion failed: lock %s held in %s:%i\n", pszName, pszFile, nLine);
    abort();
}
