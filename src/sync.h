// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_SYNC_H
#define DONATION_SYNC_H

#include <mutex>
#include <type_traits>

/////////////////////////////////////////////////
//                                             //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                             //
/////////////////////////////////////////////////

/*
RecursiveMutex mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);

LOCK2(mutex1, mutex2);
    std::unique_lock<std::recursive_mutex> criticalblock1(mutex1);
    std::unique_lock<std::recursive_mutex> criticalblock2(mutex2);
 */

void EnterCritical(const char* pszName, const char* pszFile, int nLine, void* cs);
void LeaveCritical(void* cs);
void AssertLockHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs);
void AssertLockNotHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs);

#define AssertLockHeld(cs) AssertLockHeldInternal(#cs, __FILE__, __LINE__, &cs)
#define AssertLockNotHeld(cs) AssertLockNotHeldInternal(#cs, __FILE__, __LINE__, &cs)

/**
 * Template mixin that adds -Wthread-safety locking annotations and lock order
 * checking to a subset of the mutex API.
 */
template <typename PARENT>
class AnnotatedMixin : public PARENT
{
public:
    ~AnnotatedMixin() {}

    void lock()
    {
        PARENT::lock();
    }

    void unlock()
    {
        PARENT::unlock();
    }

    bool try_lock()
    {
        return PARENT::try_lock();
    }

    using UniqueLock = std::unique_lock<PARENT>;
};

/**
 * Wrapped mutex: supports recursive locking, but no waiting
 */
typedef AnnotatedMixin<std::recursive_mutex> RecursiveMutex;

/** Wrapped mutex: supports waiting but not recursive locking */
typedef AnnotatedMixin<std::mutex> Mutex;

/** Wrapper around std::unique_lock style lock for Mutex. */
template <typename Mutex, typename Base = typename Mutex::UniqueLock>
class UniqueLock : public Base
{
public:
    UniqueLock(Mutex& mutexIn, const char* pszName, const char* pszFile, int nLine) : Base(mutexIn, std::defer_lock)
    {
        EnterCritical(pszName, pszFile, nLine, (void*)(Base::mutex()));
        Base::lock();
    }

    ~UniqueLock()
    {
        if (Base::owns_lock()) {
            LeaveCritical((void*)(Base::mutex()));
        }
    }
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) UniqueLock<typename std::remove_reference<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs, #cs, __FILE__, __LINE__)
#define LOCK2(cs1, cs2)                                                                                          \
    UniqueLock<typename std::remove_reference<decltype(cs1)>::type> criticalblock1(cs1, #cs1, __FILE__, __LINE__); \
    UniqueLock<typename std::remove_reference<decltype(cs2)>::type> criticalblock2(cs2, #cs2, __FILE__, __LINE__);

#endif // DONATION_SYNC_H
