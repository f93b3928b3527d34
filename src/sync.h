// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2013 The Bitcoin developers
// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef PWGUESS_SYNC_H
#define PWGUESS_SYNC_H

#include <boost/thread/locks.hpp>
#include <boost/thread/recursive_mutex.hpp>

/**
 * Wrapped boost mutex: supports recursive locking, but no waiting.
 * Snapshot publication and the estimator instance both lock through it.
 */
typedef boost::recursive_mutex CCriticalSection;

/** Wrapper around boost::unique_lock<Mutex> */
template <typename Mutex>
class CMutexLock
{
private:
    boost::unique_lock<Mutex> lock;

public:
    explicit CMutexLock(Mutex& mutexIn) : lock(mutexIn) {}
};

typedef CMutexLock<CCriticalSection> CCriticalBlock;

#define PASTE(x, y) x##y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)

#endif // PWGUESS_SYNC_H
