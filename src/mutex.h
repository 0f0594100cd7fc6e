/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _MUTEX_H
#define _MUTEX_H

#include <pthread.h>
#include "arch.h"


class Mutex {
  protected:
    pthread_mutex_t _mutex;

  public:
    Mutex();
    ~Mutex();

    void lock();
    void unlock();
};

class WaitableMutex : public Mutex {
  protected:
    pthread_cond_t _cond;

  public:
    WaitableMutex();
    ~WaitableMutex();

    // Must be called with the mutex held
    void wait();
    void notifyAll();
};

class MutexLocker {
  private:
    Mutex* _mutex;

  public:
    MutexLocker(Mutex& mutex) : _mutex(&mutex) {
        _mutex->lock();
    }

    ~MutexLocker() {
        _mutex->unlock();
    }
};

// Many readers, one writer
class RWLock {
  private:
    pthread_rwlock_t _rwlock;

  public:
    RWLock();
    ~RWLock();

    void lockShared();
    void unlockShared();
    void lock();
    void unlock();
};

class SharedLocker {
  private:
    RWLock* _lock;

  public:
    SharedLocker(RWLock& lock) : _lock(&lock) {
        _lock->lockShared();
    }

    ~SharedLocker() {
        _lock->unlockShared();
    }
};

class ExclusiveLocker {
  private:
    RWLock* _lock;

  public:
    ExclusiveLocker(RWLock& lock) : _lock(&lock) {
        _lock->lock();
    }

    ~ExclusiveLocker() {
        _lock->unlock();
    }
};

#endif // _MUTEX_H
