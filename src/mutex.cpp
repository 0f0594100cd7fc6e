/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "mutex.h"


Mutex::Mutex() {
    pthread_mutexattr_t attr;
    pthread_mutexattr_init(&attr);
    pthread_mutexattr_settype(&attr, PTHREAD_MUTEX_RECURSIVE);
    pthread_mutex_init(&_mutex, &attr);
    pthread_mutexattr_destroy(&attr);
}

Mutex::~Mutex() {
    pthread_mutex_destroy(&_mutex);
}

void Mutex::lock() {
    pthread_mutex_lock(&_mutex);
}

void Mutex::unlock() {
    pthread_mutex_unlock(&_mutex);
}

WaitableMutex::WaitableMutex() : Mutex() {
    pthread_cond_init(&_cond, NULL);
}

WaitableMutex::~WaitableMutex() {
    pthread_cond_destroy(&_cond);
}

void WaitableMutex::wait() {
    pthread_cond_wait(&_cond, &_mutex);
}

void WaitableMutex::notifyAll() {
    pthread_cond_broadcast(&_cond);
}

RWLock::RWLock() {
    pthread_rwlock_init(&_rwlock, NULL);
}

RWLock::~RWLock() {
    pthread_rwlock_destroy(&_rwlock);
}

void RWLock::lockShared() {
    pthread_rwlock_rdlock(&_rwlock);
}

void RWLock::unlockShared() {
    pthread_rwlock_unlock(&_rwlock);
}

void RWLock::lock() {
    pthread_rwlock_wrlock(&_rwlock);
}

void RWLock::unlock() {
    pthread_rwlock_unlock(&_rwlock);
}
