/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _ARCH_H
#define _ARCH_H


#ifndef likely
#  define likely(x)    (__builtin_expect(!!(x), 1))
#endif

#ifndef unlikely
#  define unlikely(x)  (__builtin_expect(!!(x), 0))
#endif


typedef unsigned char u8;
typedef unsigned short u16;
typedef unsigned int u32;
typedef unsigned long long u64;

static inline u64 atomicInc(volatile u64& var, u64 increment = 1) {
    return __sync_fetch_and_add(&var, increment);
}

static inline int atomicInc(volatile int& var, int increment = 1) {
    return __sync_fetch_and_add(&var, increment);
}

template <typename T>
static inline T* loadAcquire(T* volatile& var) {
    return __atomic_load_n(&var, __ATOMIC_ACQUIRE);
}

template <typename T>
static inline void storeRelease(T* volatile& var, T* value) {
    __atomic_store_n(&var, value, __ATOMIC_RELEASE);
}


#if defined(__x86_64__) || defined(__i386__)
#  define spinPause()  asm volatile("pause")
#elif defined(__aarch64__)
#  define spinPause()  asm volatile("isb")
#elif defined(__arm__) || defined(__thumb__)
#  define spinPause()  asm volatile("yield")
#else
#  define spinPause()
#endif

#endif // _ARCH_H
