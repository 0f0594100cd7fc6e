/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _DECODERCACHE_H
#define _DECODERCACHE_H

#include <stddef.h>
#include <string>
#include "arch.h"


#define CACHE_ROW_BITS  7
#define CACHE_ROWS      (1 << CACHE_ROW_BITS)
#define CACHE_CELLS     3


class DecodePlan;

class PlanFactory {
  public:
    virtual ~PlanFactory() {
    }

    // Called at most once per key; must not return NULL
    virtual DecodePlan* create() = 0;
};

struct CacheEntry {
    std::string key;
    unsigned int hash;
    DecodePlan* volatile plan;
};

struct CacheTable;

struct CacheRow {
    CacheEntry* entries[CACHE_CELLS];
    CacheTable* next;
};

struct CacheTable {
    CacheRow rows[CACHE_ROWS];
};

// Append-only concurrent map from structural shape key to DecodePlan, based on
// multi-level arrays. The thread that installs a key creates its plan;
// concurrent lookups of the same key wait for it. Plans live as long as the cache.
class DecoderCache {
  private:
    CacheTable* _table;
    volatile int _created;

    static void clear(CacheTable* table);
    static unsigned int hash(const char* key, size_t length);

    static DecodePlan* await(CacheEntry* entry);

  public:
    DecoderCache();
    ~DecoderCache();

    const DecodePlan* lookup(const std::string& key, PlanFactory& factory);

    // Lookup without creating; NULL if the key is absent
    const DecodePlan* find(const std::string& key);

    // Number of plans created so far
    int created() const {
        return _created;
    }
};

#endif // _DECODERCACHE_H
