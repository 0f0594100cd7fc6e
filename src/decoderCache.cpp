/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdlib.h>
#include <string.h>
#include "decodePlan.h"
#include "decoderCache.h"


DecoderCache::DecoderCache() : _created(0) {
    _table = (CacheTable*)calloc(1, sizeof(CacheTable));
}

DecoderCache::~DecoderCache() {
    clear(_table);
    free(_table);
}

void DecoderCache::clear(CacheTable* table) {
    for (int i = 0; i < CACHE_ROWS; i++) {
        CacheRow* row = &table->rows[i];
        for (int j = 0; j < CACHE_CELLS; j++) {
            CacheEntry* entry = row->entries[j];
            if (entry != NULL) {
                delete entry->plan;
                delete entry;
            }
        }
        if (row->next != NULL) {
            clear(row->next);
            free(row->next);
        }
    }
}

// Shape keys share long prefixes; FNV-1a over the whole key spreads them well enough
unsigned int DecoderCache::hash(const char* key, size_t length) {
    unsigned int h = 2166136261U;
    for (size_t i = 0; i < length; i++) {
        h = (h ^ (u8)key[i]) * 16777619;
    }
    return h;
}

// The installing thread publishes the plan right after creating it
DecodePlan* DecoderCache::await(CacheEntry* entry) {
    DecodePlan* plan;
    while ((plan = loadAcquire(entry->plan)) == NULL) {
        spinPause();
    }
    return plan;
}

const DecodePlan* DecoderCache::lookup(const std::string& key, PlanFactory& factory) {
    CacheTable* table = _table;
    unsigned int h = hash(key.data(), key.size());
    unsigned int row_hash = h;

    while (true) {
        CacheRow* row = &table->rows[row_hash % CACHE_ROWS];
        for (int c = 0; c < CACHE_CELLS; c++) {
            if (row->entries[c] == NULL) {
                CacheEntry* new_entry = new CacheEntry();
                new_entry->key = key;
                new_entry->hash = h;
                new_entry->plan = NULL;
                if (__sync_bool_compare_and_swap(&row->entries[c], NULL, new_entry)) {
                    DecodePlan* plan = factory.create();
                    atomicInc(_created);
                    storeRelease(new_entry->plan, plan);
                    return plan;
                }
                delete new_entry;
            }
            CacheEntry* entry = row->entries[c];
            if (entry->hash == h && entry->key == key) {
                return await(entry);
            }
        }

        if (row->next == NULL) {
            CacheTable* new_table = (CacheTable*)calloc(1, sizeof(CacheTable));
            if (!__sync_bool_compare_and_swap(&row->next, NULL, new_table)) {
                free(new_table);
            }
        }

        table = row->next;
        row_hash = (row_hash >> CACHE_ROW_BITS) | (row_hash << (32 - CACHE_ROW_BITS));
    }
}

const DecodePlan* DecoderCache::find(const std::string& key) {
    CacheTable* table = _table;
    unsigned int h = hash(key.data(), key.size());
    unsigned int row_hash = h;

    while (table != NULL) {
        CacheRow* row = &table->rows[row_hash % CACHE_ROWS];
        for (int c = 0; c < CACHE_CELLS; c++) {
            CacheEntry* entry = row->entries[c];
            if (entry == NULL) {
                return NULL;
            }
            if (entry->hash == h && entry->key == key) {
                return await(entry);
            }
        }
        table = row->next;
        row_hash = (row_hash >> CACHE_ROW_BITS) | (row_hash << (32 - CACHE_ROW_BITS));
    }
    return NULL;
}
