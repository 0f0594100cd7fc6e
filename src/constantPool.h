/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _CONSTANTPOOL_H
#define _CONSTANTPOOL_H

#include <map>
#include "chunkHeader.h"
#include "jfrMetadata.h"
#include "value.h"


class ChunkContext;

// Constants of one type within one chunk. Indexing records only the byte offset
// of every entry; an entry is decoded on first resolve and kept for the chunk lifetime.
class ConstantPool {
  private:
    enum State {
        UNRESOLVED,
        RESOLVING,
        RESOLVED
    };

    struct Entry {
        u64 offset;
        State state;
        Value value;

        Entry(u64 offset) : offset(offset), state(UNRESOLVED), value() {
        }
    };

    ChunkContext* _context;
    const TypeDescriptor* _type;
    std::map<u64, Entry> _entries;

  public:
    ConstantPool(ChunkContext* context, const TypeDescriptor* type) : _context(context), _type(type), _entries() {
    }

    const TypeDescriptor* type() const {
        return _type;
    }

    size_t size() const {
        return _entries.size();
    }

    bool contains(u64 index) const {
        return _entries.find(index) != _entries.end();
    }

    // Offset is relative to the chunk. The first definition of an index wins.
    bool addOffset(u64 index, u64 offset);

    Error resolve(u64 index, Value* result);
};

// All constant pools of a chunk, by type id
class ConstantPools {
  private:
    std::map<long long, ConstantPool*> _pools;

    Error readCheckpoint(ChunkContext* context, ByteReader& checkpoint, long long* delta);

  public:
    ConstantPools() : _pools() {
    }

    ~ConstantPools();

    ConstantPool* get(long long type_id) const {
        std::map<long long, ConstantPool*>::const_iterator it = _pools.find(type_id);
        return it != _pools.end() ? it->second : NULL;
    }

    const std::map<long long, ConstantPool*>& pools() const {
        return _pools;
    }

    // Walks the checkpoint chain starting at the header's constant pool offset
    Error index(ChunkContext* context, const ByteReader& chunk, const ChunkHeader& header);
};

#endif // _CONSTANTPOOL_H
