/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _PARSERCONTEXT_H
#define _PARSERCONTEXT_H

#include <map>
#include <string>
#include <utility>
#include "chunkHeader.h"
#include "constantPool.h"
#include "decoderCache.h"
#include "deserializer.h"
#include "jfrMetadata.h"
#include "mutex.h"
#include "parserOptions.h"


// Plans already chosen for chunks with one particular metadata layout,
// by type id and target key. Chunks with identical canonical metadata reuse
// them without recomputing shape keys.
class PlanIndex {
  private:
    RWLock _lock;
    std::map<std::string, const DecodePlan*> _plans;

  public:
    PlanIndex() : _lock(), _plans() {
    }

    const DecodePlan* find(const std::string& key);
    void put(const std::string& key, const DecodePlan* plan);
};

// Root of the context tree: one per recording. Owns the shared decoder cache.
class RecordingContext {
  private:
    ParserOptions _options;
    DecoderCache _cache;
    RWLock _lock;
    std::map<std::string, PlanIndex*> _indexes;
    volatile int _inherited;

  public:
    explicit RecordingContext(const ParserOptions& options);
    ~RecordingContext();

    const ParserOptions& options() const {
        return _options;
    }

    DecoderCache* cache() {
        return &_cache;
    }

    // Index shared by all chunks whose metadata has the given canonical form
    PlanIndex* planIndex(const Metadata& metadata);

    // Number of decoders a chunk took over from an earlier chunk with the same metadata
    int inherited() const {
        return _inherited;
    }

    void recordInherited() {
        atomicInc(_inherited);
    }
};

// State of one chunk: metadata, constant pools and deserializers.
// Created after the metadata has been decoded; used by one thread at a time.
class ChunkContext {
  private:
    typedef std::pair<long long, const TargetShape*> DeserializerKey;

    RecordingContext* _recording;
    ChunkHeader _header;
    ByteReader _reader;
    Metadata* _metadata;
    ConstantPools _pools;
    DecoderCache* _local_cache;
    PlanIndex* _plan_index;
    std::map<DeserializerKey, Deserializer*> _deserializers;
    std::map<long long, LayoutRef> _layouts;
    ConstantPool* _string_pool;
    int _resolve_depth;

    ChunkContext(RecordingContext* recording, const ChunkHeader& header, const ByteReader& chunk, Metadata* metadata);

    Error findPlan(const TypeDescriptor* type, const TargetShape* target, const DecodePlan** result);

  public:
    ~ChunkContext();

    // Decodes the metadata, then indexes the constant pools of the chunk
    static Error create(RecordingContext* recording, const ChunkHeader& header, const ByteReader& chunk,
                        ChunkContext** result);

    int index() const {
        return _header.index;
    }

    const ChunkHeader& header() const {
        return _header;
    }

    // Reader bounded to the chunk
    const ByteReader& reader() const {
        return _reader;
    }

    const Metadata& metadata() const {
        return *_metadata;
    }

    const ParserOptions& options() const {
        return _recording->options();
    }

    RecordingContext* recording() const {
        return _recording;
    }

    const ConstantPools& pools() const {
        return _pools;
    }

    ConstantPool* pool(long long type_id) const {
        return _pools.get(type_id);
    }

    Error deserializer(const TypeDescriptor* type, const TargetShape* target, Deserializer** result);

    // Decodes the pool entry of the given type at a chunk-relative offset
    Error decodeConstant(const TypeDescriptor* type, u64 offset, Value* result);

    Error skipValue(const TypeDescriptor* type, ByteReader& reader);

    // String stored by reference: java.lang.String pool first, then the metadata string table
    Error resolveString(u64 index, Value* result);

    LayoutRef layout(const TypeDescriptor* type);
};

#endif // _PARSERCONTEXT_H
