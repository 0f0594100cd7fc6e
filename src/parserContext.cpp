/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdio.h>
#include "log.h"
#include "parserContext.h"


class PlanCompilation : public PlanFactory {
  private:
    const std::string& _key;
    const TypeDescriptor* _type;
    const TargetShape* _target;
    const ParserOptions& _options;

  public:
    PlanCompilation(const std::string& key, const TypeDescriptor* type, const TargetShape* target,
                    const ParserOptions& options) :
        _key(key), _type(type), _target(target), _options(options) {
    }

    DecodePlan* create() {
        Log::trace("Compiling decoder for %s", _key.c_str());
        return PlanCompiler::compile(_key, _type, _target, _options);
    }
};


const DecodePlan* PlanIndex::find(const std::string& key) {
    SharedLocker sl(_lock);
    std::map<std::string, const DecodePlan*>::const_iterator it = _plans.find(key);
    return it != _plans.end() ? it->second : NULL;
}

void PlanIndex::put(const std::string& key, const DecodePlan* plan) {
    ExclusiveLocker el(_lock);
    _plans.insert(std::make_pair(key, plan));
}


RecordingContext::RecordingContext(const ParserOptions& options) :
    _options(options), _cache(), _lock(), _indexes(), _inherited(0) {
}

RecordingContext::~RecordingContext() {
    for (std::map<std::string, PlanIndex*>::iterator it = _indexes.begin(); it != _indexes.end(); ++it) {
        delete it->second;
    }
}

PlanIndex* RecordingContext::planIndex(const Metadata& metadata) {
    {
        SharedLocker sl(_lock);
        std::map<std::string, PlanIndex*>::const_iterator it = _indexes.find(metadata.canonicalForm());
        if (it != _indexes.end()) {
            return it->second;
        }
    }

    ExclusiveLocker el(_lock);
    PlanIndex*& index = _indexes[metadata.canonicalForm()];
    if (index == NULL) {
        index = new PlanIndex();
        Log::debug("New metadata layout %016llx with %d types", metadata.fingerprint(), (int)metadata.types().size());
    }
    return index;
}


ChunkContext::ChunkContext(RecordingContext* recording, const ChunkHeader& header, const ByteReader& chunk,
                           Metadata* metadata) :
    _recording(recording), _header(header), _reader(chunk), _metadata(metadata), _pools(),
    _local_cache(NULL), _plan_index(NULL), _deserializers(), _layouts(), _string_pool(NULL), _resolve_depth(0) {
    const ParserOptions& options = recording->options();
    if (options.compiled()) {
        if (options._cache == CACHE_CHUNK) {
            _local_cache = new DecoderCache();
        } else {
            _plan_index = recording->planIndex(*metadata);
        }
    }
}

ChunkContext::~ChunkContext() {
    for (std::map<DeserializerKey, Deserializer*>::iterator it = _deserializers.begin(); it != _deserializers.end(); ++it) {
        delete it->second;
    }
    delete _local_cache;
    delete _metadata;
}

Error ChunkContext::create(RecordingContext* recording, const ChunkHeader& header, const ByteReader& chunk,
                           ChunkContext** result) {
    ByteReader reader = chunk;
    reader.seek(header.meta_offset);

    Metadata* metadata;
    Error error = Metadata::read(reader, recording->options()._max_depth, &metadata);
    if (error) {
        if (error.kind() == ERR_UNEXPECTED_END_OF_DATA || error.kind() == ERR_MALFORMED_VARINT) {
            error.wrap(ERR_INVALID_METADATA);
        }
        return error.inChunk(header.index);
    }

    ChunkContext* context = new ChunkContext(recording, header, chunk, metadata);
    error = context->_pools.index(context, chunk, header);
    if (error) {
        delete context;
        return error.inChunk(header.index);
    }

    const TypeDescriptor* string_type = metadata->type(std::string("java.lang.String"));
    if (string_type != NULL) {
        context->_string_pool = context->pool(string_type->_id);
    }

    *result = context;
    return Error::OK;
}

Error ChunkContext::findPlan(const TypeDescriptor* type, const TargetShape* target, const DecodePlan** result) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%lld|", type->_id);
    std::string local_key(buf);
    if (target != NULL) {
        local_key.append(target->key());
    }

    if (_plan_index != NULL && (*result = _plan_index->find(local_key)) != NULL) {
        _recording->recordInherited();
        return Error::OK;
    }

    std::string key;
    Error error = PlanCompiler::shapeKey(type, target, options()._max_depth, &key);
    if (error) {
        return error.inChunk(index());
    }

    PlanCompilation compilation(key, type, target, options());
    DecoderCache* cache = _local_cache != NULL ? _local_cache : _recording->cache();
    *result = cache->lookup(key, compilation);

    if (_plan_index != NULL) {
        _plan_index->put(local_key, *result);
    }
    return Error::OK;
}

Error ChunkContext::deserializer(const TypeDescriptor* type, const TargetShape* target, Deserializer** result) {
    DeserializerKey key(type->_id, target);
    std::map<DeserializerKey, Deserializer*>::const_iterator it = _deserializers.find(key);
    if (it != _deserializers.end()) {
        *result = it->second;
        return Error::OK;
    }

    const DecodePlan* plan = NULL;
    if (options().compiled()) {
        Error error = findPlan(type, target, &plan);
        if (error) {
            return error;
        }
    }

    Deserializer* deserializer = new Deserializer(this, type, target, plan);
    _deserializers[key] = deserializer;
    *result = deserializer;
    return Error::OK;
}

Error ChunkContext::decodeConstant(const TypeDescriptor* type, u64 offset, Value* result) {
    int max_depth = options()._max_depth;
    if (_resolve_depth >= max_depth) {
        return Error::format(ERR_DECODE_FAILURE, _header.offset + offset, "constant resolution nests deeper than %d",
                             max_depth).forType(type->_name).inChunk(index());
    }

    Deserializer* deserializer;
    Error error = this->deserializer(type, NULL, &deserializer);
    if (error) {
        return error;
    }

    ByteReader reader = _reader;
    reader.seek(offset);

    _resolve_depth++;
    error = deserializer->deserialize(reader, result);
    _resolve_depth--;
    return error;
}

Error ChunkContext::skipValue(const TypeDescriptor* type, ByteReader& reader) {
    Deserializer* deserializer;
    Error error = this->deserializer(type, NULL, &deserializer);
    if (error) {
        return error;
    }
    return deserializer->skip(reader);
}

Error ChunkContext::resolveString(u64 index, Value* result) {
    if (_string_pool != NULL && _string_pool->contains(index)) {
        return _string_pool->resolve(index, result);
    }
    if (index < (u64)_metadata->stringCount()) {
        *result = Value::ofString(_metadata->string((int)index));
        return Error::OK;
    }
    return Error::format(ERR_UNRESOLVED_CONSTANT, 0, "no string constant %llu", index)
        .forType("java.lang.String").inChunk(this->index());
}

LayoutRef ChunkContext::layout(const TypeDescriptor* type) {
    std::map<long long, LayoutRef>::const_iterator it = _layouts.find(type->_id);
    if (it != _layouts.end()) {
        return it->second;
    }

    RecordLayout* layout = new RecordLayout(type->_name);
    for (size_t i = 0; i < type->_fields.size(); i++) {
        layout->_field_names.push_back(type->_fields[i]->_name);
    }
    LayoutRef ref(layout);
    _layouts[type->_id] = ref;
    return ref;
}
