/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <set>
#include "constantPool.h"
#include "log.h"
#include "parserContext.h"


bool ConstantPool::addOffset(u64 index, u64 offset) {
    return _entries.insert(std::make_pair(index, Entry(offset))).second;
}

Error ConstantPool::resolve(u64 index, Value* result) {
    std::map<u64, Entry>::iterator it = _entries.find(index);
    if (it == _entries.end()) {
        return Error::format(ERR_UNRESOLVED_CONSTANT, 0, "no constant %llu in pool of %s", index, _type->_name.c_str())
            .forType(_type->_name).inChunk(_context->index());
    }

    Entry& entry = it->second;
    if (entry.state == RESOLVED) {
        *result = entry.value;
        return Error::OK;
    } else if (entry.state == RESOLVING) {
        return Error::format(ERR_CONSTANT_POOL_CYCLE, _context->header().offset + entry.offset,
                             "constant %llu of %s refers back to itself", index, _type->_name.c_str())
            .forType(_type->_name).inChunk(_context->index());
    }

    entry.state = RESOLVING;
    Value value;
    Error error = _context->decodeConstant(_type, entry.offset, &value);
    if (error) {
        entry.state = UNRESOLVED;
        return error;
    }

    entry.value = value;
    entry.state = RESOLVED;
    *result = value;
    return Error::OK;
}


ConstantPools::~ConstantPools() {
    for (std::map<long long, ConstantPool*>::iterator it = _pools.begin(); it != _pools.end(); ++it) {
        delete it->second;
    }
}

Error ConstantPools::index(ChunkContext* context, const ByteReader& chunk, const ChunkHeader& header) {
    if (header.cp_offset == 0) {
        return Error::OK;
    }

    std::set<u64> visited;
    u64 offset = header.cp_offset;
    int count = 0;

    while (true) {
        if (!visited.insert(offset).second) {
            return Error::format(ERR_INVALID_CHECKPOINT, chunk.base() + offset,
                                 "checkpoint chain loops back to +%llu", offset).inChunk(header.index);
        }

        ByteReader reader = chunk;
        reader.seek(offset);
        u64 size = reader.readVarint();
        if (reader.failed()) {
            return reader.failure().wrap(ERR_INVALID_CHECKPOINT).inChunk(header.index);
        }
        ByteReader checkpoint = chunk.slice(offset, size);
        if (size == 0 || checkpoint.failed()) {
            return Error::format(ERR_INVALID_CHECKPOINT, chunk.base() + offset,
                                 "checkpoint size %llu does not fit the chunk", size).inChunk(header.index);
        }
        checkpoint.seek(reader.position() - offset);

        long long delta = 0;
        Error error = readCheckpoint(context, checkpoint, &delta);
        if (error) {
            return error.inChunk(header.index);
        }
        count++;

        if (delta == 0) {
            break;
        }

        // Bounds are checked before adding, so no delta can wrap the offset
        u64 ahead = header.size > offset ? header.size - offset : 0;
        u64 behind = offset > CHUNK_HEADER_SIZE ? offset - CHUNK_HEADER_SIZE : 0;
        u64 distance = delta > 0 ? (u64)delta : (u64)(-(delta + 1)) + 1;
        if (delta > 0 ? distance >= ahead : distance > behind) {
            return Error::format(ERR_INVALID_CHECKPOINT, chunk.base() + offset,
                                 "next checkpoint delta %lld leaves the chunk", delta).inChunk(header.index);
        }
        offset = delta > 0 ? offset + distance : offset - distance;
    }

    Log::debug("Chunk %d: %d checkpoint(s), %d constant pool(s)", header.index, count, (int)_pools.size());
    return Error::OK;
}

Error ConstantPools::readCheckpoint(ChunkContext* context, ByteReader& checkpoint, long long* delta) {
    u64 type = checkpoint.readVarint();
    if (!checkpoint.failed() && type != T_CPOOL) {
        return Error::format(ERR_INVALID_CHECKPOINT, checkpoint.absolute(), "unexpected checkpoint event type %llu", type);
    }

    checkpoint.readVarint();  // start time
    checkpoint.readVarint();  // duration
    *delta = (long long)checkpoint.readVarint();
    checkpoint.readU8();      // flush / type mask

    u64 pool_count = checkpoint.readLength();
    for (u64 i = 0; i < pool_count && !checkpoint.failed(); i++) {
        u64 type_id;
        while ((type_id = checkpoint.readVarint()) == 0 && !checkpoint.failed()) {
            // Some writers emit stray zero type ids
            Log::debug("Skipping zero type id in checkpoint at %llu", checkpoint.absolute());
        }

        const TypeDescriptor* pool_type = context->metadata().type((long long)type_id);
        if (pool_type == NULL && !checkpoint.failed()) {
            return Error::format(ERR_INVALID_CHECKPOINT, checkpoint.absolute(),
                                 "constant pool of undeclared type id %llu", type_id);
        }

        u64 count = checkpoint.readLength();
        if (checkpoint.failed()) {
            break;
        }

        ConstantPool* pool = get(pool_type->_id);
        if (pool == NULL) {
            pool = new ConstantPool(context, pool_type);
            _pools[pool_type->_id] = pool;
        }

        for (u64 j = 0; j < count && !checkpoint.failed(); j++) {
            u64 index = checkpoint.readVarint();
            if (checkpoint.failed()) {
                break;
            }
            u64 position = checkpoint.absolute() - context->reader().base();
            if (!pool->addOffset(index, position)) {
                Log::debug("Duplicate constant %llu of %s, keeping the first", index, pool_type->_name.c_str());
            }

            Error error = context->skipValue(pool_type, checkpoint);
            if (error) {
                return checkpoint.failed() ? error.wrap(ERR_INVALID_CHECKPOINT) : error;
            }
        }
    }

    if (checkpoint.failed()) {
        return checkpoint.failure().wrap(ERR_INVALID_CHECKPOINT);
    }
    return Error::OK;
}
