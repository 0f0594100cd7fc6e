/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chunkHeader.h"
#include "log.h"


u64 ChunkHeader::ticksToNanos(u64 ticks) const {
    if (frequency == 0 || ticks < start_ticks) {
        return start_nanos;
    }
    u64 delta = ticks - start_ticks;
    if (frequency == 1000000000) {
        return start_nanos + delta;
    }
    return start_nanos + (u64)((double)delta * 1e9 / (double)frequency);
}

Error readChunkHeader(ByteReader& reader, int index, ChunkHeader* header) {
    u64 start = reader.absolute();
    if (reader.remaining() < CHUNK_HEADER_SIZE) {
        return Error::format(ERR_TRUNCATED_HEADER, start, "%llu bytes left, chunk header needs %llu",
                             reader.remaining(), CHUNK_HEADER_SIZE).inChunk(index);
    }

    u32 magic = reader.readU32();
    if (magic != CHUNK_MAGIC) {
        return Error::format(ERR_INVALID_MAGIC, start, "bad chunk magic 0x%08x", magic).inChunk(index);
    }

    header->index = index;
    header->offset = start;
    header->major = reader.readU16();
    header->minor = reader.readU16();
    header->size = reader.readU64();
    header->cp_offset = reader.readU64();
    header->meta_offset = reader.readU64();
    header->start_nanos = reader.readU64();
    header->duration = reader.readU64();
    header->start_ticks = reader.readU64();
    header->frequency = reader.readU64();
    header->features = reader.readU32();

    if (reader.failed()) {
        return reader.failure().wrap(ERR_TRUNCATED_HEADER).inChunk(index);
    }

    if (header->major != 1 && header->major != 2) {
        return Error::format(ERR_UNSUPPORTED_VERSION, start, "unsupported format version %d.%d",
                             header->major, header->minor).inChunk(index);
    }

    u64 available = reader.limit() - (start - reader.base());
    if (header->size < CHUNK_HEADER_SIZE || header->size > available) {
        return Error::format(ERR_INCONSISTENT_CHUNK, start, "chunk size %llu does not fit %llu available bytes",
                             header->size, available).inChunk(index);
    }
    if (header->meta_offset < CHUNK_HEADER_SIZE || header->meta_offset >= header->size) {
        return Error::format(ERR_INCONSISTENT_CHUNK, start, "metadata offset %llu outside chunk of %llu bytes",
                             header->meta_offset, header->size).inChunk(index);
    }
    if (header->cp_offset != 0 && (header->cp_offset < CHUNK_HEADER_SIZE || header->cp_offset >= header->size)) {
        return Error::format(ERR_INCONSISTENT_CHUNK, start, "constant pool offset %llu outside chunk of %llu bytes",
                             header->cp_offset, header->size).inChunk(index);
    }

    if (!header->compressedInts()) {
        Log::warn("Chunk %d does not declare compressed integers, reading them compressed anyway", index);
    }
    if ((header->features & ~FEATURE_KNOWN_MASK) != 0) {
        Log::debug("Chunk %d has unknown feature bits 0x%x", index, header->features & ~FEATURE_KNOWN_MASK);
    }
    return Error::OK;
}

Error ChunkIterator::next(ChunkHeader* header, ByteReader* chunk) {
    ByteReader reader(_source);
    reader.seek(_offset);

    Error error = readChunkHeader(reader, _index, header);
    if (error) {
        _failed = true;
        return error;
    }

    Log::debug("Chunk %d at %llu: version %d.%d, %llu bytes, metadata at +%llu, constants at +%llu",
               _index, _offset, header->major, header->minor, header->size, header->meta_offset, header->cp_offset);

    *chunk = ByteReader(_source, _offset, header->size);
    chunk->seek(CHUNK_HEADER_SIZE);

    _offset += header->size;
    _index++;
    return Error::OK;
}
