/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _CHUNKHEADER_H
#define _CHUNKHEADER_H

#include "byteReader.h"
#include "error.h"


const u32 CHUNK_MAGIC = 0x464c5200;  // "FLR\0"
const u64 CHUNK_HEADER_SIZE = 68;

enum ChunkFeature {
    FEATURE_COMPRESSED_INTS = 0x1,
    FEATURE_FINAL_CHUNK     = 0x2,
    FEATURE_KNOWN_MASK      = 0x3
};

struct ChunkHeader {
    int index;
    u64 offset;        // absolute position of the chunk in the recording
    u16 major;
    u16 minor;
    u64 size;
    u64 cp_offset;     // relative to the chunk start, 0 if the chunk has no constant pools
    u64 meta_offset;   // relative to the chunk start
    u64 start_nanos;
    u64 duration;
    u64 start_ticks;
    u64 frequency;
    u32 features;

    bool compressedInts() const {
        return (features & FEATURE_COMPRESSED_INTS) != 0;
    }

    bool isFinal() const {
        return (features & FEATURE_FINAL_CHUNK) != 0;
    }

    // Converts a tick timestamp of this chunk into nanoseconds since epoch
    u64 ticksToNanos(u64 ticks) const;
};

// Reads and validates the header at the current position of the reader
Error readChunkHeader(ByteReader& reader, int index, ChunkHeader* header);

// Walks a recording one chunk at a time. Stops at the first framing error.
class ChunkIterator {
  private:
    const ByteSource* _source;
    u64 _offset;
    int _index;
    bool _failed;

  public:
    explicit ChunkIterator(const ByteSource* source) : _source(source), _offset(0), _index(0), _failed(false) {
    }

    bool hasNext() const {
        return !_failed && _offset < _source->size();
    }

    int index() const {
        return _index;
    }

    // On success, chunk is a reader bounded to the chunk bytes, positioned after the header
    Error next(ChunkHeader* header, ByteReader* chunk);
};

#endif // _CHUNKHEADER_H
