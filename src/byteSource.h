/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _BYTESOURCE_H
#define _BYTESOURCE_H

#include <stddef.h>
#include <vector>
#include "arch.h"
#include "error.h"


const size_t DEFAULT_SEGMENT_SIZE = 1UL << 30;  // 1 GB per mapping

struct Segment {
    u64 start;
    u64 length;
    const u8* data;
};

// Immutable recording bytes, possibly spread over several segments.
// Readers see one continuous address space [0, size()).
class ByteSource {
  protected:
    std::vector<Segment> _segments;
    u64 _size;

    ByteSource() : _segments(), _size(0) {
    }

    void addSegment(const u8* data, u64 length) {
        Segment s = {_size, length, data};
        _segments.push_back(s);
        _size += length;
    }

  public:
    virtual ~ByteSource() {
    }

    u64 size() const {
        return _size;
    }

    int segmentCount() const {
        return (int)_segments.size();
    }

    const Segment& segment(int index) const {
        return _segments[index];
    }

    // Index of the segment containing the given offset, or -1
    int findSegment(u64 offset) const;

    // Copies [offset, offset + length) into dst; false if the range is outside the source
    bool copy(u64 offset, u8* dst, size_t length) const;
};

// Owns a private copy of the bytes. A small segment size makes every
// multi-byte read likely to cross a segment boundary.
class MemorySource : public ByteSource {
  private:
    std::vector<u8> _bytes;

  public:
    MemorySource(const void* data, size_t length, size_t segment_size = DEFAULT_SEGMENT_SIZE);
};

// Read-only file mapping, one mmap per segment
class MappedFileSource : public ByteSource {
  private:
    std::vector<void*> _maps;
    std::vector<size_t> _map_sizes;

    MappedFileSource() : ByteSource(), _maps(), _map_sizes() {
    }

  public:
    ~MappedFileSource();

    static Error open(const char* path, size_t segment_size, MappedFileSource** result);
};

#endif // _BYTESOURCE_H
