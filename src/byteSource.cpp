/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include "byteSource.h"
#include "log.h"
#include "os.h"


int ByteSource::findSegment(u64 offset) const {
    int low = 0;
    int high = (int)_segments.size() - 1;

    while (low <= high) {
        int mid = (unsigned int)(low + high) >> 1;
        const Segment& s = _segments[mid];
        if (offset < s.start) {
            high = mid - 1;
        } else if (offset >= s.start + s.length) {
            low = mid + 1;
        } else {
            return mid;
        }
    }
    return -1;
}

bool ByteSource::copy(u64 offset, u8* dst, size_t length) const {
    if (offset > _size || length > _size - offset) {
        return false;
    }

    int index = findSegment(offset);
    while (length > 0) {
        if (index < 0 || index >= (int)_segments.size()) {
            return false;
        }
        const Segment& s = _segments[index];
        u64 from = offset - s.start;
        size_t chunk = s.length - from < length ? (size_t)(s.length - from) : length;
        memcpy(dst, s.data + from, chunk);
        dst += chunk;
        offset += chunk;
        length -= chunk;
        index++;
    }
    return true;
}


MemorySource::MemorySource(const void* data, size_t length, size_t segment_size) :
    ByteSource(), _bytes((const u8*)data, (const u8*)data + length) {
    if (segment_size == 0) {
        segment_size = DEFAULT_SEGMENT_SIZE;
    }
    for (size_t start = 0; start < length; start += segment_size) {
        size_t remaining = length - start;
        addSegment(_bytes.data() + start, remaining < segment_size ? remaining : segment_size);
    }
}


MappedFileSource::~MappedFileSource() {
    for (size_t i = 0; i < _maps.size(); i++) {
        munmap(_maps[i], _map_sizes[i]);
    }
}

Error MappedFileSource::open(const char* path, size_t segment_size, MappedFileSource** result) {
    int fd = ::open(path, O_RDONLY);
    if (fd == -1) {
        return Error::format(ERR_IO, 0, "Could not open %s: %s", path, strerror(errno));
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return Error::format(ERR_IO, 0, "Could not stat %s: %s", path, strerror(err));
    }

    // mmap offsets must be page aligned
    if (segment_size == 0) {
        segment_size = DEFAULT_SEGMENT_SIZE;
    }
    segment_size = (segment_size + OS::page_mask) & ~OS::page_mask;

    MappedFileSource* source = new MappedFileSource();
    u64 file_size = (u64)st.st_size;
    for (u64 start = 0; start < file_size; start += segment_size) {
        size_t length = file_size - start < segment_size ? (size_t)(file_size - start) : segment_size;
        void* addr = mmap(NULL, length, PROT_READ, MAP_PRIVATE, fd, (off_t)start);
        if (addr == MAP_FAILED) {
            int err = errno;
            ::close(fd);
            delete source;
            return Error::format(ERR_IO, start, "Could not map %s: %s", path, strerror(err));
        }
        source->_maps.push_back(addr);
        source->_map_sizes.push_back(length);
        source->addSegment((const u8*)addr, length);
    }
    ::close(fd);

    Log::debug("Mapped %s: %llu bytes in %d segment(s)", path, file_size, source->segmentCount());
    *result = source;
    return Error::OK;
}
