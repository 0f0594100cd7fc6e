/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _BYTEREADER_H
#define _BYTEREADER_H

#include <string.h>
#include <string>
#include "byteSource.h"
#include "error.h"
#include "varint.h"


enum StringEncoding {
    STRING_NULL       = 0,
    STRING_EMPTY      = 1,
    STRING_CONSTANT   = 2,
    STRING_UTF8       = 3,
    STRING_CHAR_ARRAY = 4,
    STRING_LATIN1     = 5
};

enum StringKind {
    STR_NULL,
    STR_VALUE,
    STR_REFERENCE
};

// Big-endian positional reader over a bounded slice [base, base + limit) of a ByteSource.
// Positions are relative to the slice. Reads past the slice, or malformed lengths,
// put the reader into a sticky failed state: every later read returns 0 and
// the position no longer moves. Callers check failed() at value boundaries.
// Not thread safe; copies are cheap and independent.
class ByteReader {
  private:
    const ByteSource* _source;
    u64 _base;
    u64 _limit;
    u64 _pos;
    u64 _mark;

    // Cached contiguous window of the current segment, in absolute offsets
    const u8* _window;
    u64 _window_start;
    u64 _window_end;

    ErrorKind _failure;
    const char* _failure_msg;
    u64 _failure_offset;

    void moveWindow(u64 absolute);
    bool fetchSlow(u8* dst, size_t length);
    u64 readVarintSlow();

    bool fetch(u8* dst, size_t length) {
        u64 absolute = _base + _pos;
        if (likely(absolute >= _window_start && absolute + length <= _window_end)) {
            memcpy(dst, _window + (absolute - _window_start), length);
            _pos += length;
            return true;
        }
        return fetchSlow(dst, length);
    }

  public:
    ByteReader();
    explicit ByteReader(const ByteSource* source);
    ByteReader(const ByteSource* source, u64 base, u64 limit);

    const ByteSource* source() const {
        return _source;
    }

    u64 base() const {
        return _base;
    }

    u64 limit() const {
        return _limit;
    }

    u64 position() const {
        return _pos;
    }

    // Offset within the whole recording
    u64 absolute() const {
        return _base + _pos;
    }

    u64 remaining() const {
        return _pos < _limit ? _limit - _pos : 0;
    }

    bool failed() const {
        return _failure != ERR_NONE;
    }

    ErrorKind failureKind() const {
        return _failure;
    }

    u64 failureOffset() const {
        return _failure_offset;
    }

    Error failure() const;

    void fail(ErrorKind kind, const char* msg);

    bool seek(u64 position);

    bool skip(u64 length);

    void mark() {
        _mark = _pos;
    }

    void reset() {
        _pos = _mark;
    }

    // Zero-copy view of [offset, offset + length) relative to this slice.
    // An out-of-range slice is returned already failed.
    ByteReader slice(u64 offset, u64 length) const;

    u8 readU8() {
        u64 absolute = _base + _pos;
        if (likely(absolute >= _window_start && absolute < _window_end)) {
            _pos++;
            return _window[absolute - _window_start];
        }
        u8 b;
        return fetchSlow(&b, 1) ? b : 0;
    }

    u16 readU16() {
        u8 b[2];
        if (!fetch(b, 2)) return 0;
        return (u16)(b[0] << 8 | b[1]);
    }

    u32 readU32() {
        u8 b[4];
        if (!fetch(b, 4)) return 0;
        return (u32)b[0] << 24 | (u32)b[1] << 16 | (u32)b[2] << 8 | (u32)b[3];
    }

    u64 readU64() {
        u64 hi = readU32();
        return hi << 32 | readU32();
    }

    float readF32() {
        union {
            u32 i;
            float f;
        } u;
        u.i = readU32();
        return u.f;
    }

    double readF64() {
        union {
            u64 i;
            double d;
        } u;
        u.i = readU64();
        return u.d;
    }

    u64 readVarint() {
        u64 absolute = _base + _pos;
        if (likely(absolute >= _window_start && absolute < _window_end)) {
            size_t pos = (size_t)(absolute - _window_start);
            u64 value;
            if (::readVarint(_window, &pos, (size_t)(_window_end - _window_start), &value)) {
                _pos = pos + _window_start - _base;
                return value;
            }
        }
        return readVarintSlow();
    }

    // Varint length prefix; must not exceed the remaining bytes of the slice
    u64 readLength();

    bool readBytes(u8* dst, size_t length) {
        return fetch(dst, length);
    }

    // Decodes any JFR string encoding into UTF-8. For STR_REFERENCE the
    // constant index is stored into ref and the caller resolves it.
    StringKind readString(std::string& out, u64* ref);
    void skipString();
};

#endif // _BYTEREADER_H
