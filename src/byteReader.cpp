/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "byteReader.h"


static void appendUtf8(std::string& out, u32 c) {
    if (c < 0x80) {
        out.push_back((char)c);
    } else if (c < 0x800) {
        out.push_back((char)(0xc0 | c >> 6));
        out.push_back((char)(0x80 | (c & 0x3f)));
    } else if (c < 0x10000) {
        out.push_back((char)(0xe0 | c >> 12));
        out.push_back((char)(0x80 | (c >> 6 & 0x3f)));
        out.push_back((char)(0x80 | (c & 0x3f)));
    } else {
        out.push_back((char)(0xf0 | c >> 18));
        out.push_back((char)(0x80 | (c >> 12 & 0x3f)));
        out.push_back((char)(0x80 | (c >> 6 & 0x3f)));
        out.push_back((char)(0x80 | (c & 0x3f)));
    }
}

static inline bool isHighSurrogate(u32 c) {
    return c >= 0xd800 && c <= 0xdbff;
}

static inline bool isLowSurrogate(u32 c) {
    return c >= 0xdc00 && c <= 0xdfff;
}


ByteReader::ByteReader() :
    _source(NULL), _base(0), _limit(0), _pos(0), _mark(0),
    _window(NULL), _window_start(0), _window_end(0),
    _failure(ERR_NONE), _failure_msg(NULL), _failure_offset(0) {
}

ByteReader::ByteReader(const ByteSource* source) :
    _source(source), _base(0), _limit(source->size()), _pos(0), _mark(0),
    _window(NULL), _window_start(0), _window_end(0),
    _failure(ERR_NONE), _failure_msg(NULL), _failure_offset(0) {
}

ByteReader::ByteReader(const ByteSource* source, u64 base, u64 limit) :
    _source(source), _base(base), _limit(limit), _pos(0), _mark(0),
    _window(NULL), _window_start(0), _window_end(0),
    _failure(ERR_NONE), _failure_msg(NULL), _failure_offset(0) {
}

Error ByteReader::failure() const {
    if (_failure == ERR_NONE) {
        return Error::OK;
    }
    return Error(_failure, _failure_msg != NULL ? _failure_msg : "read failed", _failure_offset);
}

void ByteReader::fail(ErrorKind kind, const char* msg) {
    if (_failure == ERR_NONE) {
        _failure = kind;
        _failure_msg = msg;
        _failure_offset = _base + _pos;
    }
    // Disable the fast path for good
    _window = NULL;
    _window_start = _window_end = 0;
}

void ByteReader::moveWindow(u64 absolute) {
    int index = _source != NULL ? _source->findSegment(absolute) : -1;
    if (index < 0) {
        _window = NULL;
        _window_start = _window_end = 0;
        return;
    }

    const Segment& s = _source->segment(index);
    u64 end = s.start + s.length;
    u64 slice_end = _base + _limit;
    _window = s.data;
    _window_start = s.start;
    _window_end = end < slice_end ? end : slice_end;
}

bool ByteReader::fetchSlow(u8* dst, size_t length) {
    if (_failure != ERR_NONE) {
        memset(dst, 0, length);
        return false;
    }
    if (length > remaining()) {
        fail(ERR_UNEXPECTED_END_OF_DATA, "unexpected end of data");
        memset(dst, 0, length);
        return false;
    }

    u64 absolute = _base + _pos;
    moveWindow(absolute);
    if (absolute >= _window_start && absolute + length <= _window_end) {
        memcpy(dst, _window + (absolute - _window_start), length);
    } else if (!_source->copy(absolute, dst, length)) {
        // Slice declared beyond the end of its source
        fail(ERR_UNEXPECTED_END_OF_DATA, "unexpected end of data");
        memset(dst, 0, length);
        return false;
    }
    _pos += length;
    return true;
}

u64 ByteReader::readVarintSlow() {
    u64 result = 0;
    for (int shift = 0; shift < 56; shift += 7) {
        u8 b = readU8();
        if (_failure != ERR_NONE) {
            return 0;
        }
        result |= (u64)(b & 0x7f) << shift;
        if ((b & 0x80) == 0) {
            return result;
        }
    }
    u8 last = readU8();
    return _failure != ERR_NONE ? 0 : result | (u64)last << 56;
}

u64 ByteReader::readLength() {
    u64 length = readVarint();
    if (_failure != ERR_NONE) {
        return 0;
    }
    if (length > remaining()) {
        fail(ERR_MALFORMED_VARINT, "decoded length exceeds remaining bytes");
        return 0;
    }
    return length;
}

bool ByteReader::seek(u64 position) {
    if (_failure != ERR_NONE) {
        return false;
    }
    if (position > _limit) {
        fail(ERR_UNEXPECTED_END_OF_DATA, "seek past end of data");
        return false;
    }
    _pos = position;
    return true;
}

bool ByteReader::skip(u64 length) {
    if (_failure != ERR_NONE) {
        return false;
    }
    if (length > remaining()) {
        fail(ERR_UNEXPECTED_END_OF_DATA, "unexpected end of data");
        return false;
    }
    _pos += length;
    return true;
}

ByteReader ByteReader::slice(u64 offset, u64 length) const {
    ByteReader result(_source, _base + (offset < _limit ? offset : _limit), 0);
    if (_failure != ERR_NONE) {
        result._failure = _failure;
        result._failure_msg = _failure_msg;
        result._failure_offset = _failure_offset;
    } else if (offset > _limit || length > _limit - offset) {
        result._failure = ERR_UNEXPECTED_END_OF_DATA;
        result._failure_msg = "slice exceeds readable region";
        result._failure_offset = _base + offset;
    } else {
        result._limit = length;
    }
    return result;
}

StringKind ByteReader::readString(std::string& out, u64* ref) {
    out.clear();
    u8 encoding = readU8();
    if (_failure != ERR_NONE) {
        return STR_NULL;
    }

    switch (encoding) {
        case STRING_NULL:
            return STR_NULL;

        case STRING_EMPTY:
            return STR_VALUE;

        case STRING_CONSTANT:
            *ref = readVarint();
            return _failure != ERR_NONE ? STR_NULL : STR_REFERENCE;

        case STRING_UTF8: {
            size_t length = (size_t)readLength();
            if (length > 0) {
                out.resize(length);
                readBytes((u8*)&out[0], length);
            }
            break;
        }

        case STRING_CHAR_ARRAY: {
            u64 length = readLength();
            out.reserve((size_t)length);
            u32 pending = 0;
            for (u64 i = 0; i < length && _failure == ERR_NONE; i++) {
                u32 c = (u32)(readVarint() & 0xffff);
                if (pending != 0) {
                    if (isLowSurrogate(c)) {
                        appendUtf8(out, 0x10000 + ((pending - 0xd800) << 10) + (c - 0xdc00));
                        pending = 0;
                        continue;
                    }
                    appendUtf8(out, 0xfffd);
                    pending = 0;
                }
                if (isHighSurrogate(c)) {
                    pending = c;
                } else if (isLowSurrogate(c)) {
                    appendUtf8(out, 0xfffd);
                } else {
                    appendUtf8(out, c);
                }
            }
            if (pending != 0) {
                appendUtf8(out, 0xfffd);
            }
            break;
        }

        case STRING_LATIN1: {
            u64 length = readLength();
            out.reserve((size_t)length);
            for (u64 i = 0; i < length && _failure == ERR_NONE; i++) {
                appendUtf8(out, readU8());
            }
            break;
        }

        default:
            fail(ERR_MALFORMED_VARINT, "unknown string encoding");
            return STR_NULL;
    }

    if (_failure != ERR_NONE) {
        out.clear();
        return STR_NULL;
    }
    return STR_VALUE;
}

void ByteReader::skipString() {
    u8 encoding = readU8();
    switch (encoding) {
        case STRING_NULL:
        case STRING_EMPTY:
            break;
        case STRING_CONSTANT:
            readVarint();
            break;
        case STRING_UTF8:
        case STRING_LATIN1:
            skip(readLength());
            break;
        case STRING_CHAR_ARRAY: {
            u64 length = readLength();
            for (u64 i = 0; i < length && _failure == ERR_NONE; i++) {
                readVarint();
            }
            break;
        }
        default:
            fail(ERR_MALFORMED_VARINT, "unknown string encoding");
    }
}
