/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _ERROR_H
#define _ERROR_H

#include <string>
#include "arch.h"

#ifdef __GNUC__
#define ERROR_FORMAT __attribute__((format(printf, 3, 4)))
#else
#define ERROR_FORMAT
#endif


enum ErrorKind {
    ERR_NONE,

    // Framing
    ERR_IO,
    ERR_UNEXPECTED_END_OF_DATA,
    ERR_MALFORMED_VARINT,
    ERR_INVALID_MAGIC,
    ERR_TRUNCATED_HEADER,
    ERR_INCONSISTENT_CHUNK,
    ERR_UNSUPPORTED_VERSION,

    // Metadata
    ERR_UNSUPPORTED_METADATA_ELEMENT,
    ERR_INVALID_METADATA,
    ERR_DANGLING_TYPE_REFERENCE,
    ERR_DUPLICATE_TYPE_ID,

    // Constant pools
    ERR_INVALID_CHECKPOINT,
    ERR_UNRESOLVED_CONSTANT,
    ERR_CONSTANT_POOL_CYCLE,

    // Values
    ERR_UNKNOWN_PRIMITIVE_TYPE,
    ERR_DECODE_FAILURE,

    ERR_INVALID_OPTION
};

const int NO_CHUNK = -1;

// Result of a fallible operation. Evaluates to true when an error occurred.
// Besides the message, an error remembers where it happened: chunk index,
// byte offset (absolute within the recording when known) and the type being decoded.
class Error {
  private:
    ErrorKind _kind;
    ErrorKind _cause;
    std::string _message;
    int _chunk;
    u64 _offset;
    std::string _type_name;

  public:
    static const Error OK;

    Error() : _kind(ERR_NONE), _cause(ERR_NONE), _message(), _chunk(NO_CHUNK), _offset(0), _type_name() {
    }

    Error(ErrorKind kind, const std::string& message, u64 offset = 0) :
        _kind(kind), _cause(kind), _message(message), _chunk(NO_CHUNK), _offset(offset), _type_name() {
    }

    static Error ERROR_FORMAT format(ErrorKind kind, u64 offset, const char* fmt, ...);

    ErrorKind kind() const {
        return _kind;
    }

    // The kind of the innermost failure, e.g. UnexpectedEndOfData behind a DecodeFailure
    ErrorKind cause() const {
        return _cause;
    }

    const std::string& message() const {
        return _message;
    }

    int chunk() const {
        return _chunk;
    }

    u64 offset() const {
        return _offset;
    }

    const std::string& typeName() const {
        return _type_name;
    }

    operator bool() const {
        return _kind != ERR_NONE;
    }

    Error& inChunk(int chunk) {
        if (_chunk == NO_CHUNK) _chunk = chunk;
        return *this;
    }

    Error& forType(const std::string& type_name) {
        if (_type_name.empty()) _type_name = type_name;
        return *this;
    }

    Error& at(u64 offset) {
        _offset = offset;
        return *this;
    }

    // Re-labels the error while keeping the original kind as the cause
    Error& wrap(ErrorKind kind) {
        if (_kind != ERR_NONE) {
            _kind = kind;
        }
        return *this;
    }

    std::string describe() const;

    static const char* kindName(ErrorKind kind);
};

#endif // _ERROR_H
