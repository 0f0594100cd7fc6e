/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdarg.h>
#include <stdio.h>
#include "error.h"


// Predefined value that denotes successful operation
const Error Error::OK;

static const char* const KIND_NAME[] = {
    "OK",
    "IO",
    "UnexpectedEndOfData",
    "MalformedVarint",
    "InvalidMagic",
    "TruncatedHeader",
    "InconsistentChunk",
    "UnsupportedVersion",
    "UnsupportedMetadataElement",
    "InvalidMetadata",
    "DanglingTypeReference",
    "DuplicateTypeId",
    "InvalidCheckpoint",
    "UnresolvedConstant",
    "ConstantPoolCycle",
    "UnknownPrimitiveType",
    "DecodeFailure",
    "InvalidOption"
};

Error Error::format(ErrorKind kind, u64 offset, const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    return Error(kind, buf, offset);
}

const char* Error::kindName(ErrorKind kind) {
    if ((unsigned int)kind < sizeof(KIND_NAME) / sizeof(KIND_NAME[0])) {
        return KIND_NAME[kind];
    }
    return "Unknown";
}

std::string Error::describe() const {
    if (_kind == ERR_NONE) {
        return KIND_NAME[0];
    }

    std::string result(kindName(_kind));
    if (_cause != _kind) {
        result.append(" (").append(kindName(_cause)).append(")");
    }
    result.append(": ").append(_message);

    char location[96];
    if (_chunk != NO_CHUNK) {
        snprintf(location, sizeof(location), " [chunk %d, offset %llu", _chunk, _offset);
    } else {
        snprintf(location, sizeof(location), " [offset %llu", _offset);
    }
    result.append(location);
    if (!_type_name.empty()) {
        result.append(", type ").append(_type_name);
    }
    result.append("]");
    return result;
}
