/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "targetShape.h"


static const char* const KIND_NAME[] = {
    "int",
    "long",
    "float",
    "double",
    "boolean",
    "string",
    "value"
};

TargetShape::~TargetShape() {
    for (size_t i = 0; i < _accessors.size(); i++) {
        delete _accessors[i].setter;
    }
}

void TargetShape::add(const char* field, TargetKind kind, FieldSetter* setter) {
    TargetAccessor accessor = {field, kind, setter};
    _accessors.push_back(accessor);

    if (!_key.empty()) _key.push_back(',');
    _key.append(field).append(":").append(KIND_NAME[kind]);
}

const char* TargetShape::kindName(TargetKind kind) {
    return KIND_NAME[kind];
}
