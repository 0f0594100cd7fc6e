/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _DECODEPLAN_H
#define _DECODEPLAN_H

#include <map>
#include <string>
#include <vector>
#include "byteReader.h"
#include "jfrMetadata.h"
#include "parserOptions.h"
#include "targetShape.h"
#include "value.h"


class ChunkContext;
class ConstantPool;
class DecodePlan;

// Primitive codes match PrimitiveKind
enum PlanOpCode {
    OP_NONE     = PRIMITIVE_NONE,
    OP_BOOLEAN  = PRIMITIVE_BOOLEAN,
    OP_BYTE     = PRIMITIVE_BYTE,
    OP_CHAR     = PRIMITIVE_CHAR,
    OP_SHORT    = PRIMITIVE_SHORT,
    OP_INT      = PRIMITIVE_INT,
    OP_LONG     = PRIMITIVE_LONG,
    OP_FLOAT    = PRIMITIVE_FLOAT,
    OP_DOUBLE   = PRIMITIVE_DOUBLE,
    OP_STRING   = PRIMITIVE_STRING,
    OP_CONSTANT,
    OP_NESTED
};

struct PlanOp {
    PlanOpCode code;
    bool array;
    int pool_slot;      // OP_CONSTANT: index into PlanFrame::pools
    int target_slot;    // accessor of the target shape, -1 if the field is not extracted
    const DecodePlan* nested;
    std::string pool_type;
};

// Chunk-specific state a shared plan runs against
struct PlanFrame {
    ChunkContext* context;
    ConstantPool* const* pools;
    bool eager_constants;
    int max_depth;
};

// Precompiled decode routine for one type shape: an ordered list of field operations
// replayed without consulting the metadata. Plans hold no chunk state, so a plan
// compiled for one chunk serves every chunk with the same shape.
class DecodePlan {
  private:
    std::string _key;
    LayoutRef _layout;
    PlanOpCode _primitive;
    std::vector<PlanOp> _ops;
    bool _lazy;
    Error _error;

    // Root plan only: nested plans of the tree and the pool type of every slot
    std::vector<DecodePlan*> _nested;
    std::vector<std::string> _pool_types;

    friend class PlanCompiler;

    explicit DecodePlan(const std::string& type_name);

    Error decodeOp(const PlanFrame& frame, const PlanOp& op, ByteReader& reader, int depth, Value* result) const;
    Error decodeElement(const PlanFrame& frame, const PlanOp& op, ByteReader& reader, int depth, Value* result) const;
    Error skipOp(const PlanOp& op, ByteReader& reader, int depth, int max_depth, const PlanFrame* frame) const;

  public:
    ~DecodePlan();

    const std::string& key() const {
        return _key;
    }

    const LayoutRef& layout() const {
        return _layout;
    }

    const std::string& typeName() const {
        return _layout->_type_name;
    }

    // Set when the shape cannot be decoded, e.g. it contains an unknown primitive
    const Error& error() const {
        return _error;
    }

    bool isLazy() const {
        return _lazy;
    }

    int opCount() const {
        return (int)_ops.size();
    }

    int poolSlotCount() const {
        return (int)_pool_types.size();
    }

    const std::string& poolType(int slot) const {
        return _pool_types[slot];
    }

    Error decode(const PlanFrame& frame, ByteReader& reader, int depth, Value* result) const;
    Error decodeFields(const PlanFrame& frame, ByteReader& reader, int depth, std::vector<Value>& values) const;

    // Fills the target object through the accessors; fields without an accessor are skipped
    Error decodeInto(const PlanFrame& frame, ByteReader& reader, const TargetShape* target, void* object) const;

    // With a frame, constant pool indexes are checked against the frame's pools
    Error skip(ByteReader& reader, int depth, int max_depth, const PlanFrame* frame = NULL) const;
};


class PlanCompiler {
  private:
    const ParserOptions& _options;
    DecodePlan* _root;
    std::map<long long, DecodePlan*> _compiled;

    PlanCompiler(const ParserOptions& options) : _options(options), _root(NULL), _compiled() {
    }

    DecodePlan* compileType(const TypeDescriptor* type, int depth);
    void bindTarget(const TypeDescriptor* type, const TargetShape* target);
    int poolSlot(const std::string& type_name);

  public:
    // Structural key: field names, types, array and constant pool flags of the whole
    // reachable type graph, followed by the target key. Independent of type ids.
    static Error shapeKey(const TypeDescriptor* type, const TargetShape* target, int max_depth, std::string* key);

    // Never NULL; a shape that cannot be decoded yields a plan with error() set
    static DecodePlan* compile(const std::string& key, const TypeDescriptor* type,
                               const TargetShape* target, const ParserOptions& options);
};

#endif // _DECODEPLAN_H
