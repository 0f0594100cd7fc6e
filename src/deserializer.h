/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _DESERIALIZER_H
#define _DESERIALIZER_H

#include <vector>
#include "decodePlan.h"
#include "jfrMetadata.h"
#include "targetShape.h"
#include "value.h"


class ChunkContext;
class ConstantPool;

// Metadata-driven interpreter: walks the field descriptors of a type for every value.
// Reader failures are left in the reader; callers check failed() at value boundaries.
class GenericReader {
  public:
    static Error readPrimitive(ChunkContext* context, PrimitiveKind kind, ByteReader& reader, Value* result);
    static void skipPrimitive(PrimitiveKind kind, ByteReader& reader);

    // Reads a constant pool index; the entry must exist even if it is not resolved yet
    static Error readConstant(ConstantPool* pool, const std::string& pool_type, ByteReader& reader,
                              bool eager, Value* result);

    static Error read(ChunkContext* context, const TypeDescriptor* type, ByteReader& reader,
                      int depth, bool lazy, Value* result);
    static Error readFields(ChunkContext* context, const TypeDescriptor* type, ByteReader& reader,
                            int depth, bool lazy, std::vector<Value>& values);
    static Error readField(ChunkContext* context, const FieldDescriptor* field, ByteReader& reader,
                           int depth, bool lazy, Value* result);

    // Reads a constant pool index and checks that the entry exists
    static Error skipConstant(ConstantPool* pool, const std::string& pool_type, ByteReader& reader);

    // With a context, constant pool indexes are checked against the chunk's pools
    static Error skip(const TypeDescriptor* type, ByteReader& reader, int depth, int max_depth,
                      ChunkContext* context = NULL);
};

// Keeps the bytes of a record and decodes its fields on first access.
// Valid while the chunk it was read from is being parsed.
class LazyRecord : public Record {
  private:
    PlanFrame _frame;
    const DecodePlan* _plan;
    const TypeDescriptor* _type;
    ByteReader _reader;
    int _depth;
    mutable bool _decoded;
    mutable Error _error;
    mutable std::vector<Value> _values;

    void decode() const;

  public:
    LazyRecord(const PlanFrame& frame, const DecodePlan* plan, const ByteReader& reader, int depth);
    LazyRecord(ChunkContext* context, const TypeDescriptor* type, const LayoutRef& layout,
               const ByteReader& reader, int depth);

    bool isLazy() const {
        return true;
    }

    using Record::field;

    Error field(int index, Value* result) const;
};

// Attaches the type name to an error and reports short reads as DecodeFailure
Error decodeError(Error error, const std::string& type_name);


// Decoder of one type within one chunk, optionally into a caller's target shape.
// Runs a shared DecodePlan in the compiled tiers, the GenericReader otherwise.
class Deserializer {
  private:
    ChunkContext* _context;
    const TypeDescriptor* _type;
    const TargetShape* _target;
    const DecodePlan* _plan;
    std::vector<ConstantPool*> _pools;
    bool _bound;
    bool _lazy;

    void bind();
    PlanFrame frame();
    Error finish(Error error, ByteReader& reader, u64 start) const;

  public:
    Deserializer(ChunkContext* context, const TypeDescriptor* type, const TargetShape* target, const DecodePlan* plan);

    const TypeDescriptor* type() const {
        return _type;
    }

    const TargetShape* target() const {
        return _target;
    }

    const DecodePlan* plan() const {
        return _plan;
    }

    Error deserialize(ByteReader& reader, Value* result);

    // Requires a target shape
    Error deserialize(ByteReader& reader, void* object);

    Error skip(ByteReader& reader);
};

#endif // _DESERIALIZER_H
