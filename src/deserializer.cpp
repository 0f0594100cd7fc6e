/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "constantPool.h"
#include "deserializer.h"
#include "parserContext.h"


static Error nestingError(const std::string& type_name, u64 offset, int max_depth) {
    return Error::format(ERR_DECODE_FAILURE, offset, "value nesting exceeds %d levels", max_depth).forType(type_name);
}

Error decodeError(Error error, const std::string& type_name) {
    if (error.kind() == ERR_UNEXPECTED_END_OF_DATA || error.kind() == ERR_MALFORMED_VARINT) {
        error.wrap(ERR_DECODE_FAILURE);
    }
    return error.forType(type_name);
}


Error GenericReader::readPrimitive(ChunkContext* context, PrimitiveKind kind, ByteReader& reader, Value* result) {
    switch (kind) {
        case PRIMITIVE_BOOLEAN:
            *result = Value::ofBoolean(reader.readU8() != 0);
            break;
        case PRIMITIVE_BYTE:
            *result = Value::ofLong((signed char)reader.readU8());
            break;
        case PRIMITIVE_CHAR:
            *result = Value::ofLong((long long)(reader.readVarint() & 0xffff));
            break;
        case PRIMITIVE_SHORT:
            *result = Value::ofLong((short)reader.readVarint());
            break;
        case PRIMITIVE_INT:
            *result = Value::ofLong((int)reader.readVarint());
            break;
        case PRIMITIVE_LONG:
            *result = Value::ofLong((long long)reader.readVarint());
            break;
        case PRIMITIVE_FLOAT:
            *result = Value::ofDouble(reader.readF32());
            break;
        case PRIMITIVE_DOUBLE:
            *result = Value::ofDouble(reader.readF64());
            break;
        case PRIMITIVE_STRING: {
            std::string s;
            u64 ref = 0;
            StringKind string_kind = reader.readString(s, &ref);
            if (string_kind == STR_REFERENCE) {
                return context->resolveString(ref, result);
            }
            *result = string_kind == STR_VALUE ? Value::ofString(s) : Value();
            break;
        }
        default:
            return Error(ERR_UNKNOWN_PRIMITIVE_TYPE, "no decoder for primitive", reader.absolute());
    }
    return Error::OK;
}

void GenericReader::skipPrimitive(PrimitiveKind kind, ByteReader& reader) {
    switch (kind) {
        case PRIMITIVE_BOOLEAN:
        case PRIMITIVE_BYTE:
            reader.skip(1);
            break;
        case PRIMITIVE_FLOAT:
            reader.skip(4);
            break;
        case PRIMITIVE_DOUBLE:
            reader.skip(8);
            break;
        case PRIMITIVE_STRING:
            reader.skipString();
            break;
        default:
            reader.readVarint();
    }
}

static Error unresolved(u64 index, const std::string& pool_type, u64 offset) {
    return Error::format(ERR_UNRESOLVED_CONSTANT, offset, "no constant %llu in pool of %s", index, pool_type.c_str())
        .forType(pool_type);
}

Error GenericReader::skipConstant(ConstantPool* pool, const std::string& pool_type, ByteReader& reader) {
    u64 offset = reader.absolute();
    u64 index = reader.readVarint();
    if (!reader.failed() && (pool == NULL || !pool->contains(index))) {
        return unresolved(index, pool_type, offset);
    }
    return Error::OK;
}

Error GenericReader::readConstant(ConstantPool* pool, const std::string& pool_type, ByteReader& reader,
                                  bool eager, Value* result) {
    u64 offset = reader.absolute();
    u64 index = reader.readVarint();
    if (reader.failed()) {
        return Error::OK;
    }
    if (pool == NULL || !pool->contains(index)) {
        return unresolved(index, pool_type, offset);
    }
    if (eager) {
        return pool->resolve(index, result);
    }
    *result = Value::ofConstant(pool, index);
    return Error::OK;
}

static Error readElement(ChunkContext* context, const FieldDescriptor* field, ByteReader& reader,
                         int depth, bool lazy, Value* result) {
    const TypeDescriptor* type = field->type();
    if (field->_constant_pool) {
        return GenericReader::readConstant(context->pool(type->_id), type->_name, reader,
                                           context->options().eagerConstants(), result);
    } else if (type->isPrimitive()) {
        return GenericReader::readPrimitive(context, type->_primitive, reader, result);
    }
    return GenericReader::read(context, type, reader, depth + 1, lazy, result);
}

Error GenericReader::read(ChunkContext* context, const TypeDescriptor* type, ByteReader& reader,
                          int depth, bool lazy, Value* result) {
    int max_depth = context->options()._max_depth;
    if (depth > max_depth) {
        return nestingError(type->_name, reader.absolute(), max_depth);
    }

    if (type->isPrimitive()) {
        return readPrimitive(context, type->_primitive, reader, result);
    } else if (type->isUnknownPrimitive()) {
        return Error(ERR_UNKNOWN_PRIMITIVE_TYPE, "unknown primitive type " + type->_name, reader.absolute())
            .forType(type->_name);
    }

    // Broken references fail now, not when the record is first accessed
    if (lazy) {
        u64 start = reader.position();
        Error error = skip(type, reader, depth, max_depth, context);
        if (error || reader.failed()) {
            return error;
        }
        ByteReader fields = reader.slice(start, reader.position() - start);
        *result = Value::ofRecord(RecordRef(new LazyRecord(context, type, context->layout(type), fields, depth)));
        return Error::OK;
    }

    std::vector<Value> values;
    Error error = readFields(context, type, reader, depth, false, values);
    if (error) {
        return error;
    }
    *result = Value::ofRecord(RecordRef(new EagerRecord(context->layout(type), values)));
    return Error::OK;
}

Error GenericReader::readFields(ChunkContext* context, const TypeDescriptor* type, ByteReader& reader,
                                int depth, bool lazy, std::vector<Value>& values) {
    values.resize(type->_fields.size());
    for (size_t i = 0; i < type->_fields.size(); i++) {
        Error error = readField(context, type->_fields[i], reader, depth, lazy, &values[i]);
        if (error) {
            return error;
        }
        if (reader.failed()) {
            break;
        }
    }
    return Error::OK;
}

Error GenericReader::readField(ChunkContext* context, const FieldDescriptor* field, ByteReader& reader,
                               int depth, bool lazy, Value* result) {
    if (!field->isArray()) {
        return readElement(context, field, reader, depth, lazy, result);
    }

    u64 length = reader.readLength();
    std::vector<Value>* elements = new std::vector<Value>((size_t)length);
    ArrayRef ref(elements);
    for (size_t i = 0; i < elements->size() && !reader.failed(); i++) {
        Error error = readElement(context, field, reader, depth, lazy, &(*elements)[i]);
        if (error) {
            return error;
        }
    }
    *result = Value::ofArray(ref);
    return Error::OK;
}

Error GenericReader::skip(const TypeDescriptor* type, ByteReader& reader, int depth, int max_depth,
                          ChunkContext* context) {
    if (depth > max_depth) {
        return nestingError(type->_name, reader.absolute(), max_depth);
    }

    if (type->isPrimitive()) {
        skipPrimitive(type->_primitive, reader);
        return Error::OK;
    } else if (type->isUnknownPrimitive()) {
        return Error(ERR_UNKNOWN_PRIMITIVE_TYPE, "unknown primitive type " + type->_name, reader.absolute())
            .forType(type->_name);
    }

    for (size_t i = 0; i < type->_fields.size() && !reader.failed(); i++) {
        const FieldDescriptor* field = type->_fields[i];
        const TypeDescriptor* field_type = field->type();
        u64 count = field->isArray() ? reader.readLength() : 1;
        for (u64 j = 0; j < count && !reader.failed(); j++) {
            if (field->_constant_pool && context == NULL) {
                reader.readVarint();
            } else if (field->_constant_pool) {
                Error error = skipConstant(context->pool(field_type->_id), field_type->_name, reader);
                if (error) {
                    return error;
                }
            } else if (field_type->isPrimitive()) {
                skipPrimitive(field_type->_primitive, reader);
            } else {
                Error error = skip(field_type, reader, depth + 1, max_depth, context);
                if (error) {
                    return error;
                }
            }
        }
    }
    return Error::OK;
}


LazyRecord::LazyRecord(const PlanFrame& frame, const DecodePlan* plan, const ByteReader& reader, int depth) :
    Record(plan->layout()), _frame(frame), _plan(plan), _type(NULL), _reader(reader), _depth(depth),
    _decoded(false), _error(), _values() {
}

LazyRecord::LazyRecord(ChunkContext* context, const TypeDescriptor* type, const LayoutRef& layout,
                       const ByteReader& reader, int depth) :
    Record(layout), _frame(), _plan(NULL), _type(type), _reader(reader), _depth(depth),
    _decoded(false), _error(), _values() {
    _frame.context = context;
    _frame.pools = NULL;
    _frame.eager_constants = false;
    _frame.max_depth = context->options()._max_depth;
}

void LazyRecord::decode() const {
    ByteReader reader = _reader;
    Error error = _plan != NULL
        ? _plan->decodeFields(_frame, reader, _depth, _values)
        : GenericReader::readFields(_frame.context, _type, reader, _depth, true, _values);
    if (!error && reader.failed()) {
        error = reader.failure();
    }
    if (error) {
        _error = decodeError(error, typeName()).inChunk(_frame.context->index());
    }
    _decoded = true;
}

Error LazyRecord::field(int index, Value* result) const {
    if (!_decoded) {
        decode();
    }
    if (_error) {
        return _error;
    }
    *result = _values[index];
    return Error::OK;
}


Deserializer::Deserializer(ChunkContext* context, const TypeDescriptor* type, const TargetShape* target,
                           const DecodePlan* plan) :
    _context(context), _type(type), _target(target), _plan(plan), _pools(), _bound(plan == NULL),
    _lazy(plan == NULL && context->options()._strategy == STRATEGY_LAZY && !context->options().eagerConstants()) {
}

// Pools are looked up by type name, since a plan may be shared by chunks with different type ids
void Deserializer::bind() {
    if (_bound) {
        return;
    }
    for (int i = 0; i < _plan->poolSlotCount(); i++) {
        const TypeDescriptor* type = _context->metadata().type(_plan->poolType(i));
        _pools.push_back(type != NULL ? _context->pool(type->_id) : NULL);
    }
    _bound = true;
}

PlanFrame Deserializer::frame() {
    PlanFrame frame;
    frame.context = _context;
    frame.pools = _pools.empty() ? NULL : &_pools[0];
    frame.eager_constants = _context->options().eagerConstants();
    frame.max_depth = _context->options()._max_depth;
    return frame;
}

Error Deserializer::finish(Error error, ByteReader& reader, u64 start) const {
    if (!error && reader.failed()) {
        error = reader.failure();
    }
    if (!error) {
        return Error::OK;
    }
    error = decodeError(error, _type->_name);
    error.inChunk(_context->index());
    if (error.offset() == 0) {
        error.at(start);
    }
    return error;
}

Error Deserializer::deserialize(ByteReader& reader, Value* result) {
    u64 start = reader.absolute();
    Error error;
    if (_plan != NULL) {
        bind();
        error = _plan->decode(frame(), reader, 0, result);
    } else {
        error = GenericReader::read(_context, _type, reader, 0, _lazy, result);
    }
    return finish(error, reader, start);
}

Error Deserializer::deserialize(ByteReader& reader, void* object) {
    u64 start = reader.absolute();
    if (_target == NULL) {
        return Error(ERR_DECODE_FAILURE, "no target shape to decode into", start).forType(_type->_name);
    }

    if (_plan != NULL) {
        bind();
        return finish(_plan->decodeInto(frame(), reader, _target, object), reader, start);
    }

    Value value;
    Error error = GenericReader::read(_context, _type, reader, 0, false, &value);
    if (error || reader.failed()) {
        return finish(error, reader, start);
    }

    const Record* record = value.record();
    if (record == NULL) {
        return finish(Error(ERR_DECODE_FAILURE, "a primitive value cannot fill " + _target->name(), reader.absolute()),
                      reader, start);
    }

    for (int i = 0; i < _target->accessorCount(); i++) {
        const TargetAccessor& accessor = _target->accessor(i);
        Value field;
        Value resolved;
        if ((error = record->field(accessor.name, &field))) {
            break;
        }
        if (accessor.kind == TARGET_VALUE) {
            resolved = field;
        } else if ((error = field.resolve(&resolved))) {
            break;
        }
        if (!accessor.setter->set(object, resolved)) {
            error = Error::format(ERR_DECODE_FAILURE, reader.absolute(), "field %s does not fit a %s member of %s",
                                  accessor.name.c_str(), TargetShape::kindName(accessor.kind), _target->name().c_str());
            break;
        }
    }
    return finish(error, reader, start);
}

Error Deserializer::skip(ByteReader& reader) {
    u64 start = reader.absolute();
    int max_depth = _context->options()._max_depth;
    Error error = _plan != NULL ? _plan->skip(reader, 0, max_depth) : GenericReader::skip(_type, reader, 0, max_depth);
    return finish(error, reader, start);
}
