/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdio.h>
#include "constantPool.h"
#include "decodePlan.h"
#include "deserializer.h"


DecodePlan::DecodePlan(const std::string& type_name) :
    _key(), _layout(new RecordLayout(type_name)), _primitive(OP_NONE), _ops(), _lazy(false), _error(),
    _nested(), _pool_types() {
}

DecodePlan::~DecodePlan() {
    for (size_t i = 0; i < _nested.size(); i++) {
        delete _nested[i];
    }
}

Error DecodePlan::decode(const PlanFrame& frame, ByteReader& reader, int depth, Value* result) const {
    if (_error) {
        return _error;
    }
    if (depth > frame.max_depth) {
        return Error::format(ERR_DECODE_FAILURE, reader.absolute(), "value nesting exceeds %d levels", frame.max_depth)
            .forType(typeName());
    }

    if (_primitive != OP_NESTED) {
        return GenericReader::readPrimitive(frame.context, (PrimitiveKind)_primitive, reader, result);
    }

    if (_lazy) {
        u64 start = reader.position();
        Error error = skip(reader, depth, frame.max_depth, &frame);
        if (error || reader.failed()) {
            return error;
        }
        ByteReader fields = reader.slice(start, reader.position() - start);
        *result = Value::ofRecord(RecordRef(new LazyRecord(frame, this, fields, depth)));
        return Error::OK;
    }

    std::vector<Value> values;
    Error error = decodeFields(frame, reader, depth, values);
    if (error) {
        return error;
    }
    *result = Value::ofRecord(RecordRef(new EagerRecord(_layout, values)));
    return Error::OK;
}

Error DecodePlan::decodeFields(const PlanFrame& frame, ByteReader& reader, int depth, std::vector<Value>& values) const {
    values.resize(_ops.size());
    for (size_t i = 0; i < _ops.size(); i++) {
        Error error = decodeOp(frame, _ops[i], reader, depth, &values[i]);
        if (error) {
            return error;
        }
        if (reader.failed()) {
            break;
        }
    }
    return Error::OK;
}

Error DecodePlan::decodeOp(const PlanFrame& frame, const PlanOp& op, ByteReader& reader, int depth, Value* result) const {
    if (!op.array) {
        return decodeElement(frame, op, reader, depth, result);
    }

    u64 length = reader.readLength();
    std::vector<Value>* elements = new std::vector<Value>((size_t)length);
    ArrayRef ref(elements);
    for (size_t i = 0; i < elements->size() && !reader.failed(); i++) {
        Error error = decodeElement(frame, op, reader, depth, &(*elements)[i]);
        if (error) {
            return error;
        }
    }
    *result = Value::ofArray(ref);
    return Error::OK;
}

Error DecodePlan::decodeElement(const PlanFrame& frame, const PlanOp& op, ByteReader& reader, int depth, Value* result) const {
    switch (op.code) {
        case OP_CONSTANT:
            return GenericReader::readConstant(frame.pools[op.pool_slot], op.pool_type, reader,
                                               frame.eager_constants, result);
        case OP_NESTED:
            return op.nested->decode(frame, reader, depth + 1, result);
        default:
            return GenericReader::readPrimitive(frame.context, (PrimitiveKind)op.code, reader, result);
    }
}

Error DecodePlan::decodeInto(const PlanFrame& frame, ByteReader& reader, const TargetShape* target, void* object) const {
    if (_error) {
        return _error;
    }
    if (_primitive != OP_NESTED) {
        return Error(ERR_DECODE_FAILURE, "a primitive value cannot fill " + target->name(), reader.absolute())
            .forType(typeName());
    }

    // Unbound fields are decoded too, so that broken references fail the same way as generic decoding
    for (size_t i = 0; i < _ops.size(); i++) {
        const PlanOp& op = _ops[i];
        Value value;
        Error error = decodeOp(frame, op, reader, 0, &value);
        if (error) {
            return error;
        }
        if (reader.failed()) {
            return Error::OK;
        }
        if (op.target_slot < 0) {
            continue;
        }

        const TargetAccessor& accessor = target->accessor(op.target_slot);
        Value resolved;
        if (accessor.kind == TARGET_VALUE) {
            resolved = value;
        } else if ((error = value.resolve(&resolved))) {
            return error;
        }
        if (!accessor.setter->set(object, resolved)) {
            return Error::format(ERR_DECODE_FAILURE, reader.absolute(), "field %s does not fit a %s member of %s",
                                 accessor.name.c_str(), TargetShape::kindName(accessor.kind), target->name().c_str())
                .forType(typeName());
        }
    }
    return Error::OK;
}

Error DecodePlan::skip(ByteReader& reader, int depth, int max_depth, const PlanFrame* frame) const {
    if (_error) {
        return _error;
    }
    if (depth > max_depth) {
        return Error::format(ERR_DECODE_FAILURE, reader.absolute(), "value nesting exceeds %d levels", max_depth)
            .forType(typeName());
    }

    if (_primitive != OP_NESTED) {
        GenericReader::skipPrimitive((PrimitiveKind)_primitive, reader);
        return Error::OK;
    }

    for (size_t i = 0; i < _ops.size() && !reader.failed(); i++) {
        Error error = skipOp(_ops[i], reader, depth, max_depth, frame);
        if (error) {
            return error;
        }
    }
    return Error::OK;
}

Error DecodePlan::skipOp(const PlanOp& op, ByteReader& reader, int depth, int max_depth, const PlanFrame* frame) const {
    u64 count = op.array ? reader.readLength() : 1;
    for (u64 i = 0; i < count && !reader.failed(); i++) {
        switch (op.code) {
            case OP_CONSTANT:
                if (frame == NULL) {
                    reader.readVarint();
                } else {
                    Error error = GenericReader::skipConstant(frame->pools[op.pool_slot], op.pool_type, reader);
                    if (error) {
                        return error;
                    }
                }
                break;
            case OP_NESTED: {
                Error error = op.nested->skip(reader, depth + 1, max_depth, frame);
                if (error) {
                    return error;
                }
                break;
            }
            default:
                GenericReader::skipPrimitive((PrimitiveKind)op.code, reader);
        }
    }
    return Error::OK;
}


// Names are length prefixed, so no type or field name can forge a separator
static void appendName(const std::string& name, std::string& out) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%zu'", name.size());
    out.append(buf).append(name);
}

static Error appendShape(const TypeDescriptor* type, std::map<long long, int>& seen, std::string& out,
                         int depth, int max_depth) {
    if (depth > max_depth) {
        return Error::format(ERR_DECODE_FAILURE, 0, "type nesting exceeds %d levels", max_depth).forType(type->_name);
    }

    // Recursive shapes refer back to the type by visiting order
    std::map<long long, int>::const_iterator it = seen.find(type->_id);
    if (it != seen.end()) {
        char buf[16];
        snprintf(buf, sizeof(buf), "#%d", it->second);
        out.append(buf);
        return Error::OK;
    }
    int order = (int)seen.size();
    seen[type->_id] = order;

    appendName(type->_name, out);
    if (type->_fields.empty()) {
        return Error::OK;
    }

    out.push_back('{');
    for (size_t i = 0; i < type->_fields.size(); i++) {
        const FieldDescriptor* field = type->_fields[i];
        appendName(field->_name, out);
        out.push_back(':');
        if (field->_constant_pool) {
            appendName(field->type()->_name, out);
            out.push_back('@');
        } else {
            Error error = appendShape(field->type(), seen, out, depth + 1, max_depth);
            if (error) {
                return error;
            }
        }
        if (field->isArray()) {
            out.append("[]");
        }
        out.push_back(';');
    }
    out.push_back('}');
    return Error::OK;
}

Error PlanCompiler::shapeKey(const TypeDescriptor* type, const TargetShape* target, int max_depth, std::string* key) {
    std::map<long long, int> seen;
    key->clear();
    Error error = appendShape(type, seen, *key, 0, max_depth);
    if (error) {
        return error;
    }
    if (target != NULL) {
        key->append("|").append(target->key());
    }
    return Error::OK;
}

DecodePlan* PlanCompiler::compile(const std::string& key, const TypeDescriptor* type,
                                  const TargetShape* target, const ParserOptions& options) {
    PlanCompiler compiler(options);
    DecodePlan* root = compiler.compileType(type, 0);
    root->_key = key;
    if (target != NULL && !root->_error) {
        compiler.bindTarget(type, target);
    }
    return root;
}

DecodePlan* PlanCompiler::compileType(const TypeDescriptor* type, int depth) {
    std::map<long long, DecodePlan*>::const_iterator it = _compiled.find(type->_id);
    if (it != _compiled.end()) {
        return it->second;
    }

    DecodePlan* plan = new DecodePlan(type->_name);
    if (_root == NULL) {
        _root = plan;
    } else {
        _root->_nested.push_back(plan);
    }
    _compiled[type->_id] = plan;

    if (depth > _options._max_depth) {
        plan->_error = Error::format(ERR_DECODE_FAILURE, 0, "type nesting exceeds %d levels", _options._max_depth)
            .forType(type->_name);
        return plan;
    }
    if (type->isPrimitive()) {
        plan->_primitive = (PlanOpCode)type->_primitive;
        return plan;
    }
    if (type->isUnknownPrimitive()) {
        plan->_error = Error(ERR_UNKNOWN_PRIMITIVE_TYPE, "unknown primitive type " + type->_name).forType(type->_name);
        return plan;
    }

    plan->_primitive = OP_NESTED;
    RecordLayout* layout = new RecordLayout(type->_name);
    plan->_layout = LayoutRef(layout);

    for (size_t i = 0; i < type->_fields.size(); i++) {
        const FieldDescriptor* field = type->_fields[i];
        const TypeDescriptor* field_type = field->type();
        layout->_field_names.push_back(field->_name);

        PlanOp op;
        op.array = field->isArray();
        op.pool_slot = -1;
        op.target_slot = -1;
        op.nested = NULL;

        if (field->_constant_pool) {
            op.code = OP_CONSTANT;
            op.pool_slot = poolSlot(field_type->_name);
            op.pool_type = field_type->_name;
        } else if (field_type->isPrimitive()) {
            op.code = (PlanOpCode)field_type->_primitive;
        } else {
            op.code = OP_NESTED;
            op.nested = compileType(field_type, depth + 1);
        }
        plan->_ops.push_back(op);
    }

    plan->_lazy = !_options.eagerConstants() && (int)plan->_ops.size() > _options._lazy_fields;
    return plan;
}

void PlanCompiler::bindTarget(const TypeDescriptor* type, const TargetShape* target) {
    for (int i = 0; i < target->accessorCount(); i++) {
        const TargetAccessor& accessor = target->accessor(i);
        int index = _root->_layout->indexOf(accessor.name);
        if (index < 0 || _root->_primitive != OP_NESTED) {
            _root->_error = Error::format(ERR_DECODE_FAILURE, 0, "type %s has no field %s required by %s",
                                          type->_name.c_str(), accessor.name.c_str(), target->name().c_str())
                .forType(type->_name);
            return;
        }

        PlanOp& op = _root->_ops[index];
        if (op.array && accessor.kind != TARGET_VALUE) {
            _root->_error = Error::format(ERR_DECODE_FAILURE, 0, "array field %s of %s can only be bound to a Value",
                                          accessor.name.c_str(), type->_name.c_str())
                .forType(type->_name);
            return;
        }
        op.target_slot = i;
    }
}

int PlanCompiler::poolSlot(const std::string& type_name) {
    std::vector<std::string>& types = _root->_pool_types;
    for (size_t i = 0; i < types.size(); i++) {
        if (types[i] == type_name) return (int)i;
    }
    types.push_back(type_name);
    return (int)types.size() - 1;
}
