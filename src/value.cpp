/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdio.h>
#include "constantPool.h"
#include "value.h"


static const std::vector<Value> EMPTY_ARRAY;

const std::vector<Value>& Value::array() const {
    return _type == VALUE_ARRAY ? *_array : EMPTY_ARRAY;
}

Error Record::field(const std::string& name, Value* result) const {
    int index = _layout->indexOf(name);
    if (index < 0) {
        return Error(ERR_DECODE_FAILURE, "no field '" + name + "'").forType(_layout->_type_name);
    }
    return field(index, result);
}

Error Value::resolve(Value* result) const {
    if (_type == VALUE_CONSTANT) {
        return _pool->resolve(_index, result);
    }
    *result = *this;
    return Error::OK;
}

Error Value::get(const std::string& field, Value* result) const {
    Value target;
    Error error = resolve(&target);
    if (error) {
        return error;
    }
    if (target._type != VALUE_RECORD) {
        return Error(ERR_DECODE_FAILURE, "field '" + field + "' requested from a value that is not a record");
    }
    return target._record->field(field, result);
}

Error Value::materialize(Value* result, int max_depth) const {
    ResolvingStack resolving;
    return materialize(result, 0, max_depth, resolving);
}

Error Value::materialize(Value* result, int depth, int max_depth, ResolvingStack& resolving) const {
    if (depth > max_depth) {
        return Error::format(ERR_DECODE_FAILURE, 0, "value nesting exceeds %d levels", max_depth);
    }

    switch (_type) {
        case VALUE_CONSTANT: {
            for (size_t i = 0; i < resolving.size(); i++) {
                if (resolving[i].first == _pool && resolving[i].second == _index) {
                    return Error::format(ERR_CONSTANT_POOL_CYCLE, 0, "constant %llu refers back to itself", _index)
                        .forType(_pool->type()->_name);
                }
            }
            Value target;
            Error error = _pool->resolve(_index, &target);
            if (error) {
                return error;
            }
            resolving.push_back(std::make_pair((const ConstantPool*)_pool, _index));
            error = target.materialize(result, depth + 1, max_depth, resolving);
            resolving.pop_back();
            return error;
        }

        case VALUE_RECORD: {
            int count = _record->fieldCount();
            std::vector<Value> values(count);
            for (int i = 0; i < count; i++) {
                Value field;
                Error error = _record->field(i, &field);
                if (!error) {
                    error = field.materialize(&values[i], depth + 1, max_depth, resolving);
                }
                if (error) {
                    return error;
                }
            }
            *result = ofRecord(RecordRef(new EagerRecord(_record->layout(), values)));
            return Error::OK;
        }

        case VALUE_ARRAY: {
            const std::vector<Value>& elements = *_array;
            std::vector<Value>* values = new std::vector<Value>(elements.size());
            ArrayRef ref(values);
            for (size_t i = 0; i < elements.size(); i++) {
                Error error = elements[i].materialize(&(*values)[i], depth + 1, max_depth, resolving);
                if (error) {
                    return error;
                }
            }
            *result = ofArray(ref);
            return Error::OK;
        }

        default:
            *result = *this;
            return Error::OK;
    }
}

bool Value::equals(const Value& other, int depth) const {
    if (depth > DEFAULT_MAX_DEPTH) {
        return false;
    }

    if (_type == VALUE_CONSTANT || other._type == VALUE_CONSTANT) {
        if (_type == VALUE_CONSTANT && other._type == VALUE_CONSTANT && _pool == other._pool && _index == other._index) {
            return true;
        }
        Value a, b;
        if (resolve(&a) || other.resolve(&b)) {
            return false;
        }
        return a.equals(b, depth + 1);
    }

    if (_type != other._type) {
        return false;
    }

    switch (_type) {
        case VALUE_NULL:
            return true;
        case VALUE_LONG:
            return _long == other._long;
        case VALUE_DOUBLE:
            // Bitwise, so that NaN equals itself
            return _index == other._index;
        case VALUE_BOOLEAN:
            return _boolean == other._boolean;
        case VALUE_STRING:
            return _string == other._string;
        case VALUE_ARRAY: {
            const std::vector<Value>& a = *_array;
            const std::vector<Value>& b = *other._array;
            if (a.size() != b.size()) {
                return false;
            }
            for (size_t i = 0; i < a.size(); i++) {
                if (!a[i].equals(b[i], depth + 1)) return false;
            }
            return true;
        }
        case VALUE_RECORD: {
            const Record* a = _record.get();
            const Record* b = other._record.get();
            if (a == b) {
                return true;
            }
            if (a->typeName() != b->typeName() || a->fieldCount() != b->fieldCount()) {
                return false;
            }
            for (int i = 0; i < a->fieldCount(); i++) {
                Value fa, fb;
                if (a->fieldName(i) != b->fieldName(i) || a->field(i, &fa) || b->field(i, &fb)) {
                    return false;
                }
                if (!fa.equals(fb, depth + 1)) return false;
            }
            return true;
        }
        default:
            return false;
    }
}

static void appendQuoted(std::string& out, const std::string& s) {
    out.push_back('"');
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        switch (c) {
            case '"':  out.append("\\\""); break;
            case '\\': out.append("\\\\"); break;
            case '\n': out.append("\\n"); break;
            case '\r': out.append("\\r"); break;
            case '\t': out.append("\\t"); break;
            default:
                if ((unsigned char)c < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out.append(buf);
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

void Value::appendTo(std::string& out, int depth) const {
    if (depth > DEFAULT_MAX_DEPTH) {
        out.append("...");
        return;
    }

    char buf[32];
    switch (_type) {
        case VALUE_NULL:
            out.append("null");
            break;
        case VALUE_LONG:
            snprintf(buf, sizeof(buf), "%lld", _long);
            out.append(buf);
            break;
        case VALUE_DOUBLE:
            snprintf(buf, sizeof(buf), "%.17g", _double);
            out.append(buf);
            break;
        case VALUE_BOOLEAN:
            out.append(_boolean ? "true" : "false");
            break;
        case VALUE_STRING:
            appendQuoted(out, _string);
            break;
        case VALUE_CONSTANT: {
            Value target;
            if (_pool->resolve(_index, &target)) {
                snprintf(buf, sizeof(buf), "<unresolved %llu>", _index);
                out.append(buf);
            } else {
                target.appendTo(out, depth + 1);
            }
            break;
        }
        case VALUE_ARRAY: {
            const std::vector<Value>& elements = *_array;
            out.push_back('[');
            for (size_t i = 0; i < elements.size(); i++) {
                if (i > 0) out.push_back(',');
                elements[i].appendTo(out, depth + 1);
            }
            out.push_back(']');
            break;
        }
        case VALUE_RECORD: {
            out.push_back('{');
            for (int i = 0; i < _record->fieldCount(); i++) {
                if (i > 0) out.push_back(',');
                appendQuoted(out, _record->fieldName(i));
                out.push_back(':');
                Value field;
                if (_record->field(i, &field)) {
                    out.append("<error>");
                } else {
                    field.appendTo(out, depth + 1);
                }
            }
            out.push_back('}');
            break;
        }
    }
}

std::string Value::toString() const {
    std::string out;
    appendTo(out, 0);
    return out;
}
