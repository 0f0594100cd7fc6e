/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _VALUE_H
#define _VALUE_H

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "arch.h"
#include "error.h"


const int DEFAULT_MAX_DEPTH = 256;

enum ValueType {
    VALUE_NULL,
    VALUE_LONG,
    VALUE_DOUBLE,
    VALUE_BOOLEAN,
    VALUE_STRING,
    VALUE_RECORD,
    VALUE_ARRAY,
    VALUE_CONSTANT
};

class ConstantPool;
class Record;
class Value;

// Type name and field names shared by all records of one type
class RecordLayout {
  public:
    std::string _type_name;
    std::vector<std::string> _field_names;

    RecordLayout(const std::string& type_name) : _type_name(type_name), _field_names() {
    }

    int indexOf(const std::string& name) const {
        for (size_t i = 0; i < _field_names.size(); i++) {
            if (_field_names[i] == name) return (int)i;
        }
        return -1;
    }
};

typedef std::shared_ptr<const RecordLayout> LayoutRef;
typedef std::shared_ptr<const Record> RecordRef;
typedef std::shared_ptr<const std::vector<Value> > ArrayRef;

// Decoded JFR value. Integers of every width are widened to long,
// char values are kept as UTF-16 code units. A constant refers to an entry
// of a constant pool and is resolved on demand.
//
// Records, arrays and constants decoded from a chunk may point back into it:
// they stay valid while the chunk is being parsed. materialize() produces
// a self-contained copy that may be kept longer.
class Value {
  private:
    ValueType _type;
    union {
        long long _long;
        double _double;
        bool _boolean;
        u64 _index;
    };
    std::string _string;
    RecordRef _record;
    ArrayRef _array;
    ConstantPool* _pool;

    typedef std::vector<std::pair<const ConstantPool*, u64> > ResolvingStack;

    Error materialize(Value* result, int depth, int max_depth, ResolvingStack& resolving) const;
    bool equals(const Value& other, int depth) const;
    void appendTo(std::string& out, int depth) const;

  public:
    Value() : _type(VALUE_NULL), _long(0), _string(), _record(), _array(), _pool(NULL) {
    }

    static Value ofLong(long long v) {
        Value value;
        value._type = VALUE_LONG;
        value._long = v;
        return value;
    }

    static Value ofDouble(double v) {
        Value value;
        value._type = VALUE_DOUBLE;
        value._double = v;
        return value;
    }

    static Value ofBoolean(bool v) {
        Value value;
        value._type = VALUE_BOOLEAN;
        value._boolean = v;
        return value;
    }

    static Value ofString(const std::string& v) {
        Value value;
        value._type = VALUE_STRING;
        value._string = v;
        return value;
    }

    static Value ofRecord(const RecordRef& v) {
        Value value;
        value._type = VALUE_RECORD;
        value._record = v;
        return value;
    }

    static Value ofArray(const ArrayRef& v) {
        Value value;
        value._type = VALUE_ARRAY;
        value._array = v;
        return value;
    }

    static Value ofConstant(ConstantPool* pool, u64 index) {
        Value value;
        value._type = VALUE_CONSTANT;
        value._pool = pool;
        value._index = index;
        return value;
    }

    ValueType type() const {
        return _type;
    }

    bool isNull() const {
        return _type == VALUE_NULL;
    }

    long long asLong() const {
        return _type == VALUE_LONG ? _long : _type == VALUE_DOUBLE ? (long long)_double : 0;
    }

    double asDouble() const {
        return _type == VALUE_DOUBLE ? _double : _type == VALUE_LONG ? (double)_long : 0;
    }

    bool asBoolean() const {
        return _type == VALUE_BOOLEAN && _boolean;
    }

    const std::string& asString() const {
        return _string;
    }

    const Record* record() const {
        return _record.get();
    }

    const std::vector<Value>& array() const;

    ConstantPool* pool() const {
        return _pool;
    }

    u64 index() const {
        return _index;
    }

    // The pooled value for a constant, the value itself otherwise
    Error resolve(Value* result) const;

    // Field of a record, looking through a constant reference
    Error get(const std::string& field, Value* result) const;

    // Deep copy with every constant and lazy record resolved
    Error materialize(Value* result, int max_depth = DEFAULT_MAX_DEPTH) const;

    // Structural equality of the resolved values
    bool equals(const Value& other) const {
        return equals(other, 0);
    }

    // JSON-like rendering, e.g. {"x":3,"y":4}
    std::string toString() const;
};


class Record {
  protected:
    LayoutRef _layout;

  public:
    explicit Record(const LayoutRef& layout) : _layout(layout) {
    }

    virtual ~Record() {
    }

    const LayoutRef& layout() const {
        return _layout;
    }

    const std::string& typeName() const {
        return _layout->_type_name;
    }

    int fieldCount() const {
        return (int)_layout->_field_names.size();
    }

    const std::string& fieldName(int index) const {
        return _layout->_field_names[index];
    }

    virtual bool isLazy() const {
        return false;
    }

    virtual Error field(int index, Value* result) const = 0;

    Error field(const std::string& name, Value* result) const;
};

// All fields decoded up front
class EagerRecord : public Record {
  private:
    std::vector<Value> _values;

  public:
    EagerRecord(const LayoutRef& layout, std::vector<Value>& values) : Record(layout), _values() {
        _values.swap(values);
    }

    using Record::field;

    const Value& at(int index) const {
        return _values[index];
    }

    Error field(int index, Value* result) const {
        *result = _values[index];
        return Error::OK;
    }
};

#endif // _VALUE_H
