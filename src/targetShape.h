/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _TARGETSHAPE_H
#define _TARGETSHAPE_H

#include <string>
#include <vector>
#include "value.h"


enum TargetKind {
    TARGET_INT,
    TARGET_LONG,
    TARGET_FLOAT,
    TARGET_DOUBLE,
    TARGET_BOOLEAN,
    TARGET_STRING,
    TARGET_VALUE
};

// Stores one decoded field into a caller's object.
// Returns false if the value does not fit the member.
class FieldSetter {
  public:
    virtual ~FieldSetter() {
    }

    virtual bool set(void* target, const Value& value) const = 0;
};

struct TargetAccessor {
    std::string name;
    TargetKind kind;
    FieldSetter* setter;
};

// Caller-declared view of an event type: which fields to extract and where to put them.
// Decoders are compiled per (type shape, target key), so two shapes with the same
// accessors share decoders.
class TargetShape {
  private:
    std::string _name;
    std::vector<TargetAccessor> _accessors;
    std::string _key;

    TargetShape(const TargetShape&);
    TargetShape& operator=(const TargetShape&);

  protected:
    void add(const char* field, TargetKind kind, FieldSetter* setter);

  public:
    explicit TargetShape(const char* name) : _name(name), _accessors(), _key() {
    }

    virtual ~TargetShape();

    const std::string& name() const {
        return _name;
    }

    int accessorCount() const {
        return (int)_accessors.size();
    }

    const TargetAccessor& accessor(int index) const {
        return _accessors[index];
    }

    // Accessor names and kinds in declaration order
    const std::string& key() const {
        return _key;
    }

    static const char* kindName(TargetKind kind);
};


static inline bool assignValue(int& dst, const Value& value) {
    if (value.type() != VALUE_LONG) return false;
    dst = (int)value.asLong();
    return true;
}

static inline bool assignValue(long long& dst, const Value& value) {
    if (value.type() != VALUE_LONG) return false;
    dst = value.asLong();
    return true;
}

static inline bool assignValue(float& dst, const Value& value) {
    if (value.type() != VALUE_DOUBLE && value.type() != VALUE_LONG) return false;
    dst = (float)value.asDouble();
    return true;
}

static inline bool assignValue(double& dst, const Value& value) {
    if (value.type() != VALUE_DOUBLE && value.type() != VALUE_LONG) return false;
    dst = value.asDouble();
    return true;
}

static inline bool assignValue(bool& dst, const Value& value) {
    if (value.type() != VALUE_BOOLEAN) return false;
    dst = value.asBoolean();
    return true;
}

static inline bool assignValue(std::string& dst, const Value& value) {
    if (value.type() == VALUE_NULL) {
        dst.clear();
        return true;
    }
    if (value.type() != VALUE_STRING) return false;
    dst = value.asString();
    return true;
}

// Kept as decoded: records and constants stay valid while the chunk is parsed
static inline bool assignValue(Value& dst, const Value& value) {
    dst = value;
    return true;
}

template <typename T, typename M>
class MemberSetter : public FieldSetter {
  private:
    M T::*_member;

  public:
    explicit MemberSetter(M T::*member) : _member(member) {
    }

    bool set(void* target, const Value& value) const {
        return assignValue(((T*)target)->*_member, value);
    }
};

// Binds fields of a JFR type to data members of T:
//     TypedShape<Point> shape("Point");
//     shape.bind("x", &Point::x).bind("y", &Point::y);
template <typename T>
class TypedShape : public TargetShape {
  private:
    template <typename M>
    TypedShape& bindMember(const char* field, TargetKind kind, M T::*member) {
        add(field, kind, new MemberSetter<T, M>(member));
        return *this;
    }

  public:
    explicit TypedShape(const char* name) : TargetShape(name) {
    }

    TypedShape& bind(const char* field, int T::*member) {
        return bindMember(field, TARGET_INT, member);
    }

    TypedShape& bind(const char* field, long long T::*member) {
        return bindMember(field, TARGET_LONG, member);
    }

    TypedShape& bind(const char* field, float T::*member) {
        return bindMember(field, TARGET_FLOAT, member);
    }

    TypedShape& bind(const char* field, double T::*member) {
        return bindMember(field, TARGET_DOUBLE, member);
    }

    TypedShape& bind(const char* field, bool T::*member) {
        return bindMember(field, TARGET_BOOLEAN, member);
    }

    TypedShape& bind(const char* field, std::string T::*member) {
        return bindMember(field, TARGET_STRING, member);
    }

    TypedShape& bind(const char* field, Value T::*member) {
        return bindMember(field, TARGET_VALUE, member);
    }
};

#endif // _TARGETSHAPE_H
