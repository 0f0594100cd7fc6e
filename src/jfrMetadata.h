/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _JFRMETADATA_H
#define _JFRMETADATA_H

#include <map>
#include <string>
#include <vector>
#include "byteReader.h"
#include "error.h"


enum ElementKind {
    ELEMENT_ROOT,
    ELEMENT_METADATA,
    ELEMENT_CLASS,
    ELEMENT_FIELD,
    ELEMENT_ANNOTATION,
    ELEMENT_SETTING,
    ELEMENT_REGION
};

enum PrimitiveKind {
    PRIMITIVE_NONE,
    PRIMITIVE_BOOLEAN,
    PRIMITIVE_BYTE,
    PRIMITIVE_CHAR,
    PRIMITIVE_SHORT,
    PRIMITIVE_INT,
    PRIMITIVE_LONG,
    PRIMITIVE_FLOAT,
    PRIMITIVE_DOUBLE,
    PRIMITIVE_STRING
};

const u64 T_METADATA = 0;
const u64 T_CPOOL = 1;


class Metadata;
class MetadataVisitor;
class TypeDescriptor;

// Key and value are indices into the metadata string table
class Attribute {
  public:
    int _key;
    int _value;

    Attribute(int key, int value) : _key(key), _value(value) {
    }
};

class MetadataElement {
  protected:
    const Metadata* _metadata;

    virtual bool enter(MetadataVisitor& visitor) const;

  public:
    const ElementKind _kind;
    std::vector<Attribute> _attributes;
    std::vector<MetadataElement*> _children;

    MetadataElement(ElementKind kind, const Metadata* metadata) :
        _metadata(metadata), _kind(kind), _attributes(), _children() {
    }

    virtual ~MetadataElement();

    // NULL if the element has no such attribute
    const char* attribute(const char* key) const;

    // Calls the matching visit method, then the children unless it returned false,
    // then visitEnd for this element
    void accept(MetadataVisitor& visitor) const;
};

class FieldDescriptor : public MetadataElement {
  private:
    mutable const TypeDescriptor* _type;

  protected:
    bool enter(MetadataVisitor& visitor) const;

  public:
    std::string _name;
    long long _type_id;
    int _dimension;
    bool _constant_pool;
    const TypeDescriptor* _owner;

    FieldDescriptor(const Metadata* metadata, const TypeDescriptor* owner) :
        MetadataElement(ELEMENT_FIELD, metadata), _type(NULL),
        _name(), _type_id(0), _dimension(0), _constant_pool(false), _owner(owner) {
    }

    // Resolved by id on first use; the referent may be declared after the field
    const TypeDescriptor* type() const;

    bool isArray() const {
        return _dimension > 0;
    }
};

class MetadataAnnotation : public MetadataElement {
  protected:
    bool enter(MetadataVisitor& visitor) const;

  public:
    long long _class_id;

    MetadataAnnotation(const Metadata* metadata) : MetadataElement(ELEMENT_ANNOTATION, metadata), _class_id(0) {
    }

    const TypeDescriptor* type() const;

    // "value", or NULL
    const char* value() const {
        return attribute("value");
    }

    // "value-0", "value-1", ... in order
    std::vector<std::string> values() const;
};

class MetadataSetting : public MetadataElement {
  protected:
    bool enter(MetadataVisitor& visitor) const;

  public:
    std::string _name;
    long long _class_id;
    std::string _default_value;

    MetadataSetting(const Metadata* metadata) :
        MetadataElement(ELEMENT_SETTING, metadata), _name(), _class_id(0), _default_value() {
    }
};

class MetadataRegion : public MetadataElement {
  protected:
    bool enter(MetadataVisitor& visitor) const;

  public:
    std::string _locale;
    long long _gmt_offset;
    long long _dst;

    MetadataRegion(const Metadata* metadata) :
        MetadataElement(ELEMENT_REGION, metadata), _locale(), _gmt_offset(0), _dst(0) {
    }
};

class TypeDescriptor : public MetadataElement {
  protected:
    bool enter(MetadataVisitor& visitor) const;

  public:
    long long _id;
    std::string _name;
    std::string _super_type;
    bool _simple;
    PrimitiveKind _primitive;

    // Owned by _children
    std::vector<const FieldDescriptor*> _fields;
    std::vector<const MetadataAnnotation*> _annotations;
    std::vector<const MetadataSetting*> _settings;

    TypeDescriptor(const Metadata* metadata) :
        MetadataElement(ELEMENT_CLASS, metadata), _id(0), _name(), _super_type(), _simple(false),
        _primitive(PRIMITIVE_NONE), _fields(), _annotations(), _settings() {
    }

    bool isPrimitive() const {
        return _primitive != PRIMITIVE_NONE;
    }

    // A leaf type whose name is not one of the known primitives
    bool isUnknownPrimitive() const {
        return _primitive == PRIMITIVE_NONE && _fields.empty() && _name.find('.') == std::string::npos;
    }

    const FieldDescriptor* field(const std::string& name) const;

    static PrimitiveKind primitiveKind(const std::string& name);
};


class MetadataVisitor {
  public:
    virtual ~MetadataVisitor() {
    }

    virtual bool visitRoot(const MetadataElement& root) {
        return true;
    }

    virtual bool visitMetadata(const MetadataElement& metadata) {
        return true;
    }

    virtual bool visitClass(const TypeDescriptor& type) {
        return true;
    }

    virtual bool visitField(const FieldDescriptor& field) {
        return true;
    }

    virtual bool visitAnnotation(const MetadataAnnotation& annotation) {
        return true;
    }

    virtual bool visitSetting(const MetadataSetting& setting) {
        return true;
    }

    virtual bool visitRegion(const MetadataRegion& region) {
        return true;
    }

    virtual void visitEnd(const MetadataElement& element) {
    }
};


// Decoded metadata event of one chunk: string table, element tree and type table
class Metadata {
  private:
    u64 _start_time;
    u64 _duration;
    u64 _id;
    std::vector<std::string> _strings;
    MetadataElement* _root;
    const MetadataRegion* _region;
    std::map<long long, TypeDescriptor*> _types;
    std::map<std::string, TypeDescriptor*> _types_by_name;
    std::string _canonical;
    u64 _fingerprint;

    Metadata();

    Error readElement(ByteReader& reader, MetadataElement* parent, int depth, int max_depth);
    Error parseAttributes(MetadataElement* element, MetadataElement* parent, u64 offset);
    Error registerType(TypeDescriptor* type, u64 offset);
    Error validate() const;
    void buildCanonicalForm();

  public:
    ~Metadata();

    // Reads the metadata event at the current position of the reader
    static Error read(ByteReader& reader, int max_depth, Metadata** result);

    u64 startTime() const {
        return _start_time;
    }

    u64 duration() const {
        return _duration;
    }

    u64 id() const {
        return _id;
    }

    int stringCount() const {
        return (int)_strings.size();
    }

    const std::string& string(int index) const {
        return _strings[index];
    }

    const MetadataElement* root() const {
        return _root;
    }

    const MetadataRegion* region() const {
        return _region;
    }

    const TypeDescriptor* type(long long id) const {
        std::map<long long, TypeDescriptor*>::const_iterator it = _types.find(id);
        return it != _types.end() ? it->second : NULL;
    }

    const TypeDescriptor* type(const std::string& name) const {
        std::map<std::string, TypeDescriptor*>::const_iterator it = _types_by_name.find(name);
        return it != _types_by_name.end() ? it->second : NULL;
    }

    const std::map<long long, TypeDescriptor*>& types() const {
        return _types;
    }

    // Structural description of all types, equal for structurally identical chunks
    const std::string& canonicalForm() const {
        return _canonical;
    }

    u64 fingerprint() const {
        return _fingerprint;
    }

    void accept(MetadataVisitor& visitor) const {
        _root->accept(visitor);
    }
};

#endif // _JFRMETADATA_H
