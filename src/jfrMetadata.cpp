/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include "jfrMetadata.h"
#include "log.h"


static const char* const ELEMENT_NAME[] = {
    "root",
    "metadata",
    "class",
    "field",
    "annotation",
    "setting",
    "region"
};

static bool parseLong(const char* str, long long* result) {
    if (str == NULL || *str == 0) {
        return false;
    }
    char* end;
    errno = 0;
    long long value = strtoll(str, &end, 10);
    if (*end != 0 || errno != 0) {
        return false;
    }
    *result = value;
    return true;
}

static bool parseBool(const char* str) {
    return str != NULL && strcmp(str, "true") == 0;
}


MetadataElement::~MetadataElement() {
    for (size_t i = 0; i < _children.size(); i++) {
        delete _children[i];
    }
}

const char* MetadataElement::attribute(const char* key) const {
    for (size_t i = 0; i < _attributes.size(); i++) {
        if (_metadata->string(_attributes[i]._key) == key) {
            return _metadata->string(_attributes[i]._value).c_str();
        }
    }
    return NULL;
}

void MetadataElement::accept(MetadataVisitor& visitor) const {
    if (enter(visitor)) {
        for (size_t i = 0; i < _children.size(); i++) {
            _children[i]->accept(visitor);
        }
    }
    visitor.visitEnd(*this);
}

bool MetadataElement::enter(MetadataVisitor& visitor) const {
    return _kind == ELEMENT_ROOT ? visitor.visitRoot(*this) : visitor.visitMetadata(*this);
}

bool TypeDescriptor::enter(MetadataVisitor& visitor) const {
    return visitor.visitClass(*this);
}

bool FieldDescriptor::enter(MetadataVisitor& visitor) const {
    return visitor.visitField(*this);
}

bool MetadataAnnotation::enter(MetadataVisitor& visitor) const {
    return visitor.visitAnnotation(*this);
}

bool MetadataSetting::enter(MetadataVisitor& visitor) const {
    return visitor.visitSetting(*this);
}

bool MetadataRegion::enter(MetadataVisitor& visitor) const {
    return visitor.visitRegion(*this);
}

const TypeDescriptor* FieldDescriptor::type() const {
    if (_type == NULL) {
        _type = _metadata->type(_type_id);
    }
    return _type;
}

const TypeDescriptor* MetadataAnnotation::type() const {
    return _metadata->type(_class_id);
}

std::vector<std::string> MetadataAnnotation::values() const {
    std::vector<std::string> result;
    char key[32];
    for (int i = 0; ; i++) {
        snprintf(key, sizeof(key), "value-%d", i);
        const char* value = attribute(key);
        if (value == NULL) break;
        result.push_back(value);
    }
    return result;
}

const FieldDescriptor* TypeDescriptor::field(const std::string& name) const {
    for (size_t i = 0; i < _fields.size(); i++) {
        if (_fields[i]->_name == name) {
            return _fields[i];
        }
    }
    return NULL;
}

PrimitiveKind TypeDescriptor::primitiveKind(const std::string& name) {
    switch (name.size()) {
        case 3:
            if (name == "int") return PRIMITIVE_INT;
            break;
        case 4:
            if (name == "long") return PRIMITIVE_LONG;
            if (name == "byte") return PRIMITIVE_BYTE;
            if (name == "char") return PRIMITIVE_CHAR;
            break;
        case 5:
            if (name == "short") return PRIMITIVE_SHORT;
            if (name == "float") return PRIMITIVE_FLOAT;
            break;
        case 6:
            if (name == "double") return PRIMITIVE_DOUBLE;
            if (name == "string") return PRIMITIVE_STRING;
            break;
        case 7:
            if (name == "boolean") return PRIMITIVE_BOOLEAN;
            break;
        case 16:
            if (name == "java.lang.String") return PRIMITIVE_STRING;
            break;
    }
    return PRIMITIVE_NONE;
}


Metadata::Metadata() :
    _start_time(0), _duration(0), _id(0), _strings(), _root(NULL), _region(NULL),
    _types(), _types_by_name(), _canonical(), _fingerprint(0) {
}

Metadata::~Metadata() {
    delete _root;
}

Error Metadata::read(ByteReader& reader, int max_depth, Metadata** result) {
    u64 start = reader.position();
    u64 size = reader.readVarint();
    if (reader.failed()) {
        return reader.failure();
    }
    if (size == 0) {
        return Error(ERR_INVALID_METADATA, "metadata event has zero size", reader.absolute());
    }

    ByteReader event = reader.slice(start, size);
    if (event.failed()) {
        return Error(ERR_INVALID_METADATA, "metadata event exceeds the chunk", event.failureOffset());
    }
    event.seek(reader.position() - start);

    u64 type = event.readVarint();
    if (!event.failed() && type != T_METADATA) {
        return Error::format(ERR_INVALID_METADATA, event.absolute(), "unexpected metadata event type %llu", type);
    }

    Metadata* metadata = new Metadata();
    metadata->_start_time = event.readVarint();
    metadata->_duration = event.readVarint();
    metadata->_id = event.readVarint();

    u64 string_count = event.readLength();
    std::string s;
    u64 ref;
    for (u64 i = 0; i < string_count && !event.failed(); i++) {
        if (event.readString(s, &ref) == STR_REFERENCE) {
            delete metadata;
            return Error(ERR_INVALID_METADATA, "string table entry refers to a constant", event.absolute());
        }
        metadata->_strings.push_back(s);
    }
    if (event.failed()) {
        delete metadata;
        return event.failure();
    }

    Error error = metadata->readElement(event, NULL, 0, max_depth);
    if (!error) {
        error = metadata->validate();
    }
    if (error) {
        delete metadata;
        return error;
    }

    reader.seek(start + size);
    metadata->buildCanonicalForm();

    Log::debug("Metadata %llu: %d strings, %d types", metadata->_id,
               (int)metadata->_strings.size(), (int)metadata->_types.size());
    *result = metadata;
    return Error::OK;
}

Error Metadata::readElement(ByteReader& reader, MetadataElement* parent, int depth, int max_depth) {
    u64 offset = reader.absolute();
    if (depth > max_depth) {
        return Error::format(ERR_INVALID_METADATA, offset, "metadata nesting exceeds %d levels", max_depth);
    }

    u64 name = reader.readVarint();
    std::vector<Attribute> attributes;
    u64 attribute_count = reader.readLength();
    for (u64 i = 0; i < attribute_count && !reader.failed(); i++) {
        u64 key = reader.readVarint();
        u64 value = reader.readVarint();
        if (key >= _strings.size() || value >= _strings.size()) {
            return Error::format(ERR_INVALID_METADATA, offset, "attribute refers to string %llu of %d",
                                 key >= _strings.size() ? key : value, (int)_strings.size());
        }
        attributes.push_back(Attribute((int)key, (int)value));
    }
    if (reader.failed()) {
        return reader.failure();
    }
    if (name >= _strings.size()) {
        return Error::format(ERR_INVALID_METADATA, offset, "element name refers to string %llu of %d",
                             name, (int)_strings.size());
    }

    const std::string& kind_name = _strings[name];
    int kind = -1;
    for (int k = ELEMENT_ROOT; k <= ELEMENT_REGION; k++) {
        if (kind_name == ELEMENT_NAME[k]) {
            kind = k;
            break;
        }
    }

    // Unknown elements cannot be skipped safely: their layout is unknown
    MetadataElement* element;
    switch (kind) {
        case ELEMENT_CLASS:
            element = new TypeDescriptor(this);
            break;
        case ELEMENT_FIELD:
            if (parent == NULL || parent->_kind != ELEMENT_CLASS) {
                return Error(ERR_INVALID_METADATA, "field declared outside of a class", offset);
            }
            element = new FieldDescriptor(this, (TypeDescriptor*)parent);
            break;
        case ELEMENT_ANNOTATION:
            element = new MetadataAnnotation(this);
            break;
        case ELEMENT_SETTING:
            element = new MetadataSetting(this);
            break;
        case ELEMENT_REGION:
            element = new MetadataRegion(this);
            break;
        case ELEMENT_ROOT:
        case ELEMENT_METADATA:
            element = new MetadataElement((ElementKind)kind, this);
            break;
        default:
            return Error::format(ERR_UNSUPPORTED_METADATA_ELEMENT, offset, "unsupported metadata element '%s'",
                                 kind_name.c_str());
    }
    element->_attributes.swap(attributes);

    // Attach first, so the tree owns the element on any failure below
    if (parent == NULL) {
        if (element->_kind != ELEMENT_ROOT) {
            delete element;
            return Error::format(ERR_INVALID_METADATA, offset, "metadata tree starts with '%s'", kind_name.c_str());
        }
        _root = element;
    } else {
        parent->_children.push_back(element);
    }

    Error error = parseAttributes(element, parent, offset);
    if (error) {
        return error;
    }

    u64 child_count = reader.readLength();
    for (u64 i = 0; i < child_count; i++) {
        if ((error = readElement(reader, element, depth + 1, max_depth))) {
            return error;
        }
    }
    return reader.failed() ? reader.failure() : Error::OK;
}

Error Metadata::parseAttributes(MetadataElement* element, MetadataElement* parent, u64 offset) {
    switch (element->_kind) {
        case ELEMENT_CLASS: {
            TypeDescriptor* type = (TypeDescriptor*)element;
            const char* name = element->attribute("name");
            if (name == NULL || !parseLong(element->attribute("id"), &type->_id)) {
                return Error(ERR_INVALID_METADATA, "class without a valid name and id", offset);
            }
            type->_name = name;
            const char* super_type = element->attribute("superType");
            if (super_type != NULL) {
                type->_super_type = super_type;
            }
            type->_simple = parseBool(element->attribute("simpleType"));
            type->_primitive = TypeDescriptor::primitiveKind(type->_name);
            // Registered before its children: later siblings may refer to it already
            return registerType(type, offset);
        }

        case ELEMENT_FIELD: {
            FieldDescriptor* field = (FieldDescriptor*)element;
            const char* name = element->attribute("name");
            if (name == NULL || !parseLong(element->attribute("class"), &field->_type_id)) {
                return Error(ERR_INVALID_METADATA, "field without a valid name and class", offset);
            }
            field->_name = name;

            long long dimension = 0;
            const char* dimension_str = element->attribute("dimension");
            if (dimension_str != NULL && (!parseLong(dimension_str, &dimension) || dimension < 0 || dimension > 1)) {
                return Error::format(ERR_INVALID_METADATA, offset, "field %s has unsupported dimension %s",
                                     name, dimension_str);
            }
            field->_dimension = (int)dimension;
            field->_constant_pool = parseBool(element->attribute("constantPool"));
            ((TypeDescriptor*)parent)->_fields.push_back(field);
            return Error::OK;
        }

        case ELEMENT_ANNOTATION: {
            MetadataAnnotation* annotation = (MetadataAnnotation*)element;
            if (!parseLong(element->attribute("class"), &annotation->_class_id)) {
                return Error(ERR_INVALID_METADATA, "annotation without a valid class", offset);
            }
            if (parent != NULL && parent->_kind == ELEMENT_CLASS) {
                ((TypeDescriptor*)parent)->_annotations.push_back(annotation);
            }
            return Error::OK;
        }

        case ELEMENT_SETTING: {
            MetadataSetting* setting = (MetadataSetting*)element;
            const char* name = element->attribute("name");
            const char* default_value = element->attribute("defaultValue");
            if (name == NULL || !parseLong(element->attribute("class"), &setting->_class_id)) {
                return Error(ERR_INVALID_METADATA, "setting without a valid name and class", offset);
            }
            setting->_name = name;
            if (default_value != NULL) {
                setting->_default_value = default_value;
            }
            if (parent != NULL && parent->_kind == ELEMENT_CLASS) {
                ((TypeDescriptor*)parent)->_settings.push_back(setting);
            }
            return Error::OK;
        }

        case ELEMENT_REGION: {
            MetadataRegion* region = (MetadataRegion*)element;
            const char* locale = element->attribute("locale");
            if (locale != NULL) {
                region->_locale = locale;
            }
            const char* gmt_offset = element->attribute("gmtOffset");
            if (gmt_offset != NULL && !parseLong(gmt_offset, &region->_gmt_offset)) {
                return Error(ERR_INVALID_METADATA, "region with invalid gmtOffset", offset);
            }
            const char* dst = element->attribute("dst");
            if (dst != NULL && !parseLong(dst, &region->_dst)) {
                return Error(ERR_INVALID_METADATA, "region with invalid dst", offset);
            }
            if (_region == NULL) {
                _region = region;
            }
            return Error::OK;
        }

        default:
            return Error::OK;
    }
}

Error Metadata::registerType(TypeDescriptor* type, u64 offset) {
    std::pair<std::map<long long, TypeDescriptor*>::iterator, bool> inserted =
        _types.insert(std::make_pair(type->_id, type));
    if (!inserted.second) {
        return Error::format(ERR_DUPLICATE_TYPE_ID, offset, "type id %lld declared by both %s and %s",
                             type->_id, inserted.first->second->_name.c_str(), type->_name.c_str());
    }
    if (!_types_by_name.insert(std::make_pair(type->_name, type)).second) {
        Log::debug("Type name %s declared more than once", type->_name.c_str());
    }
    return Error::OK;
}

Error Metadata::validate() const {
    for (std::map<long long, TypeDescriptor*>::const_iterator it = _types.begin(); it != _types.end(); ++it) {
        const TypeDescriptor* type = it->second;
        for (size_t i = 0; i < type->_fields.size(); i++) {
            const FieldDescriptor* field = type->_fields[i];
            if (field->type() == NULL) {
                return Error::format(ERR_DANGLING_TYPE_REFERENCE, 0, "field %s.%s refers to undeclared type id %lld",
                                     type->_name.c_str(), field->_name.c_str(), field->_type_id).forType(type->_name);
            }
        }
    }
    return Error::OK;
}

static void appendName(const std::string& name, std::string& out) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%zu'", name.size());
    out.append(buf).append(name);
}

// Types sorted by id, each with its fields in declaration order.
// Names are length prefixed to keep the form unambiguous.
void Metadata::buildCanonicalForm() {
    char buf[64];
    _canonical.clear();
    for (std::map<long long, TypeDescriptor*>::const_iterator it = _types.begin(); it != _types.end(); ++it) {
        const TypeDescriptor* type = it->second;
        snprintf(buf, sizeof(buf), "%lld:", type->_id);
        _canonical.append(buf);
        appendName(type->_name, _canonical);
        _canonical.append(type->_simple ? "!" : "<");
        appendName(type->_super_type, _canonical);
        _canonical.append("{");
        for (size_t i = 0; i < type->_fields.size(); i++) {
            const FieldDescriptor* field = type->_fields[i];
            snprintf(buf, sizeof(buf), ":%lld:%d:%d;", field->_type_id, field->_dimension, field->_constant_pool ? 1 : 0);
            appendName(field->_name, _canonical);
            _canonical.append(buf);
        }
        _canonical.append("}\n");
    }

    // FNV-1a
    u64 h = 14695981039346656037ULL;
    for (size_t i = 0; i < _canonical.size(); i++) {
        h = (h ^ (u8)_canonical[i]) * 1099511628211ULL;
    }
    _fingerprint = h;
}
