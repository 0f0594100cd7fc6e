/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _RECORDINGBUILDER_H
#define _RECORDINGBUILDER_H

#include <map>
#include <string>
#include <vector>
#include "arch.h"
#include "chunkHeader.h"


// Growable big-endian output buffer
class Buffer {
  private:
    std::vector<u8> _data;

  public:
    Buffer() : _data() {
    }

    size_t size() const {
        return _data.size();
    }

    const u8* data() const {
        return _data.data();
    }

    const std::vector<u8>& bytes() const {
        return _data;
    }

    u8& operator[](size_t index) {
        return _data[index];
    }

    void truncate(size_t size) {
        _data.resize(size);
    }

    void put8(u8 v);
    void put16(u16 v);
    void put32(u32 v);
    void put64(u64 v);
    void putFloat(float v);
    void putDouble(double v);
    void putVarint(u64 v);
    void putBytes(const void* data, size_t length);
    void putUtf8(const std::string& s);
    void putLatin1(const std::string& s);
    void putCharArray(const std::string& ascii);
    void putStringRef(u64 index);
    void putNullString();
    void putEmptyString();

    // Reserves a 5-byte varint to be filled in later
    size_t reserveVarint();
    void patchVarint(size_t pos, u32 v);
    void patch64(size_t pos, u64 v);
};


// Element of a metadata tree. Attribute values are kept as strings,
// just like in the metadata event.
class Element {
  private:
    std::string _name;
    std::vector<std::pair<std::string, std::string> > _attributes;
    std::vector<Element*> _children;

    Element(const Element&);
    Element& operator=(const Element&);

  public:
    explicit Element(const std::string& name) : _name(name), _attributes(), _children() {
    }

    ~Element();

    Element& attr(const std::string& key, const std::string& value);
    Element& attr(const std::string& key, long long value);

    // Appends a child and returns it
    Element& add(const std::string& name);

    // Adds a field to a class element and returns the class
    Element& field(const std::string& name, long long type_id, bool constant_pool = false, int dimension = 0);

    void collectStrings(std::map<std::string, int>& table, std::vector<std::string>& strings) const;
    void write(Buffer& out, const std::map<std::string, int>& table) const;
};


// Writes JFR recordings in memory: chunk headers, metadata events,
// checkpoint events with constant pools, and regular events.
//
//     RecordingBuilder rb;
//     rb.declareDefaultTypes();
//     rb.declareClass(100, "Point").field("x", T_INT).field("y", T_INT);
//     rb.beginChunk();
//     rb.writeMetadata();
//     rb.beginEvent(100); rb.out().putVarint(3); rb.out().putVarint(4); rb.endEvent();
//     rb.endChunk();
class RecordingBuilder {
  private:
    Buffer _out;
    Element* _root;
    Element* _metadata;
    size_t _chunk_start;
    u64 _meta_offset;
    u64 _cp_offset;
    size_t _event_start;
    size_t _event_size_pos;
    size_t _checkpoint_start;
    size_t _checkpoint_delta_pos;
    size_t _size_pos;
    size_t _pool_count_pos;
    u32 _pool_count;
    u64 _metadata_id;

    RecordingBuilder(const RecordingBuilder&);
    RecordingBuilder& operator=(const RecordingBuilder&);

  public:
    static const long long T_LONG = 10;
    static const long long T_INT = 11;
    static const long long T_BOOLEAN = 12;
    static const long long T_DOUBLE = 13;
    static const long long T_FLOAT = 14;
    static const long long T_STRING = 15;
    static const long long T_SHORT = 16;
    static const long long T_BYTE = 17;
    static const long long T_CHAR = 18;

    RecordingBuilder();
    ~RecordingBuilder();

    Buffer& out() {
        return _out;
    }

    // Drops all declared classes
    void resetMetadata();

    // Primitive types under the T_* ids above
    void declareDefaultTypes();

    Element& declareClass(long long id, const std::string& name, const std::string& super_type = "",
                          bool simple = false);

    // Raw element below the "metadata" element
    Element& metadataElement(const std::string& name) {
        return _metadata->add(name);
    }

    void beginChunk();
    void writeMetadata();
    void endChunk(u32 features = FEATURE_COMPRESSED_INTS, u16 major = 2, u16 minor = 0);

    // Checkpoints are chained in the order they are written
    void beginCheckpoint();
    void beginPool(long long type_id, u32 count);
    void endCheckpoint();

    // Empty checkpoint whose delta to the next one is written as is
    void rawCheckpoint(u64 delta);

    void beginEvent(long long type_id);
    void endEvent();

    // Event with a fixed size but arbitrary content
    void rawEvent(u64 size, long long type_id);

    // Offset of the current chunk in the recording
    size_t chunkStart() const {
        return _chunk_start;
    }

    const std::vector<u8>& bytes() const {
        return _out.bytes();
    }
};

#endif // _RECORDINGBUILDER_H
