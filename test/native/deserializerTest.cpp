/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdio.h>
#include "collectingListener.h"
#include "deserializer.h"
#include "parserContext.h"
#include "recordingBuilder.h"
#include "targetShape.h"
#include "testRunner.hpp"

static const long long T_POINT = 100;
static const long long T_ALL = 101;
static const long long T_ODD = 102;
static const long long T_U4 = 50;
static const long long T_CHAIN = 110;

static const char* const ALL_TYPES_VALUE =
    "{\"flag\":true,\"b\":-2,\"c\":65,\"s\":-300,\"i\":-5,\"l\":1099511627776,\"f\":1.5,\"d\":0.25,"
    "\"name\":\"abc\",\"values\":[1,2,3],\"origin\":{\"x\":7,\"y\":8}}";

static const char* const MODES[] = {
    "strategy=eager",
    "strategy=lazy",
    "strategy=compiled",
    "strategy=auto",
    "strategy=compiled,lazyfields=2",
    "constants=eager",
    "cache=chunk"
};

static const int MODE_COUNT = sizeof(MODES) / sizeof(MODES[0]);

static void declareTypes(RecordingBuilder& rb) {
    rb.declareDefaultTypes();
    rb.declareClass(T_U4, "u4");
    rb.declareClass(T_POINT, "demo.Point", "jdk.jfr.Event")
        .field("x", RecordingBuilder::T_INT)
        .field("y", RecordingBuilder::T_INT);
    rb.declareClass(T_ALL, "demo.AllTypes", "jdk.jfr.Event")
        .field("flag", RecordingBuilder::T_BOOLEAN)
        .field("b", RecordingBuilder::T_BYTE)
        .field("c", RecordingBuilder::T_CHAR)
        .field("s", RecordingBuilder::T_SHORT)
        .field("i", RecordingBuilder::T_INT)
        .field("l", RecordingBuilder::T_LONG)
        .field("f", RecordingBuilder::T_FLOAT)
        .field("d", RecordingBuilder::T_DOUBLE)
        .field("name", RecordingBuilder::T_STRING)
        .field("values", RecordingBuilder::T_INT, false, 1)
        .field("origin", T_POINT);
    rb.declareClass(T_ODD, "demo.Odd", "jdk.jfr.Event").field("raw", T_U4);

    // demo.Chain0 .. demo.Chain5, each holding the next one inline
    for (int i = 0; i < 6; i++) {
        char name[32];
        snprintf(name, sizeof(name), "demo.Chain%d", i);
        Element& chain = rb.declareClass(T_CHAIN + i, name);
        if (i < 5) {
            chain.field("next", T_CHAIN + i + 1);
        } else {
            chain.field("x", RecordingBuilder::T_INT);
        }
    }
}

static void writeAllTypes(Buffer& out) {
    out.put8(1);
    out.put8(0xfe);
    out.putVarint('A');
    out.putVarint((u16)-300);
    out.putVarint((u32)-5);
    out.putVarint(1ULL << 40);
    out.putFloat(1.5f);
    out.putDouble(0.25);
    out.putUtf8("abc");
    out.putVarint(3);
    out.putVarint(1);
    out.putVarint(2);
    out.putVarint(3);
    out.putVarint(7);
    out.putVarint(8);
}

static void writePointEvent(RecordingBuilder& rb, int x, int y) {
    rb.beginEvent(T_POINT);
    rb.out().putVarint((u32)x);
    rb.out().putVarint((u32)y);
    rb.endEvent();
}

static void buildRecording(RecordingBuilder& rb) {
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    writePointEvent(rb, 3, 4);
    rb.beginEvent(T_ALL);
    writeAllTypes(rb.out());
    rb.endEvent();
    rb.endChunk();
}

struct PointTarget {
    int x;
    int y;
};

struct SampleTarget {
    bool flag;
    int b;
    int c;
    long long l;
    float f;
    double d;
    std::string name;
    Value values;
    Value origin;
};

// Decodes every event of one type into a reused T
template <typename T>
class TypedListener : public EventListener {
  public:
    long long _type_id;
    const TargetShape* _shape;
    T _target;
    std::vector<T> _received;
    std::vector<std::string> _rendered;
    std::vector<Error> _errors;

    TypedListener(long long type_id, const TargetShape* shape) :
        _type_id(type_id), _shape(shape), _target(), _received(), _rendered(), _errors() {
    }

    bool acceptType(const TypeDescriptor& type) {
        return type._id == _type_id;
    }

    void* targetFor(const TypeDescriptor& type, const TargetShape** shape) {
        *shape = _shape;
        _target = T();
        return &_target;
    }

    void onTypedEvent(const TypeDescriptor& type, void* target, EventControl& control) {
        _received.push_back(*(T*)target);
        render(*(T*)target);
    }

    bool onEventError(const Error& error, EventControl& control) {
        _errors.push_back(error);
        return false;
    }

    template <typename U>
    void render(const U& target) {
    }

    // Records and arrays are only valid during the callback
    void render(const SampleTarget& s) {
        _rendered.push_back(s.values.toString() + " " + s.origin.toString());
    }
};

class LazinessListener : public EventListener {
  public:
    std::vector<char> _lazy;

    LazinessListener() : _lazy() {
    }

    void onEvent(const TypeDescriptor& type, const Value& value, EventControl& control) {
        _lazy.push_back(value.record() != NULL && value.record()->isLazy());
    }
};

TEST_CASE(Deserializer_point_generic) {
    RecordingBuilder rb;
    buildRecording(rb);

    for (int i = 0; i < MODE_COUNT; i++) {
        CollectingListener listener;
        ASSERT_EQ(parseRecording(rb.bytes(), MODES[i], listener).kind(), ERR_NONE);
        ASSERT_EQ(listener._events.size(), 2);
        CHECK_EQ(listener._events[0].c_str(), "demo.Point {\"x\":3,\"y\":4}");
    }
}

TEST_CASE(Deserializer_all_primitive_kinds) {
    RecordingBuilder rb;
    buildRecording(rb);

    std::string expected = std::string("demo.AllTypes ") + ALL_TYPES_VALUE;
    for (int i = 0; i < MODE_COUNT; i++) {
        CollectingListener listener;
        ASSERT_EQ(parseRecording(rb.bytes(), MODES[i], listener).kind(), ERR_NONE);
        ASSERT_EQ(listener._events.size(), 2);
        CHECK_EQ(listener._events[1].c_str(), expected.c_str());
    }
}

TEST_CASE(Deserializer_tiers_are_equivalent_across_segments) {
    RecordingBuilder rb;
    buildRecording(rb);

    CollectingListener reference;
    ASSERT_EQ(parseRecording(rb.bytes(), "strategy=eager", reference).kind(), ERR_NONE);

    // Tiny segments force every read through the slow path
    for (int i = 0; i < MODE_COUNT; i++) {
        CollectingListener listener;
        ASSERT_EQ(parseRecording(rb.bytes(), MODES[i], listener, 7).kind(), ERR_NONE);
        CHECK(listener.joined() == reference.joined());
    }
}

TEST_CASE(Deserializer_point_typed) {
    RecordingBuilder rb;
    buildRecording(rb);

    TypedShape<PointTarget> shape("PointTarget");
    shape.bind("x", &PointTarget::x).bind("y", &PointTarget::y);
    CHECK_EQ(shape.key().c_str(), "x:int,y:int");

    for (int i = 0; i < MODE_COUNT; i++) {
        TypedListener<PointTarget> listener(T_POINT, &shape);
        ASSERT_EQ(parseRecording(rb.bytes(), MODES[i], listener).kind(), ERR_NONE);
        ASSERT_EQ(listener._received.size(), 1);
        CHECK_EQ(listener._received[0].x, 3);
        CHECK_EQ(listener._received[0].y, 4);
    }
}

TEST_CASE(Deserializer_typed_members_of_every_kind) {
    RecordingBuilder rb;
    buildRecording(rb);

    TypedShape<SampleTarget> shape("SampleTarget");
    shape.bind("flag", &SampleTarget::flag)
        .bind("b", &SampleTarget::b)
        .bind("c", &SampleTarget::c)
        .bind("l", &SampleTarget::l)
        .bind("f", &SampleTarget::f)
        .bind("d", &SampleTarget::d)
        .bind("name", &SampleTarget::name)
        .bind("values", &SampleTarget::values)
        .bind("origin", &SampleTarget::origin);

    for (int i = 0; i < MODE_COUNT; i++) {
        TypedListener<SampleTarget> listener(T_ALL, &shape);
        ASSERT_EQ(parseRecording(rb.bytes(), MODES[i], listener).kind(), ERR_NONE);
        ASSERT_EQ(listener._received.size(), 1);

        const SampleTarget& s = listener._received[0];
        CHECK(s.flag);
        CHECK_EQ(s.b, -2);
        CHECK_EQ(s.c, 'A');
        CHECK_EQ(s.l, 1LL << 40);
        CHECK(s.f == 1.5f);
        CHECK(s.d == 0.25);
        CHECK_EQ(s.name.c_str(), "abc");
        ASSERT_EQ(listener._rendered.size(), 1);
        CHECK_EQ(listener._rendered[0].c_str(), "[1,2,3] {\"x\":7,\"y\":8}");
    }
}

TEST_CASE(Deserializer_typed_member_mismatch) {
    RecordingBuilder rb;
    buildRecording(rb);

    struct Wrong {
        int name;
    };
    TypedShape<Wrong> shape("Wrong");
    shape.bind("name", &Wrong::name);

    for (int i = 0; i < MODE_COUNT; i++) {
        TypedListener<Wrong> listener(T_ALL, &shape);
        Error error = parseRecording(rb.bytes(), MODES[i], listener);
        CHECK_EQ(error.kind(), ERR_DECODE_FAILURE);
        CHECK_EQ(listener._received.size(), 0);
        CHECK_EQ(listener._errors.size(), 1);
    }
}

TEST_CASE(Deserializer_typed_missing_field) {
    RecordingBuilder rb;
    buildRecording(rb);

    TypedShape<PointTarget> shape("PointTarget");
    shape.bind("x", &PointTarget::x).bind("z", &PointTarget::y);

    for (int i = 0; i < MODE_COUNT; i++) {
        TypedListener<PointTarget> listener(T_POINT, &shape);
        Error error = parseRecording(rb.bytes(), MODES[i], listener);
        CHECK_EQ(error.kind(), ERR_DECODE_FAILURE);
        CHECK_EQ(error.typeName().c_str(), "demo.Point");
        CHECK_EQ(listener._received.size(), 0);
    }
}

TEST_CASE(Deserializer_null_and_empty_strings) {
    RecordingBuilder rb;
    rb.declareDefaultTypes();
    rb.declareClass(200, "demo.Strings", "jdk.jfr.Event")
        .field("a", RecordingBuilder::T_STRING)
        .field("b", RecordingBuilder::T_STRING)
        .field("c", RecordingBuilder::T_STRING);
    rb.beginChunk();
    rb.writeMetadata();
    rb.beginEvent(200);
    rb.out().putNullString();
    rb.out().putEmptyString();
    rb.out().putCharArray("utf16");
    rb.endEvent();
    rb.endChunk();

    for (int i = 0; i < MODE_COUNT; i++) {
        CollectingListener listener;
        ASSERT_EQ(parseRecording(rb.bytes(), MODES[i], listener).kind(), ERR_NONE);
        ASSERT_EQ(listener._events.size(), 1);
        CHECK_EQ(listener._events[0].c_str(), "demo.Strings {\"a\":null,\"b\":\"\",\"c\":\"utf16\"}");
    }

    struct Strings {
        Value a;
        std::string b;
        std::string c;
    };
    TypedShape<Strings> shape("Strings");
    shape.bind("a", &Strings::a).bind("b", &Strings::b).bind("c", &Strings::c);

    TypedListener<Strings> typed(200, &shape);
    ASSERT_EQ(parseRecording(rb.bytes(), "", typed).kind(), ERR_NONE);
    ASSERT_EQ(typed._received.size(), 1);
    CHECK(typed._received[0].a.isNull());
    CHECK(typed._received[0].b.empty());
    CHECK_EQ(typed._received[0].c.c_str(), "utf16");
}

TEST_CASE(Deserializer_truncated_event) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    rb.beginEvent(T_POINT);
    rb.out().putVarint(3);
    rb.endEvent();
    rb.endChunk();

    for (int i = 0; i < MODE_COUNT; i++) {
        CollectingListener listener;
        Error error = parseRecording(rb.bytes(), MODES[i], listener);
        CHECK_EQ(error.kind(), ERR_DECODE_FAILURE);
        CHECK_EQ(error.cause(), ERR_UNEXPECTED_END_OF_DATA);
        CHECK_EQ(error.typeName().c_str(), "demo.Point");
        CHECK_EQ(error.chunk(), 0);
        CHECK_EQ(listener._event_errors.size(), 1);
    }
}

TEST_CASE(Deserializer_unknown_primitive_type) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    rb.beginEvent(T_ODD);
    rb.out().putVarint(1);
    rb.endEvent();
    rb.endChunk();

    for (int i = 0; i < MODE_COUNT; i++) {
        CollectingListener listener;
        Error error = parseRecording(rb.bytes(), MODES[i], listener);
        CHECK_EQ(error.kind(), ERR_UNKNOWN_PRIMITIVE_TYPE);
        CHECK_EQ(error.typeName().c_str(), "u4");
    }
}

TEST_CASE(Deserializer_nesting_limit) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.declareClass(120, "demo.Deep", "jdk.jfr.Event").field("chain", T_CHAIN);
    rb.beginChunk();
    rb.writeMetadata();
    rb.beginEvent(120);
    rb.out().putVarint(42);
    rb.endEvent();
    rb.endChunk();

    CollectingListener allowed;
    ASSERT_EQ(parseRecording(rb.bytes(), "", allowed).kind(), ERR_NONE);
    ASSERT_EQ(allowed._events.size(), 1);
    CHECK_EQ(allowed._events[0].c_str(),
             "demo.Deep {\"chain\":{\"next\":{\"next\":{\"next\":{\"next\":{\"next\":{\"x\":42}}}}}}}");

    const char* limited[] = {"maxdepth=4,strategy=eager", "maxdepth=4,strategy=compiled"};
    for (int i = 0; i < 2; i++) {
        CollectingListener listener;
        CHECK_EQ(parseRecording(rb.bytes(), limited[i], listener).kind(), ERR_DECODE_FAILURE);
    }
}

TEST_CASE(Deserializer_laziness_follows_strategy) {
    RecordingBuilder rb;
    buildRecording(rb);

    LazinessListener eager;
    ASSERT_EQ(parseRecording(rb.bytes(), "strategy=eager", eager).kind(), ERR_NONE);
    ASSERT_EQ(eager._lazy.size(), 2);
    CHECK_FALSE(eager._lazy[0]);
    CHECK_FALSE(eager._lazy[1]);

    LazinessListener lazy;
    ASSERT_EQ(parseRecording(rb.bytes(), "strategy=lazy", lazy).kind(), ERR_NONE);
    ASSERT_EQ(lazy._lazy.size(), 2);
    CHECK(lazy._lazy[0]);
    CHECK(lazy._lazy[1]);

    // Only the wide record exceeds the field threshold
    LazinessListener compiled;
    ASSERT_EQ(parseRecording(rb.bytes(), "strategy=compiled,lazyfields=4", compiled).kind(), ERR_NONE);
    ASSERT_EQ(compiled._lazy.size(), 2);
    CHECK_FALSE(compiled._lazy[0]);
    CHECK(compiled._lazy[1]);

    // Eager constants rule out lazy records
    LazinessListener constants;
    ASSERT_EQ(parseRecording(rb.bytes(), "strategy=lazy,constants=eager", constants).kind(), ERR_NONE);
    ASSERT_EQ(constants._lazy.size(), 2);
    CHECK_FALSE(constants._lazy[1]);
}

TEST_CASE(Deserializer_skip_and_decode_outside_events) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    rb.endChunk();

    MemorySource recording(rb.out().data(), rb.out().size());
    ChunkIterator chunks(&recording);
    ChunkHeader header;
    ByteReader chunk;
    ASSERT_EQ(chunks.next(&header, &chunk).kind(), ERR_NONE);

    Buffer payload;
    writeAllTypes(payload);
    writeAllTypes(payload);
    payload.put8(0x5a);
    MemorySource values(payload.data(), payload.size(), 5);

    const char* modes[] = {"strategy=eager", "strategy=compiled"};
    for (int i = 0; i < 2; i++) {
        ParserOptions options;
        ASSERT_EQ(options.parse(modes[i]).kind(), ERR_NONE);
        RecordingContext context(options);
        ChunkContext* chunk_context = NULL;
        ASSERT_EQ(ChunkContext::create(&context, header, chunk, &chunk_context).kind(), ERR_NONE);

        Deserializer* deserializer = NULL;
        const TypeDescriptor* type = chunk_context->metadata().type(T_ALL);
        ASSERT_EQ(chunk_context->deserializer(type, NULL, &deserializer).kind(), ERR_NONE);
        CHECK_EQ(deserializer->type(), type);
        CHECK_EQ(deserializer->plan() != NULL, options.compiled());

        ByteReader reader(&values);
        ASSERT_EQ(deserializer->skip(reader).kind(), ERR_NONE);

        Value value;
        ASSERT_EQ(deserializer->deserialize(reader, &value).kind(), ERR_NONE);
        std::string text = value.toString();
        CHECK_EQ(text.c_str(), ALL_TYPES_VALUE);
        CHECK_EQ(reader.readU8(), 0x5a);

        // Same deserializer on a repeated lookup
        Deserializer* again = NULL;
        ASSERT_EQ(chunk_context->deserializer(type, NULL, &again).kind(), ERR_NONE);
        CHECK_EQ(again, deserializer);

        delete chunk_context;
    }
}
