/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <algorithm>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include "collectingListener.h"
#include "recordingBuilder.h"
#include "testRunner.hpp"

static const long long T_SAMPLE = 100;
static const long long T_TICK = 101;

static void declareTypes(RecordingBuilder& rb) {
    rb.declareDefaultTypes();
    rb.declareClass(T_SAMPLE, "demo.Sample", "jdk.jfr.Event")
        .field("x", RecordingBuilder::T_INT)
        .field("y", RecordingBuilder::T_INT);
    rb.declareClass(T_TICK, "demo.Tick", "jdk.jfr.Event").field("time", RecordingBuilder::T_LONG);
}

static void writeSample(RecordingBuilder& rb, int x, int y) {
    rb.beginEvent(T_SAMPLE);
    rb.out().putVarint((u32)x);
    rb.out().putVarint((u32)y);
    rb.endEvent();
}

static void writeTick(RecordingBuilder& rb, long long time) {
    rb.beginEvent(T_TICK);
    rb.out().putVarint((u64)time);
    rb.endEvent();
}

// Chunk i holds samples (i, 0) .. (i, events - 1)
static void buildChunks(RecordingBuilder& rb, int chunks, int events) {
    declareTypes(rb);
    for (int i = 0; i < chunks; i++) {
        rb.beginChunk();
        rb.writeMetadata();
        for (int j = 0; j < events; j++) {
            writeSample(rb, i, j);
        }
        rb.endChunk();
    }
}

static std::string sample(int x, int y) {
    char buf[64];
    snprintf(buf, sizeof(buf), "demo.Sample {\"x\":%d,\"y\":%d}", x, y);
    return buf;
}

class RejectingListener : public CollectingListener {
  public:
    bool acceptType(const TypeDescriptor& type) {
        return type._name != "demo.Sample";
    }
};

TEST_CASE(RecordingParser_chunks_in_order) {
    RecordingBuilder rb;
    buildChunks(rb, 3, 2);

    CollectingListener listener;
    ASSERT_EQ(parseRecording(rb.bytes(), "", listener).kind(), ERR_NONE);
    ASSERT_EQ(listener._events.size(), 6);
    CHECK(listener._events[0] == sample(0, 0));
    CHECK(listener._events[3] == sample(1, 1));
    CHECK(listener._events[5] == sample(2, 1));

    ASSERT_EQ(listener._chunks.size(), 3);
    for (int i = 0; i < 3; i++) {
        CHECK_EQ(listener._chunks[i], i);
    }
    CHECK_EQ(listener._result.kind(), ERR_NONE);
}

TEST_CASE(RecordingParser_parse_twice) {
    RecordingBuilder rb;
    buildChunks(rb, 2, 3);

    ParserOptions options;
    MemorySource source(rb.out().data(), rb.out().size());
    RecordingParser parser(options);
    parser.open(&source);

    CollectingListener first;
    CollectingListener second;
    ASSERT_EQ(parser.parse(first).kind(), ERR_NONE);
    ASSERT_EQ(parser.parse(second).kind(), ERR_NONE);
    CHECK_EQ(first._events.size(), 6);
    CHECK(first.joined() == second.joined());
}

class MetadataListener : public CollectingListener {
  public:
    std::vector<std::string> _forms;

    MetadataListener() : _forms() {
    }

    bool onMetadata(const ChunkContext& context) {
        MutexLocker ml(_lock);
        _forms.push_back(context.metadata().canonicalForm());
        return true;
    }
};

TEST_CASE(RecordingParser_separate_parsers_agree) {
    RecordingBuilder rb;
    buildChunks(rb, 2, 3);

    ParserOptions options;
    MemorySource source(rb.out().data(), rb.out().size());

    MetadataListener first;
    MetadataListener second;
    {
        RecordingParser parser(options);
        parser.open(&source);
        ASSERT_EQ(parser.parse(first).kind(), ERR_NONE);
    }
    {
        RecordingParser parser(options);
        parser.open(&source);
        ASSERT_EQ(parser.parse(second).kind(), ERR_NONE);
    }

    CHECK_EQ(first._events.size(), 6);
    CHECK(first.joined() == second.joined());
    ASSERT_EQ(first._forms.size(), 2);
    ASSERT_EQ(second._forms.size(), 2);
    CHECK(!first._forms[0].empty());
    CHECK(first._forms[0] == second._forms[0]);
    CHECK(first._forms[1] == second._forms[1]);
}

TEST_CASE(RecordingParser_no_source) {
    ParserOptions options;
    RecordingParser parser(options);
    CollectingListener listener;
    CHECK_EQ(parser.parse(listener).kind(), ERR_IO);
}

TEST_CASE(RecordingParser_empty_recording) {
    std::vector<u8> empty;
    CollectingListener listener;
    Error error = parseRecording(empty, "", listener);
    CHECK_EQ(error.kind(), ERR_TRUNCATED_HEADER);
    CHECK_EQ(listener._events.size(), 0);
}

TEST_CASE(RecordingParser_truncated_second_chunk) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    writeSample(rb, 1, 2);
    rb.endChunk();
    rb.beginChunk();
    size_t second = rb.chunkStart();
    rb.writeMetadata();
    writeSample(rb, 3, 4);
    rb.endChunk();
    rb.out().truncate(second + CHUNK_HEADER_SIZE + 8);

    CollectingListener listener;
    Error error = parseRecording(rb.bytes(), "", listener);
    CHECK_EQ(error.kind(), ERR_INCONSISTENT_CHUNK);
    CHECK_EQ(error.chunk(), 1);

    // The intact chunk is still delivered
    ASSERT_EQ(listener._events.size(), 1);
    CHECK(listener._events[0] == sample(1, 2));
    CHECK_EQ(listener._result.kind(), ERR_INCONSISTENT_CHUNK);
}

TEST_CASE(RecordingParser_abort) {
    RecordingBuilder rb;
    buildChunks(rb, 3, 4);

    CollectingListener listener;
    listener._abort_after = 1;
    CHECK_EQ(parseRecording(rb.bytes(), "", listener).kind(), ERR_NONE);
    CHECK_EQ(listener._events.size(), 1);
    CHECK_EQ(listener._result.kind(), ERR_NONE);
}

TEST_CASE(RecordingParser_parallel_chunks) {
    RecordingBuilder rb;
    buildChunks(rb, 8, 25);

    CollectingListener sequential;
    ASSERT_EQ(parseRecording(rb.bytes(), "threads=1", sequential).kind(), ERR_NONE);

    const char* modes[] = {"threads=4", "threads=4,strategy=eager", "threads=0,cache=chunk", "threads=16"};
    for (size_t i = 0; i < sizeof(modes) / sizeof(modes[0]); i++) {
        CollectingListener parallel;
        ASSERT_EQ(parseRecording(rb.bytes(), modes[i], parallel).kind(), ERR_NONE);
        ASSERT_EQ(parallel._events.size(), 200);
        CHECK_EQ(parallel._chunks.size(), 8);

        // Chunks may complete in any order, events within a chunk stay ordered
        std::vector<std::string> expected = sequential._events;
        std::vector<std::string> actual = parallel._events;
        std::sort(expected.begin(), expected.end());
        std::sort(actual.begin(), actual.end());
        CHECK(expected == actual);
    }
}

TEST_CASE(RecordingParser_decoders_inherited_across_chunks) {
    RecordingBuilder rb;
    buildChunks(rb, 2, 3);

    ParserOptions options;
    ASSERT_EQ(options.parse("strategy=compiled").kind(), ERR_NONE);
    MemorySource source(rb.out().data(), rb.out().size());
    RecordingParser parser(options);
    parser.open(&source);

    CollectingListener listener;
    ASSERT_EQ(parser.parse(listener).kind(), ERR_NONE);
    CHECK_EQ(listener._events.size(), 6);
    CHECK_GTE(parser.context()->inherited(), 1);
    CHECK_EQ(parser.context()->cache()->created(), 1);
}

TEST_CASE(RecordingParser_chunk_cache_scope) {
    RecordingBuilder rb;
    buildChunks(rb, 2, 3);

    ParserOptions options;
    ASSERT_EQ(options.parse("strategy=compiled,cache=chunk").kind(), ERR_NONE);
    MemorySource source(rb.out().data(), rb.out().size());
    RecordingParser parser(options);
    parser.open(&source);

    CollectingListener listener;
    ASSERT_EQ(parser.parse(listener).kind(), ERR_NONE);
    CHECK_EQ(listener._events.size(), 6);
    CHECK_EQ(parser.context()->inherited(), 0);
    CHECK_EQ(parser.context()->cache()->created(), 0);
}

// Field names that contain separator characters must not make two shapes look alike
static void buildLookalikeChunks(RecordingBuilder& rb) {
    rb.declareDefaultTypes();
    rb.declareClass(300, "demo.P", "jdk.jfr.Event").field("x:int;y", RecordingBuilder::T_LONG);
    rb.beginChunk();
    rb.writeMetadata();
    rb.beginEvent(300);
    rb.out().putVarint(7);
    rb.endEvent();
    rb.endChunk();

    rb.resetMetadata();
    rb.declareDefaultTypes();
    rb.declareClass(300, "demo.P", "jdk.jfr.Event")
        .field("x", RecordingBuilder::T_INT)
        .field("y", RecordingBuilder::T_LONG);
    rb.beginChunk();
    rb.writeMetadata();
    rb.beginEvent(300);
    rb.out().putVarint(3);
    rb.out().putVarint(4);
    rb.endEvent();
    rb.endChunk();
}

TEST_CASE(RecordingParser_lookalike_shapes_get_own_decoders) {
    RecordingBuilder rb;
    buildLookalikeChunks(rb);

    CollectingListener eager;
    ASSERT_EQ(parseRecording(rb.bytes(), "strategy=eager", eager).kind(), ERR_NONE);
    ASSERT_EQ(eager._events.size(), 2);
    CHECK_EQ(eager._events[1].c_str(), "demo.P {\"x\":3,\"y\":4}");

    ParserOptions options;
    ASSERT_EQ(options.parse("strategy=compiled").kind(), ERR_NONE);
    MemorySource source(rb.out().data(), rb.out().size());
    RecordingParser parser(options);
    parser.open(&source);

    CollectingListener compiled;
    ASSERT_EQ(parser.parse(compiled).kind(), ERR_NONE);
    CHECK(compiled.joined() == eager.joined());
    CHECK_EQ(parser.context()->inherited(), 0);
    CHECK_EQ(parser.context()->cache()->created(), 2);
}

TEST_CASE(RecordingParser_broken_chunk_fails_by_default) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    writeSample(rb, 1, 1);
    rb.beginEvent(999);
    rb.endEvent();
    writeSample(rb, 1, 2);
    rb.endChunk();
    rb.beginChunk();
    rb.writeMetadata();
    writeSample(rb, 2, 1);
    rb.endChunk();

    CollectingListener listener;
    Error error = parseRecording(rb.bytes(), "", listener);
    CHECK_EQ(error.kind(), ERR_DANGLING_TYPE_REFERENCE);
    CHECK_EQ(error.chunk(), 0);
    CHECK_EQ(listener._event_errors.size(), 1);
    CHECK_EQ(listener._chunk_errors.size(), 1);
    ASSERT_EQ(listener._events.size(), 1);
    CHECK(listener._events[0] == sample(1, 1));
}

TEST_CASE(RecordingParser_skip_broken_chunks) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    writeSample(rb, 1, 1);
    rb.rawEvent(0, T_SAMPLE);
    rb.endChunk();
    rb.beginChunk();
    rb.writeMetadata();
    writeSample(rb, 2, 1);
    rb.endChunk();

    // Either the listener or the option lets parsing go on
    CollectingListener listener;
    listener._skip_broken_chunks = true;
    ASSERT_EQ(parseRecording(rb.bytes(), "", listener).kind(), ERR_NONE);
    CHECK_EQ(listener._chunk_errors.size(), 1);
    CHECK_EQ(listener._chunk_errors[0].kind(), ERR_DECODE_FAILURE);
    ASSERT_EQ(listener._events.size(), 2);
    CHECK(listener._events[1] == sample(2, 1));
    ASSERT_EQ(listener._chunks.size(), 1);
    CHECK_EQ(listener._chunks[0], 1);

    CollectingListener with_option;
    ASSERT_EQ(parseRecording(rb.bytes(), "skipbroken", with_option).kind(), ERR_NONE);
    CHECK_EQ(with_option._chunk_errors.size(), 1);
    CHECK_EQ(with_option._events.size(), 2);
}

TEST_CASE(RecordingParser_skip_broken_events) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    writeSample(rb, 1, 1);
    rb.beginEvent(999);
    rb.out().putVarint(42);
    rb.endEvent();
    rb.beginEvent(T_SAMPLE);
    rb.out().putVarint(5);
    rb.endEvent();
    writeSample(rb, 1, 2);
    rb.endChunk();

    CollectingListener listener;
    listener._skip_broken_events = true;
    ASSERT_EQ(parseRecording(rb.bytes(), "", listener).kind(), ERR_NONE);
    ASSERT_EQ(listener._event_errors.size(), 2);
    CHECK_EQ(listener._event_errors[0].kind(), ERR_DANGLING_TYPE_REFERENCE);
    CHECK_EQ(listener._event_errors[1].kind(), ERR_DECODE_FAILURE);
    CHECK_EQ(listener._event_errors[1].cause(), ERR_UNEXPECTED_END_OF_DATA);
    CHECK_EQ(listener._chunk_errors.size(), 0);
    ASSERT_EQ(listener._events.size(), 2);
    CHECK(listener._events[1] == sample(1, 2));
}

TEST_CASE(RecordingParser_rejected_types_are_not_decoded) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    writeSample(rb, 1, 1);
    writeTick(rb, 77);
    // Broken, but never looked at
    rb.beginEvent(T_SAMPLE);
    rb.endEvent();
    writeTick(rb, 78);
    rb.endChunk();

    RejectingListener listener;
    ASSERT_EQ(parseRecording(rb.bytes(), "", listener).kind(), ERR_NONE);
    ASSERT_EQ(listener._events.size(), 2);
    CHECK_EQ(listener._events[0].c_str(), "demo.Tick {\"time\":77}");
    CHECK_EQ(listener._events[1].c_str(), "demo.Tick {\"time\":78}");
    CHECK_EQ(listener._event_errors.size(), 0);
}

TEST_CASE(RecordingParser_event_overruns_chunk) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    writeSample(rb, 1, 1);
    rb.rawEvent(1000, T_SAMPLE);
    rb.endChunk();

    CollectingListener listener;
    Error error = parseRecording(rb.bytes(), "", listener);
    CHECK_EQ(error.kind(), ERR_DECODE_FAILURE);
    CHECK_EQ(error.chunk(), 0);
    CHECK_EQ(listener._events.size(), 1);
}

TEST_CASE(RecordingParser_zero_size_event) {
    RecordingBuilder rb;
    declareTypes(rb);
    rb.beginChunk();
    rb.writeMetadata();
    rb.rawEvent(0, T_SAMPLE);
    rb.endChunk();

    CollectingListener listener;
    Error error = parseRecording(rb.bytes(), "", listener);
    CHECK_EQ(error.kind(), ERR_DECODE_FAILURE);
    CHECK_GTE(error.offset(), CHUNK_HEADER_SIZE);
    CHECK_EQ(listener._events.size(), 0);
}

TEST_CASE(RecordingParser_small_segments) {
    RecordingBuilder rb;
    buildChunks(rb, 3, 5);

    CollectingListener whole;
    CollectingListener split;
    ASSERT_EQ(parseRecording(rb.bytes(), "", whole).kind(), ERR_NONE);
    ASSERT_EQ(parseRecording(rb.bytes(), "", split, 5).kind(), ERR_NONE);
    CHECK_EQ(split._events.size(), 15);
    CHECK(whole.joined() == split.joined());
}

TEST_CASE(RecordingParser_open_file) {
    RecordingBuilder rb;
    buildChunks(rb, 2, 2);

    char path[] = "/tmp/jfrparser-test-XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GTE(fd, 0);
    const std::vector<u8>& bytes = rb.bytes();
    ssize_t written = write(fd, bytes.data(), bytes.size());
    close(fd);
    ASSERT_EQ(written, (ssize_t)bytes.size());

    ParserOptions options;
    ASSERT_EQ(options.parse("segment=4k").kind(), ERR_NONE);
    RecordingParser parser(options);
    Error error = parser.open(path);
    unlink(path);
    ASSERT_EQ(error.kind(), ERR_NONE);

    CollectingListener listener;
    ASSERT_EQ(parser.parse(listener).kind(), ERR_NONE);
    ASSERT_EQ(listener._events.size(), 4);
    CHECK(listener._events[3] == sample(1, 1));
}

TEST_CASE(RecordingParser_missing_file) {
    ParserOptions options;
    RecordingParser parser(options);
    Error error = parser.open("/nonexistent/recording.jfr");
    CHECK_EQ(error.kind(), ERR_IO);
    CHECK(error.message().find("/nonexistent/recording.jfr") != std::string::npos);
}
