/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _RECORDINGPARSER_H
#define _RECORDINGPARSER_H

#include <vector>
#include "byteSource.h"
#include "chunkHeader.h"
#include "parserContext.h"
#include "parserOptions.h"
#include "targetShape.h"
#include "value.h"


class EventControl {
  private:
    volatile bool* _abort;
    int _chunk;
    u64 _offset;

    friend class RecordingParser;

  public:
    EventControl(volatile bool* abort, int chunk) : _abort(abort), _chunk(chunk), _offset(0) {
    }

    int chunk() const {
        return _chunk;
    }

    // Absolute offset of the current event in the recording
    u64 offset() const {
        return _offset;
    }

    // Stops parsing after the current event; other chunks are not started
    void abort() {
        *_abort = true;
    }

    bool aborted() const {
        return *_abort;
    }
};

// Receives the decoded recording. With threads > 1, chunks are parsed in parallel
// and callbacks of different chunks may run concurrently.
class EventListener {
  public:
    virtual ~EventListener() {
    }

    virtual void onRecordingStart(const ByteSource& source) {
    }

    // Return false to skip the chunk
    virtual bool onChunkStart(const ChunkHeader& header) {
        return true;
    }

    // Return false to skip the events of the chunk
    virtual bool onMetadata(const ChunkContext& context) {
        return true;
    }

    // Events of rejected types are skipped without decoding
    virtual bool acceptType(const TypeDescriptor& type) {
        return true;
    }

    // Object to decode the event into, or NULL for a generic Value
    virtual void* targetFor(const TypeDescriptor& type, const TargetShape** shape) {
        return NULL;
    }

    virtual void onEvent(const TypeDescriptor& type, const Value& value, EventControl& control) {
    }

    virtual void onTypedEvent(const TypeDescriptor& type, void* target, EventControl& control) {
    }

    // Return true to skip the broken event and continue with the next one
    virtual bool onEventError(const Error& error, EventControl& control) {
        return false;
    }

    // Return true to continue with the next chunk
    virtual bool onChunkError(const Error& error) {
        return false;
    }

    virtual void onChunkEnd(const ChunkHeader& header) {
    }

    virtual void onRecordingEnd(const Error& result) {
    }
};


class RecordingParser {
  private:
    struct ChunkTask {
        ChunkHeader header;
        ByteReader reader;
        Error error;
    };

    struct WorkerState {
        RecordingParser* parser;
        EventListener* listener;
        std::vector<ChunkTask>* tasks;
        volatile int next;
    };

    ParserOptions _options;
    const ByteSource* _source;
    ByteSource* _owned_source;
    RecordingContext* _context;
    volatile bool _abort;
    volatile bool _failed;

    static void* workerEntry(void* arg);
    void workerLoop(WorkerState* state);

    void runTask(ChunkTask& task, EventListener& listener);
    Error parseChunk(const ChunkTask& task, EventListener& listener);
    Error parseEvents(ChunkContext* context, EventListener& listener);
    Error decodeEvent(ChunkContext* context, const TypeDescriptor* type, ByteReader& event,
                      EventListener& listener, EventControl& control);

  public:
    explicit RecordingParser(const ParserOptions& options);
    ~RecordingParser();

    Error open(const char* path);

    // The source must outlive the parser
    void open(const ByteSource* source);

    Error parse(EventListener& listener);

    RecordingContext* context() const {
        return _context;
    }
};

#endif // _RECORDINGPARSER_H
