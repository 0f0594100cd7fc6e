/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _EVENTITERATOR_H
#define _EVENTITERATOR_H

#include <deque>
#include <pthread.h>
#include <string>
#include "mutex.h"
#include "recordingParser.h"

const size_t DEFAULT_ITERATOR_CAPACITY = 1024;


// Event handed out by EventIterator. The value is materialized,
// so it stays valid after its chunk has been parsed.
struct RecordedEvent {
    std::string type_name;
    long long type_id;
    int chunk;
    u64 offset;
    Value value;

    RecordedEvent() : type_name(), type_id(0), chunk(NO_CHUNK), offset(0), value() {
    }
};

// Pull-style access to a recording:
//
//     EventIterator events(options);
//     if (!events.open(path)) {
//         RecordedEvent event;
//         while (events.next(&event)) { ... }
//     }
//
// The recording is parsed on a separate thread that blocks once
// `capacity` events are waiting to be taken. With threads > 1, events
// of different chunks may interleave.
class EventIterator : private EventListener {
  private:
    RecordingParser _parser;
    int _max_depth;
    bool _skip_broken;
    size_t _capacity;

    WaitableMutex _lock;
    std::deque<RecordedEvent> _queue;
    pthread_t _thread;
    bool _started;
    bool _finished;
    bool _closed;
    Error _result;

    EventIterator(const EventIterator&);
    EventIterator& operator=(const EventIterator&);

    static void* threadEntry(void* arg);
    Error start();
    void finish(const Error& result);

    void onEvent(const TypeDescriptor& type, const Value& value, EventControl& control);
    bool onEventError(const Error& error, EventControl& control);

  public:
    explicit EventIterator(const ParserOptions& options, size_t capacity = DEFAULT_ITERATOR_CAPACITY);
    ~EventIterator();

    Error open(const char* path);

    // The source must outlive the iterator
    Error open(const ByteSource* source);

    // Blocks until an event is available or the recording is exhausted
    bool hasNext();
    bool next(RecordedEvent* event);

    // Stops parsing; events not taken yet are dropped
    void close();

    // Outcome of the parse; meaningful once hasNext() returned false
    Error result();
};

#endif // _EVENTITERATOR_H
