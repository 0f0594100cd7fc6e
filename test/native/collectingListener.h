/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _COLLECTINGLISTENER_H
#define _COLLECTINGLISTENER_H

#include <string>
#include <vector>
#include "mutex.h"
#include "recordingParser.h"


// Renders every event as "type value" and remembers the errors it has seen.
// Safe to use with several parser threads.
class CollectingListener : public EventListener {
  public:
    Mutex _lock;
    std::vector<std::string> _events;
    std::vector<Error> _event_errors;
    std::vector<Error> _chunk_errors;
    std::vector<int> _chunks;
    Error _result;
    bool _skip_broken_events;
    bool _skip_broken_chunks;
    int _abort_after;
    bool _materialize;

    CollectingListener() :
        _lock(), _events(), _event_errors(), _chunk_errors(), _chunks(), _result(),
        _skip_broken_events(false), _skip_broken_chunks(false), _abort_after(0), _materialize(false) {
    }

    void onEvent(const TypeDescriptor& type, const Value& value, EventControl& control) {
        std::string line = type._name + " ";
        if (_materialize) {
            Value copy;
            Error error = value.materialize(&copy);
            line.append(error ? Error::kindName(error.kind()) : copy.toString());
        } else {
            line.append(value.toString());
        }

        MutexLocker ml(_lock);
        _events.push_back(line);
        if (_abort_after > 0 && (int)_events.size() >= _abort_after && !control.aborted()) {
            control.abort();
        }
    }

    bool onEventError(const Error& error, EventControl& control) {
        MutexLocker ml(_lock);
        _event_errors.push_back(error);
        return _skip_broken_events;
    }

    bool onChunkError(const Error& error) {
        MutexLocker ml(_lock);
        _chunk_errors.push_back(error);
        return _skip_broken_chunks;
    }

    void onChunkEnd(const ChunkHeader& header) {
        MutexLocker ml(_lock);
        _chunks.push_back(header.index);
    }

    void onRecordingEnd(const Error& result) {
        _result = result;
    }

    std::string joined() const {
        std::string all;
        for (size_t i = 0; i < _events.size(); i++) {
            all.append(_events[i]).append("\n");
        }
        return all;
    }
};

// Parses an in-memory recording with the given options string
static inline Error parseRecording(const std::vector<u8>& bytes, const char* options, EventListener& listener,
                                   size_t segment_size = DEFAULT_SEGMENT_SIZE) {
    ParserOptions parsed;
    Error error = parsed.parse(options);
    if (error) {
        return error;
    }
    MemorySource source(bytes.data(), bytes.size(), segment_size);
    RecordingParser parser(parsed);
    parser.open(&source);
    return parser.parse(listener);
}

#endif // _COLLECTINGLISTENER_H
