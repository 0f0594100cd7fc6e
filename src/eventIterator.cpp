/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "eventIterator.h"
#include "log.h"


EventIterator::EventIterator(const ParserOptions& options, size_t capacity) :
    _parser(options), _max_depth(options._max_depth), _skip_broken(options._skip_broken),
    _capacity(capacity > 0 ? capacity : 1), _lock(), _queue(), _thread(), _started(false),
    _finished(true), _closed(false), _result(ERR_IO, "No recording opened") {
}

EventIterator::~EventIterator() {
    close();
}

Error EventIterator::open(const char* path) {
    close();
    Error error = _parser.open(path);
    if (error) {
        MutexLocker ml(_lock);
        _result = error;
        return error;
    }
    return start();
}

Error EventIterator::open(const ByteSource* source) {
    close();
    _parser.open(source);
    return start();
}

Error EventIterator::start() {
    MutexLocker ml(_lock);
    _queue.clear();
    _closed = false;
    _finished = false;
    _result = Error::OK;

    if (pthread_create(&_thread, NULL, threadEntry, this) != 0) {
        _finished = true;
        _result = Error(ERR_IO, "Unable to create parser thread");
        Log::warn("%s", _result.message().c_str());
        return _result;
    }
    _started = true;
    return Error::OK;
}

void* EventIterator::threadEntry(void* arg) {
    EventIterator* iterator = (EventIterator*)arg;
    Error result = iterator->_parser.parse(*iterator);
    iterator->finish(result);
    return NULL;
}

void EventIterator::finish(const Error& result) {
    MutexLocker ml(_lock);
    _finished = true;
    // A failure seen while handing out events takes precedence
    if (!_result) {
        _result = result;
    }
    _lock.notifyAll();
}

void EventIterator::onEvent(const TypeDescriptor& type, const Value& value, EventControl& control) {
    RecordedEvent event;
    Error error = value.materialize(&event.value, _max_depth);

    MutexLocker ml(_lock);
    if (error) {
        error.inChunk(control.chunk());
        if (_skip_broken) {
            Log::debug("Skipped broken event: %s", error.describe().c_str());
            return;
        }
        if (!_result) {
            _result = error;
        }
        control.abort();
        return;
    }

    while (_queue.size() >= _capacity && !_closed) {
        _lock.wait();
    }
    if (_closed) {
        control.abort();
        return;
    }

    event.type_name = type._name;
    event.type_id = type._id;
    event.chunk = control.chunk();
    event.offset = control.offset();
    _queue.push_back(event);
    _lock.notifyAll();
}

bool EventIterator::onEventError(const Error& error, EventControl& control) {
    return _skip_broken;
}

bool EventIterator::hasNext() {
    MutexLocker ml(_lock);
    while (_queue.empty() && !_finished && !_closed) {
        _lock.wait();
    }
    return !_queue.empty();
}

bool EventIterator::next(RecordedEvent* event) {
    if (!hasNext()) {
        return false;
    }

    MutexLocker ml(_lock);
    *event = _queue.front();
    _queue.pop_front();
    _lock.notifyAll();
    return true;
}

void EventIterator::close() {
    {
        MutexLocker ml(_lock);
        _closed = true;
        _lock.notifyAll();
    }

    if (_started) {
        pthread_join(_thread, NULL);
        _started = false;
    }

    MutexLocker ml(_lock);
    _queue.clear();
}

Error EventIterator::result() {
    MutexLocker ml(_lock);
    return _result;
}
