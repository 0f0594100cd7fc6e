/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <map>
#include <pthread.h>
#include "log.h"
#include "recordingParser.h"


RecordingParser::RecordingParser(const ParserOptions& options) :
    _options(options), _source(NULL), _owned_source(NULL), _context(new RecordingContext(options)),
    _abort(false), _failed(false) {
}

RecordingParser::~RecordingParser() {
    delete _context;
    delete _owned_source;
}

Error RecordingParser::open(const char* path) {
    MappedFileSource* source;
    Error error = MappedFileSource::open(path, _options._segment_size, &source);
    if (error) {
        return error;
    }

    delete _owned_source;
    _owned_source = source;
    _source = source;
    return Error::OK;
}

void RecordingParser::open(const ByteSource* source) {
    delete _owned_source;
    _owned_source = NULL;
    _source = source;
}

Error RecordingParser::parse(EventListener& listener) {
    if (_source == NULL) {
        return Error(ERR_IO, "No recording opened");
    }

    _abort = false;
    _failed = false;
    listener.onRecordingStart(*_source);

    // Framing is sequential: every chunk header locates the next one
    std::vector<ChunkTask> tasks;
    Error framing;
    if (_source->size() == 0) {
        framing = Error(ERR_TRUNCATED_HEADER, "Empty recording").inChunk(0);
    }

    ChunkIterator chunks(_source);
    while (chunks.hasNext()) {
        ChunkTask task;
        Error error = chunks.next(&task.header, &task.reader);
        if (error) {
            framing = error;
            Log::warn("Recording framing stopped: %s", error.describe().c_str());
            break;
        }
        tasks.push_back(task);
    }

    int workers = _options.workerCount();
    if (workers > (int)tasks.size()) {
        workers = (int)tasks.size();
    }

    WorkerState state = {this, &listener, &tasks, 0};
    if (workers <= 1) {
        workerLoop(&state);
    } else {
        Log::debug("Parsing %d chunks with %d threads", (int)tasks.size(), workers);
        std::vector<pthread_t> threads;
        for (int i = 0; i < workers; i++) {
            pthread_t thread;
            if (pthread_create(&thread, NULL, workerEntry, &state) != 0) {
                Log::warn("Unable to create parser thread");
                break;
            }
            threads.push_back(thread);
        }
        // The calling thread takes part, which also covers failed thread creation
        workerLoop(&state);
        for (size_t i = 0; i < threads.size(); i++) {
            pthread_join(threads[i], NULL);
        }
    }

    Error result;
    for (size_t i = 0; i < tasks.size(); i++) {
        if (tasks[i].error) {
            result = tasks[i].error;
            break;
        }
    }
    if (!result && framing && !_abort) {
        result = framing;
    }

    listener.onRecordingEnd(result);
    return result;
}

void* RecordingParser::workerEntry(void* arg) {
    WorkerState* state = (WorkerState*)arg;
    state->parser->workerLoop(state);
    return NULL;
}

void RecordingParser::workerLoop(WorkerState* state) {
    std::vector<ChunkTask>& tasks = *state->tasks;
    while (!_abort && !_failed) {
        int index = atomicInc(state->next);
        if (index >= (int)tasks.size()) {
            break;
        }
        runTask(tasks[index], *state->listener);
    }
}

void RecordingParser::runTask(ChunkTask& task, EventListener& listener) {
    Error error = parseChunk(task, listener);
    if (!error) {
        return;
    }

    Log::warn("Chunk %d failed: %s", task.header.index, error.describe().c_str());
    if (listener.onChunkError(error) || _options._skip_broken) {
        return;
    }

    task.error = error;
    _failed = true;
}

Error RecordingParser::parseChunk(const ChunkTask& task, EventListener& listener) {
    const ChunkHeader& header = task.header;
    if (!listener.onChunkStart(header)) {
        Log::debug("Chunk %d skipped", header.index);
        return Error::OK;
    }

    ChunkContext* context;
    Error error = ChunkContext::create(_context, header, task.reader, &context);
    if (error) {
        return error;
    }

    if (listener.onMetadata(*context)) {
        error = parseEvents(context, listener);
    }
    if (!error) {
        listener.onChunkEnd(header);
    }

    delete context;
    return error;
}

Error RecordingParser::parseEvents(ChunkContext* context, EventListener& listener) {
    const Metadata& metadata = context->metadata();
    int chunk = context->index();
    ByteReader reader = context->reader();
    reader.seek(CHUNK_HEADER_SIZE);

    EventControl control(&_abort, chunk);
    std::map<long long, bool> accepted;
    int events = 0;

    while (reader.remaining() > 0 && !_abort && !_failed) {
        u64 start = reader.position();
        u64 size = reader.readVarint();
        if (reader.failed()) {
            return reader.failure().wrap(ERR_DECODE_FAILURE).inChunk(chunk);
        }
        if (size == 0) {
            return Error(ERR_DECODE_FAILURE, "Event of zero size", reader.base() + start).inChunk(chunk);
        }

        ByteReader event = reader.slice(start, size);
        if (event.failed()) {
            return Error::format(ERR_DECODE_FAILURE, reader.base() + start, "Event of %llu bytes exceeds the chunk", size)
                .inChunk(chunk);
        }
        event.seek(reader.position() - start);

        // The next event starts at start + size whatever happens to this one
        reader.seek(start + size);

        u64 type_id = event.readVarint();
        if (!event.failed() && (type_id == T_METADATA || type_id == T_CPOOL)) {
            continue;
        }

        control._offset = event.base();
        Error error;
        const TypeDescriptor* type = event.failed() ? NULL : metadata.type((long long)type_id);
        if (event.failed()) {
            error = event.failure().wrap(ERR_DECODE_FAILURE);
        } else if (type == NULL) {
            error = Error::format(ERR_DANGLING_TYPE_REFERENCE, event.base(), "Event of undeclared type id %llu", type_id);
        } else {
            std::map<long long, bool>::iterator it = accepted.find(type->_id);
            if (it == accepted.end()) {
                it = accepted.insert(std::make_pair(type->_id, listener.acceptType(*type))).first;
            }
            if (!it->second) {
                continue;
            }
            error = decodeEvent(context, type, event, listener, control);
        }

        if (error) {
            error.inChunk(chunk);
            if (!listener.onEventError(error, control)) {
                return error;
            }
            Log::debug("Skipped broken event: %s", error.describe().c_str());
        }
        events++;
    }

    Log::debug("Chunk %d: %d events", chunk, events);
    return Error::OK;
}

Error RecordingParser::decodeEvent(ChunkContext* context, const TypeDescriptor* type, ByteReader& event,
                                   EventListener& listener, EventControl& control) {
    const TargetShape* shape = NULL;
    void* target = listener.targetFor(*type, &shape);
    if (shape == NULL) {
        target = NULL;
    }

    Deserializer* deserializer;
    Error error = context->deserializer(type, target != NULL ? shape : NULL, &deserializer);
    if (error) {
        return error;
    }

    if (target != NULL) {
        error = deserializer->deserialize(event, target);
        if (!error) {
            listener.onTypedEvent(*type, target, control);
        }
    } else {
        Value value;
        error = deserializer->deserialize(event, &value);
        if (!error) {
            listener.onEvent(*type, value, control);
        }
    }
    return error;
}
