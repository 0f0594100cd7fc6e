/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <map>
#include <string>
#include "../log.h"
#include "../mutex.h"
#include "../recordingParser.h"


#define APP_BINARY "jfrdump"

static const char USAGE_STRING[] =
    "Usage: " APP_BINARY " <recording.jfr> [options]\n"
    "Options are comma separated:\n"
    "  strategy=MODE     eager|lazy|compiled|auto\n"
    "  constants=MODE    lazy|eager\n"
    "  cache=SCOPE       shared|chunk\n"
    "  threads=N         chunks decoded in parallel, 0 = number of CPUs\n"
    "  segment=SIZE      maximum size of one file mapping, e.g. 256m\n"
    "  maxdepth=N        maximum nesting of values\n"
    "  lazyfields=N      records with more fields are decoded lazily\n"
    "  skipbroken        report broken chunks and continue\n"
    "  print             print every event\n"
    "  log=FILE          log to the given file\n"
    "  loglevel=LEVEL    trace|debug|info|warn|error|none\n"
    "\n"
    "Example: " APP_BINARY " profile.jfr threads=4,print\n";


static void error(const char* msg) {
    fprintf(stderr, "%s\n", msg);
    exit(1);
}


class DumpListener : public EventListener {
  private:
    Mutex _lock;
    bool _print;
    std::map<std::string, u64> _types;
    std::map<int, u64> _chunks;
    int _broken_chunks;

  public:
    DumpListener(bool print) : _lock(), _print(print), _types(), _chunks(), _broken_chunks(0) {
    }

    void onEvent(const TypeDescriptor& type, const Value& value, EventControl& control) {
        MutexLocker ml(_lock);
        _types[type._name]++;
        _chunks[control.chunk()]++;
        if (_print) {
            printf("%s %s\n", type._name.c_str(), value.toString().c_str());
        }
    }

    bool onChunkError(const Error& error) {
        MutexLocker ml(_lock);
        _broken_chunks++;
        return false;
    }

    void onChunkEnd(const ChunkHeader& header) {
        MutexLocker ml(_lock);
        _chunks[header.index] += 0;
    }

    void report() {
        u64 total = 0;
        for (std::map<int, u64>::const_iterator it = _chunks.begin(); it != _chunks.end(); ++it) {
            printf("Chunk %d: %llu events\n", it->first, it->second);
            total += it->second;
        }

        printf("\nEvents by type:\n");
        for (std::map<std::string, u64>::const_iterator it = _types.begin(); it != _types.end(); ++it) {
            printf("%12llu  %s\n", it->second, it->first.c_str());
        }

        printf("\nTotal: %llu events in %d chunks", total, (int)_chunks.size());
        if (_broken_chunks > 0) {
            printf(", %d broken", _broken_chunks);
        }
        printf("\n");
    }
};


int main(int argc, const char** argv) {
    if (argc < 2 || argc > 3) {
        printf(USAGE_STRING);
        return argc < 2 ? 1 : 0;
    }
    if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
        printf(USAGE_STRING);
        return 0;
    }

    ParserOptions options;
    Error error = options.parse(argc > 2 ? argv[2] : NULL);
    if (error) {
        ::error(error.message().c_str());
    }
    Log::open(options);

    RecordingParser parser(options);
    if ((error = parser.open(argv[1]))) {
        ::error(error.message().c_str());
    }

    DumpListener listener(options._print);
    error = parser.parse(listener);
    listener.report();

    Log::close();
    if (error) {
        fprintf(stderr, "%s\n", error.describe().c_str());
        return 1;
    }
    return 0;
}
