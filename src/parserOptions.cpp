/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>
#include "log.h"
#include "os.h"
#include "parserOptions.h"


static const Multiplier BYTES[] = {{'b', 1}, {'k', 1024}, {'m', 1048576}, {'g', 1073741824}, {0, 0}};

static const char* const STRATEGY_NAME[] = {
    "eager",
    "lazy",
    "compiled",
    "auto"
};


// Statically compute hash code of a string containing up to 12 [a-z] letters
#define HASH(s)  ((s[0] & 31LL)       | (s[1] & 31LL) <<  5 | (s[2]  & 31LL) << 10 | (s[3]  & 31LL) << 15 | \
                  (s[4] & 31LL) << 20 | (s[5] & 31LL) << 25 | (s[6]  & 31LL) << 30 | (s[7]  & 31LL) << 35 | \
                  (s[8] & 31LL) << 40 | (s[9] & 31LL) << 45 | (s[10] & 31LL) << 50 | (s[11] & 31LL) << 55)

// Simulate switch statement over string hashes
#define SWITCH(arg)    long long arg_hash = hash(arg); if (0)

#define CASE(s)        } else if (arg_hash == HASH(s "            ")) {

#define DEFAULT()      } else {


static bool parseInt(const char* value, int min, int* result) {
    if (value == NULL || *value == 0) {
        return false;
    }
    char* end;
    long n = strtol(value, &end, 0);
    if (*end != 0 || n < min || n > 0x7fffffff) {
        return false;
    }
    *result = (int)n;
    return true;
}


// Parses decoder options.
// The format of the string is:
//     opt[,opt...]
// where opt is one of the following:
//     strategy=MODE    - eager, lazy, compiled or auto (default)
//     constants=MODE   - lazy (default): keep constant pool references until used
//                        eager: resolve them while decoding the event
//     cache=SCOPE      - shared (default): decoders are reused across chunks
//                        chunk: every chunk compiles its own decoders
//     threads=N        - number of chunks decoded in parallel, 0 = number of CPUs (default: 1)
//     segment=SIZE     - maximum size of one file mapping (default: 1g)
//     maxdepth=N       - maximum nesting of values (default: 256)
//     lazyfields=N     - compiled records with more fields are decoded lazily (default: 8)
//     skipbroken       - report a broken chunk and continue with the next one
//     print            - print every decoded event
//     log=FILENAME     - log warnings and errors to the given dedicated stream
//     loglevel=LEVEL   - logging level: TRACE, DEBUG, INFO, WARN, ERROR, or NONE
//
Error ParserOptions::parse(const char* args) {
    if (args == NULL) {
        return Error::OK;
    }

    char* args_copy = strdup(args);
    if (args_copy == NULL) {
        return Error(ERR_INVALID_OPTION, "Not enough memory to parse options");
    }

    std::string msg;

    for (char* arg = strtok(args_copy, ","); arg != NULL; arg = strtok(NULL, ",")) {
        char* value = strchr(arg, '=');
        if (value != NULL) *value++ = 0;

        SWITCH (arg) {
            CASE("strategy")
                if (value != NULL && strcmp(value, "eager") == 0) {
                    _strategy = STRATEGY_EAGER;
                } else if (value != NULL && strcmp(value, "lazy") == 0) {
                    _strategy = STRATEGY_LAZY;
                } else if (value != NULL && strcmp(value, "compiled") == 0) {
                    _strategy = STRATEGY_COMPILED;
                } else if (value != NULL && strcmp(value, "auto") == 0) {
                    _strategy = STRATEGY_AUTO;
                } else {
                    msg = "strategy must be eager, lazy, compiled or auto";
                }

            CASE("constants")
                if (value != NULL && strcmp(value, "lazy") == 0) {
                    _constants = CONSTANTS_LAZY;
                } else if (value != NULL && strcmp(value, "eager") == 0) {
                    _constants = CONSTANTS_EAGER;
                } else {
                    msg = "constants must be lazy or eager";
                }

            CASE("cache")
                if (value != NULL && strcmp(value, "shared") == 0) {
                    _cache = CACHE_SHARED;
                } else if (value != NULL && strcmp(value, "chunk") == 0) {
                    _cache = CACHE_CHUNK;
                } else {
                    msg = "cache must be shared or chunk";
                }

            CASE("threads")
                if (!parseInt(value, 0, &_threads)) {
                    msg = "Invalid threads";
                }

            CASE("segment")
                long size;
                if (value == NULL || (size = parseUnits(value, BYTES)) <= 0) {
                    msg = "Invalid segment";
                } else {
                    _segment_size = (size_t)size;
                }

            CASE("maxdepth")
                if (!parseInt(value, 1, &_max_depth)) {
                    msg = "Invalid maxdepth";
                }

            CASE("lazyfields")
                if (!parseInt(value, 0, &_lazy_fields)) {
                    msg = "Invalid lazyfields";
                }

            CASE("skipbroken")
                _skip_broken = true;

            CASE("print")
                _print = true;

            CASE("log")
                if (value == NULL || value[0] == 0) {
                    msg = "log must not be empty";
                } else {
                    _log = value;
                }

            CASE("loglevel")
                LogLevel level;
                if (value == NULL || !Log::parseLevel(value, &level)) {
                    msg = "loglevel must be TRACE, DEBUG, INFO, WARN, ERROR or NONE";
                } else {
                    _loglevel = value;
                }

            DEFAULT()
                if (msg.empty()) msg = std::string("Unknown option: ") + arg;
        }
    }

    free(args_copy);

    if (!msg.empty()) {
        return Error(ERR_INVALID_OPTION, msg);
    }
    return Error::OK;
}

int ParserOptions::workerCount() const {
    if (_threads > 0) {
        return _threads;
    }
    int cpus = OS::getCpuCount();
    return cpus > 0 ? cpus : 1;
}

const char* ParserOptions::strategyName(Strategy strategy) {
    return STRATEGY_NAME[strategy];
}

// Should match statically computed HASH(arg)
long long ParserOptions::hash(const char* arg) {
    long long h = 0;
    for (int shift = 0; *arg != 0; shift += 5) {
        h |= (*arg++ & 31LL) << shift;
    }
    return h;
}

long ParserOptions::parseUnits(const char* str, const Multiplier* multipliers) {
    char* end;
    errno = 0;
    long result = strtol(str, &end, 0);
    if (end == str || errno == ERANGE) {
        return -1;
    }

    char c = *end;
    if (c == 0) {
        return result;
    }
    if (c >= 'A' && c <= 'Z') {
        c += 'a' - 'A';
    }

    for (const Multiplier* m = multipliers; m->symbol; m++) {
        if (c == m->symbol && end[1] == 0) {
            if (result > LONG_MAX / m->multiplier || result < LONG_MIN / m->multiplier) {
                return -1;
            }
            return result * m->multiplier;
        }
    }

    return -1;
}
