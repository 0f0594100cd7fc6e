/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _PARSEROPTIONS_H
#define _PARSEROPTIONS_H

#include <stddef.h>
#include <string>
#include "byteSource.h"
#include "error.h"
#include "value.h"


const int DEFAULT_LAZY_FIELDS = 8;

enum Strategy {
    STRATEGY_EAGER,
    STRATEGY_LAZY,
    STRATEGY_COMPILED,
    STRATEGY_AUTO
};

enum ConstantMode {
    CONSTANTS_LAZY,
    CONSTANTS_EAGER
};

enum CacheScope {
    CACHE_SHARED,
    CACHE_CHUNK
};

struct Multiplier {
    char symbol;
    long multiplier;
};


class ParserOptions {
  private:
    static long long hash(const char* arg);
    static long parseUnits(const char* str, const Multiplier* multipliers);

  public:
    Strategy _strategy;
    ConstantMode _constants;
    CacheScope _cache;
    int _threads;
    size_t _segment_size;
    int _max_depth;
    int _lazy_fields;
    bool _skip_broken;
    bool _print;
    std::string _log;
    std::string _loglevel;

    ParserOptions() :
        _strategy(STRATEGY_AUTO),
        _constants(CONSTANTS_LAZY),
        _cache(CACHE_SHARED),
        _threads(1),
        _segment_size(DEFAULT_SEGMENT_SIZE),
        _max_depth(DEFAULT_MAX_DEPTH),
        _lazy_fields(DEFAULT_LAZY_FIELDS),
        _skip_broken(false),
        _print(false),
        _log(),
        _loglevel() {
    }

    Error parse(const char* args);

    bool compiled() const {
        return _strategy == STRATEGY_COMPILED || _strategy == STRATEGY_AUTO;
    }

    bool eagerConstants() const {
        return _constants == CONSTANTS_EAGER;
    }

    // Number of chunk workers, resolving 0 to the number of CPUs
    int workerCount() const;

    static const char* strategyName(Strategy strategy);
};

#endif // _PARSEROPTIONS_H
