/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <unistd.h>
#include "log.h"
#include "parserOptions.h"


const char* const Log::LEVEL_NAME[] = {
    "TRACE",
    "DEBUG",
    "INFO",
    "WARN",
    "ERROR",
    "NONE"
};

Mutex Log::_lock;
int Log::_fd = STDERR_FILENO;
LogLevel Log::_level = LOG_WARN;


void Log::open(const ParserOptions& options) {
    open(options._log.empty() ? NULL : options._log.c_str(),
         options._loglevel.empty() ? NULL : options._loglevel.c_str());
}

bool Log::parseLevel(const char* name, LogLevel* level) {
    for (int i = LOG_TRACE; i <= LOG_NONE; i++) {
        if (strcasecmp(LEVEL_NAME[i], name) == 0) {
            *level = (LogLevel)i;
            return true;
        }
    }
    return false;
}

void Log::open(const char* file_name, const char* level) {
    LogLevel l = LOG_WARN;
    if (level != NULL) {
        parseLevel(level, &l);
    }

    MutexLocker ml(_lock);
    _level = l;

    if (_fd > STDERR_FILENO) {
        ::close(_fd);
    }

    if (file_name == NULL || strcmp(file_name, "stderr") == 0) {
        _fd = STDERR_FILENO;
    } else if (strcmp(file_name, "stdout") == 0) {
        _fd = STDOUT_FILENO;
    } else if ((_fd = creat(file_name, 0660)) < 0) {
        _fd = STDERR_FILENO;
        warn("Could not open log file: %s", file_name);
    }
}

void Log::close() {
    MutexLocker ml(_lock);
    if (_fd > STDERR_FILENO) {
        ::close(_fd);
        _fd = STDERR_FILENO;
    }
}

void Log::writeRaw(LogLevel level, const char* msg, size_t len) {
    MutexLocker ml(_lock);
    if (level < _level) {
        return;
    }

    while (len > 0) {
        ssize_t bytes = ::write(_fd, msg, len);
        if (bytes <= 0) {
            break;
        }
        msg += (size_t)bytes;
        len -= (size_t)bytes;
    }
}

void Log::log(LogLevel level, const char* msg, va_list args) {
    if (level < _level) {
        return;
    }

    char buf[1024];

    // Format log message: [LEVEL] Message\n
    size_t prefix_len = snprintf(buf, sizeof(buf), "[%s] ", LEVEL_NAME[level]);
    size_t max_len = sizeof(buf) - 2 - prefix_len;
    int formatted = vsnprintf(buf + prefix_len, max_len + 1, msg, args);
    size_t msg_len = formatted < 0 ? 0 : (size_t)formatted;
    if (msg_len > max_len) {
        msg_len = max_len;
    }
    buf[prefix_len + msg_len] = '\n';

    writeRaw(level, buf, prefix_len + msg_len + 1);
}

void Log::trace(const char* msg, ...) {
    va_list args;
    va_start(args, msg);
    log(LOG_TRACE, msg, args);
    va_end(args);
}

void Log::debug(const char* msg, ...) {
    va_list args;
    va_start(args, msg);
    log(LOG_DEBUG, msg, args);
    va_end(args);
}

void Log::info(const char* msg, ...) {
    va_list args;
    va_start(args, msg);
    log(LOG_INFO, msg, args);
    va_end(args);
}

void Log::warn(const char* msg, ...) {
    va_list args;
    va_start(args, msg);
    log(LOG_WARN, msg, args);
    va_end(args);
}

void Log::error(const char* msg, ...) {
    va_list args;
    va_start(args, msg);
    log(LOG_ERROR, msg, args);
    va_end(args);
}
