/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _VARINT_H
#define _VARINT_H

#include <stddef.h>
#include "arch.h"


// JFR compressed integers: 7 value bits per byte with the high bit set
// on every byte but the last. The 9th byte, if reached, carries 8 full bits.
const int MAX_VARINT_LENGTH = 9;

static inline int varintLength(u64 value) {
    int length = 1;
    while (value > 0x7f && length < MAX_VARINT_LENGTH) {
        value >>= 7;
        length++;
    }
    return length;
}

// Writes at most MAX_VARINT_LENGTH bytes, returns the number of bytes written
static inline int putVarint(u8* buf, u64 value) {
    for (int i = 0; i < MAX_VARINT_LENGTH - 1; i++) {
        if (value <= 0x7f) {
            buf[i] = (u8)value;
            return i + 1;
        }
        buf[i] = (u8)(value | 0x80);
        value >>= 7;
    }
    buf[MAX_VARINT_LENGTH - 1] = (u8)value;
    return MAX_VARINT_LENGTH;
}

// Returns false if the data ends before the last byte of the varint
static inline bool readVarint(const u8* data, size_t* pos, size_t limit, u64* value) {
    u64 result = 0;
    size_t p = *pos;
    for (int shift = 0; shift < 56; shift += 7) {
        if (unlikely(p >= limit)) {
            return false;
        }
        u64 b = data[p++];
        result |= (b & 0x7f) << shift;
        if ((b & 0x80) == 0) {
            *pos = p;
            *value = result;
            return true;
        }
    }
    if (unlikely(p >= limit)) {
        return false;
    }
    result |= (u64)data[p++] << 56;
    *pos = p;
    *value = result;
    return true;
}

#endif // _VARINT_H
