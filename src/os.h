/*
 * Copyright The async-profiler authors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef _OS_H
#define _OS_H

#include <stddef.h>
#include <sys/types.h>
#include "arch.h"


class OS {
  public:
    static const size_t page_size;
    static const size_t page_mask;

    static u64 nanotime();

    static int getCpuCount();
};

#endif // _OS_H
