/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/Debug.h>
#include <cstdio>
#include <cstdlib>
#include <execinfo.h>
#include <unistd.h>

static void dump_backtrace()
{
    void* trace[64] = {};
    int const num_frames = backtrace(trace, 64);
    // Skip ourselves.
    if (num_frames > 1)
        backtrace_symbols_fd(trace + 1, num_frames - 1, STDERR_FILENO);
}

extern "C" {

void regexvm_verification_failed(char const* message)
{
    regexvm::warnln("\033[31;1mVERIFICATION FAILED\033[0m: {}", message);
    dump_backtrace();
    std::fflush(stderr);
    std::abort();
}

}
