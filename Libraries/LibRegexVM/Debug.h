/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <cstdio>
#include <fmt/core.h>
#include <utility>

#ifndef REGEXVM_DEBUG
#    define REGEXVM_DEBUG 0
#endif

#ifndef REGEXVM_TRACE_DEBUG
#    define REGEXVM_TRACE_DEBUG 0
#endif

namespace regexvm {

template<typename... Parameters>
void dbgln(fmt::format_string<Parameters...> format, Parameters&&... parameters)
{
    fmt::print(stderr, "[regexvm] ");
    fmt::print(stderr, format, std::forward<Parameters>(parameters)...);
    std::fputc('\n', stderr);
}

template<typename... Parameters>
void warnln(fmt::format_string<Parameters...> format, Parameters&&... parameters)
{
    fmt::print(stderr, format, std::forward<Parameters>(parameters)...);
    std::fputc('\n', stderr);
}

}

#define dbgln_if(flag, fmt, ...)                           \
    do {                                                   \
        if constexpr (flag)                                \
            ::regexvm::dbgln(fmt __VA_OPT__(, ) __VA_ARGS__); \
    } while (0)
