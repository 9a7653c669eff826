/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Export.h>

extern "C" REGEXVM_API __attribute__((noreturn)) void regexvm_verification_failed(char const*);

#define __regexvm_stringify_helper(x) #x
#define __regexvm_stringify(x) __regexvm_stringify_helper(x)

#ifndef VERIFY
#    define VERIFY(...)                                                                                        \
        (__builtin_expect(/* NOLINT(readability-simplify-boolean-expr) */ !(__VA_ARGS__), 0)                   \
                ? regexvm_verification_failed(#__VA_ARGS__ " at " __FILE__ ":" __regexvm_stringify(__LINE__)) \
                : (void)0)
#endif

#ifndef VERIFY_NOT_REACHED
#    define VERIFY_NOT_REACHED() VERIFY(false) /* NOLINT(cert-dcl03-c,misc-static-assert) No, this can't be static_assert, it's a runtime check */
#endif
