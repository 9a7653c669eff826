/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Forward.h>

#include <optional>
#include <string_view>

namespace regexvm {

// Returns the byte offset of the leftmost occurrence of `needle` in `haystack`, or nothing if
// `needle` does not occur. An empty needle is found at offset 0.
REGEXVM_API std::optional<size_t> find_prefix(std::string_view haystack, std::string_view needle);

}
