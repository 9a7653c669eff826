/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/PrefixSearch.h>
#include <cstring>

namespace regexvm {

std::optional<size_t> find_prefix(std::string_view haystack, std::string_view needle)
{
    if (needle.empty())
        return 0;
    if (needle.size() > haystack.size())
        return {};

    auto const* haystack_start = haystack.data();
    auto const* search_end = haystack_start + (haystack.size() - needle.size()) + 1;
    auto first_byte = static_cast<unsigned char>(needle[0]);

    // OPTIMIZATION: memchr skips straight to each candidate first byte, only those get verified.
    for (auto const* cursor = haystack_start; cursor < search_end;) {
        auto const* candidate = static_cast<char const*>(std::memchr(cursor, first_byte, static_cast<size_t>(search_end - cursor)));
        if (!candidate)
            return {};
        if (std::memcmp(candidate + 1, needle.data() + 1, needle.size() - 1) == 0)
            return static_cast<size_t>(candidate - haystack_start);
        cursor = candidate + 1;
    }

    return {};
}

}
