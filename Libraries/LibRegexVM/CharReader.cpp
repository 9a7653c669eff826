/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/CharReader.h>
#include <algorithm>
#include <unicode/utf8.h>

namespace regexvm {

// The longest well-formed UTF-8 sequence.
static constexpr size_t MaxSequenceLength = 4;

CharReader::CharReader(std::string_view haystack, InputMode mode, size_t offset)
    : m_haystack(haystack)
    , m_mode(mode)
{
    reset_to(offset);
}

CharReader::AdvanceResult CharReader::advance()
{
    if (is_at_end())
        return AdvanceResult::EndOfInput;

    m_previous = m_current;
    m_offset += m_current_length;
    decode_current();
    return AdvanceResult::Advanced;
}

void CharReader::reset_to(size_t offset)
{
    VERIFY(offset <= m_haystack.size());
    m_offset = offset;
    decode_previous();
    decode_current();
}

void CharReader::decode_current()
{
    if (is_at_end()) {
        m_current.reset();
        m_current_length = 0;
        return;
    }

    auto const* bytes = reinterpret_cast<u8 const*>(m_haystack.data()) + m_offset;

    if (m_mode == InputMode::Bytes) {
        m_current = bytes[0];
        m_current_length = 1;
        return;
    }

    if (bytes[0] < 0x80) [[likely]] {
        m_current = bytes[0];
        m_current_length = 1;
        return;
    }

    auto length = static_cast<int32_t>(std::min(MaxSequenceLength, m_haystack.size() - m_offset));
    int32_t index = 0;
    UChar32 code_point = 0;
    // Ill-formed sequences decode to U+FFFD, consuming the maximal ill-formed subpart.
    U8_NEXT_OR_FFFD(bytes, index, length, code_point);

    m_current = static_cast<u32>(code_point);
    m_current_length = static_cast<size_t>(index);
}

void CharReader::decode_previous()
{
    if (m_offset == 0) {
        m_previous.reset();
        return;
    }

    auto const* bytes = reinterpret_cast<u8 const*>(m_haystack.data());

    if (m_mode == InputMode::Bytes || bytes[m_offset - 1] < 0x80) {
        m_previous = bytes[m_offset - 1];
        return;
    }

    auto window = std::min(MaxSequenceLength, m_offset);
    auto const* start = bytes + (m_offset - window);
    auto index = static_cast<int32_t>(window);
    UChar32 code_point = 0;
    U8_PREV_OR_FFFD(start, 0, index, code_point);

    m_previous = static_cast<u32>(code_point);
}

}
