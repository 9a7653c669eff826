/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Forward.h>
#include <LibRegexVM/Program.h>

#include <optional>
#include <string_view>

namespace regexvm {

// U+FFFD REPLACEMENT CHARACTER
constexpr u32 ReplacementCharacter = 0xfffd;

// Keeps a "previous" and a "current" character over the haystack. The executor advances it
// in lockstep with its own position, so assertions can look one character behind and one
// character ahead without rescanning.
class REGEXVM_API CharReader {
public:
    enum class AdvanceResult : u8 {
        Advanced,
        EndOfInput,
    };

    CharReader(std::string_view haystack, InputMode mode, size_t offset = 0);

    // Moves past the current character. Once the reader sits at the end of the haystack (where
    // peek_cur() is empty) it cannot move any further and reports EndOfInput, which is a normal
    // terminal condition rather than an error.
    AdvanceResult advance();

    // Repositions the reader at a character boundary and re-reads both characters around it.
    void reset_to(size_t offset);

    std::optional<u32> peek_prev() const { return m_previous; }
    std::optional<u32> peek_cur() const { return m_current; }

    size_t offset() const { return m_offset; }
    size_t next_offset() const { return m_offset + m_current_length; }
    size_t current_length() const { return m_current_length; }

    bool is_at_start() const { return m_offset == 0; }
    bool is_at_end() const { return m_offset >= m_haystack.size(); }

    std::string_view haystack() const { return m_haystack; }
    InputMode mode() const { return m_mode; }

private:
    void decode_current();
    void decode_previous();

    std::string_view m_haystack;
    InputMode m_mode { InputMode::Text };
    size_t m_offset { 0 };
    size_t m_current_length { 0 };
    std::optional<u32> m_previous;
    std::optional<u32> m_current;
};

}
