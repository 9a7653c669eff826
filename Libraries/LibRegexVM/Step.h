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

#define ENUMERATE_STEP_STATES        \
    __ENUMERATE_STEP_STATE(Continue) \
    __ENUMERATE_STEP_STATE(Dies)     \
    __ENUMERATE_STEP_STATE(Matches)

enum class StepState : u8 {
#define __ENUMERATE_STEP_STATE(x) x,
    ENUMERATE_STEP_STATES
#undef __ENUMERATE_STEP_STATE
};

REGEXVM_API std::string_view step_state_name(StepState);

// Decodes one Match or input-consuming instruction against the reader's current character.
// Continue means the character was accepted and the thread moves on to `out1` past it.
// Control flow (Split, Jump, Save, Assert) is each strategy's own business and never reaches here.
REGEXVM_API StepState step(Program const&, Instruction const&, CharReader const&);

REGEXVM_API bool is_assertion_satisfied(Program const&, AssertionType, CharReader const&);

// Word characters as `\b` sees them: Unicode \w in Text mode, [0-9A-Za-z_] in Bytes mode.
REGEXVM_API bool is_word_character(InputMode, u32 code_point);

// Where the executor may begin a new match attempt: the start offset only for start-anchored
// programs, otherwise every later character boundary, narrowed to occurrences of the required
// prefix when the program has one.
struct REGEXVM_API StartCandidates {
    Program const& program;
    std::string_view haystack;
    size_t start_offset { 0 };

    // First candidate at or after `from`.
    std::optional<size_t> next(size_t from) const;
};

}
