/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/CaseFolding.h>
#include <LibRegexVM/CharReader.h>
#include <LibRegexVM/PrefixSearch.h>
#include <LibRegexVM/Program.h>
#include <LibRegexVM/Step.h>
#include <algorithm>
#include <iterator>
#include <unicode/uchar.h>

namespace regexvm {

std::string_view step_state_name(StepState state)
{
    switch (state) {
#define __ENUMERATE_STEP_STATE(x) \
    case StepState::x:            \
        return #x;
        ENUMERATE_STEP_STATES
#undef __ENUMERATE_STEP_STATE
    }
    VERIFY_NOT_REACHED();
}

static bool is_ascii_word_character(u32 code_point)
{
    return (code_point >= 'a' && code_point <= 'z')
        || (code_point >= 'A' && code_point <= 'Z')
        || (code_point >= '0' && code_point <= '9')
        || code_point == '_';
}

bool is_word_character(InputMode mode, u32 code_point)
{
    if (code_point < 0x80 || mode == InputMode::Bytes)
        return is_ascii_word_character(code_point);

    // UTS #18 Annex C: \p{Alphabetic} \p{M} \p{Nd} \p{Pc} \p{Join_Control}
    auto character = static_cast<UChar32>(code_point);
    if (u_hasBinaryProperty(character, UCHAR_ALPHABETIC) || u_hasBinaryProperty(character, UCHAR_JOIN_CONTROL))
        return true;
    return (U_GET_GC_MASK(character) & (U_GC_M_MASK | U_GC_ND_MASK | U_GC_PC_MASK)) != 0;
}

static bool is_newline(std::optional<u32> code_point)
{
    return code_point.has_value() && *code_point == '\n';
}

bool is_assertion_satisfied(Program const& program, AssertionType type, CharReader const& reader)
{
    switch (type) {
    case AssertionType::StartLine:
        return !reader.peek_prev().has_value() || is_newline(reader.peek_prev());
    case AssertionType::EndLine:
        return !reader.peek_cur().has_value() || is_newline(reader.peek_cur());
    case AssertionType::StartText:
        return reader.is_at_start();
    case AssertionType::EndText:
        return reader.is_at_end();
    case AssertionType::WordBoundary:
    case AssertionType::NotWordBoundary: {
        auto mode = program.input_mode();
        auto previous = reader.peek_prev();
        auto current = reader.peek_cur();
        bool word_before = previous.has_value() && is_word_character(mode, *previous);
        bool word_after = current.has_value() && is_word_character(mode, *current);
        bool at_boundary = word_before != word_after;
        return type == AssertionType::WordBoundary ? at_boundary : !at_boundary;
    }
    }
    VERIFY_NOT_REACHED();
}

static bool ranges_contain(std::span<CharRange const> ranges, u32 code_point)
{
    // Ranges are sorted and disjoint, find the last one starting at or before the code point.
    auto it = std::upper_bound(ranges.begin(), ranges.end(), code_point,
        [](u32 value, CharRange const& range) { return value < range.from; });
    if (it == ranges.begin())
        return false;
    return std::prev(it)->contains(code_point);
}

static bool uses_unicode_folding(Program const& program)
{
    return program.uses_unicode_case_folding() && !program.is_byte_mode();
}

static bool compare_char(Program const& program, Instruction const& instruction, u32 input)
{
    auto expected = instruction.code_point();
    if (input == expected)
        return true;
    if (!instruction.insensitive)
        return false;
    if (uses_unicode_folding(program))
        return simple_case_fold_representative(input) == simple_case_fold_representative(expected);
    return ascii_case_fold(input) == ascii_case_fold(expected);
}

static bool compare_ranges(Program const& program, Instruction const& instruction, u32 input)
{
    auto ranges = program.ranges_of(instruction);
    if (ranges_contain(ranges, input))
        return true;
    if (!instruction.insensitive)
        return false;

    if (uses_unicode_folding(program))
        return any_of_simple_case_fold(input, [&](u32 member) { return ranges_contain(ranges, member); });

    auto folded = ascii_case_fold(input);
    if (folded != input)
        return ranges_contain(ranges, folded);
    if (input >= 'a' && input <= 'z')
        return ranges_contain(ranges, input - ('a' - 'A'));
    return false;
}

StepState step(Program const& program, Instruction const& instruction, CharReader const& reader)
{
    if (instruction.opcode == OpCodeId::Match) {
        if (program.is_anchored_end() && !reader.is_at_end())
            return StepState::Dies;
        return StepState::Matches;
    }

    auto current = reader.peek_cur();
    if (!current.has_value())
        return StepState::Dies;

    bool accepted = false;
    switch (instruction.opcode) {
    case OpCodeId::Char:
        accepted = compare_char(program, instruction, *current);
        break;
    case OpCodeId::Ranges:
        accepted = compare_ranges(program, instruction, *current);
        break;
    case OpCodeId::AnyChar:
        accepted = true;
        break;
    case OpCodeId::AnyCharNotNewline:
        accepted = *current != '\n';
        break;
    case OpCodeId::Match:
    case OpCodeId::Save:
    case OpCodeId::Split:
    case OpCodeId::Jump:
    case OpCodeId::Assert:
        VERIFY_NOT_REACHED();
    }

    return accepted ? StepState::Continue : StepState::Dies;
}

std::optional<size_t> StartCandidates::next(size_t from) const
{
    if (from > haystack.size())
        return {};

    auto const& prefix = program.required_prefix();

    if (program.is_anchored_start()) {
        if (from != start_offset)
            return {};
        if (prefix.has_value() && !haystack.substr(from).starts_with(*prefix))
            return {};
        return from;
    }

    if (!prefix.has_value())
        return from;

    auto candidate = find_prefix(haystack.substr(from), *prefix);
    if (!candidate.has_value())
        return {};
    return from + *candidate;
}

}
