/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Forward.h>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace regexvm {

#define ENUMERATE_OPCODES                 \
    __ENUMERATE_OPCODE(Match)             \
    __ENUMERATE_OPCODE(Save)              \
    __ENUMERATE_OPCODE(Split)             \
    __ENUMERATE_OPCODE(Jump)              \
    __ENUMERATE_OPCODE(Assert)            \
    __ENUMERATE_OPCODE(Char)              \
    __ENUMERATE_OPCODE(Ranges)            \
    __ENUMERATE_OPCODE(AnyChar)           \
    __ENUMERATE_OPCODE(AnyCharNotNewline)

// clang-format off
enum class OpCodeId : u8 {
#define __ENUMERATE_OPCODE(x) x,
    ENUMERATE_OPCODES
#undef __ENUMERATE_OPCODE

    First = Match,
    Last = AnyCharNotNewline,
};
// clang-format on

#define ENUMERATE_ASSERTION_TYPES                  \
    __ENUMERATE_ASSERTION_TYPE(StartLine)          \
    __ENUMERATE_ASSERTION_TYPE(EndLine)            \
    __ENUMERATE_ASSERTION_TYPE(StartText)          \
    __ENUMERATE_ASSERTION_TYPE(EndText)            \
    __ENUMERATE_ASSERTION_TYPE(WordBoundary)       \
    __ENUMERATE_ASSERTION_TYPE(NotWordBoundary)

enum class AssertionType : u8 {
#define __ENUMERATE_ASSERTION_TYPE(x) x,
    ENUMERATE_ASSERTION_TYPES
#undef __ENUMERATE_ASSERTION_TYPE
};

enum class InputMode : u8 {
    Text,
    Bytes,
};

REGEXVM_API std::string_view opcode_id_name(OpCodeId);
REGEXVM_API std::string_view assertion_type_name(AssertionType);
REGEXVM_API std::string_view input_mode_name(InputMode);

// Inclusive on both ends.
struct CharRange {
    u32 from;
    u32 to;

    bool contains(u32 code_point) const { return code_point >= from && code_point <= to; }
    bool operator==(CharRange const&) const = default;
};

// A single entry of the instruction arena. Successors are program counters, not pointers.
//
//   Match                           -
//   Save                 out1       argument = slot
//   Split                out1, out2 out1 has priority over out2
//   Jump                 out1       -
//   Assert               out1       argument = AssertionType
//   Char                 out1       argument = code point (or byte), insensitive
//   Ranges               out1       argument = first range, argument_count = number of ranges, insensitive
//   AnyChar              out1       -
//   AnyCharNotNewline    out1       -
struct Instruction {
    OpCodeId opcode { OpCodeId::Match };
    u32 out1 { 0 };
    u32 out2 { 0 };
    u32 argument { 0 };
    u32 argument_count { 0 };
    bool insensitive { false };

    AssertionType assertion() const { return static_cast<AssertionType>(argument); }
    size_t slot() const { return argument; }
    u32 code_point() const { return argument; }
};

class REGEXVM_API Program {
public:
    Program() = default;

    std::span<Instruction const> instructions() const { return m_instructions; }
    Instruction const& at(size_t pc) const { return m_instructions[pc]; }
    size_t size() const { return m_instructions.size(); }

    std::span<CharRange const> ranges_of(Instruction const& instruction) const
    {
        return std::span<CharRange const> { m_ranges }.subspan(instruction.argument, instruction.argument_count);
    }

    // Two slots per group, group 0 is the overall match.
    size_t capture_slot_count() const { return m_capture_slot_count; }
    size_t capture_group_count() const { return m_capture_slot_count / 2; }

    bool is_anchored_start() const { return m_anchored_start; }
    bool is_anchored_end() const { return m_anchored_end; }

    std::optional<std::string> const& required_prefix() const { return m_required_prefix; }

    InputMode input_mode() const { return m_input_mode; }
    bool is_byte_mode() const { return m_input_mode == InputMode::Bytes; }
    bool uses_unicode_case_folding() const { return m_unicode_case_folding; }

private:
    friend class ProgramBuilder;

    std::vector<Instruction> m_instructions;
    std::vector<CharRange> m_ranges;
    size_t m_capture_slot_count { 2 };
    bool m_anchored_start { false };
    bool m_anchored_end { false };
    std::optional<std::string> m_required_prefix;
    InputMode m_input_mode { InputMode::Text };
    bool m_unicode_case_folding { true };
};

// Assembler used by the compiler to lay out a Program.
// Every append_* returns the program counter of the new instruction; forward
// references are patched with set_out1()/set_out2() once the target is known.
class REGEXVM_API ProgramBuilder {
public:
    ProgramBuilder() = default;

    size_t append_match();
    size_t append_save(size_t slot, u32 next);
    size_t append_split(u32 high_priority, u32 low_priority);
    size_t append_jump(u32 target);
    size_t append_assertion(AssertionType, u32 next);
    size_t append_char(u32 code_point, u32 next, bool insensitive = false);
    size_t append_ranges(std::span<CharRange const>, u32 next, bool insensitive = false);
    size_t append_any_char(u32 next);
    size_t append_any_char_not_newline(u32 next);

    // Appends one Char per code point, each chained to the instruction that follows it.
    size_t append_literal(std::u32string_view, bool insensitive = false);

    void set_out1(size_t pc, u32 target);
    void set_out2(size_t pc, u32 target);

    u32 next_pc() const { return static_cast<u32>(m_program.m_instructions.size()); }

    ProgramBuilder& set_capture_group_count(size_t count);
    ProgramBuilder& set_anchored_start(bool value);
    ProgramBuilder& set_anchored_end(bool value);
    ProgramBuilder& set_required_prefix(std::string prefix);
    ProgramBuilder& set_input_mode(InputMode);
    ProgramBuilder& set_unicode_case_folding(bool value);

    // Checks every successor and slot reference; a malformed program is a compiler bug.
    Program build();

private:
    size_t append(Instruction);

    Program m_program;
};

}
