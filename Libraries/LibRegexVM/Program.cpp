/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/Debug.h>
#include <LibRegexVM/Program.h>
#include <algorithm>

namespace regexvm {

std::string_view opcode_id_name(OpCodeId opcode_id)
{
    switch (opcode_id) {
#define __ENUMERATE_OPCODE(x) \
    case OpCodeId::x:         \
        return #x;
        ENUMERATE_OPCODES
#undef __ENUMERATE_OPCODE
    }
    VERIFY_NOT_REACHED();
}

std::string_view assertion_type_name(AssertionType type)
{
    switch (type) {
#define __ENUMERATE_ASSERTION_TYPE(x) \
    case AssertionType::x:            \
        return #x;
        ENUMERATE_ASSERTION_TYPES
#undef __ENUMERATE_ASSERTION_TYPE
    }
    VERIFY_NOT_REACHED();
}

std::string_view input_mode_name(InputMode mode)
{
    switch (mode) {
    case InputMode::Text:
        return "Text";
    case InputMode::Bytes:
        return "Bytes";
    }
    VERIFY_NOT_REACHED();
}

size_t ProgramBuilder::append(Instruction instruction)
{
    auto pc = m_program.m_instructions.size();
    m_program.m_instructions.push_back(instruction);
    return pc;
}

size_t ProgramBuilder::append_match()
{
    return append({ .opcode = OpCodeId::Match });
}

size_t ProgramBuilder::append_save(size_t slot, u32 next)
{
    return append({ .opcode = OpCodeId::Save, .out1 = next, .argument = static_cast<u32>(slot) });
}

size_t ProgramBuilder::append_split(u32 high_priority, u32 low_priority)
{
    return append({ .opcode = OpCodeId::Split, .out1 = high_priority, .out2 = low_priority });
}

size_t ProgramBuilder::append_jump(u32 target)
{
    return append({ .opcode = OpCodeId::Jump, .out1 = target });
}

size_t ProgramBuilder::append_assertion(AssertionType type, u32 next)
{
    return append({ .opcode = OpCodeId::Assert, .out1 = next, .argument = static_cast<u32>(type) });
}

size_t ProgramBuilder::append_char(u32 code_point, u32 next, bool insensitive)
{
    return append({ .opcode = OpCodeId::Char, .out1 = next, .argument = code_point, .insensitive = insensitive });
}

size_t ProgramBuilder::append_ranges(std::span<CharRange const> ranges, u32 next, bool insensitive)
{
    VERIFY(!ranges.empty());

    // Keep the class sorted and disjoint so the matcher can binary search it.
    std::vector<CharRange> sorted_ranges { ranges.begin(), ranges.end() };
    std::sort(sorted_ranges.begin(), sorted_ranges.end(), [](auto const& a, auto const& b) { return a.from < b.from; });

    auto first_range = static_cast<u32>(m_program.m_ranges.size());
    u32 count = 0;
    for (auto const& range : sorted_ranges) {
        VERIFY(range.from <= range.to);
        if (count > 0) {
            auto& last = m_program.m_ranges.back();
            if (range.from <= last.to || range.from - last.to == 1) {
                last.to = std::max(last.to, range.to);
                continue;
            }
        }
        m_program.m_ranges.push_back(range);
        ++count;
    }

    return append({
        .opcode = OpCodeId::Ranges,
        .out1 = next,
        .argument = first_range,
        .argument_count = count,
        .insensitive = insensitive,
    });
}

size_t ProgramBuilder::append_any_char(u32 next)
{
    return append({ .opcode = OpCodeId::AnyChar, .out1 = next });
}

size_t ProgramBuilder::append_any_char_not_newline(u32 next)
{
    return append({ .opcode = OpCodeId::AnyCharNotNewline, .out1 = next });
}

size_t ProgramBuilder::append_literal(std::u32string_view literal, bool insensitive)
{
    VERIFY(!literal.empty());
    auto first = static_cast<size_t>(next_pc());
    for (auto code_point : literal)
        append_char(code_point, next_pc() + 1, insensitive);
    return first;
}

void ProgramBuilder::set_out1(size_t pc, u32 target)
{
    VERIFY(pc < m_program.m_instructions.size());
    m_program.m_instructions[pc].out1 = target;
}

void ProgramBuilder::set_out2(size_t pc, u32 target)
{
    VERIFY(pc < m_program.m_instructions.size());
    VERIFY(m_program.m_instructions[pc].opcode == OpCodeId::Split);
    m_program.m_instructions[pc].out2 = target;
}

ProgramBuilder& ProgramBuilder::set_capture_group_count(size_t count)
{
    VERIFY(count > 0);
    m_program.m_capture_slot_count = count * 2;
    return *this;
}

ProgramBuilder& ProgramBuilder::set_anchored_start(bool value)
{
    m_program.m_anchored_start = value;
    return *this;
}

ProgramBuilder& ProgramBuilder::set_anchored_end(bool value)
{
    m_program.m_anchored_end = value;
    return *this;
}

ProgramBuilder& ProgramBuilder::set_required_prefix(std::string prefix)
{
    if (prefix.empty())
        m_program.m_required_prefix.reset();
    else
        m_program.m_required_prefix = std::move(prefix);
    return *this;
}

ProgramBuilder& ProgramBuilder::set_input_mode(InputMode mode)
{
    m_program.m_input_mode = mode;
    return *this;
}

ProgramBuilder& ProgramBuilder::set_unicode_case_folding(bool value)
{
    m_program.m_unicode_case_folding = value;
    return *this;
}

Program ProgramBuilder::build()
{
    auto const& instructions = m_program.m_instructions;
    auto size = instructions.size();
    VERIFY(size > 0);

    bool has_match = false;
    for (size_t pc = 0; pc < size; ++pc) {
        auto const& instruction = instructions[pc];
        switch (instruction.opcode) {
        case OpCodeId::Match:
            has_match = true;
            break;
        case OpCodeId::Split:
            VERIFY(instruction.out2 < size);
            [[fallthrough]];
        case OpCodeId::Jump:
        case OpCodeId::AnyChar:
        case OpCodeId::AnyCharNotNewline:
            VERIFY(instruction.out1 < size);
            break;
        case OpCodeId::Save:
            VERIFY(instruction.out1 < size);
            VERIFY(instruction.slot() < m_program.m_capture_slot_count);
            break;
        case OpCodeId::Assert:
            VERIFY(instruction.out1 < size);
            VERIFY(instruction.argument <= static_cast<u32>(AssertionType::NotWordBoundary));
            break;
        case OpCodeId::Char:
            VERIFY(instruction.out1 < size);
            if (m_program.m_input_mode == InputMode::Bytes)
                VERIFY(instruction.code_point() <= 0xff);
            else
                VERIFY(instruction.code_point() <= 0x10ffff);
            break;
        case OpCodeId::Ranges:
            VERIFY(instruction.out1 < size);
            VERIFY(instruction.argument_count > 0);
            VERIFY(static_cast<size_t>(instruction.argument) + instruction.argument_count <= m_program.m_ranges.size());
            break;
        }
    }
    VERIFY(has_match);

    dbgln_if(REGEXVM_DEBUG, "Built program: {} instructions, {} slots, mode={}, prefix={}",
        size, m_program.m_capture_slot_count, input_mode_name(m_program.m_input_mode),
        m_program.m_required_prefix.value_or(std::string {}));

    return std::move(m_program);
}

}
