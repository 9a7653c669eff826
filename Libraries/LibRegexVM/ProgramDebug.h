/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/Match.h>
#include <LibRegexVM/Program.h>

#include <cstdio>
#include <fmt/core.h>
#include <string>

namespace regexvm {

class ProgramDebug {
public:
    ProgramDebug(FILE* file = stdout)
        : m_file(file)
    {
    }

    void print_program(Program const& program) const
    {
        fmt::print(m_file, "Program: {} instructions, {} slots, mode={}{}{}{}\n",
            program.size(),
            program.capture_slot_count(),
            input_mode_name(program.input_mode()),
            program.is_anchored_start() ? ", anchored start" : "",
            program.is_anchored_end() ? ", anchored end" : "",
            program.uses_unicode_case_folding() ? "" : ", ascii folding");
        if (auto const& prefix = program.required_prefix(); prefix.has_value())
            fmt::print(m_file, "Required prefix: \"{}\"\n", *prefix);

        for (size_t pc = 0; pc < program.size(); ++pc)
            print_instruction(program, pc);

        std::fflush(m_file);
    }

    void print_instruction(Program const& program, size_t pc) const
    {
        auto const& instruction = program.at(pc);
        fmt::print(m_file, "{:5} | {:18} | {}\n", pc, opcode_id_name(instruction.opcode), arguments_string(program, instruction));
    }

    void print_outcome(Outcome const& outcome) const
    {
        fmt::print(m_file, "{}, steps: {}", outcome_type_name(outcome.type()), outcome.steps());
        if (auto const& bounds = outcome.bounds(); bounds.has_value())
            fmt::print(m_file, ", bounds: [{}, {})", bounds->start, bounds->end);
        if (outcome.type() == OutcomeType::MalformedInput)
            fmt::print(m_file, ", offset: {}", outcome.error_offset());
        fmt::print(m_file, "\n");
        for (size_t group = 1; group < outcome.capture_group_count(); ++group) {
            if (auto capture = outcome.capture(group); capture.has_value())
                fmt::print(m_file, "  group {}: [{}, {})\n", group, capture->start, capture->end);
            else
                fmt::print(m_file, "  group {}: unset\n", group);
        }
    }

    static std::string arguments_string(Program const& program, Instruction const& instruction)
    {
        auto insensitive = instruction.insensitive ? " (insensitive)" : "";

        switch (instruction.opcode) {
        case OpCodeId::Match:
            return {};
        case OpCodeId::Save:
            return fmt::format("slot:{} next:{}", instruction.slot(), instruction.out1);
        case OpCodeId::Split:
            return fmt::format("high:{} low:{}", instruction.out1, instruction.out2);
        case OpCodeId::Jump:
            return fmt::format("target:{}", instruction.out1);
        case OpCodeId::Assert:
            return fmt::format("{} next:{}", assertion_type_name(instruction.assertion()), instruction.out1);
        case OpCodeId::Char:
            return fmt::format("{:#x}{} next:{}", instruction.code_point(), insensitive, instruction.out1);
        case OpCodeId::Ranges: {
            std::string builder;
            for (auto const& range : program.ranges_of(instruction)) {
                if (!builder.empty())
                    builder += ' ';
                builder += fmt::format("[{:#x}-{:#x}]", range.from, range.to);
            }
            return fmt::format("{}{} next:{}", builder, insensitive, instruction.out1);
        }
        case OpCodeId::AnyChar:
        case OpCodeId::AnyCharNotNewline:
            return fmt::format("next:{}", instruction.out1);
        }
        VERIFY_NOT_REACHED();
    }

private:
    FILE* m_file { nullptr };
};

}
