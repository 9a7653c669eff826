/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/Backtracker.h>
#include <LibRegexVM/CharReader.h>
#include <LibRegexVM/Debug.h>
#include <LibRegexVM/Program.h>
#include <LibRegexVM/Step.h>
#include <algorithm>

namespace regexvm {

Backtracker::Backtracker(Program const& program, MatchKind kind, ExecuteOptions const& options)
    : m_program(program)
    , m_kind(kind)
    , m_options(options)
    , m_slot_count(kind == MatchKind::LeftmostFirstCaptures ? program.capture_slot_count() : 2)
    , m_slots(m_slot_count, NoOffset)
{
}

size_t Backtracker::visited_bits_needed(Program const& program, size_t haystack_length, size_t start_offset)
{
    VERIFY(start_offset <= haystack_length);
    return program.size() * (haystack_length - start_offset + 1);
}

bool Backtracker::has_visited(u32 pc, size_t offset)
{
    auto bit = static_cast<size_t>(pc) * m_offset_span + (offset - m_base_offset);
    auto& word = m_visited[bit / 64];
    auto mask = u64 { 1 } << (bit % 64);
    if (word & mask)
        return true;
    word |= mask;
    return false;
}

bool Backtracker::has_visited_since_last_advance(u32 pc)
{
    if (m_trail_position[pc] > m_segment_start)
        return true;
    m_trail.push_back({ pc, m_trail_position[pc] });
    m_trail_position[pc] = m_trail.size();
    return false;
}

void Backtracker::push_trail_barrier()
{
    m_trail.push_back({ TrailBarrier, m_segment_start });
    m_segment_start = m_trail.size();
}

void Backtracker::truncate_trail(size_t length)
{
    while (m_trail.size() > length) {
        auto entry = m_trail.back();
        m_trail.pop_back();
        if (entry.pc == TrailBarrier)
            m_segment_start = entry.previous;
        else
            m_trail_position[entry.pc] = entry.previous;
    }
}

Backtracker::AttemptResult Backtracker::attempt(CharReader& reader, size_t at)
{
    m_stack.clear();
    m_slot_stack.clear();
    truncate_trail(0);

    std::fill(m_slots.begin(), m_slots.end(), NoOffset);
    m_slots[0] = at;

    auto push = [&](u32 pc, size_t offset) {
        m_stack.push_back({ pc, offset, m_slot_stack.size(), m_trail.size() });
        m_slot_stack.insert(m_slot_stack.end(), m_slots.begin(), m_slots.end());
    };

    push(0, at);

    while (!m_stack.empty()) {
        auto frame = m_stack.back();
        m_stack.pop_back();
        std::copy_n(m_slot_stack.begin() + static_cast<std::ptrdiff_t>(frame.slots_index), m_slot_count, m_slots.begin());
        m_slot_stack.resize(frame.slots_index);
        truncate_trail(frame.trail_length);

        reader.reset_to(frame.offset);
        auto pc = frame.pc;

        for (;;) {
            if (m_use_visited ? has_visited(pc, reader.offset()) : has_visited_since_last_advance(pc))
                break;

            if (++m_steps > m_options.step_budget) {
                dbgln_if(REGEXVM_DEBUG, "backtrack: step budget of {} exhausted at offset {}", m_options.step_budget, reader.offset());
                return AttemptResult::LimitExceeded;
            }

            auto const& instruction = m_program.at(pc);
            dbgln_if(REGEXVM_TRACE_DEBUG, "backtrack: offset={} pc={} {}", reader.offset(), pc, opcode_id_name(instruction.opcode));

            bool failed = false;
            switch (instruction.opcode) {
            case OpCodeId::Split:
                push(instruction.out2, reader.offset());
                pc = instruction.out1;
                break;
            case OpCodeId::Jump:
                pc = instruction.out1;
                break;
            case OpCodeId::Save:
                if (instruction.slot() < m_slot_count)
                    m_slots[instruction.slot()] = reader.offset();
                pc = instruction.out1;
                break;
            case OpCodeId::Assert:
                if (is_assertion_satisfied(m_program, instruction.assertion(), reader))
                    pc = instruction.out1;
                else
                    failed = true;
                break;
            case OpCodeId::Match:
            case OpCodeId::Char:
            case OpCodeId::Ranges:
            case OpCodeId::AnyChar:
            case OpCodeId::AnyCharNotNewline:
                switch (step(m_program, instruction, reader)) {
                case StepState::Matches:
                    m_slots[1] = reader.offset();
                    return AttemptResult::Matched;
                case StepState::Continue:
                    reader.advance();
                    if (!m_use_visited)
                        push_trail_barrier();
                    pc = instruction.out1;
                    break;
                case StepState::Dies:
                    failed = true;
                    break;
                }
                break;
            }

            if (failed)
                break;
        }
    }

    return AttemptResult::Failed;
}

Outcome Backtracker::run(std::string_view haystack, size_t start_offset)
{
    m_steps = 0;

    auto bits = visited_bits_needed(m_program, haystack.size(), start_offset);
    m_use_visited = bits <= m_options.backtrack_visited_limit;
    if (m_use_visited) {
        m_base_offset = start_offset;
        m_offset_span = haystack.size() - start_offset + 1;
        m_visited.assign((bits + 63) / 64, 0);
    } else {
        m_visited.clear();
        m_trail.clear();
        m_segment_start = 0;
        m_trail_position.assign(m_program.size(), 0);
        dbgln_if(REGEXVM_DEBUG, "backtrack: {} memo bits exceed the limit of {}, running unmemoized", bits, m_options.backtrack_visited_limit);
    }

    StartCandidates candidates { .program = m_program, .haystack = haystack, .start_offset = start_offset };
    CharReader reader { haystack, m_program.input_mode(), start_offset };

    auto position = start_offset;
    for (;;) {
        auto candidate = candidates.next(position);
        if (!candidate.has_value())
            break;

        switch (attempt(reader, *candidate)) {
        case AttemptResult::Matched:
            dbgln_if(REGEXVM_DEBUG, "backtrack: matched [{}, {}) after {} steps", m_slots[0], m_slots[1], m_steps);
            return Outcome::matched(m_kind, m_slots, m_steps);
        case AttemptResult::LimitExceeded:
            return Outcome::match_limit_exceeded(m_steps);
        case AttemptResult::Failed:
            break;
        }

        // Move one character past the failed start.
        reader.reset_to(*candidate);
        if (reader.advance() == CharReader::AdvanceResult::EndOfInput)
            break;
        position = reader.offset();
    }

    return Outcome::no_match(m_steps);
}

}
