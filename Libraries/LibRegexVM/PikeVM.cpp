/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/CharReader.h>
#include <LibRegexVM/Debug.h>
#include <LibRegexVM/PikeVM.h>
#include <LibRegexVM/Program.h>
#include <LibRegexVM/Step.h>
#include <algorithm>
#include <utility>

namespace regexvm {

static size_t slot_count_for(Program const& program, MatchKind kind)
{
    switch (kind) {
    case MatchKind::Exists:
    case MatchKind::LeftmostFirst:
        return 2;
    case MatchKind::LeftmostFirstCaptures:
        return program.capture_slot_count();
    }
    VERIFY_NOT_REACHED();
}

PikeVM::PikeVM(Program const& program, MatchKind kind)
    : m_program(program)
    , m_kind(kind)
    , m_slot_count(slot_count_for(program, kind))
    , m_current(program.size(), m_slot_count)
    , m_next(program.size(), m_slot_count)
    , m_scratch(m_slot_count, NoOffset)
    , m_best(m_slot_count, NoOffset)
{
}

void PikeVM::add_thread(ThreadList& list, u32 pc, std::span<size_t> slots, CharReader const& reader)
{
    // Frames are popped in reverse, so out2 goes on before out1 and a slot restore before the
    // branch that sees the saved value.
    auto explore = [&](u32 target) {
        m_closure_stack.push_back({ .kind = ClosureFrame::Kind::Explore, .pc = target });
    };

    m_closure_stack.clear();
    explore(pc);

    while (!m_closure_stack.empty()) {
        auto frame = m_closure_stack.back();
        m_closure_stack.pop_back();

        if (frame.kind == ClosureFrame::Kind::RestoreSlot) {
            slots[frame.slot] = frame.value;
            continue;
        }

        if (list.contains(frame.pc))
            continue;

        auto const& instruction = m_program.at(frame.pc);
        ++m_steps;

        switch (instruction.opcode) {
        case OpCodeId::Split:
            list.mark(frame.pc);
            explore(instruction.out2);
            explore(instruction.out1);
            break;
        case OpCodeId::Jump:
            list.mark(frame.pc);
            explore(instruction.out1);
            break;
        case OpCodeId::Save: {
            list.mark(frame.pc);
            auto slot = instruction.slot();
            if (slot < slots.size()) {
                m_closure_stack.push_back({ .kind = ClosureFrame::Kind::RestoreSlot, .slot = slot, .value = slots[slot] });
                slots[slot] = reader.offset();
            }
            explore(instruction.out1);
            break;
        }
        case OpCodeId::Assert:
            list.mark(frame.pc);
            if (is_assertion_satisfied(m_program, instruction.assertion(), reader))
                explore(instruction.out1);
            break;
        case OpCodeId::Match:
        case OpCodeId::Char:
        case OpCodeId::Ranges:
        case OpCodeId::AnyChar:
        case OpCodeId::AnyCharNotNewline:
            list.add(frame.pc, slots);
            break;
        }
    }
}

Outcome PikeVM::run(std::string_view haystack, size_t start_offset)
{
    StartCandidates candidates { .program = m_program, .haystack = haystack, .start_offset = start_offset };
    auto first = candidates.next(start_offset);
    if (!first.has_value())
        return Outcome::no_match(0);

    CharReader reader { haystack, m_program.input_mode(), *first };
    m_current.clear();
    m_next.clear();
    m_steps = 0;
    bool matched = false;

    for (;;) {
        if (!matched) {
            if (m_current.is_empty()) {
                auto candidate = candidates.next(reader.offset());
                if (!candidate.has_value())
                    break;
                if (*candidate != reader.offset())
                    reader.reset_to(*candidate);
            }

            // A thread starting here has lower priority than every thread that started earlier.
            if (!m_program.is_anchored_start() || reader.offset() == start_offset) {
                std::fill(m_scratch.begin(), m_scratch.end(), NoOffset);
                m_scratch[0] = reader.offset();
                add_thread(m_current, 0, m_scratch, reader);
            }
        }

        CharReader next_reader = reader;
        bool can_advance = next_reader.advance() == CharReader::AdvanceResult::Advanced;

        m_next.clear();
        for (auto pc : m_current.active()) {
            auto const& instruction = m_program.at(pc);
            ++m_steps;

            auto state = step(m_program, instruction, reader);
            dbgln_if(REGEXVM_TRACE_DEBUG, "pike: offset={} pc={} {} -> {}", reader.offset(), pc, opcode_id_name(instruction.opcode), step_state_name(state));

            bool cut = false;
            switch (state) {
            case StepState::Dies:
                break;
            case StepState::Matches: {
                if (m_kind == MatchKind::Exists)
                    return Outcome::matched(m_kind, {}, m_steps);
                auto slots = m_current.slots_of(pc);
                std::copy(slots.begin(), slots.end(), m_best.begin());
                m_best[1] = reader.offset();
                matched = true;
                // Every thread after this one has lower priority and can no longer win.
                cut = true;
                break;
            }
            case StepState::Continue: {
                VERIFY(can_advance);
                auto slots = m_current.slots_of(pc);
                std::copy(slots.begin(), slots.end(), m_scratch.begin());
                add_thread(m_next, instruction.out1, m_scratch, next_reader);
                break;
            }
            }
            if (cut)
                break;
        }

        if (!can_advance)
            break;

        std::swap(m_current, m_next);
        reader = next_reader;

        if (matched && m_current.is_empty())
            break;
    }

    if (!matched)
        return Outcome::no_match(m_steps);

    dbgln_if(REGEXVM_DEBUG, "pike: matched [{}, {}) after {} steps", m_best[0], m_best[1], m_steps);
    return Outcome::matched(m_kind, m_best, m_steps);
}

}
