/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/Match.h>

namespace regexvm {

std::string_view match_kind_name(MatchKind kind)
{
    switch (kind) {
    case MatchKind::Exists:
        return "Exists";
    case MatchKind::LeftmostFirst:
        return "LeftmostFirst";
    case MatchKind::LeftmostFirstCaptures:
        return "LeftmostFirstCaptures";
    }
    VERIFY_NOT_REACHED();
}

std::string_view outcome_type_name(OutcomeType type)
{
    switch (type) {
#define __ENUMERATE_OUTCOME_TYPE(x) \
    case OutcomeType::x:            \
        return #x;
        ENUMERATE_OUTCOME_TYPES
#undef __ENUMERATE_OUTCOME_TYPE
    }
    VERIFY_NOT_REACHED();
}

Outcome Outcome::no_match(u64 steps)
{
    Outcome outcome { OutcomeType::NoMatch };
    outcome.m_steps = steps;
    return outcome;
}

Outcome Outcome::match_limit_exceeded(u64 steps)
{
    Outcome outcome { OutcomeType::MatchLimitExceeded };
    outcome.m_steps = steps;
    return outcome;
}

Outcome Outcome::malformed_input(size_t error_offset)
{
    Outcome outcome { OutcomeType::MalformedInput };
    outcome.m_error_offset = error_offset;
    return outcome;
}

Outcome Outcome::matched(MatchKind kind, std::span<size_t const> slots, u64 steps)
{
    Outcome outcome { OutcomeType::Matched };
    outcome.m_steps = steps;

    if (kind == MatchKind::Exists)
        return outcome;

    VERIFY(slots.size() >= 2);
    VERIFY(slots[0] != NoOffset && slots[1] != NoOffset);
    outcome.m_bounds = MatchBounds { slots[0], slots[1] };

    if (kind == MatchKind::LeftmostFirstCaptures) {
        outcome.m_slots.reserve(slots.size());
        for (auto slot : slots) {
            if (slot == NoOffset)
                outcome.m_slots.emplace_back();
            else
                outcome.m_slots.emplace_back(slot);
        }
    }

    return outcome;
}

std::optional<MatchBounds> Outcome::capture(size_t group) const
{
    if (group == 0)
        return m_bounds;
    auto start_slot = group * 2;
    if (start_slot + 1 >= m_slots.size())
        return {};
    auto const& start = m_slots[start_slot];
    auto const& end = m_slots[start_slot + 1];
    if (!start.has_value() || !end.has_value())
        return {};
    return MatchBounds { *start, *end };
}

}
