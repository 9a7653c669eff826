/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Forward.h>

#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace regexvm {

// Marks a capture slot that was never written.
constexpr size_t NoOffset = std::numeric_limits<size_t>::max();

enum class MatchKind : u8 {
    // Only whether the program matches somewhere; may stop at the first completing thread.
    Exists,
    // Bounds of the leftmost-first match.
    LeftmostFirst,
    // Bounds of the leftmost-first match plus every capture group.
    LeftmostFirstCaptures,
};

REGEXVM_API std::string_view match_kind_name(MatchKind);

// Byte offsets, end exclusive.
struct MatchBounds {
    size_t start { 0 };
    size_t end { 0 };

    size_t length() const { return end - start; }
    bool operator==(MatchBounds const&) const = default;
};

#define ENUMERATE_OUTCOME_TYPES                  \
    __ENUMERATE_OUTCOME_TYPE(NoMatch)            \
    __ENUMERATE_OUTCOME_TYPE(Matched)            \
    __ENUMERATE_OUTCOME_TYPE(MatchLimitExceeded) \
    __ENUMERATE_OUTCOME_TYPE(MalformedInput)

enum class OutcomeType : u8 {
#define __ENUMERATE_OUTCOME_TYPE(x) x,
    ENUMERATE_OUTCOME_TYPES
#undef __ENUMERATE_OUTCOME_TYPE
};

REGEXVM_API std::string_view outcome_type_name(OutcomeType);

class REGEXVM_API Outcome {
public:
    static Outcome no_match(u64 steps);
    static Outcome match_limit_exceeded(u64 steps);
    static Outcome malformed_input(size_t error_offset);

    // `slots` holds one entry per capture slot, NoOffset for groups that did not participate.
    // Exists results carry no slots, LeftmostFirst results carry the two overall slots.
    static Outcome matched(MatchKind, std::span<size_t const> slots, u64 steps);

    OutcomeType type() const { return m_type; }
    bool is_match() const { return m_type == OutcomeType::Matched; }
    bool is_error() const { return m_type == OutcomeType::MatchLimitExceeded || m_type == OutcomeType::MalformedInput; }

    // Overall match bounds; empty for Exists requests and for every non-match.
    std::optional<MatchBounds> const& bounds() const { return m_bounds; }

    // Every capture slot, only filled in for LeftmostFirstCaptures.
    std::vector<std::optional<size_t>> const& slots() const { return m_slots; }
    std::optional<MatchBounds> capture(size_t group) const;
    size_t capture_group_count() const { return m_slots.size() / 2; }

    // Byte offset of the first invalid UTF-8 sequence (MalformedInput only).
    size_t error_offset() const { return m_error_offset; }

    // Number of instructions the engine executed; diagnostic only.
    u64 steps() const { return m_steps; }

    bool operator==(Outcome const&) const = default;

private:
    explicit Outcome(OutcomeType type)
        : m_type(type)
    {
    }

    OutcomeType m_type { OutcomeType::NoMatch };
    std::optional<MatchBounds> m_bounds;
    std::vector<std::optional<size_t>> m_slots;
    size_t m_error_offset { 0 };
    u64 m_steps { 0 };
};

}
