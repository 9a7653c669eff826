/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Forward.h>
#include <LibRegexVM/Match.h>
#include <LibRegexVM/Options.h>

#include <string_view>
#include <vector>

namespace regexvm {

// Depth-first interpreter that follows the high priority branch of every Split first and comes
// back for the low priority one on failure, so the first Match reached is the leftmost-first one.
//
// When the (pc, offset) memo fits in ExecuteOptions::backtrack_visited_limit every state runs at
// most once per call. Without it a path still never revisits a pc before it consumes input again,
// and the total work is bounded by ExecuteOptions::step_budget.
class REGEXVM_API Backtracker {
public:
    Backtracker(Program const&, MatchKind, ExecuteOptions const&);

    Outcome run(std::string_view haystack, size_t start_offset);

    // Number of memo bits a run over `haystack_length` bytes starting at `start_offset` needs.
    static size_t visited_bits_needed(Program const&, size_t haystack_length, size_t start_offset);

private:
    struct Frame {
        u32 pc { 0 };
        size_t offset { 0 };
        // Index of this frame's slot snapshot in m_slot_stack.
        size_t slots_index { 0 };
        // Length of m_trail when the frame was pushed.
        size_t trail_length { 0 };
    };

    // One pc visited on the current path, or a barrier left by an instruction that consumed input.
    struct TrailEntry {
        u32 pc { 0 };
        // For a pc, its previous m_trail_position. For a barrier, the previous m_segment_start.
        size_t previous { 0 };
    };
    static constexpr u32 TrailBarrier = 0xffffffff;

    enum class AttemptResult : u8 {
        Matched,
        Failed,
        LimitExceeded,
    };

    AttemptResult attempt(CharReader&, size_t at);
    bool has_visited(u32 pc, size_t offset);
    bool has_visited_since_last_advance(u32 pc);
    void push_trail_barrier();
    void truncate_trail(size_t length);

    Program const& m_program;
    MatchKind m_kind;
    ExecuteOptions m_options;
    size_t m_slot_count { 2 };

    std::vector<Frame> m_stack;
    std::vector<size_t> m_slot_stack;
    std::vector<size_t> m_slots;

    bool m_use_visited { false };
    size_t m_base_offset { 0 };
    size_t m_offset_span { 0 };
    std::vector<u64> m_visited;

    // Unmemoized runs only.
    std::vector<TrailEntry> m_trail;
    // Per pc, one past the index of its newest entry in m_trail, or 0.
    std::vector<size_t> m_trail_position;
    size_t m_segment_start { 0 };

    u64 m_steps { 0 };
};

}
