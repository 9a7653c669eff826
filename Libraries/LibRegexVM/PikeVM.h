/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Forward.h>
#include <LibRegexVM/Match.h>
#include <LibRegexVM/ThreadList.h>

#include <span>
#include <string_view>
#include <vector>

namespace regexvm {

// Breadth-first simulation of every live thread in lockstep over the input. Never backtracks,
// so it runs in O(program size * haystack length) whatever the program looks like.
class REGEXVM_API PikeVM {
public:
    PikeVM(Program const&, MatchKind);

    Outcome run(std::string_view haystack, size_t start_offset);

private:
    // Follows epsilon instructions from `pc` with the reader sitting at the position being closed
    // over, queueing a thread on every Match or consuming instruction reached. `slots` is left
    // as it was on entry.
    void add_thread(ThreadList&, u32 pc, std::span<size_t> slots, CharReader const&);

    struct ClosureFrame {
        enum class Kind : u8 {
            Explore,
            RestoreSlot,
        };
        Kind kind { Kind::Explore };
        u32 pc { 0 };
        size_t slot { 0 };
        size_t value { 0 };
    };

    Program const& m_program;
    MatchKind m_kind;
    size_t m_slot_count { 2 };

    ThreadList m_current;
    ThreadList m_next;
    std::vector<size_t> m_scratch;
    std::vector<size_t> m_best;
    std::vector<ClosureFrame> m_closure_stack;
    u64 m_steps { 0 };
};

}
