/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Forward.h>

#include <span>
#include <vector>

namespace regexvm {

// Sparse set of program counters, kept in insertion (priority) order, with one row of capture
// slots per program counter. Clearing is O(1): a pc is a member only if its generation matches.
class REGEXVM_API ThreadList {
public:
    ThreadList(size_t instruction_count, size_t slot_count);

    void clear();

    bool contains(u32 pc) const { return m_generation[pc] == m_current_generation; }

    // Claims `pc` for this generation without queueing a thread on it. Used for epsilon
    // instructions so a closure visits each of them at most once.
    void mark(u32 pc) { m_generation[pc] = m_current_generation; }

    // Queues a thread unless `pc` is already taken; the first (highest priority) thread wins.
    void add(u32 pc, std::span<size_t const> slots);

    std::span<u32 const> active() const { return m_active; }
    std::span<size_t const> slots_of(u32 pc) const;

    size_t size() const { return m_active.size(); }
    bool is_empty() const { return m_active.empty(); }
    size_t slot_count() const { return m_slot_count; }

private:
    size_t m_slot_count { 0 };
    u64 m_current_generation { 1 };
    std::vector<u64> m_generation;
    std::vector<u32> m_active;
    std::vector<size_t> m_flat_slots;
};

}
