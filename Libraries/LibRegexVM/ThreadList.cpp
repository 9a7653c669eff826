/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/ThreadList.h>
#include <algorithm>

namespace regexvm {

ThreadList::ThreadList(size_t instruction_count, size_t slot_count)
    : m_slot_count(slot_count)
    , m_generation(instruction_count, 0)
    , m_flat_slots(instruction_count * slot_count)
{
    m_active.reserve(instruction_count);
}

void ThreadList::clear()
{
    ++m_current_generation;
    m_active.clear();
}

void ThreadList::add(u32 pc, std::span<size_t const> slots)
{
    if (contains(pc))
        return;
    VERIFY(slots.size() == m_slot_count);

    m_generation[pc] = m_current_generation;
    std::copy(slots.begin(), slots.end(), m_flat_slots.begin() + static_cast<std::ptrdiff_t>(pc * m_slot_count));
    m_active.push_back(pc);
}

std::span<size_t const> ThreadList::slots_of(u32 pc) const
{
    return std::span<size_t const> { m_flat_slots }.subspan(pc * m_slot_count, m_slot_count);
}

}
