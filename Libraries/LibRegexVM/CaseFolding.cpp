/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/CaseFolding.h>
#include <LibRegexVM/Debug.h>
#include <algorithm>
#include <unicode/uchar.h>

namespace regexvm {

static constexpr u32 MaxCodePoint = 0x10ffff;

namespace {

// Inverse of ICU's simple case folding: for every representative, the other code points that
// fold to it. Built once and shared read-only by every match call.
class CaseFoldTable {
public:
    static CaseFoldTable const& the()
    {
        static CaseFoldTable const s_table;
        return s_table;
    }

    std::span<u32 const> members_of(u32 representative) const
    {
        auto it = std::lower_bound(m_entries.begin(), m_entries.end(), representative,
            [](Entry const& entry, u32 value) { return entry.representative < value; });
        if (it == m_entries.end() || it->representative != representative)
            return {};
        return std::span<u32 const> { m_members }.subspan(it->first_member, it->member_count);
    }

private:
    struct Entry {
        u32 representative;
        u32 first_member;
        u32 member_count;
    };

    CaseFoldTable()
    {
        std::vector<std::pair<u32, u32>> mappings;
        for (u32 code_point = 0; code_point <= MaxCodePoint; ++code_point) {
            auto folded = static_cast<u32>(u_foldCase(static_cast<UChar32>(code_point), U_FOLD_CASE_DEFAULT));
            if (folded != code_point)
                mappings.emplace_back(folded, code_point);
        }
        std::sort(mappings.begin(), mappings.end());

        m_members.reserve(mappings.size());
        for (auto const& [representative, member] : mappings) {
            if (m_entries.empty() || m_entries.back().representative != representative)
                m_entries.push_back({ representative, static_cast<u32>(m_members.size()), 0 });
            m_members.push_back(member);
            ++m_entries.back().member_count;
        }

        dbgln_if(REGEXVM_DEBUG, "Case fold table: {} classes, {} folded code points", m_entries.size(), m_members.size());
    }

    std::vector<Entry> m_entries;
    std::vector<u32> m_members;
};

}

u32 simple_case_fold_representative(u32 code_point)
{
    if (code_point > MaxCodePoint)
        return code_point;
    if (code_point < 0x80)
        return ascii_case_fold(code_point);
    return static_cast<u32>(u_foldCase(static_cast<UChar32>(code_point), U_FOLD_CASE_DEFAULT));
}

std::vector<u32> simple_case_fold(u32 code_point)
{
    auto representative = simple_case_fold_representative(code_point);
    auto members = Detail::case_fold_class_members(representative);

    std::vector<u32> result;
    result.reserve(members.size() + 1);
    result.push_back(representative);
    result.insert(result.end(), members.begin(), members.end());
    std::sort(result.begin(), result.end());
    return result;
}

namespace Detail {

std::span<u32 const> case_fold_class_members(u32 representative)
{
    if (representative > MaxCodePoint)
        return {};
    return CaseFoldTable::the().members_of(representative);
}

}

}
