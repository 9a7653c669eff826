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

// The target of the Unicode *simple* case folding of `code_point` (status C + S in CaseFolding.txt).
// Unlike full folding this never changes the number of code points.
REGEXVM_API u32 simple_case_fold_representative(u32 code_point);

// Every code point that simple-case-folds to the same representative as `code_point`, sorted
// ascending. The result always contains `code_point` itself.
REGEXVM_API std::vector<u32> simple_case_fold(u32 code_point);

// Calls `callback` for each member of the simple case folding equivalence class of `code_point`,
// without allocating. Stops early if the callback returns true, and returns whether it did.
template<typename Callback>
bool any_of_simple_case_fold(u32 code_point, Callback callback);

// ASCII-only folding, used when a program disables Unicode case folding.
constexpr u32 ascii_case_fold(u32 code_point)
{
    if (code_point >= 'A' && code_point <= 'Z')
        return code_point + ('a' - 'A');
    return code_point;
}

namespace Detail {

// Members of the equivalence class of `code_point`, excluding the representative; empty when
// the code point does not take part in any case folding.
REGEXVM_API std::span<u32 const> case_fold_class_members(u32 representative);

}

template<typename Callback>
bool any_of_simple_case_fold(u32 code_point, Callback callback)
{
    auto representative = simple_case_fold_representative(code_point);
    if (callback(representative))
        return true;
    for (auto member : Detail::case_fold_class_members(representative)) {
        if (callback(member))
            return true;
    }
    return false;
}

}
