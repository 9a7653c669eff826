/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Forward.h>

#include <string_view>

namespace regexvm {

enum class Strategy : u8 {
    // Pick per call from the requested MatchKind and the size of the backtracking memo.
    Auto,
    PikeVM,
    Backtrack,
};

REGEXVM_API std::string_view strategy_name(Strategy);

struct ExecuteOptions {
    // Upper bound on instructions the backtracker may execute before giving up with
    // MatchLimitExceeded. The Pike VM is linear and does not consult it.
    u64 step_budget { 10'000'000 };

    // Report invalid UTF-8 in Text mode as MalformedInput instead of decoding it to U+FFFD.
    bool strict_utf8 { false };

    Strategy strategy { Strategy::Auto };

    // Bits the backtracker may spend remembering visited (pc, offset) states. Auto selection
    // only picks the backtracker when the memo fits; a forced backtracker without room for it
    // runs unmemoized and relies on step_budget alone.
    size_t backtrack_visited_limit { 256 * 1024 * 8 };
};

}
