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

namespace regexvm {

// Runs `program` over `haystack`, beginning the search at byte `start_offset` (which must lie on
// a character boundary and not past the end). The program may be shared by any number of
// concurrent calls; every piece of mutable state lives in the call.
REGEXVM_API Outcome run(Program const&, std::string_view haystack, size_t start_offset, MatchKind, ExecuteOptions const& = {});

// The strategy run() would use for this call. Strategy::Auto is never returned.
REGEXVM_API Strategy choose_strategy(Program const&, size_t haystack_length, size_t start_offset, MatchKind, ExecuteOptions const&);

}
