/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <LibRegexVM/Assertions.h>
#include <LibRegexVM/Backtracker.h>
#include <LibRegexVM/Debug.h>
#include <LibRegexVM/Executor.h>
#include <LibRegexVM/PikeVM.h>
#include <LibRegexVM/Program.h>
#include <simdutf.h>

namespace regexvm {

std::string_view strategy_name(Strategy strategy)
{
    switch (strategy) {
    case Strategy::Auto:
        return "Auto";
    case Strategy::PikeVM:
        return "PikeVM";
    case Strategy::Backtrack:
        return "Backtrack";
    }
    VERIFY_NOT_REACHED();
}

Strategy choose_strategy(Program const& program, size_t haystack_length, size_t start_offset, MatchKind kind, ExecuteOptions const& options)
{
    if (options.strategy != Strategy::Auto)
        return options.strategy;

    switch (kind) {
    case MatchKind::Exists:
    case MatchKind::LeftmostFirst:
        return Strategy::PikeVM;
    case MatchKind::LeftmostFirstCaptures:
        if (Backtracker::visited_bits_needed(program, haystack_length, start_offset) <= options.backtrack_visited_limit)
            return Strategy::Backtrack;
        return Strategy::PikeVM;
    }
    VERIFY_NOT_REACHED();
}

Outcome run(Program const& program, std::string_view haystack, size_t start_offset, MatchKind kind, ExecuteOptions const& options)
{
    VERIFY(start_offset <= haystack.size());

    if (options.strict_utf8 && !program.is_byte_mode()) {
        auto validation = simdutf::validate_utf8_with_errors(haystack.data(), haystack.size());
        if (validation.error != simdutf::error_code::SUCCESS) {
            dbgln_if(REGEXVM_DEBUG, "run: invalid UTF-8 at offset {}", validation.count);
            return Outcome::malformed_input(validation.count);
        }
    }

    auto strategy = choose_strategy(program, haystack.size(), start_offset, kind, options);
    dbgln_if(REGEXVM_DEBUG, "run: {} over {} bytes from {} using {}", match_kind_name(kind), haystack.size(), start_offset, strategy_name(strategy));

    switch (strategy) {
    case Strategy::PikeVM:
        return PikeVM { program, kind }.run(haystack, start_offset);
    case Strategy::Backtrack:
        return Backtracker { program, kind, options }.run(haystack, start_offset);
    case Strategy::Auto:
        break;
    }
    VERIFY_NOT_REACHED();
}

}
