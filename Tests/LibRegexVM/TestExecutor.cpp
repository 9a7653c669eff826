/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <gtest/gtest.h>

#include <LibRegexVM/Executor.h>

#include "TestPrograms.h"

#include <string_view>
#include <vector>

using namespace regexvm;
using namespace regexvm::test;

static ExecuteOptions forced(Strategy strategy)
{
    ExecuteOptions options;
    options.strategy = strategy;
    return options;
}

static std::optional<MatchBounds> bounds_of(Program const& program, std::string_view haystack, size_t start_offset = 0, ExecuteOptions const& options = {})
{
    auto outcome = run(program, haystack, start_offset, MatchKind::LeftmostFirst, options);
    EXPECT_FALSE(outcome.is_error());
    return outcome.bounds();
}

TEST(Executor, literal_with_zero_or_more)
{
    // a b* c: the match cannot start at the first 'a', which is followed by another 'a'.
    EXPECT_EQ(bounds_of(a_b_star_c(), "xaabbbcZ"), (MatchBounds { 2, 7 }));
    // a+ b* c: now the leftmost 'a' starts the match.
    EXPECT_EQ(bounds_of(a_plus_b_star_c(), "xaabbbcZ"), (MatchBounds { 1, 7 }));
}

TEST(Executor, case_insensitive_class)
{
    EXPECT_TRUE(run(upper_class(true), "g", 0, MatchKind::Exists).is_match());
    EXPECT_EQ(run(upper_class(false), "g", 0, MatchKind::Exists).type(), OutcomeType::NoMatch);
    EXPECT_TRUE(run(upper_class(false), "G", 0, MatchKind::Exists).is_match());

    // ASCII-only folding still folds ASCII letters.
    EXPECT_TRUE(run(upper_class(true, false), "g", 0, MatchKind::Exists).is_match());
}

TEST(Executor, unicode_versus_ascii_folding)
{
    std::string_view kelvin = "\xE2\x84\xAA";
    EXPECT_EQ(bounds_of(single_char('k', true), kelvin), (MatchBounds { 0, 3 }));
    EXPECT_FALSE(bounds_of(single_char('k', true, false), kelvin).has_value());
    EXPECT_FALSE(bounds_of(single_char('k'), kelvin).has_value());

    // k matches K (and vice versa) in both modes.
    EXPECT_EQ(bounds_of(single_char('k', true, false), "xK"), (MatchBounds { 1, 2 }));
    EXPECT_EQ(bounds_of(single_char('K', true), "xk"), (MatchBounds { 1, 2 }));
}

TEST(Executor, pathological_backtracking)
{
    auto program = nested_star_b();
    std::string haystack(5000, 'a');

    ExecuteOptions options = forced(Strategy::Backtrack);
    options.step_budget = 1000;
    auto backtracked = run(program, haystack, 0, MatchKind::LeftmostFirstCaptures, options);
    EXPECT_EQ(backtracked.type(), OutcomeType::MatchLimitExceeded);
    EXPECT_EQ(outcome_type_name(backtracked.type()), "MatchLimitExceeded");

    options.strategy = Strategy::PikeVM;
    auto simulated = run(program, haystack, 0, MatchKind::LeftmostFirstCaptures, options);
    EXPECT_EQ(simulated.type(), OutcomeType::NoMatch);
    EXPECT_FALSE(simulated.is_error());
}

TEST(Executor, start_anchor)
{
    auto program = anchored_literal(U"b", true, false);
    EXPECT_FALSE(bounds_of(program, "ab").has_value());
    EXPECT_EQ(bounds_of(program, "ab", 1), (MatchBounds { 1, 2 }));
    EXPECT_EQ(bounds_of(program, "bb"), (MatchBounds { 0, 1 }));
}

TEST(Executor, anchored_programs_only_match_at_the_anchor)
{
    auto program = anchored_literal(U"ab", true, false);
    for (std::string_view haystack : { "ab", "xab", "abab", "aab", "" }) {
        for (size_t start = 0; start <= haystack.size(); ++start) {
            for (auto strategy : { Strategy::PikeVM, Strategy::Backtrack }) {
                auto bounds = bounds_of(program, haystack, start, forced(strategy));
                if (bounds.has_value())
                    EXPECT_EQ(bounds->start, start) << haystack;
                EXPECT_EQ(bounds.has_value(), haystack.substr(start).starts_with("ab")) << haystack << " @" << start;
            }
        }
    }
}

TEST(Executor, end_anchor)
{
    auto program = anchored_literal(U"a", false, true);
    EXPECT_EQ(bounds_of(program, "aba"), (MatchBounds { 2, 3 }));
    EXPECT_EQ(bounds_of(program, "aba", 0, forced(Strategy::Backtrack)), (MatchBounds { 2, 3 }));
    EXPECT_FALSE(bounds_of(program, "ab").has_value());

    auto both = anchored_literal(U"ab", true, true);
    EXPECT_EQ(bounds_of(both, "ab"), (MatchBounds { 0, 2 }));
    EXPECT_FALSE(bounds_of(both, "abb").has_value());
}

TEST(Executor, required_prefix_skips_ahead)
{
    std::string_view haystack = "hello hello hello world";
    auto with_prefix = literal_program(U"world", "world");
    auto without_prefix = literal_program(U"world");

    auto fast = run(with_prefix, haystack, 0, MatchKind::LeftmostFirst);
    auto slow = run(without_prefix, haystack, 0, MatchKind::LeftmostFirst);
    EXPECT_EQ(fast.bounds(), (MatchBounds { 18, 23 }));
    EXPECT_EQ(slow.bounds(), fast.bounds());
    EXPECT_LT(fast.steps(), slow.steps());

    EXPECT_EQ(run(with_prefix, "hello", 0, MatchKind::LeftmostFirst).type(), OutcomeType::NoMatch);
}

TEST(Executor, anchored_prefix_fails_fast)
{
    auto program = anchored_literal(U"abc", true, false, "abc");
    auto outcome = run(program, "xabc", 0, MatchKind::LeftmostFirst);
    EXPECT_EQ(outcome.type(), OutcomeType::NoMatch);
    EXPECT_EQ(outcome.steps(), 0u);
}

TEST(Executor, start_offset)
{
    auto program = literal_program(U"ab");
    EXPECT_EQ(bounds_of(program, "abab", 1), (MatchBounds { 2, 4 }));
    EXPECT_FALSE(bounds_of(program, "abab", 3).has_value());

    ProgramBuilder builder;
    builder.append_match();
    auto empty = builder.build();
    EXPECT_EQ(bounds_of(empty, "abab", 4), (MatchBounds { 4, 4 }));
    EXPECT_EQ(bounds_of(empty, ""), (MatchBounds { 0, 0 }));
}

TEST(Executor, assertions)
{
    EXPECT_EQ(bounds_of(word_foo(), "a foo_bar foo."), (MatchBounds { 10, 13 }));
    EXPECT_EQ(bounds_of(single_assertion(AssertionType::StartLine, 'b'), "a\nb"), (MatchBounds { 2, 3 }));
    EXPECT_EQ(bounds_of(single_assertion(AssertionType::EndLine, 'a'), "a\nb"), (MatchBounds { 0, 1 }));
    EXPECT_FALSE(bounds_of(single_assertion(AssertionType::StartText, 'b'), "bb", 1).has_value());
    EXPECT_EQ(bounds_of(single_assertion(AssertionType::EndText, 'b'), "bab"), (MatchBounds { 2, 3 }));

    // Assertions look behind the start offset.
    EXPECT_FALSE(bounds_of(word_foo(), "xfoo", 1).has_value());
}

TEST(Executor, multi_byte_text)
{
    EXPECT_EQ(bounds_of(literal_program(U"é"), "caf\xC3\xA9"), (MatchBounds { 3, 5 }));

    ProgramBuilder builder;
    builder.append_any_char(1);
    builder.append_any_char(2);
    builder.append_match();
    builder.set_anchored_start(true);
    auto two_chars = builder.build();
    EXPECT_EQ(bounds_of(two_chars, "\xF0\x9F\x98\x80" "a"), (MatchBounds { 0, 5 }));
}

TEST(Executor, byte_mode)
{
    auto program = single_char(0xff, false, true, InputMode::Bytes);
    EXPECT_EQ(bounds_of(program, "\x01\xFF"), (MatchBounds { 1, 2 }));

    ExecuteOptions strict;
    strict.strict_utf8 = true;
    EXPECT_EQ(bounds_of(program, "\x01\xFF", 0, strict), (MatchBounds { 1, 2 }));
}

TEST(Executor, malformed_input_is_lenient_by_default)
{
    auto program = single_char(0xfffd);
    EXPECT_EQ(bounds_of(program, "a\xFF" "b"), (MatchBounds { 1, 2 }));
}

TEST(Executor, strict_mode_reports_malformed_input)
{
    ExecuteOptions options;
    options.strict_utf8 = true;

    auto outcome = run(single_char(0xfffd), "a\xFF" "b", 0, MatchKind::LeftmostFirst, options);
    EXPECT_EQ(outcome.type(), OutcomeType::MalformedInput);
    EXPECT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error_offset(), 1u);

    EXPECT_TRUE(run(single_char('b'), "a\xC3\xA9" "b", 0, MatchKind::Exists, options).is_match());
}

TEST(Executor, strategy_selection)
{
    auto program = a_b_star_c();
    ExecuteOptions options;

    EXPECT_EQ(choose_strategy(program, 100, 0, MatchKind::Exists, options), Strategy::PikeVM);
    EXPECT_EQ(choose_strategy(program, 100, 0, MatchKind::LeftmostFirst, options), Strategy::PikeVM);
    EXPECT_EQ(choose_strategy(program, 100, 0, MatchKind::LeftmostFirstCaptures, options), Strategy::Backtrack);

    options.backtrack_visited_limit = program.size() * 100;
    EXPECT_EQ(choose_strategy(program, 100, 0, MatchKind::LeftmostFirstCaptures, options), Strategy::PikeVM);
    EXPECT_EQ(choose_strategy(program, 100, 1, MatchKind::LeftmostFirstCaptures, options), Strategy::Backtrack);

    options.strategy = Strategy::Backtrack;
    EXPECT_EQ(choose_strategy(program, 1'000'000, 0, MatchKind::Exists, options), Strategy::Backtrack);

    EXPECT_EQ(strategy_name(Strategy::PikeVM), "PikeVM");
}

TEST(Executor, idempotent)
{
    auto program = alternation_captures();
    for (auto kind : { MatchKind::Exists, MatchKind::LeftmostFirst, MatchKind::LeftmostFirstCaptures }) {
        for (auto strategy : { Strategy::Auto, Strategy::PikeVM, Strategy::Backtrack }) {
            auto first = run(program, "xxabcdabcd", 0, kind, forced(strategy));
            auto second = run(program, "xxabcdabcd", 0, kind, forced(strategy));
            EXPECT_EQ(first, second) << match_kind_name(kind) << " " << strategy_name(strategy);
        }
    }
}

TEST(Executor, outcome_shapes)
{
    auto program = alternation_captures();

    auto exists = run(program, "abcd", 0, MatchKind::Exists);
    EXPECT_TRUE(exists.is_match());
    EXPECT_FALSE(exists.bounds().has_value());

    auto bounds = run(program, "abcd", 0, MatchKind::LeftmostFirst);
    EXPECT_EQ(bounds.bounds(), (MatchBounds { 0, 4 }));
    EXPECT_TRUE(bounds.slots().empty());

    auto captures = run(program, "abcd", 0, MatchKind::LeftmostFirstCaptures);
    ASSERT_EQ(captures.slots().size(), 8u);
    EXPECT_EQ(captures.slots()[4], 1u);
    EXPECT_EQ(captures.capture(2), (MatchBounds { 1, 4 }));

    auto no_match = run(program, "xyz", 0, MatchKind::LeftmostFirstCaptures);
    EXPECT_EQ(no_match.type(), OutcomeType::NoMatch);
    EXPECT_FALSE(no_match.is_error());
    EXPECT_FALSE(no_match.bounds().has_value());
}

struct ConformanceCase {
    char const* name;
    Program program;
    std::string haystack;
    size_t start_offset { 0 };
};

static std::vector<ConformanceCase> conformance_corpus()
{
    std::vector<ConformanceCase> corpus;
    auto add = [&](char const* name, Program program, std::string haystack, size_t start_offset = 0) {
        corpus.push_back({ name, std::move(program), std::move(haystack), start_offset });
    };

    add("ab*c", a_b_star_c(), "xaabbbcZ");
    add("ab*c/none", a_b_star_c(), "xaabbbZ");
    add("a+b*c", a_plus_b_star_c(), "xaabbbcZ");
    add("a+b*c/offset", a_plus_b_star_c(), "aacaac", 3);
    add("(a*)*b", nested_star_b(), "aab");
    add("(a*)*b/short", nested_star_b(), std::string(40, 'a'));
    add("(a*)*b/mid", nested_star_b(), "aaxaab");
    add("(a|ab)(c|bcd)(d*)", alternation_captures(), "abcd");
    add("(a|ab)(c|bcd)(d*)/later", alternation_captures(), "xxabcdd");
    add("(a|ab)(c|bcd)(d*)/none", alternation_captures(), "abd");
    add("(x)?(y)?", optional_groups(), "y");
    add("(x)?(y)?/xy", optional_groups(), "zxy");
    add("\\bfoo\\b", word_foo(), "a foo_bar foo.");
    add("\\bfoo\\b/unicode", word_foo(), "\xC3\xA9" "foo foo");
    add("^b", single_assertion(AssertionType::StartLine, 'b'), "ab\nb");
    add("a$", single_assertion(AssertionType::EndLine, 'a'), "ba\na");
    add("[A-Z]/i", upper_class(true), "123g");
    add("[A-Z]", upper_class(false), "123g");
    add("k/i", single_char('k', true), "x\xE2\x84\xAA");
    add(".*", dot_star(), "ab\ncd");
    add("a*?", lazy_a_star(), "aaa");
    add("world/prefix", literal_program(U"world", "world"), "hello world world");
    add("^ab$", anchored_literal(U"ab", true, true), "ab");
    add("ab$", anchored_literal(U"ab", false, true), "abxab");
    add("\\xff", single_char(0xff, false, true, InputMode::Bytes), "a\xFF");
    add("U+FFFD", single_char(0xfffd), "ab\xC0");
    return corpus;
}

TEST(Executor, strategies_agree_on_bounds)
{
    for (auto const& test : conformance_corpus()) {
        auto simulated = run(test.program, test.haystack, test.start_offset, MatchKind::LeftmostFirst, forced(Strategy::PikeVM));
        auto backtracked = run(test.program, test.haystack, test.start_offset, MatchKind::LeftmostFirst, forced(Strategy::Backtrack));
        EXPECT_EQ(simulated.type(), backtracked.type()) << test.name;
        EXPECT_EQ(simulated.bounds(), backtracked.bounds()) << test.name;
    }
}

TEST(Executor, strategies_agree_on_captures)
{
    for (auto const& test : conformance_corpus()) {
        auto simulated = run(test.program, test.haystack, test.start_offset, MatchKind::LeftmostFirstCaptures, forced(Strategy::PikeVM));
        auto backtracked = run(test.program, test.haystack, test.start_offset, MatchKind::LeftmostFirstCaptures, forced(Strategy::Backtrack));
        EXPECT_EQ(simulated.type(), backtracked.type()) << test.name;
        EXPECT_EQ(simulated.bounds(), backtracked.bounds()) << test.name;
        EXPECT_EQ(simulated.slots(), backtracked.slots()) << test.name;
    }
}

TEST(Executor, unmemoized_backtracker_agrees_on_captures)
{
    auto options = forced(Strategy::Backtrack);
    options.backtrack_visited_limit = 0;
    for (auto const& test : conformance_corpus()) {
        // Exponential without the memo.
        if (std::string_view { test.name } == "(a*)*b/short")
            continue;
        auto simulated = run(test.program, test.haystack, test.start_offset, MatchKind::LeftmostFirstCaptures, forced(Strategy::PikeVM));
        auto backtracked = run(test.program, test.haystack, test.start_offset, MatchKind::LeftmostFirstCaptures, options);
        EXPECT_EQ(simulated.type(), backtracked.type()) << test.name;
        EXPECT_EQ(simulated.bounds(), backtracked.bounds()) << test.name;
        EXPECT_EQ(simulated.slots(), backtracked.slots()) << test.name;
    }
}

TEST(Executor, strategies_agree_on_existence)
{
    for (auto const& test : conformance_corpus()) {
        auto simulated = run(test.program, test.haystack, test.start_offset, MatchKind::Exists, forced(Strategy::PikeVM));
        auto backtracked = run(test.program, test.haystack, test.start_offset, MatchKind::Exists, forced(Strategy::Backtrack));
        EXPECT_EQ(simulated.type(), backtracked.type()) << test.name;
        auto bounded = run(test.program, test.haystack, test.start_offset, MatchKind::LeftmostFirst);
        EXPECT_EQ(simulated.is_match(), bounded.is_match()) << test.name;
    }
}
