/*
 * Copyright (c) 2026, the Ladybird developers.
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <LibRegexVM/Export.h>
#include <cstddef>
#include <cstdint>

namespace regexvm {

using u8 = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

enum class AssertionType : u8;
enum class InputMode : u8;
enum class MatchKind : u8;
enum class OpCodeId : u8;
enum class OutcomeType : u8;
enum class StepState : u8;
enum class Strategy : u8;

struct CharRange;
struct ExecuteOptions;
struct Instruction;
struct MatchBounds;
struct StartCandidates;

class Backtracker;
class CharReader;
class Outcome;
class PikeVM;
class Program;
class ProgramBuilder;
class ProgramDebug;
class ThreadList;

}
