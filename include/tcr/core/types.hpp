// include/tcr/core/types.hpp
#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tcr {

// -----------------------------
// Time
// -----------------------------
// Integer nanoseconds keep replays deterministic.
// TimestampNs is always epoch-based (UTC); durations are plain counts.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
};

using DurationNs = std::int64_t;

// Largest magnitude in milliseconds that converts to nanoseconds without overflow.
constexpr std::int64_t kMaxMillis = std::numeric_limits<std::int64_t>::max() / 1'000'000;

constexpr TimestampNs from_epoch_ms(std::int64_t ms) { return TimestampNs{ms * 1'000'000}; }
constexpr DurationNs ms_to_ns(std::int64_t ms) { return ms * 1'000'000; }

// -----------------------------
// Source coordinates / structural tree
// -----------------------------

struct Location {
  std::int64_t line = 0;
  std::int64_t column = 0;

  bool operator==(const Location&) const = default;
};

// One node of a parsed source document (feature, rule, examples, scenario...).
// Equality covers coordinates and content: two nodes with identical text at
// different places are different nodes.
struct StructuralNode {
  std::string uri;
  Location location;
  std::optional<std::string> keyword;
  std::optional<std::string> name;

  bool operator==(const StructuralNode&) const = default;
};

struct SourceNode {
  StructuralNode node;
  std::vector<SourceNode> children;
};

// Root first, leaf last.
using Path = std::vector<StructuralNode>;

// -----------------------------
// Test cases / steps / results
// -----------------------------

struct TestCase {
  std::string uri;
  Location location;
  std::string name;

  bool operator==(const TestCase&) const = default;
};

enum class HookType {
  kBefore,
  kAfter,
  kBeforeStep,
  kAfterStep,
  kBeforeAll,
  kAfterAll,
};

// Upper-case enumerator name ("BEFORE_STEP").
const char* hook_type_name(HookType type);

struct PickleStep {
  std::string uri;
  std::int64_t line = 0;
  std::string text;
  std::string code_location;
};

struct HookStep {
  HookType hook_type = HookType::kBefore;
  std::string code_location;
};

// A step that is neither a pickle step nor a hook.
struct GenericStep {
  std::string code_location;
};

using TestStep = std::variant<PickleStep, HookStep, GenericStep>;

const std::string& code_location_of(const TestStep& step);

enum class StepStatus {
  kPassed,
  kSkipped,
  kPending,
  kUndefined,
  kAmbiguous,
  kFailed,
};

struct ErrorInfo {
  std::string type;                    // e.g. "AssertionError"
  std::optional<std::string> message;
  std::vector<std::string> stack_trace;

  // "<type>: <message>" then one "\tat <frame>" line per frame.
  [[nodiscard]] std::string full_description() const;
};

struct StepResult {
  StepStatus status = StepStatus::kPassed;
  DurationNs duration = 0;
  std::optional<ErrorInfo> error;
};

}  // namespace tcr
