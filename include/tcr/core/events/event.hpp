// File: include/tcr/core/events/event.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "tcr/core/types.hpp"

namespace tcr {

// Events arrive one at a time, strictly ordered, each exactly once.
// Every payload carries its own wall-clock timestamp.

struct TestRunStarted {
  TimestampNs timestamp;
};

struct TestSourceParsed {
  TimestampNs timestamp;
  std::string uri;
  std::vector<SourceNode> nodes;
};

struct TestCaseStarted {
  TimestampNs timestamp;
  TestCase test_case;
};

// Step and case-finished events belong to the most recently started case.
struct TestStepStarted {
  TimestampNs timestamp;
  TestStep step;
};

struct TestStepFinished {
  TimestampNs timestamp;
  TestStep step;
  StepResult result;
};

struct TestCaseFinished {
  TimestampNs timestamp;
};

struct TestRunFinished {
  TimestampNs timestamp;
  std::optional<ErrorInfo> error;  // aggregate before-all / after-all failure
};

struct Suggestion {
  std::string step_text;
  std::vector<std::string> snippets;
};

struct SnippetsSuggested {
  TimestampNs timestamp;
  std::string uri;
  Location test_case_location;
  Suggestion suggestion;
};

struct EmbedEvent {
  TimestampNs timestamp;
  std::optional<std::string> name;
  std::string media_type;
  std::size_t size_bytes = 0;
};

struct WriteEvent {
  TimestampNs timestamp;
  std::string text;
};

using Event = std::variant<TestRunStarted,
                           TestSourceParsed,
                           TestCaseStarted,
                           TestStepStarted,
                           TestStepFinished,
                           TestCaseFinished,
                           TestRunFinished,
                           SnippetsSuggested,
                           EmbedEvent,
                           WriteEvent>;

// Stable snake_case tag, matches the event script "type" field.
const char* event_type_name(const Event& e);

TimestampNs event_timestamp(const Event& e);

}  // namespace tcr
