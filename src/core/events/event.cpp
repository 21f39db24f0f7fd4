// File: src/core/events/event.cpp
#include "tcr/core/events/event.hpp"

namespace tcr {
namespace {

struct TypeName {
  const char* operator()(const TestRunStarted&) const { return "test_run_started"; }
  const char* operator()(const TestSourceParsed&) const { return "test_source_parsed"; }
  const char* operator()(const TestCaseStarted&) const { return "test_case_started"; }
  const char* operator()(const TestStepStarted&) const { return "test_step_started"; }
  const char* operator()(const TestStepFinished&) const { return "test_step_finished"; }
  const char* operator()(const TestCaseFinished&) const { return "test_case_finished"; }
  const char* operator()(const TestRunFinished&) const { return "test_run_finished"; }
  const char* operator()(const SnippetsSuggested&) const { return "snippets_suggested"; }
  const char* operator()(const EmbedEvent&) const { return "embed"; }
  const char* operator()(const WriteEvent&) const { return "write"; }
};

}  // namespace

const char* event_type_name(const Event& e) { return std::visit(TypeName{}, e); }

TimestampNs event_timestamp(const Event& e) {
  return std::visit([](const auto& ev) { return ev.timestamp; }, e);
}

}  // namespace tcr
