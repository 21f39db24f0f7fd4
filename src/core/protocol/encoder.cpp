// File: src/core/protocol/encoder.cpp
#include "tcr/core/protocol/encoder.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>
#include <utility>

#include "tcr/core/protocol/service_message.hpp"
#include "tcr/core/protocol/timestamp.hpp"

namespace tcr {
namespace {

constexpr const char* kStepSkipped = "Step skipped";
constexpr const char* kStepPending = "Step pending";
constexpr const char* kStepUndefined = "Step undefined";
constexpr const char* kStepFailed = "Step failed";

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string hook_display_name(HookType type) {
  switch (type) {
    case HookType::kBefore: return "Before";
    case HookType::kAfter: return "After";
    case HookType::kBeforeStep: return "BeforeStep";
    case HookType::kAfterStep: return "AfterStep";
    default: return to_lower(hook_type_name(type));
  }
}

}  // namespace

ProtocolEncoder::ProtocolEncoder(ProtocolConfig cfg)
    : cfg_(std::move(cfg)), resolver_(cfg_.location_scheme) {}

std::string ProtocolEncoder::entered_the_matrix(TimestampNs t) const {
  return ServiceMessage("enteredTheMatrix").attr("timestamp", format_timestamp(t)).render(cfg_.prefix);
}

std::string ProtocolEncoder::run_started(TimestampNs t) const {
  return ServiceMessage("testSuiteStarted")
      .attr("timestamp", format_timestamp(t))
      .attr("name", cfg_.run_name)
      .render(cfg_.prefix);
}

std::string ProtocolEncoder::run_finished(TimestampNs t) const {
  return ServiceMessage("testSuiteFinished")
      .attr("timestamp", format_timestamp(t))
      .attr("name", cfg_.run_name)
      .render(cfg_.prefix);
}

std::string ProtocolEncoder::counting_started(TimestampNs t) const {
  return ServiceMessage("customProgressStatus")
      .attr("testsCategory", cfg_.progress_category)
      .attr("count", 0LL)
      .attr("timestamp", format_timestamp(t))
      .render(cfg_.prefix);
}

std::string ProtocolEncoder::counting_finished(TimestampNs t) const {
  return ServiceMessage("customProgressStatus")
      .attr("testsCategory", "")
      .attr("count", 0LL)
      .attr("timestamp", format_timestamp(t))
      .render(cfg_.prefix);
}

std::string ProtocolEncoder::case_progress_started(TimestampNs t) const {
  return ServiceMessage("customProgressStatus")
      .attr("type", "testStarted")
      .attr("timestamp", format_timestamp(t))
      .render(cfg_.prefix);
}

std::string ProtocolEncoder::case_progress_finished(TimestampNs t) const {
  return ServiceMessage("customProgressStatus")
      .attr("type", "testFinished")
      .attr("timestamp", format_timestamp(t))
      .render(cfg_.prefix);
}

std::string ProtocolEncoder::suite_name(const StructuralNode& node) {
  if (node.name) return *node.name;
  if (node.keyword) return *node.keyword;
  return "Unknown";
}

std::string ProtocolEncoder::suite_started(TimestampNs t, const StructuralNode& node) const {
  return ServiceMessage("testSuiteStarted")
      .attr("timestamp", format_timestamp(t))
      .attr("locationHint", node.uri + ":" + std::to_string(node.location.line))
      .attr("name", suite_name(node))
      .render(cfg_.prefix);
}

std::string ProtocolEncoder::suite_finished(TimestampNs t, const StructuralNode& node) const {
  return ServiceMessage("testSuiteFinished")
      .attr("timestamp", format_timestamp(t))
      .attr("name", suite_name(node))
      .render(cfg_.prefix);
}

std::string ProtocolEncoder::step_name(const TestStep& step) {
  return std::visit(
      [](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, PickleStep>) {
          return s.text;
        } else if constexpr (std::is_same_v<T, HookStep>) {
          return hook_display_name(s.hook_type);
        } else {
          return "Unknown step";
        }
      },
      step);
}

std::string ProtocolEncoder::step_location_hint(const TestStep& step) const {
  if (const auto* pickle = std::get_if<PickleStep>(&step)) {
    return pickle->uri + ":" + std::to_string(pickle->line);
  }
  return resolver_.resolve(code_location_of(step));
}

std::string ProtocolEncoder::step_started(TimestampNs t, const TestStep& step) const {
  return ServiceMessage("testStarted")
      .attr("timestamp", format_timestamp(t))
      .attr("locationHint", step_location_hint(step))
      .attr("captureStandardOutput", "true")
      .attr("name", step_name(step))
      .render(cfg_.prefix);
}

std::vector<std::string> ProtocolEncoder::step_finished(TimestampNs t,
                                                        const TestStep& step,
                                                        const StepResult& result,
                                                        const std::string& undefined_details) const {
  const std::string ts = format_timestamp(t);
  const long long duration = duration_millis(result.duration);
  const std::string name = step_name(step);
  const auto& error = result.error;

  auto failed = [&](const char* message, const std::string& details) {
    return ServiceMessage("testFailed")
        .attr("timestamp", ts)
        .attr("duration", duration)
        .attr("message", message)
        .attr("details", details)
        .attr("name", name)
        .render(cfg_.prefix);
  };

  std::vector<std::string> lines;
  switch (result.status) {
    case StepStatus::kSkipped: {
      const std::optional<std::string> message =
          error ? error->message : std::optional<std::string>(kStepSkipped);
      lines.push_back(ServiceMessage("testIgnored")
                          .attr("timestamp", ts)
                          .attr("duration", duration)
                          .attr("message", message)
                          .attr("name", name)
                          .render(cfg_.prefix));
      break;
    }
    case StepStatus::kPending:
      lines.push_back(failed(kStepPending, error ? error->message.value_or("") : ""));
      break;
    case StepStatus::kUndefined:
      lines.push_back(failed(kStepUndefined, undefined_details));
      break;
    case StepStatus::kAmbiguous:
    case StepStatus::kFailed:
      lines.push_back(failed(kStepFailed, error ? error->full_description() : ""));
      break;
    case StepStatus::kPassed:
      break;
  }

  lines.push_back(ServiceMessage("testFinished")
                      .attr("timestamp", ts)
                      .attr("duration", duration)
                      .attr("name", name)
                      .render(cfg_.prefix));
  return lines;
}

std::vector<std::string> ProtocolEncoder::fixture_failure(TimestampNs t, const ErrorInfo& error) const {
  const std::string ts = format_timestamp(t);
  const std::string& name = cfg_.fixture_failure_name;

  std::vector<std::string> lines;
  lines.push_back(ServiceMessage("testStarted").attr("timestamp", ts).attr("name", name).render(cfg_.prefix));
  lines.push_back(ServiceMessage("testFailed")
                      .attr("timestamp", ts)
                      .attr("message", name + " failed")
                      .attr("details", error.full_description())
                      .attr("name", name)
                      .render(cfg_.prefix));
  lines.push_back(ServiceMessage("testFinished").attr("timestamp", ts).attr("name", name).render(cfg_.prefix));
  return lines;
}

std::string ProtocolEncoder::embed(const EmbedEvent& e) const {
  const std::string label = e.name ? *e.name + " " : std::string();
  const std::string text = "Embed event: " + label + "[" + e.media_type + " " +
                           std::to_string(e.size_bytes) + " bytes]\n";
  return ServiceMessage("message").attr("text", text).attr("status", "NORMAL").render(cfg_.prefix);
}

std::string ProtocolEncoder::write(const WriteEvent& e) const {
  return ServiceMessage("message")
      .attr("text", "Write event:\n" + e.text + "\n")
      .attr("status", "NORMAL")
      .render(cfg_.prefix);
}

}  // namespace tcr
