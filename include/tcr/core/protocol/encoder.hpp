// File: include/tcr/core/protocol/encoder.hpp
#pragma once

#include <string>
#include <vector>

#include "tcr/core/config.hpp"
#include "tcr/core/events/event.hpp"
#include "tcr/core/protocol/code_location.hpp"
#include "tcr/core/types.hpp"

namespace tcr {

// Pure translation from one event (or one reconciler decision) to escaped
// service message lines. Holds no session state.
class ProtocolEncoder {
 public:
  explicit ProtocolEncoder(ProtocolConfig cfg);

  const ProtocolConfig& config() const { return cfg_; }

  // Run boundaries and progress counters.
  std::string entered_the_matrix(TimestampNs t) const;
  std::string run_started(TimestampNs t) const;
  std::string run_finished(TimestampNs t) const;
  std::string counting_started(TimestampNs t) const;
  std::string counting_finished(TimestampNs t) const;
  std::string case_progress_started(TimestampNs t) const;
  std::string case_progress_finished(TimestampNs t) const;

  // Suites. The location hint is only sent on open.
  std::string suite_started(TimestampNs t, const StructuralNode& node) const;
  std::string suite_finished(TimestampNs t, const StructuralNode& node) const;

  std::string step_started(TimestampNs t, const TestStep& step) const;

  // Status-specific precursor (none for PASSED) followed by testFinished.
  // `undefined_details` is only used for UNDEFINED.
  std::vector<std::string> step_finished(TimestampNs t,
                                         const TestStep& step,
                                         const StepResult& result,
                                         const std::string& undefined_details) const;

  // Placeholder test carrying a before-all/after-all failure.
  std::vector<std::string> fixture_failure(TimestampNs t, const ErrorInfo& error) const;

  std::string embed(const EmbedEvent& e) const;
  std::string write(const WriteEvent& e) const;

  static std::string suite_name(const StructuralNode& node);
  static std::string step_name(const TestStep& step);
  std::string step_location_hint(const TestStep& step) const;

 private:
  ProtocolConfig cfg_;
  CodeLocationResolver resolver_;
};

}  // namespace tcr
