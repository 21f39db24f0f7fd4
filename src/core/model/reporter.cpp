// File: src/core/model/reporter.cpp
#include "tcr/core/model/reporter.hpp"

#include <utility>

namespace tcr {

// One overload per event alternative. Hierarchy-affecting events go through
// the reconciler; step and attachment events go straight to the encoder.
struct Reporter::Dispatch {
  Reporter& r;

  Status operator()(const TestRunStarted& e) const {
    return r.write_lines(r.reconciler_.on_run_started(e.timestamp));
  }

  Status operator()(const TestSourceParsed& e) const {
    r.sources_.register_source(e.uri, e.nodes);
    return Status::ok_status();
  }

  Status operator()(const TestCaseStarted& e) const {
    ++r.stats_.cases;
    return r.write_lines(r.reconciler_.on_case_started(e.test_case, e.timestamp));
  }

  Status operator()(const TestStepStarted& e) const {
    return r.write_lines({r.encoder_.step_started(e.timestamp, e.step)});
  }

  Status operator()(const TestStepFinished& e) const {
    std::string undefined_details;
    switch (e.result.status) {
      case StepStatus::kUndefined:
        ++r.stats_.undefined_steps;
        // Suggestions are keyed by the case the reconciler considers active.
        if (const auto& active = r.reconciler_.active_case()) {
          undefined_details = r.suggestions_.undefined_step_details(active->uri, active->location);
        }
        break;
      case StepStatus::kAmbiguous:
      case StepStatus::kFailed:
        ++r.stats_.failed_steps;
        break;
      default:
        break;
    }
    return r.write_lines(r.encoder_.step_finished(e.timestamp, e.step, e.result, undefined_details));
  }

  Status operator()(const TestCaseFinished& e) const {
    return r.write_lines(r.reconciler_.on_case_finished(e.timestamp));
  }

  Status operator()(const TestRunFinished& e) const {
    return r.write_lines(r.reconciler_.on_run_finished(e.error, e.timestamp));
  }

  Status operator()(const SnippetsSuggested& e) const {
    r.suggestions_.add(e);
    return Status::ok_status();
  }

  Status operator()(const EmbedEvent& e) const { return r.write_lines({r.encoder_.embed(e)}); }

  Status operator()(const WriteEvent& e) const { return r.write_lines({r.encoder_.write(e)}); }
};

Reporter::Reporter(ProtocolConfig cfg)
    : encoder_(std::move(cfg)), reconciler_(encoder_, sources_.lookup()) {}

Status Reporter::start(LineSink& sink) {
  if (sink_ != nullptr) return Status::failed_precondition("Reporter::start: session already started");
  TCR_RETURN_IF_ERROR(sink.open());
  sink_ = &sink;

  sources_ = SourceRegistry{};
  suggestions_ = SuggestionStore{};
  reconciler_.reset();
  stats_ = ReportStats{};
  return Status::ok_status();
}

Status Reporter::handle(const Event& e) {
  if (busy_.exchange(true, std::memory_order_acquire)) {
    return Status::failed_precondition(std::string("Reporter::handle: concurrent call rejected (") +
                                       event_type_name(e) + ")");
  }

  struct Release {
    std::atomic<bool>& flag;
    ~Release() { flag.store(false, std::memory_order_release); }
  } release{busy_};

  if (sink_ == nullptr) return Status::failed_precondition("Reporter::handle called before start");

  ++stats_.events;
  return dispatch(e);
}

Status Reporter::dispatch(const Event& e) { return std::visit(Dispatch{*this}, e); }

Status Reporter::write_lines(const std::vector<std::string>& lines) {
  for (const auto& line : lines) {
    TCR_RETURN_IF_ERROR(sink_->write_line(line));
    ++stats_.lines;
  }
  return Status::ok_status();
}

Status Reporter::stop() {
  if (sink_ == nullptr) return Status::ok_status();
  const Status flushed = sink_->flush();
  sink_->close();
  sink_ = nullptr;
  return flushed;
}

}  // namespace tcr
