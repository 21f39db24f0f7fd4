// File: include/tcr/core/model/reporter.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "tcr/core/config.hpp"
#include "tcr/core/events/event.hpp"
#include "tcr/core/events/line_sink.hpp"
#include "tcr/core/model/hierarchy_reconciler.hpp"
#include "tcr/core/model/source_tree.hpp"
#include "tcr/core/model/suggestion_store.hpp"
#include "tcr/core/protocol/encoder.hpp"
#include "tcr/core/status.hpp"

namespace tcr {

struct ReportStats {
  std::int64_t events = 0;
  std::int64_t lines = 0;
  std::int64_t cases = 0;
  std::int64_t failed_steps = 0;
  std::int64_t undefined_steps = 0;
};

// One reporting session: event in, service message lines out.
//
// Lifecycle: start(sink) -> handle(event)... -> stop(). stop() flushes and
// closes the sink and reports a failed flush. start() on a started session
// fails; after stop() a new start() begins from empty state.
// handle() is single-writer. A call that overlaps another in-flight call
// (another thread, or re-entry from inside the sink) is rejected with
// kFailedPrecondition and leaves the session untouched.
class Reporter {
 public:
  explicit Reporter(ProtocolConfig cfg);

  Reporter(const Reporter&) = delete;
  Reporter& operator=(const Reporter&) = delete;

  Status start(LineSink& sink);
  Status handle(const Event& e);
  Status stop();

  const ReportStats& stats() const { return stats_; }
  const HierarchyReconciler& reconciler() const { return reconciler_; }
  const SourceRegistry& sources() const { return sources_; }
  const SuggestionStore& suggestions() const { return suggestions_; }

 private:
  struct Dispatch;

  Status write_lines(const std::vector<std::string>& lines);
  Status dispatch(const Event& e);

  ProtocolEncoder encoder_;
  SourceRegistry sources_;
  SuggestionStore suggestions_;
  HierarchyReconciler reconciler_;

  LineSink* sink_{nullptr};
  std::atomic<bool> busy_{false};
  ReportStats stats_;
};

}  // namespace tcr
