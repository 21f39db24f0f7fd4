// File: include/tcr/core/model/hierarchy_reconciler.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "tcr/core/model/source_tree.hpp"
#include "tcr/core/protocol/encoder.hpp"
#include "tcr/core/types.hpp"

namespace tcr {

// Number of leading nodes shared by `a` and `b`; stops at the first mismatch.
std::size_t common_prefix_length(const Path& a, const Path& b);

struct PathTransition {
  Path closing;  // innermost first
  Path opening;  // outermost first
};

// Minimal close/open sequence taking `current` to `next`.
PathTransition diff_paths(const Path& current, const Path& next);

// Owns the currently open suite path and the active test case for one session.
//
// Suite markers it emits always nest: a suite is only finished after every
// suite opened inside it, and `current_path()` is exactly the set of suites
// started but not yet finished. Ancestors of a finished case stay open so a
// sibling case can reuse them; the next case start (or the run end) closes
// whatever is no longer shared.
//
// Not thread-safe. One caller drives it in event order.
class HierarchyReconciler {
 public:
  HierarchyReconciler(const ProtocolEncoder& encoder, PathLookup lookup);

  std::vector<std::string> on_run_started(TimestampNs t);
  std::vector<std::string> on_case_started(const TestCase& test_case, TimestampNs t);
  std::vector<std::string> on_case_finished(TimestampNs t);
  std::vector<std::string> on_run_finished(const std::optional<ErrorInfo>& error, TimestampNs t);

  // Forgets open suites and the active case without emitting anything.
  void reset();

  const Path& current_path() const { return current_path_; }
  const std::optional<TestCase>& active_case() const { return active_case_; }

 private:
  void close_nodes(const Path& closing, TimestampNs t, std::vector<std::string>& out) const;

  const ProtocolEncoder& encoder_;
  PathLookup lookup_;

  Path current_path_;
  std::optional<TestCase> active_case_;
};

}  // namespace tcr
