// File: src/core/model/hierarchy_reconciler.cpp
#include "tcr/core/model/hierarchy_reconciler.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace tcr {

std::size_t common_prefix_length(const Path& a, const Path& b) {
  const std::size_t n = std::min(a.size(), b.size());
  std::size_t i = 0;
  while (i < n && a[i] == b[i]) ++i;
  return i;
}

PathTransition diff_paths(const Path& current, const Path& next) {
  const std::size_t k = common_prefix_length(current, next);

  PathTransition out;
  out.closing.assign(current.rbegin(), current.rend() - static_cast<std::ptrdiff_t>(k));
  out.opening.assign(next.begin() + static_cast<std::ptrdiff_t>(k), next.end());
  return out;
}

HierarchyReconciler::HierarchyReconciler(const ProtocolEncoder& encoder, PathLookup lookup)
    : encoder_(encoder), lookup_(std::move(lookup)) {}

void HierarchyReconciler::close_nodes(const Path& closing, TimestampNs t, std::vector<std::string>& out) const {
  for (const auto& node : closing) {
    out.push_back(encoder_.suite_finished(t, node));
  }
}

std::vector<std::string> HierarchyReconciler::on_run_started(TimestampNs t) {
  return {
      encoder_.entered_the_matrix(t),
      encoder_.run_started(t),
      encoder_.counting_started(t),
  };
}

std::vector<std::string> HierarchyReconciler::on_case_started(const TestCase& test_case, TimestampNs t) {
  // No match means flat reporting for this case.
  Path next;
  if (lookup_) {
    if (auto found = lookup_(test_case.uri, test_case.location)) next = std::move(*found);
  }

  const PathTransition transition = diff_paths(current_path_, next);

  std::vector<std::string> out;
  close_nodes(transition.closing, t, out);
  for (const auto& node : transition.opening) {
    out.push_back(encoder_.suite_started(t, node));
  }

  current_path_ = std::move(next);
  active_case_ = test_case;

  out.push_back(encoder_.case_progress_started(t));
  return out;
}

std::vector<std::string> HierarchyReconciler::on_case_finished(TimestampNs t) {
  std::vector<std::string> out;
  out.push_back(encoder_.case_progress_finished(t));

  if (!current_path_.empty()) {
    out.push_back(encoder_.suite_finished(t, current_path_.back()));
    current_path_.pop_back();
  }
  active_case_.reset();
  return out;
}

std::vector<std::string> HierarchyReconciler::on_run_finished(const std::optional<ErrorInfo>& error, TimestampNs t) {
  std::vector<std::string> out;
  out.push_back(encoder_.counting_finished(t));

  close_nodes(diff_paths(current_path_, Path{}).closing, t, out);
  current_path_.clear();
  active_case_.reset();

  if (error) {
    auto fixture = encoder_.fixture_failure(t, *error);
    out.insert(out.end(), fixture.begin(), fixture.end());
  }

  out.push_back(encoder_.run_finished(t));
  return out;
}

void HierarchyReconciler::reset() {
  current_path_.clear();
  active_case_.reset();
}

}  // namespace tcr
