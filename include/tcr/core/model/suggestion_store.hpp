// File: include/tcr/core/model/suggestion_store.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "tcr/core/events/event.hpp"
#include "tcr/core/types.hpp"

namespace tcr {

struct SuggestionRecord {
  std::string uri;
  Location test_case_location;
  Suggestion suggestion;
};

// Append-only for the lifetime of a reporting session.
class SuggestionStore {
 public:
  void add(const SnippetsSuggested& e);

  [[nodiscard]] std::size_t size() const { return records_.size(); }

  std::vector<Suggestion> for_test_case(const std::string& uri, const Location& location) const;

  // Details text for an undefined step; empty when nothing was suggested.
  std::string undefined_step_details(const std::string& uri, const Location& location) const;

 private:
  std::vector<SuggestionRecord> records_;
};

}  // namespace tcr
