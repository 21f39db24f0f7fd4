// File: src/core/model/suggestion_store.cpp
#include "tcr/core/model/suggestion_store.hpp"

#include <algorithm>
#include <sstream>

namespace tcr {

void SuggestionStore::add(const SnippetsSuggested& e) {
  records_.push_back(SuggestionRecord{e.uri, e.test_case_location, e.suggestion});
}

std::vector<Suggestion> SuggestionStore::for_test_case(const std::string& uri, const Location& location) const {
  std::vector<Suggestion> out;
  for (const auto& r : records_) {
    if (r.uri == uri && r.test_case_location == location) out.push_back(r.suggestion);
  }
  return out;
}

std::string SuggestionStore::undefined_step_details(const std::string& uri, const Location& location) const {
  const std::vector<Suggestion> suggestions = for_test_case(uri, location);
  if (suggestions.empty()) return std::string();

  std::ostringstream ss;
  ss << "You can implement this step";
  if (suggestions.size() > 1) {
    ss << " and " << (suggestions.size() - 1) << " other step(s)";
  }
  ss << " using the snippet(s) below:\n\n";

  // Distinct snippets, first occurrence wins.
  std::vector<std::string> seen;
  for (const auto& s : suggestions) {
    for (const auto& snippet : s.snippets) {
      if (std::find(seen.begin(), seen.end(), snippet) != seen.end()) continue;
      seen.push_back(snippet);
    }
  }
  for (std::size_t i = 0; i < seen.size(); ++i) {
    if (i > 0) ss << "\n";
    ss << seen[i];
  }
  ss << "\n";
  return ss.str();
}

}  // namespace tcr
