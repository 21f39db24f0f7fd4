#include <gtest/gtest.h>

#include "tcr/core/model/suggestion_store.hpp"

using namespace tcr;

namespace {

SnippetsSuggested suggested(const std::string& uri, std::int64_t line, std::string step,
                            std::vector<std::string> snippets) {
  SnippetsSuggested e;
  e.uri = uri;
  e.test_case_location = Location{line, 1};
  e.suggestion = Suggestion{std::move(step), std::move(snippets)};
  return e;
}

}  // namespace

TEST(SuggestionStore, EmptyWhenNothingRecorded) {
  SuggestionStore store;
  EXPECT_EQ(store.undefined_step_details("file:a.feature", Location{3, 1}), "");
}

TEST(SuggestionStore, SingleSuggestion) {
  SuggestionStore store;
  store.add(suggested("file:a.feature", 3, "I eat 5 cukes", {"@Given(\"I eat {int} cukes\")"}));

  EXPECT_EQ(store.undefined_step_details("file:a.feature", Location{3, 1}),
            "You can implement this step using the snippet(s) below:\n\n"
            "@Given(\"I eat {int} cukes\")\n");
}

TEST(SuggestionStore, SeveralSuggestionsDeduplicateSnippets) {
  SuggestionStore store;
  store.add(suggested("file:a.feature", 3, "step one", {"snippet A", "snippet B"}));
  store.add(suggested("file:a.feature", 3, "step two", {"snippet B", "snippet C"}));

  EXPECT_EQ(store.undefined_step_details("file:a.feature", Location{3, 1}),
            "You can implement this step and 1 other step(s) using the snippet(s) below:\n\n"
            "snippet A\nsnippet B\nsnippet C\n");
}

TEST(SuggestionStore, KeyedByUriAndLocation) {
  SuggestionStore store;
  store.add(suggested("file:a.feature", 3, "s", {"A"}));
  store.add(suggested("file:a.feature", 7, "s", {"B"}));
  store.add(suggested("file:b.feature", 3, "s", {"C"}));

  EXPECT_EQ(store.size(), 3u);
  const auto for_case = store.for_test_case("file:a.feature", Location{3, 1});
  ASSERT_EQ(for_case.size(), 1u);
  EXPECT_EQ(for_case[0].snippets, std::vector<std::string>{"A"});
}
