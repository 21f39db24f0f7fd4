#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

#include "tcr/core/protocol/service_message.hpp"

using namespace tcr;

namespace {

// Reads escape pairs left to right, so "||n" decodes to "|n", not "|\n".
std::string unescape(const std::string& s) {
  std::string out;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '|' || i + 1 == s.size()) {
      out += s[i];
      continue;
    }
    const char n = s[++i];
    if (n == 'n') out += '\n';
    else if (n == 'r') out += '\r';
    else out += n;
  }
  return out;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

}  // namespace

// =============================================================================
// escape_value
// =============================================================================
TEST(EscapeValue, Pipe) { EXPECT_EQ(escape_value(std::string_view("a|b")), "a||b"); }

TEST(EscapeValue, Apostrophe) { EXPECT_EQ(escape_value(std::string_view("it's")), "it|'s"); }

TEST(EscapeValue, Brackets) { EXPECT_EQ(escape_value(std::string_view("[x]")), "|[x|]"); }

TEST(EscapeValue, LineBreaks) { EXPECT_EQ(escape_value(std::string_view("a\nb\r\n")), "a|nb|r|n"); }

TEST(EscapeValue, PipeIsNotEscapedTwice) {
  // Escaping the apostrophe introduces a '|' that must stay single.
  EXPECT_EQ(escape_value(std::string_view("a|'b")), "a|||'b");
}

TEST(EscapeValue, PlainTextUnchanged) { EXPECT_EQ(escape_value(std::string_view("Given I have 42 cukes")), "Given I have 42 cukes"); }

TEST(EscapeValue, AbsentRendersEmpty) { EXPECT_EQ(escape_value(std::optional<std::string>()), ""); }

TEST(EscapeValue, HazardCharactersRoundTrip) {
  const std::string original = "|'\n\r[]x||'' [[\r\n]] |n";
  EXPECT_EQ(unescape(escape_value(std::string_view(original))), original);
}

TEST(EscapeValue, MatchesOrderedReplacement) {
  const std::string input = "x|y'z\n\r[a]|'|[]\n|";
  std::string expected = input;
  expected = replace_all(expected, "|", "||");
  expected = replace_all(expected, "'", "|'");
  expected = replace_all(expected, "\n", "|n");
  expected = replace_all(expected, "\r", "|r");
  expected = replace_all(expected, "[", "|[");
  expected = replace_all(expected, "]", "|]");
  EXPECT_EQ(escape_value(std::string_view(input)), expected);
}

// =============================================================================
// ServiceMessage
// =============================================================================
TEST(ServiceMessage, RendersAttributesInOrder) {
  const std::string line = ServiceMessage("testStarted")
                               .attr("timestamp", "t")
                               .attr("locationHint", "file:a.feature:3")
                               .attr("name", "x")
                               .render("teamcity");
  EXPECT_EQ(line, "##teamcity[testStarted timestamp='t' locationHint='file:a.feature:3' name='x']");
}

TEST(ServiceMessage, EscapesEveryValue) {
  const std::string line = ServiceMessage("message").attr("text", "it's [done]\n").render("teamcity");
  EXPECT_EQ(line, "##teamcity[message text='it|'s |[done|]|n']");
}

TEST(ServiceMessage, IntegerAttribute) {
  EXPECT_EQ(ServiceMessage("testFinished").attr("duration", 12LL).render("tc"), "##tc[testFinished duration='12']");
}

TEST(ServiceMessage, AbsentAttributeIsEmpty) {
  EXPECT_EQ(ServiceMessage("testIgnored").attr("message", std::optional<std::string>()).render("teamcity"),
            "##teamcity[testIgnored message='']");
}

TEST(ServiceMessage, NoAttributes) { EXPECT_EQ(ServiceMessage("x").render("teamcity"), "##teamcity[x]"); }
