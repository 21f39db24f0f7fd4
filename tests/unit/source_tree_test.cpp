#include <gtest/gtest.h>

#include "tcr/core/model/source_tree.hpp"
#include "unit/test_support.hpp"

using namespace tcr;
using tcr::test_support::node;
using tcr::test_support::tree;

namespace {

const std::string kUri = "file:features/belly.feature";

// Feature(1)
//   Rule(3)
//     Scenario(5)
//     Scenario(9)
//   Scenario Outline(12)
//     Examples(16)
//       example row(18)
SourceNode belly() {
  return tree(node(kUri, 1, "Feature", "Belly"),
              {tree(node(kUri, 3, "Rule", "Hunger"),
                    {tree(node(kUri, 5, "Scenario", "a few cukes")), tree(node(kUri, 9, "Scenario", "many cukes"))}),
               tree(node(kUri, 12, "Scenario Outline", "eating"),
                    {tree(node(kUri, 16, "Examples", std::nullopt), {tree(node(kUri, 18, std::nullopt, std::nullopt))})})});
}

NodePredicate at_line(std::int64_t line) {
  return [line](const StructuralNode& n) { return n.location.line == line; };
}

}  // namespace

TEST(FindPath, RootMatch) {
  const auto path = find_path(belly(), at_line(1));
  ASSERT_TRUE(path.has_value());
  ASSERT_EQ(path->size(), 1u);
  EXPECT_EQ(path->front().name, "Belly");
}

TEST(FindPath, NestedMatchIncludesAncestors) {
  const auto path = find_path(belly(), at_line(9));
  ASSERT_TRUE(path.has_value());
  ASSERT_EQ(path->size(), 3u);
  EXPECT_EQ((*path)[0].name, "Belly");
  EXPECT_EQ((*path)[1].name, "Hunger");
  EXPECT_EQ((*path)[2].name, "many cukes");
}

TEST(FindPath, DeepExampleRow) {
  const auto path = find_path(belly(), at_line(18));
  ASSERT_TRUE(path.has_value());
  ASSERT_EQ(path->size(), 4u);
  EXPECT_EQ((*path)[2].keyword, "Examples");
  EXPECT_FALSE((*path)[3].name.has_value());
}

TEST(FindPath, NoMatch) { EXPECT_FALSE(find_path(belly(), at_line(99)).has_value()); }

TEST(SourceRegistry, FindsByUriAndLocation) {
  SourceRegistry reg;
  reg.register_source(kUri, {belly()});
  const auto path = reg.find_path(kUri, Location{5, 1});
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->size(), 3u);
}

TEST(SourceRegistry, ColumnParticipatesInMatch) {
  SourceRegistry reg;
  reg.register_source(kUri, {belly()});
  EXPECT_FALSE(reg.find_path(kUri, Location{5, 3}).has_value());
}

TEST(SourceRegistry, UnknownUriYieldsNothing) {
  SourceRegistry reg;
  reg.register_source(kUri, {belly()});
  EXPECT_FALSE(reg.find_path("file:other.feature", Location{5, 1}).has_value());
}

TEST(SourceRegistry, ReRegisterReplaces) {
  SourceRegistry reg;
  reg.register_source(kUri, {belly()});
  reg.register_source(kUri, {tree(node(kUri, 1, "Feature", "Replaced"))});
  EXPECT_EQ(reg.size(), 1u);
  EXPECT_FALSE(reg.find_path(kUri, Location{5, 1}).has_value());
  const auto path = reg.find_path(kUri, Location{1, 1});
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->front().name, "Replaced");
}

TEST(SourceRegistry, LookupFunctionDelegates) {
  SourceRegistry reg;
  reg.register_source(kUri, {belly()});
  const PathLookup lookup = reg.lookup();
  const auto path = lookup(kUri, Location{12, 1});
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(path->back().name, "eating");
}
