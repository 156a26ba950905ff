#include <gtest/gtest.h>
#include "hierarchy_io.hpp"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace smt {
namespace testing {

HierarchyError::Kind ParseError(const std::string& text) {
  try {
    ParseHierarchyJson(text);
  } catch (const HierarchyError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected a HierarchyError for " << text;
  return HierarchyError::kNegativeId;
}

TEST(HierarchyIoTest, ParseBareMapping) {
  HierarchyConfig config = ParseHierarchyJson(R"({"1": [2, 3], "2": [4, 5]})");
  EXPECT_EQ(config.root_id, 1);
  ASSERT_EQ(config.hierarchy.size(), 2u);
  EXPECT_EQ(config.hierarchy.at(1), std::vector<int>({2, 3}));
  EXPECT_EQ(config.hierarchy.at(2), std::vector<int>({4, 5}));
}

TEST(HierarchyIoTest, ParseWithRoot) {
  HierarchyConfig config = ParseHierarchyJson(
      R"({"root_id": 10, "hierarchy": {"10": [11, 12], "12": [13, 14]}})");
  EXPECT_EQ(config.root_id, 10);
  EXPECT_EQ(config.hierarchy.at(12), std::vector<int>({13, 14}));

  // the result feeds straight into the index
  HierarchyIndex index = HierarchyIndex::Build(config.hierarchy,
                                               config.root_id);
  EXPECT_EQ(index.num_leaf_nodes(), 3);
}

TEST(HierarchyIoTest, MalformedInput) {
  EXPECT_EQ(ParseError("{1: [2]"), HierarchyError::kMalformedEntry);
  EXPECT_EQ(ParseError("[1, 2, 3]"), HierarchyError::kMalformedEntry);
  EXPECT_EQ(ParseError(R"({"one": [2, 3]})"), HierarchyError::kMalformedEntry);
  EXPECT_EQ(ParseError(R"({"1": 2})"), HierarchyError::kMalformedEntry);
  EXPECT_EQ(ParseError(R"({"1": [[2, 3]]})"), HierarchyError::kMalformedEntry);
  EXPECT_EQ(ParseError(R"({"1": [2.5]})"), HierarchyError::kMalformedEntry);
  EXPECT_EQ(ParseError(R"({"root_id": "1", "hierarchy": {"1": [2]}})"),
            HierarchyError::kMalformedEntry);
}

TEST(HierarchyIoTest, JsonRoundTrip) {
  HierarchyConfig config;
  config.root_id = 3;
  config.hierarchy = {{3, {4, 5}}, {5, {6, 7, 8}}};

  const HierarchyConfig parsed = ParseHierarchyJson(HierarchyToJson(config));
  EXPECT_EQ(parsed.root_id, 3);
  EXPECT_EQ(parsed.hierarchy, config.hierarchy);
}

TEST(HierarchyIoTest, SaveAndLoad) {
  HierarchyConfig config;
  config.hierarchy = MakeBalancedHierarchy(2, 2);
  const std::string path = ::testing::TempDir() + "hierarchy_io_test.json";
  SaveHierarchyJson(config, path);

  const HierarchyConfig loaded = LoadHierarchyJson(path);
  EXPECT_EQ(loaded.root_id, 1);
  EXPECT_EQ(loaded.hierarchy, config.hierarchy);
  std::remove(path.c_str());
}

TEST(HierarchyIoTest, LoadMissingFile) {
  EXPECT_THROW(LoadHierarchyJson(::testing::TempDir() + "no_such_file.json"),
               std::runtime_error);
}

TEST(BalancedHierarchyTest, BreadthFirstIds) {
  Hierarchy hierarchy = MakeBalancedHierarchy(3, 2);
  ASSERT_EQ(hierarchy.size(), 4u);
  EXPECT_EQ(hierarchy.at(1), std::vector<int>({2, 3, 4}));
  EXPECT_EQ(hierarchy.at(2), std::vector<int>({5, 6, 7}));
  EXPECT_EQ(hierarchy.at(4), std::vector<int>({11, 12, 13}));

  HierarchyIndex index = HierarchyIndex::Build(hierarchy, 1);
  EXPECT_EQ(index.num_leaf_nodes(), 9);
  EXPECT_EQ(index.max_depth(), 2);
}

TEST(BalancedHierarchyTest, CustomRoot) {
  Hierarchy hierarchy = MakeBalancedHierarchy(2, 1, 7);
  ASSERT_EQ(hierarchy.size(), 1u);
  EXPECT_EQ(hierarchy.at(7), std::vector<int>({8, 9}));
}

TEST(LeafIdsTest, SortedLeaves) {
  Hierarchy hierarchy = {{1, {3, 2, 4}}, {3, {9, 5}}};
  EXPECT_EQ(LeafIds(hierarchy), std::vector<int>({2, 4, 5, 9}));
}

TEST(BalancedHierarchyDeathTest, NonPositiveArguments) {
  EXPECT_DEATH(MakeBalancedHierarchy(0, 2), "");
  EXPECT_DEATH(MakeBalancedHierarchy(2, 0), "");
}

}  // namespace testing
}  // namespace smt
