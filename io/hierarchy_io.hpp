#ifndef SMTREE__HIERARCHY_IO_HPP_
#define SMTREE__HIERARCHY_IO_HPP_

#include <string>
#include <vector>

#include "nn/HierarchyIndex.hpp"

namespace smt {

struct HierarchyConfig {
  int root_id = 1;
  Hierarchy hierarchy;
};

// Accepts either a bare mapping {"1": [2, 3], "2": [4, 5]} (root id 1) or
// {"root_id": 1, "hierarchy": {...}}. Throws HierarchyError(kMalformedEntry)
// on bad JSON, non-integer keys or children that are not integer arrays.
HierarchyConfig ParseHierarchyJson(const std::string& text);
HierarchyConfig LoadHierarchyJson(const std::string& path);

std::string HierarchyToJson(const HierarchyConfig& config, int indent = 2);
void SaveHierarchyJson(const HierarchyConfig& config, const std::string& path);

// Complete tree with `branching` children per parent and `depth` levels
// below the root. Ids are assigned breadth first starting at root_id.
Hierarchy MakeBalancedHierarchy(int branching, int depth, int root_id = 1);

// Children that have no children of their own, in ascending id order.
std::vector<int> LeafIds(const Hierarchy& hierarchy);

}  // namespace smt

#endif  // SMTREE__HIERARCHY_IO_HPP_
