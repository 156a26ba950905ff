#include "hierarchy_io.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "absl/log/check.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

using json = nlohmann::json;

namespace smt {

namespace {

HierarchyError Malformed(const std::string& what) {
  return HierarchyError(HierarchyError::kMalformedEntry, what);
}

Hierarchy ParseMapping(const json& mapping) {
  if (!mapping.is_object()) {
    throw Malformed("hierarchy must be a JSON object");
  }
  Hierarchy hierarchy;
  for (auto it = mapping.begin(); it != mapping.end(); ++it) {
    int parent_id;
    if (!absl::SimpleAtoi(it.key(), &parent_id)) {
      throw Malformed(absl::StrCat("parent id is not an integer: ", it.key()));
    }
    const json& children = it.value();
    if (!children.is_array()) {
      throw Malformed(absl::StrCat("children of ", parent_id,
                                   " must be a one-dimensional array"));
    }
    std::vector<int>& ids = hierarchy[parent_id];
    for (const json& child : children) {
      if (!child.is_number_integer()) {
        throw Malformed(absl::StrCat("children of ", parent_id,
                                     " must be integer ids, got ",
                                     child.dump()));
      }
      ids.push_back(child.get<int>());
    }
  }
  return hierarchy;
}

}  // namespace

HierarchyConfig ParseHierarchyJson(const std::string& text) {
  json document = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (document.is_discarded()) {
    throw Malformed("hierarchy is not valid JSON");
  }
  HierarchyConfig config;
  if (document.is_object() && document.contains("hierarchy")) {
    if (document.contains("root_id")) {
      if (!document["root_id"].is_number_integer()) {
        throw Malformed("root_id must be an integer");
      }
      config.root_id = document["root_id"].get<int>();
    }
    config.hierarchy = ParseMapping(document["hierarchy"]);
  } else {
    config.hierarchy = ParseMapping(document);
  }
  return config;
}

HierarchyConfig LoadHierarchyJson(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open hierarchy file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ParseHierarchyJson(buffer.str());
}

std::string HierarchyToJson(const HierarchyConfig& config, int indent) {
  json mapping = json::object();
  for (const auto& entry : config.hierarchy) {
    mapping[std::to_string(entry.first)] = entry.second;
  }
  json document;
  document["root_id"] = config.root_id;
  document["hierarchy"] = mapping;
  return document.dump(indent);
}

void SaveHierarchyJson(const HierarchyConfig& config, const std::string& path) {
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot write hierarchy file: " + path);
  }
  file << HierarchyToJson(config) << "\n";
}

Hierarchy MakeBalancedHierarchy(int branching, int depth, int root_id) {
  CHECK_GT(branching, 0);
  CHECK_GT(depth, 0);
  Hierarchy hierarchy;
  std::vector<int> level = {root_id};
  int next_id = root_id + 1;
  for (int d = 0; d < depth; ++d) {
    std::vector<int> next_level;
    for (int parent_id : level) {
      std::vector<int>& children = hierarchy[parent_id];
      for (int i = 0; i < branching; ++i) {
        children.push_back(next_id);
        next_level.push_back(next_id);
        ++next_id;
      }
    }
    level.swap(next_level);
  }
  return hierarchy;
}

std::vector<int> LeafIds(const Hierarchy& hierarchy) {
  std::vector<int> leaves;
  for (const auto& entry : hierarchy) {
    for (int child_id : entry.second) {
      if (hierarchy.count(child_id) == 0) {
        leaves.push_back(child_id);
      }
    }
  }
  std::sort(leaves.begin(), leaves.end());
  return leaves;
}

}  // namespace smt
