#ifndef SMTREE__HIERARCHY_INDEX_HPP_
#define SMTREE__HIERARCHY_INDEX_HPP_

#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace smt {

// parent id -> ordered child ids. One entry per internal node.
using Hierarchy = std::map<int, std::vector<int>>;

class HierarchyError : public std::invalid_argument {
 public:
  enum Kind {
    kNegativeId,
    kMalformedEntry,
    kDuplicateChild,
    kMissingRoot,
    kCyclicHierarchy,
    kDisconnected,
  };

  HierarchyError(Kind kind, const std::string& what)
      : std::invalid_argument(what), kind_(kind) {}

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

// Contiguous slice of the child table (and of the weight/bias rows).
struct ChildrenRange {
  int start;
  int count;
};

struct ParentLink {
  int parent_id;
  int sibling_index;  // position of the child within its parent's group
};

class HierarchyIndex;

// Per parent node: the total size of all sibling groups met on the walk from
// that node up to the root (tree size) and the number of parents on that walk
// (path depth, the root counts as 1). The maxima size the scratch buffers.
struct PathGeometry {
  std::vector<int> tree_size;   // indexed by parent id, -1 when absent
  std::vector<int> path_depth;  // indexed by parent id, -1 when absent
  int max_family_path = 0;
  int max_depth = 0;

  int TreeSize(int parent_id) const { return tree_size.at(parent_id); }
  int PathDepth(int parent_id) const { return path_depth.at(parent_id); }

  static PathGeometry Compute(const HierarchyIndex& index, int root_id);
};

class HierarchyIndex {
 public:
  static HierarchyIndex Build(const Hierarchy& hierarchy, int root_id,
                              bool verbose = false) {
    HierarchyIndex index;
    index.root_id_ = root_id;

    int min_node_id = std::numeric_limits<int>::max();
    int max_node_id = std::numeric_limits<int>::min();
    for (const auto& entry : hierarchy) {
      const int parent_id = entry.first;
      const std::vector<int>& children = entry.second;
      if (children.empty()) {
        throw HierarchyError(
            HierarchyError::kMalformedEntry,
            absl::StrCat("parent ", parent_id, " has an empty children list"));
      }
      const auto bounds =
          std::minmax_element(children.begin(), children.end());
      min_node_id = std::min({min_node_id, parent_id, *bounds.first});
      max_node_id = std::max({max_node_id, parent_id, *bounds.second});
      index.max_parent_id_ = std::max(index.max_parent_id_, parent_id);
      index.max_child_id_ = std::max(index.max_child_id_, *bounds.second);
      index.max_family_ =
          std::max(index.max_family_, static_cast<int>(children.size()));
      index.num_child_nodes_ += children.size();
      index.parent_ids_.push_back(parent_id);
    }
    if (min_node_id < 0) {
      throw HierarchyError(
          HierarchyError::kNegativeId,
          absl::StrCat("node ids must be non-negative: ", min_node_id));
    }
    if (hierarchy.empty() || hierarchy.count(root_id) == 0) {
      throw HierarchyError(
          HierarchyError::kMissingRoot,
          absl::StrCat("root id ", root_id, " has no children in hierarchy"));
    }
    index.min_node_id_ = min_node_id;
    index.max_node_id_ = max_node_id;

    const int num_child_nodes = index.num_child_nodes();
    const int num_parent_nodes = index.num_parent_nodes();
    if (verbose) {
      LOG(INFO) << "Hierarchy has " << num_parent_nodes << " parent nodes, "
                << num_child_nodes << " child nodes, "
                << (num_child_nodes - num_parent_nodes) << " leaf nodes; "
                << "node index will contain " << max_node_id << " slots";
    }
    if (max_node_id != num_child_nodes + 1) {
      LOG(WARNING) << "Hierarchy has " << max_node_id << " id slots for "
                   << num_child_nodes + 1
                   << " nodes; contiguous node ids waste less memory on "
                      "indexes";
    }

    // parent id -> [start, count) in child_ids_
    index.parent_children_.assign(index.max_parent_id_ + 1, {-1, -1});
    index.child_ids_.reserve(num_child_nodes);
    for (const auto& entry : hierarchy) {
      index.parent_children_[entry.first] = {
          static_cast<int>(index.child_ids_.size()),
          static_cast<int>(entry.second.size())};
      index.child_ids_.insert(index.child_ids_.end(), entry.second.begin(),
                              entry.second.end());
    }

    // child id -> parent id, index within siblings
    index.child_parent_.assign(index.max_child_id_ + 1, {-1, -1});
    for (int parent_id : index.parent_ids_) {
      const ChildrenRange range = index.parent_children_[parent_id];
      for (int i = 0; i < range.count; ++i) {
        const int child_id = index.child_ids_[range.start + i];
        ParentLink& link = index.child_parent_[child_id];
        if (link.parent_id != -1) {
          throw HierarchyError(
              HierarchyError::kDuplicateChild,
              absl::StrCat("child ", child_id, " listed under parents ",
                           link.parent_id, " and ", parent_id));
        }
        link = {parent_id, i};
      }
    }
    if (index.IsChild(root_id)) {
      throw HierarchyError(
          HierarchyError::kCyclicHierarchy,
          absl::StrCat("root ", root_id, " is listed as a child of ",
                       index.child_parent_[root_id].parent_id));
    }

    index.geometry_ = PathGeometry::Compute(index, root_id);
    return index;
  }

  ChildrenRange ChildrenOf(int parent_id) const {
    DCHECK(IsParent(parent_id)) << "not a parent id: " << parent_id;
    return parent_children_[parent_id];
  }

  ParentLink ParentOf(int child_id) const {
    DCHECK(IsChild(child_id)) << "not a child id: " << child_id;
    return child_parent_[child_id];
  }

  bool IsParent(int id) const {
    return id >= 0 && id <= max_parent_id_ && parent_children_[id].count > 0;
  }

  bool IsChild(int id) const {
    return id >= 0 && id <= max_child_id_ && child_parent_[id].parent_id >= 0;
  }

  const std::vector<int>& child_ids() const { return child_ids_; }
  const std::vector<int>& parent_ids() const { return parent_ids_; }
  const PathGeometry& geometry() const { return geometry_; }

  int root_id() const { return root_id_; }
  int num_child_nodes() const { return num_child_nodes_; }
  int num_parent_nodes() const { return static_cast<int>(parent_ids_.size()); }
  int num_leaf_nodes() const { return num_child_nodes_ - num_parent_nodes(); }
  int min_node_id() const { return min_node_id_; }
  int max_node_id() const { return max_node_id_; }
  int max_parent_id() const { return max_parent_id_; }
  int max_child_id() const { return max_child_id_; }
  int max_family() const { return max_family_; }
  int max_family_path() const { return geometry_.max_family_path; }
  int max_depth() const { return geometry_.max_depth; }

 private:
  HierarchyIndex() = default;

  int root_id_ = 1;
  int num_child_nodes_ = 0;
  int min_node_id_ = 0;
  int max_node_id_ = 0;
  int max_parent_id_ = -1;
  int max_child_id_ = -1;
  int max_family_ = 0;

  std::vector<int> child_ids_;
  std::vector<int> parent_ids_;
  std::vector<ChildrenRange> parent_children_;
  std::vector<ParentLink> child_parent_;
  PathGeometry geometry_;
};

inline PathGeometry PathGeometry::Compute(const HierarchyIndex& index,
                                          int root_id) {
  enum Mark : char { kUnseen, kVisiting, kResolved };

  PathGeometry geometry;
  geometry.tree_size.assign(index.max_parent_id() + 1, -1);
  geometry.path_depth.assign(index.max_parent_id() + 1, -1);
  std::vector<char> mark(index.max_parent_id() + 1, kUnseen);

  geometry.tree_size[root_id] = index.ChildrenOf(root_id).count;
  geometry.path_depth[root_id] = 1;
  mark[root_id] = kResolved;

  std::vector<int> walk;
  for (int parent_id : index.parent_ids()) {
    // Climb until a resolved ancestor is found, then unwind the walk.
    walk.clear();
    int node = parent_id;
    while (mark[node] != kResolved) {
      if (mark[node] == kVisiting) {
        throw HierarchyError(
            HierarchyError::kCyclicHierarchy,
            absl::StrCat("cycle through node ", node, " reached from ",
                         parent_id));
      }
      if (!index.IsChild(node)) {
        throw HierarchyError(
            HierarchyError::kDisconnected,
            absl::StrCat("node ", node, " has no parent and is not the root ",
                         root_id));
      }
      mark[node] = kVisiting;
      walk.push_back(node);
      node = index.ParentOf(node).parent_id;
    }
    for (auto it = walk.rbegin(); it != walk.rend(); ++it) {
      const int ancestor = index.ParentOf(*it).parent_id;
      geometry.tree_size[*it] =
          geometry.tree_size[ancestor] + index.ChildrenOf(*it).count;
      geometry.path_depth[*it] = geometry.path_depth[ancestor] + 1;
      mark[*it] = kResolved;
    }
    geometry.max_family_path =
        std::max(geometry.max_family_path, geometry.tree_size[parent_id]);
    geometry.max_depth =
        std::max(geometry.max_depth, geometry.path_depth[parent_id]);
  }
  return geometry;
}

}  // namespace smt

#endif  // SMTREE__HIERARCHY_INDEX_HPP_
