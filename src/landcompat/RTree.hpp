#pragma once

#include "landcompat/SpatialIndex.hpp"

#include <cstddef>
#include <vector>

namespace landcompat {

// -----------------------------------------------------------------------------
// Dynamic R-tree (Guttman, quadratic split)
//
// Nodes live in a flat vector and refer to each other by index, which keeps the
// tree trivially copyable/movable and avoids per-node allocations.
//
// Design goals:
// - No external dependencies.
// - Deterministic structure for a given insertion order (all ties break on
//   entry position).
// - query() returns ids sorted ascending.
// -----------------------------------------------------------------------------
class RTreeIndex final : public SpatialIndex {
public:
  explicit RTreeIndex(int maxEntries = 16);

  void insert(int id, const Box& box) override;
  void query(const Box& box, std::vector<int>& out) const override;
  std::size_t size() const override { return m_count; }
  void clear() override;

  // 0 for an empty tree, 1 when the root is a leaf.
  int height() const;

  int maxEntries() const { return m_maxEntries; }
  int minEntries() const { return m_minEntries; }

private:
  struct Entry {
    Box box;
    // Child node index for internal nodes, item id for leaves.
    int ref = -1;
  };

  struct Node {
    bool leaf = true;
    std::vector<Entry> entries;
  };

  Box nodeBounds(int nodeId) const;
  int chooseSubtree(const Node& n, const Box& box) const;

  // Split an overflowing node. Returns the id of the new sibling.
  int splitNode(int nodeId);

  int m_maxEntries = 16;
  int m_minEntries = 6;
  std::vector<Node> m_nodes;
  int m_root = -1;
  std::size_t m_count = 0;
};

} // namespace landcompat
