#include "landcompat/RTree.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace landcompat {

RTreeIndex::RTreeIndex(int maxEntries)
{
  m_maxEntries = std::clamp(maxEntries, 4, 256);
  // Guttman suggests m <= M/2; 40% is the common choice.
  m_minEntries = std::max(2, (m_maxEntries * 2) / 5);
}

void RTreeIndex::clear()
{
  m_nodes.clear();
  m_root = -1;
  m_count = 0;
}

int RTreeIndex::height() const
{
  if (m_root < 0) return 0;
  int h = 1;
  int cur = m_root;
  while (!m_nodes[static_cast<std::size_t>(cur)].leaf) {
    const Node& n = m_nodes[static_cast<std::size_t>(cur)];
    if (n.entries.empty()) break;
    cur = n.entries.front().ref;
    ++h;
  }
  return h;
}

Box RTreeIndex::nodeBounds(int nodeId) const
{
  Box b;
  for (const Entry& e : m_nodes[static_cast<std::size_t>(nodeId)].entries) b.extend(e.box);
  return b;
}

int RTreeIndex::chooseSubtree(const Node& n, const Box& box) const
{
  int best = 0;
  double bestEnl = 0.0;
  double bestArea = 0.0;

  for (std::size_t i = 0; i < n.entries.size(); ++i) {
    const Box& eb = n.entries[i].box;
    const double enl = Enlargement(eb, box);
    const double area = eb.area();

    if (i == 0 || enl < bestEnl || (enl == bestEnl && area < bestArea)) {
      best = static_cast<int>(i);
      bestEnl = enl;
      bestArea = area;
    }
  }
  return best;
}

int RTreeIndex::splitNode(int nodeId)
{
  std::vector<Entry> all = std::move(m_nodes[static_cast<std::size_t>(nodeId)].entries);
  const bool leaf = m_nodes[static_cast<std::size_t>(nodeId)].leaf;
  const std::size_t n = all.size();

  // PickSeeds: the pair that would waste the most area if grouped together. Degenerate boxes
  // (points, axis-aligned segments) all waste 0, so fall back to the widest union margin.
  std::size_t seedA = 0;
  std::size_t seedB = 1;
  double bestWaste = -std::numeric_limits<double>::infinity();
  double bestMargin = -1.0;
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      const Box u = Union(all[i].box, all[j].box);
      const double waste = u.area() - all[i].box.area() - all[j].box.area();
      const double margin = u.margin();
      if (waste > bestWaste || (waste == bestWaste && margin > bestMargin)) {
        bestWaste = waste;
        bestMargin = margin;
        seedA = i;
        seedB = j;
      }
    }
  }

  std::vector<Entry> groupA;
  std::vector<Entry> groupB;
  groupA.reserve(n);
  groupB.reserve(n);
  groupA.push_back(all[seedA]);
  groupB.push_back(all[seedB]);
  Box boxA = all[seedA].box;
  Box boxB = all[seedB].box;

  std::vector<bool> assigned(n, false);
  assigned[seedA] = true;
  assigned[seedB] = true;
  std::size_t remaining = n - 2;

  const std::size_t minE = static_cast<std::size_t>(m_minEntries);

  while (remaining > 0) {
    // If one group needs every remaining entry to reach the minimum fill, hand them all over.
    if (groupA.size() + remaining <= minE || groupB.size() + remaining <= minE) {
      const bool toA = groupA.size() + remaining <= minE;
      for (std::size_t i = 0; i < n; ++i) {
        if (assigned[i]) continue;
        assigned[i] = true;
        if (toA) {
          groupA.push_back(all[i]);
          boxA.extend(all[i].box);
        } else {
          groupB.push_back(all[i]);
          boxB.extend(all[i].box);
        }
      }
      remaining = 0;
      break;
    }

    // PickNext: the entry with the strongest preference for one group.
    std::size_t pick = n;
    double pickDiff = -1.0;
    double pickEnlA = 0.0;
    double pickEnlB = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      if (assigned[i]) continue;
      const double enlA = Enlargement(boxA, all[i].box);
      const double enlB = Enlargement(boxB, all[i].box);
      const double diff = std::fabs(enlA - enlB);
      if (diff > pickDiff) {
        pick = i;
        pickDiff = diff;
        pickEnlA = enlA;
        pickEnlB = enlB;
      }
    }
    if (pick == n) break;

    bool toA = true;
    if (pickEnlA != pickEnlB) {
      toA = pickEnlA < pickEnlB;
    } else if (boxA.area() != boxB.area()) {
      toA = boxA.area() < boxB.area();
    } else {
      toA = groupA.size() <= groupB.size();
    }

    assigned[pick] = true;
    --remaining;
    if (toA) {
      groupA.push_back(all[pick]);
      boxA.extend(all[pick].box);
    } else {
      groupB.push_back(all[pick]);
      boxB.extend(all[pick].box);
    }
  }

  m_nodes[static_cast<std::size_t>(nodeId)].entries = std::move(groupA);

  Node sibling;
  sibling.leaf = leaf;
  sibling.entries = std::move(groupB);
  m_nodes.push_back(std::move(sibling));
  return static_cast<int>(m_nodes.size() - 1);
}

void RTreeIndex::insert(int id, const Box& box)
{
  if (box.empty()) return;

  if (m_root < 0) {
    m_nodes.push_back(Node{});
    m_root = static_cast<int>(m_nodes.size() - 1);
  }

  // ChooseLeaf, remembering the path for the upward pass.
  std::vector<int> path;
  int cur = m_root;
  while (!m_nodes[static_cast<std::size_t>(cur)].leaf) {
    path.push_back(cur);
    const Node& n = m_nodes[static_cast<std::size_t>(cur)];
    cur = n.entries[static_cast<std::size_t>(chooseSubtree(n, box))].ref;
  }

  Entry e;
  e.box = box;
  e.ref = id;
  m_nodes[static_cast<std::size_t>(cur)].entries.push_back(e);
  ++m_count;

  const std::size_t maxE = static_cast<std::size_t>(m_maxEntries);

  // AdjustTree. splitNode() may grow m_nodes, so never hold Node references across it.
  int child = cur;
  int sibling = -1;
  if (m_nodes[static_cast<std::size_t>(child)].entries.size() > maxE) sibling = splitNode(child);

  for (std::size_t k = path.size(); k-- > 0;) {
    const int parent = path[k];

    const Box childBounds = nodeBounds(child);
    for (Entry& pe : m_nodes[static_cast<std::size_t>(parent)].entries) {
      if (pe.ref == child) {
        pe.box = childBounds;
        break;
      }
    }

    if (sibling >= 0) {
      Entry se;
      se.box = nodeBounds(sibling);
      se.ref = sibling;
      m_nodes[static_cast<std::size_t>(parent)].entries.push_back(se);
      sibling = -1;
      if (m_nodes[static_cast<std::size_t>(parent)].entries.size() > maxE) sibling = splitNode(parent);
    }

    child = parent;
  }

  // Root split: grow the tree by one level.
  if (sibling >= 0) {
    Node root;
    root.leaf = false;

    Entry a;
    a.box = nodeBounds(child);
    a.ref = child;
    Entry b;
    b.box = nodeBounds(sibling);
    b.ref = sibling;
    root.entries.push_back(a);
    root.entries.push_back(b);

    m_nodes.push_back(std::move(root));
    m_root = static_cast<int>(m_nodes.size() - 1);
  }
}

void RTreeIndex::query(const Box& box, std::vector<int>& out) const
{
  out.clear();
  if (m_root < 0 || box.empty()) return;

  std::vector<int> stack;
  stack.push_back(m_root);

  while (!stack.empty()) {
    const int nodeId = stack.back();
    stack.pop_back();

    const Node& n = m_nodes[static_cast<std::size_t>(nodeId)];
    for (const Entry& e : n.entries) {
      if (!e.box.intersects(box)) continue;
      if (n.leaf) {
        out.push_back(e.ref);
      } else {
        stack.push_back(e.ref);
      }
    }
  }

  std::sort(out.begin(), out.end());
}

} // namespace landcompat
