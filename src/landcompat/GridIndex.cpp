#include "landcompat/GridIndex.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace landcompat {

GridIndex::GridIndex(double cellSize)
{
  m_cellSize = (std::isfinite(cellSize) && cellSize > 0.0) ? cellSize : 1.0;
}

void GridIndex::clear()
{
  m_items.clear();
  m_cells.clear();
  m_overflow.clear();
}

std::int64_t GridIndex::cellCoord(double v) const
{
  // Keys pack two 32-bit cell coordinates.
  constexpr double lo = static_cast<double>(std::numeric_limits<std::int32_t>::min());
  constexpr double hi = static_cast<double>(std::numeric_limits<std::int32_t>::max());
  const double c = std::floor(v / m_cellSize);
  return static_cast<std::int64_t>(std::clamp(c, lo, hi));
}

GridIndex::CellRange GridIndex::rangeOf(const Box& box) const
{
  CellRange r;
  r.x0 = cellCoord(box.minX);
  r.y0 = cellCoord(box.minY);
  r.x1 = cellCoord(box.maxX);
  r.y1 = cellCoord(box.maxY);
  return r;
}

std::uint64_t GridIndex::CellKey(std::int64_t cx, std::int64_t cy)
{
  const std::uint64_t ux = static_cast<std::uint32_t>(static_cast<std::int32_t>(cx));
  const std::uint64_t uy = static_cast<std::uint32_t>(static_cast<std::int32_t>(cy));
  return (ux << 32) | uy;
}

void GridIndex::insert(int id, const Box& box)
{
  if (box.empty()) return;

  const std::uint32_t pos = static_cast<std::uint32_t>(m_items.size());
  m_items.push_back(Item{id, box});

  const CellRange r = rangeOf(box);
  if (r.count() > kMaxCellsPerBox) {
    m_overflow.push_back(pos);
    return;
  }

  for (std::int64_t cy = r.y0; cy <= r.y1; ++cy) {
    for (std::int64_t cx = r.x0; cx <= r.x1; ++cx) {
      m_cells[CellKey(cx, cy)].push_back(pos);
    }
  }
}

void GridIndex::query(const Box& box, std::vector<int>& out) const
{
  out.clear();
  if (box.empty() || m_items.empty()) return;

  std::vector<std::uint32_t> hits;
  const CellRange r = rangeOf(box);

  if (r.count() > kMaxCellsPerBox || static_cast<std::size_t>(r.count()) > m_cells.size()) {
    // Visiting every covered cell would cost more than a linear scan.
    for (std::uint32_t pos = 0; pos < static_cast<std::uint32_t>(m_items.size()); ++pos) {
      if (m_items[pos].box.intersects(box)) out.push_back(m_items[pos].id);
    }
    std::sort(out.begin(), out.end());
    return;
  }

  for (std::int64_t cy = r.y0; cy <= r.y1; ++cy) {
    for (std::int64_t cx = r.x0; cx <= r.x1; ++cx) {
      const auto it = m_cells.find(CellKey(cx, cy));
      if (it == m_cells.end()) continue;
      hits.insert(hits.end(), it->second.begin(), it->second.end());
    }
  }
  hits.insert(hits.end(), m_overflow.begin(), m_overflow.end());

  // An item spanning several cells shows up once per cell.
  std::sort(hits.begin(), hits.end());
  hits.erase(std::unique(hits.begin(), hits.end()), hits.end());

  for (std::uint32_t pos : hits) {
    if (m_items[pos].box.intersects(box)) out.push_back(m_items[pos].id);
  }
  std::sort(out.begin(), out.end());
}

} // namespace landcompat
