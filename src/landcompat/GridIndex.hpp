#pragma once

#include "landcompat/SpatialIndex.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <unordered_map>
#include <vector>

namespace landcompat {

// Uniform hash grid over bounding boxes.
//
// Each box is registered in every cell it overlaps. Boxes that would cover more than
// kMaxCellsPerBox cells go to an overflow list that every query scans linearly, so a handful of
// huge parcels cannot blow up memory.
//
// Works best when the cell size is close to the typical box extent (see SuggestGridCellSize).
class GridIndex final : public SpatialIndex {
public:
  static constexpr std::int64_t kMaxCellsPerBox = 4096;

  explicit GridIndex(double cellSize);

  void insert(int id, const Box& box) override;
  void query(const Box& box, std::vector<int>& out) const override;
  std::size_t size() const override { return m_items.size(); }
  void clear() override;

  double cellSize() const { return m_cellSize; }
  std::size_t overflowCount() const { return m_overflow.size(); }

private:
  struct Item {
    int id = -1;
    Box box;
  };

  struct CellRange {
    std::int64_t x0 = 0;
    std::int64_t y0 = 0;
    std::int64_t x1 = -1;
    std::int64_t y1 = -1;

    std::int64_t count() const
    {
      const std::int64_t w = x1 - x0 + 1;
      const std::int64_t h = y1 - y0 + 1;
      if (w <= 0 || h <= 0) return 0;
      // Either side alone already exceeds any sane cell budget; avoid overflowing the product.
      if (w > (std::int64_t{1} << 24) || h > (std::int64_t{1} << 24)) return std::numeric_limits<std::int64_t>::max();
      return w * h;
    }
  };

  std::int64_t cellCoord(double v) const;
  CellRange rangeOf(const Box& box) const;
  static std::uint64_t CellKey(std::int64_t cx, std::int64_t cy);

  double m_cellSize = 1.0;
  std::vector<Item> m_items;

  // Cell key -> positions in m_items.
  std::unordered_map<std::uint64_t, std::vector<std::uint32_t>> m_cells;
  std::vector<std::uint32_t> m_overflow;
};

} // namespace landcompat
