#include "landcompat/SpatialIndex.hpp"

#include "landcompat/GridIndex.hpp"
#include "landcompat/RTree.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace landcompat {

const char* SpatialIndexKindName(SpatialIndexKind k)
{
  switch (k) {
  case SpatialIndexKind::RTree: return "rtree";
  case SpatialIndexKind::Grid: return "grid";
  default: return "unknown";
  }
}

bool ParseSpatialIndexKind(const std::string& s, SpatialIndexKind& out)
{
  std::string t = s;
  std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (t == "rtree" || t == "r-tree") {
    out = SpatialIndexKind::RTree;
    return true;
  }
  if (t == "grid") {
    out = SpatialIndexKind::Grid;
    return true;
  }
  return false;
}

double SuggestGridCellSize(const std::vector<Box>& boxes)
{
  double sum = 0.0;
  std::size_t n = 0;
  for (const Box& b : boxes) {
    if (b.empty()) continue;
    sum += std::max(b.width(), b.height());
    ++n;
  }
  if (n == 0) return 1.0;

  const double mean = sum / static_cast<double>(n);
  return (std::isfinite(mean) && mean > 0.0) ? mean : 1.0;
}

std::unique_ptr<SpatialIndex> MakeSpatialIndex(const SpatialIndexConfig& cfg, const std::vector<Box>& boxes)
{
  std::unique_ptr<SpatialIndex> index;
  if (cfg.kind == SpatialIndexKind::Grid) {
    const double cell = (cfg.gridCellSize > 0.0) ? cfg.gridCellSize : SuggestGridCellSize(boxes);
    index = std::make_unique<GridIndex>(cell);
  } else {
    index = std::make_unique<RTreeIndex>(cfg.rtreeMaxEntries);
  }

  for (std::size_t i = 0; i < boxes.size(); ++i) {
    index->insert(static_cast<int>(i), boxes[i]);
  }
  return index;
}

} // namespace landcompat
