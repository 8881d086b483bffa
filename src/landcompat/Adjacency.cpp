#include "landcompat/Adjacency.hpp"

#include "landcompat/Parallel.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>

namespace landcompat {

std::vector<AdjacencyPair> FindAdjacencyPairs(const ParcelTable& table, const std::vector<ProximityRegion>& regions,
                                              const AdjacencyConfig& cfg, AdjacencyStats* outStats)
{
  std::vector<AdjacencyPair> out;
  if (outStats) *outStats = AdjacencyStats{};

  const std::size_t n = std::min(table.size(), regions.size());
  if (n == 0) return out;

  // The index holds the buffered boxes; queries use each parcel's own (unbuffered) box.
  std::vector<Box> boxes(n);
  for (std::size_t i = 0; i < n; ++i) boxes[i] = regions[i].bounds;
  const std::unique_ptr<SpatialIndex> index = MakeSpatialIndex(cfg.index, boxes);

  const int workers = ResolveThreadCount(cfg.threads, n);

  std::vector<std::vector<int>> neighbors(n);
  std::vector<std::uint64_t> candidates(static_cast<std::size_t>(workers), 0);
  std::vector<std::vector<int>> scratch(static_cast<std::size_t>(workers));

  ParallelFor(n, workers, [&](int worker, std::size_t i) {
    const MultiPolygon* geom = table.geometry[i];
    if (!geom) return;

    std::vector<int>& hits = scratch[static_cast<std::size_t>(worker)];
    index->query(BoundsOf(*geom), hits);

    std::vector<int>& mine = neighbors[i];
    for (int j : hits) {
      if (static_cast<std::size_t>(j) == i) continue;
      ++candidates[static_cast<std::size_t>(worker)];
      if (RegionIntersects(regions[static_cast<std::size_t>(j)], *geom)) mine.push_back(j);
    }
  });

  std::size_t total = 0;
  for (const auto& v : neighbors) total += v.size();
  out.reserve(total);

  int withNeighbors = 0;
  for (std::size_t i = 0; i < n; ++i) {
    if (!neighbors[i].empty()) ++withNeighbors;
    for (int j : neighbors[i]) {
      AdjacencyPair p;
      p.left = static_cast<int>(i);
      p.right = j;
      p.leftId = table.ids[i];
      p.rightId = table.ids[static_cast<std::size_t>(j)];
      p.leftClass = table.classOf[i];
      p.rightClass = table.classOf[static_cast<std::size_t>(j)];
      out.push_back(p);
    }
  }

  if (outStats) {
    for (std::uint64_t c : candidates) outStats->candidates += c;
    outStats->pairs = static_cast<std::uint64_t>(out.size());
    outStats->parcelsWithNeighbors = withNeighbors;
  }
  return out;
}

} // namespace landcompat
