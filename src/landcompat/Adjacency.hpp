#pragma once

#include "landcompat/Buffer.hpp"
#include "landcompat/Parcels.hpp"
#include "landcompat/SpatialIndex.hpp"

#include <cstdint>
#include <vector>

namespace landcompat {

// One directed neighbor relation: `right`'s proximity region intersects `left`'s footprint.
//
// Since the proximity test is symmetric, (a,b) present implies (b,a) present; both are emitted
// because scoring is done from the left parcel's class perspective.
struct AdjacencyPair {
  // Positions in the ParcelTable.
  int left = -1;
  int right = -1;

  std::int64_t leftId = 0;
  std::int64_t rightId = 0;

  // Indices into ParcelTable::classLabels.
  int leftClass = -1;
  int rightClass = -1;
};

struct AdjacencyConfig {
  SpatialIndexConfig index;

  // Worker threads (see ResolveThreadCount).
  int threads = 1;
};

struct AdjacencyStats {
  // Index hits (bounding-box candidates, self-matches excluded) and how many survived the exact
  // geometry test.
  std::uint64_t candidates = 0;
  std::uint64_t pairs = 0;

  int parcelsWithNeighbors = 0;
};

// Find every ordered pair of distinct parcels within the adjacency distance.
//
// `regions[i]` must be the proximity region of table.geometry[i]. Output is ordered by left
// parcel, then right parcel (both by table position), independent of the thread count.
std::vector<AdjacencyPair> FindAdjacencyPairs(const ParcelTable& table, const std::vector<ProximityRegion>& regions,
                                              const AdjacencyConfig& cfg = {}, AdjacencyStats* outStats = nullptr);

} // namespace landcompat
