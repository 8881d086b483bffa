#pragma once

#include "landcompat/Geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace landcompat {

// -----------------------------------------------------------------------------------------------
// Spatial index interface
//
// The neighbor finder only needs two operations: insert an id with its bounding box, and return
// every id whose box intersects a query box. Exact geometry tests happen afterwards on the
// returned candidates, so implementations are free to return a superset only in the sense of
// boxes: query() must return exactly the ids whose stored box intersects the query box.
//
// query() output is sorted ascending and contains each id at most once per insertion.
// -----------------------------------------------------------------------------------------------

class SpatialIndex {
public:
  virtual ~SpatialIndex() = default;

  // Empty boxes are ignored (they can never intersect anything).
  virtual void insert(int id, const Box& box) = 0;

  // Appends matches to `out` (which is cleared first).
  virtual void query(const Box& box, std::vector<int>& out) const = 0;

  virtual std::size_t size() const = 0;
  virtual void clear() = 0;
};

enum class SpatialIndexKind : std::uint8_t {
  RTree = 0,
  Grid = 1,
};

const char* SpatialIndexKindName(SpatialIndexKind k);

// Accepts "rtree" / "grid" (case-insensitive).
bool ParseSpatialIndexKind(const std::string& s, SpatialIndexKind& out);

struct SpatialIndexConfig {
  SpatialIndexKind kind = SpatialIndexKind::RTree;

  // R-tree node fan-out (clamped to [4, 256]).
  int rtreeMaxEntries = 16;

  // Grid cell edge length. <= 0 => derived from the boxes being indexed.
  double gridCellSize = 0.0;
};

// Pick a grid cell size for the given boxes: the mean of their larger side, falling back to 1
// when every box is degenerate.
double SuggestGridCellSize(const std::vector<Box>& boxes);

// Build an index of the requested kind and insert boxes[i] under id i.
std::unique_ptr<SpatialIndex> MakeSpatialIndex(const SpatialIndexConfig& cfg, const std::vector<Box>& boxes);

} // namespace landcompat
