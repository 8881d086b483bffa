#pragma once

#include "landcompat/Geometry.hpp"

#include <vector>

namespace landcompat {

// -----------------------------------------------------------------------------------------------
// Proximity regions (geometry preparation)
//
// A proximity region is the Minkowski expansion of a parcel geometry by the adjacency distance
// d: every point within distance d of the parcel. We keep it implicit (source geometry + d) and
// answer membership/intersection queries through exact distance tests, so round caps and
// corners are exact rather than approximated by polygon segments.
//
//  - d == 0 yields the parcel's own footprint, so adjacency means touching or overlapping.
//  - `bounds` is the source bounding box grown by d; it is what the spatial index stores.
// -----------------------------------------------------------------------------------------------

struct ProximityRegion {
  // Not owned. Must outlive the region.
  const MultiPolygon* source = nullptr;

  double distance = 0.0;
  Box bounds;

  bool empty() const { return source == nullptr || bounds.empty(); }
};

// Precondition: distance >= 0 and finite (validated by the pipeline).
ProximityRegion BufferGeometry(const MultiPolygon& geom, double distance);

// One region per geometry, computed on up to `threads` workers (see ResolveThreadCount).
std::vector<ProximityRegion> BufferGeometries(const std::vector<const MultiPolygon*>& geoms, double distance,
                                              int threads = 1);

// True if `geom` intersects the region, i.e. dist(geom, region.source) <= region.distance.
bool RegionIntersects(const ProximityRegion& region, const MultiPolygon& geom);

bool RegionContains(const ProximityRegion& region, const Vec2& p);

} // namespace landcompat
