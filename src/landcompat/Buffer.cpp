#include "landcompat/Buffer.hpp"

#include "landcompat/Parallel.hpp"

namespace landcompat {

ProximityRegion BufferGeometry(const MultiPolygon& geom, double distance)
{
  ProximityRegion r;
  r.source = &geom;
  r.distance = distance;
  r.bounds = BoundsOf(geom).expanded(distance);
  return r;
}

std::vector<ProximityRegion> BufferGeometries(const std::vector<const MultiPolygon*>& geoms, double distance,
                                              int threads)
{
  std::vector<ProximityRegion> out(geoms.size());
  const int workers = ResolveThreadCount(threads, geoms.size());

  ParallelFor(geoms.size(), workers, [&](int, std::size_t i) {
    if (geoms[i]) out[i] = BufferGeometry(*geoms[i], distance);
  });
  return out;
}

bool RegionIntersects(const ProximityRegion& region, const MultiPolygon& geom)
{
  if (region.empty()) return false;
  if (!region.bounds.intersects(BoundsOf(geom))) return false;
  return WithinDistance(*region.source, geom, region.distance);
}

bool RegionContains(const ProximityRegion& region, const Vec2& p)
{
  if (region.empty()) return false;
  if (!region.bounds.contains(p)) return false;

  for (const Polygon& poly : region.source->polygons) {
    if (poly.outer.empty()) continue;
    if (PointInPolygon(p, poly)) return true;
  }

  // Outside the footprint: inside the expansion if some boundary edge is within distance.
  MultiPolygon point;
  Polygon dot;
  dot.outer.push_back(p);
  point.polygons.push_back(dot);
  return GeometryDistance(*region.source, point, region.distance) <= region.distance;
}

} // namespace landcompat
