#include "landcompat/Geometry.hpp"

#include <algorithm>
#include <cmath>

namespace landcompat {

namespace {

inline double Cross(const Vec2& o, const Vec2& a, const Vec2& b)
{
  return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

inline int Sign(double v)
{
  if (v > 0.0) return 1;
  if (v < 0.0) return -1;
  return 0;
}

// p is known to be collinear with [a,b]; check it lies within the segment's extent.
inline bool OnSegment(const Vec2& a, const Vec2& b, const Vec2& p)
{
  return p.x >= std::min(a.x, b.x) && p.x <= std::max(a.x, b.x) && p.y >= std::min(a.y, b.y) &&
         p.y <= std::max(a.y, b.y);
}

bool PointInRing(const Vec2& p, const Ring& ring)
{
  const std::size_t n = ring.size();
  if (n < 3) return false;

  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Vec2& a = ring[i];
    const Vec2& b = ring[j];
    if ((a.y > p.y) != (b.y > p.y)) {
      const double xCross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
      if (p.x < xCross) inside = !inside;
    }
  }
  return inside;
}

// Distance between two boxes (0 if they overlap). Empty boxes are infinitely far apart.
double BoxDistance(const Box& a, const Box& b)
{
  if (a.empty() || b.empty()) return std::numeric_limits<double>::infinity();
  const double dx = std::max(0.0, std::max(a.minX - b.maxX, b.minX - a.maxX));
  const double dy = std::max(0.0, std::max(a.minY - b.maxY, b.minY - a.maxY));
  return std::sqrt(dx * dx + dy * dy);
}

template <typename Fn>
void ForEachEdge(const Ring& ring, Fn&& fn)
{
  const std::size_t n = ring.size();
  if (n == 0) return;
  if (n == 1) {
    fn(ring[0], ring[0]);
    return;
  }
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& a = ring[i];
    const Vec2& b = ring[(i + 1) % n];
    // A closed ring repeats its first point; skip the zero-length closing edge.
    if (i + 1 == n && a == b) continue;
    fn(a, b);
  }
}

template <typename Fn>
void ForEachRing(const Polygon& poly, Fn&& fn)
{
  fn(poly.outer);
  for (const Ring& h : poly.holes) fn(h);
}

double PolygonDistance(const Polygon& a, const Polygon& b, double stopAtOrBelow)
{
  if (a.outer.empty() || b.outer.empty()) return std::numeric_limits<double>::infinity();

  // Containment: with no boundary crossings, one vertex decides whether a whole outer ring sits
  // inside the other polygon. A vertex on the boundary is a touch, which is also distance 0.
  if (PointInPolygon(a.outer.front(), b)) return 0.0;
  if (PointInPolygon(b.outer.front(), a)) return 0.0;

  double best = std::numeric_limits<double>::infinity();
  bool done = false;

  ForEachRing(a, [&](const Ring& ra) {
    if (done) return;
    ForEachRing(b, [&](const Ring& rb) {
      if (done) return;
      ForEachEdge(ra, [&](const Vec2& p0, const Vec2& p1) {
        if (done) return;
        Box ea;
        ea.extend(p0);
        ea.extend(p1);
        ForEachEdge(rb, [&](const Vec2& q0, const Vec2& q1) {
          if (done) return;
          Box eb;
          eb.extend(q0);
          eb.extend(q1);
          if (BoxDistance(ea, eb) >= best) return;

          const double d = SegmentSegmentDistance(p0, p1, q0, q1);
          if (d < best) best = d;
          if (best <= stopAtOrBelow || best == 0.0) done = true;
        });
      });
    });
  });

  return best;
}

} // namespace

bool MultiPolygon::empty() const
{
  for (const Polygon& p : polygons) {
    if (!p.outer.empty()) return false;
  }
  return true;
}

void Box::extend(const Vec2& p)
{
  minX = std::min(minX, p.x);
  minY = std::min(minY, p.y);
  maxX = std::max(maxX, p.x);
  maxY = std::max(maxY, p.y);
}

void Box::extend(const Box& b)
{
  if (b.empty()) return;
  minX = std::min(minX, b.minX);
  minY = std::min(minY, b.minY);
  maxX = std::max(maxX, b.maxX);
  maxY = std::max(maxY, b.maxY);
}

Box Box::expanded(double d) const
{
  if (empty()) return *this;
  return MakeBox(minX - d, minY - d, maxX + d, maxY + d);
}

bool Box::intersects(const Box& o) const
{
  if (empty() || o.empty()) return false;
  return minX <= o.maxX && o.minX <= maxX && minY <= o.maxY && o.minY <= maxY;
}

bool Box::contains(const Vec2& p) const
{
  return !empty() && p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
}

Box MakeBox(double minX, double minY, double maxX, double maxY)
{
  Box b;
  b.minX = minX;
  b.minY = minY;
  b.maxX = maxX;
  b.maxY = maxY;
  return b;
}

Box Union(const Box& a, const Box& b)
{
  Box out = a;
  out.extend(b);
  return out;
}

double Enlargement(const Box& base, const Box& add)
{
  return Union(base, add).area() - base.area();
}

Box BoundsOf(const Ring& ring)
{
  Box b;
  for (const Vec2& p : ring) b.extend(p);
  return b;
}

Box BoundsOf(const Polygon& poly)
{
  // Holes lie inside the outer ring.
  return BoundsOf(poly.outer);
}

Box BoundsOf(const MultiPolygon& mp)
{
  Box b;
  for (const Polygon& p : mp.polygons) b.extend(BoundsOf(p));
  return b;
}

Polygon MakeRectPolygon(double x0, double y0, double x1, double y1)
{
  Polygon p;
  p.outer = {Vec2{x0, y0}, Vec2{x1, y0}, Vec2{x1, y1}, Vec2{x0, y1}, Vec2{x0, y0}};
  return p;
}

MultiPolygon MakeRectParcel(double x0, double y0, double x1, double y1)
{
  MultiPolygon mp;
  mp.polygons.push_back(MakeRectPolygon(x0, y0, x1, y1));
  return mp;
}

bool IsFiniteGeometry(const MultiPolygon& mp)
{
  auto finiteRing = [](const Ring& r) {
    for (const Vec2& p : r) {
      if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
    }
    return true;
  };

  for (const Polygon& poly : mp.polygons) {
    if (!finiteRing(poly.outer)) return false;
    for (const Ring& h : poly.holes) {
      if (!finiteRing(h)) return false;
    }
  }
  return true;
}

double PointSegmentDistance(const Vec2& p, const Vec2& a, const Vec2& b)
{
  const double vx = b.x - a.x;
  const double vy = b.y - a.y;
  const double wx = p.x - a.x;
  const double wy = p.y - a.y;

  const double len2 = vx * vx + vy * vy;
  double t = 0.0;
  if (len2 > 0.0) t = std::clamp((wx * vx + wy * vy) / len2, 0.0, 1.0);

  const double dx = wx - t * vx;
  const double dy = wy - t * vy;
  return std::sqrt(dx * dx + dy * dy);
}

bool SegmentsIntersect(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d)
{
  const int o1 = Sign(Cross(a, b, c));
  const int o2 = Sign(Cross(a, b, d));
  const int o3 = Sign(Cross(c, d, a));
  const int o4 = Sign(Cross(c, d, b));

  if (o1 != o2 && o3 != o4) return true;

  if (o1 == 0 && OnSegment(a, b, c)) return true;
  if (o2 == 0 && OnSegment(a, b, d)) return true;
  if (o3 == 0 && OnSegment(c, d, a)) return true;
  if (o4 == 0 && OnSegment(c, d, b)) return true;
  return false;
}

double SegmentSegmentDistance(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d)
{
  if (SegmentsIntersect(a, b, c, d)) return 0.0;
  const double d0 = PointSegmentDistance(a, c, d);
  const double d1 = PointSegmentDistance(b, c, d);
  const double d2 = PointSegmentDistance(c, a, b);
  const double d3 = PointSegmentDistance(d, a, b);
  return std::min(std::min(d0, d1), std::min(d2, d3));
}

bool PointInPolygon(const Vec2& p, const Polygon& poly)
{
  if (!PointInRing(p, poly.outer)) return false;
  for (const Ring& h : poly.holes) {
    if (PointInRing(p, h)) return false;
  }
  return true;
}

double GeometryDistance(const MultiPolygon& a, const MultiPolygon& b, double stopAtOrBelow)
{
  double best = std::numeric_limits<double>::infinity();

  for (const Polygon& pa : a.polygons) {
    if (pa.outer.empty()) continue;
    const Box ba = BoundsOf(pa);

    for (const Polygon& pb : b.polygons) {
      if (pb.outer.empty()) continue;
      if (BoxDistance(ba, BoundsOf(pb)) >= best) continue;

      const double d = PolygonDistance(pa, pb, stopAtOrBelow);
      if (d < best) best = d;
      if (best <= stopAtOrBelow || best == 0.0) return best;
    }
  }

  return best;
}

bool WithinDistance(const MultiPolygon& a, const MultiPolygon& b, double d)
{
  if (!(d >= 0.0)) return false;
  return GeometryDistance(a, b, d) <= d;
}

} // namespace landcompat
