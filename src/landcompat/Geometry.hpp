#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace landcompat {

// -----------------------------------------------------------------------------------------------
// Planar geometry (dependency-free)
//
// Parcels arrive in a projected, distance-accurate coordinate space, so all of the math here is
// plain Euclidean geometry on doubles. Polygons follow the usual GIS layout: one outer ring plus
// zero or more holes, and a parcel may be a multipolygon.
//
// Rings may be given open or closed (front() == back()); the closing edge is implied either way.
// -----------------------------------------------------------------------------------------------

struct Vec2 {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Vec2& o) const { return !(*this == o); }
};

using Ring = std::vector<Vec2>;

struct Polygon {
  Ring outer;
  std::vector<Ring> holes;
};

struct MultiPolygon {
  std::vector<Polygon> polygons;

  bool empty() const;
};

// Axis-aligned bounding box. A default constructed box is empty (min > max).
struct Box {
  double minX = std::numeric_limits<double>::infinity();
  double minY = std::numeric_limits<double>::infinity();
  double maxX = -std::numeric_limits<double>::infinity();
  double maxY = -std::numeric_limits<double>::infinity();

  bool empty() const { return minX > maxX || minY > maxY; }

  double width() const { return empty() ? 0.0 : maxX - minX; }
  double height() const { return empty() ? 0.0 : maxY - minY; }
  double area() const { return width() * height(); }
  double margin() const { return width() + height(); }

  void extend(const Vec2& p);
  void extend(const Box& b);

  // Grow by d on every side (d >= 0). Empty boxes stay empty.
  Box expanded(double d) const;

  // Closed-interval overlap test; boxes that only share an edge intersect.
  bool intersects(const Box& o) const;

  bool contains(const Vec2& p) const;
};

Box MakeBox(double minX, double minY, double maxX, double maxY);
Box Union(const Box& a, const Box& b);

// Growth in area needed for `base` to also cover `add`.
double Enlargement(const Box& base, const Box& add);

Box BoundsOf(const Ring& ring);
Box BoundsOf(const Polygon& poly);
Box BoundsOf(const MultiPolygon& mp);

// Axis-aligned rectangle polygon (counter-clockwise, closed).
Polygon MakeRectPolygon(double x0, double y0, double x1, double y1);
MultiPolygon MakeRectParcel(double x0, double y0, double x1, double y1);

// True if every coordinate is finite.
bool IsFiniteGeometry(const MultiPolygon& mp);

double PointSegmentDistance(const Vec2& p, const Vec2& a, const Vec2& b);

// Closed segment intersection (touching endpoints and collinear overlap count).
bool SegmentsIntersect(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d);

double SegmentSegmentDistance(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d);

// Even-odd test against the outer ring minus holes. Points exactly on a boundary may report
// either result; callers that care about boundaries test edges separately.
bool PointInPolygon(const Vec2& p, const Polygon& poly);

// Minimum Euclidean distance between two areal geometries (0 when they touch or overlap).
//
// `stopAtOrBelow` allows an early exit: as soon as a distance <= stopAtOrBelow is proven the
// function returns that value, which may then be larger than the true minimum. Pass a negative
// value for an exact result. Returns +inf if either geometry is empty.
double GeometryDistance(const MultiPolygon& a, const MultiPolygon& b, double stopAtOrBelow = -1.0);

// Predicate form used by the neighbor finder: dist(a, b) <= d.
bool WithinDistance(const MultiPolygon& a, const MultiPolygon& b, double d);

} // namespace landcompat
