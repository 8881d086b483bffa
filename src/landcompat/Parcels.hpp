#pragma once

#include "landcompat/Geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace landcompat {

// Coordinate reference information as reported by whoever loaded the parcels.
//
// The engine never reprojects. Anything other than a projected CRS only produces a warning,
// because buffer distances are then not in meters (or are meaningless).
enum class CrsKind : std::uint8_t {
  Unknown = 0,
  Projected = 1,
  Geographic = 2,
};

const char* CrsKindName(CrsKind k);

struct CrsInfo {
  CrsKind kind = CrsKind::Unknown;

  // Free-form label (e.g. "WGS 84 / UTM zone 39N") for messages and the manifest.
  std::string name;

  bool isProjected() const { return kind == CrsKind::Projected; }
};

struct Parcel {
  std::int64_t id = 0;
  MultiPolygon geometry;

  // Attribute values aligned with ParcelCollection::fields.
  std::vector<std::string> values;
};

// A parcel layer: an attribute schema plus one row per parcel.
struct ParcelCollection {
  std::vector<std::string> fields;
  std::vector<Parcel> parcels;

  // False => Parcel::id is ignored and ids 0..N-1 are assigned in input order.
  bool hasIds = false;

  CrsInfo crs;

  // Where the layer came from (path or label). Used to give errors some context.
  std::string source;

  // -1 if the field is not part of the schema.
  int fieldIndex(const std::string& name) const;

  // Append a field (or reuse an existing one) and fill every parcel with `fill`.
  // Returns the field index.
  int ensureField(const std::string& name, const std::string& fill = std::string());

  std::int64_t effectiveId(std::size_t i) const;
};

// Flattened, validated view of a ParcelCollection used by the pipeline stages.
//
// Land-use labels are interned: classLabels is sorted ascending and classOf[i] indexes into it.
struct ParcelTable {
  std::vector<std::int64_t> ids;
  std::vector<const MultiPolygon*> geometry;
  std::vector<int> classOf;
  std::vector<std::string> classLabels;

  std::size_t size() const { return ids.size(); }
};

// "a, b, c" (or "<none>") for error messages.
std::string FormatFieldList(const std::vector<std::string>& fields);

// Validate the structural shape of the layer and build a ParcelTable that points into it.
//
// Fails (and leaves `out` empty) when:
//  - `landUseField` is not in the schema (the message lists the available fields),
//  - a parcel row does not have one value per field,
//  - a parcel has non-finite coordinates,
//  - explicit ids are not unique.
//
// An empty collection is valid here; rejecting it is a pipeline policy (AuditConfig).
bool BuildParcelTable(const ParcelCollection& parcels, const std::string& landUseField, ParcelTable& out,
                      std::string& outError);

} // namespace landcompat
