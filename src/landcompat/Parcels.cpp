#include "landcompat/Parcels.hpp"

#include <map>
#include <sstream>
#include <unordered_map>

namespace landcompat {

namespace {

std::string SourcePrefix(const ParcelCollection& parcels)
{
  if (parcels.source.empty()) return std::string();
  return parcels.source + ": ";
}

} // namespace

const char* CrsKindName(CrsKind k)
{
  switch (k) {
  case CrsKind::Unknown: return "unknown";
  case CrsKind::Projected: return "projected";
  case CrsKind::Geographic: return "geographic";
  default: return "unknown";
  }
}

int ParcelCollection::fieldIndex(const std::string& name) const
{
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (fields[i] == name) return static_cast<int>(i);
  }
  return -1;
}

int ParcelCollection::ensureField(const std::string& name, const std::string& fill)
{
  const int existing = fieldIndex(name);
  if (existing >= 0) return existing;

  fields.push_back(name);
  for (Parcel& p : parcels) {
    p.values.resize(fields.size() - 1);
    p.values.push_back(fill);
  }
  return static_cast<int>(fields.size() - 1);
}

std::int64_t ParcelCollection::effectiveId(std::size_t i) const
{
  return hasIds ? parcels[i].id : static_cast<std::int64_t>(i);
}

std::string FormatFieldList(const std::vector<std::string>& fields)
{
  if (fields.empty()) return "<none>";
  std::ostringstream oss;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i) oss << ", ";
    oss << fields[i];
  }
  return oss.str();
}

bool BuildParcelTable(const ParcelCollection& parcels, const std::string& landUseField, ParcelTable& out,
                      std::string& outError)
{
  out = ParcelTable{};

  const int field = parcels.fieldIndex(landUseField);
  if (field < 0) {
    outError = SourcePrefix(parcels) + "land use field '" + landUseField +
               "' not found; available fields: " + FormatFieldList(parcels.fields);
    return false;
  }

  const std::size_t n = parcels.parcels.size();
  const std::size_t fieldCount = parcels.fields.size();

  std::unordered_map<std::int64_t, std::size_t> seenIds;
  if (parcels.hasIds) seenIds.reserve(n);

  for (std::size_t i = 0; i < n; ++i) {
    const Parcel& p = parcels.parcels[i];

    if (p.values.size() != fieldCount) {
      std::ostringstream oss;
      oss << SourcePrefix(parcels) << "parcel #" << i << " has " << p.values.size() << " attribute values, expected "
          << fieldCount;
      outError = oss.str();
      return false;
    }

    if (!IsFiniteGeometry(p.geometry)) {
      std::ostringstream oss;
      oss << SourcePrefix(parcels) << "parcel #" << i << " (id " << parcels.effectiveId(i)
          << ") has non-finite coordinates";
      outError = oss.str();
      return false;
    }

    if (parcels.hasIds) {
      const auto ins = seenIds.emplace(p.id, i);
      if (!ins.second) {
        std::ostringstream oss;
        oss << SourcePrefix(parcels) << "duplicate parcel id " << p.id << " (parcels #" << ins.first->second
            << " and #" << i << ")";
        outError = oss.str();
        return false;
      }
    }
  }

  // Intern land-use labels in ascending order so class indices are stable across runs.
  std::map<std::string, int> labelIndex;
  for (const Parcel& p : parcels.parcels) {
    labelIndex.emplace(p.values[static_cast<std::size_t>(field)], 0);
  }
  out.classLabels.reserve(labelIndex.size());
  for (auto& kv : labelIndex) {
    kv.second = static_cast<int>(out.classLabels.size());
    out.classLabels.push_back(kv.first);
  }

  out.ids.resize(n);
  out.geometry.resize(n);
  out.classOf.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    const Parcel& p = parcels.parcels[i];
    out.ids[i] = parcels.effectiveId(i);
    out.geometry[i] = &p.geometry;
    out.classOf[i] = labelIndex[p.values[static_cast<std::size_t>(field)]];
  }

  outError.clear();
  return true;
}

} // namespace landcompat
