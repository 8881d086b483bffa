#include "landcompat/ConfigIO.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace landcompat {

namespace {

static bool ReadFileText(const std::string& path, std::string& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream oss;
  oss << f.rdbuf();
  out = oss.str();
  return true;
}

static bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

static bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double dv = v->numberValue;
  if (!std::isfinite(dv) || dv < static_cast<double>(std::numeric_limits<int>::min()) ||
      dv > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  if (std::floor(dv) != dv) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(dv);
  return true;
}

static bool ApplyF64(const JsonValue& root, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!std::isfinite(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

static bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

} // namespace

JsonValue AuditConfigToJsonValue(const AuditConfig& cfg)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("land_use_field", JsonValue::MakeString(cfg.landUseField));
  o.set("adjacency_distance", JsonValue::MakeNumber(cfg.adjacencyDistance));
  o.set("spatial_index", JsonValue::MakeString(SpatialIndexKindName(cfg.spatialIndex)));
  o.set("rtree_max_entries", JsonValue::MakeNumber(cfg.rtreeMaxEntries));
  o.set("grid_cell_size", JsonValue::MakeNumber(cfg.gridCellSize));
  o.set("threads", JsonValue::MakeNumber(cfg.threads));
  o.set("allow_empty_parcels", JsonValue::MakeBool(cfg.allowEmptyParcels));
  return o;
}

std::string AuditConfigToJson(const AuditConfig& cfg, int indentSpaces)
{
  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;

  std::ostringstream oss;
  std::string err;
  if (!WriteJson(oss, AuditConfigToJsonValue(cfg), err, opt)) return std::string();
  return oss.str();
}

bool ApplyAuditConfigJson(const JsonValue& root, AuditConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "config JSON root must be an object";
    return false;
  }

  AuditConfig cfg = ioCfg;
  std::string err;

  if (!ApplyString(root, "land_use_field", cfg.landUseField, err) ||
      !ApplyF64(root, "adjacency_distance", cfg.adjacencyDistance, err) ||
      !ApplyI32(root, "rtree_max_entries", cfg.rtreeMaxEntries, err) ||
      !ApplyF64(root, "grid_cell_size", cfg.gridCellSize, err) || !ApplyI32(root, "threads", cfg.threads, err) ||
      !ApplyBool(root, "allow_empty_parcels", cfg.allowEmptyParcels, err)) {
    outError = err;
    return false;
  }

  if (cfg.landUseField.empty()) {
    outError = "land_use_field must not be empty";
    return false;
  }
  if (cfg.adjacencyDistance < 0.0) {
    outError = "adjacency_distance must be >= 0";
    return false;
  }

  const JsonValue* kind = FindJsonMember(root, "spatial_index");
  if (kind) {
    if (!kind->isString()) {
      outError = "expected string for key 'spatial_index'";
      return false;
    }
    SpatialIndexKind k{};
    if (!ParseSpatialIndexKind(kind->stringValue, k)) {
      outError = "unknown spatial_index: '" + kind->stringValue + "'";
      return false;
    }
    cfg.spatialIndex = k;
  }

  ioCfg = cfg;
  outError.clear();
  return true;
}

bool WriteAuditConfigJsonFile(const std::string& path, const AuditConfig& cfg, std::string& outError,
                              int indentSpaces)
{
  const std::string text = AuditConfigToJson(cfg, indentSpaces);
  if (text.empty()) {
    outError = "failed to serialize config";
    return false;
  }

  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  f << text;
  f.flush();
  if (!f) {
    outError = "failed to write file: " + path;
    return false;
  }
  outError.clear();
  return true;
}

bool LoadAuditConfigJsonFile(const std::string& path, AuditConfig& ioCfg, std::string& outError)
{
  std::string text;
  if (!ReadFileText(path, text)) {
    outError = "failed to read file: " + path;
    return false;
  }

  JsonValue root;
  std::string err;
  if (!ParseJson(text, root, err)) {
    outError = path + ": " + err;
    return false;
  }

  if (!ApplyAuditConfigJson(root, ioCfg, err)) {
    outError = path + ": " + err;
    return false;
  }

  outError.clear();
  return true;
}

} // namespace landcompat
