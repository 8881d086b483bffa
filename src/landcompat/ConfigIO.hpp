#pragma once

#include "landcompat/AuditConfig.hpp"
#include "landcompat/Json.hpp"

#include <string>

namespace landcompat {

// JSON helpers for AuditConfig.
//
// Loading uses merge semantics: missing keys leave the existing config unchanged, so a file
// may override just the distance or the field name. Field names are snake_case:
//
//   {
//     "land_use_field": "KARBARI_MO",
//     "adjacency_distance": 10,
//     "spatial_index": "rtree",
//     "rtree_max_entries": 16,
//     "grid_cell_size": 0,
//     "threads": 1,
//     "allow_empty_parcels": false
//   }

JsonValue AuditConfigToJsonValue(const AuditConfig& cfg);
// Empty string when the config holds a non-finite number.
std::string AuditConfigToJson(const AuditConfig& cfg, int indentSpaces = 2);

// Apply overrides from `root` (must be an object). Unknown keys are ignored; wrong types and
// invalid values (negative or non-finite distance, unknown index kind) fail with the key name.
// On failure ioCfg is left unchanged.
bool ApplyAuditConfigJson(const JsonValue& root, AuditConfig& ioCfg, std::string& outError);

bool WriteAuditConfigJsonFile(const std::string& path, const AuditConfig& cfg, std::string& outError,
                              int indentSpaces = 2);
bool LoadAuditConfigJsonFile(const std::string& path, AuditConfig& ioCfg, std::string& outError);

} // namespace landcompat
