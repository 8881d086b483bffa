#pragma once

#include "landcompat/Audit.hpp"
#include "landcompat/AuditConfig.hpp"
#include "landcompat/Json.hpp"
#include "landcompat/Parcels.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace landcompat {

// Attribute appended to the scored parcel layer.
inline constexpr const char* kCompatScoreField = "compat_score";

// compatibility_score,parcel_count,percentage
// Always one row per score 1..5 (zero-filled).
bool WriteOverallSummaryCsv(std::ostream& os, const OverallSummary& s, std::string* outError = nullptr);

// <landUseField>,1,2,3,4,5,total_parcels
// One row per land-use class, ascending by label.
bool WriteDetailedBreakdownCsv(std::ostream& os, const DetailedBreakdown& d, const std::string& landUseField,
                               std::string* outError = nullptr);

// The input layer with a compat_score attribute appended (an existing field of that name is
// overwritten). `scores` must be aligned with `parcels.parcels`.
bool BuildScoredCollection(const ParcelCollection& parcels, const std::vector<ParcelScore>& scores,
                           ParcelCollection& outScored, std::string* outError = nullptr);

// id,<attribute fields...> for a (scored) layer. Geometry is not written.
bool WriteParcelAttributesCsv(std::ostream& os, const ParcelCollection& parcels, std::string* outError = nullptr);

// Config, counters, CRS warning and stage timings of a run.
JsonValue AuditManifestToJsonValue(const AuditResult& r, const std::string& parcelSource = std::string(),
                                   const std::string& matrixSource = std::string());

bool WriteAuditManifestJson(std::ostream& os, const AuditResult& r, const std::string& parcelSource = std::string(),
                            const std::string& matrixSource = std::string(), std::string* outError = nullptr);

// Write every enabled artifact into cfg.outputDir (created when missing).
// Paths of the written files are appended to outWritten in a fixed order.
bool ExportAuditResults(const ParcelCollection& parcels, const CompatMatrix& matrix, const AuditResult& r,
                        const AuditExportConfig& cfg, std::string* outError = nullptr,
                        std::vector<std::string>* outWritten = nullptr);

} // namespace landcompat
