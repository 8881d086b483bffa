#pragma once

#include "landcompat/AuditConfig.hpp"
#include "landcompat/CompatMatrix.hpp"
#include "landcompat/Parcels.hpp"
#include "landcompat/Scoring.hpp"
#include "landcompat/Summary.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace landcompat {

// Message sinks for RunAudit. Empty sinks are skipped; the core never prints on its own.
struct AuditLog {
  std::function<void(const std::string&)> info;
  std::function<void(const std::string&)> warn;
};

// info -> std::cout, warn -> std::cerr (prefixed with "warning: ").
AuditLog MakeConsoleAuditLog();

struct AuditStageTimings {
  double prepareMs = 0.0;
  double neighborsMs = 0.0;
  double lookupMs = 0.0;
  double aggregateMs = 0.0;
  double summarizeMs = 0.0;

  double totalMs() const { return prepareMs + neighborsMs + lookupMs + aggregateMs + summarizeMs; }
};

struct AuditCounters {
  int parcels = 0;
  int landUseClasses = 0;

  // Bounding-box candidates from the spatial index vs. pairs that passed the exact test.
  std::uint64_t candidates = 0;
  std::uint64_t adjacencyPairs = 0;
  std::uint64_t resolvedPairs = 0;
  std::uint64_t unresolvedPairs = 0;

  int parcelsResolved = 0;
  int parcelsNoNeighbors = 0;
  int parcelsAllUnresolved = 0;

  // Parcel classes with no row (left side) or no column (right side) in the matrix.
  std::vector<std::string> classesMissingRow;
  std::vector<std::string> classesMissingColumn;
};

struct AuditResult {
  AuditConfig config;

  // Aligned with the input parcel order.
  std::vector<ParcelScore> scores;

  OverallSummary overall;
  DetailedBreakdown detailed;
  AuditCounters counters;

  // Layer CRS as loaded. The warning is set when it is undefined or geographic (distance not in meters).
  CrsInfo crs;
  bool crsWarning = false;
  std::string crsMessage;

  AuditStageTimings timings;
};

// Structural checks on the config alone (distance finite and >= 0, non-empty field name).
bool ValidateAuditConfig(const AuditConfig& cfg, std::string& outError);

// Run the whole audit:
//   [1/5] prepare geometry (proximity regions)
//   [2/5] find neighbors
//   [3/5] look up compatibility scores
//   [4/5] worst-case aggregation
//   [5/5] summaries
//
// Structural errors (bad config, missing land-use field, malformed parcels, empty layer unless
// allowed) abort before any geometric work; outResult is then reset to an empty result.
// Everything else is absorbed into the result.
bool RunAudit(const ParcelCollection& parcels, const CompatMatrix& matrix, const AuditConfig& cfg,
              AuditResult& outResult, std::string& outError, const AuditLog& log = AuditLog());

} // namespace landcompat
