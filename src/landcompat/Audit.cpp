#include "landcompat/Audit.hpp"

#include "landcompat/Adjacency.hpp"
#include "landcompat/Buffer.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace landcompat {

namespace {

using Clock = std::chrono::steady_clock;

double MsSince(Clock::time_point t0)
{
  return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
}

void Info(const AuditLog& log, const std::string& msg)
{
  if (log.info) log.info(msg);
}

void Warn(const AuditLog& log, const std::string& msg)
{
  if (log.warn) log.warn(msg);
}

std::string CrsMessage(const CrsInfo& crs, double distance)
{
  std::ostringstream oss;
  if (crs.kind == CrsKind::Geographic) {
    oss << "CRS";
    if (!crs.name.empty()) oss << " '" << crs.name << "'";
    oss << " is geographic: adjacency distance " << distance
        << " is in degrees, not meters. Reproject the parcels to a metric CRS";
  } else {
    oss << "CRS is undefined: adjacency distance " << distance << " is applied in raw coordinate units";
  }
  return oss.str();
}

std::string StageTime(double ms)
{
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss.precision(1);
  oss << " (" << ms << " ms)";
  return oss.str();
}

} // namespace

AuditLog MakeConsoleAuditLog()
{
  AuditLog log;
  log.info = [](const std::string& msg) { std::cout << msg << "\n"; };
  log.warn = [](const std::string& msg) { std::cerr << "warning: " << msg << "\n"; };
  return log;
}

bool ValidateAuditConfig(const AuditConfig& cfg, std::string& outError)
{
  if (cfg.landUseField.empty()) {
    outError = "land-use field name is empty";
    return false;
  }
  if (!std::isfinite(cfg.adjacencyDistance) || cfg.adjacencyDistance < 0.0) {
    std::ostringstream oss;
    oss << "adjacency distance must be finite and >= 0 (got " << cfg.adjacencyDistance << ")";
    outError = oss.str();
    return false;
  }
  if (cfg.spatialIndex == SpatialIndexKind::Grid && std::isnan(cfg.gridCellSize)) {
    outError = "grid cell size is NaN";
    return false;
  }
  outError.clear();
  return true;
}

bool RunAudit(const ParcelCollection& parcels, const CompatMatrix& matrix, const AuditConfig& cfg,
              AuditResult& outResult, std::string& outError, const AuditLog& log)
{
  outResult = AuditResult{};

  // Structural validation: nothing geometric happens before all of this passes.
  if (!ValidateAuditConfig(cfg, outError)) return false;

  if (parcels.parcels.empty() && !cfg.allowEmptyParcels) {
    outError = "parcel layer";
    if (!parcels.source.empty()) outError += " '" + parcels.source + "'";
    outError += " contains no parcels";
    return false;
  }

  ParcelTable table;
  if (!BuildParcelTable(parcels, cfg.landUseField, table, outError)) return false;

  AuditResult res;
  res.config = cfg;
  res.counters.parcels = static_cast<int>(table.size());
  res.counters.landUseClasses = static_cast<int>(table.classLabels.size());

  {
    std::ostringstream oss;
    oss << "loaded " << table.size() << " parcels, " << table.classLabels.size() << " land-use classes ('"
        << cfg.landUseField << "'); matrix " << matrix.rowLabels().size() << "x" << matrix.columnLabels().size()
        << " with " << matrix.definedCount() << " defined pairs";
    Info(log, oss.str());
  }

  res.crs = parcels.crs;
  if (!parcels.crs.isProjected()) {
    res.crsWarning = true;
    res.crsMessage = CrsMessage(parcels.crs, cfg.adjacencyDistance);
    Warn(log, res.crsMessage);
  }

  for (const std::string& label : table.classLabels) {
    if (matrix.rowIndex(label) < 0) res.counters.classesMissingRow.push_back(label);
    if (matrix.columnIndex(label) < 0) res.counters.classesMissingColumn.push_back(label);
  }
  if (!res.counters.classesMissingRow.empty()) {
    Warn(log, "land-use classes without a matrix row: " + FormatFieldList(res.counters.classesMissingRow));
  }
  if (!res.counters.classesMissingColumn.empty()) {
    Warn(log, "land-use classes without a matrix column: " + FormatFieldList(res.counters.classesMissingColumn));
  }

  // [1/5]
  auto t0 = Clock::now();
  const std::vector<ProximityRegion> regions = BufferGeometries(table.geometry, cfg.adjacencyDistance, cfg.threads);
  res.timings.prepareMs = MsSince(t0);
  {
    std::ostringstream oss;
    oss << "[1/5] prepared " << regions.size() << " proximity regions at distance " << cfg.adjacencyDistance
        << StageTime(res.timings.prepareMs);
    Info(log, oss.str());
  }

  // [2/5]
  AdjacencyConfig adj;
  adj.index.kind = cfg.spatialIndex;
  adj.index.rtreeMaxEntries = cfg.rtreeMaxEntries;
  adj.index.gridCellSize = cfg.gridCellSize;
  adj.threads = cfg.threads;

  AdjacencyStats stats;
  t0 = Clock::now();
  const std::vector<AdjacencyPair> pairs = FindAdjacencyPairs(table, regions, adj, &stats);
  res.timings.neighborsMs = MsSince(t0);
  res.counters.candidates = stats.candidates;
  res.counters.adjacencyPairs = static_cast<std::uint64_t>(pairs.size());
  {
    std::ostringstream oss;
    oss << "[2/5] found " << pairs.size() << " adjacency pairs (" << stats.candidates << " candidates, "
        << SpatialIndexKindName(cfg.spatialIndex) << " index)" << StageTime(res.timings.neighborsMs);
    Info(log, oss.str());
  }

  // [3/5]
  t0 = Clock::now();
  const std::vector<ScoredPair> scored = ScorePairs(pairs, table.classLabels, matrix, cfg.threads);
  res.timings.lookupMs = MsSince(t0);
  for (const ScoredPair& sp : scored) {
    if (sp.resolved()) {
      ++res.counters.resolvedPairs;
    } else {
      ++res.counters.unresolvedPairs;
    }
  }
  {
    std::ostringstream oss;
    oss << "[3/5] looked up " << scored.size() << " pairs: " << res.counters.resolvedPairs << " resolved, "
        << res.counters.unresolvedPairs << " unresolved" << StageTime(res.timings.lookupMs);
    Info(log, oss.str());
  }

  // [4/5]
  t0 = Clock::now();
  res.scores = AggregateWorstCase(table, scored, cfg.threads);
  res.timings.aggregateMs = MsSince(t0);
  for (const ParcelScore& ps : res.scores) {
    switch (ps.basis) {
    case ScoreBasis::Resolved: ++res.counters.parcelsResolved; break;
    case ScoreBasis::NoNeighbors: ++res.counters.parcelsNoNeighbors; break;
    case ScoreBasis::AllUnresolved: ++res.counters.parcelsAllUnresolved; break;
    }
  }
  {
    std::ostringstream oss;
    oss << "[4/5] scored " << res.scores.size() << " parcels: " << res.counters.parcelsResolved << " resolved, "
        << res.counters.parcelsNoNeighbors << " without neighbors, " << res.counters.parcelsAllUnresolved
        << " with only unresolved neighbors" << StageTime(res.timings.aggregateMs);
    Info(log, oss.str());
  }

  // [5/5]
  t0 = Clock::now();
  res.overall = SummarizeOverall(res.scores);
  res.detailed = SummarizeByClass(table, res.scores);
  res.timings.summarizeMs = MsSince(t0);
  {
    std::ostringstream oss;
    oss << "[5/5] summarized " << res.overall.totalParcels << " parcels over " << res.detailed.rows.size()
        << " land-use classes" << StageTime(res.timings.summarizeMs);
    Info(log, oss.str());
  }
  if (res.overall.outOfRange > 0) {
    std::ostringstream oss;
    oss << res.overall.outOfRange << " parcels have a score outside [" << kMinCompatScore << "," << kMaxCompatScore
        << "] (matrix contains out-of-range entries)";
    Warn(log, oss.str());
  }

  outResult = std::move(res);
  outError.clear();
  return true;
}

} // namespace landcompat
