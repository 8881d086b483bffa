#include "landcompat/AuditExport.hpp"

#include "landcompat/Csv.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace landcompat {

namespace fs = std::filesystem;

namespace {

bool StreamOk(std::ostream& os, std::string* outError)
{
  if (os) return true;
  if (outError) *outError = "stream write failed";
  return false;
}

JsonValue Num(double v) { return JsonValue::MakeNumber(v); }

// Open `path` for writing, write through fn(stream), and report failures with the path.
template <typename Fn>
bool WriteFileWith(const std::string& path, std::string* outError, Fn&& fn)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    if (outError) *outError = "failed to open for writing: " + path;
    return false;
  }
  if (!fn(f)) {
    if (outError && outError->empty()) *outError = "failed to write: " + path;
    else if (outError) *outError = path + ": " + *outError;
    return false;
  }
  f.flush();
  if (!f) {
    if (outError) *outError = "failed to write: " + path;
    return false;
  }
  return true;
}

} // namespace

bool WriteOverallSummaryCsv(std::ostream& os, const OverallSummary& s, std::string* outError)
{
  if (outError) outError->clear();

  os << "compatibility_score,parcel_count,percentage\n";
  for (const ScoreDistributionRow& r : s.rows) {
    std::ostringstream pct;
    pct << std::fixed << std::setprecision(6) << r.percentage;
    os << r.score << "," << r.parcelCount << "," << pct.str() << "\n";
  }
  return StreamOk(os, outError);
}

bool WriteDetailedBreakdownCsv(std::ostream& os, const DetailedBreakdown& d, const std::string& landUseField,
                               std::string* outError)
{
  if (outError) outError->clear();

  os << CsvEscape(landUseField);
  for (int s = kMinCompatScore; s <= kMaxCompatScore; ++s) os << "," << s;
  os << ",total_parcels\n";

  for (const ClassBreakdownRow& r : d.rows) {
    os << CsvEscape(r.landUse);
    for (int c : r.counts) os << "," << c;
    os << "," << r.totalParcels << "\n";
  }
  return StreamOk(os, outError);
}

bool BuildScoredCollection(const ParcelCollection& parcels, const std::vector<ParcelScore>& scores,
                           ParcelCollection& outScored, std::string* outError)
{
  if (outError) outError->clear();
  if (scores.size() != parcels.parcels.size()) {
    if (outError) {
      *outError = "score count (" + std::to_string(scores.size()) + ") does not match parcel count (" +
                  std::to_string(parcels.parcels.size()) + ")";
    }
    return false;
  }

  ParcelCollection out = parcels;
  const int field = out.ensureField(kCompatScoreField);
  for (std::size_t i = 0; i < out.parcels.size(); ++i) {
    std::vector<std::string>& values = out.parcels[i].values;
    if (values.size() < out.fields.size()) values.resize(out.fields.size());
    values[static_cast<std::size_t>(field)] = std::to_string(scores[i].compatScore);
  }

  outScored = std::move(out);
  return true;
}

bool WriteParcelAttributesCsv(std::ostream& os, const ParcelCollection& parcels, std::string* outError)
{
  if (outError) outError->clear();

  os << "id";
  for (const std::string& f : parcels.fields) os << "," << CsvEscape(f);
  os << "\n";

  for (std::size_t i = 0; i < parcels.parcels.size(); ++i) {
    const Parcel& p = parcels.parcels[i];
    os << parcels.effectiveId(i);
    for (std::size_t k = 0; k < parcels.fields.size(); ++k) {
      os << ",";
      if (k < p.values.size()) os << CsvEscape(p.values[k]);
    }
    os << "\n";
  }
  return StreamOk(os, outError);
}

JsonValue AuditManifestToJsonValue(const AuditResult& r, const std::string& parcelSource,
                                   const std::string& matrixSource)
{
  const AuditConfig& cfg = r.config;
  const AuditCounters& c = r.counters;

  JsonValue root = JsonValue::MakeObject();

  JsonValue inputs = JsonValue::MakeObject();
  inputs.set("parcels", JsonValue::MakeString(parcelSource));
  inputs.set("matrix", JsonValue::MakeString(matrixSource));
  root.set("inputs", std::move(inputs));

  JsonValue config = JsonValue::MakeObject();
  config.set("land_use_field", JsonValue::MakeString(cfg.landUseField));
  config.set("adjacency_distance", Num(cfg.adjacencyDistance));
  config.set("spatial_index", JsonValue::MakeString(SpatialIndexKindName(cfg.spatialIndex)));
  config.set("threads", Num(cfg.threads));
  root.set("config", std::move(config));

  JsonValue counts = JsonValue::MakeObject();
  counts.set("parcels", Num(c.parcels));
  counts.set("land_use_classes", Num(c.landUseClasses));
  counts.set("index_candidates", Num(static_cast<double>(c.candidates)));
  counts.set("adjacency_pairs", Num(static_cast<double>(c.adjacencyPairs)));
  counts.set("resolved_pairs", Num(static_cast<double>(c.resolvedPairs)));
  counts.set("unresolved_pairs", Num(static_cast<double>(c.unresolvedPairs)));

  JsonValue basis = JsonValue::MakeObject();
  basis.set(ScoreBasisName(ScoreBasis::Resolved), Num(c.parcelsResolved));
  basis.set(ScoreBasisName(ScoreBasis::NoNeighbors), Num(c.parcelsNoNeighbors));
  basis.set(ScoreBasisName(ScoreBasis::AllUnresolved), Num(c.parcelsAllUnresolved));
  counts.set("parcels_by_basis", std::move(basis));
  counts.set("out_of_range_scores", Num(r.overall.outOfRange));
  root.set("counts", std::move(counts));

  JsonValue missingRow = JsonValue::MakeArray();
  for (const std::string& s : c.classesMissingRow) missingRow.arrayValue.push_back(JsonValue::MakeString(s));
  JsonValue missingCol = JsonValue::MakeArray();
  for (const std::string& s : c.classesMissingColumn) missingCol.arrayValue.push_back(JsonValue::MakeString(s));
  JsonValue coverage = JsonValue::MakeObject();
  coverage.set("classes_missing_row", std::move(missingRow));
  coverage.set("classes_missing_column", std::move(missingCol));
  root.set("matrix_coverage", std::move(coverage));

  JsonValue distribution = JsonValue::MakeArray();
  for (const ScoreDistributionRow& row : r.overall.rows) {
    JsonValue e = JsonValue::MakeObject();
    e.set("compatibility_score", Num(row.score));
    e.set("parcel_count", Num(row.parcelCount));
    e.set("percentage", Num(row.percentage));
    distribution.arrayValue.push_back(std::move(e));
  }
  root.set("overall_summary", std::move(distribution));

  JsonValue crs = JsonValue::MakeObject();
  crs.set("kind", JsonValue::MakeString(CrsKindName(r.crs.kind)));
  crs.set("name", JsonValue::MakeString(r.crs.name));
  crs.set("warning", JsonValue::MakeBool(r.crsWarning));
  crs.set("message", JsonValue::MakeString(r.crsMessage));
  root.set("crs", std::move(crs));

  JsonValue timings = JsonValue::MakeObject();
  timings.set("prepare", Num(r.timings.prepareMs));
  timings.set("neighbors", Num(r.timings.neighborsMs));
  timings.set("lookup", Num(r.timings.lookupMs));
  timings.set("aggregate", Num(r.timings.aggregateMs));
  timings.set("summarize", Num(r.timings.summarizeMs));
  timings.set("total", Num(r.timings.totalMs()));
  root.set("timings_ms", std::move(timings));

  return root;
}

bool WriteAuditManifestJson(std::ostream& os, const AuditResult& r, const std::string& parcelSource,
                            const std::string& matrixSource, std::string* outError)
{
  std::string err;
  if (!WriteJson(os, AuditManifestToJsonValue(r, parcelSource, matrixSource), err)) {
    if (outError) *outError = err;
    return false;
  }
  if (outError) outError->clear();
  return true;
}

bool ExportAuditResults(const ParcelCollection& parcels, const CompatMatrix& matrix, const AuditResult& r,
                        const AuditExportConfig& cfg, std::string* outError, std::vector<std::string>* outWritten)
{
  if (outError) outError->clear();

  if (cfg.baseName.empty()) {
    if (outError) *outError = "export base name is empty";
    return false;
  }

  const fs::path dir = cfg.outputDir.empty() ? fs::path(".") : fs::path(cfg.outputDir);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    if (outError) *outError = "failed to create output directory '" + dir.string() + "': " + ec.message();
    return false;
  }

  auto pathFor = [&](const char* suffix) { return (dir / (cfg.baseName + suffix)).string(); };
  auto written = [&](const std::string& p) {
    if (outWritten) outWritten->push_back(p);
  };

  if (cfg.writeOverallSummary) {
    const std::string p = pathFor("_overall_summary.csv");
    if (!WriteFileWith(p, outError, [&](std::ostream& os) { return WriteOverallSummaryCsv(os, r.overall, outError); }))
      return false;
    written(p);
  }

  if (cfg.writeDetailedBreakdown) {
    const std::string p = pathFor("_detailed_breakdown.csv");
    if (!WriteFileWith(p, outError, [&](std::ostream& os) {
          return WriteDetailedBreakdownCsv(os, r.detailed, r.config.landUseField, outError);
        }))
      return false;
    written(p);
  }

  if (cfg.writeScoredParcels) {
    ParcelCollection scored;
    if (!BuildScoredCollection(parcels, r.scores, scored, outError)) return false;

    const std::string p = pathFor("_scored_parcels.csv");
    if (!WriteFileWith(p, outError, [&](std::ostream& os) { return WriteParcelAttributesCsv(os, scored, outError); }))
      return false;
    written(p);
  }

  if (cfg.writeManifest) {
    const std::string p = pathFor("_audit.json");
    if (!WriteFileWith(p, outError, [&](std::ostream& os) {
          return WriteAuditManifestJson(os, r, parcels.source, matrix.source(), outError);
        }))
      return false;
    written(p);
  }

  if (outError) outError->clear();
  return true;
}

} // namespace landcompat
