#pragma once

#include "landcompat/SpatialIndex.hpp"

#include <string>

namespace landcompat {

// Run parameters of an audit.
struct AuditConfig {
  // Attribute holding the land-use class.
  std::string landUseField = "KARBARI_MO";

  // Two parcels are neighbors when their footprints are within this distance (CRS units,
  // meters for a metric CRS). Must be finite and >= 0.
  double adjacencyDistance = 10.0;

  SpatialIndexKind spatialIndex = SpatialIndexKind::RTree;
  int rtreeMaxEntries = 16;

  // <= 0 => derived from the mean buffered parcel extent.
  double gridCellSize = 0.0;

  // 1 = single thread, <= 0 = hardware concurrency.
  int threads = 1;

  // An empty parcel layer is a structural error unless this is set.
  bool allowEmptyParcels = false;
};

// Which artifacts ExportAuditResults writes, and where.
struct AuditExportConfig {
  std::string outputDir = ".";

  // Files are named <baseName>_overall_summary.csv, <baseName>_detailed_breakdown.csv,
  // <baseName>_scored_parcels.csv and <baseName>_audit.json.
  std::string baseName = "compatibility";

  bool writeOverallSummary = true;
  bool writeDetailedBreakdown = true;
  bool writeScoredParcels = true;
  bool writeManifest = true;
};

} // namespace landcompat
