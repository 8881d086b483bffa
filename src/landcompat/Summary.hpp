#pragma once

#include "landcompat/Parcels.hpp"
#include "landcompat/Scoring.hpp"

#include <array>
#include <string>
#include <vector>

namespace landcompat {

inline constexpr int kScoreLevels = kMaxCompatScore - kMinCompatScore + 1;

struct ScoreDistributionRow {
  int score = kMinCompatScore;
  int parcelCount = 0;

  // Share of all parcels in [0,100]. 0 for an empty run.
  double percentage = 0.0;
};

// City-wide distribution. Always exactly kScoreLevels rows, ascending by score.
struct OverallSummary {
  std::array<ScoreDistributionRow, kScoreLevels> rows{};
  int totalParcels = 0;

  // Parcels whose score is outside [1,5] (only possible with an out-of-range matrix entry).
  // They count towards totalParcels but not towards any row.
  int outOfRange = 0;
};

struct ClassBreakdownRow {
  std::string landUse;

  // counts[s - kMinCompatScore] = parcels of this class with score s.
  std::array<int, kScoreLevels> counts{};
  int outOfRange = 0;
  int totalParcels = 0;
};

// Per-class breakdown, one row per land-use class present in the layer, ascending by label.
struct DetailedBreakdown {
  std::vector<ClassBreakdownRow> rows;
};

// `scores` must be aligned with `table`.
OverallSummary SummarizeOverall(const std::vector<ParcelScore>& scores);
DetailedBreakdown SummarizeByClass(const ParcelTable& table, const std::vector<ParcelScore>& scores);

} // namespace landcompat
