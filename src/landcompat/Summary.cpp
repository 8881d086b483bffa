#include "landcompat/Summary.hpp"

#include <algorithm>
#include <cstddef>

namespace landcompat {

namespace {

bool InRange(int score) { return score >= kMinCompatScore && score <= kMaxCompatScore; }

} // namespace

OverallSummary SummarizeOverall(const std::vector<ParcelScore>& scores)
{
  OverallSummary s;
  for (int i = 0; i < kScoreLevels; ++i) s.rows[static_cast<std::size_t>(i)].score = kMinCompatScore + i;

  for (const ParcelScore& ps : scores) {
    ++s.totalParcels;
    if (!InRange(ps.compatScore)) {
      ++s.outOfRange;
      continue;
    }
    ++s.rows[static_cast<std::size_t>(ps.compatScore - kMinCompatScore)].parcelCount;
  }

  if (s.totalParcels > 0) {
    const double denom = static_cast<double>(s.totalParcels);
    for (ScoreDistributionRow& r : s.rows) r.percentage = 100.0 * static_cast<double>(r.parcelCount) / denom;
  }
  return s;
}

DetailedBreakdown SummarizeByClass(const ParcelTable& table, const std::vector<ParcelScore>& scores)
{
  DetailedBreakdown d;
  d.rows.resize(table.classLabels.size());
  for (std::size_t c = 0; c < table.classLabels.size(); ++c) d.rows[c].landUse = table.classLabels[c];

  const std::size_t n = std::min(table.size(), scores.size());
  for (std::size_t i = 0; i < n; ++i) {
    const int cls = table.classOf[i];
    if (cls < 0 || static_cast<std::size_t>(cls) >= d.rows.size()) continue;

    ClassBreakdownRow& row = d.rows[static_cast<std::size_t>(cls)];
    ++row.totalParcels;

    const int score = scores[i].compatScore;
    if (InRange(score)) {
      ++row.counts[static_cast<std::size_t>(score - kMinCompatScore)];
    } else {
      ++row.outOfRange;
    }
  }
  return d;
}

} // namespace landcompat
