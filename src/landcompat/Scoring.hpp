#pragma once

#include "landcompat/Adjacency.hpp"
#include "landcompat/CompatMatrix.hpp"
#include "landcompat/Parcels.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace landcompat {

// Score assigned when a parcel has no evidence of friction: no neighbors at all, or only
// neighbors whose class pair is missing from the matrix. Biased towards NOT flagging a parcel.
inline constexpr int kDefaultCompatScore = kMaxCompatScore;

struct ScoredPair {
  AdjacencyPair pair;

  // std::nullopt => the (left class, right class) pair is not in the matrix.
  std::optional<int> score;

  bool resolved() const { return score.has_value(); }
};

// Why a parcel ended up with its score. The two default cases share kDefaultCompatScore but
// carry different confidence, so they are kept apart here.
enum class ScoreBasis : std::uint8_t {
  Resolved = 0,      // minimum over at least one resolved neighbor score
  NoNeighbors = 1,   // nothing within the adjacency distance
  AllUnresolved = 2, // neighbors exist, none of their class pairs are in the matrix
};

const char* ScoreBasisName(ScoreBasis b);

struct ParcelScore {
  std::int64_t parcelId = 0;
  int compatScore = kDefaultCompatScore;
  ScoreBasis basis = ScoreBasis::NoNeighbors;

  int neighbors = 0;
  int resolvedNeighbors = 0;

  bool operator==(const ParcelScore& o) const
  {
    return parcelId == o.parcelId && compatScore == o.compatScore && basis == o.basis &&
           neighbors == o.neighbors && resolvedNeighbors == o.resolvedNeighbors;
  }
  bool operator!=(const ParcelScore& o) const { return !(*this == o); }
};

// Parcel class index -> matrix row / column index (-1 when the class is absent on that axis).
struct ClassMatrixMapping {
  std::vector<int> row;
  std::vector<int> column;
};

ClassMatrixMapping MapClassesToMatrix(const std::vector<std::string>& classLabels, const CompatMatrix& matrix);

// Resolve the score for exactly the ordered pair (left, right). Never symmetrizes.
std::optional<int> LookupCompat(const CompatMatrix& matrix, const std::string& left, const std::string& right);

// Attach a lookup result to every pair. Output order matches `pairs`.
std::vector<ScoredPair> ScorePairs(const std::vector<AdjacencyPair>& pairs, const std::vector<std::string>& classLabels,
                                   const CompatMatrix& matrix, int threads = 1);

// Worst-case reduction: for each parcel, the minimum resolved score among the pairs where it is
// the left parcel. Unresolved pairs are skipped (not treated as 0, not treated as 5). Parcels
// without a resolved pair get kDefaultCompatScore.
//
// The per-parcel minimum is computed with a concurrent min-reduction, so the result does not
// depend on the order of `scored` or the thread count. Output is aligned with `table`.
std::vector<ParcelScore> AggregateWorstCase(const ParcelTable& table, const std::vector<ScoredPair>& scored,
                                            int threads = 1);

} // namespace landcompat
