#include "landcompat/Scoring.hpp"

#include "landcompat/Parallel.hpp"

#include <atomic>
#include <cstddef>
#include <limits>

namespace landcompat {

namespace {

constexpr std::size_t kPairChunk = 4096;
constexpr int kNoScore = std::numeric_limits<int>::max();

void AtomicMin(std::atomic<int>& a, int v)
{
  int cur = a.load(std::memory_order_relaxed);
  while (v < cur && !a.compare_exchange_weak(cur, v, std::memory_order_relaxed)) {
  }
}

} // namespace

const char* ScoreBasisName(ScoreBasis b)
{
  switch (b) {
  case ScoreBasis::Resolved: return "resolved";
  case ScoreBasis::NoNeighbors: return "no_neighbors";
  case ScoreBasis::AllUnresolved: return "all_unresolved";
  }
  return "unknown";
}

ClassMatrixMapping MapClassesToMatrix(const std::vector<std::string>& classLabels, const CompatMatrix& matrix)
{
  ClassMatrixMapping m;
  m.row.resize(classLabels.size(), -1);
  m.column.resize(classLabels.size(), -1);
  for (std::size_t i = 0; i < classLabels.size(); ++i) {
    m.row[i] = matrix.rowIndex(classLabels[i]);
    m.column[i] = matrix.columnIndex(classLabels[i]);
  }
  return m;
}

std::optional<int> LookupCompat(const CompatMatrix& matrix, const std::string& left, const std::string& right)
{
  return matrix.lookup(left, right);
}

std::vector<ScoredPair> ScorePairs(const std::vector<AdjacencyPair>& pairs, const std::vector<std::string>& classLabels,
                                   const CompatMatrix& matrix, int threads)
{
  std::vector<ScoredPair> out(pairs.size());
  if (pairs.empty()) return out;

  // Labels are resolved once per class, not once per pair.
  const ClassMatrixMapping mapping = MapClassesToMatrix(classLabels, matrix);
  const int classCount = static_cast<int>(classLabels.size());

  auto scoreOne = [&](std::size_t i) {
    const AdjacencyPair& p = pairs[i];
    ScoredPair& sp = out[i];
    sp.pair = p;
    if (p.leftClass < 0 || p.leftClass >= classCount || p.rightClass < 0 || p.rightClass >= classCount) return;
    const int r = mapping.row[static_cast<std::size_t>(p.leftClass)];
    const int c = mapping.column[static_cast<std::size_t>(p.rightClass)];
    sp.score = matrix.lookup(r, c);
  };

  const int workers = ResolveThreadCount(threads, (pairs.size() + kPairChunk - 1) / kPairChunk);
  ParallelForChunks(pairs.size(), kPairChunk, workers, [&](int, std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) scoreOne(i);
  });

  return out;
}

std::vector<ParcelScore> AggregateWorstCase(const ParcelTable& table, const std::vector<ScoredPair>& scored,
                                            int threads)
{
  const std::size_t n = table.size();

  std::vector<ParcelScore> out(n);
  for (std::size_t i = 0; i < n; ++i) out[i].parcelId = table.ids[i];
  if (n == 0) return out;

  std::vector<std::atomic<int>> minScore(n);
  std::vector<std::atomic<int>> neighbors(n);
  std::vector<std::atomic<int>> resolved(n);
  for (std::size_t i = 0; i < n; ++i) {
    minScore[i].store(kNoScore, std::memory_order_relaxed);
    neighbors[i].store(0, std::memory_order_relaxed);
    resolved[i].store(0, std::memory_order_relaxed);
  }

  const int workers = ResolveThreadCount(threads, (scored.size() + kPairChunk - 1) / kPairChunk);
  ParallelForChunks(scored.size(), kPairChunk, workers, [&](int, std::size_t begin, std::size_t end) {
    for (std::size_t k = begin; k < end; ++k) {
      const ScoredPair& sp = scored[k];
      const int left = sp.pair.left;
      if (left < 0 || static_cast<std::size_t>(left) >= n) continue;

      const std::size_t li = static_cast<std::size_t>(left);
      neighbors[li].fetch_add(1, std::memory_order_relaxed);
      if (!sp.score) continue;

      resolved[li].fetch_add(1, std::memory_order_relaxed);
      AtomicMin(minScore[li], *sp.score);
    }
  });

  for (std::size_t i = 0; i < n; ++i) {
    ParcelScore& ps = out[i];
    ps.neighbors = neighbors[i].load(std::memory_order_relaxed);
    ps.resolvedNeighbors = resolved[i].load(std::memory_order_relaxed);

    if (ps.resolvedNeighbors > 0) {
      ps.compatScore = minScore[i].load(std::memory_order_relaxed);
      ps.basis = ScoreBasis::Resolved;
    } else {
      ps.compatScore = kDefaultCompatScore;
      ps.basis = (ps.neighbors > 0) ? ScoreBasis::AllUnresolved : ScoreBasis::NoNeighbors;
    }
  }

  return out;
}

} // namespace landcompat
