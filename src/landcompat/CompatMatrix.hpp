#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace landcompat {

// Lower bound / upper bound of the documented score scale. Matrix values are NOT validated
// against it; they are carried through as given.
inline constexpr int kMinCompatScore = 1;
inline constexpr int kMaxCompatScore = 5;

// -----------------------------------------------------------------------------------------------
// Compatibility matrix
//
// A directional mapping (left class, right class) -> integer score. Rows are the class whose
// perspective is being scored, columns are the neighbor's class. (A,B) and (B,A) are separate
// entries; nothing is symmetrized.
//
// The matrix may be rectangular and sparse: a pair without a value is "unresolved", which
// lookup() reports as std::nullopt. That is distinct from any real score.
// -----------------------------------------------------------------------------------------------
class CompatMatrix {
public:
  void set(const std::string& left, const std::string& right, int score);

  // Declare a label without assigning any pair (keeps CSV header order round-trippable).
  int ensureRow(const std::string& label);
  int ensureColumn(const std::string& label);

  std::optional<int> lookup(const std::string& left, const std::string& right) const;
  std::optional<int> lookup(int row, int col) const;

  // -1 if the label is not present.
  int rowIndex(const std::string& label) const;
  int columnIndex(const std::string& label) const;

  const std::vector<std::string>& rowLabels() const { return m_rows; }
  const std::vector<std::string>& columnLabels() const { return m_cols; }

  // Number of (row, col) pairs that carry a score.
  std::size_t definedCount() const { return m_defined; }
  bool empty() const { return m_defined == 0; }

  void clear();

  // Where the matrix came from (file path or label). Used in messages only.
  const std::string& source() const { return m_source; }
  void setSource(std::string s) { m_source = std::move(s); }

private:
  std::vector<std::string> m_rows;
  std::vector<std::string> m_cols;
  std::unordered_map<std::string, int> m_rowIndex;
  std::unordered_map<std::string, int> m_colIndex;

  // m_cells[row][col]; rows are grown lazily so they may be shorter than m_cols.
  std::vector<std::vector<std::optional<int>>> m_cells;
  std::size_t m_defined = 0;

  std::string m_source;
};

} // namespace landcompat
