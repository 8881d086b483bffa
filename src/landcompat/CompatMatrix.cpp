#include "landcompat/CompatMatrix.hpp"

namespace landcompat {

int CompatMatrix::ensureRow(const std::string& label)
{
  const auto it = m_rowIndex.find(label);
  if (it != m_rowIndex.end()) return it->second;

  const int idx = static_cast<int>(m_rows.size());
  m_rows.push_back(label);
  m_rowIndex.emplace(label, idx);
  m_cells.emplace_back();
  return idx;
}

int CompatMatrix::ensureColumn(const std::string& label)
{
  const auto it = m_colIndex.find(label);
  if (it != m_colIndex.end()) return it->second;

  const int idx = static_cast<int>(m_cols.size());
  m_cols.push_back(label);
  m_colIndex.emplace(label, idx);
  return idx;
}

void CompatMatrix::set(const std::string& left, const std::string& right, int score)
{
  const int r = ensureRow(left);
  const int c = ensureColumn(right);

  std::vector<std::optional<int>>& row = m_cells[static_cast<std::size_t>(r)];
  if (row.size() <= static_cast<std::size_t>(c)) row.resize(static_cast<std::size_t>(c) + 1);

  std::optional<int>& cell = row[static_cast<std::size_t>(c)];
  if (!cell.has_value()) ++m_defined;
  cell = score;
}

int CompatMatrix::rowIndex(const std::string& label) const
{
  const auto it = m_rowIndex.find(label);
  return (it == m_rowIndex.end()) ? -1 : it->second;
}

int CompatMatrix::columnIndex(const std::string& label) const
{
  const auto it = m_colIndex.find(label);
  return (it == m_colIndex.end()) ? -1 : it->second;
}

std::optional<int> CompatMatrix::lookup(int row, int col) const
{
  if (row < 0 || col < 0) return std::nullopt;
  if (static_cast<std::size_t>(row) >= m_cells.size()) return std::nullopt;

  const std::vector<std::optional<int>>& r = m_cells[static_cast<std::size_t>(row)];
  if (static_cast<std::size_t>(col) >= r.size()) return std::nullopt;
  return r[static_cast<std::size_t>(col)];
}

std::optional<int> CompatMatrix::lookup(const std::string& left, const std::string& right) const
{
  return lookup(rowIndex(left), columnIndex(right));
}

void CompatMatrix::clear()
{
  m_rows.clear();
  m_cols.clear();
  m_rowIndex.clear();
  m_colIndex.clear();
  m_cells.clear();
  m_defined = 0;
}

} // namespace landcompat
