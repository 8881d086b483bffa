#include "landcompat/CompatMatrixCsv.hpp"

#include "landcompat/Csv.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <ostream>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <vector>

namespace landcompat {

namespace {

static bool ReadFileText(const std::string& path, std::string& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream oss;
  oss << f.rdbuf();
  out = oss.str();
  return true;
}

std::string TrimBlanks(const std::string& s)
{
  std::size_t a = 0;
  std::size_t b = s.size();
  while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
  while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t')) --b;
  return s.substr(a, b - a);
}

bool IsNaSpelling(const std::string& s)
{
  static const std::unordered_set<std::string> kNa = {
      "",     "NA",   "N/A",  "n/a",  "NaN",  "nan",  "-NaN", "-nan", "#N/A", "#NA",
      "null", "NULL", "None", "<NA>", "-1.#IND", "1.#QNAN", "#N/A N/A",
  };
  return kNa.count(s) != 0;
}

enum class ScoreParse {
  Missing,
  Ok,
  NotNumber,
  NotInteger,
};

ScoreParse ParseScoreCell(const std::string& raw, int& out)
{
  const std::string s = TrimBlanks(raw);
  if (IsNaSpelling(s)) return ScoreParse::Missing;

  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || (end && *end != '\0') || errno == ERANGE) return ScoreParse::NotNumber;
  if (!std::isfinite(v)) return ScoreParse::NotNumber;

  if (std::floor(v) != v) return ScoreParse::NotInteger;
  if (v < static_cast<double>(std::numeric_limits<int>::min()) ||
      v > static_cast<double>(std::numeric_limits<int>::max())) {
    return ScoreParse::NotInteger;
  }

  out = static_cast<int>(v);
  return ScoreParse::Ok;
}

std::string Where(const std::string& source, int line)
{
  std::ostringstream oss;
  oss << (source.empty() ? std::string("matrix") : source);
  if (line > 0) oss << ":" << line;
  oss << ": ";
  return oss.str();
}

} // namespace

bool ParseCompatMatrixCsv(const std::string& text, const std::string& source, CompatMatrix& outMatrix,
                          std::string& outError)
{
  outMatrix.clear();

  CompatMatrix parsed;
  parsed.setSource(source);

  std::vector<CsvRow> rows;
  std::string err;
  if (!ParseCsv(text, rows, err)) {
    outError = Where(source, 0) + err;
    return false;
  }

  if (rows.empty()) {
    outError = Where(source, 0) + "matrix has no header row";
    return false;
  }

  const CsvRow& header = rows.front();
  const std::size_t width = header.cells.size();

  std::vector<std::string> columns;
  columns.reserve(width > 0 ? width - 1 : 0);
  for (std::size_t c = 1; c < width; ++c) {
    const std::string& label = header.cells[c];
    if (parsed.columnIndex(label) >= 0) {
      outError = Where(source, header.line) + "duplicate column label '" + label + "'";
      return false;
    }
    parsed.ensureColumn(label);
    columns.push_back(label);
  }

  for (std::size_t r = 1; r < rows.size(); ++r) {
    const CsvRow& row = rows[r];
    const std::string& label = row.cells.front();

    if (row.cells.size() > width) {
      std::ostringstream oss;
      oss << "row '" << label << "' has " << row.cells.size() << " cells but the header has " << width;
      outError = Where(source, row.line) + oss.str();
      return false;
    }

    if (parsed.rowIndex(label) >= 0) {
      outError = Where(source, row.line) + "duplicate row label '" + label + "'";
      return false;
    }
    parsed.ensureRow(label);

    for (std::size_t c = 1; c < row.cells.size(); ++c) {
      int score = 0;
      const std::string& column = columns[c - 1];
      switch (ParseScoreCell(row.cells[c], score)) {
      case ScoreParse::Missing: break;
      case ScoreParse::Ok: parsed.set(label, column, score); break;
      case ScoreParse::NotNumber:
        outError = Where(source, row.line) + "score for ('" + label + "', '" + column + "') is not a number: '" +
                   row.cells[c] + "'";
        return false;
      case ScoreParse::NotInteger:
        outError = Where(source, row.line) + "score for ('" + label + "', '" + column + "') is not an integer: '" +
                   row.cells[c] + "'";
        return false;
      }
    }
  }

  outMatrix = std::move(parsed);
  outError.clear();
  return true;
}

bool LoadCompatMatrixCsvFile(const std::string& path, CompatMatrix& outMatrix, std::string& outError)
{
  std::string text;
  if (!ReadFileText(path, text)) {
    outMatrix.clear();
    outError = "matrix CSV not found or unreadable: " + path;
    return false;
  }
  return ParseCompatMatrixCsv(text, path, outMatrix, outError);
}

bool WriteCompatMatrixCsv(std::ostream& os, const CompatMatrix& matrix, const std::string& indexName)
{
  os << CsvEscape(indexName);
  for (const std::string& c : matrix.columnLabels()) os << ',' << CsvEscape(c);
  os << '\n';

  const int cols = static_cast<int>(matrix.columnLabels().size());
  for (int r = 0; r < static_cast<int>(matrix.rowLabels().size()); ++r) {
    os << CsvEscape(matrix.rowLabels()[static_cast<std::size_t>(r)]);
    for (int c = 0; c < cols; ++c) {
      os << ',';
      const std::optional<int> v = matrix.lookup(r, c);
      if (v) os << *v;
    }
    os << '\n';
  }
  return static_cast<bool>(os);
}

} // namespace landcompat
