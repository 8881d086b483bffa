#include "landcompat/Csv.hpp"

#include <cstddef>
#include <utility>

namespace landcompat {

bool ParseCsv(const std::string& text, std::vector<CsvRow>& outRows, std::string& outError)
{
  outRows.clear();

  std::size_t i = 0;
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF && static_cast<unsigned char>(text[1]) == 0xBB &&
      static_cast<unsigned char>(text[2]) == 0xBF) {
    i = 3;
  }

  int line = 1;
  CsvRow row;
  row.line = line;
  std::string cell;
  bool inQuotes = false;
  bool cellWasQuoted = false;
  bool rowHasContent = false;

  auto endCell = [&]() {
    row.cells.push_back(std::move(cell));
    cell.clear();
    cellWasQuoted = false;
  };

  auto endRow = [&]() {
    if (rowHasContent) {
      endCell();
      outRows.push_back(std::move(row));
    }
    row = CsvRow{};
    cell.clear();
    cellWasQuoted = false;
    rowHasContent = false;
  };

  while (i < text.size()) {
    const char c = text[i];

    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          cell.push_back('"');
          i += 2;
          continue;
        }
        inQuotes = false;
        ++i;
        continue;
      }
      if (c == '\n') ++line;
      cell.push_back(c);
      ++i;
      continue;
    }

    if (c == '"') {
      if (!cell.empty() || cellWasQuoted) {
        outError = "line " + std::to_string(line) + ": unexpected quote inside unquoted field";
        return false;
      }
      inQuotes = true;
      cellWasQuoted = true;
      rowHasContent = true;
      ++i;
      continue;
    }

    if (c == ',') {
      rowHasContent = true;
      endCell();
      ++i;
      continue;
    }

    if (c == '\r' || c == '\n') {
      endRow();
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
      ++i;
      ++line;
      row.line = line;
      continue;
    }

    if (cellWasQuoted) {
      outError = "line " + std::to_string(line) + ": unexpected character after closing quote";
      return false;
    }

    cell.push_back(c);
    rowHasContent = true;
    ++i;
  }

  if (inQuotes) {
    outError = "line " + std::to_string(row.line) + ": unterminated quoted field";
    return false;
  }
  endRow();

  outError.clear();
  return true;
}

std::string CsvEscape(const std::string& s)
{
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // namespace landcompat
