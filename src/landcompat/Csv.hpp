#pragma once

#include <string>
#include <vector>

namespace landcompat {

// Minimal RFC 4180 CSV support (dependency-free).
//
// Notes:
//  - Fields may be quoted; quoted fields may contain commas, newlines and "" escapes.
//  - LF and CRLF line endings are accepted. A leading UTF-8 BOM is ignored.
//  - Completely empty lines are skipped.
//  - Cells are not trimmed.

struct CsvRow {
  std::vector<std::string> cells;

  // 1-based line number where the record starts.
  int line = 0;
};

bool ParseCsv(const std::string& text, std::vector<CsvRow>& outRows, std::string& outError);

// Quote a field if it contains a comma, quote, CR or LF.
std::string CsvEscape(const std::string& s);

} // namespace landcompat
