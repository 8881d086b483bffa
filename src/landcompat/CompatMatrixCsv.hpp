#pragma once

#include "landcompat/CompatMatrix.hpp"

#include <iosfwd>
#include <string>

namespace landcompat {

// CSV layout of a compatibility matrix (the usual spreadsheet export):
//
//   <index name>,Residential,Commercial,Industrial
//   Residential,5,4,1
//   Commercial,4,5,3
//   Industrial,1,3,5
//
// The first column holds the left (row) class, the header holds the right (column) classes.
// Empty cells and the usual NA spellings (NA, N/A, NaN, null, ...) leave the pair unresolved.
//
// Parse failures are structural errors and carry "<source>:<line>" context:
//  - no header row, duplicate row or column labels,
//  - rows with more cells than the header,
//  - scores that are not integers (non-numeric text, fractional values, out of int range).
//
// Integer scores outside [1,5] are accepted as-is.

// Parse `text` into `outMatrix` (replaced). `source` names the input in error messages and is
// stored as the matrix source. On failure `outMatrix` is left empty.
bool ParseCompatMatrixCsv(const std::string& text, const std::string& source, CompatMatrix& outMatrix,
                          std::string& outError);

bool LoadCompatMatrixCsvFile(const std::string& path, CompatMatrix& outMatrix, std::string& outError);

// Write a matrix back in the same layout. Missing pairs are written as empty cells.
bool WriteCompatMatrixCsv(std::ostream& os, const CompatMatrix& matrix, const std::string& indexName = std::string());

} // namespace landcompat
