#include "landcompat/CompatMatrixCsv.hpp"
#include "landcompat/Csv.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                         \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";             \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                         \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

using namespace landcompat;

static bool Contains(const std::string& haystack, const std::string& needle)
{
  return haystack.find(needle) != std::string::npos;
}

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static void TestCsvQuotingAndLineEndings()
{
  std::vector<CsvRow> rows;
  std::string err;

  const std::string text = "\xEF\xBB\xBF"
                           "a,\"b,c\",\"say \"\"hi\"\"\"\r\n"
                           "\r\n"
                           "\"multi\nline\",,x\n"
                           "last";
  ASSERT_TRUE(ParseCsv(text, rows, err));
  ASSERT_TRUE(rows.size() == 3);

  EXPECT_EQ(rows[0].cells, (std::vector<std::string>{"a", "b,c", "say \"hi\""}));
  EXPECT_EQ(rows[0].line, 1);

  EXPECT_EQ(rows[1].cells, (std::vector<std::string>{"multi\nline", "", "x"}));
  EXPECT_EQ(rows[1].line, 3);

  EXPECT_EQ(rows[2].cells, (std::vector<std::string>{"last"}));
  EXPECT_EQ(rows[2].line, 5);

  EXPECT_FALSE(ParseCsv("a,\"open\n", rows, err));
  EXPECT_TRUE(Contains(err, "unterminated"));

  EXPECT_FALSE(ParseCsv("a,b\"c\n", rows, err));
  EXPECT_TRUE(Contains(err, "line 1"));

  EXPECT_EQ(CsvEscape("plain"), std::string("plain"));
  EXPECT_EQ(CsvEscape("a,b"), std::string("\"a,b\""));
  EXPECT_EQ(CsvEscape("q\"q"), std::string("\"q\"\"q\""));
}

static void TestParseDirectionalMatrix()
{
  const std::string text = "KARBARI_MO,Residential,Commercial,Industrial\n"
                           "Residential,5,4,1\n"
                           "Commercial,3,5,NA\n"
                           "Industrial,2,, 5 \n";

  CompatMatrix m;
  std::string err;
  ASSERT_TRUE(ParseCompatMatrixCsv(text, "matrix.csv", m, err));
  EXPECT_TRUE(err.empty());

  EXPECT_EQ(m.rowLabels().size(), static_cast<std::size_t>(3));
  EXPECT_EQ(m.columnLabels().size(), static_cast<std::size_t>(3));
  EXPECT_EQ(m.definedCount(), static_cast<std::size_t>(7));
  EXPECT_EQ(m.source(), std::string("matrix.csv"));

  EXPECT_EQ(m.lookup("Residential", "Industrial"), std::optional<int>(1));
  EXPECT_EQ(m.lookup("Industrial", "Residential"), std::optional<int>(2));
  EXPECT_EQ(m.lookup("Commercial", "Residential"), std::optional<int>(3));
  EXPECT_EQ(m.lookup("Industrial", "Industrial"), std::optional<int>(5));

  // NA and empty cells are missing, not zero.
  EXPECT_FALSE(m.lookup("Commercial", "Industrial").has_value());
  EXPECT_FALSE(m.lookup("Industrial", "Commercial").has_value());

  // Labels are matched literally.
  EXPECT_FALSE(m.lookup("residential", "Industrial").has_value());
  EXPECT_FALSE(m.lookup("Park", "Residential").has_value());
}

static void TestShortRowsAndOutOfRangeScores()
{
  const std::string text = ",A,B,C\n"
                           "A,7\n"
                           "B,0,-2.0\n";

  CompatMatrix m;
  std::string err;
  ASSERT_TRUE(ParseCompatMatrixCsv(text, "m", m, err));

  // Out-of-range integers are kept as-is; range is the aggregator's problem, not the loader's.
  EXPECT_EQ(m.lookup("A", "A"), std::optional<int>(7));
  EXPECT_EQ(m.lookup("B", "A"), std::optional<int>(0));
  EXPECT_EQ(m.lookup("B", "B"), std::optional<int>(-2));
  EXPECT_FALSE(m.lookup("A", "C").has_value());
  EXPECT_EQ(m.definedCount(), static_cast<std::size_t>(3));
}

static void TestStructuralErrors()
{
  CompatMatrix m;
  std::string err;

  EXPECT_FALSE(ParseCompatMatrixCsv("", "empty.csv", m, err));
  EXPECT_TRUE(Contains(err, "empty.csv"));
  EXPECT_TRUE(Contains(err, "no header"));

  EXPECT_FALSE(ParseCompatMatrixCsv(",A,A\nA,1,2\n", "dup.csv", m, err));
  EXPECT_TRUE(Contains(err, "dup.csv:1"));
  EXPECT_TRUE(Contains(err, "duplicate column"));

  EXPECT_FALSE(ParseCompatMatrixCsv(",A,B\nA,1,2\nB,3,4\nA,5,5\n", "dup.csv", m, err));
  EXPECT_TRUE(Contains(err, "dup.csv:4"));
  EXPECT_TRUE(Contains(err, "duplicate row"));

  EXPECT_FALSE(ParseCompatMatrixCsv(",A\nA,1,2\n", "wide.csv", m, err));
  EXPECT_TRUE(Contains(err, "wide.csv:2"));

  EXPECT_FALSE(ParseCompatMatrixCsv(",A,B\nA,1,high\n", "text.csv", m, err));
  EXPECT_TRUE(Contains(err, "text.csv:2"));
  EXPECT_TRUE(Contains(err, "not a number"));
  EXPECT_TRUE(Contains(err, "'high'"));

  EXPECT_FALSE(ParseCompatMatrixCsv(",A,B\nA,1,2.5\n", "frac.csv", m, err));
  EXPECT_TRUE(Contains(err, "not an integer"));

  // A failed parse leaves an empty matrix behind.
  EXPECT_TRUE(m.empty());
  EXPECT_TRUE(m.rowLabels().empty());
}

static void TestFileLoadAndWriteBack()
{
  CompatMatrix m;
  std::string err;

  const fs::path missing = MakeTempPath("landcompat_missing_matrix");
  EXPECT_FALSE(LoadCompatMatrixCsvFile(missing.string(), m, err));
  EXPECT_TRUE(Contains(err, "not found"));
  EXPECT_TRUE(Contains(err, missing.string()));

  const fs::path file = MakeTempPath("landcompat_matrix") += ".csv";
  {
    std::ofstream f(file, std::ios::binary);
    f << "use,\"Mixed, dense\",Green\r\n"
         "\"Mixed, dense\",4,5\r\n"
         "Green,5,\r\n";
  }

  ASSERT_TRUE(LoadCompatMatrixCsvFile(file.string(), m, err));
  EXPECT_EQ(m.lookup("Mixed, dense", "Green"), std::optional<int>(5));
  EXPECT_FALSE(m.lookup("Green", "Green").has_value());
  EXPECT_EQ(m.source(), file.string());

  std::ostringstream oss;
  EXPECT_TRUE(WriteCompatMatrixCsv(oss, m, "use"));
  EXPECT_EQ(oss.str(), std::string("use,\"Mixed, dense\",Green\n"
                                   "\"Mixed, dense\",4,5\n"
                                   "Green,5,\n"));

  std::error_code ec;
  fs::remove(file, ec);
}

int main()
{
  TestCsvQuotingAndLineEndings();
  TestParseDirectionalMatrix();
  TestShortRowsAndOutOfRangeScores();
  TestStructuralErrors();
  TestFileLoadAndWriteBack();

  if (g_failures == 0) {
    std::cout << "landcompat_matrix_csv_tests: OK\n";
    return 0;
  }

  std::cerr << "landcompat_matrix_csv_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
