#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "finmda_core/types/financial.hpp"

namespace finmda_core {

struct CsvColumns {
  std::string company = "company";
  std::string period = "period";
  std::string concept_name = "concept";
  std::string value = "value";
};

/**
 * @brief Reads company/period/concept/value rows from CSV extracts.
 *
 * Header names are matched exactly first, then case-insensitively. Rows with
 * an empty company, period or concept are dropped; so are rows whose value is
 * empty or not a number.
 */
class FinancialDataLoader {
 public:
  explicit FinancialDataLoader(CsvColumns columns = {});

  // Throws DataLoadError when a required column is missing or a quote is unterminated.
  std::vector<TimeSeriesPoint> load(std::istream &input, const std::string &source = "<stream>") const;
  std::vector<TimeSeriesPoint> load_file(const std::filesystem::path &path) const;

  // Every *.csv file in the directory, in file name order. Unreadable files are
  // skipped with a warning; throws DataLoadError when nothing could be loaded.
  std::vector<TimeSeriesPoint> load_directory(const std::filesystem::path &directory) const;

  static std::vector<std::string> split_csv_line(const std::string &line, bool *unterminated);

 private:
  CsvColumns columns_;
};

}  // namespace finmda_core
