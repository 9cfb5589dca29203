#include "finmda_core/data/financial_data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

#include "finmda_core/errors.hpp"

namespace finmda_core {

namespace {

std::string trim(const std::string &text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::optional<size_t> find_column(const std::vector<std::string> &header,
                                  const std::string &name) {
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == name) {
      return i;
    }
  }
  for (size_t i = 0; i < header.size(); ++i) {
    if (lower(header[i]) == lower(name)) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<double> parse_number(const std::string &text) {
  const std::string trimmed = trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(trimmed.c_str(), &end);
  if (end != trimmed.c_str() + trimmed.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

FinancialDataLoader::FinancialDataLoader(CsvColumns columns) : columns_(std::move(columns)) {}

std::vector<std::string> FinancialDataLoader::split_csv_line(const std::string &line,
                                                             bool *unterminated) {
  std::vector<std::string> fields;
  std::string field;
  bool in_quotes = false;
  for (size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      fields.push_back(field);
      field.clear();
    } else if (c != '\r') {
      field.push_back(c);
    }
  }
  fields.push_back(field);
  if (unterminated) {
    *unterminated = in_quotes;
  }
  return fields;
}

std::vector<TimeSeriesPoint> FinancialDataLoader::load(std::istream &input,
                                                       const std::string &source) const {
  std::string line;
  if (!std::getline(input, line)) {
    throw DataLoadError(source + ": file is empty");
  }
  if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    line.erase(0, 3);
  }

  bool unterminated = false;
  std::vector<std::string> header = split_csv_line(line, &unterminated);
  for (auto &name : header) {
    name = trim(name);
  }

  auto company_col = find_column(header, columns_.company);
  auto period_col = find_column(header, columns_.period);
  auto concept_col = find_column(header, columns_.concept_name);
  auto value_col = find_column(header, columns_.value);
  if (!company_col || !period_col || !concept_col || !value_col) {
    throw DataLoadError(source + ": header must contain columns '" + columns_.company + "', '" +
                        columns_.period + "', '" + columns_.concept_name + "' and '" +
                        columns_.value + "'");
  }
  const size_t needed =
      std::max({*company_col, *period_col, *concept_col, *value_col}) + 1;

  std::vector<TimeSeriesPoint> points;
  size_t line_number = 1;
  size_t dropped = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (trim(line).empty()) {
      continue;
    }
    std::vector<std::string> fields = split_csv_line(line, &unterminated);
    if (unterminated) {
      throw DataLoadError(source + ":" + std::to_string(line_number) + ": unterminated quote");
    }
    if (fields.size() < needed) {
      ++dropped;
      continue;
    }

    TimeSeriesPoint point;
    point.company = trim(fields[*company_col]);
    point.period = trim(fields[*period_col]);
    point.concept_name = trim(fields[*concept_col]);
    std::optional<double> value = parse_number(fields[*value_col]);
    if (point.company.empty() || point.period.empty() || point.concept_name.empty() || !value) {
      ++dropped;
      continue;
    }
    point.value = *value;
    points.push_back(std::move(point));
  }

  if (dropped > 0) {
    std::cerr << "[FinancialDataLoader] " << source << ": dropped " << dropped
              << " incomplete or non-numeric rows" << std::endl;
  }
  return points;
}

std::vector<TimeSeriesPoint> FinancialDataLoader::load_file(
    const std::filesystem::path &path) const {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw DataLoadError("Failed to open CSV file: " + path.string());
  }
  return load(file, path.string());
}

std::vector<TimeSeriesPoint> FinancialDataLoader::load_directory(
    const std::filesystem::path &directory) const {
  if (!std::filesystem::is_directory(directory)) {
    throw DataLoadError("Not a directory: " + directory.string());
  }

  std::vector<std::filesystem::path> files;
  for (const auto &entry : std::filesystem::directory_iterator(directory)) {
    if (entry.is_regular_file() && lower(entry.path().extension().string()) == ".csv") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  std::vector<TimeSeriesPoint> points;
  size_t loaded = 0;
  for (const auto &file : files) {
    try {
      std::vector<TimeSeriesPoint> file_points = load_file(file);
      points.insert(points.end(), file_points.begin(), file_points.end());
      ++loaded;
    } catch (const DataLoadError &e) {
      std::cerr << "[FinancialDataLoader] Warning: skipping " << file.string() << ": " << e.what()
                << std::endl;
    }
  }
  if (loaded == 0) {
    throw DataLoadError("No loadable CSV files under " + directory.string());
  }
  return points;
}

}  // namespace finmda_core
