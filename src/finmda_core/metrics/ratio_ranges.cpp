#include "finmda_core/metrics/ratio_ranges.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

#include "finmda_core/errors.hpp"

namespace finmda_core {

RatioRangeTable RatioRangeTable::defaults() {
  RatioRangeTable table;
  table.set("current_ratio", {1.0, 3.0});
  table.set("quick_ratio", {0.5, 2.0});
  table.set("debt_to_equity", {0.0, 2.0});
  table.set("gross_margin", {0.1, 0.8});
  table.set("net_margin", {0.0, 0.3});
  table.set("return_on_equity", {0.0, 0.5});
  table.set("return_on_assets", {0.0, 0.2});
  table.reviewed_ = false;
  return table;
}

RatioRangeTable RatioRangeTable::from_json(const nlohmann::json &json_table) {
  if (!json_table.is_object()) {
    throw InvalidConfig("Ratio range table must be a JSON object");
  }
  RatioRangeTable table;
  table.reviewed_ = json_table.value("reviewed", false);

  const nlohmann::json ranges = json_table.value("ranges", nlohmann::json::object());
  if (!ranges.is_object()) {
    throw InvalidConfig("'ranges' must map ratio names to {min, max} objects");
  }
  for (const auto &[ratio, bounds] : ranges.items()) {
    if (!bounds.is_object() || !bounds.contains("min") || !bounds.contains("max") ||
        !bounds.at("min").is_number() || !bounds.at("max").is_number()) {
      throw InvalidConfig("Range for '" + ratio + "' needs numeric 'min' and 'max'");
    }
    table.set(ratio, {bounds.at("min").get<double>(), bounds.at("max").get<double>()});
  }
  return table;
}

RatioRangeTable RatioRangeTable::from_file(const std::string &filename) {
  std::ifstream file_stream(filename);
  if (!file_stream.is_open()) {
    throw InvalidConfig("Failed to open ratio range file: " + filename);
  }
  nlohmann::json json_table;
  try {
    file_stream >> json_table;
  } catch (const nlohmann::json::exception &e) {
    throw InvalidConfig("Failed to parse ratio range file '" + filename + "': " + e.what());
  }
  return from_json(json_table);
}

void RatioRangeTable::set(const std::string &ratio, RatioRange range) {
  if (!std::isfinite(range.min) || !std::isfinite(range.max) || range.min > range.max) {
    throw InvalidConfig("Invalid range for '" + ratio + "': min must not exceed max");
  }
  ranges_[ratio] = range;
}

std::optional<RatioRange> RatioRangeTable::find(const std::string &ratio) const {
  auto it = ranges_.find(ratio);
  if (it == ranges_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<MetricWarning> RatioRangeTable::check(const std::string &ratio,
                                                    double value,
                                                    const std::string &period) const {
  std::optional<RatioRange> range = find(ratio);
  if (!range || range->contains(value)) {
    return std::nullopt;
  }

  const double midpoint = (range->min + range->max) / 2.0;
  const double width = range->max - range->min;

  std::ostringstream message;
  message << ratio << " = " << value << " is outside the normal range [" << range->min << ", "
          << range->max << "]";
  if (!reviewed_) {
    message << " (unreviewed thresholds)";
  }

  MetricWarning warning;
  warning.kind = WarningKind::OUT_OF_RANGE;
  warning.subject = ratio;
  warning.period = period;
  warning.message = message.str();
  warning.severity =
      std::abs(value - midpoint) > width ? WarningSeverity::HIGH : WarningSeverity::MEDIUM;
  return warning;
}

}  // namespace finmda_core
