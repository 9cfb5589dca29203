#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "finmda_core/types/financial.hpp"

namespace finmda_core {

struct RatioRange {
  double min = 0.0;
  double max = 0.0;

  bool contains(double value) const {
    return value >= min && value <= max;
  }
};

/**
 * @brief Normal ranges used to flag out-of-range ratios.
 *
 * The shipped defaults are generic thresholds without industry provenance and
 * are marked unreviewed; deployments should load a reviewed table from JSON:
 *
 *   {"reviewed": true, "ranges": {"current_ratio": {"min": 1.0, "max": 3.0}}}
 */
class RatioRangeTable {
 public:
  RatioRangeTable() = default;

  static RatioRangeTable defaults();
  static RatioRangeTable from_json(const nlohmann::json &json_table);
  static RatioRangeTable from_file(const std::string &filename);

  void set(const std::string &ratio, RatioRange range);
  std::optional<RatioRange> find(const std::string &ratio) const;

  // An OUT_OF_RANGE warning when the ratio has a range and value lies outside it.
  std::optional<MetricWarning> check(const std::string &ratio,
                                     double value,
                                     const std::string &period = "") const;

  bool reviewed() const {
    return reviewed_;
  }
  size_t size() const {
    return ranges_.size();
  }

 private:
  std::map<std::string, RatioRange> ranges_;
  bool reviewed_ = false;
};

}  // namespace finmda_core
