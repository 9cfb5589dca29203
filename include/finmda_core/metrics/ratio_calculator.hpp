#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "finmda_core/metrics/ratio_ranges.hpp"
#include "finmda_core/types/financial.hpp"

namespace finmda_core {

enum class RatioCategory { LIQUIDITY, PROFITABILITY, LEVERAGE, EFFICIENCY, VALUATION };

std::string to_string(RatioCategory category);
RatioCategory ratio_category_from_string(const std::string &str);

// sum(coefficient * concept) / denominator
struct RatioFormula {
  std::string name;
  RatioCategory category;
  std::vector<std::pair<std::string, double>> numerator;
  std::string denominator;
};

struct RatioReport {
  std::map<std::string, double> ratios;
  std::vector<MetricWarning> warnings;
};

/**
 * @brief Pure ratio formulas over a {concept: value} snapshot.
 *
 * A ratio is defined only when every input concept is present and finite and
 * the denominator's magnitude exceeds kEpsilon. Undefined ratios are left out
 * of the result, never reported as Inf or NaN.
 */
class RatioCalculator {
 public:
  static constexpr double kEpsilon = 1e-9;

  explicit RatioCalculator(RatioRangeTable ranges = RatioRangeTable::defaults());

  // Throws InvalidConfig for an unknown ratio name.
  std::optional<double> compute_ratio(const std::string &name,
                                      const FinancialSnapshot &snapshot) const;

  // Empty categories means all of them.
  RatioReport compute_ratios(const FinancialSnapshot &snapshot,
                             const std::vector<RatioCategory> &categories = {},
                             const std::string &period = "") const;

  static const std::vector<RatioFormula> &formulas();
  static const RatioFormula *find_formula(const std::string &name);

  // Concepts whose negative values are flagged as anomalies.
  static bool is_normally_positive(const std::string &concept_name);

  const RatioRangeTable &ranges() const {
    return ranges_;
  }

 private:
  RatioRangeTable ranges_;
};

}  // namespace finmda_core
