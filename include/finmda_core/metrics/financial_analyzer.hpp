#pragma once

#include <map>
#include <string>
#include <vector>

#include "finmda_core/metrics/delta_calculator.hpp"
#include "finmda_core/metrics/ratio_calculator.hpp"
#include "finmda_core/metrics/trend_analyzer.hpp"
#include "finmda_core/types/financial.hpp"

namespace finmda_core {

/**
 * @brief Builds the FinancialSummary of one company from raw time-series points.
 *
 * Concept aliases are folded into canonical names (Revenues -> Revenue, ...),
 * duplicate (period, concept) values are summed, and periods are ordered
 * lexicographically. Ratios are computed on the latest period's snapshot.
 */
class FinancialAnalyzer {
 public:
  FinancialAnalyzer(RatioCalculator ratios = RatioCalculator(),
                    DeltaCalculator deltas = DeltaCalculator(),
                    TrendAnalyzer trends = TrendAnalyzer());

  FinancialSummary summarize(const std::string &company,
                             const std::vector<TimeSeriesPoint> &points) const;

  // Canonical concept name -> series, for one company.
  std::map<std::string, MetricSeries> build_series(const std::string &company,
                                                   const std::vector<TimeSeriesPoint> &points,
                                                   std::vector<MetricWarning> *warnings = nullptr) const;

  static std::string canonical_concept(const std::string &concept_name);

  // "GrossProfit" -> "gross_profit"; already snake_case names pass through.
  static std::string snapshot_key(const std::string &concept_name);

  // Concept used as denominator of the derived ratio, or "" when there is none.
  static std::string margin_base(const std::string &concept_name);

  static std::vector<std::string> companies(const std::vector<TimeSeriesPoint> &points);

 private:
  RatioCalculator ratios_;
  DeltaCalculator deltas_;
  TrendAnalyzer trends_;
};

}  // namespace finmda_core
