#pragma once

#include <optional>
#include <vector>

#include "finmda_core/types/financial.hpp"

namespace finmda_core {

/**
 * @brief Period-over-period percentage changes of one MetricSeries.
 *
 * QoQ compares each point with the one immediately before it, YoY with the
 * point yoy_lag positions back (4 for quarterly data). A change is null when
 * that point does not exist or its value is zero.
 */
class DeltaCalculator {
 public:
  static constexpr double kEpsilon = 1e-9;

  // Throws InvalidConfig when yoy_lag is 0.
  explicit DeltaCalculator(size_t yoy_lag = 4);

  // One DeltaMetric per point. When base is given, derived_ratio is the
  // value over base's value in the same period.
  std::vector<DeltaMetric> compute(const MetricSeries &series,
                                   const MetricSeries *base = nullptr) const;

  // (current - previous) / previous * 100, or nullopt when undefined.
  static std::optional<double> percent_change(double current, double previous);

  size_t yoy_lag() const {
    return yoy_lag_;
  }

 private:
  size_t yoy_lag_;
};

}  // namespace finmda_core
