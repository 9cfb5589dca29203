#include "finmda_core/metrics/delta_calculator.hpp"

#include <cmath>
#include <map>

#include "finmda_core/errors.hpp"

namespace finmda_core {

DeltaCalculator::DeltaCalculator(size_t yoy_lag) : yoy_lag_(yoy_lag) {
  if (yoy_lag_ == 0) {
    throw InvalidConfig("yoy_lag must be at least 1");
  }
}

std::optional<double> DeltaCalculator::percent_change(double current, double previous) {
  if (!std::isfinite(current) || !std::isfinite(previous) || std::abs(previous) <= kEpsilon) {
    return std::nullopt;
  }
  double change = (current - previous) / previous * 100.0;
  if (!std::isfinite(change)) {
    return std::nullopt;
  }
  return change;
}

std::vector<DeltaMetric> DeltaCalculator::compute(const MetricSeries &series,
                                                  const MetricSeries *base) const {
  std::map<std::string, double> base_by_period;
  if (base) {
    for (const auto &point : base->points) {
      base_by_period[point.period] = point.value;
    }
  }

  std::vector<DeltaMetric> deltas;
  deltas.reserve(series.size());
  for (size_t i = 0; i < series.points.size(); ++i) {
    const SeriesPoint &point = series.points[i];

    DeltaMetric delta;
    delta.concept_name = series.concept_name;
    delta.period = point.period;
    delta.value = point.value;
    if (i >= 1) {
      delta.qoq_pct = percent_change(point.value, series.points[i - 1].value);
    }
    if (i >= yoy_lag_) {
      delta.yoy_pct = percent_change(point.value, series.points[i - yoy_lag_].value);
    }

    auto base_it = base_by_period.find(point.period);
    if (base_it != base_by_period.end() && std::isfinite(base_it->second) &&
        std::abs(base_it->second) > kEpsilon && std::isfinite(point.value)) {
      delta.derived_ratio = point.value / base_it->second;
    }
    deltas.push_back(std::move(delta));
  }
  return deltas;
}

}  // namespace finmda_core
