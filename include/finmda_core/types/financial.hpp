#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace finmda_core {

struct TimeSeriesPoint {
  std::string company;
  std::string period;
  std::string concept_name;
  double value = 0.0;
};

struct SeriesPoint {
  std::string period;
  double value = 0.0;
};

// One concept for one company, ordered by period.
struct MetricSeries {
  std::string company;
  std::string concept_name;
  std::vector<SeriesPoint> points;

  size_t size() const {
    return points.size();
  }
  bool empty() const {
    return points.empty();
  }
};

// A concept -> value snapshot for one period, the input of ratio formulas.
using FinancialSnapshot = std::map<std::string, double>;

struct DeltaMetric {
  std::string concept_name;
  std::string period;
  double value = 0.0;
  std::optional<double> qoq_pct;
  std::optional<double> yoy_pct;
  std::optional<double> derived_ratio;
};

enum class TrendDirection { INCREASING, DECREASING, STABLE, UNKNOWN };

inline std::string to_string(TrendDirection direction) {
  switch (direction) {
    case TrendDirection::INCREASING:
      return "increasing";
    case TrendDirection::DECREASING:
      return "decreasing";
    case TrendDirection::STABLE:
      return "stable";
    case TrendDirection::UNKNOWN:
      return "unknown";
  }
  return "unknown";
}

inline TrendDirection trend_direction_from_string(const std::string &str) {
  if (str == "increasing")
    return TrendDirection::INCREASING;
  if (str == "decreasing")
    return TrendDirection::DECREASING;
  if (str == "stable")
    return TrendDirection::STABLE;
  if (str == "unknown")
    return TrendDirection::UNKNOWN;
  throw std::invalid_argument("Unknown TrendDirection: " + str);
}

struct TrendResult {
  std::string concept_name;
  TrendDirection direction = TrendDirection::UNKNOWN;
  double strength = 0.0;  // |Pearson r|
  double slope = 0.0;
  double intercept = 0.0;
  double r_squared = 0.0;
  double p_value = 1.0;
  double forecast_next = 0.0;
  double volatility = 0.0;
  size_t sample_size = 0;
};

enum class WarningKind { NEAR_ZERO_DENOMINATOR, NEGATIVE_VALUE, OUT_OF_RANGE, NON_FINITE_VALUE };

inline std::string to_string(WarningKind kind) {
  switch (kind) {
    case WarningKind::NEAR_ZERO_DENOMINATOR:
      return "near_zero_denominator";
    case WarningKind::NEGATIVE_VALUE:
      return "negative_value";
    case WarningKind::OUT_OF_RANGE:
      return "out_of_range";
    case WarningKind::NON_FINITE_VALUE:
      return "non_finite_value";
  }
  return "unknown";
}

enum class WarningSeverity { MEDIUM, HIGH };

inline std::string to_string(WarningSeverity severity) {
  return severity == WarningSeverity::HIGH ? "high" : "medium";
}

// A numeric anomaly: attached to results, never thrown.
struct MetricWarning {
  WarningKind kind;
  std::string subject;  // concept or ratio name
  std::string period;
  std::string message;
  WarningSeverity severity = WarningSeverity::MEDIUM;
};

struct FinancialSummary {
  std::string company;
  std::string latest_period;
  std::map<std::string, double> ratios;
  std::vector<DeltaMetric> deltas;
  std::vector<TrendResult> trends;
  std::vector<MetricWarning> warnings;
};

}  // namespace finmda_core
