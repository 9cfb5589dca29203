#include "finmda_core/metrics/trend_analyzer.hpp"

#include <boost/math/distributions/students_t.hpp>

#include <cmath>

namespace finmda_core {

LinearFit fit_linear(const std::vector<double> &values) {
  LinearFit fit;
  const size_t n = values.size();
  if (n == 0) {
    return fit;
  }
  if (n == 1) {
    fit.intercept = values.front();
    fit.residuals.assign(1, 0.0);
    return fit;
  }

  const double x_mean = static_cast<double>(n - 1) / 2.0;
  double y_mean = 0.0;
  for (double y : values) {
    y_mean += y;
  }
  y_mean /= static_cast<double>(n);

  double ss_xx = 0.0;
  double ss_xy = 0.0;
  double ss_yy = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double dx = static_cast<double>(i) - x_mean;
    const double dy = values[i] - y_mean;
    ss_xx += dx * dx;
    ss_xy += dx * dy;
    ss_yy += dy * dy;
  }

  fit.slope = ss_xy / ss_xx;
  fit.intercept = y_mean - fit.slope * x_mean;
  fit.r = ss_yy > 0.0 ? ss_xy / std::sqrt(ss_xx * ss_yy) : 0.0;

  fit.residuals.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    fit.residuals.push_back(values[i] - fit.predict(static_cast<double>(i)));
  }
  return fit;
}

double population_stddev(const std::vector<double> &values) {
  if (values.empty()) {
    return 0.0;
  }
  double mean = 0.0;
  for (double v : values) {
    mean += v;
  }
  mean /= static_cast<double>(values.size());
  double sum_sq = 0.0;
  for (double v : values) {
    sum_sq += (v - mean) * (v - mean);
  }
  return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

TrendResult TrendAnalyzer::degenerate(const std::string &concept_name, size_t sample_size) {
  TrendResult result;
  result.concept_name = concept_name;
  result.direction = TrendDirection::UNKNOWN;
  result.p_value = 1.0;
  result.sample_size = sample_size;
  return result;
}

TrendResult TrendAnalyzer::analyze(const MetricSeries &series) const {
  std::vector<double> values;
  values.reserve(series.size());
  for (const auto &point : series.points) {
    values.push_back(point.value);
  }
  return analyze(series.concept_name, values);
}

TrendResult TrendAnalyzer::analyze(const std::string &concept_name,
                                   const std::vector<double> &values) const {
  const size_t n = values.size();
  if (n < kMinPoints) {
    return degenerate(concept_name, n);
  }
  for (double v : values) {
    if (!std::isfinite(v)) {
      return degenerate(concept_name, n);
    }
  }

  LinearFit fit = fit_linear(values);

  TrendResult result;
  result.concept_name = concept_name;
  result.sample_size = n;
  result.slope = fit.slope;
  result.intercept = fit.intercept;
  result.strength = std::abs(fit.r);
  result.r_squared = fit.r * fit.r;
  result.forecast_next = fit.predict(static_cast<double>(n));
  result.volatility = population_stddev(fit.residuals);

  if (fit.slope > 0.0) {
    result.direction = TrendDirection::INCREASING;
  } else if (fit.slope < 0.0) {
    result.direction = TrendDirection::DECREASING;
  } else {
    result.direction = TrendDirection::STABLE;
  }

  const double df = static_cast<double>(n - 2);
  const double r_sq = result.r_squared;
  if (fit.r == 0.0) {
    result.p_value = 1.0;
  } else if (r_sq >= 1.0) {
    result.p_value = 0.0;
  } else {
    const double t = fit.r * std::sqrt(df / (1.0 - r_sq));
    boost::math::students_t distribution(df);
    result.p_value = 2.0 * boost::math::cdf(boost::math::complement(distribution, std::abs(t)));
  }
  return result;
}

}  // namespace finmda_core
