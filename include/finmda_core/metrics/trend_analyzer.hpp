#pragma once

#include <string>
#include <vector>

#include "finmda_core/types/financial.hpp"

namespace finmda_core {

// Closed-form least squares of y against x = 0..N-1.
struct LinearFit {
  double slope = 0.0;
  double intercept = 0.0;
  double r = 0.0;  // Pearson correlation, 0 when y is constant
  std::vector<double> residuals;

  double predict(double x) const {
    return slope * x + intercept;
  }
};

LinearFit fit_linear(const std::vector<double> &values);

// Population standard deviation.
double population_stddev(const std::vector<double> &values);

/**
 * @brief OLS trend statistics over a series of at least kMinPoints values.
 *
 * The slope p-value is two-sided, from Student's t with N-2 degrees of
 * freedom. Shorter series, or series holding a non-finite value, produce the
 * degenerate result: direction unknown, p_value 1, everything else zero.
 */
class TrendAnalyzer {
 public:
  static constexpr size_t kMinPoints = 3;

  TrendResult analyze(const MetricSeries &series) const;
  TrendResult analyze(const std::string &concept_name, const std::vector<double> &values) const;

  static TrendResult degenerate(const std::string &concept_name, size_t sample_size);
};

}  // namespace finmda_core
