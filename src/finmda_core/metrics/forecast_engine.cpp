#include "finmda_core/metrics/forecast_engine.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

#include "finmda_core/errors.hpp"
#include "finmda_core/metrics/trend_analyzer.hpp"

namespace finmda_core {

std::string to_string(ForecastMethod method) {
  switch (method) {
    case ForecastMethod::LINEAR:
      return "linear";
    case ForecastMethod::SEASONAL:
      return "seasonal";
  }
  return "unknown";
}

ForecastMethod forecast_method_from_string(const std::string &str) {
  if (str == "linear")
    return ForecastMethod::LINEAR;
  if (str == "seasonal")
    return ForecastMethod::SEASONAL;
  throw std::invalid_argument("Unknown ForecastMethod: " + str);
}

AdditiveSeasonalModel::AdditiveSeasonalModel(size_t season_length)
    : season_length_(season_length) {
  if (season_length_ < 2) {
    throw InvalidConfig("season_length must be at least 2");
  }
}

std::vector<ForecastPoint> AdditiveSeasonalModel::forecast(const std::vector<double> &values,
                                                           size_t horizon) const {
  const size_t n = values.size();
  if (n < 2 * season_length_) {
    throw std::runtime_error("additive_seasonal needs " + std::to_string(2 * season_length_) +
                             " points, series has " + std::to_string(n));
  }

  LinearFit trend = fit_linear(values);

  std::vector<double> phase_sum(season_length_, 0.0);
  std::vector<size_t> phase_count(season_length_, 0);
  for (size_t i = 0; i < n; ++i) {
    phase_sum[i % season_length_] += trend.residuals[i];
    ++phase_count[i % season_length_];
  }
  std::vector<double> seasonal(season_length_, 0.0);
  for (size_t p = 0; p < season_length_; ++p) {
    seasonal[p] = phase_sum[p] / static_cast<double>(phase_count[p]);
  }

  std::vector<double> remainder;
  remainder.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    remainder.push_back(trend.residuals[i] - seasonal[i % season_length_]);
  }
  const double band = ForecastEngine::kBandZ * population_stddev(remainder);

  std::vector<ForecastPoint> points;
  points.reserve(horizon);
  for (size_t h = 1; h <= horizon; ++h) {
    const size_t t = n - 1 + h;
    const double value = trend.predict(static_cast<double>(t)) + seasonal[t % season_length_];
    points.push_back({h, value, value - band, value + band});
  }
  return points;
}

ForecastEngine::ForecastEngine(std::shared_ptr<SeasonalModel> seasonal)
    : seasonal_(std::move(seasonal)) {}

std::vector<ForecastPoint> ForecastEngine::linear_forecast(const std::vector<double> &values,
                                                           size_t horizon) {
  const size_t n = values.size();
  if (n < 2) {
    throw std::invalid_argument("Linear forecast needs at least 2 points, series has " +
                                std::to_string(n));
  }
  LinearFit fit = fit_linear(values);
  const double band = kBandZ * population_stddev(fit.residuals);

  std::vector<ForecastPoint> points;
  points.reserve(horizon);
  for (size_t h = 1; h <= horizon; ++h) {
    const double value = fit.predict(static_cast<double>(n - 1 + h));
    points.push_back({h, value, value - band, value + band});
  }
  return points;
}

ForecastResult ForecastEngine::forecast(const MetricSeries &series,
                                        size_t horizon,
                                        ForecastMethod method) const {
  ForecastResult result;
  result.concept_name = series.concept_name;
  result.requested = method;

  std::vector<double> values;
  values.reserve(series.size());
  for (const auto &point : series.points) {
    if (!std::isfinite(point.value)) {
      result.error = "series holds a non-finite value at " + point.period;
      return result;
    }
    values.push_back(point.value);
  }

  if (method == ForecastMethod::SEASONAL) {
    if (!seasonal_) {
      result.fallback_reason = "no seasonal model configured";
    } else if (!seasonal_->is_available()) {
      result.fallback_reason = seasonal_->name() + " is unavailable";
    } else {
      try {
        result.points = seasonal_->forecast(values, horizon);
        result.used = ForecastMethod::SEASONAL;
        result.confidence_score = kSeasonalConfidence;
        return result;
      } catch (const std::exception &e) {
        result.fallback_reason = seasonal_->name() + " failed: " + e.what();
      }
    }
    std::cerr << "[ForecastEngine] Falling back to linear forecast for " << series.concept_name
              << ": " << *result.fallback_reason << std::endl;
  }

  result.used = ForecastMethod::LINEAR;
  try {
    result.points = linear_forecast(values, horizon);
    result.confidence_score = kLinearConfidence;
  } catch (const std::invalid_argument &e) {
    result.points.clear();
    result.confidence_score = 0.0;
    result.error = e.what();
  }
  return result;
}

}  // namespace finmda_core
