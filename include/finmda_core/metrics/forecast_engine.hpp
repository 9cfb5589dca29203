#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "finmda_core/types/financial.hpp"

namespace finmda_core {

enum class ForecastMethod { LINEAR, SEASONAL };

std::string to_string(ForecastMethod method);
ForecastMethod forecast_method_from_string(const std::string &str);

struct ForecastPoint {
  size_t step = 0;  // 1 = first period after the series
  double value = 0.0;
  double lower_bound = 0.0;
  double upper_bound = 0.0;
};

struct ForecastResult {
  std::string concept_name;
  ForecastMethod requested = ForecastMethod::LINEAR;
  ForecastMethod used = ForecastMethod::LINEAR;
  std::vector<ForecastPoint> points;
  double confidence_score = 0.0;
  std::optional<std::string> fallback_reason;
  std::optional<std::string> error;  // set when no forecast could be made
};

// Strategy for the advanced forecast. Implementations throw when they cannot
// produce a forecast for the given history.
class SeasonalModel {
 public:
  virtual ~SeasonalModel() = default;

  virtual std::string name() const = 0;
  virtual bool is_available() const {
    return true;
  }
  virtual std::vector<ForecastPoint> forecast(const std::vector<double> &values,
                                              size_t horizon) const = 0;
};

/**
 * Linear trend plus the mean residual of each seasonal phase. Needs at least
 * two full seasons of history.
 */
class AdditiveSeasonalModel : public SeasonalModel {
 public:
  explicit AdditiveSeasonalModel(size_t season_length = 4);

  std::string name() const override {
    return "additive_seasonal";
  }
  std::vector<ForecastPoint> forecast(const std::vector<double> &values,
                                      size_t horizon) const override;

 private:
  size_t season_length_;
};

/**
 * @brief Multi-period forecasts with a mandatory linear fallback.
 *
 * SEASONAL runs the configured SeasonalModel; when there is none, it is
 * unavailable or it throws, the linear forecast is returned instead with
 * fallback_reason set and the linear confidence score.
 */
class ForecastEngine {
 public:
  static constexpr double kLinearConfidence = 0.8;
  static constexpr double kSeasonalConfidence = 0.9;
  static constexpr double kBandZ = 1.96;

  explicit ForecastEngine(std::shared_ptr<SeasonalModel> seasonal = nullptr);

  ForecastResult forecast(const MetricSeries &series,
                          size_t horizon,
                          ForecastMethod method = ForecastMethod::LINEAR) const;

  // Throws std::invalid_argument with fewer than two values.
  static std::vector<ForecastPoint> linear_forecast(const std::vector<double> &values,
                                                    size_t horizon);

 private:
  std::shared_ptr<SeasonalModel> seasonal_;
};

}  // namespace finmda_core
