#include <gtest/gtest.h>

#include <limits>

#include "finmda_core/metrics/trend_analyzer.hpp"

namespace finmda_tests {

using namespace finmda_core;

class TrendAnalyzerTest : public ::testing::Test {
 protected:
  TrendAnalyzer analyzer_;
};

TEST_F(TrendAnalyzerTest, PerfectLinearGrowth) {
  TrendResult trend = analyzer_.analyze("Revenue", {100.0, 110.0, 120.0, 130.0});

  EXPECT_EQ(trend.concept_name, "Revenue");
  EXPECT_EQ(trend.direction, TrendDirection::INCREASING);
  EXPECT_NEAR(trend.slope, 10.0, 1e-9);
  EXPECT_NEAR(trend.intercept, 100.0, 1e-9);
  EXPECT_NEAR(trend.r_squared, 1.0, 1e-9);
  EXPECT_NEAR(trend.strength, 1.0, 1e-9);
  EXPECT_LT(trend.p_value, 0.01);
  EXPECT_NEAR(trend.forecast_next, 140.0, 1e-9);
  EXPECT_NEAR(trend.volatility, 0.0, 1e-9);
  EXPECT_EQ(trend.sample_size, 4u);
}

TEST_F(TrendAnalyzerTest, TooFewPointsIsUnknown) {
  TrendResult trend = analyzer_.analyze("Revenue", {100.0, 110.0});

  EXPECT_EQ(trend.direction, TrendDirection::UNKNOWN);
  EXPECT_DOUBLE_EQ(trend.p_value, 1.0);
  EXPECT_DOUBLE_EQ(trend.slope, 0.0);
  EXPECT_EQ(trend.sample_size, 2u);
  EXPECT_EQ(analyzer_.analyze("Revenue", {}).direction, TrendDirection::UNKNOWN);
}

TEST_F(TrendAnalyzerTest, Decline) {
  TrendResult trend = analyzer_.analyze("Cash", {50.0, 40.0, 30.0});
  EXPECT_EQ(trend.direction, TrendDirection::DECREASING);
  EXPECT_NEAR(trend.slope, -10.0, 1e-9);
}

TEST_F(TrendAnalyzerTest, FlatSeriesIsStableWithNoSignificance) {
  TrendResult trend = analyzer_.analyze("Inventory", {5.0, 5.0, 5.0, 5.0});
  EXPECT_EQ(trend.direction, TrendDirection::STABLE);
  EXPECT_DOUBLE_EQ(trend.r_squared, 0.0);
  EXPECT_DOUBLE_EQ(trend.p_value, 1.0);
}

TEST_F(TrendAnalyzerTest, NoisySeriesHasIntermediateStatistics) {
  TrendResult trend = analyzer_.analyze("Revenue", {1.0, 3.0, 2.0, 4.0, 3.0, 5.0});

  EXPECT_EQ(trend.direction, TrendDirection::INCREASING);
  EXPECT_NEAR(trend.slope, 11.0 / 17.5, 1e-9);
  EXPECT_NEAR(trend.r_squared, 121.0 / 175.0, 1e-9);
  EXPECT_GT(trend.p_value, 0.01);
  EXPECT_LT(trend.p_value, 0.1);
  EXPECT_GT(trend.volatility, 0.0);
}

TEST_F(TrendAnalyzerTest, NonFiniteValueIsUnknown) {
  TrendResult trend =
      analyzer_.analyze("Revenue", {1.0, std::numeric_limits<double>::infinity(), 3.0});
  EXPECT_EQ(trend.direction, TrendDirection::UNKNOWN);
}

TEST_F(TrendAnalyzerTest, AnalyzesMetricSeries) {
  MetricSeries series;
  series.concept_name = "Revenue";
  series.points = {{"2024-Q1", 1.0}, {"2024-Q2", 2.0}, {"2024-Q3", 3.0}};
  EXPECT_EQ(analyzer_.analyze(series).direction, TrendDirection::INCREASING);
}

TEST(LinearFitTest, ResidualsAndStddev) {
  LinearFit fit = fit_linear({2.0, 4.0, 6.0});
  EXPECT_NEAR(fit.slope, 2.0, 1e-12);
  EXPECT_NEAR(fit.intercept, 2.0, 1e-12);
  EXPECT_NEAR(fit.predict(3.0), 8.0, 1e-12);
  ASSERT_EQ(fit.residuals.size(), 3u);
  EXPECT_NEAR(population_stddev(fit.residuals), 0.0, 1e-12);
  EXPECT_DOUBLE_EQ(population_stddev({1.0, 3.0}), 1.0);
}

TEST(TrendDirectionTest, StringConversion) {
  EXPECT_EQ(to_string(TrendDirection::INCREASING), "increasing");
  EXPECT_EQ(trend_direction_from_string("unknown"), TrendDirection::UNKNOWN);
  EXPECT_THROW(trend_direction_from_string("sideways"), std::invalid_argument);
}

}  // namespace finmda_tests
