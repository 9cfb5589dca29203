#include <gtest/gtest.h>

#include "finmda_core/errors.hpp"
#include "finmda_core/metrics/delta_calculator.hpp"

namespace finmda_tests {

using namespace finmda_core;

namespace {

MetricSeries make_series(const std::string& concept_name, const std::vector<double>& values) {
  MetricSeries series;
  series.company = "ACME";
  series.concept_name = concept_name;
  for (size_t i = 0; i < values.size(); ++i) {
    series.points.push_back({"P" + std::to_string(i), values[i]});
  }
  return series;
}

}  // namespace

TEST(DeltaCalculatorTest, QuarterOverQuarterChange) {
  DeltaCalculator calculator;
  auto deltas = calculator.compute(make_series("Revenue", {100.0, 110.0}));

  ASSERT_EQ(deltas.size(), 2u);
  EXPECT_FALSE(deltas[0].qoq_pct.has_value());
  ASSERT_TRUE(deltas[1].qoq_pct.has_value());
  EXPECT_DOUBLE_EQ(*deltas[1].qoq_pct, 10.0);
  EXPECT_EQ(deltas[1].concept_name, "Revenue");
  EXPECT_EQ(deltas[1].period, "P1");
  EXPECT_DOUBLE_EQ(deltas[1].value, 110.0);
}

TEST(DeltaCalculatorTest, SinglePointHasNoChanges) {
  DeltaCalculator calculator;
  auto deltas = calculator.compute(make_series("Revenue", {100.0}));

  ASSERT_EQ(deltas.size(), 1u);
  EXPECT_FALSE(deltas[0].qoq_pct.has_value());
  EXPECT_FALSE(deltas[0].yoy_pct.has_value());
  EXPECT_FALSE(deltas[0].derived_ratio.has_value());
}

TEST(DeltaCalculatorTest, YearOverYearUsesLag) {
  DeltaCalculator calculator(4);
  auto deltas = calculator.compute(make_series("Revenue", {100.0, 90.0, 95.0, 105.0, 120.0}));

  for (size_t i = 0; i < 4; ++i) {
    EXPECT_FALSE(deltas[i].yoy_pct.has_value()) << i;
  }
  ASSERT_TRUE(deltas[4].yoy_pct.has_value());
  EXPECT_DOUBLE_EQ(*deltas[4].yoy_pct, 20.0);

  DeltaCalculator annual(1);
  auto annual_deltas = annual.compute(make_series("Revenue", {100.0, 150.0}));
  EXPECT_DOUBLE_EQ(annual_deltas[1].yoy_pct.value(), 50.0);
}

TEST(DeltaCalculatorTest, ZeroPreviousValueGivesNull) {
  DeltaCalculator calculator;
  auto deltas = calculator.compute(make_series("NetIncome", {0.0, 25.0}));
  EXPECT_FALSE(deltas[1].qoq_pct.has_value());
}

TEST(DeltaCalculatorTest, NegativeBaseKeepsSignOfChange) {
  auto change = DeltaCalculator::percent_change(-50.0, -100.0);
  ASSERT_TRUE(change.has_value());
  EXPECT_DOUBLE_EQ(*change, -50.0);
}

TEST(DeltaCalculatorTest, DerivedRatioAgainstBaseSeries) {
  DeltaCalculator calculator;
  MetricSeries gross = make_series("GrossProfit", {40.0, 44.0, 50.0});
  MetricSeries revenue = make_series("Revenue", {100.0, 110.0});

  auto deltas = calculator.compute(gross, &revenue);
  EXPECT_DOUBLE_EQ(deltas[0].derived_ratio.value(), 0.4);
  EXPECT_DOUBLE_EQ(deltas[1].derived_ratio.value(), 0.4);
  // No revenue reported for P2
  EXPECT_FALSE(deltas[2].derived_ratio.has_value());
}

TEST(DeltaCalculatorTest, ZeroLagIsRejected) {
  EXPECT_THROW(DeltaCalculator(0), InvalidConfig);
}

}  // namespace finmda_tests
