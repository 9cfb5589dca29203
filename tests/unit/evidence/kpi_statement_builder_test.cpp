#include <gtest/gtest.h>

#include "finmda_core/evidence/kpi_statement_builder.hpp"
#include "finmda_core/metrics/financial_analyzer.hpp"
#include "utilities_test.hpp"

namespace finmda_tests {

using namespace finmda_core;

namespace {

FinancialSummary acme_summary() {
  FinancialSummary summary;
  summary.company = "ACME";
  summary.latest_period = "2024-Q4";

  DeltaMetric gross_profit{"GrossProfit", "2024-Q4", 52.0, std::nullopt, std::nullopt, 0.4};
  DeltaMetric revenue_q3{"Revenue", "2024-Q3", 120.0, 100.0 / 11.0, std::nullopt, std::nullopt};
  DeltaMetric revenue_q4{"Revenue", "2024-Q4", 130.0, 25.0 / 3.0, std::nullopt, std::nullopt};
  summary.deltas = {gross_profit, revenue_q3, revenue_q4};
  return summary;
}

}  // namespace

TEST(KpiStatementBuilderTest, OneStatementPerPeriodInPeriodOrder) {
  std::vector<KpiStatement> statements = KpiStatementBuilder().build(acme_summary());

  ASSERT_EQ(statements.size(), 2u);
  EXPECT_EQ(statements[0].document_id, "kpi_ACME_2024-Q3");
  EXPECT_EQ(statements[0].text, "Company: ACME; Period: 2024-Q3; Revenue: 120; Revenue QoQ: +9.1%");
  EXPECT_EQ(statements[1].document_id, "kpi_ACME_2024-Q4");
  EXPECT_EQ(statements[1].text,
            "Company: ACME; Period: 2024-Q4; GrossProfit: 52; Revenue: 130; "
            "GrossProfit margin: 40.0%; Revenue QoQ: +8.3%");
}

TEST(KpiStatementBuilderTest, MetadataCarriesCompanyAndPeriod) {
  KpiStatement latest = KpiStatementBuilder().build(acme_summary()).back();
  EXPECT_EQ(latest.metadata.at("company"), "ACME");
  EXPECT_EQ(latest.metadata.at("period"), "2024-Q4");
  EXPECT_EQ(latest.metadata.at("source"), KpiStatementBuilder::kSource);
}

TEST(KpiStatementBuilderTest, CapKeepsTheLatestPeriods) {
  std::vector<KpiStatement> statements = KpiStatementBuilder(1).build(acme_summary());
  ASSERT_EQ(statements.size(), 1u);
  EXPECT_EQ(statements[0].metadata.at("period"), "2024-Q4");
}

TEST(KpiStatementBuilderTest, NegativeChangesAndMarginsKeepTheirSign) {
  FinancialSummary summary;
  summary.company = "ACME";
  summary.deltas = {{"NetIncome", "2024-Q4", -1500.0, -12.5, 4.0, -0.05}};

  EXPECT_EQ(KpiStatementBuilder().build(summary).at(0).text,
            "Company: ACME; Period: 2024-Q4; NetIncome: -1,500; NetIncome margin: -5.0%; "
            "NetIncome QoQ: -12.5%; NetIncome YoY: +4.0%");
}

TEST(KpiStatementBuilderTest, EmptySummaryBuildsNothing) {
  FinancialSummary summary;
  summary.company = "ACME";
  EXPECT_TRUE(KpiStatementBuilder().build(summary).empty());
}

TEST(KpiStatementBuilderTest, BuildsFromAnalyzedPoints) {
  auto points = TestUtilities::create_quarterly_points("ACME", "Revenue", {100, 110, 120, 130, 150});
  FinancialSummary summary = FinancialAnalyzer().summarize("ACME", points);

  std::vector<KpiStatement> statements = KpiStatementBuilder().build(summary);
  ASSERT_EQ(statements.size(), 5u);
  EXPECT_NE(statements.back().text.find("Revenue: 150"), std::string::npos);
  EXPECT_NE(statements.back().text.find("Revenue QoQ: +15.4%"), std::string::npos);
  EXPECT_NE(statements.back().text.find("Revenue YoY: +50.0%"), std::string::npos);
}

TEST(KpiStatementBuilderTest, FormatsAmountsWithThousandsSeparators) {
  EXPECT_EQ(KpiStatementBuilder::format_amount(0.0), "0");
  EXPECT_EQ(KpiStatementBuilder::format_amount(999.0), "999");
  EXPECT_EQ(KpiStatementBuilder::format_amount(1000.0), "1,000");
  EXPECT_EQ(KpiStatementBuilder::format_amount(1234567.4), "1,234,567");
  EXPECT_EQ(KpiStatementBuilder::format_amount(-2500.0), "-2,500");
  EXPECT_EQ(KpiStatementBuilder::format_amount(-0.3), "0");
}

}  // namespace finmda_tests
