#pragma once

#include <string>
#include <vector>

#include "finmda_core/types/chunk.hpp"
#include "finmda_core/types/financial.hpp"

namespace finmda_core {

// One company/period summary written as a short retrievable document.
struct KpiStatement {
  std::string document_id;
  std::string text;
  Metadata metadata;  // company, period, source
};

/**
 * @brief Turns a FinancialSummary's deltas into one statement per period.
 *
 * A statement lists every concept's value for the period, then the margins
 * and the QoQ/YoY changes that are defined, e.g.
 * "Company: ACME; Period: 2024-Q4; Revenue: 130; Revenue QoQ: +8.3%".
 * Indexed through DocumentIndexer, each statement becomes evidence whose
 * citation carries the company and period.
 */
class KpiStatementBuilder {
 public:
  static constexpr size_t kDefaultMaxStatements = 2000;
  static constexpr const char *kSource = "kpi";

  explicit KpiStatementBuilder(size_t max_statements = kDefaultMaxStatements);

  // Statements in ascending period order; only the latest max_statements periods are kept.
  std::vector<KpiStatement> build(const FinancialSummary &summary) const;

  static std::string document_id_for(const std::string &company, const std::string &period);

  // 1234567.4 -> "1,234,567"
  static std::string format_amount(double value);

 private:
  size_t max_statements_;
};

}  // namespace finmda_core
