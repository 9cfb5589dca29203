#include "finmda_core/evidence/kpi_statement_builder.hpp"

#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace finmda_core {

namespace {

// Changes carry an explicit sign, shares do not.
std::string format_pct(double pct, bool signed_change) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1);
  if (signed_change) {
    out << std::showpos;
  }
  out << pct << "%";
  return out.str();
}

}  // namespace

KpiStatementBuilder::KpiStatementBuilder(size_t max_statements)
    : max_statements_(max_statements) {}

std::string KpiStatementBuilder::document_id_for(const std::string &company,
                                                 const std::string &period) {
  return "kpi_" + company + "_" + period;
}

std::string KpiStatementBuilder::format_amount(double value) {
  std::ostringstream rounded;
  rounded << std::fixed << std::setprecision(0) << std::fabs(value);
  std::string digits = rounded.str();

  std::string grouped;
  for (size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 && (digits.size() - i) % 3 == 0) {
      grouped += ',';
    }
    grouped += digits[i];
  }
  if (value < 0 && digits != "0") {
    grouped.insert(grouped.begin(), '-');
  }
  return grouped;
}

std::vector<KpiStatement> KpiStatementBuilder::build(const FinancialSummary &summary) const {
  std::map<std::string, std::vector<const DeltaMetric *>> by_period;
  for (const auto &delta : summary.deltas) {
    by_period[delta.period].push_back(&delta);
  }

  std::vector<KpiStatement> statements;
  size_t skip = by_period.size() > max_statements_ ? by_period.size() - max_statements_ : 0;
  for (const auto &[period, deltas] : by_period) {
    if (skip > 0) {
      --skip;
      continue;
    }

    std::vector<std::string> parts;
    parts.push_back("Company: " + summary.company);
    parts.push_back("Period: " + period);
    for (const DeltaMetric *delta : deltas) {
      parts.push_back(delta->concept_name + ": " + format_amount(delta->value));
    }
    for (const DeltaMetric *delta : deltas) {
      if (delta->derived_ratio) {
        parts.push_back(delta->concept_name + " margin: " +
                        format_pct(*delta->derived_ratio * 100.0, false));
      }
    }
    for (const DeltaMetric *delta : deltas) {
      if (delta->qoq_pct) {
        parts.push_back(delta->concept_name + " QoQ: " + format_pct(*delta->qoq_pct, true));
      }
      if (delta->yoy_pct) {
        parts.push_back(delta->concept_name + " YoY: " + format_pct(*delta->yoy_pct, true));
      }
    }

    KpiStatement statement;
    statement.document_id = document_id_for(summary.company, period);
    for (size_t i = 0; i < parts.size(); ++i) {
      if (i > 0) {
        statement.text += "; ";
      }
      statement.text += parts[i];
    }
    statement.metadata["company"] = summary.company;
    statement.metadata["period"] = period;
    statement.metadata["source"] = kSource;
    statements.push_back(std::move(statement));
  }
  return statements;
}

}  // namespace finmda_core
