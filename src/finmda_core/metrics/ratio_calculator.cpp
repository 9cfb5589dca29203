#include "finmda_core/metrics/ratio_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

#include "finmda_core/errors.hpp"

namespace finmda_core {

std::string to_string(RatioCategory category) {
  switch (category) {
    case RatioCategory::LIQUIDITY:
      return "liquidity";
    case RatioCategory::PROFITABILITY:
      return "profitability";
    case RatioCategory::LEVERAGE:
      return "leverage";
    case RatioCategory::EFFICIENCY:
      return "efficiency";
    case RatioCategory::VALUATION:
      return "valuation";
  }
  return "unknown";
}

RatioCategory ratio_category_from_string(const std::string &str) {
  if (str == "liquidity")
    return RatioCategory::LIQUIDITY;
  if (str == "profitability")
    return RatioCategory::PROFITABILITY;
  if (str == "leverage")
    return RatioCategory::LEVERAGE;
  if (str == "efficiency")
    return RatioCategory::EFFICIENCY;
  if (str == "valuation")
    return RatioCategory::VALUATION;
  throw std::invalid_argument("Unknown RatioCategory: " + str);
}

const std::vector<RatioFormula> &RatioCalculator::formulas() {
  static const std::vector<RatioFormula> table = {
      {"current_ratio", RatioCategory::LIQUIDITY, {{"current_assets", 1.0}}, "current_liabilities"},
      {"quick_ratio",
       RatioCategory::LIQUIDITY,
       {{"current_assets", 1.0}, {"inventory", -1.0}},
       "current_liabilities"},
      {"cash_ratio", RatioCategory::LIQUIDITY, {{"cash", 1.0}}, "current_liabilities"},

      {"gross_margin", RatioCategory::PROFITABILITY, {{"gross_profit", 1.0}}, "revenue"},
      {"net_margin", RatioCategory::PROFITABILITY, {{"net_income", 1.0}}, "revenue"},
      {"return_on_assets", RatioCategory::PROFITABILITY, {{"net_income", 1.0}}, "total_assets"},
      {"return_on_equity",
       RatioCategory::PROFITABILITY,
       {{"net_income", 1.0}},
       "shareholders_equity"},

      {"debt_ratio", RatioCategory::LEVERAGE, {{"total_debt", 1.0}}, "total_assets"},
      {"debt_to_equity", RatioCategory::LEVERAGE, {{"total_debt", 1.0}}, "shareholders_equity"},
      {"interest_coverage", RatioCategory::LEVERAGE, {{"ebit", 1.0}}, "interest_expense"},

      {"asset_turnover", RatioCategory::EFFICIENCY, {{"revenue", 1.0}}, "total_assets"},
      {"inventory_turnover", RatioCategory::EFFICIENCY, {{"cost_of_goods_sold", 1.0}}, "inventory"},
      {"receivables_turnover",
       RatioCategory::EFFICIENCY,
       {{"revenue", 1.0}},
       "accounts_receivable"},

      {"price_to_earnings", RatioCategory::VALUATION, {{"market_cap", 1.0}}, "net_income"},
      {"price_to_book", RatioCategory::VALUATION, {{"market_cap", 1.0}}, "book_value"},
      {"ev_to_ebitda", RatioCategory::VALUATION, {{"enterprise_value", 1.0}}, "ebitda"},
  };
  return table;
}

const RatioFormula *RatioCalculator::find_formula(const std::string &name) {
  for (const auto &formula : formulas()) {
    if (formula.name == name) {
      return &formula;
    }
  }
  return nullptr;
}

bool RatioCalculator::is_normally_positive(const std::string &concept_name) {
  static const std::set<std::string> positive = {
      "total_assets", "current_assets", "current_liabilities", "revenue",
      "cash",         "inventory",      "accounts_receivable", "market_cap",
      "book_value",   "total_debt",     "cost_of_goods_sold",  "interest_expense"};
  return positive.count(concept_name) > 0;
}

RatioCalculator::RatioCalculator(RatioRangeTable ranges) : ranges_(std::move(ranges)) {}

namespace {

std::optional<double> lookup(const FinancialSnapshot &snapshot, const std::string &concept_name) {
  auto it = snapshot.find(concept_name);
  if (it == snapshot.end() || !std::isfinite(it->second)) {
    return std::nullopt;
  }
  return it->second;
}

// Evaluates the formula; sets near_zero when it failed only on the denominator.
std::optional<double> evaluate(const RatioFormula &formula,
                               const FinancialSnapshot &snapshot,
                               bool *near_zero) {
  if (near_zero) {
    *near_zero = false;
  }
  double numerator = 0.0;
  for (const auto &[concept_name, coefficient] : formula.numerator) {
    std::optional<double> value = lookup(snapshot, concept_name);
    if (!value) {
      return std::nullopt;
    }
    numerator += coefficient * *value;
  }
  std::optional<double> denominator = lookup(snapshot, formula.denominator);
  if (!denominator) {
    return std::nullopt;
  }
  if (std::abs(*denominator) <= RatioCalculator::kEpsilon) {
    if (near_zero) {
      *near_zero = true;
    }
    return std::nullopt;
  }
  double ratio = numerator / *denominator;
  if (!std::isfinite(ratio)) {
    return std::nullopt;
  }
  return ratio;
}

}  // namespace

std::optional<double> RatioCalculator::compute_ratio(const std::string &name,
                                                     const FinancialSnapshot &snapshot) const {
  const RatioFormula *formula = find_formula(name);
  if (!formula) {
    throw InvalidConfig("Unknown ratio: " + name);
  }
  return evaluate(*formula, snapshot, nullptr);
}

RatioReport RatioCalculator::compute_ratios(const FinancialSnapshot &snapshot,
                                            const std::vector<RatioCategory> &categories,
                                            const std::string &period) const {
  RatioReport report;

  for (const auto &[concept_name, value] : snapshot) {
    if (!std::isfinite(value)) {
      report.warnings.push_back({WarningKind::NON_FINITE_VALUE, concept_name, period,
                                 concept_name + " is not a finite number and was ignored"});
    } else if (value < 0.0 && is_normally_positive(concept_name)) {
      report.warnings.push_back({WarningKind::NEGATIVE_VALUE, concept_name, period,
                                 concept_name + " is negative (" + std::to_string(value) + ")",
                                 WarningSeverity::HIGH});
    }
  }

  for (const auto &formula : formulas()) {
    if (!categories.empty() &&
        std::find(categories.begin(), categories.end(), formula.category) == categories.end()) {
      continue;
    }

    bool near_zero = false;
    std::optional<double> ratio = evaluate(formula, snapshot, &near_zero);
    if (near_zero) {
      report.warnings.push_back({WarningKind::NEAR_ZERO_DENOMINATOR, formula.name, period,
                                 formula.name + " is undefined: " + formula.denominator +
                                     " is zero or near zero"});
    }
    if (!ratio) {
      continue;
    }

    report.ratios[formula.name] = *ratio;
    if (auto warning = ranges_.check(formula.name, *ratio, period)) {
      report.warnings.push_back(std::move(*warning));
    }
  }
  return report;
}

}  // namespace finmda_core
