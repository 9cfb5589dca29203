#include "finmda_core/metrics/financial_analyzer.hpp"

#include <cctype>
#include <cmath>
#include <set>

namespace finmda_core {

FinancialAnalyzer::FinancialAnalyzer(RatioCalculator ratios,
                                     DeltaCalculator deltas,
                                     TrendAnalyzer trends)
    : ratios_(std::move(ratios)), deltas_(std::move(deltas)), trends_(std::move(trends)) {}

std::string FinancialAnalyzer::canonical_concept(const std::string &concept_name) {
  static const std::map<std::string, std::string> aliases = {
      {"Revenues", "Revenue"},
      {"SalesRevenueNet", "Revenue"},
      {"OperatingIncomeLoss", "OperatingIncome"},
      {"NetIncomeLoss", "NetIncome"},
  };
  auto it = aliases.find(concept_name);
  return it == aliases.end() ? concept_name : it->second;
}

std::string FinancialAnalyzer::snapshot_key(const std::string &concept_name) {
  std::string key;
  key.reserve(concept_name.size() + 4);
  for (size_t i = 0; i < concept_name.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(concept_name[i]);
    if (std::isupper(c)) {
      if (i > 0) {
        const unsigned char prev = static_cast<unsigned char>(concept_name[i - 1]);
        const bool next_lower = i + 1 < concept_name.size() &&
                                std::islower(static_cast<unsigned char>(concept_name[i + 1]));
        // word boundary: "grossProfit", "Q4Revenue", or the end of an acronym ("EBITMargin")
        if (std::islower(prev) || std::isdigit(prev) || (std::isupper(prev) && next_lower)) {
          key.push_back('_');
        }
      }
      key.push_back(static_cast<char>(std::tolower(c)));
    } else {
      key.push_back(static_cast<char>(c));
    }
  }
  return key;
}

std::string FinancialAnalyzer::margin_base(const std::string &concept_name) {
  if (concept_name == "GrossProfit" || concept_name == "OperatingIncome" ||
      concept_name == "NetIncome") {
    return "Revenue";
  }
  return "";
}

std::vector<std::string> FinancialAnalyzer::companies(const std::vector<TimeSeriesPoint> &points) {
  std::set<std::string> unique;
  for (const auto &point : points) {
    unique.insert(point.company);
  }
  return {unique.begin(), unique.end()};
}

std::map<std::string, MetricSeries> FinancialAnalyzer::build_series(
    const std::string &company,
    const std::vector<TimeSeriesPoint> &points,
    std::vector<MetricWarning> *warnings) const {
  // concept -> period -> summed value
  std::map<std::string, std::map<std::string, double>> totals;
  for (const auto &point : points) {
    if (point.company != company) {
      continue;
    }
    const std::string name = canonical_concept(point.concept_name);
    if (!std::isfinite(point.value)) {
      if (warnings) {
        warnings->push_back({WarningKind::NON_FINITE_VALUE, name, point.period,
                             name + " in " + point.period + " is not a finite number"});
      }
      continue;
    }
    totals[name][point.period] += point.value;
  }

  std::map<std::string, MetricSeries> series;
  for (const auto &[name, by_period] : totals) {
    MetricSeries s;
    s.company = company;
    s.concept_name = name;
    for (const auto &[period, value] : by_period) {
      s.points.push_back({period, value});
    }
    series.emplace(name, std::move(s));
  }
  return series;
}

FinancialSummary FinancialAnalyzer::summarize(const std::string &company,
                                              const std::vector<TimeSeriesPoint> &points) const {
  FinancialSummary summary;
  summary.company = company;

  std::map<std::string, MetricSeries> series = build_series(company, points, &summary.warnings);

  for (const auto &[name, s] : series) {
    if (!s.empty() && s.points.back().period > summary.latest_period) {
      summary.latest_period = s.points.back().period;
    }
  }

  for (const auto &[name, s] : series) {
    const MetricSeries *base = nullptr;
    const std::string base_name = margin_base(name);
    if (!base_name.empty()) {
      auto base_it = series.find(base_name);
      if (base_it != series.end()) {
        base = &base_it->second;
      }
    }
    std::vector<DeltaMetric> deltas = deltas_.compute(s, base);
    summary.deltas.insert(summary.deltas.end(), deltas.begin(), deltas.end());
    summary.trends.push_back(trends_.analyze(s));
  }

  FinancialSnapshot snapshot;
  for (const auto &[name, s] : series) {
    for (const auto &point : s.points) {
      if (point.period == summary.latest_period) {
        snapshot[snapshot_key(name)] = point.value;
      }
    }
  }
  RatioReport report = ratios_.compute_ratios(snapshot, {}, summary.latest_period);
  summary.ratios = std::move(report.ratios);
  summary.warnings.insert(summary.warnings.end(), report.warnings.begin(), report.warnings.end());
  return summary;
}

}  // namespace finmda_core
