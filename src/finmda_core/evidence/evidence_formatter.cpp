#include "finmda_core/evidence/evidence_formatter.hpp"

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <sstream>

namespace finmda_core {

namespace {

std::atomic<unsigned long long> next_request_id{1};

std::string format_optional_pct(const std::optional<double> &value) {
  if (!value) {
    return "n/a";
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << std::showpos << *value << "%";
  return out.str();
}

std::string or_placeholder(const std::string &text) {
  return text.empty() ? "n/a" : text;
}

}  // namespace

std::string to_string(FootnoteKind kind) {
  switch (kind) {
    case FootnoteKind::CITATION:
      return "citation";
    case FootnoteKind::DELTA:
      return "delta";
    case FootnoteKind::TREND:
      return "trend";
  }
  return "unknown";
}

std::string EvidenceFormatter::describe(const DeltaMetric &delta) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  out << delta.concept_name << " = " << delta.value << " (QoQ " << format_optional_pct(delta.qoq_pct)
      << ", YoY " << format_optional_pct(delta.yoy_pct);
  if (delta.derived_ratio) {
    out << ", margin " << std::setprecision(4) << *delta.derived_ratio;
  }
  out << ")";
  return out.str();
}

std::string EvidenceFormatter::describe(const TrendResult &trend) {
  std::ostringstream out;
  out << trend.concept_name << " trend " << to_string(trend.direction);
  if (trend.direction == TrendDirection::UNKNOWN) {
    out << " (insufficient history: " << trend.sample_size << " points)";
    return out.str();
  }
  out << std::fixed << std::setprecision(2) << " (slope " << trend.slope << ", R^2 "
      << std::setprecision(3) << trend.r_squared << ", p " << trend.p_value << ", next "
      << std::setprecision(2) << trend.forecast_next << ", volatility " << trend.volatility << ")";
  return out.str();
}

std::string EvidenceFootnotes::render_markdown() const {
  std::ostringstream out;
  for (const auto &footnote : footnotes) {
    out << "[^" << footnote.index << "] " << or_placeholder(footnote.company) << " | "
        << or_placeholder(footnote.period) << " | " << footnote.text << "\n";
  }
  return out.str();
}

EvidenceFootnotes EvidenceFormatter::build(const EvidenceBundle &bundle,
                                           const std::vector<DeltaMetric> &deltas,
                                           const std::vector<TrendResult> &trends,
                                           const std::string &company) const {
  EvidenceFootnotes result;
  result.request_id = "req-" + std::to_string(next_request_id.fetch_add(1));
  result.query = bundle.query;
  result.context = bundle.context;

  int index = 0;
  for (const auto &citation : bundle.citations) {
    Footnote footnote;
    footnote.index = ++index;
    footnote.kind = FootnoteKind::CITATION;
    footnote.company = citation.company;
    footnote.period = citation.period;
    footnote.text = citation.snippet;
    footnote.citation = citation;
    footnote.citation->index = footnote.index;
    result.footnotes.push_back(std::move(footnote));
  }

  std::vector<DeltaMetric> ordered_deltas(deltas);
  std::stable_sort(ordered_deltas.begin(), ordered_deltas.end(),
                   [](const DeltaMetric &a, const DeltaMetric &b) {
                     if (a.concept_name != b.concept_name)
                       return a.concept_name < b.concept_name;
                     return a.period < b.period;
                   });
  for (const auto &delta : ordered_deltas) {
    Footnote footnote;
    footnote.index = ++index;
    footnote.kind = FootnoteKind::DELTA;
    footnote.company = company;
    footnote.period = delta.period;
    footnote.text = describe(delta);
    result.footnotes.push_back(std::move(footnote));
  }

  std::vector<TrendResult> ordered_trends(trends);
  std::stable_sort(ordered_trends.begin(), ordered_trends.end(),
                   [](const TrendResult &a, const TrendResult &b) {
                     return a.concept_name < b.concept_name;
                   });
  for (const auto &trend : ordered_trends) {
    Footnote footnote;
    footnote.index = ++index;
    footnote.kind = FootnoteKind::TREND;
    footnote.company = company;
    footnote.text = describe(trend);
    result.footnotes.push_back(std::move(footnote));
  }
  return result;
}

}  // namespace finmda_core
