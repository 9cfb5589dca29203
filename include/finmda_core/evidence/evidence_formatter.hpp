#pragma once

#include <optional>
#include <string>
#include <vector>

#include "finmda_core/types/evidence.hpp"
#include "finmda_core/types/financial.hpp"

namespace finmda_core {

enum class FootnoteKind { CITATION, DELTA, TREND };

std::string to_string(FootnoteKind kind);

struct Footnote {
  int index = 0;  // 1-based within one EvidenceFootnotes
  FootnoteKind kind = FootnoteKind::CITATION;
  std::string company;
  std::string period;
  std::string text;
  std::optional<Citation> citation;
};

// The numbered evidence of one generation request.
struct EvidenceFootnotes {
  std::string request_id;
  std::string query;
  std::string context;
  std::vector<Footnote> footnotes;

  bool empty() const {
    return footnotes.empty();
  }

  // One "[^n] company | period | text" line per footnote.
  std::string render_markdown() const;
};

/**
 * @brief Merges retrieval citations, deltas and trends into one footnote list.
 *
 * Citations come first in rank order, then deltas ordered by concept and
 * period, then trends ordered by concept. Every build() gets a fresh
 * request_id and numbers its footnotes from 1.
 */
class EvidenceFormatter {
 public:
  EvidenceFootnotes build(const EvidenceBundle &bundle,
                          const std::vector<DeltaMetric> &deltas = {},
                          const std::vector<TrendResult> &trends = {},
                          const std::string &company = "") const;

  static std::string describe(const DeltaMetric &delta);
  static std::string describe(const TrendResult &trend);
};

}  // namespace finmda_core
