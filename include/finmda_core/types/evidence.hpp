#pragma once

#include <string>
#include <vector>

namespace finmda_core {

struct RetrievalHit {
  std::string chunk_id;
  std::string document_id;
  int chunk_index = 0;
  std::string text;
  float relevance_score = 0.0f;
  int rank = 0;
};

struct Citation {
  int index = 0;  // 1-based, stable within one bundle
  std::string document_id;
  std::string chunk_id;
  int chunk_index = 0;
  std::string company;
  std::string period;
  std::string snippet;
  float relevance_score = 0.0f;
};

// The retrieval half of what the narrative generator receives.
struct EvidenceBundle {
  std::string query;
  std::string context;
  std::vector<Citation> citations;
  std::vector<RetrievalHit> hits;
  size_t total_results = 0;

  bool empty() const {
    return citations.empty();
  }
};

struct DocumentChunkHit {
  std::string chunk_id;
  int chunk_index = 0;
  std::string text;
  float relevance_score = 0.0f;
};

struct SimilarDocument {
  std::string document_id;
  float max_relevance = 0.0f;
  std::vector<DocumentChunkHit> chunks;
  size_t total_chunks = 0;
};

}  // namespace finmda_core
