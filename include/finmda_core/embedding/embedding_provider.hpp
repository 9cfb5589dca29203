#pragma once

#include <string>
#include <vector>

namespace finmda_core {

// Embedding Port: one vector per input text, same order, fixed dimension.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // Throws EmbeddingUnavailable when the backend cannot answer.
  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;

  virtual size_t dimension() const = 0;

  virtual bool is_available() {
    return true;
  }
};

}  // namespace finmda_core
