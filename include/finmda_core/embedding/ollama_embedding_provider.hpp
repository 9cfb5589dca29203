#pragma once

#include <string>
#include <vector>

#include "finmda_core/embedding/embedding_provider.hpp"

namespace finmda_core {

class OllamaEmbeddingProvider : public EmbeddingProvider {
 public:
  OllamaEmbeddingProvider(const std::string &ollama_url,
                          const std::string &embedding_model,
                          size_t dimension,
                          int timeout_seconds = 30);
  ~OllamaEmbeddingProvider() override = default;

  // Disable copy constructor and assignment
  OllamaEmbeddingProvider(const OllamaEmbeddingProvider &) = delete;
  OllamaEmbeddingProvider &operator=(const OllamaEmbeddingProvider &) = delete;

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;

  size_t dimension() const override {
    return dimension_;
  }

  bool is_available() override;

 private:
  std::vector<float> embed_one(const std::string &text);
  void setup_server_connection();

  std::string ollama_url_;
  std::string embedding_model_;
  size_t dimension_;
  int timeout_seconds_;
};

}  // namespace finmda_core
