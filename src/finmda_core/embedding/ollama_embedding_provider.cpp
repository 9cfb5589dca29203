#include "finmda_core/embedding/ollama_embedding_provider.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "finmda_core/errors.hpp"
#include "ollama.hpp"

namespace finmda_core {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string &ollama_url,
                                                 const std::string &embedding_model,
                                                 size_t dimension,
                                                 int timeout_seconds)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      dimension_(dimension),
      timeout_seconds_(timeout_seconds) {
  setup_server_connection();
}

// Only configures the client. Whether the server answers is reported per call,
// so callers that never embed work while Ollama is down.
void OllamaEmbeddingProvider::setup_server_connection() {
  ollama::setServerURL(ollama_url_);
  ollama::setReadTimeout(timeout_seconds_);
  ollama::setWriteTimeout(timeout_seconds_);
}

std::vector<std::vector<float>> OllamaEmbeddingProvider::embed(
    const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  // The embeddings endpoint is called once per text; order follows the input.
  for (const auto &text : texts) {
    vectors.push_back(embed_one(text));
  }
  return vectors;
}

std::vector<float> OllamaEmbeddingProvider::embed_one(const std::string &text) {
  std::vector<float> embedding;
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingUnavailable("Response does not contain embeddings field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingUnavailable("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      embedding = embeddings[0].get<std::vector<float>>();
    } else {
      embedding = embeddings.get<std::vector<float>>();
    }
  } catch (const ollama::exception &e) {
    throw EmbeddingUnavailable("Embedding generation failed at " + ollama_url_ + ": " +
                               std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingUnavailable("Malformed embedding response: " + std::string(e.what()));
  }

  if (embedding.size() != dimension_) {
    throw EmbeddingUnavailable("Model " + embedding_model_ + " returned " +
                               std::to_string(embedding.size()) + " dimensions, expected " +
                               std::to_string(dimension_));
  }
  return embedding;
}

bool OllamaEmbeddingProvider::is_available() {
  try {
    return ollama::is_running();
  } catch (const ollama::exception &e) {
    std::cerr << "[OllamaEmbeddingProvider] Availability check failed: " << e.what() << std::endl;
    return false;
  }
}

}  // namespace finmda_core
