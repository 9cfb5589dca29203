#pragma once

#include <gmock/gmock.h>

#include <cctype>
#include <functional>
#include <string>
#include <vector>

#include "finmda_core/embedding/embedding_provider.hpp"
#include "finmda_core/metrics/forecast_engine.hpp"

namespace finmda_tests {

namespace MockUtilities {

constexpr size_t kTestDimension = 16;

// Bag-of-words vector: each lowercase word lands in one hashed bucket. The last
// bucket is a constant so no text maps to the zero vector.
inline std::vector<float> keyword_embedding(const std::string& text,
                                            size_t dimensions = kTestDimension) {
  std::vector<float> embedding(dimensions, 0.0f);
  embedding[dimensions - 1] = 0.05f;

  std::string word;
  auto flush = [&]() {
    if (!word.empty()) {
      embedding[std::hash<std::string>{}(word) % (dimensions - 1)] += 1.0f;
      word.clear();
    }
  };
  for (char c : text) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    } else {
      flush();
    }
  }
  flush();
  return embedding;
}

inline std::vector<std::vector<float>> keyword_embeddings(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(keyword_embedding(text));
  }
  return out;
}

// Unit vector along one axis, handy for exact distance checks.
inline std::vector<float> axis_vector(size_t axis, size_t dimensions = kTestDimension) {
  std::vector<float> v(dimensions, 0.0f);
  v[axis % dimensions] = 1.0f;
  return v;
}

}  // namespace MockUtilities

/**
 * Mock embedding provider. By default it embeds with the deterministic
 * keyword hashing above so retrieval tests can rely on word overlap.
 */
class MockEmbeddingProvider : public finmda_core::EmbeddingProvider {
 public:
  MockEmbeddingProvider() {
    ON_CALL(*this, embed(testing::_))
        .WillByDefault(testing::Invoke(&MockUtilities::keyword_embeddings));
    ON_CALL(*this, dimension()).WillByDefault(testing::Return(MockUtilities::kTestDimension));
    ON_CALL(*this, is_available()).WillByDefault(testing::Return(true));
  }

  MOCK_METHOD(std::vector<std::vector<float>>, embed, (const std::vector<std::string>& texts),
              (override));
  MOCK_METHOD(size_t, dimension, (), (const, override));
  MOCK_METHOD(bool, is_available, (), (override));
};

class MockSeasonalModel : public finmda_core::SeasonalModel {
 public:
  MOCK_METHOD(std::string, name, (), (const, override));
  MOCK_METHOD(bool, is_available, (), (const, override));
  MOCK_METHOD(std::vector<finmda_core::ForecastPoint>, forecast,
              (const std::vector<double>& values, size_t horizon), (const, override));
};

}  // namespace finmda_tests
