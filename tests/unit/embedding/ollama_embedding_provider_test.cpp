#include <gtest/gtest.h>

#include "finmda_core/embedding/ollama_embedding_provider.hpp"
#include "finmda_core/errors.hpp"

namespace finmda_tests {

using namespace finmda_core;

// Nothing listens on port 1, so connections are refused immediately.
const char* const kUnreachableUrl = "http://127.0.0.1:1";

TEST(OllamaEmbeddingProviderTest, ConstructionDoesNotContactTheServer) {
  EXPECT_NO_THROW(OllamaEmbeddingProvider(kUnreachableUrl, "nomic-embed-text", 768, 1));
}

TEST(OllamaEmbeddingProviderTest, UnreachableServerIsReportedPerCall) {
  OllamaEmbeddingProvider provider(kUnreachableUrl, "nomic-embed-text", 768, 1);

  EXPECT_EQ(provider.dimension(), 768u);
  EXPECT_FALSE(provider.is_available());
  EXPECT_THROW(provider.embed({"Revenue grew 8% quarter over quarter."}), EmbeddingUnavailable);
}

TEST(OllamaEmbeddingProviderTest, EmptyBatchNeedsNoServer) {
  OllamaEmbeddingProvider provider(kUnreachableUrl, "nomic-embed-text", 768, 1);
  EXPECT_TRUE(provider.embed({}).empty());
}

}  // namespace finmda_tests
