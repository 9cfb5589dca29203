#include <gtest/gtest.h>

#include <cmath>

#include "finmda_core/errors.hpp"
#include "finmda_core/index/faiss_vector_index.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace finmda_tests {

using namespace finmda_core;
using MockUtilities::axis_vector;
using MockUtilities::kTestDimension;

class FaissVectorIndexTest : public ::testing::Test {
 protected:
  FaissVectorIndex index_{kTestDimension};
};

TEST_F(FaissVectorIndexTest, RejectsZeroDimension) {
  EXPECT_THROW(FaissVectorIndex(0), InvalidConfig);
}

TEST_F(FaissVectorIndexTest, EmptyIndexReturnsNoMatches) {
  EXPECT_TRUE(index_.query(axis_vector(0), 5).empty());
  EXPECT_EQ(index_.count(), 0u);
}

TEST_F(FaissVectorIndexTest, QueryRanksByCosineDistance) {
  std::vector<float> diagonal(kTestDimension, 0.0f);
  diagonal[0] = 1.0f;
  diagonal[1] = 1.0f;

  index_.upsert({TestUtilities::create_test_item("a", 0, axis_vector(0), "exact"),
                 TestUtilities::create_test_item("a", 1, diagonal, "diagonal"),
                 TestUtilities::create_test_item("b", 0, axis_vector(1), "orthogonal")});

  auto matches = index_.query(axis_vector(0), 3);
  ASSERT_EQ(matches.size(), 3u);
  EXPECT_EQ(matches[0].text, "exact");
  EXPECT_NEAR(matches[0].distance, 0.0f, 1e-5);
  EXPECT_EQ(matches[1].text, "diagonal");
  EXPECT_NEAR(matches[1].distance, 1.0f - 1.0f / std::sqrt(2.0f), 1e-5);
  EXPECT_EQ(matches[2].text, "orthogonal");
  EXPECT_NEAR(matches[2].distance, 1.0f, 1e-5);
  EXPECT_EQ(matches[0].metadata.at("document_id"), "a");
}

TEST_F(FaissVectorIndexTest, MagnitudeDoesNotAffectDistance) {
  std::vector<float> scaled = axis_vector(2);
  scaled[2] = 42.0f;
  index_.upsert({TestUtilities::create_test_item("a", 0, scaled)});

  auto matches = index_.query(axis_vector(2), 1);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_NEAR(matches[0].distance, 0.0f, 1e-5);
}

TEST_F(FaissVectorIndexTest, TopKLimitsAndZeroReturnsNothing) {
  for (int i = 0; i < 5; ++i) {
    index_.upsert({TestUtilities::create_test_item("a", i, axis_vector(i))});
  }
  EXPECT_EQ(index_.query(axis_vector(0), 2).size(), 2u);
  EXPECT_TRUE(index_.query(axis_vector(0), 0).empty());
  EXPECT_EQ(index_.query(axis_vector(0), 50).size(), 5u);
}

TEST_F(FaissVectorIndexTest, TiesBreakById) {
  index_.upsert({TestUtilities::create_test_item("b", 0, axis_vector(3)),
                 TestUtilities::create_test_item("a", 0, axis_vector(3))});

  auto matches = index_.query(axis_vector(3), 1);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].id, make_chunk_id("a", 0));
}

TEST_F(FaissVectorIndexTest, UpsertReplacesExistingId) {
  index_.upsert({TestUtilities::create_test_item("a", 0, axis_vector(0), "old")});
  index_.upsert({TestUtilities::create_test_item("a", 0, axis_vector(1), "new")});

  EXPECT_EQ(index_.count(), 1u);
  auto matches = index_.query(axis_vector(1), 5);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].text, "new");
  EXPECT_NEAR(matches[0].distance, 0.0f, 1e-5);
}

TEST_F(FaissVectorIndexTest, FilteredQueryOnlySeesMatchingDocument) {
  index_.upsert({TestUtilities::create_test_item("a", 0, axis_vector(0)),
                 TestUtilities::create_test_item("b", 0, axis_vector(0)),
                 TestUtilities::create_test_item("b", 1, axis_vector(1))});

  auto matches = index_.query(axis_vector(0), 5, MetadataFilter::by_document("b"));
  ASSERT_EQ(matches.size(), 2u);
  for (const auto& match : matches) {
    EXPECT_EQ(match.metadata.at("document_id"), "b");
  }
  EXPECT_EQ(index_.count(MetadataFilter::by_document("b")), 2u);
}

TEST_F(FaissVectorIndexTest, RemoveByFilterReturnsCount) {
  index_.upsert({TestUtilities::create_test_item("a", 0, axis_vector(0)),
                 TestUtilities::create_test_item("a", 1, axis_vector(1)),
                 TestUtilities::create_test_item("b", 0, axis_vector(2))});

  EXPECT_EQ(index_.remove(MetadataFilter::by_document("a")), 2u);
  EXPECT_EQ(index_.remove(MetadataFilter::by_document("a")), 0u);
  EXPECT_EQ(index_.count(), 1u);
  auto matches = index_.query(axis_vector(0), 5);
  ASSERT_EQ(matches.size(), 1u);
  EXPECT_EQ(matches[0].metadata.at("document_id"), "b");
}

TEST_F(FaissVectorIndexTest, ReplaceSwapsTheWholeDocument) {
  index_.upsert({TestUtilities::create_test_item("a", 0, axis_vector(0)),
                 TestUtilities::create_test_item("a", 1, axis_vector(1)),
                 TestUtilities::create_test_item("a", 2, axis_vector(2))});

  size_t removed = index_.replace(MetadataFilter::by_document("a"),
                                  {TestUtilities::create_test_item("a", 0, axis_vector(4), "v2")});
  EXPECT_EQ(removed, 3u);
  EXPECT_EQ(index_.count(MetadataFilter::by_document("a")), 1u);
  EXPECT_EQ(index_.query(axis_vector(4), 1).at(0).text, "v2");
}

TEST_F(FaissVectorIndexTest, ReplaceWithABadVectorKeepsTheOldSet) {
  index_.upsert({TestUtilities::create_test_item("a", 0, axis_vector(0), "v1"),
                 TestUtilities::create_test_item("a", 1, axis_vector(1), "v1")});

  std::vector<float> short_vector(kTestDimension - 1, 1.0f);
  EXPECT_THROW(index_.replace(MetadataFilter::by_document("a"),
                              {TestUtilities::create_test_item("a", 0, axis_vector(2), "v2"),
                               TestUtilities::create_test_item("a", 1, short_vector, "v2")}),
               InvalidConfig);

  auto matches = index_.query(axis_vector(0), 5, MetadataFilter::by_document("a"));
  ASSERT_EQ(matches.size(), 2u);
  EXPECT_EQ(matches[0].text, "v1");
  EXPECT_EQ(matches[1].text, "v1");
}

TEST_F(FaissVectorIndexTest, ConcurrentQueriesSeeWholeDocumentGenerations) {
  TestUtilities::ReplaceStressResult result = TestUtilities::run_replace_stress(index_, 500);
  EXPECT_GT(result.reads, 0u);
  EXPECT_EQ(result.torn_reads, 0u);
  EXPECT_EQ(index_.count(MetadataFilter::by_document("B")), 1u);
}

TEST_F(FaissVectorIndexTest, ResetSwapsAllContents) {
  index_.upsert({TestUtilities::create_test_item("a", 0, axis_vector(0))});
  index_.reset({TestUtilities::create_test_item("b", 0, axis_vector(1)),
                TestUtilities::create_test_item("b", 1, axis_vector(2))});

  EXPECT_EQ(index_.count(), 2u);
  EXPECT_EQ(index_.count(MetadataFilter::by_document("a")), 0u);
  std::vector<float> short_vector(kTestDimension - 1, 1.0f);
  EXPECT_THROW(index_.reset({TestUtilities::create_test_item("c", 0, short_vector)}),
               InvalidConfig);
  EXPECT_EQ(index_.count(), 2u);
}

TEST_F(FaissVectorIndexTest, RejectsWrongDimension) {
  std::vector<float> short_vector(kTestDimension - 1, 1.0f);
  EXPECT_THROW(index_.upsert({TestUtilities::create_test_item("a", 0, short_vector)}),
               InvalidConfig);
  EXPECT_THROW(index_.query(short_vector, 1), InvalidConfig);
  EXPECT_EQ(index_.count(), 0u);
}

TEST_F(FaissVectorIndexTest, ClearDropsEverything) {
  index_.upsert({TestUtilities::create_test_item("a", 0, axis_vector(0))});
  index_.clear();
  EXPECT_EQ(index_.count(), 0u);
  EXPECT_TRUE(index_.query(axis_vector(0), 1).empty());
}

}  // namespace finmda_tests
