/**
 * @file test_embedding_comparator.cpp
 * @brief Unit tests for EmbeddingComparator
 */

#include <gtest/gtest.h>
#include "embedding_comparator.h"
#include "errors.h"
#include "test_support.h"
#include <limits>

using namespace gymface;
using namespace gymface::testing;

class EmbeddingComparatorTest : public ::testing::Test {
protected:
    EmbeddingComparator comparator_{TEST_DIMS, 0.6};
};

TEST_F(EmbeddingComparatorTest, IdenticalEmbeddingsMatch) {
    ComparisonResult result = comparator_.compare(axisEmbedding(4), axisEmbedding(4));

    EXPECT_TRUE(result.is_match);
    EXPECT_DOUBLE_EQ(result.similarity, 1.0);
}

TEST_F(EmbeddingComparatorTest, MatchIsInclusiveAtTolerance) {
    Embedding b = embeddingWithSimilarity(0, 1, 0.5);

    EXPECT_FALSE(comparator_.compare(axisEmbedding(0), b).is_match);
    EXPECT_TRUE(comparator_.compare(axisEmbedding(0), b, 0.5).is_match);
}

TEST_F(EmbeddingComparatorTest, SimilarityIsSymmetric) {
    Embedding a = embeddingWithSimilarity(0, 1, 0.8);
    Embedding b = embeddingWithSimilarity(0, 2, 0.3);

    EXPECT_DOUBLE_EQ(comparator_.compare(a, b).similarity, comparator_.compare(b, a).similarity);
}

TEST_F(EmbeddingComparatorTest, RejectsDimensionMismatch) {
    try {
        comparator_.compare(axisEmbedding(0), Embedding(128, 0.0));
        FAIL() << "expected FaceError";
    } catch (const FaceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InputValidation);
        EXPECT_STREQ(e.what(), "Expected 512-dimensional embedding, got 128 dimensions");
    }
}

TEST_F(EmbeddingComparatorTest, RejectsNonFiniteValues) {
    Embedding bad = axisEmbedding(0);
    bad[10] = std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW(comparator_.compare(axisEmbedding(0), bad), FaceError);
}

TEST_F(EmbeddingComparatorTest, FindBestMatchPicksHighestSimilarity) {
    std::vector<Embedding> candidates = {
        embeddingWithSimilarity(0, 1, 0.3),
        embeddingWithSimilarity(0, 2, 0.9),
        embeddingWithSimilarity(0, 3, 0.7),
    };

    BestMatch best = comparator_.findBestMatch(axisEmbedding(0), candidates);

    ASSERT_TRUE(best.index.has_value());
    EXPECT_EQ(*best.index, 1u);
    EXPECT_NEAR(best.similarity, 0.9, 1e-12);
}

TEST_F(EmbeddingComparatorTest, FindBestMatchBelowToleranceReportsSimilarityOnly) {
    std::vector<Embedding> candidates = {embeddingWithSimilarity(0, 1, 0.4)};

    BestMatch best = comparator_.findBestMatch(axisEmbedding(0), candidates);

    EXPECT_FALSE(best.index.has_value());
    EXPECT_NEAR(best.similarity, 0.4, 1e-12);
}

TEST_F(EmbeddingComparatorTest, FindBestMatchSkipsMalformedCandidates) {
    std::vector<Embedding> candidates = {Embedding(3, 1.0), axisEmbedding(0)};

    BestMatch best = comparator_.findBestMatch(axisEmbedding(0), candidates);

    ASSERT_TRUE(best.index.has_value());
    EXPECT_EQ(*best.index, 1u);
}

TEST_F(EmbeddingComparatorTest, FindBestMatchOnEmptyList) {
    BestMatch best = comparator_.findBestMatch(axisEmbedding(0), {});

    EXPECT_FALSE(best.index.has_value());
}
