// Tests for recommend/vector_space.h -- dense vectors and normalization.

#include "recommend/vector_space.h"

#include <gtest/gtest.h>

#include <vector>

namespace tessitura {
namespace {

// ---------------------------------------------------------------------------
// buildDenseVector
// ---------------------------------------------------------------------------

TEST(BuildDenseVectorTest, ProjectsOntoRange) {
  Tessituragram tess{{60, 1.0}, {62, 2.5}, {64, 0.5}};
  DenseVector vec = buildDenseVector(tess, 60, 64);
  EXPECT_EQ(vec, (DenseVector{1.0, 0.0, 2.5, 0.0, 0.5}));
}

TEST(BuildDenseVectorTest, DropsPitchesOutsideRange) {
  Tessituragram tess{{55, 4.0}, {61, 1.0}, {70, 3.0}};
  DenseVector vec = buildDenseVector(tess, 60, 62);
  EXPECT_EQ(vec, (DenseVector{0.0, 1.0, 0.0}));
}

TEST(BuildDenseVectorTest, ReversedRangeIsEmpty) {
  EXPECT_TRUE(buildDenseVector(Tessituragram{{60, 1.0}}, 62, 60).empty());
}

// ---------------------------------------------------------------------------
// Reductions
// ---------------------------------------------------------------------------

TEST(VectorMathTest, SumNormAndDot) {
  DenseVector vec{3.0, 4.0};
  EXPECT_DOUBLE_EQ(vectorSum(vec), 7.0);
  EXPECT_DOUBLE_EQ(l2Norm(vec), 5.0);
  EXPECT_DOUBLE_EQ(dotProduct(vec, DenseVector{1.0, 2.0}), 11.0);
  EXPECT_DOUBLE_EQ(dotProduct(vec, DenseVector{2.0}), 6.0);
}

// ---------------------------------------------------------------------------
// Normalization
// ---------------------------------------------------------------------------

TEST(NormalizeTest, L1SumsToOne) {
  DenseVector normed = normalizeL1(DenseVector{1.0, 3.0, 0.0, 4.0});
  EXPECT_DOUBLE_EQ(vectorSum(normed), 1.0);
  EXPECT_DOUBLE_EQ(normed[1], 0.375);
}

TEST(NormalizeTest, L2HasUnitLength) {
  DenseVector normed = normalizeL2(DenseVector{3.0, 4.0});
  EXPECT_DOUBLE_EQ(normed[0], 0.6);
  EXPECT_DOUBLE_EQ(normed[1], 0.8);
  EXPECT_NEAR(l2Norm(normed), 1.0, 1e-12);
}

TEST(NormalizeTest, ZeroVectorUnchanged) {
  DenseVector zeros(4, 0.0);
  EXPECT_EQ(normalizeL1(zeros), zeros);
  EXPECT_EQ(normalizeL2(zeros), zeros);
}

// ---------------------------------------------------------------------------
// cosineSimilarity
// ---------------------------------------------------------------------------

TEST(CosineSimilarityTest, ParallelAndOrthogonal) {
  EXPECT_DOUBLE_EQ(cosineSimilarity(DenseVector{1.0, 2.0}, DenseVector{2.0, 4.0}), 1.0);
  EXPECT_DOUBLE_EQ(cosineSimilarity(DenseVector{1.0, 0.0}, DenseVector{0.0, 3.0}), 0.0);
}

TEST(CosineSimilarityTest, ZeroNormGivesZero) {
  EXPECT_DOUBLE_EQ(cosineSimilarity(DenseVector{0.0, 0.0}, DenseVector{1.0, 1.0}), 0.0);
}

TEST(CosineSimilarityTest, NonNegativeInputsStayInUnitInterval) {
  DenseVector lhs{0.1, 0.7, 0.2, 0.0, 0.33};
  DenseVector rhs{0.5, 0.1, 0.0, 0.9, 0.33};
  double cos = cosineSimilarity(lhs, rhs);
  EXPECT_GE(cos, 0.0);
  EXPECT_LE(cos, 1.0);
  EXPECT_LE(cosineSimilarity(lhs, lhs), 1.0);
}

// ---------------------------------------------------------------------------
// sumAtPitches
// ---------------------------------------------------------------------------

TEST(SumAtPitchesTest, SumsListedPitchesInRange) {
  DenseVector vec{0.1, 0.2, 0.3, 0.4};  // 60..63
  EXPECT_DOUBLE_EQ(sumAtPitches(vec, 60, {61, 63}), 0.6);
  EXPECT_DOUBLE_EQ(sumAtPitches(vec, 60, {59, 64}), 0.0);
  EXPECT_DOUBLE_EQ(sumAtPitches(vec, 60, {}), 0.0);
}

}  // namespace
}  // namespace tessitura
