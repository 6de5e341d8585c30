// Tests for evaluation/score_spread.h -- score spread and component correlations.

#include "evaluation/score_spread.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_helpers.h"

namespace tessitura {
namespace {

EvaluationConfig fastConfig() {
  EvaluationConfig config;
  config.bootstrap_samples = 300;
  return config;
}

ScoredResult makeResult(double final_score, double cosine, double avoid, double favorite) {
  ScoredResult result;
  result.final_score = final_score;
  result.cosine_similarity = cosine;
  result.avoid_penalty = avoid;
  result.favorite_overlap = favorite;
  return result;
}

// ---------------------------------------------------------------------------
// measureScoreSpread
// ---------------------------------------------------------------------------

TEST(MeasureScoreSpreadTest, LinearComponents) {
  std::vector<ScoredResult> results = {
      makeResult(0.9, 0.9, 0.0, 0.6),
      makeResult(0.6, 0.7, 0.2, 0.4),
      makeResult(0.3, 0.5, 0.4, 0.2),
  };
  RunRecord record = measureScoreSpread(results);
  EXPECT_EQ(record.n_songs, 3u);
  EXPECT_NEAR(record.variance_final_score, 0.09, 1e-12);
  EXPECT_NEAR(record.range_final_score, 0.6, 1e-12);
  EXPECT_NEAR(record.r_final_cosine, 1.0, 1e-9);
  EXPECT_NEAR(record.r_final_avoid, -1.0, 1e-9);
  EXPECT_NEAR(record.r_cosine_favorite, 1.0, 1e-9);
  EXPECT_TRUE(record.source_song.empty());
}

TEST(MeasureScoreSpreadTest, EqualScoresFallBackToZero) {
  std::vector<ScoredResult> results = {
      makeResult(0.5, 0.5, 0.0, 0.1),
      makeResult(0.5, 0.5, 0.0, 0.3),
      makeResult(0.5, 0.5, 0.0, 0.2),
  };
  RunRecord record = measureScoreSpread(results);
  EXPECT_DOUBLE_EQ(record.variance_final_score, 0.0);
  EXPECT_DOUBLE_EQ(record.range_final_score, 0.0);
  EXPECT_DOUBLE_EQ(record.r_final_cosine, 0.0);
  EXPECT_DOUBLE_EQ(record.r_final_avoid, 0.0);
  EXPECT_DOUBLE_EQ(record.r_cosine_favorite, 0.0);
}

TEST(MeasureScoreSpreadTest, SingleSong) {
  RunRecord record = measureScoreSpread({makeResult(0.8, 0.8, 0.0, 0.5)});
  EXPECT_EQ(record.n_songs, 1u);
  EXPECT_DOUBLE_EQ(record.variance_final_score, 0.0);
  EXPECT_DOUBLE_EQ(record.r_final_cosine, 0.0);
}

// ---------------------------------------------------------------------------
// CorrelationEstimate
// ---------------------------------------------------------------------------

TEST(CorrelationEstimateTest, StrictSignMatch) {
  CorrelationEstimate positive{{}, ExpectedSign::Positive};
  positive.estimate.value = 0.2;
  EXPECT_TRUE(positive.matchesExpected());
  positive.estimate.value = 0.0;
  EXPECT_FALSE(positive.matchesExpected());

  CorrelationEstimate negative{{}, ExpectedSign::Negative};
  negative.estimate.value = -0.1;
  EXPECT_TRUE(negative.matchesExpected());
  negative.estimate.value = 0.4;
  EXPECT_FALSE(negative.matchesExpected());

  EXPECT_STREQ(expectedSignToString(ExpectedSign::Positive), "positive");
  EXPECT_STREQ(expectedSignToString(ExpectedSign::Negative), "negative");
}

// ---------------------------------------------------------------------------
// runScoreSpread
// ---------------------------------------------------------------------------

TEST(ScoreSpreadTest, RunsUpToProfileLimit) {
  auto songs = test_helpers::makeUniformLibrary(14, 57, 72);
  EvaluationConfig config = fastConfig();
  config.n_profiles = 4;
  ScoreSpreadResult result = runScoreSpread(songs, config);
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_EQ(result.per_run.size(), 4u);
  EXPECT_EQ(result.summary.used, 4u);
  EXPECT_EQ(result.per_run[0].source_song, "song_00.xml");
  for (const auto& run : result.per_run) {
    EXPECT_EQ(run.n_songs, 14u);
    EXPECT_GE(run.variance_final_score, 0.0);
    EXPECT_GE(run.r_final_cosine, -1.0);
    EXPECT_LE(run.r_final_cosine, 1.0);
  }
  EXPECT_EQ(result.r_final_cosine.expected, ExpectedSign::Positive);
  EXPECT_EQ(result.r_final_avoid.expected, ExpectedSign::Negative);
  EXPECT_EQ(result.r_cosine_favorite.expected, ExpectedSign::Positive);
  EXPECT_LE(result.variance.ci.lo, result.variance.ci.hi);
  EXPECT_LE(result.range.ci.lo, result.range.ci.hi);
  EXPECT_GE(result.std_variance, 0.0);
}

TEST(ScoreSpreadTest, SingleCandidateRunsGiveZeroSpread) {
  std::vector<Song> songs = {
      test_helpers::makeSong("low.xml", {{48, 1.0}, {50, 2.0}}),
      test_helpers::makeSong("high.xml", {{72, 1.0}, {74, 2.0}}),
  };
  EvaluationConfig config = fastConfig();
  config.min_candidates = 1;
  ScoreSpreadResult result = runScoreSpread(songs, config);
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.per_run.size(), 2u);
  EXPECT_DOUBLE_EQ(result.variance.value, 0.0);
  EXPECT_DOUBLE_EQ(result.variance.ci.lo, 0.0);
  EXPECT_DOUBLE_EQ(result.variance.ci.hi, 0.0);
  EXPECT_DOUBLE_EQ(result.r_final_avoid.estimate.value, 0.0);
  EXPECT_FALSE(result.r_final_avoid.matchesExpected());
}

TEST(ScoreSpreadTest, DeterministicForSeed) {
  auto songs = test_helpers::makeUniformLibrary(12, 60, 70);
  ScoreSpreadResult first = runScoreSpread(songs, fastConfig());
  ScoreSpreadResult second = runScoreSpread(songs, fastConfig());
  ASSERT_TRUE(first.success);
  EXPECT_EQ(first.range.ci.lo, second.range.ci.lo);
  EXPECT_EQ(first.r_final_cosine.estimate.ci.hi, second.r_final_cosine.estimate.ci.hi);
}

TEST(ScoreSpreadTest, ZeroProfileCountIsRejected) {
  auto songs = test_helpers::makeUniformLibrary(12, 60, 70);
  EvaluationConfig config = fastConfig();
  config.n_profiles = 0;
  ScoreSpreadResult result = runScoreSpread(songs, config);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_message, "n_baselines and n_profiles must be at least 1");
  EXPECT_TRUE(result.per_run.empty());
}

TEST(ScoreSpreadTest, LibraryTooSmall) {
  auto songs = test_helpers::makeUniformLibrary(4, 60, 70);
  ScoreSpreadResult result = runScoreSpread(songs, fastConfig());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_message, "No song yielded >= 10 candidates. Library too small.");
  EXPECT_EQ(result.summary.skipped.too_few_candidates, 4u);
}

}  // namespace
}  // namespace tessitura
