// Tests for evaluation/self_retrieval.h -- self-retrieval accuracy.

#include "evaluation/self_retrieval.h"

#include <gtest/gtest.h>

#include <vector>

#include "test_helpers.h"

namespace tessitura {
namespace {

using test_helpers::makeSong;

EvaluationConfig fastConfig() {
  EvaluationConfig config;
  config.bootstrap_samples = 300;
  return config;
}

/// Three songs over C4-C5, each concentrated on a different region.
std::vector<Song> makeDistinctTrio() {
  return {
      makeSong("a.xml", {{60, 1.0}, {62, 6.0}, {64, 5.0}, {65, 4.0}, {67, 1.0}, {72, 1.0}}),
      makeSong("b.xml", {{60, 1.0}, {65, 6.0}, {67, 5.0}, {69, 4.0}, {62, 1.0}, {72, 1.0}}),
      makeSong("c.xml", {{60, 1.0}, {69, 6.0}, {71, 5.0}, {72, 4.0}, {64, 1.0}, {65, 1.0}}),
  };
}

// ---------------------------------------------------------------------------
// makeQueryRecord
// ---------------------------------------------------------------------------

TEST(QueryRecordTest, HitFlagsAndReciprocalRank) {
  Song song = makeSong("x.xml", {{60, 1.0}});
  QueryRecord first = makeQueryRecord(song, 1);
  EXPECT_TRUE(first.hit_at_1);
  EXPECT_TRUE(first.hit_at_5);
  EXPECT_DOUBLE_EQ(first.reciprocal_rank, 1.0);

  QueryRecord fourth = makeQueryRecord(song, 4);
  EXPECT_FALSE(fourth.hit_at_1);
  EXPECT_FALSE(fourth.hit_at_3);
  EXPECT_TRUE(fourth.hit_at_5);
  EXPECT_DOUBLE_EQ(fourth.reciprocal_rank, 0.25);

  QueryRecord sixth = makeQueryRecord(song, 6);
  EXPECT_FALSE(sixth.hit_at_5);
  EXPECT_EQ(sixth.filename, "x.xml");
}

// ---------------------------------------------------------------------------
// runSelfRetrieval
// ---------------------------------------------------------------------------

TEST(SelfRetrievalTest, DistinctSongsRetrieveThemselves) {
  auto songs = makeDistinctTrio();
  SelfRetrievalResult result = runSelfRetrieval(songs, fastConfig());
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_EQ(result.per_query.size(), 3u);
  for (const auto& record : result.per_query) {
    EXPECT_EQ(record.rank, 1) << record.filename;
  }
  EXPECT_DOUBLE_EQ(result.hr_at_1.value, 1.0);
  EXPECT_DOUBLE_EQ(result.mrr.value, 1.0);
  EXPECT_DOUBLE_EQ(result.hr_at_1.ci.lo, 1.0);
  EXPECT_DOUBLE_EQ(result.hr_at_1.ci.hi, 1.0);
  EXPECT_EQ(result.summary.total_songs, 3u);
  EXPECT_EQ(result.summary.used, 3u);
  EXPECT_EQ(result.summary.skipped.total(), 0u);
}

TEST(SelfRetrievalTest, MetricsAreOrderedAndBounded) {
  auto songs = test_helpers::makeUniformLibrary(14, 57, 72);
  SelfRetrievalResult result = runSelfRetrieval(songs, fastConfig());
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_LE(result.hr_at_1.value, result.hr_at_3.value);
  EXPECT_LE(result.hr_at_3.value, result.hr_at_5.value);
  EXPECT_LE(result.hr_at_5.value, 1.0);
  EXPECT_GE(result.mrr.value, result.hr_at_1.value);
  EXPECT_LE(result.mrr.value, 1.0);
  for (const MetricEstimate* metric :
       {&result.hr_at_1, &result.hr_at_3, &result.hr_at_5, &result.mrr}) {
    EXPECT_LE(metric->ci.lo, metric->ci.hi);
    EXPECT_GE(metric->ci.lo, 0.0);
    EXPECT_LE(metric->ci.hi, 1.0);
  }
  for (const auto& record : result.per_query) {
    EXPECT_GE(record.rank, 1);
    EXPECT_LE(record.rank, 14);
  }
}

TEST(SelfRetrievalTest, DeterministicForSeed) {
  auto songs = test_helpers::makeUniformLibrary(10, 60, 70);
  SelfRetrievalResult first = runSelfRetrieval(songs, fastConfig());
  SelfRetrievalResult second = runSelfRetrieval(songs, fastConfig());
  ASSERT_TRUE(first.success);
  EXPECT_EQ(first.mrr.value, second.mrr.value);
  EXPECT_EQ(first.mrr.ci.lo, second.mrr.ci.lo);
  EXPECT_EQ(first.hr_at_3.ci.hi, second.hr_at_3.ci.hi);
  ASSERT_EQ(first.per_query.size(), second.per_query.size());
  for (size_t idx = 0; idx < first.per_query.size(); ++idx) {
    EXPECT_EQ(first.per_query[idx].rank, second.per_query[idx].rank);
  }
}

TEST(SelfRetrievalTest, SkipsSongsWithoutData) {
  auto songs = makeDistinctTrio();
  Song no_range;
  no_range.filename = "no_range.xml";
  songs.push_back(no_range);
  Song silent = makeSong("silent.xml", {{64, 0.0}});
  songs.push_back(silent);

  SelfRetrievalResult result = runSelfRetrieval(songs, fastConfig());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.summary.total_songs, 5u);
  EXPECT_EQ(result.summary.used, 3u);
  EXPECT_EQ(result.summary.skipped.missing_range, 1u);
  EXPECT_EQ(result.summary.skipped.zero_duration, 1u);
}

TEST(SelfRetrievalTest, RangeOutsideMidiIsSkippedAsMissing) {
  auto songs = makeDistinctTrio();
  Song huge = makeSong("huge.xml", {{60, 1.0}, {62, 1.0}});
  huge.statistics.pitch_range = PitchRange{0, 2000000000};
  songs.push_back(huge);

  SelfRetrievalResult result = runSelfRetrieval(songs, fastConfig());
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.summary.used, 3u);
  EXPECT_EQ(result.summary.skipped.missing_range, 1u);
}

TEST(SelfRetrievalTest, QueriesWithoutCompetitorAreSkipped) {
  // Disjoint ranges: every song is alone in its own candidate set.
  std::vector<Song> songs = {
      makeSong("low.xml", {{48, 1.0}, {50, 2.0}}),
      makeSong("high.xml", {{72, 1.0}, {74, 2.0}}),
  };
  SelfRetrievalResult result = runSelfRetrieval(songs, fastConfig());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error_message, "No song yielded a valid self-retrieval query.");
  EXPECT_EQ(result.summary.skipped.too_few_candidates, 2u);
  EXPECT_TRUE(result.per_query.empty());
}

TEST(SelfRetrievalTest, EmptyLibraryFails) {
  SelfRetrievalResult result = runSelfRetrieval({}, fastConfig());
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.summary.total_songs, 0u);
}

}  // namespace
}  // namespace tessitura
