// Tests for recommender.h -- end-to-end recommendation queries.

#include "recommender.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/json_parser.h"
#include "test_helpers.h"

namespace tessitura {
namespace {

using test_helpers::makeSong;

std::vector<Song> makeLibrary() {
  return {
      makeSong("aria.xml", {{62, 1.0}, {64, 4.0}, {67, 3.0}, {69, 1.0}}, "Handel"),
      makeSong("lied.xml", {{60, 2.0}, {62, 2.0}, {64, 1.0}, {72, 3.0}}, "Schubert"),
      makeSong("chanson.xml", {{65, 2.0}, {67, 2.0}, {69, 2.0}}, "Faure"),
      makeSong("too_high.xml", {{67, 1.0}, {81, 1.0}}, "Strauss"),
      makeSong("too_low.xml", {{50, 1.0}, {62, 1.0}}, "Brahms"),
  };
}

RecommendConfig makeConfig(MidiPitch low, MidiPitch high, std::vector<MidiPitch> favorites = {},
                           std::vector<MidiPitch> avoids = {}) {
  RecommendConfig config;
  config.profile.range_min = low;
  config.profile.range_max = high;
  config.profile.favorite_midis = std::move(favorites);
  config.profile.avoid_midis = std::move(avoids);
  return config;
}

// ---------------------------------------------------------------------------
// recommend
// ---------------------------------------------------------------------------

TEST(RecommendTest, FiltersByContainmentAndRanks) {
  auto songs = makeLibrary();
  RecommendResult result = recommend(songs, makeConfig(60, 72, {64, 67}));
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.total_songs, 5u);
  EXPECT_EQ(result.candidates, 3u);
  ASSERT_EQ(result.results.size(), 3u);
  EXPECT_EQ(result.results[0].filename, "aria.xml");
  for (size_t idx = 0; idx < result.results.size(); ++idx) {
    EXPECT_EQ(result.results[idx].rank, static_cast<int>(idx) + 1);
    EXPECT_NE(result.results[idx].filename, "too_high.xml");
    EXPECT_NE(result.results[idx].filename, "too_low.xml");
  }
  EXPECT_EQ(result.ideal_vector.size(), 13u);
}

TEST(RecommendTest, ClipsOutOfRangePreferences) {
  auto songs = makeLibrary();
  RecommendResult result = recommend(songs, makeConfig(60, 72, {55, 64}, {80, 71}));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.profile.favorite_midis, (std::vector<MidiPitch>{64}));
  EXPECT_EQ(result.profile.avoid_midis, (std::vector<MidiPitch>{71}));
  EXPECT_EQ(result.clipped_favorites, (std::vector<MidiPitch>{55}));
  EXPECT_EQ(result.clipped_avoids, (std::vector<MidiPitch>{80}));
}

TEST(RecommendTest, OverlapRemovedByDefault) {
  auto songs = makeLibrary();
  RecommendResult result = recommend(songs, makeConfig(60, 72, {64}, {64, 72}));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.profile.avoid_midis, (std::vector<MidiPitch>{72}));
  EXPECT_EQ(result.removed_overlap, (std::vector<MidiPitch>{64}));
}

TEST(RecommendTest, PreservePolicyKeepsOverlap) {
  auto songs = makeLibrary();
  RecommendConfig config = makeConfig(60, 72, {64}, {64, 72});
  config.disjoint_policy = DisjointPolicy::Preserve;
  RecommendResult result = recommend(songs, config);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.profile.avoid_midis, (std::vector<MidiPitch>{64, 72}));
  EXPECT_TRUE(result.removed_overlap.empty());
  // base + boost + penalty at E4 equals the plain base weight at C#4.
  EXPECT_NEAR(result.ideal_vector[64 - 60], result.ideal_vector[61 - 60], 1e-12);
}

TEST(RecommendTest, EmptyCandidateSetIsSuccess) {
  auto songs = makeLibrary();
  RecommendResult result = recommend(songs, makeConfig(40, 45));
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.candidates, 0u);
  EXPECT_TRUE(result.results.empty());
}

TEST(RecommendTest, InvalidRanges) {
  auto songs = makeLibrary();
  RecommendResult reversed = recommend(songs, makeConfig(72, 60));
  EXPECT_FALSE(reversed.success);
  EXPECT_EQ(reversed.error_message, "Lowest note C5 is above highest note C4");

  RecommendResult outside = recommend(songs, makeConfig(-1, 60));
  EXPECT_FALSE(outside.success);
  EXPECT_EQ(outside.error_message, "Range -1-60 is outside MIDI 0-127");

  RecommendResult too_high = recommend(songs, makeConfig(60, 128));
  EXPECT_FALSE(too_high.success);
}

TEST(RecommendTest, AlphaChangesAvoidWeight) {
  auto songs = makeLibrary();
  RecommendConfig mild = makeConfig(60, 72, {}, {72});
  mild.scoring.alpha = 0.0;
  RecommendConfig harsh = mild;
  harsh.scoring.alpha = 2.0;

  RecommendResult mild_result = recommend(songs, mild);
  RecommendResult harsh_result = recommend(songs, harsh);
  ASSERT_TRUE(mild_result.success);
  ASSERT_TRUE(harsh_result.success);
  for (const auto& scored : mild_result.results) {
    EXPECT_DOUBLE_EQ(scored.final_score, scored.cosine_similarity);
  }
  EXPECT_NE(harsh_result.results.back().filename, "aria.xml");
  EXPECT_EQ(harsh_result.results.back().filename, "lied.xml");
}

// ---------------------------------------------------------------------------
// buildRecommendationsJson
// ---------------------------------------------------------------------------

TEST(RecommendationsJsonTest, Layout) {
  auto songs = makeLibrary();
  RecommendConfig config = makeConfig(60, 72, {64, 67}, {72});
  RecommendResult result = recommend(songs, config);
  ASSERT_TRUE(result.success);

  JsonValue root;
  std::string error;
  ASSERT_TRUE(parseJson(buildRecommendationsJson(result, config), root, &error)) << error;

  const JsonValue* prefs = root.find("user_preferences");
  ASSERT_NE(prefs, nullptr);
  const JsonValue* range = prefs->find("range");
  ASSERT_NE(range, nullptr);
  EXPECT_EQ(range->find("low")->asString(), "C4");
  EXPECT_EQ(range->find("high_midi")->asInt(), 72);
  EXPECT_EQ(prefs->find("favorite_notes")->array_items.size(), 2u);
  EXPECT_EQ(prefs->find("avoid_notes")->array_items[0].asString(), "C5");
  EXPECT_DOUBLE_EQ(prefs->find("alpha")->asDouble(), 0.5);

  const JsonValue* ideal = root.find("ideal_vector");
  ASSERT_NE(ideal, nullptr);
  EXPECT_EQ(ideal->object_members.size(), 13u);
  EXPECT_EQ(ideal->object_members.front().first, "60");
  EXPECT_DOUBLE_EQ(ideal->find("72")->asDouble(), 0.0);

  const JsonValue* recs = root.find("recommendations");
  ASSERT_NE(recs, nullptr);
  ASSERT_EQ(recs->array_items.size(), 3u);
  const JsonValue& top = recs->array_items[0];
  EXPECT_EQ(top.find("rank")->asInt(), 1);
  EXPECT_EQ(top.find("filename")->asString(), result.results[0].filename);
  EXPECT_NEAR(top.find("final_score")->asDouble(), result.results[0].final_score, 5e-5);
  EXPECT_NE(top.find("explanation")->asString().find("Final score"), std::string::npos);
  EXPECT_NE(top.find("normalized_vector"), nullptr);
}

}  // namespace
}  // namespace tessitura
