// Tests for evaluation/experiment_report.h -- JSON and text rendering.

#include "evaluation/experiment_report.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/json_parser.h"
#include "test_helpers.h"

namespace tessitura {
namespace {

EvaluationConfig fastConfig() {
  EvaluationConfig config;
  config.bootstrap_samples = 200;
  return config;
}

JsonValue parseOrFail(const std::string& json) {
  JsonValue root;
  std::string error;
  EXPECT_TRUE(parseJson(json, root, &error)) << error;
  return root;
}

bool contains(const std::string& text, const std::string& fragment) {
  return text.find(fragment) != std::string::npos;
}

// ---------------------------------------------------------------------------
// Self-retrieval
// ---------------------------------------------------------------------------

TEST(SelfRetrievalReportTest, JsonLayout) {
  auto songs = test_helpers::makeUniformLibrary(8, 60, 70);
  SelfRetrievalResult result = runSelfRetrieval(songs, fastConfig());
  ASSERT_TRUE(result.success);

  JsonValue root = parseOrFail(selfRetrievalToJson(result));
  EXPECT_EQ(root.find("experiment")->asString(), "RQ1_self_retrieval_accuracy");
  EXPECT_TRUE(root.find("success")->asBool());
  EXPECT_EQ(root.find("error"), nullptr);

  const JsonValue* params = root.find("parameters");
  ASSERT_NE(params, nullptr);
  EXPECT_EQ(params->find("min_candidates")->asInt(), 2);
  EXPECT_EQ(params->find("bootstrap_samples")->asInt(), 200);
  EXPECT_EQ(params->find("random_seed")->asInt(), 42);

  const JsonValue* summary = root.find("data_summary");
  ASSERT_NE(summary, nullptr);
  EXPECT_EQ(summary->find("total_songs_in_library")->asInt(), 8);
  EXPECT_EQ(summary->find("valid_queries")->asInt(), 8);
  ASSERT_NE(summary->find("skipped"), nullptr);

  const JsonValue* metrics = root.find("metrics");
  ASSERT_NE(metrics, nullptr);
  for (const char* name : {"HR@1", "HR@3", "HR@5", "MRR"}) {
    const JsonValue* metric = metrics->find(name);
    ASSERT_NE(metric, nullptr) << name;
    ASSERT_NE(metric->find("value"), nullptr);
    ASSERT_EQ(metric->find("ci_95")->array_items.size(), 2u);
  }
  const JsonValue* per_query = root.find("per_query");
  ASSERT_NE(per_query, nullptr);
  ASSERT_EQ(per_query->array_items.size(), 8u);
  EXPECT_NE(per_query->array_items[0].find("1/rank"), nullptr);
  EXPECT_NE(per_query->array_items[0].find("hit@3"), nullptr);
}

TEST(SelfRetrievalReportTest, FailureCarriesError) {
  SelfRetrievalResult result = runSelfRetrieval({}, fastConfig());
  ASSERT_FALSE(result.success);
  JsonValue root = parseOrFail(selfRetrievalToJson(result));
  EXPECT_FALSE(root.find("success")->asBool());
  EXPECT_EQ(root.find("error")->asString(), "No song yielded a valid self-retrieval query.");
  EXPECT_EQ(root.find("metrics"), nullptr);

  std::string text = selfRetrievalToTextSummary(result);
  EXPECT_TRUE(contains(text, "=== RQ1 Self-Retrieval Accuracy ==="));
  EXPECT_TRUE(contains(text, "Error: No song yielded"));
}

TEST(SelfRetrievalReportTest, TextSummary) {
  auto songs = test_helpers::makeUniformLibrary(6, 60, 70);
  SelfRetrievalResult result = runSelfRetrieval(songs, fastConfig());
  ASSERT_TRUE(result.success);
  std::string text = selfRetrievalToTextSummary(result);
  EXPECT_TRUE(contains(text, "HR@1: "));
  EXPECT_TRUE(contains(text, "[95% CI: ["));
  EXPECT_TRUE(contains(text, "Valid queries: 6 / 6"));
}

// ---------------------------------------------------------------------------
// Ranking stability
// ---------------------------------------------------------------------------

TEST(RankingStabilityReportTest, JsonLayout) {
  auto songs = test_helpers::makeUniformLibrary(12, 60, 70);
  EvaluationConfig config = fastConfig();
  config.n_baselines = 2;
  RankingStabilityResult result = runRankingStability(songs, config);
  ASSERT_TRUE(result.success);

  JsonValue root = parseOrFail(rankingStabilityToJson(result));
  EXPECT_EQ(root.find("experiment")->asString(), "RQ2_ranking_stability");
  EXPECT_EQ(root.find("parameters")->find("n_baselines")->asInt(), 2);
  EXPECT_EQ(root.find("parameters")->find("min_candidates")->asInt(), 10);
  EXPECT_EQ(root.find("data_summary")->find("total_perturbations")->asInt(), 39);
  EXPECT_EQ(root.find("baseline_profiles")->array_items.size(), 2u);

  const JsonValue* metrics = root.find("metrics");
  ASSERT_NE(metrics, nullptr);
  EXPECT_NE(metrics->find("mean_tau"), nullptr);
  EXPECT_EQ(metrics->find("ci_95")->array_items.size(), 2u);
  std::string agreement = metrics->find("agreement")->asString();
  EXPECT_TRUE(agreement == "strong" || agreement == "moderate" || agreement == "weak");
  EXPECT_NE(root.find("interpretation"), nullptr);

  const JsonValue* perts = root.find("per_perturbation");
  ASSERT_EQ(perts->array_items.size(), 39u);
  EXPECT_EQ(perts->array_items[0].find("perturbation_type")->asString(), "add_fav");
  EXPECT_EQ(perts->array_items[0].find("note_changed")->asString(), "C#4");
}

TEST(RankingStabilityReportTest, FailureAndText) {
  auto songs = test_helpers::makeUniformLibrary(3, 60, 70);
  RankingStabilityResult result = runRankingStability(songs, fastConfig());
  ASSERT_FALSE(result.success);
  JsonValue root = parseOrFail(rankingStabilityToJson(result));
  EXPECT_EQ(root.find("error")->asString(),
            "No song yielded >= 10 candidates. Library too small.");
  EXPECT_EQ(root.find("data_summary")->find("skipped")->find("too_few_candidates")->asInt(), 3);
  EXPECT_EQ(root.find("baseline_profiles"), nullptr);
  EXPECT_TRUE(contains(rankingStabilityToTextSummary(result), "=== RQ2 Ranking Stability ==="));
}

// ---------------------------------------------------------------------------
// Score spread
// ---------------------------------------------------------------------------

TEST(ScoreSpreadReportTest, JsonLayout) {
  auto songs = test_helpers::makeUniformLibrary(12, 60, 70);
  EvaluationConfig config = fastConfig();
  config.n_profiles = 3;
  ScoreSpreadResult result = runScoreSpread(songs, config);
  ASSERT_TRUE(result.success);

  JsonValue root = parseOrFail(scoreSpreadToJson(result));
  EXPECT_EQ(root.find("experiment")->asString(), "RQ3_score_spread_internal_validity");
  EXPECT_EQ(root.find("parameters")->find("n_profiles")->asInt(), 3);
  EXPECT_EQ(root.find("data_summary")->find("n_profiles")->asInt(), 3);

  const JsonValue* metrics = root.find("metrics");
  ASSERT_NE(metrics, nullptr);
  const JsonValue* spread = metrics->find("spread");
  ASSERT_NE(spread, nullptr);
  EXPECT_NE(spread->find("mean_variance_final_score"), nullptr);
  EXPECT_EQ(spread->find("ci_95_range")->array_items.size(), 2u);

  const JsonValue* correlations = metrics->find("correlations");
  ASSERT_NE(correlations, nullptr);
  const JsonValue* avoid = correlations->find("r_final_score_avoid_penalty");
  ASSERT_NE(avoid, nullptr);
  EXPECT_EQ(avoid->find("expected_sign")->asString(), "negative");
  EXPECT_EQ(avoid->find("matches_expected")->asBool(), result.r_final_avoid.matchesExpected());
  EXPECT_EQ(correlations->find("r_final_score_cosine_similarity")
                ->find("expected_sign")
                ->asString(),
            "positive");

  EXPECT_EQ(root.find("per_run")->array_items.size(), 3u);
}

TEST(ScoreSpreadReportTest, TextSummary) {
  auto songs = test_helpers::makeUniformLibrary(12, 60, 70);
  ScoreSpreadResult result = runScoreSpread(songs, fastConfig());
  ASSERT_TRUE(result.success);
  std::string text = scoreSpreadToTextSummary(result);
  EXPECT_TRUE(contains(text, "=== RQ3 Score Spread and Internal Validity ==="));
  EXPECT_TRUE(contains(text, "r(final_score, avoid_pen):"));
  EXPECT_TRUE(contains(text, "Profiles: 12"));
}

}  // namespace
}  // namespace tessitura
