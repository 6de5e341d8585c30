// Score spread experiment.

#include "evaluation/score_spread.h"

#include <cstdio>
#include <random>

#include "evaluation/statistics.h"
#include "recommend/ideal_profile.h"

namespace tessitura {

RunRecord measureScoreSpread(const std::vector<ScoredResult>& results) {
  std::vector<double> final_scores;
  std::vector<double> cosines;
  std::vector<double> penalties;
  std::vector<double> overlaps;
  for (const auto& result : results) {
    final_scores.push_back(result.final_score);
    cosines.push_back(result.cosine_similarity);
    penalties.push_back(result.avoid_penalty);
    overlaps.push_back(result.favorite_overlap);
  }

  RunRecord record;
  record.n_songs = static_cast<uint32_t>(results.size());
  record.variance_final_score = variance(final_scores, 1);
  record.range_final_score = valueRange(final_scores);
  record.r_final_cosine = pearsonCorrelation(final_scores, cosines);
  record.r_final_avoid = pearsonCorrelation(final_scores, penalties);
  record.r_cosine_favorite = pearsonCorrelation(cosines, overlaps);
  return record;
}

const char* expectedSignToString(ExpectedSign sign) {
  return sign == ExpectedSign::Positive ? "positive" : "negative";
}

ScoreSpreadResult runScoreSpread(const std::vector<Song>& songs, const EvaluationConfig& config) {
  ScoreSpreadResult result;
  result.config = config;
  EvaluationConfigError config_error = validateEvaluationConfig(config);
  if (config_error != EvaluationConfigError::Ok) {
    result.error_message = evaluationConfigErrorToString(config_error);
    return result;
  }

  auto profiles = collectProfiledQueries(songs, config.profile, config.min_candidates,
                                         config.n_profiles, result.summary, "RQ3",
                                         config.verbose);
  if (profiles.empty()) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "No song yielded >= %u candidates. Library too small.",
                  config.min_candidates);
    result.error_message = buf;
    return result;
  }

  for (const auto& query : profiles) {
    DenseVector ideal = buildIdealVector(query.profile, config.ideal);
    auto ranked = scoreSongs(query.candidates, ideal, query.profile, config.scoring);
    RunRecord record = measureScoreSpread(ranked);
    record.source_song = query.song->filename;
    record.composer = query.song->composer;
    if (config.verbose) {
      std::fprintf(stderr, "[RQ3] %s: %u songs, variance %.6f, range %.4f\n",
                   record.source_song.c_str(), record.n_songs, record.variance_final_score,
                   record.range_final_score);
    }
    result.per_run.push_back(record);
  }

  std::vector<double> variances;
  std::vector<double> ranges;
  std::vector<double> r_fc;
  std::vector<double> r_fa;
  std::vector<double> r_cf;
  for (const auto& run : result.per_run) {
    variances.push_back(run.variance_final_score);
    ranges.push_back(run.range_final_score);
    r_fc.push_back(run.r_final_cosine);
    r_fa.push_back(run.r_final_avoid);
    r_cf.push_back(run.r_cosine_favorite);
  }

  std::mt19937 rng(config.seed);
  result.variance = estimateMean(variances, rng, config.bootstrap_samples);
  result.range = estimateMean(ranges, rng, config.bootstrap_samples);
  result.r_final_cosine.estimate = estimateMean(r_fc, rng, config.bootstrap_samples);
  result.r_final_avoid.estimate = estimateMean(r_fa, rng, config.bootstrap_samples);
  result.r_cosine_favorite.estimate = estimateMean(r_cf, rng, config.bootstrap_samples);
  result.std_variance = standardDeviation(variances, 1);
  result.std_range = standardDeviation(ranges, 1);
  result.success = true;
  return result;
}

}  // namespace tessitura
