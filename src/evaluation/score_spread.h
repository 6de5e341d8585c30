// Score spread and internal validity of the score components.

#ifndef TESSITURA_EVALUATION_SCORE_SPREAD_H
#define TESSITURA_EVALUATION_SCORE_SPREAD_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "evaluation/evaluation_config.h"
#include "evaluation/experiment_common.h"
#include "recommend/scoring_engine.h"

namespace tessitura {

/// Spread and component correlations of one ranked candidate list.
struct RunRecord {
  std::string source_song;
  std::string composer;
  uint32_t n_songs = 0;
  double variance_final_score = 0.0;  ///< Sample variance (n - 1); 0 for one song.
  double range_final_score = 0.0;
  double r_final_cosine = 0.0;        ///< Pearson r(final_score, cosine_similarity).
  double r_final_avoid = 0.0;         ///< Pearson r(final_score, avoid_penalty).
  double r_cosine_favorite = 0.0;     ///< Pearson r(cosine_similarity, favorite_overlap).
};

/// @brief Measure spread and correlations over one ranked list.
///
/// Correlations fall back to 0.0 when a component has no spread.
/// source_song and composer are left empty.
RunRecord measureScoreSpread(const std::vector<ScoredResult>& results);

/// Direction a correlation is expected to take.
enum class ExpectedSign : uint8_t {
  Positive,
  Negative
};

/// @brief Convert ExpectedSign to "positive" or "negative".
const char* expectedSignToString(ExpectedSign sign);

/// Correlation estimate across runs with its expected direction.
struct CorrelationEstimate {
  MetricEstimate estimate;
  ExpectedSign expected = ExpectedSign::Positive;

  /// @brief True if the mean has the expected (strict) sign.
  bool matchesExpected() const {
    return expected == ExpectedSign::Positive ? estimate.value > 0.0 : estimate.value < 0.0;
  }
};

/// Aggregated score spread experiment.
struct ScoreSpreadResult {
  bool success = false;
  std::string error_message;
  EvaluationConfig config;
  DataSummary summary;
  MetricEstimate variance;
  double std_variance = 0.0;  ///< Sample std across runs.
  MetricEstimate range;
  double std_range = 0.0;
  CorrelationEstimate r_final_cosine{{}, ExpectedSign::Positive};
  CorrelationEstimate r_final_avoid{{}, ExpectedSign::Negative};
  CorrelationEstimate r_cosine_favorite{{}, ExpectedSign::Positive};
  std::vector<RunRecord> per_run;
};

/// @brief Run the score spread experiment over a library.
///
/// Up to config.n_profiles songs with a synthetic profile and at least
/// config.min_candidates candidates are scored. Bootstrap intervals are
/// drawn in the order variance, range, r(final, cosine), r(final, avoid),
/// r(cosine, favorite) from one generator seeded with config.seed.
///
/// @param songs Library.
/// @param config Evaluation configuration.
/// @return Result; success is false when no profile qualifies.
ScoreSpreadResult runScoreSpread(const std::vector<Song>& songs, const EvaluationConfig& config);

}  // namespace tessitura

#endif  // TESSITURA_EVALUATION_SCORE_SPREAD_H
