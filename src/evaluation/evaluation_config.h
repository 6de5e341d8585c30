// Configuration shared by the three evaluation protocols.

#ifndef TESSITURA_EVALUATION_EVALUATION_CONFIG_H
#define TESSITURA_EVALUATION_EVALUATION_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

#include "core/json_parser.h"
#include "evaluation/synthetic_profile.h"
#include "recommend/ideal_profile.h"
#include "recommend/scoring_engine.h"

namespace tessitura {

/// @brief Tunables for the evaluation harness.
struct EvaluationConfig {
  ScoringParams scoring;
  IdealVectorParams ideal;
  SyntheticProfileParams profile;
  size_t bootstrap_samples = 10000;
  uint32_t seed = 42;                 ///< Bootstrap generator seed.
  uint32_t rq1_min_candidates = 2;    ///< Self-retrieval needs a competitor.
  uint32_t min_candidates = 10;       ///< Candidate-set floor for stability/spread.
  uint32_t n_baselines = 5;           ///< Stability baselines.
  uint32_t n_profiles = 25;           ///< Spread/validity profiles.
  bool verbose = false;               ///< Log per-song skips to stderr.
};

/// Validation outcome for EvaluationConfig.
enum class EvaluationConfigError : uint8_t {
  Ok,
  InvalidAlpha,
  InvalidBootstrapSamples,
  InvalidSelectionCounts,
  InvalidCandidateThreshold,
  InvalidProfileCounts
};

/// @brief Convert EvaluationConfigError to a human-readable message.
const char* evaluationConfigErrorToString(EvaluationConfigError error);

/// @brief Read an EvaluationConfig from a flat JSON key-value map.
///
/// Keys: alpha, base, fav_boost, avoid_penalty, top_n_favorite,
/// bottom_n_avoid, bootstrap_samples, seed, rq1_min_candidates,
/// min_candidates, n_baselines, n_profiles, verbose. Unknown keys are
/// ignored; missing or wrongly typed values keep the defaults.
///
/// @param kv Parsed top-level JSON members.
/// @param base Starting configuration.
/// @return Configuration with the recognized keys applied.
EvaluationConfig evaluationConfigFromJson(const std::map<std::string, JsonValue>& kv,
                                          const EvaluationConfig& base = EvaluationConfig());

/// @brief Check ranges of the numeric tunables.
EvaluationConfigError validateEvaluationConfig(const EvaluationConfig& config);

}  // namespace tessitura

#endif  // TESSITURA_EVALUATION_EVALUATION_CONFIG_H
