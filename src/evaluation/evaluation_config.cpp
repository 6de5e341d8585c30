// Evaluation configuration parsing and validation.

#include "evaluation/evaluation_config.h"

namespace tessitura {

namespace {

/// @brief Overwrite `target` when `name` holds a number.
void readDouble(const std::map<std::string, JsonValue>& kv, const char* name, double& target) {
  auto it = kv.find(name);
  if (it != kv.end() && it->second.isNumber()) {
    target = it->second.number_val;
  }
}

/// @brief Overwrite `target` when `name` holds a non-negative number.
void readUint(const std::map<std::string, JsonValue>& kv, const char* name, uint32_t& target) {
  auto it = kv.find(name);
  if (it != kv.end() && it->second.isNumber() && it->second.number_val >= 0.0) {
    target = it->second.asUint(target);
  }
}

}  // namespace

const char* evaluationConfigErrorToString(EvaluationConfigError error) {
  switch (error) {
    case EvaluationConfigError::Ok:
      return "ok";
    case EvaluationConfigError::InvalidAlpha:
      return "alpha must be non-negative";
    case EvaluationConfigError::InvalidBootstrapSamples:
      return "bootstrap_samples must be at least 1";
    case EvaluationConfigError::InvalidSelectionCounts:
      return "top_n_favorite must be at least 1";
    case EvaluationConfigError::InvalidCandidateThreshold:
      return "candidate thresholds must be at least 1";
    case EvaluationConfigError::InvalidProfileCounts:
      return "n_baselines and n_profiles must be at least 1";
  }
  return "unknown error";
}

EvaluationConfig evaluationConfigFromJson(const std::map<std::string, JsonValue>& kv,
                                          const EvaluationConfig& base) {
  EvaluationConfig config = base;

  readDouble(kv, "alpha", config.scoring.alpha);
  readDouble(kv, "base", config.ideal.base);
  readDouble(kv, "fav_boost", config.ideal.fav_boost);
  readDouble(kv, "avoid_penalty", config.ideal.avoid_penalty);

  readUint(kv, "top_n_favorite", config.profile.top_n_favorite);
  readUint(kv, "bottom_n_avoid", config.profile.bottom_n_avoid);

  uint32_t samples = static_cast<uint32_t>(config.bootstrap_samples);
  readUint(kv, "bootstrap_samples", samples);
  config.bootstrap_samples = samples;

  readUint(kv, "seed", config.seed);
  readUint(kv, "rq1_min_candidates", config.rq1_min_candidates);
  readUint(kv, "min_candidates", config.min_candidates);
  readUint(kv, "n_baselines", config.n_baselines);
  readUint(kv, "n_profiles", config.n_profiles);

  auto it = kv.find("verbose");
  if (it != kv.end()) {
    config.verbose = it->second.asBool(config.verbose);
  }
  return config;
}

EvaluationConfigError validateEvaluationConfig(const EvaluationConfig& config) {
  if (config.scoring.alpha < 0.0) return EvaluationConfigError::InvalidAlpha;
  if (config.bootstrap_samples == 0) return EvaluationConfigError::InvalidBootstrapSamples;
  if (config.profile.top_n_favorite == 0) return EvaluationConfigError::InvalidSelectionCounts;
  if (config.rq1_min_candidates == 0 || config.min_candidates == 0) {
    return EvaluationConfigError::InvalidCandidateThreshold;
  }
  if (config.n_baselines == 0 || config.n_profiles == 0) {
    return EvaluationConfigError::InvalidProfileCounts;
  }
  return EvaluationConfigError::Ok;
}

}  // namespace tessitura
