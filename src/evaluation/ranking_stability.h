// Ranking stability under one-note preference changes (Kendall tau-b).

#ifndef TESSITURA_EVALUATION_RANKING_STABILITY_H
#define TESSITURA_EVALUATION_RANKING_STABILITY_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "evaluation/evaluation_config.h"
#include "evaluation/experiment_common.h"
#include "recommend/scoring_engine.h"

namespace tessitura {

/// Kind of one-note change applied to a baseline profile.
enum class PerturbationType : uint8_t {
  AddFavorite,
  RemoveFavorite,
  AddAvoid,
  RemoveAvoid
};

/// @brief Convert PerturbationType to its report string ("add_fav", ...).
const char* perturbationTypeToString(PerturbationType type);

/// A baseline profile with exactly one note added or removed.
struct Perturbation {
  PerturbationType type = PerturbationType::AddFavorite;
  MidiPitch midi_changed = 0;
  UserProfile profile;
};

/// @brief Enumerate every one-note perturbation of a profile.
///
/// Order: add each in-range non-favorite pitch to favorites (ascending);
/// remove each favorite (list order); add each in-range pitch that is
/// neither favorite nor avoid to avoids (ascending); remove each avoid
/// (list order). The range never changes.
std::vector<Perturbation> enumeratePerturbations(const UserProfile& baseline);

/// @brief Kendall tau-b between two rankings of the same songs.
///
/// Rank vectors are aligned by filename in the baseline's order. Songs
/// missing from `perturbed` are left out of both vectors.
double rankingTau(const std::vector<ScoredResult>& baseline,
                  const std::vector<ScoredResult>& perturbed);

/// Agreement band of a tau value.
enum class AgreementBand : uint8_t {
  Strong,    ///< tau > 0.7
  Moderate,  ///< 0.3 <= tau <= 0.7
  Weak       ///< tau < 0.3
};

/// @brief Classify a tau value into an agreement band.
AgreementBand classifyAgreement(double tau);

/// @brief Convert AgreementBand to a lowercase string.
const char* agreementBandToString(AgreementBand band);

/// Tau of one perturbation against its baseline ranking.
struct PerturbationRecord {
  std::string baseline_source;
  PerturbationType type = PerturbationType::AddFavorite;
  MidiPitch midi_changed = 0;
  std::string note_changed;
  double tau = 0.0;
};

/// Per-baseline summary.
struct BaselineRecord {
  std::string source_song;
  std::string composer;
  uint32_t n_perturbations = 0;
  double mean_tau = 0.0;
};

/// Aggregated ranking stability experiment.
struct RankingStabilityResult {
  bool success = false;
  std::string error_message;
  EvaluationConfig config;
  DataSummary summary;
  uint32_t total_perturbations = 0;
  MetricEstimate mean_tau;              ///< Pooled over all perturbations.
  double std_tau = 0.0;                 ///< Pooled sample std (n - 1).
  double mean_tau_per_baseline = 0.0;   ///< Mean of baseline means.
  double std_tau_across_baselines = 0.0;  ///< Population std of baseline means.
  std::vector<BaselineRecord> baselines;
  std::vector<PerturbationRecord> per_perturbation;
};

/// @brief Run the ranking stability experiment over a library.
///
/// The first config.n_baselines songs with a synthetic profile and at least
/// config.min_candidates candidates become baselines. Each perturbation is
/// re-scored over the baseline's candidate set and compared to the baseline
/// ranking with rankingTau.
///
/// @param songs Library.
/// @param config Evaluation configuration.
/// @return Result; success is false when no baseline qualifies.
RankingStabilityResult runRankingStability(const std::vector<Song>& songs,
                                           const EvaluationConfig& config);

}  // namespace tessitura

#endif  // TESSITURA_EVALUATION_RANKING_STABILITY_H
