// Ranking stability experiment.

#include "evaluation/ranking_stability.h"

#include <algorithm>
#include <cstdio>
#include <random>
#include <unordered_map>
#include <utility>

#include "core/pitch_utils.h"
#include "evaluation/statistics.h"
#include "recommend/ideal_profile.h"

namespace tessitura {

namespace {

constexpr double kStrongAgreement = 0.7;
constexpr double kModerateAgreement = 0.3;

bool containsPitch(const std::vector<MidiPitch>& pitches, MidiPitch pitch) {
  return std::find(pitches.begin(), pitches.end(), pitch) != pitches.end();
}

std::vector<MidiPitch> withoutIndex(const std::vector<MidiPitch>& pitches, size_t index) {
  std::vector<MidiPitch> result;
  result.reserve(pitches.size());
  for (size_t idx = 0; idx < pitches.size(); ++idx) {
    if (idx != index) result.push_back(pitches[idx]);
  }
  return result;
}

}  // namespace

const char* perturbationTypeToString(PerturbationType type) {
  switch (type) {
    case PerturbationType::AddFavorite:    return "add_fav";
    case PerturbationType::RemoveFavorite: return "remove_fav";
    case PerturbationType::AddAvoid:       return "add_avoid";
    case PerturbationType::RemoveAvoid:    return "remove_avoid";
  }
  return "unknown";
}

std::vector<Perturbation> enumeratePerturbations(const UserProfile& baseline) {
  std::vector<Perturbation> result;

  for (MidiPitch pitch = baseline.range_min; pitch <= baseline.range_max; ++pitch) {
    if (containsPitch(baseline.favorite_midis, pitch)) continue;
    Perturbation pert{PerturbationType::AddFavorite, pitch, baseline};
    pert.profile.favorite_midis.push_back(pitch);
    result.push_back(std::move(pert));
  }
  for (size_t idx = 0; idx < baseline.favorite_midis.size(); ++idx) {
    Perturbation pert{PerturbationType::RemoveFavorite, baseline.favorite_midis[idx], baseline};
    pert.profile.favorite_midis = withoutIndex(baseline.favorite_midis, idx);
    result.push_back(std::move(pert));
  }
  for (MidiPitch pitch = baseline.range_min; pitch <= baseline.range_max; ++pitch) {
    if (containsPitch(baseline.favorite_midis, pitch)) continue;
    if (containsPitch(baseline.avoid_midis, pitch)) continue;
    Perturbation pert{PerturbationType::AddAvoid, pitch, baseline};
    pert.profile.avoid_midis.push_back(pitch);
    result.push_back(std::move(pert));
  }
  for (size_t idx = 0; idx < baseline.avoid_midis.size(); ++idx) {
    Perturbation pert{PerturbationType::RemoveAvoid, baseline.avoid_midis[idx], baseline};
    pert.profile.avoid_midis = withoutIndex(baseline.avoid_midis, idx);
    result.push_back(std::move(pert));
  }
  return result;
}

double rankingTau(const std::vector<ScoredResult>& baseline,
                  const std::vector<ScoredResult>& perturbed) {
  std::unordered_map<std::string, int> perturbed_rank;
  for (const auto& result : perturbed) {
    perturbed_rank[result.filename] = result.rank;
  }

  std::vector<double> ranks_before;
  std::vector<double> ranks_after;
  for (const auto& result : baseline) {
    auto found = perturbed_rank.find(result.filename);
    if (found == perturbed_rank.end()) continue;
    ranks_before.push_back(static_cast<double>(result.rank));
    ranks_after.push_back(static_cast<double>(found->second));
  }
  return kendallTauB(ranks_before, ranks_after);
}

AgreementBand classifyAgreement(double tau) {
  if (tau > kStrongAgreement) return AgreementBand::Strong;
  if (tau >= kModerateAgreement) return AgreementBand::Moderate;
  return AgreementBand::Weak;
}

const char* agreementBandToString(AgreementBand band) {
  switch (band) {
    case AgreementBand::Strong:   return "strong";
    case AgreementBand::Moderate: return "moderate";
    case AgreementBand::Weak:     return "weak";
  }
  return "unknown";
}

RankingStabilityResult runRankingStability(const std::vector<Song>& songs,
                                           const EvaluationConfig& config) {
  RankingStabilityResult result;
  result.config = config;
  EvaluationConfigError config_error = validateEvaluationConfig(config);
  if (config_error != EvaluationConfigError::Ok) {
    result.error_message = evaluationConfigErrorToString(config_error);
    return result;
  }

  auto baselines = collectProfiledQueries(songs, config.profile, config.min_candidates,
                                          config.n_baselines, result.summary, "RQ2",
                                          config.verbose);
  if (baselines.empty()) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "No song yielded >= %u candidates. Library too small.",
                  config.min_candidates);
    result.error_message = buf;
    return result;
  }

  std::vector<double> all_taus;
  std::vector<double> baseline_means;
  for (const auto& query : baselines) {
    DenseVector ideal = buildIdealVector(query.profile, config.ideal);
    auto ranking_r0 = scoreSongs(query.candidates, ideal, query.profile, config.scoring);

    std::vector<double> taus;
    for (const auto& pert : enumeratePerturbations(query.profile)) {
      DenseVector ideal_new = buildIdealVector(pert.profile, config.ideal);
      auto ranking_new = scoreSongs(query.candidates, ideal_new, pert.profile, config.scoring);
      double tau = rankingTau(ranking_r0, ranking_new);
      taus.push_back(tau);

      PerturbationRecord record;
      record.baseline_source = query.song->filename;
      record.type = pert.type;
      record.midi_changed = pert.midi_changed;
      record.note_changed = midiToNoteName(pert.midi_changed);
      record.tau = tau;
      result.per_perturbation.push_back(std::move(record));
    }

    BaselineRecord baseline;
    baseline.source_song = query.song->filename;
    baseline.composer = query.song->composer;
    baseline.n_perturbations = static_cast<uint32_t>(taus.size());
    baseline.mean_tau = mean(taus);
    result.baselines.push_back(baseline);
    baseline_means.push_back(baseline.mean_tau);
    all_taus.insert(all_taus.end(), taus.begin(), taus.end());

    if (config.verbose) {
      std::fprintf(stderr, "[RQ2] baseline %s: %zu candidates, %zu perturbations, mean tau %.4f\n",
                   query.song->filename.c_str(), query.candidates.size(), taus.size(),
                   baseline.mean_tau);
    }
  }

  result.total_perturbations = static_cast<uint32_t>(all_taus.size());
  std::mt19937 rng(config.seed);
  result.mean_tau = estimateMean(all_taus, rng, config.bootstrap_samples);
  result.std_tau = standardDeviation(all_taus, 1);
  result.mean_tau_per_baseline = mean(baseline_means);
  result.std_tau_across_baselines = standardDeviation(baseline_means, 0);
  result.success = true;
  return result;
}

}  // namespace tessitura
