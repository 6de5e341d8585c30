// Scoring engine implementation.

#include "recommend/scoring_engine.h"

#include <algorithm>

#include "recommend/explanation.h"

namespace tessitura {

std::vector<const Song*> filterByRange(const std::vector<Song>& songs, MidiPitch min_midi,
                                       MidiPitch max_midi) {
  PitchRange user_range{min_midi, max_midi};
  std::vector<const Song*> result;
  for (const auto& song : songs) {
    if (!song.hasRangeData()) continue;
    if (user_range.contains(*song.statistics.pitch_range)) {
      result.push_back(&song);
    }
  }
  return result;
}

std::vector<ScoredResult> scoreSongs(const std::vector<const Song*>& candidates,
                                     const DenseVector& ideal, MidiPitch min_midi,
                                     MidiPitch max_midi,
                                     const std::vector<MidiPitch>& avoid_midis,
                                     const std::vector<MidiPitch>& favorite_midis,
                                     double alpha) {
  std::vector<ScoredResult> results;
  results.reserve(candidates.size());

  static const Tessituragram kEmpty;
  for (const Song* song : candidates) {
    if (!song) continue;
    const Tessituragram& tess = song->tessituragram ? *song->tessituragram : kEmpty;
    DenseVector normed = normalizeL1(buildDenseVector(tess, min_midi, max_midi));

    ScoredResult result;
    result.filename = song->filename;
    result.composer = song->composer;
    result.title = song->title;
    result.cosine_similarity = cosineSimilarity(normed, ideal);
    result.avoid_penalty = sumAtPitches(normed, min_midi, avoid_midis);
    result.favorite_overlap = sumAtPitches(normed, min_midi, favorite_midis);
    result.final_score = result.cosine_similarity - alpha * result.avoid_penalty;
    result.normalized_vector = std::move(normed);
    results.push_back(std::move(result));
  }

  std::stable_sort(results.begin(), results.end(),
                   [](const ScoredResult& lhs, const ScoredResult& rhs) {
                     if (lhs.final_score != rhs.final_score) {
                       return lhs.final_score > rhs.final_score;
                     }
                     return lhs.filename < rhs.filename;
                   });

  for (size_t idx = 0; idx < results.size(); ++idx) {
    results[idx].rank = static_cast<int>(idx) + 1;
    results[idx].explanation = generateExplanation(results[idx], favorite_midis, avoid_midis);
  }
  return results;
}

std::vector<ScoredResult> scoreSongs(const std::vector<const Song*>& candidates,
                                     const DenseVector& ideal, const UserProfile& profile,
                                     const ScoringParams& params) {
  return scoreSongs(candidates, ideal, profile.range_min, profile.range_max,
                    profile.avoid_midis, profile.favorite_midis, params.alpha);
}

std::optional<int> findRank(const std::vector<ScoredResult>& results,
                            const std::string& filename) {
  for (const auto& result : results) {
    if (result.filename == filename) return result.rank;
  }
  return std::nullopt;
}

}  // namespace tessitura
