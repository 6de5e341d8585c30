// Range filtering, scoring and ranking of candidate songs.

#ifndef TESSITURA_RECOMMEND_SCORING_ENGINE_H
#define TESSITURA_RECOMMEND_SCORING_ENGINE_H

#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "recommend/vector_space.h"

namespace tessitura {

/// Tunables of the linear score.
struct ScoringParams {
  double alpha = 0.5;  ///< Weight of the avoid penalty in final_score.
};

/// @brief Score breakdown and rank of one candidate for one query.
///
/// Derived data: always reproducible from (songs, profile, alpha).
struct ScoredResult {
  std::string filename;
  std::string composer;
  std::string title;
  double final_score = 0.0;        ///< cosine_similarity - alpha * avoid_penalty.
  double cosine_similarity = 0.0;  ///< In [0,1].
  double avoid_penalty = 0.0;      ///< Share of singing time on avoid notes [0,1].
  double favorite_overlap = 0.0;   ///< Share of singing time on favorites [0,1] (diagnostic).
  int rank = 0;                    ///< 1-based, no gaps.
  std::string explanation;
  DenseVector normalized_vector;   ///< L1-normalized song vector over the query range.
};

/// @brief Keep songs whose whole range fits inside [min_midi, max_midi].
///
/// Containment, not overlap: a song needing any note outside the range is
/// excluded. Songs without range data are excluded. Input order is kept.
///
/// @param songs Library (must outlive the returned pointers).
/// @param min_midi Lowest singable pitch.
/// @param max_midi Highest singable pitch.
/// @return Pointers to the songs that fit.
std::vector<const Song*> filterByRange(const std::vector<Song>& songs, MidiPitch min_midi,
                                       MidiPitch max_midi);

/// @brief Score and rank candidates against an ideal vector.
///
/// Per song: dense vector over [min_midi, max_midi], L1-normalized; cosine
/// similarity with the ideal; avoid penalty and favorite overlap as the
/// normalized weight on those pitches; final_score = cosine - alpha * penalty.
/// Results are sorted by final_score descending, filename ascending on ties,
/// ranked 1..N and explained.
///
/// @param candidates Songs to score (typically the output of filterByRange).
/// @param ideal Ideal vector over the same range.
/// @param min_midi Lowest pitch of the range.
/// @param max_midi Highest pitch of the range.
/// @param avoid_midis Avoid pitches.
/// @param favorite_midis Favorite pitches.
/// @param alpha Avoid penalty weight.
/// @return Ranked results; empty if there are no candidates.
std::vector<ScoredResult> scoreSongs(const std::vector<const Song*>& candidates,
                                     const DenseVector& ideal, MidiPitch min_midi,
                                     MidiPitch max_midi,
                                     const std::vector<MidiPitch>& avoid_midis,
                                     const std::vector<MidiPitch>& favorite_midis,
                                     double alpha = 0.5);

/// @brief Convenience overload taking a UserProfile and ScoringParams.
std::vector<ScoredResult> scoreSongs(const std::vector<const Song*>& candidates,
                                     const DenseVector& ideal, const UserProfile& profile,
                                     const ScoringParams& params = ScoringParams());

/// @brief Find the rank of a song in a ranked result list.
/// @return Rank, or empty if the filename is not present.
std::optional<int> findRank(const std::vector<ScoredResult>& results,
                            const std::string& filename);

}  // namespace tessitura

#endif  // TESSITURA_RECOMMEND_SCORING_ENGINE_H
