// End-to-end recommendation query: validate, clip, filter, score, explain.

#ifndef TESSITURA_RECOMMENDER_H
#define TESSITURA_RECOMMENDER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "recommend/ideal_profile.h"
#include "recommend/scoring_engine.h"
#include "recommend/vector_space.h"

namespace tessitura {

/// How recommend() treats a pitch listed as both favorite and avoid.
enum class DisjointPolicy : uint8_t {
  RemoveAvoidOverlap,  ///< Drop the pitch from avoids (favorites win).
  Preserve             ///< Keep both; the avoid penalty is applied after the boost.
};

/// @brief Configuration for one recommendation query.
struct RecommendConfig {
  UserProfile profile;
  ScoringParams scoring;
  IdealVectorParams ideal;
  DisjointPolicy disjoint_policy = DisjointPolicy::RemoveAvoidOverlap;
};

/// @brief Result of a recommendation query.
struct RecommendResult {
  bool success = false;
  std::string error_message;
  uint32_t total_songs = 0;
  uint32_t candidates = 0;                  ///< Songs fitting the range.
  UserProfile profile;                      ///< Profile after clipping and overlap handling.
  std::vector<MidiPitch> clipped_favorites;  ///< Favorites outside the range (ignored).
  std::vector<MidiPitch> clipped_avoids;     ///< Avoids outside the range (ignored).
  std::vector<MidiPitch> removed_overlap;    ///< Avoids dropped because they are favorites.
  DenseVector ideal_vector;
  std::vector<ScoredResult> results;
};

/// @brief Rank a library against a singer's profile.
///
/// The range must satisfy 0 <= range_min <= range_max <= 127; otherwise
/// success is false. Favorites and avoids outside the range are dropped and
/// reported. An empty candidate set is a successful query with no results.
///
/// @param songs Library.
/// @param config Query configuration.
/// @return RecommendResult with ranked, explained results.
RecommendResult recommend(const std::vector<Song>& songs, const RecommendConfig& config);

/// @brief Build the recommendations JSON document for a finished query.
///
/// Layout: user_preferences (range, favorite and avoid notes and MIDI
/// numbers, alpha), ideal_vector (MIDI -> weight, 6 decimals) and the
/// ranked recommendations (scores to 4 decimals, normalized vectors to 6).
///
/// @param result Successful recommendation result.
/// @param config Configuration used for the query.
/// @return Pretty-printed JSON string.
std::string buildRecommendationsJson(const RecommendResult& result, const RecommendConfig& config);

}  // namespace tessitura

#endif  // TESSITURA_RECOMMENDER_H
