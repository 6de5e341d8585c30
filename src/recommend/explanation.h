// Human-readable rationale for a scored song.

#ifndef TESSITURA_RECOMMEND_EXPLANATION_H
#define TESSITURA_RECOMMEND_EXPLANATION_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "recommend/scoring_engine.h"

namespace tessitura {

/// Favorite-overlap bands: >= 30% strong, >= 10% moderate, else low.
enum class FavoriteOverlapBand : uint8_t { Strong, Moderate, Low };

/// Avoid-presence bands: <= 2% minimal, <= 10% some, else notable.
enum class AvoidPresenceBand : uint8_t { Minimal, Some, Notable };

/// @brief Classify a favorite overlap proportion in [0,1].
FavoriteOverlapBand classifyFavoriteOverlap(double favorite_overlap);

/// @brief Classify an avoid penalty proportion in [0,1].
AvoidPresenceBand classifyAvoidPresence(double avoid_penalty);

/// @brief Build a short explanation of why a song ranked where it did.
///
/// Always contains the score line. A favorites sentence is added only when
/// favorites are given, an avoid sentence only when avoids are given.
///
/// @param result Scored result (scores already filled in).
/// @param favorite_midis Favorite pitches of the query.
/// @param avoid_midis Avoid pitches of the query.
/// @return Sentences joined by two spaces.
std::string generateExplanation(const ScoredResult& result,
                                const std::vector<MidiPitch>& favorite_midis,
                                const std::vector<MidiPitch>& avoid_midis);

}  // namespace tessitura

#endif  // TESSITURA_RECOMMEND_EXPLANATION_H
