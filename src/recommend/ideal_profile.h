// Ideal preference vector built from a singer's range and note preferences.

#ifndef TESSITURA_RECOMMEND_IDEAL_PROFILE_H
#define TESSITURA_RECOMMEND_IDEAL_PROFILE_H

#include <vector>

#include "core/basic_types.h"
#include "recommend/vector_space.h"

namespace tessitura {

/// Weights used to shape the ideal vector before L2 normalization.
struct IdealVectorParams {
  double base = 0.2;            ///< Baseline weight of every in-range pitch.
  double fav_boost = 1.0;       ///< Added at favorite pitches.
  double avoid_penalty = -1.0;  ///< Added at avoid pitches (negative).
};

/// @brief Build the L2-normalized ideal vector for a preference profile.
///
/// Every position in [min_midi, max_midi] starts at params.base; favorites
/// get params.fav_boost added, then avoids get params.avoid_penalty added.
/// Values are clamped to >= 0 and the vector is L2-normalized, so cosine
/// similarity against non-negative song vectors stays in [0, 1].
///
/// Favorites and avoids are not checked for overlap: a pitch in both lists
/// receives the boost and then the penalty. Pitches outside the range are
/// ignored.
///
/// @param min_midi Lowest pitch of the range.
/// @param max_midi Highest pitch of the range.
/// @param favorite_midis Favorite pitches.
/// @param avoid_midis Avoid pitches.
/// @param params Shaping weights.
/// @return Unit-length non-negative vector (all zeros if every value clamps to 0).
DenseVector buildIdealVector(MidiPitch min_midi, MidiPitch max_midi,
                             const std::vector<MidiPitch>& favorite_midis,
                             const std::vector<MidiPitch>& avoid_midis,
                             const IdealVectorParams& params = IdealVectorParams());

/// @brief Convenience overload taking a UserProfile.
DenseVector buildIdealVector(const UserProfile& profile,
                             const IdealVectorParams& params = IdealVectorParams());

/// @brief Remove avoid pitches that are also favorites.
/// @param profile Profile to clean (favorites win).
/// @param removed Optional output receiving the removed avoid pitches.
/// @return Profile with disjoint favorite and avoid lists.
UserProfile removeAvoidOverlap(const UserProfile& profile,
                               std::vector<MidiPitch>* removed = nullptr);

}  // namespace tessitura

#endif  // TESSITURA_RECOMMEND_IDEAL_PROFILE_H
