// Synthetic user profiles derived from a song's own tessituragram.

#ifndef TESSITURA_EVALUATION_SYNTHETIC_PROFILE_H
#define TESSITURA_EVALUATION_SYNTHETIC_PROFILE_H

#include <cstdint>
#include <optional>

#include "core/basic_types.h"

namespace tessitura {

/// Selection counts for synthetic favorites and avoids.
struct SyntheticProfileParams {
  uint32_t top_n_favorite = 4;  ///< Most-sung pitches taken as favorites.
  uint32_t bottom_n_avoid = 2;  ///< Least-sung pitches taken as avoids.
};

/// @brief Derive the profile a singer who loves this song would have.
///
/// The range is the song's own pitch range. Pitches are ordered by their
/// share of singing time (descending, lower MIDI first on ties). The first
/// top_n_favorite become favorites (all of them when the song has fewer);
/// the last bottom_n_avoid become avoids when the song has at least that
/// many pitches, none otherwise. Avoids that are also favorites are dropped,
/// so the two lists are always disjoint.
///
/// @param song Source song.
/// @param params Selection counts.
/// @param issue Optional output receiving the reason a song is rejected
///        (SongDataIssue::None on success).
/// @return Profile, or empty when the song lacks range or tessituragram data
///         or has zero total duration.
std::optional<UserProfile> deriveSyntheticProfile(
    const Song& song, const SyntheticProfileParams& params = SyntheticProfileParams(),
    SongDataIssue* issue = nullptr);

}  // namespace tessitura

#endif  // TESSITURA_EVALUATION_SYNTHETIC_PROFILE_H
