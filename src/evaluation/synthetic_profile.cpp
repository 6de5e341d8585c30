// Synthetic profile derivation.

#include "evaluation/synthetic_profile.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace tessitura {

std::optional<UserProfile> deriveSyntheticProfile(const Song& song,
                                                  const SyntheticProfileParams& params,
                                                  SongDataIssue* issue) {
  SongDataIssue found = checkSongData(song);
  if (issue) *issue = found;
  if (found != SongDataIssue::None) return std::nullopt;

  double total = song.totalDuration();
  std::vector<std::pair<MidiPitch, double>> proportions;
  proportions.reserve(song.tessituragram->size());
  for (const auto& [pitch, duration] : *song.tessituragram) {
    proportions.emplace_back(pitch, duration / total);
  }
  std::sort(proportions.begin(), proportions.end(),
            [](const std::pair<MidiPitch, double>& lhs, const std::pair<MidiPitch, double>& rhs) {
              if (lhs.second != rhs.second) return lhs.second > rhs.second;
              return lhs.first < rhs.first;
            });

  UserProfile profile;
  profile.range_min = song.statistics.pitch_range->min_midi;
  profile.range_max = song.statistics.pitch_range->max_midi;

  size_t n_pitches = proportions.size();
  size_t n_fav = std::min<size_t>(params.top_n_favorite, n_pitches);
  for (size_t idx = 0; idx < n_fav; ++idx) {
    profile.favorite_midis.push_back(proportions[idx].first);
  }

  if (params.bottom_n_avoid > 0 && n_pitches >= params.bottom_n_avoid) {
    for (size_t idx = n_pitches - params.bottom_n_avoid; idx < n_pitches; ++idx) {
      MidiPitch pitch = proportions[idx].first;
      bool is_favorite = std::find(profile.favorite_midis.begin(), profile.favorite_midis.end(),
                                   pitch) != profile.favorite_midis.end();
      if (!is_favorite) profile.avoid_midis.push_back(pitch);
    }
  }
  return profile;
}

}  // namespace tessitura
