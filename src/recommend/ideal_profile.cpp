// Ideal vector construction.

#include "recommend/ideal_profile.h"

#include <algorithm>

namespace tessitura {

DenseVector buildIdealVector(MidiPitch min_midi, MidiPitch max_midi,
                             const std::vector<MidiPitch>& favorite_midis,
                             const std::vector<MidiPitch>& avoid_midis,
                             const IdealVectorParams& params) {
  int length = max_midi - min_midi + 1;
  if (length <= 0) return {};

  DenseVector vec(static_cast<size_t>(length), params.base);

  for (MidiPitch pitch : favorite_midis) {
    int idx = pitch - min_midi;
    if (idx >= 0 && idx < length) vec[static_cast<size_t>(idx)] += params.fav_boost;
  }
  // Avoids go after favorites, so an overlapping pitch nets boost + penalty.
  for (MidiPitch pitch : avoid_midis) {
    int idx = pitch - min_midi;
    if (idx >= 0 && idx < length) vec[static_cast<size_t>(idx)] += params.avoid_penalty;
  }

  for (double& val : vec) {
    if (val < 0.0) val = 0.0;
  }
  return normalizeL2(vec);
}

DenseVector buildIdealVector(const UserProfile& profile, const IdealVectorParams& params) {
  return buildIdealVector(profile.range_min, profile.range_max, profile.favorite_midis,
                          profile.avoid_midis, params);
}

UserProfile removeAvoidOverlap(const UserProfile& profile, std::vector<MidiPitch>* removed) {
  UserProfile result = profile;
  result.avoid_midis.clear();
  for (MidiPitch pitch : profile.avoid_midis) {
    bool is_favorite = std::find(profile.favorite_midis.begin(), profile.favorite_midis.end(),
                                 pitch) != profile.favorite_midis.end();
    if (is_favorite) {
      if (removed) removed->push_back(pitch);
    } else {
      result.avoid_midis.push_back(pitch);
    }
  }
  return result;
}

}  // namespace tessitura
