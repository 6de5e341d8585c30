// Tessituragram accumulation implementation.

#include "core/tessituragram.h"

#include <algorithm>

namespace tessitura {

Tessituragram buildTessituragram(const std::vector<SungNote>& notes) {
  Tessituragram result;
  for (const auto& note : notes) {
    if (note.is_rest) continue;
    result[note.pitch] += note.duration;
  }
  return result;
}

SongStatistics computeSongStatistics(const std::vector<SungNote>& notes,
                                     const Tessituragram& tessituragram) {
  SongStatistics stats;
  bool has_pitch = false;
  PitchRange range;

  for (const auto& note : notes) {
    stats.total_duration += note.duration;
    if (note.is_rest) continue;
    if (!has_pitch) {
      range = {note.pitch, note.pitch};
      has_pitch = true;
    } else {
      range.min_midi = std::min(range.min_midi, note.pitch);
      range.max_midi = std::max(range.max_midi, note.pitch);
    }
  }

  if (has_pitch) stats.pitch_range = range;
  stats.unique_pitches = static_cast<uint32_t>(tessituragram.size());
  return stats;
}

}  // namespace tessitura
