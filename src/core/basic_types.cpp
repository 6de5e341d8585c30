// Implementation of song data checks and enum-to-string conversions.

#include "core/basic_types.h"

namespace tessitura {

double Song::totalDuration() const {
  if (!tessituragram) return 0.0;
  double total = 0.0;
  for (const auto& [pitch, duration] : *tessituragram) {
    total += duration;
  }
  return total;
}

const char* songDataIssueToString(SongDataIssue issue) {
  switch (issue) {
    case SongDataIssue::None:                 return "none";
    case SongDataIssue::MissingRange:         return "missing pitch range";
    case SongDataIssue::MissingTessituragram: return "missing tessituragram";
    case SongDataIssue::ZeroDuration:         return "zero total duration";
  }
  return "unknown";
}

SongDataIssue checkSongData(const Song& song) {
  if (!song.hasRangeData()) return SongDataIssue::MissingRange;
  if (!song.hasTessituragram()) return SongDataIssue::MissingTessituragram;
  if (song.totalDuration() <= 0.0) return SongDataIssue::ZeroDuration;
  return SongDataIssue::None;
}

}  // namespace tessitura
