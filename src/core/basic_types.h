// Basic types for the tessitura recommender: songs, tessituragrams, profiles.

#ifndef TESSITURA_CORE_BASIC_TYPES_H
#define TESSITURA_CORE_BASIC_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tessitura {

/// MIDI note number (enharmonic spellings collapse to one index).
using MidiPitch = int;

constexpr MidiPitch kMidiMin = 0;
constexpr MidiPitch kMidiMax = 127;
constexpr MidiPitch kMidiC4 = 60;

/// @brief Duration-weighted pitch histogram of one vocal line.
///
/// Maps MIDI pitch -> accumulated singing time (quarter lengths). Keys are
/// unique and ordered; durations are non-negative (ingestion guarantees it).
using Tessituragram = std::map<MidiPitch, double>;

/// Inclusive MIDI pitch range.
struct PitchRange {
  MidiPitch min_midi = 0;
  MidiPitch max_midi = 0;

  /// @brief Check whether another range lies entirely inside this one.
  bool contains(const PitchRange& other) const {
    return other.min_midi >= min_midi && other.max_midi <= max_midi;
  }

  /// @brief Check whether a single pitch lies inside this range.
  bool contains(MidiPitch pitch) const { return pitch >= min_midi && pitch <= max_midi; }

  /// @brief Number of pitch positions covered (max - min + 1).
  int width() const { return max_midi - min_midi + 1; }

  /// @brief Ordered and inside MIDI 0-127.
  bool isValid() const {
    return min_midi >= kMidiMin && max_midi <= kMidiMax && min_midi <= max_midi;
  }
};

/// Summary statistics recorded alongside a tessituragram.
struct SongStatistics {
  std::optional<PitchRange> pitch_range;  ///< Absent when the line has no pitched notes.
  double total_duration = 0.0;            ///< Including rests.
  uint32_t unique_pitches = 0;
};

/// @brief One song of the library. Immutable once loaded.
///
/// Range and tessituragram data may be missing in partially ingested
/// libraries; both are explicit optionals and must be checked before use.
struct Song {
  std::string filename;  ///< Unique identifier.
  std::string composer;
  std::string title;
  std::optional<Tessituragram> tessituragram;
  SongStatistics statistics;

  /// @brief A recorded range that is also valid; anything else counts as absent.
  bool hasRangeData() const {
    return statistics.pitch_range.has_value() && statistics.pitch_range->isValid();
  }
  bool hasTessituragram() const { return tessituragram.has_value() && !tessituragram->empty(); }

  /// @brief Sum of tessituragram durations (0 when absent).
  double totalDuration() const;
};

/// Reason a song cannot take part in a query or profile derivation.
enum class SongDataIssue : uint8_t {
  None,
  MissingRange,
  MissingTessituragram,
  ZeroDuration
};

/// @brief Convert SongDataIssue to a short lowercase string.
const char* songDataIssueToString(SongDataIssue issue);

/// @brief Classify whether a song carries usable range and tessituragram data.
/// @param song Song to check.
/// @return First issue found, or SongDataIssue::None.
SongDataIssue checkSongData(const Song& song);

/// @brief A singer's range with optional favorite and avoid notes.
///
/// Favorites and avoids are expected inside [range_min, range_max]. They are
/// ordered lists; duplicates and overlap between the two are the caller's
/// responsibility.
struct UserProfile {
  MidiPitch range_min = kMidiC4;
  MidiPitch range_max = kMidiC4;
  std::vector<MidiPitch> favorite_midis;
  std::vector<MidiPitch> avoid_midis;

  PitchRange range() const { return {range_min, range_max}; }
};

}  // namespace tessitura

#endif  // TESSITURA_CORE_BASIC_TYPES_H
