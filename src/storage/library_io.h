// Song library JSON round-trip, merging and querying.

#ifndef TESSITURA_STORAGE_LIBRARY_IO_H
#define TESSITURA_STORAGE_LIBRARY_IO_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/basic_types.h"

namespace tessitura {

/// @brief Result of loading a song library.
struct LibraryLoadResult {
  bool success = false;
  std::string error_message;
  std::vector<Song> songs;
  uint32_t records_skipped = 0;  ///< Records without a filename.
};

/// @brief Parse a library document.
///
/// Format:
/// @code
///   {"songs": [{"filename": "...", "composer": "...", "title": "...",
///               "tessituragram": {"60": 2.5, "62": 1.0},
///               "statistics": {"total_duration": 4.0, "unique_pitches": 2,
///                              "pitch_range": {"min": "C4", "min_midi": 60,
///                                              "max": "D4", "max_midi": 62}}}]}
/// @endcode
/// A null or missing pitch_range bound marks the range as absent; a null or
/// missing tessituragram marks it as absent. Tessituragram entries with a
/// non-numeric key or a negative or non-numeric duration are dropped.
///
/// @param text JSON document.
/// @return Songs in document order, or success=false with a message.
LibraryLoadResult parseLibraryJson(std::string_view text);

/// @brief Read and parse a library file.
LibraryLoadResult loadLibraryFile(const std::string& path);

/// @brief Serialize songs in the format parseLibraryJson reads.
std::string libraryToJson(const std::vector<Song>& songs);

/// @brief Append incoming songs whose filename is not yet present.
/// @return existing followed by the new songs, order preserved.
std::vector<Song> mergeSongs(const std::vector<Song>& existing, const std::vector<Song>& incoming);

/// Criteria for querySongs. Empty strings and unset bounds match everything.
struct SongQuery {
  std::string composer;  ///< Case-insensitive substring.
  std::string title;     ///< Case-insensitive substring.
  std::optional<MidiPitch> min_midi;  ///< Song range must reach at least this pitch.
  std::optional<MidiPitch> max_midi;  ///< Song range must start at or below this pitch.
};

/// @brief Filter songs by metadata and range overlap.
///
/// Unlike filterByRange this is an overlap test: a song matches when its
/// max is >= min_midi and its min is <= max_midi. Songs without range data
/// are dropped when either bound is set.
std::vector<Song> querySongs(const std::vector<Song>& songs, const SongQuery& query);

}  // namespace tessitura

#endif  // TESSITURA_STORAGE_LIBRARY_IO_H
