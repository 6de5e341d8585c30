// Tessituragram accumulation from a parsed vocal line.

#ifndef TESSITURA_CORE_TESSITURAGRAM_H
#define TESSITURA_CORE_TESSITURAGRAM_H

#include <vector>

#include "core/basic_types.h"

namespace tessitura {

/// One event of a vocal line as delivered by score ingestion.
struct SungNote {
  MidiPitch pitch = kMidiC4;  ///< Ignored for rests.
  double duration = 0.0;      ///< Quarter lengths.
  bool is_rest = false;
};

/// @brief Sum singing time per MIDI pitch.
///
/// Rests are skipped. Enharmonic spellings are already collapsed by using the
/// MIDI number as key.
///
/// @param notes Vocal line in score order.
/// @return Tessituragram (empty if the line has no pitched notes).
Tessituragram buildTessituragram(const std::vector<SungNote>& notes);

/// @brief Compute summary statistics for a vocal line.
/// @param notes Vocal line in score order.
/// @param tessituragram Tessituragram built from the same notes.
/// @return Total duration (rests included), pitch range of pitched notes
///         (absent when there are none), and unique pitch count.
SongStatistics computeSongStatistics(const std::vector<SungNote>& notes,
                                     const Tessituragram& tessituragram);

}  // namespace tessitura

#endif  // TESSITURA_CORE_TESSITURAGRAM_H
