// Pitch utilities -- MIDI note names, note-list parsing, range clipping.

#ifndef TESSITURA_CORE_PITCH_UTILS_H
#define TESSITURA_CORE_PITCH_UTILS_H

#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace tessitura {

/// Note names for pitch classes 0-11 (C=0), flats for the black keys
/// except C# and F#.
constexpr const char* kNoteNames[] = {
    "C", "C#", "D", "Eb", "E", "F", "F#", "G", "Ab", "A", "Bb", "B"};

/// @brief Get pitch class (0-11) of a MIDI pitch.
inline int getPitchClass(MidiPitch pitch) { return ((pitch % 12) + 12) % 12; }

/// @brief Get scientific octave number of a MIDI pitch (60 -> 4).
inline int getOctave(MidiPitch pitch) {
  int shifted = pitch < 0 ? pitch - 11 : pitch;  // Floor division for negatives
  return shifted / 12 - 1;
}

/// @brief Convert a MIDI note number to a human-readable note name.
/// @param pitch MIDI note number.
/// @return String like "C4", "F#3", "Bb5".
std::string midiToNoteName(MidiPitch pitch);

/// @brief Join note names with ", " (e.g. "A4, D5").
std::string noteNameList(const std::vector<MidiPitch>& pitches);

/// @brief Parse a note name into a MIDI number.
///
/// Accepts a letter A-G (either case), any number of accidentals ('#' sharp,
/// 'b' or '-' flat), and an octave number. Since '-' always means flat,
/// octaves are non-negative. Examples: "C4", "F#4", "Bb3", "B-4", "Ebb5".
///
/// @param name Note name, surrounding whitespace ignored.
/// @return MIDI number, or empty if the name is malformed or outside 0..127.
std::optional<MidiPitch> noteNameToMidi(const std::string& name);

/// @brief Parse a comma-separated list of notes and note ranges.
///
/// Each token is either a single note ("A4") or an inclusive range
/// ("D4-E4"); a hyphen directly after a digit separates a range, so "B-4"
/// still reads as B flat. Reversed ranges are swapped. The result is
/// de-duplicated and sorted ascending.
///
/// @param text List such as "A4, D4-E4, F5". Empty text gives an empty list.
/// @return Parsed pitches, or empty optional if any token is malformed.
std::optional<std::vector<MidiPitch>> parseNoteList(const std::string& text);

/// @brief Keep only pitches inside [low, high].
/// @param pitches Input pitches (order preserved).
/// @param low Lower bound (inclusive).
/// @param high Upper bound (inclusive).
/// @param dropped Optional output receiving the pitches that were removed.
/// @return Pitches inside the range.
std::vector<MidiPitch> clipToRange(const std::vector<MidiPitch>& pitches, MidiPitch low,
                                   MidiPitch high, std::vector<MidiPitch>* dropped = nullptr);

}  // namespace tessitura

#endif  // TESSITURA_CORE_PITCH_UTILS_H
