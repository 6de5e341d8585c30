// Implementation of pitch naming and note-list parsing.

#include "core/pitch_utils.h"

#include <algorithm>
#include <cctype>

namespace tessitura {

namespace {

/// Semitone offset of each natural letter from C (A..G).
constexpr int kLetterOffsets[7] = {9, 11, 0, 2, 4, 5, 7};

/// @brief Strip leading and trailing whitespace.
std::string trim(const std::string& text) {
  size_t start = 0;
  size_t end = text.size();
  while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(start, end - start);
}

/// @brief Find the first hyphen that directly follows a digit.
/// @return Position of the separator, or std::string::npos.
size_t findRangeSeparator(const std::string& token) {
  for (size_t pos = 1; pos < token.size(); ++pos) {
    if (token[pos] == '-' && std::isdigit(static_cast<unsigned char>(token[pos - 1]))) {
      return pos;
    }
  }
  return std::string::npos;
}

/// @brief Parse one list token (single note or range) into pitches.
std::optional<std::vector<MidiPitch>> parseNoteOrRange(const std::string& token) {
  size_t sep = findRangeSeparator(token);
  if (sep != std::string::npos) {
    std::string low_str = trim(token.substr(0, sep));
    std::string high_str = trim(token.substr(sep + 1));
    if (!low_str.empty() && !high_str.empty()) {
      auto low = noteNameToMidi(low_str);
      auto high = noteNameToMidi(high_str);
      if (low && high) {
        MidiPitch lo = std::min(*low, *high);
        MidiPitch hi = std::max(*low, *high);
        std::vector<MidiPitch> result;
        for (MidiPitch pitch = lo; pitch <= hi; ++pitch) result.push_back(pitch);
        return result;
      }
    }
    // Fall through: the whole token may still be a single note name.
  }

  auto single = noteNameToMidi(token);
  if (!single) return std::nullopt;
  return std::vector<MidiPitch>{*single};
}

}  // namespace

std::string midiToNoteName(MidiPitch pitch) {
  return std::string(kNoteNames[getPitchClass(pitch)]) + std::to_string(getOctave(pitch));
}

std::string noteNameList(const std::vector<MidiPitch>& pitches) {
  std::string result;
  for (size_t idx = 0; idx < pitches.size(); ++idx) {
    if (idx > 0) result += ", ";
    result += midiToNoteName(pitches[idx]);
  }
  return result;
}

std::optional<MidiPitch> noteNameToMidi(const std::string& name) {
  std::string text = trim(name);
  if (text.empty()) return std::nullopt;

  char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
  if (letter < 'A' || letter > 'G') return std::nullopt;
  int semitone = kLetterOffsets[letter - 'A'];

  size_t pos = 1;
  int accidental = 0;
  while (pos < text.size()) {
    if (text[pos] == '#') {
      ++accidental;
    } else if (text[pos] == 'b' || text[pos] == '-') {
      --accidental;
    } else {
      break;
    }
    ++pos;
  }

  if (pos >= text.size()) return std::nullopt;
  int octave = 0;
  for (; pos < text.size(); ++pos) {
    if (!std::isdigit(static_cast<unsigned char>(text[pos]))) return std::nullopt;
    octave = octave * 10 + (text[pos] - '0');
    if (octave > 10) return std::nullopt;
  }

  int midi = (octave + 1) * 12 + semitone + accidental;
  if (midi < kMidiMin || midi > kMidiMax) return std::nullopt;
  return midi;
}

std::optional<std::vector<MidiPitch>> parseNoteList(const std::string& text) {
  std::vector<MidiPitch> result;
  size_t start = 0;
  while (start <= text.size()) {
    size_t comma = text.find(',', start);
    if (comma == std::string::npos) comma = text.size();
    std::string token = trim(text.substr(start, comma - start));
    if (!token.empty()) {
      auto parsed = parseNoteOrRange(token);
      if (!parsed) return std::nullopt;
      result.insert(result.end(), parsed->begin(), parsed->end());
    }
    start = comma + 1;
  }

  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

std::vector<MidiPitch> clipToRange(const std::vector<MidiPitch>& pitches, MidiPitch low,
                                   MidiPitch high, std::vector<MidiPitch>* dropped) {
  std::vector<MidiPitch> kept;
  kept.reserve(pitches.size());
  for (MidiPitch pitch : pitches) {
    if (pitch >= low && pitch <= high) {
      kept.push_back(pitch);
    } else if (dropped) {
      dropped->push_back(pitch);
    }
  }
  return kept;
}

}  // namespace tessitura
