// Song library JSON round-trip.

#include "storage/library_io.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "core/json_helpers.h"
#include "core/json_parser.h"
#include "core/pitch_utils.h"

namespace tessitura {

namespace {

/// @brief Parse a whole string as a base-10 MIDI number.
std::optional<MidiPitch> parseMidiKey(const std::string& key) {
  if (key.empty()) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  long val = std::strtol(key.c_str(), &end, 10);
  if (errno != 0 || end != key.c_str() + key.size()) return std::nullopt;
  if (val < kMidiMin || val > kMidiMax) return std::nullopt;
  return static_cast<MidiPitch>(val);
}

std::optional<Tessituragram> readTessituragram(const JsonValue* node) {
  if (!node || !node->isObject()) return std::nullopt;
  Tessituragram tess;
  for (const auto& [key, val] : node->object_members) {
    auto midi = parseMidiKey(key);
    if (!midi || !val.isNumber() || val.number_val < 0.0) continue;
    tess[*midi] += val.number_val;
  }
  return tess;
}

bool isMidiNumber(const JsonValue& node) {
  return node.isNumber() && node.number_val >= kMidiMin && node.number_val <= kMidiMax;
}

SongStatistics readStatistics(const JsonValue* node) {
  SongStatistics stats;
  if (!node || !node->isObject()) return stats;

  if (const JsonValue* total = node->find("total_duration")) {
    stats.total_duration = total->asDouble(0.0);
  }
  if (const JsonValue* unique = node->find("unique_pitches")) {
    stats.unique_pitches = unique->asUint(0);
  }
  const JsonValue* range = node->find("pitch_range");
  if (range && range->isObject()) {
    const JsonValue* min_node = range->find("min_midi");
    const JsonValue* max_node = range->find("max_midi");
    if (min_node && max_node && isMidiNumber(*min_node) && isMidiNumber(*max_node)) {
      PitchRange pitch_range{min_node->asInt(), max_node->asInt()};
      if (pitch_range.isValid()) stats.pitch_range = pitch_range;
    }
  }
  return stats;
}

std::string toLower(std::string_view text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return result;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return true;
  return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

}  // namespace

LibraryLoadResult parseLibraryJson(std::string_view text) {
  LibraryLoadResult result;

  JsonValue root;
  std::string parse_error;
  if (!parseJson(text, root, &parse_error)) {
    result.error_message = "Invalid library JSON: " + parse_error;
    return result;
  }
  if (!root.isObject()) {
    result.error_message = "Library JSON must be an object";
    return result;
  }

  const JsonValue* songs = root.find("songs");
  if (!songs || songs->isNull()) {
    // A document without a song list is an empty library.
    result.success = true;
    return result;
  }
  if (!songs->isArray()) {
    result.error_message = "\"songs\" must be an array";
    return result;
  }

  for (const auto& record : songs->array_items) {
    const JsonValue* filename = record.isObject() ? record.find("filename") : nullptr;
    if (!filename || !filename->isString() || filename->string_val.empty()) {
      ++result.records_skipped;
      continue;
    }
    Song song;
    song.filename = filename->string_val;
    if (const JsonValue* composer = record.find("composer")) song.composer = composer->asString();
    if (const JsonValue* title = record.find("title")) song.title = title->asString();
    song.tessituragram = readTessituragram(record.find("tessituragram"));
    song.statistics = readStatistics(record.find("statistics"));
    result.songs.push_back(std::move(song));
  }

  result.success = true;
  return result;
}

LibraryLoadResult loadLibraryFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LibraryLoadResult result;
    result.error_message = "Cannot open library file: " + path;
    return result;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return parseLibraryJson(contents.str());
}

std::string libraryToJson(const std::vector<Song>& songs) {
  JsonWriter writer;
  writer.beginObject();
  writer.key("songs");
  writer.beginArray();
  for (const auto& song : songs) {
    writer.beginObject();
    writer.key("filename");
    writer.value(std::string_view(song.filename));
    writer.key("composer");
    writer.value(std::string_view(song.composer));
    writer.key("title");
    writer.value(std::string_view(song.title));

    writer.key("tessituragram");
    if (song.tessituragram) {
      writer.beginObject();
      for (const auto& [pitch, duration] : *song.tessituragram) {
        writer.key(std::to_string(pitch));
        writer.value(duration);
      }
      writer.endObject();
    } else {
      writer.valueNull();
    }

    writer.key("statistics");
    writer.beginObject();
    writer.key("total_duration");
    writer.value(song.statistics.total_duration);
    writer.key("pitch_range");
    writer.beginObject();
    const auto& range = song.statistics.pitch_range;
    writer.key("min");
    if (range) writer.value(midiToNoteName(range->min_midi)); else writer.valueNull();
    writer.key("min_midi");
    if (range) writer.value(range->min_midi); else writer.valueNull();
    writer.key("max");
    if (range) writer.value(midiToNoteName(range->max_midi)); else writer.valueNull();
    writer.key("max_midi");
    if (range) writer.value(range->max_midi); else writer.valueNull();
    writer.endObject();
    writer.key("unique_pitches");
    writer.value(song.statistics.unique_pitches);
    writer.endObject();

    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
  return writer.toPrettyString();
}

std::vector<Song> mergeSongs(const std::vector<Song>& existing, const std::vector<Song>& incoming) {
  std::unordered_set<std::string> seen;
  for (const auto& song : existing) seen.insert(song.filename);

  std::vector<Song> merged = existing;
  for (const auto& song : incoming) {
    if (seen.insert(song.filename).second) merged.push_back(song);
  }
  return merged;
}

std::vector<Song> querySongs(const std::vector<Song>& songs, const SongQuery& query) {
  std::vector<Song> result;
  bool range_query = query.min_midi.has_value() || query.max_midi.has_value();
  for (const auto& song : songs) {
    if (!containsIgnoreCase(song.composer, query.composer)) continue;
    if (!containsIgnoreCase(song.title, query.title)) continue;
    if (range_query) {
      if (!song.hasRangeData()) continue;
      const PitchRange& range = *song.statistics.pitch_range;
      if (query.min_midi && range.max_midi < *query.min_midi) continue;
      if (query.max_midi && range.min_midi > *query.max_midi) continue;
    }
    result.push_back(song);
  }
  return result;
}

}  // namespace tessitura
