// End-to-end recommendation query.

#include "recommender.h"

#include <cstdio>

#include "core/json_helpers.h"
#include "core/pitch_utils.h"

namespace tessitura {

namespace {

constexpr int kScoreDecimals = 4;
constexpr int kWeightDecimals = 6;

void writeNoteArrays(JsonWriter& writer, const char* names_key, const char* midis_key,
                     const std::vector<MidiPitch>& pitches) {
  writer.key(names_key);
  writer.beginArray();
  for (MidiPitch pitch : pitches) writer.value(midiToNoteName(pitch));
  writer.endArray();
  writer.key(midis_key);
  writer.beginArray();
  for (MidiPitch pitch : pitches) writer.value(pitch);
  writer.endArray();
}

/// Writes a dense vector as {"<midi>": weight}.
void writePitchVector(JsonWriter& writer, const DenseVector& vec, MidiPitch min_midi) {
  writer.beginObject();
  for (size_t idx = 0; idx < vec.size(); ++idx) {
    writer.key(std::to_string(min_midi + static_cast<MidiPitch>(idx)));
    writer.value(vec[idx], kWeightDecimals);
  }
  writer.endObject();
}

}  // namespace

RecommendResult recommend(const std::vector<Song>& songs, const RecommendConfig& config) {
  RecommendResult result;
  result.total_songs = static_cast<uint32_t>(songs.size());

  const UserProfile& input = config.profile;
  if (input.range_min < kMidiMin || input.range_max > kMidiMax) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "Range %d-%d is outside MIDI 0-127", input.range_min,
                  input.range_max);
    result.error_message = buf;
    return result;
  }
  if (input.range_min > input.range_max) {
    result.error_message = "Lowest note " + midiToNoteName(input.range_min) +
                           " is above highest note " + midiToNoteName(input.range_max);
    return result;
  }

  UserProfile profile;
  profile.range_min = input.range_min;
  profile.range_max = input.range_max;
  profile.favorite_midis = clipToRange(input.favorite_midis, input.range_min, input.range_max,
                                       &result.clipped_favorites);
  profile.avoid_midis = clipToRange(input.avoid_midis, input.range_min, input.range_max,
                                    &result.clipped_avoids);
  if (config.disjoint_policy == DisjointPolicy::RemoveAvoidOverlap) {
    profile = removeAvoidOverlap(profile, &result.removed_overlap);
  }
  result.profile = profile;

  auto candidates = filterByRange(songs, profile.range_min, profile.range_max);
  result.candidates = static_cast<uint32_t>(candidates.size());

  result.ideal_vector = buildIdealVector(profile, config.ideal);
  result.results = scoreSongs(candidates, result.ideal_vector, profile, config.scoring);
  result.success = true;
  return result;
}

std::string buildRecommendationsJson(const RecommendResult& result, const RecommendConfig& config) {
  const UserProfile& profile = result.profile;

  JsonWriter writer;
  writer.beginObject();

  writer.key("user_preferences");
  writer.beginObject();
  writer.key("range");
  writer.beginObject();
  writer.key("low");
  writer.value(midiToNoteName(profile.range_min));
  writer.key("low_midi");
  writer.value(profile.range_min);
  writer.key("high");
  writer.value(midiToNoteName(profile.range_max));
  writer.key("high_midi");
  writer.value(profile.range_max);
  writer.endObject();
  writeNoteArrays(writer, "favorite_notes", "favorite_midis", profile.favorite_midis);
  writeNoteArrays(writer, "avoid_notes", "avoid_midis", profile.avoid_midis);
  writer.key("alpha");
  writer.value(config.scoring.alpha);
  writer.endObject();

  writer.key("ideal_vector");
  writePitchVector(writer, result.ideal_vector, profile.range_min);

  writer.key("recommendations");
  writer.beginArray();
  for (const auto& scored : result.results) {
    writer.beginObject();
    writer.key("rank");
    writer.value(scored.rank);
    writer.key("filename");
    writer.value(std::string_view(scored.filename));
    writer.key("composer");
    writer.value(std::string_view(scored.composer));
    writer.key("title");
    writer.value(std::string_view(scored.title));
    writer.key("final_score");
    writer.value(scored.final_score, kScoreDecimals);
    writer.key("cosine_similarity");
    writer.value(scored.cosine_similarity, kScoreDecimals);
    writer.key("avoid_penalty");
    writer.value(scored.avoid_penalty, kScoreDecimals);
    writer.key("favorite_overlap");
    writer.value(scored.favorite_overlap, kScoreDecimals);
    writer.key("normalized_vector");
    writePitchVector(writer, scored.normalized_vector, profile.range_min);
    writer.key("explanation");
    writer.value(std::string_view(scored.explanation));
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return writer.toPrettyString();
}

}  // namespace tessitura
