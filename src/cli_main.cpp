/// @file
/// @brief CLI entry point for the tessitura recommender and evaluation harness.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "core/pitch_utils.h"
#include "core/rng_util.h"
#include "evaluation/evaluation_config.h"
#include "evaluation/experiment_report.h"
#include "evaluation/ranking_stability.h"
#include "evaluation/score_spread.h"
#include "evaluation/self_retrieval.h"
#include "recommender.h"
#include "storage/library_io.h"

namespace {

/// Subcommand selected on the command line.
enum class Command : uint8_t {
  None,
  Recommend,
  Evaluate
};

/// @brief Command-line options parsed from argv.
struct CliOptions {
  Command command = Command::None;
  std::string library;
  // recommend
  std::string low;
  std::string high;
  std::string favorites;
  std::string avoids;
  bool keep_overlap = false;
  bool json_output = false;
  // evaluate
  std::string rq = "all";
  std::string config_path;
  bool verbose = false;
  // shared overrides
  double alpha = 0.5;
  bool alpha_specified = false;
  uint32_t seed = 42;
  bool seed_specified = false;
  uint32_t bootstrap = 10000;
  bool bootstrap_specified = false;
  std::string output;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("tessitura_cli - Vocal repertoire recommender\n\n");
  std::printf("Usage:\n");
  std::printf("  tessitura_cli recommend --library FILE --low NOTE --high NOTE [options]\n");
  std::printf("  tessitura_cli evaluate  --library FILE [options]\n\n");
  std::printf("Recommend options:\n");
  std::printf("  --low NOTE       Lowest comfortable note (e.g. C4, Bb3, or MIDI number)\n");
  std::printf("  --high NOTE      Highest comfortable note\n");
  std::printf("  --fav LIST       Favorite notes, comma-separated; D4-E4 for ranges\n");
  std::printf("  --avoid LIST     Notes to avoid, same syntax as --fav\n");
  std::printf("  --alpha X        Avoid penalty weight (default 0.5)\n");
  std::printf("  --keep-overlap   Keep avoid notes that are also favorites\n");
  std::printf("  --json           Write recommendations JSON\n");
  std::printf("  -o FILE          JSON output path (default recommendations.json)\n");
  std::printf("\nEvaluate options:\n");
  std::printf("  --rq N           Experiment to run: 1, 2, 3 or all (default all)\n");
  std::printf("  --config FILE    JSON config file (flags override its values)\n");
  std::printf("  --seed N         Bootstrap seed (default 42, 0 = auto)\n");
  std::printf("  --bootstrap N    Bootstrap resamples (default 10000)\n");
  std::printf("  --alpha X        Avoid penalty weight (default 0.5)\n");
  std::printf("  --verbose        Log per-song decisions to stderr\n");
  std::printf("  -o DIR           Output directory for RQ*_results.json (default .)\n");
  std::printf("\n  --help           Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @param exit_code Set when the caller should exit immediately.
/// @return False if the program should exit (help or usage error).
bool parseArgs(int argc, char* argv[], CliOptions& opts, int& exit_code) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      exit_code = 0;
      return false;
    }
    if (std::strcmp(argv[idx], "recommend") == 0 && opts.command == Command::None) {
      opts.command = Command::Recommend;
    } else if (std::strcmp(argv[idx], "evaluate") == 0 && opts.command == Command::None) {
      opts.command = Command::Evaluate;
    } else if (std::strcmp(argv[idx], "--library") == 0 && idx + 1 < argc) {
      opts.library = argv[++idx];
    } else if (std::strcmp(argv[idx], "--low") == 0 && idx + 1 < argc) {
      opts.low = argv[++idx];
    } else if (std::strcmp(argv[idx], "--high") == 0 && idx + 1 < argc) {
      opts.high = argv[++idx];
    } else if (std::strcmp(argv[idx], "--fav") == 0 && idx + 1 < argc) {
      opts.favorites = argv[++idx];
    } else if (std::strcmp(argv[idx], "--avoid") == 0 && idx + 1 < argc) {
      opts.avoids = argv[++idx];
    } else if (std::strcmp(argv[idx], "--alpha") == 0 && idx + 1 < argc) {
      opts.alpha = std::atof(argv[++idx]);
      opts.alpha_specified = true;
    } else if (std::strcmp(argv[idx], "--keep-overlap") == 0) {
      opts.keep_overlap = true;
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[idx], "--rq") == 0 && idx + 1 < argc) {
      opts.rq = argv[++idx];
    } else if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
      opts.seed_specified = true;
    } else if (std::strcmp(argv[idx], "--bootstrap") == 0 && idx + 1 < argc) {
      opts.bootstrap = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
      opts.bootstrap_specified = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else {
      std::fprintf(stderr, "Error: unknown or incomplete argument '%s'\n", argv[idx]);
      exit_code = 1;
      return false;
    }
  }

  if (opts.command == Command::None) {
    printUsage();
    exit_code = 1;
    return false;
  }
  if (opts.library.empty()) {
    std::fprintf(stderr, "Error: --library is required\n");
    exit_code = 1;
    return false;
  }
  return true;
}

/// @brief Parse a note name or a plain MIDI number.
std::optional<tessitura::MidiPitch> parsePitchArg(const std::string& text) {
  if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos) {
    long val = std::strtol(text.c_str(), nullptr, 10);
    if (val > tessitura::kMidiMax) return std::nullopt;
    return static_cast<tessitura::MidiPitch>(val);
  }
  return tessitura::noteNameToMidi(text);
}

/// @brief Write text to a file, reporting failure on stderr.
bool writeTextFile(const std::string& path, const std::string& text) {
  std::ofstream file(path);
  if (!file.is_open()) {
    std::fprintf(stderr, "Warning: failed to write %s\n", path.c_str());
    return false;
  }
  file << text;
  file.close();
  if (!file) {
    std::fprintf(stderr, "Warning: failed to write %s\n", path.c_str());
    return false;
  }
  return true;
}

/// @brief Load the library named on the command line, printing errors.
bool loadLibrary(const CliOptions& opts, std::vector<tessitura::Song>& songs) {
  tessitura::LibraryLoadResult loaded = tessitura::loadLibraryFile(opts.library);
  if (!loaded.success) {
    std::fprintf(stderr, "Error: %s\n", loaded.error_message.c_str());
    return false;
  }
  if (loaded.records_skipped > 0) {
    std::fprintf(stderr, "[Library] WARNING: skipped %u record(s) without a filename\n",
                 loaded.records_skipped);
  }
  songs = std::move(loaded.songs);
  return true;
}

/// @brief Build a RecommendConfig from parsed CLI options.
/// @return False (after printing an error) if a note argument is malformed.
bool buildRecommendConfig(const CliOptions& opts, tessitura::RecommendConfig& config) {
  if (opts.low.empty() || opts.high.empty()) {
    std::fprintf(stderr, "Error: recommend needs --low and --high\n");
    return false;
  }
  auto low = parsePitchArg(opts.low);
  auto high = parsePitchArg(opts.high);
  if (!low || !high) {
    std::fprintf(stderr, "Error: cannot parse range '%s' to '%s'\n", opts.low.c_str(),
                 opts.high.c_str());
    return false;
  }
  auto favorites = tessitura::parseNoteList(opts.favorites);
  if (!favorites) {
    std::fprintf(stderr, "Error: cannot parse favorite notes '%s'\n", opts.favorites.c_str());
    return false;
  }
  auto avoids = tessitura::parseNoteList(opts.avoids);
  if (!avoids) {
    std::fprintf(stderr, "Error: cannot parse avoid notes '%s'\n", opts.avoids.c_str());
    return false;
  }

  config.profile.range_min = *low;
  config.profile.range_max = *high;
  config.profile.favorite_midis = *favorites;
  config.profile.avoid_midis = *avoids;
  config.scoring.alpha = opts.alpha;
  config.disjoint_policy = opts.keep_overlap ? tessitura::DisjointPolicy::Preserve
                                             : tessitura::DisjointPolicy::RemoveAvoidOverlap;
  return true;
}

int runRecommend(const CliOptions& opts) {
  tessitura::RecommendConfig config;
  if (!buildRecommendConfig(opts, config)) return 1;

  std::vector<tessitura::Song> songs;
  if (!loadLibrary(opts, songs)) return 1;

  tessitura::RecommendResult result = tessitura::recommend(songs, config);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  if (!result.clipped_favorites.empty()) {
    std::fprintf(stderr, "Warning: favorites %s fall outside your range and are ignored\n",
                 tessitura::noteNameList(result.clipped_favorites).c_str());
  }
  if (!result.clipped_avoids.empty()) {
    std::fprintf(stderr, "Warning: avoid notes %s fall outside your range and are ignored\n",
                 tessitura::noteNameList(result.clipped_avoids).c_str());
  }
  if (!result.removed_overlap.empty()) {
    std::fprintf(stderr, "Warning: %s listed as both favorite and avoid; kept as favorite\n",
                 tessitura::noteNameList(result.removed_overlap).c_str());
  }

  const tessitura::UserProfile& profile = result.profile;
  std::printf("Range:      %s - %s\n", tessitura::midiToNoteName(profile.range_min).c_str(),
              tessitura::midiToNoteName(profile.range_max).c_str());
  std::printf("Favorites:  %s\n", tessitura::noteNameList(profile.favorite_midis).c_str());
  std::printf("Avoid:      %s\n", tessitura::noteNameList(profile.avoid_midis).c_str());
  std::printf("Alpha:      %.2f\n", config.scoring.alpha);
  std::printf("Library:    %u song(s), %u fit your range\n\n", result.total_songs,
              result.candidates);

  if (result.results.empty()) {
    std::printf("No songs match your range. Try widening it.\n");
    return 0;
  }

  for (const auto& scored : result.results) {
    std::printf("#%d  %s\n", scored.rank, scored.title.c_str());
    std::printf("    Composer: %s\n", scored.composer.c_str());
    std::printf("    File:     %s\n", scored.filename.c_str());
    std::printf("    %s\n\n", scored.explanation.c_str());
  }

  if (opts.json_output) {
    std::string path = opts.output.empty() ? "recommendations.json" : opts.output;
    if (!writeTextFile(path, tessitura::buildRecommendationsJson(result, config))) return 1;
    std::printf("JSON:       %s\n", path.c_str());
  }
  return 0;
}

/// @brief Build an EvaluationConfig from the config file and flags.
/// @return False (after printing an error) on an unreadable or invalid config.
bool buildEvaluationConfig(const CliOptions& opts, tessitura::EvaluationConfig& config) {
  if (!opts.config_path.empty()) {
    std::ifstream file(opts.config_path);
    if (!file.is_open()) {
      std::fprintf(stderr, "Error: cannot open config file %s\n", opts.config_path.c_str());
      return false;
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    std::string text = contents.str();

    std::string parse_error;
    auto kv = tessitura::parseJsonObject(text.data(), text.size(), &parse_error);
    if (!parse_error.empty()) {
      std::fprintf(stderr, "Error: invalid config file %s: %s\n", opts.config_path.c_str(),
                   parse_error.c_str());
      return false;
    }
    config = tessitura::evaluationConfigFromJson(kv, config);
  }

  if (opts.alpha_specified) config.scoring.alpha = opts.alpha;
  if (opts.seed_specified) config.seed = opts.seed;
  if (opts.bootstrap_specified) config.bootstrap_samples = opts.bootstrap;
  if (opts.verbose) config.verbose = true;

  tessitura::EvaluationConfigError err = tessitura::validateEvaluationConfig(config);
  if (err != tessitura::EvaluationConfigError::Ok) {
    std::fprintf(stderr, "Error: %s\n", tessitura::evaluationConfigErrorToString(err));
    return false;
  }
  return true;
}

std::string joinPath(const std::string& dir, const char* name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

int runEvaluate(const CliOptions& opts) {
  bool run_rq1 = opts.rq == "all" || opts.rq == "1";
  bool run_rq2 = opts.rq == "all" || opts.rq == "2";
  bool run_rq3 = opts.rq == "all" || opts.rq == "3";
  if (!run_rq1 && !run_rq2 && !run_rq3) {
    std::fprintf(stderr, "Error: --rq must be 1, 2, 3 or all\n");
    return 1;
  }

  tessitura::EvaluationConfig config;
  if (!buildEvaluationConfig(opts, config)) return 1;

  bool auto_seed = config.seed == 0;
  if (auto_seed) config.seed = tessitura::rng::generateRandomSeed();

  std::vector<tessitura::Song> songs;
  if (!loadLibrary(opts, songs)) return 1;

  std::printf("Library:    %s (%zu songs)\n", opts.library.c_str(), songs.size());
  std::printf("Seed:       %u%s\n", config.seed, auto_seed ? " (auto)" : "");
  std::printf("Bootstrap:  %zu resamples\n\n", config.bootstrap_samples);

  int exit_code = 0;
  auto report = [&](bool success, const std::string& text, const std::string& json,
                    const char* filename) {
    std::printf("%s\n", text.c_str());
    std::string path = joinPath(opts.output, filename);
    if (writeTextFile(path, json)) {
      std::printf("Results:    %s\n\n", path.c_str());
    } else {
      exit_code = 1;
    }
    if (!success) exit_code = 1;
  };

  if (run_rq1) {
    auto result = tessitura::runSelfRetrieval(songs, config);
    report(result.success, tessitura::selfRetrievalToTextSummary(result),
           tessitura::selfRetrievalToJson(result), "RQ1_results.json");
  }
  if (run_rq2) {
    auto result = tessitura::runRankingStability(songs, config);
    report(result.success, tessitura::rankingStabilityToTextSummary(result),
           tessitura::rankingStabilityToJson(result), "RQ2_results.json");
  }
  if (run_rq3) {
    auto result = tessitura::runScoreSpread(songs, config);
    report(result.success, tessitura::scoreSpreadToTextSummary(result),
           tessitura::scoreSpreadToJson(result), "RQ3_results.json");
  }
  return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  int exit_code = 0;
  if (!parseArgs(argc, argv, opts, exit_code)) {
    return exit_code;
  }

  std::printf("tessitura_cli v0.1.0\n");
  if (opts.command == Command::Recommend) {
    return runRecommend(opts);
  }
  return runEvaluate(opts);
}
