// Shared experiment helpers.

#include "evaluation/experiment_common.h"

#include <cstdio>
#include <utility>

#include "recommend/scoring_engine.h"

namespace tessitura {

MetricEstimate estimateMean(const std::vector<double>& values, std::mt19937& rng,
                            size_t bootstrap_samples) {
  MetricEstimate estimate;
  estimate.value = mean(values);
  estimate.ci = bootstrapMeanCI(values, rng, bootstrap_samples);
  return estimate;
}

void SkipCounts::addDataIssue(SongDataIssue issue) {
  switch (issue) {
    case SongDataIssue::None:
      break;
    case SongDataIssue::MissingRange:
      ++missing_range;
      break;
    case SongDataIssue::MissingTessituragram:
      ++missing_tessituragram;
      break;
    case SongDataIssue::ZeroDuration:
      ++zero_duration;
      break;
  }
}

std::vector<ProfiledQuery> collectProfiledQueries(const std::vector<Song>& songs,
                                                  const SyntheticProfileParams& params,
                                                  uint32_t min_candidates, uint32_t max_count,
                                                  DataSummary& summary, const char* log_tag,
                                                  bool verbose) {
  summary = DataSummary();
  summary.total_songs = static_cast<uint32_t>(songs.size());

  std::vector<ProfiledQuery> queries;
  for (const auto& song : songs) {
    if (max_count > 0 && queries.size() >= max_count) break;

    SongDataIssue issue = SongDataIssue::None;
    auto profile = deriveSyntheticProfile(song, params, &issue);
    if (!profile) {
      summary.skipped.addDataIssue(issue);
      if (verbose) {
        std::fprintf(stderr, "[%s] skip %s: %s\n", log_tag, song.filename.c_str(),
                     songDataIssueToString(issue));
      }
      continue;
    }

    auto candidates = filterByRange(songs, profile->range_min, profile->range_max);
    if (candidates.size() < min_candidates) {
      ++summary.skipped.too_few_candidates;
      if (verbose) {
        std::fprintf(stderr, "[%s] skip %s: %zu candidates (need %u)\n", log_tag,
                     song.filename.c_str(), candidates.size(), min_candidates);
      }
      continue;
    }

    ProfiledQuery query;
    query.song = &song;
    query.profile = std::move(*profile);
    query.candidates = std::move(candidates);
    queries.push_back(std::move(query));
  }
  summary.used = static_cast<uint32_t>(queries.size());
  return queries;
}

}  // namespace tessitura
