// Types and helpers shared by the evaluation protocols.

#ifndef TESSITURA_EVALUATION_EXPERIMENT_COMMON_H
#define TESSITURA_EVALUATION_EXPERIMENT_COMMON_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "evaluation/statistics.h"
#include "evaluation/synthetic_profile.h"

namespace tessitura {

/// Point estimate with its 95% bootstrap interval.
struct MetricEstimate {
  double value = 0.0;
  ConfidenceInterval ci;
};

/// @brief Mean of the observations plus a bootstrap CI drawn from `rng`.
MetricEstimate estimateMean(const std::vector<double>& values, std::mt19937& rng,
                            size_t bootstrap_samples);

/// Songs left out of an experiment, split by reason.
struct SkipCounts {
  uint32_t missing_range = 0;
  uint32_t missing_tessituragram = 0;
  uint32_t zero_duration = 0;
  uint32_t too_few_candidates = 0;
  uint32_t absent_from_candidates = 0;  ///< Query song missing from its own filtered set.

  /// @brief Count one song rejected by checkSongData.
  void addDataIssue(SongDataIssue issue);

  uint32_t total() const {
    return missing_range + missing_tessituragram + zero_duration + too_few_candidates +
           absent_from_candidates;
  }
};

/// Library-level counts reported by every protocol.
struct DataSummary {
  uint32_t total_songs = 0;
  uint32_t used = 0;  ///< Valid queries (RQ1), baselines (RQ2) or profiles (RQ3).
  SkipCounts skipped;
};

/// A song, the synthetic profile derived from it and its candidate set.
struct ProfiledQuery {
  const Song* song = nullptr;
  UserProfile profile;
  std::vector<const Song*> candidates;
};

/// @brief Walk the library in order and collect usable profiled queries.
///
/// A song is used when a profile can be derived from it and its range
/// filter yields at least `min_candidates` songs. Collection stops after
/// `max_count` queries (0 means no limit); songs after that point are
/// neither used nor counted as skipped.
///
/// @param songs Library (must outlive the returned pointers).
/// @param params Synthetic profile selection counts.
/// @param min_candidates Candidate-set floor.
/// @param max_count Maximum number of queries to return.
/// @param summary Receives total, used and skip counts.
/// @param log_tag Component tag for skip diagnostics (e.g. "RQ2").
/// @param verbose Log each skipped song to stderr.
/// @return Queries in library order.
std::vector<ProfiledQuery> collectProfiledQueries(const std::vector<Song>& songs,
                                                  const SyntheticProfileParams& params,
                                                  uint32_t min_candidates, uint32_t max_count,
                                                  DataSummary& summary, const char* log_tag,
                                                  bool verbose);

}  // namespace tessitura

#endif  // TESSITURA_EVALUATION_EXPERIMENT_COMMON_H
