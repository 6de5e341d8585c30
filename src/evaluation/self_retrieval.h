// Self-retrieval accuracy: does a song's own synthetic profile rank it first?

#ifndef TESSITURA_EVALUATION_SELF_RETRIEVAL_H
#define TESSITURA_EVALUATION_SELF_RETRIEVAL_H

#include <string>
#include <vector>

#include "core/basic_types.h"
#include "evaluation/evaluation_config.h"
#include "evaluation/experiment_common.h"

namespace tessitura {

/// Outcome of one self-retrieval query.
struct QueryRecord {
  std::string filename;
  std::string composer;
  std::string title;
  int rank = 0;
  bool hit_at_1 = false;
  bool hit_at_3 = false;
  bool hit_at_5 = false;
  double reciprocal_rank = 0.0;
};

/// Aggregated self-retrieval experiment.
struct SelfRetrievalResult {
  bool success = false;
  std::string error_message;
  EvaluationConfig config;
  DataSummary summary;
  MetricEstimate hr_at_1;
  MetricEstimate hr_at_3;
  MetricEstimate hr_at_5;
  MetricEstimate mrr;
  std::vector<QueryRecord> per_query;
};

/// @brief Build the record for a query song found at `rank`.
QueryRecord makeQueryRecord(const Song& song, int rank);

/// @brief Run the self-retrieval experiment over a library.
///
/// Every song with usable data becomes a query: its synthetic profile is
/// scored against the songs fitting its own range and the song's rank is
/// recorded. Queries with fewer than config.rq1_min_candidates candidates
/// are skipped. Metrics are means over queries, with bootstrap intervals
/// drawn in the order HR@1, HR@3, HR@5, MRR from one generator seeded with
/// config.seed.
///
/// @param songs Library.
/// @param config Evaluation configuration.
/// @return Result; success is false when no query was valid.
SelfRetrievalResult runSelfRetrieval(const std::vector<Song>& songs,
                                     const EvaluationConfig& config);

}  // namespace tessitura

#endif  // TESSITURA_EVALUATION_SELF_RETRIEVAL_H
