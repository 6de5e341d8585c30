// JSON and text rendering of evaluation results.

#ifndef TESSITURA_EVALUATION_EXPERIMENT_REPORT_H
#define TESSITURA_EVALUATION_EXPERIMENT_REPORT_H

#include <string>

#include "evaluation/ranking_stability.h"
#include "evaluation/score_spread.h"
#include "evaluation/self_retrieval.h"

namespace tessitura {

/// @brief Serialize a self-retrieval result to pretty-printed JSON.
///
/// Contains experiment, description, success, parameters, data_summary,
/// and (on success) metrics HR@1/HR@3/HR@5/MRR with ci_95 and per_query.
/// A failed result carries "error" instead of metrics. Values are rounded
/// to 4 decimals.
std::string selfRetrievalToJson(const SelfRetrievalResult& result);

/// @brief Serialize a ranking stability result to pretty-printed JSON.
///
/// Adds baseline_profiles, interpretation bands and per_perturbation.
std::string rankingStabilityToJson(const RankingStabilityResult& result);

/// @brief Serialize a score spread result to pretty-printed JSON.
///
/// Variances are rounded to 6 decimals, everything else to 4.
std::string scoreSpreadToJson(const ScoreSpreadResult& result);

/// @brief Human-readable multi-line summary of a self-retrieval result.
std::string selfRetrievalToTextSummary(const SelfRetrievalResult& result);

/// @brief Human-readable multi-line summary of a ranking stability result.
std::string rankingStabilityToTextSummary(const RankingStabilityResult& result);

/// @brief Human-readable multi-line summary of a score spread result.
std::string scoreSpreadToTextSummary(const ScoreSpreadResult& result);

}  // namespace tessitura

#endif  // TESSITURA_EVALUATION_EXPERIMENT_REPORT_H
