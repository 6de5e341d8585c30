// Self-retrieval experiment.

#include "evaluation/self_retrieval.h"

#include <cstdio>
#include <random>
#include <utility>

#include "recommend/ideal_profile.h"
#include "recommend/scoring_engine.h"

namespace tessitura {

QueryRecord makeQueryRecord(const Song& song, int rank) {
  QueryRecord record;
  record.filename = song.filename;
  record.composer = song.composer;
  record.title = song.title;
  record.rank = rank;
  record.hit_at_1 = rank == 1;
  record.hit_at_3 = rank <= 3;
  record.hit_at_5 = rank <= 5;
  record.reciprocal_rank = rank > 0 ? 1.0 / static_cast<double>(rank) : 0.0;
  return record;
}

SelfRetrievalResult runSelfRetrieval(const std::vector<Song>& songs,
                                     const EvaluationConfig& config) {
  SelfRetrievalResult result;
  result.config = config;
  EvaluationConfigError config_error = validateEvaluationConfig(config);
  if (config_error != EvaluationConfigError::Ok) {
    result.error_message = evaluationConfigErrorToString(config_error);
    return result;
  }

  auto queries = collectProfiledQueries(songs, config.profile, config.rq1_min_candidates, 0,
                                        result.summary, "RQ1", config.verbose);

  for (const auto& query : queries) {
    DenseVector ideal = buildIdealVector(query.profile, config.ideal);
    auto ranked = scoreSongs(query.candidates, ideal, query.profile, config.scoring);
    auto rank = findRank(ranked, query.song->filename);
    if (!rank) {
      ++result.summary.skipped.absent_from_candidates;
      if (config.verbose) {
        std::fprintf(stderr, "[RQ1] skip %s: not in its own candidate set\n",
                     query.song->filename.c_str());
      }
      continue;
    }
    result.per_query.push_back(makeQueryRecord(*query.song, *rank));
    if (config.verbose) {
      std::fprintf(stderr, "[RQ1] %s: rank %d of %zu\n", query.song->filename.c_str(), *rank,
                   ranked.size());
    }
  }
  result.summary.used = static_cast<uint32_t>(result.per_query.size());

  if (result.per_query.empty()) {
    result.error_message = "No song yielded a valid self-retrieval query.";
    return result;
  }

  std::vector<double> hits_1;
  std::vector<double> hits_3;
  std::vector<double> hits_5;
  std::vector<double> reciprocal;
  for (const auto& record : result.per_query) {
    hits_1.push_back(record.hit_at_1 ? 1.0 : 0.0);
    hits_3.push_back(record.hit_at_3 ? 1.0 : 0.0);
    hits_5.push_back(record.hit_at_5 ? 1.0 : 0.0);
    reciprocal.push_back(record.reciprocal_rank);
  }

  std::mt19937 rng(config.seed);
  result.hr_at_1 = estimateMean(hits_1, rng, config.bootstrap_samples);
  result.hr_at_3 = estimateMean(hits_3, rng, config.bootstrap_samples);
  result.hr_at_5 = estimateMean(hits_5, rng, config.bootstrap_samples);
  result.mrr = estimateMean(reciprocal, rng, config.bootstrap_samples);
  result.success = true;
  return result;
}

}  // namespace tessitura
