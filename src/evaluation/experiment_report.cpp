// Experiment result serialization.

#include "evaluation/experiment_report.h"

#include <sstream>
#include <utility>

#include "core/json_helpers.h"

namespace tessitura {

namespace {

constexpr int kDecimals = 4;
constexpr int kVarianceDecimals = 6;

/// Which optional parameters a protocol reports.
struct ParameterFields {
  bool min_candidates = false;  ///< Report min_candidates instead of rq1_min_candidates.
  bool n_baselines = false;
  bool n_profiles = false;
};

void writeParameters(JsonWriter& writer, const EvaluationConfig& config,
                     const ParameterFields& fields) {
  writer.key("parameters");
  writer.beginObject();
  writer.key("alpha");
  writer.value(config.scoring.alpha);
  writer.key("base");
  writer.value(config.ideal.base);
  writer.key("fav_boost");
  writer.value(config.ideal.fav_boost);
  writer.key("avoid_penalty");
  writer.value(config.ideal.avoid_penalty);
  writer.key("top_n_favorite");
  writer.value(config.profile.top_n_favorite);
  writer.key("bottom_n_avoid");
  writer.value(config.profile.bottom_n_avoid);
  writer.key("min_candidates");
  writer.value(fields.min_candidates ? config.min_candidates : config.rq1_min_candidates);
  if (fields.n_baselines) {
    writer.key("n_baselines");
    writer.value(config.n_baselines);
  }
  if (fields.n_profiles) {
    writer.key("n_profiles");
    writer.value(config.n_profiles);
  }
  writer.key("bootstrap_samples");
  writer.value(static_cast<uint64_t>(config.bootstrap_samples));
  writer.key("random_seed");
  writer.value(config.seed);
  writer.endObject();
}

/// Writes the keys shared by every data_summary; caller closes the object.
void beginDataSummary(JsonWriter& writer, const DataSummary& summary, const char* used_key) {
  writer.key("data_summary");
  writer.beginObject();
  writer.key("total_songs_in_library");
  writer.value(summary.total_songs);
  writer.key(used_key);
  writer.value(summary.used);
  writer.key("songs_skipped");
  writer.value(summary.skipped.total());
  writer.key("skipped");
  writer.beginObject();
  writer.key("missing_pitch_range");
  writer.value(summary.skipped.missing_range);
  writer.key("missing_tessituragram");
  writer.value(summary.skipped.missing_tessituragram);
  writer.key("zero_total_duration");
  writer.value(summary.skipped.zero_duration);
  writer.key("too_few_candidates");
  writer.value(summary.skipped.too_few_candidates);
  writer.key("absent_from_candidates");
  writer.value(summary.skipped.absent_from_candidates);
  writer.endObject();
}

void writeHeader(JsonWriter& writer, const char* experiment, const char* description,
                 bool success, const std::string& error_message) {
  writer.key("experiment");
  writer.value(experiment);
  writer.key("description");
  writer.value(description);
  writer.key("success");
  writer.value(success);
  if (!success) {
    writer.key("error");
    writer.value(std::string_view(error_message));
  }
}

void writeEstimate(JsonWriter& writer, const char* value_key, const MetricEstimate& estimate,
                   int decimals) {
  writer.key(value_key);
  writer.value(estimate.value, decimals);
  writer.key("ci_95");
  writer.valuePair(estimate.ci.lo, estimate.ci.hi, decimals);
}

void writeMetric(JsonWriter& writer, const char* name, const MetricEstimate& estimate) {
  writer.key(name);
  writer.beginObject();
  writeEstimate(writer, "value", estimate, kDecimals);
  writer.endObject();
}

void writeCorrelation(JsonWriter& writer, const char* name, const CorrelationEstimate& corr) {
  writer.key(name);
  writer.beginObject();
  writeEstimate(writer, "mean", corr.estimate, kDecimals);
  writer.key("expected_sign");
  writer.value(expectedSignToString(corr.expected));
  writer.key("matches_expected");
  writer.value(corr.matchesExpected());
  writer.endObject();
}

std::string formatCI(const ConfidenceInterval& ci, int decimals) {
  return "[" + formatDecimal(ci.lo, decimals) + ", " + formatDecimal(ci.hi, decimals) + "]";
}

}  // namespace

std::string selfRetrievalToJson(const SelfRetrievalResult& result) {
  JsonWriter writer;
  writer.beginObject();
  writeHeader(writer, "RQ1_self_retrieval_accuracy",
              "When a synthetic user profile is derived from one song, does the system rank "
              "that song at position 1 or in the top 3/5?",
              result.success, result.error_message);
  writeParameters(writer, result.config, ParameterFields());
  beginDataSummary(writer, result.summary, "valid_queries");
  writer.endObject();

  if (result.success) {
    writer.key("metrics");
    writer.beginObject();
    writeMetric(writer, "HR@1", result.hr_at_1);
    writeMetric(writer, "HR@3", result.hr_at_3);
    writeMetric(writer, "HR@5", result.hr_at_5);
    writeMetric(writer, "MRR", result.mrr);
    writer.endObject();

    writer.key("per_query");
    writer.beginArray();
    for (const auto& record : result.per_query) {
      writer.beginObject();
      writer.key("filename");
      writer.value(std::string_view(record.filename));
      writer.key("composer");
      writer.value(std::string_view(record.composer));
      writer.key("title");
      writer.value(std::string_view(record.title));
      writer.key("rank");
      writer.value(record.rank);
      writer.key("hit@1");
      writer.value(record.hit_at_1 ? 1 : 0);
      writer.key("hit@3");
      writer.value(record.hit_at_3 ? 1 : 0);
      writer.key("hit@5");
      writer.value(record.hit_at_5 ? 1 : 0);
      writer.key("1/rank");
      writer.value(record.reciprocal_rank, kDecimals);
      writer.endObject();
    }
    writer.endArray();
  }

  writer.endObject();
  return writer.toPrettyString();
}

std::string rankingStabilityToJson(const RankingStabilityResult& result) {
  JsonWriter writer;
  writer.beginObject();
  writeHeader(writer, "RQ2_ranking_stability",
              "When favourites or avoids change by one note, how similar is the new ranking "
              "to the original? (Kendall's tau-b)",
              result.success, result.error_message);
  ParameterFields fields;
  fields.min_candidates = true;
  fields.n_baselines = true;
  writeParameters(writer, result.config, fields);
  beginDataSummary(writer, result.summary, "n_baselines");
  writer.key("total_perturbations");
  writer.value(result.total_perturbations);
  writer.endObject();

  if (result.success) {
    writer.key("baseline_profiles");
    writer.beginArray();
    for (const auto& baseline : result.baselines) {
      writer.beginObject();
      writer.key("source_song");
      writer.value(std::string_view(baseline.source_song));
      writer.key("composer");
      writer.value(std::string_view(baseline.composer));
      writer.key("n_perturbations");
      writer.value(baseline.n_perturbations);
      writer.key("mean_tau");
      writer.value(baseline.mean_tau, kDecimals);
      writer.endObject();
    }
    writer.endArray();

    writer.key("metrics");
    writer.beginObject();
    writeEstimate(writer, "mean_tau", result.mean_tau, kDecimals);
    writer.key("std_tau");
    writer.value(result.std_tau, kDecimals);
    writer.key("mean_tau_per_baseline");
    writer.value(result.mean_tau_per_baseline, kDecimals);
    writer.key("std_tau_across_baselines");
    writer.value(result.std_tau_across_baselines, kDecimals);
    writer.key("agreement");
    writer.value(agreementBandToString(classifyAgreement(result.mean_tau.value)));
    writer.endObject();

    writer.key("interpretation");
    writer.beginObject();
    writer.key("tau_gt_0.7");
    writer.value("strong agreement (rankings very similar)");
    writer.key("tau_0.3_to_0.7");
    writer.value("moderate agreement");
    writer.key("tau_lt_0.3");
    writer.value("weak agreement");
    writer.endObject();

    writer.key("per_perturbation");
    writer.beginArray();
    for (const auto& record : result.per_perturbation) {
      writer.beginObject();
      writer.key("baseline_source");
      writer.value(std::string_view(record.baseline_source));
      writer.key("perturbation_type");
      writer.value(perturbationTypeToString(record.type));
      writer.key("midi_changed");
      writer.value(record.midi_changed);
      writer.key("note_changed");
      writer.value(std::string_view(record.note_changed));
      writer.key("tau");
      writer.value(record.tau, kDecimals);
      writer.endObject();
    }
    writer.endArray();
  }

  writer.endObject();
  return writer.toPrettyString();
}

std::string scoreSpreadToJson(const ScoreSpreadResult& result) {
  JsonWriter writer;
  writer.beginObject();
  writeHeader(writer, "RQ3_score_spread_internal_validity",
              "(a) Spread of final_score (variance, range). (b) Internal validity: "
              "correlations between score parts and final_score.",
              result.success, result.error_message);
  ParameterFields fields;
  fields.min_candidates = true;
  fields.n_profiles = true;
  writeParameters(writer, result.config, fields);
  beginDataSummary(writer, result.summary, "n_profiles");
  writer.endObject();

  if (result.success) {
    writer.key("metrics");
    writer.beginObject();

    writer.key("spread");
    writer.beginObject();
    writer.key("mean_variance_final_score");
    writer.value(result.variance.value, kVarianceDecimals);
    writer.key("std_variance_final_score");
    writer.value(result.std_variance, kVarianceDecimals);
    writer.key("ci_95_variance");
    writer.valuePair(result.variance.ci.lo, result.variance.ci.hi, kVarianceDecimals);
    writer.key("mean_range_final_score");
    writer.value(result.range.value, kDecimals);
    writer.key("std_range_final_score");
    writer.value(result.std_range, kDecimals);
    writer.key("ci_95_range");
    writer.valuePair(result.range.ci.lo, result.range.ci.hi, kDecimals);
    writer.endObject();

    writer.key("correlations");
    writer.beginObject();
    writeCorrelation(writer, "r_final_score_cosine_similarity", result.r_final_cosine);
    writeCorrelation(writer, "r_final_score_avoid_penalty", result.r_final_avoid);
    writeCorrelation(writer, "r_cosine_similarity_favorite_overlap", result.r_cosine_favorite);
    writer.endObject();

    writer.endObject();

    writer.key("per_run");
    writer.beginArray();
    for (const auto& run : result.per_run) {
      writer.beginObject();
      writer.key("source_song");
      writer.value(std::string_view(run.source_song));
      writer.key("composer");
      writer.value(std::string_view(run.composer));
      writer.key("n_songs");
      writer.value(run.n_songs);
      writer.key("variance_final_score");
      writer.value(run.variance_final_score, kVarianceDecimals);
      writer.key("range_final_score");
      writer.value(run.range_final_score, kDecimals);
      writer.key("r_final_score_cosine");
      writer.value(run.r_final_cosine, kDecimals);
      writer.key("r_final_score_avoid");
      writer.value(run.r_final_avoid, kDecimals);
      writer.key("r_cosine_favorite_overlap");
      writer.value(run.r_cosine_favorite, kDecimals);
      writer.endObject();
    }
    writer.endArray();
  }

  writer.endObject();
  return writer.toPrettyString();
}

std::string selfRetrievalToTextSummary(const SelfRetrievalResult& result) {
  std::ostringstream oss;
  oss << "=== RQ1 Self-Retrieval Accuracy ===\n";
  if (!result.success) {
    oss << "Error: " << result.error_message << "\n";
    return oss.str();
  }
  const std::pair<const char*, const MetricEstimate*> rows[] = {
      {"HR@1", &result.hr_at_1},
      {"HR@3", &result.hr_at_3},
      {"HR@5", &result.hr_at_5},
      {"MRR ", &result.mrr},
  };
  for (const auto& [name, estimate] : rows) {
    oss << name << ": " << formatDecimal(estimate->value, kDecimals)
        << "  [95% CI: " << formatCI(estimate->ci, kDecimals) << "]\n";
  }
  oss << "Valid queries: " << result.summary.used << " / " << result.summary.total_songs << "\n";
  return oss.str();
}

std::string rankingStabilityToTextSummary(const RankingStabilityResult& result) {
  std::ostringstream oss;
  oss << "=== RQ2 Ranking Stability ===\n";
  if (!result.success) {
    oss << "Error: " << result.error_message << "\n";
    return oss.str();
  }
  oss << "Mean tau: " << formatDecimal(result.mean_tau.value, kDecimals)
      << "  (std: " << formatDecimal(result.std_tau, kDecimals) << ", "
      << agreementBandToString(classifyAgreement(result.mean_tau.value)) << " agreement)\n";
  oss << "95% CI: " << formatCI(result.mean_tau.ci, kDecimals) << "\n";
  for (const auto& baseline : result.baselines) {
    oss << "  " << baseline.source_song << ": " << baseline.n_perturbations
        << " perturbations, mean tau " << formatDecimal(baseline.mean_tau, kDecimals) << "\n";
  }
  oss << "Baselines: " << result.summary.used
      << " | Total perturbations: " << result.total_perturbations << "\n";
  return oss.str();
}

std::string scoreSpreadToTextSummary(const ScoreSpreadResult& result) {
  std::ostringstream oss;
  oss << "=== RQ3 Score Spread and Internal Validity ===\n";
  if (!result.success) {
    oss << "Error: " << result.error_message << "\n";
    return oss.str();
  }
  oss << "Mean variance (final_score): "
      << formatDecimal(result.variance.value, kVarianceDecimals)
      << "  [95% CI: " << formatCI(result.variance.ci, kVarianceDecimals) << "]\n";
  oss << "Mean range (final_score):    " << formatDecimal(result.range.value, kDecimals)
      << "  [95% CI: " << formatCI(result.range.ci, kDecimals) << "]\n";

  const std::pair<const char*, const CorrelationEstimate*> rows[] = {
      {"r(final_score, cosine_sim): ", &result.r_final_cosine},
      {"r(final_score, avoid_pen):  ", &result.r_final_avoid},
      {"r(cosine_sim, fav_overlap): ", &result.r_cosine_favorite},
  };
  for (const auto& [label, corr] : rows) {
    oss << label << formatDecimal(corr->estimate.value, kDecimals)
        << "  [95% CI: " << formatCI(corr->estimate.ci, kDecimals) << "]  (expected: "
        << (corr->expected == ExpectedSign::Positive ? "+" : "-")
        << (corr->matchesExpected() ? ", ok" : ", MISMATCH") << ")\n";
  }
  oss << "Profiles: " << result.summary.used << "\n";
  return oss.str();
}

}  // namespace tessitura
