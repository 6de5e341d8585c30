// Descriptive statistics, rank/linear correlation and bootstrap intervals.

#ifndef TESSITURA_EVALUATION_STATISTICS_H
#define TESSITURA_EVALUATION_STATISTICS_H

#include <cstddef>
#include <random>
#include <vector>

namespace tessitura {

/// Spreads at or below this are treated as zero (correlation undefined).
constexpr double kDegenerateSpread = 1e-9;

/// Default number of bootstrap resamples.
constexpr size_t kDefaultBootstrapSamples = 10000;

/// Closed confidence interval [lo, hi].
struct ConfidenceInterval {
  double lo = 0.0;
  double hi = 0.0;
};

/// @brief Arithmetic mean; 0 for an empty list.
double mean(const std::vector<double>& values);

/// @brief Variance with (n - ddof) denominator; 0 when n <= ddof.
/// @param values Observations.
/// @param ddof Delta degrees of freedom (0 population, 1 sample).
double variance(const std::vector<double>& values, int ddof = 1);

/// @brief Standard deviation with (n - ddof) denominator; 0 when n <= ddof.
double standardDeviation(const std::vector<double>& values, int ddof = 1);

/// @brief Max minus min; 0 for an empty list.
double valueRange(const std::vector<double>& values);

/// @brief Percentile by linear interpolation between closest ranks.
/// @param values Observations (any order, not modified).
/// @param pct Percentile in [0, 100].
/// @return Interpolated value; 0 for an empty list.
double percentile(const std::vector<double>& values, double pct);

/// @brief Pearson product-moment correlation.
///
/// Returns 0.0 (never NaN) when the lists differ in length, have fewer than
/// two observations, or either list spreads by at most kDegenerateSpread.
double pearsonCorrelation(const std::vector<double>& xs, const std::vector<double>& ys);

/// @brief Kendall's tau-b rank correlation (tie-corrected).
///
/// O(n^2) pair count; n is a candidate-set size. Returns 0.0 when the lists
/// differ in length, have fewer than two observations, or one list is
/// entirely tied.
double kendallTauB(const std::vector<double>& xs, const std::vector<double>& ys);

/// @brief 95% percentile bootstrap CI of the mean.
///
/// Draws `samples` resamples with replacement (each of the input's size)
/// from `rng`, takes each resample's mean and returns the 2.5th and 97.5th
/// percentiles of those means. Consumes exactly samples * values.size()
/// draws, so sequential calls on one generator are reproducible.
///
/// @param values Observations. Empty input returns {0, 0} without drawing.
/// @param rng Generator owned by the caller.
/// @param samples Number of resamples (0 returns {0, 0}).
ConfidenceInterval bootstrapMeanCI(const std::vector<double>& values, std::mt19937& rng,
                                   size_t samples = kDefaultBootstrapSamples);

}  // namespace tessitura

#endif  // TESSITURA_EVALUATION_STATISTICS_H
