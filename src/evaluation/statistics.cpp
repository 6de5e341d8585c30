// Statistics implementation.

#include "evaluation/statistics.h"

#include <algorithm>
#include <cmath>

#include "core/rng_util.h"

namespace tessitura {

namespace {

/// @brief Sign of a difference as -1, 0 or +1.
int signOf(double diff) {
  if (diff > 0.0) return 1;
  if (diff < 0.0) return -1;
  return 0;
}

}  // namespace

double mean(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  double sum = 0.0;
  for (double val : values) sum += val;
  return sum / static_cast<double>(values.size());
}

double variance(const std::vector<double>& values, int ddof) {
  if (ddof < 0 || values.size() <= static_cast<size_t>(ddof)) return 0.0;
  double avg = mean(values);
  double sum_sq = 0.0;
  for (double val : values) {
    double diff = val - avg;
    sum_sq += diff * diff;
  }
  return sum_sq / static_cast<double>(values.size() - static_cast<size_t>(ddof));
}

double standardDeviation(const std::vector<double>& values, int ddof) {
  return std::sqrt(variance(values, ddof));
}

double valueRange(const std::vector<double>& values) {
  if (values.empty()) return 0.0;
  auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
  return *max_it - *min_it;
}

double percentile(const std::vector<double>& values, double pct) {
  if (values.empty()) return 0.0;
  std::vector<double> sorted = values;
  std::sort(sorted.begin(), sorted.end());

  double clamped = std::clamp(pct, 0.0, 100.0);
  double position = clamped / 100.0 * static_cast<double>(sorted.size() - 1);
  auto lower = static_cast<size_t>(std::floor(position));
  size_t upper = std::min(lower + 1, sorted.size() - 1);
  double fraction = position - static_cast<double>(lower);
  // Equal neighbours must return the value itself, not a rounded blend.
  if (sorted[lower] == sorted[upper]) return sorted[lower];
  return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

double pearsonCorrelation(const std::vector<double>& xs, const std::vector<double>& ys) {
  if (xs.size() != ys.size() || xs.size() < 2) return 0.0;
  if (valueRange(xs) <= kDegenerateSpread || valueRange(ys) <= kDegenerateSpread) return 0.0;

  double mean_x = mean(xs);
  double mean_y = mean(ys);
  double numerator = 0.0;
  double denom_x = 0.0;
  double denom_y = 0.0;
  for (size_t idx = 0; idx < xs.size(); ++idx) {
    double diff_x = xs[idx] - mean_x;
    double diff_y = ys[idx] - mean_y;
    numerator += diff_x * diff_y;
    denom_x += diff_x * diff_x;
    denom_y += diff_y * diff_y;
  }
  if (denom_x == 0.0 || denom_y == 0.0) return 0.0;
  double r_val = numerator / std::sqrt(denom_x * denom_y);
  return std::clamp(r_val, -1.0, 1.0);
}

double kendallTauB(const std::vector<double>& xs, const std::vector<double>& ys) {
  if (xs.size() != ys.size() || xs.size() < 2) return 0.0;

  // tau_b = (nc - nd) / sqrt(pairs untied in x * pairs untied in y).
  long long concordant_minus_discordant = 0;
  long long untied_x = 0;
  long long untied_y = 0;
  for (size_t idx = 0; idx + 1 < xs.size(); ++idx) {
    for (size_t jdx = idx + 1; jdx < xs.size(); ++jdx) {
      int sign_x = signOf(xs[idx] - xs[jdx]);
      int sign_y = signOf(ys[idx] - ys[jdx]);
      if (sign_x != 0) ++untied_x;
      if (sign_y != 0) ++untied_y;
      concordant_minus_discordant += sign_x * sign_y;
    }
  }

  if (untied_x == 0 || untied_y == 0) return 0.0;
  double denom = std::sqrt(static_cast<double>(untied_x) * static_cast<double>(untied_y));
  double tau = static_cast<double>(concordant_minus_discordant) / denom;
  return std::clamp(tau, -1.0, 1.0);
}

ConfidenceInterval bootstrapMeanCI(const std::vector<double>& values, std::mt19937& rng,
                                   size_t samples) {
  ConfidenceInterval interval;
  if (values.empty() || samples == 0) return interval;

  // A resample mean cannot leave [min, max]; clamping removes summation drift
  // so a constant list collapses to exactly its value.
  auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
  std::vector<double> resample_means;
  resample_means.reserve(samples);
  for (size_t sample = 0; sample < samples; ++sample) {
    resample_means.push_back(std::clamp(rng::resampleMean(rng, values), *min_it, *max_it));
  }
  interval.lo = percentile(resample_means, 2.5);
  interval.hi = percentile(resample_means, 97.5);
  return interval;
}

}  // namespace tessitura
