// Dense vector construction and normalization.

#include "recommend/vector_space.h"

#include <algorithm>
#include <cmath>

namespace tessitura {

DenseVector buildDenseVector(const Tessituragram& tessituragram, MidiPitch min_midi,
                             MidiPitch max_midi) {
  int length = max_midi - min_midi + 1;
  if (length <= 0) return {};

  DenseVector vec(static_cast<size_t>(length), 0.0);
  for (const auto& [pitch, duration] : tessituragram) {
    int idx = pitch - min_midi;
    if (idx >= 0 && idx < length) {
      vec[static_cast<size_t>(idx)] = duration;
    }
  }
  return vec;
}

double vectorSum(const DenseVector& vec) {
  double total = 0.0;
  for (double val : vec) total += val;
  return total;
}

double l2Norm(const DenseVector& vec) {
  double sum_sq = 0.0;
  for (double val : vec) sum_sq += val * val;
  return std::sqrt(sum_sq);
}

double dotProduct(const DenseVector& lhs, const DenseVector& rhs) {
  size_t count = std::min(lhs.size(), rhs.size());
  double result = 0.0;
  for (size_t idx = 0; idx < count; ++idx) {
    result += lhs[idx] * rhs[idx];
  }
  return result;
}

DenseVector normalizeL1(const DenseVector& vec) {
  double total = vectorSum(vec);
  if (total == 0.0) return vec;
  DenseVector result(vec.size());
  for (size_t idx = 0; idx < vec.size(); ++idx) {
    result[idx] = vec[idx] / total;
  }
  return result;
}

DenseVector normalizeL2(const DenseVector& vec) {
  double norm = l2Norm(vec);
  if (norm == 0.0) return vec;
  DenseVector result(vec.size());
  for (size_t idx = 0; idx < vec.size(); ++idx) {
    result[idx] = vec[idx] / norm;
  }
  return result;
}

double cosineSimilarity(const DenseVector& lhs, const DenseVector& rhs) {
  double norm_lhs = l2Norm(lhs);
  double norm_rhs = l2Norm(rhs);
  if (norm_lhs == 0.0 || norm_rhs == 0.0) return 0.0;
  // Rounding can push parallel vectors a hair past 1.
  return std::clamp(dotProduct(lhs, rhs) / (norm_lhs * norm_rhs), -1.0, 1.0);
}

double sumAtPitches(const DenseVector& vec, MidiPitch min_midi,
                    const std::vector<MidiPitch>& pitches) {
  double total = 0.0;
  for (MidiPitch pitch : pitches) {
    int idx = pitch - min_midi;
    if (idx >= 0 && static_cast<size_t>(idx) < vec.size()) {
      total += vec[static_cast<size_t>(idx)];
    }
  }
  return total;
}

}  // namespace tessitura
