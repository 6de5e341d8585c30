// Dense pitch-distribution vectors and their normalizations.

#ifndef TESSITURA_RECOMMEND_VECTOR_SPACE_H
#define TESSITURA_RECOMMEND_VECTOR_SPACE_H

#include <vector>

#include "core/basic_types.h"

namespace tessitura {

/// @brief Dense vector over a pitch range.
///
/// Index i holds the weight of MIDI pitch (range_min + i); length is
/// range_max - range_min + 1.
using DenseVector = std::vector<double>;

/// @brief Project a sparse tessituragram onto a dense vector.
///
/// Pitches outside [min_midi, max_midi] are dropped silently; positions with
/// no entry are 0. No validation of durations is done here.
///
/// @param tessituragram Sparse pitch -> duration map.
/// @param min_midi Lowest pitch of the vector.
/// @param max_midi Highest pitch of the vector (>= min_midi).
/// @return Dense vector of length max_midi - min_midi + 1.
DenseVector buildDenseVector(const Tessituragram& tessituragram, MidiPitch min_midi,
                             MidiPitch max_midi);

/// @brief Sum of all elements.
double vectorSum(const DenseVector& vec);

/// @brief Euclidean norm.
double l2Norm(const DenseVector& vec);

/// @brief Dot product over the common prefix of two vectors.
double dotProduct(const DenseVector& lhs, const DenseVector& rhs);

/// @brief Scale to unit sum (proportion of singing time).
/// A zero-sum vector is returned unchanged.
DenseVector normalizeL1(const DenseVector& vec);

/// @brief Scale to unit Euclidean length.
/// A zero vector is returned unchanged.
DenseVector normalizeL2(const DenseVector& vec);

/// @brief Cosine similarity; 0 if either vector has zero norm.
///
/// For non-negative inputs the result lies in [0, 1].
double cosineSimilarity(const DenseVector& lhs, const DenseVector& rhs);

/// @brief Sum the weights at the given pitches.
///
/// Pitches outside the vector's range are ignored; a pitch listed twice is
/// counted twice.
///
/// @param vec Dense vector starting at min_midi.
/// @param min_midi Pitch of index 0.
/// @param pitches Pitches to sum.
double sumAtPitches(const DenseVector& vec, MidiPitch min_midi,
                    const std::vector<MidiPitch>& pitches);

}  // namespace tessitura

#endif  // TESSITURA_RECOMMEND_VECTOR_SPACE_H
