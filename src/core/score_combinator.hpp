// File: src/core/score_combinator.hpp
#pragma once

namespace mmq {

/// Logical 'or' over graded scores.
///
/// Adds an older, partial hypothesis to the current confidence. The older
/// score is weighted down by how far back it originates:
/// - distance 0: divided by 2
/// - distance 1: divided by 3
/// - distance 2: divided by 4
///
/// so the tolerance loop index can be passed directly as distance.
///
/// @param new_score The full match score, in [0.0, 1.0]
/// @param old_score A previous or partial score, in [0.0, 1.0]
/// @param distance Tolerance steps between the two scores (>= 0)
/// @return min(1.0, new_score + old_score / (2 + distance))
/// @throws MatchError INVALID_SCORE or INVALID_DISTANCE
float CombineScores(float new_score, float old_score, int distance);

} // namespace mmq
