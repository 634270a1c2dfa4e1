// File: src/core/score_combinator.cpp
#include "core/score_combinator.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <sstream>

namespace mmq {

float CombineScores(float new_score, float old_score, int distance) {
    if (!(new_score >= 0.0f && new_score <= 1.0f)) {
        std::ostringstream msg;
        msg << "new_score " << std::fixed << new_score << " must be >= 0.0 and <= 1.0";
        throw MatchError(ErrorCode::INVALID_SCORE, msg.str());
    }
    if (!(old_score >= 0.0f && old_score <= 1.0f)) {
        std::ostringstream msg;
        msg << "old_score " << std::fixed << old_score << " must be >= 0.0 and <= 1.0";
        throw MatchError(ErrorCode::INVALID_SCORE, msg.str());
    }
    if (distance < 0) {
        std::ostringstream msg;
        msg << "distance " << distance << " must be >= 0";
        throw MatchError(ErrorCode::INVALID_DISTANCE, msg.str());
    }

    return std::min(1.0f, new_score + old_score / static_cast<float>(2 + distance));
}

} // namespace mmq
