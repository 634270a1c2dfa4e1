// File: src/core/types.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace mmq {

// AlignmentVector: per-pattern-position match quality for one reference token
// Entry k is 1.0 for an exact match with pattern token k, 0.0 for no relation
using AlignmentVector = std::vector<float>;

// TrackerState: one automaton state vector, produced per reference token
using TrackerState = std::vector<float>;

// ErrorCode: Classification of rejected inputs
enum class ErrorCode : uint8_t {
    INVALID_SCORE = 0,       // Score outside [0.0, 1.0]
    INVALID_DISTANCE = 1,    // Negative combinator distance
    INVALID_LENGTH = 2,      // Pattern length <= 0
    EMPTY_PATTERN = 3,       // Pattern token list is empty
    INVALID_TOLERANCE = 4,   // allowed_differences < 0 or >= length
    INVALID_MULTIPLIER = 5,  // nomatch_multiplier outside [0.0, 1.0)
    INVALID_THRESHOLD = 6,   // threshold outside [0.0, 1.0]
    LENGTH_MISMATCH = 7,     // Alignment vector length differs from pattern
};

// Convert ErrorCode to string
const char* ToString(ErrorCode code);

// MatchError: the single exception type thrown by the matching core
class MatchError : public std::invalid_argument {
public:
    MatchError(ErrorCode code, const std::string& message)
        : std::invalid_argument(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// MatchResult: a candidate end position and its confidence
struct MatchResult {
    size_t position{0};   // Zero-based index of the last matched reference token
    float score{0.0f};    // Confidence in [0.0, 1.0]

    MatchResult() = default;
    MatchResult(size_t position_, float score_) : position(position_), score(score_) {}

    bool operator==(const MatchResult& other) const {
        return position == other.position && score == other.score;
    }
    bool operator!=(const MatchResult& other) const { return !(*this == other); }

    // String conversion for debugging, e.g. "(2, 1.000000)"
    std::string ToString() const;
};

/// MatcherConfig - Fuzziness settings shared by a matcher, its pattern index,
/// every nested sub-matcher and each tracker it creates.
///
/// There are two independent ways to tolerate differences:
/// - allowed_differences: number of pattern items that may be missing or
///   different; a single miss scores 1/2, two misses 1/3 and so on
/// - nomatch_multiplier: each hard mismatch multiplies the running
///   confidence by this value instead of zeroing it
///
/// Scores are meant for ranking candidates, not as a calibrated distance.
struct MatcherConfig {
    /// Number of trailing or skippable pattern positions tolerated
    int allowed_differences{0};

    /// Decay applied on a hard mismatch, in [0.0, 1.0)
    float nomatch_multiplier{0.0f};

    /// Minimum confidence reported, in [0.0, 1.0]
    float threshold{1.0f};

    /// Validate against a pattern length
    /// @param pattern_length Number of tokens in the pattern
    /// @throws MatchError naming the first violated constraint
    void Validate(long long pattern_length) const;

    /// Validate the parts that do not depend on a pattern length
    /// @throws MatchError naming the first violated constraint
    void ValidateRanges() const;

    /// Collect every violated constraint without throwing
    /// @param pattern_length Number of tokens in the pattern
    /// @return Human-readable messages, empty if valid
    std::vector<std::string> GetValidationErrors(long long pattern_length) const;

    /// Same settings with allowed_differences clamped for a shorter pattern
    /// @param pattern_length Length of the nested pattern (>= 1)
    MatcherConfig ForNestedPattern(size_t pattern_length) const;

    /// Filler used to seed the very first tracker state
    float InitialFiller() const;

    std::string ToString() const;
};

} // namespace mmq
