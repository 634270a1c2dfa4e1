// File: src/core/types.cpp
#include "core/types.hpp"
#include <algorithm>
#include <sstream>

namespace mmq {

// Enum implementations

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_SCORE: return "INVALID_SCORE";
        case ErrorCode::INVALID_DISTANCE: return "INVALID_DISTANCE";
        case ErrorCode::INVALID_LENGTH: return "INVALID_LENGTH";
        case ErrorCode::EMPTY_PATTERN: return "EMPTY_PATTERN";
        case ErrorCode::INVALID_TOLERANCE: return "INVALID_TOLERANCE";
        case ErrorCode::INVALID_MULTIPLIER: return "INVALID_MULTIPLIER";
        case ErrorCode::INVALID_THRESHOLD: return "INVALID_THRESHOLD";
        case ErrorCode::LENGTH_MISMATCH: return "LENGTH_MISMATCH";
        default: return "UNKNOWN";
    }
}

// MatchResult implementations

std::string MatchResult::ToString() const {
    std::ostringstream oss;
    oss << "(" << position << ", " << std::fixed << score << ")";
    return oss.str();
}

// MatcherConfig implementations

void MatcherConfig::Validate(long long pattern_length) const {
    if (pattern_length <= 0) {
        std::ostringstream msg;
        msg << "length " << pattern_length << " must be > 0";
        throw MatchError(ErrorCode::INVALID_LENGTH, msg.str());
    }
    if (allowed_differences >= pattern_length) {
        std::ostringstream msg;
        msg << "allowed_differences " << allowed_differences
            << " must be < length " << pattern_length;
        throw MatchError(ErrorCode::INVALID_TOLERANCE, msg.str());
    }
    ValidateRanges();
}

void MatcherConfig::ValidateRanges() const {
    if (allowed_differences < 0) {
        std::ostringstream msg;
        msg << "allowed_differences " << allowed_differences << " must be >= 0";
        throw MatchError(ErrorCode::INVALID_TOLERANCE, msg.str());
    }
    if (!(nomatch_multiplier >= 0.0f && nomatch_multiplier < 1.0f)) {
        std::ostringstream msg;
        msg << "nomatch_multiplier " << std::fixed << nomatch_multiplier
            << " must be >= 0 and < 1.0";
        throw MatchError(ErrorCode::INVALID_MULTIPLIER, msg.str());
    }
    if (!(threshold >= 0.0f && threshold <= 1.0f)) {
        std::ostringstream msg;
        msg << "threshold " << std::fixed << threshold << " must be >= 0 and <= 1.0";
        throw MatchError(ErrorCode::INVALID_THRESHOLD, msg.str());
    }
}

std::vector<std::string> MatcherConfig::GetValidationErrors(long long pattern_length) const {
    std::vector<std::string> errors;

    if (pattern_length <= 0) {
        errors.push_back("pattern length must be greater than 0");
    }
    if (allowed_differences < 0) {
        errors.push_back("allowed_differences must be >= 0");
    } else if (pattern_length > 0 && allowed_differences >= pattern_length) {
        errors.push_back("allowed_differences must be less than the pattern length");
    }
    if (!(nomatch_multiplier >= 0.0f && nomatch_multiplier < 1.0f)) {
        errors.push_back("nomatch_multiplier must be >= 0.0 and < 1.0");
    }
    if (!(threshold >= 0.0f && threshold <= 1.0f)) {
        errors.push_back("threshold must be between 0.0 and 1.0");
    }

    return errors;
}

MatcherConfig MatcherConfig::ForNestedPattern(size_t pattern_length) const {
    MatcherConfig nested = *this;
    if (pattern_length > 0) {
        long long max_allowed = static_cast<long long>(pattern_length) - 1;
        nested.allowed_differences = static_cast<int>(
            std::min<long long>(allowed_differences, max_allowed));
    }
    return nested;
}

float MatcherConfig::InitialFiller() const {
    if (nomatch_multiplier > 0.0f) {
        return nomatch_multiplier;
    }
    if (allowed_differences > 0) {
        return 1.0f / static_cast<float>(allowed_differences + 1);
    }
    return 0.0f;
}

std::string MatcherConfig::ToString() const {
    std::ostringstream oss;
    oss << "MatcherConfig(allowed_differences=" << allowed_differences
        << ", nomatch_multiplier=" << nomatch_multiplier
        << ", threshold=" << threshold << ")";
    return oss.str();
}

} // namespace mmq
