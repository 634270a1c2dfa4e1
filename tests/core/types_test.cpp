// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>

namespace mmq {
namespace {

// ============================================================================
// ErrorCode / MatchError
// ============================================================================

TEST(ErrorCodeTest, ToStringNamesEveryCode) {
    EXPECT_STREQ("INVALID_SCORE", ToString(ErrorCode::INVALID_SCORE));
    EXPECT_STREQ("INVALID_DISTANCE", ToString(ErrorCode::INVALID_DISTANCE));
    EXPECT_STREQ("INVALID_LENGTH", ToString(ErrorCode::INVALID_LENGTH));
    EXPECT_STREQ("EMPTY_PATTERN", ToString(ErrorCode::EMPTY_PATTERN));
    EXPECT_STREQ("INVALID_TOLERANCE", ToString(ErrorCode::INVALID_TOLERANCE));
    EXPECT_STREQ("INVALID_MULTIPLIER", ToString(ErrorCode::INVALID_MULTIPLIER));
    EXPECT_STREQ("INVALID_THRESHOLD", ToString(ErrorCode::INVALID_THRESHOLD));
    EXPECT_STREQ("LENGTH_MISMATCH", ToString(ErrorCode::LENGTH_MISMATCH));
}

TEST(MatchErrorTest, CarriesCodeAndMessage) {
    MatchError error(ErrorCode::INVALID_TOLERANCE, "too many differences");

    EXPECT_EQ(ErrorCode::INVALID_TOLERANCE, error.code());
    EXPECT_STREQ("too many differences", error.what());
}

TEST(MatchErrorTest, IsAnInvalidArgument) {
    try {
        throw MatchError(ErrorCode::INVALID_SCORE, "bad score");
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ("bad score", e.what());
        return;
    }
    FAIL() << "MatchError not caught as std::invalid_argument";
}

// ============================================================================
// MatchResult
// ============================================================================

TEST(MatchResultTest, DefaultIsZero) {
    MatchResult result;
    EXPECT_EQ(0u, result.position);
    EXPECT_FLOAT_EQ(0.0f, result.score);
}

TEST(MatchResultTest, Equality) {
    EXPECT_EQ(MatchResult(2, 1.0f), MatchResult(2, 1.0f));
    EXPECT_NE(MatchResult(2, 1.0f), MatchResult(3, 1.0f));
    EXPECT_NE(MatchResult(2, 1.0f), MatchResult(2, 0.5f));
}

TEST(MatchResultTest, ToString) {
    EXPECT_EQ("(2, 1.000000)", MatchResult(2, 1.0f).ToString());
    EXPECT_EQ("(17, 0.500000)", MatchResult(17, 0.5f).ToString());
}

// ============================================================================
// MatcherConfig
// ============================================================================

TEST(MatcherConfigTest, Defaults) {
    MatcherConfig config;
    EXPECT_EQ(0, config.allowed_differences);
    EXPECT_FLOAT_EQ(0.0f, config.nomatch_multiplier);
    EXPECT_FLOAT_EQ(1.0f, config.threshold);
    EXPECT_NO_THROW(config.Validate(1));
}

TEST(MatcherConfigTest, RejectsNonPositiveLength) {
    MatcherConfig config;
    try {
        config.Validate(0);
        FAIL() << "Expected MatchError";
    } catch (const MatchError& e) {
        EXPECT_EQ(ErrorCode::INVALID_LENGTH, e.code());
    }

    try {
        config.Validate(-3);
        FAIL() << "Expected MatchError";
    } catch (const MatchError& e) {
        EXPECT_EQ(ErrorCode::INVALID_LENGTH, e.code());
    }
}

TEST(MatcherConfigTest, ToleranceMustBeBelowLength) {
    MatcherConfig config;
    config.allowed_differences = 3;

    EXPECT_NO_THROW(config.Validate(4));

    try {
        config.Validate(3);
        FAIL() << "Expected MatchError";
    } catch (const MatchError& e) {
        EXPECT_EQ(ErrorCode::INVALID_TOLERANCE, e.code());
        EXPECT_EQ("allowed_differences 3 must be < length 3", std::string(e.what()));
    }
}

TEST(MatcherConfigTest, RejectsNegativeTolerance) {
    MatcherConfig config;
    config.allowed_differences = -1;

    try {
        config.Validate(3);
        FAIL() << "Expected MatchError";
    } catch (const MatchError& e) {
        EXPECT_EQ(ErrorCode::INVALID_TOLERANCE, e.code());
    }
}

TEST(MatcherConfigTest, MultiplierRange) {
    MatcherConfig config;

    config.nomatch_multiplier = 0.99f;
    EXPECT_NO_THROW(config.ValidateRanges());

    config.nomatch_multiplier = 1.0f;
    try {
        config.ValidateRanges();
        FAIL() << "Expected MatchError";
    } catch (const MatchError& e) {
        EXPECT_EQ(ErrorCode::INVALID_MULTIPLIER, e.code());
    }

    config.nomatch_multiplier = -0.1f;
    try {
        config.ValidateRanges();
        FAIL() << "Expected MatchError";
    } catch (const MatchError& e) {
        EXPECT_EQ(ErrorCode::INVALID_MULTIPLIER, e.code());
    }

    config.nomatch_multiplier = std::numeric_limits<float>::quiet_NaN();
    try {
        config.ValidateRanges();
        FAIL() << "Expected MatchError";
    } catch (const MatchError& e) {
        EXPECT_EQ(ErrorCode::INVALID_MULTIPLIER, e.code());
    }
}

TEST(MatcherConfigTest, ThresholdRange) {
    MatcherConfig config;

    config.threshold = 0.0f;
    EXPECT_NO_THROW(config.ValidateRanges());
    config.threshold = 1.0f;
    EXPECT_NO_THROW(config.ValidateRanges());

    config.threshold = 1.5f;
    try {
        config.ValidateRanges();
        FAIL() << "Expected MatchError";
    } catch (const MatchError& e) {
        EXPECT_EQ(ErrorCode::INVALID_THRESHOLD, e.code());
    }

    config.threshold = std::numeric_limits<float>::quiet_NaN();
    try {
        config.ValidateRanges();
        FAIL() << "Expected MatchError";
    } catch (const MatchError& e) {
        EXPECT_EQ(ErrorCode::INVALID_THRESHOLD, e.code());
    }
}

TEST(MatcherConfigTest, ValidationErrorsCollectEverything) {
    MatcherConfig config;
    config.allowed_differences = 5;
    config.nomatch_multiplier = 2.0f;
    config.threshold = -1.0f;

    auto errors = config.GetValidationErrors(3);
    EXPECT_EQ(3u, errors.size());

    MatcherConfig valid;
    EXPECT_TRUE(valid.GetValidationErrors(3).empty());

    MatcherConfig not_a_number;
    not_a_number.nomatch_multiplier = std::numeric_limits<float>::quiet_NaN();
    not_a_number.threshold = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(2u, not_a_number.GetValidationErrors(3).size());
}

TEST(MatcherConfigTest, ForNestedPatternClampsTolerance) {
    MatcherConfig config;
    config.allowed_differences = 3;
    config.nomatch_multiplier = 0.25f;
    config.threshold = 0.5f;

    MatcherConfig nested = config.ForNestedPattern(2);
    EXPECT_EQ(1, nested.allowed_differences);
    EXPECT_FLOAT_EQ(0.25f, nested.nomatch_multiplier);
    EXPECT_FLOAT_EQ(0.5f, nested.threshold);
    EXPECT_NO_THROW(nested.Validate(2));

    // Long enough nested patterns keep the tolerance unchanged
    EXPECT_EQ(3, config.ForNestedPattern(5).allowed_differences);
}

TEST(MatcherConfigTest, InitialFiller) {
    MatcherConfig config;
    EXPECT_FLOAT_EQ(0.0f, config.InitialFiller());

    config.allowed_differences = 1;
    EXPECT_FLOAT_EQ(0.5f, config.InitialFiller());

    config.allowed_differences = 3;
    EXPECT_FLOAT_EQ(0.25f, config.InitialFiller());

    // The multiplier takes precedence when set
    config.nomatch_multiplier = 0.1f;
    EXPECT_FLOAT_EQ(0.1f, config.InitialFiller());
}

TEST(MatcherConfigTest, ToString) {
    MatcherConfig config;
    config.allowed_differences = 1;

    std::string text = config.ToString();
    EXPECT_NE(std::string::npos, text.find("allowed_differences=1"));
    EXPECT_NE(std::string::npos, text.find("threshold=1"));
}

} // namespace
} // namespace mmq
