// File: tests/integration/integration_test.cpp
//
// End-to-end tests: tokenized prose through the matcher, the nested word
// matchers and the command-line front end.

#include "cli/mmq_cli.hpp"
#include "core/matcher.hpp"
#include "text/tokenizer.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace mmq;

// ============================================================================
// Test Utilities
// ============================================================================

/// Two paragraphs of lorem ipsum; "lorem ipsum dolor" opens both
const char* kLoremText =
    "Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod tempor incididunt ut labore et dolore magna aliqua. Pellentesque eu tincidunt tortor aliquam nulla. Justo nec ultrices dui sapien eget mi proin sed. Dictum at tempor commodo ullamcorper a lacus vestibulum sed arcu. Tempor orci dapibus ultrices in iaculis nunc. Nunc id cursus metus aliquam eleifend mi in. Condimentum id venenatis a condimentum. Cras semper auctor neque vitae. Faucibus nisl tincidunt eget nullam non nisi est. Mi eget mauris pharetra et ultrices neque ornare aenean. Bibendum ut tristique et egestas quis ipsum suspendisse ultrices.\n\n"
    "Lorem ipsum dolor sit amet. Diam quis enim lobortis scelerisque fermentum dui faucibus in. Nec ullamcorper sit amet risus. Tristique et egestas quis ipsum. Magna fringilla urna porttitor rhoncus dolor. Arcu cursus vitae congue mauris rhoncus aenean vel. Velit ut tortor pretium viverra suspendisse potenti. Fringilla urna porttitor rhoncus dolor purus non enim praesent. Commodo elit at imperdiet dui. Sollicitudin tempor id eu nisl nunc. Purus ut faucibus pulvinar elementum integer enim neque volutpat. Habitant morbi tristique senectus et netus et malesuada fames. Orci a scelerisque purus semper eget duis at tellus at. Neque convallis a cras semper. Metus aliquam eleifend mi in nulla. Quisque non tellus orci ac auctor augue.";

/// Build a matcher over words tokenized from text
Matcher<std::string> MakeMatcher(const std::string& pattern_text, const MatcherConfig& config) {
    WordTokenizer tokenizer;
    return Matcher<std::string>(tokenizer.Tokenize(pattern_text), config);
}

MatcherConfig MakeConfig(int allowed_differences, float nomatch_multiplier, float threshold) {
    MatcherConfig config;
    config.allowed_differences = allowed_differences;
    config.nomatch_multiplier = nomatch_multiplier;
    config.threshold = threshold;
    return config;
}

void ExpectResults(const std::vector<MatchResult>& expected, const std::vector<MatchResult>& actual) {
    ASSERT_EQ(expected.size(), actual.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(expected[i].position, actual[i].position) << "result " << i;
        EXPECT_NEAR(expected[i].score, actual[i].score, 1e-5f) << "result " << i;
    }
}

class LoremIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        reference_ = WordTokenizer().Tokenize(kLoremText);
        short_reference_ = WordTokenizer().Tokenize("ipsum dolor!");
    }

    std::vector<std::string> reference_;
    std::vector<std::string> short_reference_;
};

// ============================================================================
// Phrase Search
// ============================================================================

TEST_F(LoremIntegrationTest, ReferenceTokenization) {
    ASSERT_EQ(206u, reference_.size());
    EXPECT_EQ("lorem", reference_[0]);
    EXPECT_EQ("lorem", reference_[95]);
    EXPECT_EQ("dolor", reference_[97]);
}

TEST_F(LoremIntegrationTest, ExactMatching) {
    auto matcher = MakeMatcher("Lorem ipsum! Dolor.", MatcherConfig{});
    ExpectResults({{2, 1.0f}, {97, 1.0f}}, matcher.FindIn(reference_));
}

TEST_F(LoremIntegrationTest, MultiplierOnLongReference) {
    auto matcher = MakeMatcher("lorem ipsum dolor", MakeConfig(0, 0.5f, 0.5f));
    ExpectResults({{2, 1.0f}, {97, 1.0f}}, matcher.FindIn(reference_));
}

TEST_F(LoremIntegrationTest, MultiplierOnShortReference) {
    auto matcher = MakeMatcher("lorem ipsum dolor", MakeConfig(0, 0.5f, 0.5f));
    ExpectResults({{1, 0.5f}}, matcher.FindIn(short_reference_));
}

TEST_F(LoremIntegrationTest, OneDifferenceOnLongReference) {
    auto matcher = MakeMatcher("lorem ipsum dolor", MakeConfig(1, 0.0f, 0.5f));
    ExpectResults({{2, 1.0f}, {97, 1.0f}, {1, 0.5f}, {96, 0.5f}}, matcher.FindIn(reference_));
}

TEST_F(LoremIntegrationTest, OneDifferenceOnShortReference) {
    auto matcher = MakeMatcher("lorem ipsum dolor", MakeConfig(1, 0.0f, 0.5f));
    ExpectResults({{1, 0.5f}}, matcher.FindIn(short_reference_));
}

TEST_F(LoremIntegrationTest, BothMechanismsRankPartialMatches) {
    auto matcher = MakeMatcher("lorem ipsum dolor", MakeConfig(1, 0.5f, 0.5f));
    auto results = matcher.FindIn(reference_);

    ASSERT_GE(results.size(), 4u);
    ExpectResults({{2, 1.0f}, {97, 1.0f}, {1, 0.875f}, {96, 0.875f}},
                  std::vector<MatchResult>(results.begin(), results.begin() + 4));
}

TEST_F(LoremIntegrationTest, RepeatedPhrase) {
    auto matcher = MakeMatcher("tristique et egestas", MatcherConfig{});
    ExpectResults({{90, 1.0f}, {116, 1.0f}}, matcher.FindIn(reference_));
}

TEST_F(LoremIntegrationTest, MisspelledPatternWord) {
    auto matcher = MakeMatcher("magna fringila urna", MakeConfig(1, 0.0f, 0.5f));
    ExpectResults({{121, 0.5f}}, matcher.FindIn(reference_));
}

TEST_F(LoremIntegrationTest, MisspelledReferenceWord) {
    auto matcher = MakeMatcher("lorem ipsum dolor", MakeConfig(1, 0.0f, 0.5f));
    auto reference = WordTokenizer().Tokenize("Lorem ipsm dolor sit amet");
    ExpectResults({{2, 0.5f}}, matcher.FindIn(reference));
}

// ============================================================================
// Command Line
// ============================================================================

TEST_F(LoremIntegrationTest, CommandLineReportsBestFirst) {
    std::ostringstream out;
    std::ostringstream err;
    std::istringstream in(kLoremText);

    MmqCli cli(out, err);
    int exit_code = cli.Run({"--no-color", "--allowed-differences", "1", "--threshold", "0.5",
                             "--max-results", "3", "Lorem ipsum dolor"}, in);

    EXPECT_EQ(MmqCli::kExitMatched, exit_code);
    EXPECT_EQ("2\t1.000000\tlorem ipsum dolor\n"
              "97\t1.000000\tlorem ipsum dolor\n"
              "1\t0.500000\tlorem ipsum\n",
              out.str());
}
