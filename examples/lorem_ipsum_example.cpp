// File: examples/lorem_ipsum_example.cpp
//
// Approximate phrase search in a lorem ipsum text.
// Demonstrates:
// - Exact matching with the default configuration
// - Decay-based tolerance (nomatch_multiplier)
// - Count-based tolerance (allowed_differences)
// - Fuzzy word matching through nested character matchers

#include "core/matcher.hpp"
#include "text/tokenizer.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace mmq;

namespace {

const char* kReferenceText = R"(Lorem ipsum dolor sit amet, consectetur adipiscing elit, sed do eiusmod tempor incididunt ut labore et dolore magna aliqua. Pellentesque eu tincidunt tortor aliquam nulla. Justo nec ultrices dui sapien eget mi proin sed. Dictum at tempor commodo ullamcorper a lacus vestibulum sed arcu. Tempor orci dapibus ultrices in iaculis nunc. Nunc id cursus metus aliquam eleifend mi in. Condimentum id venenatis a condimentum. Cras semper auctor neque vitae. Faucibus nisl tincidunt eget nullam non nisi est. Mi eget mauris pharetra et ultrices neque ornare aenean. Bibendum ut tristique et egestas quis ipsum suspendisse ultrices.

Lorem ipsum dolor sit amet. Diam quis enim lobortis scelerisque fermentum dui faucibus in. Nec ullamcorper sit amet risus. Tristique et egestas quis ipsum. Magna fringilla urna porttitor rhoncus dolor. Arcu cursus vitae congue mauris rhoncus aenean vel. Velit ut tortor pretium viverra suspendisse potenti. Fringilla urna porttitor rhoncus dolor purus non enim praesent. Commodo elit at imperdiet dui. Sollicitudin tempor id eu nisl nunc. Purus ut faucibus pulvinar elementum integer enim neque volutpat. Habitant morbi tristique senectus et netus et malesuada fames. Orci a scelerisque purus semper eget duis at tellus at. Neque convallis a cras semper. Metus aliquam eleifend mi in nulla. Quisque non tellus orci ac auctor augue.

Id aliquet lectus proin nibh nisl. Aenean sed adipiscing diam donec adipiscing tristique risus nec. Quam quisque id diam vel quam elementum pulvinar etiam. Faucibus vitae aliquet nec ullamcorper sit amet risus. Non quam lacus suspendisse faucibus. Vestibulum lorem sed risus ultricies tristique nulla aliquet enim tortor. Eu tincidunt tortor aliquam nulla facilisi.)";

void PrintResults(const std::vector<MatchResult>& results) {
    if (results.empty()) {
        std::cout << "  (no results)\n";
        return;
    }
    for (const auto& result : results) {
        std::cout << "  position " << std::setw(4) << result.position
                  << "  score " << std::fixed << std::setprecision(3) << result.score << "\n";
    }
}

void RunCase(const std::string& title,
             const std::vector<std::string>& pattern,
             const std::vector<std::string>& reference,
             const MatcherConfig& config) {
    std::cout << title << "\n";
    std::cout << "  " << config.ToString() << "\n";

    Matcher<std::string> matcher(pattern, config);
    PrintResults(matcher.FindIn(reference));
    std::cout << "\n";
}

} // anonymous namespace

int main() {
    std::cout << "=== Approximate Phrase Search Example ===\n\n";

    WordTokenizer tokenizer;
    auto pattern = tokenizer.Tokenize("Lorem ipsum! Dolor.");
    auto reference = tokenizer.Tokenize(kReferenceText);
    auto short_reference = tokenizer.Tokenize("ipsum dolor!");
    auto misspelled = tokenizer.Tokenize("lorem ipsm dolor");

    std::cout << "Pattern: " << pattern.size() << " words, reference: "
              << reference.size() << " words\n\n";

    MatcherConfig exact;

    MatcherConfig decay;
    decay.nomatch_multiplier = 0.5f;
    decay.threshold = 0.5f;

    MatcherConfig tolerant;
    tolerant.allowed_differences = 1;
    tolerant.threshold = 0.5f;

    RunCase("Case 1: exact matching in long reference", pattern, reference, exact);
    RunCase("Case 2: multiplier 0.5, long reference", pattern, reference, decay);
    RunCase("Case 3: multiplier 0.5, short reference", pattern, short_reference, decay);
    RunCase("Case 4: one allowed difference, long reference", pattern, reference, tolerant);
    RunCase("Case 5: one allowed difference, short reference", pattern, short_reference, tolerant);
    RunCase("Case 6: one allowed difference, misspelled word", pattern, misspelled, tolerant);

    return 0;
}
