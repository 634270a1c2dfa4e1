// File: src/text/tokenizer.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mmq {

// TokenizerMode: How raw text is split into tokens
enum class TokenizerMode : uint8_t {
    WORDS = 0,       // Runs of word characters
    CHARACTERS = 1,  // One token per non-space character
};

// Convert TokenizerMode to string ("words" / "characters")
const char* ToString(TokenizerMode mode);

// Parse TokenizerMode from string
TokenizerMode ParseTokenizerMode(const std::string& str);

/// WordTokenizer - Splits text on runs of non-word characters
///
/// Word characters are ASCII letters, digits and '_'; every other byte is a
/// separator. Bytes >= 0x80 are kept as word characters so UTF-8 words stay
/// intact. Empty pieces are dropped.
class WordTokenizer {
public:
    struct Config {
        /// Lower-case ASCII letters
        bool lowercase{true};
    };

    WordTokenizer();
    explicit WordTokenizer(const Config& config);

    /// Split text into words, in order of appearance
    std::vector<std::string> Tokenize(const std::string& text) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

/// CharacterTokenizer - One token per character, whitespace skipped
class CharacterTokenizer {
public:
    struct Config {
        /// Lower-case ASCII letters
        bool lowercase{true};
    };

    CharacterTokenizer();
    explicit CharacterTokenizer(const Config& config);

    std::vector<char> Tokenize(const std::string& text) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace mmq
