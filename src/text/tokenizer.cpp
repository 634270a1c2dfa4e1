// File: src/text/tokenizer.cpp
#include "text/tokenizer.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>

namespace mmq {

namespace {

bool IsWordByte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

char Lower(char c, bool lowercase) {
    if (!lowercase) {
        return c;
    }
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // anonymous namespace

const char* ToString(TokenizerMode mode) {
    switch (mode) {
        case TokenizerMode::WORDS: return "words";
        case TokenizerMode::CHARACTERS: return "characters";
        default: return "unknown";
    }
}

TokenizerMode ParseTokenizerMode(const std::string& str) {
    if (str == "words" || str == "WORDS") return TokenizerMode::WORDS;
    if (str == "characters" || str == "CHARACTERS" || str == "chars") return TokenizerMode::CHARACTERS;
    throw std::invalid_argument("Unknown TokenizerMode: " + str);
}

// ============================================================================
// WordTokenizer
// ============================================================================

WordTokenizer::WordTokenizer()
    : WordTokenizer(Config())
{
}

WordTokenizer::WordTokenizer(const Config& config)
    : config_(config)
{
}

std::vector<std::string> WordTokenizer::Tokenize(const std::string& text) const {
    std::vector<std::string> words;
    std::string current;

    for (char c : text) {
        if (IsWordByte(static_cast<unsigned char>(c))) {
            current.push_back(Lower(c, config_.lowercase));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }

    if (!current.empty()) {
        words.push_back(std::move(current));
    }

    return words;
}

// ============================================================================
// CharacterTokenizer
// ============================================================================

CharacterTokenizer::CharacterTokenizer()
    : CharacterTokenizer(Config())
{
}

CharacterTokenizer::CharacterTokenizer(const Config& config)
    : config_(config)
{
}

std::vector<char> CharacterTokenizer::Tokenize(const std::string& text) const {
    std::vector<char> characters;
    characters.reserve(text.size());

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        characters.push_back(Lower(c, config_.lowercase));
    }

    return characters;
}

} // namespace mmq
