// File: src/core/token_traits.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace mmq {

/// TokenTraits - How a token type decomposes into constituent elements
///
/// A decomposable token (e.g. a word made of characters) that has more than
/// one element becomes a compound pattern entry with its own nested matcher,
/// so that a misspelled reference word can still partially match it.
///
/// Specializations for decomposable types provide:
/// - static constexpr bool kDecomposable = true
/// - using ElementType = ...
/// - static std::vector<ElementType> Decompose(const Token&)
///
/// Any other type is atomic: it only ever matches by equality.
template<typename Token>
struct TokenTraits {
    static constexpr bool kDecomposable = false;
};

/// Strings decompose into their characters
template<typename CharT, typename CharTraits, typename Allocator>
struct TokenTraits<std::basic_string<CharT, CharTraits, Allocator>> {
    static constexpr bool kDecomposable = true;
    using ElementType = CharT;

    static std::vector<ElementType> Decompose(
        const std::basic_string<CharT, CharTraits, Allocator>& token) {
        return std::vector<ElementType>(token.begin(), token.end());
    }
};

/// Vectors decompose into their elements
template<typename Element, typename Allocator>
struct TokenTraits<std::vector<Element, Allocator>> {
    static constexpr bool kDecomposable = true;
    using ElementType = Element;

    static std::vector<ElementType> Decompose(const std::vector<Element, Allocator>& token) {
        return std::vector<ElementType>(token.begin(), token.end());
    }
};

/// TokenHash - Hash functor used to index distinct pattern tokens
///
/// Defaults to std::hash; vectors are hashed element-wise so that sequence
/// tokens can be indexed too.
template<typename Token>
struct TokenHash {
    size_t operator()(const Token& token) const {
        return std::hash<Token>()(token);
    }
};

template<typename Element, typename Allocator>
struct TokenHash<std::vector<Element, Allocator>> {
    size_t operator()(const std::vector<Element, Allocator>& token) const {
        size_t seed = token.size();
        TokenHash<Element> element_hash;
        for (const auto& element : token) {
            seed ^= element_hash(element) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

} // namespace mmq
