// File: src/core/pattern_index.hpp
#pragma once

#include "core/diagnostics.hpp"
#include "core/token_traits.hpp"
#include "core/types.hpp"
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mmq {

template<typename Token>
class Matcher;

namespace detail {

// Placeholder nested matcher type for atomic tokens; never instantiated
struct NoSubMatcher {};

template<typename Token, bool Decomposable = TokenTraits<Token>::kDecomposable>
struct SubMatcherOf {
    using type = NoSubMatcher;
};

template<typename Token>
struct SubMatcherOf<Token, true> {
    using type = Matcher<typename TokenTraits<Token>::ElementType>;
};

} // namespace detail

/// PatternIndex - Occurrence vectors for every distinct pattern token
///
/// Built once from the pattern and read-only afterwards. Each distinct token
/// owns a one-hot occurrence vector of length L marking every position it
/// occupies in the pattern. Compound tokens (decomposable, more than one
/// element) additionally own a nested Matcher over their elements, which is
/// used to give partial credit to reference tokens that are not an exact hit.
///
/// Nested tokens are strictly shorter than their parent and single elements
/// are never compound, so the recursion terminates.
///
/// Thread-safety: Query() is const and safe to call concurrently.
///
/// @tparam Token Equality-comparable, hashable token type
template<typename Token>
class PatternIndex {
public:
    using Traits = TokenTraits<Token>;
    using SubMatcher = typename detail::SubMatcherOf<Token>::type;

    /// Leaf entry: matches by equality only
    struct SimpleEntry {
        Token token;
        AlignmentVector occurrences;
    };

    /// Entry with a nested matcher over the token's elements
    struct CompoundEntry {
        Token token;
        AlignmentVector occurrences;
        std::unique_ptr<const SubMatcher> matcher;
    };

    using Entry = std::variant<SimpleEntry, CompoundEntry>;

    /// Build the index
    /// @param pattern Pattern tokens (non-empty, validated by the owner)
    /// @param config Settings forwarded to nested matchers
    /// @param sink Diagnostics receiver; null selects the no-op sink
    PatternIndex(const std::vector<Token>& pattern,
                 const MatcherConfig& config,
                 std::shared_ptr<DiagnosticsSink> sink = nullptr);

    /// Alignment of one reference token against every pattern position
    ///
    /// - exact hit: the token's occurrence vector, values 0.0 / 1.0
    /// - otherwise: the occurrence vector of the compound token whose nested
    ///   matcher scores best, scaled by that score (first inserted wins ties)
    /// - otherwise: all zeros
    AlignmentVector Query(const Token& token) const;

    /// Pattern length L
    size_t Length() const { return length_; }

    /// Number of distinct tokens in the pattern
    size_t DistinctTokenCount() const { return entries_.size(); }

    /// Check whether a token occurs verbatim in the pattern
    bool Contains(const Token& token) const { return lookup_.find(token) != lookup_.end(); }

    /// Check whether a pattern token owns a nested matcher
    bool IsCompound(const Token& token) const;

    /// Entries in first-occurrence order
    const std::vector<Entry>& GetEntries() const { return entries_; }

private:
    size_t length_;
    MatcherConfig config_;
    std::shared_ptr<DiagnosticsSink> sink_;
    std::vector<Entry> entries_;
    std::unordered_map<Token, size_t, TokenHash<Token>> lookup_;

    static const AlignmentVector& OccurrencesOf(const Entry& entry);
    static AlignmentVector& OccurrencesOf(Entry& entry);

    /// Create the entry for a token seen for the first time
    Entry MakeEntry(const Token& token) const;

    bool Tracing() const { return sink_->IsEnabled(DiagnosticLevel::TRACE); }

    void Trace(const std::string& message) const {
        sink_->Emit(DiagnosticLevel::TRACE, "PatternIndex", message);
    }
};

// ============================================================================
// PatternIndex Implementation
// ============================================================================

template<typename Token>
PatternIndex<Token>::PatternIndex(
    const std::vector<Token>& pattern,
    const MatcherConfig& config,
    std::shared_ptr<DiagnosticsSink> sink)
    : length_(pattern.size()),
      config_(config),
      sink_(sink ? std::move(sink) : NullDiagnosticsSink::Instance()) {

    for (size_t i = 0; i < pattern.size(); ++i) {
        const Token& token = pattern[i];

        auto it = lookup_.find(token);
        if (it == lookup_.end()) {
            it = lookup_.emplace(token, entries_.size()).first;
            entries_.push_back(MakeEntry(token));
        }

        OccurrencesOf(entries_[it->second])[i] = 1.0f;
    }

    if (Tracing()) {
        std::ostringstream msg;
        msg << "index built: length " << length_ << ", " << entries_.size() << " distinct tokens";
        Trace(msg.str());
    }
}

template<typename Token>
typename PatternIndex<Token>::Entry PatternIndex<Token>::MakeEntry(const Token& token) const {
    AlignmentVector occurrences(length_, 0.0f);

    if constexpr (Traits::kDecomposable) {
        auto elements = Traits::Decompose(token);
        if (elements.size() > 1) {
            MatcherConfig nested_config = config_.ForNestedPattern(elements.size());
            auto matcher = std::make_unique<const SubMatcher>(
                std::move(elements), nested_config, sink_);
            return Entry(CompoundEntry{token, std::move(occurrences), std::move(matcher)});
        }
    }

    return Entry(SimpleEntry{token, std::move(occurrences)});
}

template<typename Token>
AlignmentVector PatternIndex<Token>::Query(const Token& token) const {
    auto it = lookup_.find(token);
    if (it != lookup_.end()) {
        if (Tracing()) {
            std::ostringstream msg;
            msg << "query: exact hit on distinct token " << it->second;
            Trace(msg.str());
        }
        return OccurrencesOf(entries_[it->second]);
    }

    if constexpr (Traits::kDecomposable) {
        auto elements = Traits::Decompose(token);

        const CompoundEntry* best = nullptr;
        size_t best_index = 0;
        float best_score = 0.0f;

        for (size_t i = 0; i < entries_.size(); ++i) {
            const auto* compound = std::get_if<CompoundEntry>(&entries_[i]);
            if (compound == nullptr) {
                continue;
            }

            auto candidates = compound->matcher->FindIn(elements);
            if (candidates.empty()) {
                continue;
            }

            // Candidates are ranked, the first one is the best
            float score = candidates.front().score;
            if (best == nullptr || score > best_score) {
                best = compound;
                best_index = i;
                best_score = score;
            }
        }

        if (best != nullptr) {
            AlignmentVector scaled(best->occurrences);
            for (auto& value : scaled) {
                value *= best_score;
            }

            if (Tracing()) {
                std::ostringstream msg;
                msg << "query: fuzzy hit on distinct token " << best_index
                    << " (" << std::fixed << best_score << ")";
                Trace(msg.str());
            }
            return scaled;
        }
    }

    if (Tracing()) {
        Trace("query: none");
    }
    return AlignmentVector(length_, 0.0f);
}

template<typename Token>
bool PatternIndex<Token>::IsCompound(const Token& token) const {
    auto it = lookup_.find(token);
    if (it == lookup_.end()) {
        return false;
    }
    return std::holds_alternative<CompoundEntry>(entries_[it->second]);
}

template<typename Token>
const AlignmentVector& PatternIndex<Token>::OccurrencesOf(const Entry& entry) {
    if (const auto* compound = std::get_if<CompoundEntry>(&entry)) {
        return compound->occurrences;
    }
    return std::get<SimpleEntry>(entry).occurrences;
}

template<typename Token>
AlignmentVector& PatternIndex<Token>::OccurrencesOf(Entry& entry) {
    if (auto* compound = std::get_if<CompoundEntry>(&entry)) {
        return compound->occurrences;
    }
    return std::get<SimpleEntry>(entry).occurrences;
}

} // namespace mmq

// Completes the nested SubMatcher type for users including only this header
#include "core/matcher.hpp"
