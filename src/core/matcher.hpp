// File: src/core/matcher.hpp
#pragma once

#include "core/diagnostics.hpp"
#include "core/match_tracker.hpp"
#include "core/pattern_index.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <sstream>
#include <vector>

namespace mmq {

/// Matcher - Finds approximate occurrences of a pattern in a reference sequence
///
/// Owns the pattern, its configuration and the PatternIndex built from it.
/// Each scan creates a fresh MatchTracker, feeds it the alignment of every
/// reference token and records the confidence of a match ending there.
///
/// Example:
///   Matcher<std::string> matcher({"lorem", "ipsum", "dolor"});
///   auto results = matcher.FindIn(reference_words);
///   // results[0].position is the end of the best match
///
/// Thread-safety: Immutable after construction. Concurrent scans are safe as
/// long as the diagnostics sink is.
///
/// @tparam Token Equality-comparable, hashable token type
template<typename Token>
class Matcher {
public:
    using TokenType = Token;

    /// Receives (position, score) in reference order; return false to stop
    using Visitor = std::function<bool(const MatchResult&)>;

    /// Constructor
    /// @param pattern Tokens to search for (non-empty)
    /// @param config Fuzziness settings
    /// @param sink Diagnostics receiver; null selects the no-op sink
    /// @throws MatchError EMPTY_PATTERN, INVALID_TOLERANCE, INVALID_MULTIPLIER
    ///         or INVALID_THRESHOLD
    explicit Matcher(std::vector<Token> pattern,
                     const MatcherConfig& config = MatcherConfig{},
                     std::shared_ptr<DiagnosticsSink> sink = nullptr);

    /// Find the pattern in a reference sequence
    /// @param reference Tokens to scan
    /// @return Matches with score >= threshold, sorted by score (highest
    ///         first, ties in reference order)
    std::vector<MatchResult> FindIn(const std::vector<Token>& reference) const;

    /// Score every reference position without ranking or filtering
    /// @param reference Tokens to scan
    /// @return One record per reference token, in reference order
    std::vector<MatchResult> ScoreAll(const std::vector<Token>& reference) const;

    /// Stream per-position scores to a visitor
    /// @param reference Tokens to scan
    /// @param visitor Called once per consumed token
    /// @return Number of reference tokens consumed
    size_t Scan(const std::vector<Token>& reference, const Visitor& visitor) const;

    const std::vector<Token>& GetPattern() const { return pattern_; }
    const MatcherConfig& GetConfig() const { return config_; }
    const PatternIndex<Token>& GetIndex() const { return index_; }
    size_t Length() const { return pattern_.size(); }

private:
    std::vector<Token> pattern_;
    MatcherConfig config_;
    std::shared_ptr<DiagnosticsSink> sink_;
    PatternIndex<Token> index_;

    /// Validate before anything is built from the pattern
    static std::vector<Token> Validated(std::vector<Token> pattern, const MatcherConfig& config);
};

// ============================================================================
// Matcher Implementation
// ============================================================================

template<typename Token>
Matcher<Token>::Matcher(
    std::vector<Token> pattern,
    const MatcherConfig& config,
    std::shared_ptr<DiagnosticsSink> sink)
    : pattern_(Validated(std::move(pattern), config)),
      config_(config),
      sink_(sink ? std::move(sink) : NullDiagnosticsSink::Instance()),
      index_(pattern_, config_, sink_) {
}

template<typename Token>
std::vector<Token> Matcher<Token>::Validated(std::vector<Token> pattern, const MatcherConfig& config) {
    if (pattern.empty()) {
        throw MatchError(ErrorCode::EMPTY_PATTERN, "pattern items list empty");
    }
    config.Validate(static_cast<long long>(pattern.size()));
    return pattern;
}

template<typename Token>
size_t Matcher<Token>::Scan(const std::vector<Token>& reference, const Visitor& visitor) const {
    MatchTracker tracker(pattern_.size(), config_, sink_);

    size_t consumed = 0;
    for (size_t i = 0; i < reference.size(); ++i) {
        float score = tracker.Advance(index_.Query(reference[i]));
        ++consumed;

        if (!visitor(MatchResult(i, score))) {
            break;
        }
    }

    return consumed;
}

template<typename Token>
std::vector<MatchResult> Matcher<Token>::ScoreAll(const std::vector<Token>& reference) const {
    std::vector<MatchResult> records;
    records.reserve(reference.size());

    Scan(reference, [&records](const MatchResult& record) {
        records.push_back(record);
        return true;
    });

    return records;
}

template<typename Token>
std::vector<MatchResult> Matcher<Token>::FindIn(const std::vector<Token>& reference) const {
    const bool tracing = sink_->IsEnabled(DiagnosticLevel::TRACE);
    std::vector<MatchResult> results;

    Scan(reference, [this, tracing, &results](const MatchResult& record) {
        if (record.score >= config_.threshold) {
            if (tracing) {
                std::ostringstream msg;
                msg << "matched at " << record.position << " (" << std::fixed << record.score << ")";
                sink_->Emit(DiagnosticLevel::TRACE, "Matcher", msg.str());
            }
            results.push_back(record);
        }
        return true;
    });

    // Highest score first; equal scores keep reference order
    std::stable_sort(results.begin(), results.end(),
        [](const MatchResult& a, const MatchResult& b) {
            return a.score > b.score;
        });

    if (sink_->IsEnabled(DiagnosticLevel::DEBUG)) {
        std::ostringstream msg;
        msg << "scanned " << reference.size() << " tokens, " << results.size()
            << " results >= " << config_.threshold;
        sink_->Emit(DiagnosticLevel::DEBUG, "Matcher", msg.str());
    }

    return results;
}

} // namespace mmq
