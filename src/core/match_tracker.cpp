// File: src/core/match_tracker.cpp
#include "core/match_tracker.hpp"
#include "core/score_combinator.hpp"
#include <cstddef>
#include <sstream>
#include <utility>

namespace mmq {

namespace {

// The diagonal look-back reaches allowed_differences states behind the newest
size_t HistoryCapacity(const MatcherConfig& config) {
    return static_cast<size_t>(config.allowed_differences < 0 ? 0 : config.allowed_differences) + 2;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

MatchTracker::MatchTracker(
    size_t length,
    const MatcherConfig& config,
    std::shared_ptr<DiagnosticsSink> sink)
    : length_(length),
      config_(Validated(length, config)),
      sink_(sink ? std::move(sink) : NullDiagnosticsSink::Instance()),
      history_(HistoryCapacity(config_)) {
}

MatcherConfig MatchTracker::Validated(size_t length, const MatcherConfig& config) {
    config.Validate(static_cast<long long>(length));
    return config;
}

void MatchTracker::Reset() {
    history_.Clear();
    steps_ = 0;
}

// ============================================================================
// Matching
// ============================================================================

float MatchTracker::Advance(const AlignmentVector& alignment) {
    if (alignment.size() != length_) {
        std::ostringstream msg;
        msg << "alignment has length " << alignment.size()
            << " different than pattern length " << length_;
        throw MatchError(ErrorCode::LENGTH_MISMATCH, msg.str());
    }

    TrackerState state = ShiftLastState();
    ApplyAlignment(state, alignment);
    history_.Push(std::move(state));
    ++steps_;

    const TrackerState& current = history_.Latest();

    if (sink_->IsEnabled(DiagnosticLevel::TRACE)) {
        sink_->Emit(DiagnosticLevel::TRACE, "MatchTracker",
                    "tracker match " + FormatScores(alignment) + ": " + FormatScores(current));
    }

    float score = current[0];

    // 'Or' with the hypotheses that are missing trailing pattern tokens, and
    // with diagonal transitions from older states that skip pattern tokens
    for (int j = 0; j < config_.allowed_differences; ++j) {
        size_t step = static_cast<size_t>(j);
        score = CombineScores(score, current[step + 1], j);

        if (history_.Has(step + 1)) {
            TrackerState alternate = ShiftOldState(step + 1, step + 2);
            ApplyAlignment(alternate, alignment);
            score = CombineScores(score, alternate[0], j);

            if (sink_->IsEnabled(DiagnosticLevel::TRACE)) {
                std::ostringstream msg;
                msg << "alt tracker " << j << " " << FormatScores(alignment)
                    << ": " << FormatScores(alternate);
                sink_->Emit(DiagnosticLevel::TRACE, "MatchTracker", msg.str());
            }
        }
    }

    return score;
}

// ============================================================================
// Helper Methods
// ============================================================================

TrackerState MatchTracker::ShiftLastState() const {
    TrackerState shifted;
    shifted.reserve(length_);

    if (history_.Empty()) {
        // No states yet: every older hypothesis starts at the filler value
        shifted.assign(length_ - 1, config_.InitialFiller());
    } else {
        const TrackerState& last = history_.Latest();
        shifted.assign(last.begin() + 1, last.end());
    }

    shifted.push_back(1.0f);
    return shifted;
}

TrackerState MatchTracker::ShiftOldState(size_t distance_back, size_t shift) const {
    const TrackerState& old = history_.Get(distance_back);

    TrackerState shifted;
    shifted.reserve(length_);
    shifted.assign(old.begin() + static_cast<std::ptrdiff_t>(shift), old.end());
    shifted.resize(length_, 1.0f);
    return shifted;
}

void MatchTracker::ApplyAlignment(TrackerState& state, const AlignmentVector& alignment) const {
    for (size_t i = 0; i < length_; ++i) {
        float quality = alignment[length_ - i - 1];
        if (quality == 0.0f) {
            // Hard mismatch: zero it or reduce it by the multiplier
            state[i] *= config_.nomatch_multiplier;
        } else if (quality < 1.0f) {
            // Fuzzy partial credit
            state[i] *= quality;
        }
    }
}

} // namespace mmq
