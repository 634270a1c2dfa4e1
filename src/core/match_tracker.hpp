// File: src/core/match_tracker.hpp
#pragma once

#include "core/diagnostics.hpp"
#include "core/state_history.hpp"
#include "core/types.hpp"
#include <memory>

namespace mmq {

/// MatchTracker: bit-parallel (Shift-AND / Bitap) automaton with graded matches
///
/// Consumes one AlignmentVector per reference token and returns the running
/// confidence that the whole pattern has just been matched. Entry i of a
/// state is the confidence that the trailing (L - i) pattern tokens match up
/// to the current reference token; entry L-1 is a fresh hypothesis started
/// at this token.
///
/// Two independent tolerance mechanisms:
/// - nomatch_multiplier decays a hypothesis on a hard mismatch
/// - allowed_differences credits hypotheses missing up to that many trailing
///   pattern tokens, and hypotheses skipping pattern tokens (diagonal moves
///   through older states)
///
/// Thread-safety: Not thread-safe. Create one tracker per scan.
class MatchTracker {
public:
    /// @param length Pattern length L
    /// @param config Tolerance settings (validated against length)
    /// @param sink Diagnostics receiver; null selects the no-op sink
    /// @throws MatchError INVALID_LENGTH, INVALID_TOLERANCE,
    ///         INVALID_MULTIPLIER or INVALID_THRESHOLD
    MatchTracker(size_t length,
                 const MatcherConfig& config,
                 std::shared_ptr<DiagnosticsSink> sink = nullptr);

    /// Consume the alignment of the next reference token
    /// @param alignment Match quality against each pattern position (size L)
    /// @return Confidence in [0.0, 1.0] of a match ending at this token
    /// @throws MatchError LENGTH_MISMATCH if alignment.size() != L
    float Advance(const AlignmentVector& alignment);

    /// Forget all consumed tokens and start over
    void Reset();

    /// Pattern length L
    size_t Length() const { return length_; }

    /// Number of tokens consumed since construction or Reset()
    size_t Steps() const { return steps_; }

    /// Most recent state
    /// @throws std::out_of_range before the first Advance()
    const TrackerState& LastState() const { return history_.Latest(); }

    /// Number of states currently retained
    size_t RetainedStates() const { return history_.Size(); }

    const MatcherConfig& GetConfig() const { return config_; }

private:
    size_t length_;
    MatcherConfig config_;
    std::shared_ptr<DiagnosticsSink> sink_;
    StateHistory<TrackerState> history_;
    size_t steps_{0};

    /// Validate before the history is sized from the config
    static MatcherConfig Validated(size_t length, const MatcherConfig& config);

    /// Shift the newest state by one, seeding a new hypothesis at the end.
    /// Synthesizes the predecessor from the filler on the first token.
    TrackerState ShiftLastState() const;

    /// Shift an older state by `shift` positions, padding with new hypotheses
    TrackerState ShiftOldState(size_t distance_back, size_t shift) const;

    /// 'And' a shifted state with the current alignment, in place
    void ApplyAlignment(TrackerState& state, const AlignmentVector& alignment) const;
};

} // namespace mmq
