// File: src/core/diagnostics.hpp
#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mmq {

// DiagnosticLevel: Severity of a diagnostics event
enum class DiagnosticLevel : uint8_t {
    TRACE = 0,   // Per-token automaton detail
    DEBUG = 1,   // Per-scan summaries
    INFO = 2,    // User-facing progress
};

// Convert DiagnosticLevel to string
const char* ToString(DiagnosticLevel level);

// Parse DiagnosticLevel from string
DiagnosticLevel ParseDiagnosticLevel(const std::string& str);

/// A single structured event emitted by the matching core
struct DiagnosticEvent {
    DiagnosticLevel level{DiagnosticLevel::TRACE};
    std::string component;   ///< Emitting component, e.g. "Matcher"
    std::string message;     ///< e.g. "matched at 2 (1.000000)"
};

/// Abstract receiver for diagnostics events
///
/// Sinks are observers only: matching results never depend on which sink is
/// attached. A sink shared by concurrent scans must synchronize itself.
class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;

    /// Receive one event
    virtual void Emit(const DiagnosticEvent& event) = 0;

    /// Check whether events of a level are wanted
    /// Producers skip formatting entirely when this returns false
    virtual bool IsEnabled(DiagnosticLevel level) const = 0;

    /// Convenience wrapper around Emit
    void Emit(DiagnosticLevel level, const std::string& component, const std::string& message) {
        Emit(DiagnosticEvent{level, component, message});
    }
};

/// Sink that drops everything (the default)
class NullDiagnosticsSink : public DiagnosticsSink {
public:
    using DiagnosticsSink::Emit;

    void Emit(const DiagnosticEvent&) override {}
    bool IsEnabled(DiagnosticLevel) const override { return false; }

    /// Process-wide shared instance (stateless)
    static std::shared_ptr<DiagnosticsSink> Instance();
};

/// Sink writing "[Component] message" lines to an output stream
class StreamDiagnosticsSink : public DiagnosticsSink {
public:
    using DiagnosticsSink::Emit;

    /// @param out Stream to write to; must outlive the sink
    /// @param min_level Events below this level are dropped
    explicit StreamDiagnosticsSink(std::ostream& out,
                                   DiagnosticLevel min_level = DiagnosticLevel::TRACE);

    void Emit(const DiagnosticEvent& event) override;
    bool IsEnabled(DiagnosticLevel level) const override { return level >= min_level_; }

    DiagnosticLevel GetMinLevel() const { return min_level_; }

private:
    std::ostream& out_;
    DiagnosticLevel min_level_;
    std::mutex mutex_;
};

/// Sink keeping every event in memory
class RecordingDiagnosticsSink : public DiagnosticsSink {
public:
    using DiagnosticsSink::Emit;

    explicit RecordingDiagnosticsSink(DiagnosticLevel min_level = DiagnosticLevel::TRACE)
        : min_level_(min_level) {}

    void Emit(const DiagnosticEvent& event) override;
    bool IsEnabled(DiagnosticLevel level) const override { return level >= min_level_; }

    /// Snapshot of recorded events, oldest first
    std::vector<DiagnosticEvent> GetEvents() const;

    /// Recorded events from one component
    std::vector<DiagnosticEvent> GetEvents(const std::string& component) const;

    size_t Size() const;
    void Clear();

private:
    DiagnosticLevel min_level_;
    mutable std::mutex mutex_;
    std::vector<DiagnosticEvent> events_;
};

/// Format a score vector for diagnostics, e.g. "[1.00, 0.50, 0.00]"
std::string FormatScores(const std::vector<float>& scores);

} // namespace mmq
