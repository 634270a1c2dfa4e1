// File: src/core/diagnostics.cpp
#include "core/diagnostics.hpp"
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace mmq {

const char* ToString(DiagnosticLevel level) {
    switch (level) {
        case DiagnosticLevel::TRACE: return "TRACE";
        case DiagnosticLevel::DEBUG: return "DEBUG";
        case DiagnosticLevel::INFO: return "INFO";
        default: return "UNKNOWN";
    }
}

DiagnosticLevel ParseDiagnosticLevel(const std::string& str) {
    if (str == "TRACE" || str == "trace") return DiagnosticLevel::TRACE;
    if (str == "DEBUG" || str == "debug") return DiagnosticLevel::DEBUG;
    if (str == "INFO" || str == "info") return DiagnosticLevel::INFO;
    throw std::invalid_argument("Unknown DiagnosticLevel: " + str);
}

// ============================================================================
// NullDiagnosticsSink
// ============================================================================

std::shared_ptr<DiagnosticsSink> NullDiagnosticsSink::Instance() {
    static std::shared_ptr<DiagnosticsSink> instance = std::make_shared<NullDiagnosticsSink>();
    return instance;
}

// ============================================================================
// StreamDiagnosticsSink
// ============================================================================

StreamDiagnosticsSink::StreamDiagnosticsSink(std::ostream& out, DiagnosticLevel min_level)
    : out_(out), min_level_(min_level) {
}

void StreamDiagnosticsSink::Emit(const DiagnosticEvent& event) {
    if (!IsEnabled(event.level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << event.component << "] " << event.message << std::endl;
}

// ============================================================================
// RecordingDiagnosticsSink
// ============================================================================

void RecordingDiagnosticsSink::Emit(const DiagnosticEvent& event) {
    if (!IsEnabled(event.level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<DiagnosticEvent> RecordingDiagnosticsSink::GetEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<DiagnosticEvent> RecordingDiagnosticsSink::GetEvents(const std::string& component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiagnosticEvent> result;
    for (const auto& event : events_) {
        if (event.component == component) {
            result.push_back(event);
        }
    }
    return result;
}

size_t RecordingDiagnosticsSink::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void RecordingDiagnosticsSink::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

std::string FormatScores(const std::vector<float>& scores) {
    std::ostringstream oss;
    oss << "[" << std::fixed << std::setprecision(2);
    for (size_t i = 0; i < scores.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << scores[i];
    }
    oss << "]";
    return oss.str();
}

} // namespace mmq
