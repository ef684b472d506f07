#pragma once

// =============================================================================
// PhaseGrid - Diagnostics and Configuration Errors
// =============================================================================
// Fatal problems in grid data are raised as ConfigurationError carrying a
// stable diagnostic code and the offending element name. Non-fatal findings
// are recorded in a DiagnosticLog and optionally forwarded to a callback.
// =============================================================================

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace phasegrid::v1 {

namespace diag {
inline constexpr const char* kSourceNode = "PHASEGRID_GRID_E_SOURCE_NODE";
inline constexpr const char* kDuplicateName = "PHASEGRID_GRID_E_DUPLICATE_NAME";
inline constexpr const char* kNodeUnknown = "PHASEGRID_GRID_E_NODE_UNKNOWN";
inline constexpr const char* kElementUnknown = "PHASEGRID_GRID_E_ELEMENT_UNKNOWN";
inline constexpr const char* kLineTypeUnknown = "PHASEGRID_GRID_E_LINE_TYPE_UNKNOWN";
inline constexpr const char* kLineTypeEntries = "PHASEGRID_GRID_E_LINE_TYPE_ENTRIES";
inline constexpr const char* kLineLength = "PHASEGRID_GRID_E_LINE_LENGTH";
inline constexpr const char* kPhaseMismatch = "PHASEGRID_GRID_E_PHASE_MISMATCH";
inline constexpr const char* kSingularImpedance = "PHASEGRID_GRID_E_SINGULAR_IMPEDANCE";
inline constexpr const char* kTransformerWindings = "PHASEGRID_GRID_E_TRANSFORMER_WINDINGS";
inline constexpr const char* kTransformerTypeUnknown = "PHASEGRID_GRID_E_TRANSFORMER_TYPE_UNKNOWN";
inline constexpr const char* kTransformerRating = "PHASEGRID_GRID_E_TRANSFORMER_RATING";
inline constexpr const char* kLoadUnplaced = "PHASEGRID_GRID_E_LOAD_UNPLACED";
inline constexpr const char* kLoadConnection = "PHASEGRID_GRID_E_LOAD_CONNECTION";
inline constexpr const char* kNoLoadVoltage = "PHASEGRID_GRID_E_NO_LOAD_VOLTAGE";

inline constexpr const char* kIndexSummary = "PHASEGRID_GRID_I_INDEX_SUMMARY";
inline constexpr const char* kModelSummary = "PHASEGRID_GRID_I_MODEL_SUMMARY";
inline constexpr const char* kZeroPhaseElement = "PHASEGRID_GRID_W_ZERO_PHASE_ELEMENT";
inline constexpr const char* kFloatingNode = "PHASEGRID_GRID_W_FLOATING_NODE";
inline constexpr const char* kNameCollision = "PHASEGRID_GRID_W_NAME_COLLISION";
inline constexpr const char* kLoadNotPlaced = "PHASEGRID_GRID_W_LOAD_UNPLACED";
}  // namespace diag

/// Render a message with its diagnostic code prefix, e.g. "[CODE] message"
[[nodiscard]] inline std::string with_diag_code(std::string_view code, std::string_view message) {
    std::string out;
    out.reserve(code.size() + message.size() + 3);
    out += '[';
    out += code;
    out += "] ";
    out += message;
    return out;
}

// =============================================================================
// Configuration Error
// =============================================================================

/// Fatal error in the grid data, raised while building the index or model
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(std::string code, std::string element, const std::string& message)
        : std::runtime_error(with_diag_code(code, message))
        , code_(std::move(code))
        , element_(std::move(element)) {}

    [[nodiscard]] const std::string& code() const { return code_; }

    /// Name of the record that caused the error (empty for grid-level errors)
    [[nodiscard]] const std::string& element() const { return element_; }

private:
    std::string code_;
    std::string element_;
};

// =============================================================================
// Diagnostic Log
// =============================================================================

enum class DiagnosticSeverity {
    Debug,
    Info,
    Warning,
};

[[nodiscard]] const char* to_string(DiagnosticSeverity severity);

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Info;
    std::string code;
    std::string element;
    std::string message;

    [[nodiscard]] std::string to_string() const;
};

using DiagnosticCallback = std::function<void(const Diagnostic&)>;

/// Collects diagnostics of one index/model construction.
/// Every entry is stored; the callback only sees entries at or above min_severity.
class DiagnosticLog {
public:
    DiagnosticLog() = default;
    DiagnosticLog(DiagnosticCallback callback, DiagnosticSeverity min_severity)
        : callback_(std::move(callback))
        , min_severity_(min_severity) {}

    void set_callback(DiagnosticCallback callback) { callback_ = std::move(callback); }
    void set_min_severity(DiagnosticSeverity severity) { min_severity_ = severity; }

    void log(Diagnostic entry);

    void debug(std::string code, std::string element, std::string message) {
        log({DiagnosticSeverity::Debug, std::move(code), std::move(element), std::move(message)});
    }
    void info(std::string code, std::string element, std::string message) {
        log({DiagnosticSeverity::Info, std::move(code), std::move(element), std::move(message)});
    }
    void warning(std::string code, std::string element, std::string message) {
        log({DiagnosticSeverity::Warning, std::move(code), std::move(element), std::move(message)});
    }

    [[nodiscard]] const std::vector<Diagnostic>& entries() const { return entries_; }
    [[nodiscard]] std::size_t count(DiagnosticSeverity severity) const;
    [[nodiscard]] std::size_t count(std::string_view code) const;

    /// Warning messages rendered with their codes
    [[nodiscard]] std::vector<std::string> warnings() const;

    void clear() { entries_.clear(); }

private:
    std::vector<Diagnostic> entries_;
    DiagnosticCallback callback_;
    DiagnosticSeverity min_severity_ = DiagnosticSeverity::Info;
};

}  // namespace phasegrid::v1
