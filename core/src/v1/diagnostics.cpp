#include "phasegrid/v1/diagnostics.hpp"

#include <algorithm>

namespace phasegrid::v1 {

const char* to_string(DiagnosticSeverity severity) {
    switch (severity) {
        case DiagnosticSeverity::Debug: return "debug";
        case DiagnosticSeverity::Info: return "info";
        case DiagnosticSeverity::Warning: return "warning";
    }
    return "unknown";
}

std::string Diagnostic::to_string() const {
    std::string out = std::string(v1::to_string(severity)) + " " + with_diag_code(code, message);
    if (!element.empty()) {
        out += " (" + element + ")";
    }
    return out;
}

void DiagnosticLog::log(Diagnostic entry) {
    entries_.push_back(std::move(entry));
    const Diagnostic& stored = entries_.back();
    if (callback_ && stored.severity >= min_severity_) {
        callback_(stored);
    }
}

std::size_t DiagnosticLog::count(DiagnosticSeverity severity) const {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [severity](const Diagnostic& d) { return d.severity == severity; }));
}

std::size_t DiagnosticLog::count(std::string_view code) const {
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [code](const Diagnostic& d) { return d.code == code; }));
}

std::vector<std::string> DiagnosticLog::warnings() const {
    std::vector<std::string> out;
    for (const auto& d : entries_) {
        if (d.severity == DiagnosticSeverity::Warning) {
            out.push_back(with_diag_code(d.code, d.message));
        }
    }
    return out;
}

}  // namespace phasegrid::v1
