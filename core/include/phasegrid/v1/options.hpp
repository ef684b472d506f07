#pragma once

#include "phasegrid/v1/diagnostics.hpp"
#include "phasegrid/v1/numeric_types.hpp"

#include <optional>
#include <string_view>

namespace phasegrid::v1 {

/// How the no-load node voltage vector is obtained
enum class VoltageNoLoadMethod {
    ByDefinition,   // Nominal node voltages with symmetric phase angles
    ByCalculation,  // Source voltage propagated through the nodal admittance matrix
};

[[nodiscard]] const char* to_string(VoltageNoLoadMethod method);
[[nodiscard]] std::optional<VoltageNoLoadMethod> parse_voltage_no_load_method(std::string_view text);

struct ElectricGridModelOptions {
    Real base_frequency = constants::default_base_frequency;  // Hz
    VoltageNoLoadMethod voltage_no_load_method = VoltageNoLoadMethod::ByDefinition;

    // Loads with connected phases that do not resolve on their node are fatal
    bool require_load_placement = true;

    // Warn about admittance rows without any nonzero entry
    bool check_floating_nodes = true;

    DiagnosticCallback diagnostic_callback;
    DiagnosticSeverity min_severity = DiagnosticSeverity::Info;

    /// Reject non-physical settings (throws std::invalid_argument)
    void validate() const;
};

}  // namespace phasegrid::v1
