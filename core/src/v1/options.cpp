#include "phasegrid/v1/options.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace phasegrid::v1 {

const char* to_string(VoltageNoLoadMethod method) {
    switch (method) {
        case VoltageNoLoadMethod::ByDefinition: return "by_definition";
        case VoltageNoLoadMethod::ByCalculation: return "by_calculation";
    }
    return "unknown";
}

std::optional<VoltageNoLoadMethod> parse_voltage_no_load_method(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "by_definition" || lower == "definition") return VoltageNoLoadMethod::ByDefinition;
    if (lower == "by_calculation" || lower == "calculation") return VoltageNoLoadMethod::ByCalculation;
    return std::nullopt;
}

void ElectricGridModelOptions::validate() const {
    if (!std::isfinite(base_frequency) || base_frequency <= 0.0) {
        throw std::invalid_argument("base_frequency must be positive and finite, got " +
                                    std::to_string(base_frequency));
    }
}

}  // namespace phasegrid::v1
