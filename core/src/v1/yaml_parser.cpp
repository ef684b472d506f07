#include "phasegrid/v1/parser/yaml_parser.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace phasegrid::v1::parser {

namespace {

constexpr const char* kSchemaId = "phasegrid-v1";
constexpr const char* kDiagUnknownField = "PHASEGRID_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "PHASEGRID_YAML_E_TYPE_MISMATCH";
constexpr const char* kDiagInvalidParameter = "PHASEGRID_YAML_E_PARAM_INVALID";
constexpr const char* kDiagDeprecatedField = "PHASEGRID_YAML_W_DEPRECATED_FIELD";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

/// "[CODE] Type mismatch at 'path' (expected X, got Y)"
void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    const char* kind = !received || received.IsNull() ? "null"
                     : received.IsScalar()           ? "scalar"
                     : received.IsSequence()         ? "sequence"
                     : received.IsMap()              ? "map"
                                                     : "unknown";
    push_error(errors, kDiagTypeMismatch,
               "Type mismatch at '" + path + "' (expected " + expected + ", got " + kind + ")");
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   std::vector<std::string>& errors,
                   bool strict) {
    if (!strict || !node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (allowed.find(key) == allowed.end()) {
            push_error(errors,
                       kDiagUnknownField,
                       "Unknown field at '" + context + "." + key + "'");
        }
    }
}

/// Scalar converted with yaml-cpp; absent keys give nullopt, bad values a type mismatch
template<typename T>
std::optional<T> parse_scalar(const YAML::Node& node,
                              const std::string& path,
                              const char* expected,
                              std::vector<std::string>& errors) {
    if (!node) return std::nullopt;
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
}

std::optional<Real> parse_real(const YAML::Node& node,
                               const std::string& path,
                               std::vector<std::string>& errors) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
    try {
        return parse_real_with_suffix(node.Scalar());
    } catch (const std::invalid_argument&) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
}

std::optional<DiagnosticSeverity> parse_severity(const std::string& text) {
    const std::string lower = to_lower(text);
    if (lower == "debug") return DiagnosticSeverity::Debug;
    if (lower == "info") return DiagnosticSeverity::Info;
    if (lower == "warn" || lower == "warning") return DiagnosticSeverity::Warning;
    return std::nullopt;
}

}  // namespace

Real parse_real_with_suffix(const std::string& raw) {
    if (raw.empty()) {
        throw std::invalid_argument("empty numeric value");
    }

    char* end = nullptr;
    const double base = std::strtod(raw.c_str(), &end);
    if (end == raw.c_str()) {
        throw std::invalid_argument("invalid numeric value");
    }

    std::string suffix = raw.substr(static_cast<std::size_t>(end - raw.c_str()));
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!suffix.empty() && is_space(static_cast<unsigned char>(suffix.front()))) {
        suffix.erase(suffix.begin());
    }
    while (!suffix.empty() && is_space(static_cast<unsigned char>(suffix.back()))) {
        suffix.pop_back();
    }
    if (suffix.empty()) return base;

    const std::string lower = to_lower(suffix);
    auto starts_with = [&](const std::string& prefix) {
        return lower.rfind(prefix, 0) == 0;
    };

    double multiplier = 1.0;
    if (starts_with("giga") || starts_with("g")) {
        multiplier = 1e9;
    } else if (starts_with("mega") || starts_with("meg") || suffix.front() == 'M') {
        multiplier = 1e6;
    } else if (starts_with("kilo") || starts_with("k")) {
        multiplier = 1e3;
    } else if (starts_with("milli") || starts_with("m")) {
        multiplier = 1e-3;
    }

    return base * multiplier;
}

YamlParser::YamlParser(YamlParserOptions options)
    : options_(options) {}

ElectricGridModelOptions YamlParser::load(const std::filesystem::path& path) {
    errors_.clear();
    warnings_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.push_back("Cannot open file: " + path.string());
        return ElectricGridModelOptions{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

ElectricGridModelOptions YamlParser::load_string(const std::string& content) {
    ElectricGridModelOptions options;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, options);
    return options;
}

void YamlParser::parse_yaml(const std::string& content, ElectricGridModelOptions& options) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root || root.IsNull()) {
        errors_.push_back("Empty configuration document");
        return;
    }
    if (!root.IsMap()) {
        push_type_mismatch_error(errors_, "root", "map", root);
        return;
    }

    validate_keys(root, {"schema", "version", "electric_grid", "logs"}, "root", errors_, options_.strict);

    if (!root["schema"]) {
        errors_.push_back("Missing required field 'schema'");
        return;
    }
    if (!root["version"]) {
        errors_.push_back("Missing required field 'version'");
        return;
    }

    const std::optional<std::string> schema =
        parse_scalar<std::string>(root["schema"], "root.schema", "string", errors_);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        errors_.push_back("Unsupported schema: " + *schema);
        return;
    }

    const std::optional<int> version = parse_scalar<int>(root["version"], "root.version", "integer", errors_);
    if (!version) {
        return;
    }
    if (*version != 1) {
        errors_.push_back("Unsupported schema version: " + std::to_string(*version));
        return;
    }

    if (const YAML::Node grid = root["electric_grid"]) {
        if (!grid.IsMap()) {
            push_type_mismatch_error(errors_, "electric_grid", "map", grid);
            return;
        }
        validate_keys(grid, {"base_frequency", "voltage_no_load_method", "require_load_placement",
                             "check_floating_nodes", "frequency"},
                      "electric_grid", errors_, options_.strict);

        const bool legacy_frequency = !grid["base_frequency"] && grid["frequency"];
        const YAML::Node frequency = legacy_frequency ? grid["frequency"] : grid["base_frequency"];
        if (legacy_frequency) {
            push_warning(warnings_, kDiagDeprecatedField,
                         "Deprecated field 'electric_grid.frequency'; use 'electric_grid.base_frequency' instead.");
        }
        if (const auto value = parse_real(frequency, "electric_grid.base_frequency", errors_)) {
            if (!std::isfinite(*value) || *value <= 0.0) {
                push_error(errors_, kDiagInvalidParameter,
                           "Invalid 'electric_grid.base_frequency': must be positive");
            } else {
                options.base_frequency = *value;
            }
        }

        if (const auto method = parse_scalar<std::string>(grid["voltage_no_load_method"],
                                                          "electric_grid.voltage_no_load_method", "string", errors_)) {
            if (const auto parsed = parse_voltage_no_load_method(*method)) {
                options.voltage_no_load_method = *parsed;
            } else {
                push_error(errors_, kDiagInvalidParameter,
                           "Invalid 'electric_grid.voltage_no_load_method': " + *method +
                               " (expected by_definition or by_calculation)");
            }
        }

        if (const auto value = parse_scalar<bool>(grid["require_load_placement"],
                                                  "electric_grid.require_load_placement", "boolean", errors_)) {
            options.require_load_placement = *value;
        }
        if (const auto value = parse_scalar<bool>(grid["check_floating_nodes"],
                                                  "electric_grid.check_floating_nodes", "boolean", errors_)) {
            options.check_floating_nodes = *value;
        }
    }

    if (const YAML::Node logs = root["logs"]) {
        validate_keys(logs, {"level"}, "logs", errors_, options_.strict);
        if (const auto level = parse_scalar<std::string>(logs["level"], "logs.level", "string", errors_)) {
            if (const auto severity = parse_severity(*level)) {
                options.min_severity = *severity;
            } else {
                push_error(errors_, kDiagInvalidParameter,
                           "Invalid 'logs.level': " + *level + " (expected debug, info or warning)");
            }
        }
    }
}

}  // namespace phasegrid::v1::parser
