#pragma once

#include "phasegrid/v1/options.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace phasegrid::v1::parser {

struct YamlParserOptions {
    bool strict = true;  // Fail on unknown fields
};

/// Loads electric grid model options from a `phasegrid-v1` YAML document.
/// Problems are collected in errors()/warnings() instead of being thrown.
class YamlParser {
public:
    explicit YamlParser(YamlParserOptions options = {});

    // Parse from file
    ElectricGridModelOptions load(const std::filesystem::path& path);

    // Parse from string
    ElectricGridModelOptions load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    YamlParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, ElectricGridModelOptions& options);
};

/// Parse a number with an optional engineering suffix ("60", "60Hz", "0.05k").
/// Throws std::invalid_argument if no number is present.
Real parse_real_with_suffix(const std::string& raw);

}  // namespace phasegrid::v1::parser
