#include "phasegrid/v1/grid_data.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace phasegrid::v1 {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template<typename Record, typename Key>
const Record* find_by(const std::vector<Record>& table, std::string_view name, Key key) {
    const auto it = std::find_if(table.begin(), table.end(),
                                 [&](const Record& record) { return record.*key == name; });
    return it == table.end() ? nullptr : &*it;
}

}  // namespace

const char* to_string(ConnectionType connection) {
    switch (connection) {
        case ConnectionType::Wye: return "wye";
        case ConnectionType::Delta: return "delta";
    }
    return "unknown";
}

std::optional<ConnectionType> parse_connection_type(std::string_view text) {
    const std::string lower = to_lower(text);
    if (lower == "wye" || lower == "y" || lower == "star") return ConnectionType::Wye;
    if (lower == "delta" || lower == "d") return ConnectionType::Delta;
    return std::nullopt;
}

LineType LineType::from_flat(std::string name, int n_phases,
                             const std::vector<Real>& r,
                             const std::vector<Real>& x,
                             const std::vector<Real>& c) {
    if (n_phases < 1 || n_phases > 3) {
        throw std::invalid_argument("LineType::from_flat: n_phases must be 1, 2 or 3");
    }
    const std::size_t n_entries = static_cast<std::size_t>(n_phases * (n_phases + 1) / 2);
    if (r.size() < n_entries || x.size() < n_entries || c.size() < n_entries) {
        throw std::invalid_argument("LineType::from_flat: expected " + std::to_string(n_entries) +
                                    " entries for line type '" + name + "'");
    }

    LineType type;
    type.line_type = std::move(name);
    type.n_phases = n_phases;
    std::size_t k = 0;
    for (int row = 1; row <= n_phases; ++row) {
        for (int col = 1; col <= row; ++col, ++k) {
            type.entries.push_back({row, col, r[k], x[k], c[k]});
        }
    }
    return type;
}

const NodeRecord* ElectricGridData::find_node(std::string_view node_name) const {
    return find_by(nodes, node_name, &NodeRecord::node_name);
}

const LineType* ElectricGridData::find_line_type(std::string_view line_type) const {
    return find_by(line_types, line_type, &LineType::line_type);
}

const TransformerType* ElectricGridData::find_transformer_type(std::string_view transformer_type) const {
    return find_by(transformer_types, transformer_type, &TransformerType::transformer_type);
}

std::vector<const TransformerWindingRecord*> ElectricGridData::transformer_windings(
    std::string_view transformer_name) const {
    std::vector<const TransformerWindingRecord*> result;
    for (const auto& winding : transformers) {
        if (winding.transformer_name == transformer_name) {
            result.push_back(&winding);
        }
    }
    return result;
}

std::vector<const TransformerWindingRecord*> ElectricGridData::one_winding_transformers() const {
    std::vector<const TransformerWindingRecord*> result;
    for (const auto& winding : transformers) {
        if (winding.winding == 1) {
            result.push_back(&winding);
        }
    }
    return result;
}

}  // namespace phasegrid::v1
