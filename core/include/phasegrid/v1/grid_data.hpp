#pragma once

// =============================================================================
// PhaseGrid - Electric Grid Data
// =============================================================================
// Typed tables describing one electric grid, as delivered by the data-access
// layer. Records are identified by name; table order is significant because
// the grid index enumerates elements in declared order.
// =============================================================================

#include "phasegrid/v1/numeric_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace phasegrid::v1 {

enum class ConnectionType {
    Wye,
    Delta,
};

[[nodiscard]] const char* to_string(ConnectionType connection);
[[nodiscard]] std::optional<ConnectionType> parse_connection_type(std::string_view text);

struct ElectricGrid {
    std::string electric_grid_name;
    std::string source_node_name;
};

struct NodeRecord {
    std::string node_name;
    Real voltage = 0.0;  // Nominal line-to-line voltage (V)
    PhaseConnection phases;
};

struct LineRecord {
    std::string line_name;
    std::string line_type;
    Real length = 0.0;  // In the length unit of the line type parameters
    std::string node_1_name;
    std::string node_2_name;
    PhaseConnection phases;
};

/// One entry of the symmetric phase-coupling matrices of a line type (1-based row/col)
struct LineTypeMatrixEntry {
    int row = 1;
    int col = 1;
    Real r = 0.0;  // Resistance per unit length
    Real x = 0.0;  // Reactance per unit length
    Real c = 0.0;  // Shunt capacitance per unit length (nF)
};

struct LineType {
    std::string line_type;
    int n_phases = 3;
    std::vector<LineTypeMatrixEntry> entries;

    /// Build a line type from flattened entries ordered (1,1), (2,1), (2,2), (3,1), (3,2), (3,3)
    [[nodiscard]] static LineType from_flat(std::string name, int n_phases,
                                            const std::vector<Real>& r,
                                            const std::vector<Real>& x,
                                            const std::vector<Real>& c);
};

/// One winding of a transformer; a two-winding transformer has two records
struct TransformerWindingRecord {
    std::string transformer_name;
    std::string transformer_type;
    int winding = 1;
    std::string node_name;
    ConnectionType connection = ConnectionType::Wye;
    Real voltage = 0.0;         // Winding nominal line-to-line voltage (V)
    Real apparent_power = 0.0;  // Rated apparent power (VA)
    PhaseConnection phases;
};

struct TransformerType {
    std::string transformer_type;
    Real resistance_percentage = 0.0;
    Real reactance_percentage = 0.0;
};

struct LoadRecord {
    std::string load_name;
    std::string node_name;
    ConnectionType connection = ConnectionType::Wye;
    Real active_power = 0.0;    // W
    Real reactive_power = 0.0;  // VAr
    PhaseConnection phases;
};

struct ElectricGridData {
    ElectricGrid electric_grid;
    std::vector<NodeRecord> nodes;
    std::vector<LineRecord> lines;
    std::vector<LineType> line_types;
    std::vector<TransformerWindingRecord> transformers;
    std::vector<TransformerType> transformer_types;
    std::vector<LoadRecord> loads;

    [[nodiscard]] const NodeRecord* find_node(std::string_view node_name) const;
    [[nodiscard]] const LineType* find_line_type(std::string_view line_type) const;
    [[nodiscard]] const TransformerType* find_transformer_type(std::string_view transformer_type) const;

    /// Winding records of one transformer, in table order
    [[nodiscard]] std::vector<const TransformerWindingRecord*> transformer_windings(
        std::string_view transformer_name) const;

    /// First-winding records, in table order; these define the transformer branches
    [[nodiscard]] std::vector<const TransformerWindingRecord*> one_winding_transformers() const;
};

}  // namespace phasegrid::v1
