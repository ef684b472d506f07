#pragma once

#include "phasegrid/v1/diagnostics.hpp"
#include "phasegrid/v1/grid_data.hpp"

#include <complex>
#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

namespace phasegrid::v1::testing {

inline constexpr PhaseConnection kThreePhase{true, true, true};
inline constexpr PhaseConnection kPhase1{true, false, false};
inline constexpr PhaseConnection kPhase2{false, true, false};
inline constexpr PhaseConnection kPhase3{false, false, true};
inline constexpr PhaseConnection kPhases12{true, true, false};
inline constexpr PhaseConnection kPhases13{true, false, true};
inline constexpr PhaseConnection kPhases23{false, true, true};
inline constexpr PhaseConnection kNoPhase{false, false, false};

/// Line type with equal diagonal entries and no phase coupling
inline LineType diagonal_line_type(const std::string& name, int n_phases, Real r, Real x, Real c) {
    LineType type;
    type.line_type = name;
    type.n_phases = n_phases;
    for (int row = 1; row <= n_phases; ++row) {
        for (int col = 1; col <= row; ++col) {
            type.entries.push_back(row == col ? LineTypeMatrixEntry{row, col, r, x, c}
                                              : LineTypeMatrixEntry{row, col, 0.0, 0.0, 0.0});
        }
    }
    return type;
}

inline NodeRecord node(const std::string& name, PhaseConnection phases, Real voltage = 400.0) {
    return NodeRecord{name, voltage, phases};
}

inline LineRecord line(const std::string& name, const std::string& type, Real length,
                       const std::string& node_1, const std::string& node_2, PhaseConnection phases) {
    return LineRecord{name, type, length, node_1, node_2, phases};
}

inline LoadRecord load(const std::string& name, const std::string& node_name, PhaseConnection phases,
                       ConnectionType connection = ConnectionType::Wye,
                       Real active_power = 1000.0, Real reactive_power = 200.0) {
    return LoadRecord{name, node_name, connection, active_power, reactive_power, phases};
}

inline std::vector<TransformerWindingRecord> transformer(const std::string& name, const std::string& type,
                                                         const std::string& node_1, ConnectionType connection_1,
                                                         Real voltage_1,
                                                         const std::string& node_2, ConnectionType connection_2,
                                                         Real voltage_2,
                                                         Real apparent_power, PhaseConnection phases) {
    return {
        TransformerWindingRecord{name, type, 1, node_1, connection_1, voltage_1, apparent_power, phases},
        TransformerWindingRecord{name, type, 2, node_2, connection_2, voltage_2, apparent_power, phases},
    };
}

/// Source node "source" and node "n1" joined by one line of diagonal type "diag"
/// (r = x = 1 per unit length, c = 0, length 1) on the given phases
inline ElectricGridData two_node_grid(PhaseConnection phases = kThreePhase) {
    ElectricGridData data;
    data.electric_grid = {"two_node", "source"};
    data.nodes = {node("source", phases), node("n1", phases)};
    data.line_types = {diagonal_line_type("diag", phases.count(), 1.0, 1.0, 0.0)};
    data.lines = {line("line_1", "diag", 1.0, "source", "n1", phases)};
    return data;
}

/// Mixed grid with partial phases, a transformer and loads:
///   source (1,2,3) --line_1 (1,3)--> n1 (1,3)
///   source (1,2,3) --line_2 (2)----> n2 (2)
///   source (1,2,3) ==trafo_1 (1,2,3)==> n3 (1,2,3)
inline ElectricGridData mixed_grid() {
    ElectricGridData data;
    data.electric_grid = {"mixed", "source"};
    data.nodes = {
        node("source", kThreePhase, 20000.0),
        node("n1", kPhases13, 20000.0),
        node("n2", kPhase2, 20000.0),
        node("n3", kThreePhase, 400.0),
    };
    data.line_types = {
        diagonal_line_type("two_phase", 2, 0.2, 0.4, 10.0),
        diagonal_line_type("one_phase", 1, 0.3, 0.3, 0.0),
    };
    data.lines = {
        line("line_1", "two_phase", 2.0, "source", "n1", kPhases13),
        line("line_2", "one_phase", 1.5, "source", "n2", kPhase2),
    };
    data.transformer_types = {{"trafo_type", 1.0, 4.0}};
    data.transformers = transformer("trafo_1", "trafo_type", "source", ConnectionType::Wye, 20000.0,
                                    "n3", ConnectionType::Wye, 400.0, 630000.0, kThreePhase);
    data.loads = {
        load("load_1", "n1", kPhases13),
        load("load_2", "n2", kPhase2),
        load("load_3", "n3", kThreePhase, ConnectionType::Delta),
    };
    return data;
}

inline PositionList positions(std::initializer_list<Index> values) {
    return PositionList(values);
}

/// True if `action` throws a ConfigurationError with the given code and element
inline bool throws_with_code(const std::function<void()>& action, const std::string& code,
                             const std::string& element) {
    try {
        action();
    } catch (const ConfigurationError& e) {
        return e.code() == code && e.element() == element;
    }
    return false;
}

inline bool near(Complex a, Complex b, Real tolerance = 1e-12) {
    return std::abs(a - b) <= tolerance;
}

}  // namespace phasegrid::v1::testing
