#include "phasegrid/v1/electric_grid_model.hpp"

#include "phasegrid/v1/components/line.hpp"
#include "phasegrid/v1/components/transformer.hpp"

#include <Eigen/SparseLU>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace phasegrid::v1 {

namespace {

ElectricGridModelOptions validated(ElectricGridModelOptions options) {
    options.validate();
    return options;
}

/// Phase angle of the symmetric no-load voltage
Real phase_angle(Phase phase) {
    switch (phase) {
        case Phase::One: return 0.0;
        case Phase::Two: return -2.0 * constants::pi / 3.0;
        case Phase::Three: return 2.0 * constants::pi / 3.0;
    }
    return 0.0;
}

/// Delta quantities are labelled by the first phase of their pair: 1-2 -> 1, 2-3 -> 2, 3-1 -> 3
Phase delta_label(const PhaseConnection& phases) {
    if (phases.phase_1 && phases.phase_2) return Phase::One;
    if (phases.phase_2 && phases.phase_3) return Phase::Two;
    return Phase::Three;
}

/// Rows/columns of `matrix` selected by `rows` and `cols`
ComplexSparseMatrix sub_matrix(const ComplexSparseMatrix& matrix,
                               const PositionList& rows,
                               const PositionList& cols) {
    std::vector<Index> row_map(static_cast<std::size_t>(matrix.rows()), -1);
    std::vector<Index> col_map(static_cast<std::size_t>(matrix.cols()), -1);
    for (std::size_t i = 0; i < rows.size(); ++i) row_map[static_cast<std::size_t>(rows[i])] = static_cast<Index>(i);
    for (std::size_t j = 0; j < cols.size(); ++j) col_map[static_cast<std::size_t>(cols[j])] = static_cast<Index>(j);

    SparseMatrixBuilder<Complex> builder(static_cast<Index>(rows.size()), static_cast<Index>(cols.size()));
    for (Eigen::Index k = 0; k < matrix.outerSize(); ++k) {
        for (ComplexSparseMatrix::InnerIterator it(matrix, k); it; ++it) {
            const Index r = row_map[static_cast<std::size_t>(it.row())];
            const Index c = col_map[static_cast<std::size_t>(it.col())];
            if (r >= 0 && c >= 0) builder.accumulate(r, c, it.value());
        }
    }
    return builder.finalize();
}

}  // namespace

ElectricGridModel::ElectricGridModel(const ElectricGridData& data, ElectricGridModelOptions options)
    : options_(validated(std::move(options)))
    , diagnostics_(options_.diagnostic_callback, options_.min_severity)
    , index_(data, &diagnostics_) {

    const Index nodes = index_.node_dimension();
    const Index branches = index_.branch_dimension();
    const Index loads = index_.load_dimension();

    SparseMatrixBuilder<Complex> node_admittance(nodes, nodes);
    SparseMatrixBuilder<int> node_transformation(nodes, nodes);
    SparseMatrixBuilder<Complex> branch_admittance_1(branches, nodes);
    SparseMatrixBuilder<Complex> branch_admittance_2(branches, nodes);
    SparseMatrixBuilder<int> branch_incidence_1(branches, nodes);
    SparseMatrixBuilder<int> branch_incidence_2(branches, nodes);
    SparseMatrixBuilder<Real> load_incidence_wye(nodes, loads);
    SparseMatrixBuilder<Real> load_incidence_delta(nodes, loads);

    BranchStampTarget target{node_admittance, branch_admittance_1, branch_admittance_2,
                             branch_incidence_1, branch_incidence_2};
    add_lines(data, target);
    add_transformers(data, target);
    add_node_transformations(data, node_transformation);
    add_loads(data, load_incidence_wye, load_incidence_delta);

    node_admittance_matrix_ = node_admittance.finalize();
    node_transformation_matrix_ = node_transformation.finalize();
    branch_admittance_1_matrix_ = branch_admittance_1.finalize();
    branch_admittance_2_matrix_ = branch_admittance_2.finalize();
    branch_incidence_1_matrix_ = branch_incidence_1.finalize();
    branch_incidence_2_matrix_ = branch_incidence_2.finalize();
    load_incidence_wye_matrix_ = load_incidence_wye.finalize();
    load_incidence_delta_matrix_ = load_incidence_delta.finalize();

    load_power_vector_nominal_.resize(loads);
    for (const auto& load : data.loads) {
        load_power_vector_nominal_(index_.load(load.load_name)) = Complex(load.active_power, load.reactive_power);
    }

    define_voltage_no_load(data);

    if (options_.check_floating_nodes) {
        check_floating_nodes();
    }

    diagnostics_.info(diag::kModelSummary, data.electric_grid.electric_grid_name,
                      "Grid model: " + std::to_string(node_admittance_matrix_.nonZeros()) +
                          " admittance entries, " + std::to_string(data.lines.size()) + " lines, " +
                          std::to_string(index_.transformer_names().size()) + " transformers, " +
                          std::to_string(loads) + " loads");
}

PositionList ElectricGridModel::end_node_positions(const std::string& element_name,
                                                   const std::string& node_name,
                                                   const PhaseConnection& phases,
                                                   const ElectricGridData& data) const {
    const NodeRecord* node = data.find_node(node_name);
    if (node == nullptr) {
        throw ConfigurationError(diag::kNodeUnknown, element_name,
                                 "Element '" + element_name + "' references unknown node '" + node_name + "'");
    }
    if (!phases.is_subset_of(node->phases)) {
        throw ConfigurationError(diag::kPhaseMismatch, element_name,
                                 "Element '" + element_name + "' connects phases that node '" + node_name +
                                     "' does not have");
    }
    return index_.node_positions(node_name, phases);
}

void ElectricGridModel::add_lines(const ElectricGridData& data, BranchStampTarget& target) {
    for (const auto& record : data.lines) {
        if (record.phases.empty()) continue;

        const LineType* type = data.find_line_type(record.line_type);
        if (type == nullptr) {
            throw ConfigurationError(diag::kLineTypeUnknown, record.line_name,
                                     "Line '" + record.line_name + "' has unknown line type '" +
                                         record.line_type + "'");
        }

        const Line line(record, *type, options_.base_frequency);

        const PositionList node_1 = end_node_positions(record.line_name, record.node_1_name, record.phases, data);
        const PositionList node_2 = end_node_positions(record.line_name, record.node_2_name, record.phases, data);
        line.stamp(target, node_1, node_2, index_.line_branch(record.line_name));
    }
}

void ElectricGridModel::add_transformers(const ElectricGridData& data, BranchStampTarget& target) {
    for (const auto* winding_1 : data.one_winding_transformers()) {
        const std::string& name = winding_1->transformer_name;
        if (winding_1->phases.empty()) continue;

        const auto windings = data.transformer_windings(name);
        const auto winding_2_it = std::find_if(windings.begin(), windings.end(),
                                               [](const TransformerWindingRecord* w) { return w->winding == 2; });
        if (windings.size() != 2 || winding_2_it == windings.end()) {
            throw ConfigurationError(diag::kTransformerWindings, name,
                                     "Transformer '" + name + "' must have exactly windings 1 and 2, got " +
                                         std::to_string(windings.size()) + " winding records");
        }
        const TransformerWindingRecord& winding_2 = **winding_2_it;

        const TransformerType* type = data.find_transformer_type(winding_1->transformer_type);
        if (type == nullptr) {
            throw ConfigurationError(diag::kTransformerTypeUnknown, name,
                                     "Transformer '" + name + "' has unknown transformer type '" +
                                         winding_1->transformer_type + "'");
        }

        const Transformer transformer(*winding_1, winding_2, *type);

        const PositionList node_1 = end_node_positions(name, winding_1->node_name, winding_1->phases, data);
        const PositionList node_2 = end_node_positions(name, winding_2.node_name, winding_2.phases, data);
        transformer.stamp(target, node_1, node_2, index_.transformer_branch(name));
    }
}

void ElectricGridModel::add_node_transformations(const ElectricGridData& data,
                                                 SparseMatrixBuilder<int>& builder) const {
    // Wye to delta (https://doi.org/10.1109/TPWRS.2018.2823277)
    Eigen::Matrix3i entries;
    entries << 1, -1, 0,
               0, 1, -1,
               -1, 0, 1;

    for (const auto& node : data.nodes) {
        if (node.phases.empty()) continue;
        builder.insert_sub_matrix(reduce_to_phases(entries, node.phases),
                                  index_.node(node.node_name),
                                  index_.node(node.node_name));
    }
}

void ElectricGridModel::add_loads(const ElectricGridData& data,
                                  SparseMatrixBuilder<Real>& wye,
                                  SparseMatrixBuilder<Real>& delta) {
    for (const auto& load : data.loads) {
        const Index column = index_.load(load.load_name);
        const int n_phases = load.phases.count();

        if (n_phases == 0) {
            diagnostics_.warning(diag::kZeroPhaseElement, load.load_name,
                                 "Load '" + load.load_name + "' has no connected phase");
            continue;
        }

        const PositionList& positions = index_.load_nodes(load.load_name);
        if (static_cast<int>(positions.size()) != n_phases) {
            const std::string message = "Load '" + load.load_name + "' does not resolve on node '" +
                                        load.node_name + "' for all of its phases";
            if (options_.require_load_placement) {
                throw ConfigurationError(diag::kLoadUnplaced, load.load_name, message);
            }
            diagnostics_.warning(diag::kLoadNotPlaced, load.load_name, message);
            continue;
        }

        if (load.connection == ConnectionType::Wye) {
            // Balanced across the connected phases
            for (Index row : positions) {
                wye.accumulate(row, column, 1.0 / n_phases);
            }
        } else if (n_phases == 3) {
            for (Index row : positions) {
                delta.accumulate(row, column, 1.0 / 3.0);
            }
        } else if (n_phases == 2) {
            PhaseConnection label;
            switch (delta_label(load.phases)) {
                case Phase::One: label.phase_1 = true; break;
                case Phase::Two: label.phase_2 = true; break;
                case Phase::Three: label.phase_3 = true; break;
            }
            for (Index row : index_.node_positions(load.node_name, label)) {
                delta.accumulate(row, column, 1.0);
            }
        } else {
            throw ConfigurationError(diag::kLoadConnection, load.load_name,
                                     "Delta load '" + load.load_name + "' needs at least two phases");
        }
    }
}

void ElectricGridModel::define_voltage_no_load(const ElectricGridData& data) {
    const Index nodes = index_.node_dimension();
    ComplexVector by_definition(nodes);
    for (Index row = 0; row < nodes; ++row) {
        const NodePhase& entry = index_.nodes_phases()[static_cast<std::size_t>(row)];
        const NodeRecord* node = data.find_node(entry.node_name);
        by_definition(row) = std::polar(node->voltage / constants::sqrt3, phase_angle(entry.phase));
    }

    if (options_.voltage_no_load_method == VoltageNoLoadMethod::ByDefinition) {
        node_voltage_vector_no_load_ = std::move(by_definition);
        return;
    }

    const PositionList& source = index_.node_by_node_type().at(NodeType::Source);
    const PositionList& no_source = index_.node_by_node_type().at(NodeType::NoSource);

    ComplexVector voltage_source(static_cast<Eigen::Index>(source.size()));
    for (std::size_t i = 0; i < source.size(); ++i) {
        voltage_source(static_cast<Eigen::Index>(i)) = by_definition(source[i]);
    }

    node_voltage_vector_no_load_ = by_definition;
    if (no_source.empty()) return;

    // Y_nn * V_n = -Y_ns * V_s
    ComplexSparseMatrix admittance_no_source = sub_matrix(node_admittance_matrix_, no_source, no_source);
    const ComplexSparseMatrix admittance_source_to_no_source = sub_matrix(node_admittance_matrix_, no_source, source);
    const ComplexVector rhs = -(admittance_source_to_no_source * voltage_source);

    Eigen::SparseLU<ComplexSparseMatrix, Eigen::COLAMDOrdering<int>> solver;
    solver.analyzePattern(admittance_no_source);
    solver.factorize(admittance_no_source);
    if (solver.info() != Eigen::Success) {
        throw ConfigurationError(diag::kNoLoadVoltage, data.electric_grid.electric_grid_name,
                                 "No-load voltage calculation failed: nodal admittance matrix of the "
                                 "non-source nodes is singular");
    }
    const ComplexVector voltage_no_source = solver.solve(rhs);
    if (solver.info() != Eigen::Success) {
        throw ConfigurationError(diag::kNoLoadVoltage, data.electric_grid.electric_grid_name,
                                 "No-load voltage calculation failed to solve");
    }

    for (std::size_t i = 0; i < no_source.size(); ++i) {
        node_voltage_vector_no_load_(no_source[i]) = voltage_no_source(static_cast<Eigen::Index>(i));
    }
}

void ElectricGridModel::check_floating_nodes() {
    for (Index row : empty_rows(node_admittance_matrix_)) {
        const NodePhase& entry = index_.nodes_phases()[static_cast<std::size_t>(row)];
        diagnostics_.warning(diag::kFloatingNode, entry.node_name,
                             "Phase " + phase_label(entry.phase) + " of node '" + entry.node_name +
                                 "' has no admittance entry");
    }
}

}  // namespace phasegrid::v1
