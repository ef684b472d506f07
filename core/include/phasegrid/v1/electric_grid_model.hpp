#pragma once

// =============================================================================
// PhaseGrid - Electric Grid Model
// =============================================================================
// Assembles the sparse matrices of an unbalanced multi-phase electric grid
// from grid data. Matrices are accumulated element by element during
// construction and are read-only afterwards; concurrent readers need no
// synchronization.
// =============================================================================

#include "phasegrid/v1/diagnostics.hpp"
#include "phasegrid/v1/electric_grid_index.hpp"
#include "phasegrid/v1/grid_data.hpp"
#include "phasegrid/v1/numeric_types.hpp"
#include "phasegrid/v1/options.hpp"
#include "phasegrid/v1/sparse_builder.hpp"

namespace phasegrid::v1 {

struct BranchStampTarget;

class ElectricGridModel {
public:
    /// Build index and matrices; throws ConfigurationError for invalid grid data
    explicit ElectricGridModel(const ElectricGridData& data, ElectricGridModelOptions options = {});

    ElectricGridModel(const ElectricGridModel&) = delete;
    ElectricGridModel& operator=(const ElectricGridModel&) = delete;
    ElectricGridModel(ElectricGridModel&&) = default;
    ElectricGridModel& operator=(ElectricGridModel&&) = default;

    [[nodiscard]] const ElectricGridIndex& index() const { return index_; }
    [[nodiscard]] const ElectricGridModelOptions& options() const { return options_; }
    [[nodiscard]] const DiagnosticLog& diagnostics() const { return diagnostics_; }

    /// node x node
    [[nodiscard]] const ComplexSparseMatrix& node_admittance_matrix() const { return node_admittance_matrix_; }
    /// node x node, wye to delta voltage transformation
    [[nodiscard]] const IntegerSparseMatrix& node_transformation_matrix() const {
        return node_transformation_matrix_;
    }
    /// branch x node
    [[nodiscard]] const ComplexSparseMatrix& branch_admittance_1_matrix() const { return branch_admittance_1_matrix_; }
    [[nodiscard]] const ComplexSparseMatrix& branch_admittance_2_matrix() const { return branch_admittance_2_matrix_; }
    [[nodiscard]] const IntegerSparseMatrix& branch_incidence_1_matrix() const { return branch_incidence_1_matrix_; }
    [[nodiscard]] const IntegerSparseMatrix& branch_incidence_2_matrix() const { return branch_incidence_2_matrix_; }
    /// node x load
    [[nodiscard]] const RealSparseMatrix& load_incidence_wye_matrix() const { return load_incidence_wye_matrix_; }
    [[nodiscard]] const RealSparseMatrix& load_incidence_delta_matrix() const { return load_incidence_delta_matrix_; }

    [[nodiscard]] const ComplexVector& node_voltage_vector_no_load() const { return node_voltage_vector_no_load_; }
    [[nodiscard]] const ComplexVector& load_power_vector_nominal() const { return load_power_vector_nominal_; }

private:
    void add_lines(const ElectricGridData& data, BranchStampTarget& target);
    void add_transformers(const ElectricGridData& data, BranchStampTarget& target);
    void add_node_transformations(const ElectricGridData& data, SparseMatrixBuilder<int>& builder) const;
    void add_loads(const ElectricGridData& data,
                   SparseMatrixBuilder<Real>& wye,
                   SparseMatrixBuilder<Real>& delta);
    void define_voltage_no_load(const ElectricGridData& data);
    void check_floating_nodes();

    /// End-node positions for the phases of a branch element
    PositionList end_node_positions(const std::string& element_name,
                                    const std::string& node_name,
                                    const PhaseConnection& phases,
                                    const ElectricGridData& data) const;

    ElectricGridModelOptions options_;
    DiagnosticLog diagnostics_;
    ElectricGridIndex index_;

    ComplexSparseMatrix node_admittance_matrix_;
    IntegerSparseMatrix node_transformation_matrix_;
    ComplexSparseMatrix branch_admittance_1_matrix_;
    ComplexSparseMatrix branch_admittance_2_matrix_;
    IntegerSparseMatrix branch_incidence_1_matrix_;
    IntegerSparseMatrix branch_incidence_2_matrix_;
    RealSparseMatrix load_incidence_wye_matrix_;
    RealSparseMatrix load_incidence_delta_matrix_;
    ComplexVector node_voltage_vector_no_load_;
    ComplexVector load_power_vector_nominal_;
};

}  // namespace phasegrid::v1
