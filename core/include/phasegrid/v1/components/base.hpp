#pragma once

// =============================================================================
// PhaseGrid - CRTP Branch Element Base
// =============================================================================

#include "phasegrid/v1/numeric_types.hpp"
#include "phasegrid/v1/sparse_builder.hpp"

#include <string>
#include <utility>

namespace phasegrid::v1 {

/// Two-port admittance sub-matrices of a branch element, sized to its connected phases
struct TwoPortAdmittance {
    ComplexMatrix y11;
    ComplexMatrix y12;
    ComplexMatrix y21;
    ComplexMatrix y22;
};

/// Global matrices that branch elements are stamped into
struct BranchStampTarget {
    SparseMatrixBuilder<Complex>& node_admittance;
    SparseMatrixBuilder<Complex>& branch_admittance_1;
    SparseMatrixBuilder<Complex>& branch_admittance_2;
    SparseMatrixBuilder<int>& branch_incidence_1;
    SparseMatrixBuilder<int>& branch_incidence_2;
};

/// Rows/columns of a 3x3 phase matrix for the connected phases
template<typename Derived>
[[nodiscard]] auto reduce_to_phases(const Eigen::MatrixBase<Derived>& full, const PhaseConnection& phases) {
    const auto connected = phases.phases();
    const auto n = static_cast<Eigen::Index>(connected.size());
    Eigen::Matrix<typename Derived::Scalar, Eigen::Dynamic, Eigen::Dynamic> reduced(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            reduced(i, j) = full(phase_offset(connected[static_cast<std::size_t>(i)]),
                                 phase_offset(connected[static_cast<std::size_t>(j)]));
        }
    }
    return reduced;
}

/// CRTP base class for branch elements (lines, transformers)
/// Derived classes must implement:
///   - TwoPortAdmittance admittance_impl() const
template<typename Derived>
class BranchElementBase {
public:
    [[nodiscard]] TwoPortAdmittance admittance() const { return derived().admittance_impl(); }

    /// Accumulate the element into the global matrices.
    /// node_1 / node_2 are the end-node positions of the connected phases, branch the element rows.
    void stamp(BranchStampTarget& target,
               const PositionList& node_1,
               const PositionList& node_2,
               const PositionList& branch) const {
        const TwoPortAdmittance y = admittance();

        target.node_admittance.insert_sub_matrix(y.y11, node_1, node_1);
        target.node_admittance.insert_sub_matrix(y.y12, node_1, node_2);
        target.node_admittance.insert_sub_matrix(y.y21, node_2, node_1);
        target.node_admittance.insert_sub_matrix(y.y22, node_2, node_2);

        target.branch_admittance_1.insert_sub_matrix(y.y11, branch, node_1);
        target.branch_admittance_1.insert_sub_matrix(y.y12, branch, node_2);
        target.branch_admittance_2.insert_sub_matrix(y.y21, branch, node_1);
        target.branch_admittance_2.insert_sub_matrix(y.y22, branch, node_2);

        const auto n = static_cast<Eigen::Index>(branch.size());
        const Eigen::MatrixXi identity = Eigen::MatrixXi::Identity(n, n);
        target.branch_incidence_1.insert_sub_matrix(identity, branch, node_1);
        target.branch_incidence_2.insert_sub_matrix(identity, branch, node_2);
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const PhaseConnection& phases() const { return phases_; }
    [[nodiscard]] int phase_count() const { return phases_.count(); }

protected:
    BranchElementBase(std::string name, PhaseConnection phases)
        : name_(std::move(name))
        , phases_(phases) {}

    const Derived& derived() const { return static_cast<const Derived&>(*this); }

private:
    std::string name_;
    PhaseConnection phases_;
};

}  // namespace phasegrid::v1
