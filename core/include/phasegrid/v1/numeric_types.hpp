#pragma once

// =============================================================================
// PhaseGrid - Numeric Types
// =============================================================================
// Scalar, index and matrix aliases shared by the grid index and grid model.
// Sparse matrices are column-major Eigen matrices assembled from triplets.
// =============================================================================

#include <Eigen/Dense>
#include <Eigen/Sparse>

#include <array>
#include <complex>
#include <cstdint>
#include <numbers>
#include <string>
#include <string_view>
#include <vector>

namespace phasegrid::v1 {

using Real = double;
using Complex = std::complex<Real>;
using Index = std::int32_t;

// Sparse matrix types (CSC, finalized from triplets)
using ComplexSparseMatrix = Eigen::SparseMatrix<Complex, Eigen::ColMajor>;
using RealSparseMatrix = Eigen::SparseMatrix<Real, Eigen::ColMajor>;
using IntegerSparseMatrix = Eigen::SparseMatrix<int, Eigen::ColMajor>;

// Dense types for per-element sub-matrices
using RealMatrix = Eigen::MatrixXd;
using ComplexMatrix = Eigen::MatrixXcd;
using ComplexVector = Eigen::VectorXcd;

/// Ordered list of zero-based positions into a flattened (element, phase) table
using PositionList = std::vector<Index>;

// =============================================================================
// Phases
// =============================================================================

enum class Phase : int {
    One = 1,
    Two = 2,
    Three = 3,
};

inline constexpr std::array<Phase, 3> kAllPhases = {Phase::One, Phase::Two, Phase::Three};

/// Zero-based offset of a phase within a 3x3 phase-coupling matrix
[[nodiscard]] constexpr int phase_offset(Phase phase) {
    return static_cast<int>(phase) - 1;
}

[[nodiscard]] inline std::string phase_label(Phase phase) {
    return std::to_string(static_cast<int>(phase));
}

/// Per-phase connection flags of a node, branch or load
struct PhaseConnection {
    bool phase_1 = false;
    bool phase_2 = false;
    bool phase_3 = false;

    [[nodiscard]] static constexpr PhaseConnection all() { return {true, true, true}; }

    [[nodiscard]] constexpr bool is_connected(Phase phase) const {
        switch (phase) {
            case Phase::One: return phase_1;
            case Phase::Two: return phase_2;
            case Phase::Three: return phase_3;
        }
        return false;
    }

    [[nodiscard]] constexpr int count() const {
        return static_cast<int>(phase_1) + static_cast<int>(phase_2) + static_cast<int>(phase_3);
    }

    [[nodiscard]] constexpr bool empty() const { return count() == 0; }

    /// Connected phases in ascending order
    [[nodiscard]] std::vector<Phase> phases() const {
        std::vector<Phase> result;
        result.reserve(3);
        for (Phase phase : kAllPhases) {
            if (is_connected(phase)) result.push_back(phase);
        }
        return result;
    }

    /// True if every phase connected here is also connected in `other`
    [[nodiscard]] constexpr bool is_subset_of(const PhaseConnection& other) const {
        return (!phase_1 || other.phase_1) && (!phase_2 || other.phase_2) && (!phase_3 || other.phase_3);
    }

    friend constexpr bool operator==(const PhaseConnection&, const PhaseConnection&) = default;
};

namespace constants {
inline constexpr Real pi = std::numbers::pi_v<Real>;
inline constexpr Real sqrt3 = std::numbers::sqrt3_v<Real>;
inline constexpr Real default_base_frequency = 60.0;  // Hz
inline constexpr Real nanofarad = 1e-9;
}  // namespace constants

}  // namespace phasegrid::v1
