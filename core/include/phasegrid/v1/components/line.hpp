#pragma once

#include "phasegrid/v1/components/base.hpp"
#include "phasegrid/v1/diagnostics.hpp"
#include "phasegrid/v1/grid_data.hpp"

#include <array>
#include <cmath>
#include <vector>

namespace phasegrid::v1 {

// =============================================================================
// Line (two-port pi-equivalent, multi-phase)
// =============================================================================

/// Multi-phase line with series impedance and two half shunt susceptances.
/// Y11 = Y22 = Ys + Ysh, Y12 = Y21 = -Ys (https://doi.org/10.1109/TPWRS.2017.2728618)
class Line : public BranchElementBase<Line> {
public:
    using Base = BranchElementBase<Line>;

    /// Expansion of the flattened triangular entries into a full symmetric 3x3 matrix
    static constexpr std::array<std::array<int, 3>, 3> kCouplingIndex = {{
        {0, 1, 3},
        {1, 2, 4},
        {3, 4, 5},
    }};

    /// Flattened position of the 1-based entry (row, col); symmetric in its arguments
    [[nodiscard]] static constexpr int flat_position(int row, int col) {
        return kCouplingIndex[static_cast<std::size_t>(row - 1)][static_cast<std::size_t>(col - 1)];
    }

    Line(const LineRecord& record, const LineType& type, Real base_frequency)
        : Base(record.line_name, record.phases)
        , length_(record.length)
        , base_frequency_(base_frequency) {
        const int n = record.phases.count();
        if (type.n_phases != n) {
            throw ConfigurationError(diag::kPhaseMismatch, record.line_name,
                                     "Line '" + record.line_name + "' connects " + std::to_string(n) +
                                         " phases but line type '" + type.line_type + "' has " +
                                         std::to_string(type.n_phases));
        }

        if (!std::isfinite(length_) || length_ <= 0.0) {
            throw ConfigurationError(diag::kLineLength, record.line_name,
                                     "Line '" + record.line_name + "' needs a positive length, got " +
                                         std::to_string(length_));
        }

        const auto flat = flatten_entries(record.line_name, type);
        resistance_ = expand(flat.r, n);
        reactance_ = expand(flat.x, n);
        capacitance_ = expand(flat.c, n);

        const ComplexMatrix impedance =
            (resistance_.cast<Complex>() + Complex(0.0, 1.0) * reactance_.cast<Complex>()) * length_;
        Eigen::FullPivLU<ComplexMatrix> lu(impedance);
        if (!lu.isInvertible()) {
            throw ConfigurationError(diag::kSingularImpedance, record.line_name,
                                     "Series impedance of line '" + record.line_name + "' is singular");
        }
        series_admittance_ = lu.inverse();

        // Capacitance in nF; half of the shunt susceptance sits at each end
        shunt_admittance_ = capacitance_.cast<Complex>() *
                            (2.0 * constants::pi * base_frequency_ * constants::nanofarad) *
                            Complex(0.0, 0.5) * length_;
    }

    [[nodiscard]] TwoPortAdmittance admittance_impl() const {
        return {
            series_admittance_ + shunt_admittance_,
            -series_admittance_,
            -series_admittance_,
            series_admittance_ + shunt_admittance_,
        };
    }

    [[nodiscard]] Real length() const { return length_; }
    [[nodiscard]] Real base_frequency() const { return base_frequency_; }
    [[nodiscard]] const RealMatrix& resistance_matrix() const { return resistance_; }
    [[nodiscard]] const RealMatrix& reactance_matrix() const { return reactance_; }
    [[nodiscard]] const RealMatrix& capacitance_matrix() const { return capacitance_; }
    [[nodiscard]] const ComplexMatrix& series_admittance() const { return series_admittance_; }
    [[nodiscard]] const ComplexMatrix& shunt_admittance() const { return shunt_admittance_; }

private:
    struct FlatEntries {
        std::vector<Real> r;
        std::vector<Real> x;
        std::vector<Real> c;
    };

    static FlatEntries flatten_entries(const std::string& line_name, const LineType& type) {
        const int n = type.n_phases;
        const auto size = static_cast<std::size_t>(n * (n + 1) / 2);
        FlatEntries flat{std::vector<Real>(size, 0.0), std::vector<Real>(size, 0.0), std::vector<Real>(size, 0.0)};
        std::vector<bool> filled(size, false);

        for (const auto& entry : type.entries) {
            if (entry.row < 1 || entry.col < 1 || entry.row > n || entry.col > n) {
                throw ConfigurationError(diag::kLineTypeEntries, line_name,
                                         "Line type '" + type.line_type + "' has entry (" +
                                             std::to_string(entry.row) + ", " + std::to_string(entry.col) +
                                             ") outside its " + std::to_string(n) + " phases");
            }
            const auto k = static_cast<std::size_t>(flat_position(entry.row, entry.col));
            if (filled[k]) {
                throw ConfigurationError(diag::kLineTypeEntries, line_name,
                                         "Line type '" + type.line_type + "' defines entry (" +
                                             std::to_string(entry.row) + ", " + std::to_string(entry.col) +
                                             ") twice");
            }
            filled[k] = true;
            flat.r[k] = entry.r;
            flat.x[k] = entry.x;
            flat.c[k] = entry.c;
        }

        for (bool is_filled : filled) {
            if (!is_filled) {
                throw ConfigurationError(diag::kLineTypeEntries, line_name,
                                         "Line type '" + type.line_type + "' needs " + std::to_string(size) +
                                             " matrix entries, got " + std::to_string(type.entries.size()));
            }
        }
        return flat;
    }

    static RealMatrix expand(const std::vector<Real>& flat, int n) {
        RealMatrix full(n, n);
        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < n; ++j) {
                full(i, j) = flat[static_cast<std::size_t>(kCouplingIndex[static_cast<std::size_t>(i)]
                                                                         [static_cast<std::size_t>(j)])];
            }
        }
        return full;
    }

    Real length_;
    Real base_frequency_;
    RealMatrix resistance_;
    RealMatrix reactance_;
    RealMatrix capacitance_;
    ComplexMatrix series_admittance_;
    ComplexMatrix shunt_admittance_;
};

}  // namespace phasegrid::v1
