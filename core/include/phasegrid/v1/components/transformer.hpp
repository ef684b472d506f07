#pragma once

#include "phasegrid/v1/components/base.hpp"
#include "phasegrid/v1/diagnostics.hpp"
#include "phasegrid/v1/grid_data.hpp"

#include <cmath>

namespace phasegrid::v1 {

// =============================================================================
// Transformer (two-winding, three-phase)
// =============================================================================

/// Two-winding transformer between the nodes of winding 1 and winding 2.
/// Element matrices follow https://doi.org/10.1109/TPWRS.2017.2728618 for the
/// wye-wye, delta-wye, wye-delta and delta-delta connections.
class Transformer : public BranchElementBase<Transformer> {
public:
    using Base = BranchElementBase<Transformer>;

    Transformer(const TransformerWindingRecord& winding_1,
                const TransformerWindingRecord& winding_2,
                const TransformerType& type)
        : Base(winding_1.transformer_name, winding_1.phases)
        , connection_1_(winding_1.connection)
        , connection_2_(winding_2.connection) {
        const std::string& name = winding_1.transformer_name;
        if (winding_1.phases != winding_2.phases) {
            throw ConfigurationError(diag::kPhaseMismatch, name,
                                     "Windings of transformer '" + name + "' connect different phases");
        }
        if (!(winding_1.voltage > 0.0) || !(winding_2.voltage > 0.0) || !(winding_2.apparent_power > 0.0)) {
            throw ConfigurationError(diag::kTransformerRating, name,
                                     "Transformer '" + name + "' needs positive winding voltages and apparent power");
        }

        const Complex impedance_pu(2.0 * type.resistance_percentage / 100.0, type.reactance_percentage / 100.0);
        if (impedance_pu == Complex(0.0, 0.0)) {
            throw ConfigurationError(diag::kSingularImpedance, name,
                                     "Transformer type '" + type.transformer_type + "' has zero impedance");
        }
        const Real base_impedance = winding_2.voltage * winding_2.voltage / winding_2.apparent_power;
        admittance_ = 1.0 / (impedance_pu * base_impedance);

        // TODO: Include the tap position once winding records carry it.
        turn_ratio_ = winding_1.voltage / winding_2.voltage;
    }

    /// Phase-coupling factors of the winding connections
    [[nodiscard]] static RealMatrix factor_1() { return RealMatrix::Identity(3, 3); }

    [[nodiscard]] static RealMatrix factor_2() {
        RealMatrix f(3, 3);
        f << 2.0, -1.0, -1.0,
             -1.0, 2.0, -1.0,
             -1.0, -1.0, 2.0;
        return f / 3.0;
    }

    [[nodiscard]] static RealMatrix factor_3() {
        RealMatrix f(3, 3);
        f << -1.0, 1.0, 0.0,
             0.0, -1.0, 1.0,
             1.0, 0.0, -1.0;
        return f / constants::sqrt3;
    }

    [[nodiscard]] TwoPortAdmittance admittance_impl() const {
        const RealMatrix f1 = factor_1();
        const RealMatrix f2 = factor_2();
        const RealMatrix f3 = factor_3();
        const Real t = turn_ratio_;

        RealMatrix y11;
        RealMatrix y12;
        RealMatrix y21;
        RealMatrix y22;
        if (connection_1_ == ConnectionType::Wye && connection_2_ == ConnectionType::Wye) {
            y11 = f1 / (t * t);
            y12 = -f1 / t;
            y21 = -f1 / t;
            y22 = f1;
        } else if (connection_1_ == ConnectionType::Delta && connection_2_ == ConnectionType::Wye) {
            y11 = f2 / (t * t);
            y12 = -f3 / t;
            y21 = -f3.transpose() / t;
            y22 = f1;
        } else if (connection_1_ == ConnectionType::Wye && connection_2_ == ConnectionType::Delta) {
            y11 = f1 / (t * t);
            y12 = -f3.transpose() / t;
            y21 = -f3 / t;
            y22 = f2;
        } else {
            y11 = f2 / (t * t);
            y12 = -f2 / t;
            y21 = -f2 / t;
            y22 = f2;
        }

        return {
            reduce_to_phases(y11.cast<Complex>() * admittance_, phases()),
            reduce_to_phases(y12.cast<Complex>() * admittance_, phases()),
            reduce_to_phases(y21.cast<Complex>() * admittance_, phases()),
            reduce_to_phases(y22.cast<Complex>() * admittance_, phases()),
        };
    }

    [[nodiscard]] Complex series_admittance() const { return admittance_; }
    [[nodiscard]] Real turn_ratio() const { return turn_ratio_; }
    [[nodiscard]] ConnectionType connection_1() const { return connection_1_; }
    [[nodiscard]] ConnectionType connection_2() const { return connection_2_; }

private:
    ConnectionType connection_1_;
    ConnectionType connection_2_;
    Complex admittance_;
    Real turn_ratio_ = 1.0;
};

}  // namespace phasegrid::v1
