#pragma once

/**
 * @file hydrostatic_load_model.hpp
 * @brief Reference fluid model: hydrostatic pressure below a flat free surface
 *
 * p(s) = max(rho g (h_wl - y(s)), 0) + p_uniform, zero shear.
 *
 * Used for still-water checks of a model before coupling it to a flow solver.
 */

#include <planingsim/fluid/load_interpolator.hpp>
#include <planingsim/geometry/arc_length_curve.hpp>

namespace pls {
namespace fluid {

class HydrostaticLoadModel : public LoadInterpolator {
public:
    struct Config {
        Real rho = 998.2;
        Real g = 9.81;
        Real water_level = 0.0;
        Real uniform_pressure = 0.0;
        Real upstream_pressure = 0.0;
        Real downstream_pressure = 0.0;
        int samples_per_span = 5;
    };

    /// The curve is owned by the substructure and must outlive the model
    HydrostaticLoadModel(const geometry::ArcLengthCurve& curve, const Config& config)
        : curve_(curve), config_(config) {}

    LoadSamples loads_in_range(Real s0, Real s1) const override;
    std::pair<Real, Real> min_max_wetted_s() const override;

    Real upstream_pressure() const override { return config_.upstream_pressure; }
    Real downstream_pressure() const override { return config_.downstream_pressure; }

    Real drag() const override { return drag_; }
    Real lift() const override { return lift_; }
    Real moment() const override { return moment_; }

    /// Totals returned to substructures using the matched force method
    void set_reported_totals(Real drag, Real lift, Real moment) {
        drag_ = drag;
        lift_ = lift;
        moment_ = moment;
    }

    Real pressure_at(Real s) const;

    const Config& config() const { return config_; }

private:
    const geometry::ArcLengthCurve& curve_;
    Config config_;
    Real drag_ = 0.0;
    Real lift_ = 0.0;
    Real moment_ = 0.0;
};

} // namespace fluid
} // namespace pls
