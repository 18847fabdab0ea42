/**
 * @file hydrostatic_load_model.cpp
 * @brief Hydrostatic reference fluid model
 */

#include <planingsim/fluid/hydrostatic_load_model.hpp>
#include <algorithm>

namespace pls {
namespace fluid {

Real HydrostaticLoadModel::pressure_at(Real s) const {
    const Real depth = config_.water_level - curve_.y(s);
    return std::max(config_.rho * config_.g * depth, 0.0) + config_.uniform_pressure;
}

LoadSamples HydrostaticLoadModel::loads_in_range(Real s0, Real s1) const {
    const int n = std::max(config_.samples_per_span, 2);

    LoadSamples samples;
    samples.s.resize(n);
    samples.pressure.resize(n);
    samples.shear.assign(n, 0.0);

    for (int i = 0; i < n; ++i) {
        // Exact end points so element spans line up with node arc lengths
        const Real s = (i == n - 1) ? s1 : s0 + (s1 - s0) * static_cast<Real>(i) / (n - 1);
        samples.s[i] = s;
        samples.pressure[i] = pressure_at(s);
    }
    return samples;
}

std::pair<Real, Real> HydrostaticLoadModel::min_max_wetted_s() const {
    if (curve_.empty()) {
        return {0.0, 0.0};
    }

    const Real total = curve_.arc_length();
    const int n = std::max(config_.samples_per_span, 2) * 20;

    bool found = false;
    Real s_min = 0.0;
    Real s_max = 0.0;
    for (int i = 0; i < n; ++i) {
        const Real s = total * static_cast<Real>(i) / (n - 1);
        if (curve_.y(s) < config_.water_level) {
            if (!found) {
                s_min = s;
                found = true;
            }
            s_max = s;
        }
    }
    return {s_min, s_max};
}

} // namespace fluid
} // namespace pls
