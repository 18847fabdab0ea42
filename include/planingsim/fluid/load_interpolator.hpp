#pragma once

/**
 * @file load_interpolator.hpp
 * @brief Interface to the fluid-pressure model seen by a substructure
 *
 * A substructure attached to the fluid asks for pressure and shear samples
 * along its own arc length. Cushion pressures upstream and downstream of the
 * wetted region are reported separately.
 */

#include <planingsim/core/types.hpp>
#include <utility>
#include <vector>

namespace pls {
namespace fluid {

/// Ascending arc-length samples spanning a requested range
struct LoadSamples {
    std::vector<Real> s;
    std::vector<Real> pressure;
    std::vector<Real> shear;

    std::size_t size() const { return s.size(); }
};

class LoadInterpolator {
public:
    virtual ~LoadInterpolator() = default;

    /// Samples in [s0, s1], including both end points
    virtual LoadSamples loads_in_range(Real s0, Real s1) const = 0;

    /// Wetted extent in substructure arc length
    virtual std::pair<Real, Real> min_max_wetted_s() const = 0;

    virtual Real upstream_pressure() const = 0;
    virtual Real downstream_pressure() const = 0;

    /// Totals reported by the fluid model itself
    virtual Real drag() const { return 0.0; }
    virtual Real lift() const { return 0.0; }
    virtual Real moment() const { return 0.0; }
};

} // namespace fluid
} // namespace pls
