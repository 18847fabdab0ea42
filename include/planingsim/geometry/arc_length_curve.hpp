#pragma once

/**
 * @file arc_length_curve.hpp
 * @brief Arc-length parameterization of a planar node chain
 *
 * The curve maps cumulative arc length s to (x, y). Outside the sampled range
 * the value continues along the slope of the nearest boundary segment, so
 * pressure samples reported slightly beyond a substructure's ends still map
 * to sensible coordinates.
 */

#include <planingsim/core/core.hpp>
#include <vector>

namespace pls {
namespace geometry {

// ============================================================================
// One-dimensional interpolant
// ============================================================================

class Interpolant1D {
public:
    Interpolant1D() = default;

    /**
     * @brief Build from strictly increasing knots
     * @param xs Knot abscissae (size >= 2)
     * @param ys Knot values
     * @param kind Piecewise order inside the knot range
     * @param extrapolate Continue linearly outside the range instead of throwing
     */
    Interpolant1D(std::vector<Real> xs, std::vector<Real> ys,
                  InterpolationKind kind, bool extrapolate);

    Real operator()(Real x) const;

    InterpolationKind kind() const { return kind_; }
    bool extrapolates() const { return extrapolate_; }
    Real x_min() const { return xs_.front(); }
    Real x_max() const { return xs_.back(); }
    std::size_t size() const { return xs_.size(); }

private:
    Real interpolate(Real x) const;
    Real quadratic_piece(std::size_t i, Real x) const;
    Real cubic_piece(std::size_t i, Real x) const;
    void compute_spline_moments();

    std::vector<Real> xs_;
    std::vector<Real> ys_;
    std::vector<Real> moments_;  // second derivatives for the cubic spline
    InterpolationKind kind_ = InterpolationKind::Linear;
    bool extrapolate_ = true;
};

// ============================================================================
// Arc-length curve
// ============================================================================

class ArcLengthCurve {
public:
    ArcLengthCurve() = default;

    /**
     * @brief Rebuild from the current node coordinates
     *
     * Two points always interpolate linearly. Three points interpolate
     * quadratically unless linear is requested.
     */
    void build(const std::vector<Vec2r>& points,
               InterpolationKind kind = InterpolationKind::Linear,
               bool extrapolate = true);

    bool empty() const { return s_.empty(); }

    /// (x, y) at arc length s
    Vec2r coordinates(Real s) const;

    Real x(Real s) const { return fx_(s); }
    Real y(Real s) const { return fy_(s); }

    /// Total arc length (last node)
    Real arc_length() const { return s_.empty() ? 0.0 : s_.back(); }

    /// Unit normal: tangent rotated by -90 degrees
    Vec2r normal_vector(Real s) const;

    /// Cumulative arc length at every node
    const std::vector<Real>& node_arc_lengths() const { return s_; }

    InterpolationKind y_kind() const { return fy_.kind(); }

private:
    std::vector<Real> s_;
    Interpolant1D fx_;
    Interpolant1D fy_;
};

} // namespace geometry
} // namespace pls
