/**
 * @file arc_length_curve.cpp
 * @brief Arc-length curve and interpolant implementation
 */

#include <planingsim/geometry/arc_length_curve.hpp>
#include <planingsim/geometry/trig.hpp>
#include <algorithm>
#include <cmath>

namespace pls {
namespace geometry {

// ============================================================================
// Interpolant1D
// ============================================================================

Interpolant1D::Interpolant1D(std::vector<Real> xs, std::vector<Real> ys,
                             InterpolationKind kind, bool extrapolate)
    : xs_(std::move(xs))
    , ys_(std::move(ys))
    , kind_(kind)
    , extrapolate_(extrapolate)
{
    PLS_REQUIRE(xs_.size() == ys_.size(), "knot and value arrays differ in length");
    PLS_REQUIRE(xs_.size() >= 2, "at least two knots are required");
    for (std::size_t i = 1; i < xs_.size(); ++i) {
        if (!(xs_[i] > xs_[i - 1])) {
            throw InvalidArgumentError("Interpolation knots must be strictly increasing (knot " +
                                       std::to_string(i) + ")");
        }
    }

    if (xs_.size() == 2) {
        kind_ = InterpolationKind::Linear;
    } else if (xs_.size() == 3 && kind_ == InterpolationKind::Cubic) {
        kind_ = InterpolationKind::Quadratic;
    }

    if (kind_ == InterpolationKind::Cubic) {
        compute_spline_moments();
    }
}

Real Interpolant1D::operator()(Real x) const {
    PLS_ASSERT(!xs_.empty(), "interpolant used before construction");
    const std::size_t n = xs_.size();

    if (x < xs_.front() || x > xs_.back()) {
        if (!extrapolate_) {
            throw OutOfRangeError("Interpolation point " + std::to_string(x) +
                                  " outside [" + std::to_string(xs_.front()) + ", " +
                                  std::to_string(xs_.back()) + "]");
        }
        if (x < xs_.front()) {
            return ys_[0] + (x - xs_[0]) * (ys_[1] - ys_[0]) / (xs_[1] - xs_[0]);
        }
        return ys_[n - 1] + (x - xs_[n - 1]) * (ys_[n - 1] - ys_[n - 2]) /
                                (xs_[n - 1] - xs_[n - 2]);
    }

    return interpolate(x);
}

Real Interpolant1D::interpolate(Real x) const {
    const std::size_t n = xs_.size();
    auto it = std::upper_bound(xs_.begin(), xs_.end(), x);
    std::size_t i = (it == xs_.begin()) ? 0 : static_cast<std::size_t>(it - xs_.begin()) - 1;
    i = std::min(i, n - 2);

    // Knot hits return the stored value exactly
    if (x == xs_[i]) return ys_[i];
    if (x == xs_[i + 1]) return ys_[i + 1];

    switch (kind_) {
        case InterpolationKind::Quadratic:
            return quadratic_piece(i, x);
        case InterpolationKind::Cubic:
            return cubic_piece(i, x);
        case InterpolationKind::Linear:
        default: {
            const Real t = (x - xs_[i]) / (xs_[i + 1] - xs_[i]);
            return ys_[i] + t * (ys_[i + 1] - ys_[i]);
        }
    }
}

Real Interpolant1D::quadratic_piece(std::size_t i, Real x) const {
    // Three-point Lagrange stencil, shifted back at the last interval
    std::size_t j0 = (i + 2 < xs_.size()) ? i : i - 1;
    const Real x0 = xs_[j0], x1 = xs_[j0 + 1], x2 = xs_[j0 + 2];
    const Real y0 = ys_[j0], y1 = ys_[j0 + 1], y2 = ys_[j0 + 2];

    const Real l0 = (x - x1) * (x - x2) / ((x0 - x1) * (x0 - x2));
    const Real l1 = (x - x0) * (x - x2) / ((x1 - x0) * (x1 - x2));
    const Real l2 = (x - x0) * (x - x1) / ((x2 - x0) * (x2 - x1));
    return y0 * l0 + y1 * l1 + y2 * l2;
}

Real Interpolant1D::cubic_piece(std::size_t i, Real x) const {
    const Real h = xs_[i + 1] - xs_[i];
    const Real a = (xs_[i + 1] - x) / h;
    const Real b = (x - xs_[i]) / h;
    return a * ys_[i] + b * ys_[i + 1] +
           ((a * a * a - a) * moments_[i] + (b * b * b - b) * moments_[i + 1]) * h * h / 6.0;
}

void Interpolant1D::compute_spline_moments() {
    // Natural spline: zero curvature at both ends, tridiagonal solve (Thomas)
    const std::size_t n = xs_.size();
    moments_.assign(n, 0.0);
    if (n < 3) return;

    const std::size_t m = n - 2;
    std::vector<Real> lower(m), diag(m), upper(m), rhs(m);
    for (std::size_t k = 0; k < m; ++k) {
        const std::size_t i = k + 1;
        const Real h0 = xs_[i] - xs_[i - 1];
        const Real h1 = xs_[i + 1] - xs_[i];
        lower[k] = h0;
        diag[k] = 2.0 * (h0 + h1);
        upper[k] = h1;
        rhs[k] = 6.0 * ((ys_[i + 1] - ys_[i]) / h1 - (ys_[i] - ys_[i - 1]) / h0);
    }

    for (std::size_t k = 1; k < m; ++k) {
        const Real w = lower[k] / diag[k - 1];
        diag[k] -= w * upper[k - 1];
        rhs[k] -= w * rhs[k - 1];
    }

    moments_[m] = rhs[m - 1] / diag[m - 1];
    for (std::size_t k = m - 1; k-- > 0;) {
        moments_[k + 1] = (rhs[k] - upper[k] * moments_[k + 2]) / diag[k];
    }
}

// ============================================================================
// ArcLengthCurve
// ============================================================================

void ArcLengthCurve::build(const std::vector<Vec2r>& points,
                           InterpolationKind kind, bool extrapolate) {
    PLS_REQUIRE(points.size() >= 2, "a curve needs at least two nodes");

    s_.assign(points.size(), 0.0);
    std::vector<Real> xs(points.size()), ys(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        xs[i] = points[i][0];
        ys[i] = points[i][1];
        if (i > 0) {
            s_[i] = s_[i - 1] + distance(points[i - 1], points[i]);
        }
    }

    if (points.size() == 2) {
        kind = InterpolationKind::Linear;
    } else if (points.size() == 3 && kind != InterpolationKind::Linear) {
        kind = InterpolationKind::Quadratic;
    }

    fx_ = Interpolant1D(s_, std::move(xs), InterpolationKind::Linear, extrapolate);
    fy_ = Interpolant1D(s_, std::move(ys), kind, extrapolate);
}

Vec2r ArcLengthCurve::coordinates(Real s) const {
    return {fx_(s), fy_(s)};
}

Vec2r ArcLengthCurve::normal_vector(Real s) const {
    constexpr Real h = 1.0e-6;
    Real s_lo = s - h;
    Real s_hi = s + h;
    if (!fx_.extrapolates()) {
        s_lo = std::max(s_lo, s_.front());
        s_hi = std::min(s_hi, s_.back());
    }

    const Real dxds = (fx_(s_hi) - fx_(s_lo)) / (s_hi - s_lo);
    const Real dyds = (fy_(s_hi) - fy_(s_lo)) / (s_hi - s_lo);

    return rotate_vec(ang2vecd(atand2(dyds, dxds)), -90.0);
}

} // namespace geometry
} // namespace pls
