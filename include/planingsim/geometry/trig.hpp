#pragma once

/**
 * @file trig.hpp
 * @brief Degree-based trigonometry and small 2D vector helpers
 *
 * Angles exchanged with the rest of the library (trim, hinge angle, element
 * orientation) are in degrees. Rotations are counter-clockwise for positive
 * angles.
 */

#include <planingsim/core/types.hpp>
#include <planingsim/core/exception.hpp>
#include <cmath>
#include <vector>

namespace pls {
namespace geometry {

inline Real radians(Real deg) { return deg * constants::pi<Real> / 180.0; }
inline Real degrees(Real rad) { return rad * 180.0 / constants::pi<Real>; }

inline Real cosd(Real ang) { return std::cos(radians(ang)); }
inline Real sind(Real ang) { return std::sin(radians(ang)); }

inline Real atand2(Real dy, Real dx) { return degrees(std::atan2(dy, dx)); }

/// Unit vector at an angle given in radians
inline Vec2r ang2vec(Real ang) { return {std::cos(ang), std::sin(ang)}; }

/// Unit vector at an angle given in degrees
inline Vec2r ang2vecd(Real ang) { return ang2vec(radians(ang)); }

/// Rotate a 2D vector by ang degrees
inline Vec2r rotate_vec(const Vec2r& v, Real ang) {
    const Real c = cosd(ang);
    const Real s = sind(ang);
    return {c * v[0] - s * v[1], s * v[0] + c * v[1]};
}

/// Rotate a point about a center by ang degrees
inline Vec2r rotate_point(const Vec2r& pt, const Vec2r& center, Real ang) {
    Vec2r rel{pt[0] - center[0], pt[1] - center[1]};
    Vec2r r = rotate_vec(rel, ang);
    return {r[0] + center[0], r[1] + center[1]};
}

/// z-component of the cross product of two planar vectors
inline Real cross2(const Vec2r& a, const Vec2r& b) {
    return a[0] * b[1] - a[1] * b[0];
}

inline Real norm(const Vec2r& v) {
    return std::sqrt(v[0] * v[0] + v[1] * v[1]);
}

inline Real distance(const Vec2r& a, const Vec2r& b) {
    return norm({b[0] - a[0], b[1] - a[1]});
}

/**
 * @brief Trapezoid-rule integral of y(x) over sampled points
 */
inline Real integrate(const std::vector<Real>& x, const std::vector<Real>& y) {
    PLS_REQUIRE(x.size() == y.size(), "sample arrays must have equal length");
    Real sum = 0.0;
    for (std::size_t i = 1; i < x.size(); ++i) {
        sum += 0.5 * (y[i] + y[i - 1]) * (x[i] - x[i - 1]);
    }
    return sum;
}

} // namespace geometry
} // namespace pls
