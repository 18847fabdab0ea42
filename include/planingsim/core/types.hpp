#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <array>
#include <limits>
#include <type_traits>

namespace pls {

// ============================================================================
// Precision Types
// ============================================================================

#ifdef PLANINGSIM_REAL
using Real = PLANINGSIM_REAL;
#else
using Real = double;  // Default to double precision
#endif

// Integer types
using Index = std::size_t;
using Int = std::int32_t;
using Int64 = std::int64_t;

// ============================================================================
// Vector and Matrix Types
// ============================================================================

template<typename T, std::size_t N>
using Array = std::array<T, N>;

template<typename T>
using Vec2 = Array<T, 2>;

template<typename T>
using Vec4 = Array<T, 4>;

using Vec2r = Vec2<Real>;
using Vec4r = Vec4<Real>;
using Vec2b = Vec2<bool>;

// Row-major 2x2 and 4x4 matrices (element level)
using Mat2r = Array<Real, 4>;
using Mat4r = Array<Real, 16>;

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template<typename T>
using UniquePtr = std::unique_ptr<T>;

template<typename T>
using SharedPtr = std::shared_ptr<T>;

template<typename T, typename... Args>
inline UniquePtr<T> make_unique(Args&&... args) {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

// ============================================================================
// Enumeration Types
// ============================================================================

enum class SubstructureType {
    Rigid,
    Flexible,
    TorsionalSpring
};

enum class MotionMethod {
    Fixed,           ///< No free DOF: zero displacement
    Secant,          ///< Generic root finder, diagonal secant update
    BroydenLibrary,  ///< Generic root finder, rank-one Broyden update
    Broyden,         ///< Explicit Jacobian with stagnation rebuild
    Physical,        ///< Explicit time marching with mass and damping
    NewmarkBeta,     ///< Newmark-beta integration
    PhysicalNoMass   ///< Predictor/corrector without inertia
};

enum class ForceMethod {
    Integrated,  ///< Integrate fluid + cushion pressure
    Assumed,     ///< Integrate fluid only, cushion lift assumed
    Matched      ///< Use the fluid model's reported totals
};

enum class PressureMethod {
    Constant,
    Hydrostatic
};

enum class InterpolationKind {
    Linear,
    Quadratic,
    Cubic
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {

template<typename T = Real>
inline constexpr T pi = T(3.14159265358979323846);

template<typename T = Real>
inline constexpr T epsilon = std::is_same_v<T, float> ? T(1e-6) : T(1e-12);

template<typename T = Real>
inline constexpr T infinity = std::numeric_limits<T>::infinity();

template<typename T = Real>
inline constexpr T nan = std::numeric_limits<T>::quiet_NaN();

} // namespace constants

// ============================================================================
// Utility Functions
// ============================================================================

inline const char* to_string(SubstructureType type) {
    switch (type) {
        case SubstructureType::Rigid: return "rigid";
        case SubstructureType::Flexible: return "flexible";
        case SubstructureType::TorsionalSpring: return "torsionalSpring";
        default: return "unknown";
    }
}

inline const char* to_string(MotionMethod method) {
    switch (method) {
        case MotionMethod::Fixed: return "Fixed";
        case MotionMethod::Secant: return "Secant";
        case MotionMethod::BroydenLibrary: return "BroydenNew";
        case MotionMethod::Broyden: return "Broyden";
        case MotionMethod::Physical: return "Physical";
        case MotionMethod::NewmarkBeta: return "Newmark-Beta";
        case MotionMethod::PhysicalNoMass: return "PhysicalNoMass";
        default: return "Unknown";
    }
}

inline const char* to_string(ForceMethod method) {
    switch (method) {
        case ForceMethod::Integrated: return "integrated";
        case ForceMethod::Assumed: return "assumed";
        case ForceMethod::Matched: return "matched";
        default: return "unknown";
    }
}

inline const char* to_string(InterpolationKind kind) {
    switch (kind) {
        case InterpolationKind::Linear: return "linear";
        case InterpolationKind::Quadratic: return "quadratic";
        case InterpolationKind::Cubic: return "cubic";
        default: return "unknown";
    }
}

} // namespace pls
