#pragma once

/**
 * @file motion_strategy.hpp
 * @brief Rigid-body (draft, trim) displacement strategies
 *
 * Each strategy turns the body's current force imbalance into a step
 * (d_draft, d_trim) and owns whatever history it needs between calls.
 *
 * Strategies:
 * - FixedMotion:          zero step (no free DOF)
 * - RootFinderMotion:     secant or Broyden root finder on (L - W, M - W (xG - xR))
 * - BroydenMotion:        explicit 2x2 Jacobian, rank-one updates, rebuild on stagnation
 * - PhysicalMotion:       explicit time marching with mass and ramped damping
 * - NewmarkBetaMotion:    Newmark-beta integration with numerical damping
 * - PhysicalNoMassMotion: damping-only predictor/corrector
 *
 * All steps pass through RigidBody::limit_disp before being returned.
 */

#include <planingsim/core/core.hpp>
#include <planingsim/solver/root_finder.hpp>
#include <planingsim/structure/parameters.hpp>

namespace pls {
namespace structure {

class RigidBody;

class MotionStrategy {
public:
    virtual ~MotionStrategy() = default;

    virtual MotionMethod method() const = 0;

    /// Next (d_draft, d_trim) for the body's current loads
    virtual Vec2r compute_displacement(RigidBody& body, const StructureParameters& params) = 0;

    /// Discard history (velocities, Jacobians, previous steps)
    virtual void reset() {}
};

UniquePtr<MotionStrategy> make_motion_strategy(MotionMethod method);

// ============================================================================
// Fixed
// ============================================================================

class FixedMotion : public MotionStrategy {
public:
    MotionMethod method() const override { return MotionMethod::Fixed; }

    Vec2r compute_displacement(RigidBody& /*body*/, const StructureParameters& /*params*/) override {
        return {0.0, 0.0};
    }
};

// ============================================================================
// Root finder (Secant / Broyden library)
// ============================================================================

class RootFinderMotion : public MotionStrategy {
public:
    explicit RootFinderMotion(solver::RootFinderMethod finder_method)
        : finder_method_(finder_method) {}

    MotionMethod method() const override {
        return finder_method_ == solver::RootFinderMethod::Secant ? MotionMethod::Secant
                                                                  : MotionMethod::BroydenLibrary;
    }

    Vec2r compute_displacement(RigidBody& body, const StructureParameters& params) override;

    void reset() override {
        finder_.reset();
        has_previous_ = false;
    }

    const solver::RootFinder* root_finder() const { return finder_.get(); }

private:
    solver::RootFinderMethod finder_method_;
    UniquePtr<solver::RootFinder> finder_;
    std::vector<Real> previous_step_;
    bool has_previous_ = false;
};

// ============================================================================
// Broyden (explicit Jacobian)
// ============================================================================

/**
 * The Jacobian of f = (L - W, M - W (xG - xR)) with respect to (draft, trim)
 * is first built by finite differences, one free DOF per call, each column
 * measured from the previous point. Fixed DOFs get identity columns. Once
 * every column is known the Jacobian is frozen and the temporary state is
 * cleared.
 *
 * Afterwards each call applies J += (df - J dx) dx^T / |dx|^2 for the last
 * step, solves -J_ff dx_f = f_f, relaxes and limits. Consecutive steps that
 * increase any free |f_i| count as stagnation; at the configured limit the
 * Jacobian is rebuilt.
 */
class BroydenMotion : public MotionStrategy {
public:
    MotionMethod method() const override { return MotionMethod::Broyden; }

    Vec2r compute_displacement(RigidBody& body, const StructureParameters& params) override;

    void reset() override;

    bool jacobian_ready() const { return jacobian_ready_; }
    bool building_jacobian() const { return building_; }
    std::size_t jacobian_column() const { return jit_; }
    int stagnation_count() const { return stagnation_; }

    /// Row-major 2x2 Jacobian estimate
    const Mat2r& jacobian() const { return J_; }

private:
    /// Advance the finite-difference build; false once the Jacobian is frozen
    bool advance_jacobian_build(const RigidBody& body, const Vec2r& f,
                                const StructureParameters& params, Vec2r& step);

    Mat2r J_{};
    Mat2r J_tmp_{};
    bool jacobian_ready_ = false;
    bool building_ = false;
    std::size_t jit_ = 0;
    Vec2r f_base_{};

    Vec2r res_old_{};
    bool has_res_old_ = false;
    Vec2r disp_old_{};
    bool has_disp_old_ = false;
    int stagnation_ = 0;
};

// ============================================================================
// Physical time marching
// ============================================================================

class PhysicalMotion : public MotionStrategy {
public:
    MotionMethod method() const override { return MotionMethod::Physical; }

    Vec2r compute_displacement(RigidBody& body, const StructureParameters& params) override;

    void reset() override {
        v_ = {0.0, 0.0};
        a_ = {0.0, 0.0};
    }

    const Vec2r& velocity() const { return v_; }
    const Vec2r& acceleration() const { return a_; }

private:
    Vec2r v_{};
    Vec2r a_{};
};

class NewmarkBetaMotion : public MotionStrategy {
public:
    MotionMethod method() const override { return MotionMethod::NewmarkBeta; }

    Vec2r compute_displacement(RigidBody& body, const StructureParameters& params) override;

    void reset() override {
        v_ = v_old_ = a_ = a_old_ = {0.0, 0.0};
    }

    const Vec2r& velocity() const { return v_; }
    const Vec2r& acceleration() const { return a_; }

private:
    Vec2r v_{};
    Vec2r v_old_{};
    Vec2r a_{};
    Vec2r a_old_{};
};

class PhysicalNoMassMotion : public MotionStrategy {
public:
    MotionMethod method() const override { return MotionMethod::PhysicalNoMass; }

    Vec2r compute_displacement(RigidBody& body, const StructureParameters& params) override;

    void reset() override {
        predictor_ = true;
        f_old_ = f_two_ago_ = {0.0, 0.0};
    }

    bool predictor_next() const { return predictor_; }

private:
    bool predictor_ = true;
    Vec2r f_old_{};
    Vec2r f_two_ago_{};
};

} // namespace structure
} // namespace pls
