/**
 * @file motion_strategy.cpp
 * @brief Rigid-body displacement strategies
 */

#include <planingsim/structure/motion_strategy.hpp>
#include <planingsim/structure/rigid_body.hpp>
#include <algorithm>
#include <cmath>

namespace pls {
namespace structure {

namespace {

/// Unbalanced loads as (L - W, M - W (xG - xR))
Vec2r load_imbalance(const RigidBody& body) {
    const Vec2r f = body.unbalanced_force();
    return {-f[0], f[1]};
}

/// NaN components become zero steps
Vec2r without_nan(Vec2r step) {
    for (Real& d : step) {
        if (std::isnan(d)) d = 0.0;
    }
    return step;
}

Real clip_magnitude(Real value, Real bound) {
    return std::copysign(std::min(std::abs(value), std::abs(bound)), value);
}

} // anonymous namespace

UniquePtr<MotionStrategy> make_motion_strategy(MotionMethod method) {
    switch (method) {
        case MotionMethod::Fixed:
            return make_unique<FixedMotion>();
        case MotionMethod::Secant:
            return make_unique<RootFinderMotion>(solver::RootFinderMethod::Secant);
        case MotionMethod::BroydenLibrary:
            return make_unique<RootFinderMotion>(solver::RootFinderMethod::Broyden);
        case MotionMethod::Broyden:
            return make_unique<BroydenMotion>();
        case MotionMethod::Physical:
            return make_unique<PhysicalMotion>();
        case MotionMethod::NewmarkBeta:
            return make_unique<NewmarkBetaMotion>();
        case MotionMethod::PhysicalNoMass:
            return make_unique<PhysicalNoMassMotion>();
    }
    throw InvalidArgumentError("Unknown motion method");
}

// ============================================================================
// Root finder
// ============================================================================

Vec2r RootFinderMotion::compute_displacement(RigidBody& body, const StructureParameters& params) {
    if (!finder_) {
        const Real lift_scale = params.p_stag * params.Lref + 1.0e-6;
        const Real moment_scale = params.p_stag * params.Lref * params.Lref + 1.0e-6;

        // The model is moved by the caller; the residual reads the body's current loads
        const RigidBody* target = &body;
        auto residual = [target, lift_scale, moment_scale](const std::vector<Real>& /*x*/) {
            const Vec2r f = load_imbalance(*target);
            return std::vector<Real>{f[0] / lift_scale, f[1] / moment_scale};
        };

        const Vec2b free = body.free_dofs();
        finder_ = pls::make_unique<solver::RootFinder>(residual,
                                                  std::vector<Real>{body.draft(), body.trim()},
                                                  finder_method_, std::vector<bool>{free[0], free[1]},
                                                  params.motion_jacobian_first_step);
        finder_->set_owner("rigid body '" + body.name() + "'");
    }

    if (has_previous_) {
        finder_->take_step(previous_step_);
    }

    const std::vector<Real> dx = finder_->get_step();
    const Vec2r step = body.limit_disp(without_nan({dx[0], dx[1]}));
    previous_step_ = {step[0], step[1]};
    has_previous_ = true;

    return step;
}

// ============================================================================
// Broyden
// ============================================================================

void BroydenMotion::reset() {
    J_ = {};
    J_tmp_ = {};
    jacobian_ready_ = false;
    building_ = false;
    jit_ = 0;
    f_base_ = {};
    res_old_ = {};
    has_res_old_ = false;
    disp_old_ = {};
    has_disp_old_ = false;
    stagnation_ = 0;
}

bool BroydenMotion::advance_jacobian_build(const RigidBody& body, const Vec2r& f,
                                           const StructureParameters& params, Vec2r& step) {
    const Vec2b free = body.free_dofs();

    if (!building_) {
        building_ = true;
        jit_ = 0;
        J_tmp_ = {};
    } else {
        // Column of the DOF perturbed by the previous call
        const Real h = disp_old_[jit_];
        for (std::size_t i = 0; i < 2; ++i) {
            J_tmp_[2 * i + jit_] = (f[i] - f_base_[i]) / h;
        }
        ++jit_;
    }

    while (jit_ < 2 && !free[jit_]) {
        for (std::size_t i = 0; i < 2; ++i) {
            J_tmp_[2 * i + jit_] = (i == jit_) ? 1.0 : 0.0;
        }
        ++jit_;
    }

    if (jit_ < 2) {
        step = {0.0, 0.0};
        step[jit_] = params.motion_jacobian_first_step;
        f_base_ = f;
        disp_old_ = step;
        return true;
    }

    J_ = J_tmp_;
    J_tmp_ = {};
    jacobian_ready_ = true;
    building_ = false;
    has_disp_old_ = false;
    res_old_ = f;
    has_res_old_ = true;

    PLS_LOG_DEBUG("Jacobian for {} frozen: [{}, {}; {}, {}]", body.name(), J_[0], J_[1], J_[2], J_[3]);
    return false;
}

Vec2r BroydenMotion::compute_displacement(RigidBody& body, const StructureParameters& params) {
    const Vec2r f = load_imbalance(body);
    const Vec2b free = body.free_dofs();

    Vec2r step{};
    if (!jacobian_ready_) {
        if (advance_jacobian_build(body, f, params, step)) {
            return step;
        }
    } else if (has_disp_old_) {
        const Vec2r df = {f[0] - res_old_[0], f[1] - res_old_[1]};
        const Vec2r& dx = disp_old_;
        const Real dx2 = dx[0] * dx[0] + dx[1] * dx[1];
        if (dx2 > 0.0) {
            for (std::size_t i = 0; i < 2; ++i) {
                const Real Jdx = J_[2 * i] * dx[0] + J_[2 * i + 1] * dx[1];
                for (std::size_t j = 0; j < 2; ++j) {
                    J_[2 * i + j] += (df[i] - Jdx) * dx[j] / dx2;
                }
            }
        }
    }

    if (has_res_old_) {
        bool increased = false;
        for (std::size_t i = 0; i < 2; ++i) {
            if (free[i] && std::abs(f[i]) - std::abs(res_old_[i]) > 0.0) {
                increased = true;
            }
        }
        stagnation_ = increased ? stagnation_ + 1 : 0;
    }

    if (stagnation_ >= params.broyden_stagnation_limit) {
        PLS_LOG_WARN("Broyden stagnated for {} after {} steps, rebuilding Jacobian",
                     body.name(), stagnation_);
        reset();
        advance_jacobian_build(body, f, params, step);
        return step;
    }

    solver::DenseMatrix J(2);
    for (std::size_t i = 0; i < 2; ++i) {
        for (std::size_t j = 0; j < 2; ++j) J(i, j) = J_[2 * i + j];
    }
    const std::vector<Real> dx = solver::solve_reduced(J, {-f[0], -f[1]}, {free[0], free[1]},
                                                       "rigid body '" + body.name() + "'");

    const Vec2r relax = body.relaxation();
    const Vec2r disp = body.limit_disp(without_nan({dx[0] * relax[0], dx[1] * relax[1]}));

    disp_old_ = disp;
    has_disp_old_ = true;
    res_old_ = f;
    has_res_old_ = true;

    return disp;
}

// ============================================================================
// Physical
// ============================================================================

Vec2r PhysicalMotion::compute_displacement(RigidBody& body, const StructureParameters& params) {
    const Real dt = body.parameters().time_step;
    const Vec2r max = body.max_step();
    const Vec2r damping = body.damping();
    const Vec2r max_acc = body.max_acceleration();
    const Vec2r mass = {body.mass(), body.inertia()};

    Vec2r disp = body.limit_disp({v_[0] * dt, v_[1] * dt});
    for (std::size_t i = 0; i < 2; ++i) {
        if (disp[i] != 0.0 && std::abs(disp[i]) == max[i]) {
            v_[i] = disp[i] / dt;
        }
    }

    const Vec2r F = body.unbalanced_force();
    for (std::size_t i = 0; i < 2; ++i) {
        v_[i] += dt * a_[i];
        a_[i] = (F[i] - damping[i] * v_[i] * params.ramp) / mass[i];
        a_[i] = clip_magnitude(a_[i], max_acc[i]);
        disp[i] *= params.ramp;
    }

    return disp;
}

// ============================================================================
// Newmark-beta
// ============================================================================

Vec2r NewmarkBetaMotion::compute_displacement(RigidBody& body, const StructureParameters& params) {
    const RigidBodyParameters& p = body.parameters();
    const Real dt = p.time_step;
    const Vec2r max_acc = body.max_acceleration();
    const Vec2r mass = {body.mass(), body.inertia()};
    const Vec2r relax = body.relaxation();

    const Vec2r F = body.unbalanced_force();
    Vec2r disp{};
    for (std::size_t i = 0; i < 2; ++i) {
        a_[i] = clip_magnitude(F[i] / mass[i], max_acc[i]);

        const Real dv = ((1.0 - p.gamma) * a_old_[i] + p.gamma * a_[i]) * dt * (1.0 - p.num_damp);
        v_[i] += dv;

        disp[i] = ((0.5 * (1.0 - 2.0 * p.beta) * a_old_[i] + p.beta * a_[i]) * dt + v_old_[i]) * dt;

        a_old_[i] = a_[i];
        v_old_[i] = v_[i];

        disp[i] *= relax[i] * params.ramp;
    }

    return body.limit_disp(disp);
}

// ============================================================================
// Damping-only predictor/corrector
// ============================================================================

Vec2r PhysicalNoMassMotion::compute_displacement(RigidBody& body, const StructureParameters& params) {
    const Real dt = body.parameters().time_step;
    const Vec2r C = body.damping();
    const Vec2r relax = body.relaxation();
    const Vec2r F = body.unbalanced_force();

    Vec2r disp{};
    for (std::size_t i = 0; i < 2; ++i) {
        if (C[i] == 0.0) continue;
        if (predictor_) {
            disp[i] = F[i] / C[i] * dt;
        } else {
            disp[i] = 0.5 * dt / C[i] * (F[i] - f_two_ago_[i]);
        }
        disp[i] *= relax[i] * params.ramp;
    }
    predictor_ = !predictor_;

    disp = body.limit_disp(disp);

    f_two_ago_ = f_old_;
    for (std::size_t i = 0; i < 2; ++i) {
        f_old_[i] = disp[i] * C[i] / dt;
    }

    return disp;
}

} // namespace structure
} // namespace pls
