/**
 * @file rigid_body.cpp
 * @brief Rigid-body loads, residuals and rigid motion
 */

#include <planingsim/structure/rigid_body.hpp>
#include <planingsim/structure/substructure.hpp>
#include <planingsim/geometry/trig.hpp>
#include <algorithm>
#include <cmath>

namespace pls {
namespace structure {

RigidBody::RigidBody(const RigidBodyParameters& params, const StructureParameters& structure)
    : params_(params)
    , xCofG_(params.xCofG)
    , yCofG_(params.yCofG)
    , xCofR_(params.xCofR)
    , yCofR_(params.yCofR)
{
    const MotionMethod method = any_free() ? structure.motion_method : MotionMethod::Fixed;

    if (method == MotionMethod::Physical || method == MotionMethod::NewmarkBeta) {
        PLS_REQUIRE(params_.m > 0.0 && params_.Iz > 0.0,
                    "body '" + params_.name + "' needs positive mass and inertia for " + to_string(method));
    }
    if (method == MotionMethod::PhysicalNoMass) {
        PLS_REQUIRE((!params_.free_in_draft || params_.draft_damping != 0.0) &&
                    (!params_.free_in_trim || params_.trim_damping != 0.0),
                    "body '" + params_.name + "' needs nonzero damping on its free DOFs");
    }

    strategy_ = make_motion_strategy(method);

    PLS_LOG_INFO("Adding rigid body: {} (W = {}, motion: {})", params_.name, params_.W, to_string(method));
}

RigidBody::~RigidBody() = default;

// ============================================================================
// Substructures and nodes
// ============================================================================

void RigidBody::add_substructure(Substructure* ss) {
    PLS_REQUIRE(ss != nullptr, "null substructure");
    substructures_.push_back(ss);
    nodes_stored_ = false;
}

void RigidBody::store_nodes() {
    nodes_.clear();
    for (Substructure* ss : substructures_) {
        for (fem::Node* nd : ss->nodes()) {
            if (std::find(nodes_.begin(), nodes_.end(), nd) == nodes_.end()) {
                nodes_.push_back(nd);
            }
        }
    }
    nodes_stored_ = true;
}

// ============================================================================
// Position
// ============================================================================

void RigidBody::initialize_position() {
    set_position(params_.initial_draft, params_.initial_trim);
}

void RigidBody::set_position(Real draft, Real trim) {
    update_position(draft - draft_, trim - trim_);
}

void RigidBody::update_position(Real d_draft, Real d_trim) {
    if (!nodes_stored_) {
        store_nodes();
    }

    const Vec2r cofr = center_of_rotation();
    for (fem::Node* nd : nodes_) {
        const Vec2r p = geometry::rotate_point(nd->coordinates(), cofr, d_trim);
        nd->set_coordinates(p[0], p[1] - d_draft);
    }

    for (Substructure* ss : substructures_) {
        ss->update_geometry();
    }

    const Vec2r cofg = geometry::rotate_point(center_of_gravity(), cofr, d_trim);
    xCofG_ = cofg[0];
    yCofG_ = cofg[1] - d_draft;
    yCofR_ -= d_draft;

    draft_ += d_draft;
    trim_ += d_trim;

    log_motion();
}

Vec2r RigidBody::compute_displacement(const StructureParameters& params) {
    Vec2r disp = strategy_->compute_displacement(*this, params);
    for (Real& d : disp) {
        if (std::isnan(d)) d = 0.0;
    }
    return disp;
}

Vec2r RigidBody::limit_disp(const Vec2r& disp) const {
    const Vec2b free = free_dofs();
    const Vec2r max = max_step();

    Real scale = 1.0;
    for (int i = 0; i < 2; ++i) {
        if (disp[i] == 0.0 || !free[i]) continue;
        const Real limited = std::copysign(std::min(std::abs(disp[i]), max[i]), disp[i]);
        scale = std::min(scale, limited / disp[i]);
    }

    Vec2r result{};
    for (int i = 0; i < 2; ++i) {
        result[i] = free[i] ? disp[i] * scale : 0.0;
    }
    return result;
}

// ============================================================================
// Loads and residuals
// ============================================================================

void RigidBody::reset_loads(const StructureParameters& params) {
    D_ = L_ = M_ = 0.0;
    Da_ = La_ = Ma_ = 0.0;
    if (params.force_method == ForceMethod::Assumed) {
        L_ += params.Pc * params.Lref * geometry::cosd(trim_);
    }
}

void RigidBody::update_fluid_forces(const StructureParameters& params) {
    reset_loads(params);
    for (Substructure* ss : substructures_) {
        ss->update_fluid_forces(params);
        D_ += ss->drag();
        L_ += ss->lift();
        M_ += ss->moment();
        Da_ += ss->air_drag();
        La_ += ss->air_lift();
        Ma_ += ss->air_moment();
    }

    resL_ = lift_residual(params);
    resM_ = moment_residual(params);
}

Real RigidBody::lift_residual(const StructureParameters& params) const {
    Real res = 1.0;
    if (!std::isnan(L_)) {
        res = (L_ - weight()) / (params.p_stag * params.Lref + 1.0e-6);
    }
    return params_.free_in_draft ? std::abs(res) : 0.0;
}

Real RigidBody::moment_residual(const StructureParameters& params) const {
    Real res = 1.0;
    if (!std::isnan(M_) && !(xCofG_ == xCofR_ && M_ == 0.0)) {
        res = (M_ - weight() * (xCofG_ - xCofR_)) /
              (params.p_stag * params.Lref * params.Lref + 1.0e-6);
    }
    return params_.free_in_trim ? std::abs(res) : 0.0;
}

Vec2r RigidBody::unbalanced_force() const {
    return {weight() - L_, M_ - weight() * (xCofG_ - xCofR_)};
}

// ============================================================================
// Persistence
// ============================================================================

io::BodyMotionRecord RigidBody::motion_record() const {
    io::BodyMotionRecord rec;
    rec.xCofR = xCofR_;
    rec.yCofR = yCofR_;
    rec.xCofG = xCofG_;
    rec.yCofG = yCofG_;
    rec.draft = draft_;
    rec.trim = trim_;
    rec.lift_res = resL_;
    rec.moment_res = resM_;
    rec.lift = L_;
    rec.drag = D_;
    rec.moment = M_;
    rec.air_lift = La_;
    rec.air_drag = Da_;
    rec.air_moment = Ma_;
    return rec;
}

void RigidBody::apply_motion_record(const io::BodyMotionRecord& rec) {
    xCofR_ = rec.xCofR;
    yCofR_ = rec.yCofR;
    xCofG_ = rec.xCofG;
    yCofG_ = rec.yCofG;
    draft_ = rec.draft;
    trim_ = rec.trim;
    resL_ = rec.lift_res;
    resM_ = rec.moment_res;
    L_ = rec.lift;
    D_ = rec.drag;
    M_ = rec.moment;
    La_ = rec.air_lift;
    Da_ = rec.air_drag;
    Ma_ = rec.air_moment;
}

void RigidBody::log_motion() const {
    PLS_LOG_INFO("Rigid Body Motion: {}", name());
    PLS_LOG_INFO("  CofR: ({}, {})", xCofR_, yCofR_);
    PLS_LOG_INFO("  CofG: ({}, {})", xCofG_, yCofG_);
    PLS_LOG_INFO("  Draft:      {:5.4e}", draft_);
    PLS_LOG_INFO("  Trim Angle: {:5.4e}", trim_);
    PLS_LOG_INFO("  Lift Force: {:5.4e}", L_);
    PLS_LOG_INFO("  Drag Force: {:5.4e}", D_);
    PLS_LOG_INFO("  Moment:     {:5.4e}", M_);
    PLS_LOG_INFO("  Lift Force Air: {:5.4e}", La_);
    PLS_LOG_INFO("  Drag Force Air: {:5.4e}", Da_);
    PLS_LOG_INFO("  Moment Air:     {:5.4e}", Ma_);
    PLS_LOG_INFO("  Lift Res:   {:5.4e}", resL_);
    PLS_LOG_INFO("  Moment Res: {:5.4e}", resM_);
}

} // namespace structure
} // namespace pls
