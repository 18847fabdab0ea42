#pragma once

/**
 * @file rigid_body.hpp
 * @brief Rigid body with draft and trim degrees of freedom
 *
 * A body owns (non-owning pointers to) its substructures, sums their loads
 * and drives the normalized residuals
 *
 *   resL = |(L - W) / (p_stag Lref + 1e-6)|                 (free in draft)
 *   resM = |(M - W (xG - xR)) / (p_stag Lref^2 + 1e-6)|     (free in trim)
 *
 * toward zero with its motion strategy. A step (d_draft, d_trim) rotates
 * every owned node about the center of rotation by d_trim (degrees,
 * counter-clockwise) and then lowers it by d_draft.
 */

#include <planingsim/core/core.hpp>
#include <planingsim/fem/node.hpp>
#include <planingsim/io/result_io.hpp>
#include <planingsim/structure/motion_strategy.hpp>
#include <planingsim/structure/parameters.hpp>
#include <vector>

namespace pls {
namespace structure {

class Substructure;

class RigidBody {
public:
    RigidBody(const RigidBodyParameters& params, const StructureParameters& structure);
    ~RigidBody();

    RigidBody(const RigidBody&) = delete;
    RigidBody& operator=(const RigidBody&) = delete;

    const std::string& name() const { return params_.name; }
    const RigidBodyParameters& parameters() const { return params_; }

    // ------------------------------------------------------------------------
    // Substructures and nodes
    // ------------------------------------------------------------------------

    void add_substructure(Substructure* ss);
    const std::vector<Substructure*>& substructures() const { return substructures_; }

    /// Deduplicated union of the substructure nodes, in first-seen order
    void store_nodes();
    const std::vector<fem::Node*>& nodes() const { return nodes_; }

    // ------------------------------------------------------------------------
    // Position
    // ------------------------------------------------------------------------

    void initialize_position();
    void set_position(Real draft, Real trim);

    /// Apply a rigid step to every owned node, CofG and CofR
    void update_position(Real d_draft, Real d_trim);

    /// Step from the motion strategy; NaN components become zero
    Vec2r compute_displacement(const StructureParameters& params);

    /// Scale the step uniformly so no free DOF exceeds its bound; fixed DOFs get zero
    Vec2r limit_disp(const Vec2r& disp) const;

    // ------------------------------------------------------------------------
    // Loads and residuals
    // ------------------------------------------------------------------------

    /// Zero the totals; the assumed cushion method seeds L = Pc Lref cos(trim)
    void reset_loads(const StructureParameters& params);

    /// Sum substructure loads and refresh the residuals
    void update_fluid_forces(const StructureParameters& params);

    void set_loads(Real drag, Real lift, Real moment) {
        D_ = drag;
        L_ = lift;
        M_ = moment;
    }

    Real lift_residual(const StructureParameters& params) const;
    Real moment_residual(const StructureParameters& params) const;

    /// Residuals stored by the last update_fluid_forces()
    Real res_lift() const { return resL_; }
    Real res_moment() const { return resM_; }

    /// (W - L, M - W (xG - xR))
    Vec2r unbalanced_force() const;

    // ------------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------------

    Real weight() const { return params_.W; }
    Real mass() const { return params_.m; }
    Real inertia() const { return params_.Iz; }

    Real draft() const { return draft_; }
    Real trim() const { return trim_; }

    Vec2r center_of_gravity() const { return {xCofG_, yCofG_}; }
    Vec2r center_of_rotation() const { return {xCofR_, yCofR_}; }

    bool free_in_draft() const { return params_.free_in_draft; }
    bool free_in_trim() const { return params_.free_in_trim; }
    bool any_free() const { return params_.free_in_draft || params_.free_in_trim; }
    Vec2b free_dofs() const { return {params_.free_in_draft, params_.free_in_trim}; }

    Vec2r max_step() const { return {params_.max_draft_step, params_.max_trim_step}; }
    Vec2r damping() const { return {params_.draft_damping, params_.trim_damping}; }
    Vec2r max_acceleration() const { return {params_.max_draft_acc, params_.max_trim_acc}; }
    Vec2r relaxation() const { return {params_.relax_draft, params_.relax_trim}; }

    Real drag() const { return D_; }
    Real lift() const { return L_; }
    Real moment() const { return M_; }
    Real air_drag() const { return Da_; }
    Real air_lift() const { return La_; }
    Real air_moment() const { return Ma_; }

    MotionStrategy& motion_strategy() { return *strategy_; }
    const MotionStrategy& motion_strategy() const { return *strategy_; }

    // ------------------------------------------------------------------------
    // Persistence
    // ------------------------------------------------------------------------

    io::BodyMotionRecord motion_record() const;
    void apply_motion_record(const io::BodyMotionRecord& record);

    void log_motion() const;

private:
    RigidBodyParameters params_;
    UniquePtr<MotionStrategy> strategy_;

    std::vector<Substructure*> substructures_;
    std::vector<fem::Node*> nodes_;
    bool nodes_stored_ = false;

    Real draft_ = 0.0;
    Real trim_ = 0.0;
    Real xCofG_ = 0.0;
    Real yCofG_ = 0.0;
    Real xCofR_ = 0.0;
    Real yCofR_ = 0.0;

    Real D_ = 0.0;
    Real L_ = 0.0;
    Real M_ = 0.0;
    Real Da_ = 0.0;
    Real La_ = 0.0;
    Real Ma_ = 0.0;

    Real resL_ = 1.0;
    Real resM_ = 1.0;
};

} // namespace structure
} // namespace pls
