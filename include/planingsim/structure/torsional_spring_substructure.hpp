#pragma once

/**
 * @file torsional_spring_substructure.hpp
 * @brief Rigid element chain hinged to its body through a torsional spring
 *
 * The chain rotates about a base point located at basePtPct of its arc
 * length. Each outer iteration:
 *
 *   Mt      = integral(r x f) about the base point, f from the net pressure,
 *             plus the moment of the ramped tip load (0, tipLoad ramp)
 *   theta*  = -Mt / k          (-Mt when k == 0, 0 when Mt is NaN)
 *   dtheta  = relax (theta* - theta), capped at max_angle_step
 *
 * The chain and the attached node of a neighboring substructure are rotated
 * about the base point by -dtheta. dtheta is the hinge residual.
 */

#include <planingsim/structure/substructure.hpp>

namespace pls {
namespace structure {

class TorsionalSpringSubstructure : public Substructure {
public:
    explicit TorsionalSpringSubstructure(const SubstructureParameters& params)
        : Substructure(params) {}

    bool is_rigid_chain() const override { return true; }

    /// Look up the attached substructure end node and apply the initial angle
    void resolve_attachments(StructureRegistry& registry) override;

    void update_deformation(const StructureParameters& params) override { update_angle(params); }

    Real residual() const override { return residual_; }

    /// Relaxed, step-limited move toward the spring equilibrium angle
    void update_angle(const StructureParameters& params);

    /// Spring equilibrium angle for the current hinge moment
    Real target_angle() const;

    /// Rotate to an absolute angle (clamped to the minimum angle)
    void set_angle(Real angle);

    /// Take over a stored angle whose node coordinates are already in place
    void restore_angle(Real angle);

    Real angle() const { return theta_; }
    Real hinge_moment() const { return Mt_; }
    Real hinge_drag() const { return Dt_; }
    Real hinge_lift() const { return Lt_; }

    /// Pivot on the current curve at basePtPct of the arc length
    Vec2r base_point() const;

    fem::Node* attached_node() const { return attached_node_; }

protected:
    UniquePtr<fem::Element> create_element() const override;
    void on_mesh_loaded() override;

    void begin_load_integration() override;
    void accumulate_span(const SpanLoads& span) override;
    void end_load_integration(const StructureParameters& params) override;

private:
    Real theta_ = 0.0;
    Real residual_ = 0.0;
    Real Mt_ = 0.0;
    Real Dt_ = 0.0;
    Real Lt_ = 0.0;
    fem::Node* attached_node_ = nullptr;
    bool initial_angle_applied_ = false;
};

} // namespace structure
} // namespace pls
