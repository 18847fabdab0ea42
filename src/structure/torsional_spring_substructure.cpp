/**
 * @file torsional_spring_substructure.cpp
 * @brief Torsional hinge equilibrium
 */

#include <planingsim/structure/torsional_spring_substructure.hpp>
#include <planingsim/structure/fe_structure.hpp>
#include <planingsim/geometry/trig.hpp>
#include <algorithm>
#include <cmath>

namespace pls {
namespace structure {

UniquePtr<fem::Element> TorsionalSpringSubstructure::create_element() const {
    return make_unique<fem::RigidElement>();
}

void TorsionalSpringSubstructure::on_mesh_loaded() {
    fix_all_nodes();
}

void TorsionalSpringSubstructure::resolve_attachments(StructureRegistry& registry) {
    if (!params_.attached_substructure.empty() && attached_node_ == nullptr) {
        Substructure& other = registry.find_substructure(params_.attached_substructure);
        if (other.nodes().empty()) {
            throw InvalidArgumentError("Substructure '" + other.name() + "' attached to hinge '" +
                                       name() + "' has no mesh");
        }
        attached_node_ = params_.attached_at_start ? other.nodes().front() : other.nodes().back();

        PLS_LOG_DEBUG("Hinge '{}' attached to {} of '{}' (node {})", name(),
                      params_.attached_at_start ? "start" : "end", other.name(), attached_node_->id());
    }

    // Initial angle once the attached node is known
    if (!initial_angle_applied_) {
        initial_angle_applied_ = true;
        set_angle(params_.initial_angle);
        residual_ = 0.0;
    }
}

Vec2r TorsionalSpringSubstructure::base_point() const {
    return coordinates(params_.base_pt_pct * arc_length());
}

// ============================================================================
// Hinge moment
// ============================================================================

void TorsionalSpringSubstructure::begin_load_integration() {
    Dt_ = Lt_ = Mt_ = 0.0;
}

void TorsionalSpringSubstructure::accumulate_span(const SpanLoads& span) {
    const ForceIntegral f = integrate_force(span.s, span.p_total(), span.tau, base_point());
    Dt_ += f.fx;
    Lt_ += f.fy;
    Mt_ += f.m;
}

void TorsionalSpringSubstructure::end_load_integration(const StructureParameters& params) {
    if (nodes_.empty()) {
        return;
    }

    const Vec2r base = base_point();
    const Vec2r tip = coordinates(params_.tip_load_pct * arc_length());
    const Vec2r r = {tip[0] - base[0], tip[1] - base[1]};
    const Vec2r F = {0.0, params_.tip_load * params.ramp};

    Lt_ += F[1];
    Mt_ += geometry::cross2(r, F);
}

// ============================================================================
// Angle update
// ============================================================================

Real TorsionalSpringSubstructure::target_angle() const {
    Real theta = std::isnan(Mt_) ? 0.0 : -Mt_;
    if (params_.spring_constant != 0.0) {
        theta /= params_.spring_constant;
    }
    return theta;
}

void TorsionalSpringSubstructure::update_angle(const StructureParameters& /*params*/) {
    Real dtheta = (target_angle() - theta_) * params_.relax_angle;
    dtheta = std::copysign(std::min(std::abs(dtheta), params_.max_angle_step), dtheta);
    set_angle(theta_ + dtheta);
}

void TorsionalSpringSubstructure::set_angle(Real angle) {
    const Real dtheta = std::max(angle, params_.minimum_angle) - theta_;

    if (!nodes_.empty()) {
        const Vec2r base = base_point();

        std::vector<fem::Node*> moving = nodes_;
        if (attached_node_ != nullptr &&
            std::find(nodes_.begin(), nodes_.end(), attached_node_) == nodes_.end()) {
            moving.push_back(attached_node_);
        }

        for (fem::Node* nd : moving) {
            const Vec2r p = geometry::rotate_point(nd->coordinates(), base, -dtheta);
            nd->set_coordinates(p[0], p[1]);
        }
    }

    theta_ += dtheta;
    residual_ = dtheta;

    if (!nodes_.empty()) {
        update_geometry();
    }

    PLS_LOG_DEBUG("  Deformation for substructure {}: {}", name(), theta_);
}

void TorsionalSpringSubstructure::restore_angle(Real angle) {
    theta_ = angle;
    residual_ = 0.0;
    initial_angle_applied_ = true;
}

} // namespace structure
} // namespace pls
