/**
 * @file substructure.cpp
 * @brief Substructure load integration and geometry
 */

#include <planingsim/structure/substructure.hpp>
#include <planingsim/structure/rigid_body.hpp>
#include <planingsim/geometry/trig.hpp>
#include <algorithm>

namespace pls {
namespace structure {

std::vector<Real> SpanLoads::p_external() const {
    std::vector<Real> p(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) p[i] = p_fluid[i] + p_cushion[i];
    return p;
}

std::vector<Real> SpanLoads::p_total() const {
    std::vector<Real> p(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) p[i] = p_fluid[i] + p_cushion[i] - p_internal[i];
    return p;
}

namespace {

/// Split an integrated distribution between the element end nodes by its centroid
Vec2r split_by_centroid(const std::vector<Real>& s, const std::vector<Real>& q) {
    const Real total = geometry::integrate(s, q);
    if (total == 0.0) {
        return {0.0, 0.0};
    }

    std::vector<Real> sq(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) sq[i] = s[i] * q[i];

    const Real pct = (geometry::integrate(s, sq) / total - s.front()) / (s.back() - s.front());
    return {total * (1.0 - pct), total * pct};
}

} // namespace

// ============================================================================
// Construction and mesh
// ============================================================================

Substructure::Substructure(const SubstructureParameters& params)
    : params_(params)
{
    PLS_REQUIRE(!params_.name.empty(), "substructures need a name");
}

void Substructure::set_elements(const std::vector<std::array<fem::Node*, 2>>& connectivity) {
    if (connectivity.empty()) {
        throw InvalidArgumentError("Substructure '" + name() + "' has no elements");
    }

    nodes_.clear();
    elements_.clear();

    for (std::size_t i = 0; i < connectivity.size(); ++i) {
        const auto& [n0, n1] = connectivity[i];
        if (n0 == nullptr || n1 == nullptr) {
            throw InvalidArgumentError("Element " + std::to_string(i) + " of '" + name() +
                                       "' references a missing node");
        }
        if (i > 0 && connectivity[i - 1][1] != n0) {
            throw InvalidArgumentError("Element chain of '" + name() + "' is broken at element " +
                                       std::to_string(i));
        }
        nodes_.push_back(n0);
    }
    nodes_.push_back(connectivity.back()[1]);

    curve_.build(node_coordinates(), params_.interpolation, params_.extrapolate);

    for (const auto& pair : connectivity) {
        auto el = create_element();
        el->set_nodes(pair[0], pair[1]);
        elements_.push_back(std::move(el));
    }

    set_element_properties();
    on_mesh_loaded();

    PLS_LOG_DEBUG("Substructure '{}' ({}): {} nodes, arc length {}",
                  name(), to_string(type()), nodes_.size(), arc_length());
}

void Substructure::fix_all_nodes() {
    for (fem::Node* nd : nodes_) {
        nd->fix_all();
    }
}

void Substructure::set_element_properties() {
    const Real L0 = arc_length() / static_cast<Real>(elements_.size());
    for (auto& el : elements_) {
        el->set_initial_length(L0);
    }
}

// ============================================================================
// Geometry
// ============================================================================

void Substructure::update_geometry() {
    for (auto& el : elements_) {
        el->update_geometry();
    }
    curve_.build(node_coordinates(), params_.interpolation, params_.extrapolate);
}

std::vector<Vec2r> Substructure::node_coordinates() const {
    std::vector<Vec2r> coords;
    coords.reserve(nodes_.size());
    for (const fem::Node* nd : nodes_) {
        coords.push_back(nd->coordinates());
    }
    return coords;
}

void Substructure::set_node_coordinates(const std::vector<Vec2r>& coords) {
    if (coords.size() != nodes_.size()) {
        throw InvalidArgumentError("Substructure '" + name() + "' expects " +
                                   std::to_string(nodes_.size()) + " coordinates, got " +
                                   std::to_string(coords.size()));
    }
    for (std::size_t i = 0; i < coords.size(); ++i) {
        nodes_[i]->set_coordinates(coords[i][0], coords[i][1]);
    }
    update_geometry();
}

Vec2r Substructure::moment_center() const {
    if (parent_ == nullptr) {
        return {0.0, 0.0};
    }
    return parent_->center_of_rotation();
}

// ============================================================================
// Load integration
// ============================================================================

void Substructure::reset_totals() {
    D_ = L_ = M_ = 0.0;
    Da_ = La_ = Ma_ = 0.0;
    fluid_profile_.clear();
    air_profile_.clear();
}

Real Substructure::cushion_pressure(Real s, Real previous, const std::pair<Real, Real>& wetted,
                                    const StructureParameters& params) const {
    if (interpolator_ != nullptr) {
        if (s > wetted.second) return interpolator_->upstream_pressure();
        if (s < wetted.first) return interpolator_->downstream_pressure();
        return previous;
    }
    if (params_.cushion_total) {
        return params.Pc;
    }
    return previous;
}

SpanLoads Substructure::sample_span(std::size_t i, const std::pair<Real, Real>& wetted,
                                    const StructureParameters& params) const {
    const auto& node_s = curve_.node_arc_lengths();
    SpanLoads span;

    if (interpolator_ != nullptr) {
        fluid::LoadSamples samples = interpolator_->loads_in_range(node_s[i], node_s[i + 1]);
        if (samples.size() < 2 || samples.pressure.size() != samples.size() ||
            samples.shear.size() != samples.size()) {
            throw InvalidArgumentError("Fluid model returned inconsistent samples for '" +
                                       name() + "' element " + std::to_string(i));
        }
        span.s = std::move(samples.s);
        span.p_fluid = std::move(samples.pressure);
        span.tau = std::move(samples.shear);

        if (params.pressure_limiter) {
            for (Real& p : span.p_fluid) p = std::min(p, params.p_stag);
        }
    } else {
        span.s = {node_s[i], node_s[i + 1]};
        span.p_fluid = {0.0, 0.0};
        span.tau = {0.0, 0.0};
    }

    const std::size_t n = span.s.size();
    span.p_cushion.assign(n, 0.0);
    span.p_internal.assign(n, 0.0);

    Real Pc = 0.0;
    for (std::size_t k = 0; k < n; ++k) {
        Pc = cushion_pressure(span.s[k], Pc, wetted, params);
        span.p_cushion[k] = Pc;

        if (params_.Ps_method == PressureMethod::Hydrostatic) {
            span.p_internal[k] = params_.Ps - params.rho * params.g * (curve_.y(span.s[k]) - params.hWL);
        } else {
            span.p_internal[k] = params_.Ps * params_.over_pressure_pct;
        }
    }
    return span;
}

ForceIntegral Substructure::integrate_force(const std::vector<Real>& s,
                                            const std::vector<Real>& p,
                                            const std::vector<Real>& tau,
                                            const Vec2r& center) const {
    const std::size_t n = s.size();
    std::vector<Real> fx(n), fy(n), m(n);

    for (std::size_t k = 0; k < n; ++k) {
        const Vec2r nv = normal_vector(s[k]);
        const Vec2r tv = geometry::rotate_vec(nv, -90.0);
        const Vec2r f = {-p[k] * nv[0] + tau[k] * tv[0],
                         -p[k] * nv[1] + tau[k] * tv[1]};
        const Vec2r pt = coordinates(s[k]);
        const Vec2r r = {pt[0] - center[0], pt[1] - center[1]};

        fx[k] = f[0];
        fy[k] = f[1];
        m[k] = geometry::cross2(r, f);
    }

    ForceIntegral result;
    result.fx = geometry::integrate(s, fx);
    result.fy = geometry::integrate(s, fy);
    result.m = geometry::integrate(s, m);
    return result;
}

void Substructure::update_fluid_forces(const StructureParameters& params) {
    reset_totals();
    begin_load_integration();

    if (elements_.empty()) {
        end_load_integration(params);
        return;
    }

    const std::pair<Real, Real> wetted =
        interpolator_ != nullptr ? interpolator_->min_max_wetted_s() : std::pair<Real, Real>{0.0, 0.0};
    const auto& node_s = curve_.node_arc_lengths();
    const Vec2r center = moment_center();
    const Real ramp2 = params.ramp * params.ramp;

    for (std::size_t i = 0; i < elements_.size(); ++i) {
        SpanLoads span = sample_span(i, wetted, params);

        // Diagnostic profiles hold the unramped fluid pressure
        const Real Pc_end = cushion_pressure(node_s[i + 1], 0.0, wetted, params);
        if (i == 0) {
            fluid_profile_.s.push_back(span.s.front());
            fluid_profile_.p.push_back(span.p_fluid.front());
            air_profile_.s.push_back(node_s[i]);
            air_profile_.p.push_back(Pc_end - params_.Ps);
        }
        for (std::size_t k = 1; k < span.s.size(); ++k) {
            fluid_profile_.s.push_back(span.s[k]);
            fluid_profile_.p.push_back(span.p_fluid[k]);
        }
        air_profile_.s.push_back(node_s[i + 1]);
        if (params_.Ps_method == PressureMethod::Hydrostatic) {
            air_profile_.p.push_back(Pc_end - params_.Ps +
                                     params.rho * params.g * (curve_.y(node_s[i + 1]) - params.hWL));
        } else {
            air_profile_.p.push_back(Pc_end - params_.Ps);
        }

        for (Real& p : span.p_fluid) p *= ramp2;

        const std::vector<Real> p_ext = span.p_external();
        const std::vector<Real> p_tot = span.p_total();

        // Nodal loads
        const Vec2r qp = split_by_centroid(span.s, p_tot);
        Vec2r qs = split_by_centroid(span.s, span.tau);
        qs = {-qs[0], -qs[1]};
        elements_[i]->set_pressure_and_shear(qp, qs);

        // Body totals
        if (params.force_method != ForceMethod::Matched) {
            const std::vector<Real>& integrand =
                params.force_method == ForceMethod::Integrated ? p_ext : span.p_fluid;
            const ForceIntegral f = integrate_force(span.s, integrand, span.tau, center);
            D_ -= f.fx;
            L_ += f.fy;
            M_ += f.m;
        }

        const ForceIntegral fa = integrate_force(span.s, span.p_cushion,
                                                 std::vector<Real>(span.s.size(), 0.0), center);
        Da_ -= fa.fx;
        La_ += fa.fy;
        Ma_ += fa.m;

        accumulate_span(span);
    }

    if (params.force_method == ForceMethod::Matched && interpolator_ != nullptr) {
        D_ = interpolator_->drag();
        L_ = interpolator_->lift();
        M_ = interpolator_->moment();
    }

    end_load_integration(params);
}

// ============================================================================
// RigidSubstructure
// ============================================================================

UniquePtr<fem::Element> RigidSubstructure::create_element() const {
    return make_unique<fem::RigidElement>();
}

} // namespace structure
} // namespace pls
