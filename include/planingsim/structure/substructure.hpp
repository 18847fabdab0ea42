#pragma once

/**
 * @file substructure.hpp
 * @brief Chain of 2-node elements loaded by fluid, cushion and internal pressure
 *
 * A substructure is parameterized by arc length s along its node chain.
 * Fluid pressure and shear samples are requested per element span from the
 * attached fluid model, combined with cushion and internal pressure, and
 * integrated into:
 * - nodal pressure/shear pairs handed to each element
 * - drag, lift and moment totals about the parent body's center of rotation
 * - air-only totals from the cushion component
 *
 * Sign conventions: force per unit length f = -p n + tau t, with n the unit
 * normal and t = n rotated by -90 degrees. Drag is -integral(fx), lift is
 * integral(fy), moment is integral(r x f).
 */

#include <planingsim/core/core.hpp>
#include <planingsim/fem/element.hpp>
#include <planingsim/fluid/load_interpolator.hpp>
#include <planingsim/geometry/arc_length_curve.hpp>
#include <planingsim/structure/parameters.hpp>
#include <array>
#include <vector>

namespace pls {
namespace structure {

class RigidBody;
class StructureRegistry;

/// Sampled (s, p) pairs retained for diagnostics
struct PressureProfile {
    std::vector<Real> s;
    std::vector<Real> p;

    void clear() {
        s.clear();
        p.clear();
    }
    std::size_t size() const { return s.size(); }
};

/// Pressure components sampled on one element span
struct SpanLoads {
    std::vector<Real> s;
    std::vector<Real> p_fluid;     ///< Ramped hydrodynamic pressure
    std::vector<Real> tau;
    std::vector<Real> p_cushion;
    std::vector<Real> p_internal;

    std::vector<Real> p_external() const;
    std::vector<Real> p_total() const;
};

/// Integrated force and moment of a sampled load distribution
struct ForceIntegral {
    Real fx = 0.0;
    Real fy = 0.0;
    Real m = 0.0;
};

// ============================================================================
// Substructure base
// ============================================================================

class Substructure {
public:
    explicit Substructure(const SubstructureParameters& params);
    virtual ~Substructure() = default;

    Substructure(const Substructure&) = delete;
    Substructure& operator=(const Substructure&) = delete;

    const std::string& name() const { return params_.name; }
    SubstructureType type() const { return params_.type; }
    const SubstructureParameters& parameters() const { return params_; }

    // ------------------------------------------------------------------------
    // Relations (non-owning)
    // ------------------------------------------------------------------------

    void set_parent(RigidBody* body) { parent_ = body; }
    RigidBody* parent() const { return parent_; }

    void set_interpolator(const fluid::LoadInterpolator* interpolator) { interpolator_ = interpolator; }
    const fluid::LoadInterpolator* interpolator() const { return interpolator_; }

    /// Resolve references to other substructures once all exist
    virtual void resolve_attachments(StructureRegistry& /*registry*/) {}

    // ------------------------------------------------------------------------
    // Mesh
    // ------------------------------------------------------------------------

    /**
     * @brief Build the element chain from per-element node pairs
     *
     * Consecutive elements must share a node (end of i == start of i+1).
     * The node chain is every element start plus the last element end.
     *
     * @throws InvalidArgumentError on an empty or broken chain
     */
    void set_elements(const std::vector<std::array<fem::Node*, 2>>& connectivity);

    const std::vector<fem::Node*>& nodes() const { return nodes_; }
    std::size_t node_count() const { return nodes_.size(); }
    std::size_t element_count() const { return elements_.size(); }
    fem::Element& element(std::size_t i) { return *elements_[i]; }
    const fem::Element& element(std::size_t i) const { return *elements_[i]; }

    /// Mark every DOF of every node fixed
    void fix_all_nodes();

    // ------------------------------------------------------------------------
    // Geometry
    // ------------------------------------------------------------------------

    /// Refresh element geometry and rebuild the arc-length curve
    virtual void update_geometry();

    Vec2r coordinates(Real s) const { return curve_.coordinates(s); }
    Vec2r normal_vector(Real s) const { return curve_.normal_vector(s); }
    Real arc_length() const { return curve_.arc_length(); }
    const std::vector<Real>& node_arc_lengths() const { return curve_.node_arc_lengths(); }
    const geometry::ArcLengthCurve& curve() const { return curve_; }

    // ------------------------------------------------------------------------
    // Loads
    // ------------------------------------------------------------------------

    /// Integrate pressure and shear into element loads and force totals
    virtual void update_fluid_forces(const StructureParameters& params);

    Real drag() const { return D_; }
    Real lift() const { return L_; }
    Real moment() const { return M_; }
    Real air_drag() const { return Da_; }
    Real air_lift() const { return La_; }
    Real air_moment() const { return Ma_; }

    const PressureProfile& fluid_profile() const { return fluid_profile_; }
    const PressureProfile& air_profile() const { return air_profile_; }

    // ------------------------------------------------------------------------
    // Capabilities
    // ------------------------------------------------------------------------

    /// Contributes elastic elements to the global flexible assembly
    virtual bool participates_in_assembly() const { return false; }

    /// Nodes are fully fixed and move only by rigid rotation
    virtual bool is_rigid_chain() const { return false; }

    /// Deformation update after the rigid-body and flexible steps
    virtual void update_deformation(const StructureParameters& /*params*/) {}

    /// Deformation residual of this substructure
    virtual Real residual() const { return 0.0; }

    /// Current node coordinates in chain order
    std::vector<Vec2r> node_coordinates() const;

    /// Overwrite node coordinates in chain order and rebuild geometry
    void set_node_coordinates(const std::vector<Vec2r>& coords);

protected:
    virtual UniquePtr<fem::Element> create_element() const = 0;

    /// Reference length arc_length / element count for every element
    virtual void set_element_properties();

    virtual void on_mesh_loaded() {}

    /// Hooks around the per-element load integration
    virtual void begin_load_integration() {}
    virtual void accumulate_span(const SpanLoads& /*span*/) {}
    virtual void end_load_integration(const StructureParameters& /*params*/) {}

    /// Parent center of rotation, origin when detached
    Vec2r moment_center() const;

    /// Integrate f = -p n + tau t and r x f over the samples
    ForceIntegral integrate_force(const std::vector<Real>& s,
                                  const std::vector<Real>& p,
                                  const std::vector<Real>& tau,
                                  const Vec2r& center) const;

    SubstructureParameters params_;
    RigidBody* parent_ = nullptr;
    const fluid::LoadInterpolator* interpolator_ = nullptr;

    std::vector<fem::Node*> nodes_;
    std::vector<UniquePtr<fem::Element>> elements_;
    geometry::ArcLengthCurve curve_;

    Real D_ = 0.0;
    Real L_ = 0.0;
    Real M_ = 0.0;
    Real Da_ = 0.0;
    Real La_ = 0.0;
    Real Ma_ = 0.0;

    PressureProfile fluid_profile_;
    PressureProfile air_profile_;

private:
    void reset_totals();

    /// Cushion pressure at s; inside the wetted range the previous value holds
    Real cushion_pressure(Real s, Real previous, const std::pair<Real, Real>& wetted,
                          const StructureParameters& params) const;

    SpanLoads sample_span(std::size_t element_index, const std::pair<Real, Real>& wetted,
                          const StructureParameters& params) const;
};

// ============================================================================
// Rigid substructure
// ============================================================================

/**
 * Locked element chain. Every node is fixed; the chain only moves with its
 * parent body.
 */
class RigidSubstructure : public Substructure {
public:
    explicit RigidSubstructure(const SubstructureParameters& params)
        : Substructure(params) {}

    bool is_rigid_chain() const override { return true; }

protected:
    UniquePtr<fem::Element> create_element() const override;
    void on_mesh_loaded() override { fix_all_nodes(); }
};

} // namespace structure
} // namespace pls
