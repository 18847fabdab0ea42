#pragma once

/**
 * @file fe_structure.hpp
 * @brief Structural model: node/substructure registry and the outer-iteration driver
 *
 * Per outer iteration:
 *   1. update_fluid_forces()   bodies sum substructure loads and refresh residuals
 *   2. calculate_response()    rigid steps, one flexible solve, hinge updates
 *                              (or load the iteration directory in replay mode)
 *   3. get_residual()          max of free-body residuals and the flexible residual
 */

#include <planingsim/core/core.hpp>
#include <planingsim/io/mesh_reader.hpp>
#include <planingsim/structure/flexible_substructure.hpp>
#include <planingsim/structure/parameters.hpp>
#include <planingsim/structure/rigid_body.hpp>
#include <planingsim/structure/substructure.hpp>
#include <planingsim/structure/torsional_spring_substructure.hpp>
#include <string>
#include <vector>

namespace pls {

namespace io { class ConfigSection; }

namespace structure {

// ============================================================================
// Registry
// ============================================================================

/**
 * @brief Owner of every node, every substructure and the flexible assembly
 *
 * Node ids are assigned in insertion order and index the global DOFs.
 */
class StructureRegistry {
public:
    StructureRegistry() = default;

    StructureRegistry(const StructureRegistry&) = delete;
    StructureRegistry& operator=(const StructureRegistry&) = delete;

    // Nodes
    fem::Node& add_node(Real x, Real y);
    fem::Node& node(Index i);
    const fem::Node& node(Index i) const;
    std::size_t node_count() const { return nodes_.size(); }
    std::size_t dof_count() const { return fem::Node::DOF_PER_NODE * nodes_.size(); }
    const std::vector<UniquePtr<fem::Node>>& nodes() const { return nodes_; }

    // Substructures
    /// @throws InvalidArgumentError on a duplicate name
    Substructure& add_substructure(UniquePtr<Substructure> ss);

    /// @throws InvalidArgumentError if no substructure has this name
    Substructure& find_substructure(const std::string& name);
    const Substructure& find_substructure(const std::string& name) const;

    bool has_substructure(const std::string& name) const;
    const std::vector<UniquePtr<Substructure>>& substructures() const { return substructures_; }

    /// Substructures that take part in the global flexible solve
    std::vector<FlexibleSubstructure*> flexible_substructures() const;

    FlexibleAssembly& assembly() { return assembly_; }
    const FlexibleAssembly& assembly() const { return assembly_; }

private:
    std::vector<UniquePtr<fem::Node>> nodes_;
    std::vector<UniquePtr<Substructure>> substructures_;
    FlexibleAssembly assembly_;
};

// ============================================================================
// Structure
// ============================================================================

class FEStructure {
public:
    explicit FEStructure(const StructureParameters& params = StructureParameters{});

    FEStructure(const FEStructure&) = delete;
    FEStructure& operator=(const FEStructure&) = delete;

    /**
     * @brief Build bodies and substructures from the "structure", "bodies"
     *        and "substructures" sections
     *
     * A default body is created when no body is listed.
     */
    static UniquePtr<FEStructure> from_config(const io::ConfigSection& root);

    // ------------------------------------------------------------------------
    // Model construction
    // ------------------------------------------------------------------------

    RigidBody& add_rigid_body(const RigidBodyParameters& params);

    /**
     * @brief Create a substructure and attach it to its body
     *
     * An empty body name selects the first body.
     *
     * @throws InvalidArgumentError if there is no body or the body name is unknown
     */
    Substructure& add_substructure(const SubstructureParameters& params);

    /// Read the mesh directory (empty: the configured mesh directory)
    void load_mesh(const std::string& directory = "");

    /// Create nodes and element chains, then resolve attachments
    void load_mesh(const io::PlaningMesh& mesh);

    void set_interpolator(const std::string& substructure, const fluid::LoadInterpolator* interpolator);

    // ------------------------------------------------------------------------
    // Iteration
    // ------------------------------------------------------------------------

    void initialize_rigid_bodies();
    void update_fluid_forces();
    void calculate_response();

    /// Recompute and return the global residual
    Real get_residual();
    Real residual() const { return residual_; }

    /// update_fluid_forces, calculate_response, get_residual
    Real iterate();

    // ------------------------------------------------------------------------
    // Results
    // ------------------------------------------------------------------------

    void set_iteration_directory(const std::string& directory) { iteration_dir_ = directory; }
    const std::string& iteration_directory() const { return iteration_dir_; }

    void write_results() const;

    /// Replay: refresh loads, then load body motion and node coordinates
    void load_response();

    // ------------------------------------------------------------------------
    // Access
    // ------------------------------------------------------------------------

    void set_ramp(Real ramp) { params_.ramp = ramp; }
    StructureParameters& parameters() { return params_; }
    const StructureParameters& parameters() const { return params_; }

    /// @throws InvalidArgumentError if no body has this name
    RigidBody& find_body(const std::string& name);

    const std::vector<UniquePtr<RigidBody>>& bodies() const { return bodies_; }
    StructureRegistry& registry() { return registry_; }
    const StructureRegistry& registry() const { return registry_; }

private:
    StructureParameters params_;
    StructureRegistry registry_;
    std::vector<UniquePtr<RigidBody>> bodies_;

    Real residual_ = 1.0;
    std::string iteration_dir_ = ".";
};

} // namespace structure
} // namespace pls
