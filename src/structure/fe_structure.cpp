/**
 * @file fe_structure.cpp
 * @brief Structural model registry and outer-iteration driver
 */

#include <planingsim/structure/fe_structure.hpp>
#include <planingsim/io/config_reader.hpp>
#include <planingsim/io/result_io.hpp>
#include <algorithm>
#include <cmath>

namespace pls {
namespace structure {

// ============================================================================
// Registry
// ============================================================================

fem::Node& StructureRegistry::add_node(Real x, Real y) {
    nodes_.push_back(make_unique<fem::Node>(nodes_.size(), x, y));
    return *nodes_.back();
}

fem::Node& StructureRegistry::node(Index i) {
    PLS_CHECK_RANGE(i, nodes_.size());
    return *nodes_[i];
}

const fem::Node& StructureRegistry::node(Index i) const {
    PLS_CHECK_RANGE(i, nodes_.size());
    return *nodes_[i];
}

Substructure& StructureRegistry::add_substructure(UniquePtr<Substructure> ss) {
    PLS_REQUIRE(ss != nullptr, "null substructure");
    if (has_substructure(ss->name())) {
        throw InvalidArgumentError("Duplicate substructure name: " + ss->name());
    }
    substructures_.push_back(std::move(ss));
    return *substructures_.back();
}

Substructure& StructureRegistry::find_substructure(const std::string& name) {
    for (auto& ss : substructures_) {
        if (ss->name() == name) return *ss;
    }
    throw InvalidArgumentError("Unknown substructure: " + name);
}

const Substructure& StructureRegistry::find_substructure(const std::string& name) const {
    for (const auto& ss : substructures_) {
        if (ss->name() == name) return *ss;
    }
    throw InvalidArgumentError("Unknown substructure: " + name);
}

bool StructureRegistry::has_substructure(const std::string& name) const {
    return std::any_of(substructures_.begin(), substructures_.end(),
                       [&name](const UniquePtr<Substructure>& ss) { return ss->name() == name; });
}

std::vector<FlexibleSubstructure*> StructureRegistry::flexible_substructures() const {
    std::vector<FlexibleSubstructure*> result;
    for (const auto& ss : substructures_) {
        if (ss->participates_in_assembly()) {
            result.push_back(static_cast<FlexibleSubstructure*>(ss.get()));
        }
    }
    return result;
}

// ============================================================================
// Construction
// ============================================================================

FEStructure::FEStructure(const StructureParameters& params)
    : params_(params) {}

UniquePtr<FEStructure> FEStructure::from_config(const io::ConfigSection& root) {
    StructureParameters params;
    if (root.has_subsection("structure")) {
        params = StructureParameters::from_config(root.subsection("structure"));
    }

    auto structure = make_unique<FEStructure>(params);

    if (root.has_subsection("bodies")) {
        for (const io::ConfigSection* item : root.subsection("bodies").list_items()) {
            structure->add_rigid_body(RigidBodyParameters::from_config(*item, structure->params_));
        }
    }
    if (structure->bodies_.empty()) {
        structure->add_rigid_body(RigidBodyParameters::from_structure(structure->params_));
    }

    if (root.has_subsection("substructures")) {
        for (const io::ConfigSection* item : root.subsection("substructures").list_items()) {
            structure->add_substructure(SubstructureParameters::from_config(*item, structure->params_));
        }
    }

    return structure;
}

RigidBody& FEStructure::add_rigid_body(const RigidBodyParameters& params) {
    for (const auto& bd : bodies_) {
        if (bd->name() == params.name) {
            throw InvalidArgumentError("Duplicate rigid body name: " + params.name);
        }
    }
    bodies_.push_back(make_unique<RigidBody>(params, params_));
    return *bodies_.back();
}

RigidBody& FEStructure::find_body(const std::string& name) {
    for (auto& bd : bodies_) {
        if (bd->name() == name) return *bd;
    }
    throw InvalidArgumentError("Unknown rigid body: " + name);
}

Substructure& FEStructure::add_substructure(const SubstructureParameters& params) {
    if (bodies_.empty()) {
        throw InvalidArgumentError("Substructure '" + params.name + "' added before any rigid body");
    }
    RigidBody& body = params.body_name.empty() ? *bodies_.front() : find_body(params.body_name);

    UniquePtr<Substructure> ss;
    switch (params.type) {
        case SubstructureType::Flexible:
            ss = make_unique<FlexibleSubstructure>(params);
            break;
        case SubstructureType::TorsionalSpring:
            ss = make_unique<TorsionalSpringSubstructure>(params);
            break;
        case SubstructureType::Rigid:
            ss = make_unique<RigidSubstructure>(params);
            break;
    }

    Substructure& added = registry_.add_substructure(std::move(ss));
    added.set_parent(&body);
    body.add_substructure(&added);

    PLS_LOG_INFO("Adding substructure: {} ({}) to body {}", added.name(), to_string(added.type()), body.name());
    return added;
}

void FEStructure::set_interpolator(const std::string& substructure,
                                   const fluid::LoadInterpolator* interpolator) {
    registry_.find_substructure(substructure).set_interpolator(interpolator);
}

// ============================================================================
// Mesh
// ============================================================================

void FEStructure::load_mesh(const std::string& directory) {
    std::vector<std::string> names;
    for (const auto& ss : registry_.substructures()) {
        names.push_back(ss->name());
    }

    io::PlaningMeshReader reader;
    load_mesh(reader.read(directory.empty() ? params_.mesh_dir : directory, names));
}

void FEStructure::load_mesh(const io::PlaningMesh& mesh) {
    PLS_REQUIRE(registry_.node_count() == 0, "mesh already loaded");
    PLS_REQUIRE(mesh.fixed_dofs.size() == mesh.node_count() &&
                mesh.fixed_loads.size() == mesh.node_count(),
                "mesh node data size mismatch");

    for (std::size_t i = 0; i < mesh.node_count(); ++i) {
        fem::Node& nd = registry_.add_node(mesh.nodes[i][0], mesh.nodes[i][1]);
        nd.set_fixed_dofs(mesh.fixed_dofs[i][0], mesh.fixed_dofs[i][1]);
        nd.set_fixed_load(mesh.fixed_loads[i][0], mesh.fixed_loads[i][1]);
    }

    for (const auto& ss : registry_.substructures()) {
        auto it = mesh.elements.find(ss->name());
        if (it == mesh.elements.end()) {
            throw InvalidArgumentError("No elements for substructure '" + ss->name() + "'");
        }

        std::vector<std::array<fem::Node*, 2>> connectivity;
        connectivity.reserve(it->second.size());
        for (const auto& el : it->second) {
            connectivity.push_back({&registry_.node(el[0]), &registry_.node(el[1])});
        }
        ss->set_elements(connectivity);
    }

    for (const auto& ss : registry_.substructures()) {
        ss->resolve_attachments(registry_);
    }

    for (auto& bd : bodies_) {
        bd->store_nodes();
    }
}

// ============================================================================
// Iteration
// ============================================================================

void FEStructure::initialize_rigid_bodies() {
    for (auto& bd : bodies_) {
        bd->initialize_position();
    }
}

void FEStructure::update_fluid_forces() {
    for (auto& bd : bodies_) {
        bd->update_fluid_forces(params_);
    }
}

void FEStructure::calculate_response() {
    if (params_.results_from_file) {
        load_response();
        return;
    }

    for (auto& bd : bodies_) {
        const Vec2r disp = bd->compute_displacement(params_);
        bd->update_position(disp[0], disp[1]);
    }

    if (!registry_.flexible_substructures().empty()) {
        FlexibleSubstructure::update_all(registry_, params_);
    }

    bool hinge_moved = false;
    for (const auto& ss : registry_.substructures()) {
        if (ss->participates_in_assembly()) continue;
        ss->update_deformation(params_);
        hinge_moved = hinge_moved || ss->residual() != 0.0;
    }

    // A hinge may move the attached node of a neighbouring substructure
    if (hinge_moved) {
        for (const auto& ss : registry_.substructures()) {
            ss->update_geometry();
        }
    }
}

Real FEStructure::get_residual() {
    residual_ = 0.0;
    for (const auto& bd : bodies_) {
        if (bd->any_free()) {
            residual_ = std::max({residual_, std::abs(bd->res_lift()), std::abs(bd->res_moment())});
        }
    }
    residual_ = std::max(residual_, registry_.assembly().residual);
    return residual_;
}

Real FEStructure::iterate() {
    update_fluid_forces();
    calculate_response();
    return get_residual();
}

// ============================================================================
// Results
// ============================================================================

void FEStructure::write_results() const {
    io::ResultWriter writer(iteration_dir_, params_.data_format);
    for (const auto& bd : bodies_) {
        writer.write_motion(bd->name(), bd->motion_record());
        for (const Substructure* ss : bd->substructures()) {
            writer.write_coordinates(ss->name(), ss->node_coordinates());
            if (ss->type() == SubstructureType::TorsionalSpring) {
                writer.write_deformation(ss->name(),
                                         static_cast<const TorsionalSpringSubstructure*>(ss)->angle());
            }
        }
    }
}

void FEStructure::load_response() {
    update_fluid_forces();

    io::ResultReader reader(iteration_dir_, params_.data_format);
    for (auto& bd : bodies_) {
        bd->apply_motion_record(reader.read_motion(bd->name()));
        for (Substructure* ss : bd->substructures()) {
            ss->set_node_coordinates(reader.read_coordinates(ss->name()));
            if (ss->type() == SubstructureType::TorsionalSpring) {
                static_cast<TorsionalSpringSubstructure*>(ss)->restore_angle(
                    reader.read_deformation(ss->name()));
            }
        }
    }

    PLS_LOG_INFO("Loaded response from {}", iteration_dir_);
}

} // namespace structure
} // namespace pls
