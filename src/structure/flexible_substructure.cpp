/**
 * @file flexible_substructure.cpp
 * @brief Truss substructure assembly and the global flexible solve
 */

#include <planingsim/structure/flexible_substructure.hpp>
#include <planingsim/structure/fe_structure.hpp>
#include <algorithm>
#include <cmath>

namespace pls {
namespace structure {

namespace {

Real max_abs(const std::vector<Real>& v) {
    Real m = 0.0;
    for (Real x : v) m = std::max(m, std::abs(x));
    return m;
}

} // namespace

UniquePtr<fem::Element> FlexibleSubstructure::create_element() const {
    return make_unique<fem::TrussElement>();
}

void FlexibleSubstructure::set_element_properties() {
    const Real L0 = arc_length() / static_cast<Real>(elements_.size());
    for (auto& el : elements_) {
        auto& truss = static_cast<fem::TrussElement&>(*el);
        truss.set_properties(L0, -params_.pretension, params_.EA);
        truss.update_geometry();
    }
}

void FlexibleSubstructure::assemble(solver::DenseMatrix& K, std::vector<Real>& F) const {
    Mat4r Ke{};
    Vec4r Fe{};

    for (const auto& el : elements_) {
        el->stiffness_and_force(Ke, Fe);
        const auto dofs = el->dof_indices();

        for (int a = 0; a < fem::Element::NUM_DOF; ++a) {
            PLS_CHECK_RANGE(dofs[a], F.size());
            F[dofs[a]] += Fe[a];
            for (int b = 0; b < fem::Element::NUM_DOF; ++b) {
                K(dofs[a], dofs[b]) += Ke[a * fem::Element::NUM_DOF + b];
            }
        }
    }
}

void FlexibleSubstructure::update_all(StructureRegistry& registry, const StructureParameters& params) {
    PLS_SCOPED_TIMER("Flexible structure solve");
    const std::vector<FlexibleSubstructure*> flexible = registry.flexible_substructures();
    FlexibleAssembly& assembly = registry.assembly();
    assembly.resize(registry.dof_count());

    std::string owner;
    for (FlexibleSubstructure* ss : flexible) {
        ss->update_fluid_forces(params);
        ss->assemble(assembly.K, assembly.F);
        owner += owner.empty() ? ss->name() : ", " + ss->name();
    }
    if (owner.empty()) {
        owner = "flexible structure";
    }

    for (const auto& nd : registry.nodes()) {
        for (int i = 0; i < fem::Node::DOF_PER_NODE; ++i) {
            assembly.F[nd->dof(i)] += nd->fixed_load()[i];
            assembly.free_dof[nd->dof(i)] = !nd->fixed_dof(i);
        }
    }

    assembly.U = solver::solve_reduced(assembly.K, assembly.F, assembly.free_dof, owner);

    assembly.residual = max_abs(assembly.U);

    for (Real& u : assembly.U) u *= params.relax_FEM;
    const Real u_max = max_abs(assembly.U);
    if (u_max > 0.0) {
        const Real scale = std::min(params.max_FEM_disp / u_max, 1.0);
        for (Real& u : assembly.U) u *= scale;
    }

    for (const auto& nd : registry.nodes()) {
        nd->move(assembly.U[nd->dof(0)], assembly.U[nd->dof(1)]);
    }

    for (FlexibleSubstructure* ss : flexible) {
        ss->update_geometry();
    }

    PLS_LOG_DEBUG("Flexible structure: {} substructures, {} DOFs, residual {:.4e}",
                  flexible.size(), assembly.size(), assembly.residual);
}

} // namespace structure
} // namespace pls
