#pragma once

/**
 * @file flexible_substructure.hpp
 * @brief Truss substructures and the global flexible-structure solve
 *
 * All flexible substructures of a model are assembled into one dense system
 * of size 2 x (node count). Nodes shared by adjacent substructures receive
 * contributions from both. The solve is a barrier: every substructure's loads
 * are evaluated on the same coordinate snapshot before any node moves.
 */

#include <planingsim/structure/substructure.hpp>
#include <planingsim/solver/dense_solver.hpp>

namespace pls {
namespace structure {

/// Global stiffness, force and displacement of the flexible structure
struct FlexibleAssembly {
    solver::DenseMatrix K;
    std::vector<Real> F;
    std::vector<Real> U;
    std::vector<bool> free_dof;

    /// Max |U| of the last solve before relaxation
    Real residual = 0.0;

    void resize(std::size_t num_dof) {
        K.resize(num_dof, num_dof);
        F.assign(num_dof, 0.0);
        U.assign(num_dof, 0.0);
        free_dof.assign(num_dof, false);
    }

    std::size_t size() const { return F.size(); }
};

class FlexibleSubstructure : public Substructure {
public:
    explicit FlexibleSubstructure(const SubstructureParameters& params)
        : Substructure(params) {}

    bool participates_in_assembly() const override { return true; }

    /// Add element stiffness and force into the global system by DOF index
    void assemble(solver::DenseMatrix& K, std::vector<Real>& F) const;

    /**
     * @brief Assemble, solve and apply one flexible-structure update
     *
     * 1. Refresh fluid forces of every flexible substructure and assemble
     * 2. Add nodal fixed loads
     * 3. Solve K_ff u_f = F_f over DOFs not marked fixed (skipped if none)
     * 4. residual = max|u|; u *= relax_FEM; u *= min(max_FEM_disp / max|u|, 1)
     * 5. Move every node, rebuild every flexible substructure's geometry
     *
     * @throws SingularMatrixError naming the flexible substructures
     */
    static void update_all(StructureRegistry& registry, const StructureParameters& params);

protected:
    UniquePtr<fem::Element> create_element() const override;
    void set_element_properties() override;
};

} // namespace structure
} // namespace pls
