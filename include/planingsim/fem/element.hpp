#pragma once

/**
 * @file element.hpp
 * @brief 2-node planar elements used by substructures
 *
 * Node numbering:
 *     0-----------1
 *
 * DOFs per node: 2 (ux, uy). Element DOF order: [u0x, u0y, u1x, u1y].
 *
 * Pressure (qp) acts along the local normal, shear (qs) along the local axis.
 * Both are given as nodal pairs produced by the substructure load
 * integration.
 */

#include <planingsim/core/core.hpp>
#include <planingsim/fem/node.hpp>
#include <array>

namespace pls {
namespace fem {

class Element {
public:
    static constexpr int NUM_NODES = 2;
    static constexpr int NUM_DOF = NUM_NODES * Node::DOF_PER_NODE;  // 4 DOFs

    virtual ~Element() = default;

    void set_nodes(Node* n0, Node* n1);

    Node* node(int i) const { return nodes_[i]; }

    /// Global DOF indices [n0x, n0y, n1x, n1y]
    std::array<Index, NUM_DOF> dof_indices() const;

    /// Nodal pressure and shear pairs from the load integration
    void set_pressure_and_shear(const Vec2r& qp, const Vec2r& qs) {
        qp_ = qp;
        qs_ = qs;
    }

    const Vec2r& pressure_load() const { return qp_; }
    const Vec2r& shear_load() const { return qs_; }

    /// Recompute current length and orientation from node coordinates
    virtual void update_geometry();

    Real length() const { return L_; }
    Real initial_length() const { return L0_; }

    /// Orientation of node 0 -> node 1 in degrees
    Real angle() const { return gamma_; }

    /// Reference (stress-free) length
    void set_initial_length(Real L0) { L0_ = L0; }

    /**
     * @brief Element stiffness and residual force in global coordinates
     * @param K Output 4x4 stiffness (row-major)
     * @param F Output 4-vector force
     */
    virtual void stiffness_and_force(Mat4r& K, Vec4r& F) const = 0;

protected:
    /// Rotate a local 4x4 matrix and 4-vector into global coordinates
    void to_global(const Mat4r& K_local, const Vec4r& F_local, Mat4r& K, Vec4r& F) const;

    std::array<Node*, NUM_NODES> nodes_{nullptr, nullptr};
    Vec2r qp_{0.0, 0.0};
    Vec2r qs_{0.0, 0.0};
    Real L_ = 0.0;
    Real L0_ = 0.0;
    Real gamma_ = 0.0;
};

// ============================================================================
// Truss Element - axial bar with pretension
// ============================================================================

/**
 * Axial force: N = N0 + EA (L - L0) / L0
 *
 * Local stiffness:
 *   KL  = EA/L [[1,0,-1,0],[0,0,0,0],[-1,0,1,0],[0,0,0,0]]
 *   KNL = N/L  [[1,0,-1,0],[0,1,0,-1],[-1,0,1,0],[0,-1,0,1]]
 *
 * Local force: [qs0, qp0, qs1, qp1] + N [1, 0, -1, 0]
 */
class TrussElement : public Element {
public:
    TrussElement() = default;
    ~TrussElement() override = default;

    void set_properties(Real length, Real axial_force, Real axial_stiffness) {
        L0_ = length;
        initial_axial_force_ = axial_force;
        EA_ = axial_stiffness;
    }

    void set_axial_force(Real N0) { initial_axial_force_ = N0; }
    void set_axial_stiffness(Real EA) { EA_ = EA; }

    Real axial_stiffness() const { return EA_; }
    Real axial_force() const { return axial_force_; }

    void update_geometry() override;

    void stiffness_and_force(Mat4r& K, Vec4r& F) const override;

private:
    Real EA_ = 0.0;
    Real initial_axial_force_ = 0.0;
    Real axial_force_ = 0.0;
};

// ============================================================================
// Rigid Element - locked, contributes nothing to the global system
// ============================================================================

class RigidElement : public Element {
public:
    RigidElement() = default;
    ~RigidElement() override = default;

    void stiffness_and_force(Mat4r& K, Vec4r& F) const override {
        K.fill(0.0);
        F.fill(0.0);
    }
};

} // namespace fem
} // namespace pls
