/**
 * @file element.cpp
 * @brief Planar truss and rigid element implementation
 */

#include <planingsim/fem/element.hpp>
#include <planingsim/geometry/trig.hpp>
#include <cmath>

namespace pls {
namespace fem {

void Element::set_nodes(Node* n0, Node* n1) {
    PLS_REQUIRE(n0 != nullptr && n1 != nullptr, "element nodes must exist");
    nodes_ = {n0, n1};
    update_geometry();
}

std::array<Index, Element::NUM_DOF> Element::dof_indices() const {
    PLS_ASSERT(nodes_[0] && nodes_[1], "element nodes not set");
    return {nodes_[0]->dof(0), nodes_[0]->dof(1), nodes_[1]->dof(0), nodes_[1]->dof(1)};
}

void Element::update_geometry() {
    if (!nodes_[0] || !nodes_[1]) return;

    const Real dx = nodes_[1]->x() - nodes_[0]->x();
    const Real dy = nodes_[1]->y() - nodes_[0]->y();
    L_ = std::sqrt(dx * dx + dy * dy);
    gamma_ = geometry::atand2(dy, dx);
}

void Element::to_global(const Mat4r& K_local, const Vec4r& F_local, Mat4r& K, Vec4r& F) const {
    const Real C = geometry::cosd(gamma_);
    const Real S = geometry::sind(gamma_);

    // T = [[C, S, 0, 0], [-S, C, 0, 0], [0, 0, C, S], [0, 0, -S, C]]
    const Mat4r T = {
         C,   S,   0.0, 0.0,
        -S,   C,   0.0, 0.0,
         0.0, 0.0, C,   S,
         0.0, 0.0, -S,  C
    };

    // K = T^T * K_local * T
    Mat4r KT{};
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            Real sum = 0.0;
            for (int k = 0; k < 4; ++k) sum += K_local[i * 4 + k] * T[k * 4 + j];
            KT[i * 4 + j] = sum;
        }
    }
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            Real sum = 0.0;
            for (int k = 0; k < 4; ++k) sum += T[k * 4 + i] * KT[k * 4 + j];
            K[i * 4 + j] = sum;
        }
    }

    // F = T^T * F_local
    for (int i = 0; i < 4; ++i) {
        Real sum = 0.0;
        for (int k = 0; k < 4; ++k) sum += T[k * 4 + i] * F_local[k];
        F[i] = sum;
    }
}

// ============================================================================
// TrussElement
// ============================================================================

void TrussElement::update_geometry() {
    Element::update_geometry();
    axial_force_ = initial_axial_force_;
    if (L0_ > 0.0) {
        axial_force_ += EA_ * (L_ - L0_) / L0_;
    }
}

void TrussElement::stiffness_and_force(Mat4r& K, Vec4r& F) const {
    if (!(L_ > 0.0)) {
        throw LogicError("Truss element has zero length");
    }

    const Real kl = EA_ / L_;
    const Real knl = axial_force_ / L_;

    const Mat4r K_local = {
         kl + knl,  0.0,  -kl - knl,  0.0,
         0.0,       knl,   0.0,      -knl,
        -kl - knl,  0.0,   kl + knl,  0.0,
         0.0,      -knl,   0.0,       knl
    };

    const Vec4r F_local = {
        qs_[0] + axial_force_,
        qp_[0],
        qs_[1] - axial_force_,
        qp_[1]
    };

    to_global(K_local, F_local, K, F);
}

} // namespace fem
} // namespace pls
