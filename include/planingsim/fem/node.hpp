#pragma once

/**
 * @file node.hpp
 * @brief 2D structural node with fixed-DOF flags and a fixed external load
 *
 * DOFs per node: 2 (ux, uy). Global DOF indices are 2*id and 2*id+1.
 */

#include <planingsim/core/types.hpp>

namespace pls {
namespace fem {

class Node {
public:
    static constexpr int DOF_PER_NODE = 2;

    explicit Node(Index id = 0, Real x = 0.0, Real y = 0.0)
        : id_(id), x_(x), y_(y) {}

    Index id() const { return id_; }

    Real x() const { return x_; }
    Real y() const { return y_; }
    Vec2r coordinates() const { return {x_, y_}; }

    void set_coordinates(Real x, Real y) { x_ = x; y_ = y; }
    void move(Real dx, Real dy) { x_ += dx; y_ += dy; }

    /// Global DOF index of component i (0 = x, 1 = y)
    Index dof(int i) const { return DOF_PER_NODE * id_ + static_cast<Index>(i); }

    bool fixed_dof(int i) const { return fixed_dof_[i]; }
    const Vec2b& fixed_dofs() const { return fixed_dof_; }
    void set_fixed_dof(int i, bool fixed) { fixed_dof_[i] = fixed; }
    void set_fixed_dofs(bool fx, bool fy) { fixed_dof_ = {fx, fy}; }
    void fix_all() { fixed_dof_ = {true, true}; }

    const Vec2r& fixed_load() const { return fixed_load_; }
    void set_fixed_load(Real fx, Real fy) { fixed_load_ = {fx, fy}; }

private:
    Index id_;
    Real x_;
    Real y_;
    Vec2b fixed_dof_{false, false};
    Vec2r fixed_load_{0.0, 0.0};
};

} // namespace fem
} // namespace pls
