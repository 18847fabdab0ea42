#pragma once

/**
 * @file root_finder.hpp
 * @brief Externally-driven quasi-Newton root finder for small systems
 *
 * The finder never moves the model itself. The caller asks for a step,
 * applies it to the model, refreshes the loads and reports the applied step
 * back through take_step(), which re-evaluates the residual and updates the
 * Jacobian estimate.
 *
 * Methods:
 * - Secant:  diagonal Jacobian, J_ii = df_i / dx_i
 * - Broyden: full Jacobian, J += (df - J dx) dx^T / |dx|^2
 *
 * The initial Jacobian is built by finite differences: Secant perturbs all
 * free unknowns at once, Broyden one unknown per step. Steps are returned
 * unlimited; bounding them is left to the caller.
 */

#include <planingsim/core/core.hpp>
#include <planingsim/solver/dense_solver.hpp>
#include <functional>
#include <vector>

namespace pls {
namespace solver {

enum class RootFinderMethod {
    Secant,
    Broyden
};

class RootFinder {
public:
    using ResidualFunction = std::function<std::vector<Real>(const std::vector<Real>& x)>;

    /**
     * @param f Residual function
     * @param x0 Initial unknowns
     * @param method Jacobian update rule
     * @param free Unknowns the finder may move; fixed ones always get a zero step
     * @param first_step Finite-difference perturbation for the initial Jacobian
     */
    RootFinder(ResidualFunction f, std::vector<Real> x0, RootFinderMethod method,
               std::vector<bool> free, Real first_step = 1.0e-6);

    /// Report a step that has been applied to the model
    void take_step(const std::vector<Real>& dx);

    /// Next unlimited step (finite-difference perturbation or quasi-Newton step)
    std::vector<Real> get_step();

    const std::vector<Real>& x() const { return x_; }
    const std::vector<Real>& residual() const { return f_; }
    const DenseMatrix& jacobian() const { return J_; }
    bool jacobian_ready() const { return jacobian_ready_; }
    RootFinderMethod method() const { return method_; }
    std::size_t dimension() const { return x_.size(); }

    void set_owner(const std::string& owner) { owner_ = owner; }

private:
    bool is_free(std::size_t i) const { return free_[i]; }
    void evaluate_if_needed();

    ResidualFunction func_;
    std::vector<Real> x_;
    std::vector<Real> f_;
    std::vector<bool> free_;
    DenseMatrix J_;
    RootFinderMethod method_;
    Real first_step_;
    bool f_valid_ = false;
    bool jacobian_ready_ = false;
    std::size_t fd_column_ = 0;
    std::string owner_ = "root finder";
};

} // namespace solver
} // namespace pls
