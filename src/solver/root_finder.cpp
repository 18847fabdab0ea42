/**
 * @file root_finder.cpp
 * @brief Secant / Broyden root finder implementation
 */

#include <planingsim/solver/root_finder.hpp>
#include <algorithm>
#include <cmath>

namespace pls {
namespace solver {

RootFinder::RootFinder(ResidualFunction f, std::vector<Real> x0, RootFinderMethod method,
                       std::vector<bool> free, Real first_step)
    : func_(std::move(f))
    , x_(std::move(x0))
    , free_(std::move(free))
    , J_(x_.size())
    , method_(method)
    , first_step_(first_step)
{
    PLS_REQUIRE(func_ != nullptr, "root finder needs a residual function");
    PLS_REQUIRE(free_.size() == x_.size(), "free mask must match the unknowns");
}

void RootFinder::evaluate_if_needed() {
    if (!f_valid_) {
        f_ = func_(x_);
        PLS_ASSERT(f_.size() == x_.size(), "residual size must match the unknowns");
        f_valid_ = true;
    }
}

void RootFinder::take_step(const std::vector<Real>& dx) {
    PLS_REQUIRE(dx.size() == x_.size(), "step size must match the unknowns");
    evaluate_if_needed();

    const std::size_t n = x_.size();
    for (std::size_t i = 0; i < n; ++i) x_[i] += dx[i];

    std::vector<Real> f_new = func_(x_);
    PLS_ASSERT(f_new.size() == n, "residual size must match the unknowns");

    std::vector<Real> df(n);
    for (std::size_t i = 0; i < n; ++i) df[i] = f_new[i] - f_[i];

    Real dx_norm2 = 0.0;
    for (Real v : dx) dx_norm2 += v * v;

    if (!jacobian_ready_) {
        if (method_ == RootFinderMethod::Secant) {
            for (std::size_t i = 0; i < n; ++i) {
                J_(i, i) = (dx[i] != 0.0) ? df[i] / dx[i] : 1.0;
            }
            jacobian_ready_ = dx_norm2 > 0.0;
        } else if (fd_column_ < n) {
            const std::size_t k = fd_column_;
            if (dx[k] != 0.0) {
                for (std::size_t i = 0; i < n; ++i) J_(i, k) = df[i] / dx[k];
                ++fd_column_;
            }
        }
    } else if (dx_norm2 > 0.0) {
        if (method_ == RootFinderMethod::Secant) {
            for (std::size_t i = 0; i < n; ++i) {
                if (dx[i] != 0.0 && df[i] != 0.0) {
                    J_(i, i) = df[i] / dx[i];
                }
            }
        } else {
            // Good Broyden rank-one update
            std::vector<Real> Jdx(n, 0.0);
            for (std::size_t i = 0; i < n; ++i) {
                for (std::size_t j = 0; j < n; ++j) Jdx[i] += J_(i, j) * dx[j];
            }
            for (std::size_t i = 0; i < n; ++i) {
                for (std::size_t j = 0; j < n; ++j) {
                    J_(i, j) += (df[i] - Jdx[i]) * dx[j] / dx_norm2;
                }
            }
        }
    }

    f_ = std::move(f_new);
}

std::vector<Real> RootFinder::get_step() {
    evaluate_if_needed();
    const std::size_t n = x_.size();
    std::vector<Real> dx(n, 0.0);

    if (!jacobian_ready_) {
        if (method_ == RootFinderMethod::Secant) {
            for (std::size_t i = 0; i < n; ++i) {
                if (is_free(i)) dx[i] = first_step_;
            }
            return dx;
        }

        // Fixed unknowns get a unit column and are skipped
        while (fd_column_ < n && !is_free(fd_column_)) {
            for (std::size_t i = 0; i < n; ++i) J_(i, fd_column_) = (i == fd_column_) ? 1.0 : 0.0;
            ++fd_column_;
        }
        if (fd_column_ < n) {
            dx[fd_column_] = first_step_;
            return dx;
        }
        jacobian_ready_ = true;
    }

    if (method_ == RootFinderMethod::Secant) {
        for (std::size_t i = 0; i < n; ++i) {
            if (is_free(i) && J_(i, i) != 0.0) {
                dx[i] = -f_[i] / J_(i, i);
            }
        }
        return dx;
    }

    std::vector<bool> mask(n);
    std::vector<Real> rhs(n);
    for (std::size_t i = 0; i < n; ++i) {
        mask[i] = is_free(i);
        rhs[i] = -f_[i];
    }
    return solve_reduced(J_, rhs, mask, owner_);
}

} // namespace solver
} // namespace pls
