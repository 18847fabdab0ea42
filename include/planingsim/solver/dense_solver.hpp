#pragma once

/**
 * @file dense_solver.hpp
 * @brief Dense matrix storage and direct LU solve for the small systems
 *        assembled by the structural model
 *
 * Global flexible-structure systems have 2 x (node count) unknowns and the
 * rigid-body Jacobian is 2x2, so a dense factorization is sufficient.
 */

#include <planingsim/core/core.hpp>
#include <vector>
#include <cmath>
#include <algorithm>

namespace pls {
namespace solver {

// ============================================================================
// Dense Matrix (row-major)
// ============================================================================

class DenseMatrix {
public:
    DenseMatrix() = default;

    DenseMatrix(std::size_t rows, std::size_t cols)
        : rows_(rows), cols_(cols), data_(rows * cols, 0.0) {}

    explicit DenseMatrix(std::size_t n) : DenseMatrix(n, n) {}

    void resize(std::size_t rows, std::size_t cols) {
        rows_ = rows;
        cols_ = cols;
        data_.assign(rows * cols, 0.0);
    }

    void set_zero() { std::fill(data_.begin(), data_.end(), 0.0); }

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }

    Real& operator()(std::size_t i, std::size_t j) { return data_[i * cols_ + j]; }
    Real operator()(std::size_t i, std::size_t j) const { return data_[i * cols_ + j]; }

    const std::vector<Real>& data() const { return data_; }

    Real max_abs() const {
        Real m = 0.0;
        for (Real v : data_) m = std::max(m, std::abs(v));
        return m;
    }

    /// Submatrix restricted to the rows/columns flagged in mask
    DenseMatrix restrict_to(const std::vector<bool>& mask) const {
        std::vector<std::size_t> idx;
        for (std::size_t i = 0; i < mask.size(); ++i) {
            if (mask[i]) idx.push_back(i);
        }
        DenseMatrix sub(idx.size());
        for (std::size_t i = 0; i < idx.size(); ++i) {
            for (std::size_t j = 0; j < idx.size(); ++j) {
                sub(i, j) = (*this)(idx[i], idx[j]);
            }
        }
        return sub;
    }

private:
    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    std::vector<Real> data_;
};

// ============================================================================
// Direct Solver
// ============================================================================

struct LinearSolverResult {
    bool converged = false;
    int iterations = 0;
    Real residual = 0.0;
    std::string diagnostic;
};

/**
 * @brief Gaussian elimination with partial pivoting
 */
class DirectSolver {
public:
    void set_pivot_tolerance(Real tol) { pivot_tolerance_ = tol; }

    LinearSolverResult solve(const DenseMatrix& A,
                             const std::vector<Real>& b,
                             std::vector<Real>& x) const {
        const std::size_t n = A.rows();
        LinearSolverResult result;

        if (A.cols() != n || b.size() != n) {
            result.diagnostic = "dimension mismatch";
            return result;
        }

        DenseMatrix lu = A;
        x = b;

        const Real scale = lu.max_abs();
        if (n > 0 && scale == 0.0) {
            result.diagnostic = "zero matrix";
            return result;
        }
        const Real tol = pivot_tolerance_ * scale;

        for (std::size_t k = 0; k < n; ++k) {
            // Find pivot
            std::size_t max_row = k;
            Real max_val = std::abs(lu(k, k));
            for (std::size_t i = k + 1; i < n; ++i) {
                if (std::abs(lu(i, k)) > max_val) {
                    max_val = std::abs(lu(i, k));
                    max_row = i;
                }
            }

            if (max_val <= tol) {
                result.diagnostic = "zero pivot in column " + std::to_string(k);
                return result;
            }

            if (max_row != k) {
                for (std::size_t j = 0; j < n; ++j) {
                    std::swap(lu(k, j), lu(max_row, j));
                }
                std::swap(x[k], x[max_row]);
            }

            // Eliminate
            for (std::size_t i = k + 1; i < n; ++i) {
                const Real factor = lu(i, k) / lu(k, k);
                lu(i, k) = factor;
                for (std::size_t j = k + 1; j < n; ++j) {
                    lu(i, j) -= factor * lu(k, j);
                }
                x[i] -= factor * x[k];
            }
        }

        // Back substitution
        for (std::size_t ii = n; ii-- > 0;) {
            for (std::size_t j = ii + 1; j < n; ++j) {
                x[ii] -= lu(ii, j) * x[j];
            }
            x[ii] /= lu(ii, ii);
        }

        result.iterations = 1;
        for (std::size_t i = 0; i < n; ++i) {
            if (std::isnan(x[i]) || std::isinf(x[i])) {
                result.diagnostic = "NaN or Inf in solution after back-substitution";
                return result;
            }
        }
        result.converged = true;
        return result;
    }

private:
    Real pivot_tolerance_ = 1.0e-14;
};

/**
 * @brief Solve A(free, free) x(free) = b(free); entries outside the mask are zero
 *
 * An empty free set returns a zero vector without factorizing. A singular
 * reduced system throws SingularMatrixError naming the owner.
 */
inline std::vector<Real> solve_reduced(const DenseMatrix& A,
                                       const std::vector<Real>& b,
                                       const std::vector<bool>& free_mask,
                                       const std::string& owner) {
    PLS_REQUIRE(A.rows() == b.size() && free_mask.size() == b.size(),
                "reduced solve dimension mismatch");

    std::vector<Real> x(b.size(), 0.0);
    std::vector<std::size_t> idx;
    for (std::size_t i = 0; i < free_mask.size(); ++i) {
        if (free_mask[i]) idx.push_back(i);
    }
    if (idx.empty()) {
        return x;
    }

    DenseMatrix A_ff = A.restrict_to(free_mask);
    std::vector<Real> b_f(idx.size());
    for (std::size_t i = 0; i < idx.size(); ++i) b_f[i] = b[idx[i]];

    std::vector<Real> x_f;
    DirectSolver solver;
    LinearSolverResult result = solver.solve(A_ff, b_f, x_f);
    if (!result.converged) {
        PLS_LOG_ERROR("Direct solve failed for {}: {}", owner, result.diagnostic);
        throw SingularMatrixError(owner, idx.size());
    }

    for (std::size_t i = 0; i < idx.size(); ++i) x[idx[i]] = x_f[i];
    return x;
}

} // namespace solver
} // namespace pls
