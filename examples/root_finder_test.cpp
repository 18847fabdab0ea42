/**
 * @file root_finder_test.cpp
 * @brief Externally driven secant / Broyden root finder
 */

#include <planingsim/solver/root_finder.hpp>
#include <iostream>
#include <cmath>

using namespace pls;
using namespace pls::solver;

static int tests_passed = 0;
static int tests_failed = 0;

#define CHECK(cond, msg) do { \
    if (cond) { \
        std::cout << "[PASS] " << msg << "\n"; \
        tests_passed++; \
    } else { \
        std::cout << "[FAIL] " << msg << "\n"; \
        tests_failed++; \
    } \
} while(0)

static bool near(Real a, Real b, Real tol = 1.0e-8) {
    return std::fabs(a - b) < tol;
}

/// Linear model f = A x - b moved by the test driver
struct LinearModel {
    Real A[2][2];
    Real b[2];
    std::vector<Real> x = {0.0, 0.0};

    std::vector<Real> residual() const {
        return {A[0][0] * x[0] + A[0][1] * x[1] - b[0],
                A[1][0] * x[0] + A[1][1] * x[1] - b[1]};
    }

    void apply(const std::vector<Real>& dx) {
        x[0] += dx[0];
        x[1] += dx[1];
    }
};

// ==========================================================================
// Test 1: Broyden on a coupled linear system
// ==========================================================================
void test_broyden_linear() {
    std::cout << "\n=== Test 1: Broyden on a coupled linear system ===\n";

    // Root at (0.2, 0.1)
    LinearModel model{{{1000.0, 100.0}, {50.0, 2000.0}}, {210.0, 210.0}};
    auto f = [&model](const std::vector<Real>&) { return model.residual(); };

    RootFinder finder(f, model.x, RootFinderMethod::Broyden, {true, true}, 0.01);

    auto dx = finder.get_step();
    CHECK(near(dx[0], 0.01) && dx[1] == 0.0, "first step perturbs the first unknown");
    model.apply(dx);
    finder.take_step(dx);
    CHECK(!finder.jacobian_ready(), "Jacobian not ready after one column");

    dx = finder.get_step();
    CHECK(dx[0] == 0.0 && near(dx[1], 0.01), "second step perturbs the second unknown");
    model.apply(dx);
    finder.take_step(dx);

    dx = finder.get_step();
    CHECK(finder.jacobian_ready(), "Jacobian ready after all columns");
    CHECK(near(finder.jacobian()(0, 1), 100.0, 1.0e-6), "finite-difference Jacobian entry");

    model.apply(dx);
    CHECK(near(model.x[0], 0.2) && near(model.x[1], 0.1), "Newton step reaches the root");
}

// ==========================================================================
// Test 2: Secant on a decoupled system
// ==========================================================================
void test_secant() {
    std::cout << "\n=== Test 2: Secant on a decoupled system ===\n";

    LinearModel model{{{10.0, 0.0}, {0.0, 5.0}}, {1.0, -1.0}};
    auto f = [&model](const std::vector<Real>&) { return model.residual(); };

    RootFinder finder(f, model.x, RootFinderMethod::Secant, {true, true}, 0.001);

    auto dx = finder.get_step();
    CHECK(near(dx[0], 0.001) && near(dx[1], 0.001), "secant perturbs all free unknowns");
    model.apply(dx);
    finder.take_step(dx);

    dx = finder.get_step();
    model.apply(dx);
    CHECK(near(model.x[0], 0.1) && near(model.x[1], -0.2), "secant step reaches the root");
}

// ==========================================================================
// Test 3: Fixed unknowns
// ==========================================================================
void test_fixed_unknowns() {
    std::cout << "\n=== Test 3: Fixed unknowns ===\n";

    auto f = [](const std::vector<Real>& x) { return std::vector<Real>{x[0] - 0.5, x[1] + 3.0}; };
    RootFinder finder(f, {0.0, 0.0}, RootFinderMethod::Broyden, {true, false}, 0.01);

    auto dx = finder.get_step();
    CHECK(near(dx[0], 0.01) && dx[1] == 0.0, "fixed unknown never perturbed");
    finder.take_step(dx);

    dx = finder.get_step();
    CHECK(finder.jacobian_ready(), "one free column completes the Jacobian");
    CHECK(near(dx[0], 0.49, 1.0e-9), "Newton step on the free unknown");
    CHECK(dx[1] == 0.0, "fixed unknown keeps a zero step despite its residual");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "PlaningSim: Root Finder Test\n";
    std::cout << "========================================\n";

    test_broyden_linear();
    test_secant();
    test_fixed_unknowns();

    std::cout << "\n========================================\n";
    std::cout << "Results: " << tests_passed << "/" << (tests_passed + tests_failed)
              << " tests passed\n";
    std::cout << "========================================\n";

    return (tests_failed > 0) ? 1 : 0;
}
