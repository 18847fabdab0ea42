/**
 * @file truss_element_test.cpp
 * @brief Truss and rigid element stiffness, force and rotation
 */

#include <planingsim/fem/element.hpp>
#include <planingsim/fem/node.hpp>
#include <iostream>
#include <cmath>

using namespace pls;
using namespace pls::fem;

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

static bool symmetric(const Mat4r& K, Real tol = 1.0e-8) {
    for (int i = 0; i < 4; ++i)
        for (int j = 0; j < 4; ++j)
            if (!near(K[i * 4 + j], K[j * 4 + i], tol)) return false;
    return true;
}

// ==========================================================================
// Test 1: Node DOFs
// ==========================================================================
void test_node() {
    std::cout << "\n=== Test 1: Node DOFs ===\n";

    Node n(3, 1.0, 2.0);
    CHECK(n.dof(0) == 6 && n.dof(1) == 7, "global DOF indices 2*id, 2*id+1");
    CHECK(!n.fixed_dof(0) && !n.fixed_dof(1), "DOFs free by default");

    n.fix_all();
    CHECK(n.fixed_dof(0) && n.fixed_dof(1), "fix_all");

    n.move(0.5, -1.0);
    CHECK(near(n.x(), 1.5) && near(n.y(), 1.0), "move");

    n.set_fixed_load(10.0, -5.0);
    CHECK(n.fixed_load()[0] == 10.0 && n.fixed_load()[1] == -5.0, "fixed load");
}

// ==========================================================================
// Test 2: Horizontal truss
// ==========================================================================
void test_horizontal_truss() {
    std::cout << "\n=== Test 2: Horizontal truss ===\n";

    Node n0(0, 0.0, 0.0), n1(1, 2.0, 0.0);
    TrussElement el;
    el.set_properties(2.0, 0.0, 1000.0);
    el.set_nodes(&n0, &n1);

    CHECK(near(el.length(), 2.0), "current length");
    CHECK(near(el.angle(), 0.0), "orientation");
    CHECK(near(el.axial_force(), 0.0), "no strain, no pretension");

    auto dofs = el.dof_indices();
    CHECK(dofs[0] == 0 && dofs[1] == 1 && dofs[2] == 2 && dofs[3] == 3, "element DOF indices");

    Mat4r K{};
    Vec4r F{};
    el.stiffness_and_force(K, F);
    CHECK(near(K[0], 500.0) && near(K[2], -500.0) && near(K[10], 500.0), "axial stiffness EA/L");
    CHECK(near(K[5], 0.0), "no transverse stiffness without axial force");
    CHECK(symmetric(K), "stiffness symmetric");
    CHECK(near(F[0], 0.0) && near(F[2], 0.0), "zero force");
}

// ==========================================================================
// Test 3: Stretched and pretensioned truss
// ==========================================================================
void test_axial_force() {
    std::cout << "\n=== Test 3: Axial force ===\n";

    Node n0(0, 0.0, 0.0), n1(1, 1.1, 0.0);
    TrussElement el;
    el.set_properties(1.0, 5.0, 100.0);
    el.set_nodes(&n0, &n1);

    // N = N0 + EA (L - L0) / L0 = 5 + 100 * 0.1
    CHECK(near(el.axial_force(), 15.0), "axial force from strain and pretension");

    Mat4r K{};
    Vec4r F{};
    el.set_pressure_and_shear({0.0, 0.0}, {0.0, 0.0});
    el.stiffness_and_force(K, F);
    CHECK(near(F[0], 15.0) && near(F[2], -15.0), "axial force pulls nodes together");
    CHECK(near(K[5], 15.0 / 1.1), "geometric stiffness N/L");

    el.set_pressure_and_shear({2.0, 3.0}, {0.0, 0.0});
    el.stiffness_and_force(K, F);
    CHECK(near(F[1], 2.0) && near(F[3], 3.0), "pressure acts along the local y axis");
}

// ==========================================================================
// Test 4: Rotated truss
// ==========================================================================
void test_rotated_truss() {
    std::cout << "\n=== Test 4: Rotated truss ===\n";

    Node n0(0, 0.0, 0.0), n1(1, 0.0, 1.0);
    TrussElement el;
    el.set_properties(1.0, 0.0, 1000.0);
    el.set_nodes(&n0, &n1);

    CHECK(near(el.angle(), 90.0), "vertical element at 90 degrees");

    Mat4r K{};
    Vec4r F{};
    el.stiffness_and_force(K, F);
    CHECK(near(K[5], 1000.0) && near(K[15], 1000.0) && near(K[7], -1000.0), "axial stiffness moved to y");
    CHECK(near(K[0], 0.0, 1.0e-9), "no x stiffness");
    CHECK(symmetric(K), "rotated stiffness symmetric");

    el.set_pressure_and_shear({1.0, 1.0}, {0.0, 0.0});
    el.stiffness_and_force(K, F);
    CHECK(near(F[0], -1.0) && near(F[2], -1.0), "local y load rotates to global -x");
}

// ==========================================================================
// Test 5: Rigid element
// ==========================================================================
void test_rigid_element() {
    std::cout << "\n=== Test 5: Rigid element ===\n";

    Node n0(0, 0.0, 0.0), n1(1, 1.0, 1.0);
    RigidElement el;
    el.set_nodes(&n0, &n1);
    el.set_pressure_and_shear({10.0, 10.0}, {1.0, 1.0});

    Mat4r K;
    Vec4r F;
    K.fill(1.0);
    F.fill(1.0);
    el.stiffness_and_force(K, F);

    bool all_zero = true;
    for (Real k : K) all_zero = all_zero && k == 0.0;
    for (Real f : F) all_zero = all_zero && f == 0.0;
    CHECK(all_zero, "rigid element contributes nothing");
    CHECK(near(el.length(), std::sqrt(2.0)), "geometry still tracked");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "PlaningSim: Truss Element Test\n";
    std::cout << "========================================\n";

    test_node();
    test_horizontal_truss();
    test_axial_force();
    test_rotated_truss();
    test_rigid_element();

    std::cout << "\n========================================\n";
    std::cout << "Results: " << tests_passed << "/" << (tests_passed + tests_failed)
              << " tests passed\n";
    std::cout << "========================================\n";

    return (tests_failed > 0) ? 1 : 0;
}
