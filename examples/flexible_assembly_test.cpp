/**
 * @file flexible_assembly_test.cpp
 * @brief Global truss assembly, reduced solve, relaxation and step scaling
 */

#include <planingsim/structure/fe_structure.hpp>
#include <iostream>
#include <cmath>

using namespace pls;
using namespace pls::structure;

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

static bool near(Real a, Real b, Real tol = 1.0e-12) {
    return std::fabs(a - b) < tol;
}

/// One truss from (0, 0) to (1, 0); node 0 clamped, node 1 on a roller in y
static FlexibleSubstructure& build_bar(StructureRegistry& reg, const std::string& name = "skin") {
    fem::Node& n0 = reg.add_node(0.0, 0.0);
    fem::Node& n1 = reg.add_node(1.0, 0.0);
    n0.fix_all();
    n1.set_fixed_dofs(false, true);

    SubstructureParameters p;
    p.name = name;
    p.type = SubstructureType::Flexible;
    p.pretension = 0.0;
    p.EA = 5.0e7;

    auto& ss = static_cast<FlexibleSubstructure&>(
        reg.add_substructure(make_unique<FlexibleSubstructure>(p)));
    ss.set_elements({{&n0, &n1}});
    return ss;
}

// ==========================================================================
// Test 1: Unloaded truss stays put
// ==========================================================================
void test_unloaded() {
    std::cout << "\n=== Test 1: Unloaded truss ===\n";

    StructureRegistry reg;
    FlexibleSubstructure& ss = build_bar(reg);
    CHECK(ss.participates_in_assembly(), "flexible substructure joins the assembly");
    CHECK(reg.flexible_substructures().size() == 1, "registry lists it");

    StructureParameters params;
    FlexibleSubstructure::update_all(reg, params);

    CHECK(reg.assembly().size() == 4, "assembly sized 2 x node count");
    CHECK(near(reg.node(1).x(), 1.0) && near(reg.node(1).y(), 0.0), "no load, no displacement");
    CHECK(near(reg.assembly().residual, 0.0), "zero residual");
    CHECK(!reg.assembly().free_dof[0] && reg.assembly().free_dof[2] && !reg.assembly().free_dof[3],
          "free mask from fixed DOFs");
}

// ==========================================================================
// Test 2: Axial point load
// ==========================================================================
void test_point_load() {
    std::cout << "\n=== Test 2: Axial point load ===\n";

    StructureRegistry reg;
    FlexibleSubstructure& ss = build_bar(reg);
    reg.node(1).set_fixed_load(1000.0, 0.0);

    StructureParameters params;
    FlexibleSubstructure::update_all(reg, params);

    // u = F L / EA
    CHECK(near(reg.node(1).x(), 1.0 + 2.0e-5, 1.0e-12), "extension F L / EA");
    CHECK(near(reg.assembly().residual, 2.0e-5, 1.0e-12), "residual is max |u|");
    CHECK(near(ss.arc_length(), 1.0 + 2.0e-5, 1.0e-12), "curve rebuilt after the move");
    CHECK(near(reg.node(0).x(), 0.0), "clamped node does not move");
}

// ==========================================================================
// Test 3: Relaxation and step scaling
// ==========================================================================
void test_relaxation_and_scaling() {
    std::cout << "\n=== Test 3: Relaxation and step scaling ===\n";

    {
        StructureRegistry reg;
        build_bar(reg);
        reg.node(1).set_fixed_load(1000.0, 0.0);

        StructureParameters params;
        params.relax_FEM = 0.5;
        FlexibleSubstructure::update_all(reg, params);
        CHECK(near(reg.node(1).x(), 1.0 + 1.0e-5, 1.0e-12), "relaxed displacement");
        CHECK(near(reg.assembly().residual, 2.0e-5, 1.0e-12), "residual before relaxation");
    }
    {
        StructureRegistry reg;
        build_bar(reg);
        reg.node(1).set_fixed_load(1000.0, 0.0);

        StructureParameters params;
        params.max_FEM_disp = 5.0e-6;
        FlexibleSubstructure::update_all(reg, params);
        CHECK(near(reg.node(1).x(), 1.0 + 5.0e-6, 1.0e-12), "displacement scaled to the step bound");
    }
}

// ==========================================================================
// Test 4: Singular reduced system
// ==========================================================================
void test_singular() {
    std::cout << "\n=== Test 4: Singular reduced system ===\n";

    StructureRegistry reg;
    build_bar(reg, "keel");
    reg.node(1).set_fixed_dofs(false, false);

    StructureParameters params;
    bool threw = false;
    std::string what;
    try {
        FlexibleSubstructure::update_all(reg, params);
    } catch (const SingularMatrixError& e) {
        threw = true;
        what = e.what();
    }
    CHECK(threw, "mechanism without transverse stiffness is singular");
    CHECK(what.find("keel") != std::string::npos, "error names the substructure");
}

// ==========================================================================
// Test 5: Shared node between two substructures
// ==========================================================================
void test_shared_node() {
    std::cout << "\n=== Test 5: Shared node ===\n";

    StructureRegistry reg;
    fem::Node& a = reg.add_node(0.0, 0.0);
    fem::Node& b = reg.add_node(1.0, 0.0);
    fem::Node& c = reg.add_node(2.0, 0.0);
    a.fix_all();
    c.fix_all();
    b.set_fixed_dofs(false, true);
    b.set_fixed_load(1000.0, 0.0);

    for (const char* name : {"left", "right"}) {
        SubstructureParameters p;
        p.name = name;
        p.type = SubstructureType::Flexible;
        p.pretension = 0.0;
        p.EA = 5.0e7;
        auto& ss = reg.add_substructure(make_unique<FlexibleSubstructure>(p));
        if (p.name == "left") ss.set_elements({{&a, &b}});
        else ss.set_elements({{&b, &c}});
    }

    StructureParameters params;
    FlexibleSubstructure::update_all(reg, params);

    // Two bars in parallel: k = 2 EA / L
    CHECK(near(b.x(), 1.0 + 1.0e-5, 1.0e-12), "stiffness from both substructures");

    bool threw = false;
    try {
        SubstructureParameters p;
        p.name = "left";
        reg.add_substructure(make_unique<FlexibleSubstructure>(p));
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "duplicate substructure name rejected");
}

// ==========================================================================
// Test 6: Repeated solve at equilibrium
// ==========================================================================
void test_repeat_at_equilibrium() {
    std::cout << "\n=== Test 6: Repeated solve at equilibrium ===\n";

    StructureRegistry reg;
    build_bar(reg);
    reg.node(1).set_fixed_load(1000.0, 0.0);

    StructureParameters params;
    FlexibleSubstructure::update_all(reg, params);
    const Real x1 = reg.node(1).x();
    CHECK(near(reg.assembly().residual, 2.0e-5, 1.0e-12), "first solve moves the loaded node");

    // Axial force EA (L - L0) / L0 now balances the load
    FlexibleSubstructure::update_all(reg, params);
    CHECK(reg.assembly().residual < 1.0e-12, "second solve finds no unbalanced force");
    CHECK(near(reg.node(1).x(), x1, 1.0e-12) && near(reg.node(1).y(), 0.0), "nodes stay in place");

    FlexibleSubstructure::update_all(reg, params);
    CHECK(reg.assembly().residual < 1.0e-12, "further solves stay at equilibrium");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "PlaningSim: Flexible Assembly Test\n";
    std::cout << "========================================\n";

    test_unloaded();
    test_point_load();
    test_relaxation_and_scaling();
    test_singular();
    test_shared_node();
    test_repeat_at_equilibrium();

    std::cout << "\n========================================\n";
    std::cout << "Results: " << tests_passed << "/" << (tests_passed + tests_failed)
              << " tests passed\n";
    std::cout << "========================================\n";

    return (tests_failed > 0) ? 1 : 0;
}
