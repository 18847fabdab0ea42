/**
 * @file config_reader_test.cpp
 * @brief YAML-like configuration parsing and model parameter sections
 */

#include <planingsim/io/config_reader.hpp>
#include <planingsim/structure/parameters.hpp>
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

static const char* kModelConfig = R"(
# Two-body planing model
structure:
  rho: 1000.0
  g: 10
  Lref: 2.0
  flow_speed: 4.0
  W: 500.0
  motion_method: "Broyden"
  cushion_force_method: "Assumed"
  pressure_limiter: true
  free_in_draft: true
  relax_rigid_body: 0.5

bodies:
  - name: "hull"
    loadPct: 0.6
    free_in_trim: true
    xCofG: 0.8
  - name: "seal"
    loadPct: 0.4
    m: 12.5

substructures:
  - name: "bottom"
    type: "rigid"
    body: "hull"
  - name: "flap"
    type: "torsionalSpring"
    body: "seal"
    spring_constant: 1.0e3
    basePtPct: 0.25
    attachedSubstructure: "bottom"
    attachedSubstructureEnd: "start"
)";

// ==========================================================================
// Test 1: Values and sections
// ==========================================================================
void test_values() {
    std::cout << "\n=== Test 1: Values and sections ===\n";

    io::ConfigReader reader;
    auto root = reader.read_string(R"(
run:
  name: "sweep"
  count: 3
  scale: 2.5e-1
  enabled: true
  speeds: [1.0, 2.0, 4.5]
  ids: [1, 2, 3]
  labels: ["a", "b"]
  missing: nan
  bound: -inf
  width: 1.5m
  spring: 250.0   # N m / deg
  tag: "a # b"
  big: 30000000000
)");

    CHECK(root.has_subsection("run"), "section created");
    const auto& run = root.subsection("run");
    CHECK(run.get_string("name") == "sweep", "quoted string");
    CHECK(run.get_int("count") == 3, "integer");
    CHECK(near(run.get_real("scale"), 0.25), "exponent notation");
    CHECK(near(run.get_real("count"), 3.0), "integer read as real");
    CHECK(run.get_bool("enabled"), "boolean");
    CHECK(run.get_real_array("speeds").size() == 3 && near(run.get_real_array("speeds")[2], 4.5),
          "real array");
    CHECK(run.get_int_array("ids").size() == 3 && run.get_int_array("ids")[0] == 1, "int array");
    CHECK(run.get_string_array("labels").size() == 2 && run.get_string_array("labels")[1] == "b",
          "string array");
    CHECK(std::isnan(run.get_real("missing")), "nan token");
    CHECK(std::isinf(run.get_real("bound")) && run.get_real("bound") < 0.0, "negative infinity token");
    CHECK(run.get_string("width") == "1.5m", "partial number kept as text");
    CHECK(near(run.get_real("absent", 7.0), 7.0), "missing key returns the default");
    CHECK(near(run.get_real("spring"), 250.0), "inline comment stripped");
    CHECK(run.get_string("tag") == "a # b", "hash inside quotes kept");
    CHECK(near(run.get_real("big"), 3.0e10), "large integer read as real");

    const io::ConfigSection& const_root = root;
    bool threw = false;
    try {
        const_root.subsection("nothing");
    } catch (const InvalidArgumentError&) {
        threw = true;
    }
    CHECK(threw, "missing subsection rejected");
}

// ==========================================================================
// Test 2: List items
// ==========================================================================
void test_list_items() {
    std::cout << "\n=== Test 2: List items ===\n";

    io::ConfigReader reader;
    auto root = reader.read_string(kModelConfig);

    auto bodies = root.subsection("bodies").list_items();
    CHECK(bodies.size() == 2, "two body items");
    CHECK(bodies[0]->get_string("name") == "hull" && bodies[1]->get_string("name") == "seal",
          "items kept in file order");
    CHECK(bodies[0]->get_bool("free_in_trim") && !bodies[1]->has("free_in_trim"),
          "item properties stay with their item");

    auto subs = root.subsection("substructures").list_items();
    CHECK(subs.size() == 2, "two substructure items");
    CHECK(subs[1]->get_string("attachedSubstructure") == "bottom", "last property of the last item");
    CHECK(root.subsection("structure").get_bool("pressure_limiter"), "structure section intact");
}

// ==========================================================================
// Test 3: Model parameters
// ==========================================================================
void test_parameters() {
    std::cout << "\n=== Test 3: Model parameters ===\n";

    io::ConfigReader reader;
    auto root = reader.read_string(kModelConfig);

    StructureParameters s = StructureParameters::from_config(root.subsection("structure"));
    CHECK(s.motion_method == MotionMethod::Broyden, "motion method parsed");
    CHECK(s.force_method == ForceMethod::Assumed, "cushion force method parsed");
    CHECK(near(s.p_stag, 8000.0), "stagnation pressure 0.5 rho U^2");
    CHECK(near(s.relax_draft, 0.5) && near(s.relax_trim, 0.5), "relaxation defaults to relax_rigid_body");
    CHECK(s.free_in_draft && !s.free_in_trim, "structure-level DOF flags");

    auto bodies = root.subsection("bodies").list_items();
    RigidBodyParameters hull = RigidBodyParameters::from_config(*bodies[0], s);
    CHECK(hull.name == "hull", "body name");
    CHECK(near(hull.W, 300.0), "weight share loadPct * W");
    CHECK(near(hull.m, 30.0), "mass from weight and gravity");
    CHECK(near(hull.Iz, 30.0 * 4.0 / 12.0), "inertia from mass and reference length");
    CHECK(hull.free_in_draft && hull.free_in_trim, "body inherits and overrides DOF flags");
    CHECK(near(hull.xCofR, 0.8) && near(hull.yCofR, 0.0), "CofR defaults to the CofG");

    RigidBodyParameters seal = RigidBodyParameters::from_config(*bodies[1], s);
    CHECK(near(seal.W, 200.0) && near(seal.m, 12.5), "explicit mass kept");

    auto subs = root.subsection("substructures").list_items();
    SubstructureParameters flap = SubstructureParameters::from_config(*subs[1], s);
    CHECK(flap.type == SubstructureType::TorsionalSpring, "substructure type parsed");
    CHECK(flap.body_name == "seal", "parent body name");
    CHECK(near(flap.spring_constant, 1000.0) && near(flap.base_pt_pct, 0.25), "hinge constants");
    CHECK(flap.attached_substructure == "bottom" && flap.attached_at_start, "attachment");
    CHECK(near(flap.relax_angle, 0.5), "angle relaxation defaults to relax_rigid_body");
}

// ==========================================================================
// Test 4: Rejected values
// ==========================================================================
void test_rejected() {
    std::cout << "\n=== Test 4: Rejected values ===\n";

    io::ConfigReader reader;
    StructureParameters s;

    auto expect_invalid = [](auto&& fn) {
        try {
            fn();
        } catch (const InvalidArgumentError&) {
            return true;
        }
        return false;
    };

    CHECK(expect_invalid([&] {
        auto root = reader.read_string("structure:\n  motion_method: \"Simplex\"\n");
        StructureParameters::from_config(root.subsection("structure"));
    }), "unknown motion method");

    CHECK(expect_invalid([&] {
        auto root = reader.read_string("structure:\n  cushion_force_method: \"guessed\"\n");
        StructureParameters::from_config(root.subsection("structure"));
    }), "unknown cushion force method");

    CHECK(expect_invalid([&] {
        auto root = reader.read_string("structure:\n  g: 0.0\n");
        StructureParameters::from_config(root.subsection("structure"));
    }), "non-positive gravity");

    CHECK(expect_invalid([&] {
        auto root = reader.read_string("ss:\n  name: \"x\"\n  type: \"membrane\"\n");
        SubstructureParameters::from_config(root.subsection("ss"), s);
    }), "unknown substructure type");

    CHECK(expect_invalid([&] {
        auto root = reader.read_string("ss:\n  type: \"rigid\"\n");
        SubstructureParameters::from_config(root.subsection("ss"), s);
    }), "substructure without a name");

    CHECK(expect_invalid([&] {
        auto root = reader.read_string("ss:\n  name: \"x\"\n  basePtPct: 1.5\n");
        SubstructureParameters::from_config(root.subsection("ss"), s);
    }), "hinge position outside the chain");

    CHECK(expect_invalid([&] {
        auto root = reader.read_string("structure:\n  rho: \"water\"\n");
        StructureParameters::from_config(root.subsection("structure"));
    }), "text where a number is expected");

    CHECK(expect_invalid([&] {
        reader.read_string("structure:\n  rho 1000\n");
    }), "line without a colon");

    CHECK(parse_motion_method("newmark-beta") == MotionMethod::NewmarkBeta, "method names are case-insensitive");
    CHECK(parse_motion_method("BroydenNew") == MotionMethod::BroydenLibrary, "library Broyden alias");

    bool threw = false;
    try {
        reader.read("no_such_config.yaml");
    } catch (const FileIOError&) {
        threw = true;
    }
    CHECK(threw, "missing file reported as an I/O error");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "PlaningSim: Config Reader Test\n";
    std::cout << "========================================\n";

    test_values();
    test_list_items();
    test_parameters();
    test_rejected();

    std::cout << "\n========================================\n";
    std::cout << "Results: " << tests_passed << "/" << (tests_passed + tests_failed)
              << " tests passed\n";
    std::cout << "========================================\n";

    return (tests_failed > 0) ? 1 : 0;
}
