/**
 * @file fe_structure_test.cpp
 * @brief Outer iteration of the structural model: equilibrium, hinges, config, replay
 */

#include <planingsim/structure/fe_structure.hpp>
#include <planingsim/fluid/hydrostatic_load_model.hpp>
#include <planingsim/geometry/trig.hpp>
#include <planingsim/io/config_reader.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cmath>

using namespace pls;
using namespace pls::structure;
namespace fs = std::filesystem;

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

static bool near(Real a, Real b, Real tol = 1.0e-9) {
    return std::fabs(a - b) < tol;
}

static void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

/// Unit plate on the free surface, split into two elements
static io::PlaningMesh plate_mesh() {
    io::PlaningMesh mesh;
    mesh.nodes = {{0.0, 0.0}, {0.5, 0.0}, {1.0, 0.0}};
    mesh.fixed_dofs.assign(3, Vec2b{false, false});
    mesh.fixed_loads.assign(3, Vec2r{0.0, 0.0});
    mesh.elements["bottom"] = {{0, 1}, {1, 2}};
    return mesh;
}

static fluid::HydrostaticLoadModel::Config water() {
    fluid::HydrostaticLoadModel::Config c;
    c.rho = 1000.0;
    c.g = 10.0;
    return c;
}

static const char* kPlateConfig = R"(
structure:
  rho: 1000.0
  g: 10.0
  pStag: 1000.0
  motion_method: "Broyden"
  motion_jacobian_first_step: 1.0e-3
  max_draft_step: 0.05
  free_in_draft: true

bodies:
  - name: "hull"
    W: 100.0
    xCofG: 0.5

substructures:
  - name: "bottom"
    type: "rigid"
    body: "hull"
)";

// ==========================================================================
// Test 1: Free-floating plate reaches hydrostatic equilibrium
// ==========================================================================
void test_equilibrium() {
    std::cout << "\n=== Test 1: Hydrostatic equilibrium ===\n";

    StructureParameters params;
    params.rho = 1000.0;
    params.g = 10.0;
    params.p_stag = 1000.0;
    params.motion_method = MotionMethod::Broyden;
    params.motion_jacobian_first_step = 1.0e-3;
    params.max_draft_step = 0.05;

    FEStructure structure(params);
    RigidBodyParameters bp = RigidBodyParameters::from_structure(params);
    bp.name = "hull";
    bp.W = 100.0;
    bp.free_in_draft = true;
    bp.xCofG = 0.5;
    bp.xCofR = 0.5;
    RigidBody& body = structure.add_rigid_body(bp);

    SubstructureParameters sp;
    sp.name = "bottom";
    Substructure& bottom = structure.add_substructure(sp);
    CHECK(bottom.parent() == &body, "empty body name selects the first body");

    structure.load_mesh(plate_mesh());
    CHECK(structure.registry().node_count() == 3, "nodes created from the mesh");

    fluid::HydrostaticLoadModel model(bottom.curve(), water());
    structure.set_interpolator("bottom", &model);
    structure.initialize_rigid_bodies();

    int iterations = 0;
    Real residual = 1.0;
    while (residual > 1.0e-8 && iterations < 30) {
        residual = structure.iterate();
        ++iterations;
    }

    // rho g d L = W
    CHECK(residual <= 1.0e-8, "outer loop converged");
    CHECK(iterations <= 5, "linear lift converges after one Jacobian perturbation");
    CHECK(near(body.draft(), 0.01, 1.0e-9), "draft W / (rho g L)");
    CHECK(near(body.lift(), 100.0, 1.0e-5), "lift balances weight");
    CHECK(near(structure.registry().node(2).y(), -0.01, 1.0e-9), "nodes lowered with the body");
    CHECK(near(body.trim(), 0.0), "trim held fixed");
}

// ==========================================================================
// Test 2: Hinged flap under a tip load
// ==========================================================================

/// Unit flap hinged at its downstream end, loaded at the free tip
static UniquePtr<FEStructure> hinged_flap(const StructureParameters& params) {
    auto structure = std::make_unique<FEStructure>(params);
    RigidBodyParameters bp = RigidBodyParameters::from_structure(params);
    bp.name = "seal";
    structure->add_rigid_body(bp);

    SubstructureParameters sp;
    sp.name = "flap";
    sp.type = SubstructureType::TorsionalSpring;
    sp.body_name = "seal";
    sp.spring_constant = 1000.0;
    sp.base_pt_pct = 1.0;
    sp.tip_load = 500.0;
    sp.relax_angle = 0.5;
    structure->add_substructure(sp);

    io::PlaningMesh mesh;
    mesh.nodes = {{0.0, 0.0}, {1.0, 0.0}};
    mesh.fixed_dofs.assign(2, Vec2b{false, false});
    mesh.fixed_loads.assign(2, Vec2r{0.0, 0.0});
    mesh.elements["flap"] = {{0, 1}};
    structure->load_mesh(mesh);
    return structure;
}

void test_hinge_iteration() {
    std::cout << "\n=== Test 2: Hinged flap ===\n";

    StructureParameters params;
    auto structure = hinged_flap(params);
    CHECK(structure->find_body("seal").motion_strategy().method() == MotionMethod::Fixed,
          "body without free DOFs is fixed");

    auto& flap = static_cast<TorsionalSpringSubstructure&>(structure->registry().find_substructure("flap"));
    for (int i = 0; i < 60; ++i) {
        structure->iterate();
    }

    // theta = 500 cos(theta) / 1000
    const Real expected = 0.5 * geometry::cosd(0.5);
    CHECK(near(flap.angle(), expected, 1.0e-6), "hinge settles where the spring balances the tip load");
    CHECK(std::fabs(flap.residual()) < 1.0e-8, "hinge step vanishes at balance");
    CHECK(near(structure->get_residual(), 0.0), "fixed body and no flexible part give zero residual");

    const fs::path dir = fs::temp_directory_path() / "planingsim_hinge_replay";
    fs::remove_all(dir);
    structure->set_iteration_directory(dir.string());
    structure->write_results();

    StructureParameters replay_params;
    replay_params.results_from_file = true;
    auto replay = hinged_flap(replay_params);
    replay->set_iteration_directory(dir.string());
    replay->calculate_response();

    auto& replayed = static_cast<TorsionalSpringSubstructure&>(replay->registry().find_substructure("flap"));
    CHECK(near(replayed.angle(), flap.angle(), 1.0e-9), "replay restores the hinge angle");
    CHECK(near(replay->registry().node(0).y(), structure->registry().node(0).y(), 1.0e-9),
          "replay restores the rotated tip");
    CHECK(replayed.residual() == 0.0, "restored angle is not a hinge step");

    // Continuing from the replayed state stays at the balance angle
    replay->parameters().results_from_file = false;
    replay->iterate();
    CHECK(near(replayed.angle(), flap.angle(), 1.0e-6), "iteration resumes from the stored angle");
    CHECK(std::fabs(replayed.residual()) < 1.0e-6, "no jump after replay");

    fs::remove_all(dir);
}

// ==========================================================================
// Test 3: Configuration, mesh directory and replay
// ==========================================================================
void test_config_and_replay() {
    std::cout << "\n=== Test 3: Configuration and replay ===\n";

    const fs::path root = fs::temp_directory_path() / "planingsim_structure";
    fs::remove_all(root);
    fs::create_directories(root / "mesh");
    write_file(root / "mesh" / "nodes.txt", "0.0 0.0\n0.5 0.0\n1.0 0.0\n");
    write_file(root / "mesh" / "fixedDOF.txt", "0 0\n0 0\n0 0\n");
    write_file(root / "mesh" / "fixedLoad.txt", "0 0\n0 0\n0 0\n");
    write_file(root / "mesh" / "elements_bottom.txt", "0 1\n1 2\n");

    io::ConfigReader reader;
    const io::ConfigSection config = reader.read_string(kPlateConfig);

    auto structure = FEStructure::from_config(config);
    CHECK(structure->bodies().size() == 1, "one body from the list");
    CHECK(structure->find_body("hull").any_free(), "draft free from the structure section");

    structure->load_mesh((root / "mesh").string());
    Substructure& bottom = structure->registry().find_substructure("bottom");
    fluid::HydrostaticLoadModel model(bottom.curve(), water());
    structure->set_interpolator("bottom", &model);

    for (int i = 0; i < 30 && structure->iterate() > 1.0e-8; ++i) {
    }
    CHECK(near(structure->find_body("hull").draft(), 0.01, 1.0e-9), "configured model converges");

    structure->set_iteration_directory((root / "0010").string());
    structure->write_results();
    CHECK(fs::exists(root / "0010" / "motion_hull.txt") && fs::exists(root / "0010" / "coords_bottom.txt"),
          "results written per body and substructure");

    auto replay = FEStructure::from_config(config);
    replay->parameters().results_from_file = true;
    replay->load_mesh((root / "mesh").string());
    replay->set_iteration_directory((root / "0010").string());
    replay->calculate_response();

    const RigidBody& hull = replay->find_body("hull");
    CHECK(near(hull.draft(), 0.01, 1.0e-9), "replayed draft");
    CHECK(near(replay->registry().node(1).y(), -0.01, 1.0e-9), "replayed node coordinates");

    fs::remove_all(root);
}

// ==========================================================================
// Test 4: Construction errors
// ==========================================================================
void test_errors() {
    std::cout << "\n=== Test 4: Construction errors ===\n";

    auto expect_invalid = [](auto&& fn) {
        try {
            fn();
        } catch (const InvalidArgumentError&) {
            return true;
        }
        return false;
    };

    {
        FEStructure structure;
        SubstructureParameters sp;
        sp.name = "bottom";
        CHECK(expect_invalid([&] { structure.add_substructure(sp); }), "substructure before any body");
    }
    {
        FEStructure structure;
        RigidBodyParameters bp;
        bp.name = "hull";
        structure.add_rigid_body(bp);
        CHECK(expect_invalid([&] { structure.add_rigid_body(bp); }), "duplicate body name");

        SubstructureParameters sp;
        sp.name = "bottom";
        sp.body_name = "ghost";
        CHECK(expect_invalid([&] { structure.add_substructure(sp); }), "unknown parent body");

        sp.body_name = "hull";
        structure.add_substructure(sp);
        CHECK(expect_invalid([&] { structure.set_interpolator("keel", nullptr); }),
              "interpolator for an unknown substructure");

        io::PlaningMesh mesh = plate_mesh();
        mesh.elements.clear();
        mesh.elements["keel"] = {{0, 1}};
        CHECK(expect_invalid([&] { structure.load_mesh(mesh); }), "substructure without elements");
    }
    {
        FEStructure structure;
        RigidBodyParameters bp;
        bp.name = "hull";
        structure.add_rigid_body(bp);
        SubstructureParameters sp;
        sp.name = "bottom";
        structure.add_substructure(sp);
        structure.load_mesh(plate_mesh());
        CHECK(expect_invalid([&] { structure.load_mesh(plate_mesh()); }), "mesh loaded twice");
    }

    io::ConfigReader reader;
    auto structure = FEStructure::from_config(reader.read_string("structure:\n  W: 50.0\n"));
    CHECK(structure->bodies().size() == 1 && near(structure->bodies()[0]->weight(), 50.0),
          "default body carries the full weight");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "PlaningSim: FE Structure Test\n";
    std::cout << "========================================\n";

    test_equilibrium();
    test_hinge_iteration();
    test_config_and_replay();
    test_errors();

    std::cout << "\n========================================\n";
    std::cout << "Results: " << tests_passed << "/" << (tests_passed + tests_failed)
              << " tests passed\n";
    std::cout << "========================================\n";

    return (tests_failed > 0) ? 1 : 0;
}
