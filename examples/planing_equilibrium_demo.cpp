/**
 * @file planing_equilibrium_demo.cpp
 * @brief Still-water equilibrium of a planing plate free in draft and trim
 *
 * Usage: planing_equilibrium_demo [config.yaml mesh_dir]
 *
 * Without arguments a two-metre plate is built in code. The hydrostatic
 * reference model stands in for a flow solver; the hydrodynamic load is
 * ramped in over the first iterations.
 */

#include <planingsim/planingsim.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace pls;
using namespace pls::structure;

namespace {

UniquePtr<FEStructure> build_default_model() {
    StructureParameters params;
    params.rho = 1000.0;
    params.g = 9.81;
    params.Lref = 2.0;
    params.p_stag = 0.5 * params.rho * params.g * params.Lref;
    params.motion_method = MotionMethod::Broyden;
    params.motion_jacobian_first_step = 1.0e-4;
    params.max_draft_step = 0.02;
    params.max_trim_step = 0.5;

    auto structure = make_unique<FEStructure>(params);

    RigidBodyParameters hull = RigidBodyParameters::from_structure(params);
    hull.name = "hull";
    hull.W = 400.0;
    hull.free_in_draft = true;
    hull.free_in_trim = true;
    hull.xCofG = 0.9;
    hull.xCofR = 1.0;
    hull.yCofG = hull.yCofR = 0.1;
    structure->add_rigid_body(hull);

    SubstructureParameters bottom;
    bottom.name = "bottom";
    bottom.body_name = "hull";
    structure->add_substructure(bottom);

    io::PlaningMesh mesh;
    const int n = 9;
    for (int i = 0; i < n; ++i) {
        mesh.nodes.push_back({params.Lref * i / (n - 1), 0.0});
        mesh.fixed_dofs.push_back({false, false});
        mesh.fixed_loads.push_back({0.0, 0.0});
        if (i > 0) {
            mesh.elements["bottom"].push_back({static_cast<Index>(i - 1), static_cast<Index>(i)});
        }
    }
    structure->load_mesh(mesh);
    return structure;
}

UniquePtr<FEStructure> build_configured_model(const std::string& config_file, const std::string& mesh_dir) {
    io::ConfigReader reader;
    auto structure = FEStructure::from_config(reader.read(config_file));
    structure->load_mesh(mesh_dir);
    return structure;
}

} // namespace

int main(int argc, char** argv) {
    InitOptions options;
    options.log_level = Logger::Level::Info;
    Context context(options);

    try {
        auto structure = (argc > 2) ? build_configured_model(argv[1], argv[2]) : build_default_model();

        std::vector<UniquePtr<fluid::HydrostaticLoadModel>> models;
        fluid::HydrostaticLoadModel::Config water;
        water.rho = structure->parameters().rho;
        water.g = structure->parameters().g;
        water.water_level = structure->parameters().hWL;
        for (const auto& ss : structure->registry().substructures()) {
            models.push_back(make_unique<fluid::HydrostaticLoadModel>(ss->curve(), water));
            ss->set_interpolator(models.back().get());
        }

        structure->initialize_rigid_bodies();

        const int max_iterations = 200;
        const int ramp_iterations = 10;
        const Real tolerance = 1.0e-6;

        int it = 0;
        Real residual = 1.0;
        for (; it < max_iterations && residual > tolerance; ++it) {
            structure->set_ramp(std::min<Real>(1.0, static_cast<Real>(it + 1) / ramp_iterations));
            residual = structure->iterate();
            PLS_LOG_INFO("Iteration {:4d}: residual {:.6e}", it, residual);

            if (it % 20 == 0) {
                std::ostringstream dir;
                dir << "results/" << std::setw(4) << std::setfill('0') << it;
                structure->set_iteration_directory(dir.str());
                structure->write_results();
            }
        }

        if (residual > tolerance) {
            PLS_LOG_WARN("Not converged after {} iterations (residual {:.3e})", it, residual);
        }

        for (const auto& body : structure->bodies()) {
            PLS_LOG_INFO("Body {}: draft {:.5f} m, trim {:.4f} deg, lift {:.2f} N, weight {:.2f} N",
                         body->name(), body->draft(), body->trim(), body->lift(), body->weight());
        }

        structure->set_iteration_directory("results/final");
        structure->write_results();
    } catch (const Exception& e) {
        PLS_LOG_ERROR("Equilibrium run failed: {}", e.what());
        return 1;
    }

    return 0;
}
