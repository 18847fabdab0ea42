/**
 * @file parameters.cpp
 * @brief Parameter parsing from configuration sections
 */

#include <planingsim/structure/parameters.hpp>
#include <planingsim/io/config_reader.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace pls {
namespace structure {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

// ============================================================================
// Enum parsing
// ============================================================================

MotionMethod parse_motion_method(const std::string& name) {
    const std::string key = lower(name);
    if (key == "fixed" || key == "none") return MotionMethod::Fixed;
    if (key == "secant") return MotionMethod::Secant;
    if (key == "broydennew" || key == "broyden-library") return MotionMethod::BroydenLibrary;
    if (key == "broyden") return MotionMethod::Broyden;
    if (key == "physical") return MotionMethod::Physical;
    if (key == "newmark-beta" || key == "newmark") return MotionMethod::NewmarkBeta;
    if (key == "physicalnomass") return MotionMethod::PhysicalNoMass;
    throw InvalidArgumentError("Unknown motion method: " + name);
}

ForceMethod parse_force_method(const std::string& name) {
    const std::string key = lower(name);
    if (key == "integrated") return ForceMethod::Integrated;
    if (key == "assumed") return ForceMethod::Assumed;
    if (key == "matched") return ForceMethod::Matched;
    throw InvalidArgumentError("Unknown cushion force method: " + name);
}

SubstructureType parse_substructure_type(const std::string& name) {
    const std::string key = lower(name);
    if (key == "rigid") return SubstructureType::Rigid;
    if (key == "flexible" || key == "truss") return SubstructureType::Flexible;
    if (key == "torsionalspring") return SubstructureType::TorsionalSpring;
    throw InvalidArgumentError("Unknown substructure type: " + name);
}

PressureMethod parse_pressure_method(const std::string& name) {
    const std::string key = lower(name);
    if (key == "constant") return PressureMethod::Constant;
    if (key == "hydrostatic") return PressureMethod::Hydrostatic;
    throw InvalidArgumentError("Unknown internal pressure method: " + name);
}

InterpolationKind parse_interpolation_kind(const std::string& name) {
    const std::string key = lower(name);
    if (key == "linear") return InterpolationKind::Linear;
    if (key == "quadratic") return InterpolationKind::Quadratic;
    if (key == "cubic") return InterpolationKind::Cubic;
    throw InvalidArgumentError("Unknown interpolation kind: " + name);
}

// ============================================================================
// StructureParameters
// ============================================================================

StructureParameters StructureParameters::from_config(const io::ConfigSection& section) {
    StructureParameters p;

    p.g = section.get_real("g", p.g);
    p.rho = section.get_real("rho", p.rho);
    p.hWL = section.get_real("hWL", p.hWL);
    p.Lref = section.get_real("Lref", p.Lref);
    p.flow_speed = section.get_real("flow_speed", p.flow_speed);
    p.update_stagnation_pressure();
    p.p_stag = section.get_real("pStag", p.p_stag);
    p.Pc = section.get_real("Pc", p.Pc);
    p.W = section.get_real("W", p.W);
    p.seal_load_pct = section.get_real("sealLoadPct", p.seal_load_pct);

    p.pressure_limiter = section.get_bool("pressure_limiter", p.pressure_limiter);
    if (section.has("cushion_force_method")) {
        p.force_method = parse_force_method(section.get_string("cushion_force_method"));
    }

    p.relax_FEM = section.get_real("relax_FEM", p.relax_FEM);
    p.max_FEM_disp = section.get_real("max_FEM_disp", p.max_FEM_disp);

    if (section.has("motion_method")) {
        p.motion_method = parse_motion_method(section.get_string("motion_method"));
    }
    p.motion_jacobian_first_step = section.get_real("motion_jacobian_first_step",
                                                    p.motion_jacobian_first_step);
    p.broyden_stagnation_limit = section.get_int("broyden_stagnation_limit",
                                                 p.broyden_stagnation_limit);
    p.relax_rigid_body = section.get_real("relax_rigid_body", p.relax_rigid_body);
    p.ramp = section.get_real("ramp", p.ramp);

    p.max_draft_step = section.get_real("max_draft_step", p.max_draft_step);
    p.max_trim_step = section.get_real("max_trim_step", p.max_trim_step);
    p.free_in_draft = section.get_bool("free_in_draft", p.free_in_draft);
    p.free_in_trim = section.get_bool("free_in_trim", p.free_in_trim);
    p.draft_damping = section.get_real("draft_damping", p.draft_damping);
    p.trim_damping = section.get_real("trim_damping", p.trim_damping);
    p.max_draft_acc = section.get_real("max_draft_acc", p.max_draft_acc);
    p.max_trim_acc = section.get_real("max_trim_acc", p.max_trim_acc);
    p.xCofG = section.get_real("xCofG", p.xCofG);
    p.yCofG = section.get_real("yCofG", p.yCofG);
    p.xCofR = section.get_real("xCofR", p.xCofR);
    p.yCofR = section.get_real("yCofR", p.yCofR);
    p.initial_draft = section.get_real("initial_draft", p.initial_draft);
    p.initial_trim = section.get_real("initial_trim", p.initial_trim);
    p.relax_draft = section.get_real("relax_draft", p.relax_rigid_body);
    p.relax_trim = section.get_real("relax_trim", p.relax_rigid_body);
    p.time_step = section.get_real("time_step", p.time_step);
    p.num_damp = section.get_real("num_damp", p.num_damp);

    p.mesh_dir = section.get_string("mesh_dir", p.mesh_dir);
    p.data_format = section.get_string("data_format", p.data_format);
    p.results_from_file = section.get_bool("results_from_file", p.results_from_file);

    PLS_REQUIRE(p.g > 0.0, "gravity must be positive");
    PLS_REQUIRE(p.Lref > 0.0, "reference length must be positive");
    PLS_REQUIRE(p.broyden_stagnation_limit > 0, "stagnation limit must be positive");

    return p;
}

// ============================================================================
// RigidBodyParameters
// ============================================================================

RigidBodyParameters RigidBodyParameters::from_structure(const StructureParameters& s) {
    RigidBodyParameters p;
    p.W = p.load_pct * s.W * s.seal_load_pct;
    p.m = p.W / s.g;
    p.Iz = p.m * s.Lref * s.Lref / 12.0;

    p.max_draft_step = s.max_draft_step;
    p.max_trim_step = s.max_trim_step;
    p.free_in_draft = s.free_in_draft;
    p.free_in_trim = s.free_in_trim;
    p.draft_damping = s.draft_damping;
    p.trim_damping = s.trim_damping;
    p.max_draft_acc = s.max_draft_acc;
    p.max_trim_acc = s.max_trim_acc;
    p.xCofG = s.xCofG;
    p.yCofG = s.yCofG;
    p.xCofR = std::isnan(s.xCofR) ? s.xCofG : s.xCofR;
    p.yCofR = std::isnan(s.yCofR) ? s.yCofG : s.yCofR;
    p.initial_draft = s.initial_draft;
    p.initial_trim = s.initial_trim;
    p.relax_draft = s.relax_draft;
    p.relax_trim = s.relax_trim;
    p.time_step = s.time_step;
    p.num_damp = s.num_damp;
    return p;
}

RigidBodyParameters RigidBodyParameters::from_config(const io::ConfigSection& section,
                                                     const StructureParameters& s) {
    RigidBodyParameters p = from_structure(s);

    p.name = section.get_string("name", p.name);
    p.load_pct = section.get_real("loadPct", p.load_pct);
    p.W = section.get_real("W", p.load_pct * s.W) * s.seal_load_pct;
    p.m = section.get_real("m", p.W / s.g);
    p.Iz = section.get_real("Iz", p.m * s.Lref * s.Lref / 12.0);

    p.max_draft_step = section.get_real("max_draft_step", p.max_draft_step);
    p.max_trim_step = section.get_real("max_trim_step", p.max_trim_step);
    p.free_in_draft = section.get_bool("free_in_draft", p.free_in_draft);
    p.free_in_trim = section.get_bool("free_in_trim", p.free_in_trim);
    p.draft_damping = section.get_real("draft_damping", p.draft_damping);
    p.trim_damping = section.get_real("trim_damping", p.trim_damping);
    p.max_draft_acc = section.get_real("max_draft_acc", p.max_draft_acc);
    p.max_trim_acc = section.get_real("max_trim_acc", p.max_trim_acc);
    p.xCofG = section.get_real("xCofG", p.xCofG);
    p.yCofG = section.get_real("yCofG", p.yCofG);
    p.xCofR = section.get_real("xCofR", std::isnan(s.xCofR) ? p.xCofG : s.xCofR);
    p.yCofR = section.get_real("yCofR", std::isnan(s.yCofR) ? p.yCofG : s.yCofR);
    p.initial_draft = section.get_real("initial_draft", p.initial_draft);
    p.initial_trim = section.get_real("initial_trim", p.initial_trim);
    p.relax_draft = section.get_real("relax_draft", p.relax_draft);
    p.relax_trim = section.get_real("relax_trim", p.relax_trim);
    p.time_step = section.get_real("time_step", p.time_step);
    p.num_damp = section.get_real("num_damp", p.num_damp);
    p.beta = section.get_real("beta", p.beta);
    p.gamma = section.get_real("gamma", p.gamma);

    PLS_REQUIRE(p.time_step > 0.0, "body '" + p.name + "' needs a positive time step");
    return p;
}

// ============================================================================
// SubstructureParameters
// ============================================================================

SubstructureParameters SubstructureParameters::from_structure(const StructureParameters& s) {
    SubstructureParameters p;
    p.relax_angle = s.relax_rigid_body;
    return p;
}

SubstructureParameters SubstructureParameters::from_config(const io::ConfigSection& section,
                                                           const StructureParameters& s) {
    SubstructureParameters p = from_structure(s);

    p.name = section.get_string("name", p.name);
    PLS_REQUIRE(!p.name.empty(), "substructure entries need a name");

    p.type = parse_substructure_type(section.get_string("type", "rigid"));
    p.body_name = section.get_string("body", p.body_name);

    p.Ps = section.get_real("Ps", p.Ps);
    p.Ps_method = parse_pressure_method(section.get_string("PsMethod", "constant"));
    p.over_pressure_pct = section.get_real("overPressurePct", p.over_pressure_pct);
    p.cushion_total = section.get_string("cushionPressureType", "") == "Total";
    p.tip_load = section.get_real("tipLoad", p.tip_load);

    p.interpolation = parse_interpolation_kind(section.get_string("structInterpType", "linear"));
    p.extrapolate = section.get_bool("structExtrap", p.extrapolate);

    p.pretension = section.get_real("pretension", p.pretension);
    p.EA = section.get_real("EA", p.EA);

    p.spring_constant = section.get_real("spring_constant", p.spring_constant);
    p.base_pt_pct = section.get_real("basePtPct", p.base_pt_pct);
    p.tip_load_pct = section.get_real("tipLoadPct", p.tip_load_pct);
    p.relax_angle = section.get_real("relaxAng", p.relax_angle);
    p.max_angle_step = section.get_real("maxAngleStep", p.max_angle_step);
    p.minimum_angle = section.get_real("minimumAngle", p.minimum_angle);
    p.initial_angle = section.get_real("initialAngle", p.initial_angle);
    p.attached_substructure = section.get_string("attachedSubstructure", p.attached_substructure);
    p.attached_at_start = lower(section.get_string("attachedSubstructureEnd", "end")) == "start";

    PLS_REQUIRE(p.base_pt_pct >= 0.0 && p.base_pt_pct <= 1.0,
                "basePtPct of '" + p.name + "' must lie in [0, 1]");
    return p;
}

} // namespace structure
} // namespace pls
