#pragma once

/**
 * @file parameters.hpp
 * @brief Model parameters for the structural equilibrium solver
 *
 * StructureParameters holds the physical constants, solver controls and the
 * defaults every rigid body falls back to. Per-body and per-substructure
 * values are read from list items of the configuration file:
 *
 * ```
 * structure:
 *   rho: 998.2
 *   flow_speed: 5.0
 *   Lref: 1.0
 *   W: 2000.0
 *   motion_method: "Newmark-Beta"
 *   cushion_force_method: "integrated"
 *   relax_FEM: 0.5
 *
 * bodies:
 *   - name: "hull"
 *     free_in_draft: true
 *     xCofG: 0.45
 *
 * substructures:
 *   - name: "bottom"
 *     type: "flexible"
 *     body: "hull"
 *     EA: 5.0e7
 * ```
 */

#include <planingsim/core/core.hpp>
#include <string>

namespace pls {

namespace io { class ConfigSection; }

namespace structure {

// ============================================================================
// Enum parsing (configuration strings)
// ============================================================================

MotionMethod parse_motion_method(const std::string& name);
ForceMethod parse_force_method(const std::string& name);
SubstructureType parse_substructure_type(const std::string& name);
PressureMethod parse_pressure_method(const std::string& name);
InterpolationKind parse_interpolation_kind(const std::string& name);

// ============================================================================
// Global parameters
// ============================================================================

struct StructureParameters {
    // Physical constants and reference quantities
    Real g = 9.81;
    Real rho = 998.2;
    Real hWL = 0.0;            ///< Free-surface height
    Real Lref = 1.0;           ///< Reference length
    Real flow_speed = 0.0;
    Real p_stag = 0.0;         ///< Stagnation pressure (0.5 rho U^2 unless given)
    Real Pc = 0.0;             ///< Cushion pressure
    Real W = 0.0;              ///< Total weight shared among bodies by load fraction
    Real seal_load_pct = 1.0;

    // Load integration
    bool pressure_limiter = false;
    ForceMethod force_method = ForceMethod::Integrated;

    // Flexible structure
    Real relax_FEM = 1.0;
    Real max_FEM_disp = 1.0;

    // Rigid-body motion
    MotionMethod motion_method = MotionMethod::Physical;
    Real motion_jacobian_first_step = 1.0e-6;
    int broyden_stagnation_limit = 6;
    Real relax_rigid_body = 1.0;

    /// Hydrodynamic load ramp in [0, 1]; updated by the outer loop
    Real ramp = 1.0;

    // Rigid-body defaults
    Real max_draft_step = 1.0e-3;
    Real max_trim_step = 1.0e-3;
    bool free_in_draft = false;
    bool free_in_trim = false;
    Real draft_damping = 1000.0;
    Real trim_damping = 500.0;
    Real max_draft_acc = 1000.0;
    Real max_trim_acc = 1000.0;
    Real xCofG = 0.0;
    Real yCofG = 0.0;
    Real xCofR = constants::nan<Real>;  ///< NaN: coincide with CofG
    Real yCofR = constants::nan<Real>;
    Real initial_draft = 0.0;
    Real initial_trim = 0.0;
    Real relax_draft = 1.0;
    Real relax_trim = 1.0;
    Real time_step = 1.0e-3;
    Real num_damp = 0.0;

    // Files
    std::string mesh_dir = "mesh";
    std::string data_format = "txt";
    bool results_from_file = false;

    /// Recompute p_stag from rho and the flow speed
    void update_stagnation_pressure() { p_stag = 0.5 * rho * flow_speed * flow_speed; }

    /// Read the "structure" section (missing keys keep their defaults)
    static StructureParameters from_config(const io::ConfigSection& section);
};

// ============================================================================
// Per-body parameters
// ============================================================================

struct RigidBodyParameters {
    std::string name = "default";

    Real load_pct = 1.0;
    Real W = 0.0;
    Real m = 0.0;
    Real Iz = 0.0;

    Real max_draft_step = 1.0e-3;
    Real max_trim_step = 1.0e-3;
    bool free_in_draft = false;
    bool free_in_trim = false;
    Real draft_damping = 1000.0;
    Real trim_damping = 500.0;
    Real max_draft_acc = 1000.0;
    Real max_trim_acc = 1000.0;
    Real xCofG = 0.0;
    Real yCofG = 0.0;
    Real xCofR = 0.0;
    Real yCofR = 0.0;
    Real initial_draft = 0.0;
    Real initial_trim = 0.0;
    Real relax_draft = 1.0;
    Real relax_trim = 1.0;
    Real time_step = 1.0e-3;
    Real num_damp = 0.0;

    // Newmark-beta
    Real beta = 0.25;
    Real gamma = 0.5;

    /// Body defaults derived from the global parameters
    static RigidBodyParameters from_structure(const StructureParameters& structure);

    /// One "bodies" list item with fall-back to the global defaults
    static RigidBodyParameters from_config(const io::ConfigSection& section,
                                           const StructureParameters& structure);
};

// ============================================================================
// Per-substructure parameters
// ============================================================================

struct SubstructureParameters {
    std::string name;
    SubstructureType type = SubstructureType::Rigid;
    std::string body_name;  ///< Empty: first body

    // Internal and cushion pressure
    Real Ps = 0.0;
    PressureMethod Ps_method = PressureMethod::Constant;
    Real over_pressure_pct = 1.0;
    bool cushion_total = false;  ///< Apply the global cushion pressure without a fluid model

    Real tip_load = 0.0;

    InterpolationKind interpolation = InterpolationKind::Linear;
    bool extrapolate = true;

    // Flexible (truss)
    Real pretension = -0.5;
    Real EA = 5.0e7;

    // Torsional spring
    Real spring_constant = 1000.0;
    Real base_pt_pct = 1.0;
    Real tip_load_pct = 0.0;
    Real relax_angle = 1.0;
    Real max_angle_step = constants::infinity<Real>;
    Real minimum_angle = -constants::infinity<Real>;
    Real initial_angle = 0.0;
    std::string attached_substructure;
    bool attached_at_start = false;

    /// Defaults derived from the global parameters
    static SubstructureParameters from_structure(const StructureParameters& structure);

    /// One "substructures" list item
    static SubstructureParameters from_config(const io::ConfigSection& section,
                                              const StructureParameters& structure);
};

} // namespace structure
} // namespace pls
