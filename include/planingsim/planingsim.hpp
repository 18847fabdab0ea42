#pragma once

/**
 * @file planingsim.hpp
 * @brief Main header for the PlaningSim structural library
 *
 * Include this single header to get access to all PlaningSim functionality.
 */

// Core infrastructure
#include <planingsim/core/core.hpp>

// Geometry and elements
#include <planingsim/geometry/trig.hpp>
#include <planingsim/geometry/arc_length_curve.hpp>
#include <planingsim/fem/node.hpp>
#include <planingsim/fem/element.hpp>

// Solvers
#include <planingsim/solver/dense_solver.hpp>
#include <planingsim/solver/root_finder.hpp>

// Fluid load sources
#include <planingsim/fluid/load_interpolator.hpp>
#include <planingsim/fluid/hydrostatic_load_model.hpp>

// Structural model
#include <planingsim/structure/parameters.hpp>
#include <planingsim/structure/substructure.hpp>
#include <planingsim/structure/flexible_substructure.hpp>
#include <planingsim/structure/torsional_spring_substructure.hpp>
#include <planingsim/structure/rigid_body.hpp>
#include <planingsim/structure/motion_strategy.hpp>
#include <planingsim/structure/fe_structure.hpp>

// I/O
#include <planingsim/io/config_reader.hpp>
#include <planingsim/io/mesh_reader.hpp>
#include <planingsim/io/result_io.hpp>

namespace pls {

// Convenience function to get version string
inline const char* version_string() {
    return version::string;
}

} // namespace pls
