#pragma once

/**
 * @file result_io.hpp
 * @brief Per-iteration result files
 *
 * Each iteration directory holds, per body and per substructure:
 *
 *   motion_<body>.<ext>       key: value lines (draft, trim, loads, residuals)
 *   coords_<substructure>.<ext>  "# x y" header followed by two columns
 *   deformation_<hinge>.<ext>    "angle: value"
 *
 * Missing keys read back as NaN.
 */

#include <planingsim/core/core.hpp>
#include <string>
#include <vector>

namespace pls {
namespace io {

struct BodyMotionRecord {
    Real xCofR = constants::nan<Real>;
    Real yCofR = constants::nan<Real>;
    Real xCofG = constants::nan<Real>;
    Real yCofG = constants::nan<Real>;
    Real draft = constants::nan<Real>;
    Real trim = constants::nan<Real>;
    Real lift_res = constants::nan<Real>;
    Real moment_res = constants::nan<Real>;
    Real lift = constants::nan<Real>;
    Real drag = constants::nan<Real>;
    Real moment = constants::nan<Real>;
    Real air_lift = constants::nan<Real>;
    Real air_drag = constants::nan<Real>;
    Real air_moment = constants::nan<Real>;
};

// ============================================================================
// Writer
// ============================================================================

class ResultWriter {
public:
    /**
     * @param directory Iteration directory (created on first write)
     * @param extension File extension without the dot
     */
    ResultWriter(std::string directory, std::string extension = "txt");

    void write_motion(const std::string& body, const BodyMotionRecord& record) const;
    void write_coordinates(const std::string& substructure, const std::vector<Vec2r>& coords) const;
    void write_deformation(const std::string& substructure, Real angle) const;

    std::string path_for(const std::string& prefix, const std::string& name) const;

private:
    void ensure_directory() const;

    std::string directory_;
    std::string extension_;
};

// ============================================================================
// Reader
// ============================================================================

class ResultReader {
public:
    ResultReader(std::string directory, std::string extension = "txt");

    /// @throws FileIOError if the file is missing
    BodyMotionRecord read_motion(const std::string& body) const;
    std::vector<Vec2r> read_coordinates(const std::string& substructure) const;
    Real read_deformation(const std::string& substructure) const;

private:
    std::string path_for(const std::string& prefix, const std::string& name) const;

    std::string directory_;
    std::string extension_;
};

} // namespace io
} // namespace pls
