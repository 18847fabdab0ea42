/**
 * @file result_io.cpp
 * @brief Per-iteration result files
 */

#include <planingsim/io/result_io.hpp>
#include <planingsim/io/config_reader.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pls {
namespace io {

namespace {

Real parse_column(const std::string& token, const std::string& filename) {
    try {
        std::size_t pos = 0;
        const Real v = std::stod(token, &pos);
        if (pos == token.size()) {
            return v;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    throw InvalidArgumentError("Malformed value '" + token + "' in " + filename);
}

} // anonymous namespace

// ============================================================================
// Writer
// ============================================================================

ResultWriter::ResultWriter(std::string directory, std::string extension)
    : directory_(std::move(directory)), extension_(std::move(extension)) {}

std::string ResultWriter::path_for(const std::string& prefix, const std::string& name) const {
    return (std::filesystem::path(directory_) / (prefix + "_" + name + "." + extension_)).string();
}

void ResultWriter::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw FileIOError(directory_, "create directory");
    }
}

void ResultWriter::write_motion(const std::string& body, const BodyMotionRecord& r) const {
    ensure_directory();
    const std::string filename = path_for("motion", body);
    std::ofstream out(filename);
    if (!out) {
        throw FileIOError(filename, "write");
    }

    out << std::setprecision(15);
    out << "xCofR: " << r.xCofR << "\n";
    out << "yCofR: " << r.yCofR << "\n";
    out << "xCofG: " << r.xCofG << "\n";
    out << "yCofG: " << r.yCofG << "\n";
    out << "draft: " << r.draft << "\n";
    out << "trim: " << r.trim << "\n";
    out << "liftRes: " << r.lift_res << "\n";
    out << "momentRes: " << r.moment_res << "\n";
    out << "Lift: " << r.lift << "\n";
    out << "Drag: " << r.drag << "\n";
    out << "Moment: " << r.moment << "\n";
    out << "LiftAir: " << r.air_lift << "\n";
    out << "DragAir: " << r.air_drag << "\n";
    out << "MomentAir: " << r.air_moment << "\n";

    PLS_LOG_DEBUG("Wrote {}", filename);
}

void ResultWriter::write_coordinates(const std::string& substructure,
                                     const std::vector<Vec2r>& coords) const {
    ensure_directory();
    const std::string filename = path_for("coords", substructure);
    std::ofstream out(filename);
    if (!out) {
        throw FileIOError(filename, "write");
    }

    out << "# x y\n" << std::setprecision(15);
    for (const auto& c : coords) {
        out << c[0] << " " << c[1] << "\n";
    }
}

void ResultWriter::write_deformation(const std::string& substructure, Real angle) const {
    ensure_directory();
    const std::string filename = path_for("deformation", substructure);
    std::ofstream out(filename);
    if (!out) {
        throw FileIOError(filename, "write");
    }
    out << std::setprecision(15) << "angle: " << angle << "\n";
}

// ============================================================================
// Reader
// ============================================================================

ResultReader::ResultReader(std::string directory, std::string extension)
    : directory_(std::move(directory)), extension_(std::move(extension)) {}

std::string ResultReader::path_for(const std::string& prefix, const std::string& name) const {
    return (std::filesystem::path(directory_) / (prefix + "_" + name + "." + extension_)).string();
}

BodyMotionRecord ResultReader::read_motion(const std::string& body) const {
    ConfigReader reader;
    const ConfigSection s = reader.read(path_for("motion", body));

    const Real nan = constants::nan<Real>;
    BodyMotionRecord r;
    r.xCofR = s.get_real("xCofR", nan);
    r.yCofR = s.get_real("yCofR", nan);
    r.xCofG = s.get_real("xCofG", nan);
    r.yCofG = s.get_real("yCofG", nan);
    r.draft = s.get_real("draft", nan);
    r.trim = s.get_real("trim", nan);
    r.lift_res = s.get_real("liftRes", nan);
    r.moment_res = s.get_real("momentRes", nan);
    r.lift = s.get_real("Lift", nan);
    r.drag = s.get_real("Drag", nan);
    r.moment = s.get_real("Moment", nan);
    r.air_lift = s.get_real("LiftAir", nan);
    r.air_drag = s.get_real("DragAir", nan);
    r.air_moment = s.get_real("MomentAir", nan);
    return r;
}

std::vector<Vec2r> ResultReader::read_coordinates(const std::string& substructure) const {
    const std::string filename = path_for("coords", substructure);
    std::ifstream in(filename);
    if (!in) {
        throw FileIOError(filename, "open");
    }

    std::vector<Vec2r> coords;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string x, y;
        if (!(iss >> x) || x[0] == '#') {
            continue;
        }
        if (!(iss >> y)) {
            throw InvalidArgumentError("Expected two columns in " + filename + ": " + line);
        }
        coords.push_back({parse_column(x, filename), parse_column(y, filename)});
    }
    return coords;
}

Real ResultReader::read_deformation(const std::string& substructure) const {
    ConfigReader reader;
    const ConfigSection s = reader.read(path_for("deformation", substructure));
    return s.get_real("angle", constants::nan<Real>);
}

} // namespace io
} // namespace pls
