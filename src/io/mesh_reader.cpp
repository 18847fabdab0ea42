/**
 * @file mesh_reader.cpp
 * @brief Mesh directory reader implementation
 */

#include <planingsim/io/mesh_reader.hpp>
#include <planingsim/core/logger.hpp>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace pls {
namespace io {

namespace {

std::string join(const std::string& directory, const std::string& file) {
    return (std::filesystem::path(directory) / file).string();
}

Real to_real(const std::string& token, const std::string& filename, std::size_t row) {
    try {
        std::size_t pos = 0;
        const Real v = std::stod(token, &pos);
        if (pos == token.size()) {
            return v;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    throw InvalidArgumentError("Malformed value '" + token + "' in " + filename +
                               " row " + std::to_string(row));
}

} // anonymous namespace

std::vector<Vec2r> PlaningMeshReader::read_two_columns(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw FileIOError(filename, "open");
    }

    std::vector<Vec2r> rows;
    std::string line;
    while (std::getline(file, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }

        std::istringstream iss(line);
        std::vector<std::string> tokens;
        std::string tok;
        while (iss >> tok) tokens.push_back(tok);

        if (tokens.empty()) {
            continue;
        }
        if (tokens.size() != 2) {
            throw InvalidArgumentError("Expected 2 columns in " + filename + " row " +
                                       std::to_string(rows.size()) + ", got " +
                                       std::to_string(tokens.size()));
        }
        rows.push_back({to_real(tokens[0], filename, rows.size()),
                        to_real(tokens[1], filename, rows.size())});
    }
    return rows;
}

PlaningMesh PlaningMeshReader::read_nodes(const std::string& directory) const {
    PlaningMesh mesh;

    mesh.nodes = read_two_columns(join(directory, "nodes.txt"));
    const auto fixed = read_two_columns(join(directory, "fixedDOF.txt"));
    mesh.fixed_loads = read_two_columns(join(directory, "fixedLoad.txt"));

    if (fixed.size() != mesh.nodes.size() || mesh.fixed_loads.size() != mesh.nodes.size()) {
        throw InvalidArgumentError("Mesh files in " + directory + " disagree on node count: nodes " +
                                   std::to_string(mesh.nodes.size()) + ", fixedDOF " +
                                   std::to_string(fixed.size()) + ", fixedLoad " +
                                   std::to_string(mesh.fixed_loads.size()));
    }

    mesh.fixed_dofs.reserve(fixed.size());
    for (const auto& f : fixed) {
        mesh.fixed_dofs.push_back({f[0] != 0.0, f[1] != 0.0});
    }

    PLS_LOG_INFO("Read {} nodes from {}", mesh.nodes.size(), directory);
    return mesh;
}

std::vector<std::array<Index, 2>> PlaningMeshReader::read_elements(const std::string& directory,
                                                                   const std::string& substructure,
                                                                   std::size_t node_count) const {
    const std::string filename = join(directory, "elements_" + substructure + ".txt");
    const auto rows = read_two_columns(filename);

    std::vector<std::array<Index, 2>> elements;
    elements.reserve(rows.size());
    for (std::size_t r = 0; r < rows.size(); ++r) {
        std::array<Index, 2> el{};
        for (int k = 0; k < 2; ++k) {
            const Real v = std::round(rows[r][k]);
            if (v < 0.0 || v >= static_cast<Real>(node_count)) {
                throw InvalidArgumentError("Node index " + std::to_string(rows[r][k]) + " in " +
                                           filename + " row " + std::to_string(r) +
                                           " is outside [0, " + std::to_string(node_count) + ")");
            }
            el[k] = static_cast<Index>(v);
        }
        elements.push_back(el);
    }

    if (elements.empty()) {
        throw InvalidArgumentError("No elements for substructure '" + substructure + "' in " + filename);
    }

    PLS_LOG_DEBUG("Read {} elements for {}", elements.size(), substructure);
    return elements;
}

PlaningMesh PlaningMeshReader::read(const std::string& directory,
                                    const std::vector<std::string>& substructures) const {
    PlaningMesh mesh = read_nodes(directory);
    for (const auto& name : substructures) {
        mesh.elements[name] = read_elements(directory, name, mesh.node_count());
    }
    return mesh;
}

} // namespace io
} // namespace pls
