#pragma once

/**
 * @file mesh_reader.hpp
 * @brief Reader for planing-structure mesh directories
 *
 * Directory layout (whitespace separated columns, '#' starts a comment):
 * ```
 * nodes.txt                 x y              one row per node
 * fixedDOF.txt              fx fy (0/1)      one row per node
 * fixedLoad.txt             Fx Fy            one row per node
 * elements_<name>.txt       start end        node indices, one row per element
 * ```
 *
 * Values may be written as floats ("3.0"); indices are rounded.
 */

#include <planingsim/core/core.hpp>
#include <array>
#include <map>
#include <string>
#include <vector>

namespace pls {
namespace io {

struct PlaningMesh {
    std::vector<Vec2r> nodes;
    std::vector<Vec2b> fixed_dofs;
    std::vector<Vec2r> fixed_loads;

    /// Element connectivity per substructure name
    std::map<std::string, std::vector<std::array<Index, 2>>> elements;

    std::size_t node_count() const { return nodes.size(); }
};

class PlaningMeshReader {
public:
    PlaningMeshReader() = default;

    /**
     * @brief Read the node files and the element files of the named substructures
     * @throws FileIOError if a file is missing
     * @throws InvalidArgumentError on row-count mismatch or bad node indices
     */
    PlaningMesh read(const std::string& directory,
                     const std::vector<std::string>& substructures) const;

    /// Node rows only (nodes, fixedDOF, fixedLoad)
    PlaningMesh read_nodes(const std::string& directory) const;

    std::vector<std::array<Index, 2>> read_elements(const std::string& directory,
                                                    const std::string& substructure,
                                                    std::size_t node_count) const;

private:
    /// Rows of exactly two numeric columns
    std::vector<Vec2r> read_two_columns(const std::string& filename) const;
};

} // namespace io
} // namespace pls
