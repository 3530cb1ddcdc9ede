#ifndef V2M_MESH_IO_HPP
#define V2M_MESH_IO_HPP

#include "V2M.hpp"
#include <string>
#include <vector>
#include <array>

namespace V2M {

/**
 * @brief Stand-alone triangle surface (one structure)
 */
struct SurfaceMesh {
    std::string name;                              ///< Structure name (OBJ object/group)
    std::vector<std::array<double, 3>> vertices;   ///< Vertex positions
    std::vector<std::array<int, 3>> faces;         ///< 0-based triangle indices

    int numVertices() const { return static_cast<int>(vertices.size()); }
    int numFaces() const { return static_cast<int>(faces.size()); }
};

/**
 * @brief Wavefront OBJ reading and writing
 *
 * Every `o` or `g` statement starts a new structure; vertex indices in the
 * file are global, so faces are re-indexed into the vertex range of the
 * structure they belong to. Polygons with more than three corners are
 * fan-triangulated. Texture and normal indices (`f 1/2/3`) are ignored.
 */
namespace MeshIO {

bool readObj(const std::string& filename, std::vector<SurfaceMesh>& structures);

bool writeObj(const std::string& filename, const SurfaceMesh& mesh);
bool writeObj(const std::string& filename, const std::vector<SurfaceMesh>& structures);

} // namespace MeshIO

} // namespace V2M

#endif // V2M_MESH_IO_HPP
