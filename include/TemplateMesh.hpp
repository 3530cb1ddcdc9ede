/**
 * @file TemplateMesh.hpp
 * @brief Immutable reference topology deformed by the decoder
 *
 * A template holds one closed triangle surface per structure. All structures
 * share the vertex count V (face counts may differ and are padded). The
 * template is never modified after construction; replicate() copies it into a
 * fresh MeshBatch for every decoder run.
 */

#ifndef V2M_TEMPLATE_MESH_HPP
#define V2M_TEMPLATE_MESH_HPP

#include "V2M.hpp"
#include "MeshIO.hpp"
#include "MeshBatch.hpp"
#include <vector>
#include <array>
#include <string>

namespace V2M {

class TemplateMesh {
public:
    /**
     * @throws ShapeError if there is no structure, V differs between
     *         structures or a face index is out of range
     * @throws GeometryError for degenerate or non-manifold faces
     */
    explicit TemplateMesh(const std::vector<SurfaceMesh>& structures);

    /**
     * @brief Load from an OBJ file, one structure per object/group
     *
     * @param normalize project every vertex onto the unit sphere
     * @throws std::runtime_error if the file cannot be read
     */
    static TemplateMesh fromObj(const std::string& path, bool normalize = true);

    /**
     * @brief One icosphere per structure
     *
     * Level 0 is the icosahedron (12 vertices, 20 faces); every level
     * subdivides once, giving 10*4^level + 2 vertices.
     *
     * @throws ConfigurationError if centers and radii differ in length or
     *         level is negative
     */
    static TemplateMesh icosphere(int level,
                                  const std::vector<std::array<double, 3>>& centers,
                                  const std::vector<double>& radii);

    static TemplateMesh fromConfig(const TemplateConfig& config);

    /**
     * @brief Unit icosphere centered at the origin
     */
    static SurfaceMesh unitIcosphere(int level);

    int numStructures() const { return static_cast<int>(structures_.size()); }
    int numVertices() const { return structures_.front().numVertices(); }
    int maxFaces() const;

    const std::vector<SurfaceMesh>& structures() const { return structures_; }
    const SurfaceMesh& structure(int m) const { return structures_.at(m); }

    /**
     * @brief Copy the template into every sample of a new batch
     *
     * @return MeshBatch [batch_size, M, V, 3] without latent features
     */
    MeshBatch replicate(int batch_size) const;

private:
    void validate() const;

    std::vector<SurfaceMesh> structures_;
};

} // namespace V2M

#endif // V2M_TEMPLATE_MESH_HPP
