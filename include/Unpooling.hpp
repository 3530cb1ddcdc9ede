/**
 * @file Unpooling.hpp
 * @brief Uniform midpoint subdivision ("unpooling") of batched meshes
 *
 * Every unique undirected edge receives one new vertex at its midpoint and
 * every triangle (v0, v1, v2) is replaced by
 *
 *   (v0, m01, m20), (v1, m12, m01), (v2, m20, m12), (m01, m12, m20)
 *
 * New vertices are appended after the existing ones in the order in which
 * their edge is first met when scanning faces in row order and, inside a
 * face, the edges (v0,v1), (v1,v2), (v2,v0). The four children of face f
 * occupy rows 4f .. 4f+3, so V' = V + E and F' = 4F hold exactly and batch
 * members that share a topology stay aligned.
 *
 * Only uniform refinement exists; a per-sample adaptive variant would break
 * the uniform vertex count of a batch and is rejected by the decoder
 * configuration.
 */

#ifndef V2M_UNPOOLING_HPP
#define V2M_UNPOOLING_HPP

#include "V2M.hpp"
#include "MeshBatch.hpp"
#include <vector>
#include <array>

namespace V2M {
namespace Unpooling {

/**
 * @brief Topology change produced by one subdivision of a triangle list
 */
struct SubdivisionPlan {
    int num_vertices = 0;                        ///< V before subdivision
    std::vector<std::array<int, 2>> edges;       ///< parents of new vertex V + k
    std::vector<std::array<int, 3>> faces;       ///< 4 children per input face

    int numNewVertices() const { return num_vertices + static_cast<int>(edges.size()); }
};

/**
 * @brief Unique undirected edges as (min, max), in first-occurrence order
 *
 * @throws GeometryError for a face repeating a vertex or an edge shared by
 *         more than two faces (non-manifold input)
 */
std::vector<std::array<int, 2>> uniqueEdges(const std::vector<std::array<int, 3>>& faces);

/**
 * @brief Subdivision of a triangle list over vertices [0, num_vertices)
 */
SubdivisionPlan plan(const std::vector<std::array<int, 3>>& faces, int num_vertices);

/**
 * @brief Subdivide every unit of a batch
 *
 * Vertex positions and latent features of new vertices are the mean of the
 * two edge endpoints. Padding face rows stay padding (four rows each).
 *
 * @throws ShapeError for edge-like faces or if units end with different
 *         vertex counts
 * @throws GeometryError for degenerate or non-manifold faces
 */
MeshBatch uniformUnpool(const MeshBatch& mesh);

/**
 * @brief Subdivide a single surface (positions only)
 */
SurfaceMesh subdivide(const SurfaceMesh& mesh);

} // namespace Unpooling
} // namespace V2M

#endif // V2M_UNPOOLING_HPP
