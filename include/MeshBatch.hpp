/**
 * @file MeshBatch.hpp
 * @brief Batched multi-structure mesh container
 *
 * A MeshBatch stores N batch samples x M anatomical structures, each with the
 * same vertex count V. The padded view is the canonical storage; the packed
 * view is always derived from it on demand, so both can never diverge.
 *
 * Packed ordering is sample-major: the unit (n, m) occupies the vertex rows
 * [(n*M + m)*V, (n*M + m + 1)*V) of every packed tensor.
 */

#ifndef V2M_MESH_BATCH_HPP
#define V2M_MESH_BATCH_HPP

#include "V2M.hpp"
#include "Tensor.hpp"
#include "MeshIO.hpp"
#include <vector>
#include <array>

namespace V2M {

class MeshBatch {
public:
    /**
     * @brief Construct from padded tensors
     *
     * @param verts    vertex positions [N, M, V, 3]
     * @param faces    face indices [N, M, F, D], D = 3 (triangles) or 2 (edges),
     *                 unused rows filled with PAD_INDEX
     * @param features latent vertex features [N, M, V, C]; a default-constructed
     *                 tensor means C = 0
     *
     * @throws ShapeError if batch/structure dimensions of vertices, faces and
     *         features disagree or a face index is neither in [0, V) nor the
     *         padding sentinel
     */
    MeshBatch(const ML::Tensor& verts, const ML::IndexTensor& faces,
              const ML::Tensor& features = ML::Tensor());

    /**
     * @brief Rebuild the padded representation from a packed one
     *
     * @param verts_packed    [N*M*V, 3]
     * @param faces_packed    [sum(faces_per_unit), D] with global (offset) indices
     * @param faces_per_unit  number of valid faces of every unit, N*M entries
     * @param features_packed [N*M*V, C] or default-constructed
     */
    static MeshBatch fromPacked(const ML::Tensor& verts_packed,
                                const ML::IndexTensor& faces_packed,
                                const std::vector<int>& faces_per_unit,
                                int batch_size, int num_structures,
                                const ML::Tensor& features_packed = ML::Tensor());

    // Dimensions
    int batchSize() const { return verts_.shape[0]; }
    int numStructures() const { return verts_.shape[1]; }
    int numVertices() const { return verts_.shape[2]; }
    int maxFaces() const { return faces_.shape[2]; }
    int faceDim() const { return faces_.shape[3]; }
    int featureDim() const { return features_.shape[3]; }
    int numUnits() const { return batchSize() * numStructures(); }

    int unitIndex(int n, int m) const { return n * numStructures() + m; }
    int vertexOffset(int n, int m) const { return unitIndex(n, m) * numVertices(); }

    // Padded view (returned unchanged)
    const ML::Tensor& vertsPadded() const { return verts_; }
    const ML::IndexTensor& facesPadded() const { return faces_; }
    const ML::Tensor& featuresPadded() const { return features_; }

    // Packed view
    ML::Tensor vertsPacked() const;
    ML::Tensor featuresPacked() const;
    ML::IndexTensor facesPacked() const;
    std::vector<int> numFacesPerUnit() const;

    /**
     * @brief Undirected edges derived from facesPacked(), shape [E, 2]
     *
     * Triangles contribute their three edges (v0,v1), (v1,v2), (v2,v0), each
     * stored as (min, max). Edges shared by neighboring faces appear once per
     * face; consumers deduplicate when they need a set. Edge-like faces
     * (D = 2) are returned as they are.
     */
    ML::IndexTensor edgesPacked() const;

    /**
     * @brief Add a displacement to every vertex
     * @throws ShapeError unless offset has the padded vertex shape
     */
    void moveVerts(const ML::Tensor& offset);

    /**
     * @brief Replace the latent feature tensor
     * @throws ShapeError unless features is [N, M, V, C] for any C
     */
    void updateFeatures(const ML::Tensor& features);

    /**
     * @brief One structure of one sample as a stand-alone triangle mesh
     */
    SurfaceMesh surface(int n, int m) const;

private:
    void validate() const;
    bool isPaddingRow(int n, int m, int f) const;

    ML::Tensor verts_;
    ML::IndexTensor faces_;
    ML::Tensor features_;
};

} // namespace V2M

#endif // V2M_MESH_BATCH_HPP
