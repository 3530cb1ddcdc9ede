/**
 * @file MeshGraph.hpp
 * @brief Graph view of a packed mesh batch for message passing
 *
 * Nodes are the packed vertices of a MeshBatch; every undirected mesh edge
 * appears once in each direction. Since packed face indices are offset per
 * unit, no edge ever connects two different batch samples or structures.
 */

#ifndef V2M_MESH_GRAPH_HPP
#define V2M_MESH_GRAPH_HPP

#include "V2M.hpp"
#include "Tensor.hpp"
#include <vector>

namespace V2M {
namespace ML {

/**
 * @brief Directed edge between two packed vertices
 */
struct Edge {
    int src;
    int dst;
};

class MeshGraph {
public:
    MeshGraph() = default;

    /**
     * @brief Create from an explicit directed edge list
     */
    void fromEdges(int num_nodes, const std::vector<Edge>& edges);

    /**
     * @brief Create from undirected pairs [E, 2]; duplicates are dropped and
     *        both directions are stored
     */
    void fromUndirected(int num_nodes, const IndexTensor& pairs);

    /**
     * @brief Graph of the current topology of a mesh batch
     */
    static MeshGraph fromMeshBatch(const MeshBatch& mesh);

    int numNodes() const { return num_nodes_; }
    int numEdges() const { return static_cast<int>(edges_.size()); }
    int degree(int node) const { return static_cast<int>(neighbors_[node].size()); }

    const std::vector<Edge>& edges() const { return edges_; }
    const std::vector<std::vector<int>>& neighbors() const { return neighbors_; }

private:
    int num_nodes_ = 0;
    std::vector<Edge> edges_;
    std::vector<std::vector<int>> neighbors_;
};

} // namespace ML
} // namespace V2M

#endif // V2M_MESH_GRAPH_HPP
