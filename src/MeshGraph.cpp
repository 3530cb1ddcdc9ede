#include "MeshGraph.hpp"
#include "MeshBatch.hpp"
#include <algorithm>

namespace V2M {
namespace ML {

void MeshGraph::fromEdges(int num_nodes, const std::vector<Edge>& edges) {
    num_nodes_ = num_nodes;
    edges_ = edges;

    neighbors_.assign(num_nodes, {});
    for (const auto& e : edges_) {
        if (e.src < 0 || e.src >= num_nodes || e.dst < 0 || e.dst >= num_nodes) {
            throw ShapeError("MeshGraph: edge (" + std::to_string(e.src) + ", " +
                             std::to_string(e.dst) + ") outside [0, " +
                             std::to_string(num_nodes) + ")");
        }
        neighbors_[e.src].push_back(e.dst);
    }
}

void MeshGraph::fromUndirected(int num_nodes, const IndexTensor& pairs) {
    if (pairs.dim() != 2 || (pairs.shape[0] > 0 && pairs.shape[1] != 2)) {
        throw ShapeError("MeshGraph: undirected edges must be [E, 2], got " +
                         pairs.shapeString());
    }

    std::vector<std::pair<int, int>> unique;
    unique.reserve(pairs.shape[0]);
    for (int e = 0; e < pairs.shape[0]; ++e) {
        int a = pairs(e, 0);
        int b = pairs(e, 1);
        if (a == b) continue;
        unique.emplace_back(std::min(a, b), std::max(a, b));
    }
    std::sort(unique.begin(), unique.end());
    unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

    std::vector<Edge> edges;
    edges.reserve(2 * unique.size());
    for (const auto& p : unique) {
        edges.push_back({p.first, p.second});
        edges.push_back({p.second, p.first});
    }
    fromEdges(num_nodes, edges);

    for (auto& neigh : neighbors_) {
        std::sort(neigh.begin(), neigh.end());
    }
}

MeshGraph MeshGraph::fromMeshBatch(const MeshBatch& mesh) {
    MeshGraph graph;
    graph.fromUndirected(mesh.numUnits() * mesh.numVertices(), mesh.edgesPacked());
    return graph;
}

} // namespace ML
} // namespace V2M
