#include "Unpooling.hpp"
#include <unordered_map>
#include <algorithm>
#include <sstream>

namespace V2M {
namespace Unpooling {

using ML::Tensor;
using ML::IndexTensor;

namespace {

long long edgeKey(int a, int b) {
    return (static_cast<long long>(a) << 32) | static_cast<unsigned int>(b);
}

struct EdgeIndex {
    std::vector<std::array<int, 2>> edges;
    std::unordered_map<long long, int> lookup;   // key -> position in edges
    std::vector<int> use_count;

    int insert(int a, int b) {
        int lo = std::min(a, b);
        int hi = std::max(a, b);
        long long key = edgeKey(lo, hi);
        auto it = lookup.find(key);
        if (it != lookup.end()) {
            use_count[it->second]++;
            return it->second;
        }
        int id = static_cast<int>(edges.size());
        lookup.emplace(key, id);
        edges.push_back({lo, hi});
        use_count.push_back(1);
        return id;
    }
};

// Builds the edge table and returns, per face, the ids of its edges
// (v0,v1), (v1,v2), (v2,v0)
EdgeIndex indexEdges(const std::vector<std::array<int, 3>>& faces,
                     std::vector<std::array<int, 3>>* face_edges) {
    EdgeIndex index;
    index.lookup.reserve(faces.size() * 2);
    if (face_edges) face_edges->resize(faces.size());

    for (size_t f = 0; f < faces.size(); ++f) {
        const auto& t = faces[f];
        if (t[0] == t[1] || t[1] == t[2] || t[2] == t[0]) {
            std::ostringstream msg;
            msg << "Unpooling: degenerate face " << f << " (" << t[0] << ", "
                << t[1] << ", " << t[2] << ")";
            throw GeometryError(msg.str());
        }
        for (int k = 0; k < 3; ++k) {
            int id = index.insert(t[k], t[(k + 1) % 3]);
            if (face_edges) (*face_edges)[f][k] = id;
        }
    }

    for (size_t e = 0; e < index.edges.size(); ++e) {
        if (index.use_count[e] > 2) {
            std::ostringstream msg;
            msg << "Unpooling: non-manifold edge (" << index.edges[e][0] << ", "
                << index.edges[e][1] << ") shared by " << index.use_count[e] << " faces";
            throw GeometryError(msg.str());
        }
    }
    return index;
}

} // namespace

std::vector<std::array<int, 2>> uniqueEdges(const std::vector<std::array<int, 3>>& faces) {
    return indexEdges(faces, nullptr).edges;
}

SubdivisionPlan plan(const std::vector<std::array<int, 3>>& faces, int num_vertices) {
    for (const auto& t : faces) {
        for (int v : t) {
            if (v < 0 || v >= num_vertices) {
                throw ShapeError("Unpooling: face index " + std::to_string(v) +
                                 " outside [0, " + std::to_string(num_vertices) + ")");
            }
        }
    }

    std::vector<std::array<int, 3>> face_edges;
    EdgeIndex index = indexEdges(faces, &face_edges);

    SubdivisionPlan result;
    result.num_vertices = num_vertices;
    result.edges = std::move(index.edges);
    result.faces.reserve(4 * faces.size());

    for (size_t f = 0; f < faces.size(); ++f) {
        const auto& t = faces[f];
        int m01 = num_vertices + face_edges[f][0];
        int m12 = num_vertices + face_edges[f][1];
        int m20 = num_vertices + face_edges[f][2];

        result.faces.push_back({t[0], m01, m20});
        result.faces.push_back({t[1], m12, m01});
        result.faces.push_back({t[2], m20, m12});
        result.faces.push_back({m01, m12, m20});
    }
    return result;
}

MeshBatch uniformUnpool(const MeshBatch& mesh) {
    if (mesh.faceDim() != 3) {
        throw ShapeError("Unpooling: requires triangle faces, got " +
                         std::to_string(mesh.faceDim()) + " corners per face");
    }

    const int N = mesh.batchSize();
    const int M = mesh.numStructures();
    const int V = mesh.numVertices();
    const int F = mesh.maxFaces();
    const int C = mesh.featureDim();
    const IndexTensor& faces = mesh.facesPadded();
    const Tensor& verts = mesh.vertsPadded();
    const Tensor& feats = mesh.featuresPadded();

    std::vector<SubdivisionPlan> plans;
    std::vector<std::vector<int>> rows;     // padded row of each valid face
    plans.reserve(N * M);
    rows.reserve(N * M);

    for (int n = 0; n < N; ++n) {
        for (int m = 0; m < M; ++m) {
            std::vector<std::array<int, 3>> unit_faces;
            std::vector<int> unit_rows;
            for (int f = 0; f < F; ++f) {
                if (faces(n, m, f, 0) == PAD_INDEX) continue;
                unit_faces.push_back({faces(n, m, f, 0), faces(n, m, f, 1), faces(n, m, f, 2)});
                unit_rows.push_back(f);
            }
            plans.push_back(plan(unit_faces, V));
            rows.push_back(std::move(unit_rows));
        }
    }

    if (plans.empty()) {
        throw ShapeError("Unpooling: empty batch");
    }
    const int V_new = plans.front().numNewVertices();
    for (size_t u = 1; u < plans.size(); ++u) {
        if (plans[u].numNewVertices() != V_new) {
            throw ShapeError("Unpooling: units would end with different vertex counts (" +
                             std::to_string(V_new) + " vs " +
                             std::to_string(plans[u].numNewVertices()) + ")");
        }
    }

    Tensor new_verts({N, M, V_new, SPATIAL_DIM});
    Tensor new_feats({N, M, V_new, C});
    IndexTensor new_faces({N, M, 4 * F, 3}, PAD_INDEX);

    for (int n = 0; n < N; ++n) {
        for (int m = 0; m < M; ++m) {
            const SubdivisionPlan& p = plans[n * M + m];
            const std::vector<int>& unit_rows = rows[n * M + m];

            for (int v = 0; v < V; ++v) {
                for (int d = 0; d < SPATIAL_DIM; ++d) new_verts(n, m, v, d) = verts(n, m, v, d);
                for (int c = 0; c < C; ++c) new_feats(n, m, v, c) = feats(n, m, v, c);
            }
            for (size_t e = 0; e < p.edges.size(); ++e) {
                int a = p.edges[e][0];
                int b = p.edges[e][1];
                int v = V + static_cast<int>(e);
                for (int d = 0; d < SPATIAL_DIM; ++d) {
                    new_verts(n, m, v, d) = 0.5 * (verts(n, m, a, d) + verts(n, m, b, d));
                }
                for (int c = 0; c < C; ++c) {
                    new_feats(n, m, v, c) = 0.5 * (feats(n, m, a, c) + feats(n, m, b, c));
                }
            }
            for (size_t i = 0; i < unit_rows.size(); ++i) {
                for (int k = 0; k < 4; ++k) {
                    const auto& child = p.faces[4 * i + k];
                    int row = 4 * unit_rows[i] + k;
                    for (int d = 0; d < 3; ++d) new_faces(n, m, row, d) = child[d];
                }
            }
        }
    }

    return MeshBatch(new_verts, new_faces, new_feats);
}

SurfaceMesh subdivide(const SurfaceMesh& mesh) {
    SubdivisionPlan p = plan(mesh.faces, mesh.numVertices());

    SurfaceMesh result;
    result.name = mesh.name;
    result.vertices = mesh.vertices;
    result.vertices.reserve(p.numNewVertices());
    for (const auto& e : p.edges) {
        const auto& a = mesh.vertices[e[0]];
        const auto& b = mesh.vertices[e[1]];
        result.vertices.push_back({0.5 * (a[0] + b[0]), 0.5 * (a[1] + b[1]),
                                   0.5 * (a[2] + b[2])});
    }
    result.faces = std::move(p.faces);
    return result;
}

} // namespace Unpooling
} // namespace V2M
