#include "TemplateMesh.hpp"
#include "Unpooling.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>

namespace V2M {

using ML::Tensor;
using ML::IndexTensor;

namespace {

void projectToUnitSphere(SurfaceMesh& mesh) {
    for (size_t v = 0; v < mesh.vertices.size(); ++v) {
        auto& p = mesh.vertices[v];
        double r = std::sqrt(p[0] * p[0] + p[1] * p[1] + p[2] * p[2]);
        if (r == 0.0) {
            throw GeometryError("TemplateMesh: vertex " + std::to_string(v) + " of '" +
                                mesh.name + "' lies at the origin and cannot be "
                                "projected onto the unit sphere");
        }
        for (double& c : p) c /= r;
    }
}

} // namespace

TemplateMesh::TemplateMesh(const std::vector<SurfaceMesh>& structures)
    : structures_(structures) {
    validate();
}

void TemplateMesh::validate() const {
    if (structures_.empty()) {
        throw ShapeError("TemplateMesh: no structures");
    }
    const int V = structures_.front().numVertices();
    for (const auto& s : structures_) {
        if (s.numVertices() != V) {
            throw ShapeError("TemplateMesh: structure '" + s.name + "' has " +
                             std::to_string(s.numVertices()) + " vertices, expected " +
                             std::to_string(V) + " like every other structure");
        }
        if (s.numFaces() == 0) {
            throw ShapeError("TemplateMesh: structure '" + s.name + "' has no faces");
        }
        for (const auto& f : s.faces) {
            for (int v : f) {
                if (v < 0 || v >= V) {
                    throw ShapeError("TemplateMesh: face index " + std::to_string(v) +
                                     " of '" + s.name + "' outside [0, " +
                                     std::to_string(V) + ")");
                }
            }
        }
        // Throws GeometryError for degenerate or non-manifold faces
        Unpooling::uniqueEdges(s.faces);
    }
}

int TemplateMesh::maxFaces() const {
    int F = 0;
    for (const auto& s : structures_) F = std::max(F, s.numFaces());
    return F;
}

TemplateMesh TemplateMesh::fromObj(const std::string& path, bool normalize) {
    std::vector<SurfaceMesh> structures;
    if (!MeshIO::readObj(path, structures)) {
        throw std::runtime_error("TemplateMesh: cannot read template mesh " + path);
    }
    if (normalize) {
        for (auto& s : structures) projectToUnitSphere(s);
    }
    return TemplateMesh(structures);
}

SurfaceMesh TemplateMesh::unitIcosphere(int level) {
    if (level < 0) {
        throw ConfigurationError("icosphere level must be non-negative, got " +
                                 std::to_string(level));
    }

    const double t = (1.0 + std::sqrt(5.0)) / 2.0;
    SurfaceMesh mesh;
    mesh.name = "icosphere";
    mesh.vertices = {
        {-1.0, t, 0.0}, {1.0, t, 0.0}, {-1.0, -t, 0.0}, {1.0, -t, 0.0},
        {0.0, -1.0, t}, {0.0, 1.0, t}, {0.0, -1.0, -t}, {0.0, 1.0, -t},
        {t, 0.0, -1.0}, {t, 0.0, 1.0}, {-t, 0.0, -1.0}, {-t, 0.0, 1.0}
    };
    mesh.faces = {
        {0, 11, 5}, {0, 5, 1}, {0, 1, 7}, {0, 7, 10}, {0, 10, 11},
        {1, 5, 9}, {5, 11, 4}, {11, 10, 2}, {10, 7, 6}, {7, 1, 8},
        {3, 9, 4}, {3, 4, 2}, {3, 2, 6}, {3, 6, 8}, {3, 8, 9},
        {4, 9, 5}, {2, 4, 11}, {6, 2, 10}, {8, 6, 7}, {9, 8, 1}
    };
    projectToUnitSphere(mesh);

    for (int l = 0; l < level; ++l) {
        mesh = Unpooling::subdivide(mesh);
        projectToUnitSphere(mesh);
    }
    return mesh;
}

TemplateMesh TemplateMesh::icosphere(int level,
                                     const std::vector<std::array<double, 3>>& centers,
                                     const std::vector<double>& radii) {
    if (centers.size() != radii.size()) {
        throw ConfigurationError("Number of structure centers (" +
                                 std::to_string(centers.size()) + ") and radii (" +
                                 std::to_string(radii.size()) + ") must be equal");
    }

    SurfaceMesh sphere = unitIcosphere(level);
    std::vector<SurfaceMesh> structures;
    for (size_t m = 0; m < centers.size(); ++m) {
        SurfaceMesh s = sphere;
        s.name = "structure_" + std::to_string(m);
        for (auto& p : s.vertices) {
            for (int d = 0; d < SPATIAL_DIM; ++d) {
                p[d] = p[d] * radii[m] + centers[m][d];
            }
        }
        structures.push_back(s);
    }
    return TemplateMesh(structures);
}

TemplateMesh TemplateMesh::fromConfig(const TemplateConfig& config) {
    if (!config.path.empty()) {
        return fromObj(config.path, config.normalize);
    }
    return icosphere(config.icosphere_level, config.structure_centers,
                     config.structure_radii);
}

MeshBatch TemplateMesh::replicate(int batch_size) const {
    if (batch_size <= 0) {
        throw ShapeError("TemplateMesh::replicate: batch size must be positive, got " +
                         std::to_string(batch_size));
    }
    const int M = numStructures();
    const int V = numVertices();
    const int F = maxFaces();

    Tensor verts({batch_size, M, V, SPATIAL_DIM});
    IndexTensor faces({batch_size, M, F, 3}, PAD_INDEX);

    for (int n = 0; n < batch_size; ++n) {
        for (int m = 0; m < M; ++m) {
            const SurfaceMesh& s = structures_[m];
            for (int v = 0; v < V; ++v) {
                for (int d = 0; d < SPATIAL_DIM; ++d) {
                    verts(n, m, v, d) = s.vertices[v][d];
                }
            }
            for (int f = 0; f < s.numFaces(); ++f) {
                for (int d = 0; d < 3; ++d) {
                    faces(n, m, f, d) = s.faces[f][d];
                }
            }
        }
    }
    return MeshBatch(verts, faces);
}

} // namespace V2M
