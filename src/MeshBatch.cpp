/**
 * @file MeshBatch.cpp
 * @brief Padded/packed views and invariant checks of MeshBatch
 */

#include "MeshBatch.hpp"
#include <algorithm>
#include <sstream>

namespace V2M {

using ML::Tensor;
using ML::IndexTensor;

MeshBatch::MeshBatch(const Tensor& verts, const IndexTensor& faces,
                     const Tensor& features)
    : verts_(verts), faces_(faces), features_(features) {
    if (verts_.dim() != 4 || verts_.shape[3] != SPATIAL_DIM) {
        throw ShapeError("MeshBatch: vertices must be [N, M, V, 3], got " +
                         verts_.shapeString());
    }
    if (features_.shape.empty()) {
        features_ = Tensor({verts_.shape[0], verts_.shape[1], verts_.shape[2], 0});
    }
    validate();
}

MeshBatch MeshBatch::fromPacked(const Tensor& verts_packed,
                                const IndexTensor& faces_packed,
                                const std::vector<int>& faces_per_unit,
                                int batch_size, int num_structures,
                                const Tensor& features_packed) {
    int units = batch_size * num_structures;
    if (units <= 0 || static_cast<int>(faces_per_unit.size()) != units) {
        throw ShapeError("MeshBatch::fromPacked: expected " + std::to_string(units) +
                         " face counts, got " + std::to_string(faces_per_unit.size()));
    }
    if (verts_packed.dim() != 2 || verts_packed.shape[0] % units != 0) {
        throw ShapeError("MeshBatch::fromPacked: packed vertices " +
                         verts_packed.shapeString() + " do not split into " +
                         std::to_string(units) + " units");
    }
    if (faces_packed.dim() != 2) {
        throw ShapeError("MeshBatch::fromPacked: packed faces must be [F, D], got " +
                         faces_packed.shapeString());
    }

    int V = verts_packed.shape[0] / units;
    int D = faces_packed.shape[1];
    int F = 0;
    long total = 0;
    for (int count : faces_per_unit) {
        if (count < 0) {
            throw ShapeError("MeshBatch::fromPacked: negative face count");
        }
        F = std::max(F, count);
        total += count;
    }
    if (total != faces_packed.shape[0]) {
        throw ShapeError("MeshBatch::fromPacked: face counts sum to " +
                         std::to_string(total) + " but " +
                         std::to_string(faces_packed.shape[0]) + " faces are packed");
    }

    Tensor verts = verts_packed.reshape({batch_size, num_structures, V, SPATIAL_DIM});
    IndexTensor faces({batch_size, num_structures, F, D}, PAD_INDEX);

    int row = 0;
    for (int n = 0; n < batch_size; ++n) {
        for (int m = 0; m < num_structures; ++m) {
            int unit = n * num_structures + m;
            int offset = unit * V;
            for (int f = 0; f < faces_per_unit[unit]; ++f, ++row) {
                for (int d = 0; d < D; ++d) {
                    faces(n, m, f, d) = faces_packed(row, d) - offset;
                }
            }
        }
    }

    Tensor features;
    if (!features_packed.shape.empty()) {
        if (features_packed.dim() != 2 || features_packed.shape[0] != verts_packed.shape[0]) {
            throw ShapeError("MeshBatch::fromPacked: packed features " +
                             features_packed.shapeString() + " do not match vertices " +
                             verts_packed.shapeString());
        }
        features = features_packed.reshape({batch_size, num_structures, V,
                                            features_packed.shape[1]});
    }

    return MeshBatch(verts, faces, features);
}

void MeshBatch::validate() const {
    if (faces_.dim() != 4) {
        throw ShapeError("MeshBatch: faces must be [N, M, F, D], got " +
                         faces_.shapeString());
    }
    if (faces_.shape[0] != verts_.shape[0] || faces_.shape[1] != verts_.shape[1]) {
        throw ShapeError("MeshBatch: batch/structure dimensions of vertices " +
                         verts_.shapeString() + " and faces " + faces_.shapeString() +
                         " disagree");
    }
    if (faces_.shape[3] != 2 && faces_.shape[3] != 3) {
        throw ShapeError("MeshBatch: faces must have 2 or 3 corners, got " +
                         faces_.shapeString());
    }
    if (features_.dim() != 4 || features_.shape[0] != verts_.shape[0] ||
        features_.shape[1] != verts_.shape[1] || features_.shape[2] != verts_.shape[2]) {
        throw ShapeError("MeshBatch: features " + features_.shapeString() +
                         " do not match vertices " + verts_.shapeString());
    }

    const int V = numVertices();
    const int D = faceDim();
    for (int n = 0; n < batchSize(); ++n) {
        for (int m = 0; m < numStructures(); ++m) {
            for (int f = 0; f < maxFaces(); ++f) {
                int pads = 0;
                for (int d = 0; d < D; ++d) {
                    int v = faces_(n, m, f, d);
                    if (v == PAD_INDEX) {
                        pads++;
                    } else if (v < 0 || v >= V) {
                        std::ostringstream msg;
                        msg << "MeshBatch: face index " << v << " of face " << f
                            << " (sample " << n << ", structure " << m
                            << ") outside [0, " << V << ")";
                        throw ShapeError(msg.str());
                    }
                }
                if (pads != 0 && pads != D) {
                    std::ostringstream msg;
                    msg << "MeshBatch: face " << f << " (sample " << n << ", structure "
                        << m << ") mixes padding and vertex indices";
                    throw ShapeError(msg.str());
                }
            }
        }
    }
}

bool MeshBatch::isPaddingRow(int n, int m, int f) const {
    return faces_(n, m, f, 0) == PAD_INDEX;
}

Tensor MeshBatch::vertsPacked() const {
    return verts_.reshape({numUnits() * numVertices(), SPATIAL_DIM});
}

Tensor MeshBatch::featuresPacked() const {
    return features_.reshape({numUnits() * numVertices(), featureDim()});
}

std::vector<int> MeshBatch::numFacesPerUnit() const {
    std::vector<int> counts(numUnits(), 0);
    for (int n = 0; n < batchSize(); ++n) {
        for (int m = 0; m < numStructures(); ++m) {
            int count = 0;
            for (int f = 0; f < maxFaces(); ++f) {
                if (!isPaddingRow(n, m, f)) count++;
            }
            counts[unitIndex(n, m)] = count;
        }
    }
    return counts;
}

IndexTensor MeshBatch::facesPacked() const {
    std::vector<int> counts = numFacesPerUnit();
    int total = 0;
    for (int c : counts) total += c;

    const int D = faceDim();
    IndexTensor packed({total, D});
    int row = 0;
    for (int n = 0; n < batchSize(); ++n) {
        for (int m = 0; m < numStructures(); ++m) {
            int offset = vertexOffset(n, m);
            for (int f = 0; f < maxFaces(); ++f) {
                if (isPaddingRow(n, m, f)) continue;
                for (int d = 0; d < D; ++d) {
                    packed(row, d) = faces_(n, m, f, d) + offset;
                }
                row++;
            }
        }
    }
    return packed;
}

IndexTensor MeshBatch::edgesPacked() const {
    IndexTensor faces = facesPacked();
    const int num_faces = faces.shape[0];

    if (faceDim() == 2) {
        return faces;
    }

    IndexTensor edges({3 * num_faces, 2});
    for (int f = 0; f < num_faces; ++f) {
        for (int k = 0; k < 3; ++k) {
            int a = faces(f, k);
            int b = faces(f, (k + 1) % 3);
            edges(3 * f + k, 0) = std::min(a, b);
            edges(3 * f + k, 1) = std::max(a, b);
        }
    }
    return edges;
}

void MeshBatch::moveVerts(const Tensor& offset) {
    if (!offset.sameShape(verts_)) {
        throw ShapeError("MeshBatch::moveVerts: offset " + offset.shapeString() +
                         " does not match vertices " + verts_.shapeString());
    }
    verts_ += offset;
}

void MeshBatch::updateFeatures(const Tensor& features) {
    if (features.dim() != 4 || features.shape[0] != verts_.shape[0] ||
        features.shape[1] != verts_.shape[1] || features.shape[2] != verts_.shape[2]) {
        throw ShapeError("MeshBatch::updateFeatures: features " + features.shapeString() +
                         " do not match vertices " + verts_.shapeString());
    }
    features_ = features;
}

SurfaceMesh MeshBatch::surface(int n, int m) const {
    if (n < 0 || n >= batchSize() || m < 0 || m >= numStructures()) {
        throw ShapeError("MeshBatch::surface: unit (" + std::to_string(n) + ", " +
                         std::to_string(m) + ") out of range");
    }
    if (faceDim() != 3) {
        throw ShapeError("MeshBatch::surface: only triangle meshes can be exported");
    }

    SurfaceMesh mesh;
    mesh.name = "structure_" + std::to_string(m);
    mesh.vertices.resize(numVertices());
    for (int v = 0; v < numVertices(); ++v) {
        for (int d = 0; d < SPATIAL_DIM; ++d) {
            mesh.vertices[v][d] = verts_(n, m, v, d);
        }
    }
    for (int f = 0; f < maxFaces(); ++f) {
        if (isPaddingRow(n, m, f)) continue;
        mesh.faces.push_back({faces_(n, m, f, 0), faces_(n, m, f, 1), faces_(n, m, f, 2)});
    }
    return mesh;
}

} // namespace V2M
