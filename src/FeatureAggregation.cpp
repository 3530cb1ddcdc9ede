#include "FeatureAggregation.hpp"
#include <cmath>
#include <algorithm>

namespace V2M {

using ML::Tensor;

namespace {

// Normalized coordinate -> continuous voxel coordinate in [0, R-1]
double toGrid(double p, int resolution) {
    if (resolution <= 1 || std::isnan(p)) return 0.0;
    double g = (p + 1.0) * 0.5 * (resolution - 1);
    return std::min(std::max(g, 0.0), static_cast<double>(resolution - 1));
}

} // namespace

// =============================================================================
// FeatureMap
// =============================================================================

FeatureMap::FeatureMap(const Tensor& data) : data_(data) {
    if (data_.dim() != 5) {
        throw ShapeError("FeatureMap: expected [N, C, X, Y, Z], got " + data_.shapeString());
    }
    for (int axis = 2; axis < 5; ++axis) {
        if (data_.shape[axis] < 1) {
            throw ShapeError("FeatureMap: empty spatial axis in " + data_.shapeString());
        }
    }
}

std::array<double, 3> FeatureMap::gridCoordinate(const std::array<double, 3>& p) const {
    return {toGrid(p[0], resolution(0)), toGrid(p[1], resolution(1)),
            toGrid(p[2], resolution(2))};
}

void FeatureMap::sample(int n, const std::array<double, 3>& p, SamplingMode mode,
                        double* out) const {
    std::array<double, 3> g = gridCoordinate(p);
    if (mode == SamplingMode::NEAREST) {
        sampleNearest(n, g, out);
    } else {
        sampleTrilinear(n, g, out);
    }
}

void FeatureMap::sampleTrilinear(int n, const std::array<double, 3>& g, double* out) const {
    int lo[3];
    double t[3];
    for (int a = 0; a < 3; ++a) {
        int R = resolution(a);
        lo[a] = std::min(static_cast<int>(std::floor(g[a])), std::max(R - 2, 0));
        t[a] = R > 1 ? g[a] - lo[a] : 0.0;
    }

    // Corner offsets collapse to 0 on single-voxel axes
    int step[3];
    for (int a = 0; a < 3; ++a) step[a] = resolution(a) > 1 ? 1 : 0;

    for (int c = 0; c < channels(); ++c) {
        double value = 0.0;
        for (int corner = 0; corner < 8; ++corner) {
            int dx = (corner >> 2) & 1;
            int dy = (corner >> 1) & 1;
            int dz = corner & 1;
            double w = (dx ? t[0] : 1.0 - t[0]) *
                       (dy ? t[1] : 1.0 - t[1]) *
                       (dz ? t[2] : 1.0 - t[2]);
            if (w == 0.0) continue;
            value += w * data_(n, c, lo[0] + dx * step[0], lo[1] + dy * step[1],
                               lo[2] + dz * step[2]);
        }
        out[c] = value;
    }
}

void FeatureMap::sampleNearest(int n, const std::array<double, 3>& g, double* out) const {
    int idx[3];
    for (int a = 0; a < 3; ++a) {
        idx[a] = std::min(static_cast<int>(std::lround(g[a])), resolution(a) - 1);
    }
    for (int c = 0; c < channels(); ++c) {
        out[c] = data_(n, c, idx[0], idx[1], idx[2]);
    }
}

// =============================================================================
// FeatureAggregator
// =============================================================================

FeatureAggregator::FeatureAggregator(SamplingMode mode) : mode_(mode) {}

int FeatureAggregator::outputChannels(const std::vector<int>& channels_per_map,
                                      const std::vector<int>& indices) {
    int total = 0;
    for (int idx : indices) {
        if (idx < 0 || idx >= static_cast<int>(channels_per_map.size())) {
            throw ConfigurationError("Aggregation index " + std::to_string(idx) +
                                     " outside the " +
                                     std::to_string(channels_per_map.size()) +
                                     " available feature maps");
        }
        total += channels_per_map[idx];
    }
    return total;
}

Tensor FeatureAggregator::aggregate(const std::vector<FeatureMap>& maps,
                                    const std::vector<int>& indices,
                                    const Tensor& verts) const {
    if (verts.dim() != 4 || verts.shape[3] != SPATIAL_DIM) {
        throw ShapeError("FeatureAggregator: vertices must be [N, M, V, 3], got " +
                         verts.shapeString());
    }
    const int N = verts.shape[0];
    const int M = verts.shape[1];
    const int V = verts.shape[2];

    std::vector<int> channels;
    channels.reserve(maps.size());
    for (const auto& map : maps) channels.push_back(map.channels());
    const int width = outputChannels(channels, indices);

    for (int idx : indices) {
        if (maps[idx].batchSize() != N) {
            throw ShapeError("FeatureAggregator: feature map " + std::to_string(idx) +
                             " has batch size " + std::to_string(maps[idx].batchSize()) +
                             " but the mesh batch has " + std::to_string(N));
        }
    }

    Tensor result({N, M, V, width});
    if (width == 0) return result;

    for (int n = 0; n < N; ++n) {
        for (int m = 0; m < M; ++m) {
            for (int v = 0; v < V; ++v) {
                std::array<double, 3> p = {verts(n, m, v, 0), verts(n, m, v, 1),
                                           verts(n, m, v, 2)};
                double* out = &result(n, m, v, 0);
                for (int idx : indices) {
                    maps[idx].sample(n, p, mode_, out);
                    out += maps[idx].channels();
                }
            }
        }
    }
    return result;
}

Tensor normalizeVoxelCoordinates(const Tensor& voxel_coords,
                                 const std::array<int, 3>& volume_shape) {
    if (voxel_coords.dim() != 2 || voxel_coords.shape[1] != SPATIAL_DIM) {
        throw ShapeError("normalizeVoxelCoordinates: expected [K, 3], got " +
                         voxel_coords.shapeString());
    }
    int extent = 0;
    for (int a = 0; a < SPATIAL_DIM; ++a) {
        if (volume_shape[a] < 1) {
            throw ShapeError("normalizeVoxelCoordinates: non-positive volume extent " +
                             std::to_string(volume_shape[a]));
        }
        extent = std::max(extent, volume_shape[a]);
    }
    if (extent < 2) {
        throw ShapeError("normalizeVoxelCoordinates: volume has a single voxel");
    }

    // One divisor for all axes keeps the frame isotropic
    const double scale = 1.0 / (extent - 1);
    Tensor result(voxel_coords.shape);
    for (int k = 0; k < voxel_coords.shape[0]; ++k) {
        for (int a = 0; a < SPATIAL_DIM; ++a) {
            result(k, a) = 2.0 * (voxel_coords(k, a) * scale - 0.5);
        }
    }
    return result;
}

} // namespace V2M
