/**
 * @file FeatureAggregation.hpp
 * @brief Sampling volumetric feature maps at continuous vertex positions
 *
 * Mesh coordinates live in the normalized frame [-1, 1]^3. Vertex axis a
 * (x, y, z) addresses spatial axis a of a feature map [N, C, X, Y, Z]. The
 * mapping is the same for every map regardless of its resolution R:
 *
 *   g = (p + 1) / 2 * (R - 1)
 *
 * so p = -1 and p = 1 hit the centers of the first and last voxel, and a
 * normalized coordinate that corresponds to a voxel center returns that voxel
 * exactly. Coordinates outside the grid are clamped to the boundary voxels.
 */

#ifndef V2M_FEATURE_AGGREGATION_HPP
#define V2M_FEATURE_AGGREGATION_HPP

#include "V2M.hpp"
#include "Tensor.hpp"
#include <vector>
#include <array>

namespace V2M {

/**
 * @brief One volumetric feature map produced by the image encoder/decoder
 */
class FeatureMap {
public:
    /**
     * @param data feature volume [N, C, X, Y, Z]
     * @throws ShapeError for other ranks or empty spatial axes
     */
    explicit FeatureMap(const ML::Tensor& data);

    int batchSize() const { return data_.shape[0]; }
    int channels() const { return data_.shape[1]; }
    int resolution(int axis) const { return data_.shape[2 + axis]; }
    const ML::Tensor& data() const { return data_; }

    /**
     * @brief Continuous, clamped grid coordinate of a normalized position
     */
    std::array<double, 3> gridCoordinate(const std::array<double, 3>& p) const;

    /**
     * @brief Sample all channels of sample n at normalized position p
     *
     * @param out receives channels() values
     */
    void sample(int n, const std::array<double, 3>& p, SamplingMode mode,
                double* out) const;

private:
    void sampleTrilinear(int n, const std::array<double, 3>& g, double* out) const;
    void sampleNearest(int n, const std::array<double, 3>& g, double* out) const;

    ML::Tensor data_;
};

/**
 * @brief Builds per-vertex features from a selection of feature maps
 */
class FeatureAggregator {
public:
    explicit FeatureAggregator(SamplingMode mode = SamplingMode::TRILINEAR);

    SamplingMode mode() const { return mode_; }

    /**
     * @brief Sample the selected maps at every vertex
     *
     * @param maps    all available feature maps
     * @param indices which maps feed this step, in concatenation order
     * @param verts   vertex positions [N, M, V, 3]
     * @return        [N, M, V, sum of selected channel counts]
     *
     * @throws ConfigurationError for an index outside the map list
     * @throws ShapeError if a map's batch size differs from N
     */
    ML::Tensor aggregate(const std::vector<FeatureMap>& maps,
                         const std::vector<int>& indices,
                         const ML::Tensor& verts) const;

    /**
     * @brief Width of the aggregated feature vector
     */
    static int outputChannels(const std::vector<int>& channels_per_map,
                              const std::vector<int>& indices);

private:
    SamplingMode mode_;
};

/**
 * @brief Map voxel indices [K, 3] of a volume with the given spatial shape
 *        into the normalized mesh frame
 *
 * Every axis is divided by the largest extent minus one, so anisotropic
 * volumes keep their aspect ratio. For cubic volumes this is the inverse
 * of the sampling map.
 */
ML::Tensor normalizeVoxelCoordinates(const ML::Tensor& voxel_coords,
                                     const std::array<int, 3>& volume_shape);

} // namespace V2M

#endif // V2M_FEATURE_AGGREGATION_HPP
