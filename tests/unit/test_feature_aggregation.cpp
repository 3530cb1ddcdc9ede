/**
 * @file test_feature_aggregation.cpp
 * @brief Unit tests for sampling feature maps at vertex positions
 */

#include <gtest/gtest.h>
#include "FeatureAggregation.hpp"

using namespace V2M;
using namespace V2M::ML;

class FeatureAggregationTest : public ::testing::Test {
protected:
    // 3x3x3 volume whose channel 0 is the linear field x + 10 y + 100 z and
    // channel 1 its negation. Trilinear sampling reproduces it exactly.
    void SetUp() override {
        Tensor data({1, 2, R, R, R});
        for (int x = 0; x < R; ++x) {
            for (int y = 0; y < R; ++y) {
                for (int z = 0; z < R; ++z) {
                    data(0, 0, x, y, z) = field(x, y, z);
                    data(0, 1, x, y, z) = -field(x, y, z);
                }
            }
        }
        linear_map = std::make_unique<FeatureMap>(data);

        // Single voxel along x and z, two voxels along y
        Tensor thin({1, 1, 1, 2, 1}, std::vector<double>{3.0, 7.0});
        thin_map = std::make_unique<FeatureMap>(thin);
    }

    static double field(double x, double y, double z) { return x + 10.0 * y + 100.0 * z; }

    static double normalized(int i, int resolution) {
        return 2.0 * i / (resolution - 1) - 1.0;
    }

    const int R = 3;
    std::unique_ptr<FeatureMap> linear_map;
    std::unique_ptr<FeatureMap> thin_map;
};

TEST_F(FeatureAggregationTest, VoxelCentersAreExact) {
    double out[2];
    for (int x = 0; x < R; ++x) {
        for (int y = 0; y < R; ++y) {
            for (int z = 0; z < R; ++z) {
                std::array<double, 3> p = {normalized(x, R), normalized(y, R), normalized(z, R)};
                linear_map->sample(0, p, SamplingMode::TRILINEAR, out);
                EXPECT_DOUBLE_EQ(out[0], field(x, y, z));
                EXPECT_DOUBLE_EQ(out[1], -field(x, y, z));
            }
        }
    }
}

TEST_F(FeatureAggregationTest, TrilinearInterpolatesBetweenVoxels) {
    // p = (0.3, -0.2, 0.7) maps to grid (1.3, 0.8, 1.7)
    double out[2];
    linear_map->sample(0, {0.3, -0.2, 0.7}, SamplingMode::TRILINEAR, out);
    EXPECT_NEAR(out[0], field(1.3, 0.8, 1.7), 1e-10);
    EXPECT_NEAR(out[1], -field(1.3, 0.8, 1.7), 1e-10);
}

TEST_F(FeatureAggregationTest, OutsideGridIsClamped) {
    auto g = linear_map->gridCoordinate({5.0, -5.0, 1.0});
    EXPECT_DOUBLE_EQ(g[0], 2.0);
    EXPECT_DOUBLE_EQ(g[1], 0.0);
    EXPECT_DOUBLE_EQ(g[2], 2.0);

    double out[2];
    linear_map->sample(0, {5.0, -5.0, 1.0}, SamplingMode::TRILINEAR, out);
    EXPECT_DOUBLE_EQ(out[0], field(2, 0, 2));
}

TEST_F(FeatureAggregationTest, NearestPicksClosestVoxel) {
    double out[2];
    linear_map->sample(0, {0.3, -0.2, 0.7}, SamplingMode::NEAREST, out);
    EXPECT_DOUBLE_EQ(out[0], field(1, 1, 2));
}

TEST_F(FeatureAggregationTest, SingleVoxelAxes) {
    double out[1];
    thin_map->sample(0, {0.9, 0.0, -0.4}, SamplingMode::TRILINEAR, out);
    EXPECT_DOUBLE_EQ(out[0], 5.0);

    thin_map->sample(0, {-0.7, 1.0, 0.2}, SamplingMode::NEAREST, out);
    EXPECT_DOUBLE_EQ(out[0], 7.0);
}

TEST_F(FeatureAggregationTest, ConcatenatesInIndexOrder) {
    std::vector<FeatureMap> maps = {*linear_map, *thin_map};
    Tensor verts({1, 2, 1, 3}, 0.0);
    verts(0, 1, 0, 1) = 1.0;

    FeatureAggregator aggregator;
    Tensor out = aggregator.aggregate(maps, {1, 0}, verts);
    ASSERT_EQ(out.shape, (std::vector<int>{1, 2, 1, 3}));

    // Structure 0 sits at the origin, structure 1 at y = 1
    EXPECT_DOUBLE_EQ(out(0, 0, 0, 0), 5.0);
    EXPECT_DOUBLE_EQ(out(0, 0, 0, 1), field(1, 1, 1));
    EXPECT_DOUBLE_EQ(out(0, 0, 0, 2), -field(1, 1, 1));
    EXPECT_DOUBLE_EQ(out(0, 1, 0, 0), 7.0);
    EXPECT_DOUBLE_EQ(out(0, 1, 0, 1), field(1, 2, 1));

    EXPECT_EQ(FeatureAggregator::outputChannels({2, 1, 4}, {0, 2, 2}), 10);
}

TEST_F(FeatureAggregationTest, NoSelectedMapsGiveEmptyFeatures) {
    std::vector<FeatureMap> maps = {*linear_map};
    Tensor verts({1, 1, 4, 3}, 0.0);
    Tensor out = FeatureAggregator().aggregate(maps, {}, verts);
    EXPECT_EQ(out.shape, (std::vector<int>{1, 1, 4, 0}));
    EXPECT_TRUE(out.data.empty());

    // Vertices far outside the grid still produce nothing to write
    Tensor wide({2, 3, 5, 3}, 7.0);
    std::vector<FeatureMap> two = {FeatureMap(Tensor({2, 1, 2, 2, 2}, 1.0))};
    out = FeatureAggregator(SamplingMode::NEAREST).aggregate(two, {}, wide);
    EXPECT_EQ(out.shape, (std::vector<int>{2, 3, 5, 0}));
}

TEST_F(FeatureAggregationTest, RejectsInvalidInputs) {
    std::vector<FeatureMap> maps = {*linear_map};
    Tensor verts({1, 1, 2, 3}, 0.0);
    FeatureAggregator aggregator(SamplingMode::NEAREST);

    EXPECT_THROW(aggregator.aggregate(maps, {1}, verts), ConfigurationError);
    EXPECT_THROW(aggregator.aggregate(maps, {-1}, verts), ConfigurationError);

    Tensor two_samples({2, 1, 2, 3}, 0.0);
    EXPECT_THROW(aggregator.aggregate(maps, {0}, two_samples), ShapeError);

    Tensor flat({2, 3}, 0.0);
    EXPECT_THROW(aggregator.aggregate(maps, {0}, flat), ShapeError);

    EXPECT_THROW(FeatureMap(Tensor({1, 2, 3, 3})), ShapeError);
    EXPECT_THROW(FeatureMap(Tensor({1, 2, 3, 0, 3})), ShapeError);
}

TEST_F(FeatureAggregationTest, NormalizedVoxelCoordinatesSampleTheirVoxel) {
    Tensor voxels({2, 3}, std::vector<double>{2.0, 0.0, 1.0,
                                              1.0, 2.0, 0.0});
    Tensor p = normalizeVoxelCoordinates(voxels, {R, R, R});
    EXPECT_DOUBLE_EQ(p(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(p(0, 1), -1.0);
    EXPECT_DOUBLE_EQ(p(0, 2), 0.0);

    double out[2];
    for (int k = 0; k < 2; ++k) {
        linear_map->sample(0, {p(k, 0), p(k, 1), p(k, 2)}, SamplingMode::TRILINEAR, out);
        EXPECT_DOUBLE_EQ(out[0], field(voxels(k, 0), voxels(k, 1), voxels(k, 2)));
    }

}

TEST_F(FeatureAggregationTest, AnisotropicVolumesUseLargestExtent) {
    Tensor voxels({2, 3}, std::vector<double>{2.0, 0.0, 1.0,
                                              0.0, 0.0, 4.0});
    Tensor q = normalizeVoxelCoordinates(voxels, {3, 1, 5});
    EXPECT_DOUBLE_EQ(q(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(q(0, 1), -1.0);
    EXPECT_DOUBLE_EQ(q(0, 2), -0.5);
    EXPECT_DOUBLE_EQ(q(1, 0), -1.0);
    EXPECT_DOUBLE_EQ(q(1, 2), 1.0);

    EXPECT_THROW(normalizeVoxelCoordinates(voxels, {1, 1, 1}), ShapeError);
    EXPECT_THROW(normalizeVoxelCoordinates(voxels, {3, 0, 5}), ShapeError);
    EXPECT_THROW(normalizeVoxelCoordinates(Tensor({2, 2}, 0.0), {3, 3, 3}), ShapeError);
}
