/**
 * @file test_graph_conv.cpp
 * @brief Unit tests for mesh graphs and graph convolution variants
 */

#include <gtest/gtest.h>
#include "GraphConv.hpp"
#include "MeshBatch.hpp"
#include <random>

using namespace V2M;
using namespace V2M::ML;

class GraphConvTest : public ::testing::Test {
protected:
    // Path 0 - 1 - 2, given with a duplicate and a self-loop
    void SetUp() override {
        IndexTensor pairs({4, 2}, std::vector<int>{0, 1, 1, 0, 1, 2, 2, 2});
        path.fromUndirected(3, pairs);
    }

    static void setAll(GraphConvLayer& layer, double value) {
        for (Tensor* p : layer.parameters()) p->fill(value);
    }

    MeshGraph path;
    std::mt19937 gen{42};
};

TEST_F(GraphConvTest, UndirectedGraphIsDeduplicated) {
    EXPECT_EQ(path.numNodes(), 3);
    EXPECT_EQ(path.numEdges(), 4);
    EXPECT_EQ(path.degree(0), 1);
    EXPECT_EQ(path.degree(1), 2);
    EXPECT_EQ(path.degree(2), 1);
    EXPECT_EQ(path.neighbors()[1], (std::vector<int>{0, 2}));

    MeshGraph bad;
    EXPECT_THROW(bad.fromEdges(2, std::vector<Edge>{Edge{0, 2}}), ShapeError);
}

TEST_F(GraphConvTest, MeshGraphStaysWithinUnits) {
    Tensor verts({2, 1, 3, 3}, 0.0);
    IndexTensor faces({2, 1, 1, 3}, std::vector<int>{0, 1, 2, 0, 1, 2});
    MeshGraph graph = MeshGraph::fromMeshBatch(MeshBatch(verts, faces));

    EXPECT_EQ(graph.numNodes(), 6);
    EXPECT_EQ(graph.numEdges(), 12);
    for (const auto& e : graph.edges()) {
        EXPECT_EQ(e.src / 3, e.dst / 3);
    }
}

TEST_F(GraphConvTest, SumAndMeanAggregation) {
    Tensor x({3, 1}, std::vector<double>{1.0, 2.0, 4.0});

    GraphConv basic(1, 1, GraphConvType::BASIC, gen);
    GraphConv norm(1, 1, GraphConvType::NORM, gen);
    for (GraphConv* conv : {&basic, &norm}) {
        // self weight, self bias, neighbor weight
        auto params = conv->parameters();
        ASSERT_EQ(params.size(), 3u);
        params[0]->fill(2.0);
        params[1]->fill(1.0);
        params[2]->fill(3.0);
    }

    Tensor y = basic.forward(x, path);
    EXPECT_DOUBLE_EQ(y(0, 0), 2.0 * 1.0 + 1.0 + 3.0 * 2.0);
    EXPECT_DOUBLE_EQ(y(1, 0), 2.0 * 2.0 + 1.0 + 3.0 * 5.0);
    EXPECT_DOUBLE_EQ(y(2, 0), 2.0 * 4.0 + 1.0 + 3.0 * 2.0);

    y = norm.forward(x, path);
    EXPECT_DOUBLE_EQ(y(0, 0), 9.0);
    EXPECT_DOUBLE_EQ(y(1, 0), 2.0 * 2.0 + 1.0 + 3.0 * 2.5);
    EXPECT_DOUBLE_EQ(y(2, 0), 15.0);

    EXPECT_EQ(basic.name(), "GraphConv");
    EXPECT_EQ(norm.name(), "GraphConvNorm");
    EXPECT_EQ(basic.numParameters(), 3u);
}

TEST_F(GraphConvTest, EdgeWeightsFollowInverseDistance) {
    // Positions on the x axis: 0, 1, 3
    Tensor x({3, 3}, std::vector<double>{0.0, 0.0, 0.0,
                                         1.0, 0.0, 0.0,
                                         3.0, 0.0, 0.0});
    EdgeWeightedGraphConv conv(3, 2, gen);
    std::vector<double> w = conv.edgeWeights(x, path);

    // Edge order (0,1), (1,0), (1,2), (2,1)
    ASSERT_EQ(w.size(), 4u);
    EXPECT_NEAR(w[0], 1.0, 1e-12);
    EXPECT_NEAR(w[1], 2.0 / 3.0, 1e-6);
    EXPECT_NEAR(w[2], 1.0 / 3.0, 1e-6);
    EXPECT_NEAR(w[1] + w[2], 1.0, 1e-12);

    Tensor y = conv.forward(x, path);
    EXPECT_EQ(y.shape, (std::vector<int>{3, 2}));

    EXPECT_THROW(EdgeWeightedGraphConv(2, 4, gen), ConfigurationError);
    EXPECT_EQ(makeGraphConv(5, 4, true, GraphConvType::NORM, gen)->name(),
              "EdgeWeightedGraphConv");
    EXPECT_EQ(makeGraphConv(5, 4, false, GraphConvType::BASIC, gen)->name(), "GraphConv");
}

TEST_F(GraphConvTest, InputShapeIsChecked) {
    GraphConv conv(4, 2, GraphConvType::NORM, gen);
    EXPECT_THROW(conv.forward(Tensor({3, 5}, 0.0), path), ShapeError);
    EXPECT_THROW(conv.forward(Tensor({4, 4}, 0.0), path), ShapeError);
}

TEST_F(GraphConvTest, ResidualBlockWithProjection) {
    ResidualGraphBlock block(4, 6, 2, false, GraphConvType::NORM, NormType::BATCH, gen);
    EXPECT_EQ(block.inFeatures(), 4);
    EXPECT_EQ(block.outFeatures(), 6);
    // 4->6 conv, two 6->6 convs, three norms of 4 x 6 and a 4->6 projection
    EXPECT_EQ(block.numParameters(), 54u + 2u * 78u + 72u + 24u);

    Tensor x({3, 4}, 0.0);
    x.randn(gen);
    Tensor y = block.forward(x, path);
    ASSERT_EQ(y.shape, (std::vector<int>{3, 6}));
    EXPECT_GE(y.min(), 0.0);
}

TEST_F(GraphConvTest, ResidualBlockSkipIsIdentity) {
    ResidualGraphBlock block(2, 2, 1, false, GraphConvType::BASIC, NormType::NONE, gen);
    setAll(block, 0.0);

    Tensor x({3, 2}, std::vector<double>{1.0, -1.0, 0.5, 2.0, -3.0, 4.0});
    Tensor y = block.forward(x, path);
    EXPECT_EQ(y.data, Activation::relu(x).data);
}

TEST_F(GraphConvTest, SimpleBlockAndIdentity) {
    SimpleGraphBlock simple(3, 5, true, GraphConvType::NORM, NormType::BATCH, gen);
    Tensor x({3, 3}, std::vector<double>{0.0, 0.0, 0.0,
                                         1.0, 0.0, 0.0,
                                         3.0, 0.0, 0.0});
    Tensor y = simple.forward(x, path);
    ASSERT_EQ(y.shape, (std::vector<int>{3, 5}));
    EXPECT_GE(y.min(), 0.0);

    GraphIdentity identity(3);
    EXPECT_EQ(identity.forward(x, path).data, x.data);
    EXPECT_EQ(identity.numParameters(), 0u);
    EXPECT_THROW(identity.forward(Tensor({3, 4}, 0.0), path), ShapeError);
}

TEST_F(GraphConvTest, BatchNormUsesRunningStatistics) {
    BatchNorm1d bn(1);
    bn.gamma.fill(2.0);
    bn.beta.fill(0.5);
    bn.running_mean.fill(1.0);
    bn.running_var.fill(4.0);

    Tensor y = bn.forward(Tensor({2, 1}, std::vector<double>{5.0, 1.0}));
    EXPECT_NEAR(y(0, 0), 2.0 * 4.0 / 2.0 + 0.5, 1e-5);
    EXPECT_NEAR(y(1, 0), 0.5, 1e-12);
}

TEST_F(GraphConvTest, ZeroWeightsGiveZeroOutput) {
    GraphConv conv(3, 3, GraphConvType::NORM, gen);
    setAll(conv, 0.0);
    Tensor x({3, 3}, 1.5);
    EXPECT_DOUBLE_EQ(conv.forward(x, path).maxAbs(), 0.0);
}
