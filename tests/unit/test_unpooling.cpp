/**
 * @file test_unpooling.cpp
 * @brief Unit tests for uniform midpoint subdivision
 */

#include <gtest/gtest.h>
#include "Unpooling.hpp"
#include "MeshGraph.hpp"
#include <set>

using namespace V2M;
using namespace V2M::ML;

class UnpoolingTest : public ::testing::Test {
protected:
    void SetUp() override {
        tetra_faces = {{0, 1, 2}, {0, 3, 1}, {0, 2, 3}, {1, 3, 2}};
        tetra_verts = {{1.0, 1.0, 1.0}, {1.0, -1.0, -1.0},
                       {-1.0, 1.0, -1.0}, {-1.0, -1.0, 1.0}};
    }

    // Tetrahedron replicated over N samples and M structures, with a
    // per-sample shift and latent features equal to the vertex index
    MeshBatch tetraBatch(int N, int M) {
        Tensor verts({N, M, 4, 3});
        Tensor feats({N, M, 4, 2});
        IndexTensor faces({N, M, 4, 3});
        for (int n = 0; n < N; ++n) {
            for (int m = 0; m < M; ++m) {
                for (int v = 0; v < 4; ++v) {
                    for (int d = 0; d < 3; ++d) verts(n, m, v, d) = tetra_verts[v][d] + n;
                    feats(n, m, v, 0) = v;
                    feats(n, m, v, 1) = 10.0 * m;
                }
                for (int f = 0; f < 4; ++f) {
                    for (int d = 0; d < 3; ++d) faces(n, m, f, d) = tetra_faces[f][d];
                }
            }
        }
        return MeshBatch(verts, faces, feats);
    }

    std::vector<std::array<int, 3>> tetra_faces;
    std::vector<std::array<double, 3>> tetra_verts;
};

TEST_F(UnpoolingTest, UniqueEdgesInFirstOccurrenceOrder) {
    auto edges = Unpooling::uniqueEdges(tetra_faces);
    ASSERT_EQ(edges.size(), 6u);
    EXPECT_EQ(edges[0], (std::array<int, 2>{0, 1}));
    EXPECT_EQ(edges[1], (std::array<int, 2>{1, 2}));
    EXPECT_EQ(edges[2], (std::array<int, 2>{0, 2}));
    EXPECT_EQ(edges[3], (std::array<int, 2>{0, 3}));
    EXPECT_EQ(edges[4], (std::array<int, 2>{1, 3}));
    EXPECT_EQ(edges[5], (std::array<int, 2>{2, 3}));
}

TEST_F(UnpoolingTest, TetrahedronCounts) {
    MeshBatch mesh = tetraBatch(1, 1);
    MeshBatch refined = Unpooling::uniformUnpool(mesh);

    // V' = V + E = 4 + 6, F' = 4F
    EXPECT_EQ(refined.numVertices(), 10);
    EXPECT_EQ(refined.maxFaces(), 16);
    EXPECT_EQ(refined.numFacesPerUnit(), (std::vector<int>{16}));

    // Closed surface stays closed: V - E + F = 2
    MeshGraph graph = MeshGraph::fromMeshBatch(refined);
    int unique_edges = graph.numEdges() / 2;
    EXPECT_EQ(refined.numVertices() - unique_edges + 16, 2);
}

TEST_F(UnpoolingTest, MidpointsAndChildFaces) {
    MeshBatch refined = Unpooling::uniformUnpool(tetraBatch(1, 1));
    const Tensor& v = refined.vertsPadded();
    const Tensor& f = refined.featuresPadded();

    // Vertex 4 is the midpoint of the first edge (0, 1)
    for (int d = 0; d < 3; ++d) {
        EXPECT_DOUBLE_EQ(v(0, 0, 4, d), 0.5 * (tetra_verts[0][d] + tetra_verts[1][d]));
    }
    EXPECT_DOUBLE_EQ(f(0, 0, 4, 0), 0.5);
    // Vertex 9 is the midpoint of (2, 3)
    EXPECT_DOUBLE_EQ(f(0, 0, 9, 0), 2.5);

    // Face (0,1,2) -> (0,m01,m20), (1,m12,m01), (2,m20,m12), (m01,m12,m20)
    // with m01 = 4, m12 = 5, m20 = 6
    const IndexTensor& faces = refined.facesPadded();
    const int expected[4][3] = {{0, 4, 6}, {1, 5, 4}, {2, 6, 5}, {4, 5, 6}};
    for (int k = 0; k < 4; ++k) {
        for (int d = 0; d < 3; ++d) {
            EXPECT_EQ(faces(0, 0, k, d), expected[k][d]);
        }
    }

    // Original vertices keep their index and position
    for (int d = 0; d < 3; ++d) {
        EXPECT_DOUBLE_EQ(v(0, 0, 3, d), tetra_verts[3][d]);
    }
}

TEST_F(UnpoolingTest, BatchMembersStayAligned) {
    MeshBatch refined = Unpooling::uniformUnpool(tetraBatch(3, 2));
    EXPECT_EQ(refined.batchSize(), 3);
    EXPECT_EQ(refined.numStructures(), 2);
    const IndexTensor& faces = refined.facesPadded();
    for (int n = 0; n < 3; ++n) {
        for (int m = 0; m < 2; ++m) {
            for (int f = 0; f < 16; ++f) {
                for (int d = 0; d < 3; ++d) {
                    EXPECT_EQ(faces(n, m, f, d), faces(0, 0, f, d));
                }
            }
        }
    }
    // Features of structure 1 are constant, so are their midpoints
    EXPECT_DOUBLE_EQ(refined.featuresPadded()(2, 1, 7, 1), 10.0);
    // Sample shift carries over to the midpoints
    EXPECT_DOUBLE_EQ(refined.vertsPadded()(2, 0, 4, 0), 0.5 * (1.0 + 1.0) + 2.0);
}

TEST_F(UnpoolingTest, PaddingRowsStayPadding) {
    Tensor verts({1, 2, 4, 3}, 0.0);
    for (int m = 0; m < 2; ++m) {
        for (int v = 0; v < 4; ++v) {
            for (int d = 0; d < 3; ++d) verts(0, m, v, d) = tetra_verts[v][d];
        }
    }
    // Both structures start as a strip of two triangles sharing edge (0, 2)
    IndexTensor faces({1, 2, 2, 3}, PAD_INDEX);
    const int strip[2][3] = {{0, 1, 2}, {0, 2, 3}};
    for (int m = 0; m < 2; ++m) {
        for (int f = 0; f < 2; ++f) {
            for (int d = 0; d < 3; ++d) faces(0, m, f, d) = strip[f][d];
        }
    }
    // Drop the second triangle of structure 0 for a single row of padding
    for (int d = 0; d < 3; ++d) faces(0, 0, 1, d) = PAD_INDEX;

    // Structure 0 now has 3 edges and structure 1 has 5: vertex counts differ
    EXPECT_THROW(Unpooling::uniformUnpool(MeshBatch(verts, faces)), ShapeError);

    // Same topology in both structures keeps padding aligned
    for (int d = 0; d < 3; ++d) faces(0, 1, 1, d) = PAD_INDEX;
    MeshBatch refined = Unpooling::uniformUnpool(MeshBatch(verts, faces));
    EXPECT_EQ(refined.numVertices(), 7);
    EXPECT_EQ(refined.maxFaces(), 8);
    for (int row = 4; row < 8; ++row) {
        EXPECT_EQ(refined.facesPadded()(0, 0, row, 0), PAD_INDEX);
        EXPECT_EQ(refined.facesPadded()(0, 1, row, 2), PAD_INDEX);
    }
    EXPECT_EQ(refined.numFacesPerUnit(), (std::vector<int>{4, 4}));
}

TEST_F(UnpoolingTest, RejectsNonManifoldAndDegenerateFaces) {
    std::vector<std::array<int, 3>> fin = {{0, 1, 2}, {0, 1, 3}, {0, 1, 4}};
    EXPECT_THROW(Unpooling::uniqueEdges(fin), GeometryError);

    std::vector<std::array<int, 3>> degenerate = {{0, 1, 1}};
    EXPECT_THROW(Unpooling::uniqueEdges(degenerate), GeometryError);
}

TEST_F(UnpoolingTest, RejectsEdgeLikeFaces) {
    IndexTensor segments({1, 1, 2, 2}, std::vector<int>{0, 1, 1, 2});
    Tensor line({1, 1, 3, 3}, 0.0);
    EXPECT_THROW(Unpooling::uniformUnpool(MeshBatch(line, segments)), ShapeError);
}

TEST_F(UnpoolingTest, SubdivideSurface) {
    SurfaceMesh tet;
    tet.vertices = tetra_verts;
    tet.faces = tetra_faces;
    SurfaceMesh refined = Unpooling::subdivide(tet);
    EXPECT_EQ(refined.numVertices(), 10);
    EXPECT_EQ(refined.numFaces(), 16);
}
