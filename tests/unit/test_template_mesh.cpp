/**
 * @file test_template_mesh.cpp
 * @brief Unit tests for template construction, OBJ loading and replication
 */

#include <gtest/gtest.h>
#include "TemplateMesh.hpp"
#include <cmath>
#include <cstdio>

using namespace V2M;
using namespace V2M::ML;

class TemplateMeshTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_obj_file = "test_template_mesh.obj";

        tetra.name = "tetra";
        tetra.vertices = {{1.0, 1.0, 1.0}, {1.0, -1.0, -1.0},
                          {-1.0, 1.0, -1.0}, {-1.0, -1.0, 1.0}};
        tetra.faces = {{0, 1, 2}, {0, 3, 1}, {0, 2, 3}, {1, 3, 2}};
    }

    void TearDown() override {
        std::remove(test_obj_file.c_str());
    }

    static double radius(const std::array<double, 3>& p, const std::array<double, 3>& c) {
        return std::sqrt((p[0] - c[0]) * (p[0] - c[0]) + (p[1] - c[1]) * (p[1] - c[1]) +
                         (p[2] - c[2]) * (p[2] - c[2]));
    }

    std::string test_obj_file;
    SurfaceMesh tetra;
};

TEST_F(TemplateMeshTest, IcosahedronAndFirstSubdivision) {
    SurfaceMesh ico = TemplateMesh::unitIcosphere(0);
    EXPECT_EQ(ico.numVertices(), 12);
    EXPECT_EQ(ico.numFaces(), 20);

    SurfaceMesh level1 = TemplateMesh::unitIcosphere(1);
    EXPECT_EQ(level1.numVertices(), 42);
    EXPECT_EQ(level1.numFaces(), 80);
    for (const auto& p : level1.vertices) {
        EXPECT_NEAR(radius(p, {0.0, 0.0, 0.0}), 1.0, 1e-12);
    }

    EXPECT_THROW(TemplateMesh::unitIcosphere(-1), ConfigurationError);
}

TEST_F(TemplateMeshTest, IcospherePerStructure) {
    std::vector<std::array<double, 3>> centers = {{-0.5, 0.0, 0.0}, {0.5, 0.1, 0.0}};
    TemplateMesh tmpl = TemplateMesh::icosphere(1, centers, {0.2, 0.3});

    EXPECT_EQ(tmpl.numStructures(), 2);
    EXPECT_EQ(tmpl.numVertices(), 42);
    EXPECT_EQ(tmpl.maxFaces(), 80);
    EXPECT_EQ(tmpl.structure(1).name, "structure_1");
    for (const auto& p : tmpl.structure(1).vertices) {
        EXPECT_NEAR(radius(p, centers[1]), 0.3, 1e-12);
    }

    EXPECT_THROW(TemplateMesh::icosphere(1, centers, {0.2}), ConfigurationError);
    EXPECT_THROW(tmpl.structure(2), std::out_of_range);
}

TEST_F(TemplateMeshTest, FromConfigDefaultsToIcospheres) {
    TemplateConfig config;
    config.icosphere_level = 0;
    TemplateMesh tmpl = TemplateMesh::fromConfig(config);
    EXPECT_EQ(tmpl.numStructures(), 1);
    EXPECT_EQ(tmpl.numVertices(), 12);
}

TEST_F(TemplateMeshTest, ObjRoundTripWithTwoStructures) {
    SurfaceMesh shifted = tetra;
    shifted.name = "shifted";
    for (auto& p : shifted.vertices) p[0] += 3.0;
    ASSERT_TRUE(MeshIO::writeObj(test_obj_file, std::vector<SurfaceMesh>{tetra, shifted}));

    TemplateMesh raw = TemplateMesh::fromObj(test_obj_file, false);
    ASSERT_EQ(raw.numStructures(), 2);
    EXPECT_EQ(raw.structure(0).name, "tetra");
    EXPECT_EQ(raw.structure(1).name, "shifted");
    EXPECT_EQ(raw.structure(1).faces, tetra.faces);
    EXPECT_NEAR(raw.structure(1).vertices[2][0], 2.0, 1e-9);

    TemplateConfig config;
    config.path = test_obj_file;
    TemplateMesh normalized = TemplateMesh::fromConfig(config);
    for (const auto& s : normalized.structures()) {
        for (const auto& p : s.vertices) {
            EXPECT_NEAR(radius(p, {0.0, 0.0, 0.0}), 1.0, 1e-9);
        }
    }

    EXPECT_THROW(TemplateMesh::fromObj("does_not_exist.obj"), std::runtime_error);
}

TEST_F(TemplateMeshTest, RejectsInconsistentStructures) {
    EXPECT_THROW(TemplateMesh(std::vector<SurfaceMesh>{}), ShapeError);

    SurfaceMesh fewer = tetra;
    fewer.vertices.pop_back();
    fewer.faces = {{0, 1, 2}};
    EXPECT_THROW(TemplateMesh(std::vector<SurfaceMesh>{tetra, fewer}), ShapeError);

    SurfaceMesh out_of_range = tetra;
    out_of_range.faces[0][1] = 4;
    EXPECT_THROW(TemplateMesh(std::vector<SurfaceMesh>{out_of_range}), ShapeError);

    SurfaceMesh no_faces = tetra;
    no_faces.faces.clear();
    EXPECT_THROW(TemplateMesh(std::vector<SurfaceMesh>{no_faces}), ShapeError);

    // Three faces on edge (0, 1)
    SurfaceMesh fin = tetra;
    fin.vertices.push_back({0.0, 0.0, 2.0});
    fin.faces = {{0, 1, 2}, {0, 1, 3}, {0, 1, 4}};
    EXPECT_THROW(TemplateMesh(std::vector<SurfaceMesh>{fin}), GeometryError);
}

TEST_F(TemplateMeshTest, ReplicatePadsFaces) {
    SurfaceMesh open = tetra;
    open.name = "open";
    open.faces = {{0, 1, 2}, {0, 2, 3}};
    TemplateMesh tmpl(std::vector<SurfaceMesh>{tetra, open});

    MeshBatch batch = tmpl.replicate(3);
    EXPECT_EQ(batch.batchSize(), 3);
    EXPECT_EQ(batch.numStructures(), 2);
    EXPECT_EQ(batch.numVertices(), 4);
    EXPECT_EQ(batch.maxFaces(), 4);
    EXPECT_EQ(batch.featureDim(), 0);
    EXPECT_EQ(batch.numFacesPerUnit(), (std::vector<int>{4, 2, 4, 2, 4, 2}));
    EXPECT_DOUBLE_EQ(batch.vertsPadded()(2, 1, 3, 2), tetra.vertices[3][2]);
    EXPECT_EQ(batch.facesPadded()(1, 1, 3, 0), PAD_INDEX);

    EXPECT_THROW(tmpl.replicate(0), ShapeError);
}
