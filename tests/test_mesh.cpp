#include <gtest/gtest.h>
#include "protocol/mesh.hpp"

namespace {

TEST(Mesh, MergeOffsetsTriangleIndices) {
    protocol::Mesh a = protocol::make_demo_quad();
    protocol::Mesh b;
    b.vertices = {{5.0f, 5.0f, 5.0f}, {6.0f, 5.0f, 5.0f}, {5.0f, 6.0f, 5.0f}};
    b.triangles = {{0, 1, 2}};

    protocol::Mesh merged = protocol::merge({a, b});
    ASSERT_EQ(merged.vertices.size(), 7u);
    ASSERT_EQ(merged.triangles.size(), 3u);
    EXPECT_EQ(merged.triangles[0], (protocol::Triangle{0, 1, 2}));
    EXPECT_EQ(merged.triangles[2], (protocol::Triangle{4, 5, 6}));
    EXPECT_EQ(merged.vertices[4], (protocol::Vertex{5.0f, 5.0f, 5.0f}));
}

TEST(Mesh, MergeOfNothingIsEmpty) {
    protocol::Mesh merged = protocol::merge({});
    EXPECT_TRUE(merged.vertices.empty());
    EXPECT_TRUE(merged.triangles.empty());
}

TEST(Mesh, AnalyzeQuad) {
    auto analysis = protocol::analyze(protocol::make_demo_quad());
    EXPECT_EQ(analysis.vertex_count, 4u);
    EXPECT_EQ(analysis.triangle_count, 2u);
    EXPECT_FLOAT_EQ(analysis.extent[0], 1.0f);
    EXPECT_FLOAT_EQ(analysis.extent[1], 1.0f);
    EXPECT_FLOAT_EQ(analysis.extent[2], 0.0f);
    EXPECT_FLOAT_EQ(analysis.center[0], 0.5f);
    EXPECT_NEAR(analysis.surface_area, 1.0, 1e-9);
}

TEST(Mesh, AnalyzeSkipsOutOfRangeTriangles) {
    protocol::Mesh mesh = protocol::make_demo_quad();
    mesh.triangles.push_back({0, 1, 42});
    auto analysis = protocol::analyze(mesh);
    EXPECT_EQ(analysis.triangle_count, 3u);
    EXPECT_NEAR(analysis.surface_area, 1.0, 1e-9);
}

TEST(Mesh, AnalyzeEmpty) {
    auto analysis = protocol::analyze(protocol::Mesh{});
    EXPECT_EQ(analysis.vertex_count, 0u);
    EXPECT_EQ(analysis.surface_area, 0.0);
}

TEST(Mesh, DescribeMentionsCountsAndSize) {
    auto text = protocol::describe(protocol::analyze(protocol::make_demo_quad()), "quad");
    EXPECT_EQ(text, "quad: 4 vertices, 2 triangles, 1.00 x 1.00 x 0.00 units, area 1.00");
}

} // namespace
