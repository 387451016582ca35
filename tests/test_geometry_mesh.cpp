#include <gtest/gtest.h>

#include "mesh.hpp"
#include "stl_test_utils.hpp"

using namespace meshstream;
using meshstream_test::make_triangle;

TEST(BoundingBox, StartsEmpty) {
    BoundingBox box;
    EXPECT_TRUE(box.empty());
    EXPECT_TRUE(box.center().isZero());
    EXPECT_TRUE(box.size().isZero());
}

TEST(BoundingBox, ExtendTracksComponentwiseExtremes) {
    BoundingBox box;
    box.extend(Vector3(1, -2, 3));
    EXPECT_FALSE(box.empty());
    EXPECT_EQ(box.min, box.max);

    box.extend(Vector3(-1, 4, 0));
    EXPECT_EQ(box.min, Vector3(-1, -2, 0));
    EXPECT_EQ(box.max, Vector3(1, 4, 3));
    EXPECT_EQ(box.size(), Vector3(2, 6, 3));
    EXPECT_EQ(box.center(), Vector3(0, 1, 1.5f));
    EXPECT_TRUE(box.contains(Vector3(0, 0, 0)));
    EXPECT_FALSE(box.contains(Vector3(0, 5, 0)));
}

TEST(Triangle, AreaAndGeometricNormal) {
    Triangle tri = make_triangle(Vector3::Zero(), Vector3(0, 0, 0), Vector3(2, 0, 0), Vector3(0, 2, 0));
    EXPECT_DOUBLE_EQ(tri.area(), 2.0);
    EXPECT_EQ(tri.geometric_normal(), Eigen::Vector3d(0, 0, 4));
}

TEST(MeshBuilder, FoldsTrianglesBoundsAndWarnings) {
    MeshBuilder builder("stl-ascii", "part.stl", 123, 100);
    builder.add(make_triangle(Vector3(0, 0, 1), Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(0, 1, 0)), {});
    builder.add(make_triangle(Vector3(0, 0, 1), Vector3(-1, 5, 2), Vector3(3, 0, 2), Vector3(0, 1, 2)),
                {Warning{1, WarningKind::NormalRecomputed}});
    EXPECT_EQ(builder.triangle_count(), 2u);

    Mesh mesh = builder.finish();
    EXPECT_EQ(mesh.triangle_count(), 2u);
    EXPECT_EQ(mesh.triangle_count(), mesh.triangles().size());
    EXPECT_EQ(mesh.vertex_count(), 6u);
    EXPECT_EQ(mesh.format(), "stl-ascii");
    EXPECT_EQ(mesh.name(), "part.stl");
    EXPECT_EQ(mesh.source_size(), 123u);
    EXPECT_EQ(mesh.bounds().min, Vector3(-1, 0, 0));
    EXPECT_EQ(mesh.bounds().max, Vector3(3, 5, 2));
    EXPECT_FLOAT_EQ(mesh.max_dimension(), 5.0f);

    ASSERT_EQ(mesh.warnings().size(), 1u);
    EXPECT_EQ(mesh.warnings()[0].triangle_index, 1u);
    EXPECT_EQ(mesh.warnings()[0].kind, WarningKind::NormalRecomputed);

    MeshSummary summary = mesh.summary();
    EXPECT_EQ(summary.triangle_count, 2u);
    EXPECT_TRUE(summary.has_warnings);
    EXPECT_EQ(summary.warning_count, 1u);
    EXPECT_EQ(summary.bounds.max, mesh.bounds().max);
}

TEST(MeshBuilder, PreservesInsertionOrder) {
    MeshBuilder builder("stl-binary", "order.stl", 0, 100);
    for (int i = 0; i < 5; ++i) {
        float x = static_cast<float>(i);
        builder.add(make_triangle(Vector3(0, 0, 1), Vector3(x, 0, 0), Vector3(x + 1, 0, 0), Vector3(x, 1, 0)), {});
    }
    Mesh mesh = builder.finish();
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(mesh.triangles()[i].vertices[0].x(), static_cast<float>(i));
    }
}

TEST(MeshBuilder, EnforcesTriangleLimit) {
    MeshBuilder builder("stl-ascii", "big.stl", 0, 1);
    Triangle tri = make_triangle(Vector3(0, 0, 1), Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(0, 1, 0));
    builder.add(tri, {});
    ParseError error = meshstream_test::capture_parse_error([&] { builder.add(tri, {}); });
    EXPECT_EQ(error.kind(), ErrorKind::ResourceLimitExceeded);
    EXPECT_EQ(builder.triangle_count(), 1u);
}

TEST(MeshBuilder, CannotBeReusedAfterFinish) {
    MeshBuilder builder("stl-ascii", "a.stl", 0, 10);
    Mesh mesh = builder.finish();
    EXPECT_EQ(mesh.triangle_count(), 0u);
    EXPECT_TRUE(mesh.bounds().empty());
    EXPECT_THROW(builder.finish(), std::logic_error);
    EXPECT_THROW(builder.add(Triangle(), {}), std::logic_error);
}

TEST(Mesh, ExportsMatrices) {
    MeshBuilder builder("stl-ascii", "m.stl", 0, 10);
    builder.add(make_triangle(Vector3(0, 0, 1), Vector3(0, 0, 0), Vector3(1, 0, 0), Vector3(0, 1, 0)), {});
    builder.add(make_triangle(Vector3(1, 0, 0), Vector3(0, 0, 0), Vector3(0, 1, 0), Vector3(0, 0, 1)), {});
    MeshData data = builder.finish().to_mesh_data();

    ASSERT_EQ(data.vertices.rows(), 6);
    ASSERT_EQ(data.vertices.cols(), 3);
    ASSERT_EQ(data.faces.rows(), 2);
    ASSERT_EQ(data.normals.rows(), 2);

    EXPECT_EQ(data.faces(1, 0), 3);
    EXPECT_EQ(data.faces(1, 2), 5);
    EXPECT_FLOAT_EQ(data.vertices(1, 0), 1.0f);
    EXPECT_FLOAT_EQ(data.vertices(5, 2), 1.0f);
    EXPECT_FLOAT_EQ(data.normals(1, 0), 1.0f);
}

TEST(ParseError, FormatsKindLocationAndDetail) {
    ParseError by_line(ErrorKind::MalformedStructure, Location::line(7), "expected 'endloop'");
    EXPECT_STREQ(by_line.what(), "MalformedStructure at line 7: expected 'endloop'");

    ParseError mismatch = ParseError::count_mismatch(5, 3, 234, "short");
    EXPECT_EQ(mismatch.kind(), ErrorKind::TriangleCountMismatch);
    EXPECT_EQ(mismatch.declared(), 5u);
    EXPECT_EQ(mismatch.actual(), 3u);
    EXPECT_EQ(mismatch.location().kind, Location::Kind::Offset);
    EXPECT_STREQ(mismatch.what(), "TriangleCountMismatch at offset 234: short");

    ParseError plain(ErrorKind::UnsupportedFormat, Location::none(), "");
    EXPECT_STREQ(plain.what(), "UnsupportedFormat");
}
