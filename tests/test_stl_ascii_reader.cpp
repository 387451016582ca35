#include <cmath>
#include <string>
#include <gtest/gtest.h>

#include "stl_ascii_reader.hpp"
#include "stl_test_utils.hpp"

using namespace meshstream;
using meshstream_test::capture_parse_error;
using meshstream_test::kSingleFacetStl;
using meshstream_test::to_bytes;

namespace {

// Drains a stream and returns the triangles it produced
std::vector<Triangle> read_all(AsciiSTLTriangleStream& stream) {
    std::vector<Triangle> triangles;
    Triangle tri;
    while (stream.next(tri)) {
        triangles.push_back(tri);
    }
    return triangles;
}

ParseError read_error(const std::string& text) {
    std::vector<char> data = to_bytes(text);
    AsciiSTLTriangleStream stream(data);
    return capture_parse_error([&] { read_all(stream); });
}

const char* const kTwoFacets =
    "solid pair\n"
    "facet normal 0 0 1\n"
    "outer loop\n"
    "vertex 0 0 0\n"
    "vertex 1 0 0\n"
    "vertex 0 1 0\n"
    "endloop\n"
    "endfacet\n"
    "facet normal 0 0 -1\n"
    "outer loop\n"
    "vertex 0 0 1\n"
    "vertex 0 1 1\n"
    "vertex 1 0 1\n"
    "endloop\n"
    "endfacet\n"
    "endsolid pair\n";

} // namespace

TEST(AsciiSTLTriangleStream, ReadsSingleFacet) {
    std::vector<char> data = to_bytes(kSingleFacetStl);
    AsciiSTLTriangleStream stream(data);

    Triangle tri;
    ASSERT_TRUE(stream.next(tri));
    EXPECT_EQ(stream.solid_name(), "cube");
    EXPECT_EQ(tri.normal, Vector3(0, 0, 1));
    EXPECT_EQ(tri.vertices[0], Vector3(0, 0, 0));
    EXPECT_EQ(tri.vertices[1], Vector3(1, 0, 0));
    EXPECT_EQ(tri.vertices[2], Vector3(0, 1, 0));
    EXPECT_EQ(stream.location().kind, Location::Kind::Line);
    EXPECT_EQ(stream.location().value, 2u);

    EXPECT_FALSE(stream.next(tri));
    EXPECT_FALSE(stream.next(tri));
}

TEST(AsciiSTLTriangleStream, ProducesFacetsLazilyInFileOrder) {
    std::vector<char> data = to_bytes(kTwoFacets);
    AsciiSTLTriangleStream stream(data);

    Triangle tri;
    ASSERT_TRUE(stream.next(tri));
    EXPECT_EQ(tri.normal, Vector3(0, 0, 1));
    EXPECT_EQ(stream.location().value, 2u);

    ASSERT_TRUE(stream.next(tri));
    EXPECT_EQ(tri.normal, Vector3(0, 0, -1));
    EXPECT_EQ(tri.vertices[1], Vector3(0, 1, 1));
    EXPECT_EQ(stream.location().value, 9u);

    EXPECT_FALSE(stream.next(tri));
}

TEST(AsciiSTLTriangleStream, KeywordsAreCaseInsensitiveAndWhitespaceFree) {
    std::vector<char> data = to_bytes(
        "SOLID Mixed Case Name  \r\n"
        "\tFACET Normal 0.0   0.0 1.0 Outer LOOP\n"
        "VERTEX 0 0 0 vertex 1e0 0 0\n\n\n   Vertex 0 +1.0 -0\r\n"
        "EndLoop\tENDFACET EndSolid whatever\r\n");
    AsciiSTLTriangleStream stream(data);

    std::vector<Triangle> triangles = read_all(stream);
    ASSERT_EQ(triangles.size(), 1u);
    EXPECT_EQ(stream.solid_name(), "Mixed Case Name");
    EXPECT_EQ(triangles[0].vertices[1], Vector3(1, 0, 0));
    EXPECT_EQ(triangles[0].vertices[2], Vector3(0, 1, 0));
}

TEST(AsciiSTLTriangleStream, AcceptsEmptySolidName) {
    std::vector<char> data = to_bytes("solid\nendsolid\n");
    AsciiSTLTriangleStream stream(data);
    EXPECT_TRUE(read_all(stream).empty());
    EXPECT_EQ(stream.solid_name(), "");
}

TEST(AsciiSTLTriangleStream, MissingEndSolidCitesLastConsumedLine) {
    std::string text(kSingleFacetStl);
    text = text.substr(0, text.find("endsolid"));

    ParseError error = read_error(text);
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().kind, Location::Kind::Line);
    EXPECT_EQ(error.location().value, 8u);
}

TEST(AsciiSTLTriangleStream, EndOfInputInsideFacet) {
    ParseError error = read_error("solid x\nfacet normal 0 0 1\nouter loop\nvertex 0 0 0\n\n\n");
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().value, 4u);
}

TEST(AsciiSTLTriangleStream, EndOfInputInsideNumberList) {
    ParseError error = read_error("solid x\nfacet normal 0 0");
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().value, 2u);
}

TEST(AsciiSTLTriangleStream, UnexpectedKeywordReportsItsLine) {
    std::string text(kSingleFacetStl);
    text.replace(text.find("outer loop"), 10, "outer lop ");

    ParseError error = read_error(text);
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().value, 3u);
    EXPECT_NE(error.detail().find("'loop'"), std::string::npos);
}

TEST(AsciiSTLTriangleStream, MissingVertexIsMalformed) {
    std::string text(kSingleFacetStl);
    text.erase(text.find("      vertex 0 1 0\n"), 19);

    ParseError error = read_error(text);
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().value, 6u);
}

TEST(AsciiSTLTriangleStream, InvalidNumberIsMalformedAtItsLine) {
    std::string text(kSingleFacetStl);
    text.replace(text.find("vertex 1 0 0"), 12, "vertex 1 abc 0");

    ParseError error = read_error(text);
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().value, 5u);
    EXPECT_NE(error.detail().find("'abc'"), std::string::npos);
}

TEST(AsciiSTLTriangleStream, TrailingGarbageOnNumberIsMalformed) {
    std::string text(kSingleFacetStl);
    text.replace(text.find("normal 0 0 1"), 12, "normal 0 0 1.0x");

    ParseError error = read_error(text);
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().value, 2u);
}

TEST(AsciiSTLTriangleStream, NonFiniteLiteralsAreLeftToTheValidator) {
    std::string text(kSingleFacetStl);
    text.replace(text.find("vertex 1 0 0"), 12, "vertex nan 0 inf");

    std::vector<char> data = to_bytes(text);
    AsciiSTLTriangleStream stream(data);
    Triangle tri;
    ASSERT_TRUE(stream.next(tri));
    EXPECT_TRUE(std::isnan(tri.vertices[1].x()));
    EXPECT_TRUE(std::isinf(tri.vertices[1].z()));
}

TEST(AsciiSTLTriangleStream, RequiresSolidHeader) {
    ParseError error = read_error("\n\nfacet normal 0 0 1\n");
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().value, 3u);
}

TEST(AsciiSTLTriangleStream, EmptyInputIsMalformed) {
    ParseError error = read_error("");
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().value, 1u);
}

TEST(AsciiSTLTriangleStream, EndSolidNameNeedNotMatch) {
    std::string text(kSingleFacetStl);
    text.replace(text.find("endsolid"), 8, "endsolid something_else");

    std::vector<char> data = to_bytes(text);
    AsciiSTLTriangleStream stream(data);
    EXPECT_EQ(read_all(stream).size(), 1u);
}

TEST(AsciiSTLTriangleStream, ContentAfterEndSolidIsMalformed) {
    std::string text = std::string(kSingleFacetStl) + "\nsolid second\n";

    ParseError error = read_error(text);
    EXPECT_EQ(error.kind(), ErrorKind::MalformedStructure);
    EXPECT_EQ(error.location().value, 11u);
}

TEST(AsciiSTLReader, ProbeRecognisesSolidKeyword) {
    AsciiSTLReader reader;
    EXPECT_EQ(reader.probe(to_bytes("solid cube\n")), ProbeResult::Strong);
    EXPECT_EQ(reader.probe(to_bytes("  \n\tSoLiD")), ProbeResult::Strong);
    EXPECT_EQ(reader.probe(to_bytes("solidify\n")), ProbeResult::None);
    EXPECT_EQ(reader.probe(to_bytes("facet normal")), ProbeResult::None);
    EXPECT_EQ(reader.probe(std::vector<char>(84, '\0')), ProbeResult::None);
    EXPECT_EQ(reader.probe(std::vector<char>()), ProbeResult::None);
}

TEST(AsciiSTLReader, ProbeRejectsBinaryBytesAfterSolid) {
    AsciiSTLReader reader;
    std::vector<char> header = to_bytes("solid exported_by_cad");
    header.resize(84, '\0');
    EXPECT_EQ(reader.probe(header), ProbeResult::None);

    std::vector<char> high_byte = to_bytes("solid part\n");
    high_byte.push_back(static_cast<char>(0xC3));
    EXPECT_EQ(reader.probe(high_byte), ProbeResult::None);

    // Only the first 1024 bytes are sampled
    std::vector<char> late_nul = to_bytes("solid part\n" + std::string(2000, ' '));
    late_nul.push_back('\0');
    EXPECT_EQ(reader.probe(late_nul), ProbeResult::Strong);
}

TEST(AsciiSTLReader, OpensStreamOverCallerBuffer) {
    AsciiSTLReader reader;
    std::vector<char> data = to_bytes(kTwoFacets);
    std::unique_ptr<TriangleStream> stream = reader.open(data, ParseOptions());

    std::uint64_t count = 0;
    EXPECT_FALSE(stream->expected_count(count));
    EXPECT_TRUE(stream->stream_warnings().empty());

    Triangle tri;
    int produced = 0;
    while (stream->next(tri)) {
        ++produced;
    }
    EXPECT_EQ(produced, 2);
}
