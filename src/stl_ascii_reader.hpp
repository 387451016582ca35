#ifndef MESHSTREAM_STL_ASCII_READER_HPP
#define MESHSTREAM_STL_ASCII_READER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <memory>

#include "mesh_reader.hpp"

namespace meshstream {

/**
 * Decodes the textual STL grammar one facet at a time:
 *
 *   solid <name>
 *     facet normal nx ny nz
 *       outer loop
 *         vertex x y z   (three times)
 *       endloop
 *     endfacet
 *   endsolid <name>
 *
 * Keywords are case-insensitive and any run of whitespace separates tokens.
 * Locations are 1-based line numbers.
 */
class AsciiSTLTriangleStream : public TriangleStream {
public:
    explicit AsciiSTLTriangleStream(const std::vector<char>& data);

    bool next(Triangle& out) override;
    Location location() const override { return Location::line(facet_line_); }

    // Free text after the `solid` keyword; empty until the header has been read
    const std::string& solid_name() const { return solid_name_; }

private:
    enum class State {
        ExpectSolidHeader,
        ExpectFacetOrEndSolid,
        ExpectOuterLoop,
        ExpectVertex,
        ExpectEndLoop,
        ExpectEndFacet,
        Done
    };

    struct Token {
        const char* begin;
        const char* end;
    };

    bool next_token(Token& token);
    Token require_token(const char* expected);
    void check_keyword(const Token& token, const char* keyword) const;
    void expect_keyword(const char* keyword);
    float read_number(const char* what);
    std::string rest_of_line();

    ParseError malformed(std::uint64_t line, const std::string& detail) const;
    static const char* describe(State state);

    const char* cursor_;
    const char* end_;
    std::uint64_t line_ = 1;       // line the cursor is on
    std::uint64_t last_line_ = 1;  // line of the last consumed token
    std::uint64_t facet_line_ = 0;

    State state_ = State::ExpectSolidHeader;
    int vertex_index_ = 0;
    Triangle current_;
    std::string solid_name_;
    std::string number_buffer_;
};

class AsciiSTLReader : public MeshReader {
public:
    std::string format() const override { return "stl-ascii"; }
    std::string name() const override { return "ASCII STL Parser"; }
    std::vector<std::string> extensions() const override { return {"stl"}; }

    // Strong when the content starts with the `solid` keyword and its first 1024 bytes are 7-bit text
    ProbeResult probe(const std::vector<char>& data) const override;

    std::unique_ptr<TriangleStream> open(const std::vector<char>& data,
                                         const ParseOptions& options) const override;
};

} // namespace meshstream

#endif // MESHSTREAM_STL_ASCII_READER_HPP
