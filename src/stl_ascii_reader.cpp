#include "stl_ascii_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace meshstream {

namespace {

constexpr std::size_t kMaxQuotedToken = 32;
constexpr std::size_t kProbeSampleSize = 1024;

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Case-insensitive comparison of a token against a lowercase keyword
bool keyword_equals(const char* begin, const char* end, const char* keyword) {
    std::size_t length = std::strlen(keyword);
    if (static_cast<std::size_t>(end - begin) != length) {
        return false;
    }
    for (std::size_t i = 0; i < length; ++i) {
        if (std::tolower(static_cast<unsigned char>(begin[i])) != keyword[i]) {
            return false;
        }
    }
    return true;
}

std::string quote(const char* begin, const char* end) {
    std::size_t length = static_cast<std::size_t>(end - begin);
    if (length > kMaxQuotedToken) {
        return "'" + std::string(begin, kMaxQuotedToken) + "...'";
    }
    return "'" + std::string(begin, length) + "'";
}

} // namespace

AsciiSTLTriangleStream::AsciiSTLTriangleStream(const std::vector<char>& data)
    : cursor_(data.data()), end_(data.data() + data.size()) {}

bool AsciiSTLTriangleStream::next(Triangle& out) {
    Token token;
    while (true) {
        if (!next_token(token)) {
            if (state_ == State::Done) {
                return false;
            }
            if (state_ == State::ExpectSolidHeader) {
                throw malformed(last_line_, "empty input, expected 'solid'");
            }
            throw malformed(last_line_, std::string("unexpected end of input, expected ") + describe(state_));
        }

        switch (state_) {
            case State::ExpectSolidHeader:
                check_keyword(token, "solid");
                solid_name_ = rest_of_line();
                state_ = State::ExpectFacetOrEndSolid;
                break;

            case State::ExpectFacetOrEndSolid:
                if (keyword_equals(token.begin, token.end, "facet")) {
                    facet_line_ = last_line_;
                    expect_keyword("normal");
                    for (int k = 0; k < 3; ++k) {
                        current_.normal[k] = read_number("normal component");
                    }
                    state_ = State::ExpectOuterLoop;
                } else if (keyword_equals(token.begin, token.end, "endsolid")) {
                    rest_of_line();  // name is not required to match the header
                    state_ = State::Done;
                } else {
                    throw malformed(last_line_, "expected 'facet' or 'endsolid', found " +
                                                    quote(token.begin, token.end));
                }
                break;

            case State::ExpectOuterLoop:
                check_keyword(token, "outer");
                expect_keyword("loop");
                vertex_index_ = 0;
                state_ = State::ExpectVertex;
                break;

            case State::ExpectVertex:
                check_keyword(token, "vertex");
                for (int k = 0; k < 3; ++k) {
                    current_.vertices[vertex_index_][k] = read_number("vertex coordinate");
                }
                if (++vertex_index_ == 3) {
                    state_ = State::ExpectEndLoop;
                }
                break;

            case State::ExpectEndLoop:
                check_keyword(token, "endloop");
                state_ = State::ExpectEndFacet;
                break;

            case State::ExpectEndFacet:
                check_keyword(token, "endfacet");
                state_ = State::ExpectFacetOrEndSolid;
                out = current_;
                return true;

            case State::Done:
                throw malformed(last_line_, "unexpected " + quote(token.begin, token.end) + " after 'endsolid'");
        }
    }
}

bool AsciiSTLTriangleStream::next_token(Token& token) {
    while (cursor_ != end_ && is_space(*cursor_)) {
        if (*cursor_ == '\n') {
            ++line_;
        }
        ++cursor_;
    }
    if (cursor_ == end_) {
        return false;
    }

    token.begin = cursor_;
    while (cursor_ != end_ && !is_space(*cursor_)) {
        ++cursor_;
    }
    token.end = cursor_;
    last_line_ = line_;
    return true;
}

AsciiSTLTriangleStream::Token AsciiSTLTriangleStream::require_token(const char* expected) {
    Token token;
    if (!next_token(token)) {
        throw malformed(last_line_, std::string("unexpected end of input, expected ") + expected);
    }
    return token;
}

void AsciiSTLTriangleStream::check_keyword(const Token& token, const char* keyword) const {
    if (!keyword_equals(token.begin, token.end, keyword)) {
        throw malformed(last_line_, std::string("expected '") + keyword + "', found " +
                                        quote(token.begin, token.end));
    }
}

void AsciiSTLTriangleStream::expect_keyword(const char* keyword) {
    Token token = require_token((std::string("'") + keyword + "'").c_str());
    check_keyword(token, keyword);
}

float AsciiSTLTriangleStream::read_number(const char* what) {
    Token token = require_token(what);
    number_buffer_.assign(token.begin, token.end);

    const char* text = number_buffer_.c_str();
    char* parsed_end = nullptr;
    float value = std::strtof(text, &parsed_end);
    if (parsed_end != text + number_buffer_.size()) {
        throw malformed(last_line_, std::string("invalid ") + what + " " + quote(token.begin, token.end));
    }
    return value;
}

std::string AsciiSTLTriangleStream::rest_of_line() {
    const char* begin = cursor_;
    while (cursor_ != end_ && *cursor_ != '\n') {
        ++cursor_;
    }
    const char* end = cursor_;
    while (begin != end && is_space(*begin)) {
        ++begin;
    }
    while (end != begin && is_space(*(end - 1))) {
        --end;
    }
    return std::string(begin, end);
}

ParseError AsciiSTLTriangleStream::malformed(std::uint64_t line, const std::string& detail) const {
    return ParseError(ErrorKind::MalformedStructure, Location::line(line), detail);
}

const char* AsciiSTLTriangleStream::describe(State state) {
    switch (state) {
        case State::ExpectSolidHeader: return "'solid'";
        case State::ExpectFacetOrEndSolid: return "'facet' or 'endsolid'";
        case State::ExpectOuterLoop: return "'outer loop'";
        case State::ExpectVertex: return "'vertex'";
        case State::ExpectEndLoop: return "'endloop'";
        case State::ExpectEndFacet: return "'endfacet'";
        case State::Done: return "end of input";
    }
    return "?";
}

ProbeResult AsciiSTLReader::probe(const std::vector<char>& data) const {
    const char* cursor = data.data();
    const char* end = cursor + data.size();
    while (cursor != end && is_space(*cursor)) {
        ++cursor;
    }

    const char* keyword_end = cursor;
    while (keyword_end != end && !is_space(*keyword_end)) {
        ++keyword_end;
    }
    if (!keyword_equals(cursor, keyword_end, "solid")) {
        return ProbeResult::None;
    }

    // Binary exporters often start the header with "solid" too; text never holds NUL or high bytes
    const char* sample_end = data.data() + std::min(data.size(), kProbeSampleSize);
    for (const char* c = data.data(); c != sample_end; ++c) {
        unsigned char byte = static_cast<unsigned char>(*c);
        if (byte == 0 || byte >= 0x80) {
            return ProbeResult::None;
        }
    }
    return ProbeResult::Strong;
}

std::unique_ptr<TriangleStream> AsciiSTLReader::open(const std::vector<char>& data,
                                                     const ParseOptions& options) const {
    (void)options;
    return std::make_unique<AsciiSTLTriangleStream>(data);
}

} // namespace meshstream
