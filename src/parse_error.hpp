#ifndef MESHSTREAM_PARSE_ERROR_HPP
#define MESHSTREAM_PARSE_ERROR_HPP

#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace meshstream {

enum class ErrorKind {
    IoError,
    UnsupportedFormat,
    MalformedStructure,
    UnexpectedEof,
    TriangleCountMismatch,
    ResourceLimitExceeded,
    // Produced triangle count disagrees with what the reader promised
    InternalInconsistency
};

enum class WarningKind {
    DegenerateGeometry,
    NormalRecomputed,
    TruncatedInput
};

const char* to_string(ErrorKind kind);
const char* to_string(WarningKind kind);

// Where in the input something happened. Text formats report lines, binary formats byte offsets.
struct Location {
    enum class Kind { None, Line, Offset };

    Kind kind = Kind::None;
    std::uint64_t value = 0;

    static Location none() { return Location(); }
    static Location line(std::uint64_t n) { return Location{Kind::Line, n}; }
    static Location offset(std::uint64_t n) { return Location{Kind::Offset, n}; }
};

// Non-fatal issue attached to one triangle of the finished mesh
struct Warning {
    std::size_t triangle_index;
    WarningKind kind;

    bool operator==(const Warning& other) const {
        return triangle_index == other.triangle_index && kind == other.kind;
    }
    bool operator!=(const Warning& other) const { return !(*this == other); }
};

// Terminal failure of a parse. Thrown; no partial mesh survives it.
class ParseError : public std::runtime_error {
public:
    ParseError(ErrorKind kind, Location location, const std::string& detail);

    static ParseError count_mismatch(std::uint64_t declared, std::uint64_t actual,
                                     std::uint64_t offset, const std::string& detail);

    ErrorKind kind() const { return kind_; }
    const Location& location() const { return location_; }
    const std::string& detail() const { return detail_; }

    // Only meaningful for TriangleCountMismatch
    std::uint64_t declared() const { return declared_; }
    std::uint64_t actual() const { return actual_; }

private:
    ErrorKind kind_;
    Location location_;
    std::string detail_;
    std::uint64_t declared_ = 0;
    std::uint64_t actual_ = 0;
};

} // namespace meshstream

#endif // MESHSTREAM_PARSE_ERROR_HPP
