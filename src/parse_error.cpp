#include "parse_error.hpp"
#include <sstream>

namespace meshstream {

namespace {

std::string format_message(ErrorKind kind, const Location& location, const std::string& detail) {
    std::ostringstream oss;
    oss << to_string(kind);
    switch (location.kind) {
        case Location::Kind::Line:
            oss << " at line " << location.value;
            break;
        case Location::Kind::Offset:
            oss << " at offset " << location.value;
            break;
        case Location::Kind::None:
            break;
    }
    if (!detail.empty()) {
        oss << ": " << detail;
    }
    return oss.str();
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::MalformedStructure: return "MalformedStructure";
        case ErrorKind::UnexpectedEof: return "UnexpectedEof";
        case ErrorKind::TriangleCountMismatch: return "TriangleCountMismatch";
        case ErrorKind::ResourceLimitExceeded: return "ResourceLimitExceeded";
        case ErrorKind::InternalInconsistency: return "InternalInconsistency";
    }
    return "Unknown";
}

const char* to_string(WarningKind kind) {
    switch (kind) {
        case WarningKind::DegenerateGeometry: return "DegenerateGeometry";
        case WarningKind::NormalRecomputed: return "NormalRecomputed";
        case WarningKind::TruncatedInput: return "TruncatedInput";
    }
    return "Unknown";
}

ParseError::ParseError(ErrorKind kind, Location location, const std::string& detail)
    : std::runtime_error(format_message(kind, location, detail)),
      kind_(kind),
      location_(location),
      detail_(detail) {}

ParseError ParseError::count_mismatch(std::uint64_t declared, std::uint64_t actual,
                                      std::uint64_t offset, const std::string& detail) {
    ParseError error(ErrorKind::TriangleCountMismatch, Location::offset(offset), detail);
    error.declared_ = declared;
    error.actual_ = actual;
    return error;
}

} // namespace meshstream
