#ifndef MESHSTREAM_MESH_READER_HPP
#define MESHSTREAM_MESH_READER_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <memory>

#include "geometry.hpp"
#include "mesh.hpp"
#include "parse_error.hpp"

namespace meshstream {

class ParserRegistry;

// What to do with a binary file that holds fewer records than its header declares
enum class TruncationPolicy {
    Fail,
    DecodeCompleteRecords
};

struct ParseOptions {
    std::uint64_t max_file_size = std::uint64_t(1) << 30;  // bytes
    std::uint64_t max_triangles = 50000000;
    TruncationPolicy truncated_binary = TruncationPolicy::Fail;
    std::string forced_format;  // empty: detect from path and content
};

// How confidently a reader recognises a byte buffer as its format
enum class ProbeResult {
    None,
    Weak,
    Strong
};

// Single-pass sequence of triangles decoded from a caller-owned buffer.
// The buffer must outlive the stream.
class TriangleStream {
public:
    virtual ~TriangleStream() = default;

    // Decodes the next triangle into `out`. Returns false once the input is exhausted,
    // throws ParseError on malformed input.
    virtual bool next(Triangle& out) = 0;

    // Location of the triangle last returned by next()
    virtual Location location() const = 0;

    // Number of triangles the input promises, for formats that declare one up front
    virtual bool expected_count(std::uint64_t& count) const {
        (void)count;
        return false;
    }

    // Warnings about the input as a whole, complete once next() has returned false
    virtual std::vector<Warning> stream_warnings() const {
        return std::vector<Warning>();
    }
};

// One on-disk format. Implementations are stateless and shared across threads.
class MeshReader {
public:
    virtual ~MeshReader() = default;

    virtual std::string format() const = 0;
    virtual std::string name() const = 0;
    virtual std::vector<std::string> extensions() const = 0;
    virtual ProbeResult probe(const std::vector<char>& data) const = 0;
    virtual std::unique_ptr<TriangleStream> open(const std::vector<char>& data,
                                                 const ParseOptions& options) const = 0;
};

// Detects the format of `data`, decodes and validates it into a finished mesh.
// `path` is used for format detection and the mesh name only; nothing is read from disk.
Mesh parse_mesh(const ParserRegistry& registry, const std::string& path,
                const std::vector<char>& data, const ParseOptions& options = ParseOptions());

Mesh parse_file(const ParserRegistry& registry, const std::string& path,
                const ParseOptions& options = ParseOptions());

// Parse and report the elapsed time in seconds
std::pair<Mesh, double> parse_file_with_timing(const ParserRegistry& registry, const std::string& path,
                                               const ParseOptions& options = ParseOptions());

std::vector<char> read_file_bytes(const std::string& path, std::uint64_t max_bytes);

// Final path component, "unknown" when there is none
std::string file_name(const std::string& path);

} // namespace meshstream

#endif // MESHSTREAM_MESH_READER_HPP
