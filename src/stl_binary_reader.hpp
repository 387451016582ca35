#ifndef MESHSTREAM_STL_BINARY_READER_HPP
#define MESHSTREAM_STL_BINARY_READER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <memory>

#include "mesh_reader.hpp"

namespace meshstream {

// Binary STL layout
constexpr std::size_t kBinaryHeaderSize = 80;
constexpr std::size_t kBinaryPreambleSize = 84;  // header + uint32 triangle count
constexpr std::size_t kBinaryRecordSize = 50;    // 12 floats + 2 attribute bytes

std::uint32_t read_u32_le(const char* bytes);
float read_f32_le(const char* bytes);

// Countdown over the fixed-size records of a binary STL file.
// The constructor validates the preamble and the record count against the buffer size.
// Locations are byte offsets of the record last produced.
class BinarySTLTriangleStream : public TriangleStream {
public:
    BinarySTLTriangleStream(const std::vector<char>& data, const ParseOptions& options);

    bool next(Triangle& out) override;
    Location location() const override { return Location::offset(record_offset_); }
    bool expected_count(std::uint64_t& count) const override;
    std::vector<Warning> stream_warnings() const override;

    std::uint32_t declared_count() const { return declared_; }
    bool truncated() const { return truncated_; }

private:
    const char* data_;
    std::uint32_t declared_ = 0;
    std::uint64_t to_decode_ = 0;
    std::uint64_t decoded_ = 0;
    std::size_t cursor_ = kBinaryPreambleSize;
    std::size_t record_offset_ = kBinaryPreambleSize;
    bool truncated_ = false;
};

class BinarySTLReader : public MeshReader {
public:
    std::string format() const override { return "stl-binary"; }
    std::string name() const override { return "Binary STL Parser"; }
    std::vector<std::string> extensions() const override { return {"stl"}; }

    // Strong when the declared count matches the buffer length exactly, otherwise Weak
    ProbeResult probe(const std::vector<char>& data) const override;

    std::unique_ptr<TriangleStream> open(const std::vector<char>& data,
                                         const ParseOptions& options) const override;
};

} // namespace meshstream

#endif // MESHSTREAM_STL_BINARY_READER_HPP
