#include "stl_binary_reader.hpp"
#include <algorithm>
#include <cstring>

namespace meshstream {

std::uint32_t read_u32_le(const char* bytes) {
    const unsigned char* b = reinterpret_cast<const unsigned char*>(bytes);
    return static_cast<std::uint32_t>(b[0]) |
           (static_cast<std::uint32_t>(b[1]) << 8) |
           (static_cast<std::uint32_t>(b[2]) << 16) |
           (static_cast<std::uint32_t>(b[3]) << 24);
}

float read_f32_le(const char* bytes) {
    std::uint32_t bits = read_u32_le(bytes);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

BinarySTLTriangleStream::BinarySTLTriangleStream(const std::vector<char>& data,
                                                 const ParseOptions& options)
    : data_(data.data()) {
    if (data.size() < kBinaryPreambleSize) {
        throw ParseError(ErrorKind::UnexpectedEof, Location::offset(0),
                         "binary STL needs at least " + std::to_string(kBinaryPreambleSize) +
                             " bytes, got " + std::to_string(data.size()));
    }

    declared_ = read_u32_le(data_ + kBinaryHeaderSize);
    if (declared_ > options.max_triangles) {
        throw ParseError(ErrorKind::ResourceLimitExceeded, Location::offset(kBinaryHeaderSize),
                         "header declares " + std::to_string(declared_) + " triangles, limit is " +
                             std::to_string(options.max_triangles));
    }

    const std::uint64_t available_bytes = data.size() - kBinaryPreambleSize;
    const std::uint64_t expected_bytes = static_cast<std::uint64_t>(declared_) * kBinaryRecordSize;
    const std::uint64_t actual = available_bytes / kBinaryRecordSize;

    to_decode_ = declared_;
    if (available_bytes != expected_bytes) {
        if (available_bytes < expected_bytes &&
            options.truncated_binary == TruncationPolicy::DecodeCompleteRecords) {
            to_decode_ = actual;
            truncated_ = true;
        } else {
            const std::uint64_t first_bad = std::min<std::uint64_t>(declared_, actual);
            throw ParseError::count_mismatch(
                declared_, actual, kBinaryPreambleSize + first_bad * kBinaryRecordSize,
                "header declares " + std::to_string(declared_) + " triangles (" +
                    std::to_string(expected_bytes) + " bytes) but " + std::to_string(available_bytes) +
                    " bytes follow the header");
        }
    }
}

bool BinarySTLTriangleStream::next(Triangle& out) {
    if (decoded_ == to_decode_) {
        return false;
    }

    record_offset_ = cursor_;
    const char* record = data_ + cursor_;

    // Read normal
    out.normal = Vector3(read_f32_le(record), read_f32_le(record + 4), read_f32_le(record + 8));

    // Read vertices
    for (int k = 0; k < 3; ++k) {
        const char* v = record + 12 + k * 12;
        out.vertices[k] = Vector3(read_f32_le(v), read_f32_le(v + 4), read_f32_le(v + 8));
    }

    // Attribute byte count is skipped
    cursor_ += kBinaryRecordSize;
    ++decoded_;
    return true;
}

bool BinarySTLTriangleStream::expected_count(std::uint64_t& count) const {
    count = to_decode_;
    return true;
}

std::vector<Warning> BinarySTLTriangleStream::stream_warnings() const {
    std::vector<Warning> warnings;
    if (truncated_) {
        warnings.push_back(Warning{static_cast<std::size_t>(to_decode_), WarningKind::TruncatedInput});
    }
    return warnings;
}

ProbeResult BinarySTLReader::probe(const std::vector<char>& data) const {
    if (data.size() < kBinaryPreambleSize) {
        return ProbeResult::Weak;
    }
    std::uint64_t declared = read_u32_le(data.data() + kBinaryHeaderSize);
    std::uint64_t expected_size = kBinaryPreambleSize + declared * kBinaryRecordSize;
    return expected_size == data.size() ? ProbeResult::Strong : ProbeResult::Weak;
}

std::unique_ptr<TriangleStream> BinarySTLReader::open(const std::vector<char>& data,
                                                      const ParseOptions& options) const {
    return std::make_unique<BinarySTLTriangleStream>(data, options);
}

} // namespace meshstream
