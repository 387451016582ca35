#include "stl_writer.hpp"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <limits>

#include "stl_binary_reader.hpp"

namespace meshstream {

namespace {

void append_u32_le(std::vector<char>& out, std::uint32_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
}

void append_vector(std::vector<char>& out, const Vector3& v) {
    for (int k = 0; k < 3; ++k) {
        float value = v[k];
        std::uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        append_u32_le(out, bits);
    }
}

void append_ascii_vector(std::string& out, const char* keyword, const Vector3& v) {
    char line[160];
    std::snprintf(line, sizeof(line), "%s %.9g %.9g %.9g\n", keyword, v.x(), v.y(), v.z());
    out += line;
}

} // namespace

std::vector<char> encode_binary_stl(const std::vector<Triangle>& triangles, const std::string& header) {
    if (triangles.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("binary STL holds at most 2^32-1 triangles");
    }

    std::vector<char> out;
    out.reserve(kBinaryPreambleSize + triangles.size() * kBinaryRecordSize);

    // Header
    out.assign(kBinaryHeaderSize, '\0');
    std::copy_n(header.begin(), std::min(header.size(), kBinaryHeaderSize), out.begin());

    append_u32_le(out, static_cast<std::uint32_t>(triangles.size()));
    for (const Triangle& tri : triangles) {
        append_vector(out, tri.normal);
        for (const Vector3& v : tri.vertices) {
            append_vector(out, v);
        }
        // Attribute byte count
        out.push_back('\0');
        out.push_back('\0');
    }
    return out;
}

std::vector<char> encode_binary_stl(const Mesh& mesh, const std::string& header) {
    return encode_binary_stl(mesh.triangles(), header);
}

std::string encode_ascii_stl(const std::vector<Triangle>& triangles, const std::string& solid_name) {
    std::string out = "solid " + solid_name + "\n";
    for (const Triangle& tri : triangles) {
        append_ascii_vector(out, "  facet normal", tri.normal);
        out += "    outer loop\n";
        for (const Vector3& v : tri.vertices) {
            append_ascii_vector(out, "      vertex", v);
        }
        out += "    endloop\n";
        out += "  endfacet\n";
    }
    out += "endsolid " + solid_name + "\n";
    return out;
}

std::string encode_ascii_stl(const Mesh& mesh, const std::string& solid_name) {
    return encode_ascii_stl(mesh.triangles(), solid_name);
}

} // namespace meshstream
