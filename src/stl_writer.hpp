#ifndef MESHSTREAM_STL_WRITER_HPP
#define MESHSTREAM_STL_WRITER_HPP

#include <string>
#include <vector>

#include "geometry.hpp"
#include "mesh.hpp"

namespace meshstream {

// 80-byte header (truncated or zero padded), little-endian count, 50-byte records
std::vector<char> encode_binary_stl(const std::vector<Triangle>& triangles, const std::string& header = "");
std::vector<char> encode_binary_stl(const Mesh& mesh, const std::string& header = "");

// Floats are written with 9 significant digits so they read back bit-exact
std::string encode_ascii_stl(const std::vector<Triangle>& triangles, const std::string& solid_name = "");
std::string encode_ascii_stl(const Mesh& mesh, const std::string& solid_name = "");

} // namespace meshstream

#endif // MESHSTREAM_STL_WRITER_HPP
