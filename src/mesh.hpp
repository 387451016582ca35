#ifndef MESHSTREAM_MESH_HPP
#define MESHSTREAM_MESH_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "geometry.hpp"
#include "parse_error.hpp"

namespace meshstream {

// Matrix form of a mesh for consumers that work on arrays
struct MeshData {
    Eigen::MatrixXf vertices;  // 3Nx3 matrix, three rows per triangle
    Eigen::MatrixXi faces;     // Nx3 matrix of row indices into vertices
    Eigen::MatrixXf normals;   // Nx3 matrix for face normals
};

struct MeshSummary {
    std::size_t triangle_count;
    BoundingBox bounds;
    bool has_warnings;
    std::size_t warning_count;
};

// A parsed mesh. Only MeshBuilder creates one; it cannot be modified afterwards.
class Mesh {
public:
    const std::vector<Triangle>& triangles() const { return triangles_; }
    std::size_t triangle_count() const { return triangles_.size(); }
    std::size_t vertex_count() const { return triangles_.size() * 3; }
    const BoundingBox& bounds() const { return bounds_; }

    const std::string& format() const { return format_; }
    const std::string& name() const { return name_; }
    std::uint64_t source_size() const { return source_size_; }

    const std::vector<Warning>& warnings() const { return warnings_; }
    bool has_warnings() const { return !warnings_.empty(); }

    Vector3 center() const { return bounds_.center(); }
    Vector3 size() const { return bounds_.size(); }
    float max_dimension() const { return size().maxCoeff(); }

    MeshSummary summary() const;
    MeshData to_mesh_data() const;

private:
    friend class MeshBuilder;

    Mesh() = default;

    std::vector<Triangle> triangles_;
    BoundingBox bounds_;
    std::string format_;
    std::string name_;
    std::uint64_t source_size_ = 0;
    std::vector<Warning> warnings_;
};

// Streaming fold of accepted triangles into a Mesh. O(1) work per triangle.
class MeshBuilder {
public:
    MeshBuilder(const std::string& format, const std::string& name,
                std::uint64_t source_size, std::uint64_t max_triangles);

    void reserve(std::size_t triangle_count);

    // Throws ParseError(ResourceLimitExceeded) once max_triangles would be exceeded
    void add(const Triangle& triangle, const std::vector<Warning>& warnings);
    void add_warning(const Warning& warning);

    std::size_t triangle_count() const { return mesh_.triangles_.size(); }

    // Hands over the accumulated mesh. The builder must not be used afterwards.
    Mesh finish();

private:
    Mesh mesh_;
    std::uint64_t max_triangles_;
    bool finished_ = false;
};

} // namespace meshstream

#endif // MESHSTREAM_MESH_HPP
