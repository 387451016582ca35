#include "mesh.hpp"
#include <stdexcept>
#include <utility>

namespace meshstream {

MeshSummary Mesh::summary() const {
    return MeshSummary{triangle_count(), bounds_, has_warnings(), warnings_.size()};
}

MeshData Mesh::to_mesh_data() const {
    const Eigen::Index n = static_cast<Eigen::Index>(triangles_.size());

    Eigen::MatrixXf vertices(n * 3, 3);
    Eigen::MatrixXi faces(n, 3);
    Eigen::MatrixXf normals(n, 3);

    for (Eigen::Index i = 0; i < n; ++i) {
        const Triangle& tri = triangles_[static_cast<std::size_t>(i)];
        normals.row(i) = tri.normal.transpose();

        Eigen::Index base_idx = i * 3;
        for (int k = 0; k < 3; ++k) {
            vertices.row(base_idx + k) = tri.vertices[k].transpose();
        }
        faces.row(i) << static_cast<int>(base_idx), static_cast<int>(base_idx + 1),
            static_cast<int>(base_idx + 2);
    }

    return MeshData{vertices, faces, normals};
}

MeshBuilder::MeshBuilder(const std::string& format, const std::string& name,
                         std::uint64_t source_size, std::uint64_t max_triangles)
    : max_triangles_(max_triangles) {
    mesh_.format_ = format;
    mesh_.name_ = name;
    mesh_.source_size_ = source_size;
}

void MeshBuilder::reserve(std::size_t triangle_count) {
    mesh_.triangles_.reserve(triangle_count);
}

void MeshBuilder::add(const Triangle& triangle, const std::vector<Warning>& warnings) {
    if (finished_) {
        throw std::logic_error("MeshBuilder::add called after finish");
    }
    if (mesh_.triangles_.size() >= max_triangles_) {
        throw ParseError(ErrorKind::ResourceLimitExceeded, Location::none(),
                         "mesh exceeds the limit of " + std::to_string(max_triangles_) + " triangles");
    }

    mesh_.triangles_.push_back(triangle);
    for (const Vector3& v : triangle.vertices) {
        mesh_.bounds_.extend(v);
    }
    mesh_.warnings_.insert(mesh_.warnings_.end(), warnings.begin(), warnings.end());
}

void MeshBuilder::add_warning(const Warning& warning) {
    mesh_.warnings_.push_back(warning);
}

Mesh MeshBuilder::finish() {
    if (finished_) {
        throw std::logic_error("MeshBuilder::finish called twice");
    }
    finished_ = true;
    mesh_.warnings_.shrink_to_fit();
    return std::move(mesh_);
}

} // namespace meshstream
