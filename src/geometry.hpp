#ifndef MESHSTREAM_GEOMETRY_HPP
#define MESHSTREAM_GEOMETRY_HPP

#include <array>
#include <limits>
#include <Eigen/Dense>

namespace meshstream {

// STL stores single precision, so the model does too.
using Vector3 = Eigen::Vector3f;

struct Triangle {
    Vector3 normal;
    std::array<Vector3, 3> vertices;  // winding as read from the file

    Triangle() : normal(Vector3::Zero()) {
        vertices.fill(Vector3::Zero());
    }

    Triangle(const Vector3& n, const Vector3& v0, const Vector3& v1, const Vector3& v2)
        : normal(n), vertices{{v0, v1, v2}} {}

    // Unnormalized n = (v1 - v0) x (v2 - v0), in double to keep small areas meaningful
    Eigen::Vector3d geometric_normal() const {
        Eigen::Vector3d e1 = (vertices[1] - vertices[0]).cast<double>();
        Eigen::Vector3d e2 = (vertices[2] - vertices[0]).cast<double>();
        return e1.cross(e2);
    }

    double area() const {
        return 0.5 * geometric_normal().norm();
    }
};

// Axis-aligned box. Starts empty (min > max) and grows as points are folded in.
struct BoundingBox {
    Vector3 min;
    Vector3 max;

    BoundingBox()
        : min(Vector3::Constant(std::numeric_limits<float>::max())),
          max(Vector3::Constant(-std::numeric_limits<float>::max())) {}

    bool empty() const {
        return (min.array() > max.array()).any();
    }

    void extend(const Vector3& p) {
        min = min.cwiseMin(p);
        max = max.cwiseMax(p);
    }

    bool contains(const Vector3& p) const {
        return (p.array() >= min.array()).all() && (p.array() <= max.array()).all();
    }

    Vector3 center() const {
        if (empty()) {
            return Vector3::Zero();
        }
        return (min + max) * 0.5f;
    }

    Vector3 size() const {
        if (empty()) {
            return Vector3::Zero();
        }
        return max - min;
    }
};

} // namespace meshstream

#endif // MESHSTREAM_GEOMETRY_HPP
