#include "validator.hpp"
#include <sstream>

namespace meshstream {

namespace {

bool is_finite(const Vector3& v) {
    return v.allFinite();
}

std::string describe(const char* what, const Vector3& v) {
    std::ostringstream oss;
    oss << "non-finite " << what << " (" << v.x() << ", " << v.y() << ", " << v.z() << ")";
    return oss.str();
}

} // namespace

ValidationOutcome Validator::check(const Triangle& triangle) {
    ValidationOutcome outcome{ValidationOutcome::Status::Accepted, triangle, {}, {}};
    const std::size_t index = static_cast<std::size_t>(accepted_);

    if (!is_finite(triangle.normal)) {
        outcome.status = ValidationOutcome::Status::Rejected;
        outcome.detail = describe("normal", triangle.normal);
        return outcome;
    }
    for (std::size_t k = 0; k < triangle.vertices.size(); ++k) {
        if (!is_finite(triangle.vertices[k])) {
            outcome.status = ValidationOutcome::Status::Rejected;
            outcome.detail = describe("vertex", triangle.vertices[k]) +
                             " at position " + std::to_string(k + 1);
            return outcome;
        }
    }

    Eigen::Vector3d geometric = triangle.geometric_normal();
    double twice_area = geometric.norm();
    bool degenerate = 0.5 * twice_area < kDegenerateAreaEpsilon;
    if (degenerate) {
        outcome.warnings.push_back(Warning{index, WarningKind::DegenerateGeometry});
    }

    Eigen::Vector3d supplied = triangle.normal.cast<double>();
    bool zero_normal = supplied.norm() < kNormalEpsilon;
    bool flipped = !degenerate && supplied.dot(geometric) < 0.0;
    if (zero_normal || flipped) {
        // Coincident vertices leave no direction to recover; the zero normal stays, flagged.
        if (twice_area > 0.0) {
            outcome.triangle.normal = (geometric / twice_area).cast<float>();
        }
        outcome.warnings.push_back(Warning{index, WarningKind::NormalRecomputed});
    }

    if (!outcome.warnings.empty()) {
        outcome.status = ValidationOutcome::Status::AcceptedWithWarnings;
    }
    ++accepted_;
    return outcome;
}

void Validator::finish(std::uint64_t expected_count) const {
    if (accepted_ != expected_count) {
        throw ParseError(ErrorKind::InternalInconsistency, Location::none(),
                         "decoded " + std::to_string(accepted_) + " triangles but the stream declared " +
                             std::to_string(expected_count));
    }
}

} // namespace meshstream
