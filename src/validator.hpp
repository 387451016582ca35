#ifndef MESHSTREAM_VALIDATOR_HPP
#define MESHSTREAM_VALIDATOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "geometry.hpp"
#include "parse_error.hpp"

namespace meshstream {

// Triangles with a smaller area are reported as degenerate
constexpr double kDegenerateAreaEpsilon = 1e-10;
// Supplied normals shorter than this are replaced by the geometric normal
constexpr double kNormalEpsilon = 1e-6;

struct ValidationOutcome {
    enum class Status {
        Accepted,
        AcceptedWithWarnings,
        Rejected
    };

    Status status;
    Triangle triangle;              // as accepted, normal possibly recomputed
    std::vector<Warning> warnings;
    std::string detail;             // reason for rejection
};

// Per-triangle checks run inline with decoding. One instance per parse.
class Validator {
public:
    ValidationOutcome check(const Triangle& triangle);

    // Confirms that the accepted triangles add up to what the stream declared.
    // Throws ParseError(InternalInconsistency) otherwise.
    void finish(std::uint64_t expected_count) const;

    std::uint64_t accepted_count() const { return accepted_; }

private:
    std::uint64_t accepted_ = 0;
};

} // namespace meshstream

#endif // MESHSTREAM_VALIDATOR_HPP
