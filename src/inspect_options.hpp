#ifndef MESHSTREAM_INSPECT_OPTIONS_HPP
#define MESHSTREAM_INSPECT_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mesh_reader.hpp"

namespace meshstream {

// Settings of the meshstream_inspect command line
struct InspectConfig {
    ParseOptions options;
    std::size_t jobs = 1;
    bool quiet = false;
    bool verbose = false;
    bool list_formats = false;
    std::vector<std::string> files;
};

// Unsigned decimal without sign or surrounding whitespace
bool parse_count(const char* text, std::uint64_t& value);

// Fills `cfg` from argv. Returns false on an unknown or malformed option, or when
// there is nothing to do.
bool parse_args(int argc, const char* const* argv, InspectConfig& cfg);

} // namespace meshstream

#endif // MESHSTREAM_INSPECT_OPTIONS_HPP
