#include "mesh_reader.hpp"
#include <fstream>
#include <chrono>

#include "format_detector.hpp"
#include "parser_registry.hpp"
#include "validator.hpp"

namespace meshstream {

std::string file_name(const std::string& path) {
    std::size_t slash = path.find_last_of("/\\");
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return name.empty() ? "unknown" : name;
}

std::vector<char> read_file_bytes(const std::string& path, std::uint64_t max_bytes) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw ParseError(ErrorKind::IoError, Location::none(), "Cannot open file: " + path);
    }

    std::streamoff size = file.tellg();
    if (size < 0) {
        throw ParseError(ErrorKind::IoError, Location::none(), "Cannot determine size of file: " + path);
    }
    if (static_cast<std::uint64_t>(size) > max_bytes) {
        throw ParseError(ErrorKind::ResourceLimitExceeded, Location::none(),
                         path + " is " + std::to_string(size) + " bytes, limit is " +
                             std::to_string(max_bytes));
    }

    std::vector<char> data(static_cast<std::size_t>(size));
    file.seekg(0);
    if (!data.empty() && !file.read(data.data(), size)) {
        throw ParseError(ErrorKind::IoError, Location::none(), "Failed to read file: " + path);
    }
    return data;
}

Mesh parse_mesh(const ParserRegistry& registry, const std::string& path,
                const std::vector<char>& data, const ParseOptions& options) {
    if (data.size() > options.max_file_size) {
        throw ParseError(ErrorKind::ResourceLimitExceeded, Location::none(),
                         "input is " + std::to_string(data.size()) + " bytes, limit is " +
                             std::to_string(options.max_file_size));
    }

    std::string format = options.forced_format;
    if (format.empty()) {
        format = detect_format(registry, path, data);
        if (format.empty()) {
            throw ParseError(ErrorKind::UnsupportedFormat, Location::none(),
                             "Unsupported file format: " + path);
        }
    }

    const MeshReader& reader = registry.resolve(format);
    std::unique_ptr<TriangleStream> stream = reader.open(data, options);

    MeshBuilder builder(format, file_name(path), data.size(), options.max_triangles);
    std::uint64_t expected = 0;
    const bool has_expected = stream->expected_count(expected);
    if (has_expected) {
        builder.reserve(static_cast<std::size_t>(expected));
    }

    Validator validator;
    Triangle triangle;
    while (stream->next(triangle)) {
        ValidationOutcome outcome = validator.check(triangle);
        if (outcome.status == ValidationOutcome::Status::Rejected) {
            throw ParseError(ErrorKind::MalformedStructure, stream->location(), outcome.detail);
        }
        builder.add(outcome.triangle, outcome.warnings);
    }

    if (has_expected) {
        validator.finish(expected);
    }
    for (const Warning& warning : stream->stream_warnings()) {
        builder.add_warning(warning);
    }
    return builder.finish();
}

Mesh parse_file(const ParserRegistry& registry, const std::string& path, const ParseOptions& options) {
    std::vector<char> data = read_file_bytes(path, options.max_file_size);
    return parse_mesh(registry, path, data, options);
}

std::pair<Mesh, double> parse_file_with_timing(const ParserRegistry& registry, const std::string& path,
                                               const ParseOptions& options) {
    // Start timing
    auto start_time = std::chrono::high_resolution_clock::now();

    Mesh mesh = parse_file(registry, path, options);

    // End timing
    auto end_time = std::chrono::high_resolution_clock::now();
    double parse_time = std::chrono::duration<double>(end_time - start_time).count();

    return {std::move(mesh), parse_time};
}

} // namespace meshstream
