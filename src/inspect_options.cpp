#include "inspect_options.hpp"
#include <cctype>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace meshstream {

bool parse_count(const char* text, std::uint64_t& value) {
    // Must start with a digit: no sign, no leading blanks
    if (!std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    try {
        std::size_t used = 0;
        unsigned long long parsed = std::stoull(text, &used);
        if (text[used] != '\0') {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parse_args(int argc, const char* const* argv, InspectConfig& cfg) {
    for (int i = 1; i < argc; i++) {
        std::uint64_t n = 0;
        if (!strcmp(argv[i], "--format") && i + 1 < argc) {
            cfg.options.forced_format = argv[++i];
        } else if (!strcmp(argv[i], "--max-triangles") && i + 1 < argc && parse_count(argv[i + 1], n)) {
            cfg.options.max_triangles = n;
            ++i;
        } else if (!strcmp(argv[i], "--max-file-size") && i + 1 < argc && parse_count(argv[i + 1], n)) {
            cfg.options.max_file_size = n;
            ++i;
        } else if (!strcmp(argv[i], "--jobs") && i + 1 < argc && parse_count(argv[i + 1], n) && n > 0) {
            cfg.jobs = static_cast<std::size_t>(n);
            ++i;
        } else if (!strcmp(argv[i], "--lenient")) {
            cfg.options.truncated_binary = TruncationPolicy::DecodeCompleteRecords;
        } else if (!strcmp(argv[i], "--quiet")) {
            cfg.quiet = true;
        } else if (!strcmp(argv[i], "--verbose")) {
            cfg.verbose = true;
        } else if (!strcmp(argv[i], "--list-formats")) {
            cfg.list_formats = true;
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Unknown or incomplete option: " << argv[i] << std::endl;
            return false;
        } else {
            cfg.files.push_back(argv[i]);
        }
    }
    if (cfg.quiet && cfg.verbose) {
        std::cerr << "--quiet and --verbose are exclusive" << std::endl;
        return false;
    }
    return cfg.list_formats || !cfg.files.empty();
}

} // namespace meshstream
