#include "format_detector.hpp"
#include <algorithm>
#include <cctype>

#include "parser_registry.hpp"

namespace meshstream {

std::string file_extension(const std::string& path) {
    std::string name = file_name(path);
    std::size_t dot = name.find_last_of('.');
    // ".stl" on its own is a hidden file without an extension
    if (dot == std::string::npos || dot == 0) {
        return std::string();
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string detect_format(const ParserRegistry& registry, const std::string& path,
                          const std::vector<char>& data) {
    const std::string ext = file_extension(path);

    std::vector<const MeshReader*> candidates;
    if (!ext.empty()) {
        for (const auto& reader : registry.readers()) {
            std::vector<std::string> extensions = reader->extensions();
            if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
                candidates.push_back(reader.get());
            }
        }
        if (candidates.size() == 1) {
            return candidates.front()->format();
        }
    }

    const bool extension_matched = !candidates.empty();
    if (!ext.empty() && !extension_matched) {
        // An extension nobody registered is not sniffed
        return std::string();
    }
    if (!extension_matched) {
        for (const auto& reader : registry.readers()) {
            candidates.push_back(reader.get());
        }
    }

    const MeshReader* weak = nullptr;
    for (const MeshReader* reader : candidates) {
        ProbeResult result = reader->probe(data);
        if (result == ProbeResult::Strong) {
            return reader->format();
        }
        if (result == ProbeResult::Weak && !weak) {
            weak = reader;
        }
    }

    if (weak && extension_matched) {
        return weak->format();
    }
    return std::string();
}

} // namespace meshstream
