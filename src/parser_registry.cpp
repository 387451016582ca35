#include "parser_registry.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

#include "stl_ascii_reader.hpp"
#include "stl_binary_reader.hpp"

namespace meshstream {

ParserRegistry::ParserRegistry(ReaderList readers) : readers_(std::move(readers)) {
    std::vector<std::string> seen;
    for (const auto& reader : readers_) {
        if (!reader) {
            throw std::invalid_argument("ParserRegistry: null reader");
        }
        std::string tag = reader->format();
        if (std::find(seen.begin(), seen.end(), tag) != seen.end()) {
            throw std::invalid_argument("ParserRegistry: duplicate format tag '" + tag + "'");
        }
        seen.push_back(tag);
    }
}

ParserRegistry ParserRegistry::create_default() {
    ReaderList readers;
    readers.push_back(std::make_unique<BinarySTLReader>());
    readers.push_back(std::make_unique<AsciiSTLReader>());
    return ParserRegistry(std::move(readers));
}

const MeshReader* ParserRegistry::find(const std::string& format) const {
    for (const auto& reader : readers_) {
        if (reader->format() == format) {
            return reader.get();
        }
    }
    return nullptr;
}

const MeshReader& ParserRegistry::resolve(const std::string& format) const {
    const MeshReader* reader = find(format);
    if (!reader) {
        throw ParseError(ErrorKind::UnsupportedFormat, Location::none(),
                         "no parser registered for format '" + format + "'");
    }
    return *reader;
}

std::vector<std::string> ParserRegistry::supported_extensions() const {
    std::vector<std::string> extensions;
    for (const auto& reader : readers_) {
        for (const std::string& ext : reader->extensions()) {
            if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
                extensions.push_back(ext);
            }
        }
    }
    return extensions;
}

} // namespace meshstream
