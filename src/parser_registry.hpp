#ifndef MESHSTREAM_PARSER_REGISTRY_HPP
#define MESHSTREAM_PARSER_REGISTRY_HPP

#include <string>
#include <vector>
#include <memory>

#include "mesh_reader.hpp"

namespace meshstream {

// Format tag -> MeshReader table. Built once at startup, read-only afterwards and
// safe to share by const reference between threads. Supporting a new format means
// implementing MeshReader and adding it here.
class ParserRegistry {
public:
    using ReaderList = std::vector<std::unique_ptr<const MeshReader>>;

    // Order matters for detection: earlier readers win ties.
    // Throws std::invalid_argument on a null reader or a duplicate format tag.
    explicit ParserRegistry(ReaderList readers);

    ParserRegistry(ParserRegistry&&) = default;
    ParserRegistry& operator=(ParserRegistry&&) = default;
    ParserRegistry(const ParserRegistry&) = delete;
    ParserRegistry& operator=(const ParserRegistry&) = delete;

    // Binary STL, then ASCII STL
    static ParserRegistry create_default();

    // nullptr if the tag is unknown
    const MeshReader* find(const std::string& format) const;

    // Throws ParseError(UnsupportedFormat) if the tag is unknown
    const MeshReader& resolve(const std::string& format) const;

    const ReaderList& readers() const { return readers_; }

    // Distinct lowercase extensions, in registration order
    std::vector<std::string> supported_extensions() const;

private:
    ReaderList readers_;
};

} // namespace meshstream

#endif // MESHSTREAM_PARSER_REGISTRY_HPP
