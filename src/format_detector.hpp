#ifndef MESHSTREAM_FORMAT_DETECTOR_HPP
#define MESHSTREAM_FORMAT_DETECTOR_HPP

#include <string>
#include <vector>

namespace meshstream {

class ParserRegistry;

// Lowercased text after the last '.' of the file name, empty if there is none
std::string file_extension(const std::string& path);

/**
 * Picks the format tag of a registered reader for the given file, or returns an
 * empty string when no reader accepts it.
 *
 * The extension narrows the candidates first. When it maps to several readers, or the
 * file has none, each candidate probes the content: the first strong match wins, then
 * the first weak match, but weak matches only count when the extension was recognised.
 * Pure function of its inputs.
 */
std::string detect_format(const ParserRegistry& registry, const std::string& path,
                          const std::vector<char>& data);

} // namespace meshstream

#endif // MESHSTREAM_FORMAT_DETECTOR_HPP
