#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace imagine {

// One catalog entry: where to fetch an image and how to recognise it.
struct ImageDescriptor {
    std::string name;
    std::string url;
    std::optional<std::string> extract_sha256;        // decompressed image
    std::optional<std::string> image_download_sha256; // archive as downloaded
    std::optional<std::uint64_t> extract_size;
};

class ImageDescriptorParser {
  public:
    std::expected<ImageDescriptor, std::string> Parse(const std::string& json_input) const;
    std::expected<ImageDescriptor, std::string> ParseFile(const std::string& path) const;
};

} // namespace imagine
