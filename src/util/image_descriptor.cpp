#include "util/image_descriptor.hpp"

#include "util/config_json_utils.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace imagine {

using json = nlohmann::json;

namespace {

std::expected<ImageDescriptor, std::string> FromJson(const json& j) {
    using config::detail::GetStringIfPresent;
    using config::detail::GetU64IfPresent;

    ImageDescriptor d;
    std::string err;
    bool present = false;

    if (!GetStringIfPresent(j, "name", d.name, present, err))
        return std::unexpected(err);
    if (!present || d.name.empty())
        return std::unexpected("missing name");

    if (!GetStringIfPresent(j, "url", d.url, present, err))
        return std::unexpected(err);
    if (!present || d.url.empty())
        return std::unexpected("missing url");

    std::string digest;
    if (!GetStringIfPresent(j, "extract_sha256", digest, present, err))
        return std::unexpected(err);
    if (present && !digest.empty())
        d.extract_sha256 = digest;

    digest.clear();
    if (!GetStringIfPresent(j, "image_download_sha256", digest, present, err))
        return std::unexpected(err);
    if (present && !digest.empty())
        d.image_download_sha256 = digest;

    std::uint64_t size = 0;
    if (!GetU64IfPresent(j, "extract_size", size, present, err))
        return std::unexpected(err);
    if (present)
        d.extract_size = size;

    return d;
}

} // namespace

std::expected<ImageDescriptor, std::string> ImageDescriptorParser::Parse(const std::string& json_input) const {
    if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
        return std::unexpected("Empty input");
    }

    json j;
    std::string err;
    if (!config::detail::ParseJsonObject(json_input, j, err)) {
        return std::unexpected(err);
    }
    return FromJson(j);
}

std::expected<ImageDescriptor, std::string> ImageDescriptorParser::ParseFile(const std::string& path) const {
    std::ifstream is(path);
    if (!is.good()) {
        return std::unexpected("cannot open " + path);
    }
    std::stringstream ss;
    ss << is.rdbuf();

    auto d = Parse(ss.str());
    if (!d) {
        return std::unexpected(d.error() + " in " + path);
    }
    return d;
}

} // namespace imagine
