#pragma once

#include <string>
#include <string_view>

namespace imagine {

inline bool IsDevPath(std::string_view s) {
    return s.rfind("/dev/", 0) == 0;
}

inline std::string BaseName(std::string_view path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string_view::npos) return std::string(path);
    return std::string(path.substr(pos + 1));
}

inline std::string DirName(std::string_view path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string_view::npos) return ".";
    if (pos == 0) return "/";
    return std::string(path.substr(0, pos));
}

// Extension of the last path component including the dot ("" if none).
// A leading dot (hidden file) is not an extension.
inline std::string Extension(std::string_view path) {
    const std::string base = BaseName(path);
    const auto pos = base.find_last_of('.');
    if (pos == std::string::npos || pos == 0) return {};
    return base.substr(pos);
}

inline std::string StripExtension(std::string_view name) {
    const std::string ext = Extension(name);
    return std::string(name.substr(0, name.size() - ext.size()));
}

inline std::string JoinPath(std::string_view dir, std::string_view name) {
    if (dir.empty()) return std::string(name);
    std::string out(dir);
    if (out.back() != '/') out.push_back('/');
    out.append(name);
    return out;
}

// Last path component of a URL, without query string or fragment.
inline std::string UrlFileName(std::string_view url) {
    const auto scheme = url.find("://");
    std::string_view rest = scheme == std::string_view::npos ? url : url.substr(scheme + 3);
    const auto cut = rest.find_first_of("?#");
    if (cut != std::string_view::npos) rest = rest.substr(0, cut);
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos) return {};
    return BaseName(rest.substr(slash));
}

} // namespace imagine
