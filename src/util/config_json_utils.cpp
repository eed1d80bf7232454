#include "util/config_json_utils.hpp"

#include <fstream>

namespace imagine::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    out = nlohmann::json::parse(text, nullptr, false);
    if (out.is_discarded()) {
        err = "invalid JSON";
        return false;
    }
    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, bool& present, std::string& err) {
    present = false;
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    present = true;
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, bool& present, std::string& err) {
    present = false;
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        present = true;
        return true;
    }
    if (it->is_number_integer()) {
        auto v = it->get<long long>();
        if (v >= 0) {
            out = static_cast<std::uint64_t>(v);
            present = true;
            return true;
        }
    }
    err = std::string(key) + " must be a non-negative integer";
    return false;
}

} // namespace imagine::config::detail
