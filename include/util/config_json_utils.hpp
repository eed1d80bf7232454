#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace imagine::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err);

// Each returns false only when `key` is present with the wrong type or range;
// `present` reports whether it was there at all.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, bool& present, std::string& err);
bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out, bool& present, std::string& err);

} // namespace imagine::config::detail
