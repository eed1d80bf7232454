#include "util/config.hpp"

#include "util/config_json_utils.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace imagine::config {

namespace {

Result ConfigFail(const std::string& msg) {
    return Result::Fail(ErrorKind::ConfigError, EINVAL, "Config: " + msg);
}

Result FillFromJson(const nlohmann::json& j, ImagineConfig& cfg) {
    std::string err;
    bool present = false;

    if (!detail::GetStringIfPresent(j, "CacheRoot", cfg.cache_root, present, err))
        return ConfigFail(err);
    if (present && cfg.cache_root.empty())
        return ConfigFail("CacheRoot must not be empty");

    if (!detail::GetU64IfPresent(j, "ChunkSize", cfg.chunk_size, present, err))
        return ConfigFail(err);
    if (cfg.chunk_size == 0)
        return ConfigFail("ChunkSize must be greater than zero");

    struct U64Key {
        const char* key;
        std::uint64_t* dst;
    };
    const U64Key keys[] = {
        {"ProgressIntervalMs", &cfg.progress_interval_ms},
        {"FsyncIntervalBytes", &cfg.fsync_interval_bytes},
        {"ConnectTimeoutSec", &cfg.connect_timeout_sec},
        {"LowSpeedLimitBytes", &cfg.low_speed_limit_bytes},
        {"LowSpeedTimeSec", &cfg.low_speed_time_sec},
    };
    for (const auto& k : keys) {
        if (!detail::GetU64IfPresent(j, k.key, *k.dst, present, err))
            return ConfigFail(err);
    }

    std::string level;
    if (!detail::GetStringIfPresent(j, "LogLevel", level, present, err))
        return ConfigFail(err);
    if (present) {
        cfg.log_level = ParseLogLevel(level);
        if (!cfg.log_level)
            return ConfigFail("unknown LogLevel '" + level + "'");
    }

    return Result::Ok();
}

} // namespace

void ImagineConfig::Reset() {
    *this = ImagineConfig{};
}

Result ImagineConfig::LoadFile(const std::string& path, bool required) {
    Reset();

    struct stat st {};
    if (::stat(path.c_str(), &st) != 0 && errno == ENOENT) {
        if (!required) return Result::Ok();
        return Result::Fail(ErrorKind::ConfigError, ENOENT, "Config: cannot open " + path);
    }

    nlohmann::json j;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, j, err)) {
        return ConfigFail(err);
    }

    auto r = FillFromJson(j, *this);
    if (!r.is_ok()) {
        r.msg += " in " + path;
    }
    return r;
}

Result ImagineConfig::LoadJson(const std::string& text) {
    Reset();

    nlohmann::json j;
    std::string err;
    if (!detail::ParseJsonObject(text, j, err)) {
        return ConfigFail(err);
    }
    return FillFromJson(j, *this);
}

std::string ImagineConfig::DownloadDir() const {
    return JoinPath(cache_root, "download");
}

std::string ImagineConfig::ImageDir() const {
    return JoinPath(cache_root, "images");
}

TransferOptions ImagineConfig::MakeTransferOptions() const {
    TransferOptions opt;
    opt.chunk_size = static_cast<std::size_t>(chunk_size);
    opt.progress_interval_ms = progress_interval_ms;
    opt.fsync_interval_bytes = fsync_interval_bytes;
    return opt;
}

HttpOptions ImagineConfig::MakeHttpOptions() const {
    HttpOptions opt;
    opt.connect_timeout_sec = static_cast<long>(connect_timeout_sec);
    opt.low_speed_limit_bytes = static_cast<long>(low_speed_limit_bytes);
    opt.low_speed_time_sec = static_cast<long>(low_speed_time_sec);
    return opt;
}

} // namespace imagine::config
