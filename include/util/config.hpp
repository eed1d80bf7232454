#pragma once

#include "io/http_reader.hpp"
#include "transfer/transfer_engine.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace imagine::config {

inline constexpr const char* kDefaultConfigPath = "/etc/imagine/imagine.conf";

class ImagineConfig {
public:
    std::string cache_root = "/var/tmp/imagine-pi";
    std::uint64_t chunk_size = 40960;
    std::uint64_t progress_interval_ms = 1000;
    std::uint64_t fsync_interval_bytes = 1024 * 1024ULL;
    std::uint64_t connect_timeout_sec = 15;
    std::uint64_t low_speed_limit_bytes = 1000;
    std::uint64_t low_speed_time_sec = 30;
    std::optional<LogLevel> log_level;

    // Missing file is only an error when `required` is set.
    Result LoadFile(const std::string& path, bool required);
    Result LoadJson(const std::string& text);

    void Reset();

    std::string DownloadDir() const;
    std::string ImageDir() const;
    TransferOptions MakeTransferOptions() const;
    HttpOptions MakeHttpOptions() const;
};

} // namespace imagine::config
