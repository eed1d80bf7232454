#include "testing.hpp"
#include "util/config.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

TEST(ConfigTest, DefaultsWhenDefaultFileIsMissing) {
    testutil::TemporaryDirectory tmp;
    imagine::config::ImagineConfig cfg;
    auto r = cfg.LoadFile(tmp.File("imagine.conf"), /*required=*/false);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(cfg.cache_root, "/var/tmp/imagine-pi");
    EXPECT_EQ(cfg.DownloadDir(), "/var/tmp/imagine-pi/download");
    EXPECT_EQ(cfg.ImageDir(), "/var/tmp/imagine-pi/images");
    EXPECT_EQ(cfg.chunk_size, 40960u);
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(ConfigTest, MissingExplicitFileIsAnError) {
    testutil::TemporaryDirectory tmp;
    imagine::config::ImagineConfig cfg;
    auto r = cfg.LoadFile(tmp.File("imagine.conf"), /*required=*/true);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, imagine::ErrorKind::ConfigError);
}

TEST(ConfigTest, LoadsEveryKey) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.File("imagine.conf");
    testutil::WriteFile(p, std::string(R"({
        "CacheRoot": "/srv/cache",
        "ChunkSize": 65536,
        "ProgressIntervalMs": 250,
        "FsyncIntervalBytes": 0,
        "ConnectTimeoutSec": 5,
        "LowSpeedLimitBytes": 10,
        "LowSpeedTimeSec": 60,
        "LogLevel": "debug"
    })"));

    imagine::config::ImagineConfig cfg;
    auto r = cfg.LoadFile(p, true);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(cfg.ImageDir(), "/srv/cache/images");
    ASSERT_TRUE(cfg.log_level.has_value());
    EXPECT_EQ(*cfg.log_level, imagine::LogLevel::Debug);

    const auto topt = cfg.MakeTransferOptions();
    EXPECT_EQ(topt.chunk_size, 65536u);
    EXPECT_EQ(topt.progress_interval_ms, 250u);
    EXPECT_EQ(topt.fsync_interval_bytes, 0u);

    const auto hopt = cfg.MakeHttpOptions();
    EXPECT_EQ(hopt.connect_timeout_sec, 5);
    EXPECT_EQ(hopt.low_speed_limit_bytes, 10);
    EXPECT_EQ(hopt.low_speed_time_sec, 60);
}

TEST(ConfigTest, RejectsBadValues) {
    imagine::config::ImagineConfig cfg;

    auto r = cfg.LoadJson(R"({"ChunkSize": 0})");
    EXPECT_EQ(r.kind, imagine::ErrorKind::ConfigError);

    r = cfg.LoadJson(R"({"ChunkSize": -5})");
    EXPECT_EQ(r.kind, imagine::ErrorKind::ConfigError);

    r = cfg.LoadJson(R"({"CacheRoot": 42})");
    EXPECT_EQ(r.kind, imagine::ErrorKind::ConfigError);
    EXPECT_NE(r.msg.find("CacheRoot"), std::string::npos);

    r = cfg.LoadJson(R"({"LogLevel": "loud"})");
    EXPECT_EQ(r.kind, imagine::ErrorKind::ConfigError);

    r = cfg.LoadJson("[1, 2]");
    EXPECT_EQ(r.kind, imagine::ErrorKind::ConfigError);

    r = cfg.LoadJson("{ broken");
    EXPECT_EQ(r.kind, imagine::ErrorKind::ConfigError);
}

TEST(ConfigTest, ReloadResetsToDefaults) {
    imagine::config::ImagineConfig cfg;
    ASSERT_TRUE(cfg.LoadJson(R"({"ChunkSize": 1})").is_ok());
    EXPECT_EQ(cfg.chunk_size, 1u);
    ASSERT_TRUE(cfg.LoadJson("{}").is_ok());
    EXPECT_EQ(cfg.chunk_size, 40960u);
}

} // namespace
