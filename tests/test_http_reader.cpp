#include "io/http_reader.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

// libcurl's file:// handler drives the same multi-handle pump as HTTP without
// a server. It cannot be paused, so the payload stays below the buffer limit.
TEST(HttpReaderTests, FileUrlDeliversExactBytes) {
    testutil::TemporaryDirectory tmp;
    const auto data = testutil::Pattern(200 * 1024 + 11);
    const std::string p = tmp.File("payload.bin");
    testutil::WriteFile(p, data);

    imagine::HttpOptions opt;
    opt.max_buffered_bytes = 1024 * 1024;
    imagine::HttpReader r("file://" + p, opt);

    auto res = r.Open();
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(r.IsOpen());
    if (r.TotalSize()) {
        EXPECT_EQ(*r.TotalSize(), data.size());
    }

    auto out = testutil::ReadAll(r, 40960);
    ASSERT_TRUE(out.has_value()) << r.LastError();
    EXPECT_EQ(out->size(), data.size());
    EXPECT_EQ(*out, testutil::AsString(data));

    EXPECT_TRUE(r.Close().is_ok());
    EXPECT_FALSE(r.IsOpen());
}

TEST(HttpReaderTests, MissingFileUrlFailsOpen) {
    testutil::TemporaryDirectory tmp;
    imagine::HttpReader r("file://" + tmp.File("absent.bin"));

    auto res = r.Open();
    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, imagine::ErrorKind::OpenError);
    EXPECT_FALSE(r.IsOpen());
}

TEST(HttpReaderTests, ConnectionRefusedFailsOpen) {
    imagine::HttpOptions opt;
    opt.connect_timeout_sec = 2;
    imagine::HttpReader r("http://127.0.0.1:1/image.img.xz", opt);

    auto res = r.Open();
    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, imagine::ErrorKind::OpenError);
    EXPECT_NE(res.msg.find("127.0.0.1"), std::string::npos);
    EXPECT_FALSE(r.IsOpen());
}

} // namespace
