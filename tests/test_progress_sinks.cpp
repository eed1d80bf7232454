#include "transfer/progress_sinks.hpp"
#include "transfer/transfer_engine.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

TEST(ProgressSinksTest, HumanSize) {
    EXPECT_EQ(imagine::HumanSize(0), "0 B");
    EXPECT_EQ(imagine::HumanSize(1023), "1023 B");
    EXPECT_EQ(imagine::HumanSize(1536), "1.5 KiB");
    EXPECT_EQ(imagine::HumanSize(3.0 * 1024 * 1024 * 1024), "3.0 GiB");
}

TEST(ProgressSinksTest, FormatClock) {
    EXPECT_EQ(imagine::FormatClock(0), "00:00:00");
    EXPECT_EQ(imagine::FormatClock(3725.9), "01:02:05");
    EXPECT_EQ(imagine::FormatClock(-1), "--:--:--");
}

TEST(ProgressSinksTest, KnownTotalLineHasBarPercentAndEta) {
    auto s = imagine::TransferEngine::MakeSample(512 * 1024, 1024 * 1024, 2.0);
    const std::string line = imagine::RenderProgressLine(s, 10);
    EXPECT_EQ(line, "512.0 KiB in 00:00:02 @ 256.0 KiB/sec [=====     ]  50% eta 00:00:02");
}

TEST(ProgressSinksTest, UnknownTotalLineHasNoBar) {
    auto s = imagine::TransferEngine::MakeSample(2048, std::nullopt, 1.0);
    const std::string line = imagine::RenderProgressLine(s);
    EXPECT_EQ(line, "2.0 KiB in 00:00:01 @ 2.0 KiB/sec");
}

TEST(ProgressSinksTest, ConsoleSinkClearsLineOnComplete) {
    std::FILE* sink = std::tmpfile();
    ASSERT_NE(sink, nullptr);

    imagine::ConsoleProgressSink console("write", sink);
    console.OnProgress(imagine::TransferEngine::MakeSample(10, 20, 1.0));
    EXPECT_TRUE(imagine::IsProgressLineActive());
    console.OnComplete();
    EXPECT_FALSE(imagine::IsProgressLineActive());

    std::rewind(sink);
    char buf[256]{};
    const size_t n = std::fread(buf, 1, sizeof(buf) - 1, sink);
    std::fclose(sink);

    const std::string out(buf, n);
    EXPECT_EQ(out.rfind("\r[write] ", 0), 0u);
    EXPECT_EQ(out.back(), '\n');
}

} // namespace
