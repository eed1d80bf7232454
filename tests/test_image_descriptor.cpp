#include "testing.hpp"
#include "util/image_descriptor.hpp"

#include <gtest/gtest.h>
#include <string>

namespace imagine {

TEST(ImageDescriptorTest, ParsesAllFields) {
    const std::string json = R"({
        "name": "Raspberry Pi OS Lite",
        "url": "https://downloads.example.org/raspios_lite.img.xz",
        "extract_sha256": "AB12",
        "image_download_sha256": "cd34",
        "extract_size": 2147483648
    })";

    auto d = ImageDescriptorParser{}.Parse(json);
    ASSERT_TRUE(d.has_value()) << d.error();
    EXPECT_EQ(d->name, "Raspberry Pi OS Lite");
    EXPECT_EQ(d->url, "https://downloads.example.org/raspios_lite.img.xz");
    EXPECT_EQ(d->extract_sha256.value_or(""), "AB12");
    EXPECT_EQ(d->image_download_sha256.value_or(""), "cd34");
    ASSERT_TRUE(d->extract_size.has_value());
    EXPECT_EQ(*d->extract_size, 2147483648ULL);
}

TEST(ImageDescriptorTest, OptionalFieldsMayBeAbsentOrEmpty) {
    auto d = ImageDescriptorParser{}.Parse(R"({"name": "n", "url": "u", "extract_sha256": ""})");
    ASSERT_TRUE(d.has_value()) << d.error();
    EXPECT_FALSE(d->extract_sha256.has_value());
    EXPECT_FALSE(d->image_download_sha256.has_value());
    EXPECT_FALSE(d->extract_size.has_value());
}

TEST(ImageDescriptorTest, RejectsMalformedInput) {
    ImageDescriptorParser parser;

    EXPECT_EQ(parser.Parse("  ").error(), "Empty input");
    EXPECT_FALSE(parser.Parse("{oops").has_value());
    EXPECT_FALSE(parser.Parse("[]").has_value());

    auto no_url = parser.Parse(R"({"name": "n"})");
    ASSERT_FALSE(no_url.has_value());
    EXPECT_EQ(no_url.error(), "missing url");

    auto bad_size = parser.Parse(R"({"name": "n", "url": "u", "extract_size": "big"})");
    ASSERT_FALSE(bad_size.has_value());
    EXPECT_NE(bad_size.error().find("extract_size"), std::string::npos);

    EXPECT_FALSE(parser.Parse(R"({"name": 3, "url": "u"})").has_value());
}

TEST(ImageDescriptorTest, ParseFile) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.File("image.json");
    testutil::WriteFile(p, std::string(R"({"name": "n", "url": "file:///tmp/x.zip"})"));

    auto d = ImageDescriptorParser{}.ParseFile(p);
    ASSERT_TRUE(d.has_value()) << d.error();
    EXPECT_EQ(d->url, "file:///tmp/x.zip");

    auto missing = ImageDescriptorParser{}.ParseFile(tmp.File("absent.json"));
    EXPECT_FALSE(missing.has_value());
}

} // namespace imagine
