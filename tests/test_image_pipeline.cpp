#include "cache/hash_cache.hpp"
#include "crypto/sha256.hpp"
#include "testing.hpp"
#include "transfer/image_pipeline.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <string>
#include <vector>

namespace {

using imagine::Phase;

class ImagePipelineTests : public ::testing::Test {
  protected:
    void SetUp() override {
        cfg.cache_root = tmp.File("cache");
        cfg.fsync_interval_bytes = 0;
        cfg.chunk_size = 4096;

        image = testutil::Pattern(64 * 1024 + 9, 21);
        image_sha = imagine::Sha256Hex(std::span<const std::uint8_t>(image));

        remote_xz = tmp.File("raspios.img.xz");
        const auto xz = testutil::XzCompress(image);
        testutil::WriteFile(remote_xz, xz);
        archive_sha = imagine::Sha256Hex(std::span<const std::uint8_t>(xz));

        device = tmp.File("device.bin");
    }

    imagine::ImageDescriptor Descriptor(const std::string& url) const {
        imagine::ImageDescriptor d;
        d.name = "test image";
        d.url = url;
        d.extract_sha256 = image_sha;
        d.image_download_sha256 = archive_sha;
        d.extract_size = image.size();
        return d;
    }

    void Track(imagine::ImagePipeline& p) {
        p.SetPhaseCallback([this](Phase ph) { phases.push_back(ph); });
    }

    testutil::TemporaryDirectory tmp;
    imagine::config::ImagineConfig cfg;
    std::vector<std::uint8_t> image;
    std::string image_sha;
    std::string remote_xz;
    std::string archive_sha;
    std::string device;
    std::vector<Phase> phases;
};

TEST(ImageNamingTest, ArchiveAndImageNames) {
    EXPECT_EQ(imagine::ArchiveFileName("https://h/x/raspios.img.xz?dl=1"), "raspios.img.xz");
    EXPECT_EQ(imagine::ArchiveFileName("/srv/raspios.zip"), "raspios.zip");
    EXPECT_EQ(imagine::ArchiveFileName("https://h/"), "");

    EXPECT_EQ(imagine::ImageFileName("raspios.img.xz"), "raspios.img");
    EXPECT_EQ(imagine::ImageFileName("raspios.zip"), "raspios.img");
    EXPECT_EQ(imagine::ImageFileName("raspios.gz"), "raspios.img");
    EXPECT_EQ(imagine::ImageFileName("2024-03-15-raspios-bookworm-arm64.img.xz"),
              "2024-03-15-raspios-bookworm-arm64.img");
}

TEST_F(ImagePipelineTests, FullInstallPopulatesCacheAndDevice) {
    imagine::ImagePipeline pipeline(cfg);
    Track(pipeline);
    testutil::RecordingProgress progress;

    const auto d = Descriptor(remote_xz);
    auto r = pipeline.Install(d, device, nullptr, &progress);
    ASSERT_TRUE(r.is_ok()) << r.msg;

    EXPECT_EQ(testutil::ReadFile(device), image);
    EXPECT_EQ(phases, (std::vector<Phase>{Phase::Download, Phase::Extract, Phase::Write}));
    EXPECT_EQ(progress.completed, 3);

    EXPECT_EQ(pipeline.ArchivePath(d), cfg.DownloadDir() + "/raspios.img.xz");
    EXPECT_EQ(pipeline.ImagePath(d), cfg.ImageDir() + "/raspios.img");

    imagine::HashCache cache;
    EXPECT_TRUE(cache.IsValid(pipeline.ArchivePath(d), archive_sha));
    EXPECT_TRUE(cache.IsValid(pipeline.ImagePath(d), image_sha));
    EXPECT_TRUE(testutil::Exists(imagine::HashCache::SidecarPath(pipeline.ImagePath(d))));
}

TEST_F(ImagePipelineTests, CachedImageSkipsDownloadAndExtract) {
    imagine::ImagePipeline pipeline(cfg);
    const auto d = Descriptor(remote_xz);
    ASSERT_TRUE(pipeline.Install(d, device).is_ok());

    // Gone upstream; the cache must carry the second run.
    ASSERT_EQ(::unlink(remote_xz.c_str()), 0);
    ASSERT_EQ(::unlink(device.c_str()), 0);

    Track(pipeline);
    auto r = pipeline.Install(d, device);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(phases, (std::vector<Phase>{Phase::Write}));
    EXPECT_EQ(testutil::ReadFile(device), image);
}

TEST_F(ImagePipelineTests, CachedArchiveIsReExtracted) {
    imagine::ImagePipeline pipeline(cfg);
    const auto d = Descriptor(remote_xz);
    ASSERT_TRUE(pipeline.Install(d, device).is_ok());

    ASSERT_EQ(::unlink(pipeline.ImagePath(d).c_str()), 0);
    ASSERT_EQ(::unlink(remote_xz.c_str()), 0);

    Track(pipeline);
    auto r = pipeline.Install(d, device);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(phases, (std::vector<Phase>{Phase::Extract, Phase::Write}));
}

TEST_F(ImagePipelineTests, WithoutDigestsEverythingIsFetchedAgain) {
    imagine::ImagePipeline pipeline(cfg);
    auto d = Descriptor(remote_xz);
    d.extract_sha256.reset();
    d.image_download_sha256.reset();
    ASSERT_TRUE(pipeline.Install(d, device).is_ok());

    Track(pipeline);
    ASSERT_TRUE(pipeline.Install(d, device).is_ok());
    EXPECT_EQ(phases, (std::vector<Phase>{Phase::Download, Phase::Extract, Phase::Write}));
}

TEST_F(ImagePipelineTests, DownloadDigestMismatchIsVerifyError) {
    imagine::ImagePipeline pipeline(cfg);
    auto d = Descriptor(remote_xz);
    d.image_download_sha256 = std::string(64, 'f');

    auto r = pipeline.Install(d, device);
    EXPECT_EQ(r.kind, imagine::ErrorKind::VerifyError);
    EXPECT_FALSE(testutil::Exists(device));
}

TEST_F(ImagePipelineTests, ExtractDigestMismatchIsVerifyError) {
    imagine::ImagePipeline pipeline(cfg);
    auto d = Descriptor(remote_xz);
    d.extract_sha256 = std::string(64, 'e');

    auto r = pipeline.Install(d, device);
    EXPECT_EQ(r.kind, imagine::ErrorKind::VerifyError);
    EXPECT_FALSE(testutil::Exists(device));
}

TEST_F(ImagePipelineTests, UnsupportedArchiveFailsBeforeDownload) {
    const std::string tar = tmp.File("raspios.tar");
    testutil::WriteFile(tar, std::string("not used"));

    imagine::ImagePipeline pipeline(cfg);
    Track(pipeline);
    auto d = Descriptor(tar);
    d.image_download_sha256.reset();

    auto r = pipeline.Install(d, device);
    EXPECT_EQ(r.kind, imagine::ErrorKind::UnsupportedFormat);
    EXPECT_TRUE(phases.empty());
}

TEST_F(ImagePipelineTests, MissingSourceIsNotFound) {
    imagine::ImagePipeline pipeline(cfg);
    auto r = pipeline.Install(Descriptor(tmp.File("absent.img.xz")), device);
    EXPECT_EQ(r.kind, imagine::ErrorKind::NotFound);
}

TEST_F(ImagePipelineTests, CancelledInstallReportsAborted) {
    imagine::CancelToken cancel;
    cancel.Cancel();

    imagine::ImagePipeline pipeline(cfg);
    auto r = pipeline.Install(Descriptor(remote_xz), device, &cancel);
    EXPECT_TRUE(r.aborted());
    EXPECT_FALSE(testutil::Exists(device));
}

TEST_F(ImagePipelineTests, FileUrlIsReadFromLocalPath) {
    imagine::ImagePipeline pipeline(cfg);
    auto r = pipeline.Install(Descriptor("file://" + remote_xz), device);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadFile(device), image);
}

TEST_F(ImagePipelineTests, LargeFileUrlIsNotLimitedByHttpBuffer) {
    // Larger than the default HTTP buffer, so a paused curl file:// transfer would fail.
    image = testutil::Pattern(3 * 1024 * 1024 + 17, 5);
    image_sha = imagine::Sha256Hex(std::span<const std::uint8_t>(image));
    const std::string big = tmp.File("big.img.gz");
    const auto gz = testutil::GzipCompress(image);
    testutil::WriteFile(big, gz);
    archive_sha = imagine::Sha256Hex(std::span<const std::uint8_t>(gz));

    imagine::ImagePipeline pipeline(cfg);
    auto r = pipeline.Install(Descriptor("file://localhost" + big), device);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadFile(device), image);
}

TEST_F(ImagePipelineTests, ExtractDigestIsCheckedWhenSidecarCannotBeStored) {
    imagine::ImagePipeline pipeline(cfg);
    auto d = Descriptor(remote_xz);
    d.extract_sha256 = std::string(64, 'e');

    ASSERT_EQ(::mkdir(cfg.cache_root.c_str(), 0755), 0);
    ASSERT_EQ(::mkdir(cfg.ImageDir().c_str(), 0755), 0);
    ASSERT_EQ(::mkdir(imagine::HashCache::SidecarPath(pipeline.ImagePath(d)).c_str(), 0755), 0);

    auto r = pipeline.Install(d, device);
    EXPECT_EQ(r.kind, imagine::ErrorKind::VerifyError);
    EXPECT_FALSE(testutil::Exists(device));
}

TEST_F(ImagePipelineTests, MatchingImageInstallsWhenSidecarCannotBeStored) {
    imagine::ImagePipeline pipeline(cfg);
    const auto d = Descriptor(remote_xz);

    ASSERT_EQ(::mkdir(cfg.cache_root.c_str(), 0755), 0);
    ASSERT_EQ(::mkdir(cfg.ImageDir().c_str(), 0755), 0);
    ASSERT_EQ(::mkdir(imagine::HashCache::SidecarPath(pipeline.ImagePath(d)).c_str(), 0755), 0);

    auto r = pipeline.Install(d, device);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(testutil::ReadFile(device), image);
}

TEST_F(ImagePipelineTests, SourceFactoryIsUsedForDownload) {
    imagine::ImagePipeline pipeline(cfg);
    std::vector<std::string> requested;
    pipeline.SetSourceFactory([&](const std::string& url) -> std::unique_ptr<imagine::IReader> {
        requested.push_back(url);
        return std::make_unique<testutil::MemoryReader>(testutil::ReadFile(remote_xz));
    });

    const std::string url = "https://mirror.example.org/raspios.img.xz";
    auto r = pipeline.Install(Descriptor(url), device);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(requested, std::vector<std::string>{url});
    EXPECT_EQ(testutil::ReadFile(device), image);
}

} // namespace
