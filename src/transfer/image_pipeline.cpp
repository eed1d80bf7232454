#include "transfer/image_pipeline.hpp"

#include "crypto/sha256.hpp"
#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/hashing_writer.hpp"
#include "io/http_reader.hpp"
#include "transfer/archive_dispatcher.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <optional>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>

namespace imagine {

namespace {

// mkdir -p
Result EnsureDirectory(const std::string& path) {
    if (path.empty() || path == "/" || path == ".") return Result::Ok();

    struct stat st {};
    if (::stat(path.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) return Result::Ok();
        return Result::Fail(ErrorKind::WriteError, ENOTDIR, "Not a directory: " + path);
    }

    auto r = EnsureDirectory(DirName(path));
    if (!r.is_ok()) return r;

    if (::mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
        const int e = errno;
        return Result::Fail(ErrorKind::WriteError, e, "mkdir " + path + ": " + std::strerror(e));
    }
    return Result::Ok();
}

bool HasScheme(const std::string& url) {
    return url.find("://") != std::string::npos;
}

// "file:///srv/x.xz" and "file://localhost/srv/x.xz" name local paths.
std::optional<std::string> LocalFilePath(const std::string& url) {
    constexpr std::string_view kFileScheme = "file://";
    if (url.rfind(kFileScheme, 0) != 0) return std::nullopt;
    std::string rest = url.substr(kFileScheme.size());
    if (rest.rfind("localhost/", 0) == 0) rest.erase(0, std::string_view("localhost").size());
    if (rest.empty() || rest.front() != '/') return std::nullopt;
    return rest;
}

} // namespace

const char* ToString(Phase phase) {
    switch (phase) {
        case Phase::Download: return "download";
        case Phase::Extract:  return "extract";
        case Phase::Write:    return "write";
    }
    return "unknown";
}

std::string ArchiveFileName(std::string_view url) {
    if (url.find("://") == std::string_view::npos) return BaseName(url);
    return UrlFileName(url);
}

std::string ImageFileName(std::string_view archive_name) {
    std::string name = StripExtension(archive_name);
    if (Extension(name) == ".img") name = StripExtension(name);
    return name + ".img";
}

ImagePipeline::ImagePipeline(const config::ImagineConfig& cfg)
    : cfg_(cfg),
      cache_(static_cast<std::size_t>(cfg.chunk_size)),
      engine_(cfg.MakeTransferOptions()) {
    make_source_ = [http = cfg.MakeHttpOptions()](const std::string& url) -> std::unique_ptr<IReader> {
        // libcurl cannot pause file:// transfers, so those never reach HttpReader.
        if (auto local = LocalFilePath(url)) return std::make_unique<FileReader>(*local);
        if (HasScheme(url)) return std::make_unique<HttpReader>(url, http);
        return std::make_unique<FileReader>(url);
    };
}

std::string ImagePipeline::ArchivePath(const ImageDescriptor& d) const {
    return JoinPath(cfg_.DownloadDir(), ArchiveFileName(d.url));
}

std::string ImagePipeline::ImagePath(const ImageDescriptor& d) const {
    return JoinPath(cfg_.ImageDir(), ImageFileName(ArchiveFileName(d.url)));
}

void ImagePipeline::Enter(Phase phase) const {
    LogInfo("phase: %s", ToString(phase));
    if (on_phase_) on_phase_(phase);
}

Result ImagePipeline::Download(const ImageDescriptor& d,
                               const std::string& archive_path,
                               const CancelToken* cancel,
                               IProgress* progress) const {
    std::unique_ptr<IReader> source = make_source_(d.url);
    HashingWriter sink(std::make_unique<FileWriter>(archive_path), archive_path, cache_);

    Enter(Phase::Download);
    auto r = engine_.Run(*source, sink, cancel, progress);
    if (!r.is_ok()) return r;

    if (d.image_download_sha256 && NormalizeHex(sink.Digest()) != NormalizeHex(*d.image_download_sha256)) {
        return Result::Fail(ErrorKind::VerifyError,
                            EBADMSG,
                            "Downloaded archive " + archive_path + " has sha256 " + sink.Digest() +
                                ", expected " + *d.image_download_sha256);
    }
    return Result::Ok();
}

Result ImagePipeline::PrepareImage(const ImageDescriptor& d,
                                   std::string& image_path,
                                   const CancelToken* cancel,
                                   IProgress* progress) const {
    const std::string archive_name = ArchiveFileName(d.url);
    if (archive_name.empty()) {
        return Result::Fail(ErrorKind::OpenError, EINVAL, "Cannot derive an archive name from " + d.url);
    }

    auto r = EnsureDirectory(cfg_.DownloadDir());
    if (!r.is_ok()) return r;
    r = EnsureDirectory(cfg_.ImageDir());
    if (!r.is_ok()) return r;

    const std::string archive_path = ArchivePath(d);
    image_path = ImagePath(d);

    if (d.extract_sha256 && cache_.IsValid(image_path, *d.extract_sha256)) {
        LogInfo("using cached image %s", image_path.c_str());
        return Result::Ok();
    }

    // Fail before any network traffic when the archive type is unusable.
    auto format = DetectArchiveFormat(archive_path);
    if (!format) return format.error();

    if (d.image_download_sha256 && cache_.IsValid(archive_path, *d.image_download_sha256)) {
        LogInfo("using cached archive %s", archive_path.c_str());
    } else {
        r = Download(d, archive_path, cancel, progress);
        if (!r.is_ok()) return r;
    }

    ArchiveExtractor extractor(engine_, cache_);
    Enter(Phase::Extract);
    std::string digest;
    r = extractor.Extract({archive_path, image_path, d.extract_size}, cancel, progress, &digest);
    if (!r.is_ok()) return r;

    if (d.extract_sha256) {
        if (digest.empty()) {
            return Result::Fail(ErrorKind::VerifyError, EBADMSG, "No sha256 available for extracted image " + image_path);
        }
        if (NormalizeHex(digest) != NormalizeHex(*d.extract_sha256)) {
            return Result::Fail(ErrorKind::VerifyError,
                                EBADMSG,
                                "Extracted image " + image_path + " has sha256 " + digest + ", expected " +
                                    *d.extract_sha256);
        }
    }
    return Result::Ok();
}

Result ImagePipeline::WriteToDevice(const std::string& image_path,
                                    const std::string& device,
                                    const CancelToken* cancel,
                                    IProgress* progress) const {
    FileReader source(image_path);
    FileWriter sink(device);

    Enter(Phase::Write);
    auto r = engine_.Run(source, sink, cancel, progress);
    if (!r.is_ok()) return r;

    ::sync();
    LogInfo("%s written to %s", BaseName(image_path).c_str(), device.c_str());
    return Result::Ok();
}

Result ImagePipeline::Install(const ImageDescriptor& d,
                              const std::string& device,
                              const CancelToken* cancel,
                              IProgress* progress) const {
    LogInfo("installing %s onto %s", d.name.c_str(), device.c_str());

    std::string image_path;
    auto r = PrepareImage(d, image_path, cancel, progress);
    if (!r.is_ok()) return r;

    return WriteToDevice(image_path, device, cancel, progress);
}

} // namespace imagine
