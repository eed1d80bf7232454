#include "transfer/archive_dispatcher.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "io/gzip_reader.hpp"
#include "io/hashing_writer.hpp"
#include "io/lzma_reader.hpp"
#include "io/zip_member_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>

namespace imagine {

const char* ToString(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip:  return "zip";
        case ArchiveFormat::Xz:   return "xz";
        case ArchiveFormat::Gzip: return "gzip";
    }
    return "unknown";
}

std::expected<ArchiveFormat, Result> DetectArchiveFormat(const std::string& archive_path) {
    const std::string ext = Extension(archive_path);
    if (ext == ".zip") return ArchiveFormat::Zip;
    if (ext == ".xz") return ArchiveFormat::Xz;
    if (ext == ".gz") return ArchiveFormat::Gzip;

    return std::unexpected(Result::Fail(ErrorKind::UnsupportedFormat,
                                        EINVAL,
                                        "Unsupported archive extension '" + (ext.empty() ? std::string("(none)") : ext) +
                                            "': " + archive_path));
}

Result MakeArchiveSource(const std::string& archive_path,
                         const std::string& member,
                         std::optional<std::uint64_t> expected_size,
                         std::unique_ptr<IReader>& out) {
    auto format = DetectArchiveFormat(archive_path);
    if (!format) return format.error();

    switch (*format) {
        case ArchiveFormat::Zip:
            out = std::make_unique<ZipMemberReader>(archive_path, member);
            break;
        case ArchiveFormat::Xz:
            out = std::make_unique<LzmaReader>(std::make_unique<FileReader>(archive_path), expected_size);
            break;
        case ArchiveFormat::Gzip:
            out = std::make_unique<GzipReader>(std::make_unique<FileReader>(archive_path), expected_size);
            break;
    }
    LogDebug("%s: %s strategy", archive_path.c_str(), ToString(*format));
    return Result::Ok();
}

ArchiveExtractor::ArchiveExtractor(const TransferEngine& engine, const HashCache& cache)
    : engine_(engine), cache_(cache) {}

Result ArchiveExtractor::Extract(const ExtractRequest& req,
                                 const CancelToken* cancel,
                                 IProgress* progress,
                                 std::string* digest) const {
    if (digest) digest->clear();

    std::unique_ptr<IReader> source;
    auto r = MakeArchiveSource(req.archive_path, BaseName(req.image_path), req.expected_size, source);
    if (!r.is_ok()) return r;

    HashingWriter sink(std::make_unique<FileWriter>(req.image_path), req.image_path, cache_);

    LogInfo("extracting %s from %s", BaseName(req.image_path).c_str(), req.archive_path.c_str());
    r = engine_.Run(*source, sink, cancel, progress);
    if (r.is_ok() && digest) *digest = sink.Digest();
    return r;
}

} // namespace imagine
