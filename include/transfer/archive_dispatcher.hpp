#pragma once

#include "cache/hash_cache.hpp"
#include "io/io.hpp"
#include "system/signals.hpp"
#include "transfer/progress.hpp"
#include "transfer/transfer_engine.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace imagine {

enum class ArchiveFormat {
    Zip,
    Xz,
    Gzip,
};

const char* ToString(ArchiveFormat format);

// By the extension of the last path component. UnsupportedFormat names the
// offending extension.
std::expected<ArchiveFormat, Result> DetectArchiveFormat(const std::string& archive_path);

// Builds (does not open) the source that yields the decompressed image.
// `member` is only used for zip archives; `expected_size` only for xz/gz.
Result MakeArchiveSource(const std::string& archive_path,
                         const std::string& member,
                         std::optional<std::uint64_t> expected_size,
                         std::unique_ptr<IReader>& out);

struct ExtractRequest {
    std::string archive_path;
    std::string image_path;                    // basename doubles as the zip member
    std::optional<std::uint64_t> expected_size; // decompressed size from the catalog
};

class ArchiveExtractor {
public:
    ArchiveExtractor(const TransferEngine& engine, const HashCache& cache);

    // Decompresses into image_path, storing the image's sidecar on success.
    // `digest` receives the sha256 of the bytes written, empty unless the
    // extraction completed.
    Result Extract(const ExtractRequest& req,
                   const CancelToken* cancel = nullptr,
                   IProgress* progress = nullptr,
                   std::string* digest = nullptr) const;

private:
    const TransferEngine& engine_;
    const HashCache& cache_;
};

} // namespace imagine
