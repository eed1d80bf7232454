#pragma once

#include "cache/hash_cache.hpp"
#include "io/io.hpp"
#include "system/signals.hpp"
#include "transfer/progress.hpp"
#include "transfer/transfer_engine.hpp"
#include "util/config.hpp"
#include "util/image_descriptor.hpp"
#include "util/result.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace imagine {

enum class Phase {
    Download,
    Extract,
    Write,
};

const char* ToString(Phase phase);

// Basename of the URL path; empty when the URL names no file.
std::string ArchiveFileName(std::string_view url);

// "raspios.img.xz" -> "raspios.img", "raspios.zip" -> "raspios.img".
std::string ImageFileName(std::string_view archive_name);

// Download -> cache -> extract -> device. Every stage runs through one
// TransferEngine built from the configuration.
class ImagePipeline {
public:
    using PhaseCallback = std::function<void(Phase)>;
    using SourceFactory = std::function<std::unique_ptr<IReader>(const std::string& url)>;

    explicit ImagePipeline(const config::ImagineConfig& cfg);

    // Called before each stage that actually moves bytes.
    void SetPhaseCallback(PhaseCallback cb) { on_phase_ = std::move(cb); }

    // Replaces how the archive URL is opened (HttpReader, or FileReader for
    // plain paths).
    void SetSourceFactory(SourceFactory f) { make_source_ = std::move(f); }

    std::string ArchivePath(const ImageDescriptor& d) const;
    std::string ImagePath(const ImageDescriptor& d) const;

    // Makes sure a valid decompressed image sits in the image cache.
    Result PrepareImage(const ImageDescriptor& d,
                        std::string& image_path,
                        const CancelToken* cancel = nullptr,
                        IProgress* progress = nullptr) const;

    // Copies the image onto the device, then flushes it.
    Result WriteToDevice(const std::string& image_path,
                         const std::string& device,
                         const CancelToken* cancel = nullptr,
                         IProgress* progress = nullptr) const;

    Result Install(const ImageDescriptor& d,
                   const std::string& device,
                   const CancelToken* cancel = nullptr,
                   IProgress* progress = nullptr) const;

private:
    Result Download(const ImageDescriptor& d,
                    const std::string& archive_path,
                    const CancelToken* cancel,
                    IProgress* progress) const;
    void Enter(Phase phase) const;

    const config::ImagineConfig& cfg_;
    HashCache cache_;
    TransferEngine engine_;
    PhaseCallback on_phase_;
    SourceFactory make_source_;
};

} // namespace imagine
