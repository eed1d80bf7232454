#pragma once

#include "cache/hash_cache.hpp"
#include "crypto/sha256.hpp"
#include "io/io.hpp"

#include <memory>
#include <string>

namespace imagine {

// Feeds every written chunk to a SHA-256 accumulator before handing it to the
// wrapped writer. When the wrapped writer closes cleanly after a fully
// successful write sequence, the digest is stored as the sidecar of
// record_path.
class HashingWriter final : public IWriter {
public:
    HashingWriter(std::unique_ptr<IWriter> inner, std::string record_path, const HashCache& cache);

    Result Open() override;
    Result Close() override;
    bool IsOpen() const override { return inner_ && inner_->IsOpen(); }
    std::string Describe() const override { return inner_ ? inner_->Describe() : record_path_; }

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override { return inner_->FsyncNow(); }

    // Digest of the last completed write sequence (empty until Close()).
    const std::string& Digest() const { return digest_; }

private:
    std::unique_ptr<IWriter> inner_;
    std::string record_path_;
    const HashCache& cache_;
    std::unique_ptr<Sha256Hasher> hasher_;
    bool failed_ = false;
    std::string digest_;
};

} // namespace imagine
