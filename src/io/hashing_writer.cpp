#include "io/hashing_writer.hpp"

#include "util/logger.hpp"

namespace imagine {

HashingWriter::HashingWriter(std::unique_ptr<IWriter> inner,
                             std::string record_path,
                             const HashCache& cache)
    : inner_(std::move(inner)), record_path_(std::move(record_path)), cache_(cache) {}

Result HashingWriter::Open() {
    auto r = inner_->Open();
    if (!r.is_ok()) return r;
    hasher_ = std::make_unique<Sha256Hasher>();
    failed_ = false;
    digest_.clear();
    return Result::Ok();
}

Result HashingWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (hasher_) hasher_->Update(in);
    auto r = inner_->WriteAll(in);
    if (!r.is_ok()) failed_ = true;
    return r;
}

Result HashingWriter::Close() {
    const bool was_open = inner_->IsOpen();
    auto r = inner_->Close();
    if (!was_open || !hasher_) return r;

    auto hasher = std::move(hasher_);
    if (!r.is_ok() || failed_) return r;

    digest_ = hasher->FinalHex();
    if (digest_.empty()) {
        LogWarn("sha256 unavailable for %s, not caching", record_path_.c_str());
        return r;
    }

    // The data is intact even if the sidecar cannot be written; the next
    // validation just rehashes.
    auto sr = cache_.Store(record_path_, digest_);
    if (!sr.is_ok()) {
        LogWarn("cannot store hash for %s: %s", record_path_.c_str(), sr.msg.c_str());
    }
    return r;
}

} // namespace imagine
