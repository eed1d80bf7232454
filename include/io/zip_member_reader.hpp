#pragma once

#include "io/io.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <optional>
#include <string>

namespace imagine {

// Streams one member of a zip archive. Only that member's decompressed bytes
// are exposed; Close() releases the member and the archive together.
class ZipMemberReader final : public IReader {
public:
    ZipMemberReader(std::string archive_path, std::string member_name);
    ~ZipMemberReader() override;

    ZipMemberReader(const ZipMemberReader&) = delete;
    ZipMemberReader& operator=(const ZipMemberReader&) = delete;

    Result Open() override;
    Result Close() override;
    bool IsOpen() const override { return ar_ != nullptr; }
    std::string Describe() const override { return archive_path_ + ":" + member_name_; }

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    std::string LastError() const override { return last_error_; }

private:
    std::string ArchiveError() const;

    std::string archive_path_;
    std::string member_name_;
    struct archive* ar_ = nullptr;
    std::optional<std::uint64_t> size_;
    std::string last_error_;
};

} // namespace imagine
