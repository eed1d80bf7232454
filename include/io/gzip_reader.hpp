#pragma once

#include "io/io.hpp"

#include <memory>
#include <optional>
#include <vector>
#include <zlib.h>

namespace imagine {

// Inflates a gzip stream (multi-member files included) read from another reader.
// Zero bytes after a complete member are padding and are skipped.
// gzip's trailer only stores the size modulo 2^32, so the decompressed size
// is whatever the caller says it is.
class GzipReader final : public IReader {
  public:
    GzipReader(std::unique_ptr<IReader> source, std::optional<std::uint64_t> expected_size);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    Result Open() override;
    Result Close() override;
    bool IsOpen() const override { return initialized_; }
    std::string Describe() const override;

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return expected_size_; }
    std::string LastError() const override { return last_error_; }

  private:
    std::unique_ptr<IReader> source_;
    std::optional<std::uint64_t> expected_size_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool initialized_ = false;
    bool eof_reached_ = false;
    bool in_member_ = false;
    bool member_done_ = false;
    std::string last_error_;
};

} // namespace imagine
