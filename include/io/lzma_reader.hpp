#pragma once

#include "io/io.hpp"

#include <lzma.h>

#include <memory>
#include <optional>
#include <vector>

namespace imagine {

// Decodes an .xz stream (concatenated streams included) read from another
// reader. The decompressed size is only in the index at the end of the file,
// so the caller supplies it.
class LzmaReader final : public IReader {
  public:
    LzmaReader(std::unique_ptr<IReader> source, std::optional<std::uint64_t> expected_size);
    ~LzmaReader() override;

    LzmaReader(const LzmaReader&) = delete;
    LzmaReader& operator=(const LzmaReader&) = delete;

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
    lzma_stream strm_ = LZMA_STREAM_INIT;
    lzma_action action_ = LZMA_RUN;
    std::vector<std::uint8_t> in_buffer_;
    bool initialized_ = false;
    bool eof_reached_ = false;
    std::string last_error_;
};

} // namespace imagine
