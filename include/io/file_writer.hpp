#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"

#include <span>
#include <string>

namespace imagine {

// Writer for a regular file (created/truncated) or a block device under /dev
// (opened in place).
class FileWriter final : public IWriter {
  public:
    explicit FileWriter(std::string path);

    Result Open() override;
    Result Close() override;
    bool IsOpen() const override { return fd_.Valid(); }
    std::string Describe() const override { return path_; }

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace imagine
