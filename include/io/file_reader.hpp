#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace imagine {

// Reads a local file, or stdin when the path is "-".
class FileReader final : public IReader {
public:
    explicit FileReader(std::string path);

    Result Open() override;
    Result Close() override;
    bool IsOpen() const override { return fd_.Valid(); }
    std::string Describe() const override { return path_; }

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;
    std::string LastError() const override { return last_error_; }

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
    std::string last_error_;
};

} // namespace imagine
