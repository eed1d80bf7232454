#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace imagine {

std::string Sha256Hex(std::span<const std::uint8_t> data);
std::string Sha256Hex(std::string_view text);

// Drains an already opened reader. Empty string on read or digest failure.
std::string Sha256Hex(IReader& reader, std::size_t chunk_size = 64 * 1024);

// NotFound when the file is missing, ReadError on I/O failure.
Result Sha256HexFile(const std::string& path, std::string& out_hex, std::size_t chunk_size = 64 * 1024);

// Lowercases a hex digest so expected values from catalogs compare equal.
std::string NormalizeHex(std::string s);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    void Update(std::span<const std::uint8_t> data);

    // Empty when the context failed at any point.
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace imagine
