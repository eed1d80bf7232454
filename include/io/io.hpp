#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <sys/types.h>

namespace imagine {

// A source or sink of bytes that is opened and closed as a unit.
// Open() must leave nothing held when it fails. Close() is idempotent and
// releases everything even after an earlier error.
class IEndpoint {
public:
    virtual ~IEndpoint() = default;
    virtual Result Open() = 0;
    virtual Result Close() = 0;
    virtual bool IsOpen() const = 0;

    // Path, URL or "archive:member" used in log and error messages.
    virtual std::string Describe() const = 0;
};

class IReader : public IEndpoint {
public:
    // Returns bytes read, 0 at end of stream, -1 on failure (see LastError()).
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;

    // nullopt means the total is not knowable before consuming the stream.
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }

    virtual std::string LastError() const { return {}; }
};

class IWriter : public IEndpoint {
public:
    virtual Result WriteAll(std::span<const std::uint8_t> in) = 0;
    virtual Result FsyncNow() = 0;
};

} // namespace imagine
