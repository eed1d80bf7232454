#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

namespace imagine {

// Content of the sidecar stored next to a cached data file.
struct HashRecord {
    std::string sha256;        // digest of the data file
    std::int64_t mtime_ns = 0; // data file mtime when the digest was taken
    std::string tag;           // sha256 over the canonical {mtime, sha256} object
};

// Nanosecond modification time of a regular file.
// NotFound when missing, OpenError when it is not a regular file.
Result ModifiedTimeNs(const std::string& path, std::int64_t& out);

class HashCache {
public:
    explicit HashCache(std::size_t chunk_size = 40960) : chunk_size_(chunk_size) {}

    // "<dir>/.<name>.sha256"
    static std::string SidecarPath(const std::string& data_path);

    static std::string IntegrityTag(const std::string& sha256, std::int64_t mtime_ns);

    // Parses the sidecar and checks its integrity tag. Does not look at the data file.
    std::expected<HashRecord, std::string> LoadRecord(const std::string& data_path) const;

    // Persists a digest computed elsewhere against the file's current mtime.
    Result Store(const std::string& data_path, const std::string& sha256, HashRecord* out = nullptr) const;

    // Hashes the whole file; ReadError if its mtime moves while reading.
    Result Compute(const std::string& data_path, std::string& digest) const;

    // Hashes the whole file and persists the record. NotFound if the file is absent.
    Result ComputeAndStore(const std::string& data_path, HashRecord& out) const;

    // True when the file content matches expected_sha256. A sidecar is trusted
    // only when its tag verifies and its mtime equals the file's; otherwise the
    // file is hashed again and the sidecar rewritten. A sidecar that cannot be
    // written does not change the answer.
    bool IsValid(const std::string& data_path, const std::string& expected_sha256) const;

private:
    std::size_t chunk_size_;
};

} // namespace imagine
