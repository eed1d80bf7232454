#include "cache/hash_cache.hpp"

#include "crypto/sha256.hpp"
#include "io/atomic_file.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

#include <nlohmann/json.hpp>

namespace imagine {

using json = nlohmann::json;

namespace {

constexpr const char* kSidecarSuffix = ".sha256";
constexpr const char* kKeyDigest = "sha256";
constexpr const char* kKeyMtime = "mtime";
constexpr const char* kKeyTag = "_hash";

} // namespace

Result ModifiedTimeNs(const std::string& path, std::int64_t& out) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        const int e = errno;
        return Result::Fail(e == ENOENT ? ErrorKind::NotFound : ErrorKind::OpenError,
                            e,
                            "stat failed: " + path + " (" + std::strerror(e) + ")");
    }
    if (!S_ISREG(st.st_mode)) {
        return Result::Fail(ErrorKind::OpenError, EINVAL, "not a regular file: " + path);
    }
    out = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
          static_cast<std::int64_t>(st.st_mtim.tv_nsec);
    return Result::Ok();
}

std::string HashCache::SidecarPath(const std::string& data_path) {
    return JoinPath(DirName(data_path), "." + BaseName(data_path) + kSidecarSuffix);
}

std::string HashCache::IntegrityTag(const std::string& sha256, std::int64_t mtime_ns) {
    // nlohmann::json keeps object keys sorted, so dump() is canonical.
    const json canonical = {{kKeyDigest, sha256}, {kKeyMtime, mtime_ns}};
    return Sha256Hex(canonical.dump());
}

std::expected<HashRecord, std::string> HashCache::LoadRecord(const std::string& data_path) const {
    const std::string sidecar = SidecarPath(data_path);

    std::ifstream is(sidecar, std::ios::binary);
    if (!is.good()) {
        return std::unexpected("no sidecar: " + sidecar);
    }
    std::stringstream ss;
    ss << is.rdbuf();

    const json j = json::parse(ss.str(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        return std::unexpected("sidecar is not a JSON object: " + sidecar);
    }

    const auto digest = j.find(kKeyDigest);
    const auto mtime = j.find(kKeyMtime);
    const auto tag = j.find(kKeyTag);
    if (digest == j.end() || !digest->is_string() ||
        mtime == j.end() || !mtime->is_number_integer() ||
        tag == j.end() || !tag->is_string()) {
        return std::unexpected("sidecar missing fields: " + sidecar);
    }

    HashRecord rec;
    rec.sha256 = digest->get<std::string>();
    rec.mtime_ns = mtime->get<std::int64_t>();
    rec.tag = tag->get<std::string>();

    if (IntegrityTag(rec.sha256, rec.mtime_ns) != rec.tag) {
        return std::unexpected("sidecar integrity tag mismatch: " + sidecar);
    }
    return rec;
}

Result HashCache::Store(const std::string& data_path, const std::string& sha256, HashRecord* out) const {
    HashRecord rec;
    auto mr = ModifiedTimeNs(data_path, rec.mtime_ns);
    if (!mr.is_ok()) return mr;

    rec.sha256 = NormalizeHex(sha256);
    rec.tag = IntegrityTag(rec.sha256, rec.mtime_ns);

    const json j = {{kKeyDigest, rec.sha256}, {kKeyMtime, rec.mtime_ns}, {kKeyTag, rec.tag}};
    auto wr = WriteFileAtomically(SidecarPath(data_path), j.dump(2) + "\n");
    if (!wr.is_ok()) return wr;

    LogDebug("stored sha256 %s for %s", rec.sha256.c_str(), data_path.c_str());
    if (out) *out = std::move(rec);
    return Result::Ok();
}

Result HashCache::Compute(const std::string& data_path, std::string& digest) const {
    std::int64_t before = 0;
    auto mr = ModifiedTimeNs(data_path, before);
    if (!mr.is_ok()) return mr;

    auto hr = Sha256HexFile(data_path, digest, chunk_size_);
    if (!hr.is_ok()) return hr;

    std::int64_t after = 0;
    mr = ModifiedTimeNs(data_path, after);
    if (!mr.is_ok()) return mr;
    if (after != before) {
        return Result::Fail(ErrorKind::ReadError, EAGAIN, "file modified while hashing: " + data_path);
    }
    return Result::Ok();
}

Result HashCache::ComputeAndStore(const std::string& data_path, HashRecord& out) const {
    std::string digest;
    auto r = Compute(data_path, digest);
    if (!r.is_ok()) return r;
    return Store(data_path, digest, &out);
}

bool HashCache::IsValid(const std::string& data_path, const std::string& expected_sha256) const {
    if (expected_sha256.empty()) return false;

    std::int64_t mtime = 0;
    auto mr = ModifiedTimeNs(data_path, mtime);
    if (!mr.is_ok()) {
        LogDebug("cache miss: %s", mr.msg.c_str());
        return false;
    }

    const std::string expected = NormalizeHex(expected_sha256);

    auto rec = LoadRecord(data_path);
    if (rec && rec->mtime_ns == mtime) {
        return NormalizeHex(rec->sha256) == expected;
    }

    if (!rec) {
        LogDebug("%s, rehashing %s", rec.error().c_str(), data_path.c_str());
    } else {
        LogDebug("sidecar mtime is stale, rehashing %s", data_path.c_str());
    }

    std::string digest;
    auto cr = Compute(data_path, digest);
    if (!cr.is_ok()) {
        LogWarn("cannot hash %s: %s", data_path.c_str(), cr.msg.c_str());
        return false;
    }

    // The answer comes from the fresh digest whether or not it can be kept.
    auto sr = Store(data_path, digest);
    if (!sr.is_ok()) {
        LogWarn("cannot store hash for %s: %s", data_path.c_str(), sr.msg.c_str());
    }
    return NormalizeHex(digest) == expected;
}

} // namespace imagine
