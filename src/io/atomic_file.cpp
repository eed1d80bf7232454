#include "io/atomic_file.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace imagine {

namespace {

Result Errno(int e, const std::string& what) {
    return Result::Fail(ErrorKind::WriteError, e, what + " (" + std::strerror(e) + ")");
}

} // namespace

Result TempFile::CreateBeside(const std::string& final_path, TempFile& out) {
    std::string tmpl = JoinPath(DirName(final_path), "." + BaseName(final_path) + ".XXXXXX");
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) return Errno(errno, "mkstemp failed for " + final_path);

    out = TempFile();
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

Result TempFile::CommitTo(const std::string& final_path) {
    if (path_.empty()) return Result::Fail(ErrorKind::WriteError, EBADF, "temp file not created");

    if (::fsync(fd_.Get()) != 0) return Errno(errno, "fsync failed for " + path_);
    if (fd_.Close() != 0) return Errno(errno, "close failed for " + path_);
    if (std::rename(path_.c_str(), final_path.c_str()) != 0) {
        return Errno(errno, "rename " + path_ + " -> " + final_path + " failed");
    }
    path_.clear();
    return Result::Ok();
}

void TempFile::Cleanup() {
    fd_.Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

Result WriteFileAtomically(const std::string& final_path, std::string_view content) {
    TempFile tmp;
    auto cr = TempFile::CreateBeside(final_path, tmp);
    if (!cr.is_ok()) return cr;

    size_t off = 0;
    while (off < content.size()) {
        const ssize_t n = ::write(tmp.GetFd(), content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Errno(errno, "write failed for " + tmp.Path());
        }
        off += static_cast<size_t>(n);
    }

    return tmp.CommitTo(final_path);
}

} // namespace imagine
