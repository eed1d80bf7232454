// file_writer.cpp - Writer implementation for local files and block devices.

#include "io/file_writer.hpp"

#include "util/path_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace imagine {

FileWriter::FileWriter(std::string path) : path_(std::move(path)) {}

Result FileWriter::Open() {
    if (fd_.Valid()) {
        return Result::Fail(ErrorKind::OpenError, EBUSY, "Output already open: " + path_);
    }

    if (path_ == "-") {
        fd_.Reset(STDOUT_FILENO);
        return Result::Ok();
    }

    int flags = O_WRONLY | O_CLOEXEC;
    if (!IsDevPath(path_)) {
        flags |= O_CREAT | O_TRUNC;
    }
    int fd = ::open(path_.c_str(), flags, 0644);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::OpenError,
                            e,
                            "Failed to open output: " + path_ + " (" + std::strerror(e) + ")");
    }
    fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::Close() {
    if (fd_.Close() != 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::WriteError,
                            e,
                            "Failed to close output: " + path_ + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        const int e = (n == 0) ? ENOSPC : errno;
        return Result::Fail(ErrorKind::WriteError,
                            e,
                            "Write failed: " + path_ + " (" + std::strerror(e) + ")");
    }

    return Result::Ok();
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        // Pipes and character devices cannot be synced.
        if (errno == EINVAL || errno == EROFS) return Result::Ok();
        const int e = errno;
        return Result::Fail(ErrorKind::WriteError,
                            e,
                            "fsync failed: " + path_ + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace imagine
