#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace imagine {

FileReader::FileReader(std::string path) : path_(std::move(path)) {}

Result FileReader::Open() {
    if (fd_.Valid()) {
        return Result::Fail(ErrorKind::OpenError, EBUSY, "Input already open: " + path_);
    }

    if (path_ == "-") {
        fd_.Reset(STDIN_FILENO);
        size_ = std::nullopt;
        return Result::Ok();
    }

    int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e == ENOENT ? ErrorKind::NotFound : ErrorKind::OpenError,
                            e,
                            "Failed to open input: " + path_ + " (" + std::strerror(e) + ")");
    }
    fd_.Reset(fd);

    // Pipes and devices have no size worth trusting before they are drained.
    struct stat st{};
    if (::fstat(fd, &st) == 0 && S_ISREG(st.st_mode)) {
        size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        size_ = std::nullopt;
    }

    return Result::Ok();
}

Result FileReader::Close() {
    if (fd_.Close() != 0) {
        const int e = errno;
        return Result::Fail(ErrorKind::ReadError,
                            e,
                            "Failed to close input: " + path_ + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    if (!fd_.Valid()) {
        last_error_ = "input not open: " + path_;
        return -1;
    }
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        last_error_ = path_ + ": " + std::strerror(errno);
        return -1;
    }
}

} // namespace imagine
