#include "io/zip_member_reader.hpp"

#include <cerrno>

namespace imagine {

ZipMemberReader::ZipMemberReader(std::string archive_path, std::string member_name)
    : archive_path_(std::move(archive_path)), member_name_(std::move(member_name)) {}

ZipMemberReader::~ZipMemberReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

std::string ZipMemberReader::ArchiveError() const {
    const char* em = ar_ ? archive_error_string(ar_) : nullptr;
    return em ? em : "unknown";
}

Result ZipMemberReader::Open() {
    if (ar_) return Result::Fail(ErrorKind::OpenError, EBUSY, "Archive already open: " + Describe());

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(ErrorKind::OpenError, ENOMEM, "archive_read_new failed");

    archive_read_support_format_zip(ar_);

    auto fail = [this](ErrorKind kind, int err, const std::string& msg) {
        archive_read_free(ar_);
        ar_ = nullptr;
        return Result::Fail(kind, err, msg);
    };

    if (archive_read_open_filename(ar_, archive_path_.c_str(), 10240) != ARCHIVE_OK) {
        const int e = archive_errno(ar_);
        return fail(e == ENOENT ? ErrorKind::NotFound : ErrorKind::OpenError,
                    e,
                    "Could not open archive: " + archive_path_ + " (" + ArchiveError() + ")");
    }

    struct archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar_, &entry);
        if (r == ARCHIVE_EOF) {
            return fail(ErrorKind::OpenError, ENOENT, "member " + member_name_ + " not found in " + archive_path_);
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return fail(ErrorKind::OpenError,
                        archive_errno(ar_),
                        "archive_read_next_header: " + archive_path_ + " (" + ArchiveError() + ")");
        }

        const char* name = archive_entry_pathname(entry);
        if (name && member_name_ == name && archive_entry_filetype(entry) == AE_IFREG) {
            break;
        }
        if (archive_read_data_skip(ar_) < ARCHIVE_WARN) {
            return fail(ErrorKind::OpenError,
                        archive_errno(ar_),
                        "archive_read_data_skip: " + archive_path_ + " (" + ArchiveError() + ")");
        }
    }

    if (archive_entry_size_is_set(entry) && archive_entry_size(entry) >= 0) {
        size_ = static_cast<std::uint64_t>(archive_entry_size(entry));
    } else {
        size_ = std::nullopt;
    }
    return Result::Ok();
}

Result ZipMemberReader::Close() {
    if (!ar_) return Result::Ok();
    const int r = archive_read_free(ar_);
    ar_ = nullptr;
    if (r != ARCHIVE_OK) {
        return Result::Fail(ErrorKind::ReadError, -1, "archive_read_free failed: " + archive_path_);
    }
    return Result::Ok();
}

ssize_t ZipMemberReader::Read(std::span<std::uint8_t> out) {
    if (!ar_) {
        last_error_ = "archive not open: " + Describe();
        return -1;
    }
    const la_ssize_t n = archive_read_data(ar_, out.data(), out.size());
    if (n < 0) {
        last_error_ = "archive_read_data: " + Describe() + " (" + ArchiveError() + ")";
        return -1;
    }
    return static_cast<ssize_t>(n);
}

} // namespace imagine
