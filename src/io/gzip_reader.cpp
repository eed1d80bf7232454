#include "io/gzip_reader.hpp"

#include "util/logger.hpp"

namespace imagine {

GzipReader::GzipReader(std::unique_ptr<IReader> source, std::optional<std::uint64_t> expected_size)
    : source_(std::move(source)), expected_size_(expected_size), in_buffer_(64 * 1024) {}

GzipReader::~GzipReader() {
    if (initialized_) {
        inflateEnd(&strm_);
    }
}

std::string GzipReader::Describe() const {
    return "gzip:" + source_->Describe();
}

Result GzipReader::Open() {
    auto r = source_->Open();
    if (!r.is_ok()) return r;

    strm_ = z_stream{};
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;

    // 16 + MAX_WBITS tells zlib to expect a gzip header
    if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
        if (auto cr = source_->Close(); !cr.is_ok()) {
            LogWarn("%s", cr.msg.c_str());
        }
        return Result::Fail(ErrorKind::OpenError, -1, "Failed to initialize zlib inflate for " + Describe());
    }
    initialized_ = true;
    eof_reached_ = false;
    in_member_ = false;
    member_done_ = false;
    return Result::Ok();
}

Result GzipReader::Close() {
    if (initialized_) {
        inflateEnd(&strm_);
        initialized_ = false;
    }
    return source_->Close();
}

ssize_t GzipReader::Read(std::span<std::uint8_t> out) {
    if (!initialized_) {
        last_error_ = "gzip stream not open";
        return -1;
    }
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = static_cast<uInt>(out.size());

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0) {
            ssize_t n = source_->Read(in_buffer_);
            if (n < 0) {
                last_error_ = source_->LastError();
                return -1;
            }
            if (n == 0) {
                if (!in_member_) {
                    eof_reached_ = true;
                    break;
                }
                // Hand out what we have; the next call reports the truncation.
                if (strm_.avail_out < out.size()) break;
                last_error_ = "truncated gzip stream: " + source_->Describe();
                return -1;
            }
            strm_.avail_in = static_cast<uInt>(n);
            strm_.next_in = in_buffer_.data();
        }

        // Zero padding may follow a finished member.
        if (!in_member_ && member_done_) {
            while (strm_.avail_in > 0 && *strm_.next_in == 0) {
                ++strm_.next_in;
                --strm_.avail_in;
            }
            if (strm_.avail_in == 0) continue;
        }

        in_member_ = true;
        int ret = inflate(&strm_, Z_NO_FLUSH);

        if (ret == Z_STREAM_END) {
            // Another member may follow (concatenated .gz files).
            in_member_ = false;
            member_done_ = true;
            if (inflateReset(&strm_) != Z_OK) {
                last_error_ = "inflateReset failed";
                return -1;
            }
            continue;
        }

        // Z_BUF_ERROR is not fatal; it just means we need more input or output space.
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            last_error_ = std::string("corrupt gzip data: ") + (strm_.msg ? strm_.msg : zError(ret));
            return -1;
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace imagine
