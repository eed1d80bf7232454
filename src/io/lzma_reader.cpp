#include "io/lzma_reader.hpp"

#include "util/logger.hpp"

#include <cstdint>

namespace imagine {

namespace {

const char* LzmaStrError(lzma_ret rc) {
    switch (rc) {
        case LZMA_MEM_ERROR:         return "out of memory";
        case LZMA_MEMLIMIT_ERROR:    return "memory limit reached";
        case LZMA_FORMAT_ERROR:      return "not an xz stream";
        case LZMA_OPTIONS_ERROR:     return "unsupported xz options";
        case LZMA_DATA_ERROR:        return "corrupt xz data";
        case LZMA_BUF_ERROR:         return "truncated xz stream";
        case LZMA_UNSUPPORTED_CHECK: return "unsupported integrity check";
        case LZMA_PROG_ERROR:        return "liblzma programming error";
        default:                     return "liblzma error";
    }
}

} // namespace

LzmaReader::LzmaReader(std::unique_ptr<IReader> source, std::optional<std::uint64_t> expected_size)
    : source_(std::move(source)), expected_size_(expected_size), in_buffer_(64 * 1024) {}

LzmaReader::~LzmaReader() {
    if (initialized_) {
        lzma_end(&strm_);
    }
}

std::string LzmaReader::Describe() const {
    return "xz:" + source_->Describe();
}

Result LzmaReader::Open() {
    auto r = source_->Open();
    if (!r.is_ok()) return r;

    strm_ = LZMA_STREAM_INIT;
    const lzma_ret rc = lzma_stream_decoder(&strm_, UINT64_MAX, LZMA_CONCATENATED);
    if (rc != LZMA_OK) {
        if (auto cr = source_->Close(); !cr.is_ok()) {
            LogWarn("%s", cr.msg.c_str());
        }
        return Result::Fail(ErrorKind::OpenError,
                            static_cast<int>(rc),
                            std::string("lzma_stream_decoder failed for ") + Describe() + ": " +
                                LzmaStrError(rc));
    }
    initialized_ = true;
    eof_reached_ = false;
    action_ = LZMA_RUN;
    return Result::Ok();
}

Result LzmaReader::Close() {
    if (initialized_) {
        lzma_end(&strm_);
        initialized_ = false;
    }
    return source_->Close();
}

ssize_t LzmaReader::Read(std::span<std::uint8_t> out) {
    if (!initialized_) {
        last_error_ = "xz stream not open";
        return -1;
    }
    if (eof_reached_ || out.empty()) return 0;

    strm_.next_out = out.data();
    strm_.avail_out = out.size();

    while (strm_.avail_out > 0) {
        if (strm_.avail_in == 0 && action_ == LZMA_RUN) {
            const ssize_t n = source_->Read(in_buffer_);
            if (n < 0) {
                last_error_ = source_->LastError();
                return -1;
            }
            if (n == 0) {
                // LZMA_CONCATENATED needs LZMA_FINISH to know no stream follows.
                action_ = LZMA_FINISH;
            } else {
                strm_.next_in = in_buffer_.data();
                strm_.avail_in = static_cast<size_t>(n);
            }
        }

        const lzma_ret rc = lzma_code(&strm_, action_);
        if (rc == LZMA_STREAM_END) {
            eof_reached_ = true;
            break;
        }
        if (rc != LZMA_OK) {
            last_error_ = std::string(LzmaStrError(rc)) + ": " + source_->Describe();
            return -1;
        }
    }

    return static_cast<ssize_t>(out.size() - strm_.avail_out);
}

} // namespace imagine
