#include "io/http_reader.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace imagine {

namespace {

bool EnsureCurlGlobal(std::string& err) {
    static std::once_flag once;
    static CURLcode rc = CURLE_OK;
    std::call_once(once, [] { rc = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (rc != CURLE_OK) {
        err = std::string("curl_global_init failed: ") + curl_easy_strerror(rc);
        return false;
    }
    return true;
}

} // namespace

HttpReader::HttpReader(std::string url, HttpOptions opt) : url_(std::move(url)), opt_(std::move(opt)) {}

HttpReader::~HttpReader() { Release(); }

void HttpReader::Release() {
    if (multi_ && easy_) {
        curl_multi_remove_handle(multi_, easy_);
    }
    if (easy_) {
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
    }
    if (multi_) {
        curl_multi_cleanup(multi_);
        multi_ = nullptr;
    }
    buffer_.clear();
    read_pos_ = 0;
    paused_ = false;
}

size_t HttpReader::WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<HttpReader*>(userdata);
    const size_t n = size * nmemb;

    if (self->Buffered() >= self->opt_.max_buffered_bytes) {
        self->paused_ = true;
        return CURL_WRITEFUNC_PAUSE;
    }
    if (self->read_pos_ > 0 && self->read_pos_ == self->buffer_.size()) {
        self->buffer_.clear();
        self->read_pos_ = 0;
    }
    self->buffer_.insert(self->buffer_.end(),
                         reinterpret_cast<const std::uint8_t*>(ptr),
                         reinterpret_cast<const std::uint8_t*>(ptr) + n);
    return n;
}

std::string HttpReader::TransferError() const {
    if (errbuf_[0] != '\0') return std::string(errbuf_);
    return curl_easy_strerror(result_);
}

// Runs libcurl until body bytes are buffered or the transfer has finished.
bool HttpReader::Pump() {
    while (Buffered() == 0 && !done_) {
        if (paused_) {
            paused_ = false;
            const CURLcode pc = curl_easy_pause(easy_, CURLPAUSE_CONT);
            if (pc != CURLE_OK) {
                last_error_ = url_ + ": " + curl_easy_strerror(pc);
                return false;
            }
            if (Buffered() > 0) break;
        }

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_, &running);
        if (mc != CURLM_OK) {
            last_error_ = url_ + ": " + curl_multi_strerror(mc);
            return false;
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_) {
                done_ = true;
                result_ = msg->data.result;
            }
        }
        if (done_ || Buffered() > 0) break;

        mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
        if (mc != CURLM_OK) {
            last_error_ = url_ + ": " + curl_multi_strerror(mc);
            return false;
        }
    }
    return true;
}

Result HttpReader::Open() {
    if (easy_) return Result::Fail(ErrorKind::OpenError, EBUSY, "Already open: " + url_);

    std::string err;
    if (!EnsureCurlGlobal(err)) return Result::Fail(ErrorKind::OpenError, -1, err);

    easy_ = curl_easy_init();
    multi_ = curl_multi_init();
    if (!easy_ || !multi_) {
        Release();
        return Result::Fail(ErrorKind::OpenError, ENOMEM, "curl init failed for " + url_);
    }

    errbuf_[0] = '\0';
    done_ = false;
    result_ = CURLE_OK;
    size_ = std::nullopt;

    curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &HttpReader::WriteCallback);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, errbuf_);
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy_, CURLOPT_MAXREDIRS, opt_.max_redirects);
    curl_easy_setopt(easy_, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT, opt_.connect_timeout_sec);
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, opt_.low_speed_limit_bytes);
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, opt_.low_speed_time_sec);
    if (!opt_.user_agent.empty()) {
        curl_easy_setopt(easy_, CURLOPT_USERAGENT, opt_.user_agent.c_str());
    }

    const CURLMcode mc = curl_multi_add_handle(multi_, easy_);
    if (mc != CURLM_OK) {
        Release();
        return Result::Fail(ErrorKind::OpenError, -1, url_ + ": " + curl_multi_strerror(mc));
    }

    // Headers are complete once the first body byte arrives or the transfer ends.
    if (!Pump()) {
        const std::string msg = last_error_;
        Release();
        return Result::Fail(ErrorKind::OpenError, -1, msg);
    }
    if (done_ && result_ != CURLE_OK) {
        const std::string msg = "GET " + url_ + " failed: " + TransferError();
        const int code = static_cast<int>(result_);
        Release();
        return Result::Fail(ErrorKind::OpenError, code, msg);
    }

    curl_off_t length = -1;
    if (curl_easy_getinfo(easy_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0) {
        size_ = static_cast<std::uint64_t>(length);
    }

    long status = 0;
    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status);
    LogDebug("GET %s -> %ld, length %lld", url_.c_str(), status, static_cast<long long>(length));
    return Result::Ok();
}

Result HttpReader::Close() {
    Release();
    return Result::Ok();
}

ssize_t HttpReader::Read(std::span<std::uint8_t> out) {
    if (!easy_) {
        last_error_ = "not open: " + url_;
        return -1;
    }
    if (out.empty()) return 0;

    if (Buffered() == 0 && !Pump()) return -1;

    if (Buffered() > 0) {
        const size_t n = std::min(out.size(), Buffered());
        std::memcpy(out.data(), buffer_.data() + read_pos_, n);
        read_pos_ += n;
        return static_cast<ssize_t>(n);
    }

    if (done_ && result_ != CURLE_OK) {
        last_error_ = "GET " + url_ + " failed: " + TransferError();
        return -1;
    }
    return 0;
}

} // namespace imagine
