#pragma once

#include "io/io.hpp"

extern "C" {
#include <curl/curl.h>
}

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace imagine {

struct HttpOptions {
    long connect_timeout_sec = 15;
    // Abort when slower than low_speed_limit_bytes/s for low_speed_time_sec.
    long low_speed_limit_bytes = 1000;
    long low_speed_time_sec = 30;
    long max_redirects = 10;
    std::string user_agent = "imagine/0.3";
    // Upper bound for body bytes held between two Read() calls.
    std::size_t max_buffered_bytes = 1024 * 1024;
};

// Pull-style HTTP(S) body reader. libcurl is driven through a multi handle
// only as far as needed to satisfy the next Read(); the transfer pauses when
// the local buffer is full.
class HttpReader final : public IReader {
public:
    HttpReader(std::string url, HttpOptions opt = {});
    ~HttpReader() override;

    HttpReader(const HttpReader&) = delete;
    HttpReader& operator=(const HttpReader&) = delete;

    Result Open() override;
    Result Close() override;
    bool IsOpen() const override { return easy_ != nullptr; }
    std::string Describe() const override { return url_; }

    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return size_; }
    std::string LastError() const override { return last_error_; }

private:
    static size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata);

    std::size_t Buffered() const { return buffer_.size() - read_pos_; }
    bool Pump();
    std::string TransferError() const;
    void Release();

    std::string url_;
    HttpOptions opt_;
    CURL* easy_ = nullptr;
    CURLM* multi_ = nullptr;
    char errbuf_[CURL_ERROR_SIZE]{};

    std::vector<std::uint8_t> buffer_;
    std::size_t read_pos_ = 0;
    bool paused_ = false;
    bool done_ = false;
    CURLcode result_ = CURLE_OK;

    std::optional<std::uint64_t> size_;
    std::string last_error_;
};

} // namespace imagine
