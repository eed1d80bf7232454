#include "transfer/transfer_engine.hpp"

#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <string>
#include <vector>

namespace imagine {

namespace {

void CloseLogged(IEndpoint& endpoint) {
    auto r = endpoint.Close();
    if (!r.is_ok()) {
        LogWarn("close %s: %s", endpoint.Describe().c_str(), r.msg.c_str());
    }
}

double MiBPerSec(std::uint64_t bytes, double sec) {
    if (sec <= 0.0) sec = 0.001;
    return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / sec;
}

} // namespace

std::uint64_t NowMs() {
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

TransferEngine::TransferEngine(TransferOptions opt) : opt_(std::move(opt)) {
    if (opt_.chunk_size == 0) opt_.chunk_size = TransferOptions{}.chunk_size;
    if (!opt_.clock) opt_.clock = &NowMs;
}

ProgressSample TransferEngine::MakeSample(std::uint64_t transferred,
                                          std::optional<std::uint64_t> total,
                                          double elapsed_sec) {
    ProgressSample s;
    s.transferred = transferred;
    s.total = total;
    s.elapsed_sec = elapsed_sec;

    if (elapsed_sec > 0.0) {
        s.bytes_per_sec = static_cast<double>(transferred) / elapsed_sec;
    }

    if (total.has_value()) {
        if (*total == 0) {
            s.percent = 100.0;
        } else {
            s.percent = std::min(100.0, 100.0 * static_cast<double>(transferred) / static_cast<double>(*total));
        }
        if (s.bytes_per_sec.has_value() && *s.bytes_per_sec > 0.0) {
            const std::uint64_t remaining = *total > transferred ? *total - transferred : 0;
            s.eta_sec = static_cast<double>(remaining) / *s.bytes_per_sec;
        }
    }
    return s;
}

Result TransferEngine::Run(IReader& source,
                           IWriter& sink,
                           const CancelToken* cancel,
                           IProgress* progress) const {
    auto r = source.Open();
    if (!r.is_ok()) return r;

    r = sink.Open();
    if (!r.is_ok()) {
        CloseLogged(source);
        return r;
    }

    LogDebug("transfer %s -> %s", source.Describe().c_str(), sink.Describe().c_str());

    Result res;
    try {
        res = CopyLoop(source, sink, cancel, progress);
    } catch (...) {
        CloseLogged(sink);
        CloseLogged(source);
        throw;
    }

    auto sc = sink.Close();
    if (!sc.is_ok()) {
        if (res.is_ok()) {
            res = sc;
        } else {
            LogWarn("close %s: %s", sink.Describe().c_str(), sc.msg.c_str());
        }
    }
    CloseLogged(source);
    return res;
}

Result TransferEngine::CopyLoop(IReader& source,
                                IWriter& sink,
                                const CancelToken* cancel,
                                IProgress* progress) const {
    std::vector<std::uint8_t> buf(opt_.chunk_size);

    const auto total = source.TotalSize();

    std::uint64_t transferred = 0;
    std::uint64_t unsynced = 0;

    const std::uint64_t t0 = opt_.clock();
    std::optional<std::uint64_t> last_emit;

    auto elapsed_at = [t0](std::uint64_t now) {
        return now > t0 ? static_cast<double>(now - t0) / 1000.0 : 0.0;
    };

    while (true) {
        if (cancel && cancel->IsCancelled()) {
            const double sec = elapsed_at(opt_.clock());
            LogWarn("Canceled. Total bytes written: %llu | Time: %.2fs | Avg: %.2f MiB/s",
                    static_cast<unsigned long long>(transferred),
                    sec,
                    MiBPerSec(transferred, sec));
            return Result::Fail(ErrorKind::Aborted,
                                ECANCELED,
                                "Transfer " + source.Describe() + " -> " + sink.Describe() +
                                    " aborted after " + std::to_string(transferred) + " bytes");
        }

        const ssize_t n = source.Read(buf);
        if (n == 0) break;
        if (n < 0) {
            const int e = errno;
            const std::string why = source.LastError();
            return Result::Fail(ErrorKind::ReadError,
                                e,
                                "Read failed: " + source.Describe() + (why.empty() ? "" : " (" + why + ")"));
        }

        auto wr = sink.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
        if (!wr.is_ok()) return wr;

        transferred += static_cast<std::uint64_t>(n);

        if (opt_.fsync_interval_bytes != 0) {
            unsynced += static_cast<std::uint64_t>(n);
            if (unsynced >= opt_.fsync_interval_bytes) {
                auto fs = sink.FsyncNow();
                if (!fs.is_ok()) return fs;
                unsynced = 0;
            }
        }

        if (progress) {
            const std::uint64_t now = opt_.clock();
            if (!last_emit || now - *last_emit >= opt_.progress_interval_ms) {
                progress->OnProgress(MakeSample(transferred, total, elapsed_at(now)));
                last_emit = now;
            }
        }
    }

    if (opt_.fsync_interval_bytes != 0) {
        auto fs = sink.FsyncNow();
        if (!fs.is_ok()) return fs;
    }

    const double sec = elapsed_at(opt_.clock());

    if (total.has_value() && *total != transferred) {
        LogWarn("%s: expected %llu bytes, transferred %llu",
                source.Describe().c_str(),
                static_cast<unsigned long long>(*total),
                static_cast<unsigned long long>(transferred));
    }

    if (progress) {
        // Exact totals: a known size is replaced by what actually moved.
        auto final_total = total.has_value() ? std::optional<std::uint64_t>(transferred) : std::nullopt;
        ProgressSample last = MakeSample(transferred, final_total, sec);
        last.final = true;
        progress->OnProgress(last);
        progress->OnComplete();
    }

    LogInfo("Done. Total bytes written: %llu | Time: %.2fs | Avg: %.2f MiB/s",
            static_cast<unsigned long long>(transferred),
            sec,
            MiBPerSec(transferred, sec));

    return Result::Ok();
}

} // namespace imagine
