#pragma once

#include "io/io.hpp"
#include "system/signals.hpp"
#include "transfer/progress.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace imagine {

// Monotonic clock in milliseconds.
std::uint64_t NowMs();

struct TransferOptions {
    std::size_t chunk_size = 40960;
    std::uint64_t progress_interval_ms = 1000;
    std::uint64_t fsync_interval_bytes = 1024 * 1024ULL; // 0 disables periodic fsync
    std::function<std::uint64_t()> clock;                // defaults to NowMs
};

class TransferEngine {
public:
    explicit TransferEngine(TransferOptions opt = {});

    // Opens source then sink, copies chunk by chunk, and closes sink then
    // source on every path. Returns Aborted when `cancel` fires between chunks.
    // A source whose TotalSize() differs from the bytes it yields is not an
    // error: a warning is logged and the final sample reports what moved, so
    // callers needing exact content must check a digest.
    Result Run(IReader& source,
               IWriter& sink,
               const CancelToken* cancel = nullptr,
               IProgress* progress = nullptr) const;

    static ProgressSample MakeSample(std::uint64_t transferred,
                                     std::optional<std::uint64_t> total,
                                     double elapsed_sec);

private:
    Result CopyLoop(IReader& source, IWriter& sink, const CancelToken* cancel, IProgress* progress) const;

    TransferOptions opt_;
};

} // namespace imagine
