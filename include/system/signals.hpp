// signals.hpp - Cooperative cancellation and the signal handlers that trigger it.

#pragma once

#include <atomic>

namespace imagine {

class CancelToken {
public:
    void Cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool IsCancelled() const { return cancelled_.load(std::memory_order_relaxed); }
    void Reset() { cancelled_.store(false, std::memory_order_relaxed); }

private:
    std::atomic_bool cancelled_{false};
};

// SIGINT and SIGTERM cancel `token`. The token must outlive the process'
// signal handling (typically a local of main()).
void InstallSignalHandlers(CancelToken& token);

} // namespace imagine
