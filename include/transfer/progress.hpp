#pragma once
#include <cstdint>
#include <optional>

namespace imagine {

struct ProgressSample {
    std::uint64_t transferred = 0;
    std::optional<std::uint64_t> total;  // nullopt: size unknown

    double elapsed_sec = 0.0;

    // Average since start; nullopt while no time has elapsed.
    std::optional<double> bytes_per_sec;

    // Only with a known total.
    std::optional<double> percent;
    std::optional<double> eta_sec;

    bool final = false;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressSample& s) = 0;

    // After the final sample of a successful transfer.
    virtual void OnComplete() {}
};

} // namespace imagine
