#pragma once

#include "transfer/progress.hpp"

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>

namespace imagine {

// "512 B", "1.5 KiB", "3.2 GiB".
std::string HumanSize(double bytes);

// "hh:mm:ss"; "--:--:--" for negative input.
std::string FormatClock(double seconds);

// One progress line without the leading '\r'.
std::string RenderProgressLine(const ProgressSample& s, int bar_width = 30);

class ConsoleProgressSink final : public IProgress {
public:
    explicit ConsoleProgressSink(std::string label = {}, std::FILE* out = stderr);

    void SetLabel(std::string label) { label_ = std::move(label); }

    void OnProgress(const ProgressSample& s) override;
    void OnComplete() override;

private:
    std::string label_;
    std::FILE* out_ = nullptr;
};

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace imagine
