#include "transfer/progress_sinks.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>

namespace imagine {

namespace {
std::atomic<bool> g_progress_line_active{false};
std::FILE* g_progress_stream = stderr;
} // namespace

std::string HumanSize(double bytes) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    int unit = 0;
    while (bytes >= 1024.0 && unit < 4) {
        bytes /= 1024.0;
        ++unit;
    }

    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%.0f %s", bytes, kUnits[unit]);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", bytes, kUnits[unit]);
    }
    return buf;
}

std::string FormatClock(double seconds) {
    if (seconds < 0.0 || !std::isfinite(seconds)) return "--:--:--";

    const auto total = static_cast<unsigned long long>(seconds);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu", total / 3600, (total / 60) % 60, total % 60);
    return buf;
}

std::string RenderProgressLine(const ProgressSample& s, int bar_width) {
    std::string line = HumanSize(static_cast<double>(s.transferred));
    line += " in ";
    line += FormatClock(s.elapsed_sec);
    line += " @ ";
    line += s.bytes_per_sec ? HumanSize(*s.bytes_per_sec) : std::string("-");
    line += "/sec";

    if (s.percent) {
        const double pct = std::clamp(*s.percent, 0.0, 100.0);
        const int filled = static_cast<int>((pct / 100.0) * bar_width);

        line += " [";
        line.append(static_cast<size_t>(filled), '=');
        line.append(static_cast<size_t>(bar_width - filled), ' ');
        line += "] ";

        char pbuf[8];
        std::snprintf(pbuf, sizeof(pbuf), "%3d%%", static_cast<int>(pct));
        line += pbuf;

        line += " eta ";
        line += s.eta_sec ? FormatClock(*s.eta_sec) : FormatClock(-1.0);
    }
    return line;
}

ConsoleProgressSink::ConsoleProgressSink(std::string label, std::FILE* out)
    : label_(std::move(label)), out_(out) {}

void ConsoleProgressSink::OnProgress(const ProgressSample& s) {
    const std::string line = RenderProgressLine(s);
    if (label_.empty()) {
        std::fprintf(out_, "\r%s\033[K", line.c_str());
    } else {
        std::fprintf(out_, "\r[%s] %s\033[K", label_.c_str(), line.c_str());
    }
    std::fflush(out_);
    g_progress_stream = out_;
    g_progress_line_active = true;
}

void ConsoleProgressSink::OnComplete() {
    ClearProgressLine();
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(g_progress_stream, "\n");
        std::fflush(g_progress_stream);
    }
}

} // namespace imagine
