#include "transfer/progress_sinks.hpp"

#include <atomic>
#include <cstdio>
#include <string>

namespace driverfetch {

namespace {
std::atomic_bool g_progress_line_active{false};

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    int pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}
} // namespace

std::string FormatBytes(std::uint64_t bytes) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", size, kUnits[unit]);
    }
    return buf;
}

void ByteProgressSink::OnProgress(const ProgressEvent& e) {
    const std::string label(e.label.substr(0, 40));
    if (label != current_) {
        current_ = label;
        next_ = 0;
    }
    if (!e.finished && e.bytes_done < next_) return;
    next_ = e.bytes_done + min_step_;

    if (e.bytes_total > 0) {
        std::fprintf(stderr,
                     "\r%s: %3d%% %s / %s   ",
                     label.c_str(),
                     Percent(e.bytes_done, e.bytes_total),
                     FormatBytes(e.bytes_done).c_str(),
                     FormatBytes(e.bytes_total).c_str());
    } else {
        std::fprintf(stderr, "\r%s: %s   ", label.c_str(), FormatBytes(e.bytes_done).c_str());
    }
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.finished) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

void TaskCountProgressSink::OnProgress(const ProgressEvent& e) {
    if (e.tasks_total == 0) return;

    std::fprintf(stderr,
                 "\rDownloading: %3d%% %llu/%llu files",
                 Percent(e.tasks_done, e.tasks_total),
                 (unsigned long long)e.tasks_done,
                 (unsigned long long)e.tasks_total);
    std::fflush(stderr);
    g_progress_line_active = true;

    if (e.tasks_done >= e.tasks_total) {
        std::fprintf(stderr, "\n");
        g_progress_line_active = false;
    }
}

bool IsProgressLineActive() { return g_progress_line_active; }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace driverfetch
