#pragma once
#include <cstdint>
#include <string_view>

namespace driverfetch {

struct ProgressEvent {
    std::string_view label;

    // Byte counters of the current file (curated single-file path).
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;  // 0 => unknown

    // Task counters (bulk path).
    std::uint64_t tasks_done = 0;
    std::uint64_t tasks_total = 0;

    bool finished = false;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace driverfetch
