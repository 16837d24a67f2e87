#pragma once

#include "transfer/progress.hpp"

#include <cstdint>
#include <string>

namespace driverfetch {

// Single-line byte progress bar on stderr.
class ByteProgressSink final : public IProgress {
public:
    explicit ByteProgressSink(std::uint64_t min_step_bytes = 256 * 1024ULL)
        : min_step_(min_step_bytes) {}

    void OnProgress(const ProgressEvent& e) override;

private:
    std::uint64_t min_step_ = 0;
    std::uint64_t next_ = 0;
    std::string current_;
};

// "Downloading: n/N files" counter on stderr.
class TaskCountProgressSink final : public IProgress {
public:
    TaskCountProgressSink() = default;

    void OnProgress(const ProgressEvent& e) override;
};

std::string FormatBytes(std::uint64_t bytes);

bool IsProgressLineActive();
void ClearProgressLine();

} // namespace driverfetch
