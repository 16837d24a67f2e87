#pragma once

#include <atomic>

namespace driverfetch {

// Set by SIGINT/SIGTERM. Polled by transfers, workers, tool runs and prompts.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

inline bool CancelRequested() { return g_cancel.load(std::memory_order_relaxed); }

} // namespace driverfetch
