#pragma once

#include <cstddef>
#include <functional>

namespace driverfetch {

// Fixed-size pool draining a FIFO queue of job indices [0, job_count).
// Every index is handed to exactly one of `run` or `skip`: once a cancel is
// requested, workers stop taking new jobs and hand the rest to `skip`.
class WorkerPool {
public:
    using Job = std::function<void(std::size_t index)>;
    using CancelCheck = std::function<bool()>;

    explicit WorkerPool(std::size_t workers) : workers_(workers ? workers : 1) {}

    // Blocks until all jobs have been handed out and finished.
    void Run(std::size_t job_count, const Job& run, const Job& skip, const CancelCheck& cancelled) const;

    std::size_t Workers() const { return workers_; }

private:
    std::size_t workers_;
};

} // namespace driverfetch
