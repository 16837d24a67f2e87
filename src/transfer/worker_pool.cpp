#include "transfer/worker_pool.hpp"

#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace driverfetch {

void WorkerPool::Run(std::size_t job_count,
                     const Job& run,
                     const Job& skip,
                     const CancelCheck& cancelled) const {
    if (job_count == 0) return;

    std::queue<std::size_t> pending;
    for (std::size_t i = 0; i < job_count; ++i) pending.push(i);
    std::mutex mu;

    auto worker = [&]() {
        while (true) {
            std::size_t index = 0;
            {
                std::lock_guard<std::mutex> lock(mu);
                if (pending.empty()) return;
                index = pending.front();
                pending.pop();
            }
            if (cancelled && cancelled()) {
                if (skip) skip(index);
            } else {
                run(index);
            }
        }
    };

    const std::size_t n = std::min(workers_, job_count);
    std::vector<std::thread> threads;
    threads.reserve(n);
    for (std::size_t i = 0; i < n; ++i) threads.emplace_back(worker);
    for (auto& t : threads) t.join();
}

} // namespace driverfetch
