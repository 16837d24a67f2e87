#pragma once

#include "net/http_client.hpp"
#include "transfer/download_task.hpp"
#include "transfer/progress.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace driverfetch {

class TransferEngine {
public:
    struct Options {
        std::size_t concurrency = 4;
        bool verify_digest = false;

        // Run(): one event per finished task. DownloadOne(): byte events.
        IProgress* progress_sink = nullptr;

        // Defaults to the process-wide signal flag.
        std::function<bool()> cancel_check;
    };

    explicit TransferEngine(std::shared_ptr<const IHttpClient> http);

    // Downloads every task on a pool of `concurrency` workers. `out` always
    // holds one outcome per task, indexed by submission order. Per-task
    // failures are reported in `out` only; the returned Result fails for a
    // zero concurrency (before any work) or when the run was interrupted.
    Result Run(const std::vector<DownloadTask>& tasks,
               const Options& opt,
               std::vector<TransferOutcome>& out) const;

    // Single task on the calling thread, with byte-level progress.
    // The destination directory must exist.
    TransferOutcome DownloadOne(const DownloadTask& task,
                                std::size_t task_index,
                                const Options& opt) const;

    static std::string PartPath(const std::string& final_path, std::size_t task_index);

    static TransferSummary Summarize(const std::vector<TransferOutcome>& outcomes,
                                     const std::string& dest_root);

private:
    TransferOutcome Execute(const DownloadTask& task,
                            std::size_t task_index,
                            bool verify_digest,
                            IProgress* byte_sink,
                            const std::function<bool()>& cancelled) const;

    std::shared_ptr<const IHttpClient> http_;
};

} // namespace driverfetch
