#include "transfer/transfer_engine.hpp"

#include "crypto/sha256.hpp"
#include "io/file_writer.hpp"
#include "system/signals.hpp"
#include "transfer/worker_pool.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <map>
#include <mutex>

namespace driverfetch {

namespace fs = std::filesystem;

namespace {

constexpr const char* kCancelledReason = "cancelled";

void RemoveQuietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

std::function<bool()> CancelCheckOrDefault(const std::function<bool()>& check) {
    if (check) return check;
    return [] { return CancelRequested(); };
}

} // namespace

const char* TransferStatusName(TransferStatus s) {
    switch (s) {
    case TransferStatus::Completed:
        return "completed";
    case TransferStatus::Skipped:
        return "skipped";
    case TransferStatus::Failed:
        return "failed";
    }
    return "unknown";
}

TransferEngine::TransferEngine(std::shared_ptr<const IHttpClient> http) : http_(std::move(http)) {}

std::string TransferEngine::PartPath(const std::string& final_path, std::size_t task_index) {
    return final_path + ".part" + std::to_string(task_index);
}

TransferOutcome TransferEngine::Execute(const DownloadTask& task,
                                        std::size_t task_index,
                                        bool verify_digest,
                                        IProgress* byte_sink,
                                        const std::function<bool()>& cancelled) const {
    TransferOutcome outcome;
    outcome.task_index = task_index;

    const std::string filename = FilenameFromUrl(task.entry.url);
    if (filename.empty()) {
        outcome.reason = "cannot derive a filename from " + task.entry.url;
        return outcome;
    }

    const std::string final_path = (fs::path(task.dest_dir) / filename).string();
    outcome.path = final_path;

    std::error_code ec;
    if (fs::exists(final_path, ec)) {
        LogDebug("%s already exists, skipping", final_path.c_str());
        outcome.status = TransferStatus::Skipped;
        return outcome;
    }

    if (cancelled()) {
        outcome.reason = kCancelledReason;
        return outcome;
    }

    const std::string part_path = PartPath(final_path, task_index);
    auto fail = [&](const std::string& reason) {
        RemoveQuietly(part_path);
        outcome.status = TransferStatus::Failed;
        outcome.reason = cancelled() ? std::string(kCancelledReason) : reason;
        return outcome;
    };

    FileWriter file;
    auto r = FileWriter::Open(part_path, file);
    if (!r.is_ok()) return fail(r.msg);

    const bool check_digest = verify_digest && !task.entry.sha256.empty();
    DigestingWriter digesting(file);
    IWriter& sink = check_digest ? static_cast<IWriter&>(digesting) : static_cast<IWriter&>(file);

    DownloadCallbacks callbacks;
    callbacks.on_progress = [&](std::uint64_t done, std::uint64_t total) {
        if (cancelled()) return false;
        if (byte_sink) {
            ProgressEvent e{};
            e.label = filename;
            e.bytes_done = done;
            e.bytes_total = total;
            byte_sink->OnProgress(e);
        }
        return true;
    };

    LogDebug("Downloading %s (%s)", filename.c_str(), task.owner_title.c_str());
    r = http_->Download(task.entry.url, sink, callbacks);
    if (!r.is_ok()) {
        (void)file.Close();
        return fail(r.msg);
    }

    r = file.Close();
    if (!r.is_ok()) return fail(r.msg);

    if (check_digest) {
        const std::string actual = digesting.FinalHex();
        if (!DigestEquals(task.entry.sha256, actual)) {
            return fail("sha256 mismatch: expected " + task.entry.sha256 + ", got " + actual);
        }
    }

    if (std::rename(part_path.c_str(), final_path.c_str()) != 0) {
        const int err = errno;
        return fail("rename " + part_path + ": " + std::strerror(err));
    }

    if (byte_sink) {
        ProgressEvent e{};
        e.label = filename;
        e.bytes_done = file.BytesWritten();
        e.bytes_total = file.BytesWritten();
        e.finished = true;
        byte_sink->OnProgress(e);
    }

    outcome.status = TransferStatus::Completed;
    return outcome;
}

TransferOutcome TransferEngine::DownloadOne(const DownloadTask& task,
                                            std::size_t task_index,
                                            const Options& opt) const {
    const auto cancelled = CancelCheckOrDefault(opt.cancel_check);
    auto outcome = Execute(task, task_index, opt.verify_digest, opt.progress_sink, cancelled);
    if (outcome.status == TransferStatus::Failed) {
        LogWarn("Failed to download %s: %s",
                outcome.path.empty() ? task.entry.url.c_str() : outcome.path.c_str(),
                outcome.reason.c_str());
    }
    return outcome;
}

Result TransferEngine::Run(const std::vector<DownloadTask>& tasks,
                           const Options& opt,
                           std::vector<TransferOutcome>& out) const {
    out.clear();
    if (opt.concurrency == 0) {
        return Result::Fail(kErrInvalidConfig, "worker count must be at least 1");
    }

    out.resize(tasks.size());
    for (std::size_t i = 0; i < tasks.size(); ++i) out[i].task_index = i;

    // Directory creation happens before any worker starts.
    std::map<std::string, std::string> dir_errors;
    for (const auto& t : tasks) {
        if (dir_errors.count(t.dest_dir)) continue;
        std::error_code ec;
        fs::create_directories(t.dest_dir, ec);
        if (ec) {
            LogError("Cannot create %s: %s", t.dest_dir.c_str(), ec.message().c_str());
            dir_errors[t.dest_dir] = "cannot create directory " + t.dest_dir + ": " + ec.message();
        } else {
            dir_errors[t.dest_dir] = std::string();
        }
    }

    const auto cancelled = CancelCheckOrDefault(opt.cancel_check);
    std::mutex progress_mu;
    std::size_t done = 0;

    auto report = [&](std::size_t index) {
        const auto& o = out[index];
        if (o.status == TransferStatus::Failed) {
            LogWarn("Failed to download %s: %s",
                    o.path.empty() ? tasks[index].entry.url.c_str() : o.path.c_str(),
                    o.reason.c_str());
        }
        std::lock_guard<std::mutex> lock(progress_mu);
        ++done;
        if (opt.progress_sink) {
            ProgressEvent e{};
            e.tasks_done = done;
            e.tasks_total = tasks.size();
            e.finished = (done == tasks.size());
            opt.progress_sink->OnProgress(e);
        }
    };

    auto run_one = [&](std::size_t index) {
        const auto& task = tasks[index];
        const auto& dir_err = dir_errors.at(task.dest_dir);
        if (!dir_err.empty()) {
            out[index].status = TransferStatus::Failed;
            out[index].reason = dir_err;
        } else {
            out[index] = Execute(task, index, opt.verify_digest, nullptr, cancelled);
        }
        report(index);
    };

    auto skip_one = [&](std::size_t index) {
        out[index].status = TransferStatus::Failed;
        out[index].reason = kCancelledReason;
        report(index);
    };

    WorkerPool pool(opt.concurrency);
    pool.Run(tasks.size(), run_one, skip_one, cancelled);

    if (cancelled()) {
        return Result::Fail(kErrCancelled, "interrupted");
    }
    return Result::Ok();
}

TransferSummary TransferEngine::Summarize(const std::vector<TransferOutcome>& outcomes,
                                          const std::string& dest_root) {
    TransferSummary s;
    s.dest_root = dest_root;
    for (const auto& o : outcomes) {
        switch (o.status) {
        case TransferStatus::Completed:
            ++s.completed;
            break;
        case TransferStatus::Skipped:
            ++s.skipped;
            break;
        case TransferStatus::Failed:
            ++s.failed;
            break;
        }
    }
    return s;
}

} // namespace driverfetch
