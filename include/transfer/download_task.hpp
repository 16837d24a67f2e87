#pragma once

#include "catalog/model.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace driverfetch {

struct DownloadTask {
    FileEntry entry;
    std::string dest_dir;
    std::string owner_title;  // for log lines only
};

enum class TransferStatus { Completed, Skipped, Failed };

struct TransferOutcome {
    TransferStatus status = TransferStatus::Failed;
    std::size_t task_index = 0;
    std::string path;    // final destination path, empty if it could not be derived
    std::string reason;  // set for Failed
};

struct TransferSummary {
    std::size_t completed = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::string dest_root;
};

const char* TransferStatusName(TransferStatus s);

} // namespace driverfetch
