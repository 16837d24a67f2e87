#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace driverfetch {

// In-process unpacker for any format libarchive reads (cabinet, 7z, zip,
// tar, ...). Used as the last resort for inner payloads.
class ArchiveExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        std::size_t block_size = 64 * 1024;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    // dst_dir must exist. `entries` receives the number of entries written.
    Result ExtractFileToDir(const std::string& archive_path,
                            const std::string& dst_dir,
                            std::uint64_t* entries = nullptr) const;

  private:
    Options opt_{};
};

} // namespace driverfetch
