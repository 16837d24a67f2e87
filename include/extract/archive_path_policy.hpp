#pragma once

#include "util/result.hpp"

#include <string>

namespace driverfetch {

// Maps archive entry names to relative paths under the extraction target.
class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);

  private:
    bool safe_paths_only_ = true;
};

} // namespace driverfetch
