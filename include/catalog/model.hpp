#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace driverfetch {

struct ProductDescriptor {
    std::string id;
    std::string name;
    // Vendor object exactly as returned; dumped into the manifest.
    nlohmann::json raw = nlohmann::json::object();
};

struct FileEntry {
    std::string url;
    std::uint64_t size = 0;     // 0 => unknown
    std::string name;           // display only, never a local filename
    std::string sha256;         // empty => none declared
};

struct DriverRecord {
    std::string title;
    std::string category;
    std::string version;
    std::int64_t release_date = 0;  // vendor epoch value, 0 => unknown
    std::vector<FileEntry> files;
};

struct DriverListing {
    std::vector<DriverRecord> drivers;
    bool degraded = false;
    std::string source;  // endpoint shape the records came from
};

} // namespace driverfetch
