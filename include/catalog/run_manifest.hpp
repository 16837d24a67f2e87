#pragma once

#include "catalog/model.hpp"
#include "util/result.hpp"

#include <ctime>
#include <string>
#include <vector>

namespace driverfetch {

inline constexpr const char* kManifestFileName = "driver_manifest.json";

// Snapshot of one run, written once before any transfer starts.
struct RunManifest {
    std::string serial_number;
    nlohmann::json product = nlohmann::json::object();
    std::vector<DriverRecord> drivers;
    std::string download_date;  // "%Y-%m-%d %H:%M:%S", local time

    nlohmann::json ToJson() const;
};

std::string FormatLocalTimestamp(std::time_t t);

RunManifest BuildRunManifest(const std::string& serial,
                             const ProductDescriptor& product,
                             const std::vector<DriverRecord>& drivers,
                             std::time_t now);

// Writes <output_dir>/driver_manifest.json through a temporary file and
// rename. output_dir must exist.
Result WriteRunManifest(const std::string& output_dir, const RunManifest& manifest);

} // namespace driverfetch
