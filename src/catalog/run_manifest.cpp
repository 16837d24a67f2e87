#include "catalog/run_manifest.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <span>

namespace driverfetch {

namespace fs = std::filesystem;

nlohmann::json RunManifest::ToJson() const {
    nlohmann::json drivers_json = nlohmann::json::array();
    for (const auto& d : drivers) {
        nlohmann::json files = nlohmann::json::array();
        for (const auto& f : d.files) {
            files.push_back({
                {"name", f.name},
                {"url", f.url},
                {"size", f.size},
                {"sha256", f.sha256},
            });
        }
        drivers_json.push_back({
            {"title", d.title},
            {"category", d.category},
            {"version", d.version},
            {"release_date", d.release_date},
            {"files", std::move(files)},
        });
    }

    nlohmann::json j = nlohmann::json::object();
    j["serial_number"] = serial_number;
    j["product"] = product;
    j["drivers"] = std::move(drivers_json);
    j["download_date"] = download_date;
    return j;
}

std::string FormatLocalTimestamp(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf, n);
}

RunManifest BuildRunManifest(const std::string& serial,
                             const ProductDescriptor& product,
                             const std::vector<DriverRecord>& drivers,
                             std::time_t now) {
    RunManifest m;
    m.serial_number = serial;
    m.product = product.raw;
    m.drivers = drivers;
    m.download_date = FormatLocalTimestamp(now);
    return m;
}

Result WriteRunManifest(const std::string& output_dir, const RunManifest& manifest) {
    const fs::path final_path = fs::path(output_dir) / kManifestFileName;
    const fs::path tmp_path = fs::path(output_dir) / (std::string(kManifestFileName) + ".tmp");

    std::string text;
    try {
        text = manifest.ToJson().dump(2);
    } catch (const nlohmann::json::exception& e) {
        return Result::Fail(kErrGeneric, std::string("manifest serialization failed: ") + e.what());
    }
    text.push_back('\n');

    FileWriter writer;
    auto r = FileWriter::Open(tmp_path.string(), writer);
    if (!r.is_ok()) return r;

    r = writer.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
    if (r.is_ok()) r = writer.FsyncNow();
    if (r.is_ok()) r = writer.Close();
    if (!r.is_ok()) {
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return r;
    }

    if (std::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
        const int err = errno;
        std::error_code ec;
        fs::remove(tmp_path, ec);
        return Result::Fail(err, "rename " + final_path.string() + ": " + std::strerror(err));
    }

    LogInfo("Manifest saved to %s", final_path.c_str());
    return Result::Ok();
}

} // namespace driverfetch
