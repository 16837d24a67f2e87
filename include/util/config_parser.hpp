#pragma once

#include "util/client_config.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace driverfetch::config {

inline constexpr const char kDefaultConfigPath[] = "/etc/driverfetch/driverfetch.conf";

// Upper bound for RequestTimeoutSeconds and ToolTimeoutSeconds (one day).
inline constexpr std::uint64_t kMaxTimeoutSeconds = 86400;

// Optional overrides read from a JSON config file. Absent keys stay unset.
class DriverfetchConfigFromFile {
public:
    std::optional<std::string> api_base_url;
    std::optional<std::string> site_base_url;
    std::optional<std::string> user_agent;
    std::optional<std::uint64_t> workers;
    std::optional<std::uint64_t> request_timeout_seconds;
    std::optional<std::uint64_t> tool_timeout_seconds;
    std::optional<bool> verify_sha256;
    std::optional<std::string> log_level;

    Result LoadFile(const std::string& path);
    Result LoadString(const std::string& json_text, const std::string& origin);

    ClientConfig ApplyTo(ClientConfig base) const;

    void Reset();
};

} // namespace driverfetch::config
