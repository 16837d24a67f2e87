#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>
#include <string>

namespace driverfetch::config::detail {

namespace {

// Each getter: true when the key is absent or valid, false on a wrong type.
bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j,
                     const char* key,
                     std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j,
                      const char* key,
                      std::optional<bool>& out,
                      std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "root must be JSON object";
        return false;
    }
    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, DriverfetchConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "ApiBaseUrl", cfg.api_base_url, err) ||
        !GetStringIfPresent(j, "SiteBaseUrl", cfg.site_base_url, err) ||
        !GetStringIfPresent(j, "UserAgent", cfg.user_agent, err) ||
        !GetU64IfPresent(j, "Workers", cfg.workers, err) ||
        !GetU64IfPresent(j, "RequestTimeoutSeconds", cfg.request_timeout_seconds, err) ||
        !GetU64IfPresent(j, "ToolTimeoutSeconds", cfg.tool_timeout_seconds, err) ||
        !GetBoolIfPresent(j, "VerifySha256", cfg.verify_sha256, err) ||
        !GetStringIfPresent(j, "LogLevel", cfg.log_level, err)) {
        return false;
    }

    if (cfg.workers.has_value() && *cfg.workers == 0) {
        err = "Workers must be at least 1";
        return false;
    }
    if (cfg.request_timeout_seconds.has_value() && *cfg.request_timeout_seconds > kMaxTimeoutSeconds) {
        err = "RequestTimeoutSeconds must be at most " + std::to_string(kMaxTimeoutSeconds);
        return false;
    }
    if (cfg.tool_timeout_seconds.has_value() && *cfg.tool_timeout_seconds > kMaxTimeoutSeconds) {
        err = "ToolTimeoutSeconds must be at most " + std::to_string(kMaxTimeoutSeconds);
        return false;
    }
    if (cfg.api_base_url.has_value() && cfg.api_base_url->empty()) {
        err = "ApiBaseUrl must not be empty";
        return false;
    }
    if (cfg.site_base_url.has_value() && cfg.site_base_url->empty()) {
        err = "SiteBaseUrl must not be empty";
        return false;
    }
    if (cfg.log_level.has_value()) {
        LogLevel lvl{};
        if (!ParseLogLevel(*cfg.log_level, lvl)) {
            err = "unknown LogLevel: " + *cfg.log_level;
            return false;
        }
    }

    for (const auto& [key, val] : j.items()) {
        (void)val;
        if (key != "ApiBaseUrl" && key != "SiteBaseUrl" && key != "UserAgent" &&
            key != "Workers" && key != "RequestTimeoutSeconds" &&
            key != "ToolTimeoutSeconds" && key != "VerifySha256" && key != "LogLevel") {
            LogWarn("Config: ignoring unknown key %s", key.c_str());
        }
    }

    return true;
}

} // namespace driverfetch::config::detail
