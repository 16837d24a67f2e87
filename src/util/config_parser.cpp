#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace driverfetch::config {

void DriverfetchConfigFromFile::Reset() {
    api_base_url.reset();
    site_base_url.reset();
    user_agent.reset();
    workers.reset();
    request_timeout_seconds.reset();
    tool_timeout_seconds.reset();
    verify_sha256.reset();
    log_level.reset();
}

Result DriverfetchConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(kErrInvalidConfig, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(kErrInvalidConfig, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

Result DriverfetchConfigFromFile::LoadString(const std::string& json_text, const std::string& origin) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(json_text, json, err) ||
        !detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(kErrInvalidConfig, "Config: " + err + " in " + origin);
    }
    return Result::Ok();
}

ClientConfig DriverfetchConfigFromFile::ApplyTo(ClientConfig base) const {
    if (api_base_url) base.api_base_url = *api_base_url;
    if (site_base_url) base.site_base_url = *site_base_url;
    if (user_agent) base.headers = ClientConfig::BrowserHeaders(*user_agent);
    if (request_timeout_seconds && *request_timeout_seconds > 0) {
        base.request_timeout_seconds = static_cast<long>(*request_timeout_seconds);
    }
    return base;
}

} // namespace driverfetch::config
