#pragma once

#include "util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace driverfetch::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(const std::string& text, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, DriverfetchConfigFromFile& cfg, std::string& err);

} // namespace driverfetch::config::detail
