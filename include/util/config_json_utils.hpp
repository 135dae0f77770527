#pragma once

#include "util/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace relay::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, RelayConfig& cfg, std::string& err);

} // namespace relay::config::detail
