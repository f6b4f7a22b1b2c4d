#pragma once

#include "channel_tree.hpp"
#include "config.hpp"
#include "status_snapshot.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ts3status {

void to_json(nlohmann::json& j, const client_view& c);
void to_json(nlohmann::json& j, const channel_node& n);
void to_json(nlohmann::json& j, const server_summary& s);

// {"success": true, "error": null, "channels"|"server_info": ...}
nlohmann::json render_success(response_mode mode, const status_snapshot& snap);

// {"success": false, "error": message, "channels"|"server_info": null}
nlohmann::json render_failure(response_mode mode, const std::string& message);

} // namespace ts3status
