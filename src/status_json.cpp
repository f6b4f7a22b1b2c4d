#include "status_json.hpp"

namespace ts3status {

namespace {

const char* payload_key(response_mode mode) {
    return mode == response_mode::server_info ? "server_info" : "channels";
}

} // namespace

void to_json(nlohmann::json& j, const client_view& c) {
    j = nlohmann::json{
        {"nickname", c.nickname},
        {"country", c.country},
        {"input_muted", c.input_muted},
        {"output_muted", c.output_muted},
        {"away", c.away}
    };
}

void to_json(nlohmann::json& j, const channel_node& n) {
    j = nlohmann::json{
        {"id", n.id},
        {"name", n.name},
        {"clients", n.clients},
        {"children", n.children}
    };
}

void to_json(nlohmann::json& j, const server_summary& s) {
    j = nlohmann::json{
        {"name", s.name},
        {"version", s.version},
        {"platform", s.platform},
        {"channels", s.channels}
    };
}

nlohmann::json render_success(response_mode mode, const status_snapshot& snap) {
    nlohmann::json body = {{"success", true}, {"error", nullptr}};

    if (mode == response_mode::server_info) {
        body[payload_key(mode)] = snap.summary
            ? *snap.summary
            : server_summary{{}, {}, {}, snap.root.children};
    } else {
        body[payload_key(mode)] = snap.root.children;
    }
    return body;
}

nlohmann::json render_failure(response_mode mode, const std::string& message) {
    return {
        {"success", false},
        {"error", message},
        {payload_key(mode), nullptr}
    };
}

} // namespace ts3status
