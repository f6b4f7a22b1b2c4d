#pragma once

#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace ts3status {

// Shape of the JSON payload served on GET /
enum class response_mode {
    channels,    // "channels": top-level channel nodes
    server_info  // "server_info": name/version/platform + channels
};

struct config {
    // ServerQuery connection
    std::string query_host;
    uint16_t query_port = 10011;
    uint64_t server_id = 1;
    std::string username;
    std::string password;
    // Upper bound for each connect, read and write on the query connection
    uint32_t query_timeout_seconds = 10;

    // HTTP listener
    std::string listen_address = "0.0.0.0";
    uint16_t listen_port = 8080;
    unsigned int http_threads = 8;

    // Cache behaviour
    uint32_t cache_ttl_seconds = 20;
    response_mode mode = response_mode::channels;
    // While a refresh is running, other callers get the previous snapshot
    // instead of waiting for the refresh.
    bool serve_stale_while_refreshing = true;

    // Operational
    int stats_interval_seconds = 60;
    std::string log_level = "info";
};

// Environment lookup; returns nullopt for unset variables.
using env_lookup = std::function<std::optional<std::string>(const char*)>;

// Parse config from YAML file. Throws on error.
config load_config(const std::string& path);

// Parse config from an already loaded YAML document. Throws on error.
config parse_config(const YAML::Node& root);

// Apply TS3_HOST, TS3_PORT, TS3_SERVER_ID, TS3_USER, TS3_PASS and
// TS3_STATUS_LISTEN on top of `cfg`. Throws on unparsable values.
void apply_env_overrides(config& cfg, const env_lookup& env);

// Lookup backed by the process environment.
env_lookup process_env();

// Throws std::runtime_error if required settings are missing.
void validate_config(const config& cfg);

// Parse response_mode from string. Returns nullopt if invalid.
std::optional<response_mode> parse_response_mode(const std::string& s);

// Parse "host:port". Returns nullopt if malformed.
std::optional<std::pair<std::string, uint16_t>> parse_listen_address(const std::string& s);

} // namespace ts3status
