#include "config.hpp"
#include <charconv>
#include <cstdlib>
#include <stdexcept>

namespace ts3status {

namespace {

template <typename T>
T parse_env_number(const char* name, const std::string& s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        throw std::runtime_error(std::string("env: invalid '") + name + "': " + s);
    }
    return value;
}

} // namespace

std::optional<response_mode> parse_response_mode(const std::string& s) {
    if (s == "channels")    return response_mode::channels;
    if (s == "server_info") return response_mode::server_info;
    return std::nullopt;
}

std::optional<std::pair<std::string, uint16_t>> parse_listen_address(const std::string& s) {
    auto colon = s.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon == s.size() - 1) {
        return std::nullopt;
    }

    uint16_t port = 0;
    const char* first = s.data() + colon + 1;
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc{} || ptr != last || port == 0) return std::nullopt;

    return std::make_pair(s.substr(0, colon), port);
}

config parse_config(const YAML::Node& root) {
    config cfg;

    // ServerQuery connection
    if (auto n = root["query_host"]) cfg.query_host = n.as<std::string>();
    if (auto n = root["query_port"]) cfg.query_port = n.as<uint16_t>();
    if (auto n = root["server_id"])  cfg.server_id  = n.as<uint64_t>();
    if (auto n = root["username"])   cfg.username   = n.as<std::string>();
    if (auto n = root["password"])   cfg.password   = n.as<std::string>();
    if (auto n = root["query_timeout_seconds"]) cfg.query_timeout_seconds = n.as<uint32_t>();

    // HTTP listener
    if (auto n = root["listen_address"]) cfg.listen_address = n.as<std::string>();
    if (auto n = root["listen_port"])    cfg.listen_port    = n.as<uint16_t>();
    if (auto n = root["http_threads"])   cfg.http_threads   = n.as<unsigned int>();

    // Cache
    if (auto n = root["cache_ttl_seconds"]) cfg.cache_ttl_seconds = n.as<uint32_t>();

    if (auto n = root["response_mode"]) {
        auto mode = parse_response_mode(n.as<std::string>());
        if (!mode) throw std::runtime_error("config: invalid 'response_mode': " + n.as<std::string>());
        cfg.mode = *mode;
    }

    if (auto n = root["serve_stale_while_refreshing"]) {
        cfg.serve_stale_while_refreshing = n.as<bool>();
    }

    // Operational
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();

    if (cfg.http_threads == 0) {
        throw std::runtime_error("config: 'http_threads' must be at least 1");
    }

    return cfg;
}

config load_config(const std::string& path) {
    return parse_config(YAML::LoadFile(path));
}

void apply_env_overrides(config& cfg, const env_lookup& env) {
    if (auto v = env("TS3_HOST"))      cfg.query_host = *v;
    if (auto v = env("TS3_PORT"))      cfg.query_port = parse_env_number<uint16_t>("TS3_PORT", *v);
    if (auto v = env("TS3_SERVER_ID")) cfg.server_id  = parse_env_number<uint64_t>("TS3_SERVER_ID", *v);
    if (auto v = env("TS3_USER"))      cfg.username   = *v;
    if (auto v = env("TS3_PASS"))      cfg.password   = *v;

    if (auto v = env("TS3_STATUS_LISTEN")) {
        auto addr = parse_listen_address(*v);
        if (!addr) throw std::runtime_error("env: invalid 'TS3_STATUS_LISTEN': " + *v);
        cfg.listen_address = addr->first;
        cfg.listen_port = addr->second;
    }
}

env_lookup process_env() {
    return [](const char* name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name)) return std::string(v);
        return std::nullopt;
    };
}

void validate_config(const config& cfg) {
    if (cfg.query_host.empty()) {
        throw std::runtime_error("config: 'query_host' is required (or set TS3_HOST)");
    }
    if (cfg.username.empty()) {
        throw std::runtime_error("config: 'username' is required (or set TS3_USER)");
    }
    if (cfg.query_timeout_seconds == 0) {
        throw std::runtime_error("config: 'query_timeout_seconds' must be positive");
    }
    if (cfg.cache_ttl_seconds == 0) {
        throw std::runtime_error("config: 'cache_ttl_seconds' must be positive");
    }
    if (cfg.stats_interval_seconds <= 0) {
        throw std::runtime_error("config: 'stats_interval_seconds' must be positive");
    }
}

} // namespace ts3status
