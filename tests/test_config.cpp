#include "config.hpp"
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>

namespace {

ts3status::env_lookup fake_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it != vars.end()) return it->second;
        return std::nullopt;
    };
}

} // namespace

TEST(config_parsing, defaults_from_empty_document) {
    auto cfg = ts3status::parse_config(YAML::Load("{}"));

    EXPECT_EQ(cfg.query_port, 10011);
    EXPECT_EQ(cfg.server_id, 1u);
    EXPECT_EQ(cfg.query_timeout_seconds, 10u);
    EXPECT_EQ(cfg.listen_address, "0.0.0.0");
    EXPECT_EQ(cfg.listen_port, 8080);
    EXPECT_EQ(cfg.cache_ttl_seconds, 20u);
    EXPECT_EQ(cfg.mode, ts3status::response_mode::channels);
    EXPECT_TRUE(cfg.serve_stale_while_refreshing);
    EXPECT_EQ(cfg.log_level, "info");
}

TEST(config_parsing, full_document) {
    auto cfg = ts3status::parse_config(YAML::Load(R"(
query_host: ts.example.org
query_port: 10022
server_id: 3
username: serveradmin
password: hunter2
query_timeout_seconds: 3
listen_address: 127.0.0.1
listen_port: 9000
http_threads: 2
cache_ttl_seconds: 45
response_mode: server_info
serve_stale_while_refreshing: false
stats_interval_seconds: 5
log_level: debug
)"));

    EXPECT_EQ(cfg.query_host, "ts.example.org");
    EXPECT_EQ(cfg.query_port, 10022);
    EXPECT_EQ(cfg.server_id, 3u);
    EXPECT_EQ(cfg.username, "serveradmin");
    EXPECT_EQ(cfg.password, "hunter2");
    EXPECT_EQ(cfg.query_timeout_seconds, 3u);
    EXPECT_EQ(cfg.listen_address, "127.0.0.1");
    EXPECT_EQ(cfg.listen_port, 9000);
    EXPECT_EQ(cfg.http_threads, 2u);
    EXPECT_EQ(cfg.cache_ttl_seconds, 45u);
    EXPECT_EQ(cfg.mode, ts3status::response_mode::server_info);
    EXPECT_FALSE(cfg.serve_stale_while_refreshing);
    EXPECT_EQ(cfg.stats_interval_seconds, 5);
    EXPECT_EQ(cfg.log_level, "debug");
}

TEST(config_parsing, invalid_response_mode_throws) {
    EXPECT_THROW(ts3status::parse_config(YAML::Load("response_mode: tree")), std::runtime_error);
}

TEST(config_parsing, zero_http_threads_throws) {
    EXPECT_THROW(ts3status::parse_config(YAML::Load("http_threads: 0")), std::runtime_error);
}

TEST(config_parsing, parse_response_mode) {
    EXPECT_EQ(ts3status::parse_response_mode("channels"), ts3status::response_mode::channels);
    EXPECT_EQ(ts3status::parse_response_mode("server_info"), ts3status::response_mode::server_info);
    EXPECT_FALSE(ts3status::parse_response_mode("Channels").has_value());
}

TEST(config_parsing, parse_listen_address) {
    auto addr = ts3status::parse_listen_address("127.0.0.1:8081");
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(addr->first, "127.0.0.1");
    EXPECT_EQ(addr->second, 8081);

    auto v6 = ts3status::parse_listen_address("::1:9000");
    ASSERT_TRUE(v6.has_value());
    EXPECT_EQ(v6->first, "::1");
    EXPECT_EQ(v6->second, 9000);

    EXPECT_FALSE(ts3status::parse_listen_address("localhost").has_value());
    EXPECT_FALSE(ts3status::parse_listen_address(":8080").has_value());
    EXPECT_FALSE(ts3status::parse_listen_address("host:").has_value());
    EXPECT_FALSE(ts3status::parse_listen_address("host:0").has_value());
    EXPECT_FALSE(ts3status::parse_listen_address("host:70000").has_value());
    EXPECT_FALSE(ts3status::parse_listen_address("host:80a").has_value());
}

TEST(config_env, overrides_connection_settings) {
    ts3status::config cfg;
    cfg.query_host = "from-file";

    ts3status::apply_env_overrides(cfg, fake_env({
        {"TS3_HOST", "ts.example.org"},
        {"TS3_PORT", "10011"},
        {"TS3_SERVER_ID", "7"},
        {"TS3_USER", "serveradmin"},
        {"TS3_PASS", "s3cret"},
        {"TS3_STATUS_LISTEN", "0.0.0.0:8123"},
    }));

    EXPECT_EQ(cfg.query_host, "ts.example.org");
    EXPECT_EQ(cfg.query_port, 10011);
    EXPECT_EQ(cfg.server_id, 7u);
    EXPECT_EQ(cfg.username, "serveradmin");
    EXPECT_EQ(cfg.password, "s3cret");
    EXPECT_EQ(cfg.listen_address, "0.0.0.0");
    EXPECT_EQ(cfg.listen_port, 8123);
}

TEST(config_env, unset_variables_leave_values_alone) {
    ts3status::config cfg;
    cfg.query_host = "from-file";
    cfg.server_id = 4;

    ts3status::apply_env_overrides(cfg, fake_env({}));

    EXPECT_EQ(cfg.query_host, "from-file");
    EXPECT_EQ(cfg.server_id, 4u);
}

TEST(config_env, invalid_numbers_throw) {
    ts3status::config cfg;
    EXPECT_THROW(ts3status::apply_env_overrides(cfg, fake_env({{"TS3_PORT", "port"}})),
                 std::runtime_error);
    EXPECT_THROW(ts3status::apply_env_overrides(cfg, fake_env({{"TS3_SERVER_ID", "-1"}})),
                 std::runtime_error);
    EXPECT_THROW(ts3status::apply_env_overrides(cfg, fake_env({{"TS3_STATUS_LISTEN", "nowhere"}})),
                 std::runtime_error);
}

TEST(config_validation, requires_host_and_user) {
    ts3status::config cfg;
    EXPECT_THROW(ts3status::validate_config(cfg), std::runtime_error);

    cfg.query_host = "ts.example.org";
    EXPECT_THROW(ts3status::validate_config(cfg), std::runtime_error);

    cfg.username = "serveradmin";
    EXPECT_NO_THROW(ts3status::validate_config(cfg));

    cfg.cache_ttl_seconds = 0;
    EXPECT_THROW(ts3status::validate_config(cfg), std::runtime_error);
}

TEST(config_validation, zero_query_timeout_is_rejected) {
    ts3status::config cfg;
    cfg.query_host = "ts.example.org";
    cfg.username = "serveradmin";
    cfg.query_timeout_seconds = 0;
    EXPECT_THROW(ts3status::validate_config(cfg), std::runtime_error);
}
