#include "config.hpp"
#include "status_cache.hpp"
#include "status_server.hpp"
#include "ts3_query_client.hpp"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

// Periodic stats logging
asio::awaitable<void> stats_loop(std::shared_ptr<ts3status::status_cache> cache,
                                 int interval_seconds,
                                 std::shared_ptr<spdlog::logger> log) {
    asio::steady_timer timer(co_await asio::this_coro::executor);

    while (true) {
        timer.expires_after(std::chrono::seconds(interval_seconds));
        co_await timer.async_wait(asio::use_awaitable);

        auto s = cache->get_stats();
        auto snap = cache->current();
        long long age = snap
            ? std::chrono::duration_cast<std::chrono::seconds>(
                  std::chrono::steady_clock::now() - snap->built_at).count()
            : -1;

        log->info("stats: hits={} refreshes={} failures={} coalesced={} snapshot_age={}s",
                  s.hits, s.refreshes, s.failures, s.coalesced, age);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("ts3_status",
        "Serves the channel/client tree of a TeamSpeak 3 server as JSON");

    options.add_options()
        ("c,config", "Path to YAML config file", cxxopts::value<std::string>())
        ("l,listen", "HTTP listen address host:port (overrides config)", cxxopts::value<std::string>())
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print help");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    // Logger
    auto console = spdlog::stdout_color_mt("ts3_status");

    // Config: file, then environment, then command line
    ts3status::config cfg;
    try {
        if (result.count("config")) {
            cfg = ts3status::load_config(result["config"].as<std::string>());
        }
        ts3status::apply_env_overrides(cfg, ts3status::process_env());

        if (result.count("listen")) {
            auto addr = ts3status::parse_listen_address(result["listen"].as<std::string>());
            if (!addr) {
                throw std::runtime_error("invalid listen address '" +
                                         result["listen"].as<std::string>() + "'");
            }
            cfg.listen_address = addr->first;
            cfg.listen_port = addr->second;
        }
        if (result.count("verbose")) cfg.log_level = "debug";

        ts3status::validate_config(cfg);
    } catch (const std::exception& e) {
        console->error("Failed to load config: {}", e.what());
        return 1;
    }

    // Set log level
    if (cfg.log_level == "trace")      spdlog::set_level(spdlog::level::trace);
    else if (cfg.log_level == "debug") spdlog::set_level(spdlog::level::debug);
    else if (cfg.log_level == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (cfg.log_level == "error") spdlog::set_level(spdlog::level::err);
    else                               spdlog::set_level(spdlog::level::info);

    console->info("ts3_status starting");
    console->info("  query:  {}:{} (server id {}, user '{}', timeout {}s)",
                  cfg.query_host, cfg.query_port, cfg.server_id, cfg.username,
                  cfg.query_timeout_seconds);
    console->info("  listen: {}:{} ({} threads)", cfg.listen_address, cfg.listen_port, cfg.http_threads);
    console->info("  cache:  TTL={}s, mode={}, serve stale while refreshing={}",
                  cfg.cache_ttl_seconds,
                  cfg.mode == ts3status::response_mode::server_info ? "server_info" : "channels",
                  cfg.serve_stale_while_refreshing);

    auto factory = std::make_shared<ts3status::ts3_query_factory>(
        cfg.query_host, cfg.query_port, std::chrono::seconds(cfg.query_timeout_seconds), console);
    auto cache = std::make_shared<ts3status::status_cache>(cfg, factory, console);
    ts3status::status_server server(cfg, cache, console);

    // The listener must be running before shutdown signals are handled
    if (!server.start()) {
        return 1;
    }

    asio::io_context ioc(1);

    // Graceful shutdown
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) {
        console->info("Shutting down...");
        ioc.stop();
    });

    asio::co_spawn(ioc, stats_loop(cache, cfg.stats_interval_seconds, console), asio::detached);

    ioc.run();

    server.stop();

    console->info("ts3_status stopped");
    return 0;
}
