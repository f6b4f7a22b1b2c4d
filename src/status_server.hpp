#pragma once

#include "config.hpp"
#include "status_cache.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <thread>

namespace ts3status {

// HTTP front end: a single `GET /` route answering with the cached status.
// Every answer is 200; failures are reported through the "success" field.
class status_server {
public:
    status_server(const config& cfg, std::shared_ptr<status_cache> cache,
                  std::shared_ptr<spdlog::logger> log);
    ~status_server();

    status_server(const status_server&) = delete;
    status_server& operator=(const status_server&) = delete;

    // Bind the listen address (port 0 picks a free port) and serve on a
    // background thread. Returns once the server accepts connections, or
    // false if binding or startup failed.
    bool start();

    // Stop serving and join the listener thread. Idempotent.
    void stop();

    // Port actually bound by start(); 0 before that.
    int port() const { return m_port; }

    // JSON body for GET /. Refresh errors are rendered, not thrown.
    std::string status_body();

private:
    void setup_routes();

    config m_cfg;
    std::shared_ptr<status_cache> m_cache;
    std::shared_ptr<spdlog::logger> m_log;
    httplib::Server m_svr;
    std::thread m_thread;
    int m_port = 0;
};

} // namespace ts3status
