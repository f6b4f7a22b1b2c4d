#include "status_server.hpp"
#include "status_error.hpp"
#include "status_json.hpp"

namespace ts3status {

namespace {

// Nicknames and channel names come straight from the remote server;
// invalid UTF-8 must not turn a good snapshot into an exception.
std::string dump(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

status_server::status_server(const config& cfg, std::shared_ptr<status_cache> cache,
                             std::shared_ptr<spdlog::logger> log)
    : m_cfg(cfg), m_cache(std::move(cache)), m_log(std::move(log))
{
    unsigned int threads = m_cfg.http_threads;
    m_svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    setup_routes();
}

void status_server::setup_routes() {
    m_svr.Get("/", [this](const httplib::Request& /*req*/, httplib::Response& res) {
        res.status = 200;
        res.set_content(status_body(), "application/json");
    });
}

status_server::~status_server() {
    stop();
}

bool status_server::start() {
    if (m_cfg.listen_port == 0) {
        m_port = m_svr.bind_to_any_port(m_cfg.listen_address);
    } else if (m_svr.bind_to_port(m_cfg.listen_address, m_cfg.listen_port)) {
        m_port = m_cfg.listen_port;
    } else {
        m_port = -1;
    }
    if (m_port <= 0) {
        m_log->error("Failed to bind {}:{}", m_cfg.listen_address, m_cfg.listen_port);
        m_port = 0;
        return false;
    }

    m_thread = std::thread([this] { m_svr.listen_after_bind(); });
    m_svr.wait_until_ready();
    if (!m_svr.is_running()) {
        m_log->error("HTTP listener on {}:{} failed to start", m_cfg.listen_address, m_port);
        stop();
        return false;
    }

    m_log->info("Listening on http://{}:{}/", m_cfg.listen_address, m_port);
    return true;
}

void status_server::stop() {
    m_svr.stop();
    if (m_thread.joinable()) m_thread.join();
}

std::string status_server::status_body() {
    try {
        auto snap = m_cache->get_or_refresh();
        return dump(render_success(m_cfg.mode, *snap));
    } catch (const status_error& e) {
        m_log->error("TS3 error ({}): {}", describe(e.code()), e.what());
        return dump(render_failure(m_cfg.mode, std::string(describe(e.code()))));
    } catch (const std::exception& e) {
        m_log->error("Status refresh failed: {}", e.what());
        return dump(render_failure(m_cfg.mode, std::string(describe(error_code::protocol))));
    }
}

} // namespace ts3status
