#include "status_cache.hpp"
#include "status_error.hpp"
#include "tree_builder.hpp"
#include <system_error>

namespace ts3status {

status_cache::status_cache(const config& cfg,
                           std::shared_ptr<query_session_factory> factory,
                           std::shared_ptr<spdlog::logger> log,
                           clock_fn now)
    : m_cfg(cfg), m_ttl(cfg.cache_ttl_seconds),
      m_factory(std::move(factory)), m_log(std::move(log)), m_now(std::move(now))
{}

bool status_cache::is_fresh(const snapshot_ptr& snap, clock::time_point now) const {
    return snap && now - snap->built_at <= m_ttl;
}

snapshot_ptr status_cache::get_or_refresh() {
    return get_or_refresh(m_now());
}

snapshot_ptr status_cache::get_or_refresh(clock::time_point now) {
    auto snap = std::atomic_load(&m_snapshot);
    if (is_fresh(snap, now)) {
        m_hits.fetch_add(1, std::memory_order_relaxed);
        m_log->debug("Using cached server status");
        return snap;
    }

    std::promise<snapshot_ptr> promise;
    {
        std::unique_lock<std::mutex> lock(m_flight_mutex);

        // A refresh may have completed since the first check
        snap = std::atomic_load(&m_snapshot);
        if (is_fresh(snap, now)) {
            m_hits.fetch_add(1, std::memory_order_relaxed);
            return snap;
        }

        if (m_flight) {
            auto flight = *m_flight;
            lock.unlock();
            m_coalesced.fetch_add(1, std::memory_order_relaxed);

            if (snap && m_cfg.serve_stale_while_refreshing) {
                m_log->debug("Refresh in progress, serving previous status");
                return snap;
            }
            m_log->debug("Refresh in progress, waiting for it");
            return flight.get();
        }

        m_flight = promise.get_future().share();
    }

    if (snap) {
        m_log->info("Status is {} seconds old, updating cache",
                    std::chrono::duration_cast<std::chrono::seconds>(now - snap->built_at).count());
    } else {
        m_log->info("No cached status, fetching");
    }

    snapshot_ptr fresh;
    try {
        fresh = fetch();
    } catch (...) {
        m_failures.fetch_add(1, std::memory_order_relaxed);
        promise.set_exception(std::current_exception());
        clear_flight();
        throw;
    }

    install(fresh);
    m_refreshes.fetch_add(1, std::memory_order_relaxed);
    promise.set_value(fresh);
    clear_flight();
    return fresh;
}

snapshot_ptr status_cache::fetch() {
    auto started = clock::now();
    auto session = m_factory->connect();

    session->login(m_cfg.username, m_cfg.password);
    session->select_server(m_cfg.server_id);

    std::map<std::string, std::string> metadata;
    if (m_cfg.mode == response_mode::server_info) {
        metadata = session->server_metadata();
    }

    auto channels = session->list_channels();
    auto clients = session->list_online_clients();
    session->logout();

    auto built = build_channel_tree(channels, clients, m_log);

    auto snap = std::make_shared<status_snapshot>();
    snap->root = std::move(built.root);
    snap->orphan_count = built.orphans.size();
    for (const auto& c : clients) {
        if (c.type == voice_client_type) ++snap->client_count;
    }
    if (m_cfg.mode == response_mode::server_info) {
        snap->summary = build_server_summary(metadata, snap->root);
    }
    snap->built_at = m_now();

    m_log->info("Fetched server status: {} channels, {} voice clients, {} orphaned ({} ms)",
                count_channels(snap->root), snap->client_count, snap->orphan_count,
                std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started).count());
    return snap;
}

std::unique_lock<std::mutex> status_cache::lock_for_publish() {
    return std::unique_lock<std::mutex>(m_write_mutex);
}

void status_cache::install(snapshot_ptr snap) {
    try {
        auto lock = lock_for_publish();
        std::atomic_store(&m_snapshot, std::move(snap));
    } catch (const std::system_error& e) {
        m_log->error("{}: {}; keeping previous snapshot",
                     describe(error_code::lock_contention), e.what());
    }
}

void status_cache::clear_flight() {
    std::lock_guard<std::mutex> lock(m_flight_mutex);
    m_flight.reset();
}

snapshot_ptr status_cache::current() const {
    return std::atomic_load(&m_snapshot);
}

bool status_cache::refresh_in_flight() const {
    std::lock_guard<std::mutex> lock(m_flight_mutex);
    return m_flight.has_value();
}

status_cache::stats status_cache::get_stats() const {
    return {
        m_hits.load(std::memory_order_relaxed),
        m_refreshes.load(std::memory_order_relaxed),
        m_failures.load(std::memory_order_relaxed),
        m_coalesced.load(std::memory_order_relaxed)
    };
}

} // namespace ts3status
