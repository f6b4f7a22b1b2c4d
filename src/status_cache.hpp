#pragma once

#include "config.hpp"
#include "query_session.hpp"
#include "status_snapshot.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace ts3status {

// TTL-gated view of the remote server status.
//
// Readers get a lock-free shared_ptr<const status_snapshot>. A stale read
// claims the single in-flight refresh, fetches outside every lock and then
// publishes the new snapshot under the writer mutex. Concurrent stale
// callers either get the previous snapshot or wait for that refresh.
// A failed refresh leaves the current snapshot untouched and is not
// remembered: the next stale call retries.
class status_cache {
public:
    using clock = std::chrono::steady_clock;
    using clock_fn = std::function<clock::time_point()>;

    struct stats {
        uint64_t hits = 0;
        uint64_t refreshes = 0;
        uint64_t failures = 0;
        uint64_t coalesced = 0;
    };

    status_cache(const config& cfg,
                 std::shared_ptr<query_session_factory> factory,
                 std::shared_ptr<spdlog::logger> log,
                 clock_fn now = &clock::now);
    virtual ~status_cache() = default;

    // Return a snapshot no older than the TTL, refreshing if needed.
    // Throws status_error (or whatever the session throws) when the
    // refresh fails.
    snapshot_ptr get_or_refresh();
    snapshot_ptr get_or_refresh(clock::time_point now);

    // Current snapshot without any refresh. Null before the first success.
    snapshot_ptr current() const;

    bool refresh_in_flight() const;

    stats get_stats() const;

protected:
    // Writer lock taken to publish a snapshot. Throws std::system_error
    // when the lock cannot be acquired.
    virtual std::unique_lock<std::mutex> lock_for_publish();

private:
    bool is_fresh(const snapshot_ptr& snap, clock::time_point now) const;

    // Full remote exchange plus tree build. No locks held.
    snapshot_ptr fetch();

    // Publish under the writer mutex. A lock failure is logged and the
    // previous snapshot stays in place.
    void install(snapshot_ptr snap);

    void clear_flight();

    config m_cfg;
    std::chrono::seconds m_ttl;
    std::shared_ptr<query_session_factory> m_factory;
    std::shared_ptr<spdlog::logger> m_log;
    clock_fn m_now;

    // Serializes snapshot publication.
    std::mutex m_write_mutex;

    // Current snapshot: atomic load/store for lock-free reader access.
    snapshot_ptr m_snapshot;

    // Guards m_flight only. Never held across the remote exchange.
    mutable std::mutex m_flight_mutex;
    std::optional<std::shared_future<snapshot_ptr>> m_flight;

    std::atomic<uint64_t> m_hits{0};
    std::atomic<uint64_t> m_refreshes{0};
    std::atomic<uint64_t> m_failures{0};
    std::atomic<uint64_t> m_coalesced{0};
};

} // namespace ts3status
