#pragma once

#include "channel_tree.hpp"
#include <chrono>
#include <memory>
#include <optional>

namespace ts3status {

// Immutable result of one refresh.
// Shared by request handlers via shared_ptr<const status_snapshot>.
struct status_snapshot {
    // Clock reading taken after the remote fetch completed.
    std::chrono::steady_clock::time_point built_at;

    // Synthetic root; its children are the top-level channels.
    channel_node root;

    // Set only in response_mode::server_info.
    std::optional<server_summary> summary;

    std::size_t client_count = 0;
    std::size_t orphan_count = 0;
};

using snapshot_ptr = std::shared_ptr<const status_snapshot>;

} // namespace ts3status
