#pragma once

#include "channel_tree.hpp"
#include <spdlog/spdlog.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ts3status {

struct tree_build_result {
    // Synthetic root (id 0, "Root"); its children are the top-level channels.
    channel_node root;

    // Channels not reachable from the root: parent never listed, or part of
    // a parent cycle. Absent from the tree.
    std::vector<channel_record> orphans;

    // Channels refused outright: id 0 or an id already seen.
    std::vector<channel_record> rejected;
};

// Build the channel tree from the flat ServerQuery lists.
//
// Parents are resolved through an id index, so enumeration order does not
// matter. Sibling order and per-channel client order follow the input order.
// Only voice clients are attached, and only to the channel whose id matches
// exactly. Orphaned and rejected channels are logged as warnings when a
// logger is given.
tree_build_result build_channel_tree(const std::vector<channel_record>& channels,
                                     const std::vector<client_record>& clients,
                                     const std::shared_ptr<spdlog::logger>& log = nullptr);

// Wrap the top-level channels with `serverinfo` metadata. Missing keys
// yield empty strings.
server_summary build_server_summary(const std::map<std::string, std::string>& metadata,
                                    channel_node root);

// Count every node below `node` (the node itself excluded).
std::size_t count_channels(const channel_node& node);

} // namespace ts3status
