#include "tree_builder.hpp"
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace ts3status {

namespace {

using client_index = std::unordered_map<uint64_t, std::vector<client_view>>;
using child_index = std::unordered_map<uint64_t, std::vector<const channel_record*>>;

client_view make_view(const client_record& c) {
    return client_view{c.nickname, c.country, c.input_muted, c.output_muted, c.away};
}

// Attach the children of `node` and recurse. Every channel has exactly one
// parent entry in the index, so a node reachable from the root is visited once.
void attach_children(channel_node& node,
                     const child_index& children,
                     client_index& clients,
                     std::unordered_set<uint64_t>& placed) {
    auto it = children.find(node.id);
    if (it == children.end()) return;

    node.children.reserve(it->second.size());
    for (const channel_record* rec : it->second) {
        channel_node child;
        child.id = rec->id;
        child.name = rec->name;

        auto cit = clients.find(rec->id);
        if (cit != clients.end()) child.clients = std::move(cit->second);

        placed.insert(rec->id);
        attach_children(child, children, clients, placed);
        node.children.push_back(std::move(child));
    }
}

} // namespace

tree_build_result build_channel_tree(const std::vector<channel_record>& channels,
                                     const std::vector<client_record>& clients,
                                     const std::shared_ptr<spdlog::logger>& log) {
    tree_build_result result;
    result.root.id = root_channel_id;
    result.root.name = "Root";

    client_index by_channel;
    for (const auto& c : clients) {
        if (c.type != voice_client_type) continue;
        by_channel[c.channel_id].push_back(make_view(c));
    }

    // First occurrence of an id wins; id 0 belongs to the root.
    std::unordered_set<uint64_t> seen;
    std::vector<const channel_record*> accepted;
    child_index by_parent;
    accepted.reserve(channels.size());

    for (const auto& ch : channels) {
        if (ch.id == root_channel_id || !seen.insert(ch.id).second) {
            if (log) {
                log->warn("Rejected channel {} '{}' (parent {}): {}",
                          ch.id, ch.name, ch.parent_id,
                          ch.id == root_channel_id ? "reserved root id" : "duplicate id");
            }
            result.rejected.push_back(ch);
            continue;
        }
        accepted.push_back(&ch);
        by_parent[ch.parent_id].push_back(&ch);
    }

    std::unordered_set<uint64_t> placed;
    attach_children(result.root, by_parent, by_channel, placed);

    for (const channel_record* ch : accepted) {
        if (placed.count(ch->id)) continue;
        if (log) {
            log->warn("Orphaned channel {} '{}': parent {} is not reachable from the root",
                      ch->id, ch->name, ch->parent_id);
        }
        result.orphans.push_back(*ch);
    }

    return result;
}

server_summary build_server_summary(const std::map<std::string, std::string>& metadata,
                                    channel_node root) {
    auto value_of = [&metadata](const char* key) -> std::string {
        auto it = metadata.find(key);
        return it != metadata.end() ? it->second : std::string{};
    };

    server_summary summary;
    summary.name = value_of("virtualserver_name");
    summary.version = value_of("virtualserver_version");
    summary.platform = value_of("virtualserver_platform");
    summary.channels = std::move(root.children);
    return summary;
}

std::size_t count_channels(const channel_node& node) {
    std::size_t n = node.children.size();
    for (const auto& child : node.children) n += count_channels(child);
    return n;
}

} // namespace ts3status
