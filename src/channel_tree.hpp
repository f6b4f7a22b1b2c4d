#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ts3status {

// client_type discriminator of a regular voice connection.
// ServerQuery connections report 1.
inline constexpr int voice_client_type = 0;

// Id of the synthetic root node. Never a real channel id.
inline constexpr uint64_t root_channel_id = 0;

// Channel as enumerated by `channellist`.
struct channel_record {
    uint64_t id = 0;
    uint64_t parent_id = 0;
    std::string name;
};

// Online client as enumerated by `clientlist -away -voice -country`.
struct client_record {
    uint64_t client_id = 0;
    uint64_t channel_id = 0;
    int type = voice_client_type;
    std::string nickname;
    std::string country;
    bool input_muted = false;
    bool output_muted = false;
    bool away = false;
};

struct client_view {
    std::string nickname;
    std::string country;
    bool input_muted = false;
    bool output_muted = false;
    bool away = false;
};

struct channel_node {
    uint64_t id = root_channel_id;
    std::string name;
    std::vector<client_view> clients;
    std::vector<channel_node> children;
};

struct server_summary {
    std::string name;
    std::string version;
    std::string platform;
    std::vector<channel_node> channels;
};

} // namespace ts3status
