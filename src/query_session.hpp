#pragma once

#include "channel_tree.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ts3status {

// One authenticated conversation with the remote server. All calls block
// and throw status_error on connection, auth or protocol failure.
class query_session {
public:
    virtual ~query_session() = default;

    virtual void login(const std::string& user, const std::string& password) = 0;
    virtual void select_server(uint64_t server_id) = 0;
    virtual std::vector<channel_record> list_channels() = 0;
    virtual std::vector<client_record> list_online_clients() = 0;
    virtual std::map<std::string, std::string> server_metadata() = 0;
    virtual void logout() = 0;
};

// Opens a fresh session per refresh.
class query_session_factory {
public:
    virtual ~query_session_factory() = default;

    virtual std::unique_ptr<query_session> connect() = 0;
};

} // namespace ts3status
