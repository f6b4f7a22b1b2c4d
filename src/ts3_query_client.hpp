#pragma once

#include "query_protocol.hpp"
#include "query_session.hpp"
#include "status_error.hpp"
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ts3status {

// Blocking ServerQuery client over a plain TCP connection.
// The constructor connects and consumes the greeting; the destructor sends
// `quit` and closes the socket. Every connect, read and write must finish
// within `timeout`, otherwise the socket is closed and a connection error
// is thrown.
class ts3_query_client : public query_session {
public:
    ts3_query_client(const std::string& host, uint16_t port,
                     std::chrono::milliseconds timeout,
                     std::shared_ptr<spdlog::logger> log);
    ~ts3_query_client() override;

    ts3_query_client(const ts3_query_client&) = delete;
    ts3_query_client& operator=(const ts3_query_client&) = delete;

    void login(const std::string& user, const std::string& password) override;
    void select_server(uint64_t server_id) override;
    std::vector<channel_record> list_channels() override;
    std::vector<client_record> list_online_clients() override;
    std::map<std::string, std::string> server_metadata() override;
    void logout() override;

private:
    // Send one command and collect its data records up to the status line.
    // A non-zero status throws status_error(failure); "empty result set"
    // yields no records.
    std::vector<query_record> execute(const std::string& command, error_code failure);

    std::string read_line();
    void write_line(const std::string& line);

    // Run the pending async operation for at most m_timeout.
    void run_with_deadline(const char* what);

    std::chrono::milliseconds m_timeout;
    asio::io_context m_ioc;
    asio::ip::tcp::socket m_socket;
    std::string m_buffer;
    std::shared_ptr<spdlog::logger> m_log;
};

class ts3_query_factory : public query_session_factory {
public:
    ts3_query_factory(std::string host, uint16_t port,
                      std::chrono::milliseconds timeout,
                      std::shared_ptr<spdlog::logger> log);

    std::unique_ptr<query_session> connect() override;

private:
    std::string m_host;
    uint16_t m_port;
    std::chrono::milliseconds m_timeout;
    std::shared_ptr<spdlog::logger> m_log;
};

} // namespace ts3status
