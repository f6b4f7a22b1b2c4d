#include "ts3_query_client.hpp"
#include <asio/connect.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

namespace ts3status {

ts3_query_client::ts3_query_client(const std::string& host, uint16_t port,
                                   std::chrono::milliseconds timeout,
                                   std::shared_ptr<spdlog::logger> log)
    : m_timeout(timeout), m_socket(m_ioc), m_log(std::move(log))
{
    asio::error_code ec;
    asio::ip::tcp::resolver resolver(m_ioc);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw status_error(error_code::connection,
                           "resolve " + host + ": " + ec.message());
    }

    asio::async_connect(m_socket, endpoints,
        [&ec](const asio::error_code& e, const asio::ip::tcp::endpoint&) { ec = e; });
    run_with_deadline("connect");
    if (ec) {
        throw status_error(error_code::connection,
                           "connect " + host + ":" + std::to_string(port) + ": " + ec.message());
    }

    // Greeting: "TS3" followed by a single welcome line.
    auto banner = read_line();
    if (trim_line(banner) != "TS3") {
        throw status_error(error_code::protocol,
                           "unexpected greeting '" + std::string(trim_line(banner)) + "'");
    }
    read_line();

    m_log->debug("ServerQuery connected to {}:{}", host, port);
}

ts3_query_client::~ts3_query_client() {
    asio::error_code ec;
    if (m_socket.is_open()) {
        asio::write(m_socket, asio::buffer(std::string("quit\n")), ec);
        m_socket.close(ec);
    }
}

void ts3_query_client::run_with_deadline(const char* what) {
    m_ioc.restart();
    m_ioc.run_for(m_timeout);
    if (m_ioc.stopped()) return;

    // Deadline passed: closing the socket completes the pending handler
    // with operation_aborted.
    asio::error_code ignored;
    m_socket.close(ignored);
    m_ioc.restart();
    m_ioc.run();

    m_log->warn("ServerQuery {} timed out after {} ms", what, m_timeout.count());
    throw status_error(error_code::connection,
                       std::string(what) + ": no response within " +
                       std::to_string(m_timeout.count()) + " ms");
}

std::string ts3_query_client::read_line() {
    asio::error_code ec;
    std::size_t n = 0;
    asio::async_read_until(m_socket, asio::dynamic_buffer(m_buffer), '\n',
        [&](const asio::error_code& e, std::size_t bytes) { ec = e; n = bytes; });
    run_with_deadline("read");
    if (ec) {
        throw status_error(error_code::connection, "read: " + ec.message());
    }

    std::string line = m_buffer.substr(0, n);
    m_buffer.erase(0, n);
    return line;
}

void ts3_query_client::write_line(const std::string& line) {
    asio::error_code ec;
    std::string data = line + "\n";
    asio::async_write(m_socket, asio::buffer(data),
        [&ec](const asio::error_code& e, std::size_t) { ec = e; });
    run_with_deadline("write");
    if (ec) {
        throw status_error(error_code::connection, "write: " + ec.message());
    }
}

std::vector<query_record> ts3_query_client::execute(const std::string& command,
                                                    error_code failure) {
    auto name = command.substr(0, command.find(' '));
    m_log->trace("ServerQuery > {}", name);
    write_line(command);

    std::vector<query_record> records;
    while (true) {
        auto raw = read_line();
        auto line = trim_line(raw);
        if (line.empty()) continue;

        if (auto status = parse_status_line(line)) {
            m_log->trace("ServerQuery < error id={} msg={}", status->id, status->message);
            if (status->ok()) return records;
            if (status->id == empty_result_error_id) return {};
            throw status_error(failure, "'" + name + "' failed: " +
                               std::to_string(status->id) + " " + status->message);
        }

        m_log->trace("ServerQuery < {}", line);
        for (auto& rec : parse_records(line)) records.push_back(std::move(rec));
    }
}

void ts3_query_client::login(const std::string& user, const std::string& password) {
    execute(format_command("login", {{"client_login_name", user},
                                     {"client_login_password", password}}),
            error_code::auth);
}

void ts3_query_client::select_server(uint64_t server_id) {
    execute(format_command("use", {{"sid", std::to_string(server_id)}}), error_code::auth);
}

std::vector<channel_record> ts3_query_client::list_channels() {
    auto records = execute(format_command("channellist"), error_code::protocol);

    std::vector<channel_record> channels;
    channels.reserve(records.size());
    for (const auto& rec : records) channels.push_back(to_channel_record(rec));
    return channels;
}

std::vector<client_record> ts3_query_client::list_online_clients() {
    auto records = execute(format_command("clientlist", {}, {"away", "voice", "country"}),
                           error_code::protocol);

    std::vector<client_record> clients;
    clients.reserve(records.size());
    for (const auto& rec : records) clients.push_back(to_client_record(rec));
    return clients;
}

std::map<std::string, std::string> ts3_query_client::server_metadata() {
    auto records = execute(format_command("serverinfo"), error_code::protocol);
    if (records.empty()) {
        throw status_error(error_code::protocol, "'serverinfo' returned no data");
    }
    return records.front();
}

void ts3_query_client::logout() {
    execute(format_command("logout"), error_code::protocol);
}

ts3_query_factory::ts3_query_factory(std::string host, uint16_t port,
                                     std::chrono::milliseconds timeout,
                                     std::shared_ptr<spdlog::logger> log)
    : m_host(std::move(host)), m_port(port), m_timeout(timeout), m_log(std::move(log))
{}

std::unique_ptr<query_session> ts3_query_factory::connect() {
    return std::make_unique<ts3_query_client>(m_host, m_port, m_timeout, m_log);
}

} // namespace ts3status
