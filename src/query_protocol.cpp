#include "query_protocol.hpp"
#include "status_error.hpp"
#include <charconv>

namespace ts3status {

namespace {

template <typename T>
T parse_number(const query_record& rec, const char* key) {
    auto it = rec.find(key);
    if (it == rec.end()) {
        throw status_error(error_code::protocol, std::string("missing field '") + key + "'");
    }

    T value{};
    const auto& s = it->second;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        throw status_error(error_code::protocol,
                           std::string("field '") + key + "' is not a number: '" + s + "'");
    }
    return value;
}

std::string string_field(const query_record& rec, const char* key) {
    auto it = rec.find(key);
    return it != rec.end() ? it->second : std::string{};
}

bool flag_field(const query_record& rec, const char* key) {
    auto it = rec.find(key);
    return it != rec.end() && it->second == "1";
}

} // namespace

std::string escape(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '/':  out += "\\/"; break;
            case ' ':  out += "\\s"; break;
            case '|':  out += "\\p"; break;
            case '\a': out += "\\a"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\v': out += "\\v"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string unescape(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c != '\\' || i + 1 == value.size()) {
            out += c;
            continue;
        }

        char next = value[++i];
        switch (next) {
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 's':  out += ' '; break;
            case 'p':  out += '|'; break;
            case 'a':  out += '\a'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'v':  out += '\v'; break;
            default:
                out += '\\';
                out += next;
                break;
        }
    }
    return out;
}

std::string format_command(std::string_view name,
                           const std::vector<std::pair<std::string, std::string>>& params,
                           const std::vector<std::string>& options) {
    std::string cmd(name);
    for (const auto& [key, value] : params) {
        cmd += ' ';
        cmd += key;
        cmd += '=';
        cmd += escape(value);
    }
    for (const auto& opt : options) {
        cmd += " -";
        cmd += opt;
    }
    return cmd;
}

std::vector<query_record> parse_records(std::string_view line) {
    std::vector<query_record> records;
    line = trim_line(line);
    if (line.empty()) return records;

    std::size_t start = 0;
    while (start <= line.size()) {
        auto bar = line.find('|', start);
        auto entry = line.substr(start, bar == std::string_view::npos ? std::string_view::npos
                                                                      : bar - start);
        query_record rec;
        std::size_t pos = 0;
        while (pos < entry.size()) {
            auto space = entry.find(' ', pos);
            auto field = entry.substr(pos, space == std::string_view::npos ? std::string_view::npos
                                                                           : space - pos);
            if (!field.empty()) {
                auto eq = field.find('=');
                if (eq == std::string_view::npos) {
                    rec[std::string(field)] = "";
                } else {
                    rec[std::string(field.substr(0, eq))] = unescape(field.substr(eq + 1));
                }
            }
            if (space == std::string_view::npos) break;
            pos = space + 1;
        }
        records.push_back(std::move(rec));

        if (bar == std::string_view::npos) break;
        start = bar + 1;
    }
    return records;
}

std::optional<query_status> parse_status_line(std::string_view line) {
    line = trim_line(line);
    if (line != "error" && line.rfind("error ", 0) != 0) return std::nullopt;

    auto records = parse_records(line.substr(5));
    if (records.empty()) return std::nullopt;
    const auto& rec = records.front();

    auto it = rec.find("id");
    if (it == rec.end()) return std::nullopt;

    query_status status;
    const auto& s = it->second;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), status.id);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;

    status.message = string_field(rec, "msg");
    return status;
}

std::string_view trim_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    while (!line.empty() && (line.front() == '\n' || line.front() == '\r')) {
        line.remove_prefix(1);
    }
    return line;
}

channel_record to_channel_record(const query_record& rec) {
    channel_record ch;
    ch.id = parse_number<uint64_t>(rec, "cid");
    ch.parent_id = parse_number<uint64_t>(rec, "pid");
    ch.name = string_field(rec, "channel_name");
    return ch;
}

client_record to_client_record(const query_record& rec) {
    client_record cl;
    cl.client_id = parse_number<uint64_t>(rec, "clid");
    cl.channel_id = parse_number<uint64_t>(rec, "cid");
    cl.type = parse_number<int>(rec, "client_type");
    cl.nickname = string_field(rec, "client_nickname");
    cl.country = string_field(rec, "client_country");
    cl.input_muted = flag_field(rec, "client_input_muted");
    cl.output_muted = flag_field(rec, "client_output_muted");
    cl.away = flag_field(rec, "client_away");
    return cl;
}

} // namespace ts3status
