#pragma once

#include "channel_tree.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ts3status {

// One `|`-separated entry of a reply line: key -> unescaped value.
// Flags without `=` map to an empty string.
using query_record = std::map<std::string, std::string>;

// Terminating status line: `error id=0 msg=ok`.
struct query_status {
    int id = 0;
    std::string message;

    bool ok() const { return id == 0; }
};

// ServerQuery id for "database empty result set".
inline constexpr int empty_result_error_id = 1281;

// Escape a value for use in a command argument.
std::string escape(std::string_view value);

// Reverse of escape(). Unknown escape sequences are kept verbatim.
std::string unescape(std::string_view value);

// Build a command line (without the trailing newline) from a name,
// key/value parameters and `-option` switches.
std::string format_command(std::string_view name,
                           const std::vector<std::pair<std::string, std::string>>& params = {},
                           const std::vector<std::string>& options = {});

// Split a data line into records.
std::vector<query_record> parse_records(std::string_view line);

// Returns nullopt if `line` is not an `error ...` status line.
std::optional<query_status> parse_status_line(std::string_view line);

// Strip '\n' / '\r' from both ends. Lines end with "\n\r", so a line read
// up to '\n' still starts with the previous line's '\r'.
std::string_view trim_line(std::string_view line);

// Record decoding. Throw status_error(protocol) on a missing or
// non-numeric required field.
channel_record to_channel_record(const query_record& rec);
client_record to_client_record(const query_record& rec);

} // namespace ts3status
