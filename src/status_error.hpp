#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ts3status {

enum class error_code {
    connection,      // remote server unreachable or socket failure
    auth,            // login or server selection rejected
    protocol,        // malformed or unexpected ServerQuery reply
    lock_contention  // internal only, never rendered to HTTP clients
};

// Stable user-facing text for an error code. Wire and socket details
// never leak into this string.
std::string_view describe(error_code code);

class status_error : public std::runtime_error {
public:
    status_error(error_code code, const std::string& detail)
        : std::runtime_error(detail), m_code(code) {}

    error_code code() const { return m_code; }

private:
    error_code m_code;
};

} // namespace ts3status
